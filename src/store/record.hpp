#pragma once

#include <cstddef>
#include <functional>
#include <string>
#include <variant>
#include <vector>

#include <nlohmann/json.hpp>

namespace memsync {

// ── Records ───────────────────────────────────────────────────────────────────
//
// One line of a store file.  Each kind is a plain struct; Record wraps them in
// a std::variant so callers can std::visit without inheritance.
//
// `extra` keeps any field the codec does not model (for instance a
// "timestamp" written by the consumer) in the order it was read, so that a
// decode → encode cycle never drops data.

struct Entity {
    std::string name;
    std::string entity_type;
    std::vector<std::string> observations;
    nlohmann::ordered_json extra = nlohmann::ordered_json::object();

    bool operator==(const Entity&) const = default;
};

struct Relation {
    std::string from;
    std::string to;
    std::string relation_type;
    nlohmann::ordered_json extra = nlohmann::ordered_json::object();

    bool operator==(const Relation&) const = default;
};

using Record = std::variant<Entity, Relation>;

// ── Relation identity ─────────────────────────────────────────────────────────

// Duplicate relations are identified by (from, to, relationType).
struct RelationKey {
    std::string from;
    std::string to;
    std::string relation_type;

    bool operator==(const RelationKey&) const = default;
};

[[nodiscard]] inline RelationKey key_of(const Relation& r) {
    return RelationKey{r.from, r.to, r.relation_type};
}

struct RelationKeyHash {
    std::size_t operator()(const RelationKey& k) const noexcept {
        std::hash<std::string> h;
        std::size_t seed = h(k.from);
        seed ^= h(k.to) + 0x9e3779b97f4a7c15ULL + (seed << 6) + (seed >> 2);
        seed ^= h(k.relation_type) + 0x9e3779b97f4a7c15ULL + (seed << 6) + (seed >> 2);
        return seed;
    }
};

} // namespace memsync
