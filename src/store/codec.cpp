#include "store/codec.hpp"

#include "common/errors.hpp"

#include <algorithm>
#include <cctype>
#include <initializer_list>
#include <type_traits>

namespace memsync {

namespace {

using json = nlohmann::ordered_json;

constexpr const char* kTypeField = "type";
constexpr const char* kEntityKind = "entity";
constexpr const char* kRelationKind = "relation";

DecodeError malformed(std::string message) {
    return DecodeError{make_error_code(Errc::decode_malformed), std::move(message)};
}

DecodeError unknown_kind(std::string message) {
    return DecodeError{make_error_code(Errc::decode_unknown_kind), std::move(message)};
}

// Read an optional string field.  Returns false if present with another type.
bool read_string(const json& obj, const char* field, std::string& out) {
    auto it = obj.find(field);
    if (it == obj.end() || it->is_null()) return true;
    if (!it->is_string()) return false;
    out = it->get<std::string>();
    return true;
}

// Copy every field not listed in `known` into `extra`, keeping input order.
void collect_extra(const json& obj, std::initializer_list<const char*> known, json& extra) {
    for (auto it = obj.begin(); it != obj.end(); ++it) {
        bool modelled = std::any_of(known.begin(), known.end(),
            [&](const char* k) { return it.key() == k; });
        if (!modelled) {
            extra[it.key()] = it.value();
        }
    }
}

DecodeResult decode_entity(const json& obj) {
    Entity e;
    if (!read_string(obj, "name", e.name)) {
        return malformed("entity field 'name' must be a string");
    }
    if (!read_string(obj, "entityType", e.entity_type)) {
        return malformed("entity field 'entityType' must be a string");
    }

    auto obs = obj.find("observations");
    if (obs != obj.end() && !obs->is_null()) {
        if (!obs->is_array()) {
            return malformed("entity field 'observations' must be an array");
        }
        e.observations.reserve(obs->size());
        for (const auto& o : *obs) {
            if (!o.is_string()) {
                return malformed("entity observations must be strings");
            }
            e.observations.push_back(o.get<std::string>());
        }
    }

    collect_extra(obj, {kTypeField, "name", "entityType", "observations"}, e.extra);
    return Record{std::move(e)};
}

DecodeResult decode_relation(const json& obj) {
    Relation r;
    if (!read_string(obj, "from", r.from)) {
        return malformed("relation field 'from' must be a string");
    }
    if (!read_string(obj, "to", r.to)) {
        return malformed("relation field 'to' must be a string");
    }
    if (!read_string(obj, "relationType", r.relation_type)) {
        return malformed("relation field 'relationType' must be a string");
    }

    collect_extra(obj, {kTypeField, "from", "to", "relationType"}, r.extra);
    return Record{std::move(r)};
}

} // anonymous namespace

// ── decode_line ───────────────────────────────────────────────────────────────

DecodeResult decode_line(std::string_view line) {
    json obj = json::parse(line.begin(), line.end(), nullptr, /*allow_exceptions=*/false);
    if (obj.is_discarded()) {
        return malformed("invalid JSON");
    }
    if (!obj.is_object()) {
        return malformed("record is not a JSON object");
    }

    auto type = obj.find(kTypeField);
    if (type == obj.end()) {
        return unknown_kind("missing 'type' field");
    }
    if (!type->is_string()) {
        return unknown_kind("'type' field is not a string");
    }

    const auto& kind = type->get_ref<const std::string&>();
    if (kind == kEntityKind) return decode_entity(obj);
    if (kind == kRelationKind) return decode_relation(obj);
    return unknown_kind("unknown record type '" + kind + "'");
}

// ── encode ────────────────────────────────────────────────────────────────────

std::string encode(const Record& record) {
    json out = std::visit(
        [](const auto& r) -> json {
            using T = std::decay_t<decltype(r)>;

            json j = json::object();
            if constexpr (std::is_same_v<T, Entity>) {
                j[kTypeField] = kEntityKind;
                j["name"] = r.name;
                j["entityType"] = r.entity_type;
                j["observations"] = r.observations;
            } else if constexpr (std::is_same_v<T, Relation>) {
                j[kTypeField] = kRelationKind;
                j["from"] = r.from;
                j["to"] = r.to;
                j["relationType"] = r.relation_type;
            }
            if (r.extra.is_object()) {
                for (auto it = r.extra.begin(); it != r.extra.end(); ++it) {
                    j[it.key()] = it.value();
                }
            }
            return j;
        },
        record);

    return out.dump(-1, ' ', false, json::error_handler_t::replace);
}

// ── Line classification ───────────────────────────────────────────────────────

bool is_blank(std::string_view line) {
    return std::all_of(line.begin(), line.end(),
        [](char c) { return std::isspace(static_cast<unsigned char>(c)) != 0; });
}

bool is_empty_store_marker(std::string_view line) {
    auto first = line.find_first_not_of(" \t\r\n");
    if (first == std::string_view::npos) return false;
    auto last = line.find_last_not_of(" \t\r\n");
    auto body = line.substr(first, last - first + 1);
    if (body.size() < 2 || body.front() != '{' || body.back() != '}') return false;
    return is_blank(body.substr(1, body.size() - 2));
}

} // namespace memsync
