#include "merge/merge_engine.hpp"

#include "common/errors.hpp"
#include "persistence/atomic_file.hpp"
#include "store/codec.hpp"
#include "store/store_reader.hpp"

#include <algorithm>
#include <cctype>
#include <charconv>
#include <cmath>
#include <cstdint>
#include <functional>
#include <limits>
#include <sstream>
#include <unordered_map>
#include <unordered_set>
#include <utility>
#include <vector>

namespace memsync::merge {

namespace {

using RelationKeySet = std::unordered_set<RelationKey, RelationKeyHash>;

// Visitor for inputs that must be fully decodable.
using InputVisitor = std::function<void(Record&&)>;

// Stream an input store.  An absent file is an empty store; the first
// undecodable line aborts the scan with its decode error.
std::error_code scan_input(const std::filesystem::path& path,
                           const InputVisitor& visit,
                           const std::shared_ptr<spdlog::logger>& logger) {
    std::error_code decode_ec;
    ScanSummary summary;
    auto ec = scan_store(path,
        [&](std::size_t line_no, DecodeResult&& result) {
            if (auto* err = std::get_if<DecodeError>(&result)) {
                logger->error("Merge: {}:{}: {}", path.string(), line_no, err->message);
                decode_ec = err->code;
                return ScanAction::Stop;
            }
            visit(std::move(std::get<Record>(result)));
            return ScanAction::Continue;
        },
        summary);

    if (ec == Errc::not_found) {
        logger->debug("Merge: {} absent, treated as empty", path.string());
        return {};
    }
    if (ec) return ec;
    return decode_ec;
}

void append_line(std::string& out, const Record& record) {
    out += encode(record);
    out += '\n';
}

bool parse_int(std::string_view sv, int64_t& out) {
    while (!sv.empty() && std::isspace(static_cast<unsigned char>(sv.front()))) sv.remove_prefix(1);
    while (!sv.empty() && std::isspace(static_cast<unsigned char>(sv.back()))) sv.remove_suffix(1);
    if (sv.empty()) return false;
    auto [ptr, ec] = std::from_chars(sv.data(), sv.data() + sv.size(), out);
    return ec == std::errc{} && ptr == sv.data() + sv.size();
}

// Local entities in file order, indexed by name.  A later duplicate replaces
// the earlier one (last write wins).
class EntityIndex {
public:
    void insert(Entity&& e) {
        auto it = index_.find(e.name);
        if (it != index_.end()) {
            live_[it->second] = false;
            it->second = entities_.size();
        } else {
            index_.emplace(e.name, entities_.size());
        }
        entities_.push_back(std::move(e));
        live_.push_back(true);
    }

    // Entity for `name`, or nullptr if absent.
    [[nodiscard]] const Entity* find(const std::string& name) const {
        auto it = index_.find(name);
        return it == index_.end() ? nullptr : &entities_[it->second];
    }

    void erase(const std::string& name) {
        auto it = index_.find(name);
        if (it == index_.end()) return;
        live_[it->second] = false;
        index_.erase(it);
    }

    template <typename F>
    void for_each_remaining(F&& f) const {
        for (std::size_t i = 0; i < entities_.size(); ++i) {
            if (live_[i]) f(entities_[i]);
        }
    }

private:
    std::vector<Entity> entities_;
    std::vector<bool> live_;
    std::unordered_map<std::string, std::size_t> index_;
};

constexpr int64_t kMaxTimestamp = std::numeric_limits<int64_t>::max();
constexpr int64_t kMinTimestamp = std::numeric_limits<int64_t>::min();

} // anonymous namespace

// ── ConflictPolicy ───────────────────────────────────────────────────────────

std::optional<ConflictPolicy> parse_conflict_policy(std::string_view s) {
    if (s == "remote-wins") return ConflictPolicy::RemoteWins;
    if (s == "local-wins")  return ConflictPolicy::LocalWins;
    if (s == "newest-wins") return ConflictPolicy::NewestWins;
    return std::nullopt;
}

std::string_view to_string(ConflictPolicy policy) {
    switch (policy) {
        case ConflictPolicy::RemoteWins: return "remote-wins";
        case ConflictPolicy::LocalWins:  return "local-wins";
        case ConflictPolicy::NewestWins: return "newest-wins";
    }
    return "remote-wins";
}

int64_t entity_timestamp(const Entity& entity) {
    if (entity.extra.is_object()) {
        auto it = entity.extra.find("timestamp");
        if (it != entity.extra.end()) {
            if (it->is_number_unsigned()) {
                auto u = it->get<uint64_t>();
                return u > static_cast<uint64_t>(kMaxTimestamp) ? kMaxTimestamp
                                                                : static_cast<int64_t>(u);
            }
            if (it->is_number_integer()) return it->get<int64_t>();
            if (it->is_number_float()) {
                // 2^63 is exact as a double; anything at or past it saturates.
                double d = it->get<double>();
                if (std::isnan(d)) return 0;
                if (d >= 9223372036854775808.0) return kMaxTimestamp;
                if (d < -9223372036854775808.0) return kMinTimestamp;
                return static_cast<int64_t>(d);
            }
            int64_t v = 0;
            if (it->is_string() && parse_int(it->get_ref<const std::string&>(), v)) return v;
        }
    }

    constexpr std::string_view kTag = "timestamp:";
    for (const auto& obs : entity.observations) {
        if (obs.size() < kTag.size()) continue;
        bool match = std::equal(kTag.begin(), kTag.end(), obs.begin(),
            [](char a, char b) {
                return a == std::tolower(static_cast<unsigned char>(b));
            });
        int64_t v = 0;
        if (match && parse_int(std::string_view(obs).substr(kTag.size()), v)) return v;
    }
    return 0;
}

// ── MergeEngine ──────────────────────────────────────────────────────────────

MergeEngine::MergeEngine(NamingPolicy policy,
                         ValidationOptions options,
                         std::shared_ptr<spdlog::logger> logger)
    : policy_(std::move(policy))
    , options_(options)
    , logger_(std::move(logger)) {}

std::error_code MergeEngine::build(const std::filesystem::path& local,
                                   const std::filesystem::path& remote,
                                   ConflictPolicy policy,
                                   MergeResult& result) const {
    result = MergeResult{};
    auto& out = result.content;
    auto& stats = result.stats;

    // 1. Index local entities.
    EntityIndex local_entities;
    auto ec = scan_input(local,
        [&](Record&& rec) {
            if (auto* e = std::get_if<Entity>(&rec)) {
                local_entities.insert(std::move(*e));
            }
        },
        logger_);
    if (ec) return ec;

    RelationKeySet seen;

    auto emit_relation = [&](const Relation& r) {
        if (seen.insert(key_of(r)).second) {
            append_line(out, r);
            ++stats.relations;
        } else {
            ++stats.duplicate_relations;
        }
    };

    // 2. Stream remote.
    ec = scan_input(remote,
        [&](Record&& rec) {
            if (auto* r = std::get_if<Relation>(&rec)) {
                emit_relation(*r);
                return;
            }

            auto& remote_entity = std::get<Entity>(rec);
            const Entity* local_entity = local_entities.find(remote_entity.name);
            if (local_entity == nullptr) {
                append_line(out, remote_entity);
                ++stats.entities;
                return;
            }

            ++stats.conflicts;
            bool keep_remote = false;
            switch (policy) {
                case ConflictPolicy::RemoteWins:
                    keep_remote = true;
                    break;
                case ConflictPolicy::LocalWins:
                    keep_remote = false;
                    break;
                case ConflictPolicy::NewestWins:
                    keep_remote = entity_timestamp(remote_entity) > entity_timestamp(*local_entity);
                    break;
            }
            logger_->debug("Merge: conflict on '{}' resolved {} ({})", remote_entity.name,
                           keep_remote ? "remote" : "local", to_string(policy));

            if (keep_remote) {
                append_line(out, remote_entity);
            } else {
                append_line(out, *local_entity);
            }
            ++stats.entities;
            local_entities.erase(remote_entity.name);
        },
        logger_);
    if (ec) return ec;

    // 3. Local-only entities.
    local_entities.for_each_remaining([&](const Entity& e) {
        append_line(out, e);
        ++stats.entities;
        ++stats.local_only_entities;
    });

    // 4. Second pass over local, for relations only.
    ec = scan_input(local,
        [&](Record&& rec) {
            if (auto* r = std::get_if<Relation>(&rec)) {
                emit_relation(*r);
            }
        },
        logger_);
    if (ec) return ec;

    logger_->debug("Merge: built {} entities ({} conflicts), {} relations ({} duplicates dropped)",
                   stats.entities, stats.conflicts, stats.relations, stats.duplicate_relations);
    return {};
}

std::error_code MergeEngine::commit(const MergeResult& result,
                                    const std::filesystem::path& output) const {
    // 5. Validate before the result may become a snapshot.
    std::istringstream in(result.content);
    ValidationReport report;
    if (auto ec = validate_stream(in, policy_, options_, report)) {
        return ec;
    }
    if (!report.is_valid()) {
        logger_->error("Merge: result for {} failed validation, discarded:\n{}",
                       output.string(), summarize(report));
        return make_error_code(Errc::merge_validation_failed);
    }

    if (auto ec = persistence::atomic_replace(output, result.content)) {
        logger_->error("Merge: failed to write {}: {}", output.string(), ec.message());
        return ec;
    }
    return {};
}

std::error_code MergeEngine::merge(const std::filesystem::path& local,
                                   const std::filesystem::path& remote,
                                   const std::filesystem::path& output,
                                   ConflictPolicy policy,
                                   MergeStats& stats) const {
    MergeResult result;
    if (auto ec = build(local, remote, policy, result)) {
        logger_->error("Merge: cannot merge {} with {}: {}",
                       local.string(), remote.string(), ec.message());
        return ec;
    }
    if (auto ec = commit(result, output)) {
        return ec;
    }

    stats = result.stats;
    logger_->info("Merge: {} + {} -> {} ({} entities, {} relations, {} conflicts, policy {})",
                  local.string(), remote.string(), output.string(),
                  stats.entities, stats.relations, stats.conflicts, to_string(policy));
    return {};
}

std::error_code MergeEngine::merge_partial(const std::filesystem::path& source,
                                           const std::filesystem::path& live,
                                           const std::filesystem::path& output,
                                           const std::string& entity_prefix,
                                           MergeStats& stats) const {
    std::error_code exists_ec;
    if (!std::filesystem::exists(source, exists_ec)) {
        logger_->error("Partial restore: source {} not found", source.string());
        return make_error_code(Errc::not_found);
    }

    NamingPolicy selector;
    selector.expected_prefix = entity_prefix;
    selector.case_insensitive = policy_.case_insensitive;

    MergeResult result;
    auto& out = result.content;
    auto& st = result.stats;

    // Selected source entities, in source order.
    std::vector<Entity> selected;
    std::unordered_set<std::string> selected_names;
    auto ec = scan_input(source,
        [&](Record&& rec) {
            auto* e = std::get_if<Entity>(&rec);
            if (e == nullptr || !name_conforms(selector, e->name)) return;
            if (selected_names.insert(e->name).second) {
                selected.push_back(std::move(*e));
            }
        },
        logger_);
    if (ec) return ec;

    RelationKeySet seen;
    auto emit_relation = [&](const Relation& r) {
        if (seen.insert(key_of(r)).second) {
            append_line(out, r);
            ++st.relations;
        } else {
            ++st.duplicate_relations;
        }
    };

    // Live store minus the entities being replaced.
    ec = scan_input(live,
        [&](Record&& rec) {
            if (auto* r = std::get_if<Relation>(&rec)) {
                emit_relation(*r);
                return;
            }
            const auto& e = std::get<Entity>(rec);
            if (selected_names.count(e.name) > 0) {
                ++st.conflicts;
                return;
            }
            append_line(out, e);
            ++st.entities;
            ++st.local_only_entities;
        },
        logger_);
    if (ec) return ec;

    for (const auto& e : selected) {
        append_line(out, e);
        ++st.entities;
    }

    // Source relations touching a selected entity.
    ec = scan_input(source,
        [&](Record&& rec) {
            auto* r = std::get_if<Relation>(&rec);
            if (r == nullptr) return;
            if (selected_names.count(r->from) > 0 || selected_names.count(r->to) > 0) {
                emit_relation(*r);
            }
        },
        logger_);
    if (ec) return ec;

    if (auto commit_ec = commit(result, output)) {
        return commit_ec;
    }

    stats = st;
    logger_->info("Partial restore: {} entities matching '{}' from {} -> {} ({} replaced)",
                  selected.size(), entity_prefix, source.string(), output.string(),
                  st.conflicts);
    return {};
}

} // namespace memsync::merge
