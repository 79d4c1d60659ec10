#pragma once

#include "store/record.hpp"
#include "store/validator.hpp"

#include <spdlog/spdlog.h>

#include <cstddef>
#include <cstdint>
#include <filesystem>
#include <memory>
#include <optional>
#include <string>
#include <string_view>
#include <system_error>

namespace memsync::merge {

// ── Conflict policy ──────────────────────────────────────────────────────────

enum class ConflictPolicy : uint8_t {
    RemoteWins = 0,   // default
    LocalWins  = 1,
    NewestWins = 2,   // greater timestamp wins; ties and missing stamps keep local
};

[[nodiscard]] std::optional<ConflictPolicy> parse_conflict_policy(std::string_view s);
[[nodiscard]] std::string_view to_string(ConflictPolicy policy);

// Timestamp used by NewestWins: a numeric "timestamp" field, else an
// observation of the form "timestamp: <n>", else 0.
[[nodiscard]] int64_t entity_timestamp(const Entity& entity);

// ── Merge result ─────────────────────────────────────────────────────────────

struct MergeStats {
    std::size_t entities = 0;              // entities written
    std::size_t relations = 0;             // relations written
    std::size_t conflicts = 0;             // same-name entities resolved
    std::size_t local_only_entities = 0;
    std::size_t duplicate_relations = 0;   // relation lines dropped as duplicates
};

// Ephemeral merged store; never written unless it validates.
struct MergeResult {
    std::string content;   // one encoded record per line
    MergeStats stats;
};

// ── MergeEngine ──────────────────────────────────────────────────────────────
//
// Combines a local and a remote store in O(|local| + |remote|):
//
//   1. index local entities by name
//   2. stream remote: resolve name conflicts against the index (removing the
//      name from it), emit new entities, emit relations not yet seen
//   3. emit the local entities still in the index, in local file order
//   4. stream local again for its relations, emitting unseen keys
//   5. validate the assembled store; only a valid result reaches disk
//
// Absent input files are treated as empty stores.
//
// Thread-safety: stateless apart from configuration; safe to share.

class MergeEngine {
public:
    MergeEngine(NamingPolicy policy,
                ValidationOptions options,
                std::shared_ptr<spdlog::logger> logger);

    // Build the merged store in memory without validating it.
    // Returns a decode_* error if either input holds an undecodable line.
    [[nodiscard]] std::error_code build(const std::filesystem::path& local,
                                        const std::filesystem::path& remote,
                                        ConflictPolicy policy,
                                        MergeResult& result) const;

    // build() + validate + atomic write to `output`.
    // Returns Errc::merge_validation_failed (output untouched) if the
    // assembled store does not validate.
    [[nodiscard]] std::error_code merge(const std::filesystem::path& local,
                                        const std::filesystem::path& remote,
                                        const std::filesystem::path& output,
                                        ConflictPolicy policy,
                                        MergeStats& stats) const;

    // Take the entities of `source` whose name starts with `entity_prefix`
    // (plus the source relations touching them) and lay them over `live`.
    // Every other live entity and relation is kept.  Validated, then written
    // atomically to `output`.
    [[nodiscard]] std::error_code merge_partial(const std::filesystem::path& source,
                                                const std::filesystem::path& live,
                                                const std::filesystem::path& output,
                                                const std::string& entity_prefix,
                                                MergeStats& stats) const;

    [[nodiscard]] const NamingPolicy& policy() const { return policy_; }

private:
    // Validate `result` and write it to `output`.
    [[nodiscard]] std::error_code commit(const MergeResult& result,
                                         const std::filesystem::path& output) const;

    NamingPolicy policy_;
    ValidationOptions options_;
    std::shared_ptr<spdlog::logger> logger_;
};

} // namespace memsync::merge
