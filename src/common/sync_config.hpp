#pragma once

#include "merge/merge_engine.hpp"
#include "session/session_context.hpp"
#include "store/validator.hpp"

#include <cstdint>
#include <stdexcept>
#include <string>
#include <string_view>
#include <vector>

#include <boost/program_options.hpp>

namespace memsync {

// ── SyncConfig ───────────────────────────────────────────────────────────────
// Full configuration for one memsync invocation.
// Populated by parse_config() from CLI arguments.

struct SyncConfig {
    std::string command;                 // validate|stats|backup|restore|load|save|merge|partial-restore|start|finish
    std::string path;                    // optional positional target (validate, stats)

    session::ContextKind context = session::ContextKind::Framework;
    std::string project;                 // required for the project context
    std::string workspace;               // workspace root

    // Explicit overrides; empty means "derive from the context".
    std::string live;
    std::string snapshot;
    std::string backup;

    std::string remote;                  // merge peer / partial-restore source
    std::string output;                  // merge output (defaults to the snapshot)
    merge::ConflictPolicy policy = merge::ConflictPolicy::RemoteWins;

    std::string prefix;                  // empty: derived from the context
    std::vector<std::string> categories;
    bool strict_categories = false;
    bool case_insensitive = true;
    bool allow_duplicates = false;

    uint32_t max_errors = 10;
    std::uintmax_t size_warning_bytes = 10u << 20;

    uint32_t handoff_timeout_ms = 30000;
    uint32_t poll_interval_ms = 500;
    uint32_t settle_ms = 500;

    bool keep_backup = false;
    std::string filter;                  // entity prefix for partial-restore
    std::string log_level;               // spdlog level string
};

// ── parse_config ─────────────────────────────────────────────────────────────
// Parse CLI arguments into a SyncConfig.
//
// On success: returns a fully validated SyncConfig.
// On error  : throws std::runtime_error with a human-readable message
//             (also for --help, carrying the option description).
//
// Validates:
//   - command is one of the known commands
//   - --context is framework|project, and project has --project
//   - --policy is remote-wins|local-wins|newest-wins
//   - --max-errors and --poll-interval-ms are > 0
//   - --size-warning parses as a size
//   - merge and partial-restore have --remote

[[nodiscard]] SyncConfig parse_config(int argc, char* argv[]);

// ── add_options ──────────────────────────────────────────────────────────────
// Populate a boost::program_options::options_description with memsync options.
// Exposed for testing and help-text generation.

void add_options(boost::program_options::options_description& desc);

// ── Helpers ──────────────────────────────────────────────────────────────────

// "10MB" → 10485760.  Accepts B, KB, MB, GB (1024 based, case-insensitive)
// and bare byte counts.  Throws std::runtime_error on bad input.
[[nodiscard]] std::uintmax_t parse_size(std::string_view s);

// Split a space- and/or comma-separated list, dropping empty items.
[[nodiscard]] std::vector<std::string> parse_list(std::string_view s);

// Projections of the config onto the components' own settings.
[[nodiscard]] session::SessionContext session_context(const SyncConfig& cfg);
[[nodiscard]] session::SessionPaths session_paths(const SyncConfig& cfg);
[[nodiscard]] NamingPolicy naming_policy(const SyncConfig& cfg);
[[nodiscard]] ValidationOptions validation_options(const SyncConfig& cfg);

} // namespace memsync
