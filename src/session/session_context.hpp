#pragma once

#include <cstdint>
#include <filesystem>
#include <optional>
#include <string>
#include <string_view>

namespace memsync::session {

// ── Session context ──────────────────────────────────────────────────────────
//
// Which snapshot a session works on.  The framework context is singular; a
// project context is named after the project directory.

enum class ContextKind : uint8_t {
    Framework = 0,
    Project   = 1,
};

[[nodiscard]] std::optional<ContextKind> parse_context_kind(std::string_view s);
[[nodiscard]] std::string_view to_string(ContextKind kind);

struct SessionContext {
    ContextKind kind = ContextKind::Framework;
    std::string project;                       // required for ContextKind::Project
    std::filesystem::path workspace{"."};      // workspace root
};

// ── Path convention ──────────────────────────────────────────────────────────
//
//   live store : <workspace>/.aipm/memory.json
//   framework  : <workspace>/.memory/local_memory.json
//   project    : <workspace>/<project>/.memory/local_memory.json
//   backup     : backup.json beside the snapshot

inline constexpr const char* kLiveStoreDir     = ".aipm";
inline constexpr const char* kLiveStoreName    = "memory.json";
inline constexpr const char* kMemoryDirName    = ".memory";
inline constexpr const char* kSnapshotFileName = "local_memory.json";
inline constexpr const char* kBackupFileName   = "backup.json";

struct SessionPaths {
    std::filesystem::path live;
    std::filesystem::path snapshot;
    std::filesystem::path backup;
};

[[nodiscard]] SessionPaths resolve_paths(const SessionContext& context);

// Entity prefix for the context: `configured` when non-empty, otherwise
// "<PROJECT>_" (upper-cased) for a project and "AIPM_" for the framework.
[[nodiscard]] std::string entity_prefix_for(const SessionContext& context,
                                            const std::string& configured);

} // namespace memsync::session
