#include "session/session_context.hpp"

#include <algorithm>
#include <cctype>
#include <iterator>

namespace memsync::session {

std::optional<ContextKind> parse_context_kind(std::string_view s) {
    if (s == "framework") return ContextKind::Framework;
    if (s == "project")   return ContextKind::Project;
    return std::nullopt;
}

std::string_view to_string(ContextKind kind) {
    switch (kind) {
        case ContextKind::Framework: return "framework";
        case ContextKind::Project:   return "project";
    }
    return "framework";
}

SessionPaths resolve_paths(const SessionContext& context) {
    const auto& root = context.workspace;

    auto memory_dir = context.kind == ContextKind::Project
        ? root / context.project / kMemoryDirName
        : root / kMemoryDirName;

    SessionPaths paths;
    paths.live     = root / kLiveStoreDir / kLiveStoreName;
    paths.snapshot = memory_dir / kSnapshotFileName;
    paths.backup   = memory_dir / kBackupFileName;
    return paths;
}

std::string entity_prefix_for(const SessionContext& context, const std::string& configured) {
    if (!configured.empty()) return configured;
    if (context.kind == ContextKind::Framework) return "AIPM_";

    std::string prefix;
    prefix.reserve(context.project.size() + 1);
    std::transform(context.project.begin(), context.project.end(), std::back_inserter(prefix),
        [](unsigned char c) {
            return std::isalnum(c) ? static_cast<char>(std::toupper(c)) : '_';
        });
    prefix += '_';
    return prefix;
}

} // namespace memsync::session
