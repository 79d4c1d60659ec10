#pragma once

#include "session/sync_session.hpp"

#include <spdlog/spdlog.h>

#include <filesystem>
#include <memory>
#include <system_error>

namespace memsync::session {

// ── FileRemote ───────────────────────────────────────────────────────────────
//
// VersionControl over a shared file: the peer snapshot is read from
// `remote_path` and the saved snapshot is published back to it atomically.
// Used by the command-line driver when --remote names a file.

class FileRemote : public VersionControl {
public:
    FileRemote(std::filesystem::path remote_path, std::shared_ptr<spdlog::logger> logger);

    // Errc::not_found while the shared file does not exist yet.
    [[nodiscard]] std::error_code fetch_remote(const std::filesystem::path& snapshot,
                                               std::filesystem::path& remote_out) override;

    [[nodiscard]] std::error_code stage(const std::filesystem::path& snapshot) override;

private:
    std::filesystem::path remote_path_;
    std::shared_ptr<spdlog::logger> logger_;
};

} // namespace memsync::session
