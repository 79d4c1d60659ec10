#include "session/file_remote.hpp"

#include "common/errors.hpp"
#include "persistence/atomic_file.hpp"

#include <utility>

namespace memsync::session {

FileRemote::FileRemote(std::filesystem::path remote_path,
                       std::shared_ptr<spdlog::logger> logger)
    : remote_path_(std::move(remote_path))
    , logger_(std::move(logger)) {}

std::error_code FileRemote::fetch_remote(const std::filesystem::path& snapshot,
                                         std::filesystem::path& remote_out) {
    std::error_code ec;
    if (!std::filesystem::exists(remote_path_, ec)) {
        if (ec) return ec;
        return make_error_code(Errc::not_found);
    }
    if (std::filesystem::equivalent(remote_path_, snapshot, ec)) {
        // Merging a snapshot with itself changes nothing.
        return make_error_code(Errc::not_found);
    }
    remote_out = remote_path_;
    return {};
}

std::error_code FileRemote::stage(const std::filesystem::path& snapshot) {
    if (auto ec = persistence::atomic_copy(snapshot, remote_path_)) {
        logger_->error("Remote: publishing {} to {} failed: {}",
                       snapshot.string(), remote_path_.string(), ec.message());
        return ec;
    }
    logger_->info("Remote: published {} to {}", snapshot.string(), remote_path_.string());
    return {};
}

} // namespace memsync::session
