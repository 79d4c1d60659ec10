#include "persistence/atomic_file.hpp"

#include <cerrno>
#include <cstdint>
#include <random>

#include <fcntl.h>
#include <sys/stat.h>
#include <unistd.h>

#include <spdlog/fmt/fmt.h>
#include <spdlog/spdlog.h>

namespace memsync::persistence {

namespace {

std::error_code make_errno_error() {
    return {errno, std::system_category()};
}

// Write all bytes to fd. Returns error_code on failure.
[[nodiscard]] std::error_code write_all(int fd, const char* data, std::size_t len) {
    std::size_t written = 0;
    while (written < len) {
        auto n = ::write(fd, data + written, len - written);
        if (n < 0) {
            if (errno == EINTR) continue;
            return make_errno_error();
        }
        written += static_cast<std::size_t>(n);
    }
    return {};
}

// Best-effort removal of a temp file after a failed write.
void discard_temp(const std::filesystem::path& tmp_path) {
    std::error_code ec;
    std::filesystem::remove(tmp_path, ec);
    if (ec) {
        spdlog::warn("Atomic write: could not remove temp file {}: {}",
                     tmp_path.string(), ec.message());
    }
}

std::filesystem::path parent_or_cwd(const std::filesystem::path& target) {
    auto dir = target.parent_path();
    return dir.empty() ? std::filesystem::path{"."} : dir;
}

} // anonymous namespace

// ── make_temp_path ───────────────────────────────────────────────────────────

std::filesystem::path make_temp_path(const std::filesystem::path& target) {
    thread_local std::mt19937_64 rng{std::random_device{}()};
    const auto suffix = fmt::format(".{}.{:016x}.tmp",
                                    static_cast<long>(::getpid()), rng());
    return parent_or_cwd(target) / ("." + target.filename().string() + suffix);
}

// ── atomic_replace ───────────────────────────────────────────────────────────

std::error_code atomic_replace(const std::filesystem::path& target,
                               std::string_view content,
                               const AtomicWriteOptions& options) {
    const auto dir = parent_or_cwd(target);

    std::error_code dir_ec;
    std::filesystem::create_directories(dir, dir_ec);
    if (dir_ec) {
        spdlog::error("Atomic write: cannot create directory {}: {}",
                      dir.string(), dir_ec.message());
        return dir_ec;
    }

    const auto tmp_path = make_temp_path(target);

    int fd = ::open(tmp_path.c_str(), O_WRONLY | O_CREAT | O_EXCL | O_CLOEXEC, 0644);
    if (fd < 0) {
        auto ec = make_errno_error();
        spdlog::error("Atomic write: failed to open tmp file {}: {}",
                      tmp_path.string(), ec.message());
        return ec;
    }

    auto ec = write_all(fd, content.data(), content.size());
    if (ec) {
        spdlog::error("Atomic write: write to {} failed: {}", tmp_path.string(), ec.message());
        ::close(fd);
        discard_temp(tmp_path);
        return ec;
    }

    if (options.sync && ::fsync(fd) < 0) {
        ec = make_errno_error();
        spdlog::error("Atomic write: fsync of {} failed: {}", tmp_path.string(), ec.message());
        ::close(fd);
        discard_temp(tmp_path);
        return ec;
    }

    if (::close(fd) < 0) {
        ec = make_errno_error();
        spdlog::error("Atomic write: close of {} failed: {}", tmp_path.string(), ec.message());
        discard_temp(tmp_path);
        return ec;
    }

    if (options.before_rename) {
        options.before_rename(tmp_path);
    }

    // Rename .tmp → final path.  This is the only step visible to readers.
    std::error_code rename_ec;
    std::filesystem::rename(tmp_path, target, rename_ec);
    if (rename_ec) {
        spdlog::error("Atomic write: rename {} -> {} failed: {}",
                      tmp_path.string(), target.string(), rename_ec.message());
        discard_temp(tmp_path);
        return rename_ec;
    }

    if (options.sync) {
        if (auto sync_ec = sync_directory(dir)) {
            // Content is in place; only durability of the rename is in doubt.
            spdlog::warn("Atomic write: fsync of directory {} failed: {}",
                         dir.string(), sync_ec.message());
        }
    }

    spdlog::debug("Atomic write: {} bytes to {}", content.size(), target.string());
    return {};
}

// ── atomic_copy ──────────────────────────────────────────────────────────────

std::error_code atomic_copy(const std::filesystem::path& source,
                            const std::filesystem::path& target,
                            const AtomicWriteOptions& options) {
    std::string content;
    if (auto ec = read_file(source, content)) {
        spdlog::error("Atomic copy: cannot read {}: {}", source.string(), ec.message());
        return ec;
    }
    return atomic_replace(target, content, options);
}

// ── read_file ────────────────────────────────────────────────────────────────

std::error_code read_file(const std::filesystem::path& path, std::string& out) {
    out.clear();

    int fd = ::open(path.c_str(), O_RDONLY | O_CLOEXEC);
    if (fd < 0) {
        return make_errno_error();
    }

    char buf[8192];
    while (true) {
        auto n = ::read(fd, buf, sizeof(buf));
        if (n < 0) {
            if (errno == EINTR) continue;
            auto ec = make_errno_error();
            ::close(fd);
            return ec;
        }
        if (n == 0) break;
        out.append(buf, static_cast<std::size_t>(n));
    }

    ::close(fd);
    return {};
}

// ── sync helpers ─────────────────────────────────────────────────────────────

std::error_code sync_file(const std::filesystem::path& path) {
    int fd = ::open(path.c_str(), O_RDONLY | O_CLOEXEC);
    if (fd < 0) {
        return make_errno_error();
    }
    std::error_code ec;
    if (::fsync(fd) < 0) {
        ec = make_errno_error();
    }
    ::close(fd);
    return ec;
}

std::error_code sync_directory(const std::filesystem::path& dir) {
    int fd = ::open(dir.c_str(), O_RDONLY | O_DIRECTORY | O_CLOEXEC);
    if (fd < 0) {
        return make_errno_error();
    }
    std::error_code ec;
    if (::fsync(fd) < 0) {
        ec = make_errno_error();
    }
    ::close(fd);
    return ec;
}

} // namespace memsync::persistence
