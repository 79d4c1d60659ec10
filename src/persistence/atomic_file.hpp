#pragma once

#include <filesystem>
#include <functional>
#include <string>
#include <string_view>
#include <system_error>

namespace memsync::persistence {

// ── Atomic file operations ────────────────────────────────────────────────────
//
// Any reader of `target` observes either its previous content or the complete
// new content.  Content goes to a uniquely named temp file in the target's
// directory (same filesystem), is fsynced, and is renamed over the target.
// The rename is the only step that touches the target, so no lock is ever
// taken on it.
//
// Temp file name: <dir>/.<target-name>.<pid>.<16 hex random>.tmp
//
// Thread-safety: stateless; concurrent calls on the same target are safe
// (last rename wins).

struct AtomicWriteOptions {
    // fsync the temp file before rename and the directory after it.
    bool sync = true;

    // Invoked after the temp file is complete, immediately before rename.
    // Tests use it to kill the process at that point.
    std::function<void(const std::filesystem::path& tmp_path)> before_rename;
};

// Atomically replace `target` with `content`.  Creates missing parent
// directories.  On failure before rename the temp file is removed and
// `target` is untouched.
[[nodiscard]] std::error_code atomic_replace(const std::filesystem::path& target,
                                             std::string_view content,
                                             const AtomicWriteOptions& options = {});

// Read `source` fully and atomically replace `target` with it.
[[nodiscard]] std::error_code atomic_copy(const std::filesystem::path& source,
                                          const std::filesystem::path& target,
                                          const AtomicWriteOptions& options = {});

// Read the whole file into `out`.
[[nodiscard]] std::error_code read_file(const std::filesystem::path& path, std::string& out);

// fsync an existing file.
[[nodiscard]] std::error_code sync_file(const std::filesystem::path& path);

// fsync a directory so a completed rename inside it is durable.
[[nodiscard]] std::error_code sync_directory(const std::filesystem::path& dir);

// Unique sibling temp path for `target`.
[[nodiscard]] std::filesystem::path make_temp_path(const std::filesystem::path& target);

} // namespace memsync::persistence
