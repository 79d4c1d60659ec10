#pragma once

#include "persistence/atomic_file.hpp"
#include "store/validator.hpp"

#include <spdlog/spdlog.h>

#include <filesystem>
#include <memory>
#include <system_error>

namespace memsync::persistence {

// ── SnapshotManager ──────────────────────────────────────────────────────────
//
// The four state transitions between the live store and at-rest stores.
// Every write goes through atomic_replace/atomic_copy, so a failure leaves
// the destination either untouched or fully written, and each call is safe
// to retry.
//
// An absent or zero-length live store is a legitimate initial state: backup
// and save write an empty store instead of failing.
//
// Thread-safety: NOT thread-safe; one session drives one manager.

class SnapshotManager {
public:
    //   policy  – naming policy snapshots must satisfy
    //   options – validator limits
    //   logger  – component logger
    //   write   – options forwarded to every atomic write
    SnapshotManager(NamingPolicy policy,
                    ValidationOptions options,
                    std::shared_ptr<spdlog::logger> logger,
                    AtomicWriteOptions write = {});

    // Copy the live store to `backup_path`.  The live store is checked for
    // well-formedness only: it may legitimately hold any context's entities.
    [[nodiscard]] std::error_code backup(const std::filesystem::path& live_path,
                                         const std::filesystem::path& backup_path);

    // Copy `backup_path` over the live store, then delete the backup unless
    // `delete_backup` is false.  On failure both files are left as they were,
    // the backup path is logged as the recovery artifact, and
    // Errc::restore_failed is returned.
    [[nodiscard]] std::error_code restore(const std::filesystem::path& backup_path,
                                          const std::filesystem::path& live_path,
                                          bool delete_backup = true);

    // Validate `snapshot_path` against the naming policy and copy it over the
    // live store.  An invalid snapshot leaves the live store untouched.  An
    // absent snapshot (new context) loads as an empty store.
    [[nodiscard]] std::error_code load(const std::filesystem::path& snapshot_path,
                                       const std::filesystem::path& live_path);

    // Copy the live store to `snapshot_path` and re-validate the copy.  If the
    // copy fails validation the previous snapshot (if any) is put back.
    [[nodiscard]] std::error_code save(const std::filesystem::path& live_path,
                                       const std::filesystem::path& snapshot_path);

    [[nodiscard]] const NamingPolicy& policy() const { return policy_; }

private:
    // Run the validator, log failures, map the report to an error code.
    [[nodiscard]] std::error_code check(const std::filesystem::path& path,
                                        const NamingPolicy& policy) const;

    // Write an empty store to `path`.
    [[nodiscard]] std::error_code write_empty(const std::filesystem::path& path) const;

    NamingPolicy policy_;
    NamingPolicy structural_policy_;   // policy_ without the name checks
    ValidationOptions options_;
    std::shared_ptr<spdlog::logger> logger_;
    AtomicWriteOptions write_;
};

// True if `path` is missing or zero bytes long.
[[nodiscard]] bool is_absent_or_empty(const std::filesystem::path& path);

} // namespace memsync::persistence
