#include "persistence/snapshot_manager.hpp"

#include "common/errors.hpp"

#include <utility>

namespace memsync::persistence {

namespace fs = std::filesystem;

bool is_absent_or_empty(const fs::path& path) {
    std::error_code ec;
    if (!fs::exists(path, ec)) return true;
    auto size = fs::file_size(path, ec);
    return !ec && size == 0;
}

// ── Construction ─────────────────────────────────────────────────────────────

SnapshotManager::SnapshotManager(NamingPolicy policy,
                                 ValidationOptions options,
                                 std::shared_ptr<spdlog::logger> logger,
                                 AtomicWriteOptions write)
    : policy_(std::move(policy))
    , options_(options)
    , logger_(std::move(logger))
    , write_(std::move(write)) {
    structural_policy_.case_insensitive = policy_.case_insensitive;
    structural_policy_.allow_duplicate_entities = policy_.allow_duplicate_entities;
}

std::error_code SnapshotManager::check(const fs::path& path,
                                       const NamingPolicy& policy) const {
    ValidationReport report;
    if (auto ec = validate(path, policy, options_, report)) {
        logger_->error("Validation of {} could not run: {}", path.string(), ec.message());
        return ec;
    }
    if (auto ec = report_error(report)) {
        logger_->error("{} failed validation ({} entities, {} relations scanned):\n{}",
                       path.string(), report.entity_count, report.relation_count,
                       summarize(report));
        return ec;
    }
    logger_->debug("{} valid: {} entities, {} relations",
                   path.string(), report.entity_count, report.relation_count);
    return {};
}

std::error_code SnapshotManager::write_empty(const fs::path& path) const {
    return atomic_replace(path, "", write_);
}

// ── backup ───────────────────────────────────────────────────────────────────

std::error_code SnapshotManager::backup(const fs::path& live_path,
                                        const fs::path& backup_path) {
    if (is_absent_or_empty(live_path)) {
        logger_->info("Backup: live store {} absent or empty, writing empty backup {}",
                      live_path.string(), backup_path.string());
        return write_empty(backup_path);
    }

    if (auto ec = check(live_path, structural_policy_)) {
        logger_->error("Backup: refusing to back up malformed live store {}", live_path.string());
        return ec;
    }

    if (auto ec = atomic_copy(live_path, backup_path, write_)) {
        logger_->error("Backup: copy {} -> {} failed: {}",
                       live_path.string(), backup_path.string(), ec.message());
        return ec;
    }

    logger_->info("Backup: {} -> {}", live_path.string(), backup_path.string());
    return {};
}

// ── restore ──────────────────────────────────────────────────────────────────

std::error_code SnapshotManager::restore(const fs::path& backup_path,
                                         const fs::path& live_path,
                                         bool delete_backup) {
    std::error_code ec;
    if (!fs::exists(backup_path, ec)) {
        logger_->error("Restore: backup {} not found{}", backup_path.string(),
                       ec ? " (" + ec.message() + ")" : std::string{});
        return make_error_code(Errc::restore_failed);
    }

    if (auto copy_ec = atomic_copy(backup_path, live_path, write_)) {
        logger_->error("Restore: copy {} -> {} failed: {}. Backup retained at {}",
                       backup_path.string(), live_path.string(), copy_ec.message(),
                       backup_path.string());
        return make_error_code(Errc::restore_failed);
    }

    if (delete_backup) {
        std::error_code rm_ec;
        fs::remove(backup_path, rm_ec);
        if (rm_ec) {
            logger_->warn("Restore: live store restored but backup {} could not be removed: {}",
                          backup_path.string(), rm_ec.message());
        }
    }

    logger_->info("Restore: {} -> {}{}", backup_path.string(), live_path.string(),
                  delete_backup ? "" : " (backup kept)");
    return {};
}

// ── load ─────────────────────────────────────────────────────────────────────

std::error_code SnapshotManager::load(const fs::path& snapshot_path,
                                      const fs::path& live_path) {
    std::error_code ec;
    if (!fs::exists(snapshot_path, ec)) {
        if (ec) return ec;
        logger_->info("Load: no snapshot at {}, starting with an empty live store",
                      snapshot_path.string());
        return write_empty(live_path);
    }

    if (auto check_ec = check(snapshot_path, policy_)) {
        logger_->error("Load: snapshot {} rejected, live store {} untouched",
                       snapshot_path.string(), live_path.string());
        return check_ec;
    }

    if (auto copy_ec = atomic_copy(snapshot_path, live_path, write_)) {
        logger_->error("Load: copy {} -> {} failed: {}",
                       snapshot_path.string(), live_path.string(), copy_ec.message());
        return copy_ec;
    }

    logger_->info("Load: {} -> {}", snapshot_path.string(), live_path.string());
    return {};
}

// ── save ─────────────────────────────────────────────────────────────────────

std::error_code SnapshotManager::save(const fs::path& live_path,
                                      const fs::path& snapshot_path) {
    std::error_code ec;
    if (!fs::exists(live_path, ec)) {
        if (ec) return ec;
        logger_->warn("Save: live store {} absent, writing empty snapshot {}",
                      live_path.string(), snapshot_path.string());
        return write_empty(snapshot_path);
    }

    // Keep the previous snapshot reachable until the new copy has validated.
    // A hard link costs nothing and survives the rename in atomic_copy.
    fs::path rollback_path;
    if (fs::exists(snapshot_path, ec)) {
        rollback_path = make_temp_path(snapshot_path);
        std::error_code link_ec;
        fs::create_hard_link(snapshot_path, rollback_path, link_ec);
        if (link_ec) {
            logger_->debug("Save: hard link failed ({}), copying previous snapshot",
                           link_ec.message());
            if (auto copy_ec = atomic_copy(snapshot_path, rollback_path, write_)) {
                logger_->error("Save: cannot preserve previous snapshot {}: {}",
                               snapshot_path.string(), copy_ec.message());
                return copy_ec;
            }
        }
    }

    auto discard_rollback = [&] {
        if (rollback_path.empty()) return;
        std::error_code rm_ec;
        fs::remove(rollback_path, rm_ec);
    };

    if (auto copy_ec = atomic_copy(live_path, snapshot_path, write_)) {
        logger_->error("Save: copy {} -> {} failed: {}",
                       live_path.string(), snapshot_path.string(), copy_ec.message());
        discard_rollback();
        return copy_ec;
    }

    if (auto check_ec = check(snapshot_path, policy_)) {
        std::error_code undo_ec;
        if (rollback_path.empty()) {
            fs::remove(snapshot_path, undo_ec);
        } else {
            fs::rename(rollback_path, snapshot_path, undo_ec);
        }
        if (undo_ec) {
            logger_->error("Save: rollback of {} failed: {}", snapshot_path.string(),
                           undo_ec.message());
            discard_rollback();
        } else {
            logger_->warn("Save: invalid copy of {} rolled back", snapshot_path.string());
        }
        return check_ec;
    }

    discard_rollback();
    logger_->info("Save: {} -> {}", live_path.string(), snapshot_path.string());
    return {};
}

} // namespace memsync::persistence
