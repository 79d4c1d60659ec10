#include "session/sync_session.hpp"

#include "common/errors.hpp"

#include <utility>

namespace memsync::session {

SyncSession::SyncSession(SessionPaths paths,
                         persistence::SnapshotManager& snapshots,
                         const merge::MergeEngine& merger,
                         handoff::HandoffCoordinator& coordinator,
                         VersionControl* vcs,
                         SessionOptions options,
                         std::shared_ptr<spdlog::logger> logger)
    : paths_(std::move(paths))
    , snapshots_(snapshots)
    , merger_(merger)
    , coordinator_(coordinator)
    , vcs_(vcs)
    , options_(options)
    , logger_(std::move(logger)) {}

void SyncSession::report_recovery_artifact() const {
    logger_->error("Session: pre-session live store preserved at {}", paths_.backup.string());
}

// ── start ────────────────────────────────────────────────────────────────────

std::error_code SyncSession::start() {
    if (active_) {
        logger_->error("Session: start requested while a session is active");
        return make_error_code(Errc::invalid_state);
    }

    // A backup left on disk belongs to an unfinished session.
    std::error_code exists_ec;
    const bool backup_exists = std::filesystem::exists(paths_.backup, exists_ec);
    if (exists_ec) {
        logger_->error("Session: cannot check backup {}: {}", paths_.backup.string(),
                       exists_ec.message());
        return exists_ec;
    }
    if (backup_exists) {
        logger_->error("Session: backup {} already exists, run finish or restore first",
                       paths_.backup.string());
        report_recovery_artifact();
        return make_error_code(Errc::invalid_state);
    }

    logger_->info("Session: starting (snapshot {})", paths_.snapshot.string());

    if (auto ec = snapshots_.backup(paths_.live, paths_.backup)) {
        logger_->error("Session: backup failed: {}", ec.message());
        return ec;
    }

    if (vcs_ != nullptr) {
        std::filesystem::path remote;
        auto fetch_ec = vcs_->fetch_remote(paths_.snapshot, remote);
        if (fetch_ec == Errc::not_found) {
            logger_->info("Session: no remote snapshot, skipping merge");
        } else if (fetch_ec) {
            logger_->error("Session: fetching remote snapshot failed: {}", fetch_ec.message());
            report_recovery_artifact();
            return fetch_ec;
        } else {
            merge::MergeStats stats;
            if (auto ec = merger_.merge(paths_.snapshot, remote, paths_.snapshot,
                                        options_.policy, stats)) {
                logger_->error("Session: merge with {} failed: {}", remote.string(), ec.message());
                report_recovery_artifact();
                return ec;
            }
        }
    }

    if (auto ec = snapshots_.load(paths_.snapshot, paths_.live)) {
        logger_->error("Session: loading snapshot failed: {}", ec.message());
        report_recovery_artifact();
        return ec;
    }

    if (auto ec = coordinator_.prepare_for_handoff()) {
        logger_->error("Session: handoff preparation failed: {}", ec.message());
        report_recovery_artifact();
        return ec;
    }

    active_ = true;
    logger_->info("Session: live store {} handed to the consumer", paths_.live.string());
    return {};
}

// ── resume ───────────────────────────────────────────────────────────────────

std::error_code SyncSession::resume() {
    if (active_) {
        return make_error_code(Errc::invalid_state);
    }
    std::error_code ec;
    if (!std::filesystem::exists(paths_.backup, ec)) {
        logger_->error("Session: no session backup at {}, nothing to resume",
                       paths_.backup.string());
        return make_error_code(Errc::not_found);
    }
    if (auto resume_ec = coordinator_.resume_handed_off()) {
        return resume_ec;
    }
    active_ = true;
    return {};
}

// ── finish ───────────────────────────────────────────────────────────────────

std::error_code SyncSession::finish() {
    if (!active_) {
        logger_->error("Session: finish requested with no active session");
        return make_error_code(Errc::invalid_state);
    }

    // A retried finish() has already reclaimed the live store.
    std::error_code release_ec;
    if (coordinator_.state() != handoff::HandoffState::Reclaimed) {
        release_ec = coordinator_.await_release(options_.handoff_timeout);
    }
    if (is_fatal(release_ec)) {
        logger_->error("Session: reclaiming live store failed: {}", release_ec.message());
        report_recovery_artifact();
        return release_ec;
    }
    if (release_ec) {
        logger_->warn("Session: {}, continuing", release_ec.message());
    }

    if (auto ec = snapshots_.save(paths_.live, paths_.snapshot)) {
        logger_->error("Session: saving live store failed: {}. Live store left in place",
                       ec.message());
        report_recovery_artifact();
        return ec;
    }

    std::error_code stage_ec;
    if (vcs_ != nullptr) {
        stage_ec = vcs_->stage(paths_.snapshot);
        if (stage_ec) {
            logger_->error("Session: staging {} failed: {}", paths_.snapshot.string(),
                           stage_ec.message());
        }
    }

    if (auto ec = snapshots_.restore(paths_.backup, paths_.live, !options_.keep_backup)) {
        report_recovery_artifact();
        return ec;
    }

    if (auto ec = coordinator_.complete()) {
        return ec;
    }

    active_ = false;
    logger_->info("Session: finished, snapshot {} saved", paths_.snapshot.string());
    return stage_ec;
}

} // namespace memsync::session
