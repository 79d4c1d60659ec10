#pragma once

#include "handoff/handoff_coordinator.hpp"
#include "merge/merge_engine.hpp"
#include "persistence/snapshot_manager.hpp"
#include "session/session_context.hpp"

#include <spdlog/spdlog.h>

#include <chrono>
#include <filesystem>
#include <memory>
#include <system_error>

namespace memsync::session {

// ── VersionControl ───────────────────────────────────────────────────────────
//
// Collaborator that moves snapshot files in and out of version control.
// Implementations live in the orchestration layer (git plumbing).

class VersionControl {
public:
    virtual ~VersionControl() = default;

    // Place the peer's copy of `snapshot` at a local path and report it in
    // `remote_out`.  Returns Errc::not_found when there is no peer copy.
    [[nodiscard]] virtual std::error_code fetch_remote(const std::filesystem::path& snapshot,
                                                       std::filesystem::path& remote_out) = 0;

    // Stage / commit the post-session snapshot.
    [[nodiscard]] virtual std::error_code stage(const std::filesystem::path& snapshot) = 0;
};

struct SessionOptions {
    merge::ConflictPolicy policy = merge::ConflictPolicy::RemoteWins;
    std::chrono::milliseconds handoff_timeout{30'000};
    bool keep_backup = false;
};

// ── SyncSession ──────────────────────────────────────────────────────────────
//
// One memory session, start to finish:
//
//   start():  backup live → merge snapshot with remote (if any) → load
//             snapshot into live → hand off to the consumer
//   finish(): await release → save live into snapshot → stage snapshot →
//             restore the backup into live
//
// Whenever a step fails while the backup exists, the backup path is logged
// as the recovery artifact and the backup is kept.
//
// Thread-safety: NOT thread-safe.

class SyncSession {
public:
    //   vcs may be null: no remote merge, no staging.
    SyncSession(SessionPaths paths,
                persistence::SnapshotManager& snapshots,
                const merge::MergeEngine& merger,
                handoff::HandoffCoordinator& coordinator,
                VersionControl* vcs,
                SessionOptions options,
                std::shared_ptr<spdlog::logger> logger);

    [[nodiscard]] std::error_code start();

    // Timeout waiting for the consumer is logged and does not fail finish().
    [[nodiscard]] std::error_code finish();

    // Re-attach to a session started by an earlier process.  Requires the
    // session backup to exist.
    [[nodiscard]] std::error_code resume();

    [[nodiscard]] bool active() const { return active_; }

    [[nodiscard]] const SessionPaths& paths() const { return paths_; }

private:
    void report_recovery_artifact() const;

    SessionPaths paths_;
    persistence::SnapshotManager& snapshots_;
    const merge::MergeEngine& merger_;
    handoff::HandoffCoordinator& coordinator_;
    VersionControl* vcs_;
    SessionOptions options_;
    std::shared_ptr<spdlog::logger> logger_;
    bool active_ = false;
};

} // namespace memsync::session
