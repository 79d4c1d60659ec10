#include "common/errors.hpp"
#include "common/logger.hpp"
#include "common/sync_config.hpp"
#include "handoff/clock.hpp"
#include "handoff/handoff_coordinator.hpp"
#include "merge/merge_engine.hpp"
#include "persistence/snapshot_manager.hpp"
#include "session/file_remote.hpp"
#include "session/session_context.hpp"
#include "session/sync_session.hpp"
#include "store/store_stats.hpp"
#include "store/validator.hpp"

#include <spdlog/spdlog.h>

#include <chrono>
#include <cstdio>
#include <filesystem>
#include <memory>
#include <stdexcept>
#include <string>

namespace fs = std::filesystem;

namespace {

// Shared state for one command.
struct Driver {
    memsync::SyncConfig cfg;
    memsync::session::SessionPaths paths;
    memsync::NamingPolicy policy;
    memsync::ValidationOptions options;
    spdlog::level::level_enum level;
    std::shared_ptr<spdlog::logger> logger;
};

// ── validate / stats ──────────────────────────────────────────────────────────

int run_validate(const Driver& d) {
    const fs::path target = d.cfg.path.empty() ? d.paths.snapshot : fs::path{d.cfg.path};

    memsync::ValidationReport report;
    if (auto ec = memsync::validate(target, d.policy, d.options, report)) {
        d.logger->error("Cannot validate {}: {}", target.string(), ec.message());
        return 1;
    }

    for (const auto& warning : report.warnings) {
        fprintf(stdout, "warning: %s\n", warning.message.c_str());
    }
    if (!report.is_valid()) {
        fprintf(stdout, "%s: INVALID\n%s\n", target.string().c_str(),
                memsync::summarize(report).c_str());
        return 1;
    }
    fprintf(stdout, "%s: valid (%zu entities, %zu relations)\n", target.string().c_str(),
            report.entity_count, report.relation_count);
    return 0;
}

int run_stats(const Driver& d) {
    const fs::path target = d.cfg.path.empty() ? d.paths.snapshot : fs::path{d.cfg.path};

    memsync::StoreStats stats;
    if (auto ec = memsync::collect_stats(target, stats)) {
        d.logger->error("Cannot read {}: {}", target.string(), ec.message());
        return 1;
    }
    fprintf(stdout, "%s: %s\n", target.string().c_str(), memsync::format_stats(stats).c_str());
    return 0;
}

// ── Snapshot transitions ──────────────────────────────────────────────────────

int run_transition(const Driver& d, memsync::persistence::SnapshotManager& snapshots) {
    const auto& command = d.cfg.command;
    std::error_code ec;
    if (command == "backup") {
        ec = snapshots.backup(d.paths.live, d.paths.backup);
    } else if (command == "restore") {
        ec = snapshots.restore(d.paths.backup, d.paths.live, !d.cfg.keep_backup);
    } else if (command == "load") {
        ec = snapshots.load(d.paths.snapshot, d.paths.live);
    } else {
        ec = snapshots.save(d.paths.live, d.paths.snapshot);
    }

    if (ec) {
        d.logger->error("{} failed: {}", command, ec.message());
        return 1;
    }
    return 0;
}

// ── merge / partial-restore ───────────────────────────────────────────────────

int run_merge(const Driver& d, const memsync::merge::MergeEngine& merger) {
    const fs::path output = d.cfg.output.empty() ? d.paths.snapshot : fs::path{d.cfg.output};
    memsync::merge::MergeStats stats;

    std::error_code ec;
    if (d.cfg.command == "merge") {
        ec = merger.merge(d.paths.snapshot, d.cfg.remote, output, d.cfg.policy, stats);
    } else {
        const auto filter = d.cfg.filter.empty() ? d.policy.expected_prefix : d.cfg.filter;
        ec = merger.merge_partial(d.cfg.remote, d.paths.snapshot, output, filter, stats);
    }

    if (ec) {
        d.logger->error("{} into {} failed: {}", d.cfg.command, output.string(), ec.message());
        return 1;
    }
    fprintf(stdout, "%s: %zu entities, %zu relations (%zu conflicts resolved)\n",
            output.string().c_str(), stats.entities, stats.relations, stats.conflicts);
    return 0;
}

// ── start / finish ────────────────────────────────────────────────────────────

int run_session(const Driver& d,
                memsync::persistence::SnapshotManager& snapshots,
                const memsync::merge::MergeEngine& merger) {
    using namespace std::chrono;

    memsync::handoff::SteadyClock clock;
    memsync::handoff::HandoffOptions handoff_options;
    handoff_options.settle_delay  = milliseconds{d.cfg.settle_ms};
    handoff_options.poll_interval = milliseconds{d.cfg.poll_interval_ms};
    memsync::handoff::HandoffCoordinator coordinator{
        d.paths.live, handoff_options, clock,
        memsync::make_component_logger("handoff", d.level)};

    std::unique_ptr<memsync::session::FileRemote> remote;
    if (!d.cfg.remote.empty()) {
        remote = std::make_unique<memsync::session::FileRemote>(d.cfg.remote, d.logger);
    }

    memsync::session::SessionOptions session_options;
    session_options.policy          = d.cfg.policy;
    session_options.handoff_timeout = milliseconds{d.cfg.handoff_timeout_ms};
    session_options.keep_backup     = d.cfg.keep_backup;

    memsync::session::SyncSession session{
        d.paths, snapshots, merger, coordinator, remote.get(), session_options,
        memsync::make_component_logger("session", d.level)};

    if (d.cfg.command == "start") {
        if (auto ec = session.start()) {
            d.logger->error("start failed: {}", ec.message());
            return 1;
        }
        return 0;
    }

    // finish runs in a later process than the start that handed the store off.
    if (auto ec = session.resume()) {
        d.logger->error("finish: no session to finish: {}", ec.message());
        return 1;
    }
    if (auto ec = session.finish()) {
        d.logger->error("finish failed: {}", ec.message());
        return 1;
    }
    return 0;
}

} // anonymous namespace

int main(int argc, char* argv[]) {
    // ── Parse CLI arguments ──────────────────────────────────────────────────
    Driver d;
    try {
        d.cfg = memsync::parse_config(argc, argv);
    } catch (const std::runtime_error& e) {
        fprintf(stderr, "%s\n", e.what());
        return 1;
    }

    // ── Logging ──────────────────────────────────────────────────────────────
    d.level = memsync::parse_log_level(d.cfg.log_level);
    memsync::init_default_logger(d.level);
    d.logger = spdlog::default_logger();

    d.paths   = memsync::session_paths(d.cfg);
    d.policy  = memsync::naming_policy(d.cfg);
    d.options = memsync::validation_options(d.cfg);

    d.logger->debug("memsync {} – context={} live={} snapshot={} prefix={}",
        d.cfg.command, memsync::session::to_string(d.cfg.context), d.paths.live.string(),
        d.paths.snapshot.string(), d.policy.expected_prefix);

    const auto& command = d.cfg.command;
    if (command == "validate") return run_validate(d);
    if (command == "stats")    return run_stats(d);

    // ── Components ───────────────────────────────────────────────────────────
    memsync::persistence::SnapshotManager snapshots{
        d.policy, d.options, memsync::make_component_logger("snapshot", d.level)};
    memsync::merge::MergeEngine merger{
        d.policy, d.options, memsync::make_component_logger("merge", d.level)};

    if (command == "merge" || command == "partial-restore") {
        return run_merge(d, merger);
    }
    if (command == "start" || command == "finish") {
        return run_session(d, snapshots, merger);
    }
    return run_transition(d, snapshots);
}
