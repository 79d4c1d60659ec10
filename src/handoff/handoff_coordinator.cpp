#include "handoff/handoff_coordinator.hpp"

#include "common/errors.hpp"
#include "persistence/atomic_file.hpp"
#include "store/codec.hpp"

#include <algorithm>
#include <fstream>
#include <string>
#include <utility>

#include <unistd.h>

namespace memsync::handoff {

std::string_view to_string(HandoffState state) {
    switch (state) {
        case HandoffState::Idle:           return "Idle";
        case HandoffState::Preparing:      return "Preparing";
        case HandoffState::HandedOff:      return "HandedOff";
        case HandoffState::AwaitingReturn: return "AwaitingReturn";
        case HandoffState::Reclaimed:      return "Reclaimed";
    }
    return "Unknown";
}

HandoffCoordinator::HandoffCoordinator(std::filesystem::path live_path,
                                       HandoffOptions options,
                                       Clock& clock,
                                       std::shared_ptr<spdlog::logger> logger)
    : live_path_(std::move(live_path))
    , options_(options)
    , clock_(clock)
    , logger_(std::move(logger)) {}

std::error_code HandoffCoordinator::transition(HandoffState from, HandoffState to) {
    if (state_ != from) {
        logger_->error("Handoff: cannot move to {} from {} (expected {})",
                       to_string(to), to_string(state_), to_string(from));
        return make_error_code(Errc::invalid_state);
    }
    logger_->debug("Handoff: {} -> {}", to_string(from), to_string(to));
    state_ = to;
    return {};
}

// ── prepare_for_handoff ──────────────────────────────────────────────────────

std::error_code HandoffCoordinator::prepare_for_handoff() {
    if (auto ec = transition(HandoffState::Idle, HandoffState::Preparing)) {
        return ec;
    }

    std::error_code exists_ec;
    if (std::filesystem::exists(live_path_, exists_ec)) {
        if (auto ec = persistence::sync_file(live_path_)) {
            logger_->error("Handoff: fsync of {} failed: {}", live_path_.string(), ec.message());
            state_ = HandoffState::Idle;
            return ec;
        }
        auto dir = live_path_.parent_path();
        if (auto ec = persistence::sync_directory(dir.empty() ? std::filesystem::path{"."} : dir)) {
            logger_->warn("Handoff: fsync of directory {} failed: {}", dir.string(), ec.message());
        }
    } else {
        logger_->debug("Handoff: live store {} absent, nothing to flush", live_path_.string());
    }

    clock_.sleep_for(options_.settle_delay);

    auto ec = transition(HandoffState::Preparing, HandoffState::HandedOff);
    if (!ec) {
        logger_->info("Handoff: live store {} handed off", live_path_.string());
    }
    return ec;
}

// ── await_release ────────────────────────────────────────────────────────────

std::error_code HandoffCoordinator::await_release(std::chrono::milliseconds timeout) {
    if (auto ec = transition(HandoffState::HandedOff, HandoffState::AwaitingReturn)) {
        return ec;
    }

    const auto start = clock_.now();
    const auto deadline = start + timeout;
    int polls = 0;

    while (true) {
        ++polls;
        if (probe(live_path_)) {
            state_ = HandoffState::Reclaimed;
            logger_->info("Handoff: live store {} reclaimed after {} poll(s)",
                          live_path_.string(), polls);
            return {};
        }

        const auto now = clock_.now();
        if (now >= deadline) {
            state_ = HandoffState::Reclaimed;
            logger_->warn("Handoff: live store {} not released within {} ms, proceeding anyway",
                          live_path_.string(), timeout.count());
            return make_error_code(Errc::timeout_exceeded);
        }

        auto remaining = std::chrono::duration_cast<std::chrono::milliseconds>(deadline - now);
        clock_.sleep_for(std::min(options_.poll_interval, std::max(remaining, std::chrono::milliseconds{1})));
    }
}

// ── complete / resume ────────────────────────────────────────────────────────

std::error_code HandoffCoordinator::complete() {
    return transition(HandoffState::Reclaimed, HandoffState::Idle);
}

std::error_code HandoffCoordinator::resume_handed_off() {
    if (auto ec = transition(HandoffState::Idle, HandoffState::HandedOff)) {
        return ec;
    }
    logger_->info("Handoff: resuming handed-off session on {}", live_path_.string());
    return {};
}

// ── probe ────────────────────────────────────────────────────────────────────

bool HandoffCoordinator::probe(const std::filesystem::path& path) {
    if (::access(path.c_str(), R_OK | W_OK) != 0) {
        return false;
    }

    std::ifstream in(path, std::ios::binary);
    if (!in.is_open()) return false;

    std::string line;
    while (std::getline(in, line)) {
        if (!line.empty() && line.back() == '\r') line.pop_back();
        if (is_blank(line)) continue;
        if (is_empty_store_marker(line)) return true;
        return std::holds_alternative<Record>(decode_line(line));
    }
    return !in.bad();
}

} // namespace memsync::handoff
