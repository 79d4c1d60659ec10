#pragma once

#include "handoff/clock.hpp"

#include <spdlog/spdlog.h>

#include <chrono>
#include <cstdint>
#include <filesystem>
#include <memory>
#include <string_view>
#include <system_error>

namespace memsync::handoff {

// ── Handoff state ────────────────────────────────────────────────────────────
//
//   Idle → Preparing → HandedOff → AwaitingReturn → Reclaimed → Idle
//
// Only in HandedOff does the external consumer own the live store.  A second
// handoff within one session must first pass through Reclaimed.

enum class HandoffState : uint8_t {
    Idle           = 0,
    Preparing      = 1,
    HandedOff      = 2,
    AwaitingReturn = 3,
    Reclaimed      = 4,
};

[[nodiscard]] std::string_view to_string(HandoffState state);

struct HandoffOptions {
    std::chrono::milliseconds settle_delay{500};
    std::chrono::milliseconds poll_interval{500};
};

// ── HandoffCoordinator ───────────────────────────────────────────────────────
//
// Sequences this process's access to the live store with the consumer
// process.  No lock is ever taken on the live file and no IPC channel is
// assumed: release is detected by bounded polling.
//
// Thread-safety: NOT thread-safe.

class HandoffCoordinator {
public:
    HandoffCoordinator(std::filesystem::path live_path,
                       HandoffOptions options,
                       Clock& clock,
                       std::shared_ptr<spdlog::logger> logger);

    // Idle → Preparing → HandedOff.
    // fsyncs the live store and its directory, then waits the settle delay.
    // On a flush failure the state returns to Idle.
    [[nodiscard]] std::error_code prepare_for_handoff();

    // HandedOff → AwaitingReturn → Reclaimed.
    // Polls every poll_interval until probe() succeeds.  If `timeout`
    // elapses first, returns Errc::timeout_exceeded; the state still
    // advances to Reclaimed and callers proceed with a warning.
    [[nodiscard]] std::error_code await_release(std::chrono::milliseconds timeout);

    // Reclaimed → Idle.
    [[nodiscard]] std::error_code complete();

    // Idle → HandedOff for a session whose handoff was started by an
    // earlier process (the state machine does not survive process exit).
    [[nodiscard]] std::error_code resume_handed_off();

    [[nodiscard]] HandoffState state() const { return state_; }

    [[nodiscard]] const std::filesystem::path& live_path() const { return live_path_; }

    // Live store is readable, writable, and its first record decodes
    // (an empty store counts).
    [[nodiscard]] static bool probe(const std::filesystem::path& path);

private:
    [[nodiscard]] std::error_code transition(HandoffState from, HandoffState to);

    std::filesystem::path live_path_;
    HandoffOptions options_;
    Clock& clock_;
    std::shared_ptr<spdlog::logger> logger_;
    HandoffState state_ = HandoffState::Idle;
};

} // namespace memsync::handoff
