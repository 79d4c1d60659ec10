#pragma once

#include <chrono>
#include <functional>
#include <thread>
#include <utility>

namespace memsync::handoff {

// ── Clock abstraction ────────────────────────────────────────────────────────
//
// Time source and sleeper for the handoff poll loop, so that tests can use a
// deterministic, manually-advanced clock instead of wall-clock time.

class Clock {
public:
    using time_point = std::chrono::steady_clock::time_point;

    virtual ~Clock() = default;

    [[nodiscard]] virtual time_point now() const = 0;

    virtual void sleep_for(std::chrono::milliseconds duration) = 0;
};

// ── SteadyClock ──────────────────────────────────────────────────────────────
//
// Production implementation: std::chrono::steady_clock and a blocking sleep.

class SteadyClock final : public Clock {
public:
    [[nodiscard]] time_point now() const override {
        return std::chrono::steady_clock::now();
    }

    void sleep_for(std::chrono::milliseconds duration) override {
        std::this_thread::sleep_for(duration);
    }
};

// ── MockClock ────────────────────────────────────────────────────────────────
//
// Test implementation: time only advances via advance() or sleep_for().
// An optional hook runs after every sleep, letting a test change the world
// between polls.

class MockClock final : public Clock {
public:
    [[nodiscard]] time_point now() const override {
        return now_;
    }

    void sleep_for(std::chrono::milliseconds duration) override {
        now_ += duration;
        ++sleeps_;
        if (on_sleep_) on_sleep_(sleeps_);
    }

    void advance(std::chrono::milliseconds delta) {
        now_ += delta;
    }

    void set_on_sleep(std::function<void(int sleeps)> hook) {
        on_sleep_ = std::move(hook);
    }

    [[nodiscard]] int sleeps() const { return sleeps_; }

private:
    time_point now_{};
    int sleeps_ = 0;
    std::function<void(int)> on_sleep_;
};

} // namespace memsync::handoff
