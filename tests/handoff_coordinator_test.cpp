#include "common/errors.hpp"
#include "common/logger.hpp"
#include "handoff/clock.hpp"
#include "handoff/handoff_coordinator.hpp"

#include <chrono>
#include <filesystem>
#include <fstream>
#include <string>

#include <gtest/gtest.h>

namespace memsync::handoff {

using namespace std::chrono_literals;

namespace {

constexpr const char* kStore =
    R"({"type":"entity","name":"AIPM_A","entityType":"note","observations":[]})" "\n";

} // anonymous namespace

// ── Fixture ──────────────────────────────────────────────────────────────────

class HandoffCoordinatorTest : public ::testing::Test {
protected:
    void SetUp() override {
        auto* info = ::testing::UnitTest::GetInstance()->current_test_info();
        test_dir_ = std::filesystem::temp_directory_path() /
                    ("handoff_coordinator_test_" + std::string(info->name()));
        std::filesystem::remove_all(test_dir_);
        std::filesystem::create_directories(test_dir_);
        live_ = test_dir_ / "memory.json";

        options_.settle_delay  = 500ms;
        options_.poll_interval = 100ms;
    }

    void TearDown() override {
        std::filesystem::remove_all(test_dir_);
    }

    HandoffCoordinator make_coordinator() {
        return HandoffCoordinator(live_, options_, clock_,
                                  make_component_logger("handoff", spdlog::level::warn));
    }

    void write_raw(const std::string& content) {
        std::ofstream out(live_, std::ios::binary | std::ios::trunc);
        out << content;
    }

    std::filesystem::path test_dir_;
    std::filesystem::path live_;
    HandoffOptions options_;
    MockClock clock_;
};

// ── Happy path ───────────────────────────────────────────────────────────────

TEST_F(HandoffCoordinatorTest, FullCycle) {
    write_raw(kStore);
    auto coordinator = make_coordinator();
    EXPECT_EQ(coordinator.state(), HandoffState::Idle);

    ASSERT_FALSE(coordinator.prepare_for_handoff());
    EXPECT_EQ(coordinator.state(), HandoffState::HandedOff);

    ASSERT_FALSE(coordinator.await_release(5000ms));
    EXPECT_EQ(coordinator.state(), HandoffState::Reclaimed);

    ASSERT_FALSE(coordinator.complete());
    EXPECT_EQ(coordinator.state(), HandoffState::Idle);
}

TEST_F(HandoffCoordinatorTest, PrepareWaitsTheSettleDelay) {
    write_raw(kStore);
    auto coordinator = make_coordinator();
    const auto before = clock_.now();

    ASSERT_FALSE(coordinator.prepare_for_handoff());
    EXPECT_EQ(clock_.now() - before, 500ms);
    EXPECT_EQ(clock_.sleeps(), 1);
}

TEST_F(HandoffCoordinatorTest, PrepareWithAbsentLiveStore) {
    auto coordinator = make_coordinator();
    ASSERT_FALSE(coordinator.prepare_for_handoff());
    EXPECT_EQ(coordinator.state(), HandoffState::HandedOff);
}

TEST_F(HandoffCoordinatorTest, ReleaseObservedAfterSeveralPolls) {
    // The consumer is still mid-write: the first line is cut short.
    write_raw(R"({"type":"entity","name":"AIP)");
    auto coordinator = make_coordinator();
    ASSERT_FALSE(coordinator.prepare_for_handoff());

    const int sleeps_before = clock_.sleeps();
    clock_.set_on_sleep([&](int sleeps) {
        if (sleeps - sleeps_before == 3) write_raw(kStore);
    });

    const auto start = clock_.now();
    ASSERT_FALSE(coordinator.await_release(5000ms));
    EXPECT_EQ(coordinator.state(), HandoffState::Reclaimed);
    EXPECT_EQ(clock_.sleeps() - sleeps_before, 3);
    EXPECT_EQ(clock_.now() - start, 300ms);
}

TEST_F(HandoffCoordinatorTest, EmptyLiveStoreCountsAsReleased) {
    write_raw("");
    auto coordinator = make_coordinator();
    ASSERT_FALSE(coordinator.prepare_for_handoff());
    ASSERT_FALSE(coordinator.await_release(1000ms));
}

// ── Timeout ──────────────────────────────────────────────────────────────────

TEST_F(HandoffCoordinatorTest, TimeoutStillReachesReclaimed) {
    auto coordinator = make_coordinator();
    ASSERT_FALSE(coordinator.prepare_for_handoff());

    // The live store never appears.
    const auto start = clock_.now();
    auto ec = coordinator.await_release(1000ms);
    EXPECT_EQ(ec, Errc::timeout_exceeded);
    EXPECT_FALSE(is_fatal(ec));
    EXPECT_EQ(coordinator.state(), HandoffState::Reclaimed);
    EXPECT_EQ(clock_.now() - start, 1000ms);

    EXPECT_FALSE(coordinator.complete());
    EXPECT_EQ(coordinator.state(), HandoffState::Idle);
}

TEST_F(HandoffCoordinatorTest, TimeoutOnPersistentlyCorruptStore) {
    write_raw("{not json\n");
    auto coordinator = make_coordinator();
    ASSERT_FALSE(coordinator.prepare_for_handoff());

    EXPECT_EQ(coordinator.await_release(250ms), Errc::timeout_exceeded);
    EXPECT_EQ(coordinator.state(), HandoffState::Reclaimed);
}

TEST_F(HandoffCoordinatorTest, LastPollIsShortenedToTheDeadline) {
    auto coordinator = make_coordinator();
    ASSERT_FALSE(coordinator.prepare_for_handoff());
    const auto start = clock_.now();
    EXPECT_EQ(coordinator.await_release(250ms), Errc::timeout_exceeded);
    EXPECT_EQ(clock_.now() - start, 250ms);
}

// ── Invalid transitions ──────────────────────────────────────────────────────

TEST_F(HandoffCoordinatorTest, AwaitBeforeHandoffIsInvalid) {
    auto coordinator = make_coordinator();
    EXPECT_EQ(coordinator.await_release(100ms), Errc::invalid_state);
    EXPECT_EQ(coordinator.state(), HandoffState::Idle);
}

TEST_F(HandoffCoordinatorTest, SecondHandoffMustPassThroughReclaimed) {
    write_raw(kStore);
    auto coordinator = make_coordinator();
    ASSERT_FALSE(coordinator.prepare_for_handoff());
    EXPECT_EQ(coordinator.prepare_for_handoff(), Errc::invalid_state);
    EXPECT_EQ(coordinator.state(), HandoffState::HandedOff);

    ASSERT_FALSE(coordinator.await_release(100ms));
    EXPECT_EQ(coordinator.prepare_for_handoff(), Errc::invalid_state);
    ASSERT_FALSE(coordinator.complete());
    EXPECT_FALSE(coordinator.prepare_for_handoff());
}

TEST_F(HandoffCoordinatorTest, CompleteRequiresReclaimed) {
    auto coordinator = make_coordinator();
    EXPECT_EQ(coordinator.complete(), Errc::invalid_state);
    ASSERT_FALSE(coordinator.prepare_for_handoff());
    EXPECT_EQ(coordinator.complete(), Errc::invalid_state);
}

TEST_F(HandoffCoordinatorTest, ResumeEntersHandedOff) {
    write_raw(kStore);
    auto coordinator = make_coordinator();
    ASSERT_FALSE(coordinator.resume_handed_off());
    EXPECT_EQ(coordinator.state(), HandoffState::HandedOff);
    EXPECT_EQ(coordinator.resume_handed_off(), Errc::invalid_state);
    ASSERT_FALSE(coordinator.await_release(100ms));
}

// ── probe ────────────────────────────────────────────────────────────────────

TEST_F(HandoffCoordinatorTest, Probe) {
    EXPECT_FALSE(HandoffCoordinator::probe(live_));
    write_raw("");
    EXPECT_TRUE(HandoffCoordinator::probe(live_));
    write_raw("{}\n");
    EXPECT_TRUE(HandoffCoordinator::probe(live_));
    write_raw(std::string("\n") + kStore + "{broken later\n");
    EXPECT_TRUE(HandoffCoordinator::probe(live_));
    write_raw("{broken\n");
    EXPECT_FALSE(HandoffCoordinator::probe(live_));
}

TEST(HandoffStateTest, Names) {
    EXPECT_EQ(to_string(HandoffState::Idle), "Idle");
    EXPECT_EQ(to_string(HandoffState::AwaitingReturn), "AwaitingReturn");
    EXPECT_EQ(to_string(HandoffState::Reclaimed), "Reclaimed");
}

} // namespace memsync::handoff
