#include "common/errors.hpp"
#include "common/logger.hpp"
#include "merge/merge_engine.hpp"
#include "store/codec.hpp"
#include "store/store_reader.hpp"

#include <cstdint>
#include <filesystem>
#include <fstream>
#include <limits>
#include <set>
#include <sstream>
#include <string>
#include <tuple>
#include <vector>

#include <gtest/gtest.h>

namespace memsync::merge {

namespace {

std::string entity(const std::string& name, const std::string& observation = "seen",
                   const std::string& extra = "") {
    return R"({"type":"entity","name":")" + name +
           R"(","entityType":"note","observations":[")" + observation + R"("])" + extra +
           "}\n";
}

std::string relation(const std::string& from, const std::string& to,
                     const std::string& type = "relates_to") {
    return R"({"type":"relation","from":")" + from + R"(","to":")" + to +
           R"(","relationType":")" + type + R"("})" "\n";
}

} // anonymous namespace

// ── Fixture ──────────────────────────────────────────────────────────────────

class MergeEngineTest : public ::testing::Test {
protected:
    void SetUp() override {
        auto* info = ::testing::UnitTest::GetInstance()->current_test_info();
        test_dir_ = std::filesystem::temp_directory_path() /
                    ("merge_engine_test_" + std::string(info->name()));
        std::filesystem::remove_all(test_dir_);
        std::filesystem::create_directories(test_dir_);

        local_  = test_dir_ / "local.json";
        remote_ = test_dir_ / "remote.json";
        output_ = test_dir_ / "merged.json";

        policy_.expected_prefix = "AIPM_";
    }

    void TearDown() override {
        std::filesystem::remove_all(test_dir_);
    }

    MergeEngine make_engine() const {
        return MergeEngine(policy_, ValidationOptions{},
                           make_component_logger("merge", spdlog::level::warn));
    }

    void write_raw(const std::filesystem::path& path, const std::string& content) {
        std::ofstream out(path, std::ios::binary | std::ios::trunc);
        out << content;
    }

    std::string read_raw(const std::filesystem::path& path) {
        std::ifstream in(path, std::ios::binary);
        std::ostringstream ss;
        ss << in.rdbuf();
        return ss.str();
    }

    std::vector<Record> read_records(const std::filesystem::path& path) {
        std::vector<Record> records;
        ScanSummary summary;
        auto ec = scan_store(path,
            [&](std::size_t line_no, DecodeResult&& result) {
                EXPECT_TRUE(std::holds_alternative<Record>(result)) << "line " << line_no;
                if (auto* rec = std::get_if<Record>(&result)) records.push_back(std::move(*rec));
                return ScanAction::Continue;
            },
            summary);
        EXPECT_FALSE(ec) << ec.message();
        return records;
    }

    std::vector<Entity> entities_named(const std::filesystem::path& path, const std::string& name) {
        std::vector<Entity> out;
        for (auto& rec : read_records(path)) {
            if (auto* e = std::get_if<Entity>(&rec); e != nullptr && e->name == name) {
                out.push_back(*e);
            }
        }
        return out;
    }

    std::filesystem::path test_dir_;
    std::filesystem::path local_;
    std::filesystem::path remote_;
    std::filesystem::path output_;
    NamingPolicy policy_;
};

// ── Conflict resolution ──────────────────────────────────────────────────────

TEST_F(MergeEngineTest, RemoteWinsKeepsRemoteVersion) {
    write_raw(local_,  entity("AIPM_X", "local view") + entity("AIPM_L"));
    write_raw(remote_, entity("AIPM_X", "remote view") + entity("AIPM_R"));

    MergeStats stats;
    auto ec = make_engine().merge(local_, remote_, output_, ConflictPolicy::RemoteWins, stats);
    ASSERT_FALSE(ec) << ec.message();

    auto xs = entities_named(output_, "AIPM_X");
    ASSERT_EQ(xs.size(), 1u);
    ASSERT_EQ(xs[0].observations.size(), 1u);
    EXPECT_EQ(xs[0].observations[0], "remote view");

    EXPECT_EQ(stats.entities, 3u);
    EXPECT_EQ(stats.conflicts, 1u);
    EXPECT_EQ(stats.local_only_entities, 1u);
}

TEST_F(MergeEngineTest, LocalWinsKeepsLocalVersion) {
    write_raw(local_,  entity("AIPM_X", "local view"));
    write_raw(remote_, entity("AIPM_X", "remote view"));

    MergeStats stats;
    auto ec = make_engine().merge(local_, remote_, output_, ConflictPolicy::LocalWins, stats);
    ASSERT_FALSE(ec) << ec.message();

    auto xs = entities_named(output_, "AIPM_X");
    ASSERT_EQ(xs.size(), 1u);
    EXPECT_EQ(xs[0].observations[0], "local view");
}

TEST_F(MergeEngineTest, NewestWinsComparesTimestamps) {
    write_raw(local_,
        entity("AIPM_A", "local a", R"(,"timestamp":200)") +
        entity("AIPM_B", "local b", R"(,"timestamp":100)") +
        entity("AIPM_C", "local c", R"(,"timestamp":50)"));
    write_raw(remote_,
        entity("AIPM_A", "remote a", R"(,"timestamp":100)") +
        entity("AIPM_B", "remote b", R"(,"timestamp":"300")") +
        entity("AIPM_C", "remote c", R"(,"timestamp":50)"));

    MergeStats stats;
    auto ec = make_engine().merge(local_, remote_, output_, ConflictPolicy::NewestWins, stats);
    ASSERT_FALSE(ec) << ec.message();

    EXPECT_EQ(entities_named(output_, "AIPM_A")[0].observations[0], "local a");
    EXPECT_EQ(entities_named(output_, "AIPM_B")[0].observations[0], "remote b");
    // Equal stamps keep the local version.
    EXPECT_EQ(entities_named(output_, "AIPM_C")[0].observations[0], "local c");
    EXPECT_EQ(stats.conflicts, 3u);
}

TEST_F(MergeEngineTest, NewestWinsWithoutTimestampsKeepsLocal) {
    write_raw(local_,  entity("AIPM_X", "local view"));
    write_raw(remote_, entity("AIPM_X", "remote view"));

    MergeStats stats;
    ASSERT_FALSE(make_engine().merge(local_, remote_, output_, ConflictPolicy::NewestWins, stats));
    EXPECT_EQ(entities_named(output_, "AIPM_X")[0].observations[0], "local view");
}

TEST(EntityTimestampTest, ReadsFieldOrObservation) {
    Entity e;
    EXPECT_EQ(entity_timestamp(e), 0);

    e.observations = {"something", "Timestamp: 1700000000"};
    EXPECT_EQ(entity_timestamp(e), 1700000000);

    e.extra["timestamp"] = 42;
    EXPECT_EQ(entity_timestamp(e), 42);

    e.extra["timestamp"] = 12.9;
    EXPECT_EQ(entity_timestamp(e), 12);

    e.extra["timestamp"] = "not a number";
    EXPECT_EQ(entity_timestamp(e), 1700000000);
}

TEST(EntityTimestampTest, SaturatesOutOfRangeNumbers) {
    Entity e;
    e.extra["timestamp"] = 1e300;
    EXPECT_EQ(entity_timestamp(e), std::numeric_limits<int64_t>::max());

    e.extra["timestamp"] = -1e300;
    EXPECT_EQ(entity_timestamp(e), std::numeric_limits<int64_t>::min());

    e.extra["timestamp"] = std::numeric_limits<uint64_t>::max();
    EXPECT_EQ(entity_timestamp(e), std::numeric_limits<int64_t>::max());

    e.extra["timestamp"] = uint64_t{1700000000};
    EXPECT_EQ(entity_timestamp(e), 1700000000);
}

TEST(ConflictPolicyTest, ParsesNames) {
    EXPECT_EQ(parse_conflict_policy("remote-wins"), ConflictPolicy::RemoteWins);
    EXPECT_EQ(parse_conflict_policy("local-wins"), ConflictPolicy::LocalWins);
    EXPECT_EQ(parse_conflict_policy("newest-wins"), ConflictPolicy::NewestWins);
    EXPECT_FALSE(parse_conflict_policy("random").has_value());
    EXPECT_EQ(to_string(ConflictPolicy::NewestWins), "newest-wins");
}

// ── Structural properties ────────────────────────────────────────────────────

TEST_F(MergeEngineTest, MergeIsDeterministic) {
    write_raw(local_,
        entity("AIPM_A") + entity("AIPM_B", "local") + relation("AIPM_A", "AIPM_B") +
        entity("AIPM_C"));
    write_raw(remote_,
        entity("AIPM_B", "remote") + entity("AIPM_D") + relation("AIPM_D", "AIPM_A") +
        relation("AIPM_A", "AIPM_B"));

    auto engine = make_engine();
    MergeStats stats;
    ASSERT_FALSE(engine.merge(local_, remote_, output_, ConflictPolicy::RemoteWins, stats));
    const auto first = read_raw(output_);

    auto second_output = test_dir_ / "merged_again.json";
    ASSERT_FALSE(engine.merge(local_, remote_, second_output, ConflictPolicy::RemoteWins, stats));
    EXPECT_EQ(read_raw(second_output), first);
}

TEST_F(MergeEngineTest, OutputOrderIsRemoteThenLocal) {
    write_raw(local_,  entity("AIPM_L1") + relation("AIPM_L1", "AIPM_L2") + entity("AIPM_L2"));
    write_raw(remote_, entity("AIPM_R1") + relation("AIPM_R1", "AIPM_L1"));

    MergeStats stats;
    ASSERT_FALSE(make_engine().merge(local_, remote_, output_, ConflictPolicy::RemoteWins, stats));

    EXPECT_EQ(read_raw(output_),
              entity("AIPM_R1") + relation("AIPM_R1", "AIPM_L1") +
              entity("AIPM_L1") + entity("AIPM_L2") + relation("AIPM_L1", "AIPM_L2"));
}

TEST_F(MergeEngineTest, DisjointStoresAddUp) {
    std::string local;
    std::string remote;
    for (int i = 0; i < 20; ++i) {
        local  += entity("AIPM_L" + std::to_string(i));
        remote += entity("AIPM_R" + std::to_string(i));
    }
    for (int i = 0; i < 5; ++i) {
        local  += relation("AIPM_L" + std::to_string(i), "AIPM_L" + std::to_string(i + 1));
        remote += relation("AIPM_R" + std::to_string(i), "AIPM_R" + std::to_string(i + 1));
    }
    write_raw(local_, local);
    write_raw(remote_, remote);

    for (auto policy : {ConflictPolicy::RemoteWins, ConflictPolicy::LocalWins,
                        ConflictPolicy::NewestWins}) {
        MergeStats stats;
        ASSERT_FALSE(make_engine().merge(local_, remote_, output_, policy, stats));
        EXPECT_EQ(stats.entities, 40u) << to_string(policy);
        EXPECT_EQ(stats.relations, 10u) << to_string(policy);
        EXPECT_EQ(stats.conflicts, 0u) << to_string(policy);
    }
}

TEST_F(MergeEngineTest, NeverEmitsDuplicateRelations) {
    write_raw(local_,
        entity("AIPM_A") + entity("AIPM_B") +
        relation("AIPM_A", "AIPM_B") + relation("AIPM_A", "AIPM_B") +
        relation("AIPM_A", "AIPM_B", "blocks"));
    write_raw(remote_,
        relation("AIPM_A", "AIPM_B") + relation("AIPM_B", "AIPM_A") + relation("AIPM_B", "AIPM_A"));

    MergeStats stats;
    ASSERT_FALSE(make_engine().merge(local_, remote_, output_, ConflictPolicy::RemoteWins, stats));
    EXPECT_EQ(stats.relations, 3u);
    EXPECT_EQ(stats.duplicate_relations, 3u);

    std::set<std::tuple<std::string, std::string, std::string>> keys;
    for (const auto& rec : read_records(output_)) {
        if (const auto* r = std::get_if<Relation>(&rec)) {
            EXPECT_TRUE(keys.emplace(r->from, r->to, r->relation_type).second)
                << r->from << " -> " << r->to;
        }
    }
}

TEST_F(MergeEngineTest, DuplicateLocalEntitiesCollapseToLastWrite) {
    write_raw(local_, entity("AIPM_A", "first") + entity("AIPM_A", "second"));
    write_raw(remote_, "");

    MergeStats stats;
    ASSERT_FALSE(make_engine().merge(local_, remote_, output_, ConflictPolicy::RemoteWins, stats));
    auto as = entities_named(output_, "AIPM_A");
    ASSERT_EQ(as.size(), 1u);
    EXPECT_EQ(as[0].observations[0], "second");
}

TEST_F(MergeEngineTest, UnknownFieldsSurviveMerge) {
    write_raw(local_, entity("AIPM_A", "x", R"(,"source":"session-7")"));
    write_raw(remote_, "");

    MergeStats stats;
    ASSERT_FALSE(make_engine().merge(local_, remote_, output_, ConflictPolicy::RemoteWins, stats));
    auto as = entities_named(output_, "AIPM_A");
    ASSERT_EQ(as.size(), 1u);
    EXPECT_EQ(as[0].extra["source"], "session-7");
}

// ── Absent and empty inputs ──────────────────────────────────────────────────

TEST_F(MergeEngineTest, AbsentInputsAreEmptyStores) {
    write_raw(local_, entity("AIPM_A"));

    MergeStats stats;
    ASSERT_FALSE(make_engine().merge(local_, remote_, output_, ConflictPolicy::RemoteWins, stats));
    EXPECT_EQ(read_raw(output_), entity("AIPM_A"));

    ASSERT_FALSE(make_engine().merge(test_dir_ / "none.json", local_, output_,
                                     ConflictPolicy::RemoteWins, stats));
    EXPECT_EQ(read_raw(output_), entity("AIPM_A"));
}

TEST_F(MergeEngineTest, EmptyStoreMarkersMergeToEmptyOutput) {
    write_raw(local_, "{}\n");
    write_raw(remote_, "{}");

    MergeStats stats;
    ASSERT_FALSE(make_engine().merge(local_, remote_, output_, ConflictPolicy::RemoteWins, stats));
    EXPECT_TRUE(std::filesystem::exists(output_));
    EXPECT_EQ(std::filesystem::file_size(output_), 0u);
}

// ── Failure paths ────────────────────────────────────────────────────────────

TEST_F(MergeEngineTest, UndecodableInputAbortsWithoutWriting) {
    write_raw(output_, "previous\n");
    write_raw(local_, entity("AIPM_A") + "{garbage\n");
    write_raw(remote_, entity("AIPM_B"));

    MergeStats stats;
    auto ec = make_engine().merge(local_, remote_, output_, ConflictPolicy::RemoteWins, stats);
    EXPECT_EQ(ec, Errc::decode_malformed);
    EXPECT_EQ(read_raw(output_), "previous\n");
}

TEST_F(MergeEngineTest, InvalidResultIsDiscarded) {
    write_raw(output_, "previous\n");
    write_raw(local_, entity("AIPM_A"));
    write_raw(remote_, entity("OTHER_B"));

    MergeStats stats;
    auto ec = make_engine().merge(local_, remote_, output_, ConflictPolicy::RemoteWins, stats);
    EXPECT_EQ(ec, Errc::merge_validation_failed);
    EXPECT_EQ(read_raw(output_), "previous\n");
}

TEST_F(MergeEngineTest, MergeInPlaceOverLocal) {
    write_raw(local_, entity("AIPM_A"));
    write_raw(remote_, entity("AIPM_B"));

    MergeStats stats;
    ASSERT_FALSE(make_engine().merge(local_, remote_, local_, ConflictPolicy::RemoteWins, stats));
    EXPECT_EQ(read_raw(local_), entity("AIPM_B") + entity("AIPM_A"));
}

TEST_F(MergeEngineTest, BuildDoesNotTouchDisk) {
    write_raw(local_, entity("AIPM_A"));
    write_raw(remote_, entity("OTHER_B"));

    MergeResult result;
    auto ec = make_engine().build(local_, remote_, ConflictPolicy::RemoteWins, result);
    ASSERT_FALSE(ec) << ec.message();
    EXPECT_EQ(result.content, entity("OTHER_B") + entity("AIPM_A"));
    EXPECT_FALSE(std::filesystem::exists(output_));
}

// ── merge_partial ────────────────────────────────────────────────────────────

TEST_F(MergeEngineTest, PartialRestoreReplacesOnlyMatchingEntities) {
    auto source = test_dir_ / "history.json";
    write_raw(source,
        entity("AIPM_TASK_1", "old task 1") + entity("AIPM_TASK_2", "old task 2") +
        entity("AIPM_DECISION_1", "old decision") +
        relation("AIPM_TASK_1", "AIPM_DECISION_1", "implements") +
        relation("AIPM_DECISION_1", "AIPM_CONTEXT_9"));
    write_raw(local_,
        entity("AIPM_TASK_1", "new task 1") + entity("AIPM_DECISION_1", "new decision") +
        entity("AIPM_CONTEXT_5") + relation("AIPM_CONTEXT_5", "AIPM_DECISION_1"));

    MergeStats stats;
    auto ec = make_engine().merge_partial(source, local_, output_, "AIPM_TASK_", stats);
    ASSERT_FALSE(ec) << ec.message();

    EXPECT_EQ(entities_named(output_, "AIPM_TASK_1")[0].observations[0], "old task 1");
    EXPECT_EQ(entities_named(output_, "AIPM_TASK_2")[0].observations[0], "old task 2");
    EXPECT_EQ(entities_named(output_, "AIPM_DECISION_1")[0].observations[0], "new decision");
    EXPECT_EQ(entities_named(output_, "AIPM_CONTEXT_5").size(), 1u);

    EXPECT_EQ(stats.entities, 4u);
    EXPECT_EQ(stats.conflicts, 1u);
    // Live relation plus the source relation touching AIPM_TASK_1.
    EXPECT_EQ(stats.relations, 2u);
}

TEST_F(MergeEngineTest, PartialRestoreNeedsSource) {
    write_raw(local_, entity("AIPM_A"));
    MergeStats stats;
    auto ec = make_engine().merge_partial(test_dir_ / "missing.json", local_, output_,
                                          "AIPM_", stats);
    EXPECT_EQ(ec, Errc::not_found);
    EXPECT_FALSE(std::filesystem::exists(output_));
}

} // namespace memsync::merge
