#include "persistence/atomic_file.hpp"

#include <filesystem>
#include <fstream>
#include <sstream>
#include <string>
#include <vector>

#include <sys/wait.h>
#include <unistd.h>

#include <gtest/gtest.h>

namespace memsync::persistence {

// ── Fixture ──────────────────────────────────────────────────────────────────

class AtomicFileTest : public ::testing::Test {
protected:
    void SetUp() override {
        auto* info = ::testing::UnitTest::GetInstance()->current_test_info();
        test_dir_ = std::filesystem::temp_directory_path() /
                    ("atomic_file_test_" + std::string(info->name()));
        std::filesystem::remove_all(test_dir_);
        std::filesystem::create_directories(test_dir_);
        target_ = test_dir_ / "memory.json";
    }

    void TearDown() override {
        std::filesystem::remove_all(test_dir_);
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

    std::vector<std::filesystem::path> temp_files() {
        std::vector<std::filesystem::path> out;
        for (const auto& entry : std::filesystem::directory_iterator(test_dir_)) {
            if (entry.path().extension() == ".tmp") out.push_back(entry.path());
        }
        return out;
    }

    std::filesystem::path test_dir_;
    std::filesystem::path target_;
};

// ── atomic_replace ───────────────────────────────────────────────────────────

TEST_F(AtomicFileTest, CreatesNewFile) {
    auto ec = atomic_replace(target_, "hello\n");
    ASSERT_FALSE(ec) << ec.message();
    EXPECT_EQ(read_raw(target_), "hello\n");
    EXPECT_TRUE(temp_files().empty());
}

TEST_F(AtomicFileTest, ReplacesExistingFile) {
    write_raw(target_, "old content that is longer\n");
    auto ec = atomic_replace(target_, "new\n");
    ASSERT_FALSE(ec) << ec.message();
    EXPECT_EQ(read_raw(target_), "new\n");
}

TEST_F(AtomicFileTest, WritesEmptyContent) {
    write_raw(target_, "something\n");
    auto ec = atomic_replace(target_, "");
    ASSERT_FALSE(ec) << ec.message();
    EXPECT_TRUE(std::filesystem::exists(target_));
    EXPECT_EQ(std::filesystem::file_size(target_), 0u);
}

TEST_F(AtomicFileTest, CreatesMissingParentDirectories) {
    auto nested = test_dir_ / "a" / "b" / "memory.json";
    auto ec = atomic_replace(nested, "x");
    ASSERT_FALSE(ec) << ec.message();
    EXPECT_EQ(read_raw(nested), "x");
}

TEST_F(AtomicFileTest, TempFileIsSiblingOfTarget) {
    std::filesystem::path seen;
    AtomicWriteOptions options;
    options.before_rename = [&](const std::filesystem::path& tmp) {
        seen = tmp;
        EXPECT_TRUE(std::filesystem::exists(tmp));
        EXPECT_FALSE(std::filesystem::exists(target_));
    };

    auto ec = atomic_replace(target_, "data", options);
    ASSERT_FALSE(ec) << ec.message();
    EXPECT_EQ(seen.parent_path(), test_dir_);
    EXPECT_EQ(seen.filename().string().rfind(".memory.json.", 0), 0u);
    EXPECT_FALSE(std::filesystem::exists(seen));
}

TEST_F(AtomicFileTest, TempPathsAreUnique) {
    EXPECT_NE(make_temp_path(target_), make_temp_path(target_));
}

TEST_F(AtomicFileTest, KilledBeforeRenameLeavesTargetUntouched) {
    const std::string original = "{\"type\":\"entity\",\"name\":\"AIPM_A\"}\n";
    write_raw(target_, original);

    pid_t pid = ::fork();
    ASSERT_GE(pid, 0);
    if (pid == 0) {
        AtomicWriteOptions options;
        options.before_rename = [](const std::filesystem::path&) { ::_exit(0); };
        (void)atomic_replace(target_, "half-finished replacement\n", options);
        ::_exit(1);
    }

    int status = 0;
    ASSERT_EQ(::waitpid(pid, &status, 0), pid);
    ASSERT_TRUE(WIFEXITED(status));
    EXPECT_EQ(WEXITSTATUS(status), 0);

    EXPECT_EQ(read_raw(target_), original);
    // The abandoned temp file is the only trace of the interrupted write.
    EXPECT_EQ(temp_files().size(), 1u);
}

TEST_F(AtomicFileTest, FailsWhenParentIsAFile) {
    write_raw(test_dir_ / "blocker", "x");
    auto ec = atomic_replace(test_dir_ / "blocker" / "memory.json", "data");
    EXPECT_TRUE(ec);
}

// ── atomic_copy / read_file ──────────────────────────────────────────────────

TEST_F(AtomicFileTest, CopyReproducesBytes) {
    using namespace std::string_literals;
    const auto content = "line one\r\nline two\n\xff\x00tail"s;
    auto source = test_dir_ / "source.json";
    write_raw(source, content);

    auto ec = atomic_copy(source, target_);
    ASSERT_FALSE(ec) << ec.message();
    EXPECT_EQ(read_raw(target_), content);
}

TEST_F(AtomicFileTest, CopyFromMissingSourceFailsWithoutTouchingTarget) {
    write_raw(target_, "keep");
    auto ec = atomic_copy(test_dir_ / "missing.json", target_);
    EXPECT_EQ(ec, std::errc::no_such_file_or_directory);
    EXPECT_EQ(read_raw(target_), "keep");
}

TEST_F(AtomicFileTest, ReadFileReturnsWholeContent) {
    std::string big(100'000, 'z');
    write_raw(target_, big);
    std::string out;
    auto ec = read_file(target_, out);
    ASSERT_FALSE(ec) << ec.message();
    EXPECT_EQ(out, big);
}

TEST_F(AtomicFileTest, SyncHelpers) {
    write_raw(target_, "x");
    EXPECT_FALSE(sync_file(target_));
    EXPECT_FALSE(sync_directory(test_dir_));
    EXPECT_TRUE(sync_file(test_dir_ / "missing"));
}

} // namespace memsync::persistence
