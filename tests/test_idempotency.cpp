#include <gtest/gtest.h>
#include <run/idempotency.hpp>
#include <filesystem>
#include <fstream>
#include <chrono>

namespace fs = std::filesystem;

class IdempotencyTest : public ::testing::Test {
protected:
    fs::path test_dir;

    void SetUp() override {
        auto* info = ::testing::UnitTest::GetInstance()->current_test_info();
        test_dir = fs::temp_directory_path() / (std::string("txrun_idem_") + info->name());
        fs::remove_all(test_dir);
        fs::create_directories(test_dir);
    }

    void TearDown() override {
        fs::remove_all(test_dir);
    }

    std::string write_file(const std::string& name, const std::string& content) {
        auto p = test_dir / name;
        std::ofstream(p) << content;
        return p.string();
    }

    std::string missing(const std::string& name) {
        return (test_dir / name).string();
    }
};

TEST_F(IdempotencyTest, ExistingNonEmptyFileNeedsNoRun) {
    auto f = write_file("a.ok", "content");
    EXPECT_FALSE(needs_run(f));
}

TEST_F(IdempotencyTest, MissingFileNeedsRun) {
    EXPECT_TRUE(needs_run(missing("noexist.txt")));
}

TEST_F(IdempotencyTest, EmptyFileNeedsRun) {
    auto f = write_file("empty.txt", "");
    EXPECT_TRUE(needs_run(f));
}

TEST_F(IdempotencyTest, MultipleFiles) {
    auto a = write_file("a.ok", "x");
    auto b = write_file("b.ok", "y");
    EXPECT_FALSE(needs_run(a, b));
    EXPECT_FALSE(needs_run(std::vector<std::string>{a, b}));
    EXPECT_TRUE(needs_run(a, missing("b.missing")));
    EXPECT_TRUE(needs_run(std::vector<std::string>{a, missing("b.missing")}));
}

TEST_F(IdempotencyTest, NestedGroupsAreFlattened) {
    auto a = write_file("a.ok", "x");
    auto b = write_file("b.ok", "y");
    std::vector<std::vector<std::string>> nested{{a}, {b}};
    EXPECT_FALSE(needs_run(nested));
    EXPECT_FALSE(needs_run(fs::path(a), nested, b.c_str()));

    nested.push_back({missing("c.missing")});
    EXPECT_TRUE(needs_run(a, nested));
}

TEST_F(IdempotencyTest, DirectoryIsNotAnOutputFile) {
    fs::create_directories(test_dir / "subdir");
    EXPECT_TRUE(needs_run((test_dir / "subdir").string()));
}

TEST_F(IdempotencyTest, UpToDate) {
    auto parent = write_file("parent.txt", "p");
    auto derived = write_file("derived.txt", "d");
    auto now = fs::file_time_type::clock::now();
    fs::last_write_time(parent, now - std::chrono::hours(1));
    fs::last_write_time(derived, now);

    EXPECT_TRUE(is_up_to_date(derived, parent));
    EXPECT_FALSE(is_up_to_date(parent, derived));
}

TEST_F(IdempotencyTest, UpToDateEqualTimes) {
    auto parent = write_file("parent.txt", "p");
    auto derived = write_file("derived.txt", "d");
    auto t = fs::file_time_type::clock::now();
    fs::last_write_time(parent, t);
    fs::last_write_time(derived, t);
    EXPECT_TRUE(is_up_to_date(derived, parent));
}

TEST_F(IdempotencyTest, UpToDateMissingFiles) {
    auto existing = write_file("x.txt", "x");
    EXPECT_FALSE(is_up_to_date(missing("derived.txt"), existing));
    EXPECT_TRUE(is_up_to_date(existing, missing("parent.txt")));
}
