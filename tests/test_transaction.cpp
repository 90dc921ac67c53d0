#include <gtest/gtest.h>
#include <run/transaction.hpp>
#include <core/path_utils.hpp>
#include <filesystem>
#include <fstream>
#include <sstream>
#include <stdexcept>
#include <sys/stat.h>
#include <unistd.h>

namespace fs = std::filesystem;

class TransactionTest : public ::testing::Test {
protected:
    fs::path test_dir;

    void SetUp() override {
        auto* info = ::testing::UnitTest::GetInstance()->current_test_info();
        test_dir = fs::temp_directory_path() / (std::string("txrun_tx_") + info->name());
        fs::remove_all(test_dir);
        fs::create_directories(test_dir);
    }

    void TearDown() override {
        fs::permissions(test_dir, fs::perms::owner_all, fs::perm_options::add);
        fs::remove_all(test_dir);
    }

    static void write_file(const fs::path& p, const std::string& content) {
        std::ofstream(p) << content;
    }

    static std::string read_file(const fs::path& p) {
        std::ifstream in(p);
        std::stringstream ss;
        ss << in.rdbuf();
        return ss.str();
    }

    // Entries of test_dir whose name starts with `prefix`.
    int count_entries(const std::string& prefix) const {
        int n = 0;
        for (const auto& e : fs::directory_iterator(test_dir)) {
            if (e.path().filename().string().rfind(prefix, 0) == 0) n++;
        }
        return n;
    }
};

TEST_F(TransactionTest, MakeTempDirCreatesUniqueDirs) {
    auto a = make_temp_dir(test_dir, "txtmp");
    auto b = make_temp_dir(test_dir, "txtmp");
    ASSERT_TRUE(a.is_ok()) << a.error;
    ASSERT_TRUE(b.is_ok()) << b.error;
    EXPECT_NE(a.value, b.value);
    EXPECT_TRUE(fs::is_directory(a.value));
    EXPECT_EQ(a.value.parent_path(), test_dir);
    EXPECT_EQ(a.value.filename().string().rfind("txtmp", 0), 0u);
}

TEST_F(TransactionTest, MakeTempDirCreatesMissingRoot) {
    auto r = make_temp_dir(test_dir / "not" / "yet", "tmp");
    ASSERT_TRUE(r.is_ok()) << r.error;
    EXPECT_TRUE(fs::is_directory(r.value));
}

TEST_F(TransactionTest, MakeTempDirUnwritableRoot) {
    if (geteuid() == 0) GTEST_SKIP() << "root ignores directory permissions";
    auto locked = test_dir / "locked";
    fs::create_directories(locked);
    fs::permissions(locked, fs::perms::owner_read | fs::perms::owner_exec);

    auto r = make_temp_dir(locked, "txtmp");
    EXPECT_TRUE(r.is_err());
    EXPECT_EQ(r.kind, ErrorKind::IOError);

    fs::permissions(locked, fs::perms::owner_all);
}

TEST_F(TransactionTest, MakeTempDirRootIsRegularFile) {
    auto file = test_dir / "plain.txt";
    write_file(file, "x");

    auto r = make_temp_dir(file, "txtmp");
    EXPECT_TRUE(r.is_err());
    EXPECT_EQ(r.kind, ErrorKind::IOError);

    auto nested = make_temp_dir(file / "below", "txtmp");
    EXPECT_EQ(nested.kind, ErrorKind::IOError);
}

TEST_F(TransactionTest, TempDirGuardRemovesTree) {
    fs::path dir;
    {
        auto r = make_temp_dir(test_dir, "tmp");
        ASSERT_TRUE(r.is_ok());
        TempDirGuard guard(r.value);
        dir = guard.path();
        fs::create_directories(dir / "a" / "b");
        write_file(dir / "a" / "b" / "f.txt", "x");
    }
    EXPECT_FALSE(fs::exists(dir));
}

TEST_F(TransactionTest, WithTempDir) {
    fs::path seen;
    auto r = with_temp_dir(test_dir, [&](const fs::path& dir) -> Result<int> {
        seen = dir;
        write_file(dir / "scratch", "data");
        return Result<int>::Ok(42);
    });
    ASSERT_TRUE(r.is_ok());
    EXPECT_EQ(r.value, 42);
    EXPECT_EQ(seen.filename().string().rfind("tmp", 0), 0u);
    EXPECT_FALSE(fs::exists(seen));
}

TEST_F(TransactionTest, StageFilesRewritesOnlyNeedTxKeys) {
    FileInfo info{{"bam", (test_dir / "sample.bam").string()},
                  {"ref", "/refs/genome.fa"}};
    auto staged = stage_files(info, {"bam"});
    ASSERT_TRUE(staged.is_ok()) << staged.error;
    TempDirGuard guard(staged.value.tx_dir);

    EXPECT_EQ(staged.value.tx_dir.parent_path(), test_dir);
    EXPECT_EQ(staged.value.file_info.at("bam"), (staged.value.tx_dir / "sample.bam").string());
    EXPECT_EQ(staged.value.file_info.at("ref"), "/refs/genome.fa");
    EXPECT_EQ(info.at("bam"), (test_dir / "sample.bam").string());
}

TEST_F(TransactionTest, StageFilesErrors) {
    FileInfo info{{"out", (test_dir / "x.txt").string()}, {"blank", ""}};

    auto empty = stage_files(info, {});
    EXPECT_EQ(empty.kind, ErrorKind::InvalidState);

    auto unknown = stage_files(info, {"nope"});
    EXPECT_EQ(unknown.kind, ErrorKind::InvalidState);

    auto blank = stage_files(info, {"blank"});
    EXPECT_EQ(blank.kind, ErrorKind::InvalidState);

    EXPECT_EQ(count_entries("txtmp"), 0);
}

TEST_F(TransactionTest, PromoteMissingStagedFileIsIOError) {
    FileInfo final_info{{"out", (test_dir / "out.txt").string()}};
    FileInfo staged{{"out", (test_dir / "never-written.txt").string()}};
    auto r = promote_files(staged, final_info, {"out"}, {});
    EXPECT_EQ(r.kind, ErrorKind::IOError);
    EXPECT_FALSE(fs::exists(test_dir / "out.txt"));
}

TEST_F(TransactionTest, CopyThenRenameReplacesDestination) {
    auto src = test_dir / "src.txt";
    auto dst = test_dir / "dst.txt";
    write_file(src, "new content");
    write_file(dst, "old");

    auto r = copy_then_rename(src, dst);
    ASSERT_TRUE(r.is_ok()) << r.error;
    EXPECT_EQ(read_file(dst), "new content");
    EXPECT_FALSE(fs::exists(src));
    EXPECT_EQ(count_entries("dst.txt.txcopy"), 0);
}

// move_file only takes the copy path when rename reports EXDEV, which needs
// a second filesystem. Where none is mounted, copy_then_rename is covered
// directly by CopyThenRenameReplacesDestination.
TEST_F(TransactionTest, MoveFileAcrossFilesystems) {
    fs::path other = "/dev/shm";
    struct stat other_st {};
    struct stat test_st {};
    if (stat(other.c_str(), &other_st) != 0 || stat(test_dir.c_str(), &test_st) != 0 ||
        other_st.st_dev == test_st.st_dev) {
        GTEST_SKIP() << "no second filesystem available";
    }
    auto src = other / ("txrun_xdev_" + std::to_string(getpid()));
    write_file(src, "payload");
    if (!fs::exists(src)) GTEST_SKIP() << other << " is not writable";

    auto dst = test_dir / "moved.txt";
    write_file(dst, "old");
    auto r = move_file(src, dst);
    ASSERT_TRUE(r.is_ok()) << r.error;
    EXPECT_EQ(read_file(dst), "payload");
    EXPECT_FALSE(fs::exists(src));
    EXPECT_EQ(count_entries("moved.txt.txcopy"), 0);
}

TEST_F(TransactionTest, MoveFileFailureIsIOError) {
    auto r = move_file(test_dir / "missing", test_dir / "dst");
    EXPECT_TRUE(r.is_err());
    EXPECT_EQ(r.kind, ErrorKind::IOError);
}

TEST_F(TransactionTest, WithTxFileSuccessPromotesOutputAndSideFiles) {
    auto out = (test_dir / "calls.vcf").string();
    std::string tx_seen;

    auto r = with_tx_file(out, {".idx", ".tbi"}, [&](const std::string& tx_out) -> Result<void> {
        tx_seen = tx_out;
        EXPECT_NE(tx_out, out);
        EXPECT_EQ(base_name(tx_out), "calls.vcf");
        write_file(tx_out, "##fileformat=VCFv4.2\n");
        write_file(tx_out + ".idx", "index");
        EXPECT_FALSE(fs::exists(out));
        return Result<void>::Ok();
    });

    ASSERT_TRUE(r.is_ok()) << r.error;
    EXPECT_EQ(read_file(out), "##fileformat=VCFv4.2\n");
    EXPECT_EQ(read_file(out + ".idx"), "index");
    EXPECT_FALSE(fs::exists(out + ".tbi"));
    EXPECT_FALSE(fs::exists(fs::path(tx_seen).parent_path()));
    EXPECT_EQ(count_entries("txtmp"), 0);
}

TEST_F(TransactionTest, WithTxFileFailureLeavesFinalPathUntouched) {
    auto out = (test_dir / "result.txt").string();
    write_file(out, "previous");

    auto r = with_tx_file(out, {}, [&](const std::string& tx_out) -> Result<void> {
        write_file(tx_out, "partial");
        return Result<void>::Err(ErrorKind::Command, "boom");
    });

    EXPECT_TRUE(r.is_err());
    EXPECT_EQ(r.kind, ErrorKind::Command);
    EXPECT_EQ(r.error, "boom");
    EXPECT_EQ(read_file(out), "previous");
    EXPECT_EQ(count_entries("txtmp"), 0);
}

TEST_F(TransactionTest, WithTxFileExceptionCleansUp) {
    auto out = (test_dir / "result.txt").string();
    fs::path tx_dir;

    EXPECT_THROW(
        with_tx_file(out, {}, [&](const std::string& tx_out) -> Result<void> {
            tx_dir = fs::path(tx_out).parent_path();
            write_file(tx_out, "partial");
            throw std::runtime_error("interrupted");
        }),
        std::runtime_error);

    EXPECT_FALSE(tx_dir.empty());
    EXPECT_FALSE(fs::exists(tx_dir));
    EXPECT_FALSE(fs::exists(out));
}

TEST_F(TransactionTest, WithTxFileMissingOutputFails) {
    auto out = (test_dir / "result.txt").string();
    auto r = with_tx_file(out, {}, [](const std::string&) { return Result<void>::Ok(); });
    EXPECT_EQ(r.kind, ErrorKind::IOError);
    EXPECT_FALSE(fs::exists(out));
    EXPECT_EQ(count_entries("txtmp"), 0);
}

TEST_F(TransactionTest, WithTxFilesPromotesSet) {
    FileInfo info{{"r1", (test_dir / "reads_1.fq").string()},
                  {"r2", (test_dir / "reads_2.fq").string()},
                  {"in", (test_dir / "reads.bam").string()}};

    auto r = with_tx_files(info, {"r1", "r2"}, {}, [&](const FileInfo& tx) -> Result<std::string> {
        EXPECT_EQ(fs::path(tx.at("r1")).parent_path(), fs::path(tx.at("r2")).parent_path());
        EXPECT_EQ(tx.at("in"), info.at("in"));
        write_file(tx.at("r1"), "@r1");
        write_file(tx.at("r2"), "@r2");
        return Result<std::string>::Ok("done");
    });

    ASSERT_TRUE(r.is_ok()) << r.error;
    EXPECT_EQ(r.value, "done");
    EXPECT_EQ(read_file(info.at("r1")), "@r1");
    EXPECT_EQ(read_file(info.at("r2")), "@r2");
    EXPECT_EQ(count_entries("txtmp"), 0);
}

TEST_F(TransactionTest, WithTxFilesEmptyKeysRunsDirectly) {
    FileInfo info{{"log", (test_dir / "run.log").string()}};
    auto r = with_tx_files(info, {}, {}, [&](const FileInfo& tx) -> Result<void> {
        EXPECT_EQ(tx.at("log"), info.at("log"));
        write_file(tx.at("log"), "direct");
        return Result<void>::Ok();
    });
    ASSERT_TRUE(r.is_ok());
    EXPECT_EQ(read_file(info.at("log")), "direct");
}

TEST_F(TransactionTest, CustomPrefix) {
    auto out = (test_dir / "o.txt").string();
    std::string tx_name;
    auto r = with_tx_file(out, {}, [&](const std::string& tx_out) -> Result<void> {
        tx_name = fs::path(tx_out).parent_path().filename().string();
        write_file(tx_out, "x");
        return Result<void>::Ok();
    }, "stage");
    ASSERT_TRUE(r.is_ok());
    EXPECT_EQ(tx_name.rfind("stage", 0), 0u);
}
