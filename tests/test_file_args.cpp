#include <gtest/gtest.h>
#include <inputs/file_args.hpp>
#include <filesystem>
#include <fstream>

namespace fs = std::filesystem;

class FileArgsTest : public ::testing::Test {
protected:
    fs::path test_dir;

    void SetUp() override {
        auto* info = ::testing::UnitTest::GetInstance()->current_test_info();
        test_dir = fs::temp_directory_path() / (std::string("txrun_args_") + info->name());
        fs::remove_all(test_dir);
        fs::create_directories(test_dir);
    }

    void TearDown() override {
        fs::remove_all(test_dir);
    }

    std::string touch(const std::string& name, const std::string& content = "x\n") {
        fs::path p = test_dir / name;
        std::ofstream(p) << content;
        return p.string();
    }
};

TEST_F(FileArgsTest, DetectByExtension) {
    EXPECT_EQ(detect_file_type("a.bam"), FileType::Bam);
    EXPECT_EQ(detect_file_type("a.cram"), FileType::Bam);
    EXPECT_EQ(detect_file_type("a.vcf"), FileType::Vcf);
    EXPECT_EQ(detect_file_type("a.vcf.gz"), FileType::Vcf);
    EXPECT_EQ(detect_file_type(touch("samples.txt")), FileType::List);
}

TEST_F(FileArgsTest, DetectVcfByHeader) {
    auto f = touch("calls.out", "##fileformat=VCFv4.2\n#CHROM\tPOS\n");
    EXPECT_EQ(detect_file_type(f), FileType::Vcf);
}

TEST_F(FileArgsTest, DirectInputs) {
    auto bam = touch("s1.bam");
    auto vcf = touch("s1.vcf");
    auto by_type = vcf_bam_args({bam, vcf});
    EXPECT_EQ(by_type[FileType::Bam], std::vector<std::string>{bam});
    EXPECT_EQ(by_type[FileType::Vcf], std::vector<std::string>{vcf});
    EXPECT_EQ(by_type.count(FileType::Missing), 0u);
}

TEST_F(FileArgsTest, ListFilesExpandRecursively) {
    auto b1 = touch("s1.bam");
    auto b2 = touch("s2.cram");
    auto v1 = touch("s1.vcf");
    auto inner = touch("inner.list", v1 + "\n");
    auto outer = touch("outer.list", b1 + "  \n\n" + b2 + "\n" + inner + "\n");

    auto by_type = vcf_bam_args({outer});
    EXPECT_EQ(by_type[FileType::Bam], (std::vector<std::string>{b1, b2}));
    EXPECT_EQ(by_type[FileType::Vcf], std::vector<std::string>{v1});
}

TEST_F(FileArgsTest, MissingInputs) {
    auto gone = (test_dir / "gone.bam").string();
    auto list = touch("samples.list", gone + "\n");
    auto by_type = vcf_bam_args({list, (test_dir / "also-gone.vcf").string()});
    ASSERT_EQ(by_type[FileType::Missing].size(), 2u);
    EXPECT_EQ(by_type[FileType::Missing][0], gone);
}

TEST_F(FileArgsTest, CompressedFallback) {
    touch("calls.vcf.gz");
    auto plain = (test_dir / "calls.vcf").string();
    auto by_type = vcf_bam_args({plain});
    EXPECT_EQ(by_type[FileType::Vcf], std::vector<std::string>{plain});
    EXPECT_EQ(by_type.count(FileType::Missing), 0u);
}

TEST_F(FileArgsTest, SelfReferencingListTerminates) {
    auto list = (test_dir / "loop.list").string();
    std::ofstream(list) << list << "\n";
    auto by_type = vcf_bam_args({list});
    EXPECT_EQ(by_type[FileType::Missing].size(), 1u);
}

TEST(FileArgs, CheckMissing) {
    auto msgs = check_missing({"out"}, {"out", "command", "ref"});
    ASSERT_EQ(msgs.size(), 2u);
    EXPECT_EQ(msgs[0], "Missing required option: command");
    EXPECT_EQ(msgs[1], "Missing required option: ref");
    EXPECT_TRUE(check_missing({"a"}, {"a"}).empty());
}

TEST(FileArgs, ErrorMsg) {
    EXPECT_EQ(error_msg({"one", "two"}),
              "The following errors occurred while parsing your command:\none\ntwo");
}

TEST(FileArgs, TypeNames) {
    EXPECT_STREQ(file_type_name(FileType::Bam), "bam");
    EXPECT_STREQ(file_type_name(FileType::Missing), "missing");
}
