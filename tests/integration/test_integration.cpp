#include "wscheck/application/run_controller.hpp"
#include "wscheck/io/file_system.hpp"
#include <gmock/gmock.h>
#include <gtest/gtest.h>
#include <filesystem>
#include <fstream>
#include <sstream>
#include <unistd.h>

namespace wscheck {

using ::testing::HasSubstr;

class IntegrationTest : public ::testing::Test {
protected:
    void SetUp() override {
        test_dir_ = std::filesystem::temp_directory_path() /
                    ("wscheck_integration_" + std::to_string(::getpid()));
        std::filesystem::create_directories(test_dir_);
    }

    void TearDown() override {
        std::error_code ec;
        std::filesystem::remove_all(test_dir_, ec);
    }

    auto write_raw(const std::string& name, const std::string& content) -> std::string {
        auto path = (test_dir_ / name).string();
        std::ofstream file(path, std::ios::binary);
        file << content;
        return path;
    }

    static auto read_raw(const std::string& path) -> std::string {
        std::ifstream file(path, std::ios::binary);
        return std::string((std::istreambuf_iterator<char>(file)), std::istreambuf_iterator<char>());
    }

    std::filesystem::path test_dir_;
};

TEST_F(IntegrationTest, FixupRewritesFileButRunStillFails)
{
    auto dirty = write_raw("dirty.c", "int main()\r\n{\r\n\treturn 0;  \r\n}\r\n");
    auto clean = write_raw("clean.c", "int x;\n");

    std::ostringstream out;
    std::ostringstream err;
    RunController controller(std::make_unique<FileSystem>(), out, err);
    int status = controller.run({dirty, clean}, 4, true, OutputMode::NORMAL);

    EXPECT_EQ(status, 1);
    EXPECT_EQ(controller.summary().files_fixed, 1);
    EXPECT_EQ(controller.summary().total_violations, 2);
    EXPECT_EQ(read_raw(dirty), "int main()\r\n{\r\n    return 0;\r\n}\r\n");
    EXPECT_EQ(read_raw(clean), "int x;\n");

    // A second run over the fixed files is clean
    std::ostringstream out2;
    RunController second(std::make_unique<FileSystem>(), out2, err);
    EXPECT_EQ(second.run({dirty, clean}, 4, false, OutputMode::NORMAL), 0);
}

TEST_F(IntegrationTest, FixupThroughSymlinkFixesRealFile)
{
    auto real = write_raw("real.c", "x\t\n");
    auto link = (test_dir_ / "link.c").string();
    std::filesystem::create_symlink(real, link);

    std::ostringstream out;
    std::ostringstream err;
    RunController controller(std::make_unique<FileSystem>(), out, err);
    int status = controller.run({link}, 8, true, OutputMode::NORMAL);

    EXPECT_EQ(status, 1);
    EXPECT_EQ(controller.summary().files_fixed, 1);
    EXPECT_TRUE(std::filesystem::is_symlink(std::filesystem::symlink_status(link)));
    EXPECT_EQ(read_raw(real), "x\n");
}

TEST_F(IntegrationTest, BinaryFileIsLeftAlone)
{
    std::string blob = "\x89PNG\r\n\t  \n";
    blob.push_back('\0');
    blob += "\t\t";
    auto path = write_raw("image.png", blob);

    std::ostringstream out;
    std::ostringstream err;
    RunController controller(std::make_unique<FileSystem>(), out, err);

    EXPECT_EQ(controller.run({path}, 8, true, OutputMode::NORMAL), 0);
    EXPECT_EQ(read_raw(path), blob);
    EXPECT_EQ(controller.summary().files_skipped, 1);
}

TEST_F(IntegrationTest, MissingPathIsRecordedAndOthersStillChecked)
{
    auto missing = (test_dir_ / "vanished.c").string();
    auto dirty = write_raw("dirty.c", "x \n");

    std::ostringstream out;
    std::ostringstream err;
    RunController controller(std::make_unique<FileSystem>(), out, err);
    int status = controller.run({missing, dirty}, 8, false, OutputMode::NORMAL);

    EXPECT_EQ(status, 1);
    EXPECT_EQ(controller.summary().errors.size(), 1);
    EXPECT_EQ(controller.summary().total_violations, 1);
    EXPECT_THAT(out.str(), HasSubstr(dirty + "\n  line 1: trailing whitespace\n"));
    EXPECT_THAT(err.str(), HasSubstr(missing));
}

TEST_F(IntegrationTest, FreeRunFunctionUsesStandardStreams)
{
    auto path = write_raw("tabbed.c", "a\tb  \n");

    std::ostringstream output;
    std::streambuf* orig = std::cout.rdbuf();
    std::cout.rdbuf(output.rdbuf());

    int status = run({path}, 4, true, OutputMode::DEBUG);

    std::cout.rdbuf(orig);

    EXPECT_EQ(status, 1);
    EXPECT_EQ(read_raw(path), "a   b\n");
    EXPECT_THAT(output.str(), HasSubstr("wscheck: tab size: 4"));
    EXPECT_THAT(output.str(), HasSubstr("line 1, column 2: tab character"));
    EXPECT_THAT(output.str(), HasSubstr("line 1, column 4: trailing whitespace"));
    EXPECT_THAT(output.str(), HasSubstr(path + ": fixed"));
}

} // namespace wscheck
