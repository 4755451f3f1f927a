#include "wscheck/config/config_file.hpp"
#include <gtest/gtest.h>
#include <filesystem>
#include <fstream>
#include <unistd.h>

namespace wscheck {

TEST(ParseConfigTest, ReadsWscheckSection)
{
    auto settings = parse_config("# project settings\n"
                                 "[other]\n"
                                 "tab_size = 2\n"
                                 "\n"
                                 "[wscheck]\n"
                                 "tab_size = 4\n"
                                 "checked_exts = .c .h  .cpp\n"
                                 "ignored_files = foo/contains_tabs.txt\n"
                                 "; unknown keys are ignored\n"
                                 "colour = always\n",
                                 "test.ini");

    ASSERT_TRUE(settings.tab_size.has_value());
    EXPECT_EQ(*settings.tab_size, 4);
    ASSERT_TRUE(settings.checked_exts.has_value());
    EXPECT_EQ(*settings.checked_exts, (std::vector<std::string>{".c", ".h", ".cpp"}));
    EXPECT_EQ(settings.ignored_files, (std::vector<std::string>{"foo/contains_tabs.txt"}));
}

TEST(ParseConfigTest, EmptyTextGivesDefaults)
{
    auto settings = parse_config("", "empty.ini");

    EXPECT_FALSE(settings.tab_size.has_value());
    EXPECT_FALSE(settings.checked_exts.has_value());
    EXPECT_TRUE(settings.ignored_files.empty());
}

TEST(ParseConfigTest, EmptyCheckedExtsMeansAllFiles)
{
    auto settings = parse_config("[wscheck]\nchecked_exts =\n", "all.ini");

    ASSERT_TRUE(settings.checked_exts.has_value());
    EXPECT_TRUE(settings.checked_exts->empty());
}

TEST(ParseConfigTest, DefaultExtensionList)
{
    auto exts = default_checked_exts();

    EXPECT_EQ(exts.size(), 17);
    EXPECT_EQ(exts.front(), ".c");
    EXPECT_EQ(exts.back(), ".glsl");
}

TEST(ParseConfigTest, RejectsBadTabSize)
{
    EXPECT_THROW(parse_config("[wscheck]\ntab_size = 0\n", "x.ini"), ConfigError);
    EXPECT_THROW(parse_config("[wscheck]\ntab_size = -3\n", "x.ini"), ConfigError);
    EXPECT_THROW(parse_config("[wscheck]\ntab_size = four\n", "x.ini"), ConfigError);
    EXPECT_THROW(parse_config("[wscheck]\ntab_size = 4x\n", "x.ini"), ConfigError);
}

TEST(ParseConfigTest, RejectsMalformedLinesInSection)
{
    try {
        parse_config("[wscheck]\ntab_size = 4\nnonsense\n", "x.ini");
        FAIL() << "expected ConfigError";
    } catch (const ConfigError& e) {
        EXPECT_NE(std::string(e.what()).find("x.ini:3"), std::string::npos);
    }
}

TEST(ParseConfigTest, IgnoresMalformedLinesInOtherSections)
{
    EXPECT_NO_THROW(parse_config("[hooks]\nwhatever\n", "x.ini"));
}

TEST(ParseTabSizeTest, AcceptsPositiveIntegers)
{
    EXPECT_EQ(parse_tab_size("8", "test"), 8);
    EXPECT_EQ(parse_tab_size(" 3 ", "test"), 3);
    EXPECT_THROW(parse_tab_size("", "test"), ConfigError);
}

class LoadConfigTest : public ::testing::Test {
protected:
    void SetUp() override {
        path_ = std::filesystem::temp_directory_path() /
                ("wscheck_config_test_" + std::to_string(::getpid()) + ".ini");
    }

    void TearDown() override {
        std::error_code ec;
        std::filesystem::remove(path_, ec);
    }

    std::filesystem::path path_;
};

TEST_F(LoadConfigTest, MissingOptionalFileIsNotAnError)
{
    EXPECT_FALSE(load_config(path_.string(), false).has_value());
}

TEST_F(LoadConfigTest, MissingRequiredFileIsAnError)
{
    EXPECT_THROW(load_config(path_.string(), true), ConfigError);
}

TEST_F(LoadConfigTest, LoadsFromDisk)
{
    {
        std::ofstream file(path_);
        file << "[wscheck]\ntab_size = 2\n";
    }

    auto settings = load_config(path_.string(), true);

    ASSERT_TRUE(settings.has_value());
    EXPECT_EQ(settings->tab_size, 2);
}

} // namespace wscheck
