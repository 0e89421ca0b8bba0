#include "flowdiff/config.hpp"
#include "flowdiff/errors.hpp"
#include "test_support/temporary_project.hpp"

#include <gmock/gmock.h>
#include <gtest/gtest.h>

#include <cstdlib>

namespace flowdiff {
namespace {

using ::testing::ElementsAre;

class ConfigTest : public ::testing::Test {
protected:

    void SetUp() override { ClearEnvironment(); }
    void TearDown() override { ClearEnvironment(); }

    static void ClearEnvironment() {
        unsetenv("FLOWDIFF_THREADS");
        unsetenv("FLOWDIFF_EXPANSION_DEPTH");
        unsetenv("FLOWDIFF_VERBOSE");
    }
};

TEST_F(ConfigTest, DefaultsWithoutConfigFile) {
    test::TemporaryProject project;
    AnalysisConfig config = load_config(project.root());

    EXPECT_FALSE(config.verbose);
    EXPECT_EQ(config.num_threads, 0u);
    EXPECT_EQ(config.default_expansion_depth, DEFAULT_EXPANSION_DEPTH);
    EXPECT_EQ(config.archive_timeout.count(), 30);
    EXPECT_EQ(config.diff_timeout.count(), 10);
}

TEST_F(ConfigTest, ParsesEveryKey) {
    AnalysisConfig config = parse_config(R"({
        "verbose": true,
        "threads": 3,
        "exclude_dirs": ["vendor", "generated"],
        "expansion_depth": 9,
        "timeouts": {"archive": 5, "diff": 2, "command": 7}
    })");

    EXPECT_TRUE(config.verbose);
    EXPECT_EQ(config.num_threads, 3u);
    EXPECT_THAT(config.exclude_dirs, ElementsAre("vendor", "generated"));
    EXPECT_EQ(config.default_expansion_depth, 9);
    EXPECT_EQ(config.archive_timeout.count(), 5);
    EXPECT_EQ(config.diff_timeout.count(), 2);
    EXPECT_EQ(config.command_timeout.count(), 7);
}

TEST_F(ConfigTest, ExpansionDepthIsClamped) {
    EXPECT_EQ(parse_config(R"({"expansion_depth": 0})").default_expansion_depth,
              MIN_EXPANSION_DEPTH);
    EXPECT_EQ(parse_config(R"({"expansion_depth": 500})").default_expansion_depth,
              MAX_EXPANSION_DEPTH);
}

TEST_F(ConfigTest, MalformedInputRaisesConfigError) {
    EXPECT_THROW(parse_config("{not json"), ConfigError);
    EXPECT_THROW(parse_config("[1, 2]"), ConfigError);
    EXPECT_THROW(parse_config(R"({"threads": "many"})"), ConfigError);
}

TEST_F(ConfigTest, ReadsConfigFileFromProjectRoot) {
    test::TemporaryProject project;
    project.AddFile(CONFIG_FILE, R"({"exclude_dirs": ["third_party"], "threads": 2})");

    AnalysisConfig config = load_config(project.root());
    EXPECT_THAT(config.exclude_dirs, ElementsAre("third_party"));
    EXPECT_EQ(config.num_threads, 2u);
}

TEST_F(ConfigTest, EnvironmentOverridesFile) {
    test::TemporaryProject project;
    project.AddFile(CONFIG_FILE, R"({"threads": 2, "expansion_depth": 4})");
    setenv("FLOWDIFF_THREADS", "6", 1);
    setenv("FLOWDIFF_EXPANSION_DEPTH", "11", 1);
    setenv("FLOWDIFF_VERBOSE", "yes", 1);

    AnalysisConfig config = load_config(project.root());
    EXPECT_EQ(config.num_threads, 6u);
    EXPECT_EQ(config.default_expansion_depth, 11);
    EXPECT_TRUE(config.verbose);
}

TEST_F(ConfigTest, InvalidEnvironmentValueRaisesConfigError) {
    test::TemporaryProject project;
    setenv("FLOWDIFF_THREADS", "four", 1);
    EXPECT_THROW(load_config(project.root()), ConfigError);

    setenv("FLOWDIFF_THREADS", "-1", 1);
    EXPECT_THROW(load_config(project.root()), ConfigError);
}

} // namespace
} // namespace flowdiff
