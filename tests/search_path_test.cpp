//! # Search-Path Sanitization Tests

#include "deps/search_path.hpp"

#include <gtest/gtest.h>

using namespace lspack::deps;

namespace {

const std::vector<std::string> kConda = {"anaconda", "miniconda"};

} // namespace

TEST(SearchPathTest, RemovesCondaEntriesKeepingOrder) {
    std::string path = "/home/dev/miniconda3/bin:/usr/local/bin:/opt/Anaconda3/condabin:/usr/bin";
    EXPECT_EQ(sanitize_search_path(path, kConda, ':'), "/usr/local/bin:/usr/bin");
}

TEST(SearchPathTest, MatchingIsCaseInsensitive) {
    EXPECT_TRUE(contains_conflict_marker("C:\\Users\\dev\\MiniConda3\\Library\\bin", kConda));
    EXPECT_FALSE(contains_conflict_marker("/usr/lib/x86_64-linux-gnu", kConda));
    EXPECT_FALSE(contains_conflict_marker("/anything", {""}));
}

TEST(SearchPathTest, DropsEmptyEntries) {
    EXPECT_EQ(sanitize_search_path(":/usr/bin::/bin:", kConda, ':'), "/usr/bin:/bin");
    EXPECT_EQ(sanitize_search_path("", kConda, ':'), "");
}

TEST(SearchPathTest, WindowsSeparator) {
    std::string path = "C:\\Windows\\System32;C:\\ProgramData\\Anaconda3;C:\\Program Files\\CMake\\bin";
    EXPECT_EQ(sanitize_search_path(path, kConda, ';'),
              "C:\\Windows\\System32;C:\\Program Files\\CMake\\bin");
}

TEST(SearchPathTest, EverythingRemovedLeavesEmptyValue) {
    EXPECT_EQ(sanitize_search_path("/opt/anaconda3/bin:/opt/miniconda/bin", kConda, ':'), "");
}

TEST(SanitizeEnvironmentTest, OverridesPresentVariablesOnly) {
    std::map<std::string, std::string> env = {
        {"PATH", "/opt/miniconda3/bin:/usr/bin"},
        {"LIBRARY_PATH", "/opt/miniconda3/lib"},
        {"CONDA_PREFIX", "/opt/miniconda3"},
        {"HOME", "/home/dev"},
    };
    auto sanitized =
        sanitize_environment(env, {"PATH", "CPATH", "LIBRARY_PATH"}, {"CONDA_PREFIX"}, kConda, ':');

    ASSERT_EQ(sanitized.overrides.size(), 2u);
    EXPECT_EQ(sanitized.overrides.at("PATH"), "/usr/bin");
    EXPECT_EQ(sanitized.overrides.at("LIBRARY_PATH"), "");
    EXPECT_EQ(sanitized.overrides.count("CPATH"), 0u);
    EXPECT_EQ(sanitized.unset, std::vector<std::string>{"CONDA_PREFIX"});
    EXPECT_EQ(sanitized.removed_entries,
              (std::vector<std::string>{"/opt/miniconda3/bin", "/opt/miniconda3/lib"}));
}

TEST(SanitizeEnvironmentTest, CleanEnvironmentIsUnchanged) {
    std::map<std::string, std::string> env = {{"PATH", "/usr/local/bin:/usr/bin"}};
    auto sanitized = sanitize_environment(env, {"PATH"}, {}, kConda, ':');
    EXPECT_EQ(sanitized.overrides.at("PATH"), "/usr/local/bin:/usr/bin");
    EXPECT_TRUE(sanitized.removed_entries.empty());
    EXPECT_TRUE(sanitized.unset.empty());
}
