//! # Logger Unit Tests
//!
//! Stage filter parsing, record formatting, the build-log file, command-line
//! option extraction and level filtering through the logger singleton.

#include "log/log.hpp"
#include "test_support.hpp"

#include <algorithm>
#include <gtest/gtest.h>
#include <string>
#include <thread>
#include <vector>

using namespace lspack::log;
using lspack::test::CaptureLog;
using lspack::test::read_file;
using lspack::test::TempDir;

namespace {

LogRecord make_record(LogLevel level, std::string_view module, std::string message) {
    return LogRecord{level, module, std::move(message), 1700000000123};
}

} // namespace

// ============================================================================
// LogFilter Parsing
// ============================================================================

class LogFilterTest : public ::testing::Test {
protected:
    LogFilter filter;
};

TEST_F(LogFilterTest, ParseModuleAndDefault) {
    filter.parse("deps=debug,*=info");

    EXPECT_TRUE(filter.should_log(LogLevel::Debug, "deps"));
    EXPECT_TRUE(filter.should_log(LogLevel::Error, "deps"));
    EXPECT_FALSE(filter.should_log(LogLevel::Trace, "deps"));

    // Unmatched modules use the default
    EXPECT_TRUE(filter.should_log(LogLevel::Info, "bundle"));
    EXPECT_FALSE(filter.should_log(LogLevel::Debug, "bundle"));
}

TEST_F(LogFilterTest, ParseModuleOff) {
    EXPECT_TRUE(filter.parse("env=off").empty());

    EXPECT_FALSE(filter.should_log(LogLevel::Fatal, "env"));
    EXPECT_TRUE(filter.should_log(LogLevel::Info, "package"));
}

TEST_F(LogFilterTest, BareStageEnablesDebug) {
    filter.parse("package");

    EXPECT_TRUE(filter.should_log(LogLevel::Debug, "package"));
    EXPECT_FALSE(filter.should_log(LogLevel::Trace, "package"));
    EXPECT_FALSE(filter.should_log(LogLevel::Debug, "build"));
}

TEST_F(LogFilterTest, UnknownStagesAreReportedAndIgnored) {
    auto unknown = filter.parse("deps=trace,compiler=debug,pkg");
    EXPECT_EQ(unknown, (std::vector<std::string>{"compiler", "pkg"}));
    EXPECT_TRUE(filter.should_log(LogLevel::Trace, "deps"));
    EXPECT_FALSE(filter.should_log(LogLevel::Debug, "compiler"));
    EXPECT_EQ(filter.min_level(), LogLevel::Trace);
}

TEST(StageTagTest, EveryPipelineStageIsKnown) {
    for (const char* tag : {"build", "platform", "env", "deps", "bundle", "package", "process",
                            "config", "container", "cli"}) {
        EXPECT_TRUE(is_stage_tag(tag)) << tag;
    }
    EXPECT_FALSE(is_stage_tag("*"));
    EXPECT_FALSE(is_stage_tag("Build"));
    EXPECT_EQ(stage_tags().size(), 10u);
}

TEST_F(LogFilterTest, ParseMultipleModules) {
    filter.parse("deps=trace,build=info,bundle=warn,*=error");

    EXPECT_TRUE(filter.should_log(LogLevel::Trace, "deps"));
    EXPECT_TRUE(filter.should_log(LogLevel::Info, "build"));
    EXPECT_FALSE(filter.should_log(LogLevel::Debug, "build"));
    EXPECT_TRUE(filter.should_log(LogLevel::Warn, "bundle"));
    EXPECT_FALSE(filter.should_log(LogLevel::Info, "bundle"));
    EXPECT_TRUE(filter.should_log(LogLevel::Error, "other"));
    EXPECT_FALSE(filter.should_log(LogLevel::Warn, "other"));
}

TEST_F(LogFilterTest, MinLevelAcrossModules) {
    filter.parse("deps=trace,*=warn");
    EXPECT_EQ(filter.min_level(), LogLevel::Trace);

    LogFilter plain;
    plain.set_default_level(LogLevel::Error);
    EXPECT_EQ(plain.min_level(), LogLevel::Error);
}

TEST(LogLevelTest, ParsesNames) {
    EXPECT_EQ(parse_level("TRACE"), LogLevel::Trace);
    EXPECT_EQ(parse_level("warning"), LogLevel::Warn);
    EXPECT_EQ(parse_level("off"), LogLevel::Off);
    EXPECT_EQ(parse_level("chatty"), LogLevel::Info);
}

// ============================================================================
// Formatting
// ============================================================================

TEST(LogFormatTest, TextContainsLevelModuleAndMessage) {
    auto line = format_record(make_record(LogLevel::Warn, "deps", "prebuilt fetch failed"),
                              LogFormat::Text);
    EXPECT_NE(line.find("WARN  [deps] prebuilt fetch failed"), std::string::npos) << line;
    EXPECT_EQ(line.find('\n'), std::string::npos);
}

TEST(LogFormatTest, JsonEscapesMessage) {
    auto line = format_record(make_record(LogLevel::Error, "package", "tool said \"no\"\n"),
                              LogFormat::JSON);
    EXPECT_EQ(line, "{\"level\":\"ERROR\",\"module\":\"package\","
                    "\"msg\":\"tool said \\\"no\\\"\\n\",\"ts\":1700000000123}");
}

TEST(LogFormatTest, JsonEscapesControlCharacters) {
    auto line = format_record(make_record(LogLevel::Warn, "deps", std::string("a\tb\x01", 4)),
                              LogFormat::JSON);
    EXPECT_NE(line.find("\\u0001"), std::string::npos) << line;
    EXPECT_EQ(line.find('\t'), std::string::npos);
}

// ============================================================================
// FileSink
// ============================================================================

TEST(FileSinkTest, WritesAndAppends) {
    TempDir dir;
    auto path = (dir.path() / "build.log").string();
    {
        FileSink sink(path, LogFormat::Text, false);
        ASSERT_TRUE(sink.is_open());
        sink.write(make_record(LogLevel::Info, "build", "first"));
    }
    {
        FileSink sink(path, LogFormat::Text, true);
        sink.write(make_record(LogLevel::Info, "build", "second"));
        sink.flush();
    }

    auto content = read_file(path);
    auto first = content.find("first");
    auto second = content.find("second");
    ASSERT_NE(first, std::string::npos);
    ASSERT_NE(second, std::string::npos);
    EXPECT_LT(first, second);
}

TEST(FileSinkTest, JsonLines) {
    TempDir dir;
    auto path = (dir.path() / "build.jsonl").string();
    {
        FileSink sink(path, LogFormat::JSON, false);
        sink.write(make_record(LogLevel::Debug, "env", "one"));
        sink.write(make_record(LogLevel::Debug, "env", "two"));
    }
    auto content = read_file(path);
    EXPECT_EQ(std::count(content.begin(), content.end(), '\n'), 2);
    EXPECT_EQ(content.rfind("{\"level\":\"DEBUG\",\"module\":\"env\"", 0), 0u);
}

// ============================================================================
// Command-line Options
// ============================================================================

TEST(LogOptionsTest, ExtractsOptions) {
    const char* args[] = {"lspack",           "build", "--log-level=debug",
                          "--log-format=json", "--log-file=/tmp/lspack.log"};
    auto config = parse_log_options(5, const_cast<char**>(args));
    EXPECT_EQ(config.level, LogLevel::Debug);
    EXPECT_EQ(config.format, LogFormat::JSON);
    EXPECT_EQ(config.log_file, "/tmp/lspack.log");
}

TEST(LogOptionsTest, VerbosityFlags) {
    const char* v[] = {"lspack", "-v"};
    EXPECT_EQ(parse_log_options(2, const_cast<char**>(v)).level, LogLevel::Debug);

    const char* vv[] = {"lspack", "-vv"};
    EXPECT_EQ(parse_log_options(2, const_cast<char**>(vv)).level, LogLevel::Trace);

    const char* q[] = {"lspack", "-q"};
    EXPECT_EQ(parse_log_options(2, const_cast<char**>(q)).level, LogLevel::Warn);
}

TEST(LogOptionsTest, RecognizesLogOptions) {
    EXPECT_TRUE(is_log_option("--log-filter=deps=trace"));
    EXPECT_TRUE(is_log_option("-vvv"));
    EXPECT_TRUE(is_log_option("--quiet"));
    EXPECT_FALSE(is_log_option("--offline"));
    EXPECT_FALSE(is_log_option("-V"));
    EXPECT_FALSE(is_log_option("--log-level"));
}

// ============================================================================
// Logger
// ============================================================================

TEST(LoggerTest, MacrosRespectLevel) {
    CaptureLog capture;
    Logger::instance().set_level(LogLevel::Warn);

    LSPACK_LOG_INFO("build", "hidden " << 1);
    LSPACK_LOG_WARN("build", "shown " << 2);

    EXPECT_FALSE(capture.contains("hidden 1"));
    EXPECT_TRUE(capture.contains("WARN [build] shown 2"));
}

TEST(LoggerTest, FilterSelectsModules) {
    CaptureLog capture;
    Logger::instance().set_filter("deps=trace,*=error");

    LSPACK_LOG_TRACE("deps", "strategy order");
    LSPACK_LOG_WARN("bundle", "ignored");

    EXPECT_TRUE(capture.contains("[deps] strategy order"));
    EXPECT_FALSE(capture.contains("ignored"));

    Logger::instance().set_filter("*=info");
}

TEST(LoggerTest, ConcurrentWritersKeepEveryRecord) {
    CaptureLog capture;
    std::vector<std::thread> threads;
    for (int t = 0; t < 4; ++t) {
        threads.emplace_back([t] {
            for (int i = 0; i < 50; ++i) {
                LSPACK_LOG_INFO("build", "thread " << t << " record " << i);
            }
        });
    }
    for (auto& thread : threads) {
        thread.join();
    }
    EXPECT_EQ(capture.messages().size(), 200u);
}
