// tests/test_layer2_service/test_logger.cpp
/**
 * @file test_logger.cpp
 * @brief Unit tests for the synchronous Logger and its sinks.
 *
 * The Logger is a process-wide singleton; every test restores the console
 * sink and the previous level on exit (ScopedLogCapture or TearDown).
 */
#include "psh_service.hpp"
#include "shared_test_helpers.h"
#include "utils/logger_sinks/file_sink.hpp"
#include "gmock/gmock.h"
#include "gtest/gtest.h"

#include <stdexcept>

namespace fs = std::filesystem;
using namespace pinshare::tests::helper;
using pinshare::utils::Logger;
using ::testing::HasSubstr;

/**
 * @class LoggerTest
 * @brief Test fixture for Logger tests that write files.
 *
 * Manages unique log file paths and removes them afterwards.
 */
class LoggerTest : public ::testing::Test
{
  protected:
    std::vector<fs::path> paths_to_clean_;
    Logger::Level saved_level_{Logger::Level::L_WARNING};

    void SetUp() override { saved_level_ = Logger::instance().level(); }

    void TearDown() override
    {
        Logger::instance().set_console();
        Logger::instance().set_level(saved_level_);
        Logger::instance().set_write_error_callback(nullptr);
        for (const auto &p : paths_to_clean_)
        {
            std::error_code ec;
            fs::remove(p, ec);
        }
    }

    fs::path GetUniqueLogPath(const std::string &test_name)
    {
        auto p = unique_temp_path(test_name, ".log");
        paths_to_clean_.push_back(p);
        return p;
    }
};

// ============================================================================
// Formatting and filtering
// ============================================================================

TEST_F(LoggerTest, LineFormat)
{
    ScopedLogCapture capture;
    LOGGER_INFO("hello {}", 42);

    const auto lines = capture.lines();
    ASSERT_EQ(lines.size(), 1u);
    EXPECT_THAT(lines[0], HasSubstr("[PINSHARE] [INFO  ]"));
    EXPECT_THAT(lines[0], HasSubstr(fmt::format("[PID:{:5}]", pinshare::platform::get_pid())));
    EXPECT_THAT(lines[0], HasSubstr("hello 42\n"));
}

TEST_F(LoggerTest, LevelFiltering)
{
    ScopedLogCapture capture(Logger::Level::L_WARNING);
    LOGGER_TRACE("trace-msg");
    LOGGER_DEBUG("debug-msg");
    LOGGER_INFO("info-msg");
    LOGGER_WARN("warn-msg");
    LOGGER_ERROR("error-msg");
    LOGGER_SYSTEM("system-msg");

    EXPECT_EQ(capture.count("trace-msg"), 0u);
    EXPECT_EQ(capture.count("debug-msg"), 0u);
    EXPECT_EQ(capture.count("info-msg"), 0u);
    EXPECT_EQ(capture.count("[WARN  ]"), 1u);
    EXPECT_EQ(capture.count("[ERROR ]"), 1u);
    EXPECT_EQ(capture.count("[SYSTEM]"), 1u);
}

TEST_F(LoggerTest, RuntimeFormatString)
{
    ScopedLogCapture capture;
    const std::string fmt_str = "value={} name={}";
    LOGGER_INFO_RT(fmt_str, 7, "x");
    EXPECT_EQ(capture.count("value=7 name=x"), 1u);
}

TEST_F(LoggerTest, BadRuntimeFormatIsReportedNotThrown)
{
    ScopedLogCapture capture;
    EXPECT_NO_THROW(LOGGER_ERROR_RT("missing arg {} {}", 1));
    EXPECT_EQ(capture.count("[FORMAT ERROR]"), 1u);
}

TEST_F(LoggerTest, ShutdownDropsRecordsUntilNewSink)
{
    auto store = std::make_shared<MemorySink::Store>();
    Logger::instance().set_level(Logger::Level::L_TRACE);
    Logger::instance().set_sink(std::make_unique<MemorySink>(store));
    LOGGER_INFO("before");
    Logger::instance().shutdown();
    LOGGER_INFO("after");
    EXPECT_EQ(store->lines.size(), 1u);
}

TEST_F(LoggerTest, ParseLevel)
{
    EXPECT_EQ(Logger::parse_level("trace"), Logger::Level::L_TRACE);
    EXPECT_EQ(Logger::parse_level("DEBUG"), Logger::Level::L_DEBUG);
    EXPECT_EQ(Logger::parse_level("Info"), Logger::Level::L_INFO);
    EXPECT_EQ(Logger::parse_level("warn"), Logger::Level::L_WARNING);
    EXPECT_EQ(Logger::parse_level("warning"), Logger::Level::L_WARNING);
    EXPECT_EQ(Logger::parse_level("error"), Logger::Level::L_ERROR);
    EXPECT_EQ(Logger::parse_level("system"), Logger::Level::L_SYSTEM);
    EXPECT_FALSE(Logger::parse_level("verbose").has_value());
    EXPECT_FALSE(Logger::parse_level("").has_value());
}

// ============================================================================
// File sink
// ============================================================================

TEST_F(LoggerTest, FileSinkAppends)
{
    const auto path = GetUniqueLogPath("file_sink");
    Logger::instance().set_level(Logger::Level::L_INFO);
    ASSERT_TRUE(Logger::instance().set_logfile(path.string()));
    LOGGER_INFO("first line");
    LOGGER_WARN("second line");
    Logger::instance().flush();

    // Re-opening appends rather than truncating.
    ASSERT_TRUE(Logger::instance().set_logfile(path.string()));
    LOGGER_ERROR("third line");
    Logger::instance().shutdown();

    std::string contents;
    ASSERT_TRUE(read_file_contents(path.string(), contents));
    EXPECT_EQ(count_lines(contents, "[PINSHARE]"), 3u);
    EXPECT_EQ(count_lines(contents, "first line"), 1u);
    EXPECT_EQ(count_lines(contents, "third line"), 1u);
}

TEST_F(LoggerTest, UnopenableFileKeepsPreviousSinkAndReportsError)
{
    std::string reported;
    Logger::instance().set_write_error_callback([&](const std::string &msg) { reported = msg; });

    ScopedLogCapture capture(Logger::Level::L_INFO);
    const auto bad = fs::temp_directory_path() / "pinshare_no_such_dir" / "x" / "y.log";
    EXPECT_FALSE(Logger::instance().set_logfile(bad.string()));
    EXPECT_THAT(reported, HasSubstr("Failed to open log file"));

    LOGGER_INFO("still captured");
    EXPECT_EQ(capture.count("still captured"), 1u);
}

TEST_F(LoggerTest, FileSinkConstructorThrows)
{
    const auto bad = fs::temp_directory_path() / "pinshare_no_such_dir" / "z.log";
    EXPECT_THROW(pinshare::utils::FileSink sink(bad.string()), std::runtime_error);
}

// ============================================================================
// Sink failures
// ============================================================================

namespace
{

class ThrowingSink : public pinshare::utils::Sink
{
  public:
    void write(const pinshare::utils::LogMessage &) override
    {
        throw std::runtime_error("disk full");
    }
    void flush() override {}
    std::string description() const override { return "Throwing"; }
};

} // namespace

TEST_F(LoggerTest, SinkWriteFailureGoesToCallback)
{
    std::vector<std::string> errors;
    Logger::instance().set_write_error_callback(
        [&](const std::string &msg) { errors.push_back(msg); });
    Logger::instance().set_level(Logger::Level::L_INFO);
    Logger::instance().set_sink(std::make_unique<ThrowingSink>());

    EXPECT_NO_THROW(LOGGER_INFO("lost"));
    ASSERT_EQ(errors.size(), 1u);
    EXPECT_THAT(errors[0], HasSubstr("Throwing write failed: disk full"));
}
