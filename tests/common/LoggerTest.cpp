#include <gtest/gtest.h>
#include <canvascore/backends/DefaultBackend.h>
#include <canvascore/common/Logger.h>

using namespace canvascore;

namespace {

/// Backend that records what reached it
class RecordingBackend : public ILoggerBackend {
public:
    explicit RecordingBackend(std::vector<std::string>& lines) : lines_(lines) {}

    void log(LogLevel level, const std::string& message, const std::source_location&) override {
        if (level >= level_) {
            lines_.push_back(message);
        }
    }
    void setLevel(LogLevel level) override { level_ = level; }
    void flush() override {}

private:
    std::vector<std::string>& lines_;
    LogLevel level_ = LogLevel::Trace;
};

}  // namespace

static void emitFromHelper(int value) {
    LOG_WARN("value was {}", value);
}

class LoggerTest : public ::testing::Test {
protected:
    void SetUp() override {
        Logger::setBackend(std::make_unique<RecordingBackend>(lines_));
        Logger::enableCapture(true);
        Logger::clearCapturedLogs();
    }

    void TearDown() override {
        Logger::enableCapture(false);
        Logger::clearCapturedLogs();
        Logger::setBackend(nullptr);
    }

    std::vector<std::string> lines_;
};

TEST_F(LoggerTest, MessagesCarryCallingFunction) {
    emitFromHelper(7);

    ASSERT_EQ(lines_.size(), 1u);
    EXPECT_NE(lines_[0].find("emitFromHelper() - value was 7"), std::string::npos);
}

TEST_F(LoggerTest, CaptureTagsLevelAndFilters) {
    LOG_INFO("first {}", 1);
    LOG_ERROR("second {}", 2);

    auto errors = Logger::getCapturedLogs("[error]");
    ASSERT_EQ(errors.size(), 1u);
    EXPECT_NE(errors[0].find("second 2"), std::string::npos);
    EXPECT_EQ(Logger::getCapturedLogs().size(), 2u);
}

TEST_F(LoggerTest, MaxLinesKeepsNewest) {
    for (int i = 0; i < 5; ++i) {
        LOG_INFO("line {}", i);
    }

    auto last = Logger::getCapturedLogs("line", 2);
    ASSERT_EQ(last.size(), 2u);
    EXPECT_NE(last[0].find("line 3"), std::string::npos);
    EXPECT_NE(last[1].find("line 4"), std::string::npos);
}

TEST_F(LoggerTest, LevelThresholdAppliesToBackend) {
    Logger::setLevel(LogLevel::Warn);
    LOG_DEBUG("hidden");
    LOG_WARN("shown");

    ASSERT_EQ(lines_.size(), 1u);
    EXPECT_NE(lines_[0].find("shown"), std::string::npos);
}

TEST(LogLevelTest, ParsesNamesAndAliases) {
    EXPECT_EQ(parseLogLevel("debug"), LogLevel::Debug);
    EXPECT_EQ(parseLogLevel("WARNING"), LogLevel::Warn);
    EXPECT_EQ(parseLogLevel("err"), LogLevel::Error);
    EXPECT_FALSE(parseLogLevel("verbose").has_value());
    EXPECT_STREQ(logLevelName(LogLevel::Critical), "critical");
}

TEST(DefaultBackendTest, WritesLevelTaggedLinesAboveThreshold) {
    DefaultBackend backend;
    backend.setLevel(LogLevel::Warn);

    ::testing::internal::CaptureStdout();
    backend.log(LogLevel::Info, "quiet", std::source_location::current());
    backend.log(LogLevel::Error, "loud", std::source_location::current());
    backend.flush();
    std::string output = ::testing::internal::GetCapturedStdout();

    EXPECT_EQ(output.find("quiet"), std::string::npos);
    EXPECT_NE(output.find("error"), std::string::npos);
    EXPECT_NE(output.find("loud"), std::string::npos);
}
