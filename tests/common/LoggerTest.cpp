#include <gtest/gtest.h>
#include <pagecraft/common/Logger.h>

#include <memory>
#include <vector>

using namespace pagecraft;

namespace {

/// Records every line instead of printing it
class RecordingBackend : public ILoggerBackend {
public:
    explicit RecordingBackend(std::vector<std::pair<LogLevel, std::string>>& sink) : sink_(sink) {}

    void log(LogLevel level, const std::string& message, const std::source_location&) override {
        if (level >= minLevel_) {
            sink_.emplace_back(level, message);
        }
    }
    void setLevel(LogLevel level) override { minLevel_ = level; }
    void flush() override {}

private:
    std::vector<std::pair<LogLevel, std::string>>& sink_;
    LogLevel minLevel_ = LogLevel::Trace;
};

}  // namespace

class LoggerTest : public ::testing::Test {
protected:
    void SetUp() override {
        Logger::setBackend(std::make_unique<RecordingBackend>(lines_));
        Logger::clearCapturedLogs();
        Logger::enableCapture(true);
    }

    void TearDown() override {
        Logger::enableCapture(false);
        Logger::setCaptureCapacity(1000);
        Logger::setBackend(nullptr);
    }

    std::vector<std::pair<LogLevel, std::string>> lines_;
};

TEST_F(LoggerTest, InjectedBackendReceivesMessages) {
    LOG_INFO("moved {} under {}", "b1", "c1");

    ASSERT_EQ(lines_.size(), 1u);
    EXPECT_EQ(lines_[0].first, LogLevel::Info);
    EXPECT_NE(lines_[0].second.find("moved b1 under c1"), std::string::npos);
}

TEST_F(LoggerTest, MessagesArePrefixedWithFunctionName) {
    LOG_WARN("careful");

    ASSERT_EQ(lines_.size(), 1u);
    EXPECT_NE(lines_[0].second.find("() - careful"), std::string::npos);
}

TEST_F(LoggerTest, SetLevelIsForwardedToBackend) {
    Logger::setLevel(LogLevel::Warn);
    LOG_DEBUG("hidden");
    LOG_ERROR("shown");

    ASSERT_EQ(lines_.size(), 1u);
    EXPECT_EQ(lines_[0].first, LogLevel::Error);
}

TEST_F(LoggerTest, CaptureFiltersByPattern) {
    LOG_INFO("alpha one");
    LOG_INFO("beta two");
    LOG_INFO("alpha three");

    auto alpha = Logger::getCapturedLogs("alpha");
    ASSERT_EQ(alpha.size(), 2u);
    EXPECT_NE(alpha[0].find("alpha one"), std::string::npos);
    EXPECT_NE(alpha[1].find("alpha three"), std::string::npos);
    EXPECT_NE(alpha[0].find("[info]"), std::string::npos);
}

TEST_F(LoggerTest, CaptureMaxLinesReturnsMostRecent) {
    for (int i = 0; i < 5; ++i) {
        LOG_INFO("line {}", i);
    }

    auto last = Logger::getCapturedLogs("", 2);
    ASSERT_EQ(last.size(), 2u);
    EXPECT_NE(last[0].find("line 3"), std::string::npos);
    EXPECT_NE(last[1].find("line 4"), std::string::npos);
}

TEST_F(LoggerTest, CaptureRingDropsOldestLines) {
    Logger::setCaptureCapacity(3);
    for (int i = 0; i < 5; ++i) {
        LOG_INFO("entry {}", i);
    }

    auto logs = Logger::getCapturedLogs();
    ASSERT_EQ(logs.size(), 3u);
    EXPECT_NE(logs[0].find("entry 2"), std::string::npos);
    EXPECT_NE(logs[2].find("entry 4"), std::string::npos);
}

TEST_F(LoggerTest, CaptureDisabledKeepsNothing) {
    Logger::enableCapture(false);
    LOG_INFO("not captured");

    EXPECT_FALSE(Logger::isCaptureEnabled());
    EXPECT_TRUE(Logger::getCapturedLogs().empty());
}
