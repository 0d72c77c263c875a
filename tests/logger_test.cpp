/**
 * PORTICO - Embedded HTTP/1.x Server Core
 * Logger tests
 */

#include "util/logger.hpp"

#include <gtest/gtest.h>
#include <spdlog/sinks/ostream_sink.h>

#include <sstream>

using namespace portico::util;

namespace {

class LoggerTest : public ::testing::Test {
protected:
    void SetUp() override {
        LogConfig config;
        config.enable_console = false;
        config.level = LogLevel::Info;
        config.access_log = true;
        Logger::init(config);

        sink_ = std::make_shared<spdlog::sinks::ostream_sink_mt>(out_);
        sink_->set_pattern("%v");
        Logger::instance().attach_sink(sink_);
    }

    void TearDown() override {
        LogConfig config;
        config.enable_console = false;
        Logger::init(config);
    }

    std::ostringstream out_;
    std::shared_ptr<spdlog::sinks::ostream_sink_mt> sink_;
};

AccessLogEntry sample_entry() {
    AccessLogEntry entry;
    entry.client = "127.0.0.1:51234";
    entry.method = "GET";
    entry.target = "/index?x=1";
    entry.protocol = "HTTP/1.1";
    entry.status_code = 200;
    entry.response_size = 1234;
    entry.latency = std::chrono::microseconds(412);
    return entry;
}

} // namespace

TEST(LoggerFormat, AccessLineLayout) {
    EXPECT_EQ(Logger::format_access(sample_entry()),
              R"(127.0.0.1:51234 "GET /index?x=1 HTTP/1.1" 200 1234 0.412ms)");
}

TEST(LoggerFormat, MissingFieldsBecomeDashes) {
    AccessLogEntry entry;
    entry.status_code = 400;
    EXPECT_EQ(Logger::format_access(entry), R"(- "- - -" 400 0 0.000ms)");
}

TEST(LoggerLevels, ParseAcceptsAliasesCaseInsensitively) {
    EXPECT_EQ(Logger::parse_level("TRACE"), LogLevel::Trace);
    EXPECT_EQ(Logger::parse_level("Warning"), LogLevel::Warn);
    EXPECT_EQ(Logger::parse_level("err"), LogLevel::Error);
    EXPECT_EQ(Logger::parse_level("fatal"), LogLevel::Critical);
    EXPECT_EQ(Logger::parse_level("none"), LogLevel::Off);
    EXPECT_FALSE(Logger::parse_level("loud").has_value());
    EXPECT_EQ(Logger::level_to_string(LogLevel::Warn), "warn");
}

TEST_F(LoggerTest, ComponentTagPrefixesMessage) {
    PORTICO_LOG_INFO(log_component::Server, "listening on {}", "127.0.0.1:8080");
    EXPECT_NE(out_.str().find("[server] listening on 127.0.0.1:8080"), std::string::npos);
}

TEST_F(LoggerTest, MessagesBelowLevelAreDropped) {
    PORTICO_LOG_DEBUG(log_component::Pool, "not shown");
    EXPECT_EQ(out_.str().find("not shown"), std::string::npos);

    Logger::instance().set_level(LogLevel::Debug);
    EXPECT_EQ(Logger::instance().get_level(), LogLevel::Debug);
    PORTICO_LOG_DEBUG(log_component::Pool, "now shown");
    EXPECT_NE(out_.str().find("[pool] now shown"), std::string::npos);
}

TEST_F(LoggerTest, AccessEntriesReachSinks) {
    Logger::instance().access(sample_entry());
    EXPECT_NE(out_.str().find(R"("GET /index?x=1 HTTP/1.1" 200 1234)"), std::string::npos);
}

TEST_F(LoggerTest, AccessLogCanBeDisabled) {
    LogConfig config;
    config.enable_console = false;
    config.access_log = false;
    Logger::init(config);
    Logger::instance().attach_sink(sink_);

    Logger::instance().access(sample_entry());
    EXPECT_EQ(out_.str().find("GET"), std::string::npos);
}
