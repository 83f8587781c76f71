#include <gtest/gtest.h>
#include <string>
#include <thread>
#include <vector>
#include <filesystem>
#include <boost/log/core.hpp>
#include "logger/logger.hpp"
#include "test_utils.hpp"

using namespace s3sync::logging;

// File sink behaviour of the global logger
class LoggerTest : public ::testing::Test {
protected:
    void SetUp() override {
        log_path = dir / "nested" / "s3sync.log";
        init_logging(log_path.string(), severity_level::trace);
    }

    void TearDown() override {
        boost::log::core::get()->remove_all_sinks();
        enable_logging();
        quiet_logging();
    }

    std::string log_text() {
        boost::log::core::get()->flush();
        return read_file(log_path);
    }

    bool logged(const std::string& text) {
        return log_text().find(text) != std::string::npos;
    }

    TempDir dir{"logger_test"};
    std::filesystem::path log_path;
};

TEST_F(LoggerTest, CreatesParentDirectoryAndFormatsLines) {
    LOG_INFO << "Sync engine: started";
    LOG_ERROR << "Sync engine: upload failed";

    EXPECT_TRUE(std::filesystem::exists(log_path));
    EXPECT_TRUE(logged("[info] Sync engine: started"));
    EXPECT_TRUE(logged("[error] Sync engine: upload failed"));
}

TEST_F(LoggerTest, TrivialLoggerSharesTheSink) {
    BOOST_LOG_TRIVIAL(warning) << "Trivial warning";
    EXPECT_TRUE(logged("Trivial warning"));
}

TEST_F(LoggerTest, PartWorkerThreadsCanLog) {
    std::vector<std::thread> workers;
    for (int i = 0; i < 4; ++i) {
        workers.emplace_back([i]() { LOG_DEBUG << "part worker " << i; });
    }
    for (auto& worker : workers) {
        worker.join();
    }

    for (int i = 0; i < 4; ++i) {
        EXPECT_TRUE(logged("part worker " + std::to_string(i)));
    }
}

TEST_F(LoggerTest, AllMacrosReachTheSink) {
    LOG_TRACE << "trace line";
    LOG_DEBUG << "debug line";
    LOG_WARN << "warning line";
    LOG_FATAL << "fatal line";

    std::string text = log_text();
    for (const char* line : {"trace line", "debug line", "warning line", "fatal line"}) {
        EXPECT_NE(text.find(line), std::string::npos) << line;
    }
}

TEST_F(LoggerTest, ReinitialisingAppendsToExistingFile) {
    LOG_INFO << "first session";
    init_logging(log_path.string(), severity_level::info);
    LOG_INFO << "second session";

    EXPECT_TRUE(logged("first session"));
    EXPECT_TRUE(logged("second session"));
}

TEST_F(LoggerTest, LogLevelFiltering) {
    set_log_level(severity_level::warning);

    LOG_DEBUG << "Should not appear";
    LOG_WARN << "Should appear";

    EXPECT_FALSE(logged("Should not appear"));
    EXPECT_TRUE(logged("Should appear"));
}

TEST_F(LoggerTest, EnableDisableLogging) {
    disable_logging();
    LOG_INFO << "Hidden while disabled";

    enable_logging();
    LOG_INFO << "Visible after enable";

    EXPECT_FALSE(logged("Hidden while disabled"));
    EXPECT_TRUE(logged("Visible after enable"));
}

TEST_F(LoggerTest, ParseSeverity) {
    EXPECT_EQ(parse_severity("debug"), severity_level::debug);
    EXPECT_EQ(parse_severity("fatal"), severity_level::fatal);
    EXPECT_THROW(parse_severity("loud"), std::invalid_argument);
}
