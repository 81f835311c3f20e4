// ============================================================
// test_logger.cpp -- Level filtering and the mirror file
// ============================================================

#include "../common/logger.hpp"
#include "test_support.hpp"
#include <gtest/gtest.h>

using namespace testing_support;

namespace {

std::string read_text(const fs::path& path) {
    std::vector<u8> bytes = read_file(path);
    return std::string(bytes.begin(), bytes.end());
}

class LoggerTest : public ::testing::Test {
protected:
    void TearDown() override {
        Logger::get().set_log_file("");
        Logger::get().set_level(LogLevel::INFO);
    }

    TempDir dir_;
};

} // namespace

TEST_F(LoggerTest, LevelFiltersMirroredLines) {
    fs::path log = dir_.path() / "node.log";
    Logger::get().set_log_file(log.string());
    Logger::get().set_level(LogLevel::INFO);

    LOG_INFO("peer joined");
    LOG_DEBUG("raw datagram");
    LOG_WARN("slow disk");
    Logger::get().set_log_file("");

    std::string text = read_text(log);
    EXPECT_NE(text.find("[INFO ] peer joined"), std::string::npos);
    EXPECT_NE(text.find("[WARN ] slow disk"), std::string::npos);
    EXPECT_EQ(text.find("raw datagram"), std::string::npos);
}

TEST_F(LoggerTest, OffSilencesEvenErrors) {
    fs::path log = dir_.path() / "quiet.log";
    Logger::get().set_log_file(log.string());
    Logger::get().set_level(LogLevel::OFF);
    EXPECT_EQ(Logger::get().level(), LogLevel::OFF);

    LOG_ERROR("disk full");
    LOG_INFO("peer joined");
    Logger::get().set_log_file("");

    EXPECT_TRUE(read_text(log).empty());
}
