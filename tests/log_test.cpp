#include "log.hpp"
#include "test_support.hpp"
#include <gtest/gtest.h>
#include <fstream>
#include <sstream>

using namespace textclf;
using namespace textclf::test;

static std::string slurp(const std::string& path) {
    std::ifstream f(path);
    std::stringstream ss;
    ss << f.rdbuf();
    return ss.str();
}

TEST(Log, ParsesLevelNames) {
    LogLevel lvl = LogLevel::Info;
    EXPECT_TRUE(Log::parseLevel("debug", lvl));
    EXPECT_EQ(lvl, LogLevel::Debug);
    EXPECT_TRUE(Log::parseLevel("error", lvl));
    EXPECT_EQ(lvl, LogLevel::Error);
    EXPECT_FALSE(Log::parseLevel("verbose", lvl));
    EXPECT_FALSE(Log::parseLevel("WARN", lvl));
    EXPECT_EQ(lvl, LogLevel::Error);
}

TEST(Log, WritesTaggedLinesAboveTheLevel) {
    TempDir dir;
    const std::string logs = dir.file("logs");
    const LogLevel saved = Log::level();

    Log::init(logs);
    Log::setLevel(LogLevel::Warn);
    Log::write(LogLevel::Info, "hidden %d", 1);
    Log::write(LogLevel::Warn, "shown %s", "warn");
    Log::write(LogLevel::Error, "shown %d", 2);
    Log::init("");   // closes the file
    Log::setLevel(saved);

    const std::string text = slurp(logs + "/log.txt");
    EXPECT_EQ(text.find("hidden"), std::string::npos);
    EXPECT_NE(text.find("[W] shown warn\n"), std::string::npos);
    EXPECT_NE(text.find("[E] shown 2\n"), std::string::npos);
}
