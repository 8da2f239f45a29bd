// ═══════════════════════════════════════════════════════════════════
//  test_console.cpp — Leveled logging
// ═══════════════════════════════════════════════════════════════════

#include <gtest/gtest.h>
#include "gqlpp/console.h"
#include "gqlpp/json_utils.h"
#include <sstream>
#include <stdexcept>

using namespace gqlpp;

class ConsoleTest : public ::testing::Test {
protected:
    void SetUp() override {
        saved_ = console::level();
        console::setOutput(&out_);
    }
    void TearDown() override {
        console::setOutput(nullptr);
        console::setLevel(saved_);
    }

    std::ostringstream out_;
    console::Level saved_ = console::Level::Info;
};

TEST_F(ConsoleTest, JoinsArgumentsWithSpaces) {
    console::setLevel(console::Level::Debug);
    console::info("executing", 3, "fields", true, Json{{"a", 1}});
    auto line = out_.str();
    EXPECT_NE(line.find("executing 3 fields true {\"a\":1}"), std::string::npos) << line;
    EXPECT_EQ(line.back(), '\n');
}

TEST_F(ConsoleTest, FiltersBelowLevel) {
    console::setLevel(console::Level::Warn);
    console::debug("hidden debug");
    console::info("hidden info");
    console::warn("shown warning");
    console::error("shown error");

    auto text = out_.str();
    EXPECT_EQ(text.find("hidden"), std::string::npos);
    EXPECT_NE(text.find("shown warning"), std::string::npos);
    EXPECT_NE(text.find("shown error"), std::string::npos);
}

TEST_F(ConsoleTest, OffSilencesEverything) {
    console::setLevel(console::Level::Off);
    console::error("nothing");
    EXPECT_TRUE(out_.str().empty());
}

TEST_F(ConsoleTest, TimersReportAtDebug) {
    console::setLevel(console::Level::Debug);
    console::time("validate");
    console::timeEnd("validate");
    EXPECT_NE(out_.str().find("validate:"), std::string::npos);

    console::timeEnd("never-started");
    EXPECT_NE(out_.str().find("Timer 'never-started' does not exist"), std::string::npos);
}

TEST(ConsoleLevelTest, ParseLevel) {
    EXPECT_EQ(console::parseLevel("debug"), console::Level::Debug);
    EXPECT_EQ(console::parseLevel("info"), console::Level::Info);
    EXPECT_EQ(console::parseLevel("warn"), console::Level::Warn);
    EXPECT_EQ(console::parseLevel("error"), console::Level::Error);
    EXPECT_EQ(console::parseLevel("off"), console::Level::Off);
    EXPECT_THROW(console::parseLevel("loud"), std::invalid_argument);
}
