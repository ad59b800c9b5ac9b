#include <gtest/gtest.h>
#include "zone_log.hpp"

using zonelog::AnsiStyle;
using zonelog::LogLevel;
using zonelog::PlainStyle;

TEST(LevelStyleTest, PlainStyleHasNoMarkers) {
    PlainStyle style;
    EXPECT_STREQ(style.start(LogLevel::ERROR), "");
    EXPECT_STREQ(style.reset(LogLevel::ERROR), "");
}

TEST(LevelStyleTest, AnsiColorCodesPerLevel) {
    EXPECT_STREQ(AnsiStyle::getColorCode(LogLevel::TRACE), "\033[2m");
    EXPECT_STREQ(AnsiStyle::getColorCode(LogLevel::DEBUG), "\033[36m");
    EXPECT_STREQ(AnsiStyle::getColorCode(LogLevel::INFO),  "\033[32m");
    EXPECT_STREQ(AnsiStyle::getColorCode(LogLevel::WARN),  "\033[33m");
    EXPECT_STREQ(AnsiStyle::getColorCode(LogLevel::ERROR), "\033[31m");
    EXPECT_STREQ(AnsiStyle::getColorCode(LogLevel::FATAL), "\033[1;31m");
}

TEST(LevelStyleTest, AnsiStartAndReset) {
    AnsiStyle style;
    EXPECT_STREQ(style.start(LogLevel::WARN), "\033[33m");
    EXPECT_STREQ(style.reset(LogLevel::WARN), "\033[0m");
}

TEST(LevelStyleTest, CustomStyleIsInjectable) {
    class BracketStyle : public zonelog::ILevelStyle {
    public:
        const char *start(LogLevel) const override { return "<"; }
        const char *reset(LogLevel) const override { return ">"; }
    };

    zonelog::FormatPolicy policy = zonelog::FormatPolicy::configure()
        .showTimestamp(false).showTarget(false).build();
    zonelog::ZonedFormatter formatter(policy, std::make_shared<BracketStyle>());
    EXPECT_EQ(formatter.formatToString(zonelog::LogRecord(LogLevel::INFO, "", "m")), "[<INFO >] m\n");
}
