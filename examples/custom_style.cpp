// custom_style.cpp
//
// The level field is wrapped in start/reset markers supplied by an
// ILevelStyle. ConsoleSink picks AnsiStyle or PlainStyle automatically;
// any other sink can inject its own style through ZonedFormatter.
//
// Compile: g++ -std=c++11 -I include examples/custom_style.cpp -o custom_style -pthread

#include "zone_log.hpp"
#include <iostream>

// Marks warnings and above with asterisks, leaves the rest plain.
class AsteriskStyle : public zonelog::ILevelStyle {
public:
    const char* start(zonelog::LogLevel level) const override {
        return level >= zonelog::LogLevel::WARN ? "*" : "";
    }
    const char* reset(zonelog::LogLevel level) const override {
        return level >= zonelog::LogLevel::WARN ? "*" : "";
    }
};

int main() {
    zonelog::FormatPolicy policy(0, zonelog::TimestampPrecision::Seconds);

    std::unique_ptr<zonelog::ISink> sink(new zonelog::StreamSink(std::cout));
    sink->setFormatter(zonelog::detail::make_unique<zonelog::ZonedFormatter>(
        policy, std::make_shared<AsteriskStyle>()));

    zonelog::Logger logger(zonelog::LogLevel::DEBUG);
    logger.setTarget("style");
    logger.addCustomSink(std::move(sink));

    logger.debug("plain debug line");
    logger.warn("highlighted warning");
    logger.error("highlighted error");

    // Forcing ANSI colors on a console sink regardless of TTY detection.
    zonelog::ConsoleSink console;
    console.setColor(true);
    console.write(zonelog::LogRecord(zonelog::LogLevel::INFO, "style", "forced color"));

    logger.flush();
    console.flush();
    return 0;
}
