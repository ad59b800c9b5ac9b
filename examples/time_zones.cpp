// time_zones.cpp
//
// Shows how the fixed UTC offset and timestamp precision of a FormatPolicy
// change the rendered header. Each policy resolves its offset once, at
// construction.
//
// Compile: g++ -std=c++11 -I include examples/time_zones.cpp -o time_zones -pthread

#include "zone_log.hpp"
#include <iostream>

static void logWith(const char* label, const zonelog::FormatPolicy& policy) {
    auto logger = zonelog::Logger::configure()
        .minLevel(zonelog::LogLevel::TRACE)
        .target(label)
        .writeTo<zonelog::ConsoleSink>(zonelog::ConsoleStream::StdOut, policy)
        .build();
    logger.info("same instant, different rendering");
}

int main() {
    // ---------------------------------------------------------------
    // Local offset (default): resolved from the machine when built.
    // ---------------------------------------------------------------
    logWith("local", zonelog::FormatPolicy());

    // ---------------------------------------------------------------
    // Explicit offsets, in seconds east of UTC.
    // ---------------------------------------------------------------
    logWith("utc", zonelog::FormatPolicy(0));
    logWith("shanghai", zonelog::FormatPolicy(8 * 3600));
    logWith("kolkata", zonelog::FormatPolicy(5 * 3600 + 30 * 60));
    logWith("new-york", zonelog::FormatPolicy(-5 * 3600));

    // ---------------------------------------------------------------
    // Precision: seconds, millis (default), micros. Nanos renders like
    // micros.
    // ---------------------------------------------------------------
    logWith("seconds", zonelog::FormatPolicy(0, zonelog::TimestampPrecision::Seconds));
    logWith("micros", zonelog::FormatPolicy(0, zonelog::TimestampPrecision::Micros));
    logWith("nanos", zonelog::FormatPolicy(0, zonelog::TimestampPrecision::Nanos));

    // ---------------------------------------------------------------
    // An out-of-range offset is not rejected: the policy quietly uses
    // the local offset instead.
    // ---------------------------------------------------------------
    logWith("invalid->local", zonelog::FormatPolicy(100000));

    return 0;
}
