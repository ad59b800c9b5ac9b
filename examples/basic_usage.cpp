// basic_usage.cpp
//
// Minimal program: the minimum level comes from ZONE_LOG_LEVEL (default
// "info") and every line is rendered by the zoned formatter to stdout.
//
// Try:  ZONE_LOG_LEVEL=debug ./basic_usage
//
// Compile: g++ -std=c++11 -I include examples/basic_usage.cpp -o basic_usage -pthread

#include "zone_log.hpp"
#include <iostream>

int main() {
    auto logger = zonelog::Logger::configure()
        .minLevelFromEnv()
        .target("app")
        .writeTo<zonelog::ConsoleSink>()
        .build();

    logger.trace("trace is hidden unless ZONE_LOG_LEVEL=trace");
    logger.debug("debug is hidden unless ZONE_LOG_LEVEL=debug or lower");
    logger.info("hello, world!");
    logger.warn("disk usage at 91%");
    logger.error("failed to open config\nfalling back to defaults");

    // Macros also record the source file as the module path.
    ZONE_INFO(logger, "net", "listening on port 8080");

    logger.flush();
    return 0;
}
