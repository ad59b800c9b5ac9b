// multiline_messages.cpp
//
// Continuation lines of a multi-line message are indented so they line up
// under the header; indentation can be resized or switched off.
//
// Compile: g++ -std=c++11 -I include examples/multiline_messages.cpp -o multiline_messages -pthread

#include "zone_log.hpp"
#include <iostream>
#include <sstream>

int main() {
    const std::string stack =
        "request failed\n"
        "at handler::serve\n"
        "at server::dispatch\n"
        "at main";

    // Default: 4-space indent.
    zonelog::Logger indented(zonelog::LogLevel::INFO);
    indented.setTarget("http");
    indented.addSink<zonelog::ConsoleSink>();
    indented.error(stack);

    // Wider indent, module path shown, CRLF terminators.
    zonelog::FormatPolicy wide = zonelog::FormatPolicy::configure()
        .indent(8)
        .showModulePath(true)
        .lineTerminator("\r\n")
        .build();
    zonelog::Logger wideLogger(zonelog::LogLevel::INFO);
    wideLogger.addSink<zonelog::ConsoleSink>(zonelog::ConsoleStream::StdOut, wide);
    ZONE_ERROR(wideLogger, "http", stack);

    // Indentation off: the message is written byte-for-byte.
    zonelog::FormatPolicy raw = zonelog::FormatPolicy::configure().noIndent().build();
    zonelog::Logger rawLogger(zonelog::LogLevel::INFO);
    rawLogger.setTarget("http");
    rawLogger.addSink<zonelog::ConsoleSink>(zonelog::ConsoleStream::StdOut, raw);
    rawLogger.error(stack);

    // Rendering into a string, e.g. to embed a line elsewhere.
    zonelog::ZonedFormatter formatter(zonelog::FormatPolicy::configure()
        .showTimestamp(false).build());
    std::string line = formatter.formatToString(
        zonelog::LogRecord(zonelog::LogLevel::WARN, "cache", "evicted 12 entries\nsize 1.2 MiB"));
    std::cout << "captured: " << line;

    indented.flush();
    return 0;
}
