#include <benchmark/benchmark.h>
#include <string>
#include "zone_log.hpp"
#include "null_sink.hpp"

// ---------------------------------------------------------------------------
// BM_RenderSingleLine
// Default header (timestamp, level, target), one-line message.
// Measures LineRenderer alone: the stream discards every byte.
// ---------------------------------------------------------------------------
static void BM_RenderSingleLine(benchmark::State& state) {
    zonelog::FormatPolicy policy(3600);
    zonelog::PlainStyle style;
    zonelog::NullStreambuf buf;
    std::ostream out(&buf);
    zonelog::LogRecord record(zonelog::LogLevel::INFO, "net", "connection established");

    for (auto _ : state) {
        zonelog::LineRenderer renderer(policy, out, style);
        renderer.render(record);
        benchmark::ClobberMemory();
    }
    state.SetItemsProcessed(state.iterations());
}
BENCHMARK(BM_RenderSingleLine);

// ---------------------------------------------------------------------------
// BM_RenderMultiLine
// Message with state.range(0) line breaks through the indenting streambuf.
// ---------------------------------------------------------------------------
static void BM_RenderMultiLine(benchmark::State& state) {
    zonelog::FormatPolicy policy(3600);
    zonelog::PlainStyle style;
    zonelog::NullStreambuf buf;
    std::ostream out(&buf);

    std::string message = "header line";
    for (int64_t i = 0; i < state.range(0); ++i) message += "\n    continuation line";
    zonelog::LogRecord record(zonelog::LogLevel::WARN, "net", message);

    for (auto _ : state) {
        zonelog::LineRenderer renderer(policy, out, style);
        renderer.render(record);
        benchmark::ClobberMemory();
    }
    state.SetBytesProcessed(state.iterations() * static_cast<int64_t>(message.size()));
}
BENCHMARK(BM_RenderMultiLine)->Arg(1)->Arg(8)->Arg(64);

// ---------------------------------------------------------------------------
// BM_RenderNoIndent
// Same multi-line message with indentation disabled (verbatim fast path).
// ---------------------------------------------------------------------------
static void BM_RenderNoIndent(benchmark::State& state) {
    zonelog::FormatPolicy policy = zonelog::FormatPolicy::configure()
        .utcOffset(3600).noIndent().build();
    zonelog::PlainStyle style;
    zonelog::NullStreambuf buf;
    std::ostream out(&buf);

    std::string message = "header line";
    for (int i = 0; i < 8; ++i) message += "\n    continuation line";
    zonelog::LogRecord record(zonelog::LogLevel::WARN, "net", message);

    for (auto _ : state) {
        zonelog::LineRenderer renderer(policy, out, style);
        renderer.render(record);
        benchmark::ClobberMemory();
    }
    state.SetItemsProcessed(state.iterations());
}
BENCHMARK(BM_RenderNoIndent);

// ---------------------------------------------------------------------------
// BM_TimestampPrecision
// Timestamp formatting cost per precision (0 = s, 1 = ms, 2 = us).
// ---------------------------------------------------------------------------
static void BM_TimestampPrecision(benchmark::State& state) {
    static const zonelog::TimestampPrecision precisions[] = {
        zonelog::TimestampPrecision::Seconds,
        zonelog::TimestampPrecision::Millis,
        zonelog::TimestampPrecision::Micros
    };
    const char* pattern = zonelog::timestampFormatFor(precisions[state.range(0)]);
    zonelog::FixedOffset offset = zonelog::FixedOffset::east(-5 * 3600);

    for (auto _ : state) {
        std::string ts = zonelog::formatTimestamp(std::chrono::system_clock::now(), offset, pattern);
        benchmark::DoNotOptimize(ts);
    }
    state.SetItemsProcessed(state.iterations());
}
BENCHMARK(BM_TimestampPrecision)->Arg(0)->Arg(1)->Arg(2);

// ---------------------------------------------------------------------------
// BM_LoggerEndToEnd
// Logger -> level filter -> NullSink -> ZonedFormatter -> discarding stream.
// ---------------------------------------------------------------------------
static void BM_LoggerEndToEnd(benchmark::State& state) {
    zonelog::Logger logger(zonelog::LogLevel::TRACE);
    logger.setTarget("bench");
    std::unique_ptr<zonelog::ISink> sink(new zonelog::NullSink());
    sink->setFormatter(zonelog::detail::make_unique<zonelog::ZonedFormatter>());
    logger.addCustomSink(std::move(sink));

    for (auto _ : state) {
        logger.info("request served\nstatus 200");
        benchmark::ClobberMemory();
    }
    state.SetItemsProcessed(state.iterations());
}
BENCHMARK(BM_LoggerEndToEnd);

// ---------------------------------------------------------------------------
// BM_LoggerFilteredOut
// Records below the minimum level: cost of the level check only.
// ---------------------------------------------------------------------------
static void BM_LoggerFilteredOut(benchmark::State& state) {
    zonelog::Logger logger(zonelog::LogLevel::ERROR);
    std::unique_ptr<zonelog::ISink> sink(new zonelog::NullSink());
    sink->setFormatter(zonelog::detail::make_unique<zonelog::ZonedFormatter>());
    logger.addCustomSink(std::move(sink));

    for (auto _ : state) {
        ZONE_DEBUG(logger, "bench", std::string("never rendered"));
        benchmark::ClobberMemory();
    }
    state.SetItemsProcessed(state.iterations());
}
BENCHMARK(BM_LoggerFilteredOut);

BENCHMARK_MAIN();
