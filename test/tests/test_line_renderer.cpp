#include <gtest/gtest.h>
#include "zone_log.hpp"
#include "utils/test_utils.hpp"
#include <iomanip>
#include <ios>
#include <ostream>
#include <sstream>
#include <stdexcept>
#include <string>

using zonelog::FormatPolicy;
using zonelog::IoError;
using zonelog::LineRenderer;
using zonelog::LogLevel;
using zonelog::LogRecord;
using zonelog::PlainStyle;
using zonelog::TimestampPrecision;

class LineRendererTest : public ::testing::Test {
protected:
    // Renders as 2024-01-01 12:00:00.000 at +08:00.
    std::chrono::system_clock::time_point at() const {
        return TestUtils::utcTime(2024, 1, 1, 4, 0, 0);
    }

    static zonelog::FormatPolicyBuilder base() {
        return FormatPolicy::configure().utcOffset(8 * 3600).precision(TimestampPrecision::Millis);
    }

    static const char *stamp() { return "2024-01-01 12:00:00.000 +08:00"; }
};

TEST_F(LineRendererTest, ConnectingRetryScenario) {
    FormatPolicy policy = base().indent(4).build();
    LogRecord record(LogLevel::INFO, "net", "connecting\nretry 1");

    EXPECT_EQ(TestUtils::render(policy, record, at()),
              std::string("[") + stamp() + " INFO  net] connecting\n    retry 1\n");
}

TEST_F(LineRendererTest, AllHeaderFieldsDisabledWritesBodyOnly) {
    FormatPolicy policy = base()
        .showTimestamp(false).showLevel(false).showTarget(false).showModulePath(false)
        .build();
    LogRecord record(LogLevel::ERROR, "mod", "net", "message_body");

    std::string line = TestUtils::render(policy, record, at());
    EXPECT_EQ(line, "message_body\n");
    EXPECT_EQ(line.find('['), std::string::npos);
    EXPECT_EQ(line.find(']'), std::string::npos);
}

TEST_F(LineRendererTest, SingleFieldIsBracketedAlone) {
    FormatPolicy policy = base().showTimestamp(false).showLevel(false).build();
    EXPECT_EQ(TestUtils::render(policy, LogRecord(LogLevel::INFO, "net", "body"), at()),
              "[net] body\n");

    FormatPolicy timestampOnly = base().showLevel(false).showTarget(false).build();
    EXPECT_EQ(TestUtils::render(timestampOnly, LogRecord(LogLevel::INFO, "net", "body"), at()),
              std::string("[") + stamp() + "] body\n");
}

TEST_F(LineRendererTest, AllFieldsInOrder) {
    FormatPolicy policy = base().showModulePath(true).build();
    LogRecord record(LogLevel::WARN, "app::db", "sql", "slow query");

    EXPECT_EQ(TestUtils::render(policy, record, at()),
              std::string("[") + stamp() + " WARN  app::db sql] slow query\n");
}

TEST_F(LineRendererTest, NoTrailingSpaceBeforeClosingBracket) {
    FormatPolicy policy = base().showModulePath(true).build();
    std::string line = TestUtils::render(policy, LogRecord(LogLevel::INFO, "m", "t", "b"), at());
    EXPECT_EQ(line.find(" ]"), std::string::npos);
    EXPECT_NE(line.find("m t] b"), std::string::npos);
}

TEST_F(LineRendererTest, DisablingLevelRemovesOnlyLevel) {
    LogRecord record(LogLevel::INFO, "mod", "net", "hello");
    std::string all = TestUtils::render(base().showModulePath(true).build(), record, at());
    std::string noLevel = TestUtils::render(base().showModulePath(true).showLevel(false).build(),
                                            record, at());

    EXPECT_EQ(all, std::string("[") + stamp() + " INFO  mod net] hello\n");
    EXPECT_EQ(noLevel, std::string("[") + stamp() + " mod net] hello\n");
}

TEST_F(LineRendererTest, DisablingModulePathRemovesOnlyModulePath) {
    LogRecord record(LogLevel::INFO, "mod", "net", "hello");
    std::string line = TestUtils::render(base().showModulePath(false).build(), record, at());
    EXPECT_EQ(line, std::string("[") + stamp() + " INFO  net] hello\n");
}

TEST_F(LineRendererTest, DisablingTargetRemovesOnlyTarget) {
    LogRecord record(LogLevel::INFO, "mod", "net", "hello");
    std::string line = TestUtils::render(base().showModulePath(true).showTarget(false).build(),
                                         record, at());
    EXPECT_EQ(line, std::string("[") + stamp() + " INFO  mod] hello\n");
}

TEST_F(LineRendererTest, AbsentModulePathIsSkipped) {
    FormatPolicy policy = base().showModulePath(true).build();
    LogRecord record(LogLevel::INFO, "net", "hello");
    ASSERT_FALSE(record.hasModulePath);
    EXPECT_EQ(TestUtils::render(policy, record, at()),
              std::string("[") + stamp() + " INFO  net] hello\n");
}

TEST_F(LineRendererTest, EmptyTargetIsSkipped) {
    FormatPolicy policy = base().build();
    EXPECT_EQ(TestUtils::render(policy, LogRecord(LogLevel::INFO, "", "hello"), at()),
              std::string("[") + stamp() + " INFO ] hello\n");
}

TEST_F(LineRendererTest, LevelIsPaddedToFiveColumns) {
    FormatPolicy policy = base().showTimestamp(false).showTarget(false).build();
    EXPECT_EQ(TestUtils::render(policy, LogRecord(LogLevel::WARN, "", "m"), at()), "[WARN ] m\n");
    EXPECT_EQ(TestUtils::render(policy, LogRecord(LogLevel::ERROR, "", "m"), at()), "[ERROR] m\n");
    EXPECT_EQ(TestUtils::render(policy, LogRecord(LogLevel::TRACE, "", "m"), at()), "[TRACE] m\n");
}

TEST_F(LineRendererTest, IndentBlocksMatchLineBreakCount) {
    FormatPolicy policy = base().showTimestamp(false).showLevel(false).showTarget(false)
        .indent(6).build();
    for (int k = 0; k <= 5; ++k) {
        std::string message = "start";
        for (int i = 0; i < k; ++i) message += "\nnext";
        std::string line = TestUtils::render(policy, LogRecord(LogLevel::INFO, "", message), at());
        EXPECT_EQ(TestUtils::countOccurrences(line, "\n      "), static_cast<size_t>(k));
        EXPECT_EQ(line.substr(0, 5), "start");
    }
}

TEST_F(LineRendererTest, DisabledIndentReproducesMessageVerbatim) {
    FormatPolicy policy = base().showTimestamp(false).showLevel(false).showTarget(false)
        .noIndent().build();
    std::string message = "a\nb\n\n  c\r\nd\n";
    EXPECT_EQ(TestUtils::render(policy, LogRecord(LogLevel::INFO, "", message), at()),
              message + "\n");
}

TEST_F(LineRendererTest, CustomTerminatorIsUsedForBreaksAndEnd) {
    FormatPolicy policy = base().showTimestamp(false).showLevel(false).showTarget(false)
        .indent(2).lineTerminator("\r\n").build();
    EXPECT_EQ(TestUtils::render(policy, LogRecord(LogLevel::INFO, "", "x\ny"), at()),
              "x\r\n  y\r\n");
}

TEST_F(LineRendererTest, StyleMarkersWrapPaddedLevel) {
    FormatPolicy policy = base().showTimestamp(false).showTarget(false).build();
    std::ostringstream out;
    zonelog::AnsiStyle style;
    LineRenderer renderer(policy, out, style);
    renderer.render(LogRecord(LogLevel::INFO, "net", "hello"), at());

    EXPECT_EQ(out.str(), "[\033[32mINFO \033[0m] hello\n");
}

TEST_F(LineRendererTest, StyleDoesNotTouchOtherFields) {
    FormatPolicy policy = base().build();
    std::ostringstream out;
    zonelog::AnsiStyle style;
    LineRenderer renderer(policy, out, style);
    renderer.render(LogRecord(LogLevel::ERROR, "net", "a\nb"), at());

    EXPECT_EQ(out.str(),
              std::string("[") + stamp() + " \033[31mERROR\033[0m net] a\n    b\n");
}

TEST_F(LineRendererTest, RenderUsesCurrentTimeByDefault) {
    FormatPolicy policy = base().precision(TimestampPrecision::Seconds).build();
    std::ostringstream out;
    PlainStyle style;

    auto before = std::chrono::system_clock::now();
    LineRenderer renderer(policy, out, style);
    renderer.render(LogRecord(LogLevel::INFO, "", "now"));
    auto after = std::chrono::system_clock::now();

    std::string line = out.str();
    std::string stampBefore = zonelog::formatTimestamp(before, policy.utcOffset(), policy.timestampFormat());
    std::string stampAfter = zonelog::formatTimestamp(after, policy.utcOffset(), policy.timestampFormat());
    std::string rendered = line.substr(1, stampBefore.size());
    EXPECT_TRUE(rendered == stampBefore || rendered == stampAfter) << line;
}

TEST_F(LineRendererTest, SecondRenderThrowsLogicError) {
    FormatPolicy policy = base().build();
    std::ostringstream out;
    PlainStyle style;
    LineRenderer renderer(policy, out, style);
    renderer.render(LogRecord(LogLevel::INFO, "", "once"), at());
    EXPECT_THROW(renderer.render(LogRecord(LogLevel::INFO, "", "twice"), at()), std::logic_error);
    EXPECT_EQ(TestUtils::countOccurrences(out.str(), "once"), 1u);
    EXPECT_EQ(out.str().find("twice"), std::string::npos);
}

TEST_F(LineRendererTest, SinkFailureInHeaderAbortsLine) {
    FormatPolicy policy = base().build();
    FailingStreambuf failing(10);
    std::ostream out(&failing);
    PlainStyle style;
    LineRenderer renderer(policy, out, style);

    EXPECT_THROW(renderer.render(LogRecord(LogLevel::INFO, "net", "body"), at()), IoError);
    EXPECT_EQ(failing.data(), "[2024-01-0");
}

TEST_F(LineRendererTest, SinkFailureInBodyAbortsBeforeTerminator) {
    FormatPolicy policy = base().showTimestamp(false).showLevel(false).showTarget(false).build();
    FailingStreambuf failing(8);
    std::ostream out(&failing);
    PlainStyle style;
    LineRenderer renderer(policy, out, style);

    EXPECT_THROW(renderer.render(LogRecord(LogLevel::INFO, "", "line\nnext"), at()), IoError);
    EXPECT_EQ(failing.data(), "line\n   ");
    EXPECT_TRUE(out.bad());
}

TEST_F(LineRendererTest, SinkFailureOnTerminator) {
    FormatPolicy policy = base().showTimestamp(false).showLevel(false).showTarget(false).build();
    FailingStreambuf failing(4);
    std::ostream out(&failing);
    PlainStyle style;
    LineRenderer renderer(policy, out, style);

    EXPECT_THROW(renderer.render(LogRecord(LogLevel::INFO, "", "body"), at()), IoError);
    EXPECT_EQ(failing.data(), "body");
}

TEST_F(LineRendererTest, AlreadyFailedStreamThrowsImmediately) {
    FormatPolicy policy = base().build();
    std::ostringstream out;
    out.setstate(std::ios_base::badbit);
    PlainStyle style;
    LineRenderer renderer(policy, out, style);
    EXPECT_THROW(renderer.render(LogRecord(LogLevel::INFO, "", "x"), at()), IoError);
}

TEST_F(LineRendererTest, ExceptionMaskedStreamFailureThrowsIoError) {
    FormatPolicy policy = base().build();
    FailingStreambuf failing(0);
    std::ostream out(&failing);
    out.exceptions(std::ios_base::badbit);
    PlainStyle style;
    LineRenderer renderer(policy, out, style);

    EXPECT_THROW(renderer.render(LogRecord(LogLevel::INFO, "net", "hi"), at()), IoError);
    EXPECT_TRUE(out.bad());
    EXPECT_EQ(out.exceptions(), std::ios_base::badbit);
}

TEST_F(LineRendererTest, ExceptionMaskedStreamFailureInBodyThrowsIoError) {
    FormatPolicy policy = base().showTimestamp(false).showLevel(false).showTarget(false).build();
    FailingStreambuf failing(8);
    std::ostream out(&failing);
    out.exceptions(std::ios_base::badbit | std::ios_base::failbit);
    PlainStyle style;
    LineRenderer renderer(policy, out, style);

    EXPECT_THROW(renderer.render(LogRecord(LogLevel::INFO, "", "line\nnext"), at()), IoError);
    EXPECT_EQ(failing.data(), "line\n   ");
}

TEST_F(LineRendererTest, ExceptionMaskIsRestoredAfterSuccessfulRender) {
    FormatPolicy policy = base().showTimestamp(false).build();
    std::ostringstream out;
    out.exceptions(std::ios_base::badbit);
    PlainStyle style;
    LineRenderer renderer(policy, out, style);
    renderer.render(LogRecord(LogLevel::INFO, "net", "hi"), at());

    EXPECT_EQ(out.str(), "[INFO  net] hi\n");
    EXPECT_EQ(out.exceptions(), std::ios_base::badbit);
}

TEST_F(LineRendererTest, PendingStreamWidthDoesNotPadHeader) {
    FormatPolicy policy = base().showTimestamp(false).build();
    std::ostringstream out;
    out << std::setw(12);
    PlainStyle style;
    LineRenderer renderer(policy, out, style);
    renderer.render(LogRecord(LogLevel::INFO, "net", "hi"), at());

    EXPECT_EQ(out.str(), "[INFO  net] hi\n");
}

TEST_F(LineRendererTest, PendingStreamWidthDoesNotPadHeaderlessBody) {
    FormatPolicy policy = base()
        .showTimestamp(false).showLevel(false).showTarget(false).noIndent()
        .build();
    std::ostringstream out;
    out << std::setw(12);
    PlainStyle style;
    LineRenderer renderer(policy, out, style);
    renderer.render(LogRecord(LogLevel::INFO, "", "hi"), at());

    EXPECT_EQ(out.str(), "hi\n");
}
