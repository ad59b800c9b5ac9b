#ifndef ZONE_LOG_CONSOLE_SINK_HPP
#define ZONE_LOG_CONSOLE_SINK_HPP

#include "sink_interface.hpp"
#include "../core/io_error.hpp"
#include "../core/log_common.hpp"
#include "../formatter/level_style.hpp"
#include "../formatter/zoned_formatter.hpp"
#include <cstdio>
#include <cstdlib>
#include <iostream>
#include <memory>
#include <mutex>

#ifdef _WIN32
#include <io.h>
#ifndef WIN32_LEAN_AND_MEAN
#define WIN32_LEAN_AND_MEAN
#endif
#include <windows.h>
// windows.h defines ERROR as 0, which conflicts with LogLevel::ERROR.
#ifdef ERROR
#undef ERROR
#endif
#ifndef ENABLE_VIRTUAL_TERMINAL_PROCESSING
#define ENABLE_VIRTUAL_TERMINAL_PROCESSING 0x0004
#endif
#else
#include <unistd.h>
#endif

namespace zonelog {

    enum class ConsoleStream {
        StdOut,
        StdErr
    };

namespace detail {
    /// All sinks on the same console stream share one mutex so that their
    /// lines never interleave. stdout and stderr are locked independently.
    inline std::mutex &consoleMutex(ConsoleStream stream) {
        static std::mutex s_stdoutMutex;
        static std::mutex s_stderrMutex;
        return stream == ConsoleStream::StdOut ? s_stdoutMutex : s_stderrMutex;
    }

    /// Color is off when NO_COLOR is set (any value, https://no-color.org/),
    /// when ZONE_LOG_NO_COLOR is non-empty, or when the stream is not a TTY.
    inline bool detectColorSupport(ConsoleStream stream) {
        if (std::getenv("NO_COLOR") != nullptr) return false;

        const char *noColor = std::getenv("ZONE_LOG_NO_COLOR");
        if (noColor && noColor[0] != '\0') return false;

#ifdef _WIN32
        DWORD handleType = (stream == ConsoleStream::StdOut)
            ? STD_OUTPUT_HANDLE : STD_ERROR_HANDLE;
        HANDLE hOut = GetStdHandle(handleType);
        if (hOut == INVALID_HANDLE_VALUE) return false;
        DWORD mode = 0;
        if (!GetConsoleMode(hOut, &mode)) return false;
        if (!(mode & ENABLE_VIRTUAL_TERMINAL_PROCESSING)) {
            if (!SetConsoleMode(hOut, mode | ENABLE_VIRTUAL_TERMINAL_PROCESSING)) {
                return false;
            }
        }
        return true;
#else
        FILE *fp = (stream == ConsoleStream::StdOut) ? stdout : stderr;
        return isatty(fileno(fp)) != 0;
#endif
    }
} // namespace detail

    /// Console sink rendering through ZonedFormatter.
    ///
    /// The level field is colored with AnsiStyle when the stream is an
    /// interactive terminal and no opt-out variable is set; otherwise
    /// PlainStyle is used. Each line is flushed immediately.
    class ConsoleSink : public ISink {
    public:
        explicit ConsoleSink(ConsoleStream stream = ConsoleStream::StdOut)
            : ConsoleSink(stream, FormatPolicy()) {}

        ConsoleSink(ConsoleStream stream, const FormatPolicy &policy)
            : m_stream(stream)
            , m_policy(policy)
            , m_colorEnabled(false) {
            setColor(detail::detectColorSupport(stream));
        }

        /// Override color auto-detection. Replaces the formatter, so call
        /// it before logging starts.
        void setColor(bool enabled) {
            m_colorEnabled = enabled;
            std::shared_ptr<const ILevelStyle> style;
            if (enabled) {
                style = std::make_shared<AnsiStyle>();
            } else {
                style = std::make_shared<PlainStyle>();
            }
            setFormatter(detail::make_unique<ZonedFormatter>(m_policy, style));
        }

        bool isColorEnabled() const { return m_colorEnabled; }

        ConsoleStream stream() const { return m_stream; }

        void write(const LogRecord &record) override {
            IFormatter *fmt = formatter();
            if (!fmt) return;
            std::ostream &out = console();
            std::lock_guard<std::mutex> lock(detail::consoleMutex(m_stream));
            fmt->format(record, out);
            out.flush();
            if (!out) {
                throw IoError("Failed to flush console log stream");
            }
        }

        void flush() override {
            std::ostream &out = console();
            std::lock_guard<std::mutex> lock(detail::consoleMutex(m_stream));
            out.flush();
            if (!out) {
                throw IoError("Failed to flush console log stream");
            }
        }

    private:
        std::ostream &console() const {
            return m_stream == ConsoleStream::StdOut ? std::cout : std::cerr;
        }

        ConsoleStream m_stream;
        FormatPolicy m_policy;
        bool m_colorEnabled;
    };

} // namespace zonelog

#endif // ZONE_LOG_CONSOLE_SINK_HPP
