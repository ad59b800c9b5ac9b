#ifndef ZONE_LOG_LINE_RENDERER_HPP
#define ZONE_LOG_LINE_RENDERER_HPP

#include "format_policy.hpp"
#include "indent_streambuf.hpp"
#include "level_style.hpp"
#include "../core/io_error.hpp"
#include "../core/log_record.hpp"
#include "../core/timestamp_format.hpp"
#include <chrono>
#include <exception>
#include <ios>
#include <ostream>
#include <stdexcept>
#include <string>

namespace zonelog {

    /// Renders one LogRecord as a single formatted line.
    ///
    /// Output shape:
    /// @code
    ///   [2024-01-01 12:00:00.000 +08:00 INFO  net] connecting
    ///       retry 1
    /// @endcode
    ///
    /// A renderer is built for one record and consumed by one render()
    /// call; calling render() again throws std::logic_error. It holds
    /// references only, so the policy, stream and style must outlive it.
    ///
    /// Any write the stream refuses aborts the line with IoError. Whatever
    /// was written before the failure stays written. The stream's exception
    /// mask is suspended while the line is written and restored afterwards,
    /// so a failure surfaces as IoError, never as std::ios_base::failure.
    /// A width left pending on the stream is discarded.
    class LineRenderer {
    public:
        LineRenderer(const FormatPolicy &policy, std::ostream &out, const ILevelStyle &style)
            : m_policy(policy)
            , m_out(out)
            , m_style(style)
            , m_savedExceptions(std::ios_base::goodbit)
            , m_headerStarted(false)
            , m_consumed(false) {}

        LineRenderer(const LineRenderer &) = delete;
        LineRenderer &operator=(const LineRenderer &) = delete;

        /// Render with the wall-clock time of this call.
        void render(const LogRecord &record) {
            render(record, std::chrono::system_clock::now());
        }

        void render(const LogRecord &record, std::chrono::system_clock::time_point now) {
            if (m_consumed) {
                throw std::logic_error("LineRenderer::render called twice");
            }
            m_consumed = true;

            m_savedExceptions = m_out.exceptions();
            m_out.exceptions(std::ios_base::goodbit);
            m_out.width(0);
            check("line");

            writeTimestamp(now);
            writeLevel(record);
            writeModulePath(record);
            writeTarget(record);
            finishHeader();

            writeBody(record);
            m_out << m_policy.lineTerminator();
            check("line terminator");

            m_out.exceptions(m_savedExceptions);
        }

    private:
        void writeHeaderSeparator() {
            if (!m_headerStarted) {
                m_headerStarted = true;
                m_out << '[';
            } else {
                m_out << ' ';
            }
        }

        void writeHeaderValue(const std::string &value, const char *step) {
            writeHeaderSeparator();
            m_out << value;
            check(step);
        }

        void writeTimestamp(std::chrono::system_clock::time_point now) {
            if (!m_policy.showTimestamp()) return;
            writeHeaderValue(formatTimestamp(now, m_policy.utcOffset(), m_policy.timestampFormat()),
                             "timestamp");
        }

        void writeLevel(const LogRecord &record) {
            if (!m_policy.showLevel()) return;

            std::string level = getLevelString(record.level);
            if (level.size() < 5) level.append(5 - level.size(), ' ');

            writeHeaderSeparator();
            m_out << m_style.start(record.level) << level << m_style.reset(record.level);
            check("level");
        }

        void writeModulePath(const LogRecord &record) {
            if (!m_policy.showModulePath() || !record.hasModulePath) return;
            writeHeaderValue(record.modulePath, "module path");
        }

        void writeTarget(const LogRecord &record) {
            if (!m_policy.showTarget() || record.target.empty()) return;
            writeHeaderValue(record.target, "target");
        }

        void finishHeader() {
            if (!m_headerStarted) return;
            m_out << "] ";
            check("header");
        }

        void writeBody(const LogRecord &record) {
            if (!m_policy.hasIndent()) {
                m_out << record.message;
                check("message");
                return;
            }

            detail::IndentStreambuf indenter(m_out.rdbuf(), m_policy.lineTerminator(),
                                             m_policy.indentWidth());
            std::ostream indented(&indenter);
            indented << record.message;
            if (!indented) {
                m_out.setstate(std::ios_base::badbit);
            }
            check("message");
        }

        void check(const char *step) {
            if (m_out) return;

            std::string what = std::string("Failed to write log ") + step;
            // Reinstating a mask that covers the failed state throws.
            try {
                m_out.exceptions(m_savedExceptions);
            } catch (const std::exception &) {
                throw IoError(what);
            }
            throw IoError(what);
        }

        const FormatPolicy &m_policy;
        std::ostream &m_out;
        const ILevelStyle &m_style;
        std::ios_base::iostate m_savedExceptions;
        bool m_headerStarted;
        bool m_consumed;
    };

} // namespace zonelog

#endif // ZONE_LOG_LINE_RENDERER_HPP
