#ifndef ZONE_LOG_STREAM_SINK_HPP
#define ZONE_LOG_STREAM_SINK_HPP

#include "sink_interface.hpp"
#include "../core/io_error.hpp"
#include "../core/log_common.hpp"
#include "../formatter/zoned_formatter.hpp"
#include <mutex>
#include <ostream>

namespace zonelog {
    /// Sink writing to a caller-owned std::ostream.
    ///
    /// Writes are serialized per sink instance. The stream must outlive
    /// the sink.
    class StreamSink : public ISink {
    public:
        explicit StreamSink(std::ostream &out)
            : m_out(out) {
            setFormatter(detail::make_unique<ZonedFormatter>());
        }

        StreamSink(std::ostream &out, const FormatPolicy &policy)
            : m_out(out) {
            setFormatter(detail::make_unique<ZonedFormatter>(policy));
        }

        void write(const LogRecord &record) override {
            IFormatter *fmt = formatter();
            if (!fmt) return;
            std::lock_guard<std::mutex> lock(m_mutex);
            fmt->format(record, m_out);
        }

        void flush() override {
            std::lock_guard<std::mutex> lock(m_mutex);
            m_out.flush();
            if (!m_out) {
                throw IoError("Failed to flush log stream");
            }
        }

    private:
        std::ostream &m_out;
        std::mutex m_mutex;
    };
} // namespace zonelog

#endif // ZONE_LOG_STREAM_SINK_HPP
