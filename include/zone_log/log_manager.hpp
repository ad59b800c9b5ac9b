#ifndef ZONE_LOG_MANAGER_HPP
#define ZONE_LOG_MANAGER_HPP

#include "sink/sink_interface.hpp"
#include <vector>
#include <memory>

namespace zonelog {
    class LogManager {
    public:
        void addSink(std::unique_ptr<ISink> sink) {
            m_sinks.push_back(std::move(sink));
        }

        /// An IoError from a sink stops the fan-out and reaches the caller.
        void log(const LogRecord &record) {
            for (const auto &sink: m_sinks) {
                sink->write(record);
            }
        }

        void flush() {
            for (const auto &sink: m_sinks) {
                sink->flush();
            }
        }

        size_t sinkCount() const { return m_sinks.size(); }

    private:
        std::vector<std::unique_ptr<ISink> > m_sinks;
    };
} // namespace zonelog

#endif // ZONE_LOG_MANAGER_HPP
