#ifndef ZONE_LOG_SINK_INTERFACE_HPP
#define ZONE_LOG_SINK_INTERFACE_HPP

#include "../core/log_record.hpp"
#include "../formatter/formatter_interface.hpp"
#include <memory>
#include <utility>

namespace zonelog {
    /// Destination for formatted records.
    ///
    /// setFormatter() is not synchronized with write(); install the
    /// formatter before the sink is handed to a Logger.
    class ISink {
    public:
        virtual ~ISink() = default;

        /// @throws IoError if the destination refuses the line.
        virtual void write(const LogRecord &record) = 0;

        virtual void flush() {}

        void setFormatter(std::unique_ptr<IFormatter> formatter) {
            m_formatter = std::move(formatter);
        }

        IFormatter *formatter() const { return m_formatter.get(); }

    protected:
        std::unique_ptr<IFormatter> m_formatter;
    };
} // namespace zonelog

#endif // ZONE_LOG_SINK_INTERFACE_HPP
