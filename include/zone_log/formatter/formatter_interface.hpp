#ifndef ZONE_LOG_FORMATTER_INTERFACE_HPP
#define ZONE_LOG_FORMATTER_INTERFACE_HPP

#include "../core/log_record.hpp"
#include <ostream>
#include <sstream>
#include <string>

namespace zonelog {
    class IFormatter {
    public:
        virtual ~IFormatter() = default;

        /// Write one complete line, terminator included, to @p out.
        /// @throws IoError if @p out refuses a write.
        virtual void format(const LogRecord &record, std::ostream &out) const = 0;

        std::string formatToString(const LogRecord &record) const {
            std::ostringstream oss;
            format(record, oss);
            return oss.str();
        }
    };
} // namespace zonelog

#endif // ZONE_LOG_FORMATTER_INTERFACE_HPP
