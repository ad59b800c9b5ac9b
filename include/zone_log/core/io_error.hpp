#ifndef ZONE_LOG_IO_ERROR_HPP
#define ZONE_LOG_IO_ERROR_HPP

#include <stdexcept>
#include <string>

namespace zonelog {
    /// Thrown when the destination stream refuses a write.
    /// The line being rendered is abandoned at the failing step.
    class IoError : public std::runtime_error {
    public:
        explicit IoError(const std::string &what)
            : std::runtime_error(what) {}
    };
} // namespace zonelog

#endif // ZONE_LOG_IO_ERROR_HPP
