#ifndef ZONE_LOG_COMMON_HPP
#define ZONE_LOG_COMMON_HPP

#include <memory>
#include <utility>

namespace zonelog {
namespace detail {
#if __cplusplus < 201402L
    template<typename T, typename... Args>
    std::unique_ptr<T> make_unique(Args&&... args) {
        return std::unique_ptr<T>(new T(std::forward<Args>(args)...));
    }
#else
    using std::make_unique;
#endif
} // namespace detail
} // namespace zonelog

#endif // ZONE_LOG_COMMON_HPP
