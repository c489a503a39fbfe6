#pragma once

#include <chrono>

namespace holdfast {

/**
 * @brief How many attempts an action allows inside one window
 */
struct RateLimitPolicy {
    int max_attempts = 5;
    std::chrono::milliseconds window{std::chrono::minutes(15)};
};

namespace policies {

inline constexpr RateLimitPolicy kLogin{5, std::chrono::minutes(15)};
inline constexpr RateLimitPolicy kPasswordReset{3, std::chrono::hours(1)};
inline constexpr RateLimitPolicy kRegister{5, std::chrono::hours(1)};
inline constexpr RateLimitPolicy kApiCall{100, std::chrono::minutes(1)};

} // namespace policies

} // namespace holdfast
