#pragma once

/**
 * @file config.hpp
 * @brief Tunables for every holdfast component
 *
 * Defaults reproduce the values the client application ships with. A JSON
 * file can override any subset:
 *
 * {
 *   "key_prefix": "cardvault",
 *   "rate_limit": {
 *     "retention_ms": 86400000,
 *     "policies": { "login": { "max_attempts": 5, "window_ms": 900000 } }
 *   },
 *   "cache": { "default_max_age_ms": 86400000, "schema_version": "1.0" },
 *   "sync": { "max_attempts": 3, "apply_timeout_ms": 30000 },
 *   "logging": { "level": "info", "pattern": "[%H:%M:%S] [%^%l%$] %v" }
 * }
 */

#include "holdfast/core/result.hpp"
#include "holdfast/ratelimit/policy.hpp"

#include <nlohmann/json.hpp>

#include <chrono>
#include <filesystem>
#include <map>
#include <optional>
#include <string>

namespace holdfast {

struct Config {
    struct RateLimit {
        /// Records younger than this survive clear_expired_records()
        std::chrono::milliseconds retention{std::chrono::hours(24)};
        std::map<std::string, RateLimitPolicy> policies{
            {"login", policies::kLogin},
            {"password_reset", policies::kPasswordReset},
            {"register", policies::kRegister},
            {"api_call", policies::kApiCall},
        };
    };

    struct Cache {
        std::chrono::milliseconds default_max_age{std::chrono::hours(24)};
        std::string schema_version = "1.0";
    };

    struct Sync {
        int max_attempts = 3;
        /// Zero disables the bound and runs the apply function inline
        std::chrono::milliseconds apply_timeout{std::chrono::seconds(30)};
    };

    struct Logging {
        std::string level = "info";
        std::string pattern = "[%H:%M:%S] [%^%l%$] %v";
    };

    std::string key_prefix = "holdfast";
    RateLimit rate_limit;
    Cache cache;
    Sync sync;
    Logging logging;

    std::optional<RateLimitPolicy> policy(const std::string& name) const;
};

/**
 * @brief Overlay @p document on the defaults
 *
 * Missing fields keep their default. A field of the wrong type, an attempt
 * count outside [1, INT_MAX] or a negative duration is an InvalidArgument
 * error.
 */
Result<Config> parse_config(const nlohmann::json& document);

Result<Config> load_config(const std::filesystem::path& path);

} // namespace holdfast
