#include "holdfast/core/config.hpp"

#include <cstdint>
#include <fstream>
#include <limits>
#include <sstream>
#include <string>

namespace holdfast {
namespace {

using json = nlohmann::json;

// Each reader leaves the target untouched when the field is absent.

Result<void> read_string(const json& parent, const char* field, std::string& target) {
    const auto it = parent.find(field);
    if (it == parent.end()) {
        return Ok();
    }
    if (!it->is_string()) {
        return Err<void>(Error::invalid(std::string("'") + field + "' must be a string"));
    }
    target = it->get<std::string>();
    return Ok();
}

Result<void> read_millis(const json& parent, const char* field, std::chrono::milliseconds& target) {
    const auto it = parent.find(field);
    if (it == parent.end()) {
        return Ok();
    }
    if (!it->is_number_integer() || it->get<std::int64_t>() < 0) {
        return Err<void>(Error::invalid(std::string("'") + field + "' must be a non-negative integer"));
    }
    target = std::chrono::milliseconds(it->get<std::int64_t>());
    return Ok();
}

Result<void> read_positive(const json& parent, const char* field, int& target) {
    const auto it = parent.find(field);
    if (it == parent.end()) {
        return Ok();
    }
    if (!it->is_number_integer() || it->get<std::int64_t>() <= 0
        || it->get<std::int64_t>() > std::numeric_limits<int>::max()) {
        return Err<void>(Error::invalid(std::string("'") + field + "' must be a positive integer up to "
                                        + std::to_string(std::numeric_limits<int>::max())));
    }
    target = static_cast<int>(it->get<std::int64_t>());
    return Ok();
}

Result<void> read_section(const json& parent, const char* field, const json*& section) {
    section = nullptr;
    const auto it = parent.find(field);
    if (it == parent.end()) {
        return Ok();
    }
    if (!it->is_object()) {
        return Err<void>(Error::invalid(std::string("'") + field + "' must be an object"));
    }
    section = &*it;
    return Ok();
}

Result<void> read_policies(const json& section, std::map<std::string, RateLimitPolicy>& policies) {
    const json* entries = nullptr;
    if (auto res = read_section(section, "policies", entries); res.is_error() || entries == nullptr) {
        return res;
    }

    for (const auto& [name, value] : entries->items()) {
        if (!value.is_object()) {
            return Err<void>(Error::invalid("policy '" + name + "' must be an object"));
        }
        RateLimitPolicy policy = policies.count(name) ? policies[name] : RateLimitPolicy{};
        if (auto res = read_positive(value, "max_attempts", policy.max_attempts); res.is_error()) {
            return Err<void>(Error::invalid("policy '" + name + "': " + res.error().message));
        }
        if (auto res = read_millis(value, "window_ms", policy.window); res.is_error()) {
            return Err<void>(Error::invalid("policy '" + name + "': " + res.error().message));
        }
        if (policy.window.count() == 0) {
            return Err<void>(Error::invalid("policy '" + name + "': 'window_ms' must be positive"));
        }
        policies[name] = policy;
    }
    return Ok();
}

} // namespace

std::optional<RateLimitPolicy> Config::policy(const std::string& name) const {
    const auto it = rate_limit.policies.find(name);
    if (it == rate_limit.policies.end()) {
        return std::nullopt;
    }
    return it->second;
}

Result<Config> parse_config(const nlohmann::json& document) {
    if (!document.is_object()) {
        return Err<Config>(Error::invalid("configuration root must be an object"));
    }

    Config config;

    auto fail = [](const Result<void>& res) {
        return Err<Config>(res.error());
    };

    if (auto res = read_string(document, "key_prefix", config.key_prefix); res.is_error()) {
        return fail(res);
    }
    if (config.key_prefix.empty()) {
        return Err<Config>(Error::invalid("'key_prefix' must not be empty"));
    }

    const json* section = nullptr;

    if (auto res = read_section(document, "rate_limit", section); res.is_error()) {
        return fail(res);
    }
    if (section != nullptr) {
        if (auto res = read_millis(*section, "retention_ms", config.rate_limit.retention); res.is_error()) {
            return fail(res);
        }
        if (auto res = read_policies(*section, config.rate_limit.policies); res.is_error()) {
            return fail(res);
        }
    }

    if (auto res = read_section(document, "cache", section); res.is_error()) {
        return fail(res);
    }
    if (section != nullptr) {
        if (auto res = read_millis(*section, "default_max_age_ms", config.cache.default_max_age); res.is_error()) {
            return fail(res);
        }
        if (auto res = read_string(*section, "schema_version", config.cache.schema_version); res.is_error()) {
            return fail(res);
        }
    }

    if (auto res = read_section(document, "sync", section); res.is_error()) {
        return fail(res);
    }
    if (section != nullptr) {
        if (auto res = read_positive(*section, "max_attempts", config.sync.max_attempts); res.is_error()) {
            return fail(res);
        }
        if (auto res = read_millis(*section, "apply_timeout_ms", config.sync.apply_timeout); res.is_error()) {
            return fail(res);
        }
    }

    if (auto res = read_section(document, "logging", section); res.is_error()) {
        return fail(res);
    }
    if (section != nullptr) {
        if (auto res = read_string(*section, "level", config.logging.level); res.is_error()) {
            return fail(res);
        }
        if (auto res = read_string(*section, "pattern", config.logging.pattern); res.is_error()) {
            return fail(res);
        }
    }

    return Ok(config);
}

Result<Config> load_config(const std::filesystem::path& path) {
    std::ifstream input(path);
    if (!input) {
        return Err<Config>(Error::storage("Failed to open config file: " + path.string()));
    }

    std::ostringstream buffer;
    buffer << input.rdbuf();

    const auto document = nlohmann::json::parse(buffer.str(), nullptr, false);
    if (document.is_discarded()) {
        return Err<Config>(Error::invalid("Config file is not valid JSON: " + path.string()));
    }
    return parse_config(document);
}

} // namespace holdfast
