#include "holdfast/core/logging.hpp"

#include <spdlog/spdlog.h>

namespace holdfast::logging {

void init(const Config::Logging& settings) {
    auto level = spdlog::level::from_str(settings.level);
    // from_str() maps unknown names to "off"
    const bool unknown = level == spdlog::level::off && settings.level != "off";
    if (unknown) {
        level = spdlog::level::info;
    }

    spdlog::set_level(level);
    spdlog::set_pattern(settings.pattern);

    if (unknown) {
        spdlog::warn("Unknown log level '{}', using info", settings.level);
    }
}

} // namespace holdfast::logging
