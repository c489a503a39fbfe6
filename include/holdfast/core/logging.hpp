#pragma once

#include "holdfast/core/config.hpp"

namespace holdfast::logging {

/**
 * @brief Apply level and pattern to the default spdlog logger
 *
 * An unknown level name falls back to "info" and says so.
 */
void init(const Config::Logging& settings);

} // namespace holdfast::logging
