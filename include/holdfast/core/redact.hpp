#pragma once

#include <string>
#include <string_view>

namespace holdfast::redact {

/**
 * @brief Mask an e-mail address: "jane@example.com" -> "j***@example.com"
 */
std::string email(std::string_view address);

/**
 * @brief Mask a phone number, keeping the last four digits: "***1234"
 */
std::string phone(std::string_view number);

/**
 * @brief Mask personal data inside a colon separated identifier
 *
 * Rate-limit keys look like "login:jane@example.com" or
 * "reset:+905551234567". Segments that look like an e-mail address or a
 * phone number are masked, everything else is kept.
 */
std::string identifier(std::string_view key);

} // namespace holdfast::redact
