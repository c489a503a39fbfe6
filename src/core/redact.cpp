#include "holdfast/core/redact.hpp"

#include <algorithm>
#include <cctype>

namespace holdfast::redact {
namespace {

bool looks_like_phone(std::string_view segment) {
    std::size_t digits = 0;
    for (char c : segment) {
        if (std::isdigit(static_cast<unsigned char>(c))) {
            ++digits;
        } else if (c != '+' && c != '-' && c != ' ' && c != '(' && c != ')') {
            return false;
        }
    }
    return digits >= 7;
}

} // namespace

std::string email(std::string_view address) {
    const auto at = address.find('@');
    if (at == std::string_view::npos || at + 1 >= address.size()) {
        return "***@***";
    }
    if (at == 0) {
        return std::string("***") + std::string(address.substr(at));
    }
    return std::string(1, address.front()) + "***" + std::string(address.substr(at));
}

std::string phone(std::string_view number) {
    if (number.size() < 4) {
        return "***";
    }
    return "***" + std::string(number.substr(number.size() - 4));
}

std::string identifier(std::string_view key) {
    std::string masked;
    masked.reserve(key.size());

    std::size_t start = 0;
    while (start <= key.size()) {
        const auto end = std::min(key.find(':', start), key.size());
        const auto segment = key.substr(start, end - start);

        if (segment.find('@') != std::string_view::npos) {
            masked += email(segment);
        } else if (looks_like_phone(segment)) {
            masked += phone(segment);
        } else {
            masked += segment;
        }

        if (end == key.size()) {
            break;
        }
        masked += ':';
        start = end + 1;
    }
    return masked;
}

} // namespace holdfast::redact
