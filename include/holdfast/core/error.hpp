#pragma once

/**
 * @file error.hpp
 * @brief Error values shared by every holdfast component
 *
 * See result.hpp for how they travel.
 */

#include <string>
#include <utility>

namespace holdfast {

enum class ErrorKind {
    StorageFault,    ///< The durable store failed to read or write
    CorruptRecord,   ///< A persisted value could not be decoded
    RetryExhausted,  ///< A queued operation was dropped after max attempts
    ApplyFailure,    ///< The remote apply function rejected an operation
    Timeout,         ///< The remote apply function did not answer in time
    InvalidArgument  ///< Bad caller input or configuration
};

struct Error {
    ErrorKind kind = ErrorKind::StorageFault;
    std::string message;

    static Error storage(std::string message) {
        return Error{ErrorKind::StorageFault, std::move(message)};
    }

    static Error corrupt(std::string message) {
        return Error{ErrorKind::CorruptRecord, std::move(message)};
    }

    static Error invalid(std::string message) {
        return Error{ErrorKind::InvalidArgument, std::move(message)};
    }
};

const char* to_string(ErrorKind kind) noexcept;

std::string describe(const Error& error);

} // namespace holdfast
