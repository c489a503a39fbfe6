#include "holdfast/core/error.hpp"

namespace holdfast {

const char* to_string(ErrorKind kind) noexcept {
    switch (kind) {
        case ErrorKind::StorageFault: return "StorageFault";
        case ErrorKind::CorruptRecord: return "CorruptRecord";
        case ErrorKind::RetryExhausted: return "RetryExhausted";
        case ErrorKind::ApplyFailure: return "ApplyFailure";
        case ErrorKind::Timeout: return "Timeout";
        case ErrorKind::InvalidArgument: return "InvalidArgument";
    }
    return "Unknown";
}

std::string describe(const Error& error) {
    if (error.message.empty()) {
        return to_string(error.kind);
    }
    return std::string(to_string(error.kind)) + ": " + error.message;
}

} // namespace holdfast
