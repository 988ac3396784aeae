#pragma once

#include "tus/core/result.hpp"

#include <string>
#include <string_view>

namespace tus {

/**
 * @brief Failure categories reported by the upload core
 *
 * Every failure raised by the session store, the chunk writer or the
 * upload service is one of these. The HTTP layer maps them onto status
 * codes; nothing below it retries.
 */
enum class ErrorCode {
    ProtocolViolation,  // Missing or malformed request signal
    Conflict,           // Offset mismatch, over-long chunk, name collision
    Gone,               // Unknown, expired or already finished upload
    TooLarge,           // Declared length above the configured ceiling
    InternalError       // Store or filesystem failure
};

struct Error {
    ErrorCode code = ErrorCode::InternalError;
    std::string message;
};

template<typename T>
using UploadResult = Result<T, Error>;

inline Error make_error(ErrorCode code, std::string message) {
    return Error{code, std::move(message)};
}

template<typename T>
UploadResult<T> fail(ErrorCode code, std::string message) {
    return Err<T, Error>(make_error(code, std::move(message)));
}

inline std::string_view to_string(ErrorCode code) noexcept {
    switch (code) {
        case ErrorCode::ProtocolViolation: return "protocol_violation";
        case ErrorCode::Conflict: return "conflict";
        case ErrorCode::Gone: return "gone";
        case ErrorCode::TooLarge: return "too_large";
        case ErrorCode::InternalError: return "internal_error";
    }
    return "unknown";
}

} // namespace tus
