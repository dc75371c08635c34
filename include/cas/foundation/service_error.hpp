#pragma once

/// @file service_error.hpp
/// @brief Service error type used with Result<T, ServiceError>.

#include <any>
#include <string>
#include <string_view>
#include <utility>

#include "cas/foundation/error_code.hpp"

namespace cas::foundation {

/// Internal cause preserved when a low-level failure is wrapped into a
/// caller-facing error. Only logs ever look at it.
struct ErrorCause {
    ErrorCode code = ErrorCode::Unknown;
    std::string message;
};

/// Error carrying a code, a caller-safe message, and optional type-erased
/// context data.
class ServiceError {
public:
    ServiceError() = default;

    explicit ServiceError(ErrorCode code)
        : code_(code) {}

    ServiceError(ErrorCode code, std::string message)
        : code_(code), message_(std::move(message)) {}

    ServiceError(ErrorCode code, std::string message, std::any context)
        : code_(code), message_(std::move(message)), context_(std::move(context)) {}

    /// Wrap @p inner under a generic message. The inner code and message
    /// survive as an ErrorCause context.
    [[nodiscard]] static ServiceError wrap(ErrorCode code, std::string message,
                                           const ServiceError& inner) {
        return ServiceError(code, std::move(message),
                            ErrorCause{inner.code(), std::string(inner.message())});
    }

    [[nodiscard]] ErrorCode code() const noexcept { return code_; }

    [[nodiscard]] std::string_view message() const noexcept { return message_; }

    [[nodiscard]] std::string_view subsystem() const noexcept {
        return errorSubsystem(code_);
    }

    /// Typed context data, or nullptr on type mismatch / absence.
    template <typename T>
    [[nodiscard]] const T* context() const noexcept {
        return std::any_cast<T>(&context_);
    }

    [[nodiscard]] bool hasContext() const noexcept { return context_.has_value(); }

    /// The wrapped cause, if this error was produced by wrap().
    [[nodiscard]] const ErrorCause* cause() const noexcept { return context<ErrorCause>(); }

    [[nodiscard]] bool isSuccess() const noexcept {
        return code_ == ErrorCode::Success;
    }

private:
    ErrorCode code_ = ErrorCode::Unknown;
    std::string message_;
    std::any context_;
};

} // namespace cas::foundation
