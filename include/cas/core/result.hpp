#pragma once

/// @file result.hpp
/// @brief Result<T,E> for explicit error propagation across module boundaries.

#include <string>
#include <utility>
#include <variant>

namespace cas {

/// Minimal error payload used when no richer error type is supplied.
struct Error {
    int code = 0;
    std::string message;

    Error() = default;
    explicit Error(std::string msg) : code(-1), message(std::move(msg)) {}
    Error(int c, std::string msg) : code(c), message(std::move(msg)) {}
};

/// Holds either a success value or an error.
///
/// Operations that talk to a store, a cache or another collaborator return
/// Result<T, E> so that the caller decides whether a failure is fatal,
/// recoverable or merely logged. Nothing in the library throws across a
/// public API boundary.
///
/// Example:
/// @code
///   auto session = store.findByRefreshTokenHash(hash);
///   if (session.hasError()) {
///       return Result<Outcome>::err(session.error());
///   }
///   if (!session.value().has_value()) { ... }
/// @endcode
template <typename T, typename E = Error>
class Result {
public:
    static Result ok(T value) { return Result(std::in_place_index<0>, std::move(value)); }
    static Result err(E error) { return Result(std::in_place_index<1>, std::move(error)); }

    [[nodiscard]] bool hasValue() const noexcept { return data_.index() == 0; }
    [[nodiscard]] bool hasError() const noexcept { return data_.index() == 1; }
    explicit operator bool() const noexcept { return hasValue(); }

    /// Success value; undefined behavior when hasError().
    [[nodiscard]] const T& value() const& { return std::get<0>(data_); }
    [[nodiscard]] T& value() & { return std::get<0>(data_); }
    [[nodiscard]] T&& value() && { return std::get<0>(std::move(data_)); }

    /// Error value; undefined behavior when hasValue().
    [[nodiscard]] const E& error() const& { return std::get<1>(data_); }
    [[nodiscard]] E& error() & { return std::get<1>(data_); }
    [[nodiscard]] E&& error() && { return std::get<1>(std::move(data_)); }

    [[nodiscard]] T valueOr(T fallback) const& {
        return hasValue() ? value() : std::move(fallback);
    }

    [[nodiscard]] T valueOr(T fallback) && {
        return hasValue() ? std::get<0>(std::move(data_)) : std::move(fallback);
    }

private:
    template <std::size_t I, typename U>
    Result(std::in_place_index_t<I> tag, U&& v) : data_(tag, std::forward<U>(v)) {}

    // Indexed so that T and E may be the same type.
    std::variant<T, E> data_;
};

/// Void success type: either "done" or an error.
template <typename E>
class Result<void, E> {
public:
    static Result ok() { return Result(); }
    static Result err(E error) { return Result(std::move(error)); }

    [[nodiscard]] bool hasValue() const noexcept { return success_; }
    [[nodiscard]] bool hasError() const noexcept { return !success_; }
    explicit operator bool() const noexcept { return success_; }

    [[nodiscard]] const E& error() const& { return error_; }
    [[nodiscard]] E& error() & { return error_; }

private:
    Result() : success_(true) {}
    explicit Result(E error) : success_(false), error_(std::move(error)) {}

    bool success_ = false;
    E error_{};
};

}  // namespace cas
