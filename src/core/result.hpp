#pragma once

#include <functional>
#include <optional>
#include <stdexcept>
#include <string>
#include <string_view>
#include <type_traits>
#include <variant>

namespace sparkle {

/**
 * NameValidation - Outcome of validating a theme name or note content.
 */
enum class NameValidation {
    Valid,
    Empty,
    TooLong,
    Invalid
};

/**
 * ErrorKind - Error taxonomy of the data layer.
 */
enum class ErrorKind {
    Storage,                  // SQLite failure; Error::code holds the result code
    InvalidName,
    InvalidContent,
    DuplicateKey,
    NotFound,
    ProtectedTheme,
    MigrationFailure,
    AggregateRefreshFailure,
    Cancelled
};

[[nodiscard]] constexpr std::string_view to_string(ErrorKind kind) noexcept {
    switch (kind) {
        case ErrorKind::Storage: return "Storage";
        case ErrorKind::InvalidName: return "InvalidName";
        case ErrorKind::InvalidContent: return "InvalidContent";
        case ErrorKind::DuplicateKey: return "DuplicateKey";
        case ErrorKind::NotFound: return "NotFound";
        case ErrorKind::ProtectedTheme: return "ProtectedTheme";
        case ErrorKind::MigrationFailure: return "MigrationFailure";
        case ErrorKind::AggregateRefreshFailure: return "AggregateRefreshFailure";
        case ErrorKind::Cancelled: return "Cancelled";
    }
    return "Unknown";
}

[[nodiscard]] constexpr std::string_view to_string(NameValidation v) noexcept {
    switch (v) {
        case NameValidation::Valid: return "Valid";
        case NameValidation::Empty: return "Empty";
        case NameValidation::TooLong: return "TooLong";
        case NameValidation::Invalid: return "Invalid";
    }
    return "Unknown";
}

/**
 * Error type for Result - a failure with a message, a kind and an optional
 * low-level code.
 *
 * Validation failures carry the precise NameValidation so callers can render
 * a field-level message instead of a generic one.
 */
struct Error {
    std::string message;
    int code{0};
    ErrorKind kind{ErrorKind::Storage};
    std::optional<NameValidation> validation;

    Error() = default;
    explicit Error(std::string msg, int c = 0) : message(std::move(msg)), code(c) {}
    Error(ErrorKind k, std::string msg) : message(std::move(msg)), kind(k) {}
    Error(ErrorKind k, std::string msg, NameValidation v)
        : message(std::move(msg)), kind(k), validation(v) {}

    [[nodiscard]] bool is(ErrorKind k) const noexcept { return kind == k; }

    bool operator==(const Error& other) const {
        return message == other.message && code == other.code && kind == other.kind;
    }
};

/**
 * Result<T, E> - Either a successful value (Ok) or an error (Err).
 *
 * Usage:
 *   Result<int64_t> id = inspirations.insert(note);
 *   if (id.is_err()) return Result<void>::err(id.unwrap_err());
 */
template<typename T, typename E = Error>
class Result {
public:
    using value_type = T;
    using error_type = E;

    [[nodiscard]] static Result ok(T value) {
        return Result(std::in_place_index<0>, std::move(value));
    }

    [[nodiscard]] static Result err(E error) {
        return Result(std::in_place_index<1>, std::move(error));
    }

    [[nodiscard]] bool is_ok() const noexcept {
        return data_.index() == 0;
    }

    [[nodiscard]] bool is_err() const noexcept {
        return data_.index() == 1;
    }

    /**
     * Get the success value, throwing if this is an error.
     * Only tests and startup code should rely on the throw.
     */
    [[nodiscard]] T& unwrap() & {
        throw_if_err();
        return std::get<0>(data_);
    }

    [[nodiscard]] const T& unwrap() const& {
        throw_if_err();
        return std::get<0>(data_);
    }

    [[nodiscard]] T unwrap() && {
        throw_if_err();
        return std::get<0>(std::move(data_));
    }

    [[nodiscard]] E& unwrap_err() & {
        if (is_ok()) {
            throw std::runtime_error("Result::unwrap_err() called on success");
        }
        return std::get<1>(data_);
    }

    [[nodiscard]] const E& unwrap_err() const& {
        if (is_ok()) {
            throw std::runtime_error("Result::unwrap_err() called on success");
        }
        return std::get<1>(data_);
    }

    [[nodiscard]] T value_or(T default_value) const& {
        if (is_ok()) {
            return std::get<0>(data_);
        }
        return default_value;
    }

    [[nodiscard]] T value_or(T default_value) && {
        if (is_ok()) {
            return std::get<0>(std::move(data_));
        }
        return default_value;
    }

    /**
     * map : Result<T, E> -> (T -> U) -> Result<U, E>
     */
    template<typename F>
    [[nodiscard]] auto map(F&& f) const& -> Result<std::invoke_result_t<F, const T&>, E> {
        using U = std::invoke_result_t<F, const T&>;
        if (is_ok()) {
            return Result<U, E>::ok(std::invoke(std::forward<F>(f), std::get<0>(data_)));
        }
        return Result<U, E>::err(std::get<1>(data_));
    }

    /**
     * and_then : Result<T, E> -> (T -> Result<U, E>) -> Result<U, E>
     */
    template<typename F>
    [[nodiscard]] auto and_then(F&& f) && -> std::invoke_result_t<F, T> {
        using ResultU = std::invoke_result_t<F, T>;
        if (is_ok()) {
            return std::invoke(std::forward<F>(f), std::get<0>(std::move(data_)));
        }
        return ResultU::err(std::get<1>(std::move(data_)));
    }

    template<typename F>
    const Result& inspect_err(F&& f) const& {
        if (is_err()) {
            std::invoke(std::forward<F>(f), std::get<1>(data_));
        }
        return *this;
    }

private:
    template<size_t I, typename... Args>
    explicit Result(std::in_place_index_t<I> idx, Args&&... args)
        : data_(idx, std::forward<Args>(args)...) {}

    void throw_if_err() const {
        if (is_err()) {
            if constexpr (std::is_same_v<E, Error>) {
                throw std::runtime_error("Result::unwrap() called on error: " +
                                         std::get<1>(data_).message);
            } else {
                throw std::runtime_error("Result::unwrap() called on error");
            }
        }
    }

    // Index-based so that T and E may be the same type.
    std::variant<T, E> data_;
};

/**
 * Specialization for operations that succeed without a value.
 */
template<typename E>
class Result<void, E> {
public:
    using value_type = void;
    using error_type = E;

    [[nodiscard]] static Result ok() {
        return Result(true);
    }

    [[nodiscard]] static Result err(E error) {
        return Result(std::move(error));
    }

    [[nodiscard]] bool is_ok() const noexcept { return is_ok_; }
    [[nodiscard]] bool is_err() const noexcept { return !is_ok_; }

    void unwrap() const {
        if (is_err()) {
            if constexpr (std::is_same_v<E, Error>) {
                throw std::runtime_error("Result::unwrap() called on error: " + error_.message);
            } else {
                throw std::runtime_error("Result::unwrap() called on error");
            }
        }
    }

    [[nodiscard]] E& unwrap_err() & {
        if (is_ok()) {
            throw std::runtime_error("Result::unwrap_err() called on success");
        }
        return error_;
    }

    [[nodiscard]] const E& unwrap_err() const& {
        if (is_ok()) {
            throw std::runtime_error("Result::unwrap_err() called on success");
        }
        return error_;
    }

    template<typename F>
    [[nodiscard]] auto and_then(F&& f) const -> std::invoke_result_t<F> {
        using ResultU = std::invoke_result_t<F>;
        if (is_ok()) {
            return std::invoke(std::forward<F>(f));
        }
        return ResultU::err(error_);
    }

    template<typename F>
    const Result& inspect_err(F&& f) const {
        if (is_err()) {
            std::invoke(std::forward<F>(f), error_);
        }
        return *this;
    }

private:
    explicit Result(bool ok) : is_ok_(ok) {}
    explicit Result(E error) : is_ok_(false), error_(std::move(error)) {}

    bool is_ok_;
    E error_{};
};

template<typename T>
using Res = Result<T, Error>;

} // namespace sparkle
