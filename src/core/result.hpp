/**
 * @file result.hpp
 * @brief Monadic error handling type for ModelMesh.
 *
 * Provides Result<T, E> as the primary error-handling mechanism. Expected
 * failures (bad input, license denial, integrity failure, capacity shortage)
 * travel as values; exceptions are reserved for programming errors.
 */

#pragma once

#include <cstdint>
#include <optional>
#include <stdexcept>
#include <string>
#include <string_view>
#include <type_traits>
#include <utility>
#include <variant>

namespace model_mesh {

/**
 * @brief Failure classes shared by every subsystem.
 *
 * Retry decisions are made on the kind, never on the message text.
 */
enum class ErrorKind : uint8_t {
    InvalidInput,          ///< Malformed or empty request, never retried
    TransientTransport,    ///< I/O error or timeout, retried with backoff
    IntegrityFailure,      ///< Checksum or tag mismatch, terminal
    LicenseDenied,         ///< License gate refused the operation
    CapacityUnavailable,   ///< Allocator cannot satisfy the request now
    NotFound,              ///< Unknown id or missing payload
    Internal               ///< Unexpected condition
};

[[nodiscard]] constexpr std::string_view to_string(ErrorKind kind) noexcept {
    switch (kind) {
        case ErrorKind::InvalidInput:        return "invalid_input";
        case ErrorKind::TransientTransport:  return "transient_transport";
        case ErrorKind::IntegrityFailure:    return "integrity_failure";
        case ErrorKind::LicenseDenied:       return "license_denied";
        case ErrorKind::CapacityUnavailable: return "capacity_unavailable";
        case ErrorKind::NotFound:            return "not_found";
        case ErrorKind::Internal:            return "internal";
    }
    return "unknown";
}

/**
 * @brief Error type carrying a descriptive message and its failure class.
 */
struct Error {
    std::string message;
    ErrorKind kind = ErrorKind::Internal;

    explicit Error(std::string msg, ErrorKind k = ErrorKind::Internal)
        : message(std::move(msg)), kind(k) {}

    [[nodiscard]] const std::string& what() const noexcept { return message; }
};

/**
 * @brief Result<T, E>: a monadic error type.
 *
 * Holds either a success value of type T or an error of type E.
 */
template <typename T, typename E = Error>
class Result {
public:
    // ── Constructors ──────────────────────────

    /// Construct a success result.
    Result(T value) : storage_(std::move(value)) {}  // NOLINT(implicit)

    /// Construct an error result.
    Result(E error) : storage_(std::move(error)) {}  // NOLINT(implicit)

    // ── Observers ─────────────────────────────

    [[nodiscard]] bool has_value() const noexcept {
        return std::holds_alternative<T>(storage_);
    }

    [[nodiscard]] explicit operator bool() const noexcept {
        return has_value();
    }

    [[nodiscard]] T& value() & {
        if (!has_value()) throw std::runtime_error("Result has no value");
        return std::get<T>(storage_);
    }

    [[nodiscard]] const T& value() const& {
        if (!has_value()) throw std::runtime_error("Result has no value");
        return std::get<T>(storage_);
    }

    [[nodiscard]] T&& value() && {
        if (!has_value()) throw std::runtime_error("Result has no value");
        return std::get<T>(std::move(storage_));
    }

    [[nodiscard]] T& operator*() & { return value(); }
    [[nodiscard]] const T& operator*() const& { return value(); }
    [[nodiscard]] T* operator->() { return &value(); }
    [[nodiscard]] const T* operator->() const { return &value(); }

    [[nodiscard]] E& error() & {
        if (has_value()) throw std::runtime_error("Result has no error");
        return std::get<E>(storage_);
    }

    [[nodiscard]] const E& error() const& {
        if (has_value()) throw std::runtime_error("Result has no error");
        return std::get<E>(storage_);
    }

    // ── Monadic operations ────────────────────

    /// Transform the success value.
    template <typename F>
    auto map(F&& func) const -> Result<std::invoke_result_t<F, const T&>, E> {
        if (has_value()) {
            return func(value());
        }
        return error();
    }

    /// Chain with a function that returns a Result.
    template <typename F>
    auto and_then(F&& func) const -> std::invoke_result_t<F, const T&> {
        if (has_value()) {
            return func(value());
        }
        return error();
    }

    /// Provide a fallback value.
    [[nodiscard]] T value_or(T default_value) const& {
        if (has_value()) return value();
        return default_value;
    }

private:
    std::variant<T, E> storage_;
};

/**
 * @brief Specialization of Result for void success type.
 */
template <typename E>
class Result<void, E> {
public:
    Result() : has_value_(true) {}
    Result(E error) : error_(std::move(error)), has_value_(false) {}  // NOLINT(implicit)

    [[nodiscard]] bool has_value() const noexcept { return has_value_; }
    [[nodiscard]] explicit operator bool() const noexcept { return has_value_; }

    [[nodiscard]] E& error() & {
        if (has_value_) throw std::runtime_error("Result has no error");
        return *error_;
    }

    [[nodiscard]] const E& error() const& {
        if (has_value_) throw std::runtime_error("Result has no error");
        return *error_;
    }

private:
    std::optional<E> error_;
    bool has_value_;
};

/// Convenience factory for error results.
template <typename T, typename E = Error>
Result<T, E> make_error(std::string message, ErrorKind kind = ErrorKind::Internal) {
    return Result<T, E>(E{std::move(message), kind});
}

}  // namespace model_mesh
