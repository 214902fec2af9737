/**
 * @file result.hpp
 * @brief Error handling with Result<T, E> type
 *
 * Every fallible operation in reel returns a Result. Errors carry an
 * ErrorCode plus a human readable message and are never swallowed.
 */

#pragma once

#include <variant>
#include <optional>
#include <string>
#include <utility>
#include <stdexcept>

#include "types.hpp"

namespace reel {

// ============================================================================
// Error Type
// ============================================================================

/// Error class holding an error code and optional message
class Error {
public:
    Error() : m_code(ErrorCode::Unknown) {}

    explicit Error(ErrorCode code) : m_code(code) {}

    Error(ErrorCode code, std::string message)
        : m_code(code), m_message(std::move(message)) {}

    ErrorCode code() const { return m_code; }
    const std::string& message() const { return m_message; }

    const char* what() const {
        if (!m_message.empty()) {
            return m_message.c_str();
        }
        return errorCodeToString(m_code);
    }

    explicit operator bool() const { return m_code != ErrorCode::Ok; }

private:
    ErrorCode m_code;
    std::string m_message;
};

// ============================================================================
// Result<T, E> Template
// ============================================================================

/**
 * @brief Result type for functions that can fail
 *
 * Holds either a success value (T) or an error (E).
 *
 * @tparam T Success value type
 * @tparam E Error type (defaults to Error)
 */
template<typename T, typename E = Error>
class Result {
public:
    using value_type = T;
    using error_type = E;

    /// Construct success result from value
    Result(T value) : m_data(std::move(value)) {}

    /// Construct error result from error
    Result(E error) : m_data(std::move(error)) {}

    Result(const Result&) = default;
    Result(Result&&) noexcept = default;
    Result& operator=(const Result&) = default;
    Result& operator=(Result&&) noexcept = default;

    /// Check if result is success
    [[nodiscard]] bool ok() const {
        return std::holds_alternative<T>(m_data);
    }

    explicit operator bool() const { return ok(); }

    /// Get value reference (throws if error)
    T& value() & {
        if (!ok()) {
            throw std::runtime_error(std::get<E>(m_data).what());
        }
        return std::get<T>(m_data);
    }

    const T& value() const& {
        if (!ok()) {
            throw std::runtime_error(std::get<E>(m_data).what());
        }
        return std::get<T>(m_data);
    }

    T&& value() && {
        if (!ok()) {
            throw std::runtime_error(std::get<E>(m_data).what());
        }
        return std::get<T>(std::move(m_data));
    }

    /// Get error reference (throws if success)
    E& error() & {
        if (ok()) {
            throw std::logic_error("Result::error() called on success value");
        }
        return std::get<E>(m_data);
    }

    const E& error() const& {
        if (ok()) {
            throw std::logic_error("Result::error() called on success value");
        }
        return std::get<E>(m_data);
    }

private:
    std::variant<T, E> m_data;
};

// ============================================================================
// Result<void, E> Specialization
// ============================================================================

template<typename E>
class Result<void, E> {
public:
    using value_type = void;
    using error_type = E;

    /// Construct success result
    Result() : m_error(std::nullopt) {}

    /// Construct error result
    Result(E error) : m_error(std::move(error)) {}

    Result(const Result&) = default;
    Result(Result&&) noexcept = default;
    Result& operator=(const Result&) = default;
    Result& operator=(Result&&) noexcept = default;

    [[nodiscard]] bool ok() const { return !m_error.has_value(); }
    explicit operator bool() const { return ok(); }

    E& error() & {
        if (!m_error.has_value()) {
            throw std::logic_error("Result::error() called on success");
        }
        return *m_error;
    }

    const E& error() const& {
        if (!m_error.has_value()) {
            throw std::logic_error("Result::error() called on success");
        }
        return *m_error;
    }

private:
    std::optional<E> m_error;
};

// ============================================================================
// Helper Factory Functions
// ============================================================================

/// Create void success result
inline Result<void> Ok() {
    return Result<void>();
}

} // namespace reel
