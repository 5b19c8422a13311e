#pragma once

/// @file error.hpp
/// @brief Error handling types for beacon_core

#include "fwd.hpp"
#include <cstdint>
#include <string>
#include <variant>
#include <optional>
#include <utility>
#include <map>
#include <stdexcept>

namespace beacon_core {

// =============================================================================
// ErrorCode
// =============================================================================

/// General error code for categorizing errors
enum class ErrorCode : std::uint8_t {
    Unknown = 0,
    NotFound,
    InvalidArgument,
    InvalidState,
    LimitReached,
    ParseError,
};

/// Get error code name
[[nodiscard]] inline const char* error_code_name(ErrorCode code) {
    switch (code) {
        case ErrorCode::Unknown: return "Unknown";
        case ErrorCode::NotFound: return "NotFound";
        case ErrorCode::InvalidArgument: return "InvalidArgument";
        case ErrorCode::InvalidState: return "InvalidState";
        case ErrorCode::LimitReached: return "LimitReached";
        case ErrorCode::ParseError: return "ParseError";
        default: return "Unknown";
    }
}

// =============================================================================
// Error Kinds
// =============================================================================

/// Observer registration and removal errors
struct SubscriptionError {
    enum class Kind : std::uint8_t {
        EmptyName,       // Notification name is empty
        EmptyCallback,   // No observer callback given
        CenterShutDown,  // Center no longer accepts observers
        LimitReached,    // Center observer limit reached
        NotFound,        // Token unknown or already removed
        NoCenter,        // Sequence built without a center
    };

    Kind kind;
    std::string message;
    std::string event_name;

    [[nodiscard]] static SubscriptionError empty_name() {
        return SubscriptionError{Kind::EmptyName, "Notification name is empty", {}};
    }

    [[nodiscard]] static SubscriptionError empty_callback(const std::string& name) {
        return SubscriptionError{Kind::EmptyCallback, "Observer for '" + name + "' has no callback", name};
    }

    [[nodiscard]] static SubscriptionError center_shut_down(const std::string& center, const std::string& name) {
        return SubscriptionError{Kind::CenterShutDown,
            "Center '" + center + "' is shut down, cannot observe '" + name + "'", name};
    }

    [[nodiscard]] static SubscriptionError limit_reached(const std::string& name, std::size_t limit) {
        return SubscriptionError{Kind::LimitReached,
            "Observer limit (" + std::to_string(limit) + ") reached while observing '" + name + "'", name};
    }

    [[nodiscard]] static SubscriptionError not_found(std::uint64_t token) {
        return SubscriptionError{Kind::NotFound, "Observer token not found: " + std::to_string(token), {}};
    }

    [[nodiscard]] static SubscriptionError no_center(const std::string& name) {
        return SubscriptionError{Kind::NoCenter, "No notification center for '" + name + "'", name};
    }
};

/// Configuration errors
struct ConfigError {
    enum class Kind : std::uint8_t {
        ParseFailed,   // Argument or value could not be parsed
        TypeMismatch,  // Value has an unexpected type
    };

    Kind kind;
    std::string message;
    std::string key;

    [[nodiscard]] static ConfigError parse_failed(const std::string& key, const std::string& reason) {
        return ConfigError{Kind::ParseFailed, "Cannot parse '" + key + "': " + reason, key};
    }

    [[nodiscard]] static ConfigError type_mismatch(const std::string& key, const std::string& expected) {
        return ConfigError{Kind::TypeMismatch, "Type mismatch for '" + key + "', expected " + expected, key};
    }
};

// =============================================================================
// Error
// =============================================================================

/// Main error type (variant of all error kinds)
class Error {
public:
    using Variant = std::variant<
        SubscriptionError,
        ConfigError,
        std::string  // Generic message
    >;

    /// Constructors
    Error() : m_code(ErrorCode::Unknown), m_error("Unknown error") {}
    Error(SubscriptionError err) : m_code(to_error_code(err.kind)), m_error(std::move(err)) {}
    Error(ConfigError err) : m_code(to_error_code(err.kind)), m_error(std::move(err)) {}
    Error(const std::string& msg) : m_code(ErrorCode::Unknown), m_error(msg) {}
    Error(const char* msg) : m_code(ErrorCode::Unknown), m_error(std::string(msg)) {}

    /// Construct with error code and message
    Error(ErrorCode code, const std::string& msg) : m_code(code), m_error(msg) {}
    Error(ErrorCode code, const char* msg) : m_code(code), m_error(std::string(msg)) {}

    /// Get error code
    [[nodiscard]] ErrorCode code() const noexcept { return m_code; }

    /// Get error message
    [[nodiscard]] std::string message() const {
        return std::visit([](const auto& err) -> std::string {
            using T = std::decay_t<decltype(err)>;
            if constexpr (std::is_same_v<T, std::string>) {
                return err;
            } else {
                return err.message;
            }
        }, m_error);
    }

    /// Check error type
    template<typename T>
    [[nodiscard]] bool is() const {
        return std::holds_alternative<T>(m_error);
    }

    /// Get error as specific type
    template<typename T>
    [[nodiscard]] const T* as() const {
        return std::get_if<T>(&m_error);
    }

    /// Get underlying variant
    [[nodiscard]] const Variant& variant() const noexcept { return m_error; }

    /// Add context information
    Error& with_context(const std::string& key, const std::string& value) {
        m_context[key] = value;
        return *this;
    }

    /// Get context value
    [[nodiscard]] const std::string* get_context(const std::string& key) const {
        auto it = m_context.find(key);
        return it != m_context.end() ? &it->second : nullptr;
    }

    /// All context entries
    [[nodiscard]] const std::map<std::string, std::string>& context() const noexcept { return m_context; }

private:
    static ErrorCode to_error_code(SubscriptionError::Kind kind) {
        switch (kind) {
            case SubscriptionError::Kind::EmptyName: return ErrorCode::InvalidArgument;
            case SubscriptionError::Kind::EmptyCallback: return ErrorCode::InvalidArgument;
            case SubscriptionError::Kind::CenterShutDown: return ErrorCode::InvalidState;
            case SubscriptionError::Kind::LimitReached: return ErrorCode::LimitReached;
            case SubscriptionError::Kind::NotFound: return ErrorCode::NotFound;
            case SubscriptionError::Kind::NoCenter: return ErrorCode::InvalidArgument;
            default: return ErrorCode::Unknown;
        }
    }

    static ErrorCode to_error_code(ConfigError::Kind kind) {
        switch (kind) {
            case ConfigError::Kind::ParseFailed: return ErrorCode::ParseError;
            case ConfigError::Kind::TypeMismatch: return ErrorCode::InvalidArgument;
            default: return ErrorCode::Unknown;
        }
    }

    ErrorCode m_code;
    Variant m_error;
    std::map<std::string, std::string> m_context;
};

// =============================================================================
// Result<T, E>
// =============================================================================

/// Result type carrying either a value or an error
/// @tparam T Value type
/// @tparam E Error type (defaults to Error)
template<typename T, typename E>
class Result {
public:
    using value_type = T;
    using error_type = E;

    /// Success constructor
    Result(T value) : m_value(std::move(value)) {}

    /// Error constructor
    Result(E error) : m_error(std::move(error)) {}

    /// Check if result is ok
    [[nodiscard]] bool is_ok() const noexcept { return m_value.has_value(); }

    /// Check if result is error
    [[nodiscard]] bool is_err() const noexcept { return !m_value.has_value(); }

    /// Get value (undefined if error)
    [[nodiscard]] T& value() & { return *m_value; }
    [[nodiscard]] const T& value() const& { return *m_value; }
    [[nodiscard]] T&& value() && { return std::move(*m_value); }

    /// Get error (undefined if ok)
    [[nodiscard]] E& error() & { return m_error; }
    [[nodiscard]] const E& error() const& { return m_error; }

    /// Operator bool (true if ok)
    explicit operator bool() const noexcept { return m_value.has_value(); }

    /// Dereference operator (returns value)
    [[nodiscard]] T& operator*() & { return *m_value; }
    [[nodiscard]] const T& operator*() const& { return *m_value; }
    [[nodiscard]] T&& operator*() && { return std::move(*m_value); }

    /// Arrow operator
    [[nodiscard]] T* operator->() { return &(*m_value); }
    [[nodiscard]] const T* operator->() const { return &(*m_value); }

    /// Unwrap (throws if error)
    [[nodiscard]] T& unwrap() & {
        if (!m_value.has_value()) {
            throw std::runtime_error("Result contains error");
        }
        return *m_value;
    }

    [[nodiscard]] T&& unwrap() && {
        if (!m_value.has_value()) {
            throw std::runtime_error("Result contains error");
        }
        return std::move(*m_value);
    }


private:
    std::optional<T> m_value;
    E m_error;
};

/// Partial specialization for void result
template<typename E>
class Result<void, E> {
public:
    using value_type = void;
    using error_type = E;

    /// Success constructor
    Result() : m_has_value(true) {}

    /// Error constructor
    Result(E error) : m_error(std::move(error)), m_has_value(false) {}

    /// Static factory for success
    [[nodiscard]] static Result ok() { return Result(); }

    /// Check if result is ok
    [[nodiscard]] bool is_ok() const noexcept { return m_has_value; }

    /// Check if result is error
    [[nodiscard]] bool is_err() const noexcept { return !m_has_value; }

    /// Get error
    [[nodiscard]] E& error() & { return m_error; }
    [[nodiscard]] const E& error() const& { return m_error; }

    /// Operator bool
    explicit operator bool() const noexcept { return m_has_value; }

    /// Unwrap
    void unwrap() const {
        if (!m_has_value) {
            throw std::runtime_error("Result contains error");
        }
    }

private:
    E m_error;
    bool m_has_value;
};

/// Helper for creating Ok result
template<typename T>
Result<T> Ok(T value) {
    return Result<T>(std::move(value));
}

/// Helper for creating Ok void result
inline Result<void> Ok() {
    return Result<void>();
}

/// Helper for creating Err result
template<typename T = void>
Result<T> Err(Error error) {
    return Result<T>(std::move(error));
}

// =============================================================================
// Error Utilities (Implemented in error.cpp)
// =============================================================================

/// Build a full error message with code, kind details and context
std::string build_error_chain(const Error& error);

namespace debug {

/// Record error occurrence (for statistics)
void record_error(const Error& error);

/// Get total error count
std::uint64_t total_error_count();

/// Get count of subscription errors
std::uint64_t subscription_error_count();

/// Reset error statistics
void reset_error_stats();

/// Get error statistics as formatted string
std::string error_stats_summary();

} // namespace debug

} // namespace beacon_core
