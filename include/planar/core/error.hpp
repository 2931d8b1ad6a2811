#pragma once

/// @file error.hpp
/// @brief Error and Result types for planar
///
/// Only configuration input can fail recoverably, so Result<T> carries
/// those failures. Broken geometric preconditions (a zero support
/// direction, a singular matrix) throw standard exceptions instead.

#include "fwd.hpp"

#include <array>
#include <cstdint>
#include <optional>
#include <stdexcept>
#include <string>
#include <type_traits>
#include <utility>
#include <variant>
#include <vector>

namespace planar_core {

// =============================================================================
// ErrorCode
// =============================================================================

enum class ErrorCode : std::uint8_t {
    Unknown = 0,
    NotFound,
    InvalidArgument,
    InvalidState,
    IOError,
    ParseError,
    ValidationError,
    NotSupported,
};

[[nodiscard]] inline const char* error_code_name(ErrorCode code) {
    constexpr std::array<const char*, 8> names{
        "Unknown", "NotFound", "InvalidArgument", "InvalidState",
        "IOError", "ParseError", "ValidationError", "NotSupported",
    };
    const auto index = static_cast<std::size_t>(code);
    return index < names.size() ? names[index] : names[0];
}

// =============================================================================
// ConfigError
// =============================================================================

/// Why a collision configuration was rejected
struct ConfigError {
    enum class Kind : std::uint8_t {
        FileNotFound,
        ParseFailed,
        InvalidValue,
    };

    Kind kind = Kind::ParseFailed;
    std::string source;  ///< File path, or the name given to an in-memory document
    std::string key;     ///< Offending key; InvalidValue only
    std::string message;

    [[nodiscard]] static ConfigError file_not_found(std::string path) {
        ConfigError err;
        err.kind = Kind::FileNotFound;
        err.message = "no config file at " + path;
        err.source = std::move(path);
        return err;
    }

    [[nodiscard]] static ConfigError parse_failed(std::string source, const std::string& reason) {
        ConfigError err;
        err.kind = Kind::ParseFailed;
        err.message = source + " is not a valid config: " + reason;
        err.source = std::move(source);
        return err;
    }

    [[nodiscard]] static ConfigError invalid_value(std::string source, std::string key,
                                                   const std::string& reason) {
        ConfigError err;
        err.kind = Kind::InvalidValue;
        err.message = key + " in " + source + " " + reason;
        err.source = std::move(source);
        err.key = std::move(key);
        return err;
    }

    /// Code an Error built from this kind reports
    [[nodiscard]] ErrorCode code() const noexcept {
        switch (kind) {
            case Kind::FileNotFound: return ErrorCode::NotFound;
            case Kind::ParseFailed: return ErrorCode::ParseError;
            case Kind::InvalidValue: return ErrorCode::ValidationError;
        }
        return ErrorCode::Unknown;
    }
};

[[nodiscard]] const char* config_error_kind_name(ConfigError::Kind kind);

// =============================================================================
// Error
// =============================================================================

/// Error code, message and optional configuration detail, plus key/value
/// context kept in the order it was attached
class Error {
public:
    Error() = default;
    Error(ConfigError detail)
        : m_code(detail.code()), m_message(detail.message), m_config(std::move(detail)) {}
    Error(std::string message) : m_message(std::move(message)) {}
    Error(const char* message) : m_message(message) {}
    Error(ErrorCode code, std::string message) : m_code(code), m_message(std::move(message)) {}

    [[nodiscard]] ErrorCode code() const noexcept { return m_code; }
    [[nodiscard]] const std::string& message() const noexcept { return m_message; }

    /// Configuration detail, or nullptr for a plain error
    [[nodiscard]] const ConfigError* config() const noexcept {
        return m_config ? &*m_config : nullptr;
    }

    /// Attach context; an existing key is overwritten in place
    Error& with_context(std::string key, std::string value) {
        for (auto& [k, v] : m_context) {
            if (k == key) {
                v = std::move(value);
                return *this;
            }
        }
        m_context.emplace_back(std::move(key), std::move(value));
        return *this;
    }

    [[nodiscard]] const std::string* get_context(const std::string& key) const {
        for (const auto& [k, v] : m_context) {
            if (k == key) {
                return &v;
            }
        }
        return nullptr;
    }

    [[nodiscard]] const std::vector<std::pair<std::string, std::string>>& context() const noexcept {
        return m_context;
    }

private:
    ErrorCode m_code = ErrorCode::Unknown;
    std::string m_message = "unknown error";
    std::optional<ConfigError> m_config;
    std::vector<std::pair<std::string, std::string>> m_context;
};

/// "[Code] message", the configuration detail if any, then "(k=v, ...)"
[[nodiscard]] std::string build_error_chain(const Error& error);

// =============================================================================
// Result<T, E>
// =============================================================================

namespace detail {

template<typename E>
std::string describe(const E& error) {
    if constexpr (std::is_same_v<E, Error>) {
        return error.message();
    } else {
        return "error value";
    }
}

} // namespace detail

/// Either a T or an E
template<typename T, typename E>
class Result {
public:
    using value_type = T;
    using error_type = E;

    Result(T value) : m_state(std::in_place_index<0>, std::move(value)) {}
    Result(E error) : m_state(std::in_place_index<1>, std::move(error)) {}

    [[nodiscard]] bool is_ok() const noexcept { return m_state.index() == 0; }
    [[nodiscard]] bool is_err() const noexcept { return m_state.index() == 1; }
    explicit operator bool() const noexcept { return is_ok(); }

    /// Unchecked access; call is_ok() first or use unwrap()
    [[nodiscard]] T& value() & { return *std::get_if<0>(&m_state); }
    [[nodiscard]] const T& value() const& { return *std::get_if<0>(&m_state); }
    [[nodiscard]] E& error() & { return *std::get_if<1>(&m_state); }
    [[nodiscard]] const E& error() const& { return *std::get_if<1>(&m_state); }

    [[nodiscard]] T& operator*() & { return value(); }
    [[nodiscard]] const T& operator*() const& { return value(); }
    [[nodiscard]] T* operator->() { return &value(); }
    [[nodiscard]] const T* operator->() const { return &value(); }

    [[nodiscard]] T value_or(T fallback) const {
        return is_ok() ? value() : std::move(fallback);
    }

    /// The value, or std::runtime_error carrying the error message
    [[nodiscard]] T& unwrap() & {
        throw_if_err();
        return value();
    }

    [[nodiscard]] T unwrap() && {
        throw_if_err();
        return std::move(*std::get_if<0>(&m_state));
    }

    template<typename F>
    auto map(F&& func) const -> Result<std::invoke_result_t<F, const T&>, E> {
        using U = std::invoke_result_t<F, const T&>;
        if (is_err()) {
            return Result<U, E>(error());
        }
        return Result<U, E>(std::forward<F>(func)(value()));
    }

    /// func returns a Result with the same error type
    template<typename F>
    auto and_then(F&& func) const -> std::invoke_result_t<F, const T&> {
        using R = std::invoke_result_t<F, const T&>;
        if (is_err()) {
            return R(error());
        }
        return std::forward<F>(func)(value());
    }

    /// func maps the error to a replacement Result<T, E>
    template<typename F>
    Result or_else(F&& func) const {
        if (is_ok()) {
            return *this;
        }
        return std::forward<F>(func)(error());
    }

private:
    void throw_if_err() const {
        if (is_err()) {
            throw std::runtime_error("Result contains error: " + detail::describe(error()));
        }
    }

    std::variant<T, E> m_state;
};

/// Success carries nothing
template<typename E>
class Result<void, E> {
public:
    using value_type = void;
    using error_type = E;

    Result() = default;
    Result(E error) : m_error(std::move(error)) {}

    [[nodiscard]] bool is_ok() const noexcept { return !m_error.has_value(); }
    [[nodiscard]] bool is_err() const noexcept { return m_error.has_value(); }
    explicit operator bool() const noexcept { return is_ok(); }

    [[nodiscard]] E& error() & { return *m_error; }
    [[nodiscard]] const E& error() const& { return *m_error; }

    void unwrap() const {
        if (m_error) {
            throw std::runtime_error("Result contains error: " + detail::describe(*m_error));
        }
    }

private:
    std::optional<E> m_error;
};

// =============================================================================
// Constructors
// =============================================================================

template<typename T>
Result<T> Ok(T value) {
    return Result<T>(std::move(value));
}

inline Result<void> Ok() {
    return Result<void>();
}

template<typename T = void>
Result<T> Err(Error error) {
    return Result<T>(std::move(error));
}

extern template class Result<void, Error>;
extern template class Result<bool, Error>;

} // namespace planar_core
