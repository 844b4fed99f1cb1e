// =============================================================================
// SmartScreen - Result Type for Unified Error Handling
// =============================================================================
// A Result<T, E> type that encapsulates either a success value or an error.
// Every transport operation reports through it; nothing throws across module
// boundaries.
//
// Usage:
//   Result<DeviceIdentity> pick(const std::string& sel) {
//       if (sel.empty()) return Error(ErrorKind::InvalidArgument, "empty selector");
//       return identity;
//   }
//
//   auto result = pick("0");
//   if (!result) SLOG_ERROR("cli", "%s", result.error().message.c_str());
// =============================================================================

#pragma once

#include <variant>
#include <string>
#include <optional>
#include <stdexcept>
#include <type_traits>

namespace smartscreen {

// =============================================================================
// Error Types
// =============================================================================

enum class ErrorKind {
    InvalidArgument,   // caller broke an input contract
    DeviceBusy,        // interface claim failed after bounded retries
    NotFound,          // selector / device resolution failed
    Ambiguous,         // selector prefix matched several devices
    ProtocolFraming,   // magic or trailer mismatch on decode
    Io,                // transport failure
    Timeout,           // no data within the read/write timeout
    TransferAborted,   // multi-chunk operation interrupted
    ModeConflict,      // transfer refused by mode / active-transfer check
    Config             // malformed configuration
};

inline const char* error_kind_name(ErrorKind kind) {
    switch (kind) {
        case ErrorKind::InvalidArgument: return "InvalidArgument";
        case ErrorKind::DeviceBusy:      return "DeviceBusy";
        case ErrorKind::NotFound:        return "NotFound";
        case ErrorKind::Ambiguous:       return "Ambiguous";
        case ErrorKind::ProtocolFraming: return "ProtocolFraming";
        case ErrorKind::Io:              return "IoError";
        case ErrorKind::Timeout:         return "TimeoutError";
        case ErrorKind::TransferAborted: return "TransferAborted";
        case ErrorKind::ModeConflict:    return "ModeConflict";
        case ErrorKind::Config:          return "ConfigError";
    }
    return "Unknown";
}

// Error with kind, message and the underlying libusb code (0 if none)
struct Error {
    ErrorKind kind = ErrorKind::Io;
    std::string message;
    int code = 0;

    Error() = default;
    Error(ErrorKind k, std::string msg, int c = 0)
        : kind(k), message(std::move(msg)), code(c) {}

    bool operator==(const Error& other) const {
        return kind == other.kind && code == other.code && message == other.message;
    }

    std::string describe() const {
        return std::string(error_kind_name(kind)) + ": " + message;
    }
};

// =============================================================================
// Result<T, E> Type
// =============================================================================

template<typename T, typename E = Error>
class Result {
public:
    // Success constructor
    Result(T value) : data_(std::in_place_index<0>, std::move(value)) {}

    // Error constructor (from E or derived)
    template<typename Err, typename = std::enable_if_t<std::is_convertible_v<Err, E>>>
    Result(Err error) : data_(std::in_place_index<1>, E(std::move(error))) {}

    bool is_ok() const { return data_.index() == 0; }
    bool is_err() const { return data_.index() == 1; }

    explicit operator bool() const { return is_ok(); }

    // Access value (throws if error)
    T& value() & {
        if (is_err()) throw std::runtime_error("Result is error: " + error().message);
        return std::get<0>(data_);
    }

    const T& value() const& {
        if (is_err()) throw std::runtime_error("Result is error: " + error().message);
        return std::get<0>(data_);
    }

    T&& value() && {
        if (is_err()) throw std::runtime_error("Result is error: " + error().message);
        return std::get<0>(std::move(data_));
    }

    // Access error (throws if success)
    E& error() & {
        if (is_ok()) throw std::runtime_error("Result is ok, no error");
        return std::get<1>(data_);
    }

    const E& error() const& {
        if (is_ok()) throw std::runtime_error("Result is ok, no error");
        return std::get<1>(data_);
    }

    T value_or(T default_value) const& {
        return is_ok() ? std::get<0>(data_) : std::move(default_value);
    }

    T value_or(T default_value) && {
        return is_ok() ? std::get<0>(std::move(data_)) : std::move(default_value);
    }

    std::optional<E> err() const& {
        if (is_err()) return std::get<1>(data_);
        return std::nullopt;
    }

    // Map success value
    template<typename F>
    auto map(F&& f) const& -> Result<decltype(f(std::declval<T>())), E> {
        using U = decltype(f(std::declval<T>()));
        if (is_ok()) return Result<U, E>(f(std::get<0>(data_)));
        return Result<U, E>(std::get<1>(data_));
    }

private:
    std::variant<T, E> data_;
};

// =============================================================================
// Result<void, E> Specialization
// =============================================================================

template<typename E>
class Result<void, E> {
public:
    Result() : data_(std::monostate{}) {}

    template<typename Err, typename = std::enable_if_t<std::is_convertible_v<Err, E>>>
    Result(Err error) : data_(E(std::move(error))) {}

    bool is_ok() const { return std::holds_alternative<std::monostate>(data_); }
    bool is_err() const { return std::holds_alternative<E>(data_); }
    explicit operator bool() const { return is_ok(); }

    void value() const {
        if (is_err()) throw std::runtime_error("Result is error: " + error().message);
    }

    E& error() & {
        if (is_ok()) throw std::runtime_error("Result is ok, no error");
        return std::get<E>(data_);
    }

    const E& error() const& {
        if (is_ok()) throw std::runtime_error("Result is ok, no error");
        return std::get<E>(data_);
    }

    std::optional<E> err() const& {
        if (is_err()) return std::get<E>(data_);
        return std::nullopt;
    }

private:
    std::variant<std::monostate, E> data_;
};

// =============================================================================
// Helper Functions
// =============================================================================

template<typename T>
Result<std::decay_t<T>, Error> Ok(T&& value) {
    return Result<std::decay_t<T>, Error>(std::forward<T>(value));
}

inline Result<void, Error> Ok() {
    return Result<void, Error>();
}

template<typename T>
Result<T, Error> Err(ErrorKind kind, std::string message, int code = 0) {
    return Result<T, Error>(Error(kind, std::move(message), code));
}

// =============================================================================
// Macros for Early Return
// =============================================================================

// TRY macro: unwrap result or return error
// Usage: auto value = SS_TRY(some_function());
#define SS_TRY(expr) \
    ({ \
        auto _result = (expr); \
        if (_result.is_err()) return _result.error(); \
        std::move(_result).value(); \
    })

} // namespace smartscreen
