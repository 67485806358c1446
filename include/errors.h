#pragma once

#include <string>
#include <variant>
#include <optional>
#include <stdexcept>

namespace voicekit {

/**
 * @brief Error types for different failure modes
 */
enum class ErrorType {
    None,
    InvalidState,      ///< start while listening, stop while idle
    InvalidArgument,   ///< ListeningOptions or config values out of range
    EngineError,       ///< Failure surfaced by the recognition engine or stream
    RoutingError,      ///< Audio routing apply/restore failure
    AudioDeviceError,  ///< Input tap could not be installed
    ConfigError,       ///< Config file unreadable or malformed
    Unknown
};

/**
 * @brief Error information structure
 */
struct Error {
    ErrorType type = ErrorType::None;
    std::string message;

    Error() = default;
    Error(ErrorType t, const std::string& msg) : type(t), message(msg) {}

    bool is_error() const { return type != ErrorType::None; }
    operator bool() const { return is_error(); }
};

/// Error as reported to event subscribers
using VoiceError = Error;

/**
 * @brief Result type for operations that can fail
 *
 * Holds either a value of type T or an Error.
 */
template<typename T>
class Result {
public:
    // Construct from value (success)
    Result(const T& value) : data_(value) {}
    Result(T&& value) : data_(std::move(value)) {}

    // Construct from error
    Result(const Error& error) : data_(error) {}
    Result(Error&& error) : data_(std::move(error)) {}

    bool is_ok() const {
        return std::holds_alternative<T>(data_);
    }

    bool is_error() const {
        return std::holds_alternative<Error>(data_);
    }

    // Get value (throws if error)
    const T& value() const {
        if (!is_ok()) {
            throw std::runtime_error("Result is error, cannot get value");
        }
        return std::get<T>(data_);
    }

    T& value() {
        if (!is_ok()) {
            throw std::runtime_error("Result is error, cannot get value");
        }
        return std::get<T>(data_);
    }

    // Get error (throws if success)
    const Error& error() const {
        if (is_ok()) {
            throw std::runtime_error("Result is success, cannot get error");
        }
        return std::get<Error>(data_);
    }

    T value_or(const T& default_value) const {
        return is_ok() ? std::get<T>(data_) : default_value;
    }

    explicit operator bool() const {
        return is_ok();
    }

private:
    std::variant<T, Error> data_;
};

// Specialization for void (success/failure only)
template<>
class Result<void> {
public:
    Result() : is_ok_(true) {}
    Result(const Error& error) : is_ok_(false), error_(error) {}
    Result(Error&& error) : is_ok_(false), error_(std::move(error)) {}

    bool is_ok() const { return is_ok_; }
    bool is_error() const { return !is_ok_; }
    const Error& error() const { return error_; }

    explicit operator bool() const { return is_ok_; }

private:
    bool is_ok_;
    Error error_;
};

using VoidResult = Result<void>;

// Helper functions for creating errors
inline Error make_error(ErrorType type, const std::string& message) {
    return Error(type, message);
}

inline Error make_invalid_state_error(const std::string& message) {
    return Error(ErrorType::InvalidState, message);
}

inline Error make_invalid_argument_error(const std::string& message) {
    return Error(ErrorType::InvalidArgument, message);
}

inline Error make_engine_error(const std::string& message) {
    return Error(ErrorType::EngineError, message);
}

inline Error make_routing_error(const std::string& message) {
    return Error(ErrorType::RoutingError, message);
}

inline Error make_audio_device_error(const std::string& message) {
    return Error(ErrorType::AudioDeviceError, message);
}

inline Error make_config_error(const std::string& message) {
    return Error(ErrorType::ConfigError, message);
}

inline Error make_unknown_error(const std::string& message = "An unknown error occurred") {
    return Error(ErrorType::Unknown, message);
}

inline const char* error_type_to_string(ErrorType type) {
    switch (type) {
        case ErrorType::None: return "None";
        case ErrorType::InvalidState: return "InvalidState";
        case ErrorType::InvalidArgument: return "InvalidArgument";
        case ErrorType::EngineError: return "EngineError";
        case ErrorType::RoutingError: return "RoutingError";
        case ErrorType::AudioDeviceError: return "AudioDeviceError";
        case ErrorType::ConfigError: return "ConfigError";
        case ErrorType::Unknown: return "Unknown";
    }
    return "Unknown";
}

} // namespace voicekit
