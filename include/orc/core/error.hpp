#pragma once

#include <string>

namespace orc {

/**
 * @brief Failure taxonomy shared by every component
 *
 * QueueFull and IrreconcilableConflict are reported to the host as-is.
 * TransportError is retried by the coordinator and becomes SyncFailed once
 * the retry bound is exhausted.
 */
enum class ErrorCode {
    QueueFull,
    TransportError,
    NotFound,
    SyncFailed,
    IrreconcilableConflict,
    StaleConflict,
    PassInProgress,
    Cancelled,
    InvalidTransition,
    InvalidState,
    StorageError,
    ConfigError
};

struct Error {
    ErrorCode code = ErrorCode::InvalidState;
    std::string message;

    Error() = default;
    Error(ErrorCode c, std::string msg) : code(c), message(std::move(msg)) {}
};

inline const char* to_string(ErrorCode code) {
    switch (code) {
        case ErrorCode::QueueFull: return "QueueFull";
        case ErrorCode::TransportError: return "TransportError";
        case ErrorCode::NotFound: return "NotFound";
        case ErrorCode::SyncFailed: return "SyncFailed";
        case ErrorCode::IrreconcilableConflict: return "IrreconcilableConflict";
        case ErrorCode::StaleConflict: return "StaleConflict";
        case ErrorCode::PassInProgress: return "PassInProgress";
        case ErrorCode::Cancelled: return "Cancelled";
        case ErrorCode::InvalidTransition: return "InvalidTransition";
        case ErrorCode::InvalidState: return "InvalidState";
        case ErrorCode::StorageError: return "StorageError";
        case ErrorCode::ConfigError: return "ConfigError";
    }
    return "Unknown";
}

inline std::string describe(const Error& error) {
    return std::string(to_string(error.code)) + ": " + error.message;
}

} // namespace orc
