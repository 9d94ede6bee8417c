#pragma once

#include <string>
#include <functional>

// Failure categories surfaced by every engine operation.
enum class ErrorKind {
    None,
    Auth,
    Network,
    Timeout,
    Channel,
    Discovery,
    TunnelConflict,
    TunnelAllocation,
    Capability,
    Config,
    Io,
};

inline const char* error_kind_name(ErrorKind kind) {
    switch (kind) {
        case ErrorKind::None:             return "Ok";
        case ErrorKind::Auth:             return "AuthError";
        case ErrorKind::Network:          return "NetworkError";
        case ErrorKind::Timeout:          return "TimeoutError";
        case ErrorKind::Channel:          return "ChannelError";
        case ErrorKind::Discovery:        return "DiscoveryError";
        case ErrorKind::TunnelConflict:   return "TunnelConflictError";
        case ErrorKind::TunnelAllocation: return "TunnelAllocationError";
        case ErrorKind::Capability:       return "CapabilityError";
        case ErrorKind::Config:           return "ConfigError";
        case ErrorKind::Io:               return "IoError";
    }
    return "UnknownError";
}

// Result type for operations that can fail
template <typename T>
struct Result {
    bool success;
    T value;
    std::string error;
    ErrorKind kind = ErrorKind::None;

    static Result<T> Ok(T val) {
        return {true, std::move(val), "", ErrorKind::None};
    }

    static Result<T> Err(ErrorKind kind, const std::string& err) {
        return {false, T{}, err, kind};
    }

    // Carry the failure of another result forward
    template <typename U>
    static Result<T> Err(const Result<U>& other) {
        return {false, T{}, other.error, other.kind};
    }

    bool is_ok() const { return success; }
    bool is_err() const { return !success; }

    // "ChannelError: channel limit reached"
    std::string describe() const {
        return std::string(error_kind_name(kind)) + ": " + error;
    }
};

// Specialization for void
template <>
struct Result<void> {
    bool success;
    std::string error;
    ErrorKind kind = ErrorKind::None;

    static Result<void> Ok() {
        return {true, "", ErrorKind::None};
    }

    static Result<void> Err(ErrorKind kind, const std::string& err) {
        return {false, err, kind};
    }

    template <typename U>
    static Result<void> Err(const Result<U>& other) {
        return {false, other.error, other.kind};
    }

    bool is_ok() const { return success; }
    bool is_err() const { return !success; }

    std::string describe() const {
        return std::string(error_kind_name(kind)) + ": " + error;
    }
};

// Raw output of a remote command
struct CommandResult {
    int exit_code = -1;
    std::string stdout_data;
    std::string stderr_data;

    bool success() const { return exit_code == 0; }
    bool failed() const { return exit_code != 0; }

    std::string get_output() const {
        return stdout_data.empty() ? stderr_data : stdout_data;
    }
};

// Status callback for operations
using StatusCallback = std::function<void(const std::string&)>;
