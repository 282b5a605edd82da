// Result.hpp
#pragma once
#include <string>
#include <utility>

enum class ErrorCode {
    None,
    Protocol,           // malformed frame, session must abort
    IncompleteFrame,    // stream ended mid-frame
    ConnectionClosed,   // clean close at a frame boundary
    UnsupportedVersion,
    DiffApplication,
    ChecksumMismatch,
    UpdateRejected,     // well-formed frame whose update cannot be accepted
    Io,
    Editor
};

template<typename T>
struct Result {
    bool success;
    ErrorCode code;
    std::string message;
    T data;

    static Result<T> Ok(const T& data) {
        return {true, ErrorCode::None, "", data};
    }

    static Result<T> Ok(T&& data) {
        return {true, ErrorCode::None, "", std::move(data)};
    }

    static Result<T> Error(ErrorCode code, const std::string& msg) {
        return {false, code, msg, T{}};
    }

    // carry the failure of another result into this one
    template<typename U>
    static Result<T> From(const Result<U>& other) {
        return {false, other.code, other.message, T{}};
    }
};

// Specialization for void
template<>
struct Result<void> {
    bool success;
    ErrorCode code;
    std::string message;

    static Result<void> Ok() {
        return {true, ErrorCode::None, ""};
    }

    static Result<void> Error(ErrorCode code, const std::string& msg) {
        return {false, code, msg};
    }

    template<typename U>
    static Result<void> From(const Result<U>& other) {
        return {false, other.code, other.message};
    }
};

inline const char* errorCodeName(ErrorCode code) {
    switch (code) {
    case ErrorCode::None: return "ok";
    case ErrorCode::Protocol: return "protocol error";
    case ErrorCode::IncompleteFrame: return "incomplete frame";
    case ErrorCode::ConnectionClosed: return "connection closed";
    case ErrorCode::UnsupportedVersion: return "unsupported version";
    case ErrorCode::DiffApplication: return "diff application error";
    case ErrorCode::ChecksumMismatch: return "checksum mismatch";
    case ErrorCode::UpdateRejected: return "update rejected";
    case ErrorCode::Io: return "i/o error";
    case ErrorCode::Editor: return "editor error";
    }
    return "unknown error";
}
