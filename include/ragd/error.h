/**
 * @file error.h
 * @brief Error kinds and result type shared by the transport and HTTP layers
 */

#pragma once

#include <string>
#include <utility>

namespace ragd {

/**
 * @brief Classification of every failure the transport can surface
 */
enum class ErrorKind {
    NONE,
    PROTOCOL,              // Malformed length line, missing terminator, bad envelope
    FRAME_TOO_LARGE,       // Length prefix or payload above MAX_FRAME_SIZE
    TIMEOUT,               // Frame read timed out (retryable)
    UNEXPECTED_EOF,        // Peer closed in the middle of a frame (retryable)
    CONNECTION_CLOSED,     // Peer closed cleanly on a frame boundary
    HANDSHAKE_MISMATCH,    // Wrong protocol name or version in the ack
    CORRELATION_MISMATCH,  // Response token differs from the request token
    STREAM_INCOMPLETE,     // Stream ended before a terminal job snapshot
    STATUS,                // Non-success application status
    NETWORK_BLOCKED,       // Offline guard refused a non-loopback destination
    CANCELLED,
    DEADLINE_EXCEEDED,
    DECODE,
    IO,
    INVALID_ARGUMENT,
    CLIENT_CLOSED,
    CALLBACK
};

inline const char* to_string(ErrorKind kind) {
    switch (kind) {
        case ErrorKind::NONE: return "none";
        case ErrorKind::PROTOCOL: return "protocol";
        case ErrorKind::FRAME_TOO_LARGE: return "frame_too_large";
        case ErrorKind::TIMEOUT: return "timeout";
        case ErrorKind::UNEXPECTED_EOF: return "unexpected_eof";
        case ErrorKind::CONNECTION_CLOSED: return "connection_closed";
        case ErrorKind::HANDSHAKE_MISMATCH: return "handshake_mismatch";
        case ErrorKind::CORRELATION_MISMATCH: return "correlation_mismatch";
        case ErrorKind::STREAM_INCOMPLETE: return "stream_incomplete";
        case ErrorKind::STATUS: return "status";
        case ErrorKind::NETWORK_BLOCKED: return "network_blocked";
        case ErrorKind::CANCELLED: return "cancelled";
        case ErrorKind::DEADLINE_EXCEEDED: return "deadline_exceeded";
        case ErrorKind::DECODE: return "decode";
        case ErrorKind::IO: return "io";
        case ErrorKind::INVALID_ARGUMENT: return "invalid_argument";
        case ErrorKind::CLIENT_CLOSED: return "client_closed";
        case ErrorKind::CALLBACK: return "callback";
        default: return "unknown";
    }
}

/**
 * @brief Error value carried by Result<T>
 */
struct Error {
    ErrorKind kind = ErrorKind::NONE;
    std::string message;
    int status_code = 0;

    static Error none() { return Error{}; }

    static Error make(ErrorKind kind, std::string message, int status_code = 0) {
        Error err;
        err.kind = kind;
        err.message = std::move(message);
        err.status_code = status_code;
        return err;
    }

    bool ok() const { return kind == ErrorKind::NONE; }

    /**
     * @brief Only read timeouts and mid-frame EOF are worth another read
     */
    bool retryable() const {
        return kind == ErrorKind::TIMEOUT || kind == ErrorKind::UNEXPECTED_EOF;
    }

    /**
     * @brief Errors after which the connection can no longer be trusted
     */
    bool fatal() const {
        switch (kind) {
            case ErrorKind::PROTOCOL:
            case ErrorKind::FRAME_TOO_LARGE:
            case ErrorKind::HANDSHAKE_MISMATCH:
            case ErrorKind::CORRELATION_MISMATCH:
            case ErrorKind::IO:
            case ErrorKind::CONNECTION_CLOSED:
            case ErrorKind::UNEXPECTED_EOF:
            case ErrorKind::TIMEOUT:
            case ErrorKind::CANCELLED:
            case ErrorKind::DEADLINE_EXCEEDED:
            case ErrorKind::STREAM_INCOMPLETE:
                return true;
            default:
                return false;
        }
    }

    /**
     * @brief One-line diagnostic, e.g. "correlation_mismatch: got abc"
     */
    std::string to_string() const {
        std::string out = ragd::to_string(kind);
        if (status_code != 0) {
            out += " (" + std::to_string(status_code) + ")";
        }
        if (!message.empty()) {
            out += ": " + message;
        }
        return out;
    }
};

/**
 * @brief Value plus error; value is meaningful only when ok()
 */
template <typename T>
struct Result {
    T value{};
    Error error;

    bool ok() const { return error.ok(); }

    static Result success(T v) {
        Result r;
        r.value = std::move(v);
        return r;
    }

    static Result failure(Error err) {
        Result r;
        r.error = std::move(err);
        return r;
    }

    static Result failure(ErrorKind kind, std::string message, int status_code = 0) {
        return failure(Error::make(kind, std::move(message), status_code));
    }
};

} // namespace ragd
