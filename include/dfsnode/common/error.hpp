#ifndef DFSNODE_COMMON_ERROR_HPP
#define DFSNODE_COMMON_ERROR_HPP

#include <cstdint>
#include <stdexcept>
#include <string>

namespace dfsnode {

enum class ErrorKind {
    SUCCESS = 0,
    INVALID_IDENTIFIER,
    INTEGRITY_MISMATCH,
    TRANSFER_TRUNCATED,
    TRANSFER_TIMEOUT,
    UNSUPPORTED_REQUEST,
    MALFORMED_REQUEST,
    FILE_NOT_FOUND,
    IO_FAILURE,
    CONNECTION_FAILED
};

inline const char* error_kind_to_string(ErrorKind kind) {
    switch (kind) {
        case ErrorKind::SUCCESS: return "Success";
        case ErrorKind::INVALID_IDENTIFIER: return "Invalid identifier";
        case ErrorKind::INTEGRITY_MISMATCH: return "File integrity check failed";
        case ErrorKind::TRANSFER_TRUNCATED: return "Transfer truncated";
        case ErrorKind::TRANSFER_TIMEOUT: return "Transfer timeout";
        case ErrorKind::UNSUPPORTED_REQUEST: return "Unsupported request";
        case ErrorKind::MALFORMED_REQUEST: return "Malformed request";
        case ErrorKind::FILE_NOT_FOUND: return "File not found";
        case ErrorKind::IO_FAILURE: return "I/O failure";
        case ErrorKind::CONNECTION_FAILED: return "Connection failed";
        default: return "Undefined error";
    }
}

// Base of every error raised by the node. Carries the taxonomy value so
// boundaries can convert it into an Outcome without string matching.
class NodeError : public std::runtime_error {
public:
    NodeError(ErrorKind kind, const std::string& message)
        : std::runtime_error(message), kind_(kind) {}

    ErrorKind kind() const { return kind_; }

private:
    ErrorKind kind_;
};

class InvalidIdentifier : public NodeError {
public:
    explicit InvalidIdentifier(const std::string& message)
        : NodeError(ErrorKind::INVALID_IDENTIFIER, "Invalid identifier: " + message) {}
};

class IntegrityMismatch : public NodeError {
public:
    explicit IntegrityMismatch(const std::string& message)
        : NodeError(ErrorKind::INTEGRITY_MISMATCH, "File integrity check failed: " + message) {}
};

class TransferTruncated : public NodeError {
public:
    explicit TransferTruncated(const std::string& message)
        : NodeError(ErrorKind::TRANSFER_TRUNCATED, "Transfer truncated: " + message) {}
};

class TransferTimeout : public NodeError {
public:
    explicit TransferTimeout(const std::string& message)
        : NodeError(ErrorKind::TRANSFER_TIMEOUT, "Transfer timeout: " + message) {}
};

class MalformedRequest : public NodeError {
public:
    explicit MalformedRequest(const std::string& message)
        : NodeError(ErrorKind::MALFORMED_REQUEST, "Malformed request: " + message) {}
};

class IOFailure : public NodeError {
public:
    explicit IOFailure(const std::string& message)
        : NodeError(ErrorKind::IO_FAILURE, "I/O failure: " + message) {}
};

class ConnectionFailed : public NodeError {
public:
    explicit ConnectionFailed(const std::string& message)
        : NodeError(ErrorKind::CONNECTION_FAILED, "Connection failed: " + message) {}
};

// Result of one transfer or request handling step
struct Outcome {
    ErrorKind kind = ErrorKind::SUCCESS;
    std::string message;
    uint64_t bytes_transferred = 0;

    bool ok() const { return kind == ErrorKind::SUCCESS; }

    static Outcome success(uint64_t bytes, const std::string& message = "") {
        return Outcome{ErrorKind::SUCCESS, message, bytes};
    }

    static Outcome failure(ErrorKind kind, const std::string& message, uint64_t bytes = 0) {
        return Outcome{kind, message, bytes};
    }
};

} // namespace dfsnode

#endif // DFSNODE_COMMON_ERROR_HPP
