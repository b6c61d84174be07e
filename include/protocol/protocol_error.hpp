#ifndef PCLOUD_PROTOCOL_ERROR_HPP
#define PCLOUD_PROTOCOL_ERROR_HPP

#include <stdexcept>
#include <string>

namespace pcloud {
namespace protocol {

enum class ErrorKind {
    MALFORMED_INPUT,
    AUTHENTICATION,
    INTEGRITY,
    NOT_FOUND,
    SANDBOX_VIOLATION,
    IO,
    TRANSPORT
};

inline const char* error_kind_to_string(ErrorKind kind) {
    switch (kind) {
        case ErrorKind::MALFORMED_INPUT: return "Malformed input";
        case ErrorKind::AUTHENTICATION: return "Authentication failure";
        case ErrorKind::INTEGRITY: return "Integrity failure";
        case ErrorKind::NOT_FOUND: return "Not found";
        case ErrorKind::SANDBOX_VIOLATION: return "Sandbox violation";
        case ErrorKind::IO: return "I/O failure";
        case ErrorKind::TRANSPORT: return "Transport failure";
        default: return "Undefined error";
    }
}

class ProtocolError : public std::runtime_error {
public:
    ProtocolError(ErrorKind kind, const std::string& message)
        : std::runtime_error(std::string(error_kind_to_string(kind)) + ": " + message)
        , kind_(kind) {}

    ErrorKind kind() const { return kind_; }

private:
    ErrorKind kind_;
};

class MalformedInputError : public ProtocolError {
public:
    explicit MalformedInputError(const std::string& message)
        : ProtocolError(ErrorKind::MALFORMED_INPUT, message) {}
};

class AuthenticationError : public ProtocolError {
public:
    explicit AuthenticationError(const std::string& message)
        : ProtocolError(ErrorKind::AUTHENTICATION, message) {}
};

class IntegrityError : public ProtocolError {
public:
    explicit IntegrityError(const std::string& message)
        : ProtocolError(ErrorKind::INTEGRITY, message) {}
};

class NotFoundError : public ProtocolError {
public:
    explicit NotFoundError(const std::string& message)
        : ProtocolError(ErrorKind::NOT_FOUND, message) {}
};

class SandboxViolationError : public ProtocolError {
public:
    explicit SandboxViolationError(const std::string& message)
        : ProtocolError(ErrorKind::SANDBOX_VIOLATION, message) {}
};

class IoError : public ProtocolError {
public:
    explicit IoError(const std::string& message)
        : ProtocolError(ErrorKind::IO, message) {}
};

class TransportError : public ProtocolError {
public:
    // Connection level failure, no status was received
    explicit TransportError(const std::string& message)
        : ProtocolError(ErrorKind::TRANSPORT, message)
        , status_(0) {}

    TransportError(unsigned status, const std::string& message)
        : ProtocolError(ErrorKind::TRANSPORT, "Server returned error status code: " +
                        std::to_string(status) + "\n" + message)
        , status_(status) {}

    unsigned status() const { return status_; }

private:
    unsigned status_;
};

} // namespace protocol
} // namespace pcloud

#endif // PCLOUD_PROTOCOL_ERROR_HPP
