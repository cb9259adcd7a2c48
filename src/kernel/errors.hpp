/**
 * RoyaOS Kernel Errors
 *
 * Recoverable failures are thrown as KernelError and turned into the
 * failure branch of the response envelope by the kernel. InvariantViolation
 * signals corrupted resource tracking and is never converted: it must take
 * the process down.
 */
#pragma once
#include <stdexcept>
#include <string>

namespace royaos::kernel {

enum class ErrorKind {
    SESSION_NOT_FOUND,
    PERMISSION_DENIED,
    QUOTA_EXCEEDED,
    INVALID_ARGUMENT,
    HANDLE_NOT_FOUND,
    TOOL_NOT_FOUND,
    CAPABILITY_NOT_FOUND,
    TOOL_EXECUTION_ERROR,
    SHUTDOWN_INCOMPLETE
};

inline const char* error_kind_to_string(ErrorKind kind) {
    switch (kind) {
        case ErrorKind::SESSION_NOT_FOUND:    return "SessionNotFound";
        case ErrorKind::PERMISSION_DENIED:    return "PermissionDenied";
        case ErrorKind::QUOTA_EXCEEDED:       return "QuotaExceeded";
        case ErrorKind::INVALID_ARGUMENT:     return "InvalidArgument";
        case ErrorKind::HANDLE_NOT_FOUND:     return "HandleNotFound";
        case ErrorKind::TOOL_NOT_FOUND:       return "ToolNotFound";
        case ErrorKind::CAPABILITY_NOT_FOUND: return "CapabilityNotFound";
        case ErrorKind::TOOL_EXECUTION_ERROR: return "ToolExecutionError";
        case ErrorKind::SHUTDOWN_INCOMPLETE:  return "ShutdownIncomplete";
        default: return "Unknown";
    }
}

class KernelError : public std::runtime_error {
public:
    KernelError(ErrorKind kind, const std::string& message)
        : std::runtime_error(message), kind_(kind) {}

    ErrorKind kind() const { return kind_; }

private:
    ErrorKind kind_;
};

class InvariantViolation : public std::logic_error {
public:
    explicit InvariantViolation(const std::string& message)
        : std::logic_error(message) {}
};

} // namespace royaos::kernel
