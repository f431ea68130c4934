#pragma once

#include <stdexcept>
#include <string>
#include <utility>

namespace orderguard {

enum class ErrorKind {
    NONE,
    TRANSIENT_IO,
    VALIDATION_FAILURE,
    SAFETY_BLOCKED,
    PROGRAMMING_INVARIANT,
    CANCELLED
};

inline const char* errorKindToString(ErrorKind kind) {
    switch (kind) {
        case ErrorKind::NONE: return "NONE";
        case ErrorKind::TRANSIENT_IO: return "TRANSIENT_IO";
        case ErrorKind::VALIDATION_FAILURE: return "VALIDATION_FAILURE";
        case ErrorKind::SAFETY_BLOCKED: return "SAFETY_BLOCKED";
        case ErrorKind::PROGRAMMING_INVARIANT: return "PROGRAMMING_INVARIANT";
        case ErrorKind::CANCELLED: return "CANCELLED";
    }
    return "NONE";
}

class OrderGuardError : public std::runtime_error {
public:
    OrderGuardError(ErrorKind kind, const std::string& message)
        : std::runtime_error(message), kind_(kind) {}

    ErrorKind kind() const { return kind_; }

private:
    ErrorKind kind_;
};

class TransientIoError : public OrderGuardError {
public:
    explicit TransientIoError(const std::string& message)
        : OrderGuardError(ErrorKind::TRANSIENT_IO, message) {}
};

// Caller bug; not recoverable at runtime.
class InvariantViolation : public OrderGuardError {
public:
    explicit InvariantViolation(const std::string& message)
        : OrderGuardError(ErrorKind::PROGRAMMING_INVARIANT, message) {}
};

class CancelledError : public OrderGuardError {
public:
    explicit CancelledError(const std::string& message)
        : OrderGuardError(ErrorKind::CANCELLED, message) {}
};

// Validation outcome. Blocking never throws; it returns one of these.
struct CheckResult {
    bool allowed = true;
    ErrorKind kind = ErrorKind::NONE;
    std::string reason;

    static CheckResult pass() { return CheckResult{}; }

    static CheckResult block(ErrorKind kind, std::string reason) {
        CheckResult r;
        r.allowed = false;
        r.kind = kind;
        r.reason = std::move(reason);
        return r;
    }
};

} // namespace orderguard
