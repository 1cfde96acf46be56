#ifndef ROLLCALL_ERRORS_H
#define ROLLCALL_ERRORS_H

#include <stdexcept>
#include <string>

namespace rollcall {

// Every refused or skipped unit of work carries one of these
enum class ErrorKind {
    MissingSeparator,   // label has no '_'
    EmptyField,         // empty roll code or name
    InvalidRollCode,    // roll code outside [A-Za-z0-9_-]
    ValidationError,    // bad filter combination / out-of-range parameter
    DuplicateInBatch,
    NoUsableImages,
    ExtractionFailure,
    NotFound,
    DimensionMismatch,
    Cancelled,
    StoreError
};

inline const char* errorKindName(ErrorKind kind) {
    switch (kind) {
        case ErrorKind::MissingSeparator:  return "MissingSeparator";
        case ErrorKind::EmptyField:        return "EmptyField";
        case ErrorKind::InvalidRollCode:   return "InvalidRollCode";
        case ErrorKind::ValidationError:   return "ValidationError";
        case ErrorKind::DuplicateInBatch:  return "DuplicateInBatch";
        case ErrorKind::NoUsableImages:    return "NoUsableImages";
        case ErrorKind::ExtractionFailure: return "ExtractionFailure";
        case ErrorKind::NotFound:          return "NotFound";
        case ErrorKind::DimensionMismatch: return "DimensionMismatch";
        case ErrorKind::Cancelled:         return "Cancelled";
        case ErrorKind::StoreError:        return "StoreError";
    }
    return "Unknown";
}

// Base of all fatal errors surfaced to callers
class Error : public std::runtime_error {
public:
    Error(ErrorKind kind, const std::string& message)
        : std::runtime_error(message), kind_(kind) {}

    ErrorKind kind() const noexcept { return kind_; }

private:
    ErrorKind kind_;
};

class ValidationError : public Error {
public:
    explicit ValidationError(const std::string& message)
        : Error(ErrorKind::ValidationError, message) {}
};

// Image could not be decoded, model failed, or the per-call timeout expired
class ExtractionError : public Error {
public:
    explicit ExtractionError(const std::string& message)
        : Error(ErrorKind::ExtractionFailure, message) {}
};

class DimensionMismatchError : public Error {
public:
    DimensionMismatchError(size_t expected, size_t actual, const std::string& context)
        : Error(ErrorKind::DimensionMismatch,
                context + ": embedding dimension " + std::to_string(actual) +
                " does not match expected " + std::to_string(expected)),
          expected_(expected), actual_(actual) {}

    size_t expected() const noexcept { return expected_; }
    size_t actual() const noexcept { return actual_; }

private:
    size_t expected_;
    size_t actual_;
};

// Raised when the caller's cancel flag is observed mid-operation
class CancelledError : public Error {
public:
    explicit CancelledError(const std::string& message)
        : Error(ErrorKind::Cancelled, message) {}
};

class StoreError : public Error {
public:
    explicit StoreError(const std::string& message)
        : Error(ErrorKind::StoreError, message) {}
};

} // namespace rollcall

#endif // ROLLCALL_ERRORS_H
