#pragma once
// Errors: the taxonomy every engine operation reports through
//
// User errors (bad id, bad path, bad pattern, bad argument) and load
// failures are distinct from InternalError, which marks a broken invariant
// in a graph that already passed load-time validation.

#include <stdexcept>
#include <string>

namespace arbor {

enum class ErrorKind {
    LoadError,         // Source unreadable, malformed, or load timed out
    NotLoaded,         // Unknown or evicted model identifier
    ElementNotFound,   // Element path does not resolve
    InvalidPattern,    // Search pattern fails to compile
    InvalidDirection,  // Chain direction is not incoming/outgoing
    InvalidArgument,   // Any other malformed query parameter
    NotFound,          // Scope path does not resolve
    InternalError      // Defect: invariant violated after load
};

inline const char* error_kind_to_string(ErrorKind kind) {
    switch (kind) {
        case ErrorKind::LoadError: return "LoadError";
        case ErrorKind::NotLoaded: return "NotLoaded";
        case ErrorKind::ElementNotFound: return "ElementNotFound";
        case ErrorKind::InvalidPattern: return "InvalidPattern";
        case ErrorKind::InvalidDirection: return "InvalidDirection";
        case ErrorKind::InvalidArgument: return "InvalidArgument";
        case ErrorKind::NotFound: return "NotFound";
        case ErrorKind::InternalError: return "InternalError";
    }
    return "InternalError";
}

class Error : public std::runtime_error {
public:
    Error(ErrorKind kind, const std::string& message)
        : std::runtime_error(message)
        , kind_(kind) {}

    ErrorKind kind() const noexcept { return kind_; }

    // True for errors caused by caller input rather than by a defect
    bool is_user_error() const noexcept { return kind_ != ErrorKind::InternalError; }

private:
    ErrorKind kind_;
};

} // namespace arbor
