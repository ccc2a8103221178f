#pragma once

#include <string>
#include <stdexcept>

enum class ErrorKind {
    IO,                     // file unreadable / unwritable
    Copy,                   // copy call itself failed
    Integrity,              // post-copy digest mismatch
    CollisionExhausted,     // name probing exceeded its bound
    RemoteFailure,          // external tool returned non-zero
    StateCorruption,        // persisted record malformed
    Config,                 // missing or invalid configuration
};

inline const char* error_kind_name(ErrorKind kind) {
    switch (kind) {
        case ErrorKind::IO:                 return "IOError";
        case ErrorKind::Copy:               return "CopyError";
        case ErrorKind::Integrity:          return "IntegrityError";
        case ErrorKind::CollisionExhausted: return "CollisionExhausted";
        case ErrorKind::RemoteFailure:      return "RemoteFailure";
        case ErrorKind::StateCorruption:    return "StateCorruption";
        case ErrorKind::Config:             return "ConfigError";
    }
    return "Error";
}

class PipelineError : public std::runtime_error {
public:
    PipelineError(ErrorKind kind, const std::string& message)
        : std::runtime_error(message), kind_(kind) {}

    ErrorKind kind() const { return kind_; }

private:
    ErrorKind kind_;
};
