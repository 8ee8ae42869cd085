#pragma once
#include <string>
#include <utility>

namespace ue {

enum class ErrorKind : int {
    None = 0,
    Format,
    Security,
    Integrity,
    OutOfBounds,
    Io,
    Cancelled,
};

inline const char* ErrorKindName(ErrorKind kind) {
    switch (kind) {
        case ErrorKind::None:        return "ok";
        case ErrorKind::Format:      return "FormatError";
        case ErrorKind::Security:    return "SecurityError";
        case ErrorKind::Integrity:   return "IntegrityError";
        case ErrorKind::OutOfBounds: return "OutOfBoundsError";
        case ErrorKind::Io:          return "IOError";
        case ErrorKind::Cancelled:   return "Cancelled";
    }
    return "Error";
}

struct Result {
    bool ok{true};
    ErrorKind kind{ErrorKind::None};
    int err{0};
    std::string msg;

    bool is_ok() const { return ok; }
    const std::string& message() const { return msg; }

    static Result Ok() { return {}; }
    static Result Fail(ErrorKind k, std::string m, int e = 0) {
        return {.ok = false, .kind = k, .err = e, .msg = std::move(m)};
    }

    static Result FormatError(std::string m) { return Fail(ErrorKind::Format, std::move(m)); }
    static Result SecurityError(std::string m) { return Fail(ErrorKind::Security, std::move(m)); }
    static Result IntegrityError(std::string m) { return Fail(ErrorKind::Integrity, std::move(m)); }
    static Result OutOfBounds(std::string m) { return Fail(ErrorKind::OutOfBounds, std::move(m)); }
    static Result IoError(int e, std::string m) { return Fail(ErrorKind::Io, std::move(m), e); }

    // Same failure, message prefixed with the caller's context.
    Result Context(const std::string& prefix) const {
        if (ok) return *this;
        return Fail(kind, prefix + ": " + msg, err);
    }
};

} // namespace ue
