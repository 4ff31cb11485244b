#include "vault_error.hpp"
#include <format>
#include <utility>

const char* errorKindName(ErrorKind kind) {
    switch (kind) {
        case ErrorKind::NotFound: return "NotFoundError";
        case ErrorKind::NotADirectory: return "NotADirectoryError";
        case ErrorKind::PermissionDenied: return "PermissionDenied";
        case ErrorKind::InsufficientSpace: return "InsufficientSpaceError";
        case ErrorKind::CorruptArchive: return "CorruptArchiveError";
        case ErrorKind::EncryptionUnavailable: return "EncryptionUnavailableError";
        case ErrorKind::WrongPassword: return "WrongPasswordError";
        case ErrorKind::TooManyAttempts: return "TooManyAttemptsError";
        case ErrorKind::PathEscape: return "PathEscapeError";
        case ErrorKind::IoError: return "IoError";
        case ErrorKind::UnsupportedEntry: return "UnsupportedEntry";
    }
    return "UnknownError";
}

std::string VaultError::describe() const {
    switch (kind) {
        case ErrorKind::InsufficientSpace:
            return std::format("{}: {} (required {} bytes, available {} bytes, short by {} bytes)",
                               errorKindName(kind), message, required, available,
                               required > available ? required - available : 0);
        case ErrorKind::WrongPassword:
            return std::format("{}: {} ({} attempt(s) remaining)", errorKindName(kind), message, attemptsRemaining);
        default:
            return std::format("{}: {}", errorKindName(kind), message);
    }
}

VaultError makeError(ErrorKind kind, std::string message) {
    return VaultError{kind, std::move(message)};
}

VaultError makeSpaceError(std::uint64_t required, std::uint64_t available) {
    VaultError error{ErrorKind::InsufficientSpace, "Insufficient disk space at destination"};
    error.required = required;
    error.available = available;
    return error;
}
