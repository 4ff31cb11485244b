/**
 * @file vault_error.hpp
 * @brief Error taxonomy for FolderVault backup and restore operations.
 *
 * Fatal failures travel back to the caller as the error side of a std::expected.
 * Per-file and per-entry failures are recorded as RecordedError values and the
 * operation carries on with the next item.
 */

#ifndef VAULT_ERROR_HPP
#define VAULT_ERROR_HPP

#include <cstdint>
#include <string>

/**
 * @brief Kinds of failure an operation can report.
 */
enum class ErrorKind {
    NotFound,               ///< Source directory or archive is missing.
    NotADirectory,          ///< Source path exists but is not a directory.
    PermissionDenied,       ///< Access refused (fatal only on the root).
    InsufficientSpace,      ///< Destination volume too small (pre-flight).
    CorruptArchive,         ///< Structural or checksum failure in the container.
    EncryptionUnavailable,  ///< Encryption requested but unsupported here.
    WrongPassword,          ///< Password rejected for an encrypted entry.
    TooManyAttempts,        ///< Password retry cap exceeded.
    PathEscape,             ///< Entry would land outside the output directory.
    IoError,                ///< Read or write failure on a single item.
    UnsupportedEntry        ///< Entry type the engine does not restore.
};

/**
 * @brief Returns a stable, human-readable name for an error kind.
 */
const char* errorKindName(ErrorKind kind);

/**
 * @brief A fatal error returned by a pipeline stage.
 *
 * Diagnostic figures are filled only for the kinds that need them:
 * required/available for InsufficientSpace, attemptsRemaining for WrongPassword.
 */
struct VaultError {
    ErrorKind kind;                   ///< What went wrong.
    std::string message;              ///< Description without any secret material.
    std::uint64_t required = 0;       ///< Bytes needed (InsufficientSpace).
    std::uint64_t available = 0;      ///< Bytes free (InsufficientSpace).
    int attemptsRemaining = 0;        ///< Password attempts left (WrongPassword).

    /**
     * @brief Formats the error as "<Kind>: <message>" plus diagnostics.
     */
    std::string describe() const;
};

/**
 * @brief A per-item failure recorded while the pipeline keeps going.
 */
struct RecordedError {
    std::string path;   ///< Archive-relative path (or source path when no relative path exists).
    ErrorKind kind;     ///< Failure category.
    std::string reason; ///< Human-readable cause.
};

/**
 * @brief Builds a VaultError of the given kind.
 */
VaultError makeError(ErrorKind kind, std::string message);

/**
 * @brief Builds an InsufficientSpace error carrying both figures.
 */
VaultError makeSpaceError(std::uint64_t required, std::uint64_t available);

#endif // VAULT_ERROR_HPP
