/**
 * @file vault.hpp
 * @brief Backup and restore orchestration for FolderVault.
 *
 * Composes the directory walker, the space check, the archive writer/reader, progress
 * reporting and cancellation into the two entry points of the engine. Environment
 * capabilities (free space query, password collection, progress rendering, encryption
 * support) are injected through VaultEnvironment so the engine itself stays free of
 * terminal and platform specifics.
 */

#ifndef VAULT_HPP
#define VAULT_HPP

#include <expected>
#include <filesystem>
#include <functional>
#include <memory>
#include <optional>
#include "archive_reader.hpp"
#include "cancellation.hpp"
#include "encryption_context.hpp"
#include "progress_reporter.hpp"
#include "run_statistics.hpp"
#include "secret.hpp"
#include "space_checker.hpp"
#include "vault_config.hpp"
#include "vault_error.hpp"

/**
 * @brief Why the engine asks the collaborator for a password.
 */
enum class PasswordPurpose {
    Create,  ///< New password for an archive being written (collaborator should confirm it).
    Unlock   ///< Password for an existing encrypted archive.
};

/**
 * @brief Synchronous password hook implemented by the collaborator.
 *
 * @param purpose Create or Unlock.
 * @param attempt 1-based attempt number.
 * @param maxAttempts Retry cap of the running operation.
 * @return std::optional<Secret> The password, or std::nullopt when the user gave up.
 */
using PasswordRequest = std::function<std::optional<Secret>(PasswordPurpose purpose, int attempt, int maxAttempts)>;

/**
 * @brief Capabilities the engine consumes from its environment.
 */
struct VaultEnvironment {
    FreeSpaceProbe freeSpace = filesystemFreeSpace;       ///< Disk space query.
    PasswordRequest requestPassword;                      ///< Interactive password hook; may be empty.
    std::shared_ptr<ProgressReporter> reporter;           ///< Progress sink; null for none.
    bool encryptionAvailable = false;                     ///< Resolved once via encryptionSupported().
};

/**
 * @brief Inputs of a backup run.
 */
struct BackupRequest {
    std::filesystem::path sourceDir;                  ///< Directory to archive.
    std::optional<std::filesystem::path> outputPath;  ///< Archive path; defaults to defaultArchivePath().
    bool wantPassword = false;                        ///< Encrypt the archive.
};

/**
 * @brief Inputs of a restore run.
 */
struct RestoreRequest {
    std::filesystem::path archivePath;               ///< Archive to restore.
    std::optional<std::filesystem::path> outputDir;  ///< Target; defaults to defaultRestoreDir().
    std::optional<Secret> password;                  ///< Password given up front (counts as the first attempt).
};

/**
 * @brief Main orchestration class of the archive engine.
 *
 * Each call runs one operation to completion on the calling thread. Concurrent runs
 * against the same archive path are the caller's responsibility to avoid.
 */
class Vault {
public:
    /**
     * @brief Constructs an engine.
     *
     * @param config Validated configuration.
     * @param environment Injected capabilities.
     */
    Vault(VaultConfig config, VaultEnvironment environment);

    /**
     * @brief Archives a directory tree.
     *
     * Pre-flight (source validation, space check, encryption capability) runs before
     * anything is written. Unreadable files are recorded and skipped. On cancellation
     * or a fatal error the temporary archive is deleted, so no file ever appears at the
     * output path unless the run completed.
     *
     * @param request Source, destination and encryption choice.
     * @return std::expected<BackupReport, VaultError> The report (Completed,
     *         CompletedWithErrors or Cancelled) or the fatal error.
     */
    std::expected<BackupReport, VaultError> backup(BackupRequest request);

    /**
     * @brief Restores an archive into a directory.
     *
     * The archive is validated, unlocked and space-checked before the output directory
     * is touched. Entries extracted before a cancellation or a per-entry failure stay
     * on disk.
     *
     * @param request Archive, destination and optional password.
     * @return std::expected<RestoreReport, VaultError> The report or the fatal error.
     */
    std::expected<RestoreReport, VaultError> restore(RestoreRequest request);

    /**
     * @brief Token of the operation currently running, for programmatic cancellation.
     */
    const CancellationToken& currentToken() const { return token; }

private:
    std::expected<std::optional<Secret>, VaultError> collectNewPassword();
    std::expected<bool, VaultError> unlock(ArchiveReader& reader, EncryptionContext& encryption,
                                           std::optional<Secret> supplied);

    VaultConfig config;
    VaultEnvironment environment;
    CancellationToken token;
};

/**
 * @brief Default archive name: "<source-name>_DD-MM-YYYY_HH-MM.zip" next to the source.
 */
std::filesystem::path defaultArchivePath(const std::filesystem::path& sourceDir);

/**
 * @brief Default restore directory: the archive stem under the current directory.
 */
std::filesystem::path defaultRestoreDir(const std::filesystem::path& archivePath);

#endif // VAULT_HPP
