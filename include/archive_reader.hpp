/**
 * @file archive_reader.hpp
 * @brief ZIP reader for the restore pipeline.
 *
 * open() validates the whole container before anything is extracted: the central
 * directory must be readable and, when checksum verification is on, every
 * unencrypted entry must pass its CRC check. Encrypted archives are unlocked with
 * verifyPassword(), which trial-decrypts the smallest encrypted entry, and then
 * checked with verifyEncryptedEntries() before extraction starts.
 *
 * @note Requires libarchive with ZIP support; AES-encrypted entries need a libarchive
 * built with a crypto backend.
 */

#ifndef ARCHIVE_READER_HPP
#define ARCHIVE_READER_HPP

#include <cstdint>
#include <expected>
#include <filesystem>
#include <optional>
#include <string>
#include <vector>
#include "archive_handle.hpp"
#include "cancellation.hpp"
#include "encryption_context.hpp"
#include "progress_reporter.hpp"
#include "run_statistics.hpp"
#include "vault_config.hpp"
#include "vault_error.hpp"

/**
 * @brief Result of a password trial.
 */
enum class PasswordCheck {
    Verified,
    Rejected
};

/**
 * @brief Reads one archive for one restore operation.
 */
class ArchiveReader {
public:
    /**
     * @brief Constructs an idle reader.
     *
     * @param config Chunk size, checksum policy, password retry cap, logging.
     */
    explicit ArchiveReader(const VaultConfig& config);

    ArchiveReader(const ArchiveReader&) = delete;
    ArchiveReader& operator=(const ArchiveReader&) = delete;

    /**
     * @brief Opens the archive and runs the structural pre-flight scan.
     *
     * @param archivePath ZIP file to restore from.
     * @param token When given, polled between entries; a cancelled scan fails with IoError.
     * @return std::expected<void, VaultError> Success, NotFound, or CorruptArchive.
     */
    std::expected<void, VaultError> open(const std::filesystem::path& archivePath,
                                         const CancellationToken* token = nullptr);

    /**
     * @brief True when at least one entry is encrypted. Needs no password.
     */
    bool detectEncryption() const;

    /**
     * @brief Trial-decrypts the smallest encrypted entry with encryption.password.
     *
     * Marks encryption.verified on success. Each call counts as one attempt; once the
     * configured cap is used up, further calls fail with TooManyAttempts before any
     * decryption is tried. The cap is per reader, so per restore operation.
     *
     * @param encryption Context carrying the candidate password.
     * @return std::expected<PasswordCheck, VaultError> Verified or Rejected, or
     *         TooManyAttempts / CorruptArchive.
     */
    std::expected<PasswordCheck, VaultError> verifyPassword(EncryptionContext& encryption);

    /**
     * @brief Authenticated read of every encrypted entry with the verified password.
     *
     * Runs only when checksum verification is on. A failed HMAC or CRC check is a
     * CorruptArchive error, reported before any file is extracted.
     *
     * @param encryption Verified context.
     * @param token When given, polled between entries; a cancelled check fails with IoError.
     */
    std::expected<void, VaultError> verifyEncryptedEntries(const EncryptionContext& encryption,
                                                           const CancellationToken* token = nullptr);

    int attemptsUsed() const { return attempts; }
    int attemptsRemaining() const;

    /**
     * @brief Extracts every entry in archive order under destinationRoot.
     *
     * Per-entry failures (path escape, write errors, authentication failures) are
     * recorded and skipped. An entry whose real target would leave destinationRoot
     * through an existing symbolic link is a path escape too. Cancellation is polled between entries, so a cancelled run
     * leaves exactly the entries completed so far.
     *
     * @param destinationRoot Output directory, created when missing.
     * @param encryption Verified context for encrypted archives.
     * @param token Cancellation token of the running operation.
     * @param progress Optional throttled progress sink.
     * @return std::expected<RunStatistics, VaultError> Final counters, or a fatal error.
     *         statistics() still holds the partial counters after a fatal error.
     */
    std::expected<RunStatistics, VaultError> extractAll(const std::filesystem::path& destinationRoot,
                                                        const EncryptionContext& encryption,
                                                        const CancellationToken& token,
                                                        ProgressThrottle* progress = nullptr);

    /**
     * @brief Entries found by the pre-flight scan, in archive order.
     */
    const std::vector<ArchiveEntry>& entries() const { return scanned; }

    /**
     * @brief Number of regular file entries.
     */
    std::uint64_t fileCount() const;

    /**
     * @brief Sum of the uncompressed sizes of all entries.
     */
    std::uint64_t totalUncompressedSize() const;

    const RunStatistics& statistics() const { return stats; }

    /**
     * @brief Resolves an entry name below root, or std::nullopt when it would escape.
     *
     * Absolute names and names with ".." components are always rejected.
     */
    static std::optional<std::filesystem::path> resolveInside(const std::filesystem::path& root,
                                                              const std::string& entryName);

private:
    std::expected<ArchiveHandle, VaultError> openHandle(const EncryptionContext* encryption) const;
    std::expected<void, VaultError> drainEntry(ArchiveHandle& handle, const std::string& name);

    const VaultConfig& config;
    std::filesystem::path archivePath;
    std::vector<ArchiveEntry> scanned;
    std::vector<bool> directories;
    std::vector<bool> regularFiles;
    std::vector<char> buffer;
    RunStatistics stats;
    int attempts = 0;
    bool opened = false;
};

#endif // ARCHIVE_READER_HPP
