/**
 * @file archive_writer.hpp
 * @brief Streaming ZIP writer for the backup pipeline.
 *
 * Entries are deflated (and AES-encrypted when requested) into a temporary file next
 * to the requested output. finalize() writes the central directory and renames the
 * temporary file into place; abort() deletes it. Either way nothing partial is ever
 * visible at the output path.
 *
 * @note Requires libarchive. AES encryption additionally needs a libarchive built
 * with a crypto backend (OpenSSL, Nettle or mbed TLS).
 */

#ifndef ARCHIVE_WRITER_HPP
#define ARCHIVE_WRITER_HPP

#include <cstdint>
#include <expected>
#include <filesystem>
#include <set>
#include <string>
#include <vector>
#include "archive_handle.hpp"
#include "cancellation.hpp"
#include "encryption_context.hpp"
#include "run_statistics.hpp"
#include "vault_config.hpp"
#include "vault_error.hpp"

/**
 * @brief Writes one archive for one backup operation.
 *
 * Neither copyable nor movable: the writer owns the temporary file and deletes it in
 * its destructor unless finalize() succeeded.
 */
class ArchiveWriter {
public:
    /**
     * @brief Constructs an idle writer.
     *
     * @param config Chunk size, compression level, encryption method, temp suffix, logging.
     */
    explicit ArchiveWriter(const VaultConfig& config);

    ArchiveWriter(const ArchiveWriter&) = delete;
    ArchiveWriter& operator=(const ArchiveWriter&) = delete;

    /**
     * @brief Aborts the archive if it was opened but never finalized.
     */
    ~ArchiveWriter();

    /**
     * @brief Starts a new archive destined for outputPath.
     *
     * @param outputPath Final archive location.
     * @param encryption Encryption settings; the password is handed to libarchive only.
     * @return std::expected<void, VaultError> Success, EncryptionUnavailable when encryption
     *         is requested but unsupported, or IoError when the temporary file cannot be created.
     */
    std::expected<void, VaultError> open(const std::filesystem::path& outputPath, const EncryptionContext& encryption);

    /**
     * @brief Streams one source file into a new entry.
     *
     * Polls token between chunks and stops early once it is cancelled; the caller is
     * expected to abort() the whole archive in that case.
     *
     * @param sourcePath File on disk.
     * @param relativePath Archive path of the entry; must be unique within the archive.
     * @param token Cancellation token of the running operation.
     * @return std::expected<ArchiveEntry, VaultError> The written entry, or the per-file failure.
     *         When healthy() turns false afterwards the archive itself is broken.
     */
    std::expected<ArchiveEntry, VaultError> add(const std::filesystem::path& sourcePath,
                                                const std::string& relativePath,
                                                const CancellationToken& token);

    /**
     * @brief Writes the trailer and moves the temporary file to the output path.
     *
     * @return std::expected<std::uint64_t, VaultError> Final archive size in bytes, or the
     *         failure (the temporary file is removed).
     */
    std::expected<std::uint64_t, VaultError> finalize();

    /**
     * @brief Releases the archive and deletes the temporary file. Idempotent.
     */
    void abort();

    /**
     * @brief False once a write into the container itself failed.
     */
    bool healthy() const { return writable; }

    bool isOpen() const { return static_cast<bool>(handle); }

    const std::filesystem::path& temporaryPath() const { return tempPath; }

    /**
     * @brief Entries written so far, in archive order.
     */
    const std::vector<ArchiveEntry>& entries() const { return written; }

private:
    std::expected<void, VaultError> configure(const EncryptionContext& encryption);

    const VaultConfig& config;
    ArchiveHandle handle;
    std::filesystem::path outputPath;
    std::filesystem::path tempPath;
    std::set<std::string> names;
    std::vector<ArchiveEntry> written;
    std::vector<char> buffer;
    bool encrypted = false;
    bool writable = true;
};

#endif // ARCHIVE_WRITER_HPP
