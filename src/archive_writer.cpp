/**
 * @file archive_writer.cpp
 * @brief ZIP archive writer implementation for FolderVault.
 *
 * Streams files into deflated (optionally AES-encrypted) ZIP entries with libarchive
 * and publishes the archive with an atomic rename.
 */

#include "archive_writer.hpp"
#include <archive.h>
#include <archive_entry.h>
#include <cerrno>
#include <cstring>
#include <format>
#include <fstream>
#include <memory>
#include <sys/stat.h>

namespace fs = std::filesystem;

namespace {

struct EntryDeleter {
    void operator()(struct archive_entry* entry) const { archive_entry_free(entry); }
};
using EntryPtr = std::unique_ptr<struct archive_entry, EntryDeleter>;

ErrorKind kindForErrno(int err) {
    switch (err) {
        case ENOENT: return ErrorKind::NotFound;
        case EACCES:
        case EPERM: return ErrorKind::PermissionDenied;
        default: return ErrorKind::IoError;
    }
}

bool isSafeEntryName(const std::string& name) {
    if (name.empty() || name.front() == '/') {
        return false;
    }
    for (const auto& part : fs::path(name)) {
        if (part == "..") {
            return false;
        }
    }
    return true;
}

} // namespace

ArchiveWriter::ArchiveWriter(const VaultConfig& config) : config(config), buffer(config.chunkSize) {}

ArchiveWriter::~ArchiveWriter() {
    if (isOpen()) {
        abort();
    }
}

std::expected<void, VaultError> ArchiveWriter::configure(const EncryptionContext& encryption) {
    struct archive* a = handle.get();
    if (archive_write_set_format_zip(a) != ARCHIVE_OK) {
        return std::unexpected(makeError(ErrorKind::IoError,
                                         std::format("Failed to select ZIP format: {}", handle.lastError())));
    }
    // Unpadded output: the archive size on disk is exactly what the format wrote.
    archive_write_set_bytes_in_last_block(a, 1);

    if (archive_write_set_format_option(a, "zip", "compression", "deflate") != ARCHIVE_OK) {
        return std::unexpected(makeError(ErrorKind::IoError,
                                         std::format("Failed to enable deflate: {}", handle.lastError())));
    }
    std::string level = std::to_string(config.compressionLevel);
    if (archive_write_set_format_option(a, "zip", "compression-level", level.c_str()) != ARCHIVE_OK) {
        config.logError(std::format("Warning: compression level {} not supported by libarchive, using its default.",
                                    config.compressionLevel));
    }

    if (encryption.enabled) {
        if (archive_write_set_format_option(a, "zip", "encryption", config.encryption.c_str()) != ARCHIVE_OK) {
            return std::unexpected(makeError(ErrorKind::EncryptionUnavailable,
                                             std::format("libarchive cannot encrypt with {}: {}",
                                                         config.encryption, handle.lastError())));
        }
        if (archive_write_set_passphrase(a, encryption.password.reveal()) != ARCHIVE_OK) {
            return std::unexpected(makeError(ErrorKind::EncryptionUnavailable,
                                             "libarchive rejected the archive password"));
        }
    }
    return {};
}

std::expected<void, VaultError> ArchiveWriter::open(const fs::path& requestedPath, const EncryptionContext& encryption) {
    if (isOpen()) {
        return std::unexpected(makeError(ErrorKind::IoError, "Archive writer is already open"));
    }
    if (encryption.enabled && !encryption.available) {
        return std::unexpected(makeError(ErrorKind::EncryptionUnavailable,
                                         "Encryption was requested but this libarchive build cannot encrypt ZIP archives"));
    }
    if (encryption.enabled && encryption.password.empty()) {
        return std::unexpected(makeError(ErrorKind::EncryptionUnavailable, "An empty password cannot encrypt an archive"));
    }

    std::error_code ec;
    outputPath = fs::absolute(requestedPath, ec).lexically_normal();
    if (ec) {
        outputPath = requestedPath;
    }
    tempPath = outputPath;
    tempPath += config.tempSuffix;

    if (outputPath.has_parent_path()) {
        fs::create_directories(outputPath.parent_path(), ec);
        if (ec) {
            return std::unexpected(makeError(ErrorKind::IoError,
                                             std::format("Failed to create output directory {}: {}",
                                                         outputPath.parent_path().string(), ec.message())));
        }
    }
    fs::remove(tempPath, ec);

    handle = ArchiveHandle::forWrite();
    if (!handle) {
        return std::unexpected(makeError(ErrorKind::IoError, "Failed to allocate libarchive writer"));
    }
    if (auto configured = configure(encryption); !configured) {
        handle.reset();
        return configured;
    }

    if (archive_write_open_filename(handle.get(), tempPath.c_str()) != ARCHIVE_OK) {
        auto error = makeError(ErrorKind::IoError,
                               std::format("Failed to open archive file: {} (error: {})", tempPath.string(), handle.lastError()));
        handle.reset();
        fs::remove(tempPath, ec);
        return std::unexpected(error);
    }

    encrypted = encryption.enabled;
    writable = true;
    names.clear();
    written.clear();
    config.logMessage(std::format("Writing archive {} (temporary file {})", outputPath.string(), tempPath.string()));
    return {};
}

std::expected<ArchiveEntry, VaultError> ArchiveWriter::add(const fs::path& sourcePath,
                                                           const std::string& relativePath,
                                                           const CancellationToken& token) {
    if (!isOpen() || !writable) {
        return std::unexpected(makeError(ErrorKind::IoError, "Archive is not open for writing"));
    }
    if (!isSafeEntryName(relativePath)) {
        return std::unexpected(makeError(ErrorKind::PathEscape, std::format("Invalid entry name: {}", relativePath)));
    }
    if (names.contains(relativePath)) {
        return std::unexpected(makeError(ErrorKind::IoError, std::format("Duplicate entry name: {}", relativePath)));
    }

    std::ifstream file(sourcePath, std::ios::binary);
    if (!file) {
        int err = errno;
        return std::unexpected(makeError(kindForErrno(err),
                                         std::format("Failed to open file: {} (error: {})", sourcePath.string(), std::strerror(err))));
    }
    struct stat st;
    if (::stat(sourcePath.c_str(), &st) != 0) {
        int err = errno;
        return std::unexpected(makeError(kindForErrno(err),
                                         std::format("Failed to stat file: {} (error: {})", sourcePath.string(), std::strerror(err))));
    }
    if (!S_ISREG(st.st_mode)) {
        return std::unexpected(makeError(ErrorKind::UnsupportedEntry,
                                         std::format("Not a regular file: {}", sourcePath.string())));
    }

    EntryPtr entry(archive_entry_new());
    archive_entry_copy_stat(entry.get(), &st);
    archive_entry_copy_pathname(entry.get(), relativePath.c_str());

    struct archive* a = handle.get();
    la_int64_t before = archive_filter_bytes(a, 0);

    int r = archive_write_header(a, entry.get());
    if (r == ARCHIVE_WARN) {
        config.logError(std::format("Warning: {}: {}", relativePath, handle.lastError()));
    } else if (r != ARCHIVE_OK) {
        writable = r != ARCHIVE_FATAL;
        return std::unexpected(makeError(ErrorKind::IoError,
                                         std::format("Failed to write entry header for {}: {}", relativePath, handle.lastError())));
    }
    names.insert(relativePath);

    std::uint64_t total = 0;
    while (file) {
        if (token.cancelled()) {
            return std::unexpected(makeError(ErrorKind::IoError, std::format("Interrupted while writing {}", relativePath)));
        }
        file.read(buffer.data(), static_cast<std::streamsize>(buffer.size()));
        std::streamsize n = file.gcount();
        if (n <= 0) {
            break;
        }
        la_ssize_t w = archive_write_data(a, buffer.data(), static_cast<size_t>(n));
        if (w < 0) {
            writable = false;
            return std::unexpected(makeError(ErrorKind::IoError,
                                             std::format("Failed to write data for {}: {}", relativePath, handle.lastError())));
        }
        total += static_cast<std::uint64_t>(w);
    }
    bool readFailed = file.bad();

    r = archive_write_finish_entry(a);
    if (r == ARCHIVE_FATAL) {
        writable = false;
        return std::unexpected(makeError(ErrorKind::IoError,
                                         std::format("Failed to finish entry {}: {}", relativePath, handle.lastError())));
    }
    if (readFailed) {
        // Entry stays in the container with the bytes read so far.
        return std::unexpected(makeError(ErrorKind::IoError,
                                         std::format("Read error after {} bytes of {}; entry truncated",
                                                     total, sourcePath.string())));
    }

    la_int64_t after = archive_filter_bytes(a, 0);
    ArchiveEntry archived{relativePath, total,
                               after > before ? static_cast<std::uint64_t>(after - before) : 0, encrypted};
    written.push_back(archived);
    return archived;
}

std::expected<std::uint64_t, VaultError> ArchiveWriter::finalize() {
    if (!isOpen()) {
        return std::unexpected(makeError(ErrorKind::IoError, "Archive is not open"));
    }
    std::error_code ec;
    if (!writable) {
        abort();
        return std::unexpected(makeError(ErrorKind::IoError, "Archive is damaged and was discarded"));
    }

    std::string closeError;
    if (handle.close(&closeError) != ARCHIVE_OK) {
        fs::remove(tempPath, ec);
        return std::unexpected(makeError(ErrorKind::IoError,
                                         std::format("Failed to finalize archive {}: {}", tempPath.string(), closeError)));
    }

    fs::rename(tempPath, outputPath, ec);
    if (ec) {
        auto error = makeError(ErrorKind::IoError,
                               std::format("Failed to move {} to {}: {}", tempPath.string(), outputPath.string(), ec.message()));
        fs::remove(tempPath, ec);
        return std::unexpected(error);
    }

    auto size = fs::file_size(outputPath, ec);
    if (ec) {
        return std::unexpected(makeError(ErrorKind::IoError,
                                         std::format("Failed to read archive size of {}: {}", outputPath.string(), ec.message())));
    }
    config.logMessage(std::format("Archive finalized: {} ({} entries)", outputPath.string(), written.size()));
    return static_cast<std::uint64_t>(size);
}

void ArchiveWriter::abort() {
    handle.reset();
    if (tempPath.empty()) {
        return;
    }
    std::error_code ec;
    if (fs::remove(tempPath, ec)) {
        config.logMessage(std::format("Incomplete archive removed: {}", tempPath.string()));
    } else if (ec) {
        config.logError(std::format("Failed to remove incomplete archive {}: {}", tempPath.string(), ec.message()));
    }
}
