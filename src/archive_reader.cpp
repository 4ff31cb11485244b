/**
 * @file archive_reader.cpp
 * @brief ZIP archive reader implementation for FolderVault.
 *
 * Pre-flight validation, password verification and chunked extraction on top of
 * libarchive's seekable ZIP reader.
 */

#include "archive_reader.hpp"
#include <archive.h>
#include <archive_entry.h>
#include <algorithm>
#include <cerrno>
#include <cstring>
#include <format>
#include <fstream>
#include <utility>

namespace fs = std::filesystem;

namespace {

constexpr size_t kReadBlockSize = 10240;

ErrorKind kindForErrno(int err) {
    switch (err) {
        case ENOENT: return ErrorKind::NotFound;
        case EACCES:
        case EPERM: return ErrorKind::PermissionDenied;
        default: return ErrorKind::IoError;
    }
}

VaultError interruptedError(const std::string& what) {
    return makeError(ErrorKind::IoError, std::format("{} interrupted", what));
}

// True when the real location of path, following existing symlinks, is root or below it.
bool staysInside(const fs::path& root, const fs::path& path) {
    std::error_code ec;
    fs::path real = fs::weakly_canonical(path, ec);
    if (ec) {
        return false;
    }
    fs::path relative = real.lexically_relative(root);
    return !relative.empty() && *relative.begin() != "..";
}

} // namespace

ArchiveReader::ArchiveReader(const VaultConfig& config) : config(config), buffer(config.chunkSize) {}

std::expected<ArchiveHandle, VaultError> ArchiveReader::openHandle(const EncryptionContext* encryption) const {
    ArchiveHandle handle = ArchiveHandle::forRead();
    if (!handle) {
        return std::unexpected(makeError(ErrorKind::IoError, "Failed to allocate libarchive reader"));
    }
    archive_read_support_format_zip_seekable(handle.get());
    if (encryption && encryption->enabled && !encryption->password.empty()) {
        if (archive_read_add_passphrase(handle.get(), encryption->password.reveal()) != ARCHIVE_OK) {
            return std::unexpected(makeError(ErrorKind::EncryptionUnavailable,
                                             std::format("libarchive refused the password: {}", handle.lastError())));
        }
    }
    if (archive_read_open_filename(handle.get(), archivePath.c_str(), kReadBlockSize) != ARCHIVE_OK) {
        return std::unexpected(makeError(ErrorKind::CorruptArchive,
                                         std::format("Failed to open archive: {} (error: {})",
                                                     archivePath.string(), handle.lastError())));
    }
    return handle;
}

std::expected<void, VaultError> ArchiveReader::drainEntry(ArchiveHandle& handle, const std::string& name) {
    for (;;) {
        la_ssize_t n = archive_read_data(handle.get(), buffer.data(), buffer.size());
        if (n == 0) {
            return {};
        }
        if (n < 0) {
            auto error = makeError(ErrorKind::CorruptArchive,
                                   std::format("Integrity check failed for entry {}: {}", name, handle.lastError()));
            config.logError(error.message);
            return std::unexpected(error);
        }
    }
}

std::expected<void, VaultError> ArchiveReader::open(const fs::path& path, const CancellationToken* token) {
    std::error_code ec;
    auto status = fs::status(path, ec);
    if (ec || !fs::exists(status)) {
        return std::unexpected(makeError(ErrorKind::NotFound, std::format("Archive not found: {}", path.string())));
    }
    if (!fs::is_regular_file(status)) {
        return std::unexpected(makeError(ErrorKind::NotFound, std::format("Path is not a file: {}", path.string())));
    }

    archivePath = fs::absolute(path, ec);
    if (ec) {
        archivePath = path;
    }
    scanned.clear();
    directories.clear();
    regularFiles.clear();
    attempts = 0;
    opened = false;

    auto handle = openHandle(nullptr);
    if (!handle) {
        config.logError(handle.error().message);
        return std::unexpected(handle.error());
    }
    struct archive* a = handle->get();

    for (;;) {
        if (token && token->cancelled()) {
            config.logError(std::format("Scan of {} interrupted", archivePath.string()));
            return std::unexpected(interruptedError("Archive scan"));
        }
        struct archive_entry* entry;
        int r = archive_read_next_header(a, &entry);
        if (r == ARCHIVE_EOF) {
            break;
        }
        if (r == ARCHIVE_WARN) {
            config.logError(std::format("Warning: {}", handle->lastError()));
        } else if (r != ARCHIVE_OK) {
            auto error = makeError(ErrorKind::CorruptArchive,
                                   std::format("Archive is corrupted or not a valid ZIP file: {} (error: {})",
                                               archivePath.string(), handle->lastError()));
            config.logError(error.message);
            return std::unexpected(error);
        }

        const char* name = archive_entry_pathname(entry);
        if (!name) {
            return std::unexpected(makeError(ErrorKind::CorruptArchive, "Cannot get archive member name"));
        }

        ArchiveEntry info;
        info.relativePath = name;
        info.uncompressedSize = archive_entry_size_is_set(entry) ? static_cast<std::uint64_t>(archive_entry_size(entry)) : 0;
        info.isEncrypted = archive_entry_is_encrypted(entry) != 0;
        bool isDirectory = archive_entry_filetype(entry) == AE_IFDIR;
        bool isRegular = archive_entry_filetype(entry) == AE_IFREG;

        if (config.verifyChecksums && isRegular && !info.isEncrypted) {
            if (auto checked = drainEntry(*handle, info.relativePath); !checked) {
                return std::unexpected(checked.error());
            }
        } else if (archive_read_data_skip(a) < ARCHIVE_WARN) {
            return std::unexpected(makeError(ErrorKind::CorruptArchive,
                                             std::format("Failed to skip entry {}: {}", info.relativePath, handle->lastError())));
        }

        scanned.push_back(std::move(info));
        directories.push_back(isDirectory);
        regularFiles.push_back(isRegular);
    }

    std::string closeError;
    if (handle->close(&closeError) != ARCHIVE_OK) {
        return std::unexpected(makeError(ErrorKind::CorruptArchive,
                                         std::format("Failed to close archive {}: {}", archivePath.string(), closeError)));
    }

    opened = true;
    config.logMessage(std::format("Archive {} passed integrity check ({} entries{})", archivePath.string(),
                                  scanned.size(), detectEncryption() ? ", encrypted" : ""));
    return {};
}

bool ArchiveReader::detectEncryption() const {
    return std::ranges::any_of(scanned, [](const ArchiveEntry& entry) { return entry.isEncrypted; });
}

int ArchiveReader::attemptsRemaining() const {
    return std::max(config.maxPasswordAttempts - attempts, 0);
}

std::uint64_t ArchiveReader::fileCount() const {
    return static_cast<std::uint64_t>(std::ranges::count(regularFiles, true));
}

std::uint64_t ArchiveReader::totalUncompressedSize() const {
    std::uint64_t total = 0;
    for (const auto& entry : scanned) {
        total += entry.uncompressedSize;
    }
    return total;
}

std::expected<PasswordCheck, VaultError> ArchiveReader::verifyPassword(EncryptionContext& encryption) {
    if (!opened) {
        return std::unexpected(makeError(ErrorKind::IoError, "Archive is not open"));
    }
    if (attempts >= config.maxPasswordAttempts) {
        return std::unexpected(makeError(ErrorKind::TooManyAttempts,
                                         std::format("Maximum password attempts ({}) exceeded", config.maxPasswordAttempts)));
    }
    if (!detectEncryption()) {
        encryption.verified = true;
        return PasswordCheck::Verified;
    }
    ++attempts;

    std::optional<size_t> target;
    for (size_t i = 0; i < scanned.size(); ++i) {
        if (!scanned[i].isEncrypted || !regularFiles[i]) {
            continue;
        }
        if (!target || scanned[i].uncompressedSize < scanned[*target].uncompressedSize) {
            target = i;
        }
    }

    auto reject = [&]() -> std::expected<PasswordCheck, VaultError> {
        encryption.verified = false;
        config.logError(std::format("Password rejected ({} attempt(s) remaining)", attemptsRemaining()));
        return PasswordCheck::Rejected;
    };

    if (encryption.password.empty()) {
        return reject();
    }

    auto handle = openHandle(&encryption);
    if (!handle) {
        return std::unexpected(handle.error());
    }
    struct archive* a = handle->get();

    for (size_t i = 0; i < scanned.size(); ++i) {
        struct archive_entry* entry;
        int r = archive_read_next_header(a, &entry);
        if (r == ARCHIVE_EOF || r < ARCHIVE_WARN) {
            return std::unexpected(makeError(ErrorKind::CorruptArchive,
                                             std::format("Archive changed while verifying the password: {}", handle->lastError())));
        }
        if (target && i != *target) {
            continue; // next_header skips unread data
        }

        for (;;) {
            la_ssize_t n = archive_read_data(a, buffer.data(), buffer.size());
            if (n == 0) {
                break;
            }
            if (n < 0) {
                return reject();
            }
        }
        break;
    }

    encryption.verified = true;
    config.logMessage("Password verified");
    return PasswordCheck::Verified;
}

std::expected<void, VaultError> ArchiveReader::verifyEncryptedEntries(const EncryptionContext& encryption,
                                                                      const CancellationToken* token) {
    if (!opened) {
        return std::unexpected(makeError(ErrorKind::IoError, "Archive is not open"));
    }
    if (!config.verifyChecksums || !detectEncryption()) {
        return {};
    }
    if (!encryption.verified) {
        return std::unexpected(makeError(ErrorKind::WrongPassword, "Archive is encrypted and no verified password is available"));
    }

    auto handle = openHandle(&encryption);
    if (!handle) {
        return std::unexpected(handle.error());
    }
    for (size_t i = 0; i < scanned.size(); ++i) {
        if (token && token->cancelled()) {
            return std::unexpected(interruptedError("Integrity check"));
        }
        struct archive_entry* entry;
        int r = archive_read_next_header(handle->get(), &entry);
        if (r == ARCHIVE_EOF || r < ARCHIVE_WARN) {
            return std::unexpected(makeError(ErrorKind::CorruptArchive,
                                             std::format("Archive changed during the integrity check: {}", handle->lastError())));
        }
        if (!scanned[i].isEncrypted || !regularFiles[i]) {
            continue;
        }
        if (auto checked = drainEntry(*handle, scanned[i].relativePath); !checked) {
            return std::unexpected(checked.error());
        }
    }
    config.logMessage("Encrypted entries passed integrity check");
    return {};
}

std::optional<fs::path> ArchiveReader::resolveInside(const fs::path& root, const std::string& entryName) {
    if (entryName.empty()) {
        return std::nullopt;
    }
    fs::path name(entryName);
    if (name.is_absolute() || name.has_root_name() || name.has_root_directory()) {
        return std::nullopt;
    }
    for (const auto& part : name) {
        if (part == "..") {
            return std::nullopt;
        }
    }
    fs::path target = (root / name).lexically_normal();
    fs::path relative = target.lexically_relative(root);
    if (relative.empty() || *relative.begin() == ".." || relative == ".") {
        return std::nullopt;
    }
    return target;
}

std::expected<RunStatistics, VaultError> ArchiveReader::extractAll(const fs::path& destinationRoot,
                                                                   const EncryptionContext& encryption,
                                                                   const CancellationToken& token,
                                                                   ProgressThrottle* progress) {
    stats = RunStatistics{};
    stats.filesTotal = fileCount();
    for (size_t i = 0; i < scanned.size(); ++i) {
        if (regularFiles[i]) {
            stats.bytesTotal += scanned[i].uncompressedSize;
        }
    }

    if (!opened) {
        return std::unexpected(makeError(ErrorKind::IoError, "Archive is not open"));
    }
    if (detectEncryption() && !encryption.verified) {
        return std::unexpected(makeError(ErrorKind::WrongPassword, "Archive is encrypted and no verified password is available"));
    }

    std::error_code ec;
    fs::create_directories(destinationRoot, ec);
    if (ec) {
        return std::unexpected(makeError(kindForErrno(ec.value()),
                                         std::format("Failed to create target directory {}: {}",
                                                     destinationRoot.string(), ec.message())));
    }
    fs::path root = fs::weakly_canonical(fs::absolute(destinationRoot), ec);
    if (ec) {
        root = fs::absolute(destinationRoot).lexically_normal();
    }

    auto handle = openHandle(&encryption);
    if (!handle) {
        return std::unexpected(handle.error());
    }
    struct archive* a = handle->get();
    config.logMessage(std::format("Extracting {} entries to {}", scanned.size(), root.string()));

    for (size_t i = 0; i < scanned.size(); ++i) {
        if (token.cancelled()) {
            config.logError(std::format("Extraction interrupted after {}/{} files", stats.filesProcessed, stats.filesTotal));
            break;
        }

        struct archive_entry* entry;
        int r = archive_read_next_header(a, &entry);
        if (r == ARCHIVE_EOF) {
            break;
        }
        if (r < ARCHIVE_WARN) {
            return std::unexpected(makeError(ErrorKind::CorruptArchive,
                                             std::format("Failed to read entry header: {}", handle->lastError())));
        }
        const std::string& name = scanned[i].relativePath;

        auto target = resolveInside(root, name);
        if (!target) {
            stats.record(name, ErrorKind::PathEscape, "Entry path escapes the output directory");
            config.logError(std::format("Skipping {}: path escapes the output directory", name));
            if (progress) {
                progress->entryCompleted(stats);
            }
            continue;
        }

        if (!staysInside(root, *target) || fs::is_symlink(fs::symlink_status(*target, ec))) {
            stats.record(name, ErrorKind::PathEscape, "Entry path leaves the output directory through a symbolic link");
            config.logError(std::format("Skipping {}: path leaves the output directory through a symbolic link", name));
            if (progress) {
                progress->entryCompleted(stats);
            }
            continue;
        }

        if (directories[i]) {
            fs::create_directories(*target, ec);
            if (ec) {
                stats.record(name, kindForErrno(ec.value()), ec.message());
            }
            continue;
        }
        if (!regularFiles[i]) {
            stats.record(name, ErrorKind::UnsupportedEntry, "Only regular files and directories are restored");
            if (progress) {
                progress->entryCompleted(stats);
            }
            continue;
        }

        fs::create_directories(target->parent_path(), ec);
        if (ec) {
            stats.record(name, kindForErrno(ec.value()),
                         std::format("Failed to create directory {}: {}", target->parent_path().string(), ec.message()));
            if (progress) {
                progress->entryCompleted(stats);
            }
            continue;
        }

        std::ofstream out(*target, std::ios::binary | std::ios::trunc);
        if (!out) {
            int err = errno;
            stats.record(name, kindForErrno(err), std::format("Failed to create file: {}", std::strerror(err)));
            if (progress) {
                progress->entryCompleted(stats);
            }
            continue;
        }

        std::uint64_t written = 0;
        std::optional<RecordedError> failure;
        for (;;) {
            la_ssize_t n = archive_read_data(a, buffer.data(), buffer.size());
            if (n == 0) {
                break;
            }
            if (n < 0) {
                // The password was verified up front, so a failing encrypted entry has been tampered with.
                failure = RecordedError{name, ErrorKind::CorruptArchive, handle->lastError()};
                break;
            }
            out.write(buffer.data(), n);
            if (!out) {
                failure = RecordedError{name, ErrorKind::IoError, "Failed to write extracted data"};
                break;
            }
            written += static_cast<std::uint64_t>(n);
        }
        out.close();
        if (!failure && out.fail()) {
            failure = RecordedError{name, ErrorKind::IoError, "Failed to flush extracted file"};
        }

        if (failure) {
            fs::remove(*target, ec);
            config.logError(std::format("Warning: Skipping {}: {}", name, failure->reason));
            stats.errors.push_back(std::move(*failure));
        } else {
            fs::permissions(*target, static_cast<fs::perms>(archive_entry_perm(entry) & 0777) | fs::perms::owner_read | fs::perms::owner_write,
                            fs::perm_options::replace, ec);
            ++stats.filesProcessed;
            stats.bytesProcessed += written;
        }
        if (progress) {
            progress->entryCompleted(stats);
        }
    }

    handle->reset();
    return stats;
}
