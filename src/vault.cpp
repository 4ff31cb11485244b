#include "vault.hpp"
#include "archive_writer.hpp"
#include "directory_walker.hpp"
#include <chrono>
#include <ctime>
#include <stdexcept>
#include <format>
#include <utility>

namespace fs = std::filesystem;

namespace {

const char* outcomeName(Outcome outcome) {
    switch (outcome) {
        case Outcome::Completed: return "completed";
        case Outcome::CompletedWithErrors: return "completed with errors";
        case Outcome::Cancelled: return "cancelled";
    }
    return "unknown";
}

// The guard lives for the whole operation so an interrupt at a password prompt cancels too.
std::expected<void, VaultError> installGuard(std::optional<CancellationGuard>& guard, const CancellationToken& token) {
    try {
        guard.emplace(token);
    } catch (const std::runtime_error& e) {
        return std::unexpected(makeError(ErrorKind::IoError, e.what()));
    }
    return {};
}

} // namespace

Vault::Vault(VaultConfig config, VaultEnvironment environment)
    : config(std::move(config)), environment(std::move(environment)) {
    if (!this->environment.freeSpace) {
        this->environment.freeSpace = filesystemFreeSpace;
    }
}

std::expected<std::optional<Secret>, VaultError> Vault::collectNewPassword() {
    if (!environment.requestPassword) {
        return std::unexpected(makeError(ErrorKind::EncryptionUnavailable,
                                         "Encryption was requested but no password source is available"));
    }
    for (int attempt = 1; attempt <= config.maxPasswordAttempts; ++attempt) {
        if (token.cancelled()) {
            return std::optional<Secret>{};
        }
        std::optional<Secret> password = environment.requestPassword(PasswordPurpose::Create, attempt,
                                                                     config.maxPasswordAttempts);
        if (!password) {
            return std::optional<Secret>{};
        }
        if (password->empty()) {
            config.logError("Password rejected: empty or not confirmed");
            continue;
        }
        return std::move(password);
    }
    return std::unexpected(makeError(ErrorKind::TooManyAttempts,
                                     std::format("No usable password after {} attempts", config.maxPasswordAttempts)));
}

std::expected<BackupReport, VaultError> Vault::backup(BackupRequest request) {
    token = CancellationToken{};
    BackupReport report;
    std::optional<CancellationGuard> guard;
    if (auto installed = installGuard(guard, token); !installed) {
        config.logError(installed.error().message);
        return std::unexpected(installed.error());
    }

    auto walker = DirectoryWalker::open(request.sourceDir);
    if (!walker) {
        config.logError(walker.error().describe());
        return std::unexpected(walker.error());
    }
    fs::path output = request.outputPath ? *request.outputPath : defaultArchivePath(walker->root());
    report.archivePath = output;

    config.logMessage(std::format("Scanning {}", walker->root().string()));
    std::vector<WalkEntry> files = walker->collect(&token);
    if (token.cancelled()) {
        config.logError("Scanning interrupted by user");
        report.outcome = Outcome::Cancelled;
        report.archivePath.clear();
        return report;
    }
    for (const auto& error : walker->errors()) {
        config.logError(std::format("Warning: Skipping {}: {}", error.path, error.reason));
        report.stats.errors.push_back(error);
    }
    report.stats.filesTotal = files.size();
    for (const auto& file : files) {
        report.stats.bytesTotal += file.size;
    }
    config.logMessage(std::format("Found {} files ({} bytes) to archive", report.stats.filesTotal,
                                  report.stats.bytesTotal));

    SpaceChecker checker(config, environment.freeSpace);
    auto space = checker.ensure(report.stats.bytesTotal, output);
    if (token.cancelled()) {
        config.logError("Backup interrupted before archiving started");
        report.outcome = Outcome::Cancelled;
        report.archivePath.clear();
        return report;
    }
    if (!space) {
        return std::unexpected(space.error());
    }

    EncryptionContext encryption = EncryptionContext::none(environment.encryptionAvailable);
    if (request.wantPassword) {
        if (!environment.encryptionAvailable) {
            auto error = makeError(ErrorKind::EncryptionUnavailable,
                                   std::format("This libarchive build cannot write {} encrypted ZIP archives",
                                               config.encryption));
            config.logError(error.message);
            return std::unexpected(error);
        }
        auto password = collectNewPassword();
        if (!password) {
            config.logError(password.error().describe());
            return std::unexpected(password.error());
        }
        if (!*password || token.cancelled()) {
            config.logMessage("Backup cancelled while entering the password");
            report.outcome = Outcome::Cancelled;
            report.archivePath.clear();
            return report;
        }
        encryption = EncryptionContext::withPassword(std::move(**password), environment.encryptionAvailable);
    }
    report.encrypted = encryption.enabled;

    ArchiveWriter writer(config);
    if (auto opened = writer.open(output, encryption); !opened) {
        config.logError(opened.error().describe());
        return std::unexpected(opened.error());
    }
    // libarchive keeps its own copy of the passphrase.
    encryption.password.clear();

    ProgressThrottle progress(environment.reporter.get(), Phase::Backup, config.progressInterval);
    for (const auto& file : files) {
        if (token.cancelled()) {
            break;
        }
        auto added = writer.add(file.sourcePath, file.relativePath, token);
        if (token.cancelled()) {
            break;
        }
        if (!added) {
            if (!writer.healthy()) {
                writer.abort();
                progress.complete(report.stats);
                config.logError(std::format("Backup failed: {}", added.error().describe()));
                return std::unexpected(added.error());
            }
            config.logError(std::format("Warning: Skipping {}: {}", file.relativePath, added.error().message));
            report.stats.record(file.relativePath, added.error().kind, added.error().message);
        } else {
            ++report.stats.filesProcessed;
            report.stats.bytesProcessed += added->uncompressedSize;
        }
        progress.entryCompleted(report.stats);
    }

    if (token.cancelled()) {
        writer.abort();
        progress.complete(report.stats);
        config.logError(std::format("Backup interrupted after {}/{} files; no archive was written",
                                    report.stats.filesProcessed, report.stats.filesTotal));
        report.outcome = Outcome::Cancelled;
        report.archivePath.clear();
        return report;
    }

    auto size = writer.finalize();
    if (!size) {
        progress.complete(report.stats);
        config.logError(std::format("Backup failed: {}", size.error().describe()));
        return std::unexpected(size.error());
    }
    report.archiveSize = *size;

    progress.complete(report.stats);
    report.outcome = outcomeFor(report.stats);
    config.logMessage(std::format("Backup {}: {} ({}/{} files, {} errors)", outcomeName(report.outcome),
                                  output.string(), report.stats.filesProcessed, report.stats.filesTotal,
                                  report.stats.errors.size()));
    return report;
}

std::expected<bool, VaultError> Vault::unlock(ArchiveReader& reader, EncryptionContext& encryption,
                                              std::optional<Secret> supplied) {
    encryption.enabled = true;
    for (;;) {
        if (!supplied) {
            if (reader.attemptsRemaining() == 0) {
                break;
            }
            if (!environment.requestPassword) {
                VaultError error = makeError(ErrorKind::WrongPassword,
                                             reader.attemptsUsed() == 0 ? "Archive is encrypted and no password was supplied"
                                                                        : "Incorrect password");
                error.attemptsRemaining = reader.attemptsRemaining();
                return std::unexpected(error);
            }
            if (token.cancelled()) {
                return false;
            }
            supplied = environment.requestPassword(PasswordPurpose::Unlock, reader.attemptsUsed() + 1,
                                                   config.maxPasswordAttempts);
            if (!supplied || token.cancelled()) {
                return false;
            }
        }
        encryption.password = std::move(*supplied);
        supplied.reset();

        auto check = reader.verifyPassword(encryption);
        if (!check) {
            return std::unexpected(check.error());
        }
        if (*check == PasswordCheck::Verified) {
            return true;
        }
    }
    encryption.password.clear();
    auto error = makeError(ErrorKind::TooManyAttempts,
                           std::format("Maximum password attempts ({}) exceeded", config.maxPasswordAttempts));
    config.logError(error.message);
    return std::unexpected(error);
}

std::expected<RestoreReport, VaultError> Vault::restore(RestoreRequest request) {
    token = CancellationToken{};
    RestoreReport report;
    std::optional<CancellationGuard> guard;
    if (auto installed = installGuard(guard, token); !installed) {
        config.logError(installed.error().message);
        return std::unexpected(installed.error());
    }

    report.outputDir = request.outputDir ? *request.outputDir : defaultRestoreDir(request.archivePath);
    auto cancelled = [&]() {
        config.logMessage("Restore cancelled before extraction");
        report.outcome = Outcome::Cancelled;
        return report;
    };

    ArchiveReader reader(config);
    if (auto opened = reader.open(request.archivePath, &token); !opened) {
        if (token.cancelled()) {
            return cancelled();
        }
        return std::unexpected(opened.error());
    }
    report.encrypted = reader.detectEncryption();
    report.stats.filesTotal = reader.fileCount();
    report.stats.bytesTotal = reader.totalUncompressedSize();

    EncryptionContext encryption = EncryptionContext::none(environment.encryptionAvailable);
    if (report.encrypted) {
        if (!environment.encryptionAvailable) {
            auto error = makeError(ErrorKind::EncryptionUnavailable,
                                   "Archive is encrypted but this libarchive build cannot decrypt ZIP archives");
            config.logError(error.message);
            return std::unexpected(error);
        }
        config.logMessage("Archive is encrypted");
        auto unlocked = unlock(reader, encryption, std::move(request.password));
        if (!unlocked) {
            return std::unexpected(unlocked.error());
        }
        if (!*unlocked) {
            encryption.password.clear();
            return cancelled();
        }
        if (auto checked = reader.verifyEncryptedEntries(encryption, &token); !checked) {
            encryption.password.clear();
            if (token.cancelled()) {
                return cancelled();
            }
            return std::unexpected(checked.error());
        }
    }
    if (token.cancelled()) {
        encryption.password.clear();
        return cancelled();
    }

    SpaceChecker checker(config, environment.freeSpace);
    auto space = checker.ensure(reader.totalUncompressedSize(), report.outputDir);
    if (token.cancelled()) {
        return cancelled();
    }
    if (!space) {
        return std::unexpected(space.error());
    }

    ProgressThrottle progress(environment.reporter.get(), Phase::Restore, config.progressInterval);
    auto extracted = reader.extractAll(report.outputDir, encryption, token, &progress);
    encryption.password.clear();

    if (!extracted) {
        progress.complete(reader.statistics());
        config.logError(std::format("Restore failed: {}", extracted.error().describe()));
        return std::unexpected(extracted.error());
    }
    report.stats = std::move(*extracted);
    progress.complete(report.stats);

    report.outcome = token.cancelled() ? Outcome::Cancelled : outcomeFor(report.stats);
    config.logMessage(std::format("Restore {}: {} ({}/{} files, {} errors)", outcomeName(report.outcome),
                                  report.outputDir.string(), report.stats.filesProcessed, report.stats.filesTotal,
                                  report.stats.errors.size()));
    return report;
}

fs::path defaultArchivePath(const fs::path& sourceDir) {
    std::error_code ec;
    fs::path source = fs::absolute(sourceDir, ec);
    if (ec) {
        source = sourceDir;
    }
    source = source.lexically_normal();
    if (!source.has_filename() && source != source.root_path()) {
        source = source.parent_path();
    }
    std::string name = source.filename().string();
    if (name.empty()) {
        name = "backup";
    }

    auto now = std::chrono::system_clock::now();
    auto timeT = std::chrono::system_clock::to_time_t(now);
    char timestampBuf[32];
    std::strftime(timestampBuf, sizeof(timestampBuf), "%d-%m-%Y_%H-%M", std::localtime(&timeT));
    return source.parent_path() / std::format("{}_{}.zip", name, timestampBuf);
}

fs::path defaultRestoreDir(const fs::path& archivePath) {
    return fs::current_path() / archivePath.stem();
}
