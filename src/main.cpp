#include "encryption_context.hpp"
#include "password_prompt.hpp"
#include "progress_reporter.hpp"
#include "vault.hpp"
#include <filesystem>
#include <format>
#include <iostream>
#include <memory>
#include <optional>
#include <string>

namespace fs = std::filesystem;

namespace {

constexpr int kExitSuccess = 0;
constexpr int kExitFailure = 1;
constexpr int kExitWithErrors = 2;
constexpr int kExitCancelled = 130;

const std::string kDefaultConfigFile = "vault_config.json";

void printUsage(const char* program) {
    std::cerr << "Usage: " << program << " backup <source> [--output <archive>] [--password|--no-password] [--config <path>]"
              << std::endl;
    std::cerr << "       " << program << " restore <archive> [--output <dir>] [--password <secret>] [--config <path>]"
              << std::endl;
}

void printBanner(const std::string& title) {
    std::cout << std::string(60, '=') << std::endl;
    std::cout << title << std::endl;
    std::cout << std::string(60, '=') << std::endl;
}

bool confirm(const std::string& question) {
    std::cout << question << " (y/N): " << std::flush;
    std::string response;
    if (!std::getline(std::cin, response)) {
        return false;
    }
    return response == "y" || response == "Y";
}

VaultConfig loadConfig(const std::optional<std::string>& configFile) {
    if (configFile) {
        return VaultConfig(*configFile);
    }
    std::error_code ec;
    if (fs::is_regular_file(kDefaultConfigFile, ec)) {
        return VaultConfig(kDefaultConfigFile);
    }
    return VaultConfig();
}

void printErrors(const RunStatistics& stats) {
    if (stats.errors.empty()) {
        return;
    }
    std::cout << "Errors: " << stats.errors.size() << std::endl;
    for (const auto& error : stats.errors) {
        std::cout << "  " << error.path << ": " << errorKindName(error.kind) << " (" << error.reason << ")" << std::endl;
    }
}

int exitCodeFor(Outcome outcome) {
    switch (outcome) {
        case Outcome::Completed: return kExitSuccess;
        case Outcome::CompletedWithErrors: return kExitWithErrors;
        case Outcome::Cancelled: return kExitCancelled;
    }
    return kExitFailure;
}

VaultEnvironment terminalEnvironment(const VaultConfig& config) {
    VaultEnvironment environment;
    environment.requestPassword = terminalPasswordPrompt();
    environment.reporter = std::make_shared<ConsoleProgressReporter>();
    environment.encryptionAvailable = encryptionSupported(config.encryption);
    return environment;
}

int runBackup(const VaultConfig& config, const fs::path& source, const std::optional<fs::path>& output,
              bool wantPassword) {
    printBanner("FOLDER BACKUP UTILITY");

    std::error_code ec;
    fs::path sourceDir = fs::absolute(source, ec);
    if (ec) {
        sourceDir = source;
    }
    fs::path archivePath = output ? fs::absolute(*output, ec) : defaultArchivePath(sourceDir);

    if (fs::exists(archivePath, ec)) {
        std::cout << "Warning: Archive already exists: " << archivePath.string() << std::endl;
        if (!confirm("Overwrite?")) {
            std::cout << "Operation cancelled." << std::endl;
            return kExitSuccess;
        }
    }

    VaultEnvironment environment = terminalEnvironment(config);
    std::cout << "Source: " << sourceDir.string() << std::endl;
    std::cout << "Archive: " << archivePath.string() << std::endl;
    std::cout << "Compression: deflate (level " << config.compressionLevel << ")" << std::endl;
    std::cout << "Encryption: " << (wantPassword ? config.encryption + " with password" : std::string("NONE")) << std::endl;

    Vault vault(config, std::move(environment));
    auto result = vault.backup(BackupRequest{sourceDir, archivePath, wantPassword});
    if (!result) {
        std::cerr << "Error: " << errorKindName(result.error().kind) << ": " << result.error().describe() << std::endl;
        return kExitFailure;
    }

    const BackupReport& report = *result;
    if (report.outcome == Outcome::Cancelled) {
        std::cout << std::endl << "Operation interrupted by user. No archive was written." << std::endl;
        return kExitCancelled;
    }

    std::cout << std::endl;
    printBanner("ARCHIVING COMPLETED");
    std::cout << "Files processed: " << report.stats.filesProcessed << "/" << report.stats.filesTotal << std::endl;
    printErrors(report.stats);
    std::cout << "Original size: " << formatSize(report.stats.bytesProcessed) << std::endl;
    std::cout << "Archive size: " << formatSize(report.archiveSize) << std::endl;
    std::cout << std::format("Compression ratio: {:.1f}%", report.compressionRatio() * 100.0) << std::endl;
    if (report.encrypted) {
        std::cout << "Archive protected with password (" << config.encryption << ")" << std::endl;
    }
    std::cout << "Archive saved: " << report.archivePath.string() << std::endl;
    return exitCodeFor(report.outcome);
}

int runRestore(const VaultConfig& config, const fs::path& archive, const std::optional<fs::path>& output,
               std::optional<std::string> password) {
    printBanner("FOLDER RESTORE UTILITY");

    std::error_code ec;
    fs::path archivePath = fs::absolute(archive, ec);
    if (ec) {
        archivePath = archive;
    }
    fs::path targetDir = output ? fs::absolute(*output, ec) : defaultRestoreDir(archivePath);

    std::cout << "Archive: " << archivePath.string() << std::endl;
    std::cout << "Target directory: " << targetDir.string() << std::endl;

    if (fs::is_directory(targetDir, ec) && !fs::is_empty(targetDir, ec)) {
        std::cout << "Warning: Target directory is not empty: " << targetDir.string() << std::endl;
        if (!confirm("Continue?")) {
            std::cout << "Operation cancelled." << std::endl;
            return kExitSuccess;
        }
    }

    RestoreRequest request{archivePath, targetDir, std::nullopt};
    if (password) {
        request.password = Secret(std::move(*password));
    }

    Vault vault(config, terminalEnvironment(config));
    auto result = vault.restore(std::move(request));
    if (!result) {
        std::cerr << "Error: " << errorKindName(result.error().kind) << ": " << result.error().describe() << std::endl;
        return kExitFailure;
    }

    const RestoreReport& report = *result;
    if (report.outcome == Outcome::Cancelled) {
        std::cout << std::endl << "Operation interrupted by user. Extracted " << report.stats.filesProcessed << "/"
                  << report.stats.filesTotal << " files." << std::endl;
        return kExitCancelled;
    }

    std::cout << std::endl;
    printBanner("RESTORATION COMPLETED");
    std::cout << "Files extracted: " << report.stats.filesProcessed << "/" << report.stats.filesTotal << std::endl;
    std::cout << "Size extracted: " << formatSize(report.stats.bytesProcessed) << std::endl;
    printErrors(report.stats);
    if (report.encrypted) {
        std::cout << "Encryption: password verified" << std::endl;
    }
    std::cout << "Path: " << report.outputDir.string() << std::endl;
    return exitCodeFor(report.outcome);
}

} // namespace

int main(int argc, char* argv[]) {
    if (argc < 3) {
        printUsage(argv[0]);
        return kExitFailure;
    }

    std::string command = argv[1];
    std::optional<std::string> configFile;
    std::optional<fs::path> output;
    std::optional<std::string> password;
    bool passwordFlag = false;
    bool noPassword = false;
    std::string target;

    for (int i = 2; i < argc; ++i) {
        std::string arg = argv[i];
        if (arg == "--config" && i + 1 < argc) {
            configFile = argv[++i];
        } else if ((arg == "--output" || arg == "-o") && i + 1 < argc) {
            output = fs::path(argv[++i]);
        } else if (arg == "--password") {
            passwordFlag = true;
            if (command == "restore" && i + 1 < argc) {
                password = argv[++i];
            }
        } else if (arg == "--no-password") {
            noPassword = true;
        } else if (target.empty()) {
            target = arg;
        } else {
            std::cerr << "Error: Unexpected argument: " << arg << std::endl;
            printUsage(argv[0]);
            return kExitFailure;
        }
    }

    if (target.empty() || (command != "backup" && command != "restore")) {
        printUsage(argv[0]);
        return kExitFailure;
    }

    std::optional<VaultConfig> config;
    try {
        config = loadConfig(configFile);
    } catch (const std::exception& e) {
        std::cerr << "Error: Failed to load config: " << e.what() << std::endl;
        return kExitFailure;
    }

    try {
        if (command == "backup") {
            return runBackup(*config, target, output, passwordFlag && !noPassword);
        }
        return runRestore(*config, target, output, std::move(password));
    } catch (const std::exception& e) {
        std::cerr << "Error: " << e.what() << std::endl;
        return kExitFailure;
    }
}
