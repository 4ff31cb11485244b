#include "vault_config.hpp"
#include <chrono>
#include <ctime>
#include <filesystem>
#include <format>
#include <fstream>
#include <print>
#include <stdexcept>

namespace fs = std::filesystem;

namespace {

std::string timestamp() {
    auto now = std::chrono::system_clock::now();
    auto timeT = std::chrono::system_clock::to_time_t(now);
    char timeBuf[32];
    std::strftime(timeBuf, sizeof(timeBuf), "%Y-%m-%d %H:%M:%S", std::localtime(&timeT));
    return timeBuf;
}

void appendLine(const std::string& file, const std::string& line) {
    if (file.empty()) {
        return;
    }
    fs::path logPath(file);
    if (logPath.has_parent_path()) {
        std::error_code ec;
        fs::create_directories(logPath.parent_path(), ec);
    }
    std::ofstream log(file, std::ios::app);
    if (log.is_open()) {
        log << line << '\n';
        log.flush();
    } else {
        std::println(stderr, "Error: Cannot write to log file: {}", file);
    }
}

} // namespace

VaultConfig::VaultConfig(const std::string& configFile) {
    std::ifstream file(configFile);
    if (!file.is_open()) {
        throw std::runtime_error(std::format("Failed to open config file: {}", configFile));
    }
    Json::Value configJson;
    Json::CharReaderBuilder builder;
    std::string errors;
    if (!Json::parseFromStream(builder, file, &configJson, &errors)) {
        throw std::runtime_error(std::format("Failed to parse config file: {} ({})", configFile, errors));
    }
    *this = fromJson(configJson);
}

VaultConfig VaultConfig::fromJson(const Json::Value& configJson) {
    if (!configJson.isObject()) {
        throw std::runtime_error("Configuration root must be a JSON object");
    }

    VaultConfig config;
    config.logFile = configJson.get("log_file", "").asString();
    config.errorLogFile = configJson.get("error_log_file", "").asString();
    config.chunkSize = configJson.get("chunk_size", static_cast<Json::UInt64>(config.chunkSize)).asUInt64();
    config.compressionLevel = configJson.get("compression_level", config.compressionLevel).asInt();
    config.progressInterval = configJson.get("progress_interval", config.progressInterval).asInt();
    config.maxPasswordAttempts = configJson.get("max_password_attempts", config.maxPasswordAttempts).asInt();
    config.verifyChecksums = configJson.get("verify_checksums", config.verifyChecksums).asBool();
    config.encryption = configJson.get("encryption", config.encryption).asString();
    config.tempSuffix = configJson.get("temp_suffix", config.tempSuffix).asString();
    config.quiet = configJson.get("quiet", config.quiet).asBool();
    config.validate();
    return config;
}

void VaultConfig::validate() const {
    if (chunkSize == 0) {
        throw std::runtime_error("chunk_size must be greater than zero");
    }
    if (compressionLevel < 0 || compressionLevel > 9) {
        throw std::runtime_error(std::format("compression_level must be within 0..9, got {}", compressionLevel));
    }
    if (progressInterval < 1) {
        throw std::runtime_error(std::format("progress_interval must be at least 1, got {}", progressInterval));
    }
    if (maxPasswordAttempts < 1) {
        throw std::runtime_error(std::format("max_password_attempts must be at least 1, got {}", maxPasswordAttempts));
    }
    if (encryption != "aes128" && encryption != "aes256") {
        throw std::runtime_error(std::format("Unsupported encryption method: {}", encryption));
    }
    if (tempSuffix.empty()) {
        throw std::runtime_error("temp_suffix must not be empty");
    }
}

void VaultConfig::logMessage(const std::string& message) const {
    std::string logEntry = std::format("[{}] {}", timestamp(), message);
    if (!quiet) {
        std::println("{}", logEntry);
    }
    appendLine(logFile, logEntry);
}

void VaultConfig::logError(const std::string& message) const {
    std::string logEntry = std::format("[{}] ERROR: {}", timestamp(), message);
    std::println(stderr, "{}", logEntry);
    appendLine(errorLogFile, logEntry);
}
