#include "vault_config.hpp"
#include "test_helpers.hpp"
#include <gtest/gtest.h>
#include <memory>
#include <stdexcept>

using foldervault::test::TempDir;
using foldervault::test::writeFile;

namespace {

Json::Value parse(const std::string& text) {
    Json::CharReaderBuilder builder;
    std::unique_ptr<Json::CharReader> reader(builder.newCharReader());
    Json::Value value;
    std::string errors;
    if (!reader->parse(text.data(), text.data() + text.size(), &value, &errors)) {
        throw std::runtime_error(errors);
    }
    return value;
}

} // namespace

TEST(VaultConfig, defaults)
{
    VaultConfig config;
    EXPECT_EQ(config.chunkSize, 65536u);
    EXPECT_EQ(config.compressionLevel, 9);
    EXPECT_EQ(config.progressInterval, 10);
    EXPECT_EQ(config.maxPasswordAttempts, 3);
    EXPECT_TRUE(config.verifyChecksums);
    EXPECT_EQ(config.encryption, "aes256");
    EXPECT_EQ(config.tempSuffix, ".partial");
    EXPECT_FALSE(config.quiet);
    EXPECT_TRUE(config.logFile.empty());
}

TEST(VaultConfig, emptyObjectKeepsDefaults)
{
    VaultConfig config = VaultConfig::fromJson(parse("{}"));
    EXPECT_EQ(config.chunkSize, 65536u);
    EXPECT_EQ(config.maxPasswordAttempts, 3);
}

TEST(VaultConfig, readsAllKeys)
{
    VaultConfig config = VaultConfig::fromJson(parse(R"({
        "log_file": "/tmp/vault.log",
        "error_log_file": "/tmp/vault.err",
        "chunk_size": 1024,
        "compression_level": 6,
        "progress_interval": 1,
        "max_password_attempts": 5,
        "verify_checksums": false,
        "encryption": "aes128",
        "temp_suffix": ".tmp",
        "quiet": true
    })"));
    EXPECT_EQ(config.logFile, "/tmp/vault.log");
    EXPECT_EQ(config.errorLogFile, "/tmp/vault.err");
    EXPECT_EQ(config.chunkSize, 1024u);
    EXPECT_EQ(config.compressionLevel, 6);
    EXPECT_EQ(config.progressInterval, 1);
    EXPECT_EQ(config.maxPasswordAttempts, 5);
    EXPECT_FALSE(config.verifyChecksums);
    EXPECT_EQ(config.encryption, "aes128");
    EXPECT_EQ(config.tempSuffix, ".tmp");
    EXPECT_TRUE(config.quiet);
}

TEST(VaultConfig, rejectsInvalidValues)
{
    EXPECT_THROW(VaultConfig::fromJson(parse(R"({"chunk_size": 0})")), std::runtime_error);
    EXPECT_THROW(VaultConfig::fromJson(parse(R"({"compression_level": 10})")), std::runtime_error);
    EXPECT_THROW(VaultConfig::fromJson(parse(R"({"compression_level": -1})")), std::runtime_error);
    EXPECT_THROW(VaultConfig::fromJson(parse(R"({"progress_interval": 0})")), std::runtime_error);
    EXPECT_THROW(VaultConfig::fromJson(parse(R"({"max_password_attempts": 0})")), std::runtime_error);
    EXPECT_THROW(VaultConfig::fromJson(parse(R"({"encryption": "zipcrypto"})")), std::runtime_error);
    EXPECT_THROW(VaultConfig::fromJson(parse(R"({"temp_suffix": ""})")), std::runtime_error);
    EXPECT_THROW(VaultConfig::fromJson(parse("[1, 2]")), std::runtime_error);
}

TEST(VaultConfig, loadsFromFile)
{
    TempDir tmp;
    writeFile(tmp / "vault_config.json", R"({"chunk_size": 2048, "quiet": true})");
    VaultConfig config((tmp / "vault_config.json").string());
    EXPECT_EQ(config.chunkSize, 2048u);
    EXPECT_TRUE(config.quiet);
}

TEST(VaultConfig, missingOrMalformedFileThrows)
{
    TempDir tmp;
    EXPECT_THROW({ VaultConfig config((tmp / "absent.json").string()); }, std::runtime_error);
    writeFile(tmp / "broken.json", "{ not json");
    EXPECT_THROW({ VaultConfig config((tmp / "broken.json").string()); }, std::runtime_error);
}

TEST(VaultConfig, logsAppendToFiles)
{
    TempDir tmp;
    VaultConfig config;
    config.quiet = true;
    config.logFile = (tmp / "logs/vault.log").string();
    config.errorLogFile = (tmp / "logs/vault.err").string();

    config.logMessage("first");
    config.logMessage("second");
    config.logError("broken");

    std::string log = foldervault::test::readFile(config.logFile);
    std::string err = foldervault::test::readFile(config.errorLogFile);
    EXPECT_NE(log.find("] first\n"), std::string::npos);
    EXPECT_NE(log.find("] second\n"), std::string::npos);
    EXPECT_EQ(log.find("broken"), std::string::npos);
    EXPECT_NE(err.find("] ERROR: broken\n"), std::string::npos);
    EXPECT_EQ(log.front(), '[');
}
