#include "space_checker.hpp"
#include "test_helpers.hpp"
#include <gtest/gtest.h>

namespace fs = std::filesystem;
using foldervault::test::TempDir;

TEST(SpaceChecker, passesWhenEnoughSpace)
{
    TempDir tmp;
    VaultConfig config = foldervault::test::testConfig();
    SpaceChecker checker(config, [](const fs::path&) -> std::expected<std::uint64_t, std::string> { return 1000; });

    EXPECT_TRUE(checker.ensure(1000, tmp / "out.zip").has_value());
    EXPECT_TRUE(checker.ensure(0, tmp / "out.zip").has_value());
}

TEST(SpaceChecker, reportsRequiredAndAvailableBytes)
{
    TempDir tmp;
    VaultConfig config = foldervault::test::testConfig();
    SpaceChecker checker(config, [](const fs::path&) -> std::expected<std::uint64_t, std::string> { return 10; });

    auto result = checker.ensure(100, tmp / "out.zip");
    ASSERT_FALSE(result.has_value());
    EXPECT_EQ(result.error().kind, ErrorKind::InsufficientSpace);
    EXPECT_EQ(result.error().required, 100u);
    EXPECT_EQ(result.error().available, 10u);
    EXPECT_NE(result.error().describe().find("short by 90 bytes"), std::string::npos);
    EXPECT_FALSE(fs::exists(tmp / "out.zip"));
}

TEST(SpaceChecker, queriesNearestExistingAncestor)
{
    TempDir tmp;
    VaultConfig config = foldervault::test::testConfig();
    fs::path queried;
    SpaceChecker checker(config, [&](const fs::path& path) -> std::expected<std::uint64_t, std::string> {
        queried = path;
        return 1u << 20;
    });

    EXPECT_TRUE(checker.ensure(1, tmp / "not/yet/created/archive.zip").has_value());
    EXPECT_EQ(queried, tmp.path());
    EXPECT_FALSE(fs::exists(tmp / "not"));
}

TEST(SpaceChecker, unavailableProbeDoesNotBlock)
{
    TempDir tmp;
    VaultConfig config = foldervault::test::testConfig();
    SpaceChecker checker(config, [](const fs::path&) -> std::expected<std::uint64_t, std::string> {
        return std::unexpected(std::string("statvfs unsupported"));
    });

    EXPECT_TRUE(checker.ensure(1ull << 40, tmp / "out.zip").has_value());
}

TEST(SpaceChecker, realFilesystemProbe)
{
    TempDir tmp;
    auto available = filesystemFreeSpace(tmp.path());
    ASSERT_TRUE(available.has_value());
    EXPECT_GT(*available, 0u);
}

TEST(SpaceChecker, existingAncestorOfExistingDirectoryIsItself)
{
    TempDir tmp;
    EXPECT_EQ(SpaceChecker::existingAncestor(tmp.path()), tmp.path());
    EXPECT_EQ(SpaceChecker::existingAncestor(tmp / "a/b"), tmp.path());
}
