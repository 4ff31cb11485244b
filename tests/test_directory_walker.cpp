#include "directory_walker.hpp"
#include "test_helpers.hpp"
#include <gtest/gtest.h>
#include <algorithm>
#include <format>
#include <sys/stat.h>
#include <unistd.h>

namespace fs = std::filesystem;
using foldervault::test::TempDir;
using foldervault::test::writeFile;

namespace {

std::vector<std::string> relativePaths(const std::vector<WalkEntry>& entries) {
    std::vector<std::string> paths;
    for (const auto& entry : entries) {
        paths.push_back(entry.relativePath);
    }
    return paths;
}

} // namespace

TEST(DirectoryWalker, yieldsFilesInLexicographicOrder)
{
    TempDir tmp;
    writeFile(tmp / "src/b.txt", "b");
    writeFile(tmp / "src/a/y/z.txt", "zz");
    writeFile(tmp / "src/a/x.txt", "x");
    writeFile(tmp / "src/a.txt", "aaa");
    fs::create_directories(tmp / "src/empty");

    auto walker = DirectoryWalker::open(tmp / "src");
    ASSERT_TRUE(walker.has_value());
    auto entries = walker->collect();

    EXPECT_EQ(relativePaths(entries), (std::vector<std::string>{"a.txt", "a/x.txt", "a/y/z.txt", "b.txt"}));
    EXPECT_EQ(entries[0].size, 3u);
    EXPECT_EQ(entries[0].sourcePath, tmp / "src/a.txt");
    EXPECT_TRUE(walker->errors().empty());
}

TEST(DirectoryWalker, repeatedWalksAreIdentical)
{
    TempDir tmp;
    for (int i = 0; i < 20; ++i) {
        writeFile(tmp / std::format("src/d{}/f{}.bin", i % 4, i), std::string(static_cast<size_t>(i), 'x'));
    }

    auto first = DirectoryWalker::open(tmp / "src");
    auto second = DirectoryWalker::open(tmp / "src");
    ASSERT_TRUE(first.has_value());
    ASSERT_TRUE(second.has_value());

    auto a = relativePaths(first->collect());
    auto b = relativePaths(second->collect());
    EXPECT_EQ(a.size(), 20u);
    EXPECT_EQ(a, b);
    EXPECT_TRUE(std::ranges::is_sorted(a));
}

TEST(DirectoryWalker, nextStopsAfterLastEntry)
{
    TempDir tmp;
    writeFile(tmp / "src/only.txt", "1");

    auto walker = DirectoryWalker::open(tmp / "src");
    ASSERT_TRUE(walker.has_value());
    auto entry = walker->next();
    ASSERT_TRUE(entry.has_value());
    EXPECT_EQ(entry->relativePath, "only.txt");
    EXPECT_FALSE(walker->next().has_value());
    EXPECT_FALSE(walker->next().has_value());
}

TEST(DirectoryWalker, followsDirectorySymlinksOnlyOnce)
{
    TempDir tmp;
    writeFile(tmp / "src/sub/file.txt", "data");
    fs::create_directory_symlink(tmp / "src", tmp / "src/sub/loop");
    fs::create_directory_symlink(tmp / "src/sub", tmp / "src/alias");

    auto walker = DirectoryWalker::open(tmp / "src");
    ASSERT_TRUE(walker.has_value());
    auto paths = relativePaths(walker->collect());

    // "alias/" sorts before "sub/", so the tree is reached through the link first.
    EXPECT_EQ(paths, (std::vector<std::string>{"alias/file.txt"}));
}

TEST(DirectoryWalker, followsFileSymlinks)
{
    TempDir tmp;
    writeFile(tmp / "outside.txt", "outside");
    fs::create_directories(tmp / "src");
    fs::create_symlink(tmp / "outside.txt", tmp / "src/link.txt");
    fs::create_symlink(tmp / "missing.txt", tmp / "src/dangling.txt");

    auto walker = DirectoryWalker::open(tmp / "src");
    ASSERT_TRUE(walker.has_value());
    auto entries = walker->collect();

    ASSERT_EQ(entries.size(), 1u);
    EXPECT_EQ(entries[0].relativePath, "link.txt");
    EXPECT_EQ(entries[0].size, 7u);
}

TEST(DirectoryWalker, skipsSpecialFiles)
{
    TempDir tmp;
    writeFile(tmp / "src/regular.txt", "r");
    ASSERT_EQ(::mkfifo((tmp / "src/pipe").c_str(), 0600), 0);

    auto walker = DirectoryWalker::open(tmp / "src");
    ASSERT_TRUE(walker.has_value());
    EXPECT_EQ(relativePaths(walker->collect()), (std::vector<std::string>{"regular.txt"}));
    EXPECT_TRUE(walker->errors().empty());
}

TEST(DirectoryWalker, recordsUnreadableSubdirectories)
{
    if (::geteuid() == 0) {
        GTEST_SKIP() << "permission checks do not apply to root";
    }
    TempDir tmp;
    writeFile(tmp / "src/locked/secret.txt", "s");
    writeFile(tmp / "src/open.txt", "o");
    fs::permissions(tmp / "src/locked", fs::perms::none);

    auto walker = DirectoryWalker::open(tmp / "src");
    ASSERT_TRUE(walker.has_value());
    EXPECT_EQ(relativePaths(walker->collect()), (std::vector<std::string>{"open.txt"}));
    ASSERT_EQ(walker->errors().size(), 1u);
    EXPECT_EQ(walker->errors()[0].path, "locked");
    EXPECT_EQ(walker->errors()[0].kind, ErrorKind::PermissionDenied);

    fs::permissions(tmp / "src/locked", fs::perms::owner_all);
}

TEST(DirectoryWalker, missingRootIsNotFound)
{
    TempDir tmp;
    auto walker = DirectoryWalker::open(tmp / "nope");
    ASSERT_FALSE(walker.has_value());
    EXPECT_EQ(walker.error().kind, ErrorKind::NotFound);
}

TEST(DirectoryWalker, fileRootIsNotADirectory)
{
    TempDir tmp;
    writeFile(tmp / "file.txt", "x");
    auto walker = DirectoryWalker::open(tmp / "file.txt");
    ASSERT_FALSE(walker.has_value());
    EXPECT_EQ(walker.error().kind, ErrorKind::NotADirectory);
}

TEST(DirectoryWalker, rootIsAbsolute)
{
    TempDir tmp;
    fs::create_directories(tmp / "src");
    auto walker = DirectoryWalker::open(tmp / "src" / ".");
    ASSERT_TRUE(walker.has_value());
    EXPECT_TRUE(walker->root().is_absolute());
    EXPECT_TRUE(walker->collect().empty());
}

TEST(DirectoryWalker, cancelledTokenStopsCollect)
{
    TempDir tmp;
    writeFile(tmp / "src/a.txt", "a");
    writeFile(tmp / "src/b.txt", "b");

    CancellationToken token;
    auto walker = DirectoryWalker::open(tmp / "src");
    ASSERT_TRUE(walker.has_value());
    auto first = walker->next();
    ASSERT_TRUE(first.has_value());
    token.cancel();
    EXPECT_TRUE(walker->collect(&token).empty());

    CancellationToken live;
    auto fresh = DirectoryWalker::open(tmp / "src");
    ASSERT_TRUE(fresh.has_value());
    EXPECT_EQ(relativePaths(fresh->collect(&live)), (std::vector<std::string>{"a.txt", "b.txt"}));
}

TEST(DirectoryWalker, archivePathsUseForwardSlashes)
{
    EXPECT_EQ(toArchivePath(fs::path("a") / "b" / "c.txt"), "a/b/c.txt");
    EXPECT_EQ(toArchivePath("a/./b/../c.txt"), "a/c.txt");
}
