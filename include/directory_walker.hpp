/**
 * @file directory_walker.hpp
 * @brief Deterministic, lazy enumeration of the regular files under a root directory.
 *
 * Files come out in lexicographic order of their root-relative path, so two walks of
 * an unmodified tree produce the same sequence. Symbolic links to directories are
 * followed once; a directory whose real path was already visited is skipped.
 */

#ifndef DIRECTORY_WALKER_HPP
#define DIRECTORY_WALKER_HPP

#include <cstdint>
#include <expected>
#include <filesystem>
#include <optional>
#include <set>
#include <string>
#include <system_error>
#include <vector>
#include "cancellation.hpp"
#include "vault_error.hpp"

/**
 * @brief One regular file found by the walker.
 */
struct WalkEntry {
    std::filesystem::path sourcePath; ///< Absolute path on disk.
    std::string relativePath;         ///< Root-relative, forward-slash path.
    std::uint64_t size = 0;           ///< File size at walk time.
};

/**
 * @brief Lazy depth-first walker over a directory tree.
 *
 * Restart by constructing a new walker on the same root.
 */
class DirectoryWalker {
public:
    /**
     * @brief Opens a walker on the given root.
     *
     * @param root Directory to enumerate.
     * @return std::expected<DirectoryWalker, VaultError> The walker, or NotFound,
     *         NotADirectory or PermissionDenied when the root itself is unusable.
     */
    static std::expected<DirectoryWalker, VaultError> open(const std::filesystem::path& root);

    /**
     * @brief Produces the next regular file, or std::nullopt once the tree is exhausted.
     *
     * Subdirectories that cannot be listed are recorded in errors() and skipped.
     */
    std::optional<WalkEntry> next();

    /**
     * @brief Drains the walker into a vector.
     *
     * @param token When given, polled before each entry; the scan stops early once it
     *        is cancelled and returns what was found so far.
     */
    std::vector<WalkEntry> collect(const CancellationToken* token = nullptr);

    /**
     * @brief Per-entry failures met so far.
     */
    const std::vector<RecordedError>& errors() const { return failures; }

    const std::filesystem::path& root() const { return rootDir; }

private:
    struct Child {
        std::filesystem::path path;
        std::string relativePath;
        std::string sortKey;  // relative path, plus a trailing '/' for directories
        bool isDirectory = false;
        std::uint64_t size = 0;
    };

    explicit DirectoryWalker(std::filesystem::path root);

    std::expected<std::vector<Child>, std::error_code> list(const std::filesystem::path& dir,
                                                             const std::string& prefix);
    void push(std::vector<Child> children);

    std::filesystem::path rootDir;
    std::vector<Child> pending;               // reverse-sorted stack, next item at the back
    std::set<std::filesystem::path> visited;  // canonical paths of entered directories
    std::vector<RecordedError> failures;
};

/**
 * @brief Converts a relative filesystem path to the archive's forward-slash form.
 */
std::string toArchivePath(const std::filesystem::path& relative);

#endif // DIRECTORY_WALKER_HPP
