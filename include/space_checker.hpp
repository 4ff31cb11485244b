/**
 * @file space_checker.hpp
 * @brief Pre-flight free space check for backup and restore destinations.
 *
 * The check is advisory: it compares a conservative byte requirement against the
 * free space reported for the destination volume before anything is written.
 * Concurrent disk usage can still make a run fail later.
 */

#ifndef SPACE_CHECKER_HPP
#define SPACE_CHECKER_HPP

#include <cstdint>
#include <expected>
#include <filesystem>
#include <functional>
#include <string>
#include "vault_config.hpp"
#include "vault_error.hpp"

/**
 * @brief Environment capability returning free bytes on the volume holding a path.
 */
using FreeSpaceProbe = std::function<std::expected<std::uint64_t, std::string>(const std::filesystem::path&)>;

/**
 * @brief Default probe backed by std::filesystem::space.
 */
std::expected<std::uint64_t, std::string> filesystemFreeSpace(const std::filesystem::path& path);

/**
 * @brief Compares required bytes against the free space at a destination.
 */
class SpaceChecker {
public:
    /**
     * @brief Constructs a checker.
     *
     * @param config Configuration used for logging.
     * @param probe Free space capability supplied by the environment.
     */
    SpaceChecker(const VaultConfig& config, FreeSpaceProbe probe = filesystemFreeSpace);

    /**
     * @brief Verifies that the destination volume can take requiredBytes.
     *
     * The destination may not exist yet; its nearest existing ancestor is queried.
     *
     * @param requiredBytes Sum of source file sizes (backup) or uncompressed entry sizes (restore).
     * @param destination Output file or directory.
     * @return std::expected<void, VaultError> Success, or InsufficientSpace carrying both figures.
     *         A probe failure is logged and treated as success.
     */
    std::expected<void, VaultError> ensure(std::uint64_t requiredBytes,
                                           const std::filesystem::path& destination) const;

    /**
     * @brief Nearest existing directory at or above path.
     */
    static std::filesystem::path existingAncestor(const std::filesystem::path& path);

private:
    const VaultConfig& config;
    FreeSpaceProbe probe;
};

#endif // SPACE_CHECKER_HPP
