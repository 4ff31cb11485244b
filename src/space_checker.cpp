#include "space_checker.hpp"
#include <format>
#include <utility>

namespace fs = std::filesystem;

std::expected<std::uint64_t, std::string> filesystemFreeSpace(const fs::path& path) {
    std::error_code ec;
    auto info = fs::space(path, ec);
    if (ec) {
        return std::unexpected(std::format("Failed to query free space for {}: {}", path.string(), ec.message()));
    }
    return static_cast<std::uint64_t>(info.available);
}

SpaceChecker::SpaceChecker(const VaultConfig& config, FreeSpaceProbe probe)
    : config(config), probe(std::move(probe)) {}

fs::path SpaceChecker::existingAncestor(const fs::path& path) {
    std::error_code ec;
    fs::path current = fs::absolute(path, ec);
    if (ec) {
        current = path;
    }
    current = current.lexically_normal();
    while (!current.empty()) {
        if (fs::is_directory(current, ec)) {
            return current;
        }
        if (current == current.parent_path()) {
            break;
        }
        current = current.parent_path();
    }
    return fs::current_path(ec);
}

std::expected<void, VaultError> SpaceChecker::ensure(std::uint64_t requiredBytes, const fs::path& destination) const {
    fs::path volume = existingAncestor(destination);
    auto available = probe(volume);
    if (!available) {
        config.logError(std::format("Warning: {}; skipping space check.", available.error()));
        return {};
    }
    if (*available < requiredBytes) {
        config.logError(std::format("Insufficient disk space at {}: required {} bytes, available {} bytes",
                                    volume.string(), requiredBytes, *available));
        return std::unexpected(makeSpaceError(requiredBytes, *available));
    }
    return {};
}
