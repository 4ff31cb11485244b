/**
 * @file directory_walker.cpp
 * @brief Sorted depth-first directory enumeration for the backup pipeline.
 */

#include "directory_walker.hpp"
#include <algorithm>
#include <format>
#include <utility>

namespace fs = std::filesystem;

namespace {

ErrorKind kindFor(const std::error_code& ec) {
    if (ec == std::errc::permission_denied || ec == std::errc::operation_not_permitted) {
        return ErrorKind::PermissionDenied;
    }
    if (ec == std::errc::no_such_file_or_directory) {
        return ErrorKind::NotFound;
    }
    return ErrorKind::IoError;
}

} // namespace

std::string toArchivePath(const fs::path& relative) {
    return relative.lexically_normal().generic_string();
}

DirectoryWalker::DirectoryWalker(fs::path root) : rootDir(std::move(root)) {}

std::expected<DirectoryWalker, VaultError> DirectoryWalker::open(const fs::path& root) {
    std::error_code ec;
    auto status = fs::status(root, ec);
    if (ec || !fs::exists(status)) {
        if (ec && kindFor(ec) == ErrorKind::PermissionDenied) {
            return std::unexpected(makeError(ErrorKind::PermissionDenied,
                                             std::format("Cannot access source directory: {}", root.string())));
        }
        return std::unexpected(makeError(ErrorKind::NotFound,
                                         std::format("Source directory not found: {}", root.string())));
    }
    if (!fs::is_directory(status)) {
        return std::unexpected(makeError(ErrorKind::NotADirectory,
                                         std::format("Path is not a directory: {}", root.string())));
    }

    fs::path absoluteRoot = fs::absolute(root, ec).lexically_normal();
    if (ec) {
        return std::unexpected(makeError(ErrorKind::IoError,
                                         std::format("Cannot resolve {}: {}", root.string(), ec.message())));
    }

    DirectoryWalker walker(absoluteRoot);
    fs::path real = fs::canonical(absoluteRoot, ec);
    walker.visited.insert(ec ? absoluteRoot : real);

    auto children = walker.list(absoluteRoot, "");
    if (!children) {
        return std::unexpected(makeError(kindFor(children.error()),
                                         std::format("Cannot list source directory {}: {}",
                                                     absoluteRoot.string(), children.error().message())));
    }
    walker.push(std::move(*children));
    return walker;
}

std::expected<std::vector<DirectoryWalker::Child>, std::error_code>
DirectoryWalker::list(const fs::path& dir, const std::string& prefix) {
    std::vector<Child> children;
    std::error_code ec;
    fs::directory_iterator it(dir, ec);
    if (ec) {
        return std::unexpected(ec);
    }

    for (; it != fs::directory_iterator(); it.increment(ec)) {
        if (ec) {
            return std::unexpected(ec);
        }
        const auto& entry = *it;
        std::error_code statusEc;
        // Follows symlinks; a dangling link has no usable status and is ignored.
        auto status = entry.status(statusEc);
        if (statusEc) {
            continue;
        }

        Child child;
        child.path = entry.path();
        child.relativePath = toArchivePath(fs::path(prefix) / entry.path().filename());
        if (fs::is_directory(status)) {
            child.isDirectory = true;
            child.sortKey = child.relativePath + "/";
        } else if (fs::is_regular_file(status)) {
            std::error_code sizeEc;
            auto size = fs::file_size(entry.path(), sizeEc);
            if (sizeEc) {
                failures.push_back(RecordedError{child.relativePath, kindFor(sizeEc), sizeEc.message()});
                continue;
            }
            child.size = size;
            child.sortKey = child.relativePath;
        } else {
            continue; // sockets, fifos, devices
        }
        children.push_back(std::move(child));
    }
    if (ec) {
        return std::unexpected(ec);
    }

    std::ranges::sort(children, [](const Child& a, const Child& b) { return a.sortKey < b.sortKey; });
    return children;
}

void DirectoryWalker::push(std::vector<Child> children) {
    for (auto it = children.rbegin(); it != children.rend(); ++it) {
        pending.push_back(std::move(*it));
    }
}

std::optional<WalkEntry> DirectoryWalker::next() {
    while (!pending.empty()) {
        Child child = std::move(pending.back());
        pending.pop_back();

        if (!child.isDirectory) {
            return WalkEntry{child.path, child.relativePath, child.size};
        }

        std::error_code ec;
        fs::path real = fs::canonical(child.path, ec);
        if (ec) {
            failures.push_back(RecordedError{child.relativePath, kindFor(ec), ec.message()});
            continue;
        }
        if (!visited.insert(real).second) {
            continue; // symlink cycle or second route to the same directory
        }

        auto grandChildren = list(child.path, child.relativePath + "/");
        if (!grandChildren) {
            failures.push_back(RecordedError{child.relativePath, kindFor(grandChildren.error()),
                                            std::format("Cannot list directory: {}", grandChildren.error().message())});
            continue;
        }
        push(std::move(*grandChildren));
    }
    return std::nullopt;
}

std::vector<WalkEntry> DirectoryWalker::collect(const CancellationToken* token) {
    std::vector<WalkEntry> entries;
    while (!(token && token->cancelled())) {
        auto entry = next();
        if (!entry) {
            break;
        }
        entries.push_back(std::move(*entry));
    }
    return entries;
}
