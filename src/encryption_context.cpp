#include "encryption_context.hpp"
#include <archive.h>
#include <map>
#include <mutex>

bool encryptionSupported(const std::string& method) {
    static std::mutex cacheMutex;
    static std::map<std::string, bool> cache;

    std::lock_guard<std::mutex> lock(cacheMutex);
    auto it = cache.find(method);
    if (it != cache.end()) {
        return it->second;
    }

    struct archive* a = archive_write_new();
    bool supported = false;
    if (a && archive_write_set_format_zip(a) == ARCHIVE_OK) {
        supported = archive_write_set_format_option(a, "zip", "encryption", method.c_str()) == ARCHIVE_OK;
    }
    if (a) {
        archive_write_free(a);
    }
    cache.emplace(method, supported);
    return supported;
}
