#include "archive_handle.hpp"
#include <archive.h>
#include <utility>

ArchiveHandle ArchiveHandle::forRead() {
    return ArchiveHandle(archive_read_new(), Mode::Read);
}

ArchiveHandle ArchiveHandle::forWrite() {
    return ArchiveHandle(archive_write_new(), Mode::Write);
}

ArchiveHandle::ArchiveHandle(ArchiveHandle&& other) noexcept
    : handle(std::exchange(other.handle, nullptr)), mode(other.mode) {}

ArchiveHandle& ArchiveHandle::operator=(ArchiveHandle&& other) noexcept {
    if (this != &other) {
        reset();
        handle = std::exchange(other.handle, nullptr);
        mode = other.mode;
    }
    return *this;
}

ArchiveHandle::~ArchiveHandle() {
    reset();
}

int ArchiveHandle::close(std::string* error) {
    if (!handle) {
        return ARCHIVE_OK;
    }
    int result = mode == Mode::Write ? archive_write_close(handle) : archive_read_close(handle);
    if (result != ARCHIVE_OK && error) {
        *error = lastError();
    }
    reset();
    return result;
}

void ArchiveHandle::reset() {
    if (!handle) {
        return;
    }
    if (mode == Mode::Write) {
        archive_write_free(handle);
    } else {
        archive_read_free(handle);
    }
    handle = nullptr;
}

std::string ArchiveHandle::lastError() const {
    const char* message = handle ? archive_error_string(handle) : nullptr;
    return message ? message : "unknown error";
}
