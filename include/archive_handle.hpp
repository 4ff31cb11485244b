/**
 * @file archive_handle.hpp
 * @brief RAII ownership of a libarchive read or write object.
 *
 * An ArchiveHandle is exclusively owned by the operation that created it and frees
 * the underlying struct archive on every exit path.
 */

#ifndef ARCHIVE_HANDLE_HPP
#define ARCHIVE_HANDLE_HPP

#include <string>

struct archive;

/**
 * @brief Move-only owner of a struct archive.
 */
class ArchiveHandle {
public:
    enum class Mode { Read, Write };

    ArchiveHandle() = default;

    /**
     * @brief Allocates a new libarchive reader.
     */
    static ArchiveHandle forRead();

    /**
     * @brief Allocates a new libarchive writer.
     */
    static ArchiveHandle forWrite();

    ArchiveHandle(const ArchiveHandle&) = delete;
    ArchiveHandle& operator=(const ArchiveHandle&) = delete;
    ArchiveHandle(ArchiveHandle&& other) noexcept;
    ArchiveHandle& operator=(ArchiveHandle&& other) noexcept;
    ~ArchiveHandle();

    struct archive* get() const { return handle; }
    explicit operator bool() const { return handle != nullptr; }

    /**
     * @brief Closes and frees the archive now. For writers this flushes the trailer.
     *
     * @param error Receives the libarchive message when the close fails.
     * @return int The libarchive status of the close call (ARCHIVE_OK when nothing was open).
     */
    int close(std::string* error = nullptr);

    /**
     * @brief Frees the archive without checking the close status.
     */
    void reset();

    /**
     * @brief Last libarchive error message, or "unknown error".
     */
    std::string lastError() const;

private:
    ArchiveHandle(struct archive* handle, Mode mode) : handle(handle), mode(mode) {}

    struct archive* handle = nullptr;
    Mode mode = Mode::Read;
};

#endif // ARCHIVE_HANDLE_HPP
