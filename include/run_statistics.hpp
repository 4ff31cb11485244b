/**
 * @file run_statistics.hpp
 * @brief Data model shared by the backup and restore pipelines.
 *
 * Holds the per-entry metadata, the per-run counters and the reports handed back
 * to the caller once an operation ends.
 */

#ifndef RUN_STATISTICS_HPP
#define RUN_STATISTICS_HPP

#include <cstdint>
#include <filesystem>
#include <string>
#include <utility>
#include <vector>
#include "vault_error.hpp"

/**
 * @brief Metadata of one entry inside an archive.
 */
struct ArchiveEntry {
    std::string relativePath;           ///< Normalized forward-slash path, unique within the archive.
    std::uint64_t uncompressedSize = 0; ///< Original file size.
    std::uint64_t compressedSize = 0;   ///< Bytes the entry occupies in the container (0 when unknown).
    bool isEncrypted = false;           ///< True when the entry data is encrypted.
};

/**
 * @brief Counters of a single run, owned by the pipeline loop.
 *
 * Reset for each run and never persisted. Progress reporters only ever see it
 * through a const reference.
 */
struct RunStatistics {
    std::uint64_t filesTotal = 0;       ///< Items planned for this run.
    std::uint64_t bytesTotal = 0;       ///< Bytes planned for this run.
    std::uint64_t filesProcessed = 0;   ///< Items completed.
    std::uint64_t bytesProcessed = 0;   ///< Original bytes (backup) or extracted bytes (restore).
    std::vector<RecordedError> errors;  ///< Per-item failures, in the order they happened.

    /**
     * @brief Appends a per-item failure.
     */
    void record(std::string path, ErrorKind kind, std::string reason) {
        errors.push_back(RecordedError{std::move(path), kind, std::move(reason)});
    }

    /**
     * @brief Progress in percent of planned files (0 when nothing is planned).
     */
    double progressPercent() const {
        if (filesTotal == 0) {
            return 0.0;
        }
        return static_cast<double>(filesProcessed) / static_cast<double>(filesTotal) * 100.0;
    }
};

/**
 * @brief Terminal outcome of an operation that did not fail fatally.
 */
enum class Outcome {
    Completed,            ///< Every planned item was processed.
    CompletedWithErrors,  ///< Finished, but some items were recorded as errors.
    Cancelled             ///< Interrupted; the documented cleanup ran.
};

/**
 * @brief Result of a backup run.
 */
struct BackupReport {
    Outcome outcome = Outcome::Completed;
    RunStatistics stats;
    std::filesystem::path archivePath;  ///< Final archive location (absent when cancelled).
    std::uint64_t archiveSize = 0;      ///< Size of the finished archive file.
    bool encrypted = false;

    /**
     * @brief 1 - archiveSize / bytesProcessed. Negative for incompressible input.
     */
    double compressionRatio() const {
        if (stats.bytesProcessed == 0) {
            return 0.0;
        }
        return 1.0 - static_cast<double>(archiveSize) / static_cast<double>(stats.bytesProcessed);
    }
};

/**
 * @brief Result of a restore run.
 */
struct RestoreReport {
    Outcome outcome = Outcome::Completed;
    RunStatistics stats;
    std::filesystem::path outputDir;
    bool encrypted = false;
};

/**
 * @brief Completed or CompletedWithErrors, depending on recorded errors.
 */
inline Outcome outcomeFor(const RunStatistics& stats) {
    return stats.errors.empty() ? Outcome::Completed : Outcome::CompletedWithErrors;
}

#endif // RUN_STATISTICS_HPP
