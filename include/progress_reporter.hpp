/**
 * @file progress_reporter.hpp
 * @brief Progress rendering for the backup and restore pipelines.
 *
 * Reporters only read RunStatistics. ProgressThrottle decides when the pipeline
 * calls a reporter: after every Nth completed entry and once more at the end.
 */

#ifndef PROGRESS_REPORTER_HPP
#define PROGRESS_REPORTER_HPP

#include <cstdint>
#include <cstdio>
#include <string>
#include "run_statistics.hpp"

/**
 * @brief Which pipeline a progress update comes from.
 */
enum class Phase {
    Backup,
    Restore
};

/**
 * @brief Interface for progress reporting strategies.
 */
class ProgressReporter {
public:
    /**
     * @brief Virtual destructor for safe polymorphism.
     */
    virtual ~ProgressReporter() = default;

    /**
     * @brief Renders an intermediate update.
     *
     * @param phase Pipeline emitting the update.
     * @param stats Snapshot of the run counters.
     */
    virtual void update(Phase phase, const RunStatistics& stats) = 0;

    /**
     * @brief Renders the final update of a run, whatever its outcome.
     */
    virtual void finish(Phase phase, const RunStatistics& stats) = 0;
};

/**
 * @brief Single-line console reporter ("\rBacking up: 10/200 files (5.0%) - 1.20 MB").
 */
class ConsoleProgressReporter : public ProgressReporter {
public:
    /**
     * @brief Constructs a console reporter.
     *
     * @param out Stream to write to (stdout by default).
     */
    explicit ConsoleProgressReporter(std::FILE* out = stdout);

    void update(Phase phase, const RunStatistics& stats) override;
    void finish(Phase phase, const RunStatistics& stats) override;

private:
    std::FILE* out;
};

/**
 * @brief Calls a reporter after every Nth completed entry and at completion.
 */
class ProgressThrottle {
public:
    /**
     * @brief Constructs a throttle.
     *
     * @param reporter Reporter to drive; may be null for no reporting.
     * @param phase Pipeline the updates belong to.
     * @param interval Report after every interval completed entries (at least 1).
     */
    ProgressThrottle(ProgressReporter* reporter, Phase phase, int interval);

    /**
     * @brief Notifies that one more entry completed; reports when due.
     */
    void entryCompleted(const RunStatistics& stats);

    /**
     * @brief Emits the final update exactly once.
     */
    void complete(const RunStatistics& stats);

private:
    ProgressReporter* reporter;
    Phase phase;
    std::uint64_t interval;
    std::uint64_t sinceLast = 0;
    bool finished = false;
};

/**
 * @brief Formats a byte count with B/KB/MB/GB/TB/PB units and two decimals.
 */
std::string formatSize(std::uint64_t bytes);

/**
 * @brief Renders one progress line without the leading carriage return.
 */
std::string renderProgressLine(Phase phase, const RunStatistics& stats);

#endif // PROGRESS_REPORTER_HPP
