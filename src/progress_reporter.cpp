#include "progress_reporter.hpp"
#include <algorithm>
#include <array>
#include <format>
#include <print>

std::string formatSize(std::uint64_t bytes) {
    static constexpr std::array<const char*, 5> units = {"B", "KB", "MB", "GB", "TB"};
    double size = static_cast<double>(bytes);
    for (const char* unit : units) {
        if (size < 1024.0) {
            return std::format("{:.2f} {}", size, unit);
        }
        size /= 1024.0;
    }
    return std::format("{:.2f} PB", size);
}

std::string renderProgressLine(Phase phase, const RunStatistics& stats) {
    const char* verb = phase == Phase::Backup ? "Backing up" : "Extracting";
    std::string line = std::format("{}: {}/{} files ({:.1f}%) - {}", verb, stats.filesProcessed, stats.filesTotal,
                                   std::min(stats.progressPercent(), 100.0), formatSize(stats.bytesProcessed));
    if (phase == Phase::Restore) {
        line += std::format("/{}", formatSize(stats.bytesTotal));
    }
    if (!stats.errors.empty()) {
        line += std::format(", {} error(s)", stats.errors.size());
    }
    return line;
}

ConsoleProgressReporter::ConsoleProgressReporter(std::FILE* out) : out(out) {}

void ConsoleProgressReporter::update(Phase phase, const RunStatistics& stats) {
    std::print(out, "\r{}", renderProgressLine(phase, stats));
    std::fflush(out);
}

void ConsoleProgressReporter::finish(Phase phase, const RunStatistics& stats) {
    std::println(out, "\r{}", renderProgressLine(phase, stats));
    std::fflush(out);
}

ProgressThrottle::ProgressThrottle(ProgressReporter* reporter, Phase phase, int interval)
    : reporter(reporter), phase(phase), interval(static_cast<std::uint64_t>(std::max(interval, 1))) {}

void ProgressThrottle::entryCompleted(const RunStatistics& stats) {
    if (!reporter || finished) {
        return;
    }
    if (++sinceLast >= interval) {
        sinceLast = 0;
        reporter->update(phase, stats);
    }
}

void ProgressThrottle::complete(const RunStatistics& stats) {
    if (!reporter || finished) {
        return;
    }
    finished = true;
    reporter->finish(phase, stats);
}
