#include "progress_reporter.h"
#include "session.h"
#include <cstdint>
#include <cstdio>

Progress computeProgress(uint64_t bytes_read, uint64_t total) {
    // Scale down huge sizes so bytes_read * 100 cannot overflow.
    while (bytes_read > UINT64_MAX / 100 || total > UINT64_MAX / 2) {
        bytes_read >>= 1;
        total >>= 1;
    }

    Progress progress;
    if (total == 0) {
        progress.percent = 100;
    } else {
        progress.percent = static_cast<int>((bytes_read * 100 + total / 2) / total);
    }
    progress.filled = (PROGRESS_BAR_WIDTH * progress.percent + 50) / 100;
    if (progress.filled > PROGRESS_BAR_WIDTH) {
        progress.filled = PROGRESS_BAR_WIDTH;
    }
    return progress;
}

std::string formatSize(uint64_t bytes) {
    static const char* units[] = {"KiB", "MiB", "GiB"};

    if (bytes < 1024) {
        return std::to_string(bytes) + " B";
    }

    double value = static_cast<double>(bytes) / 1024.0;
    size_t unit = 0;
    while (value >= 1024.0 && unit + 1 < sizeof(units) / sizeof(units[0])) {
        value /= 1024.0;
        unit++;
    }

    char buf[32];
    snprintf(buf, sizeof(buf), "%.1f %s", value, units[unit]);
    return buf;
}

std::string renderProgress(const std::string& label, uint64_t bytes_read, uint64_t total,
                           uint64_t bytes_written) {
    Progress progress = computeProgress(bytes_read, total);
    std::string bar(progress.filled, '#');
    bar.append(PROGRESS_BAR_WIDTH - progress.filled, ' ');

    return "\r" + label + ": [" + bar + "] " + std::to_string(progress.percent) + "% ("
         + formatSize(bytes_written) + " written)";
}

ProgressReporter::ProgressReporter(Session& session, std::ostream& out)
    : session_(session)
    , out_(out) {
}

void ProgressReporter::report(const std::string& label, uint64_t bytes_read, uint64_t total) {
    if (total == 0) {
        return;
    }
    out_ << renderProgress(label, bytes_read, total, session_.sdBytesWritten()) << std::flush;
}

void ProgressReporter::finish() {
    out_ << std::endl;
}
