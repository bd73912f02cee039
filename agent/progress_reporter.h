#pragma once

#include <cstdint>
#include <ostream>
#include <string>

class Session;

struct Progress {
    int percent;
    int filled;
};

constexpr int PROGRESS_BAR_WIDTH = 20;

// total must be greater than zero.
Progress computeProgress(uint64_t bytes_read, uint64_t total);
std::string formatSize(uint64_t bytes);
std::string renderProgress(const std::string& label, uint64_t bytes_read, uint64_t total,
                           uint64_t bytes_written);

// Redraws a single status line while an image is streamed to the SD card.
class ProgressReporter {
public:
    ProgressReporter(Session& session, std::ostream& out);

    void report(const std::string& label, uint64_t bytes_read, uint64_t total);
    void finish();

private:
    Session& session_;
    std::ostream& out_;
};
