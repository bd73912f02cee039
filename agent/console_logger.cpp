#include "console_logger.h"
#include "console_device.h"
#include <cstdio>
#include <iostream>

ConsoleLogger::ConsoleLogger(ConsoleDevice& console, size_t max_lines)
    : console_(console)
    , max_lines_(max_lines > 0 ? max_lines : DEFAULT_MAX_LINES)
    , prompt_(DEFAULT_PROMPT)
    , at_line_start_(true)
    , running_(false)
    , paused_(false)
    , timestamps_(false)
    , time_origin_(std::chrono::steady_clock::now()) {
}

ConsoleLogger::~ConsoleLogger() {
    stop();
}

void ConsoleLogger::start() {
    if (running_) {
        return;
    }
    if (reader_thread_.joinable()) {
        reader_thread_.join();
    }
    running_ = true;
    reader_thread_ = std::thread(&ConsoleLogger::readerLoop, this);
}

void ConsoleLogger::stop() {
    running_ = false;
    if (reader_thread_.joinable()) {
        reader_thread_.join();
    }
}

void ConsoleLogger::setSink(Sink sink) {
    std::lock_guard<std::mutex> lock(sink_mutex_);
    sink_ = std::move(sink);
}

void ConsoleLogger::readerLoop() {
    char buffer[1024];
    while (running_) {
        ssize_t n = console_.read(buffer, sizeof(buffer), 200);
        if (n < 0) {
            std::cerr << "[ConsoleLogger] Console read error, stopping reader" << std::endl;
            running_ = false;
            break;
        }
        if (n > 0 && !paused_) {
            process(std::string(buffer, static_cast<size_t>(n)));
        }
    }
}

void ConsoleLogger::process(const std::string& data) {
    {
        std::lock_guard<std::mutex> lock(mutex_);
        for (char c : data) {
            partial_.push_back(c);
            if (c == '\n') {
                lines_.push_back(std::move(partial_));
                partial_.clear();
                if (lines_.size() > max_lines_) {
                    lines_.pop_front();
                }
            }
        }
    }
    rx_cond_.notify_all();
    forward(data);
}

void ConsoleLogger::forward(const std::string& data) {
    std::lock_guard<std::mutex> lock(sink_mutex_);
    if (!sink_) {
        return;
    }
    if (!timestamps_) {
        sink_(data);
        return;
    }

    std::string out;
    for (char c : data) {
        if (at_line_start_) {
            out += timestamp();
            at_line_start_ = false;
        }
        out.push_back(c);
        if (c == '\n') {
            at_line_start_ = true;
        }
    }
    sink_(out);
}

std::string ConsoleLogger::timestamp() const {
    auto elapsed = std::chrono::duration_cast<std::chrono::microseconds>(
        std::chrono::steady_clock::now() - time_origin_).count();
    char buf[32];
    std::snprintf(buf, sizeof(buf), "[%4lld.%06lld] ",
                  static_cast<long long>(elapsed / 1000000),
                  static_cast<long long>(elapsed % 1000000));
    return buf;
}

void ConsoleLogger::clear() {
    std::lock_guard<std::mutex> lock(mutex_);
    lines_.clear();
    partial_.clear();
}

std::string ConsoleLogger::flush() {
    std::lock_guard<std::mutex> lock(mutex_);
    std::string data;
    for (const auto& line : lines_) {
        data += line;
    }
    data += partial_;
    lines_.clear();
    partial_.clear();
    return data;
}

std::string ConsoleLogger::head() {
    std::lock_guard<std::mutex> lock(mutex_);
    if (lines_.empty()) {
        return "";
    }
    std::string line = std::move(lines_.front());
    lines_.pop_front();
    return line;
}

std::string ConsoleLogger::tail() {
    std::lock_guard<std::mutex> lock(mutex_);
    if (lines_.empty()) {
        return "";
    }
    std::string line = std::move(lines_.back());
    lines_.pop_back();
    return line;
}

size_t ConsoleLogger::lines() {
    std::lock_guard<std::mutex> lock(mutex_);
    return lines_.size();
}

std::string ConsoleLogger::prompt(const std::optional<std::string>& new_prompt) {
    std::lock_guard<std::mutex> lock(mutex_);
    if (new_prompt) {
        prompt_ = *new_prompt;
    }
    return prompt_;
}

std::optional<std::string> ConsoleLogger::run(const std::string& cmd, std::chrono::milliseconds timeout) {
    std::unique_lock<std::mutex> lock(mutex_);
    lines_.clear();
    partial_.clear();
    lock.unlock();

    if (!write(cmd + "\n")) {
        std::cerr << "[ConsoleLogger] Failed to send '" << cmd << "'" << std::endl;
        return std::nullopt;
    }

    lock.lock();
    auto prompt_seen = [this] {
        return !prompt_.empty() && partial_.size() >= prompt_.size() &&
               partial_.compare(partial_.size() - prompt_.size(), prompt_.size(), prompt_) == 0;
    };
    if (!rx_cond_.wait_for(lock, timeout, prompt_seen)) {
        std::cerr << "[ConsoleLogger] Timed out waiting for prompt after '" << cmd << "'" << std::endl;
        return std::nullopt;
    }

    // The first line received is the echo of the command itself.
    if (!lines_.empty() && lines_.front().compare(0, cmd.size(), cmd) == 0) {
        lines_.pop_front();
    }
    std::string output;
    for (const auto& line : lines_) {
        output += line;
    }
    lines_.clear();
    partial_.clear();
    return output;
}

bool ConsoleLogger::write(const std::string& data) {
    return console_.write(data);
}

bool ConsoleLogger::toggleTimestamps() {
    std::lock_guard<std::mutex> lock(sink_mutex_);
    timestamps_ = !timestamps_;
    at_line_start_ = true;
    return timestamps_;
}

void ConsoleLogger::pause() {
    paused_ = true;
}

void ConsoleLogger::resume() {
    paused_ = false;
}

void ConsoleLogger::resetTimer() {
    std::lock_guard<std::mutex> lock(sink_mutex_);
    time_origin_ = std::chrono::steady_clock::now();
}
