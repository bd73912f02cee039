#pragma once

#include <atomic>
#include <chrono>
#include <condition_variable>
#include <deque>
#include <functional>
#include <mutex>
#include <optional>
#include <string>
#include <thread>

class ConsoleDevice;

// Reads the target console in the background, keeps the most recent lines
// and forwards everything it reads to an optional sink.
class ConsoleLogger {
public:
    using Sink = std::function<void(const std::string& data)>;

    static constexpr size_t DEFAULT_MAX_LINES = 1000;
    static constexpr const char* DEFAULT_PROMPT = "=> ";

    explicit ConsoleLogger(ConsoleDevice& console, size_t max_lines = DEFAULT_MAX_LINES);
    ~ConsoleLogger();

    void start();
    void stop();
    // False once stopped or after the reader gave up on a console error.
    bool isRunning() const { return running_; }
    void setSink(Sink sink);

    // Feeds bytes received from the console.
    void process(const std::string& data);

    void clear();
    std::string flush();
    std::string head();
    std::string tail();
    size_t lines();
    std::string prompt(const std::optional<std::string>& new_prompt = std::nullopt);
    // Sends cmd and collects its output up to the next prompt. Returns nullopt
    // when the command cannot be sent or no prompt shows up within timeout.
    std::optional<std::string> run(const std::string& cmd, std::chrono::milliseconds timeout);
    bool write(const std::string& data);

    bool toggleTimestamps();
    bool timestamps() const { return timestamps_; }
    void pause();
    void resume();
    void resetTimer();

private:
    ConsoleDevice& console_;
    size_t max_lines_;
    std::string prompt_;

    std::mutex mutex_;
    std::condition_variable rx_cond_;
    std::deque<std::string> lines_;
    std::string partial_;

    std::mutex sink_mutex_;
    Sink sink_;
    bool at_line_start_;

    std::atomic<bool> running_;
    std::atomic<bool> paused_;
    std::atomic<bool> timestamps_;
    std::chrono::steady_clock::time_point time_origin_;
    std::thread reader_thread_;

    void readerLoop();
    void forward(const std::string& data);
    std::string timestamp() const;
};
