#pragma once

#include <chrono>
#include <string>
#include <nlohmann/json.hpp>

// Control channel framing: one JSON object per line.
//   request   {"id": 7, "method": "target_toggle", "session": "me@host", "args": {...}}
//   response  {"id": 7, "result": ...}  or  {"id": 7, "error": "..."}
//   heartbeat {"hb": true}

constexpr int RPC_HEARTBEAT_SECONDS = 20;

// A peer that stayed silent for this many heartbeat periods is dead.
constexpr int RPC_HEARTBEAT_LIVENESS = 2;

nlohmann::json makeHeartbeatFrame();
bool isHeartbeatFrame(const nlohmann::json& frame);

// Serializes frame and writes it followed by '\n'. Invalid UTF-8 in strings
// is replaced rather than rejected.
bool sendFrame(int fd, const nlohmann::json& frame);

class LineReader {
public:
    enum class Status { Line, Timeout, Closed, Error };

    explicit LineReader(int fd) : fd_(fd) {}

    // Waits at most timeout for a complete line.
    Status readLine(std::string& line, std::chrono::milliseconds timeout);

private:
    int fd_;
    std::string buffer_;
};
