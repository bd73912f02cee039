#pragma once

#include <chrono>
#include <condition_variable>
#include <cstdint>
#include <memory>
#include <mutex>
#include <string>
#include <thread>
#include <nlohmann/json.hpp>
#include "rpc_protocol.h"

// Client end of the control channel. One call is outstanding at a time; a
// background thread only emits heartbeats so the agent keeps the connection.
// Any transport failure throws TransportError and poisons the channel: every
// later call fails the same way without reconnecting.
class RpcChannel {
public:
    RpcChannel(const std::string& host, int port,
               std::chrono::seconds heartbeat = std::chrono::seconds(RPC_HEARTBEAT_SECONDS));
    ~RpcChannel();

    nlohmann::json call(const std::string& method, const std::string& session,
                        const nlohmann::json& args = nlohmann::json::object());
    void close();

    bool isConnected() const { return fd_ >= 0; }
    std::string endpoint() const { return host_ + ":" + std::to_string(port_); }

private:
    std::string host_;
    int port_;
    std::chrono::seconds heartbeat_;

    int fd_;
    std::unique_ptr<LineReader> reader_;
    std::mutex write_mutex_;
    uint64_t next_id_;
    bool broken_;
    std::string broken_reason_;

    // Heartbeat sender
    std::mutex hb_mutex_;
    std::condition_variable hb_cond_;
    bool hb_running_;
    std::thread heartbeat_thread_;

    void connect();
    void heartbeatLoop();
    void fail(const std::string& reason);
};
