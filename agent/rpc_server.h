#pragma once

#include <atomic>
#include <chrono>
#include <condition_variable>
#include <functional>
#include <map>
#include <memory>
#include <mutex>
#include <set>
#include <string>
#include <thread>
#include <vector>
#include <nlohmann/json.hpp>
#include "rpc_protocol.h"

class Agent;

// Serves an Agent over the control channel. Each connection gets its own
// thread and heartbeat sender; calls into the agent are serialized.
class RpcServer {
public:
    using Handler = std::function<nlohmann::json(const std::string& session, const nlohmann::json& args)>;

    RpcServer(Agent& agent, int port,
              std::chrono::seconds heartbeat = std::chrono::seconds(RPC_HEARTBEAT_SECONDS));
    ~RpcServer();

    bool bind();
    // Blocks until stop() is called.
    void serve();
    // Safe to call from a signal handler.
    void stop();

    int port() const { return port_; }
    nlohmann::json handleRequest(const nlohmann::json& request);
    // Connection threads that have not been reaped yet.
    size_t workerCount();

private:
    struct Connection {
        int fd;
        std::mutex write_mutex;
        std::mutex hb_mutex;
        std::condition_variable hb_cond;
        bool open;
    };

    struct Worker {
        std::thread thread;
        std::shared_ptr<std::atomic<bool>> done;
    };

    Agent& agent_;
    int port_;
    std::chrono::seconds heartbeat_;
    int listen_fd_;
    int wake_pipe_[2];
    std::atomic<bool> running_;

    std::mutex agent_mutex_;
    std::map<std::string, Handler> methods_;

    std::mutex clients_mutex_;
    std::set<int> client_fds_;
    std::vector<Worker> workers_;

    void registerMethods();
    void handleConnection(int fd, std::shared_ptr<std::atomic<bool>> done);
    void reapWorkers();
    void heartbeatLoop(Connection& conn);
    void shutdownClients();
};
