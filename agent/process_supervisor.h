#pragma once

#include <functional>
#include <memory>
#include <string>
#include <thread>
#include <sys/types.h>

class Agent;
class RpcServer;

// Exclusive advisory lock on the daemon pid file.
class PidLock {
public:
    explicit PidLock(const std::string& path);
    ~PidLock();

    PidLock(const PidLock&) = delete;
    PidLock& operator=(const PidLock&) = delete;

    bool acquire();
    bool writePid(pid_t pid);
    void release();
    bool isHeld() const { return fd_ >= 0; }
    const std::string& path() const { return path_; }

private:
    std::string path_;
    int fd_;
};

// Runs the agent either inside the CLI process or as the long-lived daemon
// that serves remote sessions.
class ProcessSupervisor {
public:
    using ServerFactory = std::function<std::unique_ptr<RpcServer>(Agent& agent)>;

    static constexpr const char* DEFAULT_PID_FILE = "/var/run/mtda.pid";
    static constexpr const char* DEFAULT_LOG_FILE = "/var/log/mtda.log";

    ProcessSupervisor(Agent& agent, ServerFactory factory);
    ~ProcessSupervisor();

    bool startForeground();
    bool startDaemon(const std::string& log_path, const std::string& pid_path, bool detach = true);
    int serve();
    void terminate();

    // An embedded supervisor leaves stdio, the working directory and signal
    // dispositions to the hosting process.
    void setEmbedded(bool embedded) { embedded_ = embedded; }

private:
    Agent& agent_;
    ServerFactory factory_;
    std::unique_ptr<PidLock> pid_lock_;
    std::unique_ptr<RpcServer> server_;
    int log_fd_;
    int saved_fds_[3];
    int signal_pipe_[2];
    bool embedded_;
    bool terminated_;

    bool detachProcess();
    bool redirectOutput(const std::string& log_path);
    void restoreOutput();
    bool installSignalHandlers();
    void restoreSignalHandlers();
    void closeSignalPipe();
};
