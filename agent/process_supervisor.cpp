#include "process_supervisor.h"
#include "agent.h"
#include "rpc_server.h"
#include <cerrno>
#include <csignal>
#include <cstdio>
#include <cstring>
#include <iostream>
#include <fcntl.h>
#include <sys/file.h>
#include <unistd.h>

// Write end of the self-pipe; the only state signal handlers touch.
static volatile sig_atomic_t g_signal_fd = -1;

static void onTerminateSignal(int signo) {
    int saved_errno = errno;
    int fd = g_signal_fd;
    if (fd >= 0) {
        unsigned char c = static_cast<unsigned char>(signo);
        ssize_t n = ::write(fd, &c, 1);
        (void)n;
    }
    errno = saved_errno;
}

/*==================  PidLock  ==================*/

PidLock::PidLock(const std::string& path)
    : path_(path)
    , fd_(-1) {
}

PidLock::~PidLock() {
    release();
}

bool PidLock::acquire() {
    if (fd_ >= 0) {
        return true;
    }

    int fd = ::open(path_.c_str(), O_RDWR | O_CREAT | O_CLOEXEC, 0644);
    if (fd < 0) {
        std::cerr << "[PidLock] Cannot open " << path_ << ": " << strerror(errno) << std::endl;
        return false;
    }
    if (flock(fd, LOCK_EX | LOCK_NB) != 0) {
        if (errno == EWOULDBLOCK) {
            std::cerr << "[PidLock] " << path_ << " is held by another process" << std::endl;
        } else {
            std::cerr << "[PidLock] flock(" << path_ << ") failed: " << strerror(errno) << std::endl;
        }
        ::close(fd);
        return false;
    }

    fd_ = fd;
    return true;
}

bool PidLock::writePid(pid_t pid) {
    if (fd_ < 0) {
        return false;
    }

    std::string text = std::to_string(pid) + "\n";
    if (ftruncate(fd_, 0) != 0 || lseek(fd_, 0, SEEK_SET) != 0) {
        std::cerr << "[PidLock] Cannot reset " << path_ << ": " << strerror(errno) << std::endl;
        return false;
    }
    if (::write(fd_, text.data(), text.size()) != static_cast<ssize_t>(text.size())) {
        std::cerr << "[PidLock] Cannot write " << path_ << ": " << strerror(errno) << std::endl;
        return false;
    }
    return true;
}

void PidLock::release() {
    if (fd_ < 0) {
        return;
    }
    ::unlink(path_.c_str());
    flock(fd_, LOCK_UN);
    ::close(fd_);
    fd_ = -1;
}

/*==================  ProcessSupervisor  ==================*/

ProcessSupervisor::ProcessSupervisor(Agent& agent, ServerFactory factory)
    : agent_(agent)
    , factory_(std::move(factory))
    , log_fd_(-1)
    , saved_fds_{-1, -1, -1}
    , signal_pipe_{-1, -1}
    , embedded_(false)
    , terminated_(false) {
}

ProcessSupervisor::~ProcessSupervisor() {
    if (pid_lock_ || server_) {
        terminate();
    }
    closeSignalPipe();
}

bool ProcessSupervisor::startForeground() {
    return agent_.start(false);
}

bool ProcessSupervisor::startDaemon(const std::string& log_path, const std::string& pid_path, bool detach) {
    auto lock = std::make_unique<PidLock>(pid_path);
    if (!lock->acquire()) {
        std::cerr << "[ProcessSupervisor] Another instance appears to be running" << std::endl;
        return false;
    }

    if (detach && !detachProcess()) {
        return false;
    }
    if (!lock->writePid(getpid())) {
        return false;
    }
    pid_lock_ = std::move(lock);
    terminated_ = false;

    if (!embedded_) {
        if (!redirectOutput(log_path)) {
            terminate();
            return false;
        }
        if (chdir("/") != 0) {
            std::cerr << "[ProcessSupervisor] chdir(/) failed: " << strerror(errno) << std::endl;
        }
    }
    if (!installSignalHandlers()) {
        terminate();
        return false;
    }

    std::cout << "[ProcessSupervisor] Starting mtda " << agent_.version()
              << " (pid " << getpid() << ")" << std::endl;

    if (!agent_.start(true)) {
        std::cerr << "[ProcessSupervisor] Agent failed to start" << std::endl;
        terminate();
        return false;
    }

    server_ = factory_(agent_);
    if (!server_ || !server_->bind()) {
        std::cerr << "[ProcessSupervisor] Failed to set up the control channel" << std::endl;
        terminate();
        return false;
    }
    return true;
}

int ProcessSupervisor::serve() {
    if (!server_) {
        return 1;
    }

    std::thread watcher([this] {
        unsigned char signo = 0;
        for (;;) {
            ssize_t n = ::read(signal_pipe_[0], &signo, 1);
            if (n < 0 && errno == EINTR) {
                continue;
            }
            break;
        }
        if (signo != 0) {
            std::cout << "[ProcessSupervisor] Received signal " << static_cast<int>(signo)
                      << ", shutting down" << std::endl;
        }
        server_->stop();
    });

    server_->serve();

    // Release the watcher when the serve loop ended on its own.
    unsigned char wake = 0;
    ssize_t n = ::write(signal_pipe_[1], &wake, 1);
    (void)n;
    watcher.join();

    terminate();
    return 0;
}

void ProcessSupervisor::terminate() {
    if (terminated_) {
        return;
    }
    terminated_ = true;

    if (server_) {
        server_->stop();
        server_.reset();
    }
    if (agent_.isRunning()) {
        agent_.stop();
    }
    restoreSignalHandlers();
    if (pid_lock_) {
        pid_lock_->release();
        pid_lock_.reset();
    }
    if (log_fd_ >= 0) {
        std::cout << "[ProcessSupervisor] Terminated" << std::endl;
    }
    restoreOutput();
}

bool ProcessSupervisor::detachProcess() {
    std::cout.flush();
    std::cerr.flush();

    pid_t pid = fork();
    if (pid < 0) {
        std::cerr << "[ProcessSupervisor] fork() failed: " << strerror(errno) << std::endl;
        return false;
    }
    if (pid > 0) {
        _exit(0);
    }
    if (setsid() < 0) {
        std::cerr << "[ProcessSupervisor] setsid() failed: " << strerror(errno) << std::endl;
        return false;
    }
    return true;
}

bool ProcessSupervisor::redirectOutput(const std::string& log_path) {
    int log_fd = ::open(log_path.c_str(), O_WRONLY | O_CREAT | O_TRUNC | O_CLOEXEC, 0644);
    if (log_fd < 0) {
        std::cerr << "[ProcessSupervisor] Cannot open " << log_path << ": " << strerror(errno) << std::endl;
        return false;
    }
    int null_fd = ::open("/dev/null", O_RDONLY);
    if (null_fd < 0) {
        std::cerr << "[ProcessSupervisor] Cannot open /dev/null: " << strerror(errno) << std::endl;
        ::close(log_fd);
        return false;
    }

    for (int fd = STDIN_FILENO; fd <= STDERR_FILENO; fd++) {
        saved_fds_[fd] = fcntl(fd, F_DUPFD_CLOEXEC, 3);
    }

    std::cout.flush();
    std::cerr.flush();
    dup2(null_fd, STDIN_FILENO);
    dup2(log_fd, STDOUT_FILENO);
    dup2(log_fd, STDERR_FILENO);
    ::close(null_fd);

    log_fd_ = log_fd;
    return true;
}

void ProcessSupervisor::restoreOutput() {
    if (log_fd_ < 0) {
        return;
    }
    std::cout.flush();
    std::cerr.flush();
    for (int fd = STDIN_FILENO; fd <= STDERR_FILENO; fd++) {
        if (saved_fds_[fd] >= 0) {
            dup2(saved_fds_[fd], fd);
            ::close(saved_fds_[fd]);
            saved_fds_[fd] = -1;
        }
    }
    ::close(log_fd_);
    log_fd_ = -1;
}

bool ProcessSupervisor::installSignalHandlers() {
    closeSignalPipe();
    if (::pipe2(signal_pipe_, O_CLOEXEC) != 0) {
        std::cerr << "[ProcessSupervisor] pipe2 failed: " << strerror(errno) << std::endl;
        return false;
    }
    if (embedded_) {
        return true;
    }
    g_signal_fd = signal_pipe_[1];

    struct sigaction sa{};
    sa.sa_handler = onTerminateSignal;
    sigemptyset(&sa.sa_mask);
    sa.sa_flags = SA_RESTART;
    sigaction(SIGTERM, &sa, nullptr);
    sigaction(SIGHUP, &sa, nullptr);

    struct sigaction ignore{};
    ignore.sa_handler = SIG_IGN;
    sigemptyset(&ignore.sa_mask);
    sigaction(SIGPIPE, &ignore, nullptr);
    return true;
}

void ProcessSupervisor::restoreSignalHandlers() {
    if (g_signal_fd < 0) {
        return;
    }
    struct sigaction sa{};
    sa.sa_handler = SIG_DFL;
    sigemptyset(&sa.sa_mask);
    sigaction(SIGTERM, &sa, nullptr);
    sigaction(SIGHUP, &sa, nullptr);
    g_signal_fd = -1;
}

void ProcessSupervisor::closeSignalPipe() {
    for (int& fd : signal_pipe_) {
        if (fd >= 0) {
            ::close(fd);
            fd = -1;
        }
    }
}
