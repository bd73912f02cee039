#include "rpc_server.h"
#include "agent.h"
#include "codec.h"
#include <cerrno>
#include <condition_variable>
#include <cstring>
#include <iostream>
#include <arpa/inet.h>
#include <fcntl.h>
#include <netinet/in.h>
#include <netinet/tcp.h>
#include <poll.h>
#include <sys/socket.h>
#include <unistd.h>

using json = nlohmann::json;

static json toJson(const std::optional<std::string>& value) {
    return value ? json(*value) : json(nullptr);
}

static std::optional<std::string> optionalArg(const json& args, const char* name) {
    if (!args.contains(name) || args.at(name).is_null()) {
        return std::nullopt;
    }
    return args.at(name).get<std::string>();
}

RpcServer::RpcServer(Agent& agent, int port, std::chrono::seconds heartbeat)
    : agent_(agent)
    , port_(port)
    , heartbeat_(heartbeat)
    , listen_fd_(-1)
    , wake_pipe_{-1, -1}
    , running_(false) {

    if (::pipe2(wake_pipe_, O_CLOEXEC | O_NONBLOCK) != 0) {
        throw std::runtime_error(std::string("pipe2 failed: ") + strerror(errno));
    }
    registerMethods();
}

RpcServer::~RpcServer() {
    stop();
    shutdownClients();
    if (listen_fd_ >= 0) {
        ::close(listen_fd_);
    }
    ::close(wake_pipe_[0]);
    ::close(wake_pipe_[1]);
}

bool RpcServer::bind() {
    int fd = ::socket(AF_INET, SOCK_STREAM | SOCK_CLOEXEC, 0);
    if (fd < 0) {
        std::cerr << "[RpcServer] socket() failed: " << strerror(errno) << std::endl;
        return false;
    }

    int yes = 1;
    setsockopt(fd, SOL_SOCKET, SO_REUSEADDR, &yes, sizeof(yes));

    sockaddr_in addr{};
    addr.sin_family = AF_INET;
    addr.sin_addr.s_addr = htonl(INADDR_ANY);
    addr.sin_port = htons(static_cast<uint16_t>(port_));
    if (::bind(fd, reinterpret_cast<sockaddr*>(&addr), sizeof(addr)) != 0) {
        std::cerr << "[RpcServer] bind(" << port_ << ") failed: " << strerror(errno) << std::endl;
        ::close(fd);
        return false;
    }
    if (::listen(fd, 4) != 0) {
        std::cerr << "[RpcServer] listen() failed: " << strerror(errno) << std::endl;
        ::close(fd);
        return false;
    }

    socklen_t len = sizeof(addr);
    if (getsockname(fd, reinterpret_cast<sockaddr*>(&addr), &len) == 0) {
        port_ = ntohs(addr.sin_port);
    }

    listen_fd_ = fd;
    running_ = true;
    std::cout << "[RpcServer] Listening on port " << port_ << std::endl;
    return true;
}

void RpcServer::serve() {
    while (running_) {
        struct pollfd fds[2];
        fds[0] = {listen_fd_, POLLIN, 0};
        fds[1] = {wake_pipe_[0], POLLIN, 0};

        int ret = ::poll(fds, 2, 1000);
        if (ret < 0) {
            if (errno == EINTR) continue;
            std::cerr << "[RpcServer] poll() failed: " << strerror(errno) << std::endl;
            break;
        }
        if (fds[1].revents & POLLIN) {
            break;
        }
        if (fds[0].revents & POLLIN) {
            int cfd = ::accept4(listen_fd_, nullptr, nullptr, SOCK_CLOEXEC);
            if (cfd < 0) {
                if (errno != EINTR && errno != EAGAIN) {
                    std::cerr << "[RpcServer] accept() error: " << strerror(errno) << std::endl;
                }
                continue;
            }
            int nodelay = 1;
            setsockopt(cfd, IPPROTO_TCP, TCP_NODELAY, &nodelay, sizeof(nodelay));

            auto done = std::make_shared<std::atomic<bool>>(false);
            std::lock_guard<std::mutex> lock(clients_mutex_);
            client_fds_.insert(cfd);
            workers_.push_back(Worker{std::thread(&RpcServer::handleConnection, this, cfd, done), done});
        }
        reapWorkers();
    }

    running_ = false;
    if (listen_fd_ >= 0) {
        ::close(listen_fd_);
        listen_fd_ = -1;
    }
    shutdownClients();
    std::cout << "[RpcServer] Stopped" << std::endl;
}

void RpcServer::stop() {
    running_ = false;
    char c = 'x';
    ssize_t n = ::write(wake_pipe_[1], &c, 1);
    (void)n;
}

void RpcServer::reapWorkers() {
    std::vector<Worker> finished;
    {
        std::lock_guard<std::mutex> lock(clients_mutex_);
        auto it = workers_.begin();
        while (it != workers_.end()) {
            if (it->done->load()) {
                finished.push_back(std::move(*it));
                it = workers_.erase(it);
            } else {
                ++it;
            }
        }
    }
    for (auto& worker : finished) {
        worker.thread.join();
    }
}

size_t RpcServer::workerCount() {
    std::lock_guard<std::mutex> lock(clients_mutex_);
    return workers_.size();
}

void RpcServer::shutdownClients() {
    std::vector<Worker> workers;
    {
        std::lock_guard<std::mutex> lock(clients_mutex_);
        for (int fd : client_fds_) {
            ::shutdown(fd, SHUT_RDWR);
        }
        workers.swap(workers_);
    }
    for (auto& worker : workers) {
        if (worker.thread.joinable()) {
            worker.thread.join();
        }
    }
}

void RpcServer::handleConnection(int fd, std::shared_ptr<std::atomic<bool>> done) {
    std::cout << "[RpcServer] Client connected (fd " << fd << ")" << std::endl;

    Connection conn;
    conn.fd = fd;
    conn.open = true;
    std::thread heartbeat_thread(&RpcServer::heartbeatLoop, this, std::ref(conn));

    LineReader reader(fd);
    const auto liveness = std::chrono::duration_cast<std::chrono::milliseconds>(heartbeat_ * RPC_HEARTBEAT_LIVENESS);
    while (running_) {
        std::string line;
        LineReader::Status status = reader.readLine(line, liveness);
        if (status == LineReader::Status::Timeout) {
            std::cerr << "[RpcServer] Client heartbeat lost, dropping connection (fd " << fd << ")" << std::endl;
            break;
        }
        if (status != LineReader::Status::Line) {
            break;
        }

        json request = json::parse(line, nullptr, false);
        if (request.is_discarded() || !request.is_object()) {
            std::cerr << "[RpcServer] Ignoring malformed request" << std::endl;
            continue;
        }
        if (isHeartbeatFrame(request)) {
            continue;
        }

        json response = handleRequest(request);
        std::lock_guard<std::mutex> lock(conn.write_mutex);
        if (!sendFrame(fd, response)) {
            std::cerr << "[RpcServer] Failed to send reply: " << strerror(errno) << std::endl;
            break;
        }
    }

    {
        std::lock_guard<std::mutex> lock(conn.hb_mutex);
        conn.open = false;
    }
    conn.hb_cond.notify_all();
    heartbeat_thread.join();

    {
        std::lock_guard<std::mutex> lock(clients_mutex_);
        client_fds_.erase(fd);
    }
    ::close(fd);
    std::cout << "[RpcServer] Client disconnected (fd " << fd << ")" << std::endl;
    done->store(true);
}

void RpcServer::heartbeatLoop(Connection& conn) {
    std::unique_lock<std::mutex> lock(conn.hb_mutex);
    while (conn.open) {
        if (conn.hb_cond.wait_for(lock, heartbeat_, [&conn] { return !conn.open; })) {
            break;
        }
        std::lock_guard<std::mutex> write_lock(conn.write_mutex);
        sendFrame(conn.fd, makeHeartbeatFrame());
    }
}

json RpcServer::handleRequest(const json& request) {
    json id = request.contains("id") ? request.at("id") : json();

    auto field = [&request](const char* name, json::value_t type, json fallback) -> json {
        if (!request.contains(name) || request.at(name).is_null()) {
            return fallback;
        }
        if (request.at(name).type() != type) {
            throw std::runtime_error(std::string("malformed request: '") + name + "' has the wrong type");
        }
        return request.at(name);
    };

    std::string method;
    try {
        method = field("method", json::value_t::string, "").get<std::string>();
        std::string session = field("session", json::value_t::string, "").get<std::string>();
        json args = field("args", json::value_t::object, json::object());

        auto it = methods_.find(method);
        if (it == methods_.end()) {
            return {{"id", id}, {"error", "unknown method '" + method + "'"}};
        }

        std::lock_guard<std::mutex> lock(agent_mutex_);
        return {{"id", id}, {"result", it->second(session, args)}};
    } catch (const std::exception& e) {
        std::cerr << "[RpcServer] " << (method.empty() ? "request" : method) << " failed: " << e.what() << std::endl;
        return {{"id", id}, {"error", std::string(e.what())}};
    }
}

void RpcServer::registerMethods() {
    methods_["agent_version"] = [this](const std::string&, const json&) {
        return json(agent_.version());
    };

    // Console
    methods_["console_clear"] = [this](const std::string& session, const json&) {
        return json(agent_.consoleClear(session));
    };
    methods_["console_flush"] = [this](const std::string& session, const json&) {
        return toJson(agent_.consoleFlush(session));
    };
    methods_["console_head"] = [this](const std::string& session, const json&) {
        return toJson(agent_.consoleHead(session));
    };
    methods_["console_lines"] = [this](const std::string& session, const json&) {
        auto lines = agent_.consoleLines(session);
        return lines ? json(*lines) : json(nullptr);
    };
    methods_["console_locked"] = [this](const std::string& session, const json&) {
        return json(agent_.consoleLocked(session));
    };
    methods_["console_prompt"] = [this](const std::string& session, const json& args) {
        return toJson(agent_.consolePrompt(optionalArg(args, "prompt"), session));
    };
    methods_["console_run"] = [this](const std::string& session, const json& args) {
        return toJson(agent_.consoleRun(args.at("cmd").get<std::string>(), session));
    };
    methods_["console_send"] = [this](const std::string& session, const json& args) {
        return json(agent_.consoleSend(base64Decode(args.at("data").get<std::string>()), session));
    };
    methods_["console_tail"] = [this](const std::string& session, const json&) {
        return toJson(agent_.consoleTail(session));
    };
    methods_["toggle_timestamps"] = [this](const std::string&, const json&) {
        return json(agent_.toggleTimestamps());
    };

    // Target
    methods_["target_lock"] = [this](const std::string& session, const json&) {
        return json(agent_.targetLock(session));
    };
    methods_["target_locked"] = [this](const std::string& session, const json&) {
        return json(agent_.targetLocked(session));
    };
    methods_["target_owner"] = [this](const std::string&, const json&) {
        return toJson(agent_.targetOwner());
    };
    methods_["target_on"] = [this](const std::string& session, const json&) {
        return json(agent_.targetOn(session));
    };
    methods_["target_off"] = [this](const std::string& session, const json&) {
        return json(agent_.targetOff(session));
    };
    methods_["target_status"] = [this](const std::string& session, const json&) {
        return json(agent_.targetStatus(session));
    };
    methods_["target_toggle"] = [this](const std::string& session, const json&) {
        return json(agent_.targetToggle(session));
    };
    methods_["target_unlock"] = [this](const std::string& session, const json&) {
        return json(agent_.targetUnlock(session));
    };

    // SD card
    methods_["sd_bytes_written"] = [this](const std::string& session, const json&) {
        return json(agent_.sdBytesWritten(session));
    };
    methods_["sd_close"] = [this](const std::string& session, const json&) {
        return json(agent_.sdClose(session));
    };
    methods_["sd_locked"] = [this](const std::string& session, const json&) {
        return json(agent_.sdLocked(session));
    };
    methods_["sd_mount"] = [this](const std::string& session, const json& args) {
        return json(agent_.sdMount(optionalArg(args, "part"), session));
    };
    methods_["sd_open"] = [this](const std::string& session, const json&) {
        return json(agent_.sdOpen(session));
    };
    methods_["sd_status"] = [this](const std::string& session, const json&) {
        return json(agent_.sdStatus(session));
    };
    methods_["sd_to_host"] = [this](const std::string& session, const json&) {
        return json(agent_.sdToHost(session));
    };
    methods_["sd_to_target"] = [this](const std::string& session, const json&) {
        return json(agent_.sdToTarget(session));
    };
    methods_["sd_toggle"] = [this](const std::string& session, const json&) {
        return json(agent_.sdToggle(session));
    };
    methods_["sd_update"] = [this](const std::string& session, const json& args) {
        return json(agent_.sdUpdate(args.at("dst").get<std::string>(),
                                    args.at("offset").get<uint64_t>(),
                                    base64Decode(args.at("data").get<std::string>()),
                                    session));
    };
    methods_["sd_write"] = [this](const std::string& session, const json& args) {
        return json(agent_.sdWrite(base64Decode(args.at("data").get<std::string>()), session));
    };

    // USB
    methods_["usb_has_class"] = [this](const std::string& session, const json& args) {
        return json(agent_.usbHasClass(args.at("class").get<std::string>(), session));
    };
    methods_["usb_off_by_class"] = [this](const std::string& session, const json& args) {
        return json(agent_.usbOffByClass(args.at("class").get<std::string>(), session));
    };
    methods_["usb_on_by_class"] = [this](const std::string& session, const json& args) {
        return json(agent_.usbOnByClass(args.at("class").get<std::string>(), session));
    };
    methods_["usb_ports"] = [this](const std::string& session, const json&) {
        return json(agent_.usbPorts(session));
    };
    methods_["usb_status"] = [this](const std::string& session, const json& args) {
        return json(agent_.usbStatus(args.at("port").get<int>(), session));
    };
    methods_["usb_toggle"] = [this](const std::string& session, const json& args) {
        return json(agent_.usbToggle(args.at("port").get<int>(), session));
    };
}
