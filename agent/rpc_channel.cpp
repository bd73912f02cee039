#include "rpc_channel.h"
#include "session.h"
#include <cerrno>
#include <cstring>
#include <netdb.h>
#include <netinet/in.h>
#include <netinet/tcp.h>
#include <sys/socket.h>
#include <unistd.h>

RpcChannel::RpcChannel(const std::string& host, int port, std::chrono::seconds heartbeat)
    : host_(host)
    , port_(port)
    , heartbeat_(heartbeat)
    , fd_(-1)
    , next_id_(1)
    , broken_(false)
    , hb_running_(false) {
}

RpcChannel::~RpcChannel() {
    close();
}

void RpcChannel::connect() {
    struct addrinfo hints{};
    hints.ai_family = AF_UNSPEC;
    hints.ai_socktype = SOCK_STREAM;

    struct addrinfo* res = nullptr;
    std::string port = std::to_string(port_);
    int rc = getaddrinfo(host_.c_str(), port.c_str(), &hints, &res);
    if (rc != 0) {
        fail("cannot resolve " + host_ + ": " + gai_strerror(rc));
    }

    int fd = -1;
    int last_errno = 0;
    for (struct addrinfo* ai = res; ai != nullptr; ai = ai->ai_next) {
        fd = ::socket(ai->ai_family, ai->ai_socktype | SOCK_CLOEXEC, ai->ai_protocol);
        if (fd < 0) {
            last_errno = errno;
            continue;
        }
        if (::connect(fd, ai->ai_addr, ai->ai_addrlen) == 0) {
            break;
        }
        last_errno = errno;
        ::close(fd);
        fd = -1;
    }
    freeaddrinfo(res);

    if (fd < 0) {
        fail("cannot connect to " + endpoint() + ": " + strerror(last_errno));
    }

    int nodelay = 1;
    setsockopt(fd, IPPROTO_TCP, TCP_NODELAY, &nodelay, sizeof(nodelay));

    fd_ = fd;
    reader_ = std::make_unique<LineReader>(fd_);

    hb_running_ = true;
    heartbeat_thread_ = std::thread(&RpcChannel::heartbeatLoop, this);
}

nlohmann::json RpcChannel::call(const std::string& method, const std::string& session,
                                const nlohmann::json& args) {
    if (broken_) {
        throw TransportError(broken_reason_);
    }
    if (fd_ < 0) {
        connect();
    }

    uint64_t id = next_id_++;
    nlohmann::json request = {
        {"id", id},
        {"method", method},
        {"session", session},
        {"args", args}
    };

    bool sent;
    {
        std::lock_guard<std::mutex> lock(write_mutex_);
        sent = sendFrame(fd_, request);
    }
    if (!sent) {
        fail("lost connection to " + endpoint() + ": " + strerror(errno));
    }

    const auto liveness = std::chrono::duration_cast<std::chrono::milliseconds>(heartbeat_ * RPC_HEARTBEAT_LIVENESS);
    for (;;) {
        std::string line;
        LineReader::Status status = reader_->readLine(line, liveness);
        if (status == LineReader::Status::Timeout) {
            fail("lost remote agent heartbeat (" + endpoint() + ")");
        } else if (status == LineReader::Status::Closed) {
            fail("connection closed by " + endpoint());
        } else if (status == LineReader::Status::Error) {
            fail("error reading from " + endpoint() + ": " + strerror(errno));
        }

        nlohmann::json frame = nlohmann::json::parse(line, nullptr, false);
        if (frame.is_discarded() || !frame.is_object()) {
            fail("malformed reply from " + endpoint());
        }
        if (isHeartbeatFrame(frame)) {
            continue;
        }
        if (frame.value("id", static_cast<uint64_t>(0)) != id) {
            continue;
        }
        if (frame.contains("error")) {
            throw TransportError("remote agent failed '" + method + "': " + frame["error"].dump());
        }
        return frame.value("result", nlohmann::json());
    }
}

void RpcChannel::heartbeatLoop() {
    std::unique_lock<std::mutex> lock(hb_mutex_);
    while (hb_running_) {
        if (hb_cond_.wait_for(lock, heartbeat_, [this] { return !hb_running_; })) {
            break;
        }
        std::lock_guard<std::mutex> write_lock(write_mutex_);
        if (fd_ >= 0) {
            sendFrame(fd_, makeHeartbeatFrame());
        }
    }
}

void RpcChannel::close() {
    {
        std::lock_guard<std::mutex> lock(hb_mutex_);
        hb_running_ = false;
    }
    hb_cond_.notify_all();
    if (heartbeat_thread_.joinable()) {
        heartbeat_thread_.join();
    }

    std::lock_guard<std::mutex> lock(write_mutex_);
    if (fd_ >= 0) {
        ::close(fd_);
        fd_ = -1;
    }
    reader_.reset();
}

void RpcChannel::fail(const std::string& reason) {
    close();
    broken_ = true;
    broken_reason_ = reason;
    throw TransportError(reason);
}
