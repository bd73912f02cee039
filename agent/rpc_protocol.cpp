#include "rpc_protocol.h"
#include <cerrno>
#include <poll.h>
#include <sys/socket.h>
#include <unistd.h>

nlohmann::json makeHeartbeatFrame() {
    return {{"hb", true}};
}

bool isHeartbeatFrame(const nlohmann::json& frame) {
    return frame.is_object() && frame.value("hb", false);
}

bool sendFrame(int fd, const nlohmann::json& frame) {
    std::string line = frame.dump(-1, ' ', false, nlohmann::json::error_handler_t::replace);
    line.push_back('\n');

    size_t done = 0;
    while (done < line.size()) {
        ssize_t n = ::send(fd, line.data() + done, line.size() - done, MSG_NOSIGNAL);
        if (n < 0) {
            if (errno == EINTR) continue;
            return false;
        }
        done += static_cast<size_t>(n);
    }
    return true;
}

LineReader::Status LineReader::readLine(std::string& line, std::chrono::milliseconds timeout) {
    auto deadline = std::chrono::steady_clock::now() + timeout;
    for (;;) {
        size_t pos = buffer_.find('\n');
        if (pos != std::string::npos) {
            line = buffer_.substr(0, pos);
            buffer_.erase(0, pos + 1);
            return Status::Line;
        }

        auto remaining = std::chrono::duration_cast<std::chrono::milliseconds>(
            deadline - std::chrono::steady_clock::now());
        if (remaining.count() <= 0) {
            return Status::Timeout;
        }

        struct pollfd pfd{fd_, POLLIN, 0};
        int pr = ::poll(&pfd, 1, static_cast<int>(remaining.count()));
        if (pr < 0) {
            if (errno == EINTR) continue;
            return Status::Error;
        }
        if (pr == 0) {
            return Status::Timeout;
        }

        char buf[4096];
        ssize_t n = ::recv(fd_, buf, sizeof(buf), 0);
        if (n == 0) {
            return Status::Closed;
        }
        if (n < 0) {
            if (errno == EINTR || errno == EAGAIN) continue;
            return Status::Error;
        }
        buffer_.append(buf, static_cast<size_t>(n));
    }
}
