#include "console_device.h"
#include <cerrno>
#include <cstring>
#include <iostream>
#include <fcntl.h>
#include <poll.h>
#include <termios.h>
#include <unistd.h>

namespace {

speed_t toSpeed(int rate) {
    switch (rate) {
        case 9600: return B9600;
        case 19200: return B19200;
        case 38400: return B38400;
        case 57600: return B57600;
        case 115200: return B115200;
        case 230400: return B230400;
#ifdef B460800
        case 460800: return B460800;
#endif
#ifdef B921600
        case 921600: return B921600;
#endif
        default: return 0;
    }
}

}

SerialConsole::SerialConsole(const nlohmann::json& config)
    : port_(config.value("port", "/dev/ttyUSB0"))
    , rate_(config.value("rate", 115200))
    , fd_(-1) {
}

SerialConsole::~SerialConsole() {
    close();
}

bool SerialConsole::probe() {
    close();
    fd_ = ::open(port_.c_str(), O_RDWR | O_NOCTTY | O_NONBLOCK);
    if (fd_ < 0) {
        std::cerr << "[SerialConsole] Cannot open " << port_ << ": " << strerror(errno) << std::endl;
        return false;
    }
    if (!configure()) {
        std::cerr << "[SerialConsole] Failed to configure " << port_ << " @ " << rate_ << std::endl;
        close();
        return false;
    }
    return true;
}

bool SerialConsole::configure() {
    speed_t speed = toSpeed(rate_);
    if (speed == 0) {
        std::cerr << "[SerialConsole] Unsupported baud rate " << rate_ << ", using 115200" << std::endl;
        speed = B115200;
    }

    termios tty{};
    if (tcgetattr(fd_, &tty) != 0) return false;
    cfmakeraw(&tty);
    cfsetispeed(&tty, speed);
    cfsetospeed(&tty, speed);
    tty.c_cflag |= (CLOCAL | CREAD);
    tty.c_cflag &= ~PARENB;
    tty.c_cflag &= ~CSTOPB;
    tty.c_cflag &= ~CSIZE;
    tty.c_cflag |= CS8;
    tty.c_cc[VMIN] = 1;
    tty.c_cc[VTIME] = 0;
    return tcsetattr(fd_, TCSANOW, &tty) == 0;
}

ssize_t SerialConsole::read(char* buf, size_t len, int timeout_ms) {
    if (fd_ < 0) {
        return -1;
    }
    struct pollfd pfd{fd_, POLLIN, 0};
    int pr = ::poll(&pfd, 1, timeout_ms);
    if (pr == 0 || (pr < 0 && errno == EINTR)) {
        return 0;
    }
    if (pr < 0 || (pfd.revents & (POLLERR | POLLHUP | POLLNVAL))) {
        return -1;
    }
    ssize_t n = ::read(fd_, buf, len);
    if (n < 0 && (errno == EAGAIN || errno == EWOULDBLOCK || errno == EINTR)) {
        return 0;
    }
    return n;
}

bool SerialConsole::write(const std::string& data) {
    if (fd_ < 0) {
        return false;
    }
    size_t done = 0;
    while (done < data.size()) {
        ssize_t n = ::write(fd_, data.data() + done, data.size() - done);
        if (n < 0) {
            if (errno == EINTR) continue;
            if (errno == EAGAIN || errno == EWOULDBLOCK) {
                struct pollfd pfd{fd_, POLLOUT, 0};
                ::poll(&pfd, 1, 100);
                continue;
            }
            std::cerr << "[SerialConsole] Write failed: " << strerror(errno) << std::endl;
            return false;
        }
        done += static_cast<size_t>(n);
    }
    return true;
}

void SerialConsole::close() {
    if (fd_ >= 0) {
        ::close(fd_);
        fd_ = -1;
    }
}

std::unique_ptr<ConsoleDevice> createConsoleDevice(const nlohmann::json& config) {
    std::string variant = config.value("variant", "");
    if (variant.empty()) {
        std::cerr << "console variant not defined!" << std::endl;
        return nullptr;
    }
    if (variant == "serial") {
        return std::make_unique<SerialConsole>(config);
    }
    std::cerr << "console \"" << variant << "\" could not be found/loaded!" << std::endl;
    return nullptr;
}
