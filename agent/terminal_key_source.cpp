#include "terminal_key_source.h"
#include <cerrno>
#include <cstring>
#include <iostream>
#include <unistd.h>

TerminalKeySource::TerminalKeySource(int fd)
    : fd_(fd)
    , restore_(false)
    , saved_{} {

    if (!isatty(fd_)) {
        return;
    }
    if (tcgetattr(fd_, &saved_) != 0) {
        std::cerr << "[TerminalKeySource] tcgetattr failed: " << strerror(errno) << std::endl;
        return;
    }

    struct termios raw = saved_;
    raw.c_lflag &= ~(ICANON | ECHO | ISIG | IEXTEN);
    raw.c_iflag &= ~(IXON | ICRNL);
    raw.c_cc[VMIN] = 1;
    raw.c_cc[VTIME] = 0;
    if (tcsetattr(fd_, TCSAFLUSH, &raw) != 0) {
        std::cerr << "[TerminalKeySource] tcsetattr failed: " << strerror(errno) << std::endl;
        return;
    }
    restore_ = true;
}

TerminalKeySource::~TerminalKeySource() {
    if (restore_) {
        tcsetattr(fd_, TCSAFLUSH, &saved_);
    }
}

std::optional<char> TerminalKeySource::getKey() {
    char c;
    for (;;) {
        ssize_t n = ::read(fd_, &c, 1);
        if (n == 1) {
            return c;
        }
        if (n < 0 && errno == EINTR) {
            continue;
        }
        return std::nullopt;
    }
}
