#pragma once

#include <termios.h>
#include "key_source.h"

// Reads keys from a terminal in non-canonical, no-echo, no-signal mode.
// The previous terminal settings are restored on destruction.
class TerminalKeySource : public KeySource {
public:
    explicit TerminalKeySource(int fd = 0);
    ~TerminalKeySource() override;

    TerminalKeySource(const TerminalKeySource&) = delete;
    TerminalKeySource& operator=(const TerminalKeySource&) = delete;

    std::optional<char> getKey() override;

private:
    int fd_;
    bool restore_;
    struct termios saved_;
};
