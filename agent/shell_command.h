#pragma once

#include <string>

struct CommandResult {
    int exit_code;
    std::string output;
};

// Runs cmd through /bin/sh with stderr folded into the captured output.
// exit_code is -1 when the shell could not be spawned.
CommandResult runCommand(const std::string& cmd);

std::string trimOutput(const std::string& s);

// Wraps s in single quotes so /bin/sh passes it through as one word.
std::string shellQuote(const std::string& s);
