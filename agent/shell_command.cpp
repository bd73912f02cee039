#include "shell_command.h"
#include <array>
#include <cstdio>
#include <algorithm>
#include <cctype>
#include <sys/wait.h>

CommandResult runCommand(const std::string& cmd) {
    CommandResult result{-1, ""};
    std::array<char, 512> buf{};

    FILE* pipe = popen((cmd + " 2>&1").c_str(), "r");
    if (!pipe) return result;
    while (fgets(buf.data(), buf.size(), pipe)) result.output += buf.data();

    int status = pclose(pipe);
    if (status != -1 && WIFEXITED(status)) {
        result.exit_code = WEXITSTATUS(status);
    }
    return result;
}

std::string trimOutput(const std::string& s) {
    auto notSpace = [](int ch) { return !std::isspace(ch); };
    std::string out = s;
    out.erase(out.begin(), std::find_if(out.begin(), out.end(), notSpace));
    out.erase(std::find_if(out.rbegin(), out.rend(), notSpace).base(), out.end());
    return out;
}

std::string shellQuote(const std::string& s) {
    std::string quoted = "'";
    for (char c : s) {
        if (c == '\'') {
            quoted += "'\\''";
        } else {
            quoted += c;
        }
    }
    quoted += "'";
    return quoted;
}
