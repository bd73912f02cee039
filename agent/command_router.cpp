#include "command_router.h"
#include "agent.h"
#include "progress_reporter.h"
#include "session.h"
#include <fstream>
#include <map>
#include <optional>

template <typename Key>
static Key lookup(const std::map<std::string, Key>& table, const std::string& name, Key fallback) {
    auto it = table.find(name);
    return it != table.end() ? it->second : fallback;
}

static std::string joinArgs(const std::vector<std::string>& args, size_t first) {
    std::string joined;
    for (size_t i = first; i < args.size(); ++i) {
        if (i > first) {
            joined += " ";
        }
        joined += args[i];
    }
    return joined;
}

static std::string baseName(const std::string& path) {
    size_t pos = path.find_last_of('/');
    return pos == std::string::npos ? path : path.substr(pos + 1);
}

static const char* CONSOLE_USAGE =
    "usage: console <command> [args]\n"
    "  clear            discard buffered console data\n"
    "  flush            print and discard buffered console data\n"
    "  head             print and remove the first buffered line\n"
    "  interactive      attach to the console\n"
    "  lines            print the number of buffered lines\n"
    "  prompt [text]    set and print the console prompt\n"
    "  run <cmd>        run a command and print its output\n"
    "  send <text>      write text to the console\n"
    "  tail             print and remove the last buffered line\n";

static const char* SD_USAGE =
    "usage: sd <command> [args]\n"
    "  host                  connect the SD card to the host\n"
    "  mount [part]          mount the SD card on the host\n"
    "  target                connect the SD card to the target\n"
    "  update <dest> [src]   copy a file to the mounted SD card\n"
    "  write <image>         write a raw image to the SD card\n";

static const char* TARGET_USAGE =
    "usage: target <command>\n"
    "  off       power off the target\n"
    "  on        power on the target\n"
    "  toggle    toggle target power\n";

static const char* USB_USAGE =
    "usage: usb <command> <class>\n"
    "  off <class>    power off the USB port of that class\n"
    "  on <class>     power on the USB port of that class\n";

CommandGroup parseCommandGroup(const std::string& name) {
    static const std::map<std::string, CommandGroup> table = {
        {"console", CommandGroup::Console},
        {"sd", CommandGroup::Sd},
        {"target", CommandGroup::Target},
        {"usb", CommandGroup::Usb},
        {"help", CommandGroup::Help},
    };
    return lookup(table, name, CommandGroup::Unknown);
}

ConsoleCommand parseConsoleCommand(const std::string& name) {
    static const std::map<std::string, ConsoleCommand> table = {
        {"clear", ConsoleCommand::Clear},
        {"flush", ConsoleCommand::Flush},
        {"head", ConsoleCommand::Head},
        {"interactive", ConsoleCommand::Interactive},
        {"lines", ConsoleCommand::Lines},
        {"prompt", ConsoleCommand::Prompt},
        {"run", ConsoleCommand::Run},
        {"send", ConsoleCommand::Send},
        {"tail", ConsoleCommand::Tail},
    };
    return lookup(table, name, ConsoleCommand::Unknown);
}

SdCommand parseSdCommand(const std::string& name) {
    static const std::map<std::string, SdCommand> table = {
        {"host", SdCommand::Host},
        {"mount", SdCommand::Mount},
        {"target", SdCommand::Target},
        {"update", SdCommand::Update},
        {"write", SdCommand::Write},
    };
    return lookup(table, name, SdCommand::Unknown);
}

TargetCommand parseTargetCommand(const std::string& name) {
    static const std::map<std::string, TargetCommand> table = {
        {"off", TargetCommand::Off},
        {"on", TargetCommand::On},
        {"toggle", TargetCommand::Toggle},
    };
    return lookup(table, name, TargetCommand::Unknown);
}

UsbCommand parseUsbCommand(const std::string& name) {
    static const std::map<std::string, UsbCommand> table = {
        {"off", UsbCommand::Off},
        {"on", UsbCommand::On},
    };
    return lookup(table, name, UsbCommand::Unknown);
}

CommandRouter::CommandRouter(CommandContext context)
    : ctx_(std::move(context)) {
}

int CommandRouter::dispatch(const std::vector<std::string>& args) {
    if (args.empty()) {
        if (!ctx_.interactive) {
            return fail("console interactive", "not available");
        }
        try {
            return ctx_.interactive();
        } catch (const TransportError& e) {
            return fail("console interactive", e.what());
        }
    }

    Args rest(args.begin() + 1, args.end());
    switch (parseCommandGroup(args[0])) {
        case CommandGroup::Console:
            return consoleCmd(rest);
        case CommandGroup::Sd:
            return sdCmd(rest);
        case CommandGroup::Target:
            return targetCmd(rest);
        case CommandGroup::Usb:
            return usbCmd(rest);
        case CommandGroup::Help:
            return helpCmd(rest);
        case CommandGroup::Unknown:
            break;
    }

    ctx_.err << "unknown command '" << args[0] << "'" << std::endl;
    return 1;
}

void CommandRouter::printUsage(std::ostream& os) {
    os << "usage: mtda-cli [options] <command> [<args>]\n"
       << "\n"
       << "options:\n"
       << "  -d, --daemon          run the agent as a daemon\n"
       << "  -n, --no-detach       run the daemon in the foreground\n"
       << "  -r, --remote=<addr>   use the agent at host[:port]\n"
       << "  -h, --help            print this help\n"
       << "\n"
       << "commands:\n"
       << "  console     interact with the target console\n"
       << "  help        print help for a command\n"
       << "  sd          manage the shared SD card\n"
       << "  target      power the target on or off\n"
       << "  usb         power USB ports on or off\n"
       << "\n"
       << "Running without a command attaches to the target console.\n";
}

bool CommandRouter::printGroupUsage(const std::string& group, std::ostream& os) {
    switch (parseCommandGroup(group)) {
        case CommandGroup::Console:
            os << CONSOLE_USAGE;
            return true;
        case CommandGroup::Sd:
            os << SD_USAGE;
            return true;
        case CommandGroup::Target:
            os << TARGET_USAGE;
            return true;
        case CommandGroup::Usb:
            os << USB_USAGE;
            return true;
        case CommandGroup::Help:
            printUsage(os);
            return true;
        case CommandGroup::Unknown:
            break;
    }
    return false;
}

int CommandRouter::fail(const std::string& context, const std::string& message) {
    ctx_.err << context << ": " << message << std::endl;
    return 1;
}

int CommandRouter::usage(const std::string& text) {
    ctx_.err << "usage: " << text << std::endl;
    return 1;
}

/*==================  console  ==================*/

int CommandRouter::consoleCmd(const Args& args) {
    if (args.empty()) {
        ctx_.err << CONSOLE_USAGE;
        return 1;
    }

    ConsoleCommand cmd = parseConsoleCommand(args[0]);
    if (cmd == ConsoleCommand::Unknown) {
        ctx_.err << "console: unknown command '" << args[0] << "'" << std::endl;
        return 1;
    }

    try {
        return runConsole(cmd, args);
    } catch (const TransportError& e) {
        return fail("console " + args[0], e.what());
    }
}

int CommandRouter::runConsole(ConsoleCommand cmd, const Args& args) {
    Session& session = ctx_.session;

    switch (cmd) {
        case ConsoleCommand::Clear:
            if (!session.consoleClear()) {
                return fail("console clear", "no console available");
            }
            return 0;

        case ConsoleCommand::Flush:
        case ConsoleCommand::Head:
        case ConsoleCommand::Tail: {
            std::optional<std::string> data;
            if (cmd == ConsoleCommand::Flush) {
                data = session.consoleFlush();
            } else if (cmd == ConsoleCommand::Head) {
                data = session.consoleHead();
            } else {
                data = session.consoleTail();
            }
            if (!data) {
                return fail("console " + args[0], "no console available");
            }
            ctx_.out << *data << std::flush;
            return 0;
        }

        case ConsoleCommand::Interactive:
            if (!ctx_.interactive) {
                return fail("console interactive", "not available");
            }
            return ctx_.interactive();

        case ConsoleCommand::Lines: {
            std::optional<size_t> lines = session.consoleLines();
            if (!lines) {
                return fail("console lines", "no console available");
            }
            ctx_.out << *lines << std::endl;
            return 0;
        }

        case ConsoleCommand::Prompt: {
            std::optional<std::string> new_prompt;
            if (args.size() > 1) {
                new_prompt = joinArgs(args, 1);
            }
            std::optional<std::string> prompt = session.consolePrompt(new_prompt);
            if (!prompt) {
                return fail("console prompt", "no console available");
            }
            ctx_.out << *prompt << std::endl;
            return 0;
        }

        case ConsoleCommand::Run: {
            if (args.size() < 2) {
                return usage("console run <cmd>");
            }
            std::optional<std::string> output = session.consoleRun(joinArgs(args, 1));
            if (!output) {
                return fail("console run", "no reply from the console");
            }
            ctx_.out << *output << std::flush;
            return 0;
        }

        case ConsoleCommand::Send:
            if (args.size() < 2) {
                return usage("console send <text>");
            }
            if (!session.consoleSend(joinArgs(args, 1))) {
                return fail("console send", "failed to write to the console");
            }
            return 0;

        case ConsoleCommand::Unknown:
            break;
    }
    return 1;
}

/*==================  sd  ==================*/

int CommandRouter::sdCmd(const Args& args) {
    if (args.empty()) {
        ctx_.err << SD_USAGE;
        return 1;
    }

    SdCommand cmd = parseSdCommand(args[0]);
    if (cmd == SdCommand::Unknown) {
        ctx_.err << "sd: unknown command '" << args[0] << "'" << std::endl;
        return 1;
    }

    try {
        return runSd(cmd, args);
    } catch (const TransportError& e) {
        return fail("sd " + args[0], e.what());
    }
}

int CommandRouter::runSd(SdCommand cmd, const Args& args) {
    Session& session = ctx_.session;

    switch (cmd) {
        case SdCommand::Host:
            if (!session.sdToHost()) {
                return fail("sd host", "failed to connect the SD card to the host");
            }
            return 0;

        case SdCommand::Mount: {
            std::optional<std::string> part;
            if (args.size() > 1) {
                part = args[1];
            }
            if (!session.sdMount(part)) {
                return fail("sd mount", "failed to mount the SD card");
            }
            return 0;
        }

        case SdCommand::Target:
            if (!session.sdToTarget()) {
                return fail("sd target", "failed to connect the SD card to the target");
            }
            return 0;

        case SdCommand::Update:
            if (args.size() < 2) {
                return usage("sd update <dest> [src]");
            }
            return sdUpdate(args[1], args.size() > 2 ? args[2] : baseName(args[1]));

        case SdCommand::Write:
            if (args.size() < 2) {
                return usage("sd write <image>");
            }
            return sdWrite(args[1]);

        case SdCommand::Unknown:
            break;
    }
    return 1;
}

int CommandRouter::sdUpdate(const std::string& dest, const std::string& src) {
    std::ifstream file(src, std::ios::binary | std::ios::ate);
    if (!file.is_open()) {
        return fail("sd update", "cannot open '" + src + "'");
    }
    uint64_t total = static_cast<uint64_t>(file.tellg());
    file.seekg(0);

    ProgressReporter progress(ctx_.session, ctx_.out);
    std::string buffer(Agent::SD_BLOCK_SIZE, '\0');
    uint64_t offset = 0;

    while (offset < total) {
        file.read(&buffer[0], static_cast<std::streamsize>(buffer.size()));
        std::streamsize count = file.gcount();
        if (count <= 0) {
            progress.finish();
            return fail("sd update", "read error on '" + src + "'");
        }
        int64_t result = ctx_.session.sdUpdate(dest, offset, buffer.substr(0, static_cast<size_t>(count)));
        if (result < 0) {
            progress.finish();
            return fail("sd update", "failed to write '" + dest + "'");
        }
        offset += static_cast<uint64_t>(count);
        progress.report(dest, offset, total);
    }
    progress.finish();
    return 0;
}

int CommandRouter::sdWrite(const std::string& path) {
    std::ifstream file(path, std::ios::binary | std::ios::ate);
    if (!file.is_open()) {
        return fail("sd write", "cannot open '" + path + "'");
    }
    uint64_t total = static_cast<uint64_t>(file.tellg());
    file.seekg(0);

    Session& session = ctx_.session;
    if (!session.sdOpen()) {
        return fail("sd write", "failed to open the SD card");
    }

    ProgressReporter progress(session, ctx_.out);
    std::string buffer(Agent::SD_BLOCK_SIZE, '\0');
    uint64_t bytes_read = 0;

    while (bytes_read < total) {
        file.read(&buffer[0], static_cast<std::streamsize>(buffer.size()));
        std::streamsize count = file.gcount();
        if (count <= 0) {
            break;
        }
        if (session.sdWrite(buffer.substr(0, static_cast<size_t>(count))) < 0) {
            progress.finish();
            session.sdClose();
            return fail("sd write", "write error");
        }
        bytes_read += static_cast<uint64_t>(count);
        progress.report(baseName(path), bytes_read, total);
    }
    progress.finish();

    if (!session.sdClose()) {
        return fail("sd write", "failed to close the SD card");
    }
    if (bytes_read < total) {
        return fail("sd write", "read error on '" + path + "'");
    }
    return 0;
}

/*==================  target  ==================*/

int CommandRouter::targetCmd(const Args& args) {
    if (args.empty()) {
        ctx_.err << TARGET_USAGE;
        return 1;
    }

    TargetCommand cmd = parseTargetCommand(args[0]);
    if (cmd == TargetCommand::Unknown) {
        ctx_.err << "target: unknown command '" << args[0] << "'" << std::endl;
        return 1;
    }

    try {
        return runTarget(cmd);
    } catch (const TransportError& e) {
        return fail("target " + args[0], e.what());
    }
}

int CommandRouter::runTarget(TargetCommand cmd) {
    Session& session = ctx_.session;

    switch (cmd) {
        case TargetCommand::Off:
            if (!session.targetOff()) {
                return fail("target off", "failed to power off the target");
            }
            return 0;

        case TargetCommand::On:
            if (!session.targetOn()) {
                return fail("target on", "failed to power on the target");
            }
            return 0;

        case TargetCommand::Toggle: {
            std::string before = session.targetStatus();
            session.targetToggle();
            std::string after = session.targetStatus();
            if (before == after) {
                return fail("target toggle", "power status unchanged (" + after + ")");
            }
            return 0;
        }

        case TargetCommand::Unknown:
            break;
    }
    return 1;
}

/*==================  usb  ==================*/

int CommandRouter::usbCmd(const Args& args) {
    if (args.empty()) {
        ctx_.err << USB_USAGE;
        return 1;
    }

    UsbCommand cmd = parseUsbCommand(args[0]);
    if (cmd == UsbCommand::Unknown) {
        ctx_.err << "usb: unknown command '" << args[0] << "'" << std::endl;
        return 1;
    }

    try {
        return runUsb(cmd, args);
    } catch (const TransportError& e) {
        return fail("usb " + args[0], e.what());
    }
}

int CommandRouter::runUsb(UsbCommand cmd, const Args& args) {
    if (args.size() < 2) {
        return usage("usb " + args[0] + " <class>");
    }

    const std::string context = "usb " + args[0];
    const std::string& class_name = args[1];
    Session& session = ctx_.session;

    if (!session.usbHasClass(class_name)) {
        return fail(context, "no USB port of class '" + class_name + "'");
    }

    bool ok = cmd == UsbCommand::On ? session.usbOnByClass(class_name)
                                    : session.usbOffByClass(class_name);
    if (!ok) {
        return fail(context, "failed to switch the '" + class_name + "' port");
    }
    return 0;
}

/*==================  help  ==================*/

int CommandRouter::helpCmd(const Args& args) {
    if (args.empty()) {
        printUsage(ctx_.out);
        return 0;
    }
    if (!printGroupUsage(args[0], ctx_.out)) {
        ctx_.err << "unknown command '" << args[0] << "'" << std::endl;
        return 1;
    }
    return 0;
}
