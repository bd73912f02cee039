#pragma once

#include <functional>
#include <ostream>
#include <string>
#include <vector>

class Session;

enum class CommandGroup { Console, Sd, Target, Usb, Help, Unknown };
enum class ConsoleCommand { Clear, Flush, Head, Interactive, Lines, Prompt, Run, Send, Tail, Unknown };
enum class SdCommand { Host, Mount, Target, Update, Write, Unknown };
enum class TargetCommand { Off, On, Toggle, Unknown };
enum class UsbCommand { Off, On, Unknown };

CommandGroup parseCommandGroup(const std::string& name);
ConsoleCommand parseConsoleCommand(const std::string& name);
SdCommand parseSdCommand(const std::string& name);
TargetCommand parseTargetCommand(const std::string& name);
UsbCommand parseUsbCommand(const std::string& name);

struct CommandContext {
    Session& session;
    std::ostream& out;
    std::ostream& err;
    // Runs the interactive console and returns its exit status.
    std::function<int()> interactive;
};

// Maps a command line such as "target on" or "sd write image.img" to a
// session operation. Every path returns 0 on success and 1 otherwise.
class CommandRouter {
public:
    explicit CommandRouter(CommandContext context);

    int dispatch(const std::vector<std::string>& args);
    static void printUsage(std::ostream& os);
    static bool printGroupUsage(const std::string& group, std::ostream& os);

private:
    using Args = std::vector<std::string>;

    CommandContext ctx_;

    int consoleCmd(const Args& args);
    int sdCmd(const Args& args);
    int targetCmd(const Args& args);
    int usbCmd(const Args& args);
    int helpCmd(const Args& args);

    int runConsole(ConsoleCommand cmd, const Args& args);
    int runSd(SdCommand cmd, const Args& args);
    int runTarget(TargetCommand cmd);
    int runUsb(UsbCommand cmd, const Args& args);

    int sdUpdate(const std::string& dest, const std::string& src);
    int sdWrite(const std::string& path);

    int fail(const std::string& context, const std::string& message);
    int usage(const std::string& text);
};
