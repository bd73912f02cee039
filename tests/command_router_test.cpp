#include <gtest/gtest.h>
#include <cstdio>
#include <cstdlib>
#include <fstream>
#include <sstream>
#include <unistd.h>
#include "command_router.h"
#include "mock_session.h"

using ::testing::_;
using ::testing::InSequence;
using ::testing::Return;
using ::testing::StrictMock;
using ::testing::Throw;

class CommandRouterTest : public ::testing::Test {
protected:
    StrictMock<MockSession> session;
    std::ostringstream out;
    std::ostringstream err;
    int interactive_runs = 0;

    int run(const std::vector<std::string>& args) {
        CommandContext context{session, out, err, [this]() {
            interactive_runs++;
            return 0;
        }};
        CommandRouter router(context);
        return router.dispatch(args);
    }
};

TEST(CommandParseTest, ResolvesKnownTokens) {
    EXPECT_EQ(parseCommandGroup("console"), CommandGroup::Console);
    EXPECT_EQ(parseCommandGroup("bogus"), CommandGroup::Unknown);
    EXPECT_EQ(parseConsoleCommand("interactive"), ConsoleCommand::Interactive);
    EXPECT_EQ(parseSdCommand("write"), SdCommand::Write);
    EXPECT_EQ(parseTargetCommand("toggle"), TargetCommand::Toggle);
    EXPECT_EQ(parseUsbCommand("on"), UsbCommand::On);
    EXPECT_EQ(parseUsbCommand("toggle"), UsbCommand::Unknown);
}

TEST_F(CommandRouterTest, UnknownSubCommandTouchesNoSession) {
    for (const std::string group : {"console", "sd", "target", "usb"}) {
        err.str("");
        EXPECT_EQ(run({group, "frobnicate"}), 1) << group;
        EXPECT_EQ(err.str(), group + ": unknown command 'frobnicate'\n");
    }
    EXPECT_EQ(interactive_runs, 0);
}

TEST_F(CommandRouterTest, UnknownTopLevelCommand) {
    EXPECT_EQ(run({"reboot"}), 1);
    EXPECT_EQ(err.str(), "unknown command 'reboot'\n");
}

TEST_F(CommandRouterTest, MissingSubCommandPrintsGroupUsage) {
    EXPECT_EQ(run({"target"}), 1);
    EXPECT_NE(err.str().find("usage: target"), std::string::npos);
}

TEST_F(CommandRouterTest, MissingArgumentsAreUsageErrors) {
    EXPECT_EQ(run({"console", "run"}), 1);
    EXPECT_EQ(err.str(), "usage: console run <cmd>\n");

    err.str("");
    EXPECT_EQ(run({"usb", "on"}), 1);
    EXPECT_EQ(err.str(), "usage: usb on <class>\n");

    err.str("");
    EXPECT_EQ(run({"sd", "write"}), 1);
    EXPECT_EQ(err.str(), "usage: sd write <image>\n");

    err.str("");
    EXPECT_EQ(run({"sd", "update"}), 1);
    EXPECT_EQ(err.str(), "usage: sd update <dest> [src]\n");
}

TEST_F(CommandRouterTest, EmptyInvocationRunsInteractiveConsole) {
    EXPECT_EQ(run({}), 0);
    EXPECT_EQ(interactive_runs, 1);

    EXPECT_EQ(run({"console", "interactive"}), 0);
    EXPECT_EQ(interactive_runs, 2);
}

TEST_F(CommandRouterTest, TargetOnAndOff) {
    EXPECT_CALL(session, targetOn()).WillOnce(Return(true));
    EXPECT_CALL(session, targetOff()).WillOnce(Return(false));

    EXPECT_EQ(run({"target", "on"}), 0);
    EXPECT_EQ(run({"target", "off"}), 1);
    EXPECT_EQ(err.str(), "target off: failed to power off the target\n");
}

TEST_F(CommandRouterTest, TargetToggleSucceedsOnlyWhenStatusChanges) {
    {
        InSequence seq;
        EXPECT_CALL(session, targetStatus()).WillOnce(Return("OFF"));
        EXPECT_CALL(session, targetToggle()).WillOnce(Return("ON"));
        EXPECT_CALL(session, targetStatus()).WillOnce(Return("ON"));

        EXPECT_CALL(session, targetStatus()).WillOnce(Return("ON"));
        EXPECT_CALL(session, targetToggle()).WillOnce(Return("OFF"));
        EXPECT_CALL(session, targetStatus()).WillOnce(Return("OFF"));

        EXPECT_CALL(session, targetStatus()).WillOnce(Return("OFF"));
        EXPECT_CALL(session, targetToggle()).WillOnce(Return("OFF"));
        EXPECT_CALL(session, targetStatus()).WillOnce(Return("OFF"));
    }

    EXPECT_EQ(run({"target", "toggle"}), 0);
    EXPECT_EQ(run({"target", "toggle"}), 0);
    EXPECT_EQ(run({"target", "toggle"}), 1);
}

TEST_F(CommandRouterTest, TargetToggleFailsWhenPowerIsLocked) {
    {
        InSequence seq;
        EXPECT_CALL(session, targetStatus()).WillOnce(Return("???"));
        EXPECT_CALL(session, targetToggle()).WillOnce(Return("LOCKED"));
        EXPECT_CALL(session, targetStatus()).WillOnce(Return("???"));
    }

    EXPECT_EQ(run({"target", "toggle"}), 1);
    EXPECT_EQ(err.str(), "target toggle: power status unchanged (???)\n");
}

TEST_F(CommandRouterTest, ConsoleRunWithoutReplyFails) {
    EXPECT_CALL(session, consoleRun("reboot")).WillOnce(Return(std::nullopt));

    EXPECT_EQ(run({"console", "run", "reboot"}), 1);
    EXPECT_EQ(err.str(), "console run: no reply from the console\n");
    EXPECT_EQ(out.str(), "");
}

TEST_F(CommandRouterTest, TransportErrorIsReported) {
    EXPECT_CALL(session, targetOn()).WillOnce(Throw(TransportError("cannot connect to rig:5556")));

    EXPECT_EQ(run({"target", "on"}), 1);
    EXPECT_EQ(err.str(), "target on: cannot connect to rig:5556\n");
}

TEST_F(CommandRouterTest, ConsoleOutputCommands) {
    EXPECT_CALL(session, consoleHead()).WillOnce(Return(std::optional<std::string>("U-Boot 2024.01\n")));
    EXPECT_CALL(session, consoleLines()).WillOnce(Return(std::optional<size_t>(42)));
    EXPECT_CALL(session, consoleRun("uname -r")).WillOnce(Return(std::optional<std::string>("6.6.0\n")));
    EXPECT_CALL(session, consoleTail()).WillOnce(Return(std::nullopt));

    EXPECT_EQ(run({"console", "head"}), 0);
    EXPECT_EQ(run({"console", "lines"}), 0);
    EXPECT_EQ(run({"console", "run", "uname", "-r"}), 0);
    EXPECT_EQ(out.str(), "U-Boot 2024.01\n42\n6.6.0\n");

    EXPECT_EQ(run({"console", "tail"}), 1);
    EXPECT_EQ(err.str(), "console tail: no console available\n");
}

TEST_F(CommandRouterTest, ConsolePromptIsOptional) {
    EXPECT_CALL(session, consolePrompt(std::optional<std::string>()))
        .WillOnce(Return(std::optional<std::string>("=> ")));
    EXPECT_CALL(session, consolePrompt(std::optional<std::string>("root@rig:~# ")))
        .WillOnce(Return(std::optional<std::string>("root@rig:~# ")));

    EXPECT_EQ(run({"console", "prompt"}), 0);
    EXPECT_EQ(run({"console", "prompt", "root@rig:~#", ""}), 0);
    EXPECT_EQ(out.str(), "=> \nroot@rig:~# \n");
}

TEST_F(CommandRouterTest, UsbRequiresKnownClass) {
    EXPECT_CALL(session, usbHasClass("HID")).WillOnce(Return(true));
    EXPECT_CALL(session, usbOnByClass("HID")).WillOnce(Return(true));
    EXPECT_CALL(session, usbHasClass("MSC")).WillOnce(Return(false));

    EXPECT_EQ(run({"usb", "on", "HID"}), 0);
    EXPECT_EQ(run({"usb", "off", "MSC"}), 1);
    EXPECT_EQ(err.str(), "usb off: no USB port of class 'MSC'\n");
}

TEST_F(CommandRouterTest, SdMountWithPartition) {
    EXPECT_CALL(session, sdMount(std::optional<std::string>("2"))).WillOnce(Return(true));
    EXPECT_CALL(session, sdMount(std::optional<std::string>())).WillOnce(Return(false));

    EXPECT_EQ(run({"sd", "mount", "2"}), 0);
    EXPECT_EQ(run({"sd", "mount"}), 1);
}

TEST_F(CommandRouterTest, SdWriteStreamsImage) {
    char path[] = "/tmp/mtda-image-XXXXXX";
    int fd = mkstemp(path);
    ASSERT_GE(fd, 0);
    close(fd);
    {
        std::ofstream image(path, std::ios::binary);
        image << std::string(100000, 'x');
    }

    {
        InSequence seq;
        EXPECT_CALL(session, sdOpen()).WillOnce(Return(true));
        EXPECT_CALL(session, sdWrite(_)).WillOnce(Return(65536));
        EXPECT_CALL(session, sdBytesWritten()).WillOnce(Return(65536));
        EXPECT_CALL(session, sdWrite(_)).WillOnce(Return(65536));
        EXPECT_CALL(session, sdBytesWritten()).WillOnce(Return(100000));
        EXPECT_CALL(session, sdClose()).WillOnce(Return(true));
    }

    EXPECT_EQ(run({"sd", "write", path}), 0);
    EXPECT_NE(out.str().find("100%"), std::string::npos);
    unlink(path);
}

TEST_F(CommandRouterTest, SdWriteFailureClosesCard) {
    char path[] = "/tmp/mtda-image-XXXXXX";
    int fd = mkstemp(path);
    ASSERT_GE(fd, 0);
    ASSERT_EQ(write(fd, "data", 4), 4);
    close(fd);

    EXPECT_CALL(session, sdOpen()).WillOnce(Return(true));
    EXPECT_CALL(session, sdWrite(std::string("data"))).WillOnce(Return(-1));
    EXPECT_CALL(session, sdClose()).WillOnce(Return(true));

    EXPECT_EQ(run({"sd", "write", path}), 1);
    EXPECT_NE(err.str().find("sd write: write error"), std::string::npos);
    unlink(path);
}

TEST_F(CommandRouterTest, HelpForUnknownCommandFails) {
    EXPECT_EQ(run({"help"}), 0);
    EXPECT_NE(out.str().find("usage: mtda-cli"), std::string::npos);

    EXPECT_EQ(run({"help", "sd"}), 0);
    EXPECT_EQ(run({"help", "nope"}), 1);
    EXPECT_EQ(err.str(), "unknown command 'nope'\n");
}
