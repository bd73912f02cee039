#include <gtest/gtest.h>
#include <deque>
#include <sstream>
#include <stdexcept>
#include "interactive_console.h"
#include "mock_session.h"

using ::testing::_;
using ::testing::AnyNumber;
using ::testing::InSequence;
using ::testing::NiceMock;
using ::testing::Return;

class ScriptedKeySource : public KeySource {
public:
    explicit ScriptedKeySource(std::string keys) : keys_(keys.begin(), keys.end()) {}

    std::optional<char> getKey() override {
        consumed++;
        if (keys_.empty()) {
            return std::nullopt;
        }
        char key = keys_.front();
        keys_.pop_front();
        return key;
    }

    int consumed = 0;

private:
    std::deque<char> keys_;
};

static size_t countOccurrences(const std::string& haystack, const std::string& needle) {
    size_t count = 0;
    for (size_t pos = haystack.find(needle); pos != std::string::npos; pos = haystack.find(needle, pos + 1)) {
        count++;
    }
    return count;
}

class InteractiveConsoleTest : public ::testing::Test {
protected:
    NiceMock<MockSession> session;
    std::ostringstream out;

    void SetUp() override {
        ON_CALL(session, id()).WillByDefault(Return("alice@bench"));
        ON_CALL(session, endpoint()).WillByDefault(Return("local"));
        ON_CALL(session, agentVersion()).WillByDefault(Return("0.9.0"));
        ON_CALL(session, consoleAttach(_)).WillByDefault(Return(true));
        ON_CALL(session, targetStatus()).WillByDefault(Return("OFF"));
        ON_CALL(session, sdStatus()).WillByDefault(Return("TARGET"));
        ON_CALL(session, usbPorts()).WillByDefault(Return(0));
    }
};

TEST_F(InteractiveConsoleTest, QuitAfterEscapeConsumesTwoKeys) {
    ScriptedKeySource keys(std::string("\x01q", 2) + "zz");
    EXPECT_CALL(session, consoleSend(_)).Times(0);
    EXPECT_CALL(session, consoleDetach()).Times(1);

    InteractiveConsole console(session, keys, out);
    EXPECT_EQ(console.run(), 0);
    EXPECT_EQ(keys.consumed, 2);
}

TEST_F(InteractiveConsoleTest, ForwardsPlainKeysUntilEndOfInput) {
    ScriptedKeySource keys("ls\r");
    {
        InSequence seq;
        EXPECT_CALL(session, consoleSend("l")).WillOnce(Return(true));
        EXPECT_CALL(session, consoleSend("s")).WillOnce(Return(true));
        EXPECT_CALL(session, consoleSend("\r")).WillOnce(Return(true));
    }
    EXPECT_CALL(session, consoleDetach()).Times(1);

    InteractiveConsole console(session, keys, out);
    EXPECT_EQ(console.run(), 0);
    EXPECT_EQ(keys.consumed, 4);
}

TEST_F(InteractiveConsoleTest, UnknownMenuKeyIsAbsorbed) {
    ScriptedKeySource keys(std::string("\x01x", 2) + "a");
    EXPECT_CALL(session, consoleSend("x")).Times(0);
    EXPECT_CALL(session, consoleSend("a")).WillOnce(Return(true));

    InteractiveConsole console(session, keys, out);
    console.run();
    EXPECT_EQ(console.state(), InteractiveConsole::State::PassThrough);
}

TEST_F(InteractiveConsoleTest, PowerToggleReportsOnlyChanges) {
    ScriptedKeySource keys(std::string("\x01p\x01p\x01p", 6));
    EXPECT_CALL(session, targetStatus())
        .WillOnce(Return("OFF"))   // snapshot
        .WillOnce(Return("OFF"))
        .WillOnce(Return("ON"))
        .WillOnce(Return("ON"))
        .WillOnce(Return("OFF"))
        .WillOnce(Return("OFF"))
        .WillOnce(Return("OFF"));
    EXPECT_CALL(session, targetToggle())
        .WillOnce(Return("ON"))
        .WillOnce(Return("OFF"))
        .WillOnce(Return("OFF"));

    InteractiveConsole console(session, keys, out);
    console.run();
    EXPECT_EQ(countOccurrences(out.str(), "Target is now"), 2u);
}

TEST_F(InteractiveConsoleTest, LockedPowerToggleIsNotReported) {
    ScriptedKeySource keys(std::string("\x01p", 2));
    EXPECT_CALL(session, targetStatus()).WillRepeatedly(Return("???"));
    EXPECT_CALL(session, targetToggle()).WillOnce(Return("LOCKED"));

    InteractiveConsole console(session, keys, out);
    console.run();
    EXPECT_EQ(countOccurrences(out.str(), "Target is now"), 0u);
    EXPECT_EQ(out.str().find("LOCKED"), std::string::npos);
}

TEST_F(InteractiveConsoleTest, StorageToggleReportsOnlyChanges) {
    ScriptedKeySource keys(std::string("\x01s", 2));
    EXPECT_CALL(session, sdStatus())
        .WillOnce(Return("TARGET"))  // snapshot
        .WillOnce(Return("TARGET"));
    EXPECT_CALL(session, sdToggle()).WillOnce(Return("TARGET"));

    InteractiveConsole console(session, keys, out);
    console.run();
    EXPECT_EQ(countOccurrences(out.str(), "SD card is now"), 0u);
}

TEST_F(InteractiveConsoleTest, TimestampToggleIsSilent) {
    ScriptedKeySource keys(std::string("\x01t", 2));
    EXPECT_CALL(session, toggleTimestamps()).WillOnce(Return(true));

    InteractiveConsole console(session, keys, out);
    console.run();
    EXPECT_EQ(countOccurrences(out.str(), "***"), 0u);
}

TEST_F(InteractiveConsoleTest, LockFailureNamesOwner) {
    ScriptedKeySource keys(std::string("\x01" "a", 2));
    EXPECT_CALL(session, targetLock()).WillOnce(Return(false));
    EXPECT_CALL(session, targetOwner()).WillRepeatedly(Return(std::optional<std::string>("bob@lab")));

    InteractiveConsole console(session, keys, out);
    console.run();
    EXPECT_NE(out.str().find("Target is locked by bob@lab"), std::string::npos);
}

TEST_F(InteractiveConsoleTest, SnapshotListsUsbPorts) {
    ON_CALL(session, usbPorts()).WillByDefault(Return(2));
    EXPECT_CALL(session, usbStatus(1)).WillRepeatedly(Return("ON"));
    EXPECT_CALL(session, usbStatus(2)).WillRepeatedly(Return("OFF"));

    ScriptedKeySource keys("");
    InteractiveConsole console(session, keys, out);
    console.printSnapshot();

    EXPECT_NE(out.str().find("alice@bench"), std::string::npos);
    EXPECT_NE(out.str().find("USB #2"), std::string::npos);
}

TEST_F(InteractiveConsoleTest, PasteUploadsConsoleBuffer) {
    ScriptedKeySource keys(std::string("\x01" "b\x01" "b", 4));
    EXPECT_CALL(session, consoleFlush())
        .WillOnce(Return(std::optional<std::string>("boot log\n")))
        .WillOnce(Return(std::optional<std::string>("more\n")));

    int uploads = 0;
    InteractiveConsole console(session, keys, out, [&uploads](const std::string& text) -> std::string {
        if (uploads++ == 0) {
            EXPECT_EQ(text, "boot log\n");
            return "https://pastebin.com/abc123";
        }
        throw std::runtime_error("Bad API request");
    });
    console.run();

    EXPECT_NE(out.str().find("uploaded to https://pastebin.com/abc123"), std::string::npos);
    EXPECT_NE(out.str().find("Failed to upload console buffer: Bad API request"), std::string::npos);
}

TEST_F(InteractiveConsoleTest, DetachesWhenSessionFails) {
    ScriptedKeySource keys("x");
    EXPECT_CALL(session, consoleSend("x")).WillOnce(::testing::Throw(TransportError("connection closed")));
    EXPECT_CALL(session, consoleDetach()).Times(1);

    InteractiveConsole console(session, keys, out);
    EXPECT_THROW(console.run(), TransportError);
}
