#include <gtest/gtest.h>
#include "console_logger.h"
#include "fake_devices.h"

TEST(ConsoleLoggerTest, KeepsCompleteLines) {
    FakeConsole console;
    ConsoleLogger logger(console);

    logger.process("first\nsec");
    EXPECT_EQ(logger.lines(), 1u);
    logger.process("ond\nthird\n");
    EXPECT_EQ(logger.lines(), 3u);

    EXPECT_EQ(logger.head(), "first\n");
    EXPECT_EQ(logger.tail(), "third\n");
    EXPECT_EQ(logger.lines(), 1u);
    EXPECT_EQ(logger.flush(), "second\n");
    EXPECT_EQ(logger.lines(), 0u);
    EXPECT_EQ(logger.head(), "");
}

TEST(ConsoleLoggerTest, DropsOldestLinesBeyondCapacity) {
    FakeConsole console;
    ConsoleLogger logger(console, 2);

    logger.process("a\nb\nc\n");
    EXPECT_EQ(logger.lines(), 2u);
    EXPECT_EQ(logger.head(), "b\n");
}

TEST(ConsoleLoggerTest, FlushIncludesPartialLine) {
    FakeConsole console;
    ConsoleLogger logger(console);

    logger.process("login: ");
    EXPECT_EQ(logger.lines(), 0u);
    EXPECT_EQ(logger.flush(), "login: ");
}

TEST(ConsoleLoggerTest, ForwardsToSinkWithOptionalTimestamps) {
    FakeConsole console;
    ConsoleLogger logger(console);
    std::string forwarded;
    logger.setSink([&forwarded](const std::string& data) { forwarded += data; });

    logger.process("plain\n");
    EXPECT_EQ(forwarded, "plain\n");

    EXPECT_TRUE(logger.toggleTimestamps());
    forwarded.clear();
    logger.process("one\ntwo\n");
    ASSERT_EQ(forwarded.size(), 2 * std::string("[   0.000000] ").size() + 8);
    EXPECT_EQ(forwarded[0], '[');
    EXPECT_NE(forwarded.find("] one\n["), std::string::npos);

    EXPECT_FALSE(logger.toggleTimestamps());
}

TEST(ConsoleLoggerTest, RunReturnsOutputUpToPrompt) {
    FakeConsole console;
    ConsoleLogger logger(console);
    logger.process("stale line\n");

    console.on_write = [&logger](const std::string& data) {
        logger.process(data);
        logger.process("Linux 6.6.0\n=> ");
    };

    EXPECT_EQ(logger.run("uname -a", std::chrono::milliseconds(1000)), std::optional<std::string>("Linux 6.6.0\n"));
    EXPECT_EQ(console.written, "uname -a\n");
    EXPECT_EQ(logger.lines(), 0u);
}

TEST(ConsoleLoggerTest, RunWithoutPromptTimesOut) {
    FakeConsole console;
    ConsoleLogger logger(console);
    console.on_write = [&logger](const std::string&) {
        logger.process("partial output\n");
    };

    EXPECT_EQ(logger.run("sleep 100", std::chrono::milliseconds(50)), std::nullopt);
    EXPECT_EQ(console.written, "sleep 100\n");
}

TEST(ConsoleLoggerTest, ReaderErrorStopsAndAllowsRestart) {
    FakeConsole console;
    console.broken = true;
    ConsoleLogger logger(console);
    logger.start();

    auto deadline = std::chrono::steady_clock::now() + std::chrono::seconds(2);
    while (logger.isRunning() && std::chrono::steady_clock::now() < deadline) {
        std::this_thread::sleep_for(std::chrono::milliseconds(10));
    }
    EXPECT_FALSE(logger.isRunning());

    console.broken = false;
    logger.start();
    EXPECT_TRUE(logger.isRunning());
    logger.stop();
    EXPECT_FALSE(logger.isRunning());
}

TEST(ConsoleLoggerTest, PromptCanBeChanged) {
    FakeConsole console;
    ConsoleLogger logger(console);

    EXPECT_EQ(logger.prompt(), ConsoleLogger::DEFAULT_PROMPT);
    EXPECT_EQ(logger.prompt(std::string("# ")), "# ");
    EXPECT_EQ(logger.prompt(), "# ");
}
