#include <gtest/gtest.h>
#include <chrono>
#include <sstream>
#include <thread>
#include <arpa/inet.h>
#include <netinet/in.h>
#include <sys/socket.h>
#include <unistd.h>
#include "agent.h"
#include "codec.h"
#include "command_router.h"
#include "fake_devices.h"
#include "remote_session.h"
#include "rpc_channel.h"
#include "rpc_protocol.h"
#include "rpc_server.h"

// Listening socket that accepts connections at the kernel level but never
// answers, or a port nothing listens on once closed.
class SilentListener {
public:
    SilentListener() {
        fd_ = socket(AF_INET, SOCK_STREAM, 0);
        sockaddr_in addr{};
        addr.sin_family = AF_INET;
        addr.sin_addr.s_addr = htonl(INADDR_LOOPBACK);
        addr.sin_port = 0;
        bind(fd_, reinterpret_cast<sockaddr*>(&addr), sizeof(addr));
        listen(fd_, 4);
        socklen_t len = sizeof(addr);
        getsockname(fd_, reinterpret_cast<sockaddr*>(&addr), &len);
        port_ = ntohs(addr.sin_port);
    }
    ~SilentListener() { close(); }

    void close() {
        if (fd_ >= 0) {
            ::close(fd_);
            fd_ = -1;
        }
    }
    int port() const { return port_; }

private:
    int fd_;
    int port_;
};

static BrokerSettings noBroker() {
    return BrokerSettings{"127.0.0.1", 1, ""};
}

TEST(CodecTest, Base64HandlesBinary) {
    std::string data("\x00\x01\xff\n binary", 11);
    std::string encoded = base64Encode(data);
    EXPECT_EQ(encoded.find('\n'), std::string::npos);
    EXPECT_EQ(base64Decode(encoded), data);
    EXPECT_EQ(base64Encode("mtda"), "bXRkYQ==");
}

class RpcLoopbackTest : public ::testing::Test {
protected:
    Agent agent;
    FakePowerController* power = nullptr;
    FakeConsole* console = nullptr;
    std::unique_ptr<RpcServer> server;
    std::thread serve_thread;

    void SetUp() override {
        auto fake_power = std::make_unique<FakePowerController>();
        power = fake_power.get();
        agent.setPowerController(std::move(fake_power));
        auto fake_console = std::make_unique<FakeConsole>();
        console = fake_console.get();
        agent.setConsole(std::move(fake_console));
        ASSERT_TRUE(agent.start(true));

        server = std::make_unique<RpcServer>(agent, 0);
        ASSERT_TRUE(server->bind());
        serve_thread = std::thread([this] { server->serve(); });
    }

    void TearDown() override {
        server->stop();
        serve_thread.join();
        server.reset();
        agent.stop();
    }

    std::unique_ptr<RemoteSession> connect(const std::string& id) {
        return std::make_unique<RemoteSession>("127.0.0.1", server->port(), id, noBroker());
    }
};

TEST_F(RpcLoopbackTest, ForwardsCallsToAgent) {
    auto session = connect("alice@bench");

    EXPECT_EQ(session->agentVersion(), agent.version());
    EXPECT_EQ(session->targetStatus(), PowerController::POWER_OFF);
    EXPECT_EQ(session->targetToggle(), PowerController::POWER_ON);
    EXPECT_EQ(power->state, PowerController::POWER_ON);
    EXPECT_EQ(session->sdStatus(), "???");
    EXPECT_EQ(session->sdWrite("block"), -1);
    EXPECT_EQ(session->usbPorts(), 0);
    EXPECT_FALSE(session->targetOwner().has_value());
}

TEST_F(RpcLoopbackTest, ConsoleDataSurvivesTransport) {
    auto session = connect("alice@bench");
    agent.consoleLogger()->process("boot\n");

    EXPECT_EQ(session->consoleLines(), std::optional<size_t>(1));
    EXPECT_TRUE(session->consoleSend(std::string("\x03\r", 2)));
    EXPECT_EQ(console->written, std::string("\x03\r", 2));
    EXPECT_EQ(session->consolePrompt(std::string("# ")), std::optional<std::string>("# "));
    EXPECT_EQ(session->consoleHead(), std::optional<std::string>("boot\n"));
}

TEST_F(RpcLoopbackTest, LockIsPerSession) {
    auto alice = connect("alice@bench");
    auto bob = connect("bob@lab");

    EXPECT_TRUE(alice->targetLock());
    EXPECT_TRUE(bob->targetLocked());
    EXPECT_EQ(bob->targetOwner(), std::optional<std::string>("alice@bench"));
    EXPECT_FALSE(bob->targetOn());
    EXPECT_TRUE(alice->targetUnlock());
    EXPECT_TRUE(bob->targetOn());
}

TEST_F(RpcLoopbackTest, UnknownMethodIsReportedNotFatal) {
    RpcChannel channel("127.0.0.1", server->port());
    EXPECT_THROW(channel.call("self_destruct", "eve"), TransportError);
    EXPECT_EQ(channel.call("target_status", "eve").get<std::string>(), PowerController::POWER_OFF);
}

static int connectLoopback(int port) {
    int fd = socket(AF_INET, SOCK_STREAM, 0);
    sockaddr_in addr{};
    addr.sin_family = AF_INET;
    addr.sin_addr.s_addr = htonl(INADDR_LOOPBACK);
    addr.sin_port = htons(static_cast<uint16_t>(port));
    if (fd >= 0 && ::connect(fd, reinterpret_cast<sockaddr*>(&addr), sizeof(addr)) != 0) {
        ::close(fd);
        return -1;
    }
    return fd;
}

TEST_F(RpcLoopbackTest, WronglyTypedFieldsAreReportedNotFatal) {
    nlohmann::json reply = server->handleRequest({{"id", 1}, {"method", 5}});
    EXPECT_EQ(reply["id"], 1);
    EXPECT_TRUE(reply.contains("error"));

    reply = server->handleRequest({{"id", 2}, {"method", "target_status"}, {"session", 7}});
    EXPECT_TRUE(reply.contains("error"));

    reply = server->handleRequest({{"id", 3}, {"method", "console_run"}, {"args", "uname"}});
    EXPECT_TRUE(reply.contains("error"));

    reply = server->handleRequest({{"id", 4}, {"method", "console_run"}, {"args", {{"cmd", 42}}}});
    EXPECT_TRUE(reply.contains("error"));

    int fd = connectLoopback(server->port());
    ASSERT_GE(fd, 0);
    ASSERT_TRUE(sendFrame(fd, {{"id", 5}, {"method", nlohmann::json::array({"target_on"})}, {"session", "eve"}}));
    LineReader reader(fd);
    std::string line;
    ASSERT_EQ(reader.readLine(line, std::chrono::milliseconds(2000)), LineReader::Status::Line);
    nlohmann::json frame = nlohmann::json::parse(line);
    EXPECT_EQ(frame["id"], 5);
    EXPECT_TRUE(frame.contains("error"));
    ::close(fd);

    RpcChannel channel("127.0.0.1", server->port());
    EXPECT_EQ(channel.call("target_status", "eve").get<std::string>(), PowerController::POWER_OFF);
    EXPECT_EQ(power->state, PowerController::POWER_OFF);
}

TEST_F(RpcLoopbackTest, FinishedConnectionsAreReaped) {
    for (int i = 0; i < 5; i++) {
        RpcChannel channel("127.0.0.1", server->port());
        EXPECT_EQ(channel.call("target_status", "alice").get<std::string>(), PowerController::POWER_OFF);
    }

    auto deadline = std::chrono::steady_clock::now() + std::chrono::seconds(5);
    while (server->workerCount() > 0 && std::chrono::steady_clock::now() < deadline) {
        std::this_thread::sleep_for(std::chrono::milliseconds(50));
    }
    EXPECT_EQ(server->workerCount(), 0u);
}

TEST(RpcTransportTest, UnreachableEndpointThrows) {
    SilentListener listener;
    int port = listener.port();
    listener.close();

    RemoteSession session("127.0.0.1", port, "alice@bench", noBroker());
    EXPECT_THROW(session.targetStatus(), TransportError);
    EXPECT_THROW(session.targetOn(), TransportError);
}

TEST(RpcTransportTest, RouterReportsUnreachableAgent) {
    SilentListener listener;
    int port = listener.port();
    listener.close();

    RemoteSession session("127.0.0.1", port, "alice@bench", noBroker());
    std::ostringstream out;
    std::ostringstream err;
    CommandRouter router(CommandContext{session, out, err, nullptr});

    EXPECT_EQ(router.dispatch({"target", "on"}), 1);
    EXPECT_EQ(err.str().rfind("target on: ", 0), 0u);
}

TEST(RpcTransportTest, SilentPeerIsDeclaredDead) {
    SilentListener listener;
    RpcChannel channel("127.0.0.1", listener.port(), std::chrono::seconds(1));

    auto start = std::chrono::steady_clock::now();
    EXPECT_THROW(channel.call("target_status", "alice"), TransportError);
    auto elapsed = std::chrono::steady_clock::now() - start;
    EXPECT_GE(elapsed, std::chrono::milliseconds(1900));

    EXPECT_THROW(channel.call("target_status", "alice"), TransportError);
    EXPECT_FALSE(channel.isConnected());
}
