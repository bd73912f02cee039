#pragma once

#include <memory>
#include <mutex>
#include "session.h"
#include "rpc_channel.h"

class MqttClient;

struct BrokerSettings {
    std::string host;
    int port;
    std::string ca_cert_path;
};

// Session forwarding every call to an agent in another process over an
// RpcChannel. Console output arrives separately through the MQTT stream.
class RemoteSession : public Session {
public:
    RemoteSession(const std::string& host, int port, const std::string& session_id,
                  const BrokerSettings& broker,
                  std::chrono::seconds heartbeat = std::chrono::seconds(RPC_HEARTBEAT_SECONDS));
    ~RemoteSession() override;

    std::string id() const override { return session_id_; }
    std::string endpoint() const override { return channel_.endpoint(); }
    bool isRemote() const override { return true; }
    std::string agentVersion() override;

    bool consoleAttach(ConsoleSink sink) override;
    void consoleDetach() override;
    bool consoleClear() override;
    std::optional<std::string> consoleFlush() override;
    std::optional<std::string> consoleHead() override;
    std::optional<size_t> consoleLines() override;
    bool consoleLocked() override;
    std::optional<std::string> consolePrompt(const std::optional<std::string>& new_prompt) override;
    std::optional<std::string> consoleRun(const std::string& cmd) override;
    bool consoleSend(const std::string& data) override;
    std::optional<std::string> consoleTail() override;
    bool toggleTimestamps() override;

    bool targetLock() override;
    bool targetLocked() override;
    std::optional<std::string> targetOwner() override;
    bool targetOn() override;
    bool targetOff() override;
    std::string targetStatus() override;
    std::string targetToggle() override;
    bool targetUnlock() override;

    uint64_t sdBytesWritten() override;
    bool sdClose() override;
    bool sdLocked() override;
    bool sdMount(const std::optional<std::string>& part) override;
    bool sdOpen() override;
    std::string sdStatus() override;
    bool sdToHost() override;
    bool sdToTarget() override;
    std::string sdToggle() override;
    int64_t sdUpdate(const std::string& dst, uint64_t offset, const std::string& data) override;
    int64_t sdWrite(const std::string& data) override;

    bool usbHasClass(const std::string& class_name) override;
    bool usbOffByClass(const std::string& class_name) override;
    bool usbOnByClass(const std::string& class_name) override;
    int usbPorts() override;
    std::string usbStatus(int ndx) override;
    bool usbToggle(int ndx) override;

private:
    std::string session_id_;
    BrokerSettings broker_;
    RpcChannel channel_;
    std::unique_ptr<MqttClient> console_stream_;

    nlohmann::json call(const std::string& method,
                        const nlohmann::json& args = nlohmann::json::object());
    template <typename T>
    T callAs(const std::string& method, const nlohmann::json& args = nlohmann::json::object());
    std::optional<std::string> callOptional(const std::string& method,
                                            const nlohmann::json& args = nlohmann::json::object());
};
