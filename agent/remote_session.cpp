#include "remote_session.h"
#include "codec.h"
#include "mqtt_client.h"
#include <iostream>
#include <unistd.h>

using json = nlohmann::json;

RemoteSession::RemoteSession(const std::string& host, int port, const std::string& session_id,
                             const BrokerSettings& broker, std::chrono::seconds heartbeat)
    : session_id_(session_id)
    , broker_(broker)
    , channel_(host, port, heartbeat) {
}

RemoteSession::~RemoteSession() {
    consoleDetach();
}

json RemoteSession::call(const std::string& method, const json& args) {
    return channel_.call(method, session_id_, args);
}

template <typename T>
T RemoteSession::callAs(const std::string& method, const json& args) {
    json result = call(method, args);
    try {
        return result.get<T>();
    } catch (const json::exception& e) {
        throw TransportError(method + ": unexpected reply from agent: " + e.what());
    }
}

std::optional<std::string> RemoteSession::callOptional(const std::string& method, const json& args) {
    json result = call(method, args);
    if (result.is_null()) {
        return std::nullopt;
    }
    if (!result.is_string()) {
        throw TransportError(method + ": unexpected reply from agent");
    }
    return result.get<std::string>();
}

std::string RemoteSession::agentVersion() {
    return callAs<std::string>("agent_version");
}

bool RemoteSession::consoleAttach(ConsoleSink sink) {
    consoleDetach();

    std::string client_id = "mtda-" + session_id_ + "-" + std::to_string(getpid());
    auto stream = std::make_unique<MqttClient>(broker_.host, broker_.port, client_id, broker_.ca_cert_path);
    stream->setMessageCallback([sink](const std::string&, const std::string& payload) {
        if (sink) {
            sink(payload);
        }
    });
    if (!stream->connect() || !stream->subscribe(MqttClient::CONSOLE_TOPIC)) {
        return false;
    }
    console_stream_ = std::move(stream);
    return true;
}

void RemoteSession::consoleDetach() {
    if (console_stream_) {
        console_stream_->unsubscribe(MqttClient::CONSOLE_TOPIC);
        console_stream_->disconnect();
        console_stream_.reset();
    }
}

bool RemoteSession::consoleClear() { return callAs<bool>("console_clear"); }
std::optional<std::string> RemoteSession::consoleFlush() { return callOptional("console_flush"); }
std::optional<std::string> RemoteSession::consoleHead() { return callOptional("console_head"); }

std::optional<size_t> RemoteSession::consoleLines() {
    json result = call("console_lines");
    if (result.is_null()) {
        return std::nullopt;
    }
    if (!result.is_number_unsigned()) {
        throw TransportError("console_lines: unexpected reply from agent");
    }
    return result.get<size_t>();
}

bool RemoteSession::consoleLocked() { return callAs<bool>("console_locked"); }

std::optional<std::string> RemoteSession::consolePrompt(const std::optional<std::string>& new_prompt) {
    json args = json::object();
    if (new_prompt) {
        args["prompt"] = *new_prompt;
    }
    return callOptional("console_prompt", args);
}

std::optional<std::string> RemoteSession::consoleRun(const std::string& cmd) {
    return callOptional("console_run", {{"cmd", cmd}});
}

bool RemoteSession::consoleSend(const std::string& data) {
    return callAs<bool>("console_send", {{"data", base64Encode(data)}});
}

std::optional<std::string> RemoteSession::consoleTail() { return callOptional("console_tail"); }
bool RemoteSession::toggleTimestamps() { return callAs<bool>("toggle_timestamps"); }

bool RemoteSession::targetLock() { return callAs<bool>("target_lock"); }
bool RemoteSession::targetLocked() { return callAs<bool>("target_locked"); }
std::optional<std::string> RemoteSession::targetOwner() { return callOptional("target_owner"); }
bool RemoteSession::targetOn() { return callAs<bool>("target_on"); }
bool RemoteSession::targetOff() { return callAs<bool>("target_off"); }
std::string RemoteSession::targetStatus() { return callAs<std::string>("target_status"); }
std::string RemoteSession::targetToggle() { return callAs<std::string>("target_toggle"); }
bool RemoteSession::targetUnlock() { return callAs<bool>("target_unlock"); }

uint64_t RemoteSession::sdBytesWritten() { return callAs<uint64_t>("sd_bytes_written"); }
bool RemoteSession::sdClose() { return callAs<bool>("sd_close"); }
bool RemoteSession::sdLocked() { return callAs<bool>("sd_locked"); }

bool RemoteSession::sdMount(const std::optional<std::string>& part) {
    json args = json::object();
    if (part) {
        args["part"] = *part;
    }
    return callAs<bool>("sd_mount", args);
}

bool RemoteSession::sdOpen() { return callAs<bool>("sd_open"); }
std::string RemoteSession::sdStatus() { return callAs<std::string>("sd_status"); }
bool RemoteSession::sdToHost() { return callAs<bool>("sd_to_host"); }
bool RemoteSession::sdToTarget() { return callAs<bool>("sd_to_target"); }
std::string RemoteSession::sdToggle() { return callAs<std::string>("sd_toggle"); }

int64_t RemoteSession::sdUpdate(const std::string& dst, uint64_t offset, const std::string& data) {
    return callAs<int64_t>("sd_update", {{"dst", dst}, {"offset", offset}, {"data", base64Encode(data)}});
}

int64_t RemoteSession::sdWrite(const std::string& data) {
    return callAs<int64_t>("sd_write", {{"data", base64Encode(data)}});
}

bool RemoteSession::usbHasClass(const std::string& class_name) {
    return callAs<bool>("usb_has_class", {{"class", class_name}});
}

bool RemoteSession::usbOffByClass(const std::string& class_name) {
    return callAs<bool>("usb_off_by_class", {{"class", class_name}});
}

bool RemoteSession::usbOnByClass(const std::string& class_name) {
    return callAs<bool>("usb_on_by_class", {{"class", class_name}});
}

int RemoteSession::usbPorts() { return callAs<int>("usb_ports"); }

std::string RemoteSession::usbStatus(int ndx) {
    return callAs<std::string>("usb_status", {{"port", ndx}});
}

bool RemoteSession::usbToggle(int ndx) {
    return callAs<bool>("usb_toggle", {{"port", ndx}});
}
