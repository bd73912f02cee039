#pragma once

#include <atomic>
#include <functional>
#include <string>

// Forward declaration
struct mosquitto;

// Thin wrapper around libmosquitto used to stream the target console from
// the agent to attached clients.
class MqttClient {
public:
    using MessageCallback = std::function<void(const std::string& topic, const std::string& message)>;

    static constexpr const char* CONSOLE_TOPIC = "mtda/console";

    MqttClient(const std::string& host, int port, const std::string& client_id,
               const std::string& ca_cert_path = "");
    ~MqttClient();

    // Connection management
    bool connect();
    void disconnect();
    bool isConnected() const;
    std::string endpoint() const { return host_ + ":" + std::to_string(port_); }

    // Publishing
    bool publish(const std::string& topic, const std::string& message, int qos = 0);
    bool publishConsole(const std::string& data);

    // Subscription
    bool subscribe(const std::string& topic, int qos = 0);
    bool unsubscribe(const std::string& topic);
    void setMessageCallback(MessageCallback callback);

private:
    std::string host_;
    int port_;
    std::string client_id_;
    std::string ca_cert_path_;

    struct mosquitto* mqtt_handle_;

    MessageCallback message_callback_;
    std::atomic<bool> connected_;

    void initializeMqtt();
    void cleanupMqtt();
    bool setupTLS();
    void handleMessage(const std::string& topic, const std::string& message);
};
