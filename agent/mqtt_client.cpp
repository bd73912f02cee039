#include "mqtt_client.h"
#include <iostream>
#include <mosquitto.h>

MqttClient::MqttClient(const std::string& host, int port, const std::string& client_id,
                       const std::string& ca_cert_path)
    : host_(host)
    , port_(port)
    , client_id_(client_id)
    , ca_cert_path_(ca_cert_path)
    , mqtt_handle_(nullptr)
    , connected_(false) {

    initializeMqtt();
}

MqttClient::~MqttClient() {
    disconnect();
    cleanupMqtt();
}

bool MqttClient::connect() {
    if (!mqtt_handle_) {
        std::cerr << "[MqttClient] MQTT handle not initialized" << std::endl;
        return false;
    }

    if (!ca_cert_path_.empty() && !setupTLS()) {
        return false;
    }

    int result = mosquitto_connect(mqtt_handle_, host_.c_str(), port_, 60);
    if (result != MOSQ_ERR_SUCCESS) {
        std::cerr << "[MqttClient] Failed to connect to MQTT broker " << endpoint()
                  << ": " << mosquitto_strerror(result) << std::endl;
        return false;
    }

    // Start the network loop
    result = mosquitto_loop_start(mqtt_handle_);
    if (result != MOSQ_ERR_SUCCESS) {
        std::cerr << "[MqttClient] Failed to start MQTT loop: " << mosquitto_strerror(result) << std::endl;
        mosquitto_disconnect(mqtt_handle_);
        return false;
    }

    connected_ = true;
    return true;
}

void MqttClient::disconnect() {
    if (mqtt_handle_ && connected_) {
        mosquitto_disconnect(mqtt_handle_);
        mosquitto_loop_stop(mqtt_handle_, true);
        connected_ = false;
    }
}

bool MqttClient::isConnected() const {
    return connected_ && mqtt_handle_;
}

bool MqttClient::publish(const std::string& topic, const std::string& message, int qos) {
    if (!isConnected()) {
        return false;
    }

    int result = mosquitto_publish(mqtt_handle_, nullptr, topic.c_str(),
                                   static_cast<int>(message.length()), message.data(), qos, false);
    if (result != MOSQ_ERR_SUCCESS) {
        std::cerr << "[MqttClient] Failed to publish to topic " << topic
                  << ": " << mosquitto_strerror(result) << std::endl;
        return false;
    }
    return true;
}

bool MqttClient::publishConsole(const std::string& data) {
    return publish(CONSOLE_TOPIC, data, 0);
}

bool MqttClient::subscribe(const std::string& topic, int qos) {
    if (!isConnected()) {
        std::cerr << "[MqttClient] Not connected to broker" << std::endl;
        return false;
    }

    int result = mosquitto_subscribe(mqtt_handle_, nullptr, topic.c_str(), qos);
    if (result != MOSQ_ERR_SUCCESS) {
        std::cerr << "[MqttClient] Failed to subscribe to topic " << topic
                  << ": " << mosquitto_strerror(result) << std::endl;
        return false;
    }
    return true;
}

bool MqttClient::unsubscribe(const std::string& topic) {
    if (!isConnected()) {
        return false;
    }

    int result = mosquitto_unsubscribe(mqtt_handle_, nullptr, topic.c_str());
    if (result != MOSQ_ERR_SUCCESS) {
        std::cerr << "[MqttClient] Failed to unsubscribe from topic " << topic
                  << ": " << mosquitto_strerror(result) << std::endl;
        return false;
    }
    return true;
}

void MqttClient::setMessageCallback(MessageCallback callback) {
    message_callback_ = callback;
}

void MqttClient::initializeMqtt() {
    mosquitto_lib_init();

    mqtt_handle_ = mosquitto_new(client_id_.c_str(), true, this);
    if (!mqtt_handle_) {
        std::cerr << "[MqttClient] Failed to create MQTT client instance" << std::endl;
        return;
    }

    mosquitto_connect_callback_set(mqtt_handle_, [](struct mosquitto*, void*, int result) {
        if (result != 0) {
            std::cerr << "[MqttClient] Connection refused: " << mosquitto_connack_string(result) << std::endl;
        }
    });

    mosquitto_disconnect_callback_set(mqtt_handle_, [](struct mosquitto*, void* userdata, int result) {
        MqttClient* client = static_cast<MqttClient*>(userdata);
        if (result != 0) {
            std::cerr << "[MqttClient] Lost connection to broker " << client->endpoint() << std::endl;
        }
    });

    mosquitto_message_callback_set(mqtt_handle_, [](struct mosquitto*, void* userdata,
                                                    const struct mosquitto_message* message) {
        MqttClient* client = static_cast<MqttClient*>(userdata);
        if (client && client->message_callback_) {
            std::string topic(message->topic);
            std::string payload(static_cast<char*>(message->payload), message->payloadlen);
            client->handleMessage(topic, payload);
        }
    });
}

void MqttClient::cleanupMqtt() {
    if (mqtt_handle_) {
        mosquitto_destroy(mqtt_handle_);
        mqtt_handle_ = nullptr;
    }
    mosquitto_lib_cleanup();
}

bool MqttClient::setupTLS() {
    int result = mosquitto_tls_set(mqtt_handle_, ca_cert_path_.c_str(), nullptr, nullptr, nullptr, nullptr);
    if (result != MOSQ_ERR_SUCCESS) {
        std::cerr << "[MqttClient] Failed to set TLS certificates: " << mosquitto_strerror(result) << std::endl;
        return false;
    }

    result = mosquitto_tls_opts_set(mqtt_handle_, 1, "tlsv1.2", nullptr);
    if (result != MOSQ_ERR_SUCCESS) {
        std::cerr << "[MqttClient] Failed to set TLS options: " << mosquitto_strerror(result) << std::endl;
        return false;
    }
    return true;
}

void MqttClient::handleMessage(const std::string& topic, const std::string& message) {
    if (message_callback_) {
        message_callback_(topic, message);
    }
}
