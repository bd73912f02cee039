#pragma once

#include <memory>
#include <string>
#include <sys/types.h>
#include <nlohmann/json.hpp>

// Byte stream to the target's console.
class ConsoleDevice {
public:
    virtual ~ConsoleDevice() = default;

    virtual bool probe() = 0;
    // Returns the number of bytes read, 0 when nothing arrived within
    // timeout_ms, -1 on error.
    virtual ssize_t read(char* buf, size_t len, int timeout_ms) = 0;
    virtual bool write(const std::string& data) = 0;
    virtual void close() = 0;
};

//   { "variant": "serial", "port": "/dev/ttyUSB0", "rate": 115200 }
class SerialConsole : public ConsoleDevice {
public:
    explicit SerialConsole(const nlohmann::json& config);
    ~SerialConsole() override;

    bool probe() override;
    ssize_t read(char* buf, size_t len, int timeout_ms) override;
    bool write(const std::string& data) override;
    void close() override;

private:
    std::string port_;
    int rate_;
    int fd_;

    bool configure();
};

std::unique_ptr<ConsoleDevice> createConsoleDevice(const nlohmann::json& config);
