#pragma once

#include <memory>
#include <string>
#include <nlohmann/json.hpp>

class UsbSwitch {
public:
    enum class Status { PoweredOff, PoweredOn, Unknown };

    virtual ~UsbSwitch() = default;

    virtual bool probe() = 0;
    virtual bool on() = 0;
    virtual bool off() = 0;
    virtual Status status() = 0;
    virtual bool toggle();

    const std::string& className() const { return class_name_; }
    void setClassName(const std::string& class_name) { class_name_ = class_name; }

private:
    std::string class_name_;
};

//   { "class": "HID", "variant": "shell", "on": "...", "off": "...", "status": "..." }
class ShellUsbSwitch : public UsbSwitch {
public:
    explicit ShellUsbSwitch(const nlohmann::json& config);

    bool probe() override;
    bool on() override;
    bool off() override;
    Status status() override;

private:
    std::string on_cmd_;
    std::string off_cmd_;
    std::string status_cmd_;
    Status last_status_;

    bool execute(const std::string& cmd, Status new_status);
};

std::unique_ptr<UsbSwitch> createUsbSwitch(const nlohmann::json& config);
