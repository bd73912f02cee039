#include "usb_switch.h"
#include "shell_command.h"
#include <iostream>

bool UsbSwitch::toggle() {
    if (status() == Status::PoweredOn) {
        return off();
    }
    return on();
}

ShellUsbSwitch::ShellUsbSwitch(const nlohmann::json& config)
    : on_cmd_(config.value("on", ""))
    , off_cmd_(config.value("off", ""))
    , status_cmd_(config.value("status", ""))
    , last_status_(Status::Unknown) {
}

bool ShellUsbSwitch::probe() {
    if (on_cmd_.empty() || off_cmd_.empty()) {
        std::cerr << "[ShellUsbSwitch] \"on\" and \"off\" commands are required" << std::endl;
        return false;
    }
    return true;
}

bool ShellUsbSwitch::on() {
    return execute(on_cmd_, Status::PoweredOn);
}

bool ShellUsbSwitch::off() {
    return execute(off_cmd_, Status::PoweredOff);
}

UsbSwitch::Status ShellUsbSwitch::status() {
    if (status_cmd_.empty()) {
        return last_status_;
    }
    CommandResult result = runCommand(status_cmd_);
    std::string value = trimOutput(result.output);
    if (result.exit_code != 0) return Status::Unknown;
    if (value == "on" || value == "1") return Status::PoweredOn;
    if (value == "off" || value == "0") return Status::PoweredOff;
    return Status::Unknown;
}

bool ShellUsbSwitch::execute(const std::string& cmd, Status new_status) {
    CommandResult result = runCommand(cmd);
    if (result.exit_code != 0) {
        std::cerr << "[ShellUsbSwitch] '" << cmd << "' failed: " << trimOutput(result.output) << std::endl;
        return false;
    }
    last_status_ = new_status;
    return true;
}

std::unique_ptr<UsbSwitch> createUsbSwitch(const nlohmann::json& config) {
    std::string variant = config.value("variant", "");
    if (variant.empty()) {
        std::cerr << "usb switch variant not defined!" << std::endl;
        return nullptr;
    }

    std::unique_ptr<UsbSwitch> usb_switch;
    if (variant == "shell") {
        usb_switch = std::make_unique<ShellUsbSwitch>(config);
    } else {
        std::cerr << "usb switch \"" << variant << "\" could not be found/loaded!" << std::endl;
        return nullptr;
    }

    usb_switch->setClassName(config.value("class", ""));
    return usb_switch;
}
