#include "power_controller.h"
#include "shell_command.h"
#include <algorithm>
#include <cctype>
#include <iostream>

std::string PowerController::toggle() {
    if (status() == POWER_ON) {
        off();
    } else {
        on();
    }
    return status();
}

ShellPowerController::ShellPowerController(const nlohmann::json& config)
    : on_cmd_(config.value("on", ""))
    , off_cmd_(config.value("off", ""))
    , status_cmd_(config.value("status", ""))
    , probe_cmd_(config.value("probe", ""))
    , last_status_(POWER_UNSURE) {
}

bool ShellPowerController::probe() {
    if (on_cmd_.empty() || off_cmd_.empty()) {
        std::cerr << "[ShellPowerController] \"on\" and \"off\" commands are required" << std::endl;
        return false;
    }
    if (probe_cmd_.empty()) {
        return true;
    }
    CommandResult result = runCommand(probe_cmd_);
    if (result.exit_code != 0) {
        std::cerr << "[ShellPowerController] Probe failed: " << trimOutput(result.output) << std::endl;
        return false;
    }
    return true;
}

bool ShellPowerController::on() {
    return execute(on_cmd_, POWER_ON);
}

bool ShellPowerController::off() {
    return execute(off_cmd_, POWER_OFF);
}

std::string ShellPowerController::status() {
    if (status_cmd_.empty()) {
        return last_status_;
    }

    CommandResult result = runCommand(status_cmd_);
    if (result.exit_code != 0) {
        return POWER_UNSURE;
    }

    std::string value = trimOutput(result.output);
    std::transform(value.begin(), value.end(), value.begin(),
                   [](unsigned char c) { return static_cast<char>(std::tolower(c)); });
    if (value == "on" || value == "1") return POWER_ON;
    if (value == "off" || value == "0") return POWER_OFF;
    return POWER_UNSURE;
}

bool ShellPowerController::execute(const std::string& cmd, const char* new_status) {
    CommandResult result = runCommand(cmd);
    if (result.exit_code != 0) {
        std::cerr << "[ShellPowerController] '" << cmd << "' failed: " << trimOutput(result.output) << std::endl;
        return false;
    }
    last_status_ = new_status;
    return true;
}

std::unique_ptr<PowerController> createPowerController(const nlohmann::json& config) {
    std::string variant = config.value("variant", "");
    if (variant.empty()) {
        std::cerr << "power controller variant not defined!" << std::endl;
        return nullptr;
    }
    if (variant == "shell") {
        return std::make_unique<ShellPowerController>(config);
    }
    std::cerr << "power controller \"" << variant << "\" could not be found/loaded!" << std::endl;
    return nullptr;
}
