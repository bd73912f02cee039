#pragma once

#include <memory>
#include <string>
#include <nlohmann/json.hpp>

class PowerController {
public:
    static constexpr const char* POWER_ON = "ON";
    static constexpr const char* POWER_OFF = "OFF";
    static constexpr const char* POWER_UNSURE = "???";
    static constexpr const char* POWER_LOCKED = "LOCKED";

    virtual ~PowerController() = default;

    virtual bool probe() = 0;
    virtual bool on() = 0;
    virtual bool off() = 0;
    virtual std::string status() = 0;

    // Returns the status observed after toggling.
    virtual std::string toggle();
};

// Power controller driven by shell commands:
//   { "variant": "shell", "on": "...", "off": "...", "status": "...", "probe": "..." }
// The status command prints "on" or "off"; without one the last commanded
// state is reported.
class ShellPowerController : public PowerController {
public:
    explicit ShellPowerController(const nlohmann::json& config);

    bool probe() override;
    bool on() override;
    bool off() override;
    std::string status() override;

private:
    std::string on_cmd_;
    std::string off_cmd_;
    std::string status_cmd_;
    std::string probe_cmd_;
    std::string last_status_;

    bool execute(const std::string& cmd, const char* new_status);
};

// Returns nullptr (after reporting) when the variant is missing or unknown.
std::unique_ptr<PowerController> createPowerController(const nlohmann::json& config);
