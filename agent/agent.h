#pragma once

#include <chrono>
#include <cstdint>
#include <memory>
#include <optional>
#include <string>
#include <vector>
#include "console_logger.h"

// Forward declarations
class ConfigManager;
class ConsoleDevice;
class PowerController;
class SdMuxController;
class UsbSwitch;

// Owns the device controllers of a test rig and arbitrates access to them
// between sessions.
class Agent {
public:
    static constexpr int64_t SD_BLOCK_SIZE = 65536;

    Agent();
    ~Agent();

    void configure(const ConfigManager& config);
    bool start(bool is_server);
    void stop();
    bool isRunning() const { return running_; }
    std::string version() const;

    // Controller setup
    void setPowerController(std::unique_ptr<PowerController> controller);
    void setSdMuxController(std::unique_ptr<SdMuxController> controller);
    void setConsole(std::unique_ptr<ConsoleDevice> console);
    void addUsbSwitch(std::unique_ptr<UsbSwitch> usb_switch);
    void setConsoleSink(ConsoleLogger::Sink sink);
    ConsoleLogger* consoleLogger() { return console_logger_.get(); }

    // Console
    bool consoleClear(const std::string& session);
    std::optional<std::string> consoleFlush(const std::string& session);
    std::optional<std::string> consoleHead(const std::string& session);
    std::optional<size_t> consoleLines(const std::string& session);
    bool consoleLocked(const std::string& session);
    std::optional<std::string> consolePrompt(const std::optional<std::string>& new_prompt,
                                             const std::string& session);
    std::optional<std::string> consoleRun(const std::string& cmd, const std::string& session);
    bool consoleSend(const std::string& data, const std::string& session);
    std::optional<std::string> consoleTail(const std::string& session);
    bool toggleTimestamps();

    // Target
    bool targetLock(const std::string& session);
    bool targetLocked(const std::string& session);
    std::optional<std::string> targetOwner() const { return lock_owner_; }
    bool targetOn(const std::string& session);
    bool targetOff(const std::string& session);
    std::string targetStatus(const std::string& session);
    std::string targetToggle(const std::string& session);
    bool targetUnlock(const std::string& session);

    // SD card
    uint64_t sdBytesWritten(const std::string& session);
    bool sdClose(const std::string& session);
    bool sdLocked(const std::string& session);
    bool sdMount(const std::optional<std::string>& part, const std::string& session);
    bool sdOpen(const std::string& session);
    std::string sdStatus(const std::string& session);
    bool sdToHost(const std::string& session);
    bool sdToTarget(const std::string& session);
    std::string sdToggle(const std::string& session);
    int64_t sdUpdate(const std::string& dst, uint64_t offset, const std::string& data,
                     const std::string& session);
    int64_t sdWrite(const std::string& data, const std::string& session);

    // USB
    bool usbHasClass(const std::string& class_name, const std::string& session);
    bool usbOffByClass(const std::string& class_name, const std::string& session);
    bool usbOnByClass(const std::string& class_name, const std::string& session);
    int usbPorts(const std::string& session);
    std::string usbStatus(int ndx, const std::string& session);
    bool usbToggle(int ndx, const std::string& session);

    // Utility
    void logInfo(const std::string& message);
    void logError(const std::string& message);

private:
    std::unique_ptr<PowerController> power_controller_;
    std::unique_ptr<SdMuxController> sdmux_controller_;
    std::unique_ptr<ConsoleDevice> console_;
    std::unique_ptr<ConsoleLogger> console_logger_;
    std::vector<std::unique_ptr<UsbSwitch>> usb_switches_;
    ConsoleLogger::Sink console_sink_;

    size_t console_lines_;
    std::string console_prompt_;
    std::chrono::seconds console_timeout_;
    bool running_;
    bool is_server_;

    // SD state
    uint64_t sd_bytes_written_;
    bool sd_mounted_;
    bool sd_opened_;

    // Target lock
    std::optional<std::string> lock_owner_;
    std::chrono::steady_clock::time_point lock_expiry_;
    std::chrono::minutes lock_timeout_;

    bool powerLocked(const std::string& session);
    UsbSwitch* usbFindByClass(const std::string& class_name);
    void checkExpired(const std::string& session);
    bool checkLocked(const std::string& session) const;
};
