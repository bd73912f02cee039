#include "agent.h"
#include "config_manager.h"
#include "console_device.h"
#include "power_controller.h"
#include "sdmux_controller.h"
#include "usb_switch.h"
#include <iostream>

#ifndef MTDA_VERSION
#define MTDA_VERSION "0.0.0"
#endif

Agent::Agent()
    : console_lines_(ConsoleLogger::DEFAULT_MAX_LINES)
    , console_timeout_(30)
    , running_(false)
    , is_server_(false)
    , sd_bytes_written_(0)
    , sd_mounted_(false)
    , sd_opened_(false)
    , lock_timeout_(5) {
}

Agent::~Agent() {
    stop();
}

std::string Agent::version() const {
    return MTDA_VERSION;
}

void Agent::configure(const ConfigManager& config) {
    if (config.hasSection("console")) {
        console_ = createConsoleDevice(config.getSection("console"));
        console_lines_ = config.getConsoleLines();
        console_prompt_ = config.getConsolePrompt();
        console_timeout_ = std::chrono::seconds(config.getConsoleTimeoutSeconds());
    }
    if (config.hasSection("power")) {
        power_controller_ = createPowerController(config.getSection("power"));
    }
    if (config.hasSection("sdmux")) {
        sdmux_controller_ = createSdMuxController(config.getSection("sdmux"));
    }
    if (config.hasSection("usb")) {
        nlohmann::json ports = config.getSection("usb");
        if (!ports.is_array()) {
            std::cerr << "usb section shall list one object per port!" << std::endl;
            return;
        }
        for (const auto& port : ports) {
            auto usb_switch = createUsbSwitch(port);
            if (!usb_switch) {
                continue;
            }
            if (!usb_switch->probe()) {
                std::cerr << "Probe of USB switch #" << (usb_switches_.size() + 1) << " failed!" << std::endl;
                continue;
            }
            usb_switches_.push_back(std::move(usb_switch));
        }
    }
}

bool Agent::start(bool is_server) {
    if (running_) {
        return true;
    }
    is_server_ = is_server;

    if (power_controller_ && !power_controller_->probe()) {
        std::cerr << "Probe of the Power Controller failed!" << std::endl;
        return false;
    }

    if (sdmux_controller_ && !sdmux_controller_->probe()) {
        std::cerr << "Probe of the SDMUX Controller failed!" << std::endl;
        return false;
    }

    if (console_) {
        if (!console_->probe()) {
            logError("Console probe failed, console will not be available");
        } else {
            console_logger_ = std::make_unique<ConsoleLogger>(*console_, console_lines_);
            if (!console_prompt_.empty()) {
                console_logger_->prompt(console_prompt_);
            }
            if (console_sink_) {
                console_logger_->setSink(console_sink_);
            }
            console_logger_->start();
        }
    }

    running_ = true;
    logInfo("Agent " + version() + " started");
    return true;
}

void Agent::stop() {
    if (!running_) {
        return;
    }
    if (console_logger_) {
        console_logger_->stop();
    }
    if (sdmux_controller_ && sd_opened_) {
        sdmux_controller_->close();
        sd_opened_ = false;
    }
    running_ = false;
    logInfo("Agent stopped");
}

void Agent::setPowerController(std::unique_ptr<PowerController> controller) {
    power_controller_ = std::move(controller);
}

void Agent::setSdMuxController(std::unique_ptr<SdMuxController> controller) {
    sdmux_controller_ = std::move(controller);
}

void Agent::setConsole(std::unique_ptr<ConsoleDevice> console) {
    console_ = std::move(console);
}

void Agent::addUsbSwitch(std::unique_ptr<UsbSwitch> usb_switch) {
    usb_switches_.push_back(std::move(usb_switch));
}

void Agent::setConsoleSink(ConsoleLogger::Sink sink) {
    console_sink_ = sink;
    if (console_logger_) {
        console_logger_->setSink(std::move(sink));
    }
}

/*==================  Console  ==================*/

bool Agent::consoleClear(const std::string& session) {
    checkExpired(session);
    if (consoleLocked(session) || !console_logger_) {
        return false;
    }
    console_logger_->clear();
    return true;
}

std::optional<std::string> Agent::consoleFlush(const std::string& session) {
    checkExpired(session);
    if (consoleLocked(session) || !console_logger_) {
        return std::nullopt;
    }
    return console_logger_->flush();
}

std::optional<std::string> Agent::consoleHead(const std::string& session) {
    checkExpired(session);
    if (!console_logger_) {
        return std::nullopt;
    }
    return console_logger_->head();
}

std::optional<size_t> Agent::consoleLines(const std::string& session) {
    checkExpired(session);
    if (!console_logger_) {
        return std::nullopt;
    }
    return console_logger_->lines();
}

bool Agent::consoleLocked(const std::string& session) {
    checkExpired(session);
    return checkLocked(session);
}

std::optional<std::string> Agent::consolePrompt(const std::optional<std::string>& new_prompt,
                                                const std::string& session) {
    checkExpired(session);
    if (consoleLocked(session) || !console_logger_) {
        return std::nullopt;
    }
    return console_logger_->prompt(new_prompt);
}

std::optional<std::string> Agent::consoleRun(const std::string& cmd, const std::string& session) {
    checkExpired(session);
    if (consoleLocked(session) || !console_logger_) {
        return std::nullopt;
    }
    return console_logger_->run(cmd, console_timeout_);
}

bool Agent::consoleSend(const std::string& data, const std::string& session) {
    checkExpired(session);
    if (consoleLocked(session) || !console_logger_) {
        return false;
    }
    return console_logger_->write(data);
}

std::optional<std::string> Agent::consoleTail(const std::string& session) {
    checkExpired(session);
    if (consoleLocked(session) || !console_logger_) {
        return std::nullopt;
    }
    return console_logger_->tail();
}

bool Agent::toggleTimestamps() {
    if (!console_logger_) {
        logError("no console configured/found!");
        return false;
    }
    console_logger_->toggleTimestamps();
    return true;
}

/*==================  Target  ==================*/

bool Agent::targetLock(const std::string& session) {
    checkExpired(session);
    if (!lock_owner_ || *lock_owner_ == session) {
        lock_owner_ = session;
        lock_expiry_ = std::chrono::steady_clock::now() + lock_timeout_;
        logInfo("Target locked by " + session);
        return true;
    }
    return false;
}

bool Agent::targetLocked(const std::string& session) {
    checkExpired(session);
    return checkLocked(session);
}

bool Agent::targetOn(const std::string& session) {
    checkExpired(session);
    if (console_logger_) {
        console_logger_->resume();
    }
    if (powerLocked(session)) {
        return false;
    }
    return power_controller_->on();
}

bool Agent::targetOff(const std::string& session) {
    checkExpired(session);
    if (powerLocked(session)) {
        return false;
    }
    bool status = power_controller_->off();
    if (console_logger_) {
        console_logger_->resetTimer();
        if (status) {
            console_logger_->pause();
        }
    }
    return status;
}

std::string Agent::targetStatus(const std::string& session) {
    checkExpired(session);
    if (!power_controller_) {
        return PowerController::POWER_UNSURE;
    }
    return power_controller_->status();
}

std::string Agent::targetToggle(const std::string& session) {
    checkExpired(session);
    if (powerLocked(session)) {
        return PowerController::POWER_LOCKED;
    }
    std::string status = power_controller_->toggle();
    if (console_logger_) {
        if (status == PowerController::POWER_ON) {
            console_logger_->resume();
        } else if (status == PowerController::POWER_OFF) {
            console_logger_->pause();
            console_logger_->resetTimer();
        }
    }
    return status;
}

bool Agent::targetUnlock(const std::string& session) {
    checkExpired(session);
    if (lock_owner_ && *lock_owner_ == session) {
        lock_owner_.reset();
        logInfo("Target unlocked by " + session);
        return true;
    }
    return false;
}

bool Agent::powerLocked(const std::string& session) {
    checkExpired(session);
    if (checkLocked(session)) {
        return true;
    }
    return power_controller_ == nullptr;
}

/*==================  SD card  ==================*/

uint64_t Agent::sdBytesWritten(const std::string& session) {
    checkExpired(session);
    return sd_bytes_written_;
}

bool Agent::sdClose(const std::string& session) {
    checkExpired(session);
    if (!sdmux_controller_) {
        return false;
    }
    if (sd_opened_) {
        sd_opened_ = !sdmux_controller_->close();
    }
    return !sd_opened_;
}

bool Agent::sdLocked(const std::string& session) {
    checkExpired(session);
    if (checkLocked(session)) {
        return true;
    }
    // Cannot swap the SD card between the host and target without a SD mux
    if (!sdmux_controller_) {
        return true;
    }
    // We also need a power controller to be safe
    if (!power_controller_) {
        return true;
    }
    // The target shall be OFF
    if (targetStatus(session) != PowerController::POWER_OFF) {
        return true;
    }
    // Lastly, the SD shall not be opened
    return sd_opened_;
}

bool Agent::sdMount(const std::optional<std::string>& part, const std::string& session) {
    checkExpired(session);
    if (sd_mounted_) {
        return true;
    }
    if (!sdmux_controller_) {
        return false;
    }
    sd_mounted_ = sdmux_controller_->mount(part);
    return sd_mounted_;
}

bool Agent::sdOpen(const std::string& session) {
    checkExpired(session);
    if (!sdmux_controller_) {
        return false;
    }
    sdClose(session);
    sd_bytes_written_ = 0;
    sd_opened_ = sdmux_controller_->open();
    return sd_opened_;
}

std::string Agent::sdStatus(const std::string& session) {
    checkExpired(session);
    if (!sdmux_controller_) {
        return SdMuxController::SD_ON_UNSURE;
    }
    return sdmux_controller_->status();
}

bool Agent::sdToHost(const std::string& session) {
    checkExpired(session);
    if (sdLocked(session)) {
        return false;
    }
    return sdmux_controller_->toHost();
}

bool Agent::sdToTarget(const std::string& session) {
    checkExpired(session);
    if (sdLocked(session)) {
        return false;
    }
    sdClose(session);
    bool status = sdmux_controller_->toTarget();
    if (status) {
        sd_mounted_ = false;
    }
    return status;
}

std::string Agent::sdToggle(const std::string& session) {
    checkExpired(session);
    if (!sdLocked(session)) {
        std::string status = sdStatus(session);
        if (status == SdMuxController::SD_ON_HOST) {
            if (sdmux_controller_->toTarget()) {
                sd_mounted_ = false;
            }
        } else if (status == SdMuxController::SD_ON_TARGET) {
            sdmux_controller_->toHost();
        }
    }
    return sdStatus(session);
}

int64_t Agent::sdUpdate(const std::string& dst, uint64_t offset, const std::string& data,
                        const std::string& session) {
    checkExpired(session);
    if (!sdmux_controller_) {
        return -1;
    }
    if (offset == 0) {
        sd_bytes_written_ = 0;
    }
    int64_t result = sdmux_controller_->update(dst, offset, data);
    if (result > 0) {
        sd_bytes_written_ += static_cast<uint64_t>(result);
    }
    return result;
}

int64_t Agent::sdWrite(const std::string& data, const std::string& session) {
    checkExpired(session);
    if (!sdmux_controller_ || !sd_opened_) {
        return -1;
    }
    if (!sdmux_controller_->write(data)) {
        return -1;
    }
    sd_bytes_written_ += data.size();
    return SD_BLOCK_SIZE;
}

/*==================  USB  ==================*/

UsbSwitch* Agent::usbFindByClass(const std::string& class_name) {
    for (auto& usb_switch : usb_switches_) {
        if (usb_switch->className() == class_name) {
            return usb_switch.get();
        }
    }
    return nullptr;
}

bool Agent::usbHasClass(const std::string& class_name, const std::string& session) {
    checkExpired(session);
    return usbFindByClass(class_name) != nullptr;
}

bool Agent::usbOffByClass(const std::string& class_name, const std::string& session) {
    checkExpired(session);
    UsbSwitch* usb_switch = usbFindByClass(class_name);
    return usb_switch != nullptr && usb_switch->off();
}

bool Agent::usbOnByClass(const std::string& class_name, const std::string& session) {
    checkExpired(session);
    UsbSwitch* usb_switch = usbFindByClass(class_name);
    return usb_switch != nullptr && usb_switch->on();
}

int Agent::usbPorts(const std::string& session) {
    checkExpired(session);
    return static_cast<int>(usb_switches_.size());
}

std::string Agent::usbStatus(int ndx, const std::string& session) {
    checkExpired(session);
    if (ndx <= 0) {
        return "???";
    }
    if (static_cast<size_t>(ndx) > usb_switches_.size()) {
        logError("invalid USB switch #" + std::to_string(ndx));
        return "ERR";
    }
    switch (usb_switches_[ndx - 1]->status()) {
        case UsbSwitch::Status::PoweredOn:
            return "ON";
        case UsbSwitch::Status::PoweredOff:
            return "OFF";
        default:
            return "???";
    }
}

bool Agent::usbToggle(int ndx, const std::string& session) {
    checkExpired(session);
    if (ndx <= 0 || static_cast<size_t>(ndx) > usb_switches_.size()) {
        logError("invalid USB switch #" + std::to_string(ndx));
        return false;
    }
    return usb_switches_[ndx - 1]->toggle();
}

/*==================  Lock management  ==================*/

void Agent::checkExpired(const std::string& session) {
    if (!lock_owner_) {
        return;
    }
    auto now = std::chrono::steady_clock::now();
    if (session == *lock_owner_) {
        lock_expiry_ = now + lock_timeout_;
    } else if (now >= lock_expiry_) {
        logInfo("Lock held by " + *lock_owner_ + " expired");
        lock_owner_.reset();
    }
}

bool Agent::checkLocked(const std::string& session) const {
    return lock_owner_ && *lock_owner_ != session;
}

void Agent::logInfo(const std::string& message) {
    if (is_server_) {
        std::cout << "[INFO] " << message << std::endl;
    }
}

void Agent::logError(const std::string& message) {
    std::cerr << "[ERROR] " << message << std::endl;
}
