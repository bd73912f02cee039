#pragma once

#include <cstdint>
#include <functional>
#include <optional>
#include <stdexcept>
#include <string>

// Raised when the agent cannot be reached; never used for an operation the
// agent merely refused.
class TransportError : public std::runtime_error {
public:
    explicit TransportError(const std::string& what) : std::runtime_error(what) {}
};

// Binding of this process to one agent, local or remote, for its lifetime.
class Session {
public:
    using ConsoleSink = std::function<void(const std::string& data)>;

    virtual ~Session() = default;

    // Identity
    virtual std::string id() const = 0;
    virtual std::string endpoint() const = 0;
    virtual bool isRemote() const = 0;
    virtual std::string agentVersion() = 0;

    // Console
    virtual bool consoleAttach(ConsoleSink sink) = 0;
    virtual void consoleDetach() = 0;
    virtual bool consoleClear() = 0;
    virtual std::optional<std::string> consoleFlush() = 0;
    virtual std::optional<std::string> consoleHead() = 0;
    virtual std::optional<size_t> consoleLines() = 0;
    virtual bool consoleLocked() = 0;
    virtual std::optional<std::string> consolePrompt(const std::optional<std::string>& new_prompt) = 0;
    virtual std::optional<std::string> consoleRun(const std::string& cmd) = 0;
    virtual bool consoleSend(const std::string& data) = 0;
    virtual std::optional<std::string> consoleTail() = 0;
    virtual bool toggleTimestamps() = 0;

    // Target
    virtual bool targetLock() = 0;
    virtual bool targetLocked() = 0;
    virtual std::optional<std::string> targetOwner() = 0;
    virtual bool targetOn() = 0;
    virtual bool targetOff() = 0;
    virtual std::string targetStatus() = 0;
    virtual std::string targetToggle() = 0;
    virtual bool targetUnlock() = 0;

    // SD card
    virtual uint64_t sdBytesWritten() = 0;
    virtual bool sdClose() = 0;
    virtual bool sdLocked() = 0;
    virtual bool sdMount(const std::optional<std::string>& part) = 0;
    virtual bool sdOpen() = 0;
    virtual std::string sdStatus() = 0;
    virtual bool sdToHost() = 0;
    virtual bool sdToTarget() = 0;
    virtual std::string sdToggle() = 0;
    virtual int64_t sdUpdate(const std::string& dst, uint64_t offset, const std::string& data) = 0;
    virtual int64_t sdWrite(const std::string& data) = 0;

    // USB
    virtual bool usbHasClass(const std::string& class_name) = 0;
    virtual bool usbOffByClass(const std::string& class_name) = 0;
    virtual bool usbOnByClass(const std::string& class_name) = 0;
    virtual int usbPorts() = 0;
    virtual std::string usbStatus(int ndx) = 0;
    virtual bool usbToggle(int ndx) = 0;
};
