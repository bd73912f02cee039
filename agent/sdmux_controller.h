#pragma once

#include <cstdint>
#include <filesystem>
#include <memory>
#include <optional>
#include <string>
#include <nlohmann/json.hpp>

class SdMuxController {
public:
    static constexpr const char* SD_ON_HOST = "HOST";
    static constexpr const char* SD_ON_TARGET = "TARGET";
    static constexpr const char* SD_ON_UNSURE = "???";

    virtual ~SdMuxController() = default;

    virtual bool probe() = 0;
    virtual bool open() = 0;
    virtual bool close() = 0;
    virtual bool write(const std::string& data) = 0;
    virtual bool mount(const std::optional<std::string>& part) = 0;

    // Writes data at offset into dst on the mounted card (offset 0 truncates).
    // Returns the number of bytes written or -1.
    virtual int64_t update(const std::string& dst, uint64_t offset, const std::string& data) = 0;

    virtual bool toHost() = 0;
    virtual bool toTarget() = 0;
    virtual std::string status() = 0;
};

// SD multiplexer switched with shell commands; the card is accessed through
// the block device it shows up as on the host.
//   { "variant": "shell", "device": "/dev/sda", "to_host": "...", "to_target": "...",
//     "status": "...", "mountpoint": "/media/mtda" }
class ShellSdMuxController : public SdMuxController {
public:
    explicit ShellSdMuxController(const nlohmann::json& config);
    ~ShellSdMuxController() override;

    bool probe() override;
    bool open() override;
    bool close() override;
    bool write(const std::string& data) override;
    bool mount(const std::optional<std::string>& part) override;
    int64_t update(const std::string& dst, uint64_t offset, const std::string& data) override;
    bool toHost() override;
    bool toTarget() override;
    std::string status() override;

private:
    std::string device_;
    std::string to_host_cmd_;
    std::string to_target_cmd_;
    std::string status_cmd_;
    std::string mountpoint_;
    std::string last_status_;
    int fd_;
    bool mounted_;

    bool unmount();
};

// Resolves dst below root, following symlinks that already exist.
// Returns nullopt when the result is root itself or would leave it.
std::optional<std::filesystem::path> confinePath(const std::string& root, const std::string& dst);

std::unique_ptr<SdMuxController> createSdMuxController(const nlohmann::json& config);
