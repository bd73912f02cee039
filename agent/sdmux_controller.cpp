#include "sdmux_controller.h"
#include "shell_command.h"
#include <algorithm>
#include <cctype>
#include <cerrno>
#include <cstring>
#include <filesystem>
#include <fstream>
#include <iostream>
#include <fcntl.h>
#include <unistd.h>

namespace fs = std::filesystem;

std::optional<fs::path> confinePath(const std::string& root, const std::string& dst) {
    std::error_code ec;
    fs::path base = fs::weakly_canonical(fs::path(root), ec);
    if (ec) {
        return std::nullopt;
    }
    fs::path path = fs::weakly_canonical(base / fs::path(dst).relative_path(), ec);
    if (ec) {
        return std::nullopt;
    }

    fs::path rel = path.lexically_relative(base);
    if (rel.empty() || rel == "." || *rel.begin() == "..") {
        return std::nullopt;
    }
    return path;
}

ShellSdMuxController::ShellSdMuxController(const nlohmann::json& config)
    : device_(config.value("device", ""))
    , to_host_cmd_(config.value("to_host", ""))
    , to_target_cmd_(config.value("to_target", ""))
    , status_cmd_(config.value("status", ""))
    , mountpoint_(config.value("mountpoint", "/media/mtda"))
    , last_status_(SD_ON_UNSURE)
    , fd_(-1)
    , mounted_(false) {
}

ShellSdMuxController::~ShellSdMuxController() {
    close();
}

bool ShellSdMuxController::probe() {
    if (device_.empty() || to_host_cmd_.empty() || to_target_cmd_.empty()) {
        std::cerr << "[ShellSdMuxController] \"device\", \"to_host\" and \"to_target\" are required" << std::endl;
        return false;
    }
    return true;
}

bool ShellSdMuxController::open() {
    close();
    fd_ = ::open(device_.c_str(), O_WRONLY);
    if (fd_ < 0) {
        std::cerr << "[ShellSdMuxController] Cannot open " << device_ << ": " << strerror(errno) << std::endl;
        return false;
    }
    return true;
}

bool ShellSdMuxController::close() {
    if (fd_ < 0) {
        return true;
    }
    bool ok = (::fsync(fd_) == 0);
    ok = (::close(fd_) == 0) && ok;
    fd_ = -1;
    return ok;
}

bool ShellSdMuxController::write(const std::string& data) {
    if (fd_ < 0) {
        return false;
    }
    size_t done = 0;
    while (done < data.size()) {
        ssize_t n = ::write(fd_, data.data() + done, data.size() - done);
        if (n < 0) {
            if (errno == EINTR) continue;
            std::cerr << "[ShellSdMuxController] Write to " << device_ << " failed: " << strerror(errno) << std::endl;
            return false;
        }
        done += static_cast<size_t>(n);
    }
    return true;
}

bool ShellSdMuxController::mount(const std::optional<std::string>& part) {
    if (mounted_) {
        return true;
    }
    std::error_code ec;
    fs::create_directories(mountpoint_, ec);

    std::string source = device_ + part.value_or("");
    CommandResult result = runCommand("mount " + shellQuote(source) + " " + shellQuote(mountpoint_));
    if (result.exit_code != 0) {
        std::cerr << "[ShellSdMuxController] Failed to mount " << source << ": " << trimOutput(result.output) << std::endl;
        return false;
    }
    mounted_ = true;
    return true;
}

bool ShellSdMuxController::unmount() {
    if (!mounted_) {
        return true;
    }
    CommandResult result = runCommand("umount " + shellQuote(mountpoint_));
    if (result.exit_code != 0) {
        std::cerr << "[ShellSdMuxController] Failed to unmount " << mountpoint_ << ": " << trimOutput(result.output) << std::endl;
        return false;
    }
    mounted_ = false;
    return true;
}

int64_t ShellSdMuxController::update(const std::string& dst, uint64_t offset, const std::string& data) {
    if (!mounted_) {
        return -1;
    }

    std::optional<fs::path> resolved = confinePath(mountpoint_, dst);
    if (!resolved) {
        std::cerr << "[ShellSdMuxController] Refusing to update '" << dst << "' outside " << mountpoint_ << std::endl;
        return -1;
    }
    const fs::path& path = *resolved;
    std::ios::openmode mode = std::ios::binary | std::ios::out;
    if (offset > 0) {
        mode |= std::ios::in;
    } else {
        mode |= std::ios::trunc;
    }

    std::fstream file(path, mode);
    if (!file.is_open()) {
        std::cerr << "[ShellSdMuxController] Cannot open " << path << std::endl;
        return -1;
    }
    file.seekp(static_cast<std::streamoff>(offset));
    file.write(data.data(), static_cast<std::streamsize>(data.size()));
    if (!file) {
        return -1;
    }
    return static_cast<int64_t>(data.size());
}

bool ShellSdMuxController::toHost() {
    CommandResult result = runCommand(to_host_cmd_);
    if (result.exit_code != 0) {
        std::cerr << "[ShellSdMuxController] '" << to_host_cmd_ << "' failed: " << trimOutput(result.output) << std::endl;
        return false;
    }
    last_status_ = SD_ON_HOST;
    return true;
}

bool ShellSdMuxController::toTarget() {
    if (!unmount()) {
        return false;
    }
    CommandResult result = runCommand(to_target_cmd_);
    if (result.exit_code != 0) {
        std::cerr << "[ShellSdMuxController] '" << to_target_cmd_ << "' failed: " << trimOutput(result.output) << std::endl;
        return false;
    }
    last_status_ = SD_ON_TARGET;
    return true;
}

std::string ShellSdMuxController::status() {
    if (status_cmd_.empty()) {
        return last_status_;
    }
    CommandResult result = runCommand(status_cmd_);
    if (result.exit_code != 0) {
        return SD_ON_UNSURE;
    }
    std::string value = trimOutput(result.output);
    std::transform(value.begin(), value.end(), value.begin(),
                   [](unsigned char c) { return static_cast<char>(std::tolower(c)); });
    if (value == "host") return SD_ON_HOST;
    if (value == "target" || value == "dut") return SD_ON_TARGET;
    return SD_ON_UNSURE;
}

std::unique_ptr<SdMuxController> createSdMuxController(const nlohmann::json& config) {
    std::string variant = config.value("variant", "");
    if (variant.empty()) {
        std::cerr << "sdmux controller variant not defined!" << std::endl;
        return nullptr;
    }
    if (variant == "shell") {
        return std::make_unique<ShellSdMuxController>(config);
    }
    std::cerr << "sdmux controller \"" << variant << "\" could not be found/loaded!" << std::endl;
    return nullptr;
}
