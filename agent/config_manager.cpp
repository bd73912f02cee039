#include "config_manager.h"
#include <cstdlib>
#include <filesystem>
#include <fstream>
#include <iostream>

namespace fs = std::filesystem;

ConfigManager::ConfigManager()
    : ConfigManager(defaultConfigPaths()) {
}

ConfigManager::ConfigManager(const std::vector<std::string>& config_paths)
    : config_paths_(config_paths)
    , config_(nlohmann::json::object()) {

    for (const auto& path : config_paths_) {
        loadConfigFile(path);
    }
}

std::vector<std::string> ConfigManager::defaultConfigPaths() {
    std::vector<std::string> paths;
    paths.push_back("/etc/mtda/config.json");

    const char* home = std::getenv("HOME");
    if (home && *home) {
        paths.push_back((fs::path(home) / ".mtda" / "config.json").string());
    }

    paths.push_back("mtda.json");
    return paths;
}

void ConfigManager::loadConfigFile(const std::string& path) {
    std::error_code ec;
    if (!fs::exists(path, ec)) {
        return;
    }

    try {
        std::ifstream file(path);
        if (!file.is_open()) {
            throw std::runtime_error("Cannot open config: " + path);
        }

        nlohmann::json overlay;
        file >> overlay;
        if (!overlay.is_object()) {
            throw std::runtime_error("top-level value is not an object");
        }
        config_.merge_patch(overlay);
    } catch (const std::exception& e) {
        std::cerr << "[ConfigManager] Error loading config " << path << ": " << e.what() << std::endl;
    }
}

bool ConfigManager::hasSection(const std::string& name) const {
    return config_.contains(name) && !config_.at(name).is_null();
}

nlohmann::json ConfigManager::getSection(const std::string& name) const {
    if (!hasSection(name)) {
        return nlohmann::json::object();
    }
    return config_.at(name);
}

std::string ConfigManager::getRemoteHost() const {
    const char* env = std::getenv("MTDA_REMOTE");
    if (env && *env) {
        return env;
    }
    return getSection("remote").value("host", "");
}

int ConfigManager::getControlPort() const {
    return getSection("remote").value("control", DEFAULT_CONTROL_PORT);
}

std::string ConfigManager::getBrokerHost(const std::string& fallback) const {
    return getSection("remote").value("broker", fallback);
}

int ConfigManager::getBrokerPort() const {
    return getSection("remote").value("broker_port", DEFAULT_BROKER_PORT);
}

std::string ConfigManager::getBrokerCaCert() const {
    return getSection("remote").value("broker_ca", "");
}

std::string ConfigManager::getPastebinEndpoint() const {
    return getSection("pastebin").value("endpoint", "https://pastebin.com/api/api_post.php");
}

std::string ConfigManager::getPastebinApiKey() const {
    return getSection("pastebin").value("api_key", "");
}

std::string ConfigManager::getConsolePrompt() const {
    return getSection("console").value("prompt", "");
}

size_t ConfigManager::getConsoleLines() const {
    return getSection("console").value("lines", static_cast<size_t>(1000));
}

int ConfigManager::getConsoleTimeoutSeconds() const {
    return getSection("console").value("timeout", 30);
}
