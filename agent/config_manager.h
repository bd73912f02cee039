#pragma once

#include <string>
#include <vector>
#include <nlohmann/json.hpp>

class ConfigManager {
public:
    static constexpr int DEFAULT_CONTROL_PORT = 5556;
    static constexpr int DEFAULT_BROKER_PORT = 1883;

    // Loads the default search path.
    ConfigManager();
    // Loads config_paths in order; later files override earlier ones.
    explicit ConfigManager(const std::vector<std::string>& config_paths);

    const nlohmann::json& getConfig() const { return config_; }
    bool hasSection(const std::string& name) const;
    nlohmann::json getSection(const std::string& name) const;

    // Utility methods
    std::string getRemoteHost() const;
    int getControlPort() const;
    std::string getBrokerHost(const std::string& fallback) const;
    int getBrokerPort() const;
    std::string getBrokerCaCert() const;
    std::string getPastebinEndpoint() const;
    std::string getPastebinApiKey() const;
    size_t getConsoleLines() const;
    std::string getConsolePrompt() const;
    int getConsoleTimeoutSeconds() const;

    static std::vector<std::string> defaultConfigPaths();

private:
    std::vector<std::string> config_paths_;
    nlohmann::json config_;

    void loadConfigFile(const std::string& path);
};
