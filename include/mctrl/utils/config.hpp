#pragma once

#include "mctrl/utils/secret_string.hpp"

#include <spdlog/common.h>
#include <chrono>
#include <cstdint>
#include <stdexcept>
#include <string>

namespace mctrl::utils {

/**
 * Invalid configuration value or unreadable configuration source
 */
class ConfigError : public std::runtime_error {
public:
    explicit ConfigError(const std::string& message) : std::runtime_error(message) {}
};

/**
 * RCON client settings
 */
struct ClientConfig {
    std::string rcon_host = "127.0.0.1";
    uint16_t rcon_port = 25575;
    SecretString rcon_password;
    std::string server_properties_path;
    std::chrono::milliseconds request_timeout{0};
    spdlog::level::level_enum log_level = spdlog::level::info;
    std::string log_file;
};

/**
 * Configuration manager
 *
 * Loads client configuration from a "key = value" file. Command-line
 * options are applied on top through the setters.
 */
class Config {
public:
    Config() = default;

    static Config& instance();

    /**
     * Load config from file. Unknown keys are logged and skipped.
     * @return false if the file cannot be opened
     * @throws ConfigError for a malformed value
     */
    bool loadFromFile(const std::string& path);

    /**
     * Apply one setting
     * @return false for an unknown key
     * @throws ConfigError for a malformed value
     */
    bool set(const std::string& key, const std::string& value);

    /**
     * Fill port and password from server.properties when a path is
     * configured. Values already set explicitly win over the file.
     * @throws ConfigError if the file is unusable or no password is known
     */
    void resolve();

    const ClientConfig& getClientConfig() const { return m_config; }
    ClientConfig& getClientConfig() { return m_config; }

    // Individual settings
    void setHost(const std::string& host) { m_config.rcon_host = host; }
    void setPort(uint16_t port) { m_config.rcon_port = port; m_portSet = true; }
    void setPassword(const std::string& password) { m_config.rcon_password = SecretString(password); }
    void setServerPropertiesPath(const std::string& path) { m_config.server_properties_path = path; }
    void setRequestTimeout(std::chrono::milliseconds timeout) { m_config.request_timeout = timeout; }
    void setLogLevel(spdlog::level::level_enum level) { m_config.log_level = level; }

    static uint16_t parsePort(const std::string& value);
    static std::chrono::milliseconds parseTimeout(const std::string& value);

private:
    ClientConfig m_config;
    bool m_portSet = false;
};

} // namespace mctrl::utils
