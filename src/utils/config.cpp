#include "mctrl/utils/config.hpp"
#include "mctrl/utils/logger.hpp"
#include "mctrl/utils/server_properties.hpp"

#include <fstream>

namespace mctrl::utils {

Config& Config::instance() {
    static Config config;
    return config;
}

static void trim(std::string& s) {
    s.erase(0, s.find_first_not_of(" \t\r"));
    s.erase(s.find_last_not_of(" \t\r") + 1);
}

static long parseNumber(const std::string& key, const std::string& value) {
    try {
        size_t consumed = 0;
        long number = std::stol(value, &consumed);
        if (consumed != value.size()) {
            throw std::invalid_argument(value);
        }
        return number;
    }
    catch (const std::logic_error&) {
        throw ConfigError("Invalid numeric value for " + key + ": '" + value + "'");
    }
}

uint16_t Config::parsePort(const std::string& value) {
    long port = parseNumber("rcon_port", value);
    if (port < 1 || port > 65535) {
        throw ConfigError("rcon_port must be between 1 and 65535, got: " + value);
    }
    return static_cast<uint16_t>(port);
}

std::chrono::milliseconds Config::parseTimeout(const std::string& value) {
    long timeout = parseNumber("request_timeout_ms", value);
    if (timeout < 0) {
        throw ConfigError("request_timeout_ms must not be negative, got: " + value);
    }
    return std::chrono::milliseconds(timeout);
}

bool Config::loadFromFile(const std::string& path) {
    std::ifstream file(path);
    if (!file.is_open()) {
        return false;
    }

    std::string line;
    size_t lineNumber = 0;
    while (std::getline(file, line)) {
        lineNumber++;
        trim(line);

        // Skip comments and empty lines
        if (line.empty() || line[0] == '#') {
            continue;
        }

        size_t eqPos = line.find('=');
        if (eqPos == std::string::npos) {
            LOG_WARN("{}:{}: ignoring line without '='", path, lineNumber);
            continue;
        }

        std::string key = line.substr(0, eqPos);
        std::string value = line.substr(eqPos + 1);
        trim(key);
        trim(value);

        if (!set(key, value)) {
            LOG_WARN("{}:{}: unknown configuration key '{}'", path, lineNumber, key);
        }
    }

    return true;
}

bool Config::set(const std::string& key, const std::string& value) {
    if (key == "rcon_host") {
        m_config.rcon_host = value;
    }
    else if (key == "rcon_port") {
        setPort(parsePort(value));
    }
    else if (key == "rcon_password") {
        setPassword(value);
    }
    else if (key == "server_properties") {
        m_config.server_properties_path = value;
    }
    else if (key == "request_timeout_ms") {
        m_config.request_timeout = parseTimeout(value);
    }
    else if (key == "log_level") {
        if (!Logger::parseLevel(value, m_config.log_level)) {
            throw ConfigError("Unknown log_level: '" + value + "'");
        }
    }
    else if (key == "log_file") {
        m_config.log_file = value;
    }
    else {
        return false;
    }
    return true;
}

void Config::resolve() {
    if (!m_config.server_properties_path.empty()) {
        try {
            auto properties = ServerProperties::parse(m_config.server_properties_path);

            if (!properties.rconEnabled()) {
                LOG_WARN("RCON is not enabled in {} (enable-rcon=true)",
                         m_config.server_properties_path);
            }

            auto rcon = properties.rconProperties();
            if (!m_portSet) {
                m_config.rcon_port = rcon.port;
            }
            if (m_config.rcon_password.empty()) {
                m_config.rcon_password = std::move(rcon.password);
            }

            LOG_DEBUG("Loaded RCON settings for world '{}' from {}",
                      properties.levelName(), m_config.server_properties_path);
        }
        catch (const PropertiesError& e) {
            throw ConfigError(e.what());
        }
    }

    if (m_config.rcon_password.empty()) {
        throw ConfigError("No RCON password configured (rcon_password or server_properties)");
    }
}

} // namespace mctrl::utils
