#include "mctrl/utils/server_properties.hpp"

#include <fstream>
#include <sstream>

namespace mctrl::utils {

static const char* LEVEL_NAME_KEY = "level-name";
static const char* ENABLE_RCON_KEY = "enable-rcon";
static const char* RCON_PORT_KEY = "rcon.port";
static const char* RCON_PASSWORD_KEY = "rcon.password";

static void trim(std::string& s) {
    s.erase(0, s.find_first_not_of(" \t\r"));
    s.erase(s.find_last_not_of(" \t\r") + 1);
}

ServerProperties ServerProperties::parse(const std::string& path) {
    std::ifstream file(path);
    if (!file.is_open()) {
        throw PropertiesError(PropertiesError::Kind::Open,
            "Failed to open server.properties file: " + path);
    }

    std::ostringstream contents;
    contents << file.rdbuf();
    if (file.bad()) {
        throw PropertiesError(PropertiesError::Kind::Read,
            "Failed to read server.properties file: " + path);
    }

    return parseString(contents.str());
}

ServerProperties ServerProperties::parseString(const std::string& contents) {
    ServerProperties properties;

    std::istringstream lines(contents);
    std::string line;
    size_t lineNumber = 0;

    while (std::getline(lines, line)) {
        lineNumber++;
        trim(line);

        // Skip comments and empty lines
        if (line.empty() || line[0] == '#') {
            continue;
        }

        size_t eqPos = line.find('=');
        if (eqPos == std::string::npos) {
            throw PropertiesError(PropertiesError::Kind::MalformedLine,
                "Broken server.properties file. Malformed line " + std::to_string(lineNumber));
        }

        std::string key = line.substr(0, eqPos);
        std::string value = line.substr(eqPos + 1);
        trim(key);
        trim(value);

        properties.m_values[key] = value;
    }

    return properties;
}

RconProperties ServerProperties::rconProperties() const {
    RconProperties rcon;

    auto port = m_values.find(RCON_PORT_KEY);
    if (port == m_values.end()) {
        throw PropertiesError(PropertiesError::Kind::InvalidRconPort,
            "The server.properties has no rcon.port property");
    }

    try {
        size_t consumed = 0;
        int value = std::stoi(port->second, &consumed);
        if (consumed != port->second.size() || value < 1 || value > 65535) {
            throw std::out_of_range("port");
        }
        rcon.port = static_cast<uint16_t>(value);
    }
    catch (const std::logic_error&) {
        throw PropertiesError(PropertiesError::Kind::InvalidRconPort,
            "The server.properties has an invalid rcon.port property: " + port->second);
    }

    auto password = m_values.find(RCON_PASSWORD_KEY);
    if (password == m_values.end()) {
        throw PropertiesError(PropertiesError::Kind::MissingRconPassword,
            "The server.properties does not contain an rcon.password property");
    }
    rcon.password = SecretString(password->second);

    return rcon;
}

std::string ServerProperties::levelName() const {
    auto it = m_values.find(LEVEL_NAME_KEY);
    return it != m_values.end() ? it->second : "world";
}

bool ServerProperties::rconEnabled() const {
    auto it = m_values.find(ENABLE_RCON_KEY);
    return it != m_values.end() && it->second == "true";
}

} // namespace mctrl::utils
