#pragma once

#include "mctrl/utils/secret_string.hpp"

#include <cstdint>
#include <map>
#include <stdexcept>
#include <string>

namespace mctrl::utils {

/**
 * Error reading a server.properties file
 */
class PropertiesError : public std::runtime_error {
public:
    enum class Kind {
        Open,
        Read,
        MalformedLine,
        InvalidRconPort,
        MissingRconPassword,
    };

    PropertiesError(Kind kind, const std::string& message)
        : std::runtime_error(message), m_kind(kind) {}

    Kind kind() const { return m_kind; }

private:
    Kind m_kind;
};

/**
 * RCON endpoint settings found in server.properties
 */
struct RconProperties {
    uint16_t port{0};
    SecretString password;
};

/**
 * Minecraft server.properties reader
 *
 * key=value lines; '#' comments and blank lines are skipped.
 */
class ServerProperties {
public:
    /**
     * @throws PropertiesError Open / Read / MalformedLine
     */
    static ServerProperties parse(const std::string& path);

    /**
     * Parse already loaded file contents
     * @throws PropertiesError MalformedLine
     */
    static ServerProperties parseString(const std::string& contents);

    /**
     * @throws PropertiesError InvalidRconPort / MissingRconPassword
     */
    RconProperties rconProperties() const;

    // "level-name", "world" when unset
    std::string levelName() const;

    // "enable-rcon=true"
    bool rconEnabled() const;

    const std::map<std::string, std::string>& values() const { return m_values; }

private:
    std::map<std::string, std::string> m_values;
};

} // namespace mctrl::utils
