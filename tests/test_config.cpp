#include "test_framework.hpp"
#include "mctrl/utils/config.hpp"
#include "mctrl/utils/server_properties.hpp"
#include "mctrl/utils/secret_string.hpp"

#include <filesystem>
#include <fstream>

using namespace mctrl::utils;

// Temporary file removed when the object goes out of scope
class TempFile {
public:
    TempFile(const std::string& name, const std::string& contents)
        : m_path(std::filesystem::temp_directory_path() / ("mctrl_test_" + name))
    {
        std::ofstream out(m_path);
        out << contents;
    }

    ~TempFile() {
        std::error_code ec;
        std::filesystem::remove(m_path, ec);
    }

    std::string path() const { return m_path.string(); }

private:
    std::filesystem::path m_path;
};

static const char* SERVER_PROPERTIES =
    "#Minecraft server properties\n"
    "#Mon Jan 01 00:00:00 UTC 2024\n"
    "enable-rcon=true\n"
    "level-name=survival\n"
    "rcon.password=s3cret\n"
    "rcon.port=25580\n"
    "motd=A Minecraft Server\n";

// =============================================================================
// server.properties Tests
// =============================================================================

TEST(Properties_Parse) {
    auto properties = ServerProperties::parseString(SERVER_PROPERTIES);

    auto rcon = properties.rconProperties();
    ASSERT_EQ(rcon.port, 25580);
    ASSERT_STREQ(rcon.password.expose(), "s3cret");
    ASSERT_STREQ(properties.levelName(), "survival");
    ASSERT_TRUE(properties.rconEnabled());
    ASSERT_EQ(properties.values().size(), 5u);
    PASS();
}

TEST(Properties_TrimsAndSplitsOnFirstEquals) {
    auto properties = ServerProperties::parseString(
        "  rcon.port = 25575  \r\n"
        "rcon.password=a=b=c\n"
        "\n"
        "   # indented comment\n");

    auto rcon = properties.rconProperties();
    ASSERT_EQ(rcon.port, 25575);
    ASSERT_STREQ(rcon.password.expose(), "a=b=c");
    PASS();
}

TEST(Properties_Defaults) {
    auto properties = ServerProperties::parseString("enable-rcon=false\n");
    ASSERT_STREQ(properties.levelName(), "world");
    ASSERT_FALSE(properties.rconEnabled());
    PASS();
}

TEST(Properties_MalformedLine) {
    try {
        ServerProperties::parseString("rcon.port=25575\nthis line is broken\n");
    } catch (const PropertiesError& e) {
        ASSERT_TRUE(e.kind() == PropertiesError::Kind::MalformedLine);
        ASSERT_TRUE(std::string(e.what()).find("line 2") != std::string::npos);
        PASS();
    }
    _msg = "Expected MalformedLine";
    return false;
}

TEST(Properties_InvalidPort) {
    for (const char* port : {"abc", "0", "65536", "25575x", ""}) {
        auto properties = ServerProperties::parseString(
            std::string("rcon.password=pw\nrcon.port=") + port + "\n");
        try {
            properties.rconProperties();
            _msg = std::string("Expected InvalidRconPort for '") + port + "'";
            return false;
        } catch (const PropertiesError& e) {
            ASSERT_TRUE(e.kind() == PropertiesError::Kind::InvalidRconPort);
        }
    }
    PASS();
}

TEST(Properties_MissingPassword) {
    auto properties = ServerProperties::parseString("rcon.port=25575\n");
    try {
        properties.rconProperties();
    } catch (const PropertiesError& e) {
        ASSERT_TRUE(e.kind() == PropertiesError::Kind::MissingRconPassword);
        PASS();
    }
    _msg = "Expected MissingRconPassword";
    return false;
}

TEST(Properties_MissingFile) {
    try {
        ServerProperties::parse("/nonexistent/server.properties");
    } catch (const PropertiesError& e) {
        ASSERT_TRUE(e.kind() == PropertiesError::Kind::Open);
        PASS();
    }
    _msg = "Expected Open error";
    return false;
}

// =============================================================================
// Config Tests
// =============================================================================

TEST(Config_Defaults) {
    Config config;
    const auto& c = config.getClientConfig();
    ASSERT_STREQ(c.rcon_host, "127.0.0.1");
    ASSERT_EQ(c.rcon_port, 25575);
    ASSERT_TRUE(c.rcon_password.empty());
    ASSERT_EQ(c.request_timeout.count(), 0);
    ASSERT_TRUE(c.log_level == spdlog::level::info);
    PASS();
}

TEST(Config_LoadFromFile) {
    TempFile file("client.conf",
        "# mctrl settings\n"
        "rcon_host = mc.example.org\n"
        "rcon_port = 25581\n"
        "rcon_password = pw\n"
        "request_timeout_ms = 1500\n"
        "log_level = debug\n"
        "unknown_key = ignored\n"
        "no equals sign here\n");

    Config config;
    ASSERT_TRUE(config.loadFromFile(file.path()));

    const auto& c = config.getClientConfig();
    ASSERT_STREQ(c.rcon_host, "mc.example.org");
    ASSERT_EQ(c.rcon_port, 25581);
    ASSERT_STREQ(c.rcon_password.expose(), "pw");
    ASSERT_EQ(c.request_timeout.count(), 1500);
    ASSERT_TRUE(c.log_level == spdlog::level::debug);
    PASS();
}

TEST(Config_MissingFile) {
    Config config;
    ASSERT_FALSE(config.loadFromFile("/nonexistent/mctrl.conf"));
    PASS();
}

TEST(Config_BadValues) {
    Config config;
    ASSERT_THROWS(config.set("rcon_port", "seventy"), ConfigError);
    ASSERT_THROWS(config.set("rcon_port", "70000"), ConfigError);
    ASSERT_THROWS(config.set("request_timeout_ms", "-1"), ConfigError);
    ASSERT_THROWS(config.set("log_level", "loud"), ConfigError);
    ASSERT_FALSE(config.set("rcon_pasword", "typo"));
    PASS();
}

TEST(Config_ResolveFromServerProperties) {
    TempFile properties("server.properties", SERVER_PROPERTIES);

    Config config;
    config.setServerPropertiesPath(properties.path());
    config.resolve();

    const auto& c = config.getClientConfig();
    ASSERT_EQ(c.rcon_port, 25580);
    ASSERT_STREQ(c.rcon_password.expose(), "s3cret");
    PASS();
}

TEST(Config_ExplicitValuesWinOverServerProperties) {
    TempFile properties("server_override.properties", SERVER_PROPERTIES);

    Config config;
    config.setServerPropertiesPath(properties.path());
    config.setPort(30000);
    config.setPassword("override");
    config.resolve();

    const auto& c = config.getClientConfig();
    ASSERT_EQ(c.rcon_port, 30000);
    ASSERT_STREQ(c.rcon_password.expose(), "override");
    PASS();
}

TEST(Config_ResolveWithoutPassword) {
    Config config;
    ASSERT_THROWS(config.resolve(), ConfigError);

    config.setServerPropertiesPath("/nonexistent/server.properties");
    config.setPassword("pw");
    ASSERT_THROWS(config.resolve(), ConfigError);
    PASS();
}

// =============================================================================
// SecretString Tests
// =============================================================================

TEST(Secret_Redacted) {
    SecretString secret("hunter2");
    std::ostringstream out;
    out << secret;
    ASSERT_STREQ(out.str(), "[REDACTED]");
    ASSERT_STREQ(secret.expose(), "hunter2");
    PASS();
}

TEST(Secret_ClearWipes) {
    SecretString secret("hunter2");
    secret.clear();
    ASSERT_TRUE(secret.empty());
    ASSERT_TRUE(secret.expose().empty());
    PASS();
}

TEST(Secret_CopyAndMove) {
    SecretString original("hunter2");
    SecretString copy = original;
    ASSERT_STREQ(copy.expose(), "hunter2");

    SecretString moved = std::move(original);
    ASSERT_STREQ(moved.expose(), "hunter2");
    ASSERT_TRUE(original.empty());

    copy = SecretString("other");
    ASSERT_STREQ(copy.expose(), "other");
    PASS();
}
