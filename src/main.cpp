#include "mctrl/server/client.hpp"
#include "mctrl/utils/config.hpp"
#include "mctrl/utils/logger.hpp"

#include <algorithm>
#include <cstdio>
#include <iostream>
#include <string>
#include <vector>
#include <unistd.h> // isatty

void printUsage(const char* program) {
    std::cout << "Minecraft server RCON control\n";
    std::cout << "Usage: " << program << " [options] <action> [args...]\n\n";
    std::cout << "Options:\n";
    std::cout << "  -c, --config <file>       Load configuration from file\n";
    std::cout << "  -s, --server <host>       RCON host (default: 127.0.0.1)\n";
    std::cout << "  -P, --port <port>         RCON port (default: 25575)\n";
    std::cout << "  -p, --password <secret>   RCON password\n";
    std::cout << "  -f, --properties <file>   Read port and password from server.properties\n";
    std::cout << "  -t, --timeout <ms>        Give up waiting for a reply after <ms>\n";
    std::cout << "  -v, --verbose             Debug logging\n";
    std::cout << "  -h, --help                Show this help message\n";
    std::cout << "\n";
    std::cout << "Actions:\n";
    std::cout << "  save-all                  Save all worlds\n";
    std::cout << "  stop                      Stop the server\n";
    std::cout << "  restart-prep              save-all followed by stop\n";
    std::cout << "  list                      List online players\n";
    std::cout << "  tick                      Show tick timings\n";
    std::cout << "  exec <command...>         Run a raw command and print the reply\n";
    std::cout << "  -                         Read commands from stdin, one per line\n";
}

static void printReply(const std::string& reply) {
    if (reply.empty() || reply.back() != '\n') {
        std::cout << reply << std::endl;
    }
    else {
        std::cout << reply << std::flush;
    }
}

// Run commands read from a stream over one connection. Stops at the first error.
static void streamCommands(mctrl::server::Client& client, std::istream& in, const std::string& prompt) {
    std::string command;
    while (std::getline(in, command)) {
        if (command.empty()) {
            continue;
        }

        std::cout << prompt << " > " << command << std::endl;
        printReply(client.run(command));
    }
}

static void runAction(mctrl::server::Client& client, const std::string& action,
                      const std::vector<std::string>& args, const std::string& prompt) {
    if (action == "save-all") {
        client.saveAll();
    }
    else if (action == "stop") {
        client.stop();
    }
    else if (action == "restart-prep") {
        client.saveAll();
        LOG_INFO("World saved, stopping the server");
        client.stop();
    }
    else if (action == "list") {
        for (const auto& player : client.list()) {
            std::cout << player << "\n";
        }
        std::cout << std::flush;
    }
    else if (action == "tick") {
        auto stats = client.queryTick();
        std::cout << "average: " << stats.average << "\n"
                  << "target:  " << stats.target << "\n"
                  << "p50:     " << stats.p50 << "\n"
                  << "p95:     " << stats.p95 << "\n"
                  << "p99:     " << stats.p99 << std::endl;
    }
    else if (action == "exec") {
        std::string command;
        for (const auto& arg : args) {
            if (!command.empty()) {
                command += " ";
            }
            command += arg;
        }
        printReply(client.run(command));
    }
    else if (action == "-") {
        streamCommands(client, std::cin, prompt);
    }
}

int main(int argc, char* argv[]) {
    std::string configFile;
    std::string action;
    std::vector<std::string> actionArgs;
    bool verbose = false;

    auto& config = mctrl::utils::Config::instance();

    // Command-line values are applied after the config file
    std::vector<std::pair<std::string, std::string>> overrides;

    for (int i = 1; i < argc; i++) {
        std::string arg = argv[i];

        auto requireValue = [&](const char* name) -> const char* {
            if (i + 1 >= argc) {
                std::cerr << "Error: " << name << " requires an argument\n";
                return nullptr;
            }
            return argv[++i];
        };

        if (!action.empty()) {
            actionArgs.push_back(arg);
        }
        else if (arg == "-h" || arg == "--help") {
            printUsage(argv[0]);
            return 0;
        }
        else if (arg == "-v" || arg == "--verbose") {
            verbose = true;
        }
        else if (arg == "-c" || arg == "--config") {
            const char* value = requireValue("--config");
            if (!value) return 1;
            configFile = value;
        }
        else if (arg == "-s" || arg == "--server" || arg == "-P" || arg == "--port" ||
                 arg == "-p" || arg == "--password" || arg == "-f" || arg == "--properties" ||
                 arg == "-t" || arg == "--timeout") {
            const char* value = requireValue(arg.c_str());
            if (!value) return 1;

            std::string key;
            if (arg == "-s" || arg == "--server") key = "rcon_host";
            else if (arg == "-P" || arg == "--port") key = "rcon_port";
            else if (arg == "-p" || arg == "--password") key = "rcon_password";
            else if (arg == "-f" || arg == "--properties") key = "server_properties";
            else key = "request_timeout_ms";

            overrides.emplace_back(key, value);
        }
        else if (arg == "-" || arg[0] != '-') {
            action = arg;
        }
        else {
            std::cerr << "Error: unknown option " << arg << "\n";
            printUsage(argv[0]);
            return 1;
        }
    }

    if (action.empty()) {
        if (isatty(fileno(stdin))) {
            std::cerr << "Error: no action given\n";
            printUsage(argv[0]);
            return 1;
        }
        // Redirected stdin
        action = "-";
    }

    static const std::vector<std::string> ACTIONS = {
        "save-all", "stop", "restart-prep", "list", "tick", "exec", "-"
    };
    if (std::find(ACTIONS.begin(), ACTIONS.end(), action) == ACTIONS.end()) {
        std::cerr << "Error: unknown action " << action << "\n";
        printUsage(argv[0]);
        return 1;
    }

    if (action == "exec" && actionArgs.empty()) {
        std::cerr << "Error: exec requires a command\n";
        return 1;
    }

    try {
        if (!configFile.empty() && !config.loadFromFile(configFile)) {
            std::cerr << "Error: failed to load config file: " << configFile << "\n";
            return 1;
        }

        for (const auto& [key, value] : overrides) {
            config.set(key, value);
        }

        if (verbose) {
            config.setLogLevel(spdlog::level::debug);
        }

        const auto& settings = config.getClientConfig();
        mctrl::utils::Logger::init(settings.log_file, settings.log_level);

        config.resolve();
    }
    catch (const mctrl::utils::ConfigError& e) {
        std::cerr << "Error: " << e.what() << "\n";
        return 1;
    }

    const auto& settings = config.getClientConfig();
    std::string prompt = settings.rcon_host + ":" + std::to_string(settings.rcon_port);

    int status = 0;
    {
        mctrl::server::Client client(settings.rcon_host, settings.rcon_port, settings.rcon_password);
        client.setRequestTimeout(settings.request_timeout);

        bool stalled = false;
        try {
            runAction(client, action, actionArgs, prompt);
        }
        catch (const mctrl::server::ClientError& e) {
            LOG_ERROR("{}", e.what());
            stalled = e.kind() == mctrl::server::ClientError::Kind::Timeout;
            status = 1;
        }

        // Do not wait for a server that stopped answering
        if (stalled) {
            client.abort();
        }
        else {
            client.shutdown();
        }
    }

    mctrl::utils::Logger::shutdown();
    return status;
}
