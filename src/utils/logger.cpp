#include "mctrl/utils/logger.hpp"

#include <cstdio>
#include <vector>

namespace mctrl::utils {

std::shared_ptr<spdlog::logger> Logger::s_logger;

void Logger::init(const std::string& logFile, spdlog::level::level_enum level) {
    try {
        std::vector<spdlog::sink_ptr> sinks;

        // Console sink with colors, on stderr so command output stays clean
        auto console_sink = std::make_shared<spdlog::sinks::stderr_color_sink_mt>();
        console_sink->set_level(level);
        console_sink->set_pattern("[%Y-%m-%d %H:%M:%S.%e] [%^%l%$] %v");
        sinks.push_back(console_sink);

        // Optional file sink with rotation
        if (!logFile.empty()) {
            auto file_sink = std::make_shared<spdlog::sinks::rotating_file_sink_mt>(
                logFile, 1024 * 1024 * 5, 3); // 5MB, 3 files
            file_sink->set_level(spdlog::level::trace);
            file_sink->set_pattern("[%Y-%m-%d %H:%M:%S.%e] [%l] [%t] %v");
            sinks.push_back(file_sink);
        }

        s_logger = std::make_shared<spdlog::logger>("mctrl", sinks.begin(), sinks.end());

        s_logger->set_level(level);
        s_logger->flush_on(spdlog::level::warn);

        spdlog::register_logger(s_logger);
        spdlog::set_default_logger(s_logger);

        s_logger->debug("Logger initialized");
    }
    catch (const spdlog::spdlog_ex& ex) {
        fprintf(stderr, "Logger init failed: %s\n", ex.what());
    }
}

void Logger::shutdown() {
    if (s_logger) {
        s_logger->flush();
        s_logger.reset();
    }
    spdlog::shutdown();
}

bool Logger::parseLevel(const std::string& name, spdlog::level::level_enum& level) {
    auto parsed = spdlog::level::from_str(name);

    // from_str() maps unknown names to "off", so only accept "off" when asked for
    if (parsed == spdlog::level::off && name != "off") {
        return false;
    }

    level = parsed;
    return true;
}

} // namespace mctrl::utils
