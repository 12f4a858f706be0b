#pragma once

#include <spdlog/spdlog.h>
#include <spdlog/sinks/stdout_color_sinks.h>
#include <spdlog/sinks/rotating_file_sink.h>
#include <memory>
#include <string>

namespace mctrl::utils {

/**
 * Logger utility
 *
 * Provides a centralized logging interface using spdlog.
 * Until init() is called, messages go to spdlog's default logger so the
 * library can be embedded without any logging setup.
 */
class Logger {
public:
    static void init(const std::string& logFile = "",
                     spdlog::level::level_enum level = spdlog::level::info);
    static void shutdown();

    static std::shared_ptr<spdlog::logger> get() {
        return s_logger ? s_logger : spdlog::default_logger();
    }

    // Parse "trace", "debug", ... "off". Returns false for unknown names.
    static bool parseLevel(const std::string& name, spdlog::level::level_enum& level);

    // Convenience logging functions
    template<typename... Args>
    static void trace(fmt::format_string<Args...> fmt, Args&&... args) {
        get()->trace(fmt, std::forward<Args>(args)...);
    }

    template<typename... Args>
    static void debug(fmt::format_string<Args...> fmt, Args&&... args) {
        get()->debug(fmt, std::forward<Args>(args)...);
    }

    template<typename... Args>
    static void info(fmt::format_string<Args...> fmt, Args&&... args) {
        get()->info(fmt, std::forward<Args>(args)...);
    }

    template<typename... Args>
    static void warn(fmt::format_string<Args...> fmt, Args&&... args) {
        get()->warn(fmt, std::forward<Args>(args)...);
    }

    template<typename... Args>
    static void error(fmt::format_string<Args...> fmt, Args&&... args) {
        get()->error(fmt, std::forward<Args>(args)...);
    }

    template<typename... Args>
    static void critical(fmt::format_string<Args...> fmt, Args&&... args) {
        get()->critical(fmt, std::forward<Args>(args)...);
    }

private:
    static std::shared_ptr<spdlog::logger> s_logger;
};

#define LOG_TRACE(...) mctrl::utils::Logger::trace(__VA_ARGS__)
#define LOG_DEBUG(...) mctrl::utils::Logger::debug(__VA_ARGS__)
#define LOG_INFO(...)  mctrl::utils::Logger::info(__VA_ARGS__)
#define LOG_WARN(...)  mctrl::utils::Logger::warn(__VA_ARGS__)
#define LOG_ERROR(...) mctrl::utils::Logger::error(__VA_ARGS__)
#define LOG_CRITICAL(...) mctrl::utils::Logger::critical(__VA_ARGS__)

} // namespace mctrl::utils
