#pragma once

#include <spdlog/spdlog.h>
#include <spdlog/sinks/rotating_file_sink.h>
#include <spdlog/sinks/stdout_color_sinks.h>
#include <fmt/core.h>
#include <memory>
#include <mutex>
#include <string>

namespace Whisher {

class Logger {
public:
    enum class Level {
        Trace = 0,
        Debug = 1,
        Info = 2,
        Warn = 3,
        Error = 4,
        Critical = 5
    };

    static Logger& instance();

    void initialize(const std::string& logFilePath = "whisher.log",
                   Level level = Level::Info);

    void setLevel(Level level);
    bool isInitialized() const;

    // Flushes and unregisters the logger; later calls fall back to stderr
    void shutdown();

    template<typename... Args>
    void trace(fmt::format_string<Args...> format, Args&&... args) {
        ensureLogger()->trace(format, std::forward<Args>(args)...);
    }

    template<typename... Args>
    void debug(fmt::format_string<Args...> format, Args&&... args) {
        ensureLogger()->debug(format, std::forward<Args>(args)...);
    }

    template<typename... Args>
    void info(fmt::format_string<Args...> format, Args&&... args) {
        ensureLogger()->info(format, std::forward<Args>(args)...);
    }

    template<typename... Args>
    void warn(fmt::format_string<Args...> format, Args&&... args) {
        ensureLogger()->warn(format, std::forward<Args>(args)...);
    }

    template<typename... Args>
    void error(fmt::format_string<Args...> format, Args&&... args) {
        ensureLogger()->error(format, std::forward<Args>(args)...);
    }

    template<typename... Args>
    void critical(fmt::format_string<Args...> format, Args&&... args) {
        ensureLogger()->critical(format, std::forward<Args>(args)...);
    }

private:
    Logger() = default;

    // Components may log from worker threads before main() has configured
    // the sinks; callers keep the returned logger alive while they use it
    std::shared_ptr<spdlog::logger> ensureLogger();

    mutable std::mutex mutex_;
    std::shared_ptr<spdlog::logger> logger_;
};

// Convenience macros
#define WHISHER_TRACE(...) Whisher::Logger::instance().trace(__VA_ARGS__)
#define WHISHER_DEBUG(...) Whisher::Logger::instance().debug(__VA_ARGS__)
#define WHISHER_INFO(...) Whisher::Logger::instance().info(__VA_ARGS__)
#define WHISHER_WARN(...) Whisher::Logger::instance().warn(__VA_ARGS__)
#define WHISHER_ERROR(...) Whisher::Logger::instance().error(__VA_ARGS__)
#define WHISHER_CRITICAL(...) Whisher::Logger::instance().critical(__VA_ARGS__)

} // namespace Whisher
