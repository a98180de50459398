#include "Logger.hpp"
#include <spdlog/pattern_formatter.h>

namespace Whisher {

namespace {

constexpr const char* kLoggerName = "whisher";
constexpr const char* kConsoleLoggerName = "whisher_console";
constexpr const char* kFallbackLoggerName = "whisher_fallback";

// Must be called with the Logger mutex held
std::shared_ptr<spdlog::logger> consoleLogger(const char* name) {
    auto logger = spdlog::get(name);
    if (!logger) {
        logger = spdlog::stderr_color_mt(name);
    }
    return logger;
}

} // namespace

Logger& Logger::instance() {
    static Logger instance;
    return instance;
}

void Logger::initialize(const std::string& logFilePath, Level level) {
    try {
        // Create sinks
        auto console_sink = std::make_shared<spdlog::sinks::stderr_color_sink_mt>();
        auto file_sink = std::make_shared<spdlog::sinks::rotating_file_sink_mt>(
            logFilePath, 1024 * 1024 * 5, 3); // 5MB, 3 files

        console_sink->set_pattern("[%H:%M:%S] [%^%l%$] %v");
        file_sink->set_pattern("[%Y-%m-%d %H:%M:%S.%f] [%l] [%t] %v");

        auto logger = std::make_shared<spdlog::logger>(kLoggerName,
            spdlog::sinks_init_list{console_sink, file_sink});
        logger->set_level(static_cast<spdlog::level::level_enum>(level));

        {
            std::lock_guard<std::mutex> lock(mutex_);
            spdlog::drop(kLoggerName);
            spdlog::register_logger(logger);
            logger_ = logger;
        }

        WHISHER_INFO("Logger initialized with file: {}", logFilePath);

    } catch (const spdlog::spdlog_ex& ex) {
        // Fallback to console only
        std::shared_ptr<spdlog::logger> fallback;
        {
            std::lock_guard<std::mutex> lock(mutex_);
            logger_ = consoleLogger(kFallbackLoggerName);
            logger_->set_level(static_cast<spdlog::level::level_enum>(level));
            fallback = logger_;
        }
        fallback->error("Logger initialization failed: {}", ex.what());
    }
}

void Logger::setLevel(Level level) {
    std::lock_guard<std::mutex> lock(mutex_);
    if (logger_) {
        logger_->set_level(static_cast<spdlog::level::level_enum>(level));
    }
}

bool Logger::isInitialized() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return logger_ != nullptr && logger_->name() == kLoggerName;
}

void Logger::shutdown() {
    std::lock_guard<std::mutex> lock(mutex_);
    if (logger_) {
        logger_->flush();
        spdlog::drop(logger_->name());
        logger_.reset();
    }
}

std::shared_ptr<spdlog::logger> Logger::ensureLogger() {
    std::lock_guard<std::mutex> lock(mutex_);
    if (!logger_) {
        logger_ = consoleLogger(kConsoleLoggerName);
    }
    return logger_;
}

} // namespace Whisher
