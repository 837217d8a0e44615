#pragma once

/**
 * Logger.hpp
 *
 * Process-wide logging for Tether, on top of spdlog.
 * Library code logs through the LOG_* macros. Until a host calls
 * initialize() or attach(), every call is a silent no-op.
 */

#include <spdlog/spdlog.h>
#include <spdlog/sinks/stdout_color_sinks.h>
#include <spdlog/sinks/rotating_file_sink.h>

#include <chrono>
#include <cstddef>
#include <filesystem>
#include <memory>
#include <string>
#include <vector>

namespace tether::core {

enum class LogLevel {
    Trace,
    Debug,
    Info,
    Warn,
    Error,
    Critical,
    Off
};

/**
 * Parse "trace", "debug", "info", "warn", "error", "critical" or "off".
 * Anything else maps to Info.
 */
inline LogLevel logLevelFromString(const std::string& name) {
    if (name == "trace")    return LogLevel::Trace;
    if (name == "debug")    return LogLevel::Debug;
    if (name == "warn")     return LogLevel::Warn;
    if (name == "error")    return LogLevel::Error;
    if (name == "critical") return LogLevel::Critical;
    if (name == "off")      return LogLevel::Off;
    return LogLevel::Info;
}

struct LogOptions {
    LogLevel level{LogLevel::Info};
    std::filesystem::path directory;        // empty = ./logs
    size_t maxFileSize{10 * 1024 * 1024};   // per rotated file
    size_t maxFiles{5};
    bool console{true};
};

/**
 * Logger - singleton wrapper around one spdlog logger
 *
 * Sinks: colored console (optional) and a rotating tether.log.
 */
class Logger {
public:
    static Logger& instance() {
        static Logger instance;
        return instance;
    }

    void initialize(const LogOptions& options) {
        try {
            std::vector<spdlog::sink_ptr> sinks;

            if (options.console) {
                auto console = std::make_shared<spdlog::sinks::stdout_color_sink_mt>();
                console->set_pattern("[%H:%M:%S.%e] [%^%l%$] %v");
                sinks.push_back(console);
            }

            auto directory = options.directory.empty()
                ? std::filesystem::current_path() / "logs"
                : options.directory;
            std::filesystem::create_directories(directory);

            auto file = std::make_shared<spdlog::sinks::rotating_file_sink_mt>(
                (directory / "tether.log").string(), options.maxFileSize, options.maxFiles);
            file->set_pattern("[%Y-%m-%d %H:%M:%S.%e] [%l] [%t] %v");
            sinks.push_back(file);

            auto logger = std::make_shared<spdlog::logger>("tether", sinks.begin(), sinks.end());
            logger->set_level(toSpdlog(options.level));
            logger->flush_on(spdlog::level::warn);

            // Registered so the periodic flusher sees it
            spdlog::drop("tether");
            spdlog::register_logger(logger);
            m_logger = std::move(logger);

            spdlog::flush_every(std::chrono::seconds(3));

        } catch (const std::exception& e) {
            // Unwritable log directory: keep going on the console
            m_logger = std::make_shared<spdlog::logger>(
                "tether", std::make_shared<spdlog::sinks::stderr_color_sink_mt>());
            m_logger->set_level(toSpdlog(options.level));
            m_logger->error("File logging disabled: {}", e.what());
        }
    }

    void initialize(LogLevel level = LogLevel::Info, const std::string& directory = "") {
        LogOptions options;
        options.level = level;
        options.directory = directory;
        initialize(options);
    }

    /**
     * Log through a logger owned by the host (tests, embedding apps)
     */
    void attach(std::shared_ptr<spdlog::logger> logger) {
        m_logger = std::move(logger);
    }

    void setLevel(LogLevel level) {
        if (m_logger) m_logger->set_level(toSpdlog(level));
    }

    void flush() {
        if (m_logger) m_logger->flush();
    }

    template<typename... Args>
    void trace(spdlog::format_string_t<Args...> fmt, Args&&... args) {
        log(spdlog::level::trace, fmt, std::forward<Args>(args)...);
    }

    template<typename... Args>
    void debug(spdlog::format_string_t<Args...> fmt, Args&&... args) {
        log(spdlog::level::debug, fmt, std::forward<Args>(args)...);
    }

    template<typename... Args>
    void info(spdlog::format_string_t<Args...> fmt, Args&&... args) {
        log(spdlog::level::info, fmt, std::forward<Args>(args)...);
    }

    template<typename... Args>
    void warn(spdlog::format_string_t<Args...> fmt, Args&&... args) {
        log(spdlog::level::warn, fmt, std::forward<Args>(args)...);
    }

    template<typename... Args>
    void error(spdlog::format_string_t<Args...> fmt, Args&&... args) {
        log(spdlog::level::err, fmt, std::forward<Args>(args)...);
    }

    template<typename... Args>
    void critical(spdlog::format_string_t<Args...> fmt, Args&&... args) {
        log(spdlog::level::critical, fmt, std::forward<Args>(args)...);
    }

private:
    Logger() = default;
    ~Logger() { flush(); }

    Logger(const Logger&) = delete;
    Logger& operator=(const Logger&) = delete;

    template<typename... Args>
    void log(spdlog::level::level_enum level, spdlog::format_string_t<Args...> fmt, Args&&... args) {
        if (m_logger) {
            m_logger->log(level, fmt, std::forward<Args>(args)...);
        }
    }

    static spdlog::level::level_enum toSpdlog(LogLevel level) {
        switch (level) {
            case LogLevel::Trace:    return spdlog::level::trace;
            case LogLevel::Debug:    return spdlog::level::debug;
            case LogLevel::Info:     return spdlog::level::info;
            case LogLevel::Warn:     return spdlog::level::warn;
            case LogLevel::Error:    return spdlog::level::err;
            case LogLevel::Critical: return spdlog::level::critical;
            case LogLevel::Off:      return spdlog::level::off;
        }
        return spdlog::level::info;
    }

private:
    std::shared_ptr<spdlog::logger> m_logger;
};

} // namespace tether::core

#define LOG_TRACE(...)    ::tether::core::Logger::instance().trace(__VA_ARGS__)
#define LOG_DEBUG(...)    ::tether::core::Logger::instance().debug(__VA_ARGS__)
#define LOG_INFO(...)     ::tether::core::Logger::instance().info(__VA_ARGS__)
#define LOG_WARN(...)     ::tether::core::Logger::instance().warn(__VA_ARGS__)
#define LOG_ERROR(...)    ::tether::core::Logger::instance().error(__VA_ARGS__)
#define LOG_CRITICAL(...) ::tether::core::Logger::instance().critical(__VA_ARGS__)
