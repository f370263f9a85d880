#pragma once

/**
 * Logger.hpp
 *
 * Centralized logging for the download engine.
 * Uses spdlog as the underlying logging library.
 */

#include <spdlog/spdlog.h>
#include <spdlog/sinks/stdout_color_sinks.h>
#include <spdlog/sinks/rotating_file_sink.h>

#include <algorithm>
#include <memory>
#include <string>
#include <vector>
#include <filesystem>

namespace aniflow::core {

/**
 * Log level enumeration
 */
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
 * Logger sink settings
 */
struct LoggerOptions {
    LogLevel consoleLevel{LogLevel::Info};
    LogLevel fileLevel{LogLevel::Debug};
    std::string directory;              // empty = no file sink
    size_t maxFileSize{1024 * 1024 * 10};
    size_t maxFiles{5};
};

/**
 * Logger class - Thread-safe singleton logger
 *
 * Console output with colors, plus an optional rotating file.
 * Until initialize() is called messages go to a plain console logger,
 * so library code and tests can log without any setup.
 */
class Logger {
public:
    /**
     * Get singleton instance
     * @return Reference to Logger instance
     */
    static Logger& instance() {
        static Logger instance;
        return instance;
    }

    /**
     * Initialize the logger sinks
     * @param options Console/file levels and file location
     */
    void initialize(const LoggerOptions& options) {
        try {
            std::vector<spdlog::sink_ptr> sinks;

            auto consoleSink = std::make_shared<spdlog::sinks::stdout_color_sink_mt>();
            consoleSink->set_level(toSpdlogLevel(options.consoleLevel));
            consoleSink->set_pattern("[%Y-%m-%d %H:%M:%S.%e] [%^%l%$] [%t] %v");
            sinks.push_back(consoleSink);

            if (!options.directory.empty()) {
                std::filesystem::path logPath = std::filesystem::path(options.directory) / "aniflow.log";
                std::filesystem::create_directories(logPath.parent_path());

                auto fileSink = std::make_shared<spdlog::sinks::rotating_file_sink_mt>(
                    logPath.string(),
                    options.maxFileSize,
                    options.maxFiles
                );
                fileSink->set_level(toSpdlogLevel(options.fileLevel));
                fileSink->set_pattern("[%Y-%m-%d %H:%M:%S.%e] [%l] [%t] %v");
                sinks.push_back(fileSink);
            }

            auto logger = std::make_shared<spdlog::logger>("aniflow", sinks.begin(), sinks.end());
            // The logger itself passes everything; each sink filters on its own level
            logger->set_level(std::min(toSpdlogLevel(options.consoleLevel),
                                       toSpdlogLevel(options.fileLevel)));
            logger->flush_on(spdlog::level::warn);

            spdlog::set_default_logger(logger);
            spdlog::flush_every(std::chrono::seconds(3));
            m_logger = logger;

        } catch (const std::exception& ex) {
            m_logger = spdlog::default_logger();
            m_logger->error("Logger initialization failed: {}", ex.what());
        }
    }

    /**
     * Set log level
     * @param level New log level
     */
    void setLevel(LogLevel level) {
        m_logger->set_level(toSpdlogLevel(level));
    }

    /**
     * Flush all log sinks
     */
    void flush() {
        m_logger->flush();
    }

    template<typename... Args>
    void trace(spdlog::format_string_t<Args...> fmt, Args&&... args) {
        m_logger->trace(fmt, std::forward<Args>(args)...);
    }

    template<typename... Args>
    void debug(spdlog::format_string_t<Args...> fmt, Args&&... args) {
        m_logger->debug(fmt, std::forward<Args>(args)...);
    }

    template<typename... Args>
    void info(spdlog::format_string_t<Args...> fmt, Args&&... args) {
        m_logger->info(fmt, std::forward<Args>(args)...);
    }

    template<typename... Args>
    void warn(spdlog::format_string_t<Args...> fmt, Args&&... args) {
        m_logger->warn(fmt, std::forward<Args>(args)...);
    }

    template<typename... Args>
    void error(spdlog::format_string_t<Args...> fmt, Args&&... args) {
        m_logger->error(fmt, std::forward<Args>(args)...);
    }

    template<typename... Args>
    void critical(spdlog::format_string_t<Args...> fmt, Args&&... args) {
        m_logger->critical(fmt, std::forward<Args>(args)...);
    }

    /**
     * Parse a level name ("debug", "INFO", "warning", ...)
     * @param name Level name, case-insensitive
     * @param fallback Returned for unknown names
     */
    static LogLevel parseLevel(const std::string& name, LogLevel fallback = LogLevel::Info) {
        auto level = spdlog::level::from_str(toLowerAscii(name));
        if (level == spdlog::level::off && toLowerAscii(name) != "off") {
            return fallback;
        }
        switch (level) {
            case spdlog::level::trace:    return LogLevel::Trace;
            case spdlog::level::debug:    return LogLevel::Debug;
            case spdlog::level::info:     return LogLevel::Info;
            case spdlog::level::warn:     return LogLevel::Warn;
            case spdlog::level::err:      return LogLevel::Error;
            case spdlog::level::critical: return LogLevel::Critical;
            default:                      return LogLevel::Off;
        }
    }

private:
    Logger() : m_logger(spdlog::default_logger()) {}
    ~Logger() {
        if (m_logger) {
            m_logger->flush();
        }
    }

    Logger(const Logger&) = delete;
    Logger& operator=(const Logger&) = delete;

    /**
     * Convert LogLevel to spdlog::level
     */
    static spdlog::level::level_enum toSpdlogLevel(LogLevel level) {
        switch (level) {
            case LogLevel::Trace:    return spdlog::level::trace;
            case LogLevel::Debug:    return spdlog::level::debug;
            case LogLevel::Info:     return spdlog::level::info;
            case LogLevel::Warn:     return spdlog::level::warn;
            case LogLevel::Error:    return spdlog::level::err;
            case LogLevel::Critical: return spdlog::level::critical;
            case LogLevel::Off:      return spdlog::level::off;
            default:                 return spdlog::level::info;
        }
    }

    static std::string toLowerAscii(std::string value) {
        for (char& c : value) {
            if (c >= 'A' && c <= 'Z') c = static_cast<char>(c - 'A' + 'a');
        }
        // spdlog spells it "warning"; accept the short form too
        if (value == "warn") value = "warning";
        return value;
    }

private:
    std::shared_ptr<spdlog::logger> m_logger;
};

} // namespace aniflow::core

