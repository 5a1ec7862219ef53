#pragma once

#include <spdlog/spdlog.h>
#include <spdlog/sinks/stdout_color_sinks.h>
#include <nlohmann/json.hpp>
#include <string>
#include <memory>
#include <atomic>
#include <chrono>
#include <mutex>

namespace mimeid {

/**
 * Structured logger shared by the library and the mimeid-gen tool.
 * Writes to stderr so that generated tokens on stdout stay machine-readable.
 */
class Logger {
public:
    enum class Format {
        JSON,    // One JSON object per line
        TEXT     // Human-readable text format
    };

    /**
     * Initialize the global logger
     * @param service_name Name of the emitting program (e.g., "mimeid-gen")
     * @param log_level Minimum log level (trace, debug, info, warn, error, critical, off)
     * @param format Output format (JSON or TEXT)
     * @param environment Environment name (e.g., "production", "test")
     */
    static void initialize(
        const std::string& service_name,
        const std::string& log_level = "info",
        Format format = Format::TEXT,
        const std::string& environment = "production"
    );

    /**
     * Get the singleton logger instance
     *
     * The instance is created once and reconfigured in place by initialize(),
     * so this never takes a lock after the first call.
     */
    static const std::shared_ptr<spdlog::logger>& get();

    /**
     * Log structured data with additional context fields
     * @param level Log level
     * @param message Log message
     * @param fields Additional JSON fields (e.g., {"resolver": "session", "suffix": "@localhost"})
     */
    static void log_structured(
        spdlog::level::level_enum level,
        const std::string& message,
        const nlohmann::json& fields = {}
    );

    /**
     * Log error with exception details
     * @param level Log level
     * @param message Error message
     * @param exception Exception object
     * @param fields Additional JSON fields
     */
    static void log_exception(
        spdlog::level::level_enum level,
        const std::string& message,
        const std::exception& exception,
        const nlohmann::json& fields = {}
    );

    /**
     * Get current timestamp in ISO 8601 format
     */
    static std::string get_timestamp();

    /**
     * Convert log level string to spdlog level enum
     */
    static spdlog::level::level_enum parse_log_level(const std::string& level);

private:
    static void applyPattern(Format format);

    static std::shared_ptr<spdlog::logger> logger_;
    static std::once_flag create_flag_;

    // Guards service_name_ and environment_; only taken when a JSON line is emitted
    static std::mutex context_mutex_;
    static std::string service_name_;
    static std::string environment_;
    static std::atomic<Format> format_;
};

// Convenience macros for logging
#define LOG_TRACE(...) mimeid::Logger::get()->trace(__VA_ARGS__)
#define LOG_DEBUG(...) mimeid::Logger::get()->debug(__VA_ARGS__)
#define LOG_INFO(...) mimeid::Logger::get()->info(__VA_ARGS__)
#define LOG_WARN(...) mimeid::Logger::get()->warn(__VA_ARGS__)
#define LOG_ERROR(...) mimeid::Logger::get()->error(__VA_ARGS__)
#define LOG_CRITICAL(...) mimeid::Logger::get()->critical(__VA_ARGS__)

} // namespace mimeid
