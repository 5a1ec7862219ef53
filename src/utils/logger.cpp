#include "utils/logger.h"
#include <spdlog/sinks/stdout_color_sinks.h>
#include <spdlog/pattern_formatter.h>
#include <ctime>
#include <iomanip>
#include <mutex>
#include <sstream>

namespace mimeid {

std::shared_ptr<spdlog::logger> Logger::logger_;
std::once_flag Logger::create_flag_;
std::mutex Logger::context_mutex_;
std::string Logger::service_name_ = "mimeid";
std::string Logger::environment_ = "production";
std::atomic<Logger::Format> Logger::format_{Logger::Format::TEXT};

void Logger::initialize(
    const std::string& service_name,
    const std::string& log_level,
    Format format,
    const std::string& environment
) {
    const auto& logger = get();

    {
        std::lock_guard<std::mutex> lock(context_mutex_);
        service_name_ = service_name;
        environment_ = environment;
    }
    format_.store(format);

    applyPattern(format);
    logger->set_level(parse_log_level(log_level));

    LOG_DEBUG("Logger initialized: service={}, level={}, format={}, environment={}",
              service_name, log_level,
              (format == Format::JSON ? "json" : "text"),
              environment);
}

const std::shared_ptr<spdlog::logger>& Logger::get() {
    std::call_once(create_flag_, [] {
        // Tokens go to stdout, diagnostics to stderr
        auto console_sink = std::make_shared<spdlog::sinks::stderr_color_sink_mt>();

        auto logger = std::make_shared<spdlog::logger>("mimeid", console_sink);

        // Library callers that never configure logging only see warnings
        logger->set_level(spdlog::level::warn);
        logger->flush_on(spdlog::level::warn);
        logger_ = logger;

        applyPattern(Format::TEXT);
        spdlog::set_default_logger(logger);
    });
    return logger_;
}

void Logger::applyPattern(Format format) {
    if (format == Format::TEXT) {
        // [2026-10-19 10:30:45.123] [info] Message
        logger_->set_pattern("[%Y-%m-%d %H:%M:%S.%e] [%^%l%$] %v");
    } else {
        // JSON lines are assembled in log_structured
        logger_->set_pattern("%v");
    }
}

void Logger::log_structured(
    spdlog::level::level_enum level,
    const std::string& message,
    const nlohmann::json& fields
) {
    const auto& logger = get();
    if (!logger->should_log(level)) {
        return;
    }

    if (format_.load() == Format::TEXT) {
        if (fields.empty()) {
            logger->log(level, message);
        } else {
            logger->log(level, "{} {}", message, fields.dump());
        }
        return;
    }

    std::string service_name;
    std::string environment;
    {
        std::lock_guard<std::mutex> lock(context_mutex_);
        service_name = service_name_;
        environment = environment_;
    }

    nlohmann::json log_entry = {
        {"timestamp", get_timestamp()},
        {"level", spdlog::level::to_string_view(level).data()},
        {"service", service_name},
        {"environment", environment},
        {"message", message}
    };

    for (auto& [key, value] : fields.items()) {
        log_entry[key] = value;
    }

    logger->log(level, log_entry.dump());
}

void Logger::log_exception(
    spdlog::level::level_enum level,
    const std::string& message,
    const std::exception& exception,
    const nlohmann::json& fields
) {
    nlohmann::json context = fields;
    context["error_type"] = "exception";
    context["error_message"] = exception.what();

    log_structured(level, message, context);
}

std::string Logger::get_timestamp() {
    auto now = std::chrono::system_clock::now();
    auto now_time_t = std::chrono::system_clock::to_time_t(now);
    auto now_ms = std::chrono::duration_cast<std::chrono::milliseconds>(
        now.time_since_epoch()
    ) % 1000;

    std::tm utc{};
    gmtime_r(&now_time_t, &utc);

    std::stringstream ss;
    ss << std::put_time(&utc, "%Y-%m-%dT%H:%M:%S");
    ss << '.' << std::setfill('0') << std::setw(3) << now_ms.count() << 'Z';

    return ss.str();
}

spdlog::level::level_enum Logger::parse_log_level(const std::string& level) {
    if (level == "trace") return spdlog::level::trace;
    if (level == "debug") return spdlog::level::debug;
    if (level == "info") return spdlog::level::info;
    if (level == "warn" || level == "warning") return spdlog::level::warn;
    if (level == "error") return spdlog::level::err;
    if (level == "critical") return spdlog::level::critical;
    if (level == "off") return spdlog::level::off;

    // Default to info
    return spdlog::level::info;
}

} // namespace mimeid
