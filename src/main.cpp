#include <cstdlib>
#include <iostream>
#include <stdexcept>
#include <string>

#include "models/mail_session.h"
#include "services/session_address_resolver.h"
#include "utils/header_utils.h"
#include "utils/logger.h"
#include "utils/metrics.h"
#include "utils/unique_token_generator.h"

namespace {

void printUsage(const char* program) {
    std::cerr << "Usage: " << program << " [boundary|message-id] [count]\n"
              << "Environment: MAIL_FROM, MAIL_USER, MAIL_HOST, LOG_LEVEL, LOG_FORMAT,\n"
              << "             ENVIRONMENT, METRICS_ENABLED, METRICS_NAMESPACE\n";
}

} // namespace

int main(int argc, char* argv[]) {
    // Get logging configuration from environment
    const char* log_level_env = std::getenv("LOG_LEVEL");
    const char* log_format_env = std::getenv("LOG_FORMAT");
    const char* environment_env = std::getenv("ENVIRONMENT");

    std::string log_level = log_level_env ? log_level_env : "warn";
    std::string log_format_str = log_format_env ? log_format_env : "text";
    std::string environment = environment_env ? environment_env : "production";

    auto log_format = (log_format_str == "json")
        ? mimeid::Logger::Format::JSON
        : mimeid::Logger::Format::TEXT;

    mimeid::Logger::initialize("mimeid-gen", log_level, log_format, environment);

    const char* metrics_enabled_env = std::getenv("METRICS_ENABLED");
    const char* metrics_namespace_env = std::getenv("METRICS_NAMESPACE");

    bool metrics_enabled = metrics_enabled_env
        ? (std::string(metrics_enabled_env) == "true")
        : false;
    std::string metrics_namespace = metrics_namespace_env ? metrics_namespace_env : "MimeId";

    mimeid::Metrics::initialize(metrics_namespace, "mimeid-gen", environment, metrics_enabled);

    if (argc > 3) {
        printUsage(argv[0]);
        return 1;
    }

    std::string kind = argc > 1 ? argv[1] : "boundary";
    if (kind == "-h" || kind == "--help") {
        printUsage(argv[0]);
        return 0;
    }
    if (kind != "boundary" && kind != "message-id") {
        LOG_ERROR("Unknown token kind: {}", kind);
        printUsage(argv[0]);
        return 1;
    }

    long count = 1;
    if (argc > 2) {
        try {
            size_t consumed = 0;
            count = std::stol(argv[2], &consumed);
            if (consumed != std::string(argv[2]).size() || count < 1) {
                throw std::invalid_argument("count must be a positive integer");
            }
        } catch (const std::exception& e) {
            mimeid::Logger::log_exception(spdlog::level::err, "Invalid count argument", e,
                                          {{"count", argv[2]}});
            printUsage(argv[0]);
            return 1;
        }
    }

    auto session = mimeid::MailSession::fromEnvironment();
    mimeid::Logger::log_structured(spdlog::level::debug, "Session configuration", session.toJson());

    mimeid::SessionAddressResolver resolver;
    auto& generator = mimeid::utils::UniqueTokenGenerator::instance();

    for (long i = 0; i < count; ++i) {
        if (kind == "boundary") {
            std::cout << generator.generateBoundaryToken() << '\n';
        } else {
            std::cout << mimeid::utils::HeaderUtils::formatMessageIdHeader(
                             generator.generateMessageIdToken(resolver, session))
                      << '\n';
        }
    }

    return 0;
}
