#include "models/mail_session.h"
#include "constants/token_constants.h"
#include "exceptions/mimeid_exceptions.h"
#include <cstdlib>
#include <utility>

namespace mimeid {

MailSession::MailSession(PropertyMap properties)
    : properties_(std::move(properties)) {}

std::optional<std::string> MailSession::getProperty(const std::string& name) const {
    auto it = properties_.find(name);
    if (it == properties_.end() || it->second.empty()) {
        return std::nullopt;
    }
    return it->second;
}

void MailSession::setProperty(const std::string& name, const std::string& value) {
    properties_[name] = value;
}

nlohmann::json MailSession::toJson() const {
    nlohmann::json j = nlohmann::json::object();
    for (const auto& [name, value] : properties_) {
        j[name] = value;
    }
    return j;
}

MailSession MailSession::fromJson(const nlohmann::json& j) {
    if (!j.is_object()) {
        throw exceptions::ValidationException("Mail session must be a JSON object");
    }

    MailSession session;
    for (auto& [key, value] : j.items()) {
        if (!value.is_string()) {
            throw exceptions::ValidationException(
                "Mail session property '" + key + "' must be a string");
        }
        session.setProperty(key, value.get<std::string>());
    }
    return session;
}

MailSession MailSession::fromEnvironment() {
    MailSession session;

    const char* from_env = std::getenv(constants::ENV_MAIL_FROM);
    if (from_env) {
        session.setProperty(constants::PROP_MAIL_FROM, from_env);
    }

    const char* user_env = std::getenv(constants::ENV_MAIL_USER);
    if (user_env) {
        session.setProperty(constants::PROP_MAIL_USER, user_env);
    }

    const char* host_env = std::getenv(constants::ENV_MAIL_HOST);
    if (host_env) {
        session.setProperty(constants::PROP_MAIL_HOST, host_env);
    }

    return session;
}

} // namespace mimeid
