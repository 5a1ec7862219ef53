#ifndef MIMEID_MAIL_SESSION_H
#define MIMEID_MAIL_SESSION_H

#include <map>
#include <optional>
#include <string>
#include <nlohmann/json.hpp>

namespace mimeid {

/**
 * @brief Session context handed to address resolvers
 *
 * A flat bag of string properties ("mail.from", "mail.user", "mail.host",
 * "user.name", ...). Read-only once shared between threads.
 */
class MailSession {
public:
    using PropertyMap = std::map<std::string, std::string>;

    MailSession() = default;
    explicit MailSession(PropertyMap properties);

    /**
     * @brief Look up a property
     * @return the value, or std::nullopt when the property is unset or empty
     */
    std::optional<std::string> getProperty(const std::string& name) const;

    void setProperty(const std::string& name, const std::string& value);

    const PropertyMap& properties() const { return properties_; }

    // Convert to/from JSON (an object of string values)
    nlohmann::json toJson() const;
    static MailSession fromJson(const nlohmann::json& j);

    // Build a session from MAIL_FROM, MAIL_USER and MAIL_HOST
    static MailSession fromEnvironment();

private:
    PropertyMap properties_;
};

} // namespace mimeid

#endif // MIMEID_MAIL_SESSION_H
