#ifndef MIMEID_SESSION_ADDRESS_RESOLVER_H
#define MIMEID_SESSION_ADDRESS_RESOLVER_H

#include "interfaces/address_resolver_interface.h"
#include <optional>
#include <string>

namespace mimeid {

/**
 * @brief Default local address lookup driven by session properties
 *
 * Resolution order:
 *   1. "mail.from", reduced to its addr-spec ("Alice <a@b>" gives "a@b")
 *   2. user@host, where user is "mail.user", then "user.name", then the
 *      process user, and host is "mail.host", then the canonical name of
 *      this machine
 *
 * A malformed address is logged and reported as std::nullopt; this class
 * never throws from getLocalAddress.
 */
class SessionAddressResolver : public AddressResolverInterface {
public:
    SessionAddressResolver() = default;

    std::optional<std::string> getLocalAddress(const MailSession& session) const override;

    /**
     * @brief Quote a local part if it contains RFC 822 specials
     * @param user Local part, already trimmed
     * @return user unchanged, or wrapped in double quotes with '"' and '\' escaped
     */
    static std::string quoteLocalPart(const std::string& user);

    /**
     * @brief Extract the addr-spec from a mail.from value
     *
     * Accepts a bare address, "Display Name <addr-spec>" and
     * "addr-spec (Display Name)".
     * @throws exceptions::AddressException on an unterminated '<' or an empty address
     */
    static std::string parseFromAddress(const std::string& from);

    /**
     * @brief Fully qualified name of host, via getaddrinfo(AI_CANONNAME)
     * @return the canonical name, or host unchanged when it cannot be resolved
     */
    static std::string canonicalHostName(const std::string& host);

protected:
    // Login name of the process owner, from USER or LOGNAME
    virtual std::optional<std::string> systemUserName() const;

    // Canonical host name of this machine
    virtual std::optional<std::string> systemHostName() const;

private:
    std::optional<std::string> buildAddress(const MailSession& session) const;
    static void validateAddress(const std::string& address);
};

} // namespace mimeid

#endif // MIMEID_SESSION_ADDRESS_RESOLVER_H
