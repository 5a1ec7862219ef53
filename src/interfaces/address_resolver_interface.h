#ifndef MIMEID_ADDRESS_RESOLVER_INTERFACE_H
#define MIMEID_ADDRESS_RESOLVER_INTERFACE_H

#include <optional>
#include <string>

namespace mimeid {

class MailSession;

/**
 * @brief Abstract interface for local address lookup
 *
 * Implementations decide where the address of the sending user/host comes
 * from (session properties, a directory, a fixed value in tests, ...).
 */
class AddressResolverInterface {
public:
    virtual ~AddressResolverInterface() = default;

    /**
     * @brief Resolve the local email address for a session
     * @param session Session whose properties drive the lookup
     * @return address string, or std::nullopt if none is available
     *
     * May throw; callers in this library treat a throw the same as nullopt.
     */
    virtual std::optional<std::string> getLocalAddress(const MailSession& session) const = 0;
};

} // namespace mimeid

#endif // MIMEID_ADDRESS_RESOLVER_INTERFACE_H
