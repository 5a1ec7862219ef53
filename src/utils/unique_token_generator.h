#ifndef MIMEID_UTILS_UNIQUE_TOKEN_GENERATOR_H
#define MIMEID_UTILS_UNIQUE_TOKEN_GENERATOR_H

#include "interfaces/clock_interface.h"
#include <atomic>
#include <cstdint>
#include <memory>
#include <string>

namespace mimeid {

class AddressResolverInterface;
class MailSession;

namespace utils {

/**
 * @brief Generates unique US-ASCII tokens for MIME boundaries and Message-IDs
 *
 * Every token combines a counter owned by the generator, a random per-call
 * identity value and the current wall-clock time in milliseconds. Both kinds
 * of token draw from the same counter. All methods are thread-safe and never
 * throw.
 */
class UniqueTokenGenerator {
public:
    using counter_type = std::uint64_t;

    /**
     * @brief Construct a generator with its own counter starting at 0
     * @param clock Time source (defaults to the system clock)
     */
    explicit UniqueTokenGenerator(std::shared_ptr<ClockInterface> clock = nullptr);

    UniqueTokenGenerator(const UniqueTokenGenerator&) = delete;
    UniqueTokenGenerator& operator=(const UniqueTokenGenerator&) = delete;

    /**
     * @brief Process-wide generator backed by the system clock
     *
     * Created on first use; lives until process exit.
     */
    static UniqueTokenGenerator& instance();

    /**
     * @brief Generate a multipart boundary value
     *
     * Format: ----=_Part_{part}_{identity}.{millis}
     * The identity may be negative. The result contains no whitespace and
     * can be placed in a Content-Type boundary parameter.
     *
     * @return Boundary string
     */
    std::string generateBoundaryToken();

    /**
     * @brief Generate the value of a Message-ID header, without angle brackets
     *
     * Format: {identity}.{id}.{millis}{suffix}
     * The suffix is the resolved local address from its last '@' on, the
     * whole address if it has no '@', or "@localhost" if the resolver
     * returns nothing, an empty string, or throws.
     *
     * @param resolver Local address lookup
     * @param session Session passed through to the resolver
     * @return Message-ID token
     */
    std::string generateMessageIdToken(const AddressResolverInterface& resolver,
                                       const MailSession& session);

    /**
     * @brief Generate a Message-ID token using SessionAddressResolver
     */
    std::string generateMessageIdToken(const MailSession& session);

    /**
     * @brief Value the next generated token will take from the counter
     */
    counter_type currentCounter() const;

private:
    std::string resolveSuffix(const AddressResolverInterface& resolver,
                              const MailSession& session) const;

    static std::int32_t nextIdentity();

    std::shared_ptr<ClockInterface> clock_;
    std::atomic<counter_type> counter_;
};

} // namespace utils
} // namespace mimeid

#endif // MIMEID_UTILS_UNIQUE_TOKEN_GENERATOR_H
