#include "utils/unique_token_generator.h"
#include "interfaces/address_resolver_interface.h"
#include "services/session_address_resolver.h"
#include "models/mail_session.h"
#include "constants/token_constants.h"
#include "utils/logger.h"
#include "utils/metrics.h"
#include <limits>
#include <optional>
#include <random>
#include <sstream>
#include <utility>

namespace mimeid {
namespace utils {

UniqueTokenGenerator::UniqueTokenGenerator(std::shared_ptr<ClockInterface> clock)
    : clock_(std::move(clock)),
      counter_{0} {
    if (!clock_) {
        clock_ = std::make_shared<SystemClock>();
    }
}

UniqueTokenGenerator& UniqueTokenGenerator::instance() {
    static UniqueTokenGenerator generator;
    return generator;
}

std::string UniqueTokenGenerator::generateBoundaryToken() {
    std::int32_t identity = nextIdentity();
    counter_type part = counter_.fetch_add(1, std::memory_order_relaxed);
    std::int64_t now = clock_->nowMillis();

    // ----=_Part_<part>_<identity>.<now>
    std::ostringstream oss;
    oss << constants::BOUNDARY_PREFIX << part << '_' << identity << '.' << now;

    METRICS_COUNT(constants::METRIC_BOUNDARY_TOKENS);
    return oss.str();
}

std::string UniqueTokenGenerator::generateMessageIdToken(const AddressResolverInterface& resolver,
                                                         const MailSession& session) {
    std::string suffix = resolveSuffix(resolver, session);

    std::int32_t identity = nextIdentity();
    counter_type id = counter_.fetch_add(1, std::memory_order_relaxed);
    std::int64_t now = clock_->nowMillis();

    // <identity>.<id>.<now><suffix>
    std::ostringstream oss;
    oss << identity << '.' << id << '.' << now << suffix;

    METRICS_COUNT(constants::METRIC_MESSAGE_ID_TOKENS);
    return oss.str();
}

std::string UniqueTokenGenerator::generateMessageIdToken(const MailSession& session) {
    SessionAddressResolver resolver;
    return generateMessageIdToken(resolver, session);
}

UniqueTokenGenerator::counter_type UniqueTokenGenerator::currentCounter() const {
    return counter_.load(std::memory_order_relaxed);
}

std::string UniqueTokenGenerator::resolveSuffix(const AddressResolverInterface& resolver,
                                                const MailSession& session) const {
    std::optional<std::string> address;
    try {
        address = resolver.getLocalAddress(session);
    } catch (const std::exception& e) {
        Logger::log_exception(spdlog::level::warn,
                              "Local address resolution failed, using fallback host", e,
                              {{"fallback_suffix", constants::FALLBACK_HOST_SUFFIX}});
        METRICS_COUNT(constants::METRIC_RESOLUTION_FAILURES);
        address.reset();
    } catch (...) {
        LOG_WARN("Local address resolution failed with a non-standard exception, using {}",
                 constants::FALLBACK_HOST_SUFFIX);
        METRICS_COUNT(constants::METRIC_RESOLUTION_FAILURES);
        address.reset();
    }

    if (!address || address->empty()) {
        LOG_DEBUG("No local address available, using {}", constants::FALLBACK_HOST_SUFFIX);
        METRICS_COUNT(constants::METRIC_RESOLUTION_FALLBACKS);
        return constants::FALLBACK_HOST_SUFFIX;
    }

    auto at = address->rfind('@');
    if (at == std::string::npos) {
        return *address;
    }
    return address->substr(at);
}

std::int32_t UniqueTokenGenerator::nextIdentity() {
    // Per-thread engine: varies across calls without any shared state
    thread_local std::mt19937 engine{std::random_device{}()};
    std::uniform_int_distribution<std::int32_t> dis(
        std::numeric_limits<std::int32_t>::min(),
        std::numeric_limits<std::int32_t>::max());
    return dis(engine);
}

} // namespace utils
} // namespace mimeid
