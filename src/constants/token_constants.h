#ifndef MIMEID_CONSTANTS_TOKEN_CONSTANTS_H
#define MIMEID_CONSTANTS_TOKEN_CONSTANTS_H

#include <cstddef>

namespace mimeid {
namespace constants {

// Literal prefix of every multipart boundary: ----=_Part_<part>_<identity>.<millis>
constexpr const char* BOUNDARY_PREFIX = "----=_Part_";

// Suffix appended to message-id tokens when no local address can be resolved
constexpr const char* FALLBACK_HOST_SUFFIX = "@localhost";

// RFC 2046 caps a boundary at 70 characters
constexpr std::size_t MAX_BOUNDARY_LENGTH = 70;

// Session property names
constexpr const char* PROP_MAIL_FROM = "mail.from";
constexpr const char* PROP_MAIL_USER = "mail.user";
constexpr const char* PROP_MAIL_HOST = "mail.host";
constexpr const char* PROP_USER_NAME = "user.name";

// Environment variables feeding MailSession::fromEnvironment
constexpr const char* ENV_MAIL_FROM = "MAIL_FROM";
constexpr const char* ENV_MAIL_USER = "MAIL_USER";
constexpr const char* ENV_MAIL_HOST = "MAIL_HOST";

// Metric names
constexpr const char* METRIC_BOUNDARY_TOKENS = "BoundaryTokensGenerated";
constexpr const char* METRIC_MESSAGE_ID_TOKENS = "MessageIdTokensGenerated";
constexpr const char* METRIC_RESOLUTION_FALLBACKS = "AddressResolutionFallbacks";
constexpr const char* METRIC_RESOLUTION_FAILURES = "AddressResolutionFailures";

} // namespace constants
} // namespace mimeid

#endif // MIMEID_CONSTANTS_TOKEN_CONSTANTS_H
