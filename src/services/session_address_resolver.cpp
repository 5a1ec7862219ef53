#include "services/session_address_resolver.h"
#include "models/mail_session.h"
#include "constants/token_constants.h"
#include "exceptions/mimeid_exceptions.h"
#include "utils/logger.h"
#include <cstdlib>
#include <cerrno>
#include <cstring>
#include <netdb.h>
#include <sys/socket.h>
#include <unistd.h>

namespace mimeid {

namespace {

// RFC 822 specials without '.', plus tab and space
constexpr const char* LOCAL_PART_SPECIALS = "()<>,;:\\\"[]@\t ";

// Strip leading and trailing control characters and spaces
std::string trim(const std::string& value) {
    size_t start = 0;
    size_t end = value.size();
    while (start < end && static_cast<unsigned char>(value[start]) <= ' ') {
        ++start;
    }
    while (end > start && static_cast<unsigned char>(value[end - 1]) <= ' ') {
        --end;
    }
    return value.substr(start, end - start);
}

} // namespace

std::optional<std::string> SessionAddressResolver::getLocalAddress(const MailSession& session) const {
    try {
        auto address = buildAddress(session);
        if (!address) {
            LOG_DEBUG("No local address could be derived from the session");
            return std::nullopt;
        }

        validateAddress(*address);
        return address;
    } catch (const exceptions::AddressException& e) {
        Logger::log_exception(spdlog::level::warn, "Ignoring malformed local address", e);
        return std::nullopt;
    }
}

std::optional<std::string> SessionAddressResolver::buildAddress(const MailSession& session) const {
    if (auto from = session.getProperty(constants::PROP_MAIL_FROM)) {
        return parseFromAddress(*from);
    }

    auto user = session.getProperty(constants::PROP_MAIL_USER);
    if (!user) {
        user = session.getProperty(constants::PROP_USER_NAME);
    }
    if (!user) {
        user = systemUserName();
    }

    auto host = session.getProperty(constants::PROP_MAIL_HOST);
    if (!host) {
        host = systemHostName();
    }

    if (!user || !host || host->empty()) {
        return std::nullopt;
    }

    std::string local_part = trim(*user);
    if (local_part.empty()) {
        return std::nullopt;
    }

    return quoteLocalPart(local_part) + "@" + *host;
}

std::string SessionAddressResolver::parseFromAddress(const std::string& from) {
    std::string address = trim(from);

    // Display Name <addr-spec>
    size_t open = address.rfind('<');
    if (open != std::string::npos) {
        size_t close = address.find('>', open + 1);
        if (close == std::string::npos) {
            throw exceptions::AddressException("Unterminated '<' in mail.from: " + from);
        }
        address = trim(address.substr(open + 1, close - open - 1));
    } else if (!address.empty() && address.back() == ')') {
        // addr-spec (Display Name)
        size_t comment = address.rfind('(');
        if (comment != std::string::npos) {
            address = trim(address.substr(0, comment));
        }
    }

    if (address.empty()) {
        throw exceptions::AddressException("No address in mail.from: " + from);
    }
    return address;
}

std::string SessionAddressResolver::quoteLocalPart(const std::string& user) {
    bool needs_quoting = false;
    bool needs_escaping = false;

    for (char ch : user) {
        unsigned char c = static_cast<unsigned char>(ch);
        if (c == '"' || c == '\\' || c == '\r' || c == '\n') {
            needs_escaping = true;
            needs_quoting = true;
            break;
        }
        if (c < 040 || c >= 0177 || std::strchr(LOCAL_PART_SPECIALS, ch) != nullptr) {
            needs_quoting = true;
        }
    }

    if (!needs_quoting) {
        return user;
    }

    std::string quoted;
    quoted.reserve(user.size() + 2);
    quoted.push_back('"');
    for (char ch : user) {
        if (needs_escaping && (ch == '"' || ch == '\\')) {
            quoted.push_back('\\');
        }
        quoted.push_back(ch);
    }
    quoted.push_back('"');
    return quoted;
}

void SessionAddressResolver::validateAddress(const std::string& address) {
    if (address.empty()) {
        throw exceptions::AddressException("Local address is empty");
    }

    for (char ch : address) {
        unsigned char c = static_cast<unsigned char>(ch);
        if (c < 040 || c == 0177) {
            throw exceptions::AddressException(
                "Local address contains a control character: " + address);
        }
    }
}

std::optional<std::string> SessionAddressResolver::systemUserName() const {
    for (const char* var : {"USER", "LOGNAME"}) {
        const char* value = std::getenv(var);
        if (value != nullptr && value[0] != '\0') {
            return std::string(value);
        }
    }
    return std::nullopt;
}

std::optional<std::string> SessionAddressResolver::systemHostName() const {
    char buffer[256] = {};
    if (gethostname(buffer, sizeof(buffer) - 1) != 0) {
        LOG_DEBUG("gethostname failed: {}", std::strerror(errno));
        return std::nullopt;
    }

    std::string host(buffer);
    if (host.empty()) {
        return std::nullopt;
    }
    return canonicalHostName(host);
}

std::string SessionAddressResolver::canonicalHostName(const std::string& host) {
    addrinfo hints{};
    hints.ai_family = AF_UNSPEC;
    hints.ai_socktype = SOCK_STREAM;
    hints.ai_flags = AI_CANONNAME;

    addrinfo* result = nullptr;
    int rc = getaddrinfo(host.c_str(), nullptr, &hints, &result);
    if (rc != 0) {
        LOG_DEBUG("Cannot canonicalize host {}: {}", host, gai_strerror(rc));
        return host;
    }

    std::string canonical;
    if (result != nullptr && result->ai_canonname != nullptr) {
        canonical = result->ai_canonname;
    }
    freeaddrinfo(result);

    if (canonical.empty()) {
        return host;
    }
    return canonical;
}

} // namespace mimeid
