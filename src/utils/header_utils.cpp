#include "utils/header_utils.h"
#include "constants/token_constants.h"
#include "exceptions/mimeid_exceptions.h"
#include <cctype>
#include <cstring>

namespace mimeid {
namespace utils {

namespace {

// RFC 2046 bchars, excluding alphanumerics and space
constexpr const char* BOUNDARY_SPECIALS = "'()+_,-./:=?";

// RFC 2045 token characters, excluding alphanumerics
constexpr const char* TOKEN_SPECIALS = "!#$%&'*+-.^_`{|}~";

bool isMimeToken(const std::string& value) {
    if (value.empty()) {
        return false;
    }
    for (char ch : value) {
        unsigned char c = static_cast<unsigned char>(ch);
        if (c < 040 || c >= 0177 || (!std::isalnum(c) && std::strchr(TOKEN_SPECIALS, ch) == nullptr)) {
            return false;
        }
    }
    return true;
}

} // namespace

std::string HeaderUtils::formatMessageIdHeader(const std::string& token) {
    return "<" + token + ">";
}

std::string HeaderUtils::formatMultipartContentType(const std::string& subtype,
                                                    const std::string& boundary) {
    if (!isMimeToken(subtype)) {
        throw exceptions::ValidationException("Invalid multipart subtype: '" + subtype + "'");
    }
    if (!isValidBoundary(boundary)) {
        throw exceptions::ValidationException("Invalid multipart boundary: '" + boundary + "'");
    }

    // '=' is a tspecial, so the boundary is always quoted
    return "multipart/" + subtype + "; boundary=\"" + boundary + "\"";
}

bool HeaderUtils::isValidBoundary(const std::string& boundary) {
    if (boundary.empty() || boundary.size() > constants::MAX_BOUNDARY_LENGTH) {
        return false;
    }
    if (boundary.back() == ' ') {
        return false;
    }

    for (char ch : boundary) {
        unsigned char c = static_cast<unsigned char>(ch);
        if (c < 040 || c >= 0177) {
            return false;
        }
        if (std::isalnum(c) || ch == ' ' || std::strchr(BOUNDARY_SPECIALS, ch) != nullptr) {
            continue;
        }
        return false;
    }
    return true;
}

} // namespace utils
} // namespace mimeid
