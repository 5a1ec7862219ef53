#ifndef MIMEID_UTILS_HEADER_UTILS_H
#define MIMEID_UTILS_HEADER_UTILS_H

#include <string>

namespace mimeid {
namespace utils {

class HeaderUtils {
public:
    // Wrap a message-id token in angle brackets: <token>
    static std::string formatMessageIdHeader(const std::string& token);

    /**
     * @brief Build a multipart Content-Type value
     *
     * Example: multipart/mixed; boundary="----=_Part_0_-12.1700000000000"
     *
     * @throws exceptions::ValidationException if the subtype is empty or not
     *         a MIME token, or the boundary is not a valid RFC 2046 boundary
     */
    static std::string formatMultipartContentType(const std::string& subtype,
                                                  const std::string& boundary);

    // True if boundary has 1-70 bchars and does not end in a space
    static bool isValidBoundary(const std::string& boundary);
};

} // namespace utils
} // namespace mimeid

#endif // MIMEID_UTILS_HEADER_UTILS_H
