#ifndef MIMEID_EXCEPTIONS_MIMEID_EXCEPTIONS_H
#define MIMEID_EXCEPTIONS_MIMEID_EXCEPTIONS_H

#include <stdexcept>
#include <string>

namespace mimeid {
namespace exceptions {

/**
 * @brief Exception thrown when a local address is malformed
 */
class AddressException : public std::runtime_error {
public:
    explicit AddressException(const std::string& message)
        : std::runtime_error(message) {}
};

/**
 * @brief Exception thrown when input validation fails
 */
class ValidationException : public std::runtime_error {
public:
    explicit ValidationException(const std::string& message)
        : std::runtime_error(message) {}
};

} // namespace exceptions
} // namespace mimeid

#endif // MIMEID_EXCEPTIONS_MIMEID_EXCEPTIONS_H
