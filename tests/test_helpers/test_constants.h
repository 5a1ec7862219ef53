#ifndef MIMEID_TEST_HELPERS_TEST_CONSTANTS_H
#define MIMEID_TEST_HELPERS_TEST_CONSTANTS_H

#include <cstdint>
#include <string>

namespace mimeid {
namespace test_constants {

// Time constants
constexpr std::int64_t FIXED_NOW_MILLIS = 1700000000123;
constexpr std::int64_t ZERO_MILLIS = 0;

// Addresses returned by stub resolvers
const std::string ADDRESS_EXAMPLE = "user@example.com";
const std::string ADDRESS_TWO_ATS = "\"odd@user\"@mail.example.org";
const std::string ADDRESS_NO_DOMAIN = "nodomain";
const std::string SUFFIX_EXAMPLE = "@example.com";
const std::string SUFFIX_TWO_ATS = "@mail.example.org";
const std::string SUFFIX_LOCALHOST = "@localhost";

// Session values
const std::string SESSION_FROM = "sender@from.example";
const std::string SESSION_USER = "alice";
const std::string SESSION_USER_NAME = "bob";
const std::string SESSION_HOST = "mx.example.net";
const std::string SYSTEM_USER = "sysuser";
const std::string SYSTEM_HOST = "buildhost.local";

// Multipart subtypes
const std::string SUBTYPE_MIXED = "mixed";
const std::string SUBTYPE_ALTERNATIVE = "alternative";

// Concurrency test constants
constexpr int CONCURRENT_THREADS = 10;
constexpr int CALLS_PER_THREAD = 1000;
constexpr int UNIQUENESS_TEST_COUNT = 10000;

} // namespace test_constants
} // namespace mimeid

#endif // MIMEID_TEST_HELPERS_TEST_CONSTANTS_H
