#include <gtest/gtest.h>
#include "services/session_address_resolver.h"
#include "models/mail_session.h"
#include "constants/token_constants.h"
#include "exceptions/mimeid_exceptions.h"
#include "test_helpers/test_constants.h"
#include <optional>
#include <string>
#include <utility>

using namespace mimeid;
using namespace mimeid::constants;
using namespace mimeid::test_constants;

namespace {

// Resolver with the operating-system lookups pinned
class PinnedSessionAddressResolver : public SessionAddressResolver {
public:
    PinnedSessionAddressResolver(std::optional<std::string> user, std::optional<std::string> host)
        : user_(std::move(user)), host_(std::move(host)) {}

protected:
    std::optional<std::string> systemUserName() const override { return user_; }
    std::optional<std::string> systemHostName() const override { return host_; }

private:
    std::optional<std::string> user_;
    std::optional<std::string> host_;
};

} // namespace

class SessionAddressResolverTest : public ::testing::Test {
protected:
    PinnedSessionAddressResolver resolver_{SYSTEM_USER, SYSTEM_HOST};
    MailSession session_;
};

TEST_F(SessionAddressResolverTest, MailFrom_TakesPrecedence) {
    session_.setProperty(PROP_MAIL_FROM, SESSION_FROM);
    session_.setProperty(PROP_MAIL_USER, SESSION_USER);
    session_.setProperty(PROP_MAIL_HOST, SESSION_HOST);

    EXPECT_EQ(SESSION_FROM, resolver_.getLocalAddress(session_));
}

TEST_F(SessionAddressResolverTest, MailFromWithDisplayName_UsesAddrSpec) {
    session_.setProperty(PROP_MAIL_FROM, "Alice Example <alice@example.org>");

    EXPECT_EQ("alice@example.org", resolver_.getLocalAddress(session_));
}

TEST_F(SessionAddressResolverTest, MailFromWithQuotedDisplayName_UsesAddrSpec) {
    session_.setProperty(PROP_MAIL_FROM, "\"Example, Alice\" < alice@example.org >");

    EXPECT_EQ("alice@example.org", resolver_.getLocalAddress(session_));
}

TEST_F(SessionAddressResolverTest, MailFromWithUnterminatedBracket_ReturnsNullopt) {
    session_.setProperty(PROP_MAIL_FROM, "Alice <alice@example.org");

    std::optional<std::string> address;
    EXPECT_NO_THROW({
        address = resolver_.getLocalAddress(session_);
    });
    EXPECT_FALSE(address.has_value());
}

TEST_F(SessionAddressResolverTest, MailUserAndHost_AreCombined) {
    session_.setProperty(PROP_MAIL_USER, SESSION_USER);
    session_.setProperty(PROP_MAIL_HOST, SESSION_HOST);

    EXPECT_EQ(SESSION_USER + "@" + SESSION_HOST, resolver_.getLocalAddress(session_));
}

TEST_F(SessionAddressResolverTest, UserName_UsedWhenMailUserMissing) {
    session_.setProperty(PROP_USER_NAME, SESSION_USER_NAME);
    session_.setProperty(PROP_MAIL_HOST, SESSION_HOST);

    EXPECT_EQ(SESSION_USER_NAME + "@" + SESSION_HOST, resolver_.getLocalAddress(session_));
}

TEST_F(SessionAddressResolverTest, EmptyMailUser_FallsThroughToUserName) {
    session_.setProperty(PROP_MAIL_USER, "");
    session_.setProperty(PROP_USER_NAME, SESSION_USER_NAME);
    session_.setProperty(PROP_MAIL_HOST, SESSION_HOST);

    EXPECT_EQ(SESSION_USER_NAME + "@" + SESSION_HOST, resolver_.getLocalAddress(session_));
}

TEST_F(SessionAddressResolverTest, EmptySession_UsesSystemUserAndHost) {
    EXPECT_EQ(SYSTEM_USER + "@" + SYSTEM_HOST, resolver_.getLocalAddress(session_));
}

TEST_F(SessionAddressResolverTest, NoUserAnywhere_ReturnsNullopt) {
    PinnedSessionAddressResolver resolver(std::nullopt, SYSTEM_HOST);

    EXPECT_FALSE(resolver.getLocalAddress(session_).has_value());
}

TEST_F(SessionAddressResolverTest, NoHostAnywhere_ReturnsNullopt) {
    PinnedSessionAddressResolver resolver(SYSTEM_USER, std::nullopt);
    session_.setProperty(PROP_MAIL_USER, SESSION_USER);

    EXPECT_FALSE(resolver.getLocalAddress(session_).has_value());
}

TEST_F(SessionAddressResolverTest, BlankUser_ReturnsNullopt) {
    session_.setProperty(PROP_MAIL_USER, "   ");
    session_.setProperty(PROP_MAIL_HOST, SESSION_HOST);

    EXPECT_FALSE(resolver_.getLocalAddress(session_).has_value());
}

TEST_F(SessionAddressResolverTest, UserIsTrimmed) {
    session_.setProperty(PROP_MAIL_USER, "  alice\t");
    session_.setProperty(PROP_MAIL_HOST, SESSION_HOST);

    EXPECT_EQ("alice@" + SESSION_HOST, resolver_.getLocalAddress(session_));
}

TEST_F(SessionAddressResolverTest, UserWithSpace_IsQuoted) {
    session_.setProperty(PROP_MAIL_USER, "John Doe");
    session_.setProperty(PROP_MAIL_HOST, SESSION_HOST);

    EXPECT_EQ("\"John Doe\"@" + SESSION_HOST, resolver_.getLocalAddress(session_));
}

TEST_F(SessionAddressResolverTest, MailFromWithControlCharacter_ReturnsNullopt) {
    session_.setProperty(PROP_MAIL_FROM, "bad\r\nBcc: victim@example.com");

    std::optional<std::string> address;
    EXPECT_NO_THROW({
        address = resolver_.getLocalAddress(session_);
    });
    EXPECT_FALSE(address.has_value());
}

TEST_F(SessionAddressResolverTest, UnpinnedResolver_DoesNotThrow) {
    SessionAddressResolver resolver;

    EXPECT_NO_THROW(resolver.getLocalAddress(session_));
}

// ============================================================================
// Local Part Quoting Tests
// ============================================================================

TEST(SessionAddressResolverQuoteTest, PlainUser_Unchanged) {
    EXPECT_EQ("alice", SessionAddressResolver::quoteLocalPart("alice"));
}

TEST(SessionAddressResolverQuoteTest, DotsDoNotRequireQuoting) {
    EXPECT_EQ("first.last", SessionAddressResolver::quoteLocalPart("first.last"));
}

TEST(SessionAddressResolverQuoteTest, SpecialsAreQuoted) {
    EXPECT_EQ("\"a,b\"", SessionAddressResolver::quoteLocalPart("a,b"));
    EXPECT_EQ("\"a@b\"", SessionAddressResolver::quoteLocalPart("a@b"));
    EXPECT_EQ("\"(a)\"", SessionAddressResolver::quoteLocalPart("(a)"));
}

TEST(SessionAddressResolverQuoteTest, QuotesAndBackslashesAreEscaped) {
    EXPECT_EQ("\"say \\\"hi\\\"\"", SessionAddressResolver::quoteLocalPart("say \"hi\""));
    EXPECT_EQ("\"a\\\\b\"", SessionAddressResolver::quoteLocalPart("a\\b"));
}

// ============================================================================
// mail.from Parsing Tests
// ============================================================================

TEST(SessionAddressResolverParseFromTest, BareAddress_Unchanged) {
    EXPECT_EQ("alice@example.org", SessionAddressResolver::parseFromAddress(" alice@example.org "));
}

TEST(SessionAddressResolverParseFromTest, TrailingComment_IsDropped) {
    EXPECT_EQ("alice@example.org",
              SessionAddressResolver::parseFromAddress("alice@example.org (Alice Example)"));
}

TEST(SessionAddressResolverParseFromTest, EmptyBrackets_Throw) {
    EXPECT_THROW(SessionAddressResolver::parseFromAddress("Alice <>"),
                 exceptions::AddressException);
}

// ============================================================================
// Host Name Tests
// ============================================================================

TEST(SessionAddressResolverHostTest, CanonicalHostName_ResolvesLocalhost) {
    std::string canonical = SessionAddressResolver::canonicalHostName("localhost");

    EXPECT_FALSE(canonical.empty());
    EXPECT_NE(std::string::npos, canonical.find("localhost")) << canonical;
}

TEST(SessionAddressResolverHostTest, CanonicalHostName_UnresolvableHostIsReturnedAsIs) {
    EXPECT_EQ("no-such-host.invalid",
              SessionAddressResolver::canonicalHostName("no-such-host.invalid"));
}
