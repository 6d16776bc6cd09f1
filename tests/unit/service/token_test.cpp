#include <gtest/gtest.h>

#include "tmauth/foundation/error_code.hpp"
#include "tmauth/service/token_issuer.hpp"
#include "tmauth/service/token_validator.hpp"

#include "services/auth/crypto_utils.hpp"

#include <chrono>
#include <limits>
#include <string>
#include <vector>

using namespace tmauth::service;
using tmauth::foundation::ErrorCode;
using std::chrono::hours;
using std::chrono::seconds;
using std::chrono::system_clock;

namespace {

constexpr const char* kSecret = "test-signing-secret";
const system_clock::time_point kIssuedAt{seconds(1'700'000'000)};

AuthConfig makeConfig(std::string secret = kSecret, hours lifetime = hours(24)) {
    AuthConfig config;
    config.signingSecret = std::move(secret);
    config.tokenLifetime = lifetime;
    return config;
}

/// Sign arbitrary header/payload JSON with HS256 under @p secret.
std::string craftToken(std::string_view headerJson, std::string_view payloadJson,
                       std::string_view secret = kSecret) {
    using namespace tmauth::service::detail;
    std::string input = base64urlEncode(headerJson) + "." + base64urlEncode(payloadJson);
    auto mac = hmacSha256(secret, input);
    EXPECT_TRUE(mac.hasValue());
    return input + "." + base64urlEncode(mac.value().data(), mac.value().size());
}

std::vector<std::string> split(const std::string& token) {
    std::vector<std::string> parts;
    std::size_t start = 0;
    for (;;) {
        auto dot = token.find('.', start);
        parts.push_back(token.substr(start, dot - start));
        if (dot == std::string::npos) {
            return parts;
        }
        start = dot + 1;
    }
}

} // namespace

/// Issuer and validator sharing a controllable clock.
class TokenTest : public ::testing::Test {
protected:
    system_clock::time_point now = kIssuedAt;
    Clock clock = [this]() { return now; };

    TokenIssuer issuer{makeConfig(), clock};
    TokenValidator validator{makeConfig(), clock};

    std::string issue(std::string_view username = "alice") {
        auto issued = issuer.issueToken(username);
        EXPECT_TRUE(issued.hasValue());
        return issued.value().token;
    }

    static std::string bearer(const std::string& token) { return "Bearer " + token; }
};

// =============================================================================
// Issuing
// =============================================================================

TEST_F(TokenTest, IssueProducesThreeSegmentsAndClaims) {
    auto issued = issuer.issueToken("alice");
    ASSERT_TRUE(issued.hasValue());

    EXPECT_EQ(split(issued.value().token).size(), 3u);
    const auto& claims = issued.value().claims;
    EXPECT_EQ(claims.username, "alice");
    EXPECT_TRUE(claims.authorized);
    EXPECT_EQ(claims.issuedAt, kIssuedAt);
    EXPECT_EQ(claims.expiresAt, kIssuedAt + hours(24));
}

TEST_F(TokenTest, HeaderAndPayloadWireFormat) {
    auto parts = split(issue());
    auto header = detail::base64urlDecodeString(parts[0]);
    auto payload = detail::base64urlDecodeString(parts[1]);
    ASSERT_TRUE(header.has_value());
    ASSERT_TRUE(payload.has_value());
    EXPECT_EQ(*header, R"({"alg":"HS256","typ":"JWT"})");
    EXPECT_EQ(*payload,
              R"({"authorized":true,"exp":1700086400,"iat":1700000000,"username":"alice"})");
}

TEST_F(TokenTest, SubSecondClockIsTruncated) {
    now = kIssuedAt + std::chrono::milliseconds(750);
    auto issued = issuer.issueToken("alice");
    ASSERT_TRUE(issued.hasValue());
    EXPECT_EQ(issued.value().claims.issuedAt, kIssuedAt);
}

TEST_F(TokenTest, ResponseEnvelope) {
    auto issued = issuer.issueToken("alice");
    ASSERT_TRUE(issued.hasValue());
    auto response = TokenIssuer::toResponse(issued.value());
    EXPECT_EQ(response.accessToken, issued.value().token);
    EXPECT_EQ(response.tokenType, "Bearer");
    EXPECT_EQ(response.expiresIn, seconds(86400));
}

TEST_F(TokenTest, IssueRejectsEmptySubject) {
    auto issued = issuer.issueToken("");
    ASSERT_TRUE(issued.hasError());
    EXPECT_EQ(issued.error().code(), ErrorCode::InvalidArgument);
}

TEST(TokenIssuerConfigTest, MissingSecretOrLifetime) {
    TokenIssuer noSecret(makeConfig(""));
    auto a = noSecret.issueToken("alice");
    ASSERT_TRUE(a.hasError());
    EXPECT_EQ(a.error().code(), ErrorCode::ConfigKeyNotFound);

    TokenIssuer noLifetime(makeConfig(kSecret, hours(0)));
    auto b = noLifetime.issueToken("alice");
    ASSERT_TRUE(b.hasError());
    EXPECT_EQ(b.error().code(), ErrorCode::ConfigTypeMismatch);
}

TEST(TokenIssuerConfigTest, LifetimeAboveUpperBoundIsRefused) {
    for (hours lifetime : {kMaxTokenLifetime + hours(1), hours(3000000),
                           hours(std::numeric_limits<hours::rep>::max())}) {
        TokenIssuer issuer(makeConfig(kSecret, lifetime));
        auto issued = issuer.issueToken("alice");
        ASSERT_TRUE(issued.hasError()) << lifetime.count();
        EXPECT_EQ(issued.error().code(), ErrorCode::ConfigTypeMismatch);
    }
}

TEST(TokenIssuerConfigTest, LongestLifetimeRoundTrips) {
    AuthConfig config = makeConfig(kSecret, kMaxTokenLifetime);
    TokenIssuer issuer(config, [] { return kIssuedAt; });
    TokenValidator validator(config, [] { return kIssuedAt; });

    auto issued = issuer.issueToken("alice");
    ASSERT_TRUE(issued.hasValue());
    auto response = TokenIssuer::toResponse(issued.value());
    EXPECT_EQ(response.expiresIn.count(), kMaxTokenLifetime.count() * 3600);
    EXPECT_TRUE(validator.validateToken("Bearer " + issued.value().token).hasValue());
}

// =============================================================================
// Round trip and expiry
// =============================================================================

TEST_F(TokenTest, RoundTrip) {
    auto username = validator.validateToken(bearer(issue("alice")));
    ASSERT_TRUE(username.hasValue()) << username.error().message();
    EXPECT_EQ(username.value(), "alice");
}

TEST_F(TokenTest, DecodeReturnsTypedClaims) {
    auto claims = validator.decode(issue("bob"));
    ASSERT_TRUE(claims.hasValue());
    EXPECT_EQ(claims.value().username, "bob");
    EXPECT_EQ(claims.value().issuedAt, kIssuedAt);
    EXPECT_EQ(claims.value().expiresAt, kIssuedAt + hours(24));
    EXPECT_TRUE(claims.value().authorized);
}

TEST_F(TokenTest, ExpiryBoundary) {
    auto token = issue();

    now = kIssuedAt + hours(24) - seconds(1);
    EXPECT_TRUE(validator.validateToken(bearer(token)).hasValue());

    now = kIssuedAt + hours(24);
    EXPECT_TRUE(validator.validateToken(bearer(token)).hasValue());

    now = kIssuedAt + hours(24) + seconds(1);
    auto expired = validator.validateToken(bearer(token));
    ASSERT_TRUE(expired.hasError());
    EXPECT_EQ(expired.error().code(), ErrorCode::TokenExpired);
    EXPECT_EQ(expired.error().message(), "token is expired");
    EXPECT_TRUE(expired.error().isUnauthenticated());
}

TEST_F(TokenTest, NotYetValid) {
    auto token = issue();
    now = kIssuedAt - seconds(1);
    auto result = validator.validateToken(bearer(token));
    ASSERT_TRUE(result.hasError());
    EXPECT_EQ(result.error().code(), ErrorCode::InvalidClaims);
}

TEST_F(TokenTest, WrongSecretFailsSignature) {
    TokenValidator other(makeConfig("another-secret"), clock);
    auto result = other.validateToken(bearer(issue()));
    ASSERT_TRUE(result.hasError());
    EXPECT_EQ(result.error().code(), ErrorCode::InvalidSignature);
    EXPECT_EQ(result.error().message(), "signature is invalid");
}

// =============================================================================
// Tampering
// =============================================================================

TEST_F(TokenTest, FlippingAnyPayloadOrSignatureCharacterFails) {
    const auto token = issue();
    const auto parts = split(token);
    const auto payloadStart = parts[0].size() + 1;

    for (std::size_t i = payloadStart; i < token.size(); ++i) {
        if (token[i] == '.') {
            continue;
        }
        auto tampered = token;
        tampered[i] = tampered[i] == 'A' ? 'B' : 'A';
        auto result = validator.validateToken(bearer(tampered));
        ASSERT_TRUE(result.hasError()) << "position " << i;
        EXPECT_TRUE(result.error().isUnauthenticated()) << "position " << i;
    }
}

TEST_F(TokenTest, ResignedPayloadWithOtherSecretFails) {
    auto forged = craftToken(R"({"alg":"HS256","typ":"JWT"})",
                             R"({"authorized":true,"exp":1700086400,"iat":1700000000,"username":"mallory"})",
                             "guessed-secret");
    auto result = validator.validateToken(bearer(forged));
    ASSERT_TRUE(result.hasError());
    EXPECT_EQ(result.error().code(), ErrorCode::InvalidSignature);
}

// =============================================================================
// Algorithm confusion
// =============================================================================

TEST_F(TokenTest, AlgNoneRejected) {
    using namespace tmauth::service::detail;
    auto token = base64urlEncode(R"({"alg":"none","typ":"JWT"})") + "." +
                 base64urlEncode(R"({"authorized":true,"exp":1700086400,"iat":1700000000,"username":"alice"})") +
                 ".";
    auto result = validator.validateToken(bearer(token));
    ASSERT_TRUE(result.hasError());
    EXPECT_EQ(result.error().code(), ErrorCode::UnsupportedAlgorithm);
    EXPECT_EQ(result.error().message(), "unexpected signing method: none");
}

TEST_F(TokenTest, AsymmetricAlgRejectedEvenWithValidHmac) {
    auto token = craftToken(R"({"alg":"RS256","typ":"JWT"})",
                            R"({"authorized":true,"exp":1700086400,"iat":1700000000,"username":"alice"})");
    auto result = validator.validateToken(bearer(token));
    ASSERT_TRUE(result.hasError());
    EXPECT_EQ(result.error().code(), ErrorCode::UnsupportedAlgorithm);
}

TEST_F(TokenTest, MissingAlgRejected) {
    auto token = craftToken(R"({"typ":"JWT"})",
                            R"({"authorized":true,"exp":1700086400,"iat":1700000000,"username":"alice"})");
    auto result = validator.validateToken(bearer(token));
    ASSERT_TRUE(result.hasError());
    EXPECT_EQ(result.error().code(), ErrorCode::InvalidToken);
}

// =============================================================================
// Claims
// =============================================================================

TEST_F(TokenTest, ClaimsAreRequiredAndTyped) {
    const std::string header = R"({"alg":"HS256","typ":"JWT"})";
    const std::vector<std::string> badPayloads = {
        R"({"authorized":true,"iat":1700000000,"username":"alice"})",
        R"({"authorized":true,"exp":1700086400,"username":"alice"})",
        R"({"authorized":true,"exp":"1700086400","iat":1700000000,"username":"alice"})",
        R"({"exp":1700086400,"iat":1700000000,"username":"alice"})",
        R"({"authorized":false,"exp":1700086400,"iat":1700000000,"username":"alice"})",
        R"({"authorized":"true","exp":1700086400,"iat":1700000000,"username":"alice"})",
        R"({"authorized":true,"exp":1700086400,"iat":1700000000})",
        R"({"authorized":true,"exp":1700086400,"iat":1700000000,"username":""})",
        R"({"authorized":true,"exp":1700086400,"iat":1700000000,"username":42})",
    };
    for (const auto& payload : badPayloads) {
        auto result = validator.validateToken(bearer(craftToken(header, payload)));
        ASSERT_TRUE(result.hasError()) << payload;
        EXPECT_EQ(result.error().code(), ErrorCode::InvalidClaims) << payload;
    }
}

TEST_F(TokenTest, NonIntegralTimestampsRejected) {
    const std::string header = R"({"alg":"HS256","typ":"JWT"})";
    for (const std::string payload : {
             R"({"authorized":true,"exp":1700086400.0,"iat":1700000000,"username":"alice"})",
             R"({"authorized":true,"exp":1700086400,"iat":1.7e9,"username":"alice"})",
             R"({"authorized":true,"exp":1700086400.5,"iat":1700000000.5,"username":"alice"})",
         }) {
        auto result = validator.validateToken(bearer(craftToken(header, payload)));
        ASSERT_TRUE(result.hasError()) << payload;
        EXPECT_EQ(result.error().code(), ErrorCode::InvalidClaims) << payload;
    }
}

TEST_F(TokenTest, PayloadThatIsNotJson) {
    auto token = craftToken(R"({"alg":"HS256","typ":"JWT"})", "not json");
    auto result = validator.validateToken(bearer(token));
    ASSERT_TRUE(result.hasError());
    EXPECT_EQ(result.error().code(), ErrorCode::InvalidToken);
}

TEST_F(TokenTest, WrongSegmentCount) {
    for (const char* token : {"abc", "a.b", "a.b.c.d", ".."}) {
        auto result = validator.validateToken(std::string("Bearer ") + token);
        ASSERT_TRUE(result.hasError()) << token;
        EXPECT_EQ(result.error().code(), ErrorCode::InvalidToken) << token;
    }
}

// =============================================================================
// Authorization header
// =============================================================================

TEST_F(TokenTest, MissingHeader) {
    for (auto header : {std::optional<std::string_view>{}, std::optional<std::string_view>{""}}) {
        auto result = validator.validateToken(header);
        ASSERT_TRUE(result.hasError());
        EXPECT_EQ(result.error().code(), ErrorCode::TokenMissing);
        EXPECT_EQ(result.error().message(), "token not set");
    }
}

TEST_F(TokenTest, MalformedHeader) {
    auto token = issue();
    const std::vector<std::string> headers = {
        "Basic xyz",
        "Bearer",
        "Bearer ",
        "bearer " + token,
        "Bearer  " + token,
        "Bearer " + token + " extra",
        token,
    };
    for (const auto& header : headers) {
        auto result = validator.validateToken(header);
        ASSERT_TRUE(result.hasError()) << header;
        EXPECT_EQ(result.error().code(), ErrorCode::MalformedAuthHeader) << header;
        EXPECT_TRUE(result.error().isUnauthenticated());
    }
}

TEST(TokenValidatorStaticTest, ExtractBearer) {
    auto token = TokenValidator::extractBearer(std::string_view("Bearer abc.def.ghi"));
    ASSERT_TRUE(token.hasValue());
    EXPECT_EQ(token.value(), "abc.def.ghi");
}

TEST(TokenValidatorConfigTest, MissingSecret) {
    TokenValidator validator(makeConfig(""));
    auto result = validator.decode("a.b.c");
    ASSERT_TRUE(result.hasError());
    EXPECT_EQ(result.error().code(), ErrorCode::ConfigKeyNotFound);
}
