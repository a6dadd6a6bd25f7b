#include <catch2/catch_test_macros.hpp>

#include "rb/relay/webhook_signature.hpp"

#include <string>

using namespace relay_bot;

namespace {
constexpr std::string_view kFoxBody = "The quick brown fox jumps over the lazy dog";
constexpr std::string_view kFoxSignature =
    "sha256=f7bc83f430538424b13298e6aa6fb143ef4d59a14946175997479dbc2d1a3cd8";
} // namespace

TEST_CASE("sign_payload: known HMAC-SHA256 vector", "[relay][signature]") {
    CHECK(sign_payload("key", kFoxBody) == kFoxSignature);
}

TEST_CASE("verify_signature", "[relay][signature]") {
    const std::string body = R"({"repository":{"name":"pokemon-showdown"}})";
    const std::string header = sign_payload("s1", body);

    SECTION("own signature verifies") {
        CHECK(verify_signature("s1", body, header));
    }

    SECTION("known vector verifies") {
        CHECK(verify_signature("key", kFoxBody, kFoxSignature));
    }

    SECTION("uppercase hex is accepted") {
        std::string upper = header;
        for (std::size_t i = kSignaturePrefix.size(); i < upper.size(); ++i) {
            if (upper[i] >= 'a' && upper[i] <= 'f') upper[i] = static_cast<char>(upper[i] - 'a' + 'A');
        }
        CHECK(verify_signature("s1", body, upper));
    }

    SECTION("modified body fails") {
        CHECK_FALSE(verify_signature("s1", body + " ", header));
    }

    SECTION("wrong secret fails") {
        CHECK_FALSE(verify_signature("g", body, header));
    }

    SECTION("missing prefix fails") {
        CHECK_FALSE(verify_signature("s1", body, header.substr(kSignaturePrefix.size())));
    }

    SECTION("sha1 header fails") {
        CHECK_FALSE(verify_signature("s1", body, "sha1=" + header.substr(kSignaturePrefix.size())));
    }

    SECTION("truncated digest fails") {
        CHECK_FALSE(verify_signature("s1", body, header.substr(0, header.size() - 2)));
    }

    SECTION("non-hex digest fails") {
        std::string bad = header;
        bad.back() = 'z';
        CHECK_FALSE(verify_signature("s1", body, bad));
    }

    SECTION("empty header fails") {
        CHECK_FALSE(verify_signature("s1", body, ""));
    }
}
