/*
Module Name:
- webhook_signature.cpp

Abstract:
- OpenSSL one-shot HMAC plus hex encode/decode for signature headers.
*/

// C++ Standard Library
#include <algorithm>
#include <array>
#include <cstddef>
#include <optional>
#include <stdexcept>

// GSL
#include <gsl/gsl>

// OpenSSL
#include <openssl/crypto.h>
#include <openssl/evp.h>
#include <openssl/hmac.h>

// Core
#include <rb/relay/webhook_signature.hpp>

namespace relay_bot {

namespace {

inline constexpr std::size_t kSha256Size = 32;
inline constexpr std::string_view kHexDigits = "0123456789abcdef";

using Digest = std::array<unsigned char, kSha256Size>;

std::optional<Digest> hmac_sha256(std::string_view key, std::string_view data) noexcept
{
    std::array<unsigned char, EVP_MAX_MD_SIZE> out{};
    unsigned int out_len = 0;

    const unsigned char* result = HMAC(EVP_sha256(),
                                       key.data(), gsl::narrow_cast<int>(key.size()),
                                       reinterpret_cast<const unsigned char*>(data.data()), data.size(),
                                       out.data(), &out_len);
    if (result == nullptr || out_len != kSha256Size)
        return std::nullopt;

    Digest digest{};
    std::copy_n(out.begin(), kSha256Size, digest.begin());
    return digest;
}

int hex_value(char c) noexcept
{
    if (c >= '0' && c <= '9')
        return c - '0';
    if (c >= 'a' && c <= 'f')
        return c - 'a' + 10;
    if (c >= 'A' && c <= 'F')
        return c - 'A' + 10;
    return -1;
}

std::optional<Digest> decode_hex_digest(std::string_view hex) noexcept
{
    if (hex.size() != kSha256Size * 2)
        return std::nullopt;

    Digest digest{};
    for (std::size_t i = 0; i < kSha256Size; ++i) {
        const int hi = hex_value(hex[2 * i]);
        const int lo = hex_value(hex[2 * i + 1]);
        if (hi < 0 || lo < 0)
            return std::nullopt;
        digest[i] = gsl::narrow_cast<unsigned char>((hi << 4) | lo);
    }
    return digest;
}

} // unnamed namespace

std::string sign_payload(std::string_view secret, std::string_view body)
{
    const auto digest = hmac_sha256(secret, body);
    if (!digest)
        throw std::runtime_error("HMAC-SHA256 computation failed");

    std::string out{kSignaturePrefix};
    out.reserve(kSignaturePrefix.size() + kSha256Size * 2);
    for (unsigned char byte : *digest) {
        out.push_back(kHexDigits[byte >> 4]);
        out.push_back(kHexDigits[byte & 0x0F]);
    }
    return out;
}

bool verify_signature(std::string_view secret, std::string_view body, std::string_view header) noexcept
{
    if (!header.starts_with(kSignaturePrefix))
        return false;

    const auto expected = decode_hex_digest(header.substr(kSignaturePrefix.size()));
    if (!expected)
        return false;

    const auto actual = hmac_sha256(secret, body);
    if (!actual)
        return false;

    return CRYPTO_memcmp(expected->data(), actual->data(), kSha256Size) == 0;
}

} // namespace relay_bot
