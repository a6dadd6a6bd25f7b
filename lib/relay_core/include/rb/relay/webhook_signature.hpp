/*
Module Name:
- webhook_signature.hpp

Abstract:
- HMAC-SHA256 signing and verification of webhook bodies.
- Header format follows GitHub's X-Hub-Signature-256: "sha256=" + 64 hex digits.
- The secret comes from RoomResolver::resolve(); nothing here touches the network.
*/
#pragma once

// C++ Standard Library
#include <string>
#include <string_view>

namespace relay_bot {

inline constexpr std::string_view kSignatureHeader = "X-Hub-Signature-256";
inline constexpr std::string_view kSignaturePrefix = "sha256=";

// Header value for body signed with secret ("sha256=<lowercase hex>").
[[nodiscard]] std::string sign_payload(std::string_view secret, std::string_view body);

// True if header is a well formed signature of body under secret.
// Digests are compared in constant time. Malformed headers are rejected, never thrown on.
[[nodiscard]] bool verify_signature(std::string_view secret,
                                    std::string_view body,
                                    std::string_view header) noexcept;

} // namespace relay_bot
