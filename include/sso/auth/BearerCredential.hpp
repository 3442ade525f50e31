//==========================================================================================================
// SPDX-License-Identifier: MIT
// Copyright (c) 2025 Vinny Parla
// File: BearerCredential.hpp
// Purpose: Codec for the SSO bearer credential wire format SSO-{broker}-{token}-{checksum}
//==========================================================================================================

#pragma once

#include <optional>
#include <string>

namespace sso::auth {

//==========================================================================================================
// BearerCredential
// Purpose: Components of a bearer credential presented by a broker.
// Fields:
//   brokerId: Broker identifier (word characters).
//   token: Broker-issued handshake nonce (word characters).
//   checksum: Lowercase alphanumeric checksum (hex HMAC-SHA256 for well-formed credentials).
//==========================================================================================================
struct BearerCredential {
    std::string brokerId;
    std::string token;
    std::string checksum;
};

//==========================================================================================================
// parseBearerCredential
// Purpose: Parse a credential of exactly the shape SSO-<word>-<word>-<lowercase alnum>.
// Args:
//   bearer: Credential string (the Authorization header value after "Bearer ").
// Returns:
//   Parsed components, or std::nullopt when the shape does not match.
//==========================================================================================================
std::optional<BearerCredential> parseBearerCredential(const std::string& bearer);

//==========================================================================================================
// renderBearerCredential
// Purpose: Inverse of parseBearerCredential.
//==========================================================================================================
std::string renderBearerCredential(const std::string& brokerId, const std::string& token, const std::string& checksum);

//==========================================================================================================
// cacheKeyFor
// Purpose: Key under which a broker token is linked to a client session ("SSO-{broker}-{token}").
//==========================================================================================================
std::string cacheKeyFor(const std::string& brokerId, const std::string& token);

// True when every character is in [A-Za-z0-9_] and s is non-empty.
bool isWordString(const std::string& s);

} // namespace sso::auth
