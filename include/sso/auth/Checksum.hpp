//==========================================================================================================
// SPDX-License-Identifier: MIT
// Copyright (c) 2025 Vinny Parla
// File: Checksum.hpp
// Purpose: Per-command HMAC-SHA256 checksums proving knowledge of a broker secret
//==========================================================================================================

#pragma once

#include <string>

#include "sso/BrokerInfo.hpp"

namespace sso::auth {

// Command a checksum is bound to. A checksum valid for one command is invalid for the other.
enum class Command {
    Bearer,
    Attach
};

// Wire name of a command ("bearer" / "attach").
const char* commandName(Command command);

//==========================================================================================================
// hmacSha256Hex
// Purpose: Lowercase hex HMAC-SHA256 of message keyed by key.
// Throws: std::runtime_error when the digest cannot be computed.
//==========================================================================================================
std::string hmacSha256Hex(const std::string& key, const std::string& message);

//==========================================================================================================
// constantTimeEquals
// Purpose: Compare two strings in time independent of where they differ. Strings of different length
//          compare unequal immediately (length is not secret).
//==========================================================================================================
bool constantTimeEquals(const std::string& a, const std::string& b);

//==========================================================================================================
// ChecksumAuthority
// Purpose: Computes and validates checksums of command + ":" + token keyed by the broker's secret. The
//          secret is fetched from the provider on every call.
//==========================================================================================================
class ChecksumAuthority {
public:
    explicit ChecksumAuthority(IBrokerInfoProvider& brokers);

    //==========================================================================================================
    // Generate
    // Returns: hex(HMAC-SHA256(secret, command + ":" + token)).
    // Throws:
    //   errors::BrokerError(UnknownBroker) when the broker is not registered.
    //   errors::ServerError when the provider fails.
    //==========================================================================================================
    std::string Generate(Command command, const std::string& brokerId, const std::string& token) const;

    //==========================================================================================================
    // Validate
    // Purpose: Recompute the checksum and compare it with the supplied one in constant time.
    // Throws:
    //   errors::BrokerError(InvalidChecksum) on mismatch, plus everything Generate throws.
    //==========================================================================================================
    void Validate(const std::string& checksum, Command command, const std::string& brokerId, const std::string& token) const;

private:
    IBrokerInfoProvider& brokers;
};

} // namespace sso::auth
