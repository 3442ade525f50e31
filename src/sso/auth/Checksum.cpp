//==========================================================================================================
// SPDX-License-Identifier: MIT
// Copyright (c) 2025 Vinny Parla
// File: src/sso/auth/Checksum.cpp
// Purpose: HMAC-SHA256 checksum generation and validation (OpenSSL)
//==========================================================================================================

#include "sso/auth/Checksum.hpp"

#include <optional>
#include <stdexcept>

#include <openssl/crypto.h>
#include <openssl/evp.h>
#include <openssl/hmac.h>

#include "logging/Logger.h"
#include "sso/errors/Errors.h"

namespace sso::auth {

using errors::BrokerError;
using errors::ErrorCategory;
using errors::ServerError;

const char* commandName(Command command) {
    switch (command) {
        case Command::Bearer: return "bearer";
        case Command::Attach: return "attach";
        default: return "unknown";
    }
}

std::string hmacSha256Hex(const std::string& key, const std::string& message) {
    unsigned char digest[EVP_MAX_MD_SIZE];
    unsigned int digestLen = 0;
    const unsigned char* out = ::HMAC(::EVP_sha256(),
                                      key.data(), static_cast<int>(key.size()),
                                      reinterpret_cast<const unsigned char*>(message.data()), message.size(),
                                      digest, &digestLen);
    if (out == nullptr) {
        throw std::runtime_error("HMAC-SHA256 computation failed");
    }

    static const char* kHex = "0123456789abcdef";
    std::string hex;
    hex.reserve(static_cast<size_t>(digestLen) * 2);
    for (unsigned int i = 0; i < digestLen; ++i) {
        hex.push_back(kHex[(digest[i] >> 4) & 0x0F]);
        hex.push_back(kHex[digest[i] & 0x0F]);
    }
    return hex;
}

bool constantTimeEquals(const std::string& a, const std::string& b) {
    if (a.size() != b.size()) {
        return false;
    }
    if (a.empty()) {
        return true;
    }
    return ::CRYPTO_memcmp(a.data(), b.data(), a.size()) == 0;
}

ChecksumAuthority::ChecksumAuthority(IBrokerInfoProvider& brokers) : brokers(brokers) {}

std::string ChecksumAuthority::Generate(Command command, const std::string& brokerId, const std::string& token) const {
    std::optional<BrokerInfo> info;
    try {
        info = brokers.GetBrokerInfo(brokerId);
    } catch (const std::exception& e) {
        LOG_ERROR("Failed to get broker secret: {} (broker={} token={})", e.what(), brokerId, token);
        throw ServerError("Failed to get broker secret", brokerId, token, e.what());
    }

    if (!info.has_value()) {
        LOG_WARN("Unknown broker id (broker={} token={})", brokerId, token);
        throw BrokerError(ErrorCategory::UnknownBroker, "Unknown broker id", brokerId, token);
    }

    try {
        return hmacSha256Hex(info->secret, std::string(commandName(command)) + ":" + token);
    } catch (const std::exception& e) {
        LOG_ERROR("Failed to generate {} checksum: {} (broker={} token={})", commandName(command), e.what(), brokerId, token);
        throw ServerError("Failed to generate checksum", brokerId, token, e.what());
    }
}

void ChecksumAuthority::Validate(const std::string& checksum, Command command,
                                 const std::string& brokerId, const std::string& token) const {
    const std::string expected = Generate(command, brokerId, token);

    if (!constantTimeEquals(checksum, expected)) {
        LOG_WARN("Invalid {} checksum (expected={} received={} broker={} token={})",
                 commandName(command), expected, checksum, brokerId, token);
        throw BrokerError(ErrorCategory::InvalidChecksum, "Invalid checksum", brokerId, token);
    }
}

} // namespace sso::auth
