//==========================================================================================================
// SPDX-License-Identifier: MIT
// Copyright (c) 2025 Vinny Parla
// File: src/sso/auth/BearerCredential.cpp
// Purpose: Bearer credential parsing/rendering and cache key derivation
//==========================================================================================================

#include "sso/auth/BearerCredential.hpp"

namespace sso::auth {

namespace {
    const std::string kPrefix = "SSO-";

    bool isWordChar(char c) {
        return (c >= 'a' && c <= 'z') || (c >= 'A' && c <= 'Z') || (c >= '0' && c <= '9') || c == '_';
    }

    bool isLowerAlnum(char c) {
        return (c >= 'a' && c <= 'z') || (c >= '0' && c <= '9');
    }

    // Consume [A-Za-z0-9_]+ starting at i; returns false if nothing was consumed.
    bool parseWord(const std::string& s, size_t& i, std::string& out) {
        size_t start = i;
        while (i < s.size() && isWordChar(s[i])) {
            ++i;
        }
        if (i == start) {
            return false;
        }
        out = s.substr(start, i - start);
        return true;
    }
}

bool isWordString(const std::string& s) {
    if (s.empty()) {
        return false;
    }
    for (char c : s) {
        if (!isWordChar(c)) {
            return false;
        }
    }
    return true;
}

std::optional<BearerCredential> parseBearerCredential(const std::string& bearer) {
    if (bearer.compare(0, kPrefix.size(), kPrefix) != 0) {
        return std::nullopt;
    }

    BearerCredential cred;
    size_t i = kPrefix.size();

    if (!parseWord(bearer, i, cred.brokerId)) {
        return std::nullopt;
    }
    if (i >= bearer.size() || bearer[i] != '-') {
        return std::nullopt;
    }
    ++i;

    if (!parseWord(bearer, i, cred.token)) {
        return std::nullopt;
    }
    if (i >= bearer.size() || bearer[i] != '-') {
        return std::nullopt;
    }
    ++i;

    // Checksum runs to the end of input
    if (i >= bearer.size()) {
        return std::nullopt;
    }
    for (size_t j = i; j < bearer.size(); ++j) {
        if (!isLowerAlnum(bearer[j])) {
            return std::nullopt;
        }
    }
    cred.checksum = bearer.substr(i);
    return cred;
}

std::string renderBearerCredential(const std::string& brokerId, const std::string& token, const std::string& checksum) {
    return kPrefix + brokerId + "-" + token + "-" + checksum;
}

std::string cacheKeyFor(const std::string& brokerId, const std::string& token) {
    return kPrefix + brokerId + "-" + token;
}

} // namespace sso::auth
