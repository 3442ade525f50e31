//==========================================================================================================
// SPDX-License-Identifier: MIT
// Copyright (c) 2025 Vinny Parla
// File: src/sso/auth/DomainPolicy.cpp
// Purpose: URL host extraction and broker domain allow-list validation
//==========================================================================================================

#include "sso/auth/DomainPolicy.hpp"

#include <algorithm>
#include <cctype>

#include "logging/Logger.h"
#include "sso/errors/Errors.h"

namespace sso::auth {

namespace {
    bool isSchemeChar(char c) {
        unsigned char ch = static_cast<unsigned char>(c);
        return std::isalnum(ch) != 0 || c == '+' || c == '-' || c == '.';
    }

    bool hasControlChar(const std::string& s) {
        return std::any_of(s.begin(), s.end(), [](char c) {
            unsigned char ch = static_cast<unsigned char>(c);
            return ch < 0x20 || ch == 0x7F;
        });
    }

    // Control characters are masked so a rejected URL cannot forge log lines
    std::string printable(const std::string& s) {
        std::string out = s;
        for (char& c : out) {
            unsigned char ch = static_cast<unsigned char>(c);
            if (ch < 0x20 || ch == 0x7F) {
                c = '?';
            }
        }
        return out;
    }
}

std::optional<std::string> urlHost(const std::string& url) {
    if (hasControlChar(url)) {
        return std::nullopt;
    }

    size_t authStart = std::string::npos;

    if (url.rfind("//", 0) == 0) {
        authStart = 2;
    } else {
        auto sep = url.find("://");
        if (sep == std::string::npos || sep == 0) {
            return std::nullopt;
        }
        if (std::isalpha(static_cast<unsigned char>(url[0])) == 0) {
            return std::nullopt;
        }
        for (size_t i = 1; i < sep; ++i) {
            if (!isSchemeChar(url[i])) {
                return std::nullopt;
            }
        }
        authStart = sep + 3;
    }

    size_t authEnd = url.find_first_of("/?#", authStart);
    std::string authority = url.substr(authStart, authEnd == std::string::npos ? std::string::npos : authEnd - authStart);

    // Strip userinfo
    auto at = authority.rfind('@');
    if (at != std::string::npos) {
        authority = authority.substr(at + 1);
    }

    std::string host;
    if (!authority.empty() && authority.front() == '[') {
        auto rb = authority.find(']');
        if (rb == std::string::npos) {
            return std::nullopt;
        }
        host = authority.substr(0, rb + 1);
    } else {
        auto colon = authority.find(':');
        host = (colon == std::string::npos) ? authority : authority.substr(0, colon);
    }

    if (host.empty()) {
        return std::nullopt;
    }
    return host;
}

DomainPolicy::DomainPolicy(IBrokerInfoProvider& brokers) : brokers(brokers) {}

void DomainPolicy::Validate(const std::string& kind, const std::string& url, const std::string& brokerId,
                            const std::optional<std::string>& token) const {
    const std::string tokenLog = token.value_or("-");

    std::optional<BrokerInfo> info;
    try {
        info = brokers.GetBrokerInfo(brokerId);
    } catch (const std::exception& e) {
        LOG_ERROR("Failed to get broker domains: {} (broker={} token={})", e.what(), brokerId, tokenLog);
        throw errors::ServerError("Failed to get broker domains", brokerId, token, e.what());
    }

    const std::optional<std::string> host = urlHost(url);

    bool allowed = false;
    if (info.has_value() && host.has_value()) {
        allowed = std::find(info->domains.begin(), info->domains.end(), host.value()) != info->domains.end();
    }

    if (!allowed) {
        LOG_WARN("Domain of {} is not allowed for broker ({}={} domain={} broker={} token={})",
                 kind, kind, printable(url), host.value_or(""), brokerId, tokenLog);
        throw errors::BrokerError(errors::ErrorCategory::DomainNotAllowed,
                                  std::string("Domain of ") + kind + " is not allowed", brokerId, token);
    }
}

} // namespace sso::auth
