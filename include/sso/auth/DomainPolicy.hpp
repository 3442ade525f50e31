//==========================================================================================================
// SPDX-License-Identifier: MIT
// Copyright (c) 2025 Vinny Parla
// File: DomainPolicy.hpp
// Purpose: Allow-list check of a URL's host against a broker's registered domains
//==========================================================================================================

#pragma once

#include <optional>
#include <string>

#include "sso/BrokerInfo.hpp"

namespace sso::auth {

//==========================================================================================================
// urlHost
// Purpose: Extract the host component of an absolute ("scheme://") or scheme-relative ("//") URL.
//          Userinfo and port are stripped; IPv6 literals keep their brackets; case is preserved.
// Returns:
//   Host, or std::nullopt when the URL has no authority component or contains a control character
//   (< 0x20 or 0x7F).
//==========================================================================================================
std::optional<std::string> urlHost(const std::string& url);

//==========================================================================================================
// DomainPolicy
// Purpose: Validates that a URL's host is an exact, case-sensitive member of the broker's domains.
//          No wildcard or subdomain matching.
//==========================================================================================================
class DomainPolicy {
public:
    explicit DomainPolicy(IBrokerInfoProvider& brokers);

    //==========================================================================================================
    // Validate
    // Args:
    //   kind: "origin", "referer" or "return_url"; used for diagnostics only.
    //   url: URL whose host is checked.
    //   brokerId: Broker whose allow-list applies.
    //   token: Handshake token, logged when present.
    // Throws:
    //   errors::BrokerError(DomainNotAllowed) when the host is not allowed (or the broker is unknown), and
    //   whenever url contains a control character, so a validated URL is always safe to echo in a header.
    //   errors::ServerError when the provider fails.
    //==========================================================================================================
    void Validate(const std::string& kind, const std::string& url, const std::string& brokerId,
                  const std::optional<std::string>& token = std::nullopt) const;

private:
    IBrokerInfoProvider& brokers;
};

} // namespace sso::auth
