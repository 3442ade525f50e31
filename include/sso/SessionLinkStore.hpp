//==========================================================================================================
// SPDX-License-Identifier: MIT
// Copyright (c) 2025 Vinny Parla
// File: SessionLinkStore.hpp
// Purpose: Links broker tokens to client session ids through an injected cache
//==========================================================================================================

#pragma once

#include <chrono>
#include <optional>
#include <string>

#include "sso/Cache.hpp"

namespace sso {

class SessionLinkStore {
public:
    explicit SessionLinkStore(ICache& cache, std::chrono::seconds ttl = std::chrono::seconds(0));

    //==========================================================================================================
    // Lookup
    // Purpose: Session id linked to (brokerId, token). An empty stored value counts as a miss.
    // Throws: errors::ServerError when the cache fails.
    //==========================================================================================================
    std::optional<std::string> Lookup(const std::string& brokerId, const std::string& token) const;

    //==========================================================================================================
    // Link
    // Purpose: Bind (brokerId, token) to sessionId, replacing any previous link.
    // Throws: errors::ServerError when the cache rejects the write or fails.
    //==========================================================================================================
    void Link(const std::string& brokerId, const std::string& token, const std::string& sessionId) const;

private:
    ICache& cache;
    std::chrono::seconds ttl;
};

} // namespace sso
