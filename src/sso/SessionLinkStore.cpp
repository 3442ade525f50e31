//==========================================================================================================
// SPDX-License-Identifier: MIT
// Copyright (c) 2025 Vinny Parla
// File: src/sso/SessionLinkStore.cpp
// Purpose: Session link store wrapping cache failures as server errors
//==========================================================================================================

#include "sso/SessionLinkStore.hpp"

#include <stdexcept>
#include <string>

#include "logging/Logger.h"
#include "sso/auth/BearerCredential.hpp"
#include "sso/errors/Errors.h"

namespace sso {

SessionLinkStore::SessionLinkStore(ICache& cache, std::chrono::seconds ttl) : cache(cache), ttl(ttl) {}

std::optional<std::string> SessionLinkStore::Lookup(const std::string& brokerId, const std::string& token) const {
    std::optional<std::string> sessionId;
    try {
        sessionId = cache.Get(auth::cacheKeyFor(brokerId, token));
    } catch (const std::exception& e) {
        LOG_ERROR("Failed to get session id: {} (broker={} token={})", e.what(), brokerId, token);
        throw errors::ServerError("Failed to get session id", brokerId, token, e.what());
    }
    if (sessionId.has_value() && sessionId->empty()) {
        return std::nullopt;
    }
    return sessionId;
}

void SessionLinkStore::Link(const std::string& brokerId, const std::string& token, const std::string& sessionId) const {
    bool stored = false;
    std::string cause = "cache rejected the write";
    try {
        stored = cache.Set(auth::cacheKeyFor(brokerId, token), sessionId, ttl);
    } catch (const std::exception& e) {
        cause = e.what();
    }
    if (!stored) {
        LOG_ERROR("Failed to attach bearer token to session id due to cache issue: {} (broker={} token={} session={})",
                  cause, brokerId, token, sessionId);
        throw errors::ServerError("Failed to attach bearer token to session id", brokerId, token, cause);
    }
}

} // namespace sso
