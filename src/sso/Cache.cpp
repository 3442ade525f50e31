//==========================================================================================================
// SPDX-License-Identifier: MIT
// Copyright (c) 2025 Vinny Parla
// File: src/sso/Cache.cpp
// Purpose: In-memory cache implementation
//==========================================================================================================

#include "sso/Cache.hpp"

#include <utility>

namespace sso {

std::optional<std::string> InMemoryCache::Get(const std::string& key) {
    std::lock_guard<std::mutex> lock(mutex);
    auto it = entries.find(key);
    if (it == entries.end()) {
        return std::nullopt;
    }
    if (it->second.expiresAt.has_value() && it->second.expiresAt.value() <= Clock::now()) {
        entries.erase(it);
        return std::nullopt;
    }
    return it->second.value;
}

bool InMemoryCache::Set(const std::string& key, const std::string& value, std::chrono::seconds ttl) {
    if (ttl.count() < 0) {
        return false;
    }
    const auto now = Clock::now();
    Entry e;
    e.value = value;
    if (ttl.count() > 0) {
        e.expiresAt = now + ttl;
    }
    std::lock_guard<std::mutex> lock(mutex);
    pruneExpiredLocked(now);
    if (e.expiresAt.has_value() && (!earliestExpiry.has_value() || e.expiresAt.value() < earliestExpiry.value())) {
        earliestExpiry = e.expiresAt;
    }
    entries[key] = std::move(e);
    return true;
}

void InMemoryCache::pruneExpiredLocked(const Clock::time_point& now) {
    if (!earliestExpiry.has_value() || earliestExpiry.value() > now) {
        return;
    }
    earliestExpiry.reset();
    for (auto it = entries.begin(); it != entries.end();) {
        const auto& expiresAt = it->second.expiresAt;
        if (expiresAt.has_value() && expiresAt.value() <= now) {
            it = entries.erase(it);
            continue;
        }
        if (expiresAt.has_value() && (!earliestExpiry.has_value() || expiresAt.value() < earliestExpiry.value())) {
            earliestExpiry = expiresAt;
        }
        ++it;
    }
}

bool InMemoryCache::Erase(const std::string& key) {
    std::lock_guard<std::mutex> lock(mutex);
    return entries.erase(key) > 0;
}

size_t InMemoryCache::Size() const {
    std::lock_guard<std::mutex> lock(mutex);
    return entries.size();
}

} // namespace sso
