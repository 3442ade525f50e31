//==========================================================================================================
// SPDX-License-Identifier: MIT
// Copyright (c) 2025 Vinny Parla
// File: Cache.hpp
// Purpose: Key-value cache contract used to link broker tokens to sessions, plus an in-memory cache
//==========================================================================================================

#pragma once

#include <chrono>
#include <mutex>
#include <optional>
#include <string>
#include <unordered_map>

namespace sso {

//==========================================================================================================
// ICache
// Purpose: External key-value store. Implementations must make Get/Set atomic per key; the cache may be
//          shared by many server instances.
//==========================================================================================================
class ICache {
public:
    virtual ~ICache() = default;

    // Returns the value, or std::nullopt on a miss. May throw on backend failure.
    virtual std::optional<std::string> Get(const std::string& key) = 0;

    // Stores value under key (unconditional overwrite). ttl of zero means no expiry.
    // Returns false when the value could not be stored.
    virtual bool Set(const std::string& key, const std::string& value, std::chrono::seconds ttl) = 0;
};

//==========================================================================================================
// InMemoryCache
// Purpose: Mutex-guarded map with optional per-entry expiry. An expired entry is dropped when it is read,
//          and Set prunes every expired entry once the earliest pending expiry has passed.
//==========================================================================================================
class InMemoryCache : public ICache {
public:
    using Clock = std::chrono::steady_clock;

    InMemoryCache() = default;

    std::optional<std::string> Get(const std::string& key) override;
    bool Set(const std::string& key, const std::string& value, std::chrono::seconds ttl) override;

    bool Erase(const std::string& key);
    size_t Size() const;

private:
    struct Entry {
        std::string value;
        std::optional<Clock::time_point> expiresAt;
    };

    void pruneExpiredLocked(const Clock::time_point& now);

    mutable std::mutex mutex;
    std::unordered_map<std::string, Entry> entries;
    std::optional<Clock::time_point> earliestExpiry;
};

} // namespace sso
