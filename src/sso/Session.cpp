//==========================================================================================================
// SPDX-License-Identifier: MIT
// Copyright (c) 2025 Vinny Parla
// File: src/sso/Session.cpp
// Purpose: In-memory session registry and cookie-scoped session
//==========================================================================================================

#include "sso/Session.hpp"

#include <algorithm>
#include <stdexcept>

#include <openssl/rand.h>

#include "logging/Logger.h"

namespace sso {

namespace {
    std::string randomHexId(size_t bytes) {
        std::string raw(bytes, '\0');
        if (::RAND_bytes(reinterpret_cast<unsigned char*>(&raw[0]), static_cast<int>(bytes)) != 1) {
            throw std::runtime_error("RAND_bytes failed");
        }
        static const char* kHex = "0123456789abcdef";
        std::string hex;
        hex.reserve(bytes * 2);
        for (unsigned char b : raw) {
            hex.push_back(kHex[(b >> 4) & 0x0F]);
            hex.push_back(kHex[b & 0x0F]);
        }
        return hex;
    }

    void trimSpaces(std::string& s) {
        while (!s.empty() && (s.front() == ' ' || s.front() == '\t')) s.erase(s.begin());
        while (!s.empty() && (s.back() == ' ' || s.back() == '\t')) s.pop_back();
    }
}

SessionRegistry::SessionRegistry(std::chrono::seconds idleTimeout)
    : idleTimeout(idleTimeout), nextSweep(Clock::now()) {}

bool SessionRegistry::expired(const Clock::time_point& seen, const Clock::time_point& now) const {
    return idleTimeout.count() > 0 && now - seen >= idleTimeout;
}

// Full sweeps run at most once per min(idleTimeout, 60s) unless forced.
void SessionRegistry::sweepLocked(const Clock::time_point& now, bool force) {
    if (idleTimeout.count() <= 0 || (!force && now < nextSweep)) {
        return;
    }
    size_t before = lastSeen.size();
    for (auto it = lastSeen.begin(); it != lastSeen.end();) {
        if (expired(it->second, now)) {
            it = lastSeen.erase(it);
        } else {
            ++it;
        }
    }
    nextSweep = now + std::min<std::chrono::seconds>(idleTimeout, std::chrono::seconds(60));
    if (lastSeen.size() != before) {
        LOG_DEBUG("Expired {} idle session(s); {} live", before - lastSeen.size(), lastSeen.size());
    }
}

std::string SessionRegistry::Create() {
    std::string id = randomHexId(32);
    std::lock_guard<std::mutex> lock(mutex);
    const auto now = Clock::now();
    sweepLocked(now, false);
    while (!lastSeen.emplace(id, now).second) {
        id = randomHexId(32);
    }
    return id;
}

bool SessionRegistry::Resume(const std::string& id) {
    std::lock_guard<std::mutex> lock(mutex);
    const auto now = Clock::now();
    sweepLocked(now, false);
    auto it = lastSeen.find(id);
    bool live = it != lastSeen.end() && !expired(it->second, now);
    lastSeen[id] = now;
    return live;
}

bool SessionRegistry::Contains(const std::string& id) {
    std::lock_guard<std::mutex> lock(mutex);
    const auto now = Clock::now();
    sweepLocked(now, false);
    auto it = lastSeen.find(id);
    if (it == lastSeen.end()) {
        return false;
    }
    if (expired(it->second, now)) {
        lastSeen.erase(it);
        return false;
    }
    it->second = now;
    return true;
}

bool SessionRegistry::Destroy(const std::string& id) {
    std::lock_guard<std::mutex> lock(mutex);
    return lastSeen.erase(id) > 0;
}

size_t SessionRegistry::Size() {
    std::lock_guard<std::mutex> lock(mutex);
    sweepLocked(Clock::now(), true);
    return lastSeen.size();
}

CookieSession::CookieSession(SessionRegistry& registry, const std::optional<std::string>& cookieId)
    : registry(registry) {
    if (cookieId.has_value() && !cookieId->empty() && registry.Contains(cookieId.value())) {
        id = cookieId.value();
        active = true;
    }
}

bool CookieSession::IsActive() const {
    return active;
}

void CookieSession::Start(const std::optional<std::string>& existingId) {
    if (existingId.has_value()) {
        if (!registry.Resume(existingId.value())) {
            LOG_DEBUG("Resumed session {} was not live in this process", existingId.value());
        }
        id = existingId.value();
        created = false;
    } else {
        id = registry.Create();
        created = true;
    }
    active = true;
}

std::string CookieSession::GetId() const {
    return active ? id : std::string();
}

std::optional<std::string> cookieValue(const std::string& cookieHeader, const std::string& name) {
    size_t start = 0;
    while (start <= cookieHeader.size()) {
        size_t semi = cookieHeader.find(';', start);
        std::string pair = (semi == std::string::npos) ? cookieHeader.substr(start) : cookieHeader.substr(start, semi - start);
        auto eq = pair.find('=');
        if (eq != std::string::npos) {
            std::string k = pair.substr(0, eq);
            std::string v = pair.substr(eq + 1);
            trimSpaces(k);
            trimSpaces(v);
            if (k == name) {
                return v;
            }
        }
        if (semi == std::string::npos) {
            break;
        }
        start = semi + 1;
    }
    return std::nullopt;
}

} // namespace sso
