//==========================================================================================================
// SPDX-License-Identifier: MIT
// Copyright (c) 2025 Vinny Parla
// File: Session.hpp
// Purpose: Client session capability used by the SSO flows, and an in-memory cookie-backed implementation
//==========================================================================================================

#pragma once

#include <chrono>
#include <mutex>
#include <optional>
#include <string>
#include <unordered_map>

namespace sso {

//==========================================================================================================
// ISession
// Purpose: Session mechanism scoped to one request. The SSO core never persists sessions itself.
//==========================================================================================================
class ISession {
public:
    virtual ~ISession() = default;

    virtual bool IsActive() const = 0;

    // Start a new session (existingId == std::nullopt) or resume the given one.
    virtual void Start(const std::optional<std::string>& existingId) = 0;

    // Id of the active session; empty when inactive.
    virtual std::string GetId() const = 0;
};

//==========================================================================================================
// SessionRegistry
// Purpose: Thread-safe set of live session ids shared by all requests of one server process.
//          A session expires after idleTimeout without use; expired ids are swept while creating and
//          looking up sessions. An idleTimeout of zero keeps sessions until Destroy().
//==========================================================================================================
class SessionRegistry {
public:
    using Clock = std::chrono::steady_clock;

    explicit SessionRegistry(std::chrono::seconds idleTimeout = std::chrono::hours(24));

    // Create and register a new random session id (64 hex chars).
    std::string Create();

    // Register id if unknown, or refresh it; returns true when it was already live.
    bool Resume(const std::string& id);

    // True when id is live; a live id counts as used and its idle timer restarts.
    bool Contains(const std::string& id);

    bool Destroy(const std::string& id);

    // Number of live sessions.
    size_t Size();

    std::chrono::seconds IdleTimeout() const { return idleTimeout; }

private:
    bool expired(const Clock::time_point& lastSeen, const Clock::time_point& now) const;
    void sweepLocked(const Clock::time_point& now, bool force);

    const std::chrono::seconds idleTimeout;
    mutable std::mutex mutex;
    std::unordered_map<std::string, Clock::time_point> lastSeen;
    Clock::time_point nextSweep;
};

//==========================================================================================================
// CookieSession
// Purpose: Per-request ISession. Active from construction when the request carried a cookie naming a live
//          session in the registry; otherwise inactive until Start().
//==========================================================================================================
class CookieSession : public ISession {
public:
    CookieSession(SessionRegistry& registry, const std::optional<std::string>& cookieId);

    bool IsActive() const override;
    void Start(const std::optional<std::string>& existingId) override;
    std::string GetId() const override;

    // True when Start() created a new session during this request (the response must set the cookie).
    bool IsNew() const { return created; }

private:
    SessionRegistry& registry;
    std::string id;
    bool active{false};
    bool created{false};
};

//==========================================================================================================
// cookieValue
// Purpose: Value of cookie `name` in a Cookie request header ("a=1; b=2"), or std::nullopt.
//==========================================================================================================
std::optional<std::string> cookieValue(const std::string& cookieHeader, const std::string& name);

} // namespace sso
