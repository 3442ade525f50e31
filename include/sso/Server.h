//==========================================================================================================
// SPDX-License-Identifier: MIT
// Copyright (c) 2025 Vinny Parla
// File: Server.h
// Purpose: SSO server protocol flows: attach a client session to a broker token, and resume that session
//          for broker requests carrying a bearer credential
//==========================================================================================================

#pragma once

#include <chrono>
#include <optional>
#include <string>

#include "sso/BrokerInfo.hpp"
#include "sso/Cache.hpp"
#include "sso/Request.hpp"
#include "sso/Session.hpp"
#include "sso/SessionLinkStore.hpp"
#include "sso/auth/Checksum.hpp"
#include "sso/auth/DomainPolicy.hpp"

namespace sso {

//==========================================================================================================
// BrokerSession
// Purpose: Outcome of a successful flow.
// Fields:
//   brokerId, token: Handshake identity.
//   sessionId: Client session bound to (or resumed for) the broker token.
//   returnUrl: Validated return_url of an attach request, when supplied.
//==========================================================================================================
struct BrokerSession {
    std::string brokerId;
    std::string token;
    std::string sessionId;
    std::optional<std::string> returnUrl;
};

class Server {
public:
    //==========================================================================================================
    // Options
    // Purpose: Server configuration, assembled before construction.
    // Fields:
    //   linkTtl: Lifetime of a token -> session link in the cache (0 = no expiry).
    //==========================================================================================================
    struct Options {
        std::chrono::seconds linkTtl{0};
    };

    // brokers and cache must outlive the server.
    Server(IBrokerInfoProvider& brokers, ICache& cache);
    Server(IBrokerInfoProvider& brokers, ICache& cache, const Options& opts);

    //==========================================================================================================
    // StartBrokerSession
    // Purpose: Resume the client session linked to the bearer credential in the Authorization header.
    // Args:
    //   request: Broker request ("Authorization: Bearer SSO-{broker}-{token}-{checksum}").
    //   session: Session capability for this request; must not be active yet.
    // Returns:
    //   Broker id, token and the resumed session id.
    // Throws:
    //   errors::BrokerError (AlreadyStarted, MissingCredential, InvalidCredential, UnknownBroker,
    //   InvalidChecksum, NoLinkedSession) and errors::ServerError.
    //==========================================================================================================
    BrokerSession StartBrokerSession(const IRequest& request, ISession& session) const;

    //==========================================================================================================
    // Attach
    // Purpose: Bind the broker token of an attach request (query: broker, token, checksum[, return_url]) to
    //          the active client session, starting a new session when none is active.
    // Returns:
    //   Broker id, token, the linked session id and the validated return_url.
    // Throws:
    //   errors::BrokerError (MissingParameter, UnknownBroker, InvalidChecksum, DomainNotAllowed) and
    //   errors::ServerError.
    //==========================================================================================================
    BrokerSession Attach(const IRequest& request, ISession& session) const;

private:
    std::string requireQueryParam(const IRequest& request, const std::string& key) const;

    auth::ChecksumAuthority checksums;
    auth::DomainPolicy domains;
    SessionLinkStore links;
};

} // namespace sso
