//==========================================================================================================
// SPDX-License-Identifier: MIT
// Copyright (c) 2025 Vinny Parla
// File: src/sso/Server.cpp
// Purpose: Attach and broker-session flows
//==========================================================================================================

#include "sso/Server.h"

#include "logging/Logger.h"
#include "sso/auth/BearerCredential.hpp"
#include "sso/errors/Errors.h"

namespace sso {

using errors::BrokerError;
using errors::ErrorCategory;

namespace {
    const std::string kBearerPrefix = "Bearer ";
}

Server::Server(IBrokerInfoProvider& brokers, ICache& cache)
    : Server(brokers, cache, Options{}) {}

Server::Server(IBrokerInfoProvider& brokers, ICache& cache, const Options& opts)
    : checksums(brokers),
      domains(brokers),
      links(cache, opts.linkTtl) {}

BrokerSession Server::StartBrokerSession(const IRequest& request, ISession& session) const {
    FUNC_SCOPE();
    if (session.IsActive()) {
        LOG_WARN("Broker session requested while a session is already started");
        throw BrokerError(ErrorCategory::AlreadyStarted, "Session is already started");
    }

    const std::string authorization = request.GetHeader("Authorization");
    if (authorization.compare(0, kBearerPrefix.size(), kBearerPrefix) != 0) {
        LOG_WARN("Broker didn't use bearer authentication");
        throw BrokerError(ErrorCategory::MissingCredential, "Broker didn't use bearer authentication");
    }

    const std::string bearer = authorization.substr(kBearerPrefix.size());
    auto cred = auth::parseBearerCredential(bearer);
    if (!cred.has_value()) {
        LOG_WARN("Invalid bearer token (bearer={})", bearer);
        throw BrokerError(ErrorCategory::InvalidCredential, "Invalid bearer token");
    }

    checksums.Validate(cred->checksum, auth::Command::Bearer, cred->brokerId, cred->token);

    auto sessionId = links.Lookup(cred->brokerId, cred->token);
    if (!sessionId.has_value()) {
        LOG_WARN("Bearer token isn't attached to a client session (broker={} token={})", cred->brokerId, cred->token);
        throw BrokerError(ErrorCategory::NoLinkedSession, "Bearer token isn't attached to a client session",
                          cred->brokerId, cred->token);
    }

    session.Start(sessionId);

    LOG_DEBUG("Broker request with session (broker={} token={} session={})", cred->brokerId, cred->token, sessionId.value());

    BrokerSession result;
    result.brokerId = cred->brokerId;
    result.token = cred->token;
    result.sessionId = sessionId.value();
    return result;
}

BrokerSession Server::Attach(const IRequest& request, ISession& session) const {
    FUNC_SCOPE();
    const std::string brokerId = requireQueryParam(request, "broker");
    const std::string token = requireQueryParam(request, "token");
    const std::string checksum = requireQueryParam(request, "checksum");

    checksums.Validate(checksum, auth::Command::Attach, brokerId, token);

    const std::string origin = request.GetHeader("Origin");
    if (!origin.empty()) {
        domains.Validate("origin", origin, brokerId, token);
    }

    const std::string referer = request.GetHeader("Referer");
    if (!referer.empty()) {
        domains.Validate("referer", referer, brokerId, token);
    }

    // return_url is checked against the broker's allow-list only, without the handshake token
    auto returnUrl = request.GetQueryParam("return_url");
    if (returnUrl.has_value()) {
        domains.Validate("return_url", returnUrl.value(), brokerId);
    }

    if (!session.IsActive()) {
        session.Start(std::nullopt);
    }

    const std::string sessionId = session.GetId();
    links.Link(brokerId, token, sessionId);

    LOG_INFO("Attached broker token to session (broker={} token={} session={})", brokerId, token, sessionId);

    BrokerSession result;
    result.brokerId = brokerId;
    result.token = token;
    result.sessionId = sessionId;
    result.returnUrl = returnUrl;
    return result;
}

std::string Server::requireQueryParam(const IRequest& request, const std::string& key) const {
    auto value = request.GetQueryParam(key);
    if (!value.has_value()) {
        LOG_WARN("Missing '{}' query parameter", key);
        throw BrokerError(ErrorCategory::MissingParameter, std::string("Missing '") + key + "' query parameter");
    }
    return value.value();
}

} // namespace sso
