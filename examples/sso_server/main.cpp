//==========================================================================================================
// SPDX-License-Identifier: MIT
// Copyright (c) 2025 Vinny Parla
// File: main.cpp
// Purpose: SSO server example (HTTP front end over in-memory broker registry, cache and sessions)
//==========================================================================================================

#include "logging/Logger.h"
#include "sso/BrokerInfo.hpp"
#include "sso/Cache.hpp"
#include "sso/HTTPServer.hpp"
#include "sso/Server.h"
#include "sso/Session.hpp"
#include "sso/version.h"
#include <chrono>
#include <cstddef>
#include <cstdio>
#include <future>
#include <memory>
#include <optional>
#include <stdexcept>
#include <string>
#include <thread>
#include "env/EnvVars.h"

using namespace sso;

//==========================================================================================================
// Parses simple key=value style command-line options.
// Args:
//   argc: Argument count
//   argv: Argument values
//   key: Option name including leading dashes (e.g., "--listen")
// Returns:
//   Optional value string when present; empty optional otherwise
//==========================================================================================================
static std::optional<std::string> getArgValue(int argc, char** argv, const std::string& key) {
    for (std::size_t i = 1; i < static_cast<std::size_t>(argc); ++i) {
        const char* arg = argv[i];
        if (arg == nullptr) {
            continue;
        }
        std::string a = arg;
        std::size_t eq = a.find('=');
        if (eq != std::string::npos && a.substr(0, eq) == key) {
            return a.substr(eq + 1);
        }
    }
    return std::nullopt;
}

//==========================================================================================================
// Reads a non-negative number of seconds from the environment; 0 disables expiry.
//==========================================================================================================
static std::chrono::seconds secondsFromEnv(const char* name, std::chrono::seconds defaultValue) {
    std::string value = GetEnvOrDefault(name, "");
    if (value.empty()) {
        return defaultValue;
    }
    try {
        long seconds = std::stol(value);
        if (seconds >= 0) {
            return std::chrono::seconds(seconds);
        }
        LOG_WARN("Ignoring negative {}={}", name, value);
    } catch (const std::exception& e) {
        LOG_WARN("Ignoring {}={}: {}", name, value, e.what());
    }
    return defaultValue;
}

int main(int argc, char** argv) {
    FUNC_SCOPE();
    Logger::setLogLevelFromString(GetEnvOrDefault("SSO_LOG_LEVEL", "INFO"));
    {
        std::string logFile = GetEnvOrDefault("SSO_LOG_FILE", "");
        if (!logFile.empty()) {
            Logger::setLogFile(logFile);
        }
    }
    LOG_INFO("SSO server {} starting", getVersionString());

    // Broker registry: "id:secret:domain1,domain2;id2:secret2:..."
    InMemoryBrokerRegistry brokers;
    {
        std::string cfg = getArgValue(argc, argv, "--brokers").value_or(GetEnvOrDefault("SSO_BROKERS", ""));
        if (cfg.empty()) {
            LOG_WARN("No brokers configured (set SSO_BROKERS or --brokers=id:secret:domain,...)");
        } else {
            std::string err;
            int loaded = brokers.LoadFromString(cfg, err);
            if (loaded < 0) {
                LOG_ERROR("Invalid broker configuration: {}", err);
                return 2;
            }
            LOG_INFO("Loaded {} broker(s)", loaded);
        }
    }

    std::chrono::seconds sessionIdle = secondsFromEnv("SSO_SESSION_IDLE_SECONDS", std::chrono::hours(24));
    LOG_INFO("Client sessions expire after {} s idle", sessionIdle.count());

    // A link outliving its session is useless, so links share the session lifetime unless configured
    Server::Options serverOpts;
    serverOpts.linkTtl = secondsFromEnv("SSO_LINK_TTL_SECONDS", sessionIdle);
    LOG_INFO("Broker token links expire after {} s", serverOpts.linkTtl.count());

    InMemoryCache cache;
    SessionRegistry sessions(sessionIdle);
    Server server(brokers, cache, serverOpts);

    std::string listen = getArgValue(argc, argv, "--listen").value_or(GetEnvOrDefault("SSO_LISTEN", "http://127.0.0.1:9443"));
    HTTPServer::Options httpOpts = HTTPServer::OptionsFromUri(listen);
    httpOpts.cookieName = GetEnvOrDefault("SSO_COOKIE_NAME", httpOpts.cookieName);

    std::unique_ptr<HTTPServer> http;
    try {
        http = std::make_unique<HTTPServer>(httpOpts, server, sessions);
    } catch (const std::exception& e) {
        LOG_ERROR("Failed to create HTTP server: {}", e.what());
        return 1;
    }

    std::promise<void> stopped;
    http->SetErrorHandler([&stopped](const std::string& e){
        LOG_ERROR("HTTPServer error: {}", e);
        try {
            stopped.set_value();
        } catch (const std::future_error&) {
            // already stopping
        }
    });
    http->Start().get();

    // Allow pressing Enter to exit demo
    std::thread waiter([&stopped]() {
        LOG_INFO("Press ENTER to stop SSO server...");
        (void)std::getchar();
        try {
            stopped.set_value();
        } catch (const std::future_error&) {
            // already stopping
        }
    });
    stopped.get_future().wait();
    http->Stop().get();
    if (waiter.joinable()) {
        waiter.detach();
    }
    return 0;
}
