//==========================================================================================================
// SPDX-License-Identifier: MIT
// Copyright (c) 2025 Vinny Parla
// File: HTTPServer.hpp
// Purpose: Coroutine-based HTTP/HTTPS front end for the SSO flows using Boost.Beast (TLS 1.3 only for HTTPS)
//==========================================================================================================

#pragma once

#include <string>
#include <future>
#include <functional>
#include <memory>

#include "sso/Server.h"
#include "sso/Session.hpp"

namespace sso {

  class HTTPServer {
  public:
    using ErrorHandler = std::function<void(const std::string&)>;

    //==========================================================================================================
    // Options
    // Purpose: Configuration for bind address/port, endpoint paths, session cookie and TLS files.
    // Fields:
    //   address: Bind address (default: 0.0.0.0)
    //   port: Listen port (default: 9443)
    //   attachPath: Browser-facing attach endpoint
    //   infoPath: Broker-facing endpoint resuming the session from a bearer credential
    //   cookieName: Name of the client session cookie
    //   scheme: "http" or "https" (TLS 1.3 only for https)
    //   certFile/keyFile: PEM files required when scheme == https
    //==========================================================================================================
    struct Options {
        std::string address{"0.0.0.0"};
        std::string port{"9443"};
        std::string attachPath{"/sso/attach"};
        std::string infoPath{"/sso/info"};
        std::string cookieName{"SSO_SESSION"};
        std::string scheme{"https"}; // "http" or "https"
        std::string certFile; // PEM (required for https)
        std::string keyFile;  // PEM (required for https)
    };

    //==========================================================================================================
    // OptionsFromUri
    // Purpose: Build Options from a listen URI:
    //            - "http://<address>:<port>" (e.g., http://127.0.0.1:0)
    //            - "https://<address>:<port>?cert=<pem>&key=<pem>"
    //          Unknown parameters are ignored. If scheme is omitted, defaults to http.
    //==========================================================================================================
    static Options OptionsFromUri(const std::string& uri);

    // server and sessions are non-owning; caller must keep them alive while the HTTP server runs.
    HTTPServer(const Options& opts, const Server& server, SessionRegistry& sessions);
    ~HTTPServer();

    //==========================================================================================================
    // Starts the server accept loop on a background I/O thread.
    // Returns:
    //   Future that becomes ready once the I/O context is running.
    //==========================================================================================================
    std::future<void> Start();

    //==========================================================================================================
    // Stops the server: closes acceptor, stops I/O context, and joins background thread.
    // Returns:
    //   Future that completes when shutdown has finished.
    //==========================================================================================================
    std::future<void> Stop();

    //==========================================================================================================
    // Sets the error handler for transport/server errors.
    // Args:
    //   handler: Callback invoked with error strings.
    //==========================================================================================================
    void SetErrorHandler(ErrorHandler handler);

private:
    class Impl;
    std::unique_ptr<Impl> pImpl;
  };

} // namespace sso
