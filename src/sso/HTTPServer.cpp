//==========================================================================================================
// SPDX-License-Identifier: MIT
// Copyright (c) 2025 Vinny Parla
// File: src/sso/HTTPServer.cpp
// Purpose: HTTP/HTTPS front end for attach and broker-session flows using Boost.Beast (TLS 1.3 only for HTTPS)
//==========================================================================================================

#include <utility>
#include <thread>
#include <atomic>
#include <sstream>
#include <algorithm>
#include <cctype>

#include <boost/asio.hpp>
#include <boost/asio/ssl.hpp>
#include <boost/asio/co_spawn.hpp>
#include <boost/asio/detached.hpp>
#include <boost/asio/use_awaitable.hpp>
#include <boost/beast/core.hpp>
#include <boost/beast/ssl.hpp>
#include <boost/beast/http.hpp>

#include "logging/Logger.h"
#include "sso/HTTPServer.hpp"
#include "sso/Request.hpp"
#include "sso/errors/Errors.h"

#include <openssl/ssl.h>

namespace sso {
namespace net = boost::asio;
namespace ssl = boost::asio::ssl;
namespace http = boost::beast::http;
using tcp = net::ip::tcp;

namespace {
    std::string jsonEscape(const std::string& s) {
        std::string out;
        out.reserve(s.size() + 2);
        for (char c : s) {
            switch (c) {
                case '"': out += "\\\""; break;
                case '\\': out += "\\\\"; break;
                case '\n': out += "\\n"; break;
                case '\r': out += "\\r"; break;
                case '\t': out += "\\t"; break;
                default:
                    if (static_cast<unsigned char>(c) < 0x20) {
                        static const char* kHex = "0123456789abcdef";
                        out += "\\u00";
                        out.push_back(kHex[(c >> 4) & 0x0F]);
                        out.push_back(kHex[c & 0x0F]);
                    } else {
                        out.push_back(c);
                    }
            }
        }
        return out;
    }

    std::string jsonField(const std::string& key, const std::string& value) {
        return std::string("\"") + jsonEscape(key) + "\":\"" + jsonEscape(value) + "\"";
    }
}

class HTTPServer::Impl {
public:
    HTTPServer::Options opts;
    const Server& server;
    SessionRegistry& sessions;
    std::atomic<bool> running{false};

    net::io_context ioc;
    std::unique_ptr<tcp::acceptor> acceptor;
    std::unique_ptr<ssl::context> sslCtx; // present when scheme==https
    std::thread ioThread;

    HTTPServer::ErrorHandler errorHandler;

    Impl(const HTTPServer::Options& o, const Server& srv, SessionRegistry& reg)
        : opts(o), server(srv), sessions(reg) {
        if (opts.scheme == "https") {
            sslCtx = std::make_unique<ssl::context>(ssl::context::tls_server);
            // TLS 1.3 only
            ::SSL_CTX_set_min_proto_version(sslCtx->native_handle(), TLS1_3_VERSION);
            ::SSL_CTX_set_max_proto_version(sslCtx->native_handle(), TLS1_3_VERSION);
            try {
                sslCtx->use_certificate_chain_file(opts.certFile);
                sslCtx->use_private_key_file(opts.keyFile, ssl::context::file_format::pem);
            } catch (const std::exception& e) {
                LOG_ERROR("HTTPServer: failed to load certificate/key: {}", e.what());
                throw;
            }
            sslCtx->set_options(
                ssl::context::default_workarounds | ssl::context::no_sslv2 | ssl::context::no_sslv3 |
                ssl::context::no_tlsv1 | ssl::context::no_tlsv1_1 | ssl::context::no_tlsv1_2);
        }
    }

    ~Impl() {
        if (ioThread.joinable()) {
            ioc.stop();
            ioThread.join();
        }
    }

    void setError(const std::string& msg) {
        if (errorHandler) { errorHandler(msg); }
    }

    void sessionError(const char* kind, const std::exception& e) {
        if (!running.load()) {
            // Shutdown-related errors are expected once the acceptor is closed
            LOG_DEBUG("HTTPServer {} session suppressed during shutdown: {}", kind, e.what());
        } else {
            setError(std::string("HTTPServer ") + kind + " session error: " + e.what());
        }
    }

    net::awaitable<void> session_plain(tcp::socket socket) {
        try {
            boost::beast::tcp_stream stream(std::move(socket));
            boost::beast::flat_buffer buffer;
            http::request<http::string_body> req;
            co_await http::async_read(stream, buffer, req, net::use_awaitable);
            auto res = makeResponse(req);
            co_await http::async_write(stream, res, net::use_awaitable);
            // close after single request
            boost::system::error_code ec;
            stream.socket().shutdown(tcp::socket::shutdown_send, ec);
        } catch (const std::exception& e) {
            sessionError("plain", e);
        }
        co_return;
    }

    net::awaitable<void> session_tls(tcp::socket socket) {
        try {
            ssl::stream<tcp::socket> tls(std::move(socket), *sslCtx);
            co_await tls.async_handshake(ssl::stream_base::server, net::use_awaitable);
            boost::beast::flat_buffer buffer;
            http::request<http::string_body> req;
            co_await http::async_read(tls, buffer, req, net::use_awaitable);
            auto res = makeResponse(req);
            co_await http::async_write(tls, res, net::use_awaitable);
            boost::system::error_code ec;
            tls.shutdown(ec);
        } catch (const std::exception& e) {
            sessionError("TLS", e);
        }
        co_return;
    }

    static RequestData toRequestData(const http::request<http::string_body>& req) {
        RequestData data = RequestData::FromTarget(std::string(req.target()));
        for (const auto& field : req) {
            data.SetHeader(std::string(field.name_string()), std::string(field.value()));
        }
        return data;
    }

    std::string sessionCookie(const std::string& id) const {
        std::string cookie = opts.cookieName + "=" + id + "; Path=/; HttpOnly; SameSite=Lax";
        if (opts.scheme == "https") {
            cookie += "; Secure";
        }
        return cookie;
    }

    void setJson(http::response<http::string_body>& res, http::status status, const std::string& body) {
        res.result(status);
        res.set(http::field::content_type, "application/json");
        res.body() = body;
        res.prepare_payload();
    }

    void setErrorResponse(http::response<http::string_body>& res, const errors::SsoError& e) {
        setJson(res, static_cast<http::status>(e.httpStatus()),
                std::string("{") + jsonField("error", e.what()) + "," + jsonField("code", errors::categoryName(e.category())) + "}");
        if (e.httpStatus() == 401) {
            res.set(http::field::www_authenticate, "Bearer");
        }
    }

    void handleAttach(const RequestData& request, http::response<http::string_body>& res) {
        CookieSession session(sessions, cookieValue(request.GetHeader("Cookie"), opts.cookieName));
        BrokerSession linked = server.Attach(request, session);

        if (session.IsNew()) {
            res.set(http::field::set_cookie, sessionCookie(linked.sessionId));
        }

        const std::string origin = request.GetHeader("Origin");
        if (!origin.empty()) {
            // Origin was validated against the broker's domains by Attach
            res.set(http::field::access_control_allow_origin, origin);
            res.set(http::field::access_control_allow_credentials, "true");
        }

        if (linked.returnUrl.has_value()) {
            res.result(http::status::see_other);
            res.set(http::field::location, linked.returnUrl.value());
            res.prepare_payload();
            return;
        }
        setJson(res, http::status::ok, std::string("{") + jsonField("success", "attached") + "}");
    }

    void handleInfo(const RequestData& request, http::response<http::string_body>& res) {
        CookieSession session(sessions, std::nullopt);
        BrokerSession resumed = server.StartBrokerSession(request, session);
        setJson(res, http::status::ok,
                std::string("{") + jsonField("broker", resumed.brokerId) + "," + jsonField("token", resumed.token) + "," +
                jsonField("session", resumed.sessionId) + "}");
    }

    http::response<http::string_body> makeResponse(const http::request<http::string_body>& req) {
        http::response<http::string_body> res{http::status::ok, req.version()};
        res.set(http::field::cache_control, "no-store");
        res.keep_alive(false);

        const RequestData request = toRequestData(req);
        const std::string& path = request.Path();

        if (path != opts.attachPath && path != opts.infoPath) {
            setJson(res, http::status::not_found, std::string("{\"error\":\"Not found\"}"));
            return res;
        }
        if (req.method() != http::verb::get) {
            res.set(http::field::allow, "GET");
            setJson(res, http::status::method_not_allowed, std::string("{\"error\":\"GET required\"}"));
            return res;
        }

        try {
            if (path == opts.attachPath) {
                handleAttach(request, res);
            } else {
                handleInfo(request, res);
            }
        } catch (const errors::SsoError& e) {
            setErrorResponse(res, e);
        } catch (const std::exception& e) {
            LOG_ERROR("HTTPServer: unhandled error on {}: {}", path, e.what());
            setJson(res, http::status::internal_server_error, std::string("{\"error\":\"Internal server error\"}"));
        }
        return res;
    }

    net::awaitable<void> acceptLoop() {
        try {
            // Validate port strictly: numeric and within [0, 65535]
            if (opts.port.empty()) {
                setError("HTTPServer invalid port: empty");
                co_return;
            }
            bool allDigits = std::all_of(opts.port.begin(), opts.port.end(), [](unsigned char ch){ return std::isdigit(ch) != 0; });
            if (!allDigits || opts.port.size() > 5) {
                setError(std::string("HTTPServer invalid port (non-numeric): ") + opts.port);
                co_return;
            }
            unsigned long portNum = std::stoul(opts.port);
            if (portNum > 65535ul) {
                setError(std::string("HTTPServer invalid port (out of range): ") + opts.port);
                co_return;
            }
            tcp::resolver resolver(co_await net::this_coro::executor);
            auto r = resolver.resolve(opts.address, opts.port);
            tcp::endpoint ep = *r.begin();

            acceptor = std::make_unique<tcp::acceptor>(ioc);
            acceptor->open(ep.protocol());
            acceptor->set_option(tcp::acceptor::reuse_address(true));
            acceptor->bind(ep);
            acceptor->listen();
            LOG_INFO("HTTPServer listening on {}://{}:{} (attach={} info={})",
                     opts.scheme, opts.address, opts.port, opts.attachPath, opts.infoPath);

            while (running.load()) {
                tcp::socket socket = co_await acceptor->async_accept(net::use_awaitable);
                if (opts.scheme == "https") {
                    net::co_spawn(ioc, session_tls(std::move(socket)), net::detached);
                } else {
                    net::co_spawn(ioc, session_plain(std::move(socket)), net::detached);
                }
            }
        } catch (const std::exception& e) {
            if (!running.load()) {
                // operation_aborted when the acceptor is closed
                LOG_DEBUG("HTTPServer accept suppressed during shutdown: {}", e.what());
            } else {
                setError(std::string("HTTPServer accept error: ") + e.what());
            }
        }
        co_return;
    }
};

HTTPServer::HTTPServer(const Options& opts, const Server& server, SessionRegistry& sessions)
    : pImpl(std::make_unique<Impl>(opts, server, sessions)) {}

HTTPServer::~HTTPServer() = default;

std::future<void> HTTPServer::Start() {
    std::promise<void> ready; auto fut = ready.get_future();
    pImpl->running.store(true);
    pImpl->ioThread = std::thread([this, pr = std::move(ready)]() mutable {
        try {
            net::co_spawn(pImpl->ioc, pImpl->acceptLoop(), net::detached);
            pr.set_value();
            pImpl->ioc.run();
        } catch (const std::exception& e) {
            if (pImpl->errorHandler) { pImpl->errorHandler(e.what()); }
            pr.set_value();
        }
    });
    return fut;
}

std::future<void> HTTPServer::Stop() {
    std::promise<void> done; auto fut = done.get_future();
    pImpl->running.store(false);
    if (pImpl->acceptor) {
        boost::system::error_code ec; pImpl->acceptor->close(ec);
    }
    pImpl->ioc.stop();
    if (pImpl->ioThread.joinable()) {
        pImpl->ioThread.join();
    }
    done.set_value();
    return fut;
}

void HTTPServer::SetErrorHandler(ErrorHandler handler) {
    pImpl->errorHandler = std::move(handler);
}

HTTPServer::Options HTTPServer::OptionsFromUri(const std::string& uri) {
    Options opts;
    // Default: http if scheme omitted
    opts.scheme = "http";

    std::string cfg = uri;
    // Trim leading/trailing spaces
    auto trim = [](std::string& s){
        auto notSpace = [](unsigned char c){ return !std::isspace(c); };
        s.erase(s.begin(), std::find_if(s.begin(), s.end(), notSpace));
        s.erase(std::find_if(s.rbegin(), s.rend(), notSpace).base(), s.end());
    };
    trim(cfg);

    // Detect scheme
    auto startsWith = [](const std::string& s, const char* pfx){ return s.rfind(pfx, 0) == 0; };
    if (startsWith(cfg, "http://")) {
        opts.scheme = "http";
        cfg = cfg.substr(7);
    } else if (startsWith(cfg, "https://")) {
        opts.scheme = "https";
        cfg = cfg.substr(8);
    }

    // Split query params
    std::string hostPortPath = cfg;
    std::string query;
    auto qpos = cfg.find('?');
    if (qpos != std::string::npos) {
        hostPortPath = cfg.substr(0, qpos);
        query = cfg.substr(qpos + 1);
    }

    // Strip path component if present
    std::string hostPort = hostPortPath;
    auto slash = hostPortPath.find('/');
    if (slash != std::string::npos) {
        hostPort = hostPortPath.substr(0, slash);
    }
    trim(hostPort);

    // Parse host[:port] including IPv4/IPv6 in [addr]:port form
    if (!hostPort.empty()) {
        if (hostPort.front() == '[') {
            auto rb = hostPort.find(']');
            if (rb != std::string::npos) {
                opts.address = hostPort.substr(1, rb - 1);
                if (rb + 1 < hostPort.size() && hostPort[rb + 1] == ':') {
                    opts.port = hostPort.substr(rb + 2);
                }
            }
        } else {
            auto colon = hostPort.rfind(':');
            if (colon != std::string::npos) {
                opts.address = hostPort.substr(0, colon);
                opts.port = hostPort.substr(colon + 1);
            } else {
                opts.address = hostPort;
            }
        }
        trim(opts.address);
        trim(opts.port);
        if (opts.port.empty()) opts.port = "9443"; // default
    }

    // Query parameters: cert, key
    for (const auto& kv : parseQueryString(query)) {
        if (kv.first == "cert") opts.certFile = kv.second;
        else if (kv.first == "key") opts.keyFile = kv.second;
    }

    return opts;
}

} // namespace sso
