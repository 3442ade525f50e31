//==========================================================================================================
// SPDX-License-Identifier: MIT
// Copyright (c) 2025 Vinny Parla
// File: tests/test_domain_policy.cpp
// Purpose: GoogleTests for URL host extraction and broker domain allow-list validation
//==========================================================================================================

#include <gtest/gtest.h>

#include <stdexcept>
#include <string>

#include "sso/BrokerInfo.hpp"
#include "sso/auth/DomainPolicy.hpp"
#include "sso/errors/Errors.h"

using namespace sso;
using namespace sso::auth;
using sso::errors::BrokerError;
using sso::errors::ErrorCategory;
using sso::errors::ServerError;

namespace {

class ThrowingProvider : public IBrokerInfoProvider {
public:
    std::optional<BrokerInfo> GetBrokerInfo(const std::string& brokerId) override {
        (void)brokerId;
        throw std::runtime_error("registry offline");
    }
};

} // namespace

TEST(UrlHost, ExtractsHostFromAbsoluteUrls) {
    EXPECT_EQ(urlHost("https://app.demo.test").value_or(""), std::string("app.demo.test"));
    EXPECT_EQ(urlHost("https://app.demo.test/").value_or(""), std::string("app.demo.test"));
    EXPECT_EQ(urlHost("https://app.demo.test:8443/path?q=1#f").value_or(""), std::string("app.demo.test"));
    EXPECT_EQ(urlHost("http://user:pw@app.demo.test/x").value_or(""), std::string("app.demo.test"));
    EXPECT_EQ(urlHost("http://app.demo.test?x=1").value_or(""), std::string("app.demo.test"));
    EXPECT_EQ(urlHost("//app.demo.test/path").value_or(""), std::string("app.demo.test"));
    EXPECT_EQ(urlHost("http://[::1]:8080/").value_or(""), std::string("[::1]"));
}

TEST(UrlHost, PreservesCase) {
    EXPECT_EQ(urlHost("https://App.Demo.Test/").value_or(""), std::string("App.Demo.Test"));
}

TEST(UrlHost, NoAuthorityYieldsNoHost) {
    EXPECT_FALSE(urlHost("").has_value());
    EXPECT_FALSE(urlHost("app.demo.test").has_value());
    EXPECT_FALSE(urlHost("/relative/path").has_value());
    EXPECT_FALSE(urlHost("https://").has_value());
    EXPECT_FALSE(urlHost("://app.demo.test").has_value());
    EXPECT_FALSE(urlHost("1http://app.demo.test").has_value());
}

TEST(UrlHost, ControlCharactersYieldNoHost) {
    EXPECT_FALSE(urlHost("https://app.demo.test/\r\nSet-Cookie: SSO_SESSION=x").has_value());
    EXPECT_FALSE(urlHost("https://app.demo.test/\n").has_value());
    EXPECT_FALSE(urlHost(std::string("https://app.demo.test/a") + '\0' + "b").has_value());
    EXPECT_FALSE(urlHost("https://app.demo.test/\x7f").has_value());
    EXPECT_FALSE(urlHost("https://app.demo.test/\tx").has_value());
}

TEST(DomainPolicy, ExactHostMatchPasses) {
    InMemoryBrokerRegistry registry;
    registry.SetBroker("demo", BrokerInfo{"abc123", {"other.test", "app.demo.test"}});
    DomainPolicy policy(registry);
    EXPECT_NO_THROW(policy.Validate("origin", "https://app.demo.test", "demo", std::string("tok1")));
    EXPECT_NO_THROW(policy.Validate("referer", "https://app.demo.test/page?x=1", "demo", std::string("tok1")));
    EXPECT_NO_THROW(policy.Validate("return_url", "http://other.test:8080/back", "demo"));
}

TEST(DomainPolicy, SubdomainCaseAndParentDomainsFail) {
    InMemoryBrokerRegistry registry;
    registry.SetBroker("demo", BrokerInfo{"abc123", {"app.demo.test"}});
    DomainPolicy policy(registry);
    const char* bad[] = {
        "https://sub.app.demo.test",
        "https://demo.test",
        "https://APP.demo.test",
        "https://app.demo.test.evil.example",
        "https://evil.example/?app.demo.test",
        "app.demo.test",
    };
    for (const char* url : bad) {
        try {
            policy.Validate("origin", url, "demo", std::string("tok1"));
            ADD_FAILURE() << "accepted: " << url;
        } catch (const BrokerError& e) {
            EXPECT_EQ(e.category(), ErrorCategory::DomainNotAllowed);
            EXPECT_EQ(std::string(e.what()), std::string("Domain of origin is not allowed"));
        }
    }
}

TEST(DomainPolicy, UnknownBrokerOrEmptyListFails) {
    InMemoryBrokerRegistry registry;
    registry.SetBroker("nodomains", BrokerInfo{"s", {}});
    DomainPolicy policy(registry);
    EXPECT_THROW(policy.Validate("origin", "https://app.demo.test", "nobody"), BrokerError);
    EXPECT_THROW(policy.Validate("origin", "https://app.demo.test", "nodomains"), BrokerError);
}

TEST(DomainPolicy, KindAppearsInMessage) {
    InMemoryBrokerRegistry registry;
    registry.SetBroker("demo", BrokerInfo{"abc123", {"app.demo.test"}});
    DomainPolicy policy(registry);
    try {
        policy.Validate("return_url", "https://evil.example/", "demo");
        FAIL() << "expected BrokerError";
    } catch (const BrokerError& e) {
        EXPECT_EQ(std::string(e.what()), std::string("Domain of return_url is not allowed"));
        EXPECT_FALSE(e.token().has_value());
    }
}

TEST(DomainPolicy, UrlWithControlCharactersIsNotAllowed) {
    InMemoryBrokerRegistry registry;
    registry.SetBroker("demo", BrokerInfo{"abc123", {"app.demo.test"}});
    DomainPolicy policy(registry);
    try {
        policy.Validate("return_url", "https://app.demo.test/\r\nSet-Cookie: SSO_SESSION=attacker", "demo");
        FAIL() << "expected BrokerError";
    } catch (const BrokerError& e) {
        EXPECT_EQ(e.category(), ErrorCategory::DomainNotAllowed);
        EXPECT_EQ(std::string(e.what()), std::string("Domain of return_url is not allowed"));
    }
}

TEST(DomainPolicy, ProviderFailureIsInfrastructureError) {
    ThrowingProvider provider;
    DomainPolicy policy(provider);
    try {
        policy.Validate("origin", "https://app.demo.test", "demo");
        FAIL() << "expected ServerError";
    } catch (const ServerError& e) {
        EXPECT_EQ(e.cause(), std::string("registry offline"));
        EXPECT_EQ(std::string(e.what()).find("registry offline"), std::string::npos);
    }
}
