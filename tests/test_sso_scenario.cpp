//==========================================================================================================
// SPDX-License-Identifier: MIT
// Copyright (c) 2025 Vinny Parla
// File: tests/test_sso_scenario.cpp
// Purpose: End-to-end single sign-on handshake: browser attach followed by broker bearer requests
//==========================================================================================================

#include <gtest/gtest.h>

#include <string>

#include "sso/BrokerInfo.hpp"
#include "sso/Cache.hpp"
#include "sso/Request.hpp"
#include "sso/Server.h"
#include "sso/Session.hpp"
#include "sso/auth/BearerCredential.hpp"
#include "sso/auth/Checksum.hpp"
#include "sso/errors/Errors.h"

using namespace sso;
using sso::errors::BrokerError;
using sso::errors::ErrorCategory;

namespace {

const std::string kAttachTok1 = "a8f17365d07f4f88a78125cbb627f30521bd9edd5b31066358b0fec639f6bea7";
const std::string kBearerTok1 = "2c0f3f34a591355609613370cd3fc1951aa6a730ae39e65031c81b6455a24015";

class SsoScenarioTest : public ::testing::Test {
protected:
    void SetUp() override {
        std::string err;
        ASSERT_EQ(brokers.LoadFromString("demo:abc123:app.demo.test", err), 1) << err;
    }

    InMemoryBrokerRegistry brokers;
    InMemoryCache cache;
    SessionRegistry sessions;
    Server server{brokers, cache};
};

} // namespace

TEST_F(SsoScenarioTest, AttachThenBrokerRequestsResumeSameSession) {
    // Browser visits the attach URL with the broker's handshake token
    RequestData attach = RequestData::FromTarget("/sso/attach?broker=demo&token=tok1&checksum=" + kAttachTok1);
    attach.SetHeader("Origin", "https://app.demo.test");
    CookieSession browser(sessions, std::nullopt);
    BrokerSession attached = server.Attach(attach, browser);
    ASSERT_TRUE(browser.IsActive());
    ASSERT_TRUE(browser.IsNew());
    const std::string sessionS = attached.sessionId;
    EXPECT_EQ(sessionS, browser.GetId());

    // Every later broker request with the bearer credential lands on session S
    for (int i = 0; i < 3; ++i) {
        RequestData api;
        api.SetHeader("Authorization", "Bearer SSO-demo-tok1-" + kBearerTok1);
        CookieSession brokerSide(sessions, std::nullopt);
        BrokerSession resumed = server.StartBrokerSession(api, brokerSide);
        EXPECT_EQ(resumed.sessionId, sessionS);
        EXPECT_EQ(brokerSide.GetId(), sessionS);
        EXPECT_FALSE(brokerSide.IsNew());
    }
    EXPECT_EQ(sessions.Size(), 1u);
}

TEST_F(SsoScenarioTest, SecondBrokerJoinsExistingBrowserSession) {
    brokers.SetBroker("shop", BrokerInfo{"s3cret", {"shop.demo.test"}});

    CookieSession first(sessions, std::nullopt);
    BrokerSession a = server.Attach(RequestData::FromTarget("/sso/attach?broker=demo&token=tok1&checksum=" + kAttachTok1), first);

    // Same browser (cookie) attaches for the second broker
    CookieSession again(sessions, a.sessionId);
    ASSERT_TRUE(again.IsActive());
    const std::string shopChecksum = auth::hmacSha256Hex("s3cret", "attach:cart9");
    BrokerSession b = server.Attach(RequestData::FromTarget("/sso/attach?broker=shop&token=cart9&checksum=" + shopChecksum), again);
    EXPECT_EQ(b.sessionId, a.sessionId);

    RequestData api;
    api.SetHeader("Authorization",
                  "Bearer " + auth::renderBearerCredential("shop", "cart9", auth::hmacSha256Hex("s3cret", "bearer:cart9")));
    CookieSession shopSide(sessions, std::nullopt);
    EXPECT_EQ(server.StartBrokerSession(api, shopSide).sessionId, a.sessionId);
}

TEST_F(SsoScenarioTest, ChecksumsAreNotInterchangeableBetweenCommands) {
    // Bearer checksum used for attach
    CookieSession browser(sessions, std::nullopt);
    try {
        (void)server.Attach(RequestData::FromTarget("/sso/attach?broker=demo&token=tok1&checksum=" + kBearerTok1), browser);
        FAIL() << "expected BrokerError";
    } catch (const BrokerError& e) {
        EXPECT_EQ(e.category(), ErrorCategory::InvalidChecksum);
    }
    EXPECT_FALSE(browser.IsActive());

    // Attach checksum used in the bearer credential
    (void)server.Attach(RequestData::FromTarget("/sso/attach?broker=demo&token=tok1&checksum=" + kAttachTok1), browser);
    RequestData api;
    api.SetHeader("Authorization", "Bearer SSO-demo-tok1-" + kAttachTok1);
    CookieSession brokerSide(sessions, std::nullopt);
    try {
        (void)server.StartBrokerSession(api, brokerSide);
        FAIL() << "expected BrokerError";
    } catch (const BrokerError& e) {
        EXPECT_EQ(e.category(), ErrorCategory::InvalidChecksum);
        EXPECT_EQ(e.httpStatus(), 400);
    }
    EXPECT_FALSE(brokerSide.IsActive());
}

TEST_F(SsoScenarioTest, RotatedSecretInvalidatesOutstandingCredentials) {
    CookieSession browser(sessions, std::nullopt);
    (void)server.Attach(RequestData::FromTarget("/sso/attach?broker=demo&token=tok1&checksum=" + kAttachTok1), browser);

    brokers.SetBroker("demo", BrokerInfo{"rotated", {"app.demo.test"}});
    RequestData api;
    api.SetHeader("Authorization", "Bearer SSO-demo-tok1-" + kBearerTok1);
    CookieSession brokerSide(sessions, std::nullopt);
    EXPECT_THROW((void)server.StartBrokerSession(api, brokerSide), BrokerError);
}
