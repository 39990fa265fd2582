// SPDX-License-Identifier: GPL-2.0-only
/**
* Softphone - Test Suite
* GPLv2 Open Source. Use is subject to license terms.
* DO NOT ALTER OR REMOVE COPYRIGHT NOTICES OR THIS FILE HEADER.
*
* @package Softphone / Test Suite
* @license GPLv2 License (https://opensource.org/licenses/GPL-2.0)
*
*   Copyright (C) 2025 Softphone Project Contributors
*
*/
#include "softphone/Defines.h"
#include "softphone/SoftphoneConfig.h"
#include "softphone/Exceptions.h"
#include "common/crypto/SRTPSession.h"

#include <catch2/catch_test_macros.hpp>

TEST_CASE("SoftphoneConfig", "[Config Test]") {
    SECTION("Defaults_Test") {
        SoftphoneConfig config = SoftphoneConfig::parse("");
        REQUIRE(config.logDisplayLevel == 1U);
        REQUIRE(config.sipDomain == DEFAULT_TRANSFER_DOMAIN);
        REQUIRE(config.transferDomain == DEFAULT_TRANSFER_DOMAIN);
        REQUIRE(config.transport == "TLS");
        REQUIRE(config.userAgent == SOFTPHONE_USER_AGENT);
        REQUIRE(config.telephoneEventPT == RTP_TELEPHONE_EVENT_PAYLOAD_TYPE);
        REQUIRE(config.decoder == "opus");
        REQUIRE(config.holePunch);
        REQUIRE_FALSE(config.debug);
        REQUIRE_FALSE(config.advertisedAddress.empty());

        // generated values
        const std::string suffix = ".invalid";
        REQUIRE(config.fakeDomain.size() > suffix.size());
        REQUIRE(config.fakeDomain.compare(config.fakeDomain.size() - suffix.size(), suffix.size(), suffix) == 0);

        std::vector<uint8_t> key;
        REQUIRE(crypto::SRTPKey::decode(config.localKey, key));
    }

    SECTION("Overrides_Test") {
        std::string key = crypto::SRTPKey::generate();
        SoftphoneConfig config = SoftphoneConfig::parse(
            "log:\n"
            "  displayLevel: 2\n"
            "sip:\n"
            "  domain: pbx.example.com\n"
            "  transport: udp\n"
            "  userAgent: TestPhone/1.0\n"
            "media:\n"
            "  advertisedAddress: 192.0.2.10\n"
            "  localKey: " + key + "\n"
            "  telephoneEventPayloadType: 96\n"
            "  decoder: PCMA\n"
            "  holePunch: false\n");

        REQUIRE(config.logDisplayLevel == 2U);
        REQUIRE(config.sipDomain == "pbx.example.com");
        REQUIRE(config.transport == "UDP");
        REQUIRE(config.userAgent == "TestPhone/1.0");
        REQUIRE(config.advertisedAddress == "192.0.2.10");
        REQUIRE(config.localKey == key);
        REQUIRE(config.telephoneEventPT == 96U);
        REQUIRE(config.decoder == "pcma");
        REQUIRE_FALSE(config.holePunch);
    }

    SECTION("Invalid_Test") {
        REQUIRE_THROWS_AS(SoftphoneConfig::parse("media:\n  decoder: gsm\n"), ConfigError);
        REQUIRE_THROWS_AS(SoftphoneConfig::parse("media:\n  telephoneEventPayloadType: 8\n"), ConfigError);
        REQUIRE_THROWS_AS(SoftphoneConfig::parse("media:\n  telephoneEventPayloadType: 128\n"), ConfigError);
        REQUIRE_THROWS_AS(SoftphoneConfig::parse("media:\n  localKey: c2hvcnQ=\n"), ConfigError);
        REQUIRE_THROWS_AS(SoftphoneConfig::parse("- one\n- two\n"), ConfigError);
        REQUIRE_THROWS_AS(SoftphoneConfig::parse("sip: [unterminated\n"), ConfigError);
        REQUIRE_THROWS_AS(SoftphoneConfig::load("/nonexistent/softphone.yml"), ConfigError);
    }
}
