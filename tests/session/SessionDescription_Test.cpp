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
#include "softphone/session/SessionDescription.h"
#include "common/crypto/SRTPSession.h"
#include "common/Log.h"
#include "../TestUtil.h"

using namespace session;

#include <catch2/catch_test_macros.hpp>

TEST_CASE("SessionDescription", "[Session Test]") {
    SECTION("Parse_Test") {
        std::string key = crypto::SRTPKey::generate();

        SessionDescription desc;
        REQUIRE(SessionDescription::parse(test::offer(20000U, key), desc));
        REQUIRE(desc.address() == "127.0.0.1");
        REQUIRE(desc.port() == 20000U);
        REQUIRE(desc.cryptoKey() == key);

        REQUIRE(SessionDescription::parse(test::offer(20002U, ""), desc));
        REQUIRE(desc.port() == 20002U);
        REQUIRE(desc.cryptoKey().empty());
    }

    SECTION("Parse_Missing_Test") {
        SessionDescription desc;
        REQUIRE_FALSE(SessionDescription::parse("v=0\r\nm=audio 20000 RTP/SAVP 0\r\n", desc));
        REQUIRE_FALSE(SessionDescription::parse("v=0\r\nc=IN IP4 10.0.0.1\r\n", desc));
        REQUIRE_FALSE(SessionDescription::parse("", desc));

        // video only
        REQUIRE_FALSE(SessionDescription::parse("v=0\r\nc=IN IP4 10.0.0.1\r\nm=video 20000 RTP/AVP 96\r\n", desc));
    }

    SECTION("Parse_Port_Test") {
        SessionDescription desc;
        REQUIRE_FALSE(SessionDescription::parse("c=IN IP4 10.0.0.1\r\nm=audio 0 RTP/SAVP 0\r\n", desc));
        REQUIRE_FALSE(SessionDescription::parse("c=IN IP4 10.0.0.1\r\nm=audio 70000 RTP/SAVP 0\r\n", desc));
        REQUIRE(SessionDescription::parse("c=IN IP4 10.0.0.1\r\nm=audio 65535 RTP/SAVP 0\r\n", desc));
        REQUIRE(desc.port() == 65535U);
    }

    SECTION("Answer_Test") {
        std::string key = crypto::SRTPKey::generate();
        std::string sdp = SessionDescription::answer("192.0.2.10", 40000U, key, 101U, 4242U);
        ::LogDebug("T", "Answer_Test, SDP\r\n%s", sdp.c_str());

        REQUIRE(sdp.find("o=- 4242 0 IN IP4 192.0.2.10\r\n") != std::string::npos);
        REQUIRE(sdp.find("c=IN IP4 192.0.2.10\r\n") != std::string::npos);
        REQUIRE(sdp.find("m=audio 40000 RTP/SAVP 0 111 101\r\n") != std::string::npos);
        REQUIRE(sdp.find("a=rtpmap:101 telephone-event/8000\r\n") != std::string::npos);
        REQUIRE(sdp.find("a=fmtp:101 0-15\r\n") != std::string::npos);
        REQUIRE(sdp.find("a=crypto:1 AES_CM_128_HMAC_SHA1_80 inline:" + key + "\r\n") != std::string::npos);

        // an answer is itself a parseable description
        SessionDescription desc;
        REQUIRE(SessionDescription::parse(sdp, desc));
        REQUIRE(desc.address() == "192.0.2.10");
        REQUIRE(desc.port() == 40000U);
        REQUIRE(desc.cryptoKey() == key);
    }
}
