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
#include "common/crypto/SRTPSession.h"
#include "common/network/RTPPacket.h"
#include "common/Log.h"
#include "common/Utils.h"

using namespace crypto;
using namespace network::frame;

#include <catch2/catch_test_macros.hpp>

#include <type_traits>

TEST_CASE("SRTP", "[Crypto Test]") {
    SECTION("SRTP_Key_Test") {
        std::string text = SRTPKey::generate();
        REQUIRE(text.size() == 40U);
        REQUIRE(text != SRTPKey::generate());

        std::vector<uint8_t> key;
        REQUIRE(SRTPKey::decode(text, key));
        REQUIRE(key.size() == SRTP_MASTER_LEN);

        // longer keys (e.g. with MKI material) are truncated to the master key and salt
        std::vector<uint8_t> longKey(40U, 0xA5U);
        REQUIRE(SRTPKey::decode(Utils::base64Encode(longKey.data(), (uint32_t)longKey.size()), key));
        REQUIRE(key.size() == SRTP_MASTER_LEN);

        REQUIRE_FALSE(SRTPKey::decode("c2hvcnQ=", key));
        REQUIRE_FALSE(SRTPKey::decode("", key));
        REQUIRE_FALSE(SRTPKey::decode("!!!not base64!!!", key));
    }

    SECTION("SRTP_Protect_Test") {
        std::vector<uint8_t> keyA, keyB;
        REQUIRE(SRTPKey::decode(SRTPKey::generate(), keyA));
        REQUIRE(SRTPKey::decode(SRTPKey::generate(), keyB));

        SRTPSession a, b;
        REQUIRE_FALSE(a.isReady());
        REQUIRE(a.setKeys(keyA, keyB));
        REQUIRE(b.setKeys(keyB, keyA));
        REQUIRE(a.isReady());

        RTPPacket packet;
        packet.header.setPayloadType(RTP_PCMU_PAYLOAD_TYPE);
        packet.header.setSequence(1U);
        packet.header.setTimestamp(160U);
        packet.header.setSSRC(0x11223344U);
        packet.payload = std::vector<uint8_t>(160U, 0x7EU);
        std::vector<uint8_t> clear = packet.serialize();

        std::vector<uint8_t> protectedBuffer;
        REQUIRE(a.protect(clear.data(), (uint32_t)clear.size(), protectedBuffer));
        Utils::dump(2U, "SRTP_Protect_Test, Protected", protectedBuffer.data(), (uint32_t)protectedBuffer.size());

        // 80-bit authentication tag
        REQUIRE(protectedBuffer.size() == clear.size() + 10U);

        std::vector<uint8_t> decrypted;
        REQUIRE(b.unprotect(protectedBuffer.data(), (uint32_t)protectedBuffer.size(), decrypted));
        REQUIRE(decrypted == clear);

        // replayed packets are rejected
        REQUIRE_FALSE(b.unprotect(protectedBuffer.data(), (uint32_t)protectedBuffer.size(), decrypted));

        // a session holding the wrong key cannot authenticate the packet
        SRTPSession c;
        REQUIRE(c.setKeys(keyB, keyB));
        REQUIRE_FALSE(c.unprotect(protectedBuffer.data(), (uint32_t)protectedBuffer.size(), decrypted));
    }

    SECTION("SRTP_Reset_Test") {
        std::vector<uint8_t> key;
        REQUIRE(SRTPKey::decode(SRTPKey::generate(), key));

        SRTPSession a;
        REQUIRE_FALSE(a.setKeys(key, std::vector<uint8_t>(10U, 0x00U)));
        REQUIRE_FALSE(a.isReady());

        REQUIRE(a.setKeys(key, key));
        a.reset();
        REQUIRE_FALSE(a.isReady());

        std::vector<uint8_t> out;
        uint8_t data[12U] = { 0x80U };
        REQUIRE_FALSE(a.protect(data, 12U, out));
    }

    SECTION("SRTP_Ownership_Test") {
        // the session owns raw libsrtp contexts and is never copied
        STATIC_REQUIRE_FALSE(std::is_copy_constructible<SRTPSession>::value);
        STATIC_REQUIRE_FALSE(std::is_copy_assignable<SRTPSession>::value);
        STATIC_REQUIRE_FALSE(std::is_move_assignable<SRTPSession>::value);
    }
}
