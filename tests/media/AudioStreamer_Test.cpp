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
#include "softphone/media/AudioStreamer.h"
#include "softphone/media/MediaTransport.h"
#include "softphone/Exceptions.h"
#include "common/Log.h"
#include "../TestUtil.h"

using namespace media;
using namespace network::frame;

#include <catch2/catch_test_macros.hpp>

TEST_CASE("AudioStreamer", "[Media Test]") {
    std::string localKey = crypto::SRTPKey::generate();
    std::string remoteKey = crypto::SRTPKey::generate();

    auto state = std::make_shared<test::SocketState>();
    MediaTransport transport("127.0.0.1", 20000U, localKey, 101U, nullptr,
        std::unique_ptr<network::udp::Socket>(new test::RecordingSocket(state)));
    REQUIRE(transport.open());

    SECTION("NotReady_Test") {
        AudioStreamer streamer(&transport, std::vector<uint8_t>(160U, 0xFFU), RTP_PCMU_PAYLOAD_TYPE);
        REQUIRE_THROWS_AS(streamer.start(), session::UseBeforeReadyError);
        REQUIRE(state->writes.empty());
    }

    transport.setRemoteKey(remoteKey);

    crypto::SRTPSession peer;
    REQUIRE(test::peerSession(peer, remoteKey, localKey));

    SECTION("Frames_Test") {
        // 2.5 frames, the last frame is sent short
        AudioStreamer streamer(&transport, std::vector<uint8_t>(400U, 0xFFU), RTP_PCMU_PAYLOAD_TYPE);

        uint32_t finished = 0U;
        streamer.setFinishedCallback([&]() { finished++; });

        streamer.start();
        REQUIRE(state->writes.size() == 1U);

        streamer.clock(19U);
        REQUIRE(state->writes.size() == 1U);

        // a late clock catches up on every frame that came due
        streamer.clock(41U);
        REQUIRE(state->writes.size() == 3U);
        REQUIRE(streamer.isFinished());
        REQUIRE_FALSE(streamer.isRunning());
        REQUIRE(streamer.framesSent() == 3U);
        REQUIRE(finished == 1U);

        std::vector<RTPPacket> packets;
        for (auto& datagram : state->writes) {
            std::vector<uint8_t> clear;
            REQUIRE(peer.unprotect(datagram.data(), (uint32_t)datagram.size(), clear));

            RTPPacket packet;
            REQUIRE(packet.deserialize(clear.data(), (uint32_t)clear.size()));
            packets.push_back(packet);
        }

        REQUIRE(packets[0U].header.getMarker());
        REQUIRE_FALSE(packets[1U].header.getMarker());
        REQUIRE(packets[2U].payload.size() == 80U);
        for (uint32_t i = 1U; i < packets.size(); i++) {
            REQUIRE(packets[i].header.getSSRC() == packets[0U].header.getSSRC());
            REQUIRE((uint16_t)(packets[i].header.getSequence() - packets[i - 1U].header.getSequence()) == 1U);
            REQUIRE(packets[i].header.getTimestamp() - packets[i - 1U].header.getTimestamp() == 160U);
        }

        streamer.clock(100U);
        REQUIRE(state->writes.size() == 3U);
    }

    SECTION("PauseResume_Test") {
        AudioStreamer streamer(&transport, std::vector<uint8_t>(160U * 4U, 0xFFU), RTP_PCMU_PAYLOAD_TYPE);
        streamer.start();
        REQUIRE(state->writes.size() == 1U);

        streamer.pause();
        REQUIRE(streamer.isPaused());
        streamer.clock(100U);
        REQUIRE(state->writes.size() == 1U);

        streamer.resume();
        streamer.clock(20U);
        REQUIRE(state->writes.size() == 2U);

        streamer.stop();
        streamer.clock(100U);
        REQUIRE(state->writes.size() == 2U);
        REQUIRE_FALSE(streamer.isFinished());
        REQUIRE(streamer.isStopped());

        // stop is final
        streamer.start();
        streamer.clock(100U);
        REQUIRE_FALSE(streamer.isRunning());
        REQUIRE(state->writes.size() == 2U);
    }

    SECTION("Empty_Test") {
        AudioStreamer streamer(&transport, std::vector<uint8_t>(), RTP_PCMU_PAYLOAD_TYPE);

        uint32_t finished = 0U;
        streamer.setFinishedCallback([&]() { finished++; });
        streamer.start();

        REQUIRE(state->writes.empty());
        REQUIRE(streamer.isFinished());
        REQUIRE(finished == 1U);
    }

    SECTION("TransportClosed_Test") {
        AudioStreamer streamer(&transport, std::vector<uint8_t>(160U * 4U, 0xFFU), RTP_PCMU_PAYLOAD_TYPE);
        streamer.start();
        REQUIRE(state->writes.size() == 1U);

        transport.close();
        streamer.clock(20U);
        REQUIRE_FALSE(streamer.isRunning());
        REQUIRE(state->writes.size() == 1U);
    }
}
