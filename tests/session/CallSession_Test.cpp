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
#include "common/network/sip/SIPUtils.h"
#include "common/network/RTPPacket.h"
#include "common/Log.h"
#include "common/Utils.h"
#include "softphone/dtmf/DTMF.h"
#include "softphone/session/InboundCallSession.h"
#include "softphone/session/OutboundCallSession.h"
#include "softphone/Exceptions.h"
#include "../TestUtil.h"

using namespace crypto;
using namespace network::frame;
using namespace network::sip;
using namespace network::udp;
using namespace session;
using namespace test;

#include <catch2/catch_test_macros.hpp>

TEST_CASE("CallSession", "[Call Session Test]") {
    std::string localKey = SRTPKey::generate();
    std::string peerKey = SRTPKey::generate();
    SoftphoneConfig conf = config(localKey);

    RecordingSignalingChannel channel;
    std::shared_ptr<SocketState> state = std::make_shared<SocketState>();

    SECTION("MalformedOffer_NoSocket") {
        SIPPayload noMedia = invite("call-malformed", "v=0\r\nc=IN IP4 127.0.0.1\r\n");
        REQUIRE_THROWS_AS(InboundCallSession(conf, channel, noMedia, std::unique_ptr<Socket>(new RecordingSocket(state))), MalformedOfferError);

        SIPPayload noConnection = progress("call-malformed", "v=0\r\nm=audio 4000 RTP/SAVP 0\r\n");
        REQUIRE_THROWS_AS(OutboundCallSession(conf, channel, noConnection, std::unique_ptr<Socket>(new RecordingSocket(state))), MalformedOfferError);

        REQUIRE(state->opens == 0U);
        REQUIRE(channel.subscriptionCount() == 0U);
        REQUIRE(channel.sent.empty());
    }

    SECTION("RemoteEndpoint") {
        OutboundCallSession call(conf, channel, progress("call-endpoint", offer(4002U, peerKey)), std::unique_ptr<Socket>(new RecordingSocket(state)));
        REQUIRE(call.callId() == "call-endpoint");
        REQUIRE(call.remoteIP() == "127.0.0.1");
        REQUIRE(call.remotePort() == 4002U);
        REQUIRE(call.localPeer() == "<sip:100@sip.example.com>;tag=local1");
        REQUIRE(call.remotePeer() == "<sip:200@sip.example.com>;tag=remote1");
        REQUIRE(call.state() == CallState::INITIATING);
    }

    SECTION("StartLocalServices") {
        OutboundCallSession call(conf, channel, progress("call-start", offer(4000U, peerKey)), std::unique_ptr<Socket>(new RecordingSocket(state)));
        REQUIRE(call.startLocalServices());

        REQUIRE(state->opens == 1U);
        REQUIRE(call.localPort() == 40000U);
        REQUIRE(call.state() == CallState::RINGING);
        REQUIRE(channel.subscriptionCount() == 1U);

        // hole punch is sent in the clear
        REQUIRE(state->writes.size() == 1U);
        REQUIRE(std::string(state->writes[0].begin(), state->writes[0].end()) == MEDIA_HOLE_PUNCH);
    }

    SECTION("DoubleDispose") {
        OutboundCallSession call(conf, channel, progress("call-dispose", offer(4000U, peerKey)), std::unique_ptr<Socket>(new RecordingSocket(state)));
        REQUIRE(call.startLocalServices());

        uint32_t disposed = 0U;
        call.setDisposedCallback([&]() { disposed++; });

        call.dispose();
        call.dispose();

        REQUIRE(disposed == 1U);
        REQUIRE(state->closes == 1U);
        REQUIRE(call.isDisposed());
        REQUIRE(channel.subscriptionCount() == 0U);

        // nothing is sent once disposed
        size_t writes = state->writes.size();
        REQUIRE_FALSE(call.hangup());
        call.sendDTMF('1');
        REQUIRE(call.streamAudio(std::vector<uint8_t>(320U, 0xFFU)) == nullptr);
        REQUIRE(state->writes.size() == writes);
        REQUIRE(channel.sent.empty());
    }

    SECTION("BusyHere") {
        OutboundCallSession call(conf, channel, progress("call-busy", offer(4000U, peerKey)), std::unique_ptr<Socket>(new RecordingSocket(state)));
        REQUIRE(call.startLocalServices());

        uint32_t busy = 0U, disposed = 0U;
        call.setBusyCallback([&]() { busy++; });
        call.setDisposedCallback([&]() { disposed++; });

        channel.dispatch(response("call-busy", "SIP/2.0 486 Busy Here", "1 INVITE"));
        channel.dispatch(response("call-busy", "SIP/2.0 486 Busy Here", "1 INVITE"));

        REQUIRE(busy == 1U);
        REQUIRE(disposed == 1U);
        REQUIRE(call.isDisposed());
        REQUIRE(channel.countRequests(SIP_BYE) == 0U);
    }

    SECTION("HangupDisposesOnConfirmation") {
        OutboundCallSession call(conf, channel, progress("call-hangup", offer(4000U, peerKey)), std::unique_ptr<Socket>(new RecordingSocket(state)));
        REQUIRE(call.startLocalServices());

        uint32_t disposed = 0U;
        call.setDisposedCallback([&]() { disposed++; });

        REQUIRE(call.hangup());
        REQUIRE(channel.countRequests(SIP_BYE) == 1U);

        SIPPayload& bye = channel.sent.back();
        REQUIRE(bye.uri == "sip:sip.example.com");
        REQUIRE(bye.callId() == "call-hangup");
        REQUIRE(bye.cseqMethod() == SIP_BYE);
        REQUIRE(bye.headers.find("From") == call.localPeer());
        REQUIRE(bye.headers.find("To") == call.remotePeer());
        REQUIRE(bye.headers.find("Via").find("SIP/2.0/TLS 12345.invalid;branch=" SIP_BRANCH_MAGIC_COOKIE) == 0U);

        // hangup never disposes directly
        REQUIRE_FALSE(call.isDisposed());

        channel.dispatch(response("call-hangup", "SIP/2.0 200 OK", "2 BYE"));
        REQUIRE(call.isDisposed());
        REQUIRE(disposed == 1U);
    }

    SECTION("HangupBeforeLocalServices") {
        OutboundCallSession call(conf, channel, progress("call-hangup-early", offer(4000U, peerKey)), std::unique_ptr<Socket>(new RecordingSocket(state)));

        // the BYE confirmation could never be observed without the Call-ID subscription
        REQUIRE_FALSE(call.hangup());
        REQUIRE(channel.countRequests(SIP_BYE) == 0U);
        REQUIRE_FALSE(call.isDisposed());

        REQUIRE(call.startLocalServices());
        REQUIRE(call.hangup());
        REQUIRE(channel.countRequests(SIP_BYE) == 1U);

        channel.dispatch(response("call-hangup-early", "SIP/2.0 200 OK", "2 BYE"));
        REQUIRE(call.isDisposed());
    }

    SECTION("PeerHangup") {
        OutboundCallSession call(conf, channel, progress("call-peer-bye", offer(4000U, peerKey)), std::unique_ptr<Socket>(new RecordingSocket(state)));
        REQUIRE(call.startLocalServices());

        channel.dispatch(request("call-peer-bye", SIP_BYE, "3 BYE"));

        REQUIRE(call.isDisposed());
        REQUIRE(channel.countResponses(SIPPayload::OK) == 1U);
        REQUIRE(channel.sent.back().cseqMethod() == SIP_BYE);
        REQUIRE(state->closes == 1U);
    }

    SECTION("CallIdIsolation") {
        std::shared_ptr<SocketState> otherState = std::make_shared<SocketState>();
        OutboundCallSession a(conf, channel, progress("call-a", offer(4000U, peerKey)), std::unique_ptr<Socket>(new RecordingSocket(state)));
        OutboundCallSession b(conf, channel, progress("call-b", offer(4004U, peerKey)), std::unique_ptr<Socket>(new RecordingSocket(otherState)));
        REQUIRE(a.startLocalServices());
        REQUIRE(b.startLocalServices());

        channel.dispatch(request("call-a", SIP_BYE, "3 BYE"));

        REQUIRE(a.isDisposed());
        REQUIRE_FALSE(b.isDisposed());
        REQUIRE(otherState->closes == 0U);
        REQUIRE(channel.subscriptionCount() == 1U);
    }

    SECTION("Transfer") {
        OutboundCallSession call(conf, channel, progress("call-refer", offer(4000U, peerKey)), std::unique_ptr<Socket>(new RecordingSocket(state)));
        REQUIRE(call.startLocalServices());

        REQUIRE(call.transfer("16505550100"));
        REQUIRE(channel.countRequests(SIP_REFER) == 1U);
        REQUIRE(channel.subscriptionCount() == 2U);

        SIPPayload& refer = channel.sent.back();
        REQUIRE(refer.uri == "sip:200@sip.example.com");
        REQUIRE(refer.headers.find("Refer-To") == "sip:16505550100@transfer.example.com");
        REQUIRE(refer.headers.find("Referred-By") == "<sip:100@sip.example.com>");

        channel.dispatch(request("call-refer", SIP_NOTIFY, "10 NOTIFY", "SIP/2.0 100 Trying\r\n"));
        REQUIRE(channel.countResponses(SIPPayload::OK) == 1U);
        REQUIRE(channel.subscriptionCount() == 2U);

        channel.dispatch(request("call-refer", SIP_NOTIFY, "11 NOTIFY", "SIP/2.0 200 OK\r\n"));
        REQUIRE(channel.countResponses(SIPPayload::OK) == 2U);
        REQUIRE(channel.sent.back().cseqNumber() == 11U);
        REQUIRE(channel.subscriptionCount() == 1U);

        // later NOTIFYs are ignored
        channel.dispatch(request("call-refer", SIP_NOTIFY, "12 NOTIFY", "SIP/2.0 200 OK\r\n"));
        REQUIRE(channel.countResponses(SIPPayload::OK) == 2U);
        REQUIRE_FALSE(call.isDisposed());
    }

    SECTION("TransferDroppedOnDispose") {
        OutboundCallSession call(conf, channel, progress("call-refer-dispose", offer(4000U, peerKey)), std::unique_ptr<Socket>(new RecordingSocket(state)));
        REQUIRE(call.startLocalServices());
        REQUIRE(call.transfer("16505550100"));

        call.dispose();
        REQUIRE(channel.subscriptionCount() == 0U);

        channel.dispatch(request("call-refer-dispose", SIP_NOTIFY, "10 NOTIFY", "SIP/2.0 200 OK\r\n"));
        REQUIRE(channel.countResponses(SIPPayload::OK) == 0U);
    }
}

TEST_CASE("CallSessionDTMF", "[Call Session Test]") {
    std::string localKey = SRTPKey::generate();
    std::string peerKey = SRTPKey::generate();
    SoftphoneConfig conf = config(localKey);

    RecordingSignalingChannel channel;
    std::shared_ptr<SocketState> state = std::make_shared<SocketState>();

    SECTION("InvalidCharacter") {
        OutboundCallSession call(conf, channel, progress("call-dtmf-invalid", offer(4000U, peerKey)), std::unique_ptr<Socket>(new RecordingSocket(state)));
        REQUIRE(call.startLocalServices());

        size_t writes = state->writes.size();
        REQUIRE_THROWS_AS(call.sendDTMF('A'), InvalidDTMFCharError);
        REQUIRE_THROWS_AS(call.sendDTMF('x'), InvalidDTMFCharError);
        REQUIRE(state->writes.size() == writes);
    }

    SECTION("UseBeforeReady") {
        OutboundCallSession call(conf, channel, progress("call-dtmf-nokey", offer(4000U, "")), std::unique_ptr<Socket>(new RecordingSocket(state)));
        REQUIRE(call.startLocalServices());

        size_t writes = state->writes.size();
        REQUIRE_THROWS_AS(call.sendDTMF('1'), UseBeforeReadyError);
        REQUIRE_THROWS_AS(call.streamAudio(std::vector<uint8_t>(160U, 0xFFU)), UseBeforeReadyError);
        REQUIRE(state->writes.size() == writes);

        // a key arriving later enables media
        call.setRemoteKey(peerKey);
        call.sendDTMF('1');
        REQUIRE(state->writes.size() == writes + dtmf::DTMF_BURST_LENGTH);
    }

    SECTION("BadRemoteKey") {
        REQUIRE_THROWS_AS(OutboundCallSession(conf, channel, progress("call-dtmf-badkey", offer(4000U, "c2hvcnQ=")),
            std::unique_ptr<Socket>(new RecordingSocket(state))), SRTPKeyError);
    }

    SECTION("SendBurst") {
        OutboundCallSession call(conf, channel, progress("call-dtmf-send", offer(4000U, peerKey)), std::unique_ptr<Socket>(new RecordingSocket(state)));
        REQUIRE(call.startLocalServices());
        REQUIRE(state->writes.size() == 1U);

        call.sendDTMF('#');
        REQUIRE(state->writes.size() == 1U + dtmf::DTMF_BURST_LENGTH);

        SRTPSession peer;
        REQUIRE(peerSession(peer, peerKey, localKey));

        dtmf::DTMFDecoder decoder;
        uint32_t digits = 0U;
        char digit = 0;

        RTPPacket first;
        for (size_t i = 1U; i < state->writes.size(); i++) {
            std::vector<uint8_t> clear;
            REQUIRE(peer.unprotect(state->writes[i].data(), (uint32_t)state->writes[i].size(), clear));

            RTPPacket packet;
            REQUIRE(packet.deserialize(clear.data(), (uint32_t)clear.size()));
            Utils::dump(2U, "CallSessionDTMF, Packet", clear.data(), (uint32_t)clear.size());

            if (i == 1U)
                first = packet;

            REQUIRE(packet.header.getPayloadType() == RTP_TELEPHONE_EVENT_PAYLOAD_TYPE);
            REQUIRE(packet.header.getMarker() == (i == 1U));
            REQUIRE(packet.header.getTimestamp() == first.header.getTimestamp());
            REQUIRE(packet.header.getSSRC() == first.header.getSSRC());
            REQUIRE(packet.header.getSequence() == (uint16_t)(first.header.getSequence() + (i - 1U)));

            char c = 0;
            if (decoder.decode(packet, c)) {
                digit = c;
                digits++;
            }
        }

        REQUIRE(digits == 1U);
        REQUIRE(digit == '#');
    }

    SECTION("DistinctSSRCPerKeyPress") {
        OutboundCallSession call(conf, channel, progress("call-dtmf-ssrc", offer(4000U, peerKey)), std::unique_ptr<Socket>(new RecordingSocket(state)));
        REQUIRE(call.startLocalServices());

        call.sendDTMF('1');
        call.sendDTMF('1');

        SRTPSession peer;
        REQUIRE(peerSession(peer, peerKey, localKey));

        std::vector<uint8_t> clear;
        RTPPacket a, b;
        REQUIRE(peer.unprotect(state->writes[1U].data(), (uint32_t)state->writes[1U].size(), clear));
        REQUIRE(a.deserialize(clear.data(), (uint32_t)clear.size()));
        REQUIRE(peer.unprotect(state->writes[10U].data(), (uint32_t)state->writes[10U].size(), clear));
        REQUIRE(b.deserialize(clear.data(), (uint32_t)clear.size()));

        REQUIRE(a.header.getSSRC() != b.header.getSSRC());
    }

    SECTION("ReceiveBurst") {
        OutboundCallSession call(conf, channel, progress("call-dtmf-recv", offer(4000U, peerKey)), std::unique_ptr<Socket>(new RecordingSocket(state)));
        REQUIRE(call.startLocalServices());

        uint32_t packets = 0U, rtpPackets = 0U;
        std::string digits;
        call.setDTMFPacketCallback([&](const RTPPacket&) { packets++; });
        call.setRTPPacketCallback([&](const RTPPacket&) { rtpPackets++; });
        call.setDTMFCallback([&](char c) { digits += c; });

        SRTPSession peer;
        REQUIRE(peerSession(peer, peerKey, localKey));

        std::vector<std::vector<uint8_t>> payloads = dtmf::DTMF::charToPayloads('5');
        for (size_t i = 0U; i < payloads.size(); i++) {
            RTPPacket packet;
            packet.header.setPayloadType(RTP_TELEPHONE_EVENT_PAYLOAD_TYPE);
            packet.header.setMarker(i == 0U);
            packet.header.setSequence((uint16_t)(100U + i));
            packet.header.setTimestamp(8000U);
            packet.header.setSSRC(0x1234U);
            packet.payload = payloads[i];
            state->inbound.push_back(protect(peer, packet));
        }

        call.clock(20U);

        REQUIRE(packets == dtmf::DTMF_BURST_LENGTH);
        REQUIRE(rtpPackets == dtmf::DTMF_BURST_LENGTH);
        REQUIRE(digits == "5");
    }
}

TEST_CASE("CallSessionMedia", "[Call Session Test]") {
    std::string localKey = SRTPKey::generate();
    std::string peerKey = SRTPKey::generate();
    SoftphoneConfig conf = config(localKey);

    RecordingSignalingChannel channel;
    std::shared_ptr<SocketState> state = std::make_shared<SocketState>();

    SECTION("DecryptFailureIsolation") {
        OutboundCallSession call(conf, channel, progress("call-media", offer(4000U, peerKey)), std::unique_ptr<Socket>(new RecordingSocket(state)));
        REQUIRE(call.startLocalServices());

        uint32_t audioPackets = 0U;
        size_t pcmLength = 0U;
        call.setAudioPacketCallback([&](const RTPPacket& packet) {
            audioPackets++;
            pcmLength = packet.payload.size();
        });

        SRTPSession peer;
        REQUIRE(peerSession(peer, peerKey, localKey));

        std::vector<std::vector<uint8_t>> datagrams;
        for (uint16_t i = 0U; i < 3U; i++) {
            RTPPacket packet;
            packet.header.setPayloadType(RTP_PCMU_PAYLOAD_TYPE);
            packet.header.setSequence(500U + i);
            packet.header.setTimestamp(160U * i);
            packet.header.setSSRC(0xCAFEU);
            packet.payload = std::vector<uint8_t>(160U, 0xFFU);
            datagrams.push_back(protect(peer, packet));
        }

        state->inbound.push_back(datagrams[0U]);
        state->inbound.push_back(std::vector<uint8_t>(64U, 0x5AU));
        state->inbound.push_back(datagrams[1U]);
        call.clock(20U);

        REQUIRE(audioPackets == 2U);
        REQUIRE(pcmLength == 320U);
        REQUIRE_FALSE(call.isDisposed());

        state->inbound.push_back(datagrams[2U]);
        call.clock(20U);
        REQUIRE(audioPackets == 3U);
    }

    SECTION("StreamSingleFrame") {
        OutboundCallSession call(conf, channel, progress("call-stream-one", offer(4000U, peerKey)), std::unique_ptr<Socket>(new RecordingSocket(state)));
        REQUIRE(call.startLocalServices());

        std::shared_ptr<media::AudioStreamer> streamer = call.streamAudio(std::vector<uint8_t>(160U, 0xFFU));
        REQUIRE(streamer != nullptr);
        REQUIRE(state->writes.size() == 2U);
        REQUIRE(streamer->isFinished());
        REQUIRE_FALSE(streamer->isRunning());

        call.clock(100U);
        REQUIRE(state->writes.size() == 2U);
    }

    SECTION("StreamPacing") {
        OutboundCallSession call(conf, channel, progress("call-stream-pace", offer(4000U, peerKey)), std::unique_ptr<Socket>(new RecordingSocket(state)));
        REQUIRE(call.startLocalServices());

        uint32_t finished = 0U;
        std::shared_ptr<media::AudioStreamer> streamer = call.streamAudio(std::vector<uint8_t>(400U, 0xFFU));
        streamer->setFinishedCallback([&]() { finished++; });
        REQUIRE(state->writes.size() == 2U);

        call.clock(10U);
        REQUIRE(state->writes.size() == 2U);
        call.clock(10U);
        REQUIRE(state->writes.size() == 3U);
        call.clock(20U);
        REQUIRE(state->writes.size() == 4U);

        REQUIRE(streamer->framesSent() == 3U);
        REQUIRE(streamer->isFinished());
        REQUIRE(finished == 1U);

        // the last short frame carries the remaining 80 bytes
        SRTPSession peer;
        REQUIRE(peerSession(peer, peerKey, localKey));

        uint16_t seq = 0U;
        uint32_t ts = 0U;
        for (size_t i = 1U; i < state->writes.size(); i++) {
            std::vector<uint8_t> clear;
            REQUIRE(peer.unprotect(state->writes[i].data(), (uint32_t)state->writes[i].size(), clear));

            RTPPacket packet;
            REQUIRE(packet.deserialize(clear.data(), (uint32_t)clear.size()));
            REQUIRE(packet.header.getPayloadType() == RTP_PCMU_PAYLOAD_TYPE);
            REQUIRE(packet.header.getSSRC() == streamer->getSSRC());
            REQUIRE(packet.payload.size() == ((i < 3U) ? 160U : 80U));
            if (i > 1U) {
                REQUIRE(packet.header.getSequence() == (uint16_t)(seq + 1U));
                REQUIRE(packet.header.getTimestamp() == ts + 160U);
            }

            seq = packet.header.getSequence();
            ts = packet.header.getTimestamp();
        }
    }

    SECTION("StoppedStreamIsNotRestarted") {
        OutboundCallSession call(conf, channel, progress("call-stream-restart", offer(4000U, peerKey)), std::unique_ptr<Socket>(new RecordingSocket(state)));
        REQUIRE(call.startLocalServices());

        std::shared_ptr<media::AudioStreamer> streamer = call.streamAudio(std::vector<uint8_t>(1600U, 0xFFU));
        REQUIRE(streamer->isRunning());
        REQUIRE(state->writes.size() == 2U);

        streamer->stop();
        call.clock(20U);
        REQUIRE(streamer->isStopped());

        streamer->start();
        REQUIRE_FALSE(streamer->isRunning());

        call.clock(100U);
        REQUIRE(state->writes.size() == 2U);
        REQUIRE(streamer->framesSent() == 1U);
    }

    SECTION("StoppedStreamOutlivesSession") {
        std::shared_ptr<media::AudioStreamer> streamer;
        {
            OutboundCallSession call(conf, channel, progress("call-stream-outlive", offer(4000U, peerKey)), std::unique_ptr<Socket>(new RecordingSocket(state)));
            REQUIRE(call.startLocalServices());

            streamer = call.streamAudio(std::vector<uint8_t>(1600U, 0xFFU));
            streamer->stop();
            call.clock(20U);
        }

        // the session and its transport are gone; the handle stays inert
        size_t writes = state->writes.size();
        streamer->start();
        streamer->clock(100U);
        streamer->pause();
        streamer->resume();
        REQUIRE_FALSE(streamer->isRunning());
        REQUIRE(state->writes.size() == writes);
    }

    SECTION("RunningStreamOutlivesSession") {
        std::shared_ptr<media::AudioStreamer> streamer;
        {
            OutboundCallSession call(conf, channel, progress("call-stream-running", offer(4000U, peerKey)), std::unique_ptr<Socket>(new RecordingSocket(state)));
            REQUIRE(call.startLocalServices());
            streamer = call.streamAudio(std::vector<uint8_t>(1600U, 0xFFU));
            REQUIRE(streamer->isRunning());
        }

        REQUIRE_FALSE(streamer->isRunning());

        size_t writes = state->writes.size();
        streamer->start();
        streamer->clock(100U);
        REQUIRE(state->writes.size() == writes);
    }

    SECTION("StreamStoppedOnDispose") {
        OutboundCallSession call(conf, channel, progress("call-stream-dispose", offer(4000U, peerKey)), std::unique_ptr<Socket>(new RecordingSocket(state)));
        REQUIRE(call.startLocalServices());

        std::shared_ptr<media::AudioStreamer> streamer = call.streamAudio(std::vector<uint8_t>(1600U, 0xFFU));
        REQUIRE(streamer->isRunning());

        call.dispose();
        REQUIRE_FALSE(streamer->isRunning());

        size_t writes = state->writes.size();
        streamer->clock(100U);
        call.clock(100U);
        REQUIRE(state->writes.size() == writes);
    }
}

TEST_CASE("OutboundCallSession", "[Call Session Test]") {
    std::string localKey = SRTPKey::generate();
    std::string peerKey = SRTPKey::generate();
    SoftphoneConfig conf = config(localKey);

    RecordingSignalingChannel channel;
    std::shared_ptr<SocketState> state = std::make_shared<SocketState>();

    OutboundCallSession call(conf, channel, progress("call-out", offer(4000U, peerKey)), std::unique_ptr<Socket>(new RecordingSocket(state)));
    REQUIRE(call.startLocalServices());

    uint32_t answered = 0U, disposed = 0U;
    call.setAnsweredCallback([&]() { answered++; });
    call.setDisposedCallback([&]() { disposed++; });

    SECTION("Answered") {
        SIPPayload ok = response("call-out", "SIP/2.0 200 OK", "1 INVITE", "Contact: <sip:200@10.0.0.9:5061;transport=tls>\r\n");
        channel.dispatch(ok);

        REQUIRE(call.state() == CallState::ANSWERED);
        REQUIRE(answered == 1U);
        REQUIRE(channel.countRequests(SIP_ACK) == 1U);

        SIPPayload& ack = channel.sent.back();
        REQUIRE(ack.uri == "sip:200@10.0.0.9:5061");
        REQUIRE(ack.cseqNumber() == 1U);
        REQUIRE(ack.cseqMethod() == SIP_ACK);

        // retransmitted 200 OK is acknowledged again without a second answered event
        channel.dispatch(ok);
        REQUIRE(channel.countRequests(SIP_ACK) == 2U);
        REQUIRE(answered == 1U);
    }

    SECTION("Cancel") {
        REQUIRE(call.cancel());
        REQUIRE(call.state() == CallState::CANCELED);
        REQUIRE(channel.countRequests(SIP_CANCEL) == 1U);

        SIPPayload& cancel = channel.sent.back();
        REQUIRE(cancel.cseqNumber() == 1U);
        REQUIRE(cancel.cseqMethod() == SIP_CANCEL);
        REQUIRE(cancel.headers.find("Via") == "SIP/2.0/TLS 12345.invalid;branch=z9hG4bK-0001");
        REQUIRE_FALSE(call.isDisposed());

        // a second cancel is rejected
        REQUIRE_FALSE(call.cancel());

        channel.dispatch(response("call-out", "SIP/2.0 487 Request Terminated", "1 INVITE"));
        REQUIRE(call.isDisposed());
        REQUIRE(disposed == 1U);
        REQUIRE(answered == 0U);
    }

    SECTION("AnswerCrossesCancel") {
        REQUIRE(call.cancel());
        REQUIRE(call.state() == CallState::CANCELED);

        // the 200 OK was already in flight; it is acknowledged and the dialog is torn down
        SIPPayload ok = response("call-out", "SIP/2.0 200 OK", "1 INVITE");
        channel.dispatch(ok);

        REQUIRE(channel.countRequests(SIP_ACK) == 1U);
        REQUIRE(channel.countRequests(SIP_BYE) == 1U);
        REQUIRE(channel.sent.back().cseqMethod() == SIP_BYE);
        REQUIRE(call.state() == CallState::CANCELED);
        REQUIRE(answered == 0U);
        REQUIRE_FALSE(call.isDisposed());

        // a retransmitted 200 OK is acknowledged again without a second BYE
        channel.dispatch(ok);
        REQUIRE(channel.countRequests(SIP_ACK) == 2U);
        REQUIRE(channel.countRequests(SIP_BYE) == 1U);

        channel.dispatch(response("call-out", "SIP/2.0 200 OK", "3 BYE"));
        REQUIRE(call.isDisposed());
        REQUIRE(disposed == 1U);
    }

    SECTION("CancelAfterAnswer") {
        channel.dispatch(response("call-out", "SIP/2.0 200 OK", "1 INVITE"));
        REQUIRE(call.state() == CallState::ANSWERED);

        REQUIRE_FALSE(call.cancel());
        REQUIRE(channel.countRequests(SIP_CANCEL) == 0U);
    }

    SECTION("TerminatedWithoutCancel") {
        channel.dispatch(response("call-out", "SIP/2.0 487 Request Terminated", "1 INVITE"));
        REQUIRE_FALSE(call.isDisposed());
    }
}

TEST_CASE("InboundCallSession", "[Call Session Test]") {
    std::string localKey = SRTPKey::generate();
    std::string peerKey = SRTPKey::generate();
    SoftphoneConfig conf = config(localKey);

    RecordingSignalingChannel channel;
    std::shared_ptr<SocketState> state = std::make_shared<SocketState>();

    InboundCallSession call(conf, channel, invite("call-in", offer(4010U, peerKey)), std::unique_ptr<Socket>(new RecordingSocket(state)));

    uint32_t answered = 0U, disposed = 0U;
    call.setAnsweredCallback([&]() { answered++; });
    call.setDisposedCallback([&]() { disposed++; });

    SECTION("Peers") {
        REQUIRE(call.state() == CallState::RINGING);
        REQUIRE(call.remotePeer() == "<sip:200@sip.example.com>;tag=caller1");
        REQUIRE(call.localPeer().find("<sip:100@sip.example.com>;tag=") == 0U);
        REQUIRE(state->opens == 0U);
    }

    SECTION("Answer") {
        REQUIRE(call.answer());
        REQUIRE(call.state() == CallState::ANSWERED);
        REQUIRE(answered == 1U);
        REQUIRE(state->opens == 1U);

        REQUIRE(channel.countResponses(SIPPayload::OK) == 1U);
        SIPPayload& ok = channel.sent.back();
        REQUIRE(ok.cseqNumber() == 7U);
        REQUIRE(ok.cseqMethod() == SIP_INVITE);
        REQUIRE(ok.headers.find("To") == call.localPeer());
        REQUIRE(ok.headers.find("Content-Type") == SIP_CONTENT_TYPE_SDP);
        REQUIRE(ok.content.find("c=IN IP4 127.0.0.1\r\n") != std::string::npos);
        REQUIRE(ok.content.find("m=audio 40000 RTP/SAVP 0 111 101\r\n") != std::string::npos);
        REQUIRE(ok.content.find("a=rtpmap:101 telephone-event/8000\r\n") != std::string::npos);
        REQUIRE(ok.content.find("a=crypto:1 AES_CM_128_HMAC_SHA1_80 inline:" + localKey + "\r\n") != std::string::npos);

        // a second answer is rejected
        REQUIRE_FALSE(call.answer());
        REQUIRE(channel.countResponses(SIPPayload::OK) == 1U);

        channel.dispatch(request("call-in", SIP_BYE, "8 BYE"));
        REQUIRE(call.isDisposed());
        REQUIRE(disposed == 1U);
    }

    SECTION("Decline") {
        REQUIRE(call.decline());
        REQUIRE(channel.countResponses(SIPPayload::DECLINE) == 1U);
        REQUIRE(channel.sent.back().headers.find("To") == call.localPeer());
        REQUIRE(call.isDisposed());
        REQUIRE(disposed == 1U);
        REQUIRE(answered == 0U);
        REQUIRE(channel.subscriptionCount() == 0U);
    }

    SECTION("CallerCancel") {
        channel.dispatch(request("call-in", SIP_CANCEL, "7 CANCEL"));

        REQUIRE(channel.countResponses(SIPPayload::OK) == 1U);
        REQUIRE(channel.countResponses(SIPPayload::REQUEST_TERMINATED) == 1U);
        REQUIRE(channel.sent.back().cseqMethod() == SIP_INVITE);
        REQUIRE(call.isDisposed());
        REQUIRE(disposed == 1U);
        REQUIRE_FALSE(call.answer());
    }
}
