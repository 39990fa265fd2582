// SPDX-License-Identifier: GPL-2.0-only
/*
 * Softphone - Call Session Library
 * GPLv2 Open Source. Use is subject to license terms.
 * DO NOT ALTER OR REMOVE COPYRIGHT NOTICES OR THIS FILE HEADER.
 *
 *  Copyright (C) 2025 Softphone Project Contributors
 *
 */
#include "Defines.h"
#include "common/crypto/SRTPSession.h"
#include "common/Log.h"
#include "session/SessionDescription.h"

using namespace session;

#include <cstdio>
#include <regex>
#include <sstream>

// ---------------------------------------------------------------------------
//  Public Class Members
// ---------------------------------------------------------------------------

/* Initializes a new instance of the SessionDescription class. */

SessionDescription::SessionDescription() :
    m_address(),
    m_port(0U),
    m_cryptoKey()
{
    /* stub */
}

// ---------------------------------------------------------------------------
//  Static Class Members
// ---------------------------------------------------------------------------

/* Parses the media parameters from SDP text. */

bool SessionDescription::parse(const std::string& sdp, SessionDescription& desc)
{
    static const std::regex connection("c=IN IP4 ([\\d.]+)");
    static const std::regex media("m=audio (\\d{1,5}) ");
    static const std::regex crypto("a=crypto:\\d+ " SRTP_CRYPTO_SUITE " inline:([A-Za-z0-9+/=]+)");

    desc = SessionDescription();

    std::smatch match;
    if (std::regex_search(sdp, match, crypto)) {
        desc.m_cryptoKey = match[1].str();
    }

    if (!std::regex_search(sdp, match, connection)) {
        LogDebug(LOG_SIP, "SDP has no IPv4 connection address");
        return false;
    }
    desc.m_address = match[1].str();

    if (!std::regex_search(sdp, match, media)) {
        LogDebug(LOG_SIP, "SDP has no audio media description");
        return false;
    }

    unsigned long port = std::stoul(match[1].str());
    if (port == 0U || port > 65535U) {
        LogDebug(LOG_SIP, "SDP audio port is out of range, port = %lu", port);
        return false;
    }
    desc.m_port = (uint16_t)port;

    return true;
}

/* Builds a SDP answer offering PCMU, Opus and telephone-event over SRTP. */

std::string SessionDescription::answer(const std::string& address, uint16_t port, const std::string& localKey,
    uint8_t telephoneEventPT, uint32_t sessionId)
{
    std::stringstream ss;
    ss << "v=0\r\n";
    ss << "o=- " << sessionId << " 0 IN IP4 " << address << "\r\n";
    ss << "s=" << __EXE_NAME__ << "\r\n";
    ss << "c=IN IP4 " << address << "\r\n";
    ss << "t=0 0\r\n";
    ss << "m=audio " << port << " RTP/SAVP 0 " << (uint32_t)SDP_OPUS_PAYLOAD_TYPE << " " << (uint32_t)telephoneEventPT << "\r\n";
    ss << "a=rtpmap:0 PCMU/8000\r\n";
    ss << "a=rtpmap:" << (uint32_t)SDP_OPUS_PAYLOAD_TYPE << " OPUS/48000/2\r\n";
    ss << "a=rtpmap:" << (uint32_t)telephoneEventPT << " telephone-event/8000\r\n";
    ss << "a=fmtp:" << (uint32_t)telephoneEventPT << " 0-15\r\n";
    ss << "a=sendrecv\r\n";
    ss << "a=rtcp-mux\r\n";
    ss << "a=crypto:1 " << SRTP_CRYPTO_SUITE << " inline:" << localKey << "\r\n";

    return ss.str();
}
