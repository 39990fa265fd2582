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
#include "common/Log.h"
#include "dtmf/DTMF.h"
#include "Exceptions.h"

using namespace dtmf;
using namespace network::frame;

// ---------------------------------------------------------------------------
//  Constants
// ---------------------------------------------------------------------------

const char DTMF_EVENT_CHARS[] = "0123456789*#";

// ---------------------------------------------------------------------------
//  Static Class Members
// ---------------------------------------------------------------------------

/* Flag indicating whether the character is a supported DTMF digit. */

bool DTMF::isValidChar(char c)
{
    return (c >= '0' && c <= '9') || c == '*' || c == '#';
}

/* Gets the event code for a DTMF digit. */

uint8_t DTMF::eventCode(char c)
{
    if (c >= '0' && c <= '9')
        return (uint8_t)(c - '0');

    switch (c) {
    case '*':
        return 10U;
    case '#':
        return 11U;
    default:
        throw session::InvalidDTMFCharError(c);
    }
}

/* Converts a DTMF digit into the burst of telephone-event payloads representing a single key press. */

std::vector<std::vector<uint8_t>> DTMF::charToPayloads(char c)
{
    uint8_t event = eventCode(c);

    std::vector<std::vector<uint8_t>> payloads;
    payloads.reserve(DTMF_BURST_LENGTH);

    uint16_t duration = 0U;
    for (uint32_t i = 0U; i < DTMF_BURST_LENGTH; i++) {
        bool end = i >= (DTMF_BURST_LENGTH - DTMF_END_PACKETS);
        if (!end)
            duration += DTMF_DURATION_STEP;

        std::vector<uint8_t> payload(DTMF_PAYLOAD_LENGTH, 0x00U);
        payload[0U] = event;
        payload[1U] = (DTMF_DEFAULT_VOLUME & DTMF_VOLUME_MASK) | ((end) ? DTMF_END_OF_EVENT : 0x00U);
        payload[2U] = (duration >> 8) & 0xFFU;
        payload[3U] = (duration >> 0) & 0xFFU;

        payloads.push_back(payload);
    }

    return payloads;
}

/* Converts a telephone-event payload into a DTMF digit. */

bool DTMF::payloadToChar(const uint8_t* payload, uint32_t length, char& c)
{
    if (payload == nullptr || length < DTMF_PAYLOAD_LENGTH)
        return false;

    uint8_t event = payload[0U];
    if (event > DTMF_MAX_EVENT)
        return false;

    c = DTMF_EVENT_CHARS[event];
    return true;
}

/* Flag indicating whether the telephone-event payload has the end of event flag set. */

bool DTMF::isEndOfEvent(const uint8_t* payload, uint32_t length)
{
    if (payload == nullptr || length < DTMF_PAYLOAD_LENGTH)
        return false;

    return (payload[1U] & DTMF_END_OF_EVENT) == DTMF_END_OF_EVENT;
}

/* Gets the duration carried by a telephone-event payload. */

uint16_t DTMF::duration(const uint8_t* payload, uint32_t length)
{
    if (payload == nullptr || length < DTMF_PAYLOAD_LENGTH)
        return 0U;

    return (uint16_t)((payload[2U] << 8) | payload[3U]);
}

// ---------------------------------------------------------------------------
//  Public Class Members
// ---------------------------------------------------------------------------

/* Initializes a new instance of the DTMFDecoder class. */

DTMFDecoder::DTMFDecoder() :
    m_lastEvent()
{
    /* stub */
}

/* Decodes a telephone-event RTP packet. */

bool DTMFDecoder::decode(const RTPPacket& packet, char& c)
{
    const uint8_t* payload = packet.payload.data();
    uint32_t length = (uint32_t)packet.payload.size();

    if (!DTMF::isEndOfEvent(payload, length))
        return false;

    char digit = 0;
    if (!DTMF::payloadToChar(payload, length, digit)) {
        LogDebug(LOG_DTMF, "unrecognized telephone-event, event = %u", length > 0U ? payload[0U] : 0U);
        return false;
    }

    // end of event payloads are retransmitted; only the first for a given event timestamp counts
    uint32_t ssrc = packet.header.getSSRC();
    uint32_t timestamp = packet.header.getTimestamp();

    auto it = m_lastEvent.find(ssrc);
    if (it != m_lastEvent.end() && it->second == timestamp)
        return false;

    m_lastEvent[ssrc] = timestamp;
    c = digit;
    return true;
}

/* Clears the decoder state. */

void DTMFDecoder::reset()
{
    m_lastEvent.clear();
}
