// SPDX-License-Identifier: GPL-2.0-only
/*
 * Softphone - Common Library
 * GPLv2 Open Source. Use is subject to license terms.
 * DO NOT ALTER OR REMOVE COPYRIGHT NOTICES OR THIS FILE HEADER.
 *
 *  Copyright (C) 2025 Softphone Project Contributors
 *
 */
#include "Defines.h"
#include "network/RTPPacket.h"
#include "Log.h"

using namespace network::frame;

#include <cstring>

// ---------------------------------------------------------------------------
//  Public Class Members
// ---------------------------------------------------------------------------

/* Initializes a new instance of the RTPPacket class. */

RTPPacket::RTPPacket() :
    header(),
    csrc(),
    payload()
{
    /* stub */
}

/* Initializes a new instance of the RTPPacket class. */

RTPPacket::RTPPacket(const RTPHeader& header, const std::vector<uint8_t>& payload) :
    header(header),
    csrc(),
    payload(payload)
{
    /* stub */
}

/* Deserializes a RTP packet from the given buffer. */

bool RTPPacket::deserialize(const uint8_t* data, uint32_t length)
{
    if (!header.decode(data, length)) {
        LogDebugEx(LOG_RTP, "RTPPacket::deserialize()", "invalid RTP header, len = %u", length);
        return false;
    }

    uint32_t offset = RTP_HEADER_LENGTH_BYTES;

    csrc.clear();
    uint32_t csrcLen = header.getCSRCCount() * 4U;
    if (offset + csrcLen > length) {
        LogDebugEx(LOG_RTP, "RTPPacket::deserialize()", "truncated CSRC list, cc = %u, len = %u", header.getCSRCCount(), length);
        return false;
    }

    for (uint8_t i = 0U; i < header.getCSRCCount(); i++) {
        uint32_t id = GET_UINT32(data, offset);
        csrc.push_back(id);
        offset += 4U;
    }

    // skip the header extension (16-bit profile, 16-bit length in 32-bit words)
    if (header.getExtension()) {
        if (offset + 4U > length) {
            LogDebugEx(LOG_RTP, "RTPPacket::deserialize()", "truncated extension header, len = %u", length);
            return false;
        }

        uint16_t extLen = GET_UINT16(data, offset + 2U);
        offset += 4U + (extLen * 4U);
        if (offset > length) {
            LogDebugEx(LOG_RTP, "RTPPacket::deserialize()", "truncated extension, extLen = %u, len = %u", extLen, length);
            return false;
        }
    }

    uint32_t end = length;
    if (header.getPadding()) {
        uint8_t padLen = data[length - 1U];
        if (padLen == 0U || offset + padLen > length) {
            LogDebugEx(LOG_RTP, "RTPPacket::deserialize()", "invalid padding, padLen = %u, len = %u", padLen, length);
            return false;
        }

        end -= padLen;
    }

    payload = std::vector<uint8_t>(data + offset, data + end);
    return true;
}

/* Serializes the RTP packet. */

std::vector<uint8_t> RTPPacket::serialize() const
{
    RTPHeader hdr = header;
    hdr.setPadding(false);
    hdr.setExtension(false);
    hdr.setCSRCCount((uint8_t)csrc.size());

    uint32_t csrcLen = hdr.getCSRCCount() * 4U;
    std::vector<uint8_t> buffer(RTP_HEADER_LENGTH_BYTES + csrcLen + payload.size(), 0x00U);
    uint8_t* data = buffer.data();

    hdr.encode(data);

    uint32_t offset = RTP_HEADER_LENGTH_BYTES;
    for (uint8_t i = 0U; i < hdr.getCSRCCount(); i++) {
        SET_UINT32(csrc[i], data, offset);
        offset += 4U;
    }

    if (!payload.empty())
        ::memcpy(data + offset, payload.data(), payload.size());

    return buffer;
}
