// SPDX-License-Identifier: GPL-2.0-only
/*
 * Softphone - Common Library
 * GPLv2 Open Source. Use is subject to license terms.
 * DO NOT ALTER OR REMOVE COPYRIGHT NOTICES OR THIS FILE HEADER.
 *
 *  Copyright (C) 2023-2025 Bryan Biedenkapp, N2PLL
 *
 */
#include "Defines.h"
#include "network/RTPHeader.h"

using namespace network::frame;

// ---------------------------------------------------------------------------
//  Public Class Members
// ---------------------------------------------------------------------------

/* Initializes a new instance of the RTPHeader class. */

RTPHeader::RTPHeader() :
    m_version(RTP_VERSION),
    m_padding(false),
    m_extension(false),
    m_cc(0U),
    m_marker(false),
    m_payloadType(0U),
    m_seq(0U),
    m_timestamp(0U),
    m_ssrc(0U)
{
    /* stub */
}

/* Finalizes a instance of the RTPHeader class. */

RTPHeader::~RTPHeader() = default;

/* Decode a RTP header. */

bool RTPHeader::decode(const uint8_t* data, uint32_t length)
{
    if (data == nullptr || length < RTP_HEADER_LENGTH_BYTES)
        return false;

    // check for invalid version
    if (((data[0U] >> 6) & 0x03) != RTP_VERSION) {
        return false;
    }

    m_version = (data[0U] >> 6) & 0x03U;                                        // RTP Version
    m_padding = ((data[0U] & 0x20U) == 0x20U);                                  // Padding Flag
    m_extension = ((data[0U] & 0x10U) == 0x10U);                                // Extension Header Flag
    m_cc = (data[0U] & 0x0FU);                                                  // CSRC Count
    m_marker = ((data[1U] & 0x80U) == 0x80U);                                   // Marker Flag
    m_payloadType = (data[1U] & 0x7FU);                                         // Payload Type
    m_seq = GET_UINT16(data, 2U);                                               // Sequence

    m_timestamp = GET_UINT32(data, 4U);                                         // Timestamp
    m_ssrc = GET_UINT32(data, 8U);                                              // Synchronization Source ID

    return true;
}

/* Encode a RTP header. */

void RTPHeader::encode(uint8_t* data) const
{
    if (data == nullptr)
        return;

    data[0U] = (m_version << 6) +                                               // RTP Version
        (m_padding ? 0x20U : 0x00U) +                                           // Padding Flag
        (m_extension ? 0x10U : 0x00U) +                                         // Extension Header Flag
        (m_cc & 0x0FU);                                                         // CSRC Count
    data[1U] = (m_marker ? 0x80U : 0x00U) +                                     // Marker Flag
        (m_payloadType & 0x7FU);                                                // Payload Type
    SET_UINT16(m_seq, data, 2U);                                                // Sequence

    SET_UINT32(m_timestamp, data, 4U);                                          // Timestamp
    SET_UINT32(m_ssrc, data, 8U);                                               // Synchronization Source Identifier
}
