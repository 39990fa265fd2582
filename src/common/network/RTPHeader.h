// SPDX-License-Identifier: GPL-2.0-only
/*
 * Softphone - Common Library
 * GPLv2 Open Source. Use is subject to license terms.
 * DO NOT ALTER OR REMOVE COPYRIGHT NOTICES OR THIS FILE HEADER.
 *
 *  Copyright (C) 2023-2025 Bryan Biedenkapp, N2PLL
 *
 */
/**
 * @defgroup network_core Networking Core
 * @brief Implementation for the core networking (RTP, SIP and sockets).
 * @ingroup common
 *
 * @file RTPHeader.h
 * @ingroup network_core
 * @file RTPHeader.cpp
 * @ingroup network_core
 */
#if !defined(__RTP_HEADER_H__)
#define __RTP_HEADER_H__

#include "common/Defines.h"

#include <string>

// ---------------------------------------------------------------------------
//  Constants
// ---------------------------------------------------------------------------

#define RTP_HEADER_LENGTH_BYTES 12
#define RTP_GENERIC_CLOCK_RATE 8000

#define RTP_VERSION 2U

#define RTP_PCMU_PAYLOAD_TYPE 0U
#define RTP_PCMA_PAYLOAD_TYPE 8U
#define RTP_TELEPHONE_EVENT_PAYLOAD_TYPE 101U

namespace network
{
    namespace frame
    {
        // ---------------------------------------------------------------------------
        //  Class Declaration
        // ---------------------------------------------------------------------------

        /**
         * @brief Represents an RTP header.
         * \code{.unparsed}
         * Byte 0               1               2               3
         * Bit  7 6 5 4 3 2 1 0 7 6 5 4 3 2 1 0 7 6 5 4 3 2 1 0 7 6 5 4 3 2 1 0
         *     +-+-+-+-+-+-+-+-+-+-+-+-+-+-+-+-+-+-+-+-+-+-+-+-+-+-+-+-+-+-+-+-+
         *     |Ver|P|E| CSRC  |M| Payload Type| Sequence                      |
         *     +-+-+-+-+-+-+-+-+-+-+-+-+-+-+-+-+-+-+-+-+-+-+-+-+-+-+-+-+-+-+-+-+
         *     | Timestamp                                                     |
         *     +-+-+-+-+-+-+-+-+-+-+-+-+-+-+-+-+-+-+-+-+-+-+-+-+-+-+-+-+-+-+-+-+
         *     | SSRC                                                          |
         *     +-+-+-+-+-+-+-+-+-+-+-+-+-+-+-+-+-+-+-+-+-+-+-+-+-+-+-+-+-+-+-+-+
         * \endcode
         * @ingroup network_core
         */
        class SOFTPHONE_API RTPHeader {
        public:
            /**
             * @brief Initializes a new instance of the RTPHeader class.
             */
            RTPHeader();
            /**
             * @brief Finalizes a instance of the RTPHeader class.
             */
            ~RTPHeader();

            /**
             * @brief Decode a RTP header.
             * @param[in] data Buffer containing RTP header to decode.
             * @param length Length of the buffer.
             * @returns bool True, if the header was decoded, otherwise false.
             */
            bool decode(const uint8_t* data, uint32_t length);
            /**
             * @brief Encode a RTP header.
             * @param[out] data Buffer to encode an RTP header.
             */
            void encode(uint8_t* data) const;

            /**
             * @brief Helper to set the CSRC count.
             * @param cc Count of contributing source IDs.
             */
            void setCSRCCount(uint8_t cc) { m_cc = cc & 0x0FU; }

        public:
            /**
             * @brief RTP Protocol Version.
             */
            DECLARE_RO_PROPERTY(uint8_t, version, Version);
            /**
             * @brief Flag indicating if the packet has trailing padding.
             */
            DECLARE_PROPERTY(bool, padding, Padding);
            /**
             * @brief Flag indicating the presence of an extension header.
             */
            DECLARE_PROPERTY(bool, extension, Extension);
            /**
             * @brief Count of contributing source IDs that follow the SSRC.
             */
            DECLARE_RO_PROPERTY(uint8_t, cc, CSRCCount);
            /**
             * @brief Flag indicating application-specific behavior.
             */
            DECLARE_PROPERTY(bool, marker, Marker);
            /**
             * @brief Format of the payload contained within the packet.
             */
            DECLARE_PROPERTY(uint8_t, payloadType, PayloadType);
            /**
             * @brief Sequence number for the RTP packet.
             */
            DECLARE_PROPERTY(uint16_t, seq, Sequence);
            /**
             * @brief RTP packet timestamp.
             */
            DECLARE_PROPERTY(uint32_t, timestamp, Timestamp);
            /**
             * @brief Synchronization Source ID.
             */
            DECLARE_PROPERTY(uint32_t, ssrc, SSRC);
        };
    } // namespace frame
} // namespace network

#endif // __RTP_HEADER_H__
