// SPDX-License-Identifier: GPL-2.0-only
/*
 * Softphone - Common Library
 * GPLv2 Open Source. Use is subject to license terms.
 * DO NOT ALTER OR REMOVE COPYRIGHT NOTICES OR THIS FILE HEADER.
 *
 *  Copyright (C) 2025 Softphone Project Contributors
 *
 */
/**
 * @file RTPPacket.h
 * @ingroup network_core
 * @file RTPPacket.cpp
 * @ingroup network_core
 */
#if !defined(__RTP_PACKET_H__)
#define __RTP_PACKET_H__

#include "common/Defines.h"
#include "common/network/RTPHeader.h"

#include <vector>

namespace network
{
    namespace frame
    {
        // ---------------------------------------------------------------------------
        //  Class Declaration
        // ---------------------------------------------------------------------------

        /**
         * @brief Represents a complete RTP packet (header, contributing sources and payload).
         *
         *  Header extensions are skipped and trailing padding is stripped when a packet is
         *  deserialized; serialized packets never carry either.
         * @ingroup network_core
         */
        class SOFTPHONE_API RTPPacket {
        public:
            /**
             * @brief Initializes a new instance of the RTPPacket class.
             */
            RTPPacket();
            /**
             * @brief Initializes a new instance of the RTPPacket class.
             * @param header RTP header.
             * @param payload Payload bytes.
             */
            RTPPacket(const RTPHeader& header, const std::vector<uint8_t>& payload);

            /**
             * @brief Deserializes a RTP packet from the given buffer.
             * @param[in] data Buffer containing the RTP packet.
             * @param length Length of buffer.
             * @returns bool True, if the packet was deserialized, otherwise false.
             */
            bool deserialize(const uint8_t* data, uint32_t length);
            /**
             * @brief Serializes the RTP packet.
             * @returns std::vector<uint8_t> Serialized packet.
             */
            std::vector<uint8_t> serialize() const;

            /**
             * @brief RTP header.
             */
            RTPHeader header;
            /**
             * @brief Contributing source IDs.
             */
            std::vector<uint32_t> csrc;
            /**
             * @brief Payload bytes.
             */
            std::vector<uint8_t> payload;
        };
    } // namespace frame
} // namespace network

#endif // __RTP_PACKET_H__
