// SPDX-License-Identifier: GPL-2.0-only
/*
 * Softphone - Call Session Library
 * GPLv2 Open Source. Use is subject to license terms.
 * DO NOT ALTER OR REMOVE COPYRIGHT NOTICES OR THIS FILE HEADER.
 *
 *  Copyright (C) 2025 Softphone Project Contributors
 *
 */
/**
 * @defgroup dtmf DTMF
 * @brief Implementation for RFC 4733 telephone-event (DTMF) payloads.
 * @ingroup softphone
 *
 * @file DTMF.h
 * @ingroup dtmf
 * @file DTMF.cpp
 * @ingroup dtmf
 */
#if !defined(__DTMF_H__)
#define __DTMF_H__

#include "Defines.h"
#include "common/network/RTPPacket.h"

#include <map>
#include <vector>

namespace dtmf
{
    // ---------------------------------------------------------------------------
    //  Constants
    // ---------------------------------------------------------------------------

    /** @brief Length of a telephone-event payload. */
    const uint32_t DTMF_PAYLOAD_LENGTH = 4U;
    /** @brief Number of payloads in the burst for a single key press. */
    const uint32_t DTMF_BURST_LENGTH = 9U;
    /** @brief Number of payloads in the burst carrying the end of event flag. */
    const uint32_t DTMF_END_PACKETS = 3U;
    /** @brief Duration step (timestamp units) between payloads of a burst. */
    const uint16_t DTMF_DURATION_STEP = 160U;
    /** @brief Default event volume (-dBm0). */
    const uint8_t DTMF_DEFAULT_VOLUME = 10U;

    /** @brief Highest event code for a keypad digit. */
    const uint8_t DTMF_MAX_EVENT = 11U;

    const uint8_t DTMF_END_OF_EVENT = 0x80U;
    const uint8_t DTMF_VOLUME_MASK = 0x3FU;

    // ---------------------------------------------------------------------------
    //  Class Declaration
    // ---------------------------------------------------------------------------

    /**
     * @brief Implements the mapping between keypad characters and RFC 4733 telephone-event payloads.
     * @ingroup dtmf
     *
     * Payload layout:
     * @code{.unparsed}
     * Byte 0               1               2               3
     * Bit  0 1 2 3 4 5 6 7 0 1 2 3 4 5 6 7 0 1 2 3 4 5 6 7 0 1 2 3 4 5 6 7
     *     +-+-+-+-+-+-+-+-+-+-+-+-+-+-+-+-+-+-+-+-+-+-+-+-+-+-+-+-+-+-+-+-+
     *     |     event     |E|R| volume    |          duration             |
     *     +-+-+-+-+-+-+-+-+-+-+-+-+-+-+-+-+-+-+-+-+-+-+-+-+-+-+-+-+-+-+-+-+
     * @endcode
     */
    class SOFTPHONE_API DTMF {
    public:
        /**
         * @brief Flag indicating whether the character is a supported DTMF digit (0-9, * or #).
         * @param c Character.
         * @returns bool True, if the character is supported, otherwise false.
         */
        static bool isValidChar(char c);
        /**
         * @brief Gets the event code for a DTMF digit.
         * @param c Character.
         * @returns uint8_t Event code.
         * @throws session::InvalidDTMFCharError if the character is not supported.
         */
        static uint8_t eventCode(char c);

        /**
         * @brief Converts a DTMF digit into the burst of telephone-event payloads representing a
         *  single key press. The burst consists of payloads with ascending durations followed by
         *  the retransmitted end of event payloads.
         * @param c Character.
         * @returns std::vector<std::vector<uint8_t>> Telephone-event payloads.
         * @throws session::InvalidDTMFCharError if the character is not supported.
         */
        static std::vector<std::vector<uint8_t>> charToPayloads(char c);
        /**
         * @brief Converts a telephone-event payload into a DTMF digit.
         * @param[in] payload Telephone-event payload.
         * @param[in] length Length of payload.
         * @param[out] c Character.
         * @returns bool True, if the payload carries a keypad event, otherwise false.
         */
        static bool payloadToChar(const uint8_t* payload, uint32_t length, char& c);

        /**
         * @brief Flag indicating whether the telephone-event payload has the end of event flag set.
         * @param payload Telephone-event payload.
         * @param length Length of payload.
         * @returns bool True, if the end of event flag is set, otherwise false.
         */
        static bool isEndOfEvent(const uint8_t* payload, uint32_t length);
        /**
         * @brief Gets the duration carried by a telephone-event payload.
         * @param payload Telephone-event payload.
         * @param length Length of payload.
         * @returns uint16_t Duration in timestamp units.
         */
        static uint16_t duration(const uint8_t* payload, uint32_t length);
    };

    // ---------------------------------------------------------------------------
    //  Class Declaration
    // ---------------------------------------------------------------------------

    /**
     * @brief Implements a de-duplicating telephone-event decoder for an inbound RTP stream. A key
     *  press is reported once, on the first end of event payload seen for its RTP timestamp.
     * @ingroup dtmf
     */
    class SOFTPHONE_API DTMFDecoder {
    public:
        /**
         * @brief Initializes a new instance of the DTMFDecoder class.
         */
        DTMFDecoder();

        /**
         * @brief Decodes a telephone-event RTP packet.
         * @param[in] packet RTP packet.
         * @param[out] c Character.
         * @returns bool True, if the packet completes a new key press, otherwise false.
         */
        bool decode(const network::frame::RTPPacket& packet, char& c);

        /**
         * @brief Clears the decoder state.
         */
        void reset();

    private:
        std::map<uint32_t, uint32_t> m_lastEvent;
    };
} // namespace dtmf

#endif // __DTMF_H__
