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
 * @file SessionDescription.h
 * @ingroup session
 * @file SessionDescription.cpp
 * @ingroup session
 */
#if !defined(__SESSION_DESCRIPTION_H__)
#define __SESSION_DESCRIPTION_H__

#include "Defines.h"

#include <string>

namespace session
{
    // ---------------------------------------------------------------------------
    //  Constants
    // ---------------------------------------------------------------------------

    /** @brief Dynamic payload type advertised for Opus. */
    const uint8_t SDP_OPUS_PAYLOAD_TYPE = 111U;

    // ---------------------------------------------------------------------------
    //  Class Declaration
    // ---------------------------------------------------------------------------

    /**
     * @brief Represents the media parameters of a SDP offer or answer.
     * @ingroup session
     */
    class SOFTPHONE_API SessionDescription {
    public:
        /**
         * @brief Initializes a new instance of the SessionDescription class.
         */
        SessionDescription();

        /**
         * @brief Parses the media parameters from SDP text.
         * @param[in] sdp SDP text.
         * @param[out] desc Media parameters.
         * @returns bool True, if the connection address and audio port were found, otherwise false.
         */
        static bool parse(const std::string& sdp, SessionDescription& desc);

        /**
         * @brief Builds a SDP answer offering PCMU, Opus and telephone-event over SRTP.
         * @param address IP address advertised for media.
         * @param port RTP port advertised for media.
         * @param localKey Local base64 SRTP master key and salt.
         * @param telephoneEventPT Telephone-event payload type.
         * @param sessionId SDP session ID.
         * @returns std::string SDP text.
         */
        static std::string answer(const std::string& address, uint16_t port, const std::string& localKey,
            uint8_t telephoneEventPT, uint32_t sessionId);

    public:
        /**
         * @brief Connection address (c=IN IP4).
         */
        DECLARE_RO_PROPERTY_PLAIN(std::string, address);
        /**
         * @brief Audio port (m=audio).
         */
        DECLARE_RO_PROPERTY_PLAIN(uint16_t, port);
        /**
         * @brief Base64 SRTP master key and salt (a=crypto), empty if not present.
         */
        DECLARE_RO_PROPERTY_PLAIN(std::string, cryptoKey);
    };
} // namespace session

#endif // __SESSION_DESCRIPTION_H__
