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
 * @file InboundCallSession.h
 * @ingroup session
 * @file InboundCallSession.cpp
 * @ingroup session
 */
#if !defined(__INBOUND_CALL_SESSION_H__)
#define __INBOUND_CALL_SESSION_H__

#include "Defines.h"
#include "session/CallSession.h"

namespace session
{
    // ---------------------------------------------------------------------------
    //  Class Declaration
    // ---------------------------------------------------------------------------

    /**
     * @brief Implements a call received by the application; created from an inbound INVITE.
     * @ingroup session
     */
    class SOFTPHONE_API InboundCallSession : public CallSession {
    public:
        /**
         * @brief Initializes a new instance of the InboundCallSession class.
         * @param config Softphone configuration.
         * @param channel SIP signaling channel.
         * @param invite Inbound INVITE request.
         * @param socket RTP socket (nullptr creates a socket bound to the configured local address).
         * @throws MalformedOfferError if the SDP offer lacks the connection address or audio port.
         */
        InboundCallSession(const SoftphoneConfig& config, network::sip::SignalingChannel& channel,
            const network::sip::SIPPayload& invite, std::unique_ptr<network::udp::Socket> socket = nullptr);

        /**
         * @brief Answers the call; starts local services and sends 200 OK with the SDP answer.
         * @returns bool True, if the call was answered, otherwise false.
         */
        bool answer();
        /**
         * @brief Declines the call (603 Decline) and disposes the session.
         * @returns bool True, if the call was declined, otherwise false.
         */
        bool decline();

    private:
        network::sip::SIPPayload m_invite;

        /**
         * @brief Internal helper to process a CANCEL request.
         * @param message SIP CANCEL request.
         */
        void onCancel(const network::sip::SIPPayload& message);

        /**
         * @brief Internal helper to build a response to the INVITE.
         * @param status SIP status.
         * @returns network::sip::SIPPayload SIP response.
         */
        network::sip::SIPPayload inviteResponse(network::sip::SIPPayload::StatusType status);

        /**
         * @brief Internal helper to get the local peer of an INVITE, tagged.
         * @param invite Inbound INVITE request.
         * @returns std::string Local SIP address header value.
         */
        static std::string taggedLocalPeer(const network::sip::SIPPayload& invite);
    };
} // namespace session

#endif // __INBOUND_CALL_SESSION_H__
