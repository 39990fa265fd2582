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
 * @file OutboundCallSession.h
 * @ingroup session
 * @file OutboundCallSession.cpp
 * @ingroup session
 */
#if !defined(__OUTBOUND_CALL_SESSION_H__)
#define __OUTBOUND_CALL_SESSION_H__

#include "Defines.h"
#include "session/CallSession.h"

namespace session
{
    // ---------------------------------------------------------------------------
    //  Class Declaration
    // ---------------------------------------------------------------------------

    /**
     * @brief Implements a call placed by the application; created from the SDP-bearing provisional
     *  response to the application's INVITE.
     * @ingroup session
     */
    class SOFTPHONE_API OutboundCallSession : public CallSession {
    public:
        /**
         * @brief Initializes a new instance of the OutboundCallSession class.
         * @param config Softphone configuration.
         * @param channel SIP signaling channel.
         * @param progress SDP-bearing provisional response (e.g. 183 Session Progress).
         * @param socket RTP socket (nullptr creates a socket bound to the configured local address).
         * @throws MalformedOfferError if the SDP lacks the connection address or audio port.
         */
        OutboundCallSession(const SoftphoneConfig& config, network::sip::SignalingChannel& channel,
            const network::sip::SIPPayload& progress, std::unique_ptr<network::udp::Socket> socket = nullptr);

        /**
         * @brief Opens the RTP socket and starts listening for the SIP messages of this call; the
         *  call is ringing afterwards.
         * @returns bool True, if local services were started, otherwise false.
         */
        bool startLocalServices() override;

        /**
         * @brief Cancels the call before it is answered (CANCEL). The session is disposed when the
         *  INVITE is terminated.
         * @returns bool True, if the CANCEL was sent, otherwise false.
         */
        bool cancel();

    protected:
        /**
         * @brief Processes a SIP message carrying the Call-ID of this session.
         * @param message SIP message.
         */
        void onMessage(const network::sip::SIPPayload& message) override;

    private:
        network::sip::SIPPayload m_progress;
        uint32_t m_inviteCSeq;
        bool m_canceledHangup;
    };
} // namespace session

#endif // __OUTBOUND_CALL_SESSION_H__
