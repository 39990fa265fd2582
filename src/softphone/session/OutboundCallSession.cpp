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
#include "common/network/sip/SIPUtils.h"
#include "common/Log.h"
#include "session/OutboundCallSession.h"

using namespace session;
using namespace network::sip;
using namespace network::udp;

// ---------------------------------------------------------------------------
//  Public Class Members
// ---------------------------------------------------------------------------

/* Initializes a new instance of the OutboundCallSession class. */

OutboundCallSession::OutboundCallSession(const SoftphoneConfig& config, SignalingChannel& channel, const SIPPayload& progress,
    std::unique_ptr<Socket> socket) :
    CallSession(config, channel, progress, progress.headers.find("From"), progress.headers.find("To"), CallState::INITIATING, std::move(socket)),
    m_progress(progress),
    m_inviteCSeq(progress.cseqNumber()),
    m_canceledHangup(false)
{
    if (progress.isClientPayload || progress.status != SIPPayload::SESSION_PROGRESS) {
        LogDebug(LOG_CALL, "Call-ID %s, outbound session created from %s", m_callId.c_str(), progress.subject().c_str());
    }
}

/* Opens the RTP socket and starts listening for the SIP messages of this call. */

bool OutboundCallSession::startLocalServices()
{
    std::lock_guard<std::recursive_mutex> lock(m_lock);
    if (!CallSession::startLocalServices())
        return false;

    if (m_state == CallState::INITIATING)
        transition(CallState::RINGING);

    return true;
}

/* Cancels the call before it is answered (CANCEL). */

bool OutboundCallSession::cancel()
{
    std::lock_guard<std::recursive_mutex> lock(m_lock);
    if (m_state != CallState::INITIATING && m_state != CallState::RINGING) {
        LogWarning(LOG_CALL, "Call-ID %s, cannot cancel a call that is %s", m_callId.c_str(), CallStateTable::toString(m_state).c_str());
        return false;
    }

    // CANCEL must match the INVITE transaction it terminates
    SIPPayload request = buildRequest(SIP_CANCEL, "sip:" + SIPUtils::extractAddress(m_remotePeer), m_inviteCSeq);
    std::string via = m_progress.headers.find("Via");
    if (!via.empty())
        request.headers.add("Via", via);
    request.payload("");

    LogMessage(LOG_CALL, "Call-ID %s, canceling call", m_callId.c_str());
    if (!sendMessage(request))
        return false;

    transition(CallState::CANCELED);
    return true;
}

// ---------------------------------------------------------------------------
//  Protected Class Members
// ---------------------------------------------------------------------------

/* Processes a SIP message carrying the Call-ID of this session. */

void OutboundCallSession::onMessage(const SIPPayload& message)
{
    std::lock_guard<std::recursive_mutex> lock(m_lock);
    if (m_state == CallState::DISPOSED)
        return;

    if (!message.isClientPayload && message.status == SIPPayload::OK && message.cseqMethod() == SIP_INVITE) {
        std::string to = message.headers.find("To");
        if (!to.empty())
            m_remotePeer = to;

        std::string contact = message.headers.find("Contact");
        std::string uri = "sip:" + SIPUtils::extractAddress(contact.empty() ? m_remotePeer : contact);

        // every 200 OK (including retransmissions) is acknowledged
        SIPPayload ack = buildRequest(SIP_ACK, uri, message.cseqNumber());
        ack.payload("");
        sendMessage(ack);

        if (m_state == CallState::ANSWERED)
            return;

        // the answer crossed our CANCEL; no 487 follows a 2xx, so the dialog is torn down with a BYE
        if (m_state == CallState::CANCELED) {
            if (!m_canceledHangup) {
                LogMessage(LOG_CALL, "Call-ID %s, call answered after cancel, hanging up", m_callId.c_str());
                m_canceledHangup = true;
                hangup();
            }

            return;
        }

        if (transition(CallState::ANSWERED)) {
            LogMessage(LOG_CALL, "Call-ID %s, call answered, remote = %s", m_callId.c_str(), m_remotePeer.c_str());
            fireAnswered();
        }

        return;
    }

    CallSession::onMessage(message);
}
