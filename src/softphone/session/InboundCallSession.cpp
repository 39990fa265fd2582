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
#include "common/network/sip/MessageFilters.h"
#include "common/network/sip/SIPUtils.h"
#include "common/Log.h"
#include "common/Utils.h"
#include "session/InboundCallSession.h"
#include "session/SessionDescription.h"

using namespace session;
using namespace network::sip;
using namespace network::udp;

// ---------------------------------------------------------------------------
//  Public Class Members
// ---------------------------------------------------------------------------

/* Initializes a new instance of the InboundCallSession class. */

InboundCallSession::InboundCallSession(const SoftphoneConfig& config, SignalingChannel& channel, const SIPPayload& invite,
    std::unique_ptr<Socket> socket) :
    CallSession(config, channel, invite, taggedLocalPeer(invite), invite.headers.find("From"), CallState::RINGING, std::move(socket)),
    m_invite(invite)
{
    // a caller may cancel while the call is still ringing, before local services are started
    addSubscription(m_channel.subscribe(MessageFilters::both(MessageFilters::callId(m_callId), MessageFilters::request(SIP_CANCEL)),
        [this](const SIPPayload& message) { onCancel(message); }));
}

/* Answers the call. */

bool InboundCallSession::answer()
{
    std::lock_guard<std::recursive_mutex> lock(m_lock);
    if (m_state != CallState::RINGING) {
        LogWarning(LOG_CALL, "Call-ID %s, cannot answer a call that is %s", m_callId.c_str(), CallStateTable::toString(m_state).c_str());
        return false;
    }

    if (!startLocalServices())
        return false;

    std::string address = m_config.advertisedAddress;
    SIPPayload response = inviteResponse(SIPPayload::OK);
    response.headers.add("Contact", "<sip:" + SIPUtils::extractAddress(m_localPeer) + ">");
    response.payload(SessionDescription::answer(address, localPort(), m_config.localKey, m_config.telephoneEventPT,
        Utils::random(1U, 0x7FFFFFFFU)), SIPPayload::OK);

    if (!sendMessage(response)) {
        LogError(LOG_CALL, "Call-ID %s, failed to answer call", m_callId.c_str());
        return false;
    }

    if (transition(CallState::ANSWERED)) {
        LogMessage(LOG_CALL, "Call-ID %s, call answered, localPort = %u", m_callId.c_str(), localPort());
        fireAnswered();
    }

    return true;
}

/* Declines the call (603 Decline) and disposes the session. */

bool InboundCallSession::decline()
{
    std::lock_guard<std::recursive_mutex> lock(m_lock);
    if (m_state != CallState::RINGING) {
        LogWarning(LOG_CALL, "Call-ID %s, cannot decline a call that is %s", m_callId.c_str(), CallStateTable::toString(m_state).c_str());
        return false;
    }

    SIPPayload response = inviteResponse(SIPPayload::DECLINE);
    response.payload("", SIPPayload::DECLINE);

    LogMessage(LOG_CALL, "Call-ID %s, declining call", m_callId.c_str());
    bool ret = sendMessage(response);

    dispose();
    return ret;
}

// ---------------------------------------------------------------------------
//  Private Class Members
// ---------------------------------------------------------------------------

/* Internal helper to process a CANCEL request. */

void InboundCallSession::onCancel(const SIPPayload& message)
{
    std::lock_guard<std::recursive_mutex> lock(m_lock);
    if (m_state == CallState::DISPOSED)
        return;

    SIPPayload response = SIPPayload::responseTo(message, SIPPayload::OK);
    sendMessage(response);

    if (m_state != CallState::RINGING)
        return;

    LogMessage(LOG_CALL, "Call-ID %s, caller canceled the call", m_callId.c_str());

    SIPPayload terminated = inviteResponse(SIPPayload::REQUEST_TERMINATED);
    terminated.payload("", SIPPayload::REQUEST_TERMINATED);
    sendMessage(terminated);

    transition(CallState::CANCELED);
    dispose();
}

/* Internal helper to build a response to the INVITE. */

SIPPayload InboundCallSession::inviteResponse(SIPPayload::StatusType status)
{
    SIPPayload response = SIPPayload::responseTo(m_invite, status);
    response.headers.add("To", m_localPeer);
    return response;
}

/* Internal helper to get the local peer of an INVITE, tagged. */

std::string InboundCallSession::taggedLocalPeer(const SIPPayload& invite)
{
    std::string to = invite.headers.find("To");
    if (!SIPUtils::parameter(to, "tag").empty())
        return to;

    return to + ";tag=" + SIPUtils::tag();
}
