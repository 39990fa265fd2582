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
#include "dtmf/DTMF.h"
#include "media/AudioDecoder.h"
#include "session/CallSession.h"
#include "session/SessionDescription.h"
#include "Exceptions.h"

using namespace session;
using namespace network::frame;
using namespace network::sip;
using namespace network::udp;

#include <algorithm>
#include <atomic>
#include <chrono>

// ---------------------------------------------------------------------------
//  Public Class Members
// ---------------------------------------------------------------------------

/* Finalizes a instance of the CallSession class. */

CallSession::~CallSession()
{
    std::lock_guard<std::recursive_mutex> lock(m_lock);
    clearCallbacks();
    release();
}

/* Opens the RTP socket, sends the hole punch datagram and starts listening for the SIP messages of this call. */

bool CallSession::startLocalServices()
{
    std::lock_guard<std::recursive_mutex> lock(m_lock);
    if (m_state == CallState::DISPOSED) {
        LogWarning(LOG_CALL, "Call-ID %s, cannot start local services on a disposed session", m_callId.c_str());
        return false;
    }

    if (m_servicesStarted)
        return true;

    if (!m_transport->open())
        return false;

    m_transport->setRTPPacketCallback([this](const RTPPacket& packet) {
        auto callback = m_rtpPacketCallback;
        if (callback)
            callback(packet);
    });
    m_transport->setAudioPacketCallback([this](const RTPPacket& packet) {
        auto callback = m_audioPacketCallback;
        if (callback)
            callback(packet);
    });
    m_transport->setDTMFPacketCallback([this](const RTPPacket& packet) {
        auto callback = m_dtmfPacketCallback;
        if (callback)
            callback(packet);
    });
    m_transport->setDTMFCallback([this](char c) {
        auto callback = m_dtmfCallback;
        if (callback)
            callback(c);
    });

    if (m_config.holePunch) {
        if (!m_transport->send(std::string(MEDIA_HOLE_PUNCH))) {
            LogWarning(LOG_RTP, "Call-ID %s, failed to send hole punch datagram", m_callId.c_str());
        }
    }

    addSubscription(m_channel.subscribe(MessageFilters::callId(m_callId),
        [this](const SIPPayload& message) { onMessage(message); }));

    m_servicesStarted = true;
    LogMessage(LOG_CALL, "Call-ID %s, local services started, localPort = %u, remote = %s:%u", m_callId.c_str(),
        m_transport->getLocalPort(), m_remoteIP.c_str(), m_remotePort);
    return true;
}

/* Sets the remote SRTP master key. */

void CallSession::setRemoteKey(const std::string& remoteKey)
{
    std::lock_guard<std::recursive_mutex> lock(m_lock);
    m_transport->setRemoteKey(remoteKey);
}

/* Transfers the call (blind transfer, REFER) to the given number. */

bool CallSession::transfer(const std::string& target)
{
    std::lock_guard<std::recursive_mutex> lock(m_lock);
    if (m_state == CallState::DISPOSED) {
        LogWarning(LOG_CALL, "Call-ID %s, cannot transfer a disposed session", m_callId.c_str());
        return false;
    }

    if (target.empty()) {
        LogError(LOG_CALL, "Call-ID %s, transfer target is empty", m_callId.c_str());
        return false;
    }

    SIPPayload request = buildRequest(SIP_REFER, "sip:" + SIPUtils::extractAddress(m_remotePeer));
    request.headers.add("Refer-To", "sip:" + target + "@" + m_config.transferDomain);
    request.headers.add("Referred-By", "<sip:" + SIPUtils::extractAddress(m_localPeer) + ">");
    request.payload("");

    m_transferSubscription = m_channel.subscribe(MessageFilters::both(MessageFilters::callId(m_callId), MessageFilters::request(SIP_NOTIFY)),
        [this](const SIPPayload& message) { onTransferNotify(message); });

    LogMessage(LOG_CALL, "Call-ID %s, transferring call, target = %s@%s", m_callId.c_str(), target.c_str(), m_config.transferDomain.c_str());
    return sendMessage(request);
}

/* Hangs up the call (BYE). */

bool CallSession::hangup()
{
    std::lock_guard<std::recursive_mutex> lock(m_lock);
    if (m_state == CallState::DISPOSED) {
        LogWarning(LOG_CALL, "Call-ID %s, cannot hang up a disposed session", m_callId.c_str());
        return false;
    }

    // the confirming 200 OK is only observed through the Call-ID subscription
    if (!m_servicesStarted) {
        LogWarning(LOG_CALL, "Call-ID %s, cannot hang up before local services are started", m_callId.c_str());
        return false;
    }

    SIPPayload request = buildRequest(SIP_BYE, "sip:" + m_config.sipDomain);
    request.payload("");

    LogMessage(LOG_CALL, "Call-ID %s, hanging up", m_callId.c_str());
    return sendMessage(request);
}

/* Sends a DTMF digit as a burst of RTP telephone-event packets. */

void CallSession::sendDTMF(char c)
{
    // throws for characters outside the DTMF alphabet before anything else is checked
    uint8_t event = dtmf::DTMF::eventCode(c);

    std::lock_guard<std::recursive_mutex> lock(m_lock);
    if (m_state == CallState::DISPOSED) {
        LogWarning(LOG_DTMF, "Call-ID %s, cannot send DTMF on a disposed session", m_callId.c_str());
        return;
    }

    if (!m_transport->isReady()) {
        throw UseBeforeReadyError("cannot send DTMF before the remote SRTP key is known");
    }

    uint32_t secs = (uint32_t)std::chrono::duration_cast<std::chrono::seconds>(
        std::chrono::system_clock::now().time_since_epoch()).count();
    uint32_t ssrc = nextDTMFSSRC();

    std::vector<std::vector<uint8_t>> payloads = dtmf::DTMF::charToPayloads(c);
    for (size_t i = 0U; i < payloads.size(); i++) {
        RTPPacket packet;
        packet.header.setMarker(i == 0U);
        packet.header.setPayloadType(m_transport->telephoneEventPT());
        packet.header.setSequence((uint16_t)((secs % 65536U) + i));
        packet.header.setTimestamp(secs);
        packet.header.setSSRC(ssrc);
        packet.payload = payloads[i];

        if (!m_transport->encryptAndSend(packet)) {
            LogError(LOG_DTMF, "Call-ID %s, failed to send DTMF packet, digit = %c, packet = %u", m_callId.c_str(), c, (uint32_t)i);
            return;
        }
    }

    LogMessage(LOG_DTMF, "Call-ID %s, sent DTMF digit, digit = %c, event = %u, ssrc = %u", m_callId.c_str(), c, event, ssrc);
}

/* Streams a buffer of 8kHz MuLaw audio to the remote party. */

std::shared_ptr<media::AudioStreamer> CallSession::streamAudio(const std::vector<uint8_t>& buffer)
{
    std::lock_guard<std::recursive_mutex> lock(m_lock);
    if (m_state == CallState::DISPOSED) {
        LogWarning(LOG_AUDIO, "Call-ID %s, cannot stream audio on a disposed session", m_callId.c_str());
        return nullptr;
    }

    std::shared_ptr<media::AudioStreamer> streamer = std::make_shared<media::AudioStreamer>(m_transport.get(), buffer);
    streamer->start();

    if (streamer->isRunning())
        m_streamers.push_back(streamer);
    else
        streamer->detach();

    return streamer;
}

/* Disposes the session. */

void CallSession::dispose()
{
    std::function<void()> disposedCallback = nullptr;
    {
        std::lock_guard<std::recursive_mutex> lock(m_lock);
        if (m_state == CallState::DISPOSED)
            return;

        m_state = CallState::DISPOSED;
        LogMessage(LOG_CALL, "Call-ID %s, session disposed", m_callId.c_str());

        release();

        disposedCallback = m_disposedCallback;
        clearCallbacks();
    }

    if (disposedCallback)
        disposedCallback();
}

/* Updates the session by the passed number of milliseconds. */

void CallSession::clock(uint32_t ms)
{
    std::lock_guard<std::recursive_mutex> lock(m_lock);
    if (m_state == CallState::DISPOSED)
        return;

    m_transport->clock(ms);
    if (m_state == CallState::DISPOSED)
        return;

    std::vector<std::shared_ptr<media::AudioStreamer>> streamers = m_streamers;
    for (auto& streamer : streamers) {
        streamer->clock(ms);
    }

    // streamers that leave the session give up the transport; the caller may still hold them
    m_streamers.erase(std::remove_if(m_streamers.begin(), m_streamers.end(), [](const std::shared_ptr<media::AudioStreamer>& streamer) {
        if (streamer->isRunning())
            return false;
        streamer->detach();
        return true;
    }), m_streamers.end());
}

/* Gets the local SIP address header value. */

std::string CallSession::localPeer() const
{
    std::lock_guard<std::recursive_mutex> lock(m_lock);
    return m_localPeer;
}

/* Gets the remote SIP address header value. */

std::string CallSession::remotePeer() const
{
    std::lock_guard<std::recursive_mutex> lock(m_lock);
    return m_remotePeer;
}

/* Gets the local RTP port. */

uint16_t CallSession::localPort() const
{
    std::lock_guard<std::recursive_mutex> lock(m_lock);
    return m_transport->getLocalPort();
}

/* Gets the current call state. */

CallState::E CallSession::state() const
{
    std::lock_guard<std::recursive_mutex> lock(m_lock);
    return m_state;
}

/* Helper to set the RTP packet callback. */

void CallSession::setRTPPacketCallback(std::function<void(const RTPPacket&)>&& callback)
{
    std::lock_guard<std::recursive_mutex> lock(m_lock);
    m_rtpPacketCallback = callback;
}

/* Helper to set the audio packet callback. */

void CallSession::setAudioPacketCallback(std::function<void(const RTPPacket&)>&& callback)
{
    std::lock_guard<std::recursive_mutex> lock(m_lock);
    m_audioPacketCallback = callback;
}

/* Helper to set the DTMF packet callback. */

void CallSession::setDTMFPacketCallback(std::function<void(const RTPPacket&)>&& callback)
{
    std::lock_guard<std::recursive_mutex> lock(m_lock);
    m_dtmfPacketCallback = callback;
}

/* Helper to set the DTMF callback. */

void CallSession::setDTMFCallback(std::function<void(char)>&& callback)
{
    std::lock_guard<std::recursive_mutex> lock(m_lock);
    m_dtmfCallback = callback;
}

/* Helper to set the busy callback. */

void CallSession::setBusyCallback(std::function<void()>&& callback)
{
    std::lock_guard<std::recursive_mutex> lock(m_lock);
    m_busyCallback = callback;
}

/* Helper to set the answered callback. */

void CallSession::setAnsweredCallback(std::function<void()>&& callback)
{
    std::lock_guard<std::recursive_mutex> lock(m_lock);
    m_answeredCallback = callback;
}

/* Helper to set the disposed callback. */

void CallSession::setDisposedCallback(std::function<void()>&& callback)
{
    std::lock_guard<std::recursive_mutex> lock(m_lock);
    m_disposedCallback = callback;
}

// ---------------------------------------------------------------------------
//  Protected Class Members
// ---------------------------------------------------------------------------

/* Initializes a new instance of the CallSession class. */

CallSession::CallSession(const SoftphoneConfig& config, SignalingChannel& channel, const SIPPayload& message,
    const std::string& localPeer, const std::string& remotePeer, CallState::E initialState, std::unique_ptr<Socket> socket) :
    m_config(config),
    m_channel(channel),
    m_callId(message.callId()),
    m_localPeer(localPeer),
    m_remotePeer(remotePeer),
    m_remoteIP(),
    m_remotePort(0U),
    m_transport(nullptr),
    m_state(initialState),
    m_cseq(message.cseqNumber()),
    m_lock(),
    m_subscriptions(),
    m_transferSubscription(nullptr),
    m_streamers(),
    m_servicesStarted(false),
    m_rtpPacketCallback(nullptr),
    m_audioPacketCallback(nullptr),
    m_dtmfPacketCallback(nullptr),
    m_dtmfCallback(nullptr),
    m_busyCallback(nullptr),
    m_answeredCallback(nullptr),
    m_disposedCallback(nullptr)
{
    SessionDescription desc;
    if (!SessionDescription::parse(message.content, desc)) {
        throw MalformedOfferError("SDP of Call-ID " + m_callId + " lacks a connection address or audio port");
    }

    m_remoteIP = desc.address();
    m_remotePort = desc.port();

    if (socket == nullptr)
        socket = std::unique_ptr<Socket>(new Socket(m_config.localAddress, 0U));

    m_transport = std::unique_ptr<media::MediaTransport>(new media::MediaTransport(m_remoteIP, m_remotePort, m_config.localKey,
        m_config.telephoneEventPT, media::AudioDecoder::create(m_config.decoder), std::move(socket)));
    m_transport->setDebug(m_config.debug);

    if (!desc.cryptoKey().empty()) {
        m_transport->setRemoteKey(desc.cryptoKey());
    }
    else {
        LogWarning(LOG_SRTP, "Call-ID %s, SDP carries no SRTP key, media is held until a key is set", m_callId.c_str());
    }

    LogMessage(LOG_CALL, "Call-ID %s, session created, state = %s, remote = %s:%u", m_callId.c_str(),
        CallStateTable::toString(m_state).c_str(), m_remoteIP.c_str(), m_remotePort);
}

/* Processes a SIP message carrying the Call-ID of this session. */

void CallSession::onMessage(const SIPPayload& message)
{
    std::lock_guard<std::recursive_mutex> lock(m_lock);
    if (m_state == CallState::DISPOSED)
        return;

    if (!message.isClientPayload) {
        if (message.status == SIPPayload::BUSY_HERE) {
            LogMessage(LOG_CALL, "Call-ID %s, remote party is busy", m_callId.c_str());
            if (transition(CallState::BUSY)) {
                auto busyCallback = m_busyCallback;
                if (busyCallback)
                    busyCallback();
            }

            dispose();
            return;
        }

        if (message.status == SIPPayload::REQUEST_TERMINATED && m_state == CallState::CANCELED) {
            LogMessage(LOG_CALL, "Call-ID %s, cancel confirmed", m_callId.c_str());
            dispose();
            return;
        }
    }

    if (message.cseqMethod() == SIP_BYE) {
        if (message.isClientPayload) {
            LogMessage(LOG_CALL, "Call-ID %s, remote party hung up", m_callId.c_str());
            SIPPayload response = SIPPayload::responseTo(message, SIPPayload::OK);
            sendMessage(response);
        }
        else {
            LogMessage(LOG_CALL, "Call-ID %s, hang up confirmed, status = %u", m_callId.c_str(), (uint32_t)message.status);
        }

        dispose();
        return;
    }
}

/* Moves the session to the given state. */

bool CallSession::transition(CallState::E state)
{
    if (!CallStateTable::isLegal(m_state, state)) {
        LogDebug(LOG_CALL, "Call-ID %s, ignoring illegal state transition, %s -> %s", m_callId.c_str(),
            CallStateTable::toString(m_state).c_str(), CallStateTable::toString(state).c_str());
        return false;
    }

    LogDebug(LOG_CALL, "Call-ID %s, state %s -> %s", m_callId.c_str(),
        CallStateTable::toString(m_state).c_str(), CallStateTable::toString(state).c_str());
    m_state = state;
    return true;
}

/* Builds an in-dialog request for this session. */

SIPPayload CallSession::buildRequest(const std::string& method, const std::string& uri, uint32_t cseq)
{
    if (cseq == 0U)
        cseq = ++m_cseq;

    SIPPayload request = SIPPayload::requestPayload(method, uri);
    request.headers.add("Via", SIPUtils::via(m_config.transport, m_config.fakeDomain));
    request.headers.add("From", m_localPeer);
    request.headers.add("To", m_remotePeer);
    request.headers.add("Call-ID", m_callId);
    request.headers.add("CSeq", std::to_string(cseq) + " " + request.method);
    return request;
}

/* Sends a SIP message over the signaling channel. */

bool CallSession::sendMessage(SIPPayload& message)
{
    if (message.isClientPayload)
        message.headers.add("User-Agent", m_config.userAgent);
    else
        message.headers.add("Server", m_config.userAgent);

    if (!m_channel.send(message)) {
        LogError(LOG_SIP, "Call-ID %s, failed to send SIP message, %s", m_callId.c_str(), message.subject().c_str());
        return false;
    }

    LogDebug(LOG_SIP, "Call-ID %s, sent %s", m_callId.c_str(), message.subject().c_str());
    return true;
}

/* Registers a signaling subscription that is dropped when the session is disposed. */

void CallSession::addSubscription(std::unique_ptr<Subscription> subscription)
{
    if (subscription != nullptr)
        m_subscriptions.push_back(std::move(subscription));
}

/* Helper to fire the answered callback. */

void CallSession::fireAnswered()
{
    auto answeredCallback = m_answeredCallback;
    if (answeredCallback)
        answeredCallback();
}

// ---------------------------------------------------------------------------
//  Private Class Members
// ---------------------------------------------------------------------------

/* Internal helper to answer a transfer NOTIFY. */

void CallSession::onTransferNotify(const SIPPayload& message)
{
    std::lock_guard<std::recursive_mutex> lock(m_lock);

    SIPPayload response = SIPPayload::responseTo(message, SIPPayload::OK);
    sendMessage(response);

    // the referred call is up once the sipfrag reports a final 200
    if (::strtrim(message.content) == "SIP/2.0 200 OK") {
        LogMessage(LOG_CALL, "Call-ID %s, transfer completed", m_callId.c_str());
        if (m_transferSubscription != nullptr)
            m_transferSubscription->unsubscribe();
    }
}

/* Internal helper to release the signaling subscriptions, streamers and transport. */

void CallSession::release()
{
    for (auto& streamer : m_streamers) {
        streamer->detach();
    }
    m_streamers.clear();

    if (m_transferSubscription != nullptr) {
        m_transferSubscription->unsubscribe();
        m_transferSubscription.reset();
    }

    for (auto& subscription : m_subscriptions) {
        subscription->unsubscribe();
    }
    m_subscriptions.clear();

    if (m_transport != nullptr) {
        m_transport->clearCallbacks();
        m_transport->close();
    }
}

/* Internal helper to clear the application callbacks. */

void CallSession::clearCallbacks()
{
    m_rtpPacketCallback = nullptr;
    m_audioPacketCallback = nullptr;
    m_dtmfPacketCallback = nullptr;
    m_dtmfCallback = nullptr;
    m_busyCallback = nullptr;
    m_answeredCallback = nullptr;
    m_disposedCallback = nullptr;
}

/* Internal helper to get the next DTMF synchronization source. */

uint32_t CallSession::nextDTMFSSRC()
{
    static std::atomic<uint32_t> ssrc(Utils::random());
    return ssrc++;
}
