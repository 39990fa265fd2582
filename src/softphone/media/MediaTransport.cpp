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
#include "common/Log.h"
#include "common/Utils.h"
#include "media/MediaTransport.h"
#include "Exceptions.h"

using namespace media;
using namespace network::frame;
using namespace network::udp;

#include <cstring>

// ---------------------------------------------------------------------------
//  Public Class Members
// ---------------------------------------------------------------------------

/* Initializes a new instance of the MediaTransport class. */

MediaTransport::MediaTransport(const std::string& remoteAddress, uint16_t remotePort, const std::string& localKey,
    uint8_t telephoneEventPT, std::unique_ptr<AudioDecoder> decoder, std::unique_ptr<Socket> socket) :
    m_remoteAddress(remoteAddress),
    m_remotePort(remotePort),
    m_remoteAddr(),
    m_remoteAddrLen(0U),
    m_localKey(localKey),
    m_telephoneEventPT(telephoneEventPT),
    m_socket(std::move(socket)),
    m_open(false),
    m_closed(false),
    m_srtp(),
    m_decoder(std::move(decoder)),
    m_pcmuDecoder(false),
    m_pcmaDecoder(true),
    m_dtmfDecoder(),
    m_debug(false),
    m_rtpPacketCallback(nullptr),
    m_dtmfPacketCallback(nullptr),
    m_dtmfCallback(nullptr),
    m_audioPacketCallback(nullptr)
{
    ::memset(&m_remoteAddr, 0x00U, sizeof(sockaddr_storage));
    if (m_socket == nullptr)
        m_socket = std::unique_ptr<Socket>(new Socket());
}

/* Finalizes a instance of the MediaTransport class. */

MediaTransport::~MediaTransport()
{
    close();
}

/* Opens the UDP socket on an ephemeral local port. */

bool MediaTransport::open()
{
    if (m_closed) {
        LogError(LOG_NET, "cannot reopen a closed media transport");
        return false;
    }

    if (m_open)
        return true;

    if (Socket::lookup(m_remoteAddress, m_remotePort, m_remoteAddr, m_remoteAddrLen) != 0) {
        LogError(LOG_NET, "could not resolve remote media endpoint, %s:%u", m_remoteAddress.c_str(), m_remotePort);
        return false;
    }

    if (!m_socket->open(m_remoteAddr.ss_family)) {
        LogError(LOG_NET, "failed to open RTP socket");
        return false;
    }

    m_open = true;
    LogMessage(LOG_NET, "RTP socket opened, localPort = %u, remote = %s:%u", getLocalPort(), m_remoteAddress.c_str(), m_remotePort);
    return true;
}

/* Closes the UDP socket. */

void MediaTransport::close()
{
    if (m_closed)
        return;

    m_closed = true;
    if (m_open) {
        m_socket->close();
        m_open = false;
    }

    m_srtp.reset();
}

/* Gets the local port the UDP socket is bound to. */

uint16_t MediaTransport::getLocalPort() const
{
    if (!m_open)
        return 0U;

    return m_socket->getLocalPort();
}

/* Sets the remote SRTP master key and (re)creates the SRTP contexts. */

void MediaTransport::setRemoteKey(const std::string& remoteKey)
{
    std::vector<uint8_t> local, remote;
    if (!crypto::SRTPKey::decode(m_localKey, local)) {
        throw session::SRTPKeyError("local SRTP key does not decode to a 30 byte master key and salt");
    }

    if (!crypto::SRTPKey::decode(remoteKey, remote)) {
        throw session::SRTPKeyError("remote SRTP key does not decode to a 30 byte master key and salt");
    }

    if (!m_srtp.setKeys(local, remote)) {
        throw session::SRTPKeyError("failed to create SRTP contexts");
    }

    m_dtmfDecoder.reset();
    LogDebug(LOG_SRTP, "SRTP contexts established, profile = $%04X", SRTP_PROFILE_AES128_CM_SHA1_80);
}

/* Sends a raw datagram to the remote RTP endpoint. */

bool MediaTransport::send(const uint8_t* data, uint32_t length)
{
    if (!m_open || m_closed)
        return false;
    if (data == nullptr || length == 0U)
        return false;

    if (m_debug)
        Utils::dump(1U, "MediaTransport::send()", data, length);

    return m_socket->write(data, length, m_remoteAddr, m_remoteAddrLen);
}

/* Sends a raw datagram to the remote RTP endpoint. */

bool MediaTransport::send(const std::string& data)
{
    return send(reinterpret_cast<const uint8_t*>(data.data()), (uint32_t)data.size());
}

/* Serializes, protects and sends an RTP packet. */

bool MediaTransport::encryptAndSend(const RTPPacket& packet)
{
    if (!m_srtp.isReady()) {
        throw session::UseBeforeReadyError("cannot send media before the remote SRTP key is known");
    }

    if (!m_open || m_closed)
        return false;

    std::vector<uint8_t> buffer = packet.serialize();

    std::vector<uint8_t> protectedBuffer;
    if (!m_srtp.protect(buffer.data(), (uint32_t)buffer.size(), protectedBuffer))
        return false;

    return send(protectedBuffer.data(), (uint32_t)protectedBuffer.size());
}

/* Processes an inbound SRTP datagram. */

void MediaTransport::onDatagram(const uint8_t* data, uint32_t length)
{
    if (m_closed || data == nullptr || length == 0U)
        return;

    if (m_debug)
        Utils::dump(1U, "MediaTransport::onDatagram()", data, length);

    if (!m_srtp.isReady()) {
        LogWarning(LOG_RTP, "dropping datagram received before the remote SRTP key is known, len = %u", length);
        return;
    }

    std::vector<uint8_t> buffer;
    if (!m_srtp.unprotect(data, length, buffer)) {
        LogWarning(LOG_RTP, "dropping datagram, SRTP unprotect failed, len = %u", length);
        return;
    }

    RTPPacket packet;
    if (!packet.deserialize(buffer.data(), (uint32_t)buffer.size())) {
        LogWarning(LOG_RTP, "dropping datagram, malformed RTP packet, len = %u", (uint32_t)buffer.size());
        return;
    }

    // callbacks are copied before invocation, a handler may dispose of the session
    auto rtpPacketCallback = m_rtpPacketCallback;
    if (rtpPacketCallback)
        rtpPacketCallback(packet);
    if (m_closed)
        return;

    uint8_t pt = packet.header.getPayloadType();
    if (pt == m_telephoneEventPT) {
        auto dtmfPacketCallback = m_dtmfPacketCallback;
        if (dtmfPacketCallback)
            dtmfPacketCallback(packet);
        if (m_closed)
            return;

        char c = 0;
        if (m_dtmfDecoder.decode(packet, c)) {
            LogMessage(LOG_DTMF, "received DTMF digit, digit = %c, ssrc = %u", c, packet.header.getSSRC());

            auto dtmfCallback = m_dtmfCallback;
            if (dtmfCallback)
                dtmfCallback(c);
        }

        return;
    }

    AudioDecoder* decoder = m_decoder.get();
    if (pt == RTP_PCMU_PAYLOAD_TYPE)
        decoder = &m_pcmuDecoder;
    else if (pt == RTP_PCMA_PAYLOAD_TYPE)
        decoder = &m_pcmaDecoder;

    if (decoder == nullptr) {
        LogWarning(LOG_RTP, "dropping audio packet, no decoder for payload type, pt = %u", pt);
        return;
    }

    std::vector<uint8_t> pcm;
    if (!decoder->decode(packet.payload.data(), (uint32_t)packet.payload.size(), pcm)) {
        LogWarning(LOG_RTP, "dropping audio packet, %s decode failed, seq = %u", decoder->name().c_str(), packet.header.getSequence());
        return;
    }

    packet.payload = pcm;

    auto audioPacketCallback = m_audioPacketCallback;
    if (audioPacketCallback)
        audioPacketCallback(packet);
}

/* Updates the timer by the passed number of milliseconds. */

void MediaTransport::clock(uint32_t ms)
{
    if (!m_open || m_closed)
        return;

    uint8_t buffer[MEDIA_BUFFER_LENGTH];
    ::memset(buffer, 0x00U, MEDIA_BUFFER_LENGTH);

    sockaddr_storage address;
    uint32_t addrLen = 0U;

    while (m_open && !m_closed) {
        ssize_t length = m_socket->read(buffer, MEDIA_BUFFER_LENGTH, address, addrLen);
        if (length <= 0)
            break;

        onDatagram(buffer, (uint32_t)length);
    }
}

/* Helper to clear all callbacks. */

void MediaTransport::clearCallbacks()
{
    m_rtpPacketCallback = nullptr;
    m_dtmfPacketCallback = nullptr;
    m_dtmfCallback = nullptr;
    m_audioPacketCallback = nullptr;
}
