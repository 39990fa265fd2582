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
 * @file MediaTransport.h
 * @ingroup media
 * @file MediaTransport.cpp
 * @ingroup media
 */
#if !defined(__MEDIA_TRANSPORT_H__)
#define __MEDIA_TRANSPORT_H__

#include "Defines.h"
#include "common/crypto/SRTPSession.h"
#include "common/network/RTPPacket.h"
#include "common/network/udp/Socket.h"
#include "dtmf/DTMF.h"
#include "media/AudioDecoder.h"

#include <functional>
#include <memory>
#include <string>
#include <vector>

namespace media
{
    // ---------------------------------------------------------------------------
    //  Constants
    // ---------------------------------------------------------------------------

    /** @brief Maximum length of a datagram read from the RTP socket. */
    const uint32_t MEDIA_BUFFER_LENGTH = 2048U;

    // ---------------------------------------------------------------------------
    //  Class Declaration
    // ---------------------------------------------------------------------------

    /**
     * @brief Implements the secure media transport of a call session; owns the UDP socket and
     *  the SRTP contexts, protects outbound RTP and classifies inbound RTP.
     * @ingroup media
     */
    class SOFTPHONE_API MediaTransport {
    public:
        /**
         * @brief Initializes a new instance of the MediaTransport class.
         * @param remoteAddress Remote RTP IP address.
         * @param remotePort Remote RTP port.
         * @param localKey Local base64 SRTP master key and salt.
         * @param telephoneEventPT Telephone-event payload type.
         * @param decoder Audio decoder for payload types other than PCMU/PCMA.
         * @param socket UDP socket (ownership is transferred).
         */
        MediaTransport(const std::string& remoteAddress, uint16_t remotePort, const std::string& localKey,
            uint8_t telephoneEventPT, std::unique_ptr<AudioDecoder> decoder, std::unique_ptr<network::udp::Socket> socket);
        /**
         * @brief Finalizes a instance of the MediaTransport class.
         */
        ~MediaTransport();

        /**
         * @brief Opens the UDP socket on an ephemeral local port.
         * @returns bool True, if the socket was opened, otherwise false.
         */
        bool open();
        /**
         * @brief Closes the UDP socket. Repeated calls are no-ops.
         */
        void close();
        /**
         * @brief Flag indicating whether the UDP socket is open.
         * @returns bool True, if the socket is open, otherwise false.
         */
        bool isOpen() const { return m_open; }
        /**
         * @brief Gets the local port the UDP socket is bound to.
         * @returns uint16_t Local port.
         */
        uint16_t getLocalPort() const;

        /**
         * @brief Sets the remote SRTP master key and (re)creates the SRTP contexts.
         * @param remoteKey Remote base64 SRTP master key and salt.
         * @throws session::SRTPKeyError if either key does not decode to 30 bytes.
         */
        void setRemoteKey(const std::string& remoteKey);
        /**
         * @brief Flag indicating whether the SRTP contexts exist.
         * @returns bool True, if the contexts exist, otherwise false.
         */
        bool isReady() const { return m_srtp.isReady(); }

        /**
         * @brief Sends a raw datagram to the remote RTP endpoint.
         * @param data Datagram.
         * @param length Length of datagram.
         * @returns bool True, if the datagram was sent, otherwise false.
         */
        bool send(const uint8_t* data, uint32_t length);
        /**
         * @brief Sends a raw datagram to the remote RTP endpoint.
         * @param data Datagram.
         * @returns bool True, if the datagram was sent, otherwise false.
         */
        bool send(const std::string& data);
        /**
         * @brief Serializes, protects and sends an RTP packet.
         * @param packet RTP packet.
         * @returns bool True, if the packet was sent, otherwise false.
         * @throws session::UseBeforeReadyError if the SRTP contexts do not exist.
         */
        bool encryptAndSend(const network::frame::RTPPacket& packet);

        /**
         * @brief Processes an inbound SRTP datagram.
         * @param data Datagram.
         * @param length Length of datagram.
         */
        void onDatagram(const uint8_t* data, uint32_t length);

        /**
         * @brief Updates the timer by the passed number of milliseconds; reads and processes
         *  every datagram waiting on the socket.
         * @param ms Number of milliseconds.
         */
        void clock(uint32_t ms);

        /**
         * @brief Helper to set the RTP packet callback.
         * @param callback Callback invoked for every inbound RTP packet.
         */
        void setRTPPacketCallback(std::function<void(const network::frame::RTPPacket&)>&& callback) { m_rtpPacketCallback = callback; }
        /**
         * @brief Helper to set the DTMF packet callback.
         * @param callback Callback invoked for every inbound telephone-event RTP packet.
         */
        void setDTMFPacketCallback(std::function<void(const network::frame::RTPPacket&)>&& callback) { m_dtmfPacketCallback = callback; }
        /**
         * @brief Helper to set the DTMF callback.
         * @param callback Callback invoked once per received key press.
         */
        void setDTMFCallback(std::function<void(char)>&& callback) { m_dtmfCallback = callback; }
        /**
         * @brief Helper to set the audio packet callback.
         * @param callback Callback invoked for every inbound audio RTP packet (payload replaced by PCM).
         */
        void setAudioPacketCallback(std::function<void(const network::frame::RTPPacket&)>&& callback) { m_audioPacketCallback = callback; }
        /**
         * @brief Helper to clear all callbacks.
         */
        void clearCallbacks();

        /**
         * @brief Gets the telephone-event payload type.
         * @returns uint8_t Telephone-event payload type.
         */
        uint8_t telephoneEventPT() const { return m_telephoneEventPT; }

        /**
         * @brief Sets a flag indicating whether datagrams are dumped to the log.
         * @param debug Flag indicating whether datagrams are dumped to the log.
         */
        void setDebug(bool debug) { m_debug = debug; }

    private:
        std::string m_remoteAddress;
        uint16_t m_remotePort;
        sockaddr_storage m_remoteAddr;
        uint32_t m_remoteAddrLen;

        std::string m_localKey;
        uint8_t m_telephoneEventPT;

        std::unique_ptr<network::udp::Socket> m_socket;
        bool m_open;
        bool m_closed;

        crypto::SRTPSession m_srtp;

        std::unique_ptr<AudioDecoder> m_decoder;
        G711AudioDecoder m_pcmuDecoder;
        G711AudioDecoder m_pcmaDecoder;
        dtmf::DTMFDecoder m_dtmfDecoder;

        bool m_debug;

        std::function<void(const network::frame::RTPPacket&)> m_rtpPacketCallback;
        std::function<void(const network::frame::RTPPacket&)> m_dtmfPacketCallback;
        std::function<void(char)> m_dtmfCallback;
        std::function<void(const network::frame::RTPPacket&)> m_audioPacketCallback;
    };
} // namespace media

#endif // __MEDIA_TRANSPORT_H__
