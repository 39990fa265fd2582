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
 * @file CallSession.h
 * @ingroup session
 * @file CallSession.cpp
 * @ingroup session
 */
#if !defined(__CALL_SESSION_H__)
#define __CALL_SESSION_H__

#include "Defines.h"
#include "common/network/sip/SignalingChannel.h"
#include "common/network/sip/SIPPayload.h"
#include "common/network/udp/Socket.h"
#include "common/network/RTPPacket.h"
#include "media/AudioStreamer.h"
#include "media/MediaTransport.h"
#include "session/CallState.h"
#include "SoftphoneConfig.h"

#include <functional>
#include <memory>
#include <mutex>
#include <string>
#include <vector>

namespace session
{
    // ---------------------------------------------------------------------------
    //  Class Declaration
    // ---------------------------------------------------------------------------

    /**
     * @brief Base class for a single VoIP call; drives the call state machine from the SIP messages
     *  carrying its Call-ID, owns the secure media transport and reports media and call events to
     *  the application.
     * @ingroup session
     */
    class SOFTPHONE_API CallSession {
    public:
        auto operator=(CallSession&) -> CallSession& = delete;
        CallSession(CallSession&) = delete;

        /**
         * @brief Finalizes a instance of the CallSession class.
         */
        virtual ~CallSession();

        /**
         * @brief Opens the RTP socket, sends the hole punch datagram and starts listening for the
         *  SIP messages of this call.
         * @returns bool True, if local services were started, otherwise false.
         */
        virtual bool startLocalServices();

        /**
         * @brief Sets the remote SRTP master key.
         * @param remoteKey Remote base64 SRTP master key and salt.
         * @throws SRTPKeyError if the key does not decode to 30 bytes.
         */
        void setRemoteKey(const std::string& remoteKey);

        /**
         * @brief Transfers the call (blind transfer, REFER) to the given number.
         * @param target Transfer target (user part of the Refer-To address).
         * @returns bool True, if the REFER was sent, otherwise false.
         */
        bool transfer(const std::string& target);
        /**
         * @brief Hangs up the call (BYE). The session is disposed when the BYE is confirmed.
         * @returns bool True, if the BYE was sent, otherwise false (disposed, or local services
         *  not started).
         */
        bool hangup();
        /**
         * @brief Sends a DTMF digit as a burst of RTP telephone-event packets.
         * @param c DTMF digit (0-9, * or #).
         * @throws InvalidDTMFCharError if the character is not a DTMF digit.
         * @throws UseBeforeReadyError if the remote SRTP key is not known.
         */
        void sendDTMF(char c);
        /**
         * @brief Streams a buffer of 8kHz MuLaw audio to the remote party.
         * @param buffer MuLaw audio samples.
         * @returns std::shared_ptr<media::AudioStreamer> Streamer handle, nullptr if the session is disposed.
         * @throws UseBeforeReadyError if the remote SRTP key is not known.
         */
        std::shared_ptr<media::AudioStreamer> streamAudio(const std::vector<uint8_t>& buffer);

        /**
         * @brief Disposes the session. Repeated calls are no-ops.
         */
        void dispose();

        /**
         * @brief Updates the session by the passed number of milliseconds; processes inbound RTP and
         *  paces audio streamers.
         * @param ms Number of milliseconds.
         */
        void clock(uint32_t ms);

        /**
         * @brief Gets the Call-ID of the session.
         * @returns std::string Call-ID.
         */
        std::string callId() const { return m_callId; }
        /**
         * @brief Gets the local SIP address header value.
         * @returns std::string Local peer.
         */
        std::string localPeer() const;
        /**
         * @brief Gets the remote SIP address header value.
         * @returns std::string Remote peer.
         */
        std::string remotePeer() const;
        /**
         * @brief Gets the remote RTP IP address.
         * @returns std::string Remote RTP IP address.
         */
        std::string remoteIP() const { return m_remoteIP; }
        /**
         * @brief Gets the remote RTP port.
         * @returns uint16_t Remote RTP port.
         */
        uint16_t remotePort() const { return m_remotePort; }
        /**
         * @brief Gets the local RTP port.
         * @returns uint16_t Local RTP port (0 until local services are started).
         */
        uint16_t localPort() const;

        /**
         * @brief Gets the current call state.
         * @returns CallState::E Call state.
         */
        CallState::E state() const;
        /**
         * @brief Flag indicating whether the session is disposed.
         * @returns bool True, if the session is disposed, otherwise false.
         */
        bool isDisposed() const { return state() == CallState::DISPOSED; }

        /**
         * @brief Helper to set the RTP packet callback.
         * @param callback Callback invoked for every inbound RTP packet.
         */
        void setRTPPacketCallback(std::function<void(const network::frame::RTPPacket&)>&& callback);
        /**
         * @brief Helper to set the audio packet callback.
         * @param callback Callback invoked for every inbound audio packet (payload is 16-bit PCM).
         */
        void setAudioPacketCallback(std::function<void(const network::frame::RTPPacket&)>&& callback);
        /**
         * @brief Helper to set the DTMF packet callback.
         * @param callback Callback invoked for every inbound telephone-event packet.
         */
        void setDTMFPacketCallback(std::function<void(const network::frame::RTPPacket&)>&& callback);
        /**
         * @brief Helper to set the DTMF callback.
         * @param callback Callback invoked once per received key press.
         */
        void setDTMFCallback(std::function<void(char)>&& callback);
        /**
         * @brief Helper to set the busy callback.
         * @param callback Callback invoked when the remote party is busy.
         */
        void setBusyCallback(std::function<void()>&& callback);
        /**
         * @brief Helper to set the answered callback.
         * @param callback Callback invoked when the call is answered.
         */
        void setAnsweredCallback(std::function<void()>&& callback);
        /**
         * @brief Helper to set the disposed callback.
         * @param callback Callback invoked once when the session is disposed.
         */
        void setDisposedCallback(std::function<void()>&& callback);

    protected:
        SoftphoneConfig m_config;
        network::sip::SignalingChannel& m_channel;

        std::string m_callId;
        std::string m_localPeer;
        std::string m_remotePeer;

        std::string m_remoteIP;
        uint16_t m_remotePort;

        std::unique_ptr<media::MediaTransport> m_transport;

        CallState::E m_state;
        uint32_t m_cseq;

        mutable std::recursive_mutex m_lock;

        /**
         * @brief Initializes a new instance of the CallSession class.
         * @param config Softphone configuration.
         * @param channel SIP signaling channel.
         * @param message SDP-bearing SIP message creating the session.
         * @param localPeer Local SIP address header value.
         * @param remotePeer Remote SIP address header value.
         * @param initialState Initial call state.
         * @param socket RTP socket (nullptr creates a socket bound to the configured local address).
         * @throws MalformedOfferError if the SDP lacks the connection address or audio port.
         * @throws SRTPKeyError if the SDP carries an undecodable SRTP key.
         */
        CallSession(const SoftphoneConfig& config, network::sip::SignalingChannel& channel, const network::sip::SIPPayload& message,
            const std::string& localPeer, const std::string& remotePeer, CallState::E initialState,
            std::unique_ptr<network::udp::Socket> socket);

        /**
         * @brief Processes a SIP message carrying the Call-ID of this session.
         * @param message SIP message.
         */
        virtual void onMessage(const network::sip::SIPPayload& message);

        /**
         * @brief Moves the session to the given state.
         * @param state Next state.
         * @returns bool True, if the transition is legal and was applied, otherwise false.
         */
        bool transition(CallState::E state);

        /**
         * @brief Builds an in-dialog request for this session.
         * @param method SIP method.
         * @param uri Request URI.
         * @param cseq CSeq number (0 uses the next local sequence number).
         * @returns network::sip::SIPPayload SIP request.
         */
        network::sip::SIPPayload buildRequest(const std::string& method, const std::string& uri, uint32_t cseq = 0U);
        /**
         * @brief Sends a SIP message over the signaling channel.
         * @param message SIP message.
         * @returns bool True, if the message was sent, otherwise false.
         */
        bool sendMessage(network::sip::SIPPayload& message);

        /**
         * @brief Registers a signaling subscription that is dropped when the session is disposed.
         * @param subscription Signaling subscription.
         */
        void addSubscription(std::unique_ptr<network::sip::Subscription> subscription);

        /**
         * @brief Helper to fire the answered callback.
         */
        void fireAnswered();

    private:
        std::vector<std::unique_ptr<network::sip::Subscription>> m_subscriptions;
        std::unique_ptr<network::sip::Subscription> m_transferSubscription;
        std::vector<std::shared_ptr<media::AudioStreamer>> m_streamers;

        bool m_servicesStarted;

        std::function<void(const network::frame::RTPPacket&)> m_rtpPacketCallback;
        std::function<void(const network::frame::RTPPacket&)> m_audioPacketCallback;
        std::function<void(const network::frame::RTPPacket&)> m_dtmfPacketCallback;
        std::function<void(char)> m_dtmfCallback;
        std::function<void()> m_busyCallback;
        std::function<void()> m_answeredCallback;
        std::function<void()> m_disposedCallback;

        /**
         * @brief Internal helper to answer a transfer NOTIFY.
         * @param message SIP NOTIFY request.
         */
        void onTransferNotify(const network::sip::SIPPayload& message);

        /**
         * @brief Internal helper to release the signaling subscriptions, streamers and transport.
         */
        void release();
        /**
         * @brief Internal helper to clear the application callbacks.
         */
        void clearCallbacks();

        /**
         * @brief Internal helper to get the next DTMF synchronization source.
         * @returns uint32_t Synchronization source.
         */
        static uint32_t nextDTMFSSRC();
    };
} // namespace session

#endif // __CALL_SESSION_H__
