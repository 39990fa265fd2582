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
 * @file AudioStreamer.h
 * @ingroup media
 * @file AudioStreamer.cpp
 * @ingroup media
 */
#if !defined(__AUDIO_STREAMER_H__)
#define __AUDIO_STREAMER_H__

#include "Defines.h"
#include "common/network/RTPHeader.h"
#include "common/Timer.h"

#include <functional>
#include <vector>

namespace media
{
    // ---------------------------------------------------------------------------
    //  Class Prototypes
    // ---------------------------------------------------------------------------

    class SOFTPHONE_API MediaTransport;

    // ---------------------------------------------------------------------------
    //  Class Declaration
    // ---------------------------------------------------------------------------

    /**
     * @brief Paces a buffer of 8kHz MuLaw audio out over a media transport as 20ms RTP frames.
     * @ingroup media
     */
    class SOFTPHONE_API AudioStreamer {
    public:
        /**
         * @brief Initializes a new instance of the AudioStreamer class.
         * @param transport Media transport the frames are sent over.
         * @param buffer MuLaw audio samples.
         * @param payloadType RTP payload type of the frames.
         */
        AudioStreamer(MediaTransport* transport, const std::vector<uint8_t>& buffer, uint8_t payloadType = RTP_PCMU_PAYLOAD_TYPE);
        /**
         * @brief Finalizes a instance of the AudioStreamer class.
         */
        ~AudioStreamer();

        /**
         * @brief Starts streaming; the first frame is sent immediately.
         * @throws session::UseBeforeReadyError if the media transport has no SRTP context.
         */
        void start();
        /**
         * @brief Stops streaming. No further frames are sent and the streamer cannot be
         *  started again.
         */
        void stop();
        /**
         * @brief Suspends the frame pacing without losing the stream position.
         */
        void pause();
        /**
         * @brief Resumes the frame pacing.
         */
        void resume();

        /**
         * @brief Updates the timer by the passed number of milliseconds; sends the next frame
         *  when the pacing interval has elapsed.
         * @param ms Number of milliseconds.
         */
        void clock(uint32_t ms);

        /**
         * @brief Releases the media transport; the streamer is stopped and cannot be restarted.
         */
        void detach();

        /**
         * @brief Flag indicating whether the streamer is sending frames.
         * @returns bool True, if the streamer is running, otherwise false.
         */
        bool isRunning() const { return m_running; }
        /**
         * @brief Flag indicating whether the streamer was stopped before the end of the buffer.
         * @returns bool True, if the streamer was stopped, otherwise false.
         */
        bool isStopped() const { return m_stopped && !m_finished; }
        /**
         * @brief Flag indicating whether the streamer is paused.
         * @returns bool True, if the streamer is paused, otherwise false.
         */
        bool isPaused() const { return m_running && m_frameTimer.isPaused(); }
        /**
         * @brief Flag indicating whether the whole buffer was sent.
         * @returns bool True, if the whole buffer was sent, otherwise false.
         */
        bool isFinished() const { return m_finished; }
        /**
         * @brief Gets the number of frames sent.
         * @returns uint32_t Number of frames sent.
         */
        uint32_t framesSent() const { return m_framesSent; }
        /**
         * @brief Gets the synchronization source of the stream.
         * @returns uint32_t Synchronization source.
         */
        uint32_t getSSRC() const { return m_ssrc; }

        /**
         * @brief Helper to set the finished callback.
         * @param callback Callback invoked once when the whole buffer was sent.
         */
        void setFinishedCallback(std::function<void()>&& callback) { m_finishedCallback = callback; }

    private:
        MediaTransport* m_transport;
        std::vector<uint8_t> m_buffer;
        uint32_t m_position;

        uint8_t m_payloadType;
        uint16_t m_seq;
        uint32_t m_timestamp;
        uint32_t m_ssrc;

        Timer m_frameTimer;

        bool m_running;
        bool m_stopped;
        bool m_finished;
        uint32_t m_framesSent;

        std::function<void()> m_finishedCallback;

        /**
         * @brief Internal helper to send the next frame.
         */
        void sendFrame();
        /**
         * @brief Internal helper to mark the stream finished.
         */
        void finish();
    };
} // namespace media

#endif // __AUDIO_STREAMER_H__
