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
#include "common/audio/G711.h"
#include "common/network/RTPPacket.h"
#include "common/Log.h"
#include "common/Utils.h"
#include "media/AudioStreamer.h"
#include "media/MediaTransport.h"
#include "Exceptions.h"

using namespace media;
using namespace network::frame;

#include <chrono>

// ---------------------------------------------------------------------------
//  Public Class Members
// ---------------------------------------------------------------------------

/* Initializes a new instance of the AudioStreamer class. */

AudioStreamer::AudioStreamer(MediaTransport* transport, const std::vector<uint8_t>& buffer, uint8_t payloadType) :
    m_transport(transport),
    m_buffer(buffer),
    m_position(0U),
    m_payloadType(payloadType),
    m_seq((uint16_t)Utils::random(0U, 0xFFFFU)),
    m_timestamp(0U),
    m_ssrc(Utils::random()),
    m_frameTimer(1000U, 0U, AUDIO_FRAME_INTERVAL_MS),
    m_running(false),
    m_stopped(false),
    m_finished(false),
    m_framesSent(0U),
    m_finishedCallback(nullptr)
{
    uint64_t now = std::chrono::duration_cast<std::chrono::milliseconds>(std::chrono::system_clock::now().time_since_epoch()).count();
    m_timestamp = (uint32_t)(now * (audio::G711_SAMPLE_RATE / 1000U));
}

/* Finalizes a instance of the AudioStreamer class. */

AudioStreamer::~AudioStreamer() = default;

/* Starts streaming. */

void AudioStreamer::start()
{
    // a stopped stream is never restarted; its owner no longer clocks it
    if (m_running || m_stopped || m_finished)
        return;

    if (m_transport == nullptr)
        return;
    if (!m_transport->isReady()) {
        throw session::UseBeforeReadyError("cannot stream audio before the remote SRTP key is known");
    }

    m_running = true;
    LogMessage(LOG_AUDIO, "audio stream started, ssrc = %u, len = %u", m_ssrc, (uint32_t)m_buffer.size());

    if (m_buffer.empty()) {
        finish();
        return;
    }

    sendFrame();
    if (m_running)
        m_frameTimer.start();
}

/* Stops streaming. */

void AudioStreamer::stop()
{
    if (!m_running)
        return;

    m_running = false;
    m_stopped = true;
    m_frameTimer.stop();
    LogMessage(LOG_AUDIO, "audio stream stopped, ssrc = %u, frames = %u", m_ssrc, m_framesSent);
}

/* Suspends the frame pacing without losing the stream position. */

void AudioStreamer::pause()
{
    if (m_running)
        m_frameTimer.pause();
}

/* Resumes the frame pacing. */

void AudioStreamer::resume()
{
    if (m_running)
        m_frameTimer.resume();
}

/* Updates the timer by the passed number of milliseconds. */

void AudioStreamer::clock(uint32_t ms)
{
    if (!m_running)
        return;

    m_frameTimer.clock(ms);
    while (m_running && m_frameTimer.consume()) {
        sendFrame();
    }
}

/* Releases the media transport. */

void AudioStreamer::detach()
{
    stop();
    m_stopped = true;
    m_transport = nullptr;
    m_finishedCallback = nullptr;
}

// ---------------------------------------------------------------------------
//  Private Class Members
// ---------------------------------------------------------------------------

/* Internal helper to send the next frame. */

void AudioStreamer::sendFrame()
{
    if (m_transport == nullptr || !m_transport->isOpen() || !m_transport->isReady()) {
        stop();
        return;
    }

    uint32_t length = audio::G711_FRAME_SAMPLES;
    if (m_position + length > m_buffer.size())
        length = (uint32_t)m_buffer.size() - m_position;

    RTPPacket packet;
    packet.header.setPayloadType(m_payloadType);
    packet.header.setMarker(m_framesSent == 0U);
    packet.header.setSequence(m_seq);
    packet.header.setTimestamp(m_timestamp);
    packet.header.setSSRC(m_ssrc);
    packet.payload.assign(m_buffer.begin() + m_position, m_buffer.begin() + m_position + length);

    if (!m_transport->encryptAndSend(packet)) {
        LogWarning(LOG_AUDIO, "failed to send audio frame, ssrc = %u, seq = %u", m_ssrc, m_seq);
    }

    m_position += length;
    m_seq++;
    m_timestamp += audio::G711_FRAME_SAMPLES;
    m_framesSent++;

    if (m_position >= m_buffer.size())
        finish();
}

/* Internal helper to mark the stream finished. */

void AudioStreamer::finish()
{
    stop();
    if (m_finished)
        return;

    m_finished = true;
    LogDebug(LOG_AUDIO, "audio stream finished, ssrc = %u, frames = %u", m_ssrc, m_framesSent);

    auto finishedCallback = m_finishedCallback;
    if (finishedCallback)
        finishedCallback();
}
