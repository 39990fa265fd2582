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
#include "common/Log.h"
#include "common/Utils.h"
#include "media/AudioDecoder.h"

using namespace media;

// ---------------------------------------------------------------------------
//  Constants
// ---------------------------------------------------------------------------

#define OPUS_MAX_FRAME_SIZE 5760    // 120ms at 48kHz

// ---------------------------------------------------------------------------
//  Static Class Members
// ---------------------------------------------------------------------------

/* Creates a decoder by codec name. */

std::unique_ptr<AudioDecoder> AudioDecoder::create(const std::string& name)
{
    std::string codec = ::strtolower(::strtrim(name));
    if (codec == "opus")
        return std::unique_ptr<AudioDecoder>(new OpusAudioDecoder());
    if (codec == "pcmu")
        return std::unique_ptr<AudioDecoder>(new G711AudioDecoder(false));
    if (codec == "pcma")
        return std::unique_ptr<AudioDecoder>(new G711AudioDecoder(true));

    LogError(LOG_AUDIO, "unknown audio codec, codec = %s", name.c_str());
    return nullptr;
}

// ---------------------------------------------------------------------------
//  Public Class Members
// ---------------------------------------------------------------------------

/* Initializes a new instance of the OpusAudioDecoder class. */

OpusAudioDecoder::OpusAudioDecoder(int32_t sampleRate, int32_t channels) :
    m_decoder(nullptr),
    m_channels(channels)
{
    int error = OPUS_OK;
    m_decoder = ::opus_decoder_create(sampleRate, channels, &error);
    if (error != OPUS_OK) {
        LogError(LOG_AUDIO, "failed to create Opus decoder, err: %s", ::opus_strerror(error));
        m_decoder = nullptr;
    }
}

/* Finalizes a instance of the OpusAudioDecoder class. */

OpusAudioDecoder::~OpusAudioDecoder()
{
    if (m_decoder != nullptr) {
        ::opus_decoder_destroy(m_decoder);
        m_decoder = nullptr;
    }
}

/* Decodes an Opus RTP payload. */

bool OpusAudioDecoder::decode(const uint8_t* data, uint32_t length, std::vector<uint8_t>& pcm)
{
    if (m_decoder == nullptr || data == nullptr || length == 0U)
        return false;

    std::vector<opus_int16> samples(OPUS_MAX_FRAME_SIZE * m_channels);
    int ret = ::opus_decode(m_decoder, data, (opus_int32)length, samples.data(), OPUS_MAX_FRAME_SIZE, 0);
    if (ret < 0) {
        LogWarning(LOG_AUDIO, "failed to decode Opus frame, len = %u, err: %s", length, ::opus_strerror(ret));
        return false;
    }

    uint32_t count = (uint32_t)ret * m_channels;
    pcm.resize(count * 2U);
    for (uint32_t i = 0U; i < count; i++) {
        pcm[i * 2U] = (uint8_t)(samples[i] & 0xFFU);
        pcm[i * 2U + 1U] = (uint8_t)((samples[i] >> 8) & 0xFFU);
    }

    return true;
}

/* Initializes a new instance of the G711AudioDecoder class. */

G711AudioDecoder::G711AudioDecoder(bool aLaw) :
    m_aLaw(aLaw)
{
    /* stub */
}

/* Decodes a G.711 RTP payload. */

bool G711AudioDecoder::decode(const uint8_t* data, uint32_t length, std::vector<uint8_t>& pcm)
{
    if (data == nullptr || length == 0U)
        return false;

    audio::G711::decode(data, length, m_aLaw, pcm);
    return true;
}
