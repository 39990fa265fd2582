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
 * @defgroup media Media
 * @brief Implementation for the SRTP media path of a call session.
 * @ingroup softphone
 *
 * @file AudioDecoder.h
 * @ingroup media
 * @file AudioDecoder.cpp
 * @ingroup media
 */
#if !defined(__AUDIO_DECODER_H__)
#define __AUDIO_DECODER_H__

#include "Defines.h"

#include <memory>
#include <string>
#include <vector>

#include <opus/opus.h>

namespace media
{
    // ---------------------------------------------------------------------------
    //  Class Declaration
    // ---------------------------------------------------------------------------

    /**
     * @brief Base class for decoders turning received RTP audio payloads into PCM.
     * @ingroup media
     */
    class SOFTPHONE_API AudioDecoder {
    public:
        /**
         * @brief Finalizes a instance of the AudioDecoder class.
         */
        virtual ~AudioDecoder() = default;

        /**
         * @brief Decodes an RTP audio payload.
         * @param[in] data Encoded audio payload.
         * @param[in] length Length of encoded audio payload.
         * @param[out] pcm 16-bit little endian PCM samples.
         * @returns bool True, if the payload was decoded, otherwise false.
         */
        virtual bool decode(const uint8_t* data, uint32_t length, std::vector<uint8_t>& pcm) = 0;

        /**
         * @brief Gets the name of the codec.
         * @returns std::string Codec name.
         */
        virtual std::string name() const = 0;

        /**
         * @brief Creates a decoder by codec name ("opus", "pcmu" or "pcma").
         * @param name Codec name.
         * @returns std::unique_ptr<AudioDecoder> Decoder, or nullptr if the codec is unknown.
         */
        static std::unique_ptr<AudioDecoder> create(const std::string& name);
    };

    // ---------------------------------------------------------------------------
    //  Class Declaration
    // ---------------------------------------------------------------------------

    /**
     * @brief Implements an Opus (48kHz stereo) audio decoder.
     * @ingroup media
     */
    class SOFTPHONE_API OpusAudioDecoder : public AudioDecoder {
    public:
        /**
         * @brief Initializes a new instance of the OpusAudioDecoder class.
         * @param sampleRate Output sample rate.
         * @param channels Number of output channels.
         */
        OpusAudioDecoder(int32_t sampleRate = 48000, int32_t channels = 2);
        /**
         * @brief Finalizes a instance of the OpusAudioDecoder class.
         */
        ~OpusAudioDecoder() override;

        /**
         * @brief Decodes an Opus RTP payload.
         * @param[in] data Encoded audio payload.
         * @param[in] length Length of encoded audio payload.
         * @param[out] pcm 16-bit little endian interleaved PCM samples.
         * @returns bool True, if the payload was decoded, otherwise false.
         */
        bool decode(const uint8_t* data, uint32_t length, std::vector<uint8_t>& pcm) override;

        /**
         * @brief Gets the name of the codec.
         * @returns std::string Codec name.
         */
        std::string name() const override { return "opus"; }

    private:
        OpusDecoder* m_decoder;
        int32_t m_channels;
    };

    // ---------------------------------------------------------------------------
    //  Class Declaration
    // ---------------------------------------------------------------------------

    /**
     * @brief Implements a G.711 (PCMU or PCMA, 8kHz mono) audio decoder.
     * @ingroup media
     */
    class SOFTPHONE_API G711AudioDecoder : public AudioDecoder {
    public:
        /**
         * @brief Initializes a new instance of the G711AudioDecoder class.
         * @param aLaw Flag indicating aLaw (PCMA) rather than MuLaw (PCMU).
         */
        explicit G711AudioDecoder(bool aLaw = false);

        /**
         * @brief Decodes a G.711 RTP payload.
         * @param[in] data Encoded audio payload.
         * @param[in] length Length of encoded audio payload.
         * @param[out] pcm 16-bit little endian PCM samples.
         * @returns bool True, if the payload was decoded, otherwise false.
         */
        bool decode(const uint8_t* data, uint32_t length, std::vector<uint8_t>& pcm) override;

        /**
         * @brief Gets the name of the codec.
         * @returns std::string Codec name.
         */
        std::string name() const override { return (m_aLaw) ? "pcma" : "pcmu"; }

    private:
        bool m_aLaw;
    };
} // namespace media

#endif // __AUDIO_DECODER_H__
