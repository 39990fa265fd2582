// SPDX-License-Identifier: GPL-2.0-only
/*
 * Softphone - Common Library
 * GPLv2 Open Source. Use is subject to license terms.
 * DO NOT ALTER OR REMOVE COPYRIGHT NOTICES OR THIS FILE HEADER.
 *
 *  Copyright (C) 2025 Bryan Biedenkapp, N2PLL
 *
 */
/**
 * @defgroup audio Audio Codecs
 * @brief Defines and implements audio codec routines.
 * @ingroup common
 *
 * @file G711.h
 * @ingroup audio
 * @file G711.cpp
 * @ingroup audio
 */
#if !defined(__AUDIO__G711_H__)
#define __AUDIO__G711_H__

#include "common/Defines.h"

#include <vector>

namespace audio
{
    // ---------------------------------------------------------------------------
    //  Constants
    // ---------------------------------------------------------------------------

    /** @brief Sample rate of G.711 audio. */
    const uint32_t G711_SAMPLE_RATE = 8000U;
    /** @brief Number of G.711 samples (bytes) in a 20ms frame. */
    const uint32_t G711_FRAME_SAMPLES = 160U;

    // ---------------------------------------------------------------------------
    //  Class Declaration
    // ---------------------------------------------------------------------------

    /**
     * @brief Defines and implements the G.711 aLaw and uLaw audio decoders.
     * @ingroup audio
     */
    class SOFTPHONE_API G711 {
    public:
        /**
         * @brief Helper to convert G.711 aLaw into PCM.
         * @param alaw aLaw value.
         * @return short PCM value.
         */
        static short decodeALaw(uint8_t alaw);
        /**
         * @brief Helper to convert G.711 MuLaw into PCM.
         * @param ulaw MuLaw value.
         * @return short PCM value.
         */
        static short decodeMuLaw(uint8_t ulaw);

        /**
         * @brief Helper to convert a buffer of G.711 samples into 16-bit little endian PCM.
         * @param[in] data G.711 samples.
         * @param[in] length Number of samples.
         * @param[in] aLaw Flag indicating the samples are aLaw rather than MuLaw.
         * @param[out] pcm PCM buffer (2 bytes per sample).
         */
        static void decode(const uint8_t* data, uint32_t length, bool aLaw, std::vector<uint8_t>& pcm);
    };
} // namespace audio

#endif // __AUDIO__G711_H__
