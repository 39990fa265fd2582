// SPDX-License-Identifier: GPL-2.0-only
/*
 * Softphone - Common Library
 * GPLv2 Open Source. Use is subject to license terms.
 * DO NOT ALTER OR REMOVE COPYRIGHT NOTICES OR THIS FILE HEADER.
 *
 *  Copyright (C) 2025 Bryan Biedenkapp, N2PLL
 *
 */
#include "Defines.h"
#include "audio/G711.h"

using namespace audio;

// ---------------------------------------------------------------------------
//  Constants
// ---------------------------------------------------------------------------

#define SIGN_BIT (0x80)         // sign bit for a A-law byte
#define QUANT_MASK (0xf)        // quantization field mask
#define SEG_SHIFT (4)           // left shift for segment number
#define SEG_MASK (0x70)         // segment field mask

#define BIAS (0x84)             // bias for linear code

// ---------------------------------------------------------------------------
//  Public Static Class Members
// ---------------------------------------------------------------------------

/* Helper to convert G.711 aLaw into PCM. */

short G711::decodeALaw(uint8_t alaw)
{
    alaw ^= 0x55U;

    short t = (alaw & QUANT_MASK) << 4;
    short seg = ((unsigned)alaw & SEG_MASK) >> SEG_SHIFT;
    switch (seg) {
    case 0:
        t += 8;
        break;
    case 1:
        t += 0x108U;
        break;
    default:
        t += 0x108U;
        t <<= seg - 1;
    }

    return ((alaw & SIGN_BIT) ? t : -t);
}

/* Helper to convert G.711 MuLaw into PCM. */

short G711::decodeMuLaw(uint8_t ulaw)
{
    // complement to obtain normal u-law value
    ulaw = ~ulaw;

    short t = ((ulaw & QUANT_MASK) << 3) + BIAS;
    t <<= ((unsigned)ulaw & SEG_MASK) >> SEG_SHIFT;

    return ((ulaw & SIGN_BIT) ? (BIAS - t) : (t - BIAS));
}

/* Helper to convert a buffer of G.711 samples into 16-bit little endian PCM. */

void G711::decode(const uint8_t* data, uint32_t length, bool aLaw, std::vector<uint8_t>& pcm)
{
    pcm.resize(length * 2U);
    if (data == nullptr)
        return;

    for (uint32_t i = 0U; i < length; i++) {
        short sample = (aLaw) ? decodeALaw(data[i]) : decodeMuLaw(data[i]);
        pcm[i * 2U] = (uint8_t)(sample & 0xFFU);
        pcm[i * 2U + 1U] = (uint8_t)((sample >> 8) & 0xFFU);
    }
}
