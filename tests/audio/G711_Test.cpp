// SPDX-License-Identifier: GPL-2.0-only
/**
* Softphone - Test Suite
* GPLv2 Open Source. Use is subject to license terms.
* DO NOT ALTER OR REMOVE COPYRIGHT NOTICES OR THIS FILE HEADER.
*
* @package Softphone / Test Suite
* @license GPLv2 License (https://opensource.org/licenses/GPL-2.0)
*
*   Copyright (C) 2025 Softphone Project Contributors
*
*/
#include "softphone/Defines.h"
#include "common/audio/G711.h"
#include "common/Utils.h"

using namespace audio;

#include <catch2/catch_test_macros.hpp>
#include <cstring>

TEST_CASE("G711", "[Audio Test]") {
    SECTION("MuLaw_Decode_Test") {
        REQUIRE(G711::decodeMuLaw(0xFFU) == 0);
        REQUIRE(G711::decodeMuLaw(0x7FU) == 0);
        REQUIRE(G711::decodeMuLaw(0x00U) == -32124);
        REQUIRE(G711::decodeMuLaw(0x80U) == 32124);
    }

    SECTION("ALaw_Decode_Test") {
        REQUIRE(G711::decodeALaw(0xD5U) == 8);
        REQUIRE(G711::decodeALaw(0x55U) == -8);
    }

    SECTION("Symmetry_Test") {
        for (uint32_t i = 0U; i < 256U; i++) {
            uint8_t value = (uint8_t)i;

            // the sign bit alone separates positive and negative codes of the same magnitude
            REQUIRE(G711::decodeMuLaw(value) == -G711::decodeMuLaw(value ^ 0x80U));
            REQUIRE(G711::decodeALaw(value) == -G711::decodeALaw(value ^ 0x80U));
        }

        REQUIRE(G711::decodeALaw(0xAAU) == 32256);
        REQUIRE(G711::decodeALaw(0x2AU) == -32256);
    }

    SECTION("MuLaw_Monotonic_Test") {
        // positive codes fall from full scale to silence
        for (uint32_t i = 0x80U; i < 0xFFU; i++) {
            REQUIRE(G711::decodeMuLaw((uint8_t)i) > G711::decodeMuLaw((uint8_t)(i + 1U)));
        }
    }

    SECTION("Buffer_Test") {
        uint8_t frame[160U];
        ::memset(frame, 0xFFU, 160U);
        frame[0U] = 0x00U;

        std::vector<uint8_t> pcm;
        G711::decode(frame, 160U, false, pcm);
        REQUIRE(pcm.size() == 320U);

        // 16-bit little endian
        short first = (short)(pcm[0U] | (pcm[1U] << 8));
        REQUIRE(first == -32124);
        for (uint32_t i = 2U; i < pcm.size(); i++) {
            REQUIRE(pcm[i] == 0x00U);
        }

        std::vector<uint8_t> aLaw;
        G711::decode(frame, 2U, true, aLaw);
        REQUIRE(aLaw.size() == 4U);
        REQUIRE((short)(aLaw[2U] | (aLaw[3U] << 8)) == G711::decodeALaw(0xFFU));
    }
}
