// SPDX-License-Identifier: GPL-2.0-only
/*
 * Softphone - Common Library
 * GPLv2 Open Source. Use is subject to license terms.
 * DO NOT ALTER OR REMOVE COPYRIGHT NOTICES OR THIS FILE HEADER.
 *
 *  Copyright (C) 2009,2014,2015,2016 Jonathan Naylor, G4KLX
 *  Copyright (C) 2018-2025 Bryan Biedenkapp, N2PLL
 *
 */
#include "Utils.h"
#include "Log.h"

#include <openssl/evp.h>

#include <cstdio>
#include <cctype>
#include <mutex>
#include <random>

// ---------------------------------------------------------------------------
//  Global Variables
// ---------------------------------------------------------------------------

static std::mutex m_randomLock;

// ---------------------------------------------------------------------------
//  Static Class Members
// ---------------------------------------------------------------------------

/* Helper to dump the input buffer and display the hexadecimal output in the log. */

void Utils::dump(const std::string& title, const uint8_t* data, uint32_t length)
{
    dump(2U, title, data, length);
}

/* Helper to dump the input buffer and display the hexadecimal output in the log. */

void Utils::dump(int level, const std::string& title, const uint8_t* data, uint32_t length)
{
    if (data == nullptr)
        return;

    ::Log(level, "DUMP", nullptr, 0, nullptr, "%s", title.c_str());

    uint32_t offset = 0U;

    while (length > 0U) {
        std::string output;

        uint32_t bytes = (length > 16U) ? 16U : length;

        for (uint32_t i = 0U; i < bytes; i++) {
            char temp[10U];
            ::snprintf(temp, sizeof(temp), "%02X ", data[offset + i]);
            output += temp;
        }

        for (uint32_t i = bytes; i < 16U; i++)
            output += "   ";

        output += "   *";

        for (uint32_t i = 0U; i < bytes; i++) {
            uint8_t c = data[offset + i];

            if (::isprint(c))
                output += c;
            else
                output += '.';
        }

        output += '*';

        ::Log(level, "DUMP", nullptr, 0, nullptr, "%04X:  %s", offset, output.c_str());

        offset += 16U;

        if (length >= 16U)
            length -= 16U;
        else
            length = 0U;
    }
}

/* Helper to encode a buffer as base64 text. */

std::string Utils::base64Encode(const uint8_t* data, uint32_t length)
{
    if (data == nullptr || length == 0U)
        return std::string();

    // 4 output characters for every 3 input bytes, plus the terminator
    std::vector<uint8_t> out(((length + 2U) / 3U) * 4U + 1U);
    int len = ::EVP_EncodeBlock(out.data(), data, (int)length);
    if (len < 0)
        return std::string();

    return std::string((char*)out.data(), len);
}

/* Helper to decode base64 text. */

bool Utils::base64Decode(const std::string& text, std::vector<uint8_t>& output)
{
    output.clear();

    std::string in = ::strtrim(text);
    if (in.empty() || (in.size() % 4U) != 0U)
        return false;

    std::vector<uint8_t> out((in.size() / 4U) * 3U);
    int len = ::EVP_DecodeBlock(out.data(), (const uint8_t*)in.c_str(), (int)in.size());
    if (len < 0)
        return false;

    // EVP_DecodeBlock keeps the zero bytes produced by the padding characters
    uint32_t padding = 0U;
    if (in[in.size() - 1U] == '=')
        padding++;
    if (in[in.size() - 2U] == '=')
        padding++;

    out.resize(len - padding);
    output = out;
    return true;
}

/* Helper to generate a uniformly distributed random number. */

uint32_t Utils::random(uint32_t min, uint32_t max)
{
    static std::random_device rd;
    static std::mt19937 mt(rd());

    std::lock_guard<std::mutex> lock(m_randomLock);
    std::uniform_int_distribution<uint32_t> dist(min, max);
    return dist(mt);
}
