// SPDX-License-Identifier: GPL-2.0-only
/*
 * Softphone - Common Library
 * GPLv2 Open Source. Use is subject to license terms.
 * DO NOT ALTER OR REMOVE COPYRIGHT NOTICES OR THIS FILE HEADER.
 *
 *  Copyright (C) 2025 Softphone Project Contributors
 *
 */
#include "Defines.h"
#include "network/sip/SIPPayload.h"
#include "network/sip/SIPUtils.h"
#include "Utils.h"

using namespace network::sip;

#include <cstdio>
#include <regex>

// ---------------------------------------------------------------------------
//  Static Class Members
// ---------------------------------------------------------------------------

/* Generates a new, unique Via branch parameter. */

std::string SIPUtils::branch()
{
    return std::string(SIP_BRANCH_MAGIC_COOKIE) + "-" + uuid();
}

/* Generates a new From/To tag. */

std::string SIPUtils::tag()
{
    char buffer[16U];
    ::snprintf(buffer, sizeof(buffer), "%08x", Utils::random());
    return std::string(buffer);
}

/* Generates a new random UUID string. */

std::string SIPUtils::uuid()
{
    uint32_t a = Utils::random();
    uint32_t b = Utils::random();
    uint32_t c = Utils::random();
    uint32_t d = Utils::random();

    // version 4, variant 10xx
    b = (b & 0xFFFF0FFFU) | 0x00004000U;
    c = (c & 0x3FFFFFFFU) | 0x80000000U;

    char buffer[40U];
    ::snprintf(buffer, sizeof(buffer), "%08x-%04x-%04x-%04x-%04x%08x", a, (b >> 16) & 0xFFFFU, b & 0xFFFFU,
        (c >> 16) & 0xFFFFU, c & 0xFFFFU, d);
    return std::string(buffer);
}

/* Extracts the address (user@host) from a SIP address header value. */

std::string SIPUtils::extractAddress(const std::string& peer)
{
    static const std::regex bracketed("<sips?:([^>]+?)>");
    static const std::regex bare("sips?:([^;>\\s]+)");

    std::smatch match;
    if (std::regex_search(peer, match, bracketed)) {
        std::string addr = match[1].str();

        // drop URI parameters
        size_t pos = addr.find(';');
        if (pos != std::string::npos)
            addr = addr.substr(0U, pos);
        return addr;
    }

    if (std::regex_search(peer, match, bare)) {
        return match[1].str();
    }

    return ::strtrim(peer);
}

/* Extracts the value of the named parameter from a SIP header value. */

std::string SIPUtils::parameter(const std::string& value, const std::string& name)
{
    std::string key = ";" + ::strtolower(name) + "=";
    std::string lower = ::strtolower(value);

    size_t pos = lower.find(key);
    if (pos == std::string::npos)
        return std::string();

    pos += key.size();
    size_t end = value.find_first_of(";,> \t", pos);
    if (end == std::string::npos)
        end = value.size();

    return value.substr(pos, end - pos);
}

/* Builds a Via header value. */

std::string SIPUtils::via(const std::string& transport, const std::string& sentBy)
{
    return std::string(SIP_VERSION "/") + ::strtoupper(transport) + " " + sentBy + ";branch=" + branch();
}
