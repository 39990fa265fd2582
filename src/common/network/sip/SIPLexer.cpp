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
#include "network/sip/SIPLexer.h"
#include "network/sip/SIPPayload.h"

using namespace network::sip;

#include <cctype>
#include <cstring>

// ---------------------------------------------------------------------------
//  Public Class Members
// ---------------------------------------------------------------------------

/* Initializes a new instance of the SIPLexer class. */

SIPLexer::SIPLexer(bool clientLexer) :
    m_clientLexer(clientLexer),
    m_consumed(0U),
    m_startLine(true),
    m_sawCR(false),
    m_line(),
    m_headers()
{
    /* stub */
}

/* Reset to initial lexer state. */

void SIPLexer::reset()
{
    m_consumed = 0U;
    m_startLine = true;
    m_sawCR = false;
    m_line.clear();
    m_headers.clear();
}

// ---------------------------------------------------------------------------
//  Private Class Members
// ---------------------------------------------------------------------------

/* Handle the next character of input. */

SIPLexer::ResultType SIPLexer::consume(SIPPayload& payload, char input)
{
    m_consumed++;

    if (m_sawCR) {
        if (input != '\n')
            return BAD;

        m_sawCR = false;
        ResultType result = line(payload);
        m_line.clear();
        return result;
    }

    if (input == '\r') {
        m_sawCR = true;
        return INDETERMINATE;
    }

    // bare control characters never appear in a start or header line (HT is whitespace)
    unsigned char c = (unsigned char)input;
    if ((c < 0x20U && c != '\t') || c == 0x7FU)
        return BAD;

    if (m_line.size() >= SIP_MAX_LINE_LEN)
        return BAD;

    m_line.push_back(input);
    return INDETERMINATE;
}

/* Handle a complete line (without its CRLF). */

SIPLexer::ResultType SIPLexer::line(SIPPayload& payload)
{
    if (m_startLine) {
        m_startLine = false;
        bool ok = (m_clientLexer) ? statusLine(payload) : requestLine(payload);
        return (ok) ? INDETERMINATE : BAD;
    }

    // end of the header block
    if (m_line.empty()) {
        for (auto& header : m_headers) {
            payload.headers.append(std::get<0>(header), std::get<1>(header));
        }

        return GOOD;
    }

    // folded continuation of the previous header value
    if (m_line[0U] == ' ' || m_line[0U] == '\t') {
        if (m_headers.empty())
            return BAD;

        size_t start = m_line.find_first_not_of(" \t");
        if (start != std::string::npos) {
            std::string& value = std::get<1>(m_headers.back());
            if (!value.empty())
                value.push_back(' ');
            value.append(m_line, start, std::string::npos);
        }

        return INDETERMINATE;
    }

    size_t colon = m_line.find(':');
    if (colon == std::string::npos)
        return BAD;

    // whitespace is allowed between the name and the colon
    size_t nameEnd = m_line.find_last_not_of(" \t", colon == 0U ? 0U : colon - 1U);
    if (colon == 0U || nameEnd == std::string::npos)
        return BAD;

    std::string name;
    for (size_t i = 0U; i <= nameEnd; i++) {
        if (!isToken(m_line[i]))
            return BAD;
        name.push_back((char)::tolower((unsigned char)m_line[i]));
    }

    std::string value;
    size_t valueStart = m_line.find_first_not_of(" \t", colon + 1U);
    if (valueStart != std::string::npos) {
        size_t valueEnd = m_line.find_last_not_of(" \t");
        value = m_line.substr(valueStart, valueEnd - valueStart + 1U);
    }

    m_headers.emplace_back(name, value);
    return INDETERMINATE;
}

/* Lexes a request line ("METHOD URI SIP/2.0"). */

bool SIPLexer::requestLine(SIPPayload& payload)
{
    size_t sp1 = m_line.find(' ');
    if (sp1 == std::string::npos || sp1 == 0U)
        return false;
    size_t sp2 = m_line.find(' ', sp1 + 1U);
    if (sp2 == std::string::npos || sp2 == sp1 + 1U)
        return false;

    std::string method = m_line.substr(0U, sp1);
    for (char c : method) {
        if (!isToken(c))
            return false;
    }

    payload.method = method;
    payload.uri = m_line.substr(sp1 + 1U, sp2 - sp1 - 1U);
    return version(m_line.substr(sp2 + 1U), payload);
}

/* Lexes a status line ("SIP/2.0 200 OK"). */

bool SIPLexer::statusLine(SIPPayload& payload)
{
    size_t sp1 = m_line.find(' ');
    if (sp1 == std::string::npos)
        return false;
    if (!version(m_line.substr(0U, sp1), payload))
        return false;

    // the status code is exactly three digits, followed by an optional reason phrase
    std::string rest = m_line.substr(sp1 + 1U);
    if (rest.size() < 3U)
        return false;
    for (size_t i = 0U; i < 3U; i++) {
        if (!::isdigit((unsigned char)rest[i]))
            return false;
    }
    if (rest.size() > 3U && rest[3U] != ' ')
        return false;

    int status = (rest[0U] - '0') * 100 + (rest[1U] - '0') * 10 + (rest[2U] - '0');
    if (status < 100)
        return false;

    payload.status = (SIPPayload::StatusType)status;
    payload.reason = (rest.size() > 4U) ? rest.substr(4U) : std::string();
    return true;
}

/* Lexes a "SIP/major.minor" version token. */

bool SIPLexer::version(const std::string& token, SIPPayload& payload)
{
    if (token.size() < 7U || token.compare(0U, 4U, "SIP/") != 0)
        return false;

    size_t dot = token.find('.', 4U);
    if (dot == std::string::npos || dot == 4U || dot == token.size() - 1U)
        return false;

    int major = 0, minor = 0;
    for (size_t i = 4U; i < token.size(); i++) {
        if (i == dot)
            continue;
        if (!::isdigit((unsigned char)token[i]))
            return false;
        if (i < dot)
            major = major * 10 + (token[i] - '0');
        else
            minor = minor * 10 + (token[i] - '0');
    }

    payload.sipVersionMajor = major;
    payload.sipVersionMinor = minor;
    return true;
}

/* Check if a character is valid in a SIP token. */

bool SIPLexer::isToken(char c)
{
    if (::isalnum((unsigned char)c))
        return true;
    return ::strchr("-.!%*_+`'~", c) != nullptr && c != '\0';
}
