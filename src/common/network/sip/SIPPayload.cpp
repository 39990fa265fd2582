// SPDX-License-Identifier: BSL-1.0
/*
 * Softphone - Common Library
 * BSL-1.0 Open Source. Use is subject to license terms.
 * DO NOT ALTER OR REMOVE COPYRIGHT NOTICES OR THIS FILE HEADER.
 *
 *  Copyright (c) 2003-2013 Christopher M. Kohlhoff
 *  Copyright (C) 2023-2025 Bryan Biedenkapp, N2PLL
 *
 */
#include "Defines.h"
#include "network/sip/SIPPayload.h"
#include "network/sip/SIPLexer.h"
#include "Log.h"
#include "Utils.h"

using namespace network::sip;

#include <cstdlib>
#include <algorithm>
#include <string>
#include <tuple>

namespace status_strings {
    const std::string trying = "Trying";
    const std::string ringing = "Ringing";
    const std::string session_progress = "Session Progress";
    const std::string ok = "OK";
    const std::string accepted = "Accepted";
    const std::string no_notify = "No Notification";
    const std::string multiple_choices = "Multiple Choices";
    const std::string moved_permanently = "Moved Permanently";
    const std::string moved_temporarily = "Moved Temporarily";
    const std::string bad_request = "Bad Request";
    const std::string unauthorized = "Unauthorized";
    const std::string forbidden = "Forbidden";
    const std::string not_found = "Not Found";
    const std::string call_does_not_exist = "Call/Transaction Does Not Exist";
    const std::string busy_here = "Busy Here";
    const std::string request_terminated = "Request Terminated";
    const std::string internal_server_error = "Internal Server Error";
    const std::string not_implemented = "Not Implemented";
    const std::string bad_gateway = "Bad Gateway";
    const std::string service_unavailable = "Service Unavailable";
    const std::string busy_everywhere = "Busy Everywhere";
    const std::string decline = "Decline";

    const std::string& toString(SIPPayload::StatusType status)
    {
        switch (status)
        {
        case SIPPayload::TRYING:
            return trying;
        case SIPPayload::RINGING:
            return ringing;
        case SIPPayload::SESSION_PROGRESS:
            return session_progress;
        case SIPPayload::OK:
            return ok;
        case SIPPayload::ACCEPTED:
            return accepted;
        case SIPPayload::NO_NOTIFY:
            return no_notify;
        case SIPPayload::MULTIPLE_CHOICES:
            return multiple_choices;
        case SIPPayload::MOVED_PERMANENTLY:
            return moved_permanently;
        case SIPPayload::MOVED_TEMPORARILY:
            return moved_temporarily;
        case SIPPayload::BAD_REQUEST:
            return bad_request;
        case SIPPayload::UNAUTHORIZED:
            return unauthorized;
        case SIPPayload::FORBIDDEN:
            return forbidden;
        case SIPPayload::NOT_FOUND:
            return not_found;
        case SIPPayload::CALL_DOES_NOT_EXIST:
            return call_does_not_exist;
        case SIPPayload::BUSY_HERE:
            return busy_here;
        case SIPPayload::REQUEST_TERMINATED:
            return request_terminated;
        case SIPPayload::INTERNAL_SERVER_ERROR:
            return internal_server_error;
        case SIPPayload::NOT_IMPLEMENTED:
            return not_implemented;
        case SIPPayload::BAD_GATEWAY:
            return bad_gateway;
        case SIPPayload::SERVICE_UNAVAILABLE:
            return service_unavailable;
        case SIPPayload::BUSY_EVERYWHERE:
            return busy_everywhere;
        case SIPPayload::DECLINE:
            return decline;
        default:
            return internal_server_error;
        }
    }
} // namespace status_strings

namespace misc_strings {
    const char name_value_separator[] = { ':', ' ' };
    const char crlf[] = { '\r', '\n' };
} // namespace misc_strings

// ---------------------------------------------------------------------------
//  Public Class Members
// ---------------------------------------------------------------------------

/* Convert the payload into a vector of buffers. */

std::vector<asio::const_buffer> SIPPayload::toBuffers()
{
    std::vector<asio::const_buffer> buffers;
    if (isClientPayload) {
        // copy method and erase zero terminator
        method.erase(std::find(method.begin(), method.end(), '\0'), method.end());

        // copy URI and erase zero terminator
        uri.erase(std::find(uri.begin(), uri.end(), '\0'), uri.end());
#if DEBUG_SIP_PAYLOAD
        ::LogDebugEx(LOG_SIP, "SIPPayload::toBuffers()", "method = %s, uri = %s", method.c_str(), uri.c_str());
#endif
    }

    m_startLine = subject();
    buffers.push_back(asio::buffer(m_startLine));
    buffers.push_back(asio::buffer(misc_strings::crlf));

    for (std::size_t i = 0; i < headers.size(); ++i) {
        SIPHeaders::Header& h = headers.m_headers[i];
#if DEBUG_SIP_PAYLOAD
        ::LogDebugEx(LOG_SIP, "SIPPayload::toBuffers()", "header = %s, value = %s", h.name.c_str(), h.value.c_str());
#endif

        buffers.push_back(asio::buffer(h.name));
        buffers.push_back(asio::buffer(misc_strings::name_value_separator));
        buffers.push_back(asio::buffer(h.value));
        buffers.push_back(asio::buffer(misc_strings::crlf));
    }

    buffers.push_back(asio::buffer(misc_strings::crlf));
    if (content.size() > 0)
        buffers.push_back(asio::buffer(content));

    return buffers;
}

/* Convert the payload into its wire text. */

std::string SIPPayload::toString()
{
    std::string text;
    for (auto buffer : toBuffers()) {
        text.append((const char*)buffer.data(), buffer.size());
    }

    return text;
}

/* Prepares payload for transmission by finalizing status and content type. */

void SIPPayload::payload(const std::string& c, SIPPayload::StatusType s, const std::string& contentType)
{
    content = c;
    if (!isClientPayload)
        status = s;
    ensureDefaultHeaders(contentType);
}

/* Gets the first line of the message. */

std::string SIPPayload::subject() const
{
    if (isClientPayload) {
        return method + " " + uri + " " + SIP_VERSION;
    }

    std::string phrase = reason.empty() ? reasonPhrase(status) : reason;
    return std::string(SIP_VERSION) + " " + std::to_string((int)status) + " " + phrase;
}

/* Gets the method named in the CSeq header. */

std::string SIPPayload::cseqMethod() const
{
    std::string cseq = ::strtrim(headers.find("CSeq"));
    size_t pos = cseq.find_last_of(' ');
    if (pos == std::string::npos)
        return std::string();

    return ::strtoupper(cseq.substr(pos + 1U));
}

/* Gets the sequence number named in the CSeq header. */

uint32_t SIPPayload::cseqNumber() const
{
    std::string cseq = ::strtrim(headers.find("CSeq"));
    return (uint32_t)::strtoul(cseq.c_str(), nullptr, 10);
}

// ---------------------------------------------------------------------------
//  Static Members
// ---------------------------------------------------------------------------

/* Get a request payload. */

SIPPayload SIPPayload::requestPayload(std::string method, std::string uri)
{
    SIPPayload rep;
    rep.isClientPayload = true;
    rep.method = ::strtoupper(method);
    rep.uri = std::string(uri);
    rep.ensureDefaultHeaders();
    return rep;
}

/* Get a status payload. */

SIPPayload SIPPayload::statusPayload(SIPPayload::StatusType status, const std::string& contentType)
{
    SIPPayload rep;
    rep.isClientPayload = false;
    rep.status = status;
    rep.ensureDefaultHeaders(contentType);

    return rep;
}

/* Get a status payload answering the given request. */

SIPPayload SIPPayload::responseTo(const SIPPayload& request, SIPPayload::StatusType status)
{
    SIPPayload rep;
    rep.isClientPayload = false;
    rep.status = status;

    const char* echoed[] = { "Via", "From", "To", "Call-ID", "CSeq" };
    for (const char* name : echoed) {
        std::string value = request.headers.find(name);
        if (!value.empty())
            rep.headers.add(name, value);
    }

    rep.ensureDefaultHeaders();
    return rep;
}

/* Parse SIP message text. */

bool SIPPayload::parse(const std::string& text, SIPPayload& payload)
{
    payload = SIPPayload();

    // responses start with the protocol version, requests with the method
    bool isResponse = text.compare(0U, 4U, "SIP/") == 0;
    payload.isClientPayload = !isResponse;

    SIPLexer lexer(isResponse);
    SIPLexer::ResultType result;
    std::string::const_iterator bodyStart;
    std::tie(result, bodyStart) = lexer.parse(payload, text.begin(), text.end());
    if (result != SIPLexer::GOOD) {
        LogDebugEx(LOG_SIP, "SIPPayload::parse()", "malformed SIP message, consumed = %u", lexer.consumed());
        return false;
    }

    std::string body(bodyStart, text.end());

    std::string contentLength = payload.headers.find("Content-Length");
    if (!contentLength.empty()) {
        size_t len = (size_t)::strtoul(contentLength.c_str(), nullptr, 10);
        if (len < body.size())
            body.resize(len);
    }

    payload.content = body;
    return true;
}

/* Gets the default reason phrase for a SIP status. */

std::string SIPPayload::reasonPhrase(SIPPayload::StatusType status)
{
    return status_strings::toString(status);
}

// ---------------------------------------------------------------------------
//  Private Members
// ---------------------------------------------------------------------------

/* Internal helper to ensure the headers are of a default for the given content type. */

void SIPPayload::ensureDefaultHeaders(const std::string& contentType)
{
    if (!isClientPayload) {
        headers.add("Server", SOFTPHONE_USER_AGENT);
    }
    else {
        headers.add("Max-Forwards", "70");
        headers.add("User-Agent", SOFTPHONE_USER_AGENT);
    }

    if (!content.empty()) {
        headers.add("Content-Type", std::string(contentType));
    }
    else {
        headers.remove("Content-Type");
    }

    headers.add("Content-Length", std::to_string(content.size()));
}
