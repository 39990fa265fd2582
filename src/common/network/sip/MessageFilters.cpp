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
#include "network/sip/MessageFilters.h"
#include "Utils.h"

using namespace network::sip;

// ---------------------------------------------------------------------------
//  Static Class Members
// ---------------------------------------------------------------------------

/* Accepts messages carrying the given Call-ID. */

MessageFilter MessageFilters::callId(const std::string& callId)
{
    std::string id = ::strtrim(callId);
    return [id](const SIPPayload& message) {
        return ::strtrim(message.callId()) == id;
    };
}

/* Accepts requests with the given method. */

MessageFilter MessageFilters::request(const std::string& method)
{
    std::string m = ::strtoupper(method);
    return [m](const SIPPayload& message) {
        return message.isClientPayload && ::strtoupper(message.method) == m;
    };
}

/* Accepts responses with the given status. */

MessageFilter MessageFilters::response(SIPPayload::StatusType status)
{
    return [status](const SIPPayload& message) {
        return !message.isClientPayload && message.status == status;
    };
}

/* Accepts messages whose CSeq names the given method. */

MessageFilter MessageFilters::cseqMethod(const std::string& method)
{
    std::string m = ::strtoupper(method);
    return [m](const SIPPayload& message) {
        return message.cseqMethod() == m;
    };
}

/* Accepts messages accepted by both predicates. */

MessageFilter MessageFilters::both(MessageFilter a, MessageFilter b)
{
    return [a, b](const SIPPayload& message) {
        return a(message) && b(message);
    };
}
