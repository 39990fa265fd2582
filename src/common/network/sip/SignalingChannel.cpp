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
#include "network/sip/SignalingChannel.h"
#include "Log.h"

#include <algorithm>

using namespace network::sip;

// ---------------------------------------------------------------------------
//  Public Class Members
// ---------------------------------------------------------------------------

/* Finalizes a instance of the Subscription class. */

Subscription::~Subscription()
{
    unsubscribe();
}

/* Removes the listener from the channel. */

void Subscription::unsubscribe()
{
    if (m_entry != nullptr) {
        m_entry->active = false;
    }
}

/* Flag indicating whether the listener is still registered. */

bool Subscription::isActive() const
{
    return m_entry != nullptr && m_entry->active;
}

// ---------------------------------------------------------------------------
//  Private Class Members
// ---------------------------------------------------------------------------

/* Initializes a new instance of the Subscription class. */

Subscription::Subscription(std::shared_ptr<Entry> entry) :
    m_entry(entry)
{
    /* stub */
}

// ---------------------------------------------------------------------------
//  Public Class Members
// ---------------------------------------------------------------------------

/* Initializes a new instance of the SignalingChannel class. */

SignalingChannel::SignalingChannel() :
    m_lock(),
    m_entries()
{
    /* stub */
}

/* Finalizes a instance of the SignalingChannel class. */

SignalingChannel::~SignalingChannel()
{
    std::lock_guard<std::mutex> lock(m_lock);
    for (auto& entry : m_entries) {
        entry->active = false;
    }

    m_entries.clear();
}

/* Registers a listener for inbound SIP messages. */

std::unique_ptr<Subscription> SignalingChannel::subscribe(MessageFilter filter, MessageHandler handler)
{
    std::shared_ptr<Subscription::Entry> entry = std::make_shared<Subscription::Entry>(filter, handler);

    {
        std::lock_guard<std::mutex> lock(m_lock);
        prune();
        m_entries.push_back(entry);
    }

    return std::unique_ptr<Subscription>(new Subscription(entry));
}

/* Delivers an inbound SIP message to every registered listener whose filter accepts it. */

void SignalingChannel::dispatch(const SIPPayload& message)
{
    // handlers may subscribe or unsubscribe while we walk the list, so walk a snapshot
    std::vector<std::shared_ptr<Subscription::Entry>> entries;
    {
        std::lock_guard<std::mutex> lock(m_lock);
        prune();
        entries = m_entries;
    }

    for (auto& entry : entries) {
        if (!entry->active)
            continue;
        if (entry->filter && !entry->filter(message))
            continue;

        if (entry->handler)
            entry->handler(message);
    }
}

/* Parses and delivers an inbound SIP message. */

bool SignalingChannel::dispatch(const std::string& text)
{
    SIPPayload message;
    if (!SIPPayload::parse(text, message)) {
        LogWarning(LOG_SIP, "discarding malformed inbound SIP message, len = %u", (uint32_t)text.size());
        return false;
    }

    dispatch(message);
    return true;
}

/* Gets the number of registered listeners. */

size_t SignalingChannel::subscriptionCount()
{
    std::lock_guard<std::mutex> lock(m_lock);
    prune();
    return m_entries.size();
}

// ---------------------------------------------------------------------------
//  Private Class Members
// ---------------------------------------------------------------------------

/* Internal helper to drop listeners that have been unsubscribed. */

void SignalingChannel::prune()
{
    m_entries.erase(std::remove_if(m_entries.begin(), m_entries.end(), [](const std::shared_ptr<Subscription::Entry>& entry) {
        return !entry->active;
    }), m_entries.end());
}
