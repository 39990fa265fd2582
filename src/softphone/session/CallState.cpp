// SPDX-License-Identifier: GPL-2.0-only
/*
 * Softphone - Call Session Library
 * GPLv2 Open Source. Use is subject to license terms.
 * DO NOT ALTER OR REMOVE COPYRIGHT NOTICES OR THIS FILE HEADER.
 *
 *  Copyright (C) 2025 Softphone Project Contributors
 *
 */
#include "Defines.h"
#include "session/CallState.h"

using namespace session;

// ---------------------------------------------------------------------------
//  Static Class Members
// ---------------------------------------------------------------------------

/* Flag indicating whether the transition between the given states is legal. */

bool CallStateTable::isLegal(CallState::E from, CallState::E to)
{
    switch (from) {
    case CallState::INITIATING:
        return to == CallState::RINGING || to == CallState::ANSWERED || to == CallState::BUSY ||
            to == CallState::CANCELED || to == CallState::DISPOSED;
    case CallState::RINGING:
        return to == CallState::ANSWERED || to == CallState::BUSY || to == CallState::CANCELED ||
            to == CallState::DISPOSED;
    case CallState::ANSWERED:
    case CallState::BUSY:
    case CallState::CANCELED:
        return to == CallState::DISPOSED;
    case CallState::DISPOSED:
    default:
        return false;
    }
}

/* Gets the textual name of a state. */

std::string CallStateTable::toString(CallState::E state)
{
    switch (state) {
    case CallState::INITIATING:
        return "INITIATING";
    case CallState::RINGING:
        return "RINGING";
    case CallState::ANSWERED:
        return "ANSWERED";
    case CallState::BUSY:
        return "BUSY";
    case CallState::CANCELED:
        return "CANCELED";
    case CallState::DISPOSED:
        return "DISPOSED";
    default:
        return "UNKNOWN";
    }
}
