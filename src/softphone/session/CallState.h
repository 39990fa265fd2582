// SPDX-License-Identifier: GPL-2.0-only
/*
 * Softphone - Call Session Library
 * GPLv2 Open Source. Use is subject to license terms.
 * DO NOT ALTER OR REMOVE COPYRIGHT NOTICES OR THIS FILE HEADER.
 *
 *  Copyright (C) 2025 Softphone Project Contributors
 *
 */
/**
 * @defgroup session Call Session
 * @brief Implementation for the call session state machine.
 * @ingroup softphone
 *
 * @file CallState.h
 * @ingroup session
 * @file CallState.cpp
 * @ingroup session
 */
#if !defined(__CALL_STATE_H__)
#define __CALL_STATE_H__

#include "Defines.h"

#include <string>

namespace session
{
    // ---------------------------------------------------------------------------
    //  Constants
    // ---------------------------------------------------------------------------

    /**
     * @brief Call Session States
     * @ingroup session
     */
    namespace CallState {
        /** @brief Call Session States */
        enum E : uint8_t {
            INITIATING = 0x00U,                 //! Signaling in progress
            RINGING = 0x01U,                    //! Remote party alerting
            ANSWERED = 0x02U,                   //! Media active
            BUSY = 0x03U,                       //! Remote party busy
            CANCELED = 0x04U,                   //! Canceled before answer
            DISPOSED = 0x05U                    //! Terminal
        };
    }

    // ---------------------------------------------------------------------------
    //  Class Declaration
    // ---------------------------------------------------------------------------

    /**
     * @brief Implements the call session state transition table.
     * @ingroup session
     *
     * | From       | To                                          |
     * | ---------- | ------------------------------------------- |
     * | INITIATING | RINGING, ANSWERED, BUSY, CANCELED, DISPOSED |
     * | RINGING    | ANSWERED, BUSY, CANCELED, DISPOSED          |
     * | ANSWERED   | DISPOSED                                    |
     * | BUSY       | DISPOSED                                    |
     * | CANCELED   | DISPOSED                                    |
     * | DISPOSED   |                                             |
     */
    class SOFTPHONE_API CallStateTable {
    public:
        /**
         * @brief Flag indicating whether the transition between the given states is legal.
         * @param from Current state.
         * @param to Next state.
         * @returns bool True, if the transition is legal, otherwise false.
         */
        static bool isLegal(CallState::E from, CallState::E to);

        /**
         * @brief Gets the textual name of a state.
         * @param state State.
         * @returns std::string Name of the state.
         */
        static std::string toString(CallState::E state);
    };
} // namespace session

#endif // __CALL_STATE_H__
