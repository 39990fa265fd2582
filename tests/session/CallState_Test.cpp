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
#include "softphone/session/CallState.h"

using namespace session;

#include <catch2/catch_test_macros.hpp>

TEST_CASE("CallState", "[Session Test]") {
    SECTION("Legal_Test") {
        REQUIRE(CallStateTable::isLegal(CallState::INITIATING, CallState::RINGING));
        REQUIRE(CallStateTable::isLegal(CallState::INITIATING, CallState::CANCELED));
        REQUIRE(CallStateTable::isLegal(CallState::RINGING, CallState::ANSWERED));
        REQUIRE(CallStateTable::isLegal(CallState::RINGING, CallState::BUSY));
        REQUIRE(CallStateTable::isLegal(CallState::ANSWERED, CallState::DISPOSED));
        REQUIRE(CallStateTable::isLegal(CallState::BUSY, CallState::DISPOSED));
        REQUIRE(CallStateTable::isLegal(CallState::CANCELED, CallState::DISPOSED));
    }

    SECTION("Illegal_Test") {
        REQUIRE_FALSE(CallStateTable::isLegal(CallState::ANSWERED, CallState::RINGING));
        REQUIRE_FALSE(CallStateTable::isLegal(CallState::ANSWERED, CallState::CANCELED));
        REQUIRE_FALSE(CallStateTable::isLegal(CallState::RINGING, CallState::INITIATING));

        // disposed is terminal
        const CallState::E all[] = { CallState::INITIATING, CallState::RINGING, CallState::ANSWERED,
            CallState::BUSY, CallState::CANCELED, CallState::DISPOSED };
        for (CallState::E state : all) {
            REQUIRE_FALSE(CallStateTable::isLegal(CallState::DISPOSED, state));
        }
    }

    SECTION("ToString_Test") {
        REQUIRE(CallStateTable::toString(CallState::INITIATING) == "INITIATING");
        REQUIRE(CallStateTable::toString(CallState::ANSWERED) == "ANSWERED");
        REQUIRE(CallStateTable::toString(CallState::DISPOSED) == "DISPOSED");
        REQUIRE(CallStateTable::toString((CallState::E)0x7FU) == "UNKNOWN");
    }
}
