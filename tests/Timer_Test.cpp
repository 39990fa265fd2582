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
#include "common/Timer.h"

#include <catch2/catch_test_macros.hpp>

TEST_CASE("Timer", "[Timer Test]") {
    SECTION("Period_Test") {
        Timer timer(1000U, 0U, 20U);
        REQUIRE(timer.getPeriod() == 20U);
        REQUIRE_FALSE(timer.isRunning());

        // not running, no time accumulates
        timer.clock(100U);
        REQUIRE_FALSE(timer.hasExpired());

        timer.start();
        timer.clock(19U);
        REQUIRE_FALSE(timer.consume());
        timer.clock(1U);
        REQUIRE(timer.consume());
        REQUIRE_FALSE(timer.consume());
    }

    SECTION("CarryOver_Test") {
        Timer timer(1000U, 0U, 20U);
        timer.start();

        // a late clock yields every elapsed period
        timer.clock(65U);
        uint32_t periods = 0U;
        while (timer.consume())
            periods++;
        REQUIRE(periods == 3U);

        timer.clock(15U);
        REQUIRE(timer.consume());
    }

    SECTION("Pause_Test") {
        Timer timer(1000U, 0U, 20U);
        timer.start();
        timer.pause();
        REQUIRE(timer.isPaused());
        timer.clock(40U);
        REQUIRE_FALSE(timer.consume());

        timer.resume();
        timer.clock(20U);
        REQUIRE(timer.consume());

        timer.stop();
        REQUIRE_FALSE(timer.isRunning());
        REQUIRE_FALSE(timer.hasExpired());
    }
}
