// SPDX-License-Identifier: GPL-2.0-only
/*
 * Softphone - Common Library
 * GPLv2 Open Source. Use is subject to license terms.
 * DO NOT ALTER OR REMOVE COPYRIGHT NOTICES OR THIS FILE HEADER.
 *
 *  Copyright (C) 2009,2010,2015 Jonathan Naylor, G4KLX
 *  Copyright (C) 2017-2019,2025 Bryan Biedenkapp, N2PLL
 *
 */
#include "Defines.h"
#include "Timer.h"

// ---------------------------------------------------------------------------
//  Public Class Members
// ---------------------------------------------------------------------------

/* Initializes a new instance of the Timer class. */

Timer::Timer(uint32_t ticksPerSec, uint32_t secs, uint32_t msecs) :
    m_ticksPerSec(ticksPerSec > 0U ? ticksPerSec : 1000U),
    m_period(0U),
    m_elapsed(0U),
    m_running(false),
    m_paused(false)
{
    setPeriod(secs, msecs);
}

/* Sets the period of the timer. */

void Timer::setPeriod(uint32_t secs, uint32_t msecs)
{
    ulong64_t temp = (secs * 1000ULL + msecs) * m_ticksPerSec;
    m_period = (uint32_t)(temp / 1000ULL);
    if (m_period == 0U && (secs > 0U || msecs > 0U))
        m_period = 1U;
}

/* Starts the timer. */

void Timer::start()
{
    m_elapsed = 0U;
    m_running = m_period > 0U;
    m_paused = false;
}

/* Stops the timer. */

void Timer::stop()
{
    m_elapsed = 0U;
    m_running = false;
    m_paused = false;
}

/* Consumes one elapsed period. */

bool Timer::consume()
{
    if (!hasExpired())
        return false;

    m_elapsed -= m_period;
    return true;
}

/* Updates the timer by the passed number of ticks. */

void Timer::clock(uint32_t ticks)
{
    if (!m_running || m_paused)
        return;

    m_elapsed += ticks;
}
