// SPDX-License-Identifier: GPL-2.0-only
/*
 * Softphone - Common Library
 * GPLv2 Open Source. Use is subject to license terms.
 * DO NOT ALTER OR REMOVE COPYRIGHT NOTICES OR THIS FILE HEADER.
 *
 *  Copyright (C) 2009,2010,2011,2014 Jonathan Naylor, G4KLX
 *  Copyright (C) 2017-2019,2025 Bryan Biedenkapp, N2PLL
 *
 */
/**
 * @defgroup timers Timers
 * @brief Defines and implements timing routines driven by an external clock.
 * @ingroup common
 *
 * @file Timer.h
 * @ingroup timers
 * @file Timer.cpp
 * @ingroup timers
 */
#if !defined(__TIMER_H__)
#define __TIMER_H__

#include "common/Defines.h"

// ---------------------------------------------------------------------------
//  Class Declaration
// ---------------------------------------------------------------------------

/**
 * @brief Periodic timer advanced by an external clock; marks each elapsed period so that callers
 *  pacing work (e.g. media frames) can catch up when the clock is driven late.
 * @ingroup timers
 */
class SOFTPHONE_API Timer {
public:
    /**
     * @brief Initializes a new instance of the Timer class.
     * @param ticksPerSec Count of ticks per second.
     * @param secs Number of seconds in a timer period.
     * @param msecs Number of milliseconds in a timer period.
     */
    Timer(uint32_t ticksPerSec, uint32_t secs = 0U, uint32_t msecs = 0U);

    /**
     * @brief Sets the period of the timer.
     * @param secs Number of seconds in a timer period.
     * @param msecs Number of milliseconds in a timer period.
     */
    void setPeriod(uint32_t secs, uint32_t msecs = 0U);
    /**
     * @brief Gets the period of the timer.
     * @returns uint32_t Timer period in ticks.
     */
    uint32_t getPeriod() const { return m_period; }

    /**
     * @brief Flag indicating whether the timer is running.
     * @return bool True, if the timer is running, otherwise false.
     */
    bool isRunning() const { return m_running; }
    /**
     * @brief Flag indicating whether the timer is paused.
     * @return bool True, if the timer is paused, otherwise false.
     */
    bool isPaused() const { return m_paused; }

    /**
     * @brief Starts the timer; the first period begins now.
     */
    void start();
    /**
     * @brief Stops the timer and discards any elapsed time.
     */
    void stop();
    /**
     * @brief Pauses the timer; elapsed time is kept.
     */
    void pause() { m_paused = true; }
    /**
     * @brief Resumes the timer.
     */
    void resume() { m_paused = false; }

    /**
     * @brief Flag indicating whether at least one full period has elapsed.
     * @return bool True, if a period has elapsed, otherwise false.
     */
    bool hasExpired() const { return m_running && m_period > 0U && m_elapsed >= m_period; }
    /**
     * @brief Consumes one elapsed period; time elapsed beyond the period carries over.
     * @return bool True, if a period was consumed, otherwise false.
     */
    bool consume();

    /**
     * @brief Updates the timer by the passed number of ticks.
     * @param ticks Number of passed ticks.
     */
    void clock(uint32_t ticks = 1U);

private:
    uint32_t m_ticksPerSec;
    uint32_t m_period;
    uint32_t m_elapsed;

    bool m_running;
    bool m_paused;
};

#endif // __TIMER_H__
