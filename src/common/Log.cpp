// SPDX-License-Identifier: GPL-2.0-only
/*
 * Softphone - Common Library
 * GPLv2 Open Source. Use is subject to license terms.
 * DO NOT ALTER OR REMOVE COPYRIGHT NOTICES OR THIS FILE HEADER.
 *
 *  Copyright (C) 2015,2016 Jonathan Naylor, G4KLX
 *  Copyright (C) 2018-2025 Bryan Biedenkapp, N2PLL
 *
 */
#include "Log.h"

#include <sys/time.h>
#include <syslog.h>

#if defined(CATCH2_TEST_COMPILATION)
#include <catch2/catch_test_macros.hpp>
#endif

#include <cstdio>
#include <cstdarg>
#include <ctime>
#include <cstring>
#include <mutex>

// ---------------------------------------------------------------------------
//  Constants
// ---------------------------------------------------------------------------

#define EOL    "\r\n"

const uint32_t LOG_BUFFER_LEN = 4096U;

// ---------------------------------------------------------------------------
//  Global Variables
// ---------------------------------------------------------------------------

static uint32_t m_fileLevel = 0U;
static std::string m_filePath;
static std::string m_fileRoot;

static FILE* m_fpLog = nullptr;
static struct tm m_tm;

uint32_t g_logDisplayLevel = 2U;
bool g_disableTimeDisplay = false;
bool g_useSyslog = false;

static std::mutex m_logLock;

static char LEVELS[] = " DMIWEF";

// ---------------------------------------------------------------------------
//  Global Functions
// ---------------------------------------------------------------------------

/* Helper to map a log level onto a syslog priority. */

static int SyslogPriority(uint32_t level)
{
    switch (level) {
    case 1U:
        return LOG_DEBUG;
    case 2U:
        return LOG_NOTICE;
    case 3U:
        return LOG_INFO;
    case 4U:
        return LOG_WARNING;
    case 5U:
        return LOG_ERR;
    default:
        return LOG_CRIT;
    }
}

/* Helper to open the daily log file (or syslog), rotating the file when the day changes. */

static bool LogOpen()
{
    if (m_fileLevel == 0U)
        return true;

    if (g_useSyslog) {
        ::setlogmask(LOG_UPTO(SyslogPriority(m_fileLevel)));
        ::openlog(m_fileRoot.c_str(), LOG_CONS | LOG_PID | LOG_NDELAY, LOG_USER);
        return true;
    }

    time_t now;
    ::time(&now);
    struct tm* tm = ::localtime(&now);

    bool sameDay = tm->tm_mday == m_tm.tm_mday && tm->tm_mon == m_tm.tm_mon && tm->tm_year == m_tm.tm_year;
    if (sameDay && m_fpLog != nullptr)
        return true;

    if (m_fpLog != nullptr) {
        ::fclose(m_fpLog);
        m_fpLog = nullptr;
    }

    char filename[256U];
    ::snprintf(filename, sizeof(filename), "%s/%s-%04d-%02d-%02d.log", m_filePath.c_str(), m_fileRoot.c_str(),
        tm->tm_year + 1900, tm->tm_mon + 1, tm->tm_mday);

    m_fpLog = ::fopen(filename, "a+t");
    m_tm = *tm;

    return m_fpLog != nullptr;
}

/* Helper to format the level, timestamp, module and (for debug entries) source location prefix. */

static size_t LogPrefix(char* buffer, uint32_t level, const char* module, const char* file, const int lineNo, const char* func)
{
    size_t len = 0U;
    if (!g_disableTimeDisplay && !g_useSyslog) {
        struct timeval now;
        ::gettimeofday(&now, nullptr);
        struct tm* tm = ::localtime(&now.tv_sec);

        len = ::snprintf(buffer, LOG_BUFFER_LEN, "%c: %04d-%02d-%02d %02d:%02d:%02d.%03lu ", LEVELS[level],
            tm->tm_year + 1900, tm->tm_mon + 1, tm->tm_mday, tm->tm_hour, tm->tm_min, tm->tm_sec,
            (unsigned long)(now.tv_usec / 1000U));
    }
    else {
        len = ::snprintf(buffer, LOG_BUFFER_LEN, "%c: ", LEVELS[level]);
    }

    if (module != nullptr)
        len += ::snprintf(buffer + len, LOG_BUFFER_LEN - len, "(%s) ", module);

    // debug entries carry their source location
    if (level == 1U) {
        if (func != nullptr)
            len += ::snprintf(buffer + len, LOG_BUFFER_LEN - len, "%s ", func);
        else if (file != nullptr)
            len += ::snprintf(buffer + len, LOG_BUFFER_LEN - len, "[%s:%d] ", file, lineNo);
    }

    return (len < LOG_BUFFER_LEN) ? len : LOG_BUFFER_LEN - 1U;
}

/* Helper to get the current log file level. */

uint32_t CurrentLogFileLevel() { return m_fileLevel; }

/* Initializes the diagnostics log. */

bool LogInitialise(const std::string& filePath, const std::string& fileRoot, uint32_t fileLevel, uint32_t displayLevel, bool disableTimeDisplay, bool useSyslog)
{
    std::lock_guard<std::mutex> lock(m_logLock);
    m_filePath = filePath;
    m_fileRoot = fileRoot;
    m_fileLevel = fileLevel;
    g_logDisplayLevel = displayLevel;
    g_disableTimeDisplay = disableTimeDisplay;
    g_useSyslog = useSyslog;

#if defined(CATCH2_TEST_COMPILATION)
    return true;
#else
    return ::LogOpen();
#endif
}

/* Finalizes the diagnostics log. */

void LogFinalise()
{
    std::lock_guard<std::mutex> lock(m_logLock);
    if (m_fpLog != nullptr) {
        ::fclose(m_fpLog);
        m_fpLog = nullptr;
    }

    if (g_useSyslog)
        ::closelog();
}

/* Writes a new entry to the diagnostics log. */

void Log(uint32_t level, const char* module, const char* file, const int lineNo, const char* func, const char* fmt, ...)
{
    if (fmt == nullptr || level == 0U || level > 6U)
        return;

    std::lock_guard<std::mutex> lock(m_logLock);
#if defined(CATCH2_TEST_COMPILATION)
    g_disableTimeDisplay = true;
#endif
    char buffer[LOG_BUFFER_LEN];
    size_t prefixLen = LogPrefix(buffer, level, module, file, lineNo, func);

    va_list vl;
    va_start(vl, fmt);
    ::vsnprintf(buffer + prefixLen, LOG_BUFFER_LEN - prefixLen, fmt, vl);
    va_end(vl);

#if defined(CATCH2_TEST_COMPILATION)
    UNSCOPED_INFO(buffer);
    return;
#endif

    if (m_fileLevel != 0U && level >= m_fileLevel) {
        if (g_useSyslog) {
            ::syslog(SyslogPriority(level), "%s", buffer);
        }
        else if (::LogOpen()) {
            ::fprintf(m_fpLog, "%s\n", buffer);
            ::fflush(m_fpLog);
        }
    }

    if (!g_useSyslog && g_logDisplayLevel != 0U && level >= g_logDisplayLevel) {
        ::fprintf(stdout, "%s" EOL, buffer);
        ::fflush(stdout);
    }
}
