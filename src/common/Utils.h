// SPDX-License-Identifier: GPL-2.0-only
/*
 * Softphone - Common Library
 * GPLv2 Open Source. Use is subject to license terms.
 * DO NOT ALTER OR REMOVE COPYRIGHT NOTICES OR THIS FILE HEADER.
 *
 *  Copyright (C) 2009,2014,2015 Jonathan Naylor, G4KLX
 *  Copyright (C) 2018-2025 Bryan Biedenkapp, N2PLL
 *
 */
/**
 * @defgroup utils Utility Routines
 * @brief Defines and implements utility routines.
 * @ingroup common
 *
 * @file Utils.h
 * @ingroup utils
 * @file Utils.cpp
 * @ingroup utils
 */
#if !defined(__UTILS_H__)
#define __UTILS_H__

#include "common/Defines.h"

#include <algorithm>
#include <cstring>
#include <string>
#include <vector>

// ---------------------------------------------------------------------------
//  Inlines
// ---------------------------------------------------------------------------

/**
 * @brief Helper to lower-case an input string.
 * @ingroup utils
 * @param value String to lower-case.
 * @return std::string Lowercased string.
 */
inline std::string strtolower(const std::string value) {
    std::string v = value;
    std::transform(v.begin(), v.end(), v.begin(), ::tolower);
    return v;
}

/**
 * @brief Helper to upper-case an input string.
 * @ingroup utils
 * @param value String to upper-case.
 * @return std::string Uppercased string.
 */
inline std::string strtoupper(const std::string value) {
    std::string v = value;
    std::transform(v.begin(), v.end(), v.begin(), ::toupper);
    return v;
}

/**
 * @brief Helper to strip leading and trailing whitespace from an input string.
 * @ingroup utils
 * @param value String to trim.
 * @return std::string Trimmed string.
 */
inline std::string strtrim(const std::string value) {
    const char* ws = " \t\r\n";
    size_t begin = value.find_first_not_of(ws);
    if (begin == std::string::npos)
        return std::string();

    size_t end = value.find_last_not_of(ws);
    return value.substr(begin, end - begin + 1U);
}

/**
 * @brief Helper to test whether an input string ends with the given suffix.
 * @ingroup utils
 * @param value String to test.
 * @param suffix Suffix.
 * @return bool True, if the string ends with the suffix, otherwise false.
 */
inline bool strendswith(const std::string& value, const std::string& suffix) {
    if (suffix.size() > value.size())
        return false;
    return value.compare(value.size() - suffix.size(), suffix.size(), suffix) == 0;
}

// ---------------------------------------------------------------------------
//  Class Declaration
// ---------------------------------------------------------------------------

/**
 * @brief Various helper utilities.
 * @ingroup utils
 */
class SOFTPHONE_API Utils {
public:
    /**
     * @brief Helper to dump the input buffer and display the hexadecimal output in the log.
     * @param title Name of buffer.
     * @param data Buffer to dump.
     * @param length Length of buffer.
     */
    static void dump(const std::string& title, const uint8_t* data, uint32_t length);
    /**
     * @brief Helper to dump the input buffer and display the hexadecimal output in the log.
     * @param level Log level.
     * @param title Name of buffer.
     * @param data Buffer to dump.
     * @param length Length of buffer.
     */
    static void dump(int level, const std::string& title, const uint8_t* data, uint32_t length);

    /**
     * @brief Helper to encode a buffer as base64 text.
     * @param data Buffer to encode.
     * @param length Length of buffer.
     * @returns std::string Base64 text.
     */
    static std::string base64Encode(const uint8_t* data, uint32_t length);
    /**
     * @brief Helper to decode base64 text.
     * @param[in] text Base64 text.
     * @param[out] output Decoded bytes.
     * @returns bool True, if the text was valid base64, otherwise false.
     */
    static bool base64Decode(const std::string& text, std::vector<uint8_t>& output);

    /**
     * @brief Helper to generate a uniformly distributed random number.
     * @param min Minimum value (inclusive).
     * @param max Maximum value (inclusive).
     * @returns uint32_t Random number.
     */
    static uint32_t random(uint32_t min = 0U, uint32_t max = 0xFFFFFFFFU);
};

#endif // __UTILS_H__
