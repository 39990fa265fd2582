// SPDX-License-Identifier: GPL-2.0-only
/*
 * Softphone - Common Library
 * GPLv2 Open Source. Use is subject to license terms.
 * DO NOT ALTER OR REMOVE COPYRIGHT NOTICES OR THIS FILE HEADER.
 *
 *  Copyright (C) 2025 Softphone Project Contributors
 *
 */
/**
 * @file SIPUtils.h
 * @ingroup sip
 * @file SIPUtils.cpp
 * @ingroup sip
 */
#if !defined(__SIP__SIP_UTILS_H__)
#define __SIP__SIP_UTILS_H__

#include "common/Defines.h"

#include <string>

// ---------------------------------------------------------------------------
//  Constants
// ---------------------------------------------------------------------------

/** @brief RFC 3261 branch parameter magic cookie. */
#define SIP_BRANCH_MAGIC_COOKIE "z9hG4bK"

namespace network
{
    namespace sip
    {
        // ---------------------------------------------------------------------------
        //  Class Declaration
        // ---------------------------------------------------------------------------

        /**
         * @brief Helper routines for building SIP requests.
         * @ingroup sip
         */
        class SOFTPHONE_API SIPUtils {
        public:
            /**
             * @brief Generates a new, unique Via branch parameter.
             * @returns std::string Branch parameter.
             */
            static std::string branch();
            /**
             * @brief Generates a new From/To tag.
             * @returns std::string Tag.
             */
            static std::string tag();
            /**
             * @brief Generates a new random UUID (RFC 4122 version 4) string.
             * @returns std::string UUID.
             */
            static std::string uuid();

            /**
             * @brief Extracts the address (user@host, without the "sip:" scheme) from a SIP
             *  address header value such as <tt>"Name" &lt;sip:101@host&gt;;tag=abc</tt>.
             * @param peer SIP address header value.
             * @returns std::string Address.
             */
            static std::string extractAddress(const std::string& peer);
            /**
             * @brief Extracts the value of the named parameter from a SIP header value.
             * @param value SIP header value.
             * @param name Parameter name.
             * @returns std::string Parameter value, empty if not present.
             */
            static std::string parameter(const std::string& value, const std::string& name);

            /**
             * @brief Builds a Via header value.
             * @param transport Transport token (e.g. TLS).
             * @param sentBy Host named in the Via header.
             * @returns std::string Via header value with a fresh branch.
             */
            static std::string via(const std::string& transport, const std::string& sentBy);
        };
    } // namespace sip
} // namespace network

#endif // __SIP__SIP_UTILS_H__
