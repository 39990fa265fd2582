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
 * @file MessageFilters.h
 * @ingroup sip
 * @file MessageFilters.cpp
 * @ingroup sip
 */
#if !defined(__SIP__MESSAGE_FILTERS_H__)
#define __SIP__MESSAGE_FILTERS_H__

#include "common/Defines.h"
#include "common/network/sip/SignalingChannel.h"

#include <string>

namespace network
{
    namespace sip
    {
        // ---------------------------------------------------------------------------
        //  Class Declaration
        // ---------------------------------------------------------------------------

        /**
         * @brief Factory for the predicates used to select inbound SIP messages.
         * @ingroup sip
         */
        class SOFTPHONE_API MessageFilters {
        public:
            /**
             * @brief Accepts messages carrying the given Call-ID.
             * @param callId Call-ID.
             * @returns MessageFilter Predicate.
             */
            static MessageFilter callId(const std::string& callId);
            /**
             * @brief Accepts requests with the given method.
             * @param method SIP method.
             * @returns MessageFilter Predicate.
             */
            static MessageFilter request(const std::string& method);
            /**
             * @brief Accepts responses with the given status.
             * @param status SIP status.
             * @returns MessageFilter Predicate.
             */
            static MessageFilter response(SIPPayload::StatusType status);
            /**
             * @brief Accepts messages (requests or responses) whose CSeq names the given method.
             * @param method SIP method.
             * @returns MessageFilter Predicate.
             */
            static MessageFilter cseqMethod(const std::string& method);

            /**
             * @brief Accepts messages accepted by both predicates.
             * @param a Predicate.
             * @param b Predicate.
             * @returns MessageFilter Predicate.
             */
            static MessageFilter both(MessageFilter a, MessageFilter b);
        };
    } // namespace sip
} // namespace network

#endif // __SIP__MESSAGE_FILTERS_H__
