// SPDX-License-Identifier: BSL-1.0
/*
 * Softphone - Common Library
 * BSL-1.0 Open Source. Use is subject to license terms.
 * DO NOT ALTER OR REMOVE COPYRIGHT NOTICES OR THIS FILE HEADER.
 *
 *  Copyright (c) 2003-2013 Christopher M. Kohlhoff
 *  Copyright (C) 2023-2025 Bryan Biedenkapp, N2PLL
 *
 */
/**
 * @defgroup sip SIP
 * @brief Implementation for the SIP signaling model.
 * @ingroup network_core
 *
 * @file SIPHeaders.h
 * @ingroup sip
 */
#if !defined(__SIP__SIP_HEADERS_H__)
#define __SIP__SIP_HEADERS_H__

#include "common/Defines.h"
#include "common/Utils.h"

#include <algorithm>
#include <string>
#include <vector>

namespace network
{
    namespace sip
    {
        // ---------------------------------------------------------------------------
        //  Class Prototypes
        // ---------------------------------------------------------------------------

        struct SIPPayload;

        // ---------------------------------------------------------------------------
        //  Structure Declaration
        // ---------------------------------------------------------------------------

        /**
         * @brief Represents SIP headers.
         * @ingroup sip
         */
        struct SIPHeaders {
            /**
             * @brief Structure representing an individual SIP header.
             * @ingroup sip
             */
            struct Header
            {
                /**
                 * @brief Header name.
                 */
                std::string name;
                /**
                 * @brief Header value.
                 */
                std::string value;

                /**
                 * @brief Initializes a new instance of the Header class.
                 */
                Header() : name{}, value{} { /* stub */ }
                /**
                 * @brief Initializes a new instance of the Header class
                 * @param n Header name.
                 * @param v Header value.
                 */
                Header(std::string n, std::string v) : name{n}, value{v} { /* stub */ }
            };

            /**
             * @brief Gets the list of SIP headers.
             * @returns std::vector<Header> List of SIP headers.
             */
            std::vector<Header> headers() const { return m_headers; }
            /**
             * @brief Returns true if the headers are empty.
             * @returns bool True, if no SIP headers are present, otherwise false.
             */
            bool empty() const { return m_headers.empty(); }
            /**
             * @brief Returns the number of headers.
             * @returns std::size_t Number of headers.
             */
            std::size_t size() const { return m_headers.size(); }
            /**
             * @brief Clears the list of SIP headers.
             */
            void clearHeaders() { m_headers = std::vector<Header>(); }
            /**
             * @brief Helper to add a SIP header. An existing header of the same name is replaced.
             * @param name Header name.
             * @param value Header value.
             */
            void add(const std::string& name, const std::string& value)
            {
                for (auto& header : m_headers) {
                    if (matches(header.name, name)) {
                        header.value = value;
                        return;
                    }
                }

                m_headers.push_back(Header(name, value));
            }
            /**
             * @brief Helper to append a SIP header value. Repeated header fields are folded into
             *  a single comma separated value.
             * @param name Header name.
             * @param value Header value.
             */
            void append(const std::string& name, const std::string& value)
            {
                for (auto& header : m_headers) {
                    if (matches(header.name, name)) {
                        header.value += ", " + value;
                        return;
                    }
                }

                m_headers.push_back(Header(name, value));
            }
            /**
             * @brief Helper to remove a SIP header.
             * @param headerName Header name.
             */
            void remove(const std::string headerName)
            {
                auto header = std::find_if(m_headers.begin(), m_headers.end(), [&](const Header& h) {
                    return matches(h.name, headerName);
                });

                if (header != m_headers.end()) {
                    m_headers.erase(header);
                }
            }
            /**
             * @brief Helper to find the named SIP header. Compact header forms (RFC 3261 7.3.3)
             *  are treated as their full names.
             * @param headerName Header name.
             * @returns std::string Value of named header (if any).
             */
            std::string find(const std::string headerName) const
            {
                auto header = std::find_if(m_headers.begin(), m_headers.end(), [&](const Header& h) {
                    return matches(h.name, headerName);
                });

                if (header != m_headers.end()) {
                    return header->value;
                }
                else {
                    return "";
                }
            }
            /**
             * @brief Helper to test whether the named SIP header is present.
             * @param headerName Header name.
             * @returns bool True, if the header is present, otherwise false.
             */
            bool has(const std::string headerName) const
            {
                return std::any_of(m_headers.begin(), m_headers.end(), [&](const Header& h) {
                    return matches(h.name, headerName);
                });
            }

            /**
             * @brief Helper to expand a compact SIP header name into its full lower-case form.
             * @param name Header name.
             * @returns std::string Full lower-case header name.
             */
            static std::string canonicalName(const std::string& name)
            {
                std::string n = ::strtolower(name);
                if (n.size() != 1U)
                    return n;

                switch (n[0U]) {
                case 'i': return "call-id";
                case 'f': return "from";
                case 't': return "to";
                case 'v': return "via";
                case 'l': return "content-length";
                case 'c': return "content-type";
                case 'm': return "contact";
                case 'r': return "refer-to";
                case 'b': return "referred-by";
                case 'o': return "event";
                default:  return n;
                }
            }

        private:
            friend struct SIPPayload;
            std::vector<Header> m_headers;

            /**
             * @brief Internal helper to compare header names.
             * @param a Header name.
             * @param b Header name.
             * @returns bool True, if the names refer to the same header, otherwise false.
             */
            static bool matches(const std::string& a, const std::string& b)
            {
                return canonicalName(a) == canonicalName(b);
            }
        };
    } // namespace sip
} // namespace network

#endif // __SIP__SIP_HEADERS_H__
