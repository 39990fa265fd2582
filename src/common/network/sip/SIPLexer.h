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
 * @file SIPLexer.h
 * @ingroup sip
 * @file SIPLexer.cpp
 * @ingroup sip
 */
#if !defined(__SIP__SIP_LEXER_H__)
#define __SIP__SIP_LEXER_H__

#include "common/Defines.h"

#include <string>
#include <tuple>
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
        //  Constants
        // ---------------------------------------------------------------------------

        /** @brief Longest start or header line accepted by the lexer. */
        const uint32_t SIP_MAX_LINE_LEN = 4096U;

        // ---------------------------------------------------------------------------
        //  Class Declaration
        // ---------------------------------------------------------------------------

        /**
         * @brief This class implements a line oriented lexer for incoming SIP messages. Input is
         *  collected into CRLF terminated lines; the first line is the start line, following lines
         *  are headers (folded continuation lines are joined) and the first empty line ends the
         *  header block. The body is left to the caller.
         * @ingroup sip
         */
        class SOFTPHONE_API SIPLexer {
        public:
            /**
             * @brief Lexing result.
             */
            enum ResultType { GOOD, BAD, INDETERMINATE };

            /**
             * @brief Initializes a new instance of the SIPLexer class.
             * @param clientLexer Flag indicating this lexer is used for a SIP client (lexes responses
             *  rather than requests).
             */
            explicit SIPLexer(bool clientLexer);

            /**
             * @brief Reset to initial lexer state.
             */
            void reset();

            /**
             * @brief Lex some data. GOOD is returned once the start line and header block are complete,
             *  BAD if the data is invalid and INDETERMINATE when more data is required.
             * @tparam InputIterator
             * @param payload SIP payload to fill.
             * @param begin Start of input.
             * @param end End of input.
             * @returns std::tuple<ResultType, InputIterator> Lexing result and position after the
             *  last character consumed.
             */
            template <typename InputIterator>
            std::tuple<ResultType, InputIterator> parse(SIPPayload& payload, InputIterator begin, InputIterator end)
            {
                while (begin != end) {
                    ResultType result = consume(payload, *begin++);
                    if (result != INDETERMINATE)
                        return std::make_tuple(result, begin);
                }
                return std::make_tuple(INDETERMINATE, begin);
            }

            /**
             * @brief Returns the count of characters consumed from the payload.
             * @returns uint32_t Count of characters consumed.
             */
            uint32_t consumed() const { return m_consumed; }

        private:
            bool m_clientLexer;
            uint32_t m_consumed;

            bool m_startLine;
            bool m_sawCR;
            std::string m_line;
            std::vector<std::tuple<std::string, std::string>> m_headers;

            /**
             * @brief Handle the next character of input.
             * @param payload SIP payload.
             * @param input Character.
             * @returns ResultType Lexing result.
             */
            ResultType consume(SIPPayload& payload, char input);
            /**
             * @brief Handle a complete line (without its CRLF).
             * @param payload SIP payload.
             * @returns ResultType Lexing result.
             */
            ResultType line(SIPPayload& payload);

            /**
             * @brief Lexes a request line ("METHOD URI SIP/2.0").
             * @param payload SIP payload.
             * @returns bool True, if the line is well formed, otherwise false.
             */
            bool requestLine(SIPPayload& payload);
            /**
             * @brief Lexes a status line ("SIP/2.0 200 OK").
             * @param payload SIP payload.
             * @returns bool True, if the line is well formed, otherwise false.
             */
            bool statusLine(SIPPayload& payload);
            /** @brief Lexes a "SIP/major.minor" version token. */
            static bool version(const std::string& token, SIPPayload& payload);

            /** @brief Check if a character is valid in a SIP token. */
            static bool isToken(char c);
        };
    } // namespace sip
} // namespace network

#endif // __SIP__SIP_LEXER_H__
