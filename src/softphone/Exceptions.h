// SPDX-License-Identifier: GPL-2.0-only
/*
 * Softphone - Call Session Library
 * GPLv2 Open Source. Use is subject to license terms.
 * DO NOT ALTER OR REMOVE COPYRIGHT NOTICES OR THIS FILE HEADER.
 *
 *  Copyright (C) 2025 Softphone Project Contributors
 *
 */
/**
 * @file Exceptions.h
 * @ingroup softphone
 */
#if !defined(__EXCEPTIONS_H__)
#define __EXCEPTIONS_H__

#include "Defines.h"

#include <stdexcept>
#include <string>

namespace session
{
    // ---------------------------------------------------------------------------
    //  Class Declaration
    // ---------------------------------------------------------------------------

    /**
     * @brief Base class for errors raised synchronously by the call session library.
     * @ingroup softphone
     */
    class SOFTPHONE_API CallSessionError : public std::runtime_error {
    public:
        /**
         * @brief Initializes a new instance of the CallSessionError class.
         * @param message Error message.
         */
        explicit CallSessionError(const std::string& message) : std::runtime_error(message) { /* stub */ }
    };

    /**
     * @brief Raised when the SDP of the message creating a call session lacks the remote media endpoint.
     * @ingroup softphone
     */
    class SOFTPHONE_API MalformedOfferError : public CallSessionError {
    public:
        /**
         * @brief Initializes a new instance of the MalformedOfferError class.
         * @param message Error message.
         */
        explicit MalformedOfferError(const std::string& message) : CallSessionError(message) { /* stub */ }
    };

    /**
     * @brief Raised when a character outside 0-9, * and # is used as a DTMF digit.
     * @ingroup softphone
     */
    class SOFTPHONE_API InvalidDTMFCharError : public CallSessionError {
    public:
        /**
         * @brief Initializes a new instance of the InvalidDTMFCharError class.
         * @param c Offending character.
         */
        explicit InvalidDTMFCharError(char c) : CallSessionError(std::string("invalid DTMF character '") + c + "'"),
            m_character(c) { /* stub */ }

        /**
         * @brief Gets the offending character.
         * @returns char Offending character.
         */
        char character() const { return m_character; }

    private:
        char m_character;
    };

    /**
     * @brief Raised when outbound media is sent before the SRTP context exists.
     * @ingroup softphone
     */
    class SOFTPHONE_API UseBeforeReadyError : public CallSessionError {
    public:
        /**
         * @brief Initializes a new instance of the UseBeforeReadyError class.
         * @param message Error message.
         */
        explicit UseBeforeReadyError(const std::string& message) : CallSessionError(message) { /* stub */ }
    };

    /**
     * @brief Raised when a SRTP master key cannot be decoded to 30 bytes.
     * @ingroup softphone
     */
    class SOFTPHONE_API SRTPKeyError : public CallSessionError {
    public:
        /**
         * @brief Initializes a new instance of the SRTPKeyError class.
         * @param message Error message.
         */
        explicit SRTPKeyError(const std::string& message) : CallSessionError(message) { /* stub */ }
    };

    /**
     * @brief Raised when the configuration cannot be loaded.
     * @ingroup softphone
     */
    class SOFTPHONE_API ConfigError : public CallSessionError {
    public:
        /**
         * @brief Initializes a new instance of the ConfigError class.
         * @param message Error message.
         */
        explicit ConfigError(const std::string& message) : CallSessionError(message) { /* stub */ }
    };
} // namespace session

#endif // __EXCEPTIONS_H__
