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
 * @defgroup crypto Cryptography
 * @brief Defines and implements cryptography routines.
 * @ingroup common
 *
 * @file SRTPSession.h
 * @ingroup crypto
 * @file SRTPSession.cpp
 * @ingroup crypto
 */
#if !defined(__SRTP_SESSION_H__)
#define __SRTP_SESSION_H__

#include "common/Defines.h"

#include <mutex>
#include <string>
#include <vector>

#include <srtp2/srtp.h>

namespace crypto
{
    // ---------------------------------------------------------------------------
    //  Constants
    // ---------------------------------------------------------------------------

    /** @brief AES_CM_128 master key length. */
    const uint32_t SRTP_MASTER_KEY_LEN = 16U;
    /** @brief AES_CM_128 master salt length. */
    const uint32_t SRTP_MASTER_SALT_LEN = 14U;
    /** @brief Concatenated master key and salt length. */
    const uint32_t SRTP_MASTER_LEN = SRTP_MASTER_KEY_LEN + SRTP_MASTER_SALT_LEN;

    /** @brief SDES crypto suite name. */
    #define SRTP_CRYPTO_SUITE "AES_CM_128_HMAC_SHA1_80"
    /** @brief DTLS-SRTP protection profile identifier for the crypto suite. */
    #define SRTP_PROFILE_AES128_CM_SHA1_80 0x0001U

    // ---------------------------------------------------------------------------
    //  Class Declaration
    // ---------------------------------------------------------------------------

    /**
     * @brief Helper routines for SRTP master keys.
     * @ingroup crypto
     */
    class SOFTPHONE_API SRTPKey {
    public:
        /**
         * @brief Generates a new random master key and salt.
         * @returns std::string Base64 encoded master key and salt.
         */
        static std::string generate();
        /**
         * @brief Decodes a base64 encoded master key and salt.
         * @param[in] text Base64 encoded master key and salt.
         * @param[out] key Master key and salt (truncated to 30 bytes).
         * @returns bool True, if the key decoded to at least 30 bytes, otherwise false.
         */
        static bool decode(const std::string& text, std::vector<uint8_t>& key);
    };

    // ---------------------------------------------------------------------------
    //  Class Declaration
    // ---------------------------------------------------------------------------

    /**
     * @brief Implements a pair of SRTP contexts (AES_CM_128_HMAC_SHA1_80) for a single media
     *  stream. The outbound context is keyed with the local master key, the inbound context with
     *  the remote master key.
     * @ingroup crypto
     */
    class SOFTPHONE_API SRTPSession {
    public:
        auto operator=(SRTPSession&) -> SRTPSession& = delete;
        auto operator=(SRTPSession&&) -> SRTPSession& = delete;
        SRTPSession(SRTPSession&) = delete;

        /**
         * @brief Initializes a new instance of the SRTPSession class.
         */
        SRTPSession();
        /**
         * @brief Finalizes a instance of the SRTPSession class.
         */
        ~SRTPSession();

        /**
         * @brief Creates (or replaces) the inbound and outbound SRTP contexts.
         * @param localKey Local master key and salt (30 bytes).
         * @param remoteKey Remote master key and salt (30 bytes).
         * @returns bool True, if both contexts were created, otherwise false.
         */
        bool setKeys(const std::vector<uint8_t>& localKey, const std::vector<uint8_t>& remoteKey);
        /**
         * @brief Releases the SRTP contexts.
         */
        void reset();

        /**
         * @brief Flag indicating whether the SRTP contexts exist.
         * @returns bool True, if the contexts exist, otherwise false.
         */
        bool isReady() const { return m_inbound != nullptr && m_outbound != nullptr; }

        /**
         * @brief Encrypts and authenticates a serialized RTP packet.
         * @param[in] data RTP packet.
         * @param[in] length Length of RTP packet.
         * @param[out] out SRTP packet.
         * @returns bool True, if the packet was protected, otherwise false.
         */
        bool protect(const uint8_t* data, uint32_t length, std::vector<uint8_t>& out);
        /**
         * @brief Authenticates and decrypts a SRTP packet.
         * @param[in] data SRTP packet.
         * @param[in] length Length of SRTP packet.
         * @param[out] out RTP packet.
         * @returns bool True, if the packet was unprotected, otherwise false.
         */
        bool unprotect(const uint8_t* data, uint32_t length, std::vector<uint8_t>& out);

    private:
        srtp_t m_inbound;
        srtp_t m_outbound;

        static std::mutex m_initLock;
        static bool m_initialized;

        /**
         * @brief Internal helper to initialize libsrtp once per process.
         * @returns bool True, if libsrtp is initialized, otherwise false.
         */
        static bool init();
        /**
         * @brief Internal helper to create a SRTP context.
         * @param[out] ctx SRTP context.
         * @param key Master key and salt.
         * @param inbound Flag indicating the context protects inbound traffic.
         * @returns bool True, if the context was created, otherwise false.
         */
        static bool create(srtp_t* ctx, const std::vector<uint8_t>& key, bool inbound);
    };
} // namespace crypto

#endif // __SRTP_SESSION_H__
