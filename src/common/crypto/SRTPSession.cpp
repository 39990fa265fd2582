// SPDX-License-Identifier: GPL-2.0-only
/*
 * Softphone - Common Library
 * GPLv2 Open Source. Use is subject to license terms.
 * DO NOT ALTER OR REMOVE COPYRIGHT NOTICES OR THIS FILE HEADER.
 *
 *  Copyright (C) 2025 Softphone Project Contributors
 *
 */
#include "Defines.h"
#include "crypto/SRTPSession.h"
#include "Log.h"
#include "Utils.h"

using namespace crypto;

#include <cstring>

#include <openssl/rand.h>

// ---------------------------------------------------------------------------
//  Static Class Members
// ---------------------------------------------------------------------------

std::mutex SRTPSession::m_initLock;
bool SRTPSession::m_initialized = false;

/* Generates a new random master key and salt. */

std::string SRTPKey::generate()
{
    uint8_t key[SRTP_MASTER_LEN];
    ::memset(key, 0x00U, SRTP_MASTER_LEN);

    if (RAND_bytes(key, SRTP_MASTER_LEN) != 1) {
        LogWarning(LOG_SRTP, "RAND_bytes() failed, using fallback key generator");
        for (uint32_t i = 0U; i < SRTP_MASTER_LEN; i++)
            key[i] = (uint8_t)Utils::random(0U, 0xFFU);
    }

    return Utils::base64Encode(key, SRTP_MASTER_LEN);
}

/* Decodes a base64 encoded master key and salt. */

bool SRTPKey::decode(const std::string& text, std::vector<uint8_t>& key)
{
    std::vector<uint8_t> raw;
    if (!Utils::base64Decode(::strtrim(text), raw))
        return false;
    if (raw.size() < SRTP_MASTER_LEN)
        return false;

    key.assign(raw.begin(), raw.begin() + SRTP_MASTER_LEN);
    return true;
}

// ---------------------------------------------------------------------------
//  Public Class Members
// ---------------------------------------------------------------------------

/* Initializes a new instance of the SRTPSession class. */

SRTPSession::SRTPSession() :
    m_inbound(nullptr),
    m_outbound(nullptr)
{
    /* stub */
}

/* Finalizes a instance of the SRTPSession class. */

SRTPSession::~SRTPSession()
{
    reset();
}

/* Creates (or replaces) the inbound and outbound SRTP contexts. */

bool SRTPSession::setKeys(const std::vector<uint8_t>& localKey, const std::vector<uint8_t>& remoteKey)
{
    if (localKey.size() < SRTP_MASTER_LEN || remoteKey.size() < SRTP_MASTER_LEN) {
        LogError(LOG_SRTP, "invalid SRTP master key length, local = %u, remote = %u", (uint32_t)localKey.size(), (uint32_t)remoteKey.size());
        return false;
    }

    if (!init())
        return false;

    reset();

    if (!create(&m_outbound, localKey, false))
        return false;
    if (!create(&m_inbound, remoteKey, true)) {
        reset();
        return false;
    }

    return true;
}

/* Releases the SRTP contexts. */

void SRTPSession::reset()
{
    if (m_inbound != nullptr) {
        srtp_dealloc(m_inbound);
        m_inbound = nullptr;
    }

    if (m_outbound != nullptr) {
        srtp_dealloc(m_outbound);
        m_outbound = nullptr;
    }
}

/* Encrypts and authenticates a serialized RTP packet. */

bool SRTPSession::protect(const uint8_t* data, uint32_t length, std::vector<uint8_t>& out)
{
    if (m_outbound == nullptr || data == nullptr || length == 0U)
        return false;

    // libsrtp works in place and appends the authentication tag
    out.assign(data, data + length);
    out.resize(length + SRTP_MAX_TRAILER_LEN);

    int len = (int)length;
    srtp_err_status_t err = srtp_protect(m_outbound, out.data(), &len);
    if (err != srtp_err_status_ok) {
        LogWarning(LOG_SRTP, "failed to protect RTP packet, err: %d", (int)err);
        out.clear();
        return false;
    }

    out.resize(len);
    return true;
}

/* Authenticates and decrypts a SRTP packet. */

bool SRTPSession::unprotect(const uint8_t* data, uint32_t length, std::vector<uint8_t>& out)
{
    if (m_inbound == nullptr || data == nullptr || length == 0U)
        return false;

    out.assign(data, data + length);

    int len = (int)length;
    srtp_err_status_t err = srtp_unprotect(m_inbound, out.data(), &len);
    if (err != srtp_err_status_ok) {
        LogWarning(LOG_SRTP, "failed to unprotect SRTP packet, len = %u, err: %d", length, (int)err);
        out.clear();
        return false;
    }

    out.resize(len);
    return true;
}

// ---------------------------------------------------------------------------
//  Private Class Members
// ---------------------------------------------------------------------------

/* Internal helper to initialize libsrtp once per process. */

bool SRTPSession::init()
{
    std::lock_guard<std::mutex> lock(m_initLock);
    if (m_initialized)
        return true;

    srtp_err_status_t err = srtp_init();
    if (err != srtp_err_status_ok) {
        LogError(LOG_SRTP, "failed to initialize libsrtp, err: %d", (int)err);
        return false;
    }

    m_initialized = true;
    return true;
}

/* Internal helper to create a SRTP context. */

bool SRTPSession::create(srtp_t* ctx, const std::vector<uint8_t>& key, bool inbound)
{
    uint8_t master[SRTP_MASTER_LEN];
    ::memcpy(master, key.data(), SRTP_MASTER_LEN);

    srtp_policy_t policy;
    ::memset(&policy, 0x00U, sizeof(srtp_policy_t));

    srtp_crypto_policy_set_rtp_default(&policy.rtp);
    srtp_crypto_policy_set_rtcp_default(&policy.rtcp);

    policy.ssrc.type = (inbound) ? ssrc_any_inbound : ssrc_any_outbound;
    policy.ssrc.value = 0U;
    policy.key = master;
    policy.window_size = 1024U;
    policy.allow_repeat_tx = 1;
    policy.next = nullptr;

    srtp_err_status_t err = srtp_create(ctx, &policy);
    ::memset(master, 0x00U, SRTP_MASTER_LEN);

    if (err != srtp_err_status_ok) {
        LogError(LOG_SRTP, "failed to create %s SRTP context, err: %d", (inbound) ? "inbound" : "outbound", (int)err);
        *ctx = nullptr;
        return false;
    }

    return true;
}
