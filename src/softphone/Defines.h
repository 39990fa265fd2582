// SPDX-License-Identifier: GPL-2.0-only
/*
 * Softphone - Call Session Library
 * GPLv2 Open Source. Use is subject to license terms.
 * DO NOT ALTER OR REMOVE COPYRIGHT NOTICES OR THIS FILE HEADER.
 *
 *  Copyright (C) 2025 Bryan Biedenkapp, N2PLL
 *
 */
/**
 * @defgroup softphone Call Session Library
 * @brief Softphone - Call Session Library
 * @details Call sessions layered over SIP signaling and SRTP media; places and receives calls,
 *  exchanges in-band DTMF and streams or captures audio.
 * @ingroup softphone
 *
 * @file Defines.h
 * @ingroup softphone
 */
#if !defined(__DEFINES_H__)
#define __DEFINES_H__

#include "common/Defines.h"

// ---------------------------------------------------------------------------
//  Constants
// ---------------------------------------------------------------------------

#undef __PROG_NAME__
#define __PROG_NAME__ "Softphone Call Session Library"
#undef __EXE_NAME__
#define __EXE_NAME__ "softphone"

/** @brief Hole punch datagram sent (unencrypted) when the RTP socket is opened. */
#define MEDIA_HOLE_PUNCH "hello"
/** @brief Default transfer (Refer-To) domain. */
#define DEFAULT_TRANSFER_DOMAIN "sip.ringcentral.com"

/** @brief Audio streamer frame interval (ms). */
const uint32_t AUDIO_FRAME_INTERVAL_MS = 20U;

#endif // __DEFINES_H__
