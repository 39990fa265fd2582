// SPDX-License-Identifier: GPL-2.0-only
/*
 * Softphone - Common Library
 * GPLv2 Open Source. Use is subject to license terms.
 * DO NOT ALTER OR REMOVE COPYRIGHT NOTICES OR THIS FILE HEADER.
 *
 *  Copyright (C) 2015,2016,2017 Jonathan Naylor, G4KLX
 *  Copyright (C) 2018-2025 Bryan Biedenkapp, N2PLL
 *
 */
/**
 * @defgroup common Common Library
 * @brief Softphone - Common Library
 * @details This library implements common core code (logging, timers, sockets, RTP, SIP) used by
 *  the softphone call session library.
 * @ingroup common
 *
 * @file Defines.h
 * @ingroup common
 */
#pragma once
#if !defined(__COMMON_DEFINES_H__)
#define __COMMON_DEFINES_H__

#include <cstdint>
#include <memory>
#include <string>

// ---------------------------------------------------------------------------
//  Types
// ---------------------------------------------------------------------------

#ifndef __ULONG64_TYPE__
typedef unsigned long long  ulong64_t;
#endif // __ULONG64_TYPE__

#if defined(__GNUC__) || defined(__GNUG__)
#define __forceinline __attribute__((always_inline))
#endif

// ---------------------------------------------------------------------------
//  Meta-Programming Macro Includes
// ---------------------------------------------------------------------------

#include "common/ClassProperties.h"
#include "common/BitManipulation.h"

// ---------------------------------------------------------------------------
//  Constants
// ---------------------------------------------------------------------------

#ifndef __GIT_VER__
#define __GIT_VER__ "00000000"
#endif
#ifndef __GIT_VER_HASH__
#define __GIT_VER_HASH__ "00000000"
#endif

#define __PROG_NAME__ ""
#define __EXE_NAME__ ""

#define VERSION_MAJOR       "01"
#define VERSION_MINOR       "00"
#define VERSION_REV         "A"

#define __VER__ VERSION_MAJOR "." VERSION_MINOR VERSION_REV " (R" VERSION_MAJOR VERSION_REV VERSION_MINOR " " __GIT_VER__ ")"

#define SOFTPHONE_API

/**
 * @addtogroup common
 * @{
 */

/** @brief Default configuration file name. */
#define DEFAULT_CONF_FILE "softphone.yml"
/** @brief User agent token used in SIP requests and responses. */
#define SOFTPHONE_USER_AGENT "softphone/" VERSION_MAJOR "." VERSION_MINOR VERSION_REV

/** @} */

#endif // __COMMON_DEFINES_H__
