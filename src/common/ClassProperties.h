// SPDX-License-Identifier: GPL-2.0-only
/*
 * Softphone - Common Library
 * GPLv2 Open Source. Use is subject to license terms.
 * DO NOT ALTER OR REMOVE COPYRIGHT NOTICES OR THIS FILE HEADER.
 *
 *  Copyright (C) 2025 Bryan Biedenkapp, N2PLL
 *
 */
/**
 * @file ClassProperties.h
 * @ingroup common
 */
#pragma once
#if !defined(__CLASS_PROPERTIES_H__)
#define __CLASS_PROPERTIES_H__

#if !defined(__COMMON_DEFINES_H__)
#warning "ClassProperties.h included before Defines.h, please check include order"
#include "common/Defines.h"
#endif

// ---------------------------------------------------------------------------
//  Macros
// ---------------------------------------------------------------------------

/**
 * @addtogroup common
 * @{
 */

/**
 * Property Declaration
 *  These macros should always be used LAST in a "public" section of a class definition.
 */

/**
 * @brief Declare a read-only get property.
 *  Generates a private "m_<variableName>" member and a public inline "get<propName>()" getter; the value
 *  can only be set internally to the class.
 * @ingroup common
 * @param type Atomic type for property.
 * @param variableName Variable name for property.
 * @param propName Property name.
 */
#define DECLARE_RO_PROPERTY(type, variableName, propName)                                       \
        private: type m_##variableName;                                                         \
        public: __forceinline type get##propName(void) const { return m_##variableName; }
/**
 * @brief Declare a read-only property, does not use "get" prefix for getter.
 *  Generates a private "m_<variableName>" member and a public inline "<variableName>()" getter.
 * @ingroup common
 * @param type Atomic type for property.
 * @param variableName Variable name for property.
 */
#define DECLARE_RO_PROPERTY_PLAIN(type, variableName)                                           \
        private: type m_##variableName;                                                         \
        public: __forceinline type variableName(void) const { return m_##variableName; }

/**
 * @brief Declare a get and set private property.
 *  Generates a private "m_<variableName>" member, a public inline "get<propName>()" getter and a
 *  public inline "set<propName>(value)" setter.
 * @ingroup common
 * @param type Atomic type for property.
 * @param variableName Variable name for property.
 * @param propName Property name.
 */
#define DECLARE_PROPERTY(type, variableName, propName)                                          \
        private: type m_##variableName;                                                         \
        public: __forceinline type get##propName(void) const { return m_##variableName; }       \
                __forceinline void set##propName(type val) { m_##variableName = val; }

/** @} */

#endif // __CLASS_PROPERTIES_H__
