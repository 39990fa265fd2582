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
 * @file SoftphoneConfig.h
 * @ingroup softphone
 * @file SoftphoneConfig.cpp
 * @ingroup softphone
 */
#if !defined(__SOFTPHONE_CONFIG_H__)
#define __SOFTPHONE_CONFIG_H__

#include "Defines.h"

#include <string>

#include <yaml-cpp/yaml.h>

// ---------------------------------------------------------------------------
//  Structure Declaration
// ---------------------------------------------------------------------------

/**
 * @brief Represents the softphone configuration.
 * @ingroup softphone
 */
struct SOFTPHONE_API SoftphoneConfig {
    /**
     * @brief Initializes a new instance of the SoftphoneConfig structure with the default configuration.
     */
    SoftphoneConfig();

    /** @name Logging */
    /** @{ */
    uint32_t logDisplayLevel;
    uint32_t logFileLevel;
    std::string logFilePath;
    std::string logFileRoot;
    bool logUseSyslog;
    /** @} */

    /** @name SIP */
    /** @{ */
    /** @brief Host named in the request URI of BYE requests. */
    std::string sipDomain;
    /** @brief Host named in the sent-by of Via headers. */
    std::string fakeDomain;
    /** @brief Host named in the Refer-To of REFER requests. */
    std::string transferDomain;
    /** @brief Transport token named in Via headers. */
    std::string transport;
    std::string userAgent;
    /** @} */

    /** @name Media */
    /** @{ */
    /** @brief Address RTP sockets are bound to. */
    std::string localAddress;
    /** @brief Address advertised in SDP answers (empty selects the first local interface address). */
    std::string advertisedAddress;
    /** @brief Local base64 SRTP master key and salt. */
    std::string localKey;
    uint8_t telephoneEventPT;
    /** @brief Audio decoder for payload types other than PCMU/PCMA (opus, pcmu or pcma). */
    std::string decoder;
    /** @brief Flag indicating whether the hole punch datagram is sent when the RTP socket opens. */
    bool holePunch;
    /** @brief Flag indicating whether RTP datagrams are dumped to the log. */
    bool debug;
    /** @} */

    /**
     * @brief Loads the configuration from a YAML file.
     * @param file Path to the YAML file.
     * @returns SoftphoneConfig Configuration.
     * @throws session::ConfigError if the file cannot be read or is invalid.
     */
    static SoftphoneConfig load(const std::string& file);
    /**
     * @brief Parses the configuration from YAML text.
     * @param text YAML text.
     * @returns SoftphoneConfig Configuration.
     * @throws session::ConfigError if the text is invalid.
     */
    static SoftphoneConfig parse(const std::string& text);

    /**
     * @brief Initializes the diagnostics log from the logging configuration.
     * @returns bool True, if the log was initialized, otherwise false.
     */
    bool initializeLog() const;

private:
    /**
     * @brief Internal helper to read the configuration from a YAML document.
     * @param root Root YAML node.
     */
    void read(const YAML::Node& root);
    /**
     * @brief Internal helper to validate the configuration and fill in generated values.
     */
    void validate();
};

#endif // __SOFTPHONE_CONFIG_H__
