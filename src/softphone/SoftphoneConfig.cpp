// SPDX-License-Identifier: GPL-2.0-only
/*
 * Softphone - Call Session Library
 * GPLv2 Open Source. Use is subject to license terms.
 * DO NOT ALTER OR REMOVE COPYRIGHT NOTICES OR THIS FILE HEADER.
 *
 *  Copyright (C) 2025 Softphone Project Contributors
 *
 */
#include "Defines.h"
#include "common/crypto/SRTPSession.h"
#include "common/network/udp/Socket.h"
#include "common/network/RTPHeader.h"
#include "common/Log.h"
#include "common/Utils.h"
#include "Exceptions.h"
#include "SoftphoneConfig.h"

using namespace session;

// ---------------------------------------------------------------------------
//  Global Functions
// ---------------------------------------------------------------------------

/**
 * @brief Helper to read a value from a configuration section, returning the fallback when the
 *  section or key does not exist or the value does not convert.
 * @tparam T Type of value.
 * @param section Configuration section.
 * @param key Name of key.
 * @param fallback Fallback value.
 * @returns T Value.
 */
template<typename T>
static T value(const YAML::Node& section, const char* key, const T& fallback)
{
    if (!section || !section.IsMap())
        return fallback;

    const YAML::Node node = section[key];
    if (!node || node.IsNull())
        return fallback;

    return node.as<T>(fallback);
}

// ---------------------------------------------------------------------------
//  Public Class Members
// ---------------------------------------------------------------------------

/* Initializes a new instance of the SoftphoneConfig structure with the default configuration. */

SoftphoneConfig::SoftphoneConfig() :
    logDisplayLevel(1U),
    logFileLevel(0U),
    logFilePath("."),
    logFileRoot(__EXE_NAME__),
    logUseSyslog(false),
    sipDomain(DEFAULT_TRANSFER_DOMAIN),
    fakeDomain(),
    transferDomain(DEFAULT_TRANSFER_DOMAIN),
    transport("TLS"),
    userAgent(SOFTPHONE_USER_AGENT),
    localAddress("0.0.0.0"),
    advertisedAddress(),
    localKey(),
    telephoneEventPT(RTP_TELEPHONE_EVENT_PAYLOAD_TYPE),
    decoder("opus"),
    holePunch(true),
    debug(false)
{
    /* stub */
}

/* Loads the configuration from a YAML file. */

SoftphoneConfig SoftphoneConfig::load(const std::string& file)
{
    YAML::Node root;
    try {
        root = YAML::LoadFile(file);
    }
    catch (const YAML::Exception& e) {
        throw ConfigError("cannot load configuration file " + file + ", " + e.what());
    }

    SoftphoneConfig config;
    config.read(root);
    config.validate();
    return config;
}

/* Parses the configuration from YAML text. */

SoftphoneConfig SoftphoneConfig::parse(const std::string& text)
{
    YAML::Node root;
    try {
        root = YAML::Load(text);
    }
    catch (const YAML::Exception& e) {
        throw ConfigError(std::string("cannot parse configuration, ") + e.what());
    }

    SoftphoneConfig config;
    config.read(root);
    config.validate();
    return config;
}

/* Initializes the diagnostics log from the logging configuration. */

bool SoftphoneConfig::initializeLog() const
{
    return ::LogInitialise(logFilePath, logFileRoot, logFileLevel, logDisplayLevel, false, logUseSyslog);
}

// ---------------------------------------------------------------------------
//  Private Class Members
// ---------------------------------------------------------------------------

/* Internal helper to read the configuration from a YAML document. */

void SoftphoneConfig::read(const YAML::Node& root)
{
    if (!root || root.IsNull())
        return;
    if (!root.IsMap())
        throw ConfigError("configuration root must be a map");

    try {
        const YAML::Node logConf = root["log"];
        logDisplayLevel = value<uint32_t>(logConf, "displayLevel", logDisplayLevel);
        logFileLevel = value<uint32_t>(logConf, "fileLevel", logFileLevel);
        logFilePath = value<std::string>(logConf, "filePath", logFilePath);
        logFileRoot = value<std::string>(logConf, "fileRoot", logFileRoot);
        logUseSyslog = value<bool>(logConf, "useSyslog", logUseSyslog);

        const YAML::Node sipConf = root["sip"];
        sipDomain = value<std::string>(sipConf, "domain", sipDomain);
        fakeDomain = value<std::string>(sipConf, "fakeDomain", fakeDomain);
        transferDomain = value<std::string>(sipConf, "transferDomain", transferDomain);
        transport = value<std::string>(sipConf, "transport", transport);
        userAgent = value<std::string>(sipConf, "userAgent", userAgent);

        const YAML::Node mediaConf = root["media"];
        localAddress = value<std::string>(mediaConf, "localAddress", localAddress);
        advertisedAddress = value<std::string>(mediaConf, "advertisedAddress", advertisedAddress);
        localKey = value<std::string>(mediaConf, "localKey", localKey);
        uint32_t pt = value<uint32_t>(mediaConf, "telephoneEventPayloadType", telephoneEventPT);
        if (pt < 96U || pt > 127U)
            throw ConfigError("media.telephoneEventPayloadType must be a dynamic payload type (96-127)");
        telephoneEventPT = (uint8_t)pt;
        decoder = value<std::string>(mediaConf, "decoder", decoder);
        holePunch = value<bool>(mediaConf, "holePunch", holePunch);
        debug = value<bool>(mediaConf, "debug", debug);
    }
    catch (const YAML::Exception& e) {
        throw ConfigError(std::string("invalid configuration, ") + e.what());
    }
}

/* Internal helper to validate the configuration and fill in generated values. */

void SoftphoneConfig::validate()
{
    std::string codec = ::strtolower(decoder);
    if (codec != "opus" && codec != "pcmu" && codec != "pcma")
        throw ConfigError("media.decoder must be one of opus, pcmu or pcma");
    decoder = codec;

    transport = ::strtoupper(transport);
    if (transport.empty())
        throw ConfigError("sip.transport must not be empty");

    if (fakeDomain.empty()) {
        fakeDomain = std::to_string(Utils::random(10000U, 99999U)) + ".invalid";
    }

    if (advertisedAddress.empty()) {
        advertisedAddress = network::udp::Socket::getLocalAddress();
    }

    if (localKey.empty()) {
        localKey = crypto::SRTPKey::generate();
        LogMessage(LOG_HOST, "generated local SRTP master key");
    }
    else {
        std::vector<uint8_t> key;
        if (!crypto::SRTPKey::decode(localKey, key))
            throw ConfigError("media.localKey must be a base64 encoded 30 byte SRTP master key and salt");
    }
}
