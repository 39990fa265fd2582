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
 * @file SIPPayload.h
 * @ingroup sip
 * @file SIPPayload.cpp
 * @ingroup sip
 */
#if !defined(__SIP__SIP_PAYLOAD_H__)
#define __SIP__SIP_PAYLOAD_H__

#include "common/Defines.h"
#include "common/network/sip/SIPHeaders.h"

#include <string>
#include <vector>

#include <asio.hpp>

namespace network
{
    namespace sip
    {
        // ---------------------------------------------------------------------------
        //  Constants
        // ---------------------------------------------------------------------------

        #define SIP_INVITE "INVITE"
        #define SIP_ACK "ACK"
        #define SIP_BYE "BYE"
        #define SIP_CANCEL "CANCEL"
        #define SIP_REGISTER "REGISTER"
        #define SIP_OPTIONS "OPTIONS"
        #define SIP_SUBSCRIBE "SUBSCRIBE"
        #define SIP_NOTIFY "NOTIFY"
        #define SIP_REFER "REFER"
        #define SIP_INFO "INFO"
        #define SIP_MESSAGE "MESSAGE"
        #define SIP_UPDATE "UPDATE"

        #define SIP_VERSION "SIP/2.0"

        #define SIP_CONTENT_TYPE_SDP "application/sdp"
        #define SIP_CONTENT_TYPE_SIPFRAG "message/sipfrag"

        // ---------------------------------------------------------------------------
        //  Structure Declaration
        // ---------------------------------------------------------------------------

        /**
         * @brief This struct implements a model of a SIP message (request or response)
         *  exchanged with a SIP client/server.
         * @ingroup sip
         */
        struct SOFTPHONE_API SIPPayload {
            /**
             * @brief SIP Status/Response Codes
             */
            enum StatusType {
                TRYING = 100,                   //! SIP Trying 100
                RINGING = 180,                  //! SIP Ringing 180
                SESSION_PROGRESS = 183,         //! SIP Session Progress 183

                OK = 200,                       //! SIP OK 200
                ACCEPTED = 202,                 //! SIP Accepted 202
                NO_NOTIFY = 204,                //! SIP No Notification 204

                MULTIPLE_CHOICES = 300,         //! SIP Multiple Choices 300
                MOVED_PERMANENTLY = 301,        //! SIP Moved Permenantly 301
                MOVED_TEMPORARILY = 302,        //! SIP Moved Temporarily 302

                BAD_REQUEST = 400,              //! SIP Bad Request 400
                UNAUTHORIZED = 401,             //! SIP Unauthorized 401
                FORBIDDEN = 403,                //! SIP Forbidden 403
                NOT_FOUND = 404,                //! SIP Not Found 404
                CALL_DOES_NOT_EXIST = 481,      //! SIP Call/Transaction Does Not Exist 481
                BUSY_HERE = 486,                //! SIP Busy Here 486
                REQUEST_TERMINATED = 487,       //! SIP Request Terminated 487

                INTERNAL_SERVER_ERROR = 500,    //! SIP Internal Server Error 500
                NOT_IMPLEMENTED = 501,          //! SIP Not Implemented 501
                BAD_GATEWAY = 502,              //! SIP Bad Gateway 502
                SERVICE_UNAVAILABLE = 503,      //! SIP Service Unavailable 503

                BUSY_EVERYWHERE = 600,          //! SIP Busy Everywhere 600
                DECLINE = 603,                  //! SIP Decline 603
            } status = OK;

            /**
             * @brief Reason phrase of a response (empty selects the default phrase for the status).
             */
            std::string reason;

            SIPHeaders headers;
            std::string content;

            std::string method;
            std::string uri;

            int sipVersionMajor = 2;
            int sipVersionMinor = 0;

            /**
             * @brief Flag indicating this payload is a request (method and URI are valid) rather
             *  than a response (status and reason are valid).
             */
            bool isClientPayload = false;

            /**
             * @brief Convert the payload into a vector of buffers. The buffers do not own the
             *  underlying memory blocks, therefore the payload object must remain valid and
             *  not be changed until the write operation has completed.
             * @returns std::vector<asio::const_buffer> List of buffers representing the SIP payload.
             */
            std::vector<asio::const_buffer> toBuffers();
            /**
             * @brief Convert the payload into its wire text.
             * @returns std::string SIP message text.
             */
            std::string toString();

            /**
             * @brief Prepares payload for transmission by finalizing status and content type.
             * @param content Message body.
             * @param status SIP status (ignored for requests).
             * @param contentType SIP content type.
             */
            void payload(const std::string& content, StatusType status = OK, const std::string& contentType = SIP_CONTENT_TYPE_SDP);

            /**
             * @brief Gets the first line of the message ("METHOD uri SIP/2.0" or "SIP/2.0 code reason").
             * @returns std::string Start line of the message.
             */
            std::string subject() const;
            /**
             * @brief Gets the Call-ID of the message.
             * @returns std::string Call-ID.
             */
            std::string callId() const { return headers.find("Call-ID"); }
            /**
             * @brief Gets the method named in the CSeq header.
             * @returns std::string CSeq method (upper-case).
             */
            std::string cseqMethod() const;
            /**
             * @brief Gets the sequence number named in the CSeq header.
             * @returns uint32_t CSeq number.
             */
            uint32_t cseqNumber() const;

            /**
             * @brief Get a request payload.
             * @param method SIP method.
             * @param uri SIP uri.
             * @returns SIPPayload Request payload.
             */
            static SIPPayload requestPayload(std::string method, std::string uri);
            /**
             * @brief Get a status payload.
             * @param status SIP status.
             * @param contentType SIP content type.
             * @returns SIPPayload Response payload.
             */
            static SIPPayload statusPayload(StatusType status, const std::string& contentType = SIP_CONTENT_TYPE_SDP);
            /**
             * @brief Get a status payload answering the given request. The Via, From, To, Call-ID and
             *  CSeq headers are copied from the request.
             * @param request SIP request being answered.
             * @param status SIP status.
             * @returns SIPPayload Response payload.
             */
            static SIPPayload responseTo(const SIPPayload& request, StatusType status);

            /**
             * @brief Parse SIP message text.
             * @param[in] text SIP message text.
             * @param[out] payload Parsed SIP message.
             * @returns bool True, if the message was parsed, otherwise false.
             */
            static bool parse(const std::string& text, SIPPayload& payload);

            /**
             * @brief Gets the default reason phrase for a SIP status.
             * @param status SIP status.
             * @returns std::string Reason phrase.
             */
            static std::string reasonPhrase(StatusType status);

        private:
            std::string m_startLine;

            /**
             * @brief Internal helper to ensure the headers are of a default for the given content type.
             * @param contentType SIP content type.
             */
            void ensureDefaultHeaders(const std::string& contentType = SIP_CONTENT_TYPE_SDP);
        };
    } // namespace sip
} // namespace network

#endif // __SIP__SIP_PAYLOAD_H__
