// SPDX-License-Identifier: GPL-2.0-only
/*
 * Softphone - Common Library
 * GPLv2 Open Source. Use is subject to license terms.
 * DO NOT ALTER OR REMOVE COPYRIGHT NOTICES OR THIS FILE HEADER.
 *
 *  Copyright (C) 2006-2016,2020 Jonathan Naylor, G4KLX
 *  Copyright (C) 2017-2025 Bryan Biedenkapp, N2PLL
 *
 */
/**
 * @defgroup udp_socket UDP
 * @brief Implementation for the media UDP sockets.
 * @ingroup network_core
 *
 * @file Socket.h
 * @ingroup udp_socket
 * @file Socket.cpp
 * @ingroup udp_socket
 */
#if !defined(__UDP_SOCKET_H__)
#define __UDP_SOCKET_H__

#include "common/Defines.h"

#include <string>

#include <netdb.h>
#include <sys/types.h>
#include <sys/socket.h>
#include <poll.h>
#include <unistd.h>
#include <netinet/in.h>
#include <arpa/inet.h>

namespace network
{
    namespace udp
    {
        // ---------------------------------------------------------------------------
        //  Class Declaration
        // ---------------------------------------------------------------------------

        /**
         * @brief Non-blocking UDP socket carrying one call's RTP stream.
         * @ingroup udp_socket
         */
        class SOFTPHONE_API Socket {
        public:
            auto operator=(Socket&) -> Socket& = delete;
            auto operator=(Socket&&) -> Socket& = delete;
            Socket(Socket&) = delete;

            /**
             * @brief Initializes a new instance of the Socket class.
             * @param address Local IP address to bind to (empty binds the wildcard address).
             * @param port Local port to bind to (0 lets the kernel pick an ephemeral port).
             */
            explicit Socket(const std::string& address = std::string(), uint16_t port = 0U);
            /**
             * @brief Finalizes a instance of the Socket class.
             */
            virtual ~Socket();

            /**
             * @brief Creates and binds the socket.
             * @param af Address family.
             * @returns bool True, if the socket is open, otherwise false.
             */
            virtual bool open(uint32_t af = AF_INET) noexcept;
            /**
             * @brief Closes the socket.
             */
            virtual void close();
            /**
             * @brief Flag indicating whether the socket is open.
             * @returns bool True, if the socket is open, otherwise false.
             */
            virtual bool isOpen() const { return m_fd >= 0; }

            /**
             * @brief Reads one waiting datagram without blocking.
             * @param[out] buffer Buffer to read data into.
             * @param length Size of the buffer.
             * @param[out] address Source address of the datagram.
             * @param[out] addrLen Length of address structure.
             * @returns ssize_t Length of the datagram, 0 if nothing is waiting, -1 on error.
             */
            virtual ssize_t read(uint8_t* buffer, uint32_t length, sockaddr_storage& address, uint32_t& addrLen) noexcept;
            /**
             * @brief Sends a datagram.
             * @param[in] buffer Datagram.
             * @param length Length of the datagram.
             * @param address Destination address.
             * @param addrLen Length of address structure.
             * @param[out] lenWritten Number of bytes sent, -1 on error.
             * @returns bool True, if the whole datagram was sent, otherwise false.
             */
            virtual bool write(const uint8_t* buffer, uint32_t length, const sockaddr_storage& address, uint32_t addrLen, ssize_t* lenWritten = nullptr) noexcept;

            /**
             * @brief Gets the local port the socket is bound to.
             * @returns uint16_t Local port, or 0 if the socket is not open.
             */
            virtual uint16_t getLocalPort() const;

            /**
             * @brief Helper to resolve a numeric host and port into a socket address.
             * @param[in] hostName Hostname or IP address (empty resolves the wildcard address when passive).
             * @param port Port number.
             * @param[out] address Socket address structure.
             * @param[out] addrLen Length of address structure.
             * @param af Address family hint (AF_UNSPEC accepts any).
             * @param passive Flag indicating the address is to be bound.
             * @returns int Zero if the lookup succeeded, otherwise the getaddrinfo() error.
             */
            static int lookup(const std::string& hostName, uint16_t port, sockaddr_storage& address, uint32_t& addrLen,
                int af = AF_UNSPEC, bool passive = false);

            /**
             * @brief Helper to return the first non-loopback IPv4 address of this machine.
             * @returns std::string IPv4 address, "0.0.0.0" if the interfaces cannot be listed.
             */
            static std::string getLocalAddress();

        private:
            std::string m_localAddress;
            uint16_t m_localPort;

            int m_fd;
        };
    } // namespace udp
} // namespace network

#endif // __UDP_SOCKET_H__
