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
#include "Defines.h"
#include "network/udp/Socket.h"
#include "Log.h"

using namespace network;
using namespace network::udp;

#include <cerrno>
#include <cstring>

#include <ifaddrs.h>

// ---------------------------------------------------------------------------
//  Public Class Members
// ---------------------------------------------------------------------------

/* Initializes a new instance of the Socket class. */

Socket::Socket(const std::string& address, uint16_t port) :
    m_localAddress(address),
    m_localPort(port),
    m_fd(-1)
{
    /* stub */
}

/* Finalizes a instance of the Socket class. */

Socket::~Socket()
{
    close();
}

/* Creates and binds the socket. */

bool Socket::open(uint32_t af) noexcept
{
    sockaddr_storage addr;
    uint32_t addrLen = 0U;
    if (lookup(m_localAddress, m_localPort, addr, addrLen, (int)af, true) != 0) {
        LogError(LOG_NET, "invalid local RTP address, %s:%u", m_localAddress.c_str(), m_localPort);
        return false;
    }

    close();

    m_fd = ::socket(addr.ss_family, SOCK_DGRAM, 0);
    if (m_fd < 0) {
        LogError(LOG_NET, "cannot create the UDP socket, err: %d", errno);
        return false;
    }

    if (m_localPort > 0U) {
        int reuse = 1;
        if (::setsockopt(m_fd, SOL_SOCKET, SO_REUSEADDR, (char*)&reuse, sizeof(reuse)) == -1) {
            LogError(LOG_NET, "cannot set the UDP socket option, err: %d", errno);
            close();
            return false;
        }
    }

    if (::bind(m_fd, (sockaddr*)&addr, addrLen) < 0) {
        LogError(LOG_NET, "cannot bind the UDP socket, %s:%u, err: %d", m_localAddress.c_str(), m_localPort, errno);
        close();
        return false;
    }

    LogDebug(LOG_NET, "UDP socket bound, localPort = %u", getLocalPort());
    return true;
}

/* Closes the socket. */

void Socket::close()
{
    if (m_fd >= 0) {
        ::close(m_fd);
        m_fd = -1;
    }
}

/* Reads one waiting datagram without blocking. */

ssize_t Socket::read(uint8_t* buffer, uint32_t length, sockaddr_storage& address, uint32_t& addrLen) noexcept
{
    if (buffer == nullptr || length == 0U || m_fd < 0)
        return -1;

    struct pollfd pfd;
    pfd.fd = m_fd;
    pfd.events = POLLIN;
    pfd.revents = 0;

    if (::poll(&pfd, 1, 0) < 0) {
        LogError(LOG_NET, "error returned from UDP poll, err: %d", errno);
        return -1;
    }

    if ((pfd.revents & POLLIN) == 0)
        return 0;

    socklen_t size = sizeof(sockaddr_storage);
    ssize_t len = ::recvfrom(m_fd, (char*)buffer, length, 0, (sockaddr*)&address, &size);
    if (len < 0) {
        LogError(LOG_NET, "error returned from recvfrom, err: %d", errno);
        return -1;
    }

    addrLen = size;
    return len;
}

/* Sends a datagram. */

bool Socket::write(const uint8_t* buffer, uint32_t length, const sockaddr_storage& address, uint32_t addrLen, ssize_t* lenWritten) noexcept
{
    ssize_t sent = -1;
    if (buffer != nullptr && length > 0U && m_fd >= 0) {
        sent = ::sendto(m_fd, (char*)buffer, length, 0, (sockaddr*)&address, addrLen);
        if (sent < 0)
            LogError(LOG_NET, "error returned from sendto, err: %d", errno);
    }

    if (lenWritten != nullptr)
        *lenWritten = sent;

    return sent == (ssize_t)length;
}

/* Gets the local port the socket is bound to. */

uint16_t Socket::getLocalPort() const
{
    if (m_fd < 0)
        return 0U;

    sockaddr_storage addr;
    socklen_t addrLen = sizeof(addr);
    if (::getsockname(m_fd, (sockaddr*)&addr, &addrLen) < 0) {
        LogError(LOG_NET, "cannot get the UDP socket name, err: %d", errno);
        return 0U;
    }

    switch (addr.ss_family) {
    case AF_INET:
        return ntohs(((sockaddr_in*)&addr)->sin_port);
    case AF_INET6:
        return ntohs(((sockaddr_in6*)&addr)->sin6_port);
    default:
        return 0U;
    }
}

/* Helper to resolve a numeric host and port into a socket address. */

int Socket::lookup(const std::string& hostName, uint16_t port, sockaddr_storage& address, uint32_t& addrLen, int af, bool passive)
{
    struct addrinfo hints;
    ::memset(&hints, 0, sizeof(hints));
    hints.ai_family = af;
    hints.ai_socktype = SOCK_DGRAM;
    hints.ai_flags = AI_NUMERICSERV;
    if (passive)
        hints.ai_flags |= AI_PASSIVE;

    std::string service = std::to_string(port);
    struct addrinfo* res = nullptr;

    int err = ::getaddrinfo(hostName.empty() ? nullptr : hostName.c_str(), service.c_str(), &hints, &res);
    if (err != 0 || res == nullptr) {
        ::memset(&address, 0x00U, sizeof(sockaddr_storage));
        addrLen = 0U;
        LogError(LOG_NET, "cannot find address for host %s, err: %s", hostName.c_str(), ::gai_strerror(err));
        return (err != 0) ? err : EAI_NONAME;
    }

    ::memcpy(&address, res->ai_addr, addrLen = res->ai_addrlen);
    ::freeaddrinfo(res);
    return 0;
}

/* Helper to return the first non-loopback IPv4 address of this machine. */

std::string Socket::getLocalAddress()
{
    struct ifaddrs* ifaddr = nullptr;
    if (::getifaddrs(&ifaddr) == -1) {
        LogError(LOG_NET, "cannot list the network interfaces, err: %d", errno);
        return "0.0.0.0";
    }

    std::string address = "127.0.0.1";
    char host[NI_MAXHOST];
    for (struct ifaddrs* ifa = ifaddr; ifa != nullptr; ifa = ifa->ifa_next) {
        // SDP c= lines are IPv4 only
        if (ifa->ifa_addr == nullptr || ifa->ifa_addr->sa_family != AF_INET)
            continue;

        if (::getnameinfo(ifa->ifa_addr, sizeof(struct sockaddr_in), host, NI_MAXHOST, nullptr, 0, NI_NUMERICHOST) != 0)
            continue;

        std::string candidate(host);
        if (candidate != "127.0.0.1") {
            address = candidate;
            break;
        }
    }

    ::freeifaddrs(ifaddr);
    return address;
}
