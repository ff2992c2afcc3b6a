/**
 * @file common.hpp
 * @brief Common platform includes, type aliases and address helpers for quicsock.
 */

#pragma once

#include "SocketException.hpp"

#include <cstddef> // std::size_t
#include <cstdint>
#include <source_location>
#include <span>
#include <string>
#include <string_view>

#include <cstring> // std::memset(), std::memcpy()
#include <memory>

#ifdef _WIN32
#error "quicsock requires a POSIX socket API"
#endif

#include <arpa/inet.h>   // inet_ntop
#include <cerrno>        // errno
#include <fcntl.h>       // fcntl
#include <netdb.h>       // addrinfo
#include <netinet/in.h>  // sockaddr_in, sockaddr_in6, in_pktinfo
#include <netinet/udp.h> // SOL_UDP, UDP_SEGMENT, UDP_GRO
#include <sys/socket.h>  // socket, sendmsg, recvmsg, cmsghdr
#include <sys/time.h>    // timeval
#include <sys/types.h>   // socket
#include <sys/uio.h>     // iovec
#include <unistd.h>      // close

#if defined(__linux__)
// Kernel constants that older libc headers do not expose yet (linux/udp.h).
#ifndef UDP_SEGMENT
#define UDP_SEGMENT 103
#endif
#ifndef UDP_GRO
#define UDP_GRO 104
#endif
#ifndef SOL_UDP
#define SOL_UDP 17
#endif
#define QUICSOCK_HAS_SEGMENTATION_OFFLOAD 1
#define QUICSOCK_HAS_MMSG 1
#else
#define QUICSOCK_HAS_SEGMENTATION_OFFLOAD 0
#define QUICSOCK_HAS_MMSG 0
#endif

#ifndef QUICSOCK_INCLUDE_ERROR_CONTEXT
#define QUICSOCK_INCLUDE_ERROR_CONTEXT 0
#endif

/**
 * @defgroup quicsock quicsock: UDP datagram transport beneath a QUIC stack
 * @brief All classes and functions of the quicsock library.
 *
 * quicsock moves UDP datagrams between user space and the kernel as efficiently as the
 * host allows. It batches outgoing datagrams with Generic Segmentation Offload (GSO),
 * splits coalesced receives produced by Generic Receive Offload (GRO), recovers the
 * per-packet metadata the protocol layer needs (destination address and interface,
 * ECN codepoint) from ancillary control messages, and controls kernel socket buffer
 * capacity including the privileged override path.
 */

/**
 * @defgroup core Core Utilities and Types
 * @ingroup quicsock
 * @brief Type aliases, platform abstractions and address helpers.
 */

/**
 * @defgroup internal Internal Helpers
 * @ingroup quicsock
 * @brief Implementation-only utilities for internal use.
 *
 * @warning Do not rely on this module from user code. It is subject to change without notice.
 */

/**
 * @defgroup udp UDP Sockets
 * @ingroup quicsock
 * @brief Batched UDP send and receive.
 */

/**
 * @defgroup cmsg Control Messages
 * @ingroup quicsock
 * @brief Encoding and decoding of ancillary (control) message buffers.
 */

/**
 * @defgroup exceptions Exception Classes
 * @ingroup quicsock
 * @brief Exception types used in quicsock for error handling.
 */

/**
 * @defgroup socketopts Socket Options
 * @ingroup quicsock
 * @brief Socket option access and kernel buffer capacity control.
 */

/**
 * @namespace quicsock
 * @brief Raw datagram transport layer for a QUIC implementation.
 *
 * Core classes:
 * - DatagramSocket: UDP endpoint with batched, offload-aware send and receive
 * - SocketOptions: socket option access and buffer capacity control
 * - ReceivedBatch: lazy, single-pass sequence of received datagrams
 *
 * @note Sockets are not internally synchronized. At most one thread may send and at most
 *       one thread may receive on a given socket at any time.
 */
namespace quicsock
{

typedef int SOCKET;
constexpr SOCKET INVALID_SOCKET = -1;
constexpr SOCKET SOCKET_ERROR = -1;

inline int GetSocketError()
{
    return errno;
}

inline int CloseSocket(const SOCKET fd)
{
    return ::close(fd);
}

/**
 * @brief Convert a socket-related error code to a human-readable message.
 * @ingroup core
 *
 * @param error       The error code (errno, or an EAI_* code when @p gaiStrerror is set).
 * @param gaiStrerror Treat @p error as a getaddrinfo()/getnameinfo() return code.
 * @return Descriptive message. Empty when @p error is 0.
 */
std::string SocketErrorMessage(int error, bool gaiStrerror = false);

/**
 * @brief Type alias representing a UDP port number (1–65535).
 * @ingroup core
 */
using Port = std::uint16_t;

/**
 * @brief Maximum UDP payload (in bytes) that is always safe to send over IPv4.
 * @ingroup core
 *
 * 65,535 (IPv4 total length) minus 20 (IPv4 header) minus 8 (UDP header). Also the upper bound
 * for one coalesced GSO send, since the kernel emits the whole batch as one UDP super-packet.
 */
inline constexpr std::size_t MaxDatagramPayloadSafe = 65507;

/**
 * @brief Default size of one receive slot.
 * @ingroup core
 *
 * Large enough to hold a GRO-coalesced buffer, which the kernel bounds at 64 KiB.
 */
inline constexpr std::size_t DefaultReceiveSlotSize = 65535;

/**
 * @class SocketAddress
 * @ingroup core
 * @brief Owning wrapper around a `sockaddr_storage` and its effective length.
 *
 * Used for datagram destinations and sources. The storage is large enough for any
 * address family the kernel may report.
 */
struct SocketAddress
{
    sockaddr_storage storage{}; ///< Raw address storage.
    socklen_t length = 0;       ///< Number of meaningful bytes in @ref storage.

    [[nodiscard]] const sockaddr* data() const noexcept { return reinterpret_cast<const sockaddr*>(&storage); }
    [[nodiscard]] sockaddr* data() noexcept { return reinterpret_cast<sockaddr*>(&storage); }

    /// Address family (`AF_INET`, `AF_INET6`), or `AF_UNSPEC` when empty.
    [[nodiscard]] int family() const noexcept { return length == 0 ? AF_UNSPEC : storage.ss_family; }

    [[nodiscard]] bool empty() const noexcept { return length == 0; }

    /**
     * @brief Port number in host byte order.
     * @throws SocketException if the address family is not IPv4 or IPv6.
     */
    [[nodiscard]] Port port() const;

    /**
     * @brief Numeric `ip:port` representation (IPv6 in brackets).
     * @throws SocketException if `getnameinfo()` fails.
     */
    [[nodiscard]] std::string toString() const;

    /**
     * @brief Resolve a numeric host and port into a socket address.
     *
     * No DNS lookup is performed: @p host must be a numeric IPv4 or IPv6 literal.
     *
     * @throws SocketException if @p host is not a valid numeric address.
     */
    [[nodiscard]] static SocketAddress resolve(std::string_view host, Port port);

    /**
     * @brief Copy a native address into a SocketAddress.
     * @throws SocketArgumentException if @p len exceeds `sizeof(sockaddr_storage)`.
     */
    [[nodiscard]] static SocketAddress fromNative(const sockaddr* addr, socklen_t len);
};

} // namespace quicsock

namespace quicsock::internal
{

/**
 * @struct AddrinfoDeleter
 * @brief Custom deleter for `addrinfo*` pointers to support RAII-style cleanup.
 * @ingroup internal
 */
struct AddrinfoDeleter
{
    void operator()(addrinfo* p) const noexcept
    {
        if (p)
            freeaddrinfo(p);
    }
};

/**
 * @typedef AddrinfoPtr
 * @brief Smart pointer that releases `addrinfo` lists with `freeaddrinfo()`.
 * @ingroup internal
 */
using AddrinfoPtr = std::unique_ptr<addrinfo, AddrinfoDeleter>;

/**
 * @brief Resolves a host and port into a list of usable socket address structures.
 * @ingroup internal
 *
 * Thin wrapper around `::getaddrinfo()` with explicit hints. An empty @p host combined with
 * `AI_PASSIVE` yields the family-appropriate wildcard address.
 *
 * @throws SocketException if `getaddrinfo()` fails (message from `gai_strerror()`).
 */
[[nodiscard]] inline AddrinfoPtr resolveAddress(const std::string_view host, const Port port, const int family,
                                                const int socktype, const int protocol, const int flags = 0)
{
    addrinfo hints{};
    hints.ai_family = family;
    hints.ai_socktype = socktype;
    hints.ai_protocol = protocol;
    hints.ai_flags = flags;

    const std::string hostStr(host);
    const std::string portStr = std::to_string(port);
    addrinfo* raw = nullptr;

    if (const int ret = ::getaddrinfo(hostStr.empty() ? nullptr : hostStr.c_str(), portStr.c_str(), &hints, &raw);
        ret != 0)
    {
        throw SocketException(ret, SocketErrorMessage(ret, true));
    }

    return AddrinfoPtr{raw};
}

/**
 * @brief Attempts to close a socket descriptor without throwing exceptions.
 * @ingroup internal
 *
 * Intended for destructors and constructor cleanup where closure failures must not propagate.
 *
 * @return `true` if the socket was already invalid or closed successfully; `false` otherwise.
 */
inline bool tryCloseNoexcept(const SOCKET fd) noexcept
{
    if (fd == INVALID_SOCKET)
        return true;
    return CloseSocket(fd) == 0;
}

/**
 * @brief Closes a socket descriptor and throws on failure.
 * @ingroup internal
 *
 * @throws SocketException If closing the socket fails.
 */
inline void closeOrThrow(const SOCKET fd)
{
    if (fd == INVALID_SOCKET)
        return;
    if (CloseSocket(fd) != 0)
    {
        const int error = GetSocketError();
        throw SocketException(error, SocketErrorMessage(error));
    }
}

/**
 * @brief Throw a SocketException for a given error code, optionally with call-site context.
 * @ingroup internal
 *
 * @details
 * Uses the canonical two-argument pattern `SocketException(err, context + SocketErrorMessage(err))`.
 * When `QUICSOCK_INCLUDE_ERROR_CONTEXT` is enabled at build time, the message is suffixed with
 * `[at file:line function]` from @p loc.
 *
 * @param[in] err      The errno value to report.
 * @param[in] context  Operation prefix, e.g. `"DatagramSocket::sendBatch() failed on fd 7: "`.
 * @param[in] loc      Call-site information, captured automatically.
 */
[[noreturn]] inline void throwSockError(const int err, const std::string_view context,
                                        const std::source_location& loc = std::source_location::current())
{
    std::string msg(context);
    msg.append(SocketErrorMessage(err));
#if QUICSOCK_INCLUDE_ERROR_CONTEXT
    msg.append(" [at ")
        .append(loc.file_name())
        .append(":")
        .append(std::to_string(loc.line()))
        .append(" ")
        .append(loc.function_name())
        .append("]");
#else
    (void) loc;
#endif
    throw SocketException(err, std::move(msg));
}

/**
 * @brief Throw for the thread-local last socket error.
 * @ingroup internal
 */
[[noreturn]] inline void throwLastSockError(const std::string_view context = {},
                                            const std::source_location& loc = std::source_location::current())
{
    throwSockError(GetSocketError(), context, loc);
}

} // namespace quicsock::internal
