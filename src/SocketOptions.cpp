// SocketOptions.cpp

#include "quicsock/SocketOptions.hpp"
#include "quicsock/Logger.hpp"
#include "quicsock/SocketArgumentException.hpp"
#include "quicsock/SocketException.hpp"
#include "quicsock/SocketPermissionException.hpp"

#include <climits>

namespace quicsock
{

namespace
{

constexpr int MaxBufferRequest = INT_MAX / 2;

void validateBufferRequest(const int size, const char* operation)
{
    if (size <= 0 || size > MaxBufferRequest)
        throw SocketArgumentException(std::string(operation) + " failed: capacity must be in [1, " +
                                      std::to_string(MaxBufferRequest) + "], got " + std::to_string(size));
}

std::string optionName(const int level, const int optName)
{
    struct Known
    {
        int level;
        int name;
        const char* text;
    };
    static const Known known[] = {
        {SOL_SOCKET, SO_REUSEADDR, "SO_REUSEADDR"},
        {SOL_SOCKET, SO_RCVBUF, "SO_RCVBUF"},
        {SOL_SOCKET, SO_SNDBUF, "SO_SNDBUF"},
        {SOL_SOCKET, SO_RCVTIMEO, "SO_RCVTIMEO"},
        {SOL_SOCKET, SO_SNDTIMEO, "SO_SNDTIMEO"},
        {IPPROTO_IP, IP_PKTINFO, "IP_PKTINFO"},
        {IPPROTO_IP, IP_RECVTOS, "IP_RECVTOS"},
        {IPPROTO_IPV6, IPV6_V6ONLY, "IPV6_V6ONLY"},
        {IPPROTO_IPV6, IPV6_RECVPKTINFO, "IPV6_RECVPKTINFO"},
        {IPPROTO_IPV6, IPV6_RECVTCLASS, "IPV6_RECVTCLASS"},
#if QUICSOCK_HAS_SEGMENTATION_OFFLOAD
        {SOL_UDP, UDP_SEGMENT, "UDP_SEGMENT"},
        {SOL_UDP, UDP_GRO, "UDP_GRO"},
#endif
    };

    for (const auto& entry : known)
        if (entry.level == level && entry.name == optName)
            return entry.text;
    return "level " + std::to_string(level) + " option " + std::to_string(optName);
}

std::string optionFailure(const char* call, const int level, const int optName, const SOCKET fd, const int errnum)
{
    return std::string(call) + "(" + optionName(level, optName) + ") failed on fd " + std::to_string(fd) + ": " +
           SocketErrorMessage(errnum);
}

timeval toTimeval(const int millis) noexcept
{
    timeval tv{};
    tv.tv_sec = millis / 1000;
    tv.tv_usec = (millis % 1000) * 1000;
    return tv;
}

} // namespace

// NOLINTNEXTLINE(readability-make-member-function-const) - changes socket state
void SocketOptions::setOption(const int level, const int optName, const int value)
{
    setOption(level, optName, static_cast<const void*>(&value), static_cast<socklen_t>(sizeof(value)));
}

// NOLINTNEXTLINE(readability-make-member-function-const) - changes socket state
void SocketOptions::setOption(const int level, const int optName, const void* value, const socklen_t len)
{
    if (_sockFd == INVALID_SOCKET)
        throw SocketException("setOption() failed: socket not open.");

    if (!value || len == 0)
        throw SocketException("setOption() failed: null buffer or zero length.");

    if (const auto result = _sysCalls->setsockopt(_sockFd, level, optName, value, len); result.rc < 0)
        throw SocketException(result.errnum, optionFailure("setsockopt", level, optName, _sockFd, result.errnum));
}

int SocketOptions::getOption(const int level, const int optName) const
{
    int value = 0;
    socklen_t len = sizeof(value);

    getOption(level, optName, &value, &len);
    return value;
}

void SocketOptions::getOption(const int level, const int optName, void* result, socklen_t* len) const
{
    if (_sockFd == INVALID_SOCKET)
        throw SocketException("getOption() failed: socket not open.");

    if (!result || !len || *len == 0)
        throw SocketException("getOption() failed: invalid buffer or length.");

    if (const auto rc = _sysCalls->getsockopt(_sockFd, level, optName, result, len); rc.rc < 0)
        throw SocketException(rc.errnum, optionFailure("getsockopt", level, optName, _sockFd, rc.errnum));
}

// NOLINTNEXTLINE(readability-make-member-function-const) - changes socket state
void SocketOptions::setReuseAddress(const bool on)
{
    setOption(SOL_SOCKET, SO_REUSEADDR, on ? 1 : 0);
}

void SocketOptions::setReceiveBufferSize(const int size)
{
#if defined(SO_RCVBUFFORCE)
    applyBufferSize(SO_RCVBUF, SO_RCVBUFFORCE, size, "setReceiveBufferSize()");
#else
    applyBufferSize(SO_RCVBUF, -1, size, "setReceiveBufferSize()");
#endif
}

int SocketOptions::getReceiveBufferSize() const
{
    return getOption(SOL_SOCKET, SO_RCVBUF);
}

void SocketOptions::setSendBufferSize(const int size)
{
#if defined(SO_SNDBUFFORCE)
    applyBufferSize(SO_SNDBUF, SO_SNDBUFFORCE, size, "setSendBufferSize()");
#else
    applyBufferSize(SO_SNDBUF, -1, size, "setSendBufferSize()");
#endif
}

int SocketOptions::getSendBufferSize() const
{
    return getOption(SOL_SOCKET, SO_SNDBUF);
}

void SocketOptions::forceSetReceiveBufferSize(const int size)
{
    validateBufferRequest(size, "forceSetReceiveBufferSize()");
#if defined(SO_RCVBUFFORCE)
    forceBufferSize(SO_RCVBUFFORCE, size, "forceSetReceiveBufferSize()");
#else
    forceBufferSize(-1, size, "forceSetReceiveBufferSize()");
#endif
}

void SocketOptions::forceSetSendBufferSize(const int size)
{
    validateBufferRequest(size, "forceSetSendBufferSize()");
#if defined(SO_SNDBUFFORCE)
    forceBufferSize(SO_SNDBUFFORCE, size, "forceSetSendBufferSize()");
#else
    forceBufferSize(-1, size, "forceSetSendBufferSize()");
#endif
}

void SocketOptions::applyBufferSize(const int optName, const int forceOptName, const int size,
                                    const char* operation)
{
    validateBufferRequest(size, operation);

    setOption(SOL_SOCKET, optName, size);

    const int expected = 2 * size;
    int effective = getOption(SOL_SOCKET, optName);
    if (effective >= expected)
        return;

    QUICSOCK_LOG(debug, "{}: fd {} clamped to {} bytes (wanted {}), retrying with privileged override", operation,
                 _sockFd, effective, expected);

    forceBufferSize(forceOptName, size, operation);

    effective = getOption(SOL_SOCKET, optName);
    if (effective < expected)
        throw SocketException(std::string(operation) + " failed: requested " + std::to_string(size) +
                              " bytes, kernel reports " + std::to_string(effective) + " (expected " +
                              std::to_string(expected) + ")");
}

// NOLINTNEXTLINE(readability-make-member-function-const) - changes socket state
void SocketOptions::forceBufferSize(const int forceOptName, const int size, const char* operation)
{
    if (_sockFd == INVALID_SOCKET)
        throw SocketException(std::string(operation) + " failed: socket not open.");

    if (forceOptName < 0)
        throw SocketPermissionException(EPERM, std::string(operation) +
                                                   " failed: no privileged buffer override on this platform");

    const auto result = _sysCalls->setsockopt(_sockFd, SOL_SOCKET, forceOptName, &size,
                                              static_cast<socklen_t>(sizeof(size)));
    if (result.rc < 0)
    {
        QUICSOCK_LOG(debug, "{}: privileged override rejected on fd {}: {}", operation, _sockFd,
                     SocketErrorMessage(result.errnum));
        throw SocketPermissionException(result.errnum, std::string(operation) +
                                                           " failed: privileged override rejected: " +
                                                           SocketErrorMessage(result.errnum));
    }
}

// NOLINTNEXTLINE(readability-make-member-function-const) - changes socket state
void SocketOptions::setSoRecvTimeout(const int millis)
{
    if (millis < 0)
        throw SocketArgumentException("setSoRecvTimeout() failed: timeout must be non-negative.");

    const timeval tv = toTimeval(millis);
    setOption(SOL_SOCKET, SO_RCVTIMEO, &tv, static_cast<socklen_t>(sizeof(tv)));
}

// NOLINTNEXTLINE(readability-make-member-function-const) - changes socket state
void SocketOptions::setSoSendTimeout(const int millis)
{
    if (millis < 0)
        throw SocketArgumentException("setSoSendTimeout() failed: timeout must be non-negative.");

    const timeval tv = toTimeval(millis);
    setOption(SOL_SOCKET, SO_SNDTIMEO, &tv, static_cast<socklen_t>(sizeof(tv)));
}

// NOLINTNEXTLINE(readability-make-member-function-const) - changes socket state
void SocketOptions::setNonBlocking(const bool nonBlocking)
{
    if (_sockFd == INVALID_SOCKET)
        throw SocketException("setNonBlocking() failed: socket is not open.");

    const int flags = ::fcntl(_sockFd, F_GETFL, 0);
    if (flags < 0)
        internal::throwLastSockError("fcntl(F_GETFL) failed on fd " + std::to_string(_sockFd) + ": ");

    const int newFlags = nonBlocking ? (flags | O_NONBLOCK) : (flags & ~O_NONBLOCK);
    if (::fcntl(_sockFd, F_SETFL, newFlags) < 0)
        internal::throwLastSockError("fcntl(F_SETFL) failed on fd " + std::to_string(_sockFd) + ": ");
}

bool SocketOptions::getNonBlocking() const
{
    if (_sockFd == INVALID_SOCKET)
        throw SocketException("getNonBlocking() failed: socket is not open.");

    const int flags = ::fcntl(_sockFd, F_GETFL, 0);
    if (flags < 0)
        internal::throwLastSockError("fcntl(F_GETFL) failed on fd " + std::to_string(_sockFd) + ": ");

    return (flags & O_NONBLOCK) != 0;
}

int SocketOptions::socketFamily() const
{
    if (_sockFd == INVALID_SOCKET)
        throw SocketException("socketFamily() failed: socket is not open.");

    sockaddr_storage addr{};
    socklen_t len = sizeof(addr);
    if (::getsockname(_sockFd, reinterpret_cast<sockaddr*>(&addr), &len) < 0)
        internal::throwLastSockError("getsockname() failed on fd " + std::to_string(_sockFd) + ": ");

    return addr.ss_family;
}

// NOLINTNEXTLINE(readability-make-member-function-const) - changes socket state
void SocketOptions::setIPv6Only(const bool enable)
{
    if (socketFamily() != AF_INET6)
        throw SocketException("setIPv6Only() failed: socket is not IPv6");

    setOption(IPPROTO_IPV6, IPV6_V6ONLY, enable ? 1 : 0);
}

bool SocketOptions::getIPv6Only() const
{
    if (socketFamily() != AF_INET6)
        throw SocketException("getIPv6Only() failed: socket is not IPv6");

    return getOption(IPPROTO_IPV6, IPV6_V6ONLY) != 0;
}

void SocketOptions::setPacketInfo(const bool enable)
{
    const int value = enable ? 1 : 0;
    if (socketFamily() == AF_INET6)
    {
        setOption(IPPROTO_IPV6, IPV6_RECVPKTINFO, value);
        if (getIPv6Only())
            return;
    }
    setOption(IPPROTO_IP, IP_PKTINFO, value);
}

void SocketOptions::setEcnReporting(const bool enable)
{
    const int value = enable ? 1 : 0;
    if (socketFamily() == AF_INET6)
    {
        setOption(IPPROTO_IPV6, IPV6_RECVTCLASS, value);
        if (getIPv6Only())
            return;
    }
    setOption(IPPROTO_IP, IP_RECVTOS, value);
}

void SocketOptions::setReceiveOffload(const bool enable)
{
#if QUICSOCK_HAS_SEGMENTATION_OFFLOAD
    setOption(SOL_UDP, UDP_GRO, enable ? 1 : 0);
#else
    (void) enable;
    throw SocketException("setReceiveOffload() failed: UDP_GRO is not available on this platform");
#endif
}

bool SocketOptions::probeSegmentationOffload() const noexcept
{
#if QUICSOCK_HAS_SEGMENTATION_OFFLOAD
    if (_sockFd == INVALID_SOCKET)
        return false;

    int value = 0;
    socklen_t len = sizeof(value);
    return _sysCalls->getsockopt(_sockFd, SOL_UDP, UDP_SEGMENT, &value, &len).rc == 0;
#else
    return false;
#endif
}

} // namespace quicsock
