#include "quicsock/common.hpp"
#include "quicsock/SocketArgumentException.hpp"

#include <system_error>

using namespace quicsock;

std::string quicsock::SocketErrorMessage(int error, const bool gaiStrerror /* = false */)
{
    // 0 means "no error".
    if (error == 0)
        return {};

    // Some APIs return negative errno-like values; normalize to positive for lookups.
    if (error < 0 && !gaiStrerror)
        error = -error;

    // getaddrinfo()/getnameinfo() codes have their own mapper.
    if (gaiStrerror)
    {
        if (const char* m = ::gai_strerror(error); m && *m)
            return {m};
    }

    if (std::string m = std::system_category().message(error); !m.empty())
        return m;

    return "Unknown error " + std::to_string(error);
}

Port SocketAddress::port() const
{
    if (family() == AF_INET)
        return ntohs(reinterpret_cast<const sockaddr_in*>(&storage)->sin_port);
    if (family() == AF_INET6)
        return ntohs(reinterpret_cast<const sockaddr_in6*>(&storage)->sin6_port);
    throw SocketException("SocketAddress::port(): unsupported address family " + std::to_string(family()));
}

std::string SocketAddress::toString() const
{
    if (family() != AF_INET && family() != AF_INET6)
        return "unknown";

    char ip[NI_MAXHOST] = {};
    char service[NI_MAXSERV] = {};
    if (const int ret = ::getnameinfo(data(), length, ip, sizeof(ip), service, sizeof(service),
                                      NI_NUMERICHOST | NI_NUMERICSERV);
        ret != 0)
    {
        throw SocketException(ret, SocketErrorMessage(ret, true));
    }

    if (family() == AF_INET6)
        return std::string("[") + ip + "]:" + service;
    return std::string(ip) + ":" + service;
}

SocketAddress SocketAddress::resolve(const std::string_view host, const Port port)
{
    const internal::AddrinfoPtr res =
        internal::resolveAddress(host, port, AF_UNSPEC, SOCK_DGRAM, IPPROTO_UDP, AI_NUMERICHOST | AI_NUMERICSERV);

    return fromNative(res->ai_addr, static_cast<socklen_t>(res->ai_addrlen));
}

SocketAddress SocketAddress::fromNative(const sockaddr* addr, const socklen_t len)
{
    if (!addr || len == 0)
        throw SocketArgumentException("SocketAddress::fromNative(): null or empty address");
    if (len > static_cast<socklen_t>(sizeof(sockaddr_storage)))
        throw SocketArgumentException("SocketAddress::fromNative(): address length " + std::to_string(len) +
                                      " exceeds sockaddr_storage");

    SocketAddress out;
    std::memcpy(&out.storage, addr, len);
    out.length = len;
    return out;
}
