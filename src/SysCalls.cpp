// SysCalls.cpp

#include "quicsock/SysCalls.hpp"

namespace quicsock
{

SysCallIntResult PosixSysCalls::setsockopt(const SOCKET fd, const int level, const int optName, const void* value,
                                           const socklen_t len)
{
    const int rc = ::setsockopt(fd, level, optName, value, len);
    return {rc, errno};
}

SysCallIntResult PosixSysCalls::getsockopt(const SOCKET fd, const int level, const int optName, void* value,
                                           socklen_t* len)
{
    const int rc = ::getsockopt(fd, level, optName, value, len);
    return {rc, errno};
}

SysCallSizeResult PosixSysCalls::sendmsg(const SOCKET fd, const msghdr* message, const int flags)
{
    const ssize_t rc = ::sendmsg(fd, message, flags);
    return {rc, errno};
}

SysCallSizeResult PosixSysCalls::recvmsg(const SOCKET fd, msghdr* message, const int flags)
{
    const ssize_t rc = ::recvmsg(fd, message, flags);
    return {rc, errno};
}

#if QUICSOCK_HAS_MMSG
SysCallIntResult PosixSysCalls::recvmmsg(const SOCKET fd, mmsghdr* messages, const unsigned int vlen,
                                         const int flags, timespec* timeout)
{
    const int rc = ::recvmmsg(fd, messages, vlen, flags, timeout);
    return {rc, errno};
}
#endif

SysCalls& defaultSysCalls()
{
    static PosixSysCalls instance;
    return instance;
}

} // namespace quicsock
