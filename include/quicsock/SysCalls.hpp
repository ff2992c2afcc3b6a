/**
 * @file SysCalls.hpp
 * @brief Replaceable boundary for the socket system calls issued by quicsock.
 */

#pragma once

#include "common.hpp"

namespace quicsock
{

/**
 * @brief Result of a system call returning `int`: the raw return value and the `errno` it left.
 * @ingroup core
 *
 * `errnum` is meaningful only when `rc < 0`.
 */
struct SysCallIntResult
{
    int rc = 0;
    int errnum = 0;
};

/**
 * @brief Result of a system call returning `ssize_t`.
 * @ingroup core
 */
struct SysCallSizeResult
{
    ssize_t rc = 0;
    int errnum = 0;
};

/**
 * @class SysCalls
 * @ingroup core
 * @brief Abstract interface over the option, send and receive syscalls used by DatagramSocket.
 *
 * Every call returns its raw result plus the `errno` captured immediately after it, so callers
 * never read a stale `errno`. Production code uses defaultSysCalls(); tests supply their own
 * implementation to count sends, inject failures and fabricate kernel receive results.
 *
 * Implementations must not throw.
 */
class SysCalls
{
  public:
    virtual ~SysCalls() = default;

    virtual SysCallIntResult setsockopt(SOCKET fd, int level, int optName, const void* value, socklen_t len) = 0;

    virtual SysCallIntResult getsockopt(SOCKET fd, int level, int optName, void* value, socklen_t* len) = 0;

    virtual SysCallSizeResult sendmsg(SOCKET fd, const msghdr* message, int flags) = 0;

    virtual SysCallSizeResult recvmsg(SOCKET fd, msghdr* message, int flags) = 0;

#if QUICSOCK_HAS_MMSG
    /**
     * @brief Receive up to @p vlen datagrams in one call.
     * @return Number of `mmsghdr` entries filled, or -1 with `errnum` set.
     */
    virtual SysCallIntResult recvmmsg(SOCKET fd, mmsghdr* messages, unsigned int vlen, int flags,
                                      timespec* timeout) = 0;
#endif
};

/**
 * @class PosixSysCalls
 * @ingroup core
 * @brief SysCalls implementation that forwards straight to the kernel.
 */
class PosixSysCalls final : public SysCalls
{
  public:
    SysCallIntResult setsockopt(SOCKET fd, int level, int optName, const void* value, socklen_t len) override;
    SysCallIntResult getsockopt(SOCKET fd, int level, int optName, void* value, socklen_t* len) override;
    SysCallSizeResult sendmsg(SOCKET fd, const msghdr* message, int flags) override;
    SysCallSizeResult recvmsg(SOCKET fd, msghdr* message, int flags) override;
#if QUICSOCK_HAS_MMSG
    SysCallIntResult recvmmsg(SOCKET fd, mmsghdr* messages, unsigned int vlen, int flags,
                              timespec* timeout) override;
#endif
};

/**
 * @brief Process-wide PosixSysCalls instance used when no SysCalls is supplied.
 * @ingroup core
 */
SysCalls& defaultSysCalls();

} // namespace quicsock
