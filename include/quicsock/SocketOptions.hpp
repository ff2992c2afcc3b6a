/**
 * @file SocketOptions.hpp
 * @brief Defines the SocketOptions base class: socket option access and buffer capacity control.
 *
 * `SocketOptions` is inherited by DatagramSocket and owns every `setsockopt()`/`getsockopt()` the
 * library issues, including the kernel buffer Capacity Controller with its privileged override
 * path, and the switches that make the kernel attach receive metadata (packet info, ECN, GRO).
 */

#pragma once

#include "SysCalls.hpp"
#include "common.hpp"

namespace quicsock
{

/**
 * @class SocketOptions
 * @brief Base class for socket option access via the SysCalls boundary.
 * @ingroup socketopts
 *
 * Derived classes pass their socket descriptor to the constructor and call setSocketFd() when the
 * descriptor changes. This class does **not** own the descriptor.
 *
 * ## Buffer capacity
 * The kernel stores twice the requested buffer size to account for its own bookkeeping, and
 * `getsockopt()` reports the doubled value. After a successful setReceiveBufferSize(n),
 * getReceiveBufferSize() returns exactly `2 * n`; a later request fully replaces the earlier one.
 * This doubling is a fixed kernel contract.
 *
 * @note Not thread-safe. Capacity changes are expected at setup or reconfiguration time only,
 *       never concurrently with in-flight I/O on the same socket.
 */
class SocketOptions
{
  public:
    /**
     * @brief Bind the option interface to a descriptor and a SysCalls implementation.
     *
     * @param[in] sock     A valid socket descriptor, or `INVALID_SOCKET` if not yet created.
     * @param[in] sysCalls Syscall boundary used for every option call. Must outlive this object.
     */
    SocketOptions(const SOCKET sock, SysCalls& sysCalls) noexcept : _sockFd(sock), _sysCalls(&sysCalls) {}

    virtual ~SocketOptions() = default;

    /**
     * @brief The native socket descriptor, or `INVALID_SOCKET`.
     *
     * Intended for integration with event loops (`poll()`, `epoll`). Do not close it or change
     * options behind the library's back.
     */
    [[nodiscard]] SOCKET getSocketFd() const noexcept { return _sockFd; }

    /**
     * @brief Set an integer socket option.
     * @throws SocketException on failure, or if the socket is not open.
     */
    void setOption(int level, int optName, int value);

    /**
     * @brief Set a socket option from a raw buffer.
     * @throws SocketException on failure, if the socket is not open, or for a null/empty buffer.
     */
    void setOption(int level, int optName, const void* value, socklen_t len);

    /**
     * @brief Read an integer socket option.
     * @throws SocketException on failure.
     */
    [[nodiscard]] int getOption(int level, int optName) const;

    /**
     * @brief Read a socket option into a raw buffer. `*len` is updated to the returned size.
     * @throws SocketException on failure, or for an invalid buffer.
     */
    void getOption(int level, int optName, void* result, socklen_t* len) const;

    /// Enable or disable `SO_REUSEADDR`.
    void setReuseAddress(bool on);

    /**
     * @brief Set the receive buffer capacity, escalating to the privileged override when clamped.
     * @ingroup socketopts
     *
     * 1. Applies `SO_RCVBUF` (unprivileged). The kernel silently clamps it to `net.core.rmem_max`.
     * 2. Reads the effective size back. If it is below `2 * size`, the request was clamped and
     *    `SO_RCVBUFFORCE` is applied, which requires `CAP_NET_ADMIN`.
     * 3. Verifies that the effective size is now `2 * size`.
     *
     * @param size Requested capacity in bytes, in `[1, INT_MAX / 2]`.
     *
     * @throws SocketArgumentException     if @p size is outside the accepted range.
     * @throws SocketPermissionException   if the privileged override was needed and rejected.
     * @throws SocketException             on any other option failure, or if the kernel still does
     *                                     not report the doubled size afterwards.
     */
    void setReceiveBufferSize(int size);

    /**
     * @brief Effective receive buffer capacity as reported by the kernel (`SO_RCVBUF`).
     *
     * Equals `2 ×` the last size the kernel accepted. Never assume it equals the requested value.
     */
    [[nodiscard]] int getReceiveBufferSize() const;

    /**
     * @brief Set the send buffer capacity. Same contract as setReceiveBufferSize(), using
     *        `SO_SNDBUF` / `SO_SNDBUFFORCE`.
     */
    void setSendBufferSize(int size);

    /// Effective send buffer capacity as reported by the kernel (`SO_SNDBUF`).
    [[nodiscard]] int getSendBufferSize() const;

    /**
     * @brief Apply `SO_RCVBUFFORCE` directly, bypassing the unprivileged attempt.
     *
     * @throws SocketArgumentException   if @p size is outside `[1, INT_MAX / 2]`.
     * @throws SocketPermissionException if the kernel rejects the override or the platform has none.
     */
    void forceSetReceiveBufferSize(int size);

    /// `SO_SNDBUFFORCE` counterpart of forceSetReceiveBufferSize().
    void forceSetSendBufferSize(int size);

    /**
     * @brief Set the receive timeout (`SO_RCVTIMEO`). 0 disables the timeout.
     *
     * An expired timeout surfaces as SocketTimeoutException from the receive path.
     */
    void setSoRecvTimeout(int millis);

    /// Set the send timeout (`SO_SNDTIMEO`). 0 disables the timeout.
    void setSoSendTimeout(int millis);

    /**
     * @brief Toggle `O_NONBLOCK` on the descriptor.
     *
     * On a non-blocking socket, a send or receive that cannot complete immediately throws
     * SocketTimeoutException.
     */
    void setNonBlocking(bool nonBlocking);

    [[nodiscard]] bool getNonBlocking() const;

    /// `IPV6_V6ONLY`. Only valid on IPv6 sockets.
    void setIPv6Only(bool enable);

    [[nodiscard]] bool getIPv6Only() const;

    /**
     * @brief Ask the kernel to attach destination info (`IP_PKTINFO` / `IPV6_RECVPKTINFO`) to
     *        every received datagram.
     *
     * On a dual-stack IPv6 socket both the IPv4 and the IPv6 option are set, so IPv4-mapped
     * traffic is covered too.
     */
    void setPacketInfo(bool enable);

    /**
     * @brief Ask the kernel to attach the TOS / traffic class byte (`IP_RECVTOS` /
     *        `IPV6_RECVTCLASS`), from which the ECN codepoint is extracted.
     */
    void setEcnReporting(bool enable);

    /**
     * @brief Enable or disable Generic Receive Offload (`UDP_GRO`).
     *
     * @throws SocketException if the kernel rejects the option, or the platform lacks it.
     */
    void setReceiveOffload(bool enable);

    /**
     * @brief Probe whether the kernel accepts the segmentation offload option on this socket.
     *
     * Issues `getsockopt(SOL_UDP, UDP_SEGMENT)`. Never throws; returns `false` on any failure and
     * on platforms without segmentation offload.
     */
    [[nodiscard]] bool probeSegmentationOffload() const noexcept;

  protected:
    /// Update the descriptor after creation, move or close.
    void setSocketFd(const SOCKET sock) noexcept { _sockFd = sock; }

    /// The syscall boundary shared with the derived class.
    [[nodiscard]] SysCalls& sysCalls() const noexcept { return *_sysCalls; }

    /// Address family the socket was created with (from `getsockname()`).
    [[nodiscard]] int socketFamily() const;

  private:
    SOCKET _sockFd = INVALID_SOCKET; ///< Descriptor the options apply to (not owned).
    SysCalls* _sysCalls;             ///< Never null.

    void applyBufferSize(int optName, int forceOptName, int size, const char* operation);
    void forceBufferSize(int forceOptName, int size, const char* operation);
};

} // namespace quicsock
