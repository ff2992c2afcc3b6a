/**
 * @file DatagramSocket.hpp
 * @brief Batched UDP socket with segmentation/receive offload, for QUIC-style transports.
 */

#pragma once

#include "DatagramPacket.hpp"
#include "ReceivedBatch.hpp"
#include "SocketOptions.hpp"
#include "SysCalls.hpp"
#include "common.hpp"

#include <cstddef>
#include <optional>
#include <span>
#include <string>
#include <vector>

namespace quicsock
{

/**
 * @struct BatchLimits
 * @ingroup udp
 * @brief Upper bounds on one DatagramSocket::sendBatch() call.
 *
 * The real ceiling depends on kernel version and NIC driver. These defaults are conservative values
 * every Linux kernel with UDP_SEGMENT accepts: 64 segments (`UDP_MAX_SEGMENTS`) and a total that
 * fits one UDP datagram.
 */
struct BatchLimits
{
    std::size_t maxSegments = 64;                       ///< Maximum payload count per batch.
    std::size_t maxBatchBytes = MaxDatagramPayloadSafe; ///< Maximum summed payload bytes per batch.
};

/**
 * @struct DatagramSocketOptions
 * @ingroup udp
 * @brief Construction-time configuration of a DatagramSocket.
 *
 * All fields have defaults; `DatagramSocketOptions{}` yields an IPv4/IPv6 wildcard socket on an
 * ephemeral port with offload and receive metadata enabled.
 *
 * @code
 * quicsock::DatagramSocketOptions opts;
 * opts.localAddress = "127.0.0.1";
 * opts.localPort = 4433;
 * opts.receiveBufferSize = 4 * 1024 * 1024;
 * quicsock::DatagramSocket sock(opts);
 * @endcode
 */
struct DatagramSocketOptions
{
    /// Numeric local address to bind to. Empty binds the wildcard address.
    std::string localAddress;

    /// Local port. 0 lets the kernel choose.
    Port localPort = 0;

    /// Prefer an IPv6 socket with `IPV6_V6ONLY` off, so IPv4-mapped traffic is accepted too.
    bool dualStack = false;

    /// `SO_REUSEADDR`, applied before bind.
    bool reuseAddress = false;

    /// Receive buffer capacity, applied through SocketOptions::setReceiveBufferSize().
    std::optional<int> receiveBufferSize;

    /// Send buffer capacity, applied through SocketOptions::setSendBufferSize().
    std::optional<int> sendBufferSize;

    /// `SO_RCVTIMEO` in milliseconds. Negative leaves the OS default (block forever).
    int soRecvTimeoutMillis = -1;

    /// `SO_SNDTIMEO` in milliseconds. Negative leaves the OS default.
    int soSendTimeoutMillis = -1;

    /// Put the descriptor in `O_NONBLOCK` mode, for callers that poll it from an event loop.
    bool nonBlocking = false;

    /// Initial offload state. `false` starts the socket with segmentation offload disabled.
    bool segmentationOffload = true;

    /// Request GRO (`UDP_GRO`). Kernels without it are tolerated.
    bool receiveOffload = true;

    /// Request destination info on received datagrams.
    bool packetInfo = true;

    /// Request the TOS / traffic class byte on received datagrams.
    bool ecn = true;

    BatchLimits batchLimits{};

    /// Bytes per receive slot. Must hold the largest GRO-coalesced buffer the kernel may deliver.
    std::size_t receiveSlotSize = DefaultReceiveSlotSize;

    /// Number of receive slots, which caps `maxDatagrams` in receiveBatch().
    std::size_t maxReceiveSlots = 64;
};

/**
 * @class DatagramSocket
 * @ingroup udp
 * @brief Bound UDP socket with batched send (GSO) and batched receive (recvmmsg + GRO).
 *
 * This is the socket handle a QUIC engine drives once per I/O cycle:
 *
 * - sendBatch() coalesces same-size payloads for one peer into a single `sendmsg()` carrying a
 *   `UDP_SEGMENT` directive, so the kernel or NIC splits it into wire packets.
 * - receiveBatch() pulls several datagrams in one `recvmmsg()` and splits GRO-coalesced buffers
 *   back into individual datagrams, each with its destination info and ECN codepoint.
 *
 * ### Offload state
 * Segmentation offload starts enabled (unless disabled by options or unsupported by the kernel).
 * The first send the kernel rejects with the offload-rejection code (see isOffloadUnsupported())
 * disables it for the rest of this socket's lifetime and the batch is re-sent one payload at a
 * time. There is no way to re-enable it. The state is per socket, never shared.
 *
 * ### Thread safety
 * No internal locking. At most one thread may send and at most one thread may receive on a
 * socket at a time. Capacity changes (SocketOptions) must not race with I/O.
 *
 * ### Errors
 * | Condition | Exception |
 * |-----------|-----------|
 * | Invalid batch, closed socket, bad options | SocketArgumentException |
 * | `EPERM` / `EACCES` from a send | SocketPermissionException |
 * | `EAGAIN` / `EWOULDBLOCK` (timeout or non-blocking) | SocketTimeoutException |
 * | Offload rejection (`EIO`) on a coalesced send | none, absorbed |
 * | Any other syscall failure | SocketException |
 *
 * `EINTR` is retried.
 */
class DatagramSocket : public SocketOptions
{
  public:
    /**
     * @brief Create, configure and bind a UDP socket.
     *
     * Steps, in order: resolve the local address (`AI_PASSIVE`), create the socket (IPv6 first when
     * @ref DatagramSocketOptions::dualStack is set, IPv4 first otherwise), apply `SO_REUSEADDR`,
     * buffer capacities, timeouts and blocking mode, bind, enable receive metadata, then probe
     * segmentation offload.
     *
     * @param options  Configuration.
     * @param sysCalls Boundary used for option, send and receive calls. Must outlive the socket.
     *
     * @throws SocketArgumentException   for invalid options.
     * @throws SocketPermissionException if a requested buffer capacity needs a privilege the
     *                                   process lacks.
     * @throws SocketException           if any other step fails. The descriptor is closed first.
     */
    explicit DatagramSocket(const DatagramSocketOptions& options = {}, SysCalls& sysCalls = defaultSysCalls());

    /**
     * @brief Close the socket. A close failure is logged, never thrown.
     */
    ~DatagramSocket() noexcept override;

    DatagramSocket(const DatagramSocket&) = delete;
    DatagramSocket& operator=(const DatagramSocket&) = delete;

    /**
     * @brief Move the socket, its offload state and its buffers.
     *
     * Views from a ReceivedBatch of @p rhs stay valid; they now reference this socket's slots.
     */
    DatagramSocket(DatagramSocket&& rhs) noexcept;

    DatagramSocket& operator=(DatagramSocket&& rhs) noexcept;

    /**
     * @brief Close the descriptor. Idempotent.
     * @throws SocketException if `close()` fails.
     */
    void close();

    [[nodiscard]] bool isOpen() const noexcept { return getSocketFd() != INVALID_SOCKET; }

    /**
     * @brief The bound local address (from `getsockname()`), including the chosen port.
     * @throws SocketException if the socket is closed or the call fails.
     */
    [[nodiscard]] SocketAddress getLocalSocketAddress() const;

    /**
     * @brief Send one datagram with a single `sendmsg()`, no control message.
     *
     * A zero-length payload is a valid UDP datagram and is sent as such.
     */
    void sendTo(const SocketAddress& destination, std::span<const std::byte> payload);

    /**
     * @brief Send an ordered batch of payloads to one peer.
     *
     * Preconditions (violations throw SocketArgumentException, nothing is sent):
     * - at least one payload, none empty;
     * - every payload but the last has the same length as the first, and the last is not longer;
     * - payload count and total bytes are within BatchLimits.
     *
     * With offload enabled and more than one payload, the payloads are concatenated and sent with
     * one `sendmsg()` carrying the segment size (the first payload's length). Otherwise each
     * payload is sent with its own `sendmsg()`, in order.
     *
     * If the coalesced send fails with the offload-rejection code, offload is disabled for good,
     * a warning is logged, and the batch is re-sent one payload at a time. Any other failure
     * propagates unchanged.
     */
    void sendBatch(const SocketAddress& destination, std::span<const std::span<const std::byte>> payloads);

    /**
     * @brief Receive up to @p maxDatagrams kernel datagrams in one call.
     *
     * On Linux, issues one `recvmmsg(MSG_WAITFORONE)`: it blocks until one datagram is available,
     * then returns whatever else is already queued. Elsewhere, one `recvmsg()`.
     * Kernel results flagged `MSG_TRUNC` are dropped with a warning.
     *
     * @param maxDatagrams Kernel results to request; clamped to
     *        @ref DatagramSocketOptions::maxReceiveSlots. Must be at least 1.
     * @return A lazy sequence of datagrams; GRO-coalesced results expand to several entries.
     *         Valid until the next receiveBatch() or recvFrom() on this socket.
     *
     * @throws SocketTimeoutException on `EAGAIN` / `EWOULDBLOCK`.
     * @throws SocketException        on any other receive failure.
     */
    [[nodiscard]] ReceivedBatch receiveBatch(std::size_t maxDatagrams);

    /**
     * @brief Receive one kernel datagram into an owning packet.
     *
     * Reuses the first receive slot, so views from an earlier receiveBatch() are invalidated.
     */
    [[nodiscard]] DatagramPacket recvFrom();

    /// Whether the next multi-payload sendBatch() will try a coalesced send.
    [[nodiscard]] bool isOffloadEnabled() const noexcept { return _offloadEnabled; }

    /// Permanently disable segmentation offload on this socket.
    void disableOffload() noexcept { _offloadEnabled = false; }

    [[nodiscard]] const BatchLimits& getBatchLimits() const noexcept { return _limits; }

  private:
    void cleanup() noexcept;
    [[noreturn]] void cleanupAndRethrow();
    [[noreturn]] void cleanupAndThrow(int errorCode);

    void validateBatch(std::span<const std::span<const std::byte>> payloads) const;
    void requireOpen(const char* operation) const;
    void sendCoalesced(const SocketAddress& destination, std::span<const std::span<const std::byte>> payloads);
    SysCallSizeResult sendMessage(const msghdr& message);
    [[noreturn]] void throwSendError(int errorCode, const char* operation) const;
    [[noreturn]] void throwReceiveError(int errorCode, const char* operation) const;
    msghdr prepareSlot(std::size_t index);
    void allocateReceiveSlots();

    BatchLimits _limits;
    std::size_t _slotSize = DefaultReceiveSlotSize;
    std::size_t _maxSlots = 64;
    bool _offloadEnabled = true; ///< Sticky: only ever goes from true to false.

    std::vector<std::byte> _sendBuffer;  ///< Reused concatenation buffer for coalesced sends.
    std::vector<std::byte> _sendControl; ///< Reused segmentation directive.

    std::vector<std::byte> _recvData;           ///< `_maxSlots * _slotSize` payload bytes.
    std::vector<std::byte> _recvControl;        ///< `_maxSlots * ReceiveControlBufferSize` bytes.
    std::vector<sockaddr_storage> _recvNames;   ///< One source address per slot.
    std::vector<iovec> _recvIov;                ///< One iovec per slot.
#if QUICSOCK_HAS_MMSG
    std::vector<mmsghdr> _recvHeaders;
#endif
};

} // namespace quicsock
