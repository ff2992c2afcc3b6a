/**
 * @file DatagramPacket.hpp
 * @brief Datagram value types produced by the receive path.
 */

#pragma once

#include "ControlMessage.hpp"
#include "common.hpp"

#include <cstddef>
#include <cstdint>
#include <optional>
#include <span>
#include <vector>

namespace quicsock
{

/**
 * @struct ReceivedDatagram
 * @ingroup udp
 * @brief One application-visible datagram from DatagramSocket::receiveBatch().
 *
 * When the kernel coalesced several wire packets into one buffer (GRO), each segment becomes its own
 * ReceivedDatagram. All segments of one coalesced buffer share the same @ref source,
 * @ref packetInfo and @ref ecn.
 *
 * @warning @ref payload is a view into the socket's receive slots. It is valid until the next
 *          `receiveBatch()` on the same socket, or until the socket is destroyed. Copy the bytes
 *          if they must live longer.
 */
struct ReceivedDatagram
{
    /// Payload bytes, uninterpreted.
    std::span<const std::byte> payload;

    /// Sender address.
    SocketAddress source;

    /// Receiving interface and original destination, if the kernel reported it.
    std::optional<PacketInfo> packetInfo;

    /// ECN codepoint (0..3), if the kernel reported the TOS / traffic class byte.
    std::optional<std::uint8_t> ecn;
};

/**
 * @struct RawDatagram
 * @ingroup udp
 * @brief One kernel receive result before ancillary decoding and GRO splitting.
 *
 * Produced by the socket from each filled receive slot. Exposed so that a ReceivedBatch can be
 * built directly from captured kernel buffers.
 */
struct RawDatagram
{
    std::span<const std::byte> payload; ///< Bytes the kernel wrote into the slot.
    std::span<const std::byte> control; ///< Ancillary bytes (`msg_control`, `msg_controllen`).
    SocketAddress source;               ///< Sender address from `msg_name`.
};

/**
 * @struct DatagramPacket
 * @ingroup udp
 * @brief Owning single-datagram result of DatagramSocket::recvFrom().
 *
 * Unlike ReceivedDatagram this owns its bytes. When receive offload is enabled the kernel may
 * still deliver a coalesced buffer here; @ref segmentSize then holds the GRO segment size and
 * the caller is responsible for splitting. It is 0 for an ordinary datagram.
 */
struct DatagramPacket
{
    std::vector<std::byte> buffer;
    SocketAddress source;
    std::optional<PacketInfo> packetInfo;
    std::optional<std::uint8_t> ecn;
    std::uint16_t segmentSize = 0;
};

} // namespace quicsock
