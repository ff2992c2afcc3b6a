/**
 * @file ControlMessage.hpp
 * @brief Encoding and decoding of ancillary (control message) buffers.
 *
 * Outgoing: the GSO segment-size directive attached to a coalesced send.
 * Incoming: destination info (IP_PKTINFO / IPV6_PKTINFO), ECN marking (IP_TOS / IPV6_TCLASS)
 * and the GRO segment size (UDP_GRO).
 *
 * Buffers are treated as untyped byte ranges. Every header's declared length is checked against
 * the bytes that remain before its body is read, so a truncated or inconsistent buffer degrades to
 * "record not present" and never aborts datagram processing.
 */

#pragma once

#include "common.hpp"

#include <array>
#include <bit>
#include <cstdint>
#include <optional>
#include <span>
#include <string>
#include <variant>
#include <vector>

namespace quicsock
{

/**
 * @brief Byte order used for the integer fields inside control message bodies.
 * @ingroup cmsg
 *
 * The kernel writes these fields in the host CPU's native order, which is big-endian on
 * s390x, ppc64, mips and mips64 and little-endian elsewhere. The header fields
 * (`cmsg_len`, `cmsg_level`, `cmsg_type`) are always in host layout and are not affected.
 */
enum class ByteOrder
{
    LittleEndian,
    BigEndian
};

/**
 * @brief Body byte order of the target this library is built for.
 * @ingroup cmsg
 */
inline constexpr ByteOrder NativeByteOrder =
    (std::endian::native == std::endian::big) ? ByteOrder::BigEndian : ByteOrder::LittleEndian;

/**
 * @brief Destination of an inbound packet: receiving interface and the original destination address.
 * @ingroup cmsg
 *
 * For IPv4 only the first 4 bytes of @ref address are used.
 */
struct PacketInfo
{
    std::uint32_t interfaceIndex = 0;       ///< Index of the interface the packet arrived on.
    int family = AF_UNSPEC;                 ///< `AF_INET` or `AF_INET6`.
    std::array<std::uint8_t, 16> address{}; ///< Destination address in network byte order.

    /// Build an IPv4 PacketInfo.
    [[nodiscard]] static PacketInfo v4(std::uint32_t ifIndex, const std::array<std::uint8_t, 4>& ip) noexcept;

    /// Numeric text form of the destination address ("192.0.2.1", "2001:db8::1").
    [[nodiscard]] std::string addressString() const;

    bool operator==(const PacketInfo&) const = default;
};

/**
 * @brief Explicit Congestion Notification codepoint (the two low bits of TOS / traffic class).
 * @ingroup cmsg
 */
struct EcnMarking
{
    std::uint8_t codepoint = 0;

    bool operator==(const EcnMarking&) const = default;
};

/**
 * @brief Segment size reported by GRO for a coalesced receive, or requested for a GSO send.
 * @ingroup cmsg
 */
struct SegmentSize
{
    std::uint16_t bytes = 0;

    bool operator==(const SegmentSize&) const = default;
};

/**
 * @brief One decoded kernel control message.
 * @ingroup cmsg
 */
using AncillaryRecord = std::variant<PacketInfo, EcnMarking, SegmentSize>;

/**
 * @brief Bytes needed to receive the largest combination of known records.
 *
 * A dual-stack socket receiving IPv4 traffic gets both packet info records, both `IP_TOS` and
 * `IPV6_TCLASS`, and the GRO segment size. Anything smaller makes the kernel set `MSG_CTRUNC`
 * and drop the trailing records.
 *
 * @ingroup cmsg
 */
inline constexpr std::size_t ReceiveControlBufferSize =
    CMSG_SPACE(sizeof(in_pktinfo)) + CMSG_SPACE(sizeof(in6_pktinfo)) + 3 * CMSG_SPACE(sizeof(int));

/**
 * @brief Bytes needed for one outgoing segmentation directive.
 * @ingroup cmsg
 */
inline constexpr std::size_t SegmentationDirectiveSize = CMSG_SPACE(sizeof(std::uint16_t));

/**
 * @brief Append one control message (header, body, trailing padding) to @p buffer.
 * @ingroup cmsg
 *
 * The header is written in host layout; the body is copied verbatim. Padding bytes are zero.
 */
void appendControlMessage(std::vector<std::byte>& buffer, int level, int type, std::span<const std::byte> body);

/**
 * @brief Encode the GSO directive for a coalesced send.
 * @ingroup cmsg
 *
 * Produces exactly one control message (`SOL_UDP`, `UDP_SEGMENT`) whose body is a single
 * 16-bit unsigned segment size in @p order.
 *
 * @param segmentSize Uniform length of every segment but the last. Must be non-zero.
 * @param order       Body byte order; the kernel expects NativeByteOrder.
 * @return A buffer of exactly SegmentationDirectiveSize bytes.
 *
 * @throws SocketArgumentException if @p segmentSize is 0.
 */
[[nodiscard]] std::vector<std::byte> encodeSegmentationDirective(std::uint16_t segmentSize,
                                                                 ByteOrder order = NativeByteOrder);

/**
 * @brief Encode the GSO directive into @p buffer, replacing its contents.
 * @ingroup cmsg
 *
 * Same output as the returning overload. The buffer's capacity is reused, so a buffer reserved to
 * SegmentationDirectiveSize never reallocates.
 *
 * @throws SocketArgumentException if @p segmentSize is 0. @p buffer is left unchanged.
 */
void encodeSegmentationDirective(std::vector<std::byte>& buffer, std::uint16_t segmentSize,
                                 ByteOrder order = NativeByteOrder);

/**
 * @brief Decode every recognized record in an ancillary buffer.
 * @ingroup cmsg
 *
 * Scans header by header with an explicit cursor. Unrecognized `(level, type)` pairs are skipped.
 * A recognized record whose body is too short is skipped. A header whose declared length is
 * smaller than a header or larger than the bytes that remain ends the scan; the records decoded
 * so far are returned. Never throws for malformed input.
 *
 * @param buffer Raw bytes as filled in by the kernel (`msg_control`, `msg_controllen`).
 * @param order  Byte order of integer body fields.
 */
[[nodiscard]] std::vector<AncillaryRecord> decodeControlMessages(std::span<const std::byte> buffer,
                                                                 ByteOrder order = NativeByteOrder);

/**
 * @brief Parse an IPv4 packet-info body.
 * @ingroup cmsg
 *
 * Layout (12 bytes): interface index (4 bytes, @p order), specified destination (4 bytes),
 * original destination address (4 bytes, network order). The interface index and the original
 * destination are reported.
 *
 * @return The packet info, or `std::nullopt` when @p body is shorter than 12 bytes.
 */
[[nodiscard]] std::optional<PacketInfo> parseIPv4PacketInfo(std::span<const std::byte> body,
                                                            ByteOrder order = NativeByteOrder) noexcept;

/**
 * @brief Parse an IPv6 packet-info body.
 * @ingroup cmsg
 *
 * Layout (20 bytes): destination address (16 bytes), interface index (4 bytes, @p order).
 *
 * @return The packet info, or `std::nullopt` when @p body is shorter than 20 bytes.
 */
[[nodiscard]] std::optional<PacketInfo> parseIPv6PacketInfo(std::span<const std::byte> body,
                                                            ByteOrder order = NativeByteOrder) noexcept;

/**
 * @brief Parse a TOS / traffic-class body into its ECN codepoint.
 * @ingroup cmsg
 *
 * Accepts a native `int` (IPV6_TCLASS, and IP_TOS on some platforms) or a single byte
 * (IP_TOS on Linux).
 *
 * @return The ECN marking, or `std::nullopt` for an empty body.
 */
[[nodiscard]] std::optional<EcnMarking> parseTrafficClass(std::span<const std::byte> body,
                                                          ByteOrder order = NativeByteOrder) noexcept;

/**
 * @brief Parse a GRO segment-size body (a native `int`).
 * @ingroup cmsg
 *
 * @return The segment size, or `std::nullopt` when the body is shorter than an `int` or the value
 *         is not in `[1, 65535]`.
 */
[[nodiscard]] std::optional<SegmentSize> parseSegmentSize(std::span<const std::byte> body,
                                                          ByteOrder order = NativeByteOrder) noexcept;

} // namespace quicsock
