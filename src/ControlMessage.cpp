// ControlMessage.cpp

#include "quicsock/ControlMessage.hpp"
#include "quicsock/Logger.hpp"
#include "quicsock/SocketArgumentException.hpp"

#include <algorithm>

namespace quicsock
{

namespace
{

// Aligned size of a control message header; bodies start this far from the header.
constexpr std::size_t HeaderLength = CMSG_LEN(0);

constexpr std::size_t IPv4PacketInfoLength = 12;
constexpr std::size_t IPv6PacketInfoLength = 20;
constexpr std::uint8_t EcnMask = 0x03;

std::uint32_t readUint32(const std::span<const std::byte> bytes, const ByteOrder order) noexcept
{
    std::uint32_t value = 0;
    if (order == ByteOrder::BigEndian)
    {
        for (std::size_t i = 0; i < 4; ++i)
            value = (value << 8) | std::to_integer<std::uint32_t>(bytes[i]);
    }
    else
    {
        for (std::size_t i = 4; i > 0; --i)
            value = (value << 8) | std::to_integer<std::uint32_t>(bytes[i - 1]);
    }
    return value;
}

void writeUint16(std::byte* out, const std::uint16_t value, const ByteOrder order) noexcept
{
    const auto hi = static_cast<std::byte>(value >> 8);
    const auto lo = static_cast<std::byte>(value & 0xff);
    out[0] = (order == ByteOrder::BigEndian) ? hi : lo;
    out[1] = (order == ByteOrder::BigEndian) ? lo : hi;
}

// Space a message with the given cmsg_len occupies, including trailing padding.
std::size_t paddedLength(const std::size_t cmsgLen) noexcept
{
    return CMSG_SPACE(cmsgLen - HeaderLength);
}

bool isPacketInfoV4(const int level, const int type) noexcept
{
#if defined(IP_PKTINFO)
    return level == IPPROTO_IP && type == IP_PKTINFO;
#else
    (void) level;
    (void) type;
    return false;
#endif
}

bool isTrafficClass(const int level, const int type) noexcept
{
    if (level == IPPROTO_IP)
    {
#if defined(IP_RECVTOS)
        if (type == IP_RECVTOS)
            return true;
#endif
        return type == IP_TOS;
    }
    return level == IPPROTO_IPV6 && type == IPV6_TCLASS;
}

bool isSegmentSize(const int level, const int type) noexcept
{
#if QUICSOCK_HAS_SEGMENTATION_OFFLOAD
    return level == SOL_UDP && type == UDP_GRO;
#else
    (void) level;
    (void) type;
    return false;
#endif
}

} // namespace

PacketInfo PacketInfo::v4(const std::uint32_t ifIndex, const std::array<std::uint8_t, 4>& ip) noexcept
{
    PacketInfo info;
    info.interfaceIndex = ifIndex;
    info.family = AF_INET;
    std::copy(ip.begin(), ip.end(), info.address.begin());
    return info;
}

std::string PacketInfo::addressString() const
{
    char text[INET6_ADDRSTRLEN] = {};
    if (family != AF_INET && family != AF_INET6)
        return {};
    if (::inet_ntop(family, address.data(), text, sizeof(text)) == nullptr)
        return {};
    return {text};
}

void appendControlMessage(std::vector<std::byte>& buffer, const int level, const int type,
                          const std::span<const std::byte> body)
{
    const std::size_t offset = buffer.size();
    buffer.resize(offset + CMSG_SPACE(body.size()), std::byte{0});

    cmsghdr header{};
    header.cmsg_len = CMSG_LEN(body.size());
    header.cmsg_level = level;
    header.cmsg_type = type;

    std::memcpy(buffer.data() + offset, &header, sizeof(header));
    if (!body.empty())
        std::memcpy(buffer.data() + offset + HeaderLength, body.data(), body.size());
}

void encodeSegmentationDirective(std::vector<std::byte>& buffer, const std::uint16_t segmentSize,
                                 const ByteOrder order)
{
    if (segmentSize == 0)
        throw SocketArgumentException("encodeSegmentationDirective(): segment size must be non-zero");

    std::array<std::byte, sizeof(std::uint16_t)> body{};
    writeUint16(body.data(), segmentSize, order);

    buffer.clear();
#if QUICSOCK_HAS_SEGMENTATION_OFFLOAD
    appendControlMessage(buffer, SOL_UDP, UDP_SEGMENT, body);
#else
    appendControlMessage(buffer, IPPROTO_UDP, 0, body);
#endif
}

std::vector<std::byte> encodeSegmentationDirective(const std::uint16_t segmentSize, const ByteOrder order)
{
    std::vector<std::byte> buffer;
    buffer.reserve(SegmentationDirectiveSize);
    encodeSegmentationDirective(buffer, segmentSize, order);
    return buffer;
}

std::optional<PacketInfo> parseIPv4PacketInfo(const std::span<const std::byte> body, const ByteOrder order) noexcept
{
    if (body.size() < IPv4PacketInfoLength)
        return std::nullopt;

    PacketInfo info;
    info.family = AF_INET;
    info.interfaceIndex = readUint32(body.first(4), order);
    // Bytes 4..8 hold the "specified destination", which routing does not need.
    std::memcpy(info.address.data(), body.data() + 8, 4);
    return info;
}

std::optional<PacketInfo> parseIPv6PacketInfo(const std::span<const std::byte> body, const ByteOrder order) noexcept
{
    if (body.size() < IPv6PacketInfoLength)
        return std::nullopt;

    PacketInfo info;
    info.family = AF_INET6;
    std::memcpy(info.address.data(), body.data(), 16);
    info.interfaceIndex = readUint32(body.subspan(16, 4), order);
    return info;
}

std::optional<EcnMarking> parseTrafficClass(const std::span<const std::byte> body, const ByteOrder order) noexcept
{
    if (body.empty())
        return std::nullopt;

    std::uint32_t tos = 0;
    if (body.size() >= sizeof(std::uint32_t))
        tos = readUint32(body.first(4), order);
    else
        tos = std::to_integer<std::uint32_t>(body[0]);

    return EcnMarking{static_cast<std::uint8_t>(tos & EcnMask)};
}

std::optional<SegmentSize> parseSegmentSize(const std::span<const std::byte> body, const ByteOrder order) noexcept
{
    if (body.size() < sizeof(std::uint32_t))
        return std::nullopt;

    const auto value = static_cast<std::int32_t>(readUint32(body.first(4), order));
    if (value <= 0 || value > 0xffff)
        return std::nullopt;

    return SegmentSize{static_cast<std::uint16_t>(value)};
}

std::vector<AncillaryRecord> decodeControlMessages(const std::span<const std::byte> buffer, const ByteOrder order)
{
    std::vector<AncillaryRecord> records;
    std::size_t cursor = 0;

    while (buffer.size() - cursor >= HeaderLength)
    {
        cmsghdr header{};
        std::memcpy(&header, buffer.data() + cursor, sizeof(header));

        const auto declared = static_cast<std::size_t>(header.cmsg_len);
        const std::size_t remaining = buffer.size() - cursor;
        if (declared < HeaderLength || declared > remaining)
        {
            QUICSOCK_LOG(debug, "control message at offset {} declares {} bytes, {} remain; ignoring the rest",
                         cursor, declared, remaining);
            break;
        }

        const auto body = buffer.subspan(cursor + HeaderLength, declared - HeaderLength);
        const int level = header.cmsg_level;
        const int type = header.cmsg_type;

        std::optional<AncillaryRecord> record;
        bool recognized = true;
        if (isPacketInfoV4(level, type))
        {
            if (auto info = parseIPv4PacketInfo(body, order))
                record = *info;
        }
        else if (level == IPPROTO_IPV6 && type == IPV6_PKTINFO)
        {
            if (auto info = parseIPv6PacketInfo(body, order))
                record = *info;
        }
        else if (isTrafficClass(level, type))
        {
            if (auto ecn = parseTrafficClass(body, order))
                record = *ecn;
        }
        else if (isSegmentSize(level, type))
        {
            if (auto size = parseSegmentSize(body, order))
                record = *size;
        }
        else
        {
            recognized = false;
        }

        if (record)
            records.push_back(*record);
        else if (recognized)
            QUICSOCK_LOG(debug, "skipping malformed control message (level {}, type {}, {} body bytes)", level, type,
                         body.size());

        const std::size_t advance = paddedLength(declared);
        if (advance >= remaining)
            break;
        cursor += advance;
    }

    return records;
}

} // namespace quicsock
