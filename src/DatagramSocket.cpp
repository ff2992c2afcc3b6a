// DatagramSocket.cpp

#include "quicsock/DatagramSocket.hpp"
#include "quicsock/ControlMessage.hpp"
#include "quicsock/Logger.hpp"
#include "quicsock/OffloadError.hpp"
#include "quicsock/SocketArgumentException.hpp"
#include "quicsock/SocketException.hpp"
#include "quicsock/SocketPermissionException.hpp"
#include "quicsock/SocketTimeoutException.hpp"

#include <algorithm>
#include <utility>
#include <variant>

using namespace quicsock;

namespace
{

void validateOptions(const DatagramSocketOptions& options)
{
    if (options.receiveSlotSize == 0)
        throw SocketArgumentException("DatagramSocket: receiveSlotSize must be at least 1");
    if (options.maxReceiveSlots == 0)
        throw SocketArgumentException("DatagramSocket: maxReceiveSlots must be at least 1");
    if (options.batchLimits.maxSegments == 0)
        throw SocketArgumentException("DatagramSocket: batchLimits.maxSegments must be at least 1");
    if (options.batchLimits.maxBatchBytes == 0 || options.batchLimits.maxBatchBytes > MaxDatagramPayloadSafe)
        throw SocketArgumentException("DatagramSocket: batchLimits.maxBatchBytes must be in [1, " +
                                      std::to_string(MaxDatagramPayloadSafe) + "]");
}

std::string failurePrefix(const char* operation, const SOCKET fd)
{
    return std::string(operation) + " failed on fd " + std::to_string(fd) + ": ";
}

} // namespace

DatagramSocket::DatagramSocket(const DatagramSocketOptions& options, SysCalls& sysCalls)
    : SocketOptions(INVALID_SOCKET, sysCalls), _limits(options.batchLimits), _slotSize(options.receiveSlotSize),
      _maxSlots(options.maxReceiveSlots)
{
    validateOptions(options);

    // Allocated before the descriptor exists, so an allocation failure has nothing to close.
    _sendBuffer.reserve(_limits.maxBatchBytes);
    _sendControl.reserve(SegmentationDirectiveSize);
    allocateReceiveSlots();

    const auto localAddrInfoPtr = internal::resolveAddress(options.localAddress, options.localPort, AF_UNSPEC,
                                                           SOCK_DGRAM, IPPROTO_UDP, AI_PASSIVE | AI_NUMERICHOST);

    // Dual-stack prefers an IPv6 socket; otherwise IPv4 wins so a wildcard bind can reach IPv4 peers.
    const int preferred = options.dualStack ? AF_INET6 : AF_INET;
    std::vector<addrinfo*> sorted;
    for (addrinfo* p = localAddrInfoPtr.get(); p; p = p->ai_next)
        if (p->ai_family == preferred)
            sorted.push_back(p);
    for (addrinfo* p = localAddrInfoPtr.get(); p; p = p->ai_next)
        if (p->ai_family != preferred)
            sorted.push_back(p);

    const addrinfo* chosen = nullptr;
    for (const auto* p : sorted)
    {
        setSocketFd(::socket(p->ai_family, p->ai_socktype, p->ai_protocol));
        if (getSocketFd() != INVALID_SOCKET)
        {
            chosen = p;
            break;
        }
    }

    if (chosen == nullptr)
        cleanupAndThrow(GetSocketError());

    try
    {
        if (chosen->ai_family == AF_INET6)
            setIPv6Only(!options.dualStack);

        setReuseAddress(options.reuseAddress);

        if (options.receiveBufferSize)
            setReceiveBufferSize(*options.receiveBufferSize);
        if (options.sendBufferSize)
            setSendBufferSize(*options.sendBufferSize);

        if (options.soRecvTimeoutMillis >= 0)
            setSoRecvTimeout(options.soRecvTimeoutMillis);
        if (options.soSendTimeoutMillis >= 0)
            setSoSendTimeout(options.soSendTimeoutMillis);
        if (options.nonBlocking)
            setNonBlocking(true);

        if (::bind(getSocketFd(), chosen->ai_addr, static_cast<socklen_t>(chosen->ai_addrlen)) == SOCKET_ERROR)
            internal::throwLastSockError("DatagramSocket: bind() failed: ");

        if (options.packetInfo)
            setPacketInfo(true);
        if (options.ecn)
            setEcnReporting(true);
    }
    catch (const SocketException&)
    {
        cleanupAndRethrow();
    }

    if (options.receiveOffload)
    {
        try
        {
            setReceiveOffload(true);
        }
        catch (const SocketException& e)
        {
            QUICSOCK_LOG(debug, "fd {}: receive offload unavailable: {}", getSocketFd(), e.what());
        }
    }

    _offloadEnabled = options.segmentationOffload && probeSegmentationOffload();
    QUICSOCK_LOG(debug, "fd {}: segmentation offload {}", getSocketFd(), _offloadEnabled ? "enabled" : "disabled");

}

DatagramSocket::~DatagramSocket() noexcept
{
    try
    {
        close();
    }
    catch (const SocketException& e)
    {
        QUICSOCK_LOG(err, "DatagramSocket destructor: {}", e.what());
    }
}

DatagramSocket::DatagramSocket(DatagramSocket&& rhs) noexcept
    : SocketOptions(rhs.getSocketFd(), rhs.sysCalls()), _limits(rhs._limits), _slotSize(rhs._slotSize),
      _maxSlots(rhs._maxSlots), _offloadEnabled(rhs._offloadEnabled), _sendBuffer(std::move(rhs._sendBuffer)),
      _sendControl(std::move(rhs._sendControl)), _recvData(std::move(rhs._recvData)),
      _recvControl(std::move(rhs._recvControl)), _recvNames(std::move(rhs._recvNames)),
      _recvIov(std::move(rhs._recvIov))
#if QUICSOCK_HAS_MMSG
      ,
      _recvHeaders(std::move(rhs._recvHeaders))
#endif
{
    rhs.setSocketFd(INVALID_SOCKET);
}

DatagramSocket& DatagramSocket::operator=(DatagramSocket&& rhs) noexcept
{
    if (this != &rhs)
    {
        if (!internal::tryCloseNoexcept(getSocketFd()))
            QUICSOCK_LOG(err, "DatagramSocket move assignment: closing fd {} failed: {}", getSocketFd(),
                         SocketErrorMessage(GetSocketError()));

        SocketOptions::operator=(rhs);
        _limits = rhs._limits;
        _slotSize = rhs._slotSize;
        _maxSlots = rhs._maxSlots;
        _offloadEnabled = rhs._offloadEnabled;
        _sendBuffer = std::move(rhs._sendBuffer);
        _sendControl = std::move(rhs._sendControl);
        _recvData = std::move(rhs._recvData);
        _recvControl = std::move(rhs._recvControl);
        _recvNames = std::move(rhs._recvNames);
        _recvIov = std::move(rhs._recvIov);
#if QUICSOCK_HAS_MMSG
        _recvHeaders = std::move(rhs._recvHeaders);
#endif
        rhs.setSocketFd(INVALID_SOCKET);
    }
    return *this;
}

void DatagramSocket::cleanup() noexcept
{
    internal::tryCloseNoexcept(getSocketFd());
    setSocketFd(INVALID_SOCKET);
}

void DatagramSocket::cleanupAndThrow(const int errorCode)
{
    cleanup();
    throw SocketException(errorCode, SocketErrorMessage(errorCode));
}

void DatagramSocket::cleanupAndRethrow()
{
    cleanup();
    throw;
}

void DatagramSocket::close()
{
    internal::closeOrThrow(getSocketFd());
    setSocketFd(INVALID_SOCKET);
}

SocketAddress DatagramSocket::getLocalSocketAddress() const
{
    requireOpen("DatagramSocket::getLocalSocketAddress()");

    sockaddr_storage addr{};
    socklen_t len = sizeof(addr);
    if (::getsockname(getSocketFd(), reinterpret_cast<sockaddr*>(&addr), &len) == SOCKET_ERROR)
        internal::throwLastSockError(failurePrefix("DatagramSocket::getLocalSocketAddress()", getSocketFd()));

    return SocketAddress::fromNative(reinterpret_cast<const sockaddr*>(&addr), len);
}

void DatagramSocket::requireOpen(const char* operation) const
{
    if (!isOpen())
        throw SocketArgumentException(std::string(operation) + " failed: socket is not open");
}

void DatagramSocket::allocateReceiveSlots()
{
    _recvData.assign(_maxSlots * _slotSize, std::byte{0});
    _recvControl.assign(_maxSlots * ReceiveControlBufferSize, std::byte{0});
    _recvNames.assign(_maxSlots, sockaddr_storage{});
    _recvIov.assign(_maxSlots, iovec{});
#if QUICSOCK_HAS_MMSG
    _recvHeaders.assign(_maxSlots, mmsghdr{});
#endif
}

msghdr DatagramSocket::prepareSlot(const std::size_t index)
{
    _recvIov[index].iov_base = _recvData.data() + index * _slotSize;
    _recvIov[index].iov_len = _slotSize;
    _recvNames[index] = sockaddr_storage{};

    msghdr msg{};
    msg.msg_name = &_recvNames[index];
    msg.msg_namelen = sizeof(sockaddr_storage);
    msg.msg_iov = &_recvIov[index];
    msg.msg_iovlen = 1;
    msg.msg_control = _recvControl.data() + index * ReceiveControlBufferSize;
    msg.msg_controllen = ReceiveControlBufferSize;
    return msg;
}

SysCallSizeResult DatagramSocket::sendMessage(const msghdr& message)
{
    for (;;)
    {
        const auto result = sysCalls().sendmsg(getSocketFd(), &message, 0);
        if (result.rc >= 0 || result.errnum != EINTR)
            return result;
    }
}

void DatagramSocket::throwSendError(const int errorCode, const char* operation) const
{
    const std::string prefix = failurePrefix(operation, getSocketFd());
    if (errorCode == EPERM || errorCode == EACCES)
        throw SocketPermissionException(errorCode, prefix + SocketErrorMessage(errorCode));
    // NOLINTNEXTLINE
    if (errorCode == EAGAIN || errorCode == EWOULDBLOCK)
        throw SocketTimeoutException(errorCode, prefix + SocketErrorMessage(errorCode));
    internal::throwSockError(errorCode, prefix);
}

void DatagramSocket::throwReceiveError(const int errorCode, const char* operation) const
{
    const std::string prefix = failurePrefix(operation, getSocketFd());
    // NOLINTNEXTLINE
    if (errorCode == EAGAIN || errorCode == EWOULDBLOCK)
        throw SocketTimeoutException(errorCode, prefix + SocketErrorMessage(errorCode));
    internal::throwSockError(errorCode, prefix);
}

void DatagramSocket::sendTo(const SocketAddress& destination, const std::span<const std::byte> payload)
{
    requireOpen("DatagramSocket::sendTo()");
    if (destination.empty())
        throw SocketArgumentException("DatagramSocket::sendTo() failed: empty destination address");

    iovec iov{};
    iov.iov_base = const_cast<std::byte*>(payload.data());
    iov.iov_len = payload.size();

    msghdr msg{};
    msg.msg_name = const_cast<sockaddr*>(destination.data());
    msg.msg_namelen = destination.length;
    msg.msg_iov = &iov;
    msg.msg_iovlen = 1;

    if (const auto result = sendMessage(msg); result.rc < 0)
        throwSendError(result.errnum, "DatagramSocket::sendTo()");
}

void DatagramSocket::validateBatch(const std::span<const std::span<const std::byte>> payloads) const
{
    if (payloads.empty())
        throw SocketArgumentException("DatagramSocket::sendBatch() failed: empty batch");

    if (payloads.size() > _limits.maxSegments)
        throw SocketArgumentException("DatagramSocket::sendBatch() failed: " + std::to_string(payloads.size()) +
                                      " payloads exceed the limit of " + std::to_string(_limits.maxSegments));

    const std::size_t segment = payloads.front().size();
    std::size_t total = 0;
    for (std::size_t i = 0; i < payloads.size(); ++i)
    {
        const std::size_t len = payloads[i].size();
        if (len == 0)
            throw SocketArgumentException("DatagramSocket::sendBatch() failed: payload " + std::to_string(i) +
                                          " is empty");

        const bool last = (i + 1 == payloads.size());
        if ((!last && len != segment) || (last && len > segment))
            throw SocketArgumentException("DatagramSocket::sendBatch() failed: payload " + std::to_string(i) +
                                          " has length " + std::to_string(len) + ", segment size is " +
                                          std::to_string(segment));
        total += len;
    }

    if (total > _limits.maxBatchBytes)
        throw SocketArgumentException("DatagramSocket::sendBatch() failed: " + std::to_string(total) +
                                      " bytes exceed the limit of " + std::to_string(_limits.maxBatchBytes));
}

void DatagramSocket::sendBatch(const SocketAddress& destination,
                               const std::span<const std::span<const std::byte>> payloads)
{
    requireOpen("DatagramSocket::sendBatch()");
    if (destination.empty())
        throw SocketArgumentException("DatagramSocket::sendBatch() failed: empty destination address");
    validateBatch(payloads);

    if (_offloadEnabled && payloads.size() > 1)
    {
        sendCoalesced(destination, payloads);
        return;
    }

    for (const auto& payload : payloads)
        sendTo(destination, payload);
}

void DatagramSocket::sendCoalesced(const SocketAddress& destination,
                                   const std::span<const std::span<const std::byte>> payloads)
{
    _sendBuffer.clear();
    for (const auto& payload : payloads)
        _sendBuffer.insert(_sendBuffer.end(), payload.begin(), payload.end());

    encodeSegmentationDirective(_sendControl, static_cast<std::uint16_t>(payloads.front().size()));

    iovec iov{};
    iov.iov_base = _sendBuffer.data();
    iov.iov_len = _sendBuffer.size();

    msghdr msg{};
    msg.msg_name = const_cast<sockaddr*>(destination.data());
    msg.msg_namelen = destination.length;
    msg.msg_iov = &iov;
    msg.msg_iovlen = 1;
    msg.msg_control = _sendControl.data();
    msg.msg_controllen = _sendControl.size();

    const auto result = sendMessage(msg);
    if (result.rc >= 0)
        return;

    if (!isOffloadUnsupported(result.errnum))
        throwSendError(result.errnum, "DatagramSocket::sendBatch()");

    QUICSOCK_LOG(warn, "fd {}: segmentation offload rejected ({}), disabling it and sending {} datagrams individually",
                 getSocketFd(), SocketErrorMessage(result.errnum), payloads.size());
    _offloadEnabled = false;

    for (const auto& payload : payloads)
        sendTo(destination, payload);
}

ReceivedBatch DatagramSocket::receiveBatch(const std::size_t maxDatagrams)
{
    requireOpen("DatagramSocket::receiveBatch()");
    if (maxDatagrams == 0)
        throw SocketArgumentException("DatagramSocket::receiveBatch() failed: maxDatagrams must be at least 1");

    const std::size_t count = std::min(maxDatagrams, _maxSlots);
    std::vector<RawDatagram> raw;
    raw.reserve(count);

    const auto collect = [&](const std::size_t index, const msghdr& msg, const std::size_t bytes)
    {
        if (msg.msg_flags & MSG_TRUNC)
        {
            QUICSOCK_LOG(warn, "fd {}: dropping datagram truncated to {} bytes (slot size {})", getSocketFd(), bytes,
                         _slotSize);
            return;
        }
        if (msg.msg_flags & MSG_CTRUNC)
            QUICSOCK_LOG(debug, "fd {}: ancillary data truncated; decoding the records that fit", getSocketFd());

        RawDatagram out;
        out.payload = std::span<const std::byte>(_recvData.data() + index * _slotSize, std::min(bytes, _slotSize));
        out.control = std::span<const std::byte>(_recvControl.data() + index * ReceiveControlBufferSize,
                                                 std::min<std::size_t>(msg.msg_controllen, ReceiveControlBufferSize));
        if (msg.msg_namelen > 0)
            out.source = SocketAddress::fromNative(reinterpret_cast<const sockaddr*>(&_recvNames[index]),
                                                   msg.msg_namelen);
        raw.push_back(out);
    };

#if QUICSOCK_HAS_MMSG
    for (std::size_t i = 0; i < count; ++i)
        _recvHeaders[i].msg_hdr = prepareSlot(i);

    SysCallIntResult result{};
    do
    {
        result = sysCalls().recvmmsg(getSocketFd(), _recvHeaders.data(), static_cast<unsigned int>(count),
                                     MSG_WAITFORONE, nullptr);
    } while (result.rc < 0 && result.errnum == EINTR);

    if (result.rc < 0)
        throwReceiveError(result.errnum, "DatagramSocket::receiveBatch()");

    const auto filled = std::min(static_cast<std::size_t>(result.rc), count);
    for (std::size_t i = 0; i < filled; ++i)
        collect(i, _recvHeaders[i].msg_hdr, _recvHeaders[i].msg_len);
#else
    msghdr msg = prepareSlot(0);
    SysCallSizeResult result{};
    do
    {
        result = sysCalls().recvmsg(getSocketFd(), &msg, 0);
    } while (result.rc < 0 && result.errnum == EINTR);

    if (result.rc < 0)
        throwReceiveError(result.errnum, "DatagramSocket::receiveBatch()");

    collect(0, msg, static_cast<std::size_t>(result.rc));
#endif

    return ReceivedBatch(std::move(raw));
}

DatagramPacket DatagramSocket::recvFrom()
{
    requireOpen("DatagramSocket::recvFrom()");

    msghdr msg = prepareSlot(0);
    SysCallSizeResult result{};
    do
    {
        result = sysCalls().recvmsg(getSocketFd(), &msg, 0);
    } while (result.rc < 0 && result.errnum == EINTR);

    if (result.rc < 0)
        throwReceiveError(result.errnum, "DatagramSocket::recvFrom()");

    if (msg.msg_flags & MSG_TRUNC)
        QUICSOCK_LOG(warn, "fd {}: datagram truncated to {} bytes", getSocketFd(), result.rc);

    const auto bytes = std::min(static_cast<std::size_t>(result.rc), _slotSize);

    DatagramPacket packet;
    packet.buffer.assign(_recvData.begin(), _recvData.begin() + static_cast<std::ptrdiff_t>(bytes));
    if (msg.msg_namelen > 0)
        packet.source = SocketAddress::fromNative(reinterpret_cast<const sockaddr*>(&_recvNames[0]), msg.msg_namelen);

    const std::span<const std::byte> control(_recvControl.data(),
                                             std::min<std::size_t>(msg.msg_controllen, ReceiveControlBufferSize));
    for (const auto& record : decodeControlMessages(control))
    {
        if (const auto* info = std::get_if<PacketInfo>(&record))
            packet.packetInfo = *info;
        else if (const auto* ecn = std::get_if<EcnMarking>(&record))
            packet.ecn = ecn->codepoint;
        else if (const auto* size = std::get_if<SegmentSize>(&record))
            packet.segmentSize = size->bytes;
    }
    return packet;
}
