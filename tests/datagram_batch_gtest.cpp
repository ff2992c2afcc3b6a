// GoogleTest unit tests for batched send and receive
#include "mocks/MockSysCalls.hpp"
#include "quicsock/ControlMessage.hpp"
#include "quicsock/DatagramSocket.hpp"
#include "quicsock/ReceivedBatch.hpp"
#include "quicsock/SocketArgumentException.hpp"
#include "quicsock/SocketPermissionException.hpp"
#include "quicsock/SocketTimeoutException.hpp"

#include <gmock/gmock.h>
#include <gtest/gtest.h>

#include <cstring>
#include <filesystem>
#include <limits>
#include <optional>
#include <stdexcept>
#include <string>
#include <vector>

using namespace quicsock;
using quicsock::test::MockSysCalls;
using ::testing::_;
using ::testing::AnyNumber;
using ::testing::NiceMock;
using ::testing::Return;

namespace
{

using Payloads = std::vector<std::vector<std::byte>>;

// Each payload is filled with its own index so ordering mistakes are visible.
Payloads makePayloads(const std::vector<std::size_t>& sizes)
{
    Payloads out;
    for (std::size_t i = 0; i < sizes.size(); ++i)
        out.emplace_back(sizes[i], static_cast<std::byte>(i + 1));
    return out;
}

std::vector<std::span<const std::byte>> views(const Payloads& payloads)
{
    return std::vector<std::span<const std::byte>>(payloads.begin(), payloads.end());
}

std::vector<std::byte> concat(const Payloads& payloads)
{
    std::vector<std::byte> out;
    for (const auto& p : payloads)
        out.insert(out.end(), p.begin(), p.end());
    return out;
}

struct SentMessage
{
    std::vector<std::byte> data;
    std::optional<std::uint16_t> segmentSize;
    const void* control = nullptr;
};

SentMessage capture(const msghdr* msg)
{
    SentMessage out;
    out.control = msg->msg_control;
    for (std::size_t i = 0; i < msg->msg_iovlen; ++i)
    {
        const auto* base = static_cast<const std::byte*>(msg->msg_iov[i].iov_base);
        out.data.insert(out.data.end(), base, base + msg->msg_iov[i].iov_len);
    }

    if (msg->msg_controllen >= CMSG_LEN(sizeof(std::uint16_t)))
    {
        const auto* control = static_cast<const std::byte*>(msg->msg_control);
        cmsghdr header{};
        std::memcpy(&header, control, sizeof(header));
        if (header.cmsg_level == SOL_UDP && header.cmsg_type == UDP_SEGMENT)
        {
            std::uint16_t size = 0;
            std::memcpy(&size, control + CMSG_LEN(0), sizeof(size));
            out.segmentSize = size;
        }
    }
    return out;
}

std::size_t openDescriptorCount()
{
    std::size_t count = 0;
    for ([[maybe_unused]] const auto& entry : std::filesystem::directory_iterator("/proc/self/fd"))
        ++count;
    return count;
}

class DatagramBatchTest : public ::testing::Test
{
  protected:
    void SetUp() override
    {
        ON_CALL(sys, sendmsg(_, _, _))
            .WillByDefault(
                [this](SOCKET, const msghdr* msg, int)
                {
                    sent.push_back(capture(msg));
                    return SysCallSizeResult{static_cast<ssize_t>(sent.back().data.size()), 0};
                });
        EXPECT_CALL(sys, sendmsg(_, _, _)).Times(AnyNumber());
        config.localAddress = "127.0.0.1";
        peer = SocketAddress::resolve("127.0.0.1", 4433);
    }

    // Fail the next send with errorCode, recording what it carried.
    void failNextSendWith(const int errorCode)
    {
        EXPECT_CALL(sys, sendmsg(_, _, _))
            .WillOnce(
                [this, errorCode](SOCKET, const msghdr* msg, int)
                {
                    sent.push_back(capture(msg));
                    return SysCallSizeResult{-1, errorCode};
                })
            .RetiresOnSaturation();
    }

    NiceMock<MockSysCalls> sys;
    DatagramSocketOptions config;
    SocketAddress peer;
    std::vector<SentMessage> sent;
};

} // namespace

TEST_F(DatagramBatchTest, CoalescesEqualPayloadsIntoOneSend)
{
    DatagramSocket socket(config, sys);
    ASSERT_TRUE(socket.isOffloadEnabled());

    const auto payloads = makePayloads({1200, 1200, 1200, 1200});
    socket.sendBatch(peer, views(payloads));

    ASSERT_EQ(sent.size(), 1u);
    EXPECT_EQ(sent[0].data, concat(payloads));
    EXPECT_EQ(sent[0].segmentSize, std::optional<std::uint16_t>(1200));
}

TEST_F(DatagramBatchTest, ShorterFinalPayloadIsCoalesced)
{
    DatagramSocket socket(config, sys);

    const auto payloads = makePayloads({1200, 1200, 700});
    socket.sendBatch(peer, views(payloads));

    ASSERT_EQ(sent.size(), 1u);
    EXPECT_EQ(sent[0].data.size(), 3100u);
    EXPECT_EQ(sent[0].segmentSize, std::optional<std::uint16_t>(1200));
}

TEST_F(DatagramBatchTest, ConsecutiveBatchesCarryTheirOwnSegmentSize)
{
    DatagramSocket socket(config, sys);

    socket.sendBatch(peer, views(makePayloads({1200, 1200})));
    socket.sendBatch(peer, views(makePayloads({600, 600, 100})));

    ASSERT_EQ(sent.size(), 2u);
    EXPECT_EQ(sent[0].segmentSize, std::optional<std::uint16_t>(1200));
    EXPECT_EQ(sent[1].segmentSize, std::optional<std::uint16_t>(600));
    EXPECT_EQ(sent[0].control, sent[1].control);
}

TEST_F(DatagramBatchTest, SinglePayloadIsSentWithoutDirective)
{
    DatagramSocket socket(config, sys);

    const auto payloads = makePayloads({900});
    socket.sendBatch(peer, views(payloads));

    ASSERT_EQ(sent.size(), 1u);
    EXPECT_EQ(sent[0].data, payloads[0]);
    EXPECT_FALSE(sent[0].segmentSize.has_value());
}

TEST_F(DatagramBatchTest, DisabledOffloadSendsEachPayloadInOrder)
{
    config.segmentationOffload = false;
    DatagramSocket socket(config, sys);
    ASSERT_FALSE(socket.isOffloadEnabled());

    const auto payloads = makePayloads({500, 500, 500, 200});
    socket.sendBatch(peer, views(payloads));

    ASSERT_EQ(sent.size(), payloads.size());
    for (std::size_t i = 0; i < payloads.size(); ++i)
    {
        EXPECT_EQ(sent[i].data, payloads[i]) << "payload " << i;
        EXPECT_FALSE(sent[i].segmentSize.has_value());
    }
}

TEST_F(DatagramBatchTest, OffloadRejectionFallsBackToPerPacketSends)
{
    DatagramSocket socket(config, sys);
    failNextSendWith(EIO);

    const auto payloads = makePayloads({1000, 1000, 400});
    EXPECT_NO_THROW(socket.sendBatch(peer, views(payloads)));

    ASSERT_EQ(sent.size(), 1u + payloads.size());
    EXPECT_TRUE(sent[0].segmentSize.has_value());
    for (std::size_t i = 0; i < payloads.size(); ++i)
    {
        EXPECT_EQ(sent[i + 1].data, payloads[i]) << "payload " << i;
        EXPECT_FALSE(sent[i + 1].segmentSize.has_value());
    }
    EXPECT_FALSE(socket.isOffloadEnabled());
}

TEST_F(DatagramBatchTest, OffloadRejectionIsStickyForTheSocket)
{
    DatagramSocket socket(config, sys);
    failNextSendWith(EIO);

    const auto payloads = makePayloads({800, 800, 800});
    socket.sendBatch(peer, views(payloads));
    sent.clear();

    socket.sendBatch(peer, views(payloads));
    socket.sendBatch(peer, views(payloads));

    ASSERT_EQ(sent.size(), 2 * payloads.size());
    for (const auto& message : sent)
        EXPECT_FALSE(message.segmentSize.has_value());
    EXPECT_FALSE(socket.isOffloadEnabled());
}

TEST_F(DatagramBatchTest, OffloadStateIsPerSocket)
{
    DatagramSocket first(config, sys);
    DatagramSocket second(config, sys);
    failNextSendWith(EIO);

    const auto payloads = makePayloads({600, 600});
    first.sendBatch(peer, views(payloads));

    EXPECT_FALSE(first.isOffloadEnabled());
    EXPECT_TRUE(second.isOffloadEnabled());
}

TEST_F(DatagramBatchTest, PermissionErrorPropagatesWithoutFallback)
{
    DatagramSocket socket(config, sys);
    failNextSendWith(EPERM);

    const auto payloads = makePayloads({1200, 1200});
    EXPECT_THROW(socket.sendBatch(peer, views(payloads)), SocketPermissionException);

    EXPECT_EQ(sent.size(), 1u);
    EXPECT_TRUE(socket.isOffloadEnabled());
}

TEST_F(DatagramBatchTest, OrdinarySendErrorPropagatesUnchanged)
{
    DatagramSocket socket(config, sys);
    failNextSendWith(EMSGSIZE);

    const auto payloads = makePayloads({1200, 1200});
    try
    {
        socket.sendBatch(peer, views(payloads));
        FAIL() << "expected SocketException";
    }
    catch (const SocketException& e)
    {
        EXPECT_EQ(e.getErrorCode(), EMSGSIZE);
    }

    EXPECT_EQ(sent.size(), 1u);
    EXPECT_TRUE(socket.isOffloadEnabled());
}

TEST_F(DatagramBatchTest, WouldBlockIsReportedAsTimeout)
{
    DatagramSocket socket(config, sys);
    failNextSendWith(EAGAIN);

    const auto payloads = makePayloads({100, 100});
    EXPECT_THROW(socket.sendBatch(peer, views(payloads)), SocketTimeoutException);
}

TEST_F(DatagramBatchTest, InterruptedSendIsRetried)
{
    DatagramSocket socket(config, sys);
    failNextSendWith(EINTR);

    const auto payloads = makePayloads({100, 100});
    EXPECT_NO_THROW(socket.sendBatch(peer, views(payloads)));

    ASSERT_EQ(sent.size(), 2u);
    EXPECT_EQ(sent[1].data, concat(payloads));
    EXPECT_TRUE(socket.isOffloadEnabled());
}

TEST_F(DatagramBatchTest, FailedFallbackSendPropagates)
{
    DatagramSocket socket(config, sys);
    EXPECT_CALL(sys, sendmsg(_, _, _))
        .WillOnce(Return(SysCallSizeResult{-1, EIO}))
        .WillOnce(Return(SysCallSizeResult{100, 0}))
        .WillOnce(Return(SysCallSizeResult{-1, ENOBUFS}));

    const auto payloads = makePayloads({100, 100, 100});
    EXPECT_THROW(socket.sendBatch(peer, views(payloads)), SocketException);
    EXPECT_FALSE(socket.isOffloadEnabled());
}

TEST_F(DatagramBatchTest, InvalidBatchesAreRejectedBeforeSending)
{
    config.batchLimits.maxSegments = 4;
    config.batchLimits.maxBatchBytes = 4000;
    DatagramSocket socket(config, sys);
    EXPECT_CALL(sys, sendmsg(_, _, _)).Times(0);

    EXPECT_THROW(socket.sendBatch(peer, {}), SocketArgumentException);
    EXPECT_THROW(socket.sendBatch(peer, views(makePayloads({100, 0, 100}))), SocketArgumentException);
    EXPECT_THROW(socket.sendBatch(peer, views(makePayloads({100, 90, 100}))), SocketArgumentException);
    EXPECT_THROW(socket.sendBatch(peer, views(makePayloads({100, 100, 101}))), SocketArgumentException);
    EXPECT_THROW(socket.sendBatch(peer, views(makePayloads({10, 10, 10, 10, 10}))), SocketArgumentException);
    EXPECT_THROW(socket.sendBatch(peer, views(makePayloads({1500, 1500, 1500}))), SocketArgumentException);
    EXPECT_THROW(socket.sendBatch(SocketAddress{}, views(makePayloads({100}))), SocketArgumentException);
}

TEST_F(DatagramBatchTest, ProbeFailureStartsWithOffloadDisabled)
{
    ON_CALL(sys, getsockopt(_, SOL_UDP, UDP_SEGMENT, _, _)).WillByDefault(Return(SysCallIntResult{-1, ENOPROTOOPT}));
    DatagramSocket socket(config, sys);
    EXPECT_FALSE(socket.isOffloadEnabled());

    const auto payloads = makePayloads({300, 300});
    socket.sendBatch(peer, views(payloads));
    EXPECT_EQ(sent.size(), 2u);
}

TEST_F(DatagramBatchTest, ExplicitDisableIsPermanent)
{
    DatagramSocket socket(config, sys);
    socket.disableOffload();

    const auto payloads = makePayloads({300, 300, 300});
    socket.sendBatch(peer, views(payloads));

    EXPECT_EQ(sent.size(), 3u);
    EXPECT_FALSE(socket.isOffloadEnabled());
}

TEST_F(DatagramBatchTest, ClosedSocketRejectsIo)
{
    DatagramSocket socket(config, sys);
    socket.close();

    EXPECT_FALSE(socket.isOpen());
    EXPECT_THROW(socket.sendBatch(peer, views(makePayloads({10}))), SocketArgumentException);
    EXPECT_THROW(static_cast<void>(socket.receiveBatch(1)), SocketArgumentException);
}

TEST_F(DatagramBatchTest, GroFailureIsTolerated)
{
    ON_CALL(sys, setsockopt(_, SOL_UDP, UDP_GRO, _, _)).WillByDefault(Return(SysCallIntResult{-1, ENOPROTOOPT}));
    EXPECT_NO_THROW({ DatagramSocket socket(config, sys); });
}

TEST_F(DatagramBatchTest, PacketInfoFailurePropagates)
{
    ON_CALL(sys, setsockopt(_, IPPROTO_IP, IP_PKTINFO, _, _)).WillByDefault(Return(SysCallIntResult{-1, EINVAL}));

    try
    {
        DatagramSocket socket(config, sys);
        FAIL() << "expected SocketException";
    }
    catch (const SocketException& e)
    {
        const std::string message = e.what();
        EXPECT_EQ(e.getErrorCode(), EINVAL);
        EXPECT_NE(message.find("setsockopt(IP_PKTINFO)"), std::string::npos) << message;
        EXPECT_NE(message.find("on fd "), std::string::npos) << message;
    }
}

TEST_F(DatagramBatchTest, FailedConstructionLeavesNoDescriptorOpen)
{
    const auto before = openDescriptorCount();

    config.maxReceiveSlots = 1;
    config.receiveSlotSize = std::numeric_limits<std::size_t>::max();
    EXPECT_THROW({ DatagramSocket socket(config, sys); }, std::length_error);

    ON_CALL(sys, setsockopt(_, IPPROTO_IP, IP_PKTINFO, _, _)).WillByDefault(Return(SysCallIntResult{-1, EINVAL}));
    config.receiveSlotSize = 2048;
    EXPECT_THROW({ DatagramSocket socket(config, sys); }, SocketException);

    EXPECT_EQ(openDescriptorCount(), before);
}

TEST_F(DatagramBatchTest, InvalidOptionsAreRejected)
{
    config.receiveSlotSize = 0;
    EXPECT_THROW({ DatagramSocket socket(config, sys); }, SocketArgumentException);

    config.receiveSlotSize = 2048;
    config.batchLimits.maxSegments = 0;
    EXPECT_THROW({ DatagramSocket socket(config, sys); }, SocketArgumentException);
}

// --- Receive path -----------------------------------------------------------------------------

namespace
{

template <typename T> std::span<const std::byte> asBytes(const T& value)
{
    return std::as_bytes(std::span<const T, 1>(&value, 1));
}

sockaddr_in ipv4(const char* ip, const Port port)
{
    sockaddr_in addr{};
    addr.sin_family = AF_INET;
    addr.sin_port = htons(port);
    ::inet_pton(AF_INET, ip, &addr.sin_addr);
    return addr;
}

struct Metadata
{
    std::optional<int> ifIndex;
    const char* destination = "127.0.0.1";
    std::optional<std::uint8_t> tos;
    std::optional<int> groSize;
};

std::vector<std::byte> buildControl(const Metadata& meta)
{
    std::vector<std::byte> control;
    if (meta.ifIndex)
    {
        in_pktinfo info{};
        info.ipi_ifindex = *meta.ifIndex;
        ::inet_pton(AF_INET, meta.destination, &info.ipi_addr);
        appendControlMessage(control, IPPROTO_IP, IP_PKTINFO, asBytes(info));
    }
    if (meta.tos)
        appendControlMessage(control, IPPROTO_IP, IP_TOS, asBytes(*meta.tos));
    if (meta.groSize)
        appendControlMessage(control, SOL_UDP, UDP_GRO, asBytes(*meta.groSize));
    return control;
}

std::vector<std::byte> pattern(const std::size_t size)
{
    std::vector<std::byte> out(size);
    for (std::size_t i = 0; i < size; ++i)
        out[i] = static_cast<std::byte>(i % 251);
    return out;
}

} // namespace

TEST(ReceivedBatchTest, SplitsByGroSegmentSize)
{
    const auto payload = pattern(300);
    const auto control = buildControl({.ifIndex = 2, .tos = 0x01, .groSize = 100});
    const auto source = ipv4("192.0.2.9", 5000);

    ReceivedBatch batch({RawDatagram{payload, control,
                                     SocketAddress::fromNative(reinterpret_cast<const sockaddr*>(&source),
                                                               sizeof(source))}});

    std::vector<ReceivedDatagram> out;
    for (const auto& dgram : batch)
        out.push_back(dgram);

    ASSERT_EQ(out.size(), 3u);
    for (std::size_t i = 0; i < out.size(); ++i)
    {
        EXPECT_EQ(out[i].payload.size(), 100u);
        EXPECT_EQ(out[i].payload.data(), payload.data() + i * 100);
        EXPECT_EQ(out[i].source.toString(), "192.0.2.9:5000");
        ASSERT_TRUE(out[i].packetInfo.has_value());
        EXPECT_EQ(out[i].packetInfo->interfaceIndex, 2u);
        EXPECT_EQ(out[i].ecn, std::optional<std::uint8_t>(0x01));
    }
}

TEST(ReceivedBatchTest, FinalSegmentMayBeShorter)
{
    const auto payload = pattern(250);
    const auto control = buildControl({.groSize = 100});

    ReceivedBatch batch({RawDatagram{payload, control, {}}});

    std::vector<std::size_t> sizes;
    while (auto dgram = batch.next())
        sizes.push_back(dgram->payload.size());

    EXPECT_EQ(sizes, (std::vector<std::size_t>{100, 100, 50}));
}

TEST(ReceivedBatchTest, WithoutSegmentSizeWholePayloadIsOneDatagram)
{
    const auto payload = pattern(1400);
    const auto control = buildControl({.ifIndex = 1});

    ReceivedBatch batch({RawDatagram{payload, control, {}}});

    const auto first = batch.next();
    ASSERT_TRUE(first.has_value());
    EXPECT_EQ(first->payload.size(), 1400u);
    EXPECT_FALSE(first->ecn.has_value());
    EXPECT_FALSE(batch.next().has_value());
}

TEST(ReceivedBatchTest, SegmentSizeNotSmallerThanPayloadDoesNotSplit)
{
    const auto payload = pattern(100);
    const auto control = buildControl({.groSize = 100});

    ReceivedBatch batch({RawDatagram{payload, control, {}}});

    const auto first = batch.next();
    ASSERT_TRUE(first.has_value());
    EXPECT_EQ(first->payload.size(), 100u);
    EXPECT_FALSE(batch.next().has_value());
}

TEST(ReceivedBatchTest, EmptyDatagramIsDelivered)
{
    ReceivedBatch batch({RawDatagram{{}, {}, {}}});

    const auto first = batch.next();
    ASSERT_TRUE(first.has_value());
    EXPECT_TRUE(first->payload.empty());
    EXPECT_FALSE(batch.next().has_value());
}

TEST(ReceivedBatchTest, MetadataDoesNotLeakBetweenResults)
{
    const auto a = pattern(40);
    const auto b = pattern(60);
    const auto controlA = buildControl({.ifIndex = 3, .tos = 0x03});

    ReceivedBatch batch({RawDatagram{a, controlA, {}}, RawDatagram{b, {}, {}}});

    const auto first = batch.next();
    const auto second = batch.next();
    ASSERT_TRUE(first && second);
    EXPECT_TRUE(first->packetInfo.has_value());
    EXPECT_EQ(first->ecn, std::optional<std::uint8_t>(0x03));
    EXPECT_EQ(second->payload.size(), 60u);
    EXPECT_FALSE(second->packetInfo.has_value());
    EXPECT_FALSE(second->ecn.has_value());
}

TEST(ReceivedBatchTest, IsSinglePass)
{
    const auto payload = pattern(30);
    ReceivedBatch batch({RawDatagram{payload, {}, {}}, RawDatagram{payload, {}, {}}});

    std::size_t firstPass = 0;
    for ([[maybe_unused]] const auto& dgram : batch)
        ++firstPass;

    std::size_t secondPass = 0;
    for ([[maybe_unused]] const auto& dgram : batch)
        ++secondPass;

    EXPECT_EQ(firstPass, 2u);
    EXPECT_EQ(secondPass, 0u);
}

TEST(ReceivedBatchTest, MalformedControlDataStillYieldsPayload)
{
    const auto payload = pattern(80);
    auto control = buildControl({.ifIndex = 4});
    control.resize(control.size() - 8); // body cut short

    ReceivedBatch batch({RawDatagram{payload, control, {}}});

    const auto first = batch.next();
    ASSERT_TRUE(first.has_value());
    EXPECT_EQ(first->payload.size(), 80u);
    EXPECT_FALSE(first->packetInfo.has_value());
}

#if QUICSOCK_HAS_MMSG

namespace
{

struct KernelResult
{
    std::vector<std::byte> payload;
    std::vector<std::byte> control;
    sockaddr_in source{};
    int flags = 0;
};

// Copies fabricated results into the slots the socket handed to recvmmsg().
SysCallIntResult deliver(const std::vector<KernelResult>& results, mmsghdr* msgs, const unsigned int vlen)
{
    const auto count = std::min<std::size_t>(results.size(), vlen);
    for (std::size_t i = 0; i < count; ++i)
    {
        auto& hdr = msgs[i].msg_hdr;
        const auto& r = results[i];

        const auto bytes = std::min(r.payload.size(), hdr.msg_iov[0].iov_len);
        std::memcpy(hdr.msg_iov[0].iov_base, r.payload.data(), bytes);
        msgs[i].msg_len = static_cast<unsigned int>(r.payload.size());

        if (!r.control.empty())
            std::memcpy(hdr.msg_control, r.control.data(), r.control.size());
        hdr.msg_controllen = r.control.size();

        std::memcpy(hdr.msg_name, &r.source, sizeof(r.source));
        hdr.msg_namelen = sizeof(r.source);
        hdr.msg_flags = r.flags;
    }
    return {static_cast<int>(count), 0};
}

} // namespace

TEST_F(DatagramBatchTest, ReceiveSplitsCoalescedResultAndSharesMetadata)
{
    DatagramSocket socket(config, sys);

    const std::vector<KernelResult> results{
        {pattern(300), buildControl({.ifIndex = 7, .destination = "127.0.0.1", .tos = 0x02, .groSize = 100}),
         ipv4("127.0.0.2", 9000)}};
    EXPECT_CALL(sys, recvmmsg(socket.getSocketFd(), _, 8u, MSG_WAITFORONE, nullptr))
        .WillOnce([&](SOCKET, mmsghdr* msgs, unsigned int vlen, int, timespec*) { return deliver(results, msgs, vlen); });

    auto batch = socket.receiveBatch(8);

    std::vector<ReceivedDatagram> out;
    for (const auto& dgram : batch)
        out.push_back(dgram);

    ASSERT_EQ(out.size(), 3u);
    const auto expected = pattern(300);
    for (std::size_t i = 0; i < out.size(); ++i)
    {
        ASSERT_EQ(out[i].payload.size(), 100u);
        EXPECT_EQ(std::memcmp(out[i].payload.data(), expected.data() + i * 100, 100), 0);
        EXPECT_EQ(out[i].source.toString(), "127.0.0.2:9000");
        ASSERT_TRUE(out[i].packetInfo.has_value());
        EXPECT_EQ(out[i].packetInfo->interfaceIndex, 7u);
        EXPECT_EQ(out[i].packetInfo->addressString(), "127.0.0.1");
        EXPECT_EQ(out[i].ecn, std::optional<std::uint8_t>(0x02));
    }
}

TEST_F(DatagramBatchTest, ReceivePreservesKernelOrder)
{
    DatagramSocket socket(config, sys);

    const std::vector<KernelResult> results{
        {std::vector<std::byte>(10, std::byte{1}), {}, ipv4("10.0.0.1", 1)},
        {std::vector<std::byte>(20, std::byte{2}), {}, ipv4("10.0.0.2", 2)},
        {std::vector<std::byte>(30, std::byte{3}), {}, ipv4("10.0.0.3", 3)},
    };
    ON_CALL(sys, recvmmsg(_, _, _, _, _))
        .WillByDefault([&](SOCKET, mmsghdr* msgs, unsigned int vlen, int, timespec*)
                       { return deliver(results, msgs, vlen); });

    auto batch = socket.receiveBatch(16);
    EXPECT_EQ(batch.rawCount(), 3u);

    std::vector<std::size_t> sizes;
    while (auto dgram = batch.next())
    {
        sizes.push_back(dgram->payload.size());
        EXPECT_EQ(dgram->payload[0], static_cast<std::byte>(sizes.size()));
    }
    EXPECT_EQ(sizes, (std::vector<std::size_t>{10, 20, 30}));
}

TEST_F(DatagramBatchTest, ReceiveDropsTruncatedResults)
{
    DatagramSocket socket(config, sys);

    const std::vector<KernelResult> results{
        {pattern(64), {}, ipv4("10.0.0.1", 1), MSG_TRUNC},
        {pattern(32), {}, ipv4("10.0.0.2", 2)},
    };
    ON_CALL(sys, recvmmsg(_, _, _, _, _))
        .WillByDefault([&](SOCKET, mmsghdr* msgs, unsigned int vlen, int, timespec*)
                       { return deliver(results, msgs, vlen); });

    auto batch = socket.receiveBatch(4);

    const auto first = batch.next();
    ASSERT_TRUE(first.has_value());
    EXPECT_EQ(first->payload.size(), 32u);
    EXPECT_FALSE(batch.next().has_value());
}

TEST_F(DatagramBatchTest, ReceiveRequestIsClampedToSlotCount)
{
    config.maxReceiveSlots = 4;
    DatagramSocket socket(config, sys);

    EXPECT_CALL(sys, recvmmsg(_, _, 4u, _, _)).WillOnce(Return(SysCallIntResult{0, 0}));

    auto batch = socket.receiveBatch(100);
    EXPECT_FALSE(batch.next().has_value());
}

TEST_F(DatagramBatchTest, ReceiveRejectsZeroDatagrams)
{
    DatagramSocket socket(config, sys);
    EXPECT_CALL(sys, recvmmsg(_, _, _, _, _)).Times(0);

    EXPECT_THROW(static_cast<void>(socket.receiveBatch(0)), SocketArgumentException);
}

TEST_F(DatagramBatchTest, ReceiveTimeoutIsRetryableError)
{
    DatagramSocket socket(config, sys);
    EXPECT_CALL(sys, recvmmsg(_, _, _, _, _)).WillOnce(Return(SysCallIntResult{-1, EAGAIN}));

    EXPECT_THROW(static_cast<void>(socket.receiveBatch(4)), SocketTimeoutException);
}

TEST_F(DatagramBatchTest, ReceiveRetriesInterruptedCall)
{
    DatagramSocket socket(config, sys);
    const std::vector<KernelResult> results{{pattern(12), {}, ipv4("10.0.0.1", 1)}};

    EXPECT_CALL(sys, recvmmsg(_, _, _, _, _))
        .WillOnce(Return(SysCallIntResult{-1, EINTR}))
        .WillOnce([&](SOCKET, mmsghdr* msgs, unsigned int vlen, int, timespec*) { return deliver(results, msgs, vlen); });

    auto batch = socket.receiveBatch(4);
    const auto first = batch.next();
    ASSERT_TRUE(first.has_value());
    EXPECT_EQ(first->payload.size(), 12u);
}

TEST_F(DatagramBatchTest, ReceiveErrorPropagates)
{
    DatagramSocket socket(config, sys);
    EXPECT_CALL(sys, recvmmsg(_, _, _, _, _)).WillOnce(Return(SysCallIntResult{-1, ECONNREFUSED}));

    try
    {
        static_cast<void>(socket.receiveBatch(4));
        FAIL() << "expected SocketException";
    }
    catch (const SocketTimeoutException&)
    {
        FAIL() << "a refused connection is not a timeout";
    }
    catch (const SocketException& e)
    {
        EXPECT_EQ(e.getErrorCode(), ECONNREFUSED);
    }
}

#endif // QUICSOCK_HAS_MMSG

TEST_F(DatagramBatchTest, RecvFromReportsSegmentSizeAndMetadata)
{
    DatagramSocket socket(config, sys);
    const auto payload = pattern(200);
    const auto control = buildControl({.ifIndex = 5, .tos = 0x01, .groSize = 100});
    const auto source = ipv4("10.1.1.1", 7777);

    EXPECT_CALL(sys, recvmsg(_, _, _))
        .WillOnce(
            [&](SOCKET, msghdr* msg, int)
            {
                std::memcpy(msg->msg_iov[0].iov_base, payload.data(), payload.size());
                std::memcpy(msg->msg_control, control.data(), control.size());
                msg->msg_controllen = control.size();
                std::memcpy(msg->msg_name, &source, sizeof(source));
                msg->msg_namelen = sizeof(source);
                msg->msg_flags = 0;
                return SysCallSizeResult{static_cast<ssize_t>(payload.size()), 0};
            });

    const auto packet = socket.recvFrom();
    EXPECT_EQ(packet.buffer, payload);
    EXPECT_EQ(packet.source.toString(), "10.1.1.1:7777");
    EXPECT_EQ(packet.segmentSize, 100);
    ASSERT_TRUE(packet.packetInfo.has_value());
    EXPECT_EQ(packet.packetInfo->interfaceIndex, 5u);
    EXPECT_EQ(packet.ecn, std::optional<std::uint8_t>(0x01));
}
