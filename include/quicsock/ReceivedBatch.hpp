/**
 * @file ReceivedBatch.hpp
 * @brief Lazy, single-pass sequence of datagrams from one batched receive.
 */

#pragma once

#include "ControlMessage.hpp"
#include "DatagramPacket.hpp"

#include <cstddef>
#include <iterator>
#include <optional>
#include <vector>

namespace quicsock
{

/**
 * @class ReceivedBatch
 * @ingroup udp
 * @brief The result of DatagramSocket::receiveBatch(): a finite, non-restartable sequence.
 *
 * Holds the raw kernel results of one receive call. Ancillary decoding and GRO splitting happen
 * on demand as the caller advances: each raw result is decoded once, and if it carries a GRO
 * segment size smaller than its payload, the payload is split into consecutive chunks of that
 * size (the last may be shorter). Without a segment size the whole payload, even an empty one,
 * is a single datagram.
 *
 * Consume it either with next():
 * @code
 * auto batch = socket.receiveBatch(32);
 * while (auto dgram = batch.next())
 *     handle(dgram->payload, dgram->source);
 * @endcode
 * or with a range-for, which drives next() underneath:
 * @code
 * for (const auto& dgram : socket.receiveBatch(32))
 *     handle(dgram.payload, dgram.source);
 * @endcode
 *
 * Once exhausted, the batch yields nothing further. Iterating it a second time does not restart.
 *
 * @warning The payload views reference the socket's receive slots and share their lifetime
 *          (see ReceivedDatagram).
 */
class ReceivedBatch
{
  public:
    /**
     * @brief Input iterator over the remaining datagrams. Compares equal to `std::default_sentinel`
     *        once the batch is exhausted.
     */
    class Iterator
    {
      public:
        using iterator_category = std::input_iterator_tag;
        using difference_type = std::ptrdiff_t;
        using value_type = ReceivedDatagram;
        using reference = const ReceivedDatagram&;
        using pointer = const ReceivedDatagram*;

        Iterator() = default;

        explicit Iterator(ReceivedBatch* batch) : _batch(batch) { advance(); }

        reference operator*() const { return *_current; }

        pointer operator->() const { return &*_current; }

        Iterator& operator++()
        {
            advance();
            return *this;
        }

        void operator++(int) { advance(); }

        friend bool operator==(const Iterator& it, std::default_sentinel_t) noexcept { return !it._current; }

      private:
        void advance() { _current = _batch ? _batch->next() : std::nullopt; }

        ReceivedBatch* _batch = nullptr;
        std::optional<ReceivedDatagram> _current;
    };

    ReceivedBatch() = default;

    /**
     * @brief Wrap raw kernel results.
     *
     * @param raw   Results in kernel order. The referenced bytes must outlive the batch.
     * @param order Byte order for decoding ancillary bodies.
     */
    explicit ReceivedBatch(std::vector<RawDatagram> raw, ByteOrder order = NativeByteOrder);

    /**
     * @brief Produce the next datagram, or `std::nullopt` when the batch is exhausted.
     */
    std::optional<ReceivedDatagram> next();

    Iterator begin() { return Iterator(this); }

    [[nodiscard]] std::default_sentinel_t end() const noexcept { return std::default_sentinel; }

    /// Number of kernel receive results in this batch (before GRO splitting).
    [[nodiscard]] std::size_t rawCount() const noexcept { return _raw.size(); }

  private:
    void load(const RawDatagram& raw);

    std::vector<RawDatagram> _raw;
    ByteOrder _order = NativeByteOrder;
    std::size_t _rawIndex = 0;

    // Split state of the raw result currently being consumed.
    std::span<const std::byte> _remaining;
    std::size_t _segment = 0;
    SocketAddress _source;
    std::optional<PacketInfo> _packetInfo;
    std::optional<std::uint8_t> _ecn;
};

} // namespace quicsock
