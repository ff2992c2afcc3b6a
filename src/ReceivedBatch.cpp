// ReceivedBatch.cpp

#include "quicsock/ReceivedBatch.hpp"

#include <algorithm>
#include <utility>

namespace quicsock
{

ReceivedBatch::ReceivedBatch(std::vector<RawDatagram> raw, const ByteOrder order) : _raw(std::move(raw)), _order(order)
{
}

void ReceivedBatch::load(const RawDatagram& raw)
{
    _source = raw.source;
    _packetInfo.reset();
    _ecn.reset();

    std::optional<std::uint16_t> segment;
    for (const auto& record : decodeControlMessages(raw.control, _order))
    {
        if (const auto* info = std::get_if<PacketInfo>(&record))
            _packetInfo = *info;
        else if (const auto* ecn = std::get_if<EcnMarking>(&record))
            _ecn = ecn->codepoint;
        else if (const auto* size = std::get_if<SegmentSize>(&record))
            segment = size->bytes;
    }

    _remaining = raw.payload;
    _segment = (segment && *segment < raw.payload.size()) ? *segment : raw.payload.size();
}

std::optional<ReceivedDatagram> ReceivedBatch::next()
{
    if (_remaining.empty())
    {
        if (_rawIndex >= _raw.size())
            return std::nullopt;
        load(_raw[_rawIndex++]);
    }

    const std::size_t take = std::min(_segment, _remaining.size());

    ReceivedDatagram out;
    out.payload = _remaining.first(take);
    out.source = _source;
    out.packetInfo = _packetInfo;
    out.ecn = _ecn;

    _remaining = _remaining.subspan(take);
    return out;
}

} // namespace quicsock
