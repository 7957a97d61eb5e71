#include "protocol/wire_codec.h"
#include <algorithm>

namespace tap { namespace protocol {

// ─── Requests ───

static size_t encode_request(uint8_t* buf, size_t cap, RequestType type, std::string_view topic,
    int32_t partition, int64_t position, uint32_t limit) {
    if (cap < WireEncoder::request_size(topic)) return 0;
    BinaryWriter w(buf);
    size_t sp = w.write_size_placeholder();
    w.write_int16(static_cast<int16_t>(type));
    w.write_string(topic);
    w.write_int32(partition);
    w.write_int64(position);
    w.write_int32(static_cast<int32_t>(limit));
    w.patch_size(sp);
    return w.position();
}

size_t WireEncoder::encode_fetch_request(uint8_t* buf, size_t cap, std::string_view topic,
    int32_t partition, uint64_t offset, uint32_t max_fetch_size) {
    return encode_request(buf, cap, RequestType::Fetch, topic, partition,
                          static_cast<int64_t>(offset), max_fetch_size);
}

size_t WireEncoder::encode_offsets_request(uint8_t* buf, size_t cap, std::string_view topic,
    int32_t partition, int64_t time_marker, uint32_t max_num_offsets) {
    return encode_request(buf, cap, RequestType::Offsets, topic, partition,
                          time_marker, max_num_offsets);
}

std::vector<uint8_t> WireEncoder::fetch_request(std::string_view topic, int32_t partition,
    uint64_t offset, uint32_t max_fetch_size) {
    std::vector<uint8_t> out(request_size(topic));
    out.resize(encode_fetch_request(out.data(), out.size(), topic, partition, offset, max_fetch_size));
    return out;
}

std::vector<uint8_t> WireEncoder::offsets_request(std::string_view topic, int32_t partition,
    int64_t time_marker, uint32_t max_num_offsets) {
    std::vector<uint8_t> out(request_size(topic));
    out.resize(encode_offsets_request(out.data(), out.size(), topic, partition, time_marker, max_num_offsets));
    return out;
}

// ─── Responses ───

std::optional<Message> WireDecoder::decode_message(const uint8_t* data, size_t length) {
    BinaryReader r(data, length);
    if (!r.has_remaining(kLengthFieldSize)) return std::nullopt;
    uint32_t stored = r.read_uint32();
    if (stored < kChecksumSize || !r.has_remaining(stored)) return std::nullopt;
    uint32_t checksum = r.read_uint32();
    return Message(checksum, r.current(), stored);
}

ScanResult WireDecoder::scan_messages(const uint8_t* data, size_t length, uint64_t base_offset,
    const MessageCallback& on_message) {
    ScanResult res;
    uint64_t pos = 0;
    // A frame needs at least its length field; fewer trailing bytes are ignored.
    while (pos + kLengthFieldSize <= length) {
        auto msg = decode_message(data + pos, length - pos);
        if (!msg) {
            res.complete = false;
            break;
        }
        Message placed = msg->at_offset(base_offset + pos);
        if (!on_message(placed)) {
            res.stopped = true;
            break;
        }
        pos += placed.frame_size();
        ++res.count;
    }
    res.consumed = pos;
    return res;
}

std::vector<uint64_t> WireDecoder::decode_offsets(const uint8_t* data, size_t length,
    uint32_t max_num_offsets) {
    std::vector<uint64_t> offsets;
    BinaryReader r(data, length);
    if (!r.has_remaining(4)) return offsets;
    uint32_t count = r.read_uint32();
    uint32_t wanted = std::min(count, max_num_offsets);
    offsets.reserve(std::min<size_t>(wanted, r.remaining() / kOffsetEntrySize));
    while (offsets.size() < wanted && r.has_remaining(kOffsetEntrySize)) {
        offsets.push_back(r.read_uint64());
    }
    return offsets;
}

} } // namespace tap::protocol
