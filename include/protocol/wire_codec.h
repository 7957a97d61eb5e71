#pragma once
#include "core/types.h"
#include "utils/endian.h"
#include <cstdint>
#include <cstring>
#include <functional>
#include <optional>
#include <span>
#include <string>
#include <string_view>
#include <vector>

namespace tap {
namespace protocol {

enum class RequestType : int16_t {
    Produce = 0, Fetch = 1, MultiFetch = 2, MultiProduce = 3, Offsets = 4,
};

class BinaryReader {
public:
    BinaryReader(const uint8_t* data, size_t length) : data_(data), length_(length), pos_(0) {}
    [[nodiscard]] bool has_remaining(size_t n) const { return pos_ + n <= length_; }
    [[nodiscard]] size_t remaining() const { return length_ - pos_; }
    [[nodiscard]] size_t position() const { return pos_; }

    int16_t read_int16() { int16_t v = static_cast<int16_t>(load_be16(data_ + pos_)); pos_ += 2; return v; }
    int32_t read_int32() { int32_t v = static_cast<int32_t>(load_be32(data_ + pos_)); pos_ += 4; return v; }
    uint32_t read_uint32() { uint32_t v = load_be32(data_ + pos_); pos_ += 4; return v; }
    uint64_t read_uint64() { uint64_t v = load_be64(data_ + pos_); pos_ += 8; return v; }

    std::string_view read_string() {
        int16_t len = read_int16();
        if (len < 0 || !has_remaining(static_cast<size_t>(len))) return {};
        std::string_view r(reinterpret_cast<const char*>(data_ + pos_), len);
        pos_ += len; return r;
    }

    const uint8_t* current() const { return data_ + pos_; }
private:
    const uint8_t* data_; size_t length_; size_t pos_;
};

class BinaryWriter {
public:
    /// Callers size `data` up front; see WireEncoder::request_size.
    explicit BinaryWriter(uint8_t* data) : data_(data), pos_(0) {}

    void write_int16(int16_t v) { store_be16(data_ + pos_, static_cast<uint16_t>(v)); pos_ += 2; }
    void write_int32(int32_t v) { store_be32(data_ + pos_, static_cast<uint32_t>(v)); pos_ += 4; }
    void write_int64(int64_t v) { store_be64(data_ + pos_, static_cast<uint64_t>(v)); pos_ += 8; }

    void write_string(std::string_view s) {
        write_int16(static_cast<int16_t>(s.size()));
        std::memcpy(data_ + pos_, s.data(), s.size()); pos_ += s.size();
    }

    size_t write_size_placeholder() { size_t p = pos_; pos_ += 4; return p; }
    void patch_size(size_t ph) {
        store_be32(data_ + ph, static_cast<uint32_t>(pos_ - ph - 4));
    }

    [[nodiscard]] size_t position() const { return pos_; }
private:
    uint8_t* data_; size_t pos_;
};

/// Result of walking a fetch response payload.
struct ScanResult {
    int64_t count = 0;      // messages the callback accepted
    uint64_t consumed = 0;  // bytes covered by those messages
    bool complete = true;   // false if a frame failed to decode
    bool stopped = false;   // callback declined a message; the walk ended there
};

class WireEncoder {
public:
    /// Bytes needed by a request for `topic`: size, type, topic, partition,
    /// and a 12-byte body (int64 + int32) shared by Fetch and Offsets.
    static size_t request_size(std::string_view topic) {
        return 4 + 2 + 2 + topic.size() + 4 + 8 + 4;
    }

    /// Both return the encoded length, or 0 if `cap` is too small.
    static size_t encode_fetch_request(uint8_t* buf, size_t cap, std::string_view topic,
        int32_t partition, uint64_t offset, uint32_t max_fetch_size);
    static size_t encode_offsets_request(uint8_t* buf, size_t cap, std::string_view topic,
        int32_t partition, int64_t time_marker, uint32_t max_num_offsets);

    static std::vector<uint8_t> fetch_request(std::string_view topic, int32_t partition,
        uint64_t offset, uint32_t max_fetch_size);
    static std::vector<uint8_t> offsets_request(std::string_view topic, int32_t partition,
        int64_t time_marker, uint32_t max_num_offsets);
};

class WireDecoder {
public:
    /// Returns false to decline the message and end the walk before it.
    using MessageCallback = std::function<bool(const Message&)>;

    /// Decode the message framed at the start of `data`. The result views
    /// `data`; nullopt if the frame is truncated or its length field is too
    /// small to hold the checksum.
    static std::optional<Message> decode_message(const uint8_t* data, size_t length);
    static std::optional<Message> decode_message(std::span<const uint8_t> bytes) {
        return decode_message(bytes.data(), bytes.size());
    }

    /// Walk consecutive message frames, stamping each with
    /// `base_offset + position` before invoking `on_message`. Stops at the
    /// first frame that fails to decode or that `on_message` declines; a
    /// declined message is neither counted nor consumed.
    static ScanResult scan_messages(const uint8_t* data, size_t length, uint64_t base_offset,
        const MessageCallback& on_message);

    /// Offsets response payload: [int32 count][count x int64 offset].
    static std::vector<uint64_t> decode_offsets(const uint8_t* data, size_t length,
        uint32_t max_num_offsets);
};

} // namespace protocol
} // namespace tap
