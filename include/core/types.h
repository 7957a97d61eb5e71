#pragma once
#include <chrono>
#include <cstdint>
#include <cstring>
#include <span>
#include <string>
#include <string_view>
#include <vector>

namespace tap {

struct TopicPartition {
    std::string topic;
    int32_t partition = 0;
    bool operator==(const TopicPartition& o) const {
        return partition == o.partition && topic == o.topic;
    }
};

/// Offset query sentinels accepted in place of a millisecond timestamp.
inline constexpr int64_t kLatestTime = -1;
inline constexpr int64_t kEarliestTime = -2;

/// Wire sizes of the fixed fields inside a fetch response payload.
inline constexpr uint32_t kLengthFieldSize = 4;
inline constexpr uint32_t kChecksumSize = 4;
inline constexpr uint32_t kOffsetEntrySize = 8;

struct OwnedMessage;
namespace protocol { class WireDecoder; }

/// One decoded message. The payload is a view into the connection's
/// response buffer and is only valid until the handler returns. Only the
/// decoder builds one, after checking `total_length >= kChecksumSize`.
class Message {
public:
    [[nodiscard]] uint64_t offset() const noexcept { return offset_; }
    [[nodiscard]] uint32_t checksum() const noexcept { return checksum_; }
    /// Stored length field: checksum plus payload, excluding the length field itself.
    [[nodiscard]] uint32_t total_length() const noexcept { return total_length_; }
    /// Bytes this message occupies on the wire, length field included.
    [[nodiscard]] uint32_t frame_size() const noexcept { return kLengthFieldSize + total_length_; }
    [[nodiscard]] uint32_t payload_size() const noexcept { return total_length_ - kChecksumSize; }

    [[nodiscard]] std::span<const uint8_t> payload() const noexcept {
        return {payload_, payload_size()};
    }
    [[nodiscard]] std::string_view payload_view() const noexcept {
        return {reinterpret_cast<const char*>(payload_), payload_size()};
    }

    /// Copy of this message placed at an absolute log offset.
    [[nodiscard]] Message at_offset(uint64_t offset) const noexcept {
        Message m = *this;
        m.offset_ = offset;
        return m;
    }

    [[nodiscard]] OwnedMessage to_owned() const;

private:
    friend class protocol::WireDecoder;
    Message(uint32_t checksum, const uint8_t* payload, uint32_t total_length)
        : checksum_(checksum), payload_(payload), total_length_(total_length) {}

    uint64_t offset_ = 0;
    uint32_t checksum_;
    const uint8_t* payload_;
    uint32_t total_length_;
};

/// A message detached from the response buffer, safe to queue or retain.
struct OwnedMessage {
    uint64_t offset = 0;
    uint32_t checksum = 0;
    uint32_t total_length = 0;
    std::vector<uint8_t> payload;

    [[nodiscard]] std::string_view payload_view() const noexcept {
        return {reinterpret_cast<const char*>(payload.data()), payload.size()};
    }
};

inline OwnedMessage Message::to_owned() const {
    OwnedMessage m;
    m.offset = offset_;
    m.checksum = checksum_;
    m.total_length = total_length_;
    m.payload.assign(payload_, payload_ + payload_size());
    return m;
}

enum class ConsumeError : uint8_t {
    None = 0,
    Connection,   // resolve or connect failed
    Io,           // socket read/write failed, or frame exceeds the size limit
    EndOfStream,  // peer closed while a response was expected
    Broker,       // non-zero error code in the response header
    Decode,       // truncated or malformed message frame
};

inline const char* error_name(ConsumeError e) {
    switch (e) {
        case ConsumeError::None: return "None";
        case ConsumeError::Connection: return "Connection";
        case ConsumeError::Io: return "Io";
        case ConsumeError::EndOfStream: return "EndOfStream";
        case ConsumeError::Broker: return "Broker";
        case ConsumeError::Decode: return "Decode";
    }
    return "?";
}

struct ConsumeResult {
    int64_t count = 0;
    ConsumeError error = ConsumeError::None;
    std::string detail;

    [[nodiscard]] bool ok() const noexcept { return error == ConsumeError::None; }
};

struct PollStats {
    int64_t message_count = 0;
    int64_t failed_polls = 0;
    ConsumeError last_error = ConsumeError::None;
    std::string last_detail;
};

struct OffsetsResult {
    std::vector<uint64_t> offsets;
    ConsumeError error = ConsumeError::None;
    std::string detail;

    [[nodiscard]] bool ok() const noexcept { return error == ConsumeError::None; }
};

struct ConsumerConfig {
    std::string host = "127.0.0.1:9092";
    std::string topic;
    int32_t partition = 0;
    uint64_t start_offset = 0;
    uint32_t max_fetch_size = 1048576;
    std::chrono::milliseconds poll_interval{1000};
    int64_t offsets_time = kLatestTime;
    uint32_t max_num_offsets = 10;
};

/// Cross-platform high-resolution timestamp
#if defined(__x86_64__) || defined(_M_X64)
inline uint64_t rdtsc() noexcept {
    uint32_t lo, hi;
    __asm__ __volatile__("rdtsc" : "=a"(lo), "=d"(hi));
    return (static_cast<uint64_t>(hi) << 32) | lo;
}
#elif defined(__aarch64__) || defined(_M_ARM64)
inline uint64_t rdtsc() noexcept {
    uint64_t val;
    __asm__ __volatile__("mrs %0, cntvct_el0" : "=r"(val));
    return val;
}
#else
#error "Unsupported architecture"
#endif

} // namespace tap
