#pragma once
#include "core/types.h"
#include "network/broker_connection.h"
#include "utils/channel.h"
#include "utils/quit_signal.h"
#include <chrono>
#include <cstdint>
#include <functional>
#include <string>

namespace tap {
namespace client {

using MessageChannel = UnboundedChannel<OwnedMessage>;

/// Consumes one topic partition from one broker, tracking the next offset
/// to fetch. Not thread-safe: run one consume call at a time.
class BrokerConsumer {
public:
    /// Invoked synchronously, once per message, in offset order. The
    /// message payload must not be retained after the call returns, and the
    /// handler must not throw.
    using MessageHandler = std::function<void(const Message&)>;

    /// `max_fetch_size` must be at least the size of the largest message in
    /// the log, otherwise the consumer never gets past it.
    BrokerConsumer(std::string hostname, std::string topic, int32_t partition,
                   uint64_t offset, uint32_t max_fetch_size);
    /// Offset 0 and no fetch budget; for consumers used only to query offsets.
    BrokerConsumer(std::string hostname, std::string topic, int32_t partition);
    explicit BrokerConsumer(const ConsumerConfig& config);

    /// One fetch on a fresh connection, closed before returning.
    ConsumeResult consume(const MessageHandler& handler);

    /// Polls on one connection every `poll_interval` until `quit` is tripped.
    /// Poll errors other than end-of-stream are logged and polling goes on.
    PollStats consume_until_quit(std::chrono::milliseconds poll_interval, QuitSignal& quit,
                                 const MessageHandler& handler);

    /// Polls like consume_until_quit, but copies each message onto `channel`
    /// and stops polling at the first error other than end-of-stream. Blocks
    /// until `quit` is tripped; `channel` is closed on return.
    ConsumeResult consume_on_channel(MessageChannel& channel, std::chrono::milliseconds poll_interval,
                                     QuitSignal& quit);

    /// One fetch request/response exchange on `conn`. The cursor moves only
    /// if every message in the response decoded.
    ConsumeResult consume_once(network::BrokerConnection& conn, const MessageHandler& handler);

    /// Up to `max_num_offsets` valid offsets before `time_marker` (ms since
    /// epoch, or kLatestTime / kEarliestTime), in the broker's descending order.
    OffsetsResult get_offsets(int64_t time_marker, uint32_t max_num_offsets);

    [[nodiscard]] uint64_t offset() const noexcept { return offset_; }
    [[nodiscard]] uint32_t max_fetch_size() const noexcept { return max_fetch_size_; }
    [[nodiscard]] const TopicPartition& topic_partition() const noexcept { return tp_; }
    [[nodiscard]] const std::string& hostname() const noexcept { return hostname_; }

    /// Explicit cursor reset; the only way the offset moves backwards.
    void set_offset(uint64_t offset) noexcept { offset_ = offset; }
    void set_max_fetch_size(uint32_t size) noexcept { max_fetch_size_ = size; }

private:
    /// Returns false to decline a message; the pass ends before it.
    using MessageSink = std::function<bool(const Message&)>;

    network::IoStatus open(network::BrokerConnection& conn) const;
    /// consume_once with a sink that may decline. The cursor ends after the
    /// last accepted message.
    ConsumeResult fetch_pass(network::BrokerConnection& conn, const MessageSink& sink);

    std::string hostname_;
    TopicPartition tp_;
    uint64_t offset_;
    uint32_t max_fetch_size_;
};

} // namespace client
} // namespace tap
