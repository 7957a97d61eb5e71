#include "client/broker_consumer.h"
#include "protocol/wire_codec.h"
#include <atomic>
#include <condition_variable>
#include <future>
#include <iostream>
#include <mutex>
#include <stdexcept>
#include <thread>

namespace tap {
namespace client {

using network::BrokerConnection;
using network::IoStatus;
using network::ResponseFrame;
using protocol::WireDecoder;
using protocol::WireEncoder;

BrokerConsumer::BrokerConsumer(std::string hostname, std::string topic, int32_t partition,
                               uint64_t offset, uint32_t max_fetch_size)
    : hostname_(std::move(hostname)), tp_{std::move(topic), partition},
      offset_(offset), max_fetch_size_(max_fetch_size) {
    if (hostname_.empty()) throw std::invalid_argument("BrokerConsumer: empty broker hostname");
    if (tp_.topic.empty()) throw std::invalid_argument("BrokerConsumer: empty topic");
    if (tp_.topic.size() > 32767) throw std::invalid_argument("BrokerConsumer: topic name too long");
}

BrokerConsumer::BrokerConsumer(std::string hostname, std::string topic, int32_t partition)
    : BrokerConsumer(std::move(hostname), std::move(topic), partition, 0, 0) {}

BrokerConsumer::BrokerConsumer(const ConsumerConfig& config)
    : BrokerConsumer(config.host, config.topic, config.partition,
                     config.start_offset, config.max_fetch_size) {}

IoStatus BrokerConsumer::open(BrokerConnection& conn) const {
    return conn.connect(hostname_, tp_);
}

// ─── Single exchange ───

ConsumeResult BrokerConsumer::consume_once(BrokerConnection& conn, const MessageHandler& handler) {
    return fetch_pass(conn, [&handler](const Message& msg) {
        handler(msg);
        return true;
    });
}

ConsumeResult BrokerConsumer::fetch_pass(BrokerConnection& conn, const MessageSink& sink) {
    const TopicPartition& tp = conn.topic_partition();
    IoStatus st = conn.write_all(WireEncoder::fetch_request(tp.topic, tp.partition, offset_, max_fetch_size_));
    if (!st.ok()) return {-1, st.error, std::move(st.detail)};

    ResponseFrame frame;
    st = conn.read_response(frame);
    if (!st.ok()) return {-1, st.error, std::move(st.detail)};

    ConsumeResult res;
    // Error code only (or less): nothing new at this offset.
    if (frame.length <= 2) return res;

    auto scan = WireDecoder::scan_messages(frame.payload.data(), frame.payload.size(), offset_, sink);
    res.count = scan.count;
    if (!scan.complete) {
        res.error = ConsumeError::Decode;
        res.detail = "error decoding message at offset " + std::to_string(offset_ + scan.consumed);
        return res;
    }
    // On a declined message this stops short of the end of the payload.
    offset_ += scan.consumed;
    return res;
}

// ─── Driving modes ───

ConsumeResult BrokerConsumer::consume(const MessageHandler& handler) {
    BrokerConnection conn;
    IoStatus st = open(conn);
    if (!st.ok()) {
        std::cerr << "  [CONSUMER] Fatal error: " << error_name(st.error) << ": " << st.detail << "\n";
        return {-1, st.error, std::move(st.detail)};
    }

    ConsumeResult res = consume_once(conn, handler);
    if (!res.ok() && res.error != ConsumeError::EndOfStream) {
        std::cerr << "  [CONSUMER] Fatal error: [" << tp_.topic << "] "
                  << error_name(res.error) << ": " << res.detail << "\n";
    }
    return res;
}

PollStats BrokerConsumer::consume_until_quit(std::chrono::milliseconds poll_interval, QuitSignal& quit,
                                             const MessageHandler& handler) {
    PollStats stats;
    BrokerConnection conn;
    IoStatus st = open(conn);
    if (!st.ok()) {
        std::cerr << "  [CONSUMER] Fatal error: " << error_name(st.error) << ": " << st.detail << "\n";
        stats.message_count = -1;
        stats.last_error = st.error;
        stats.last_detail = std::move(st.detail);
        return stats;
    }

    std::cout << "  [CONSUMER] Polling " << tp_.topic << "-" << tp_.partition
              << " from offset " << offset_ << " every " << poll_interval.count() << "ms\n" << std::flush;

    std::atomic<bool> quit_received{false};
    std::mutex wake_mu;
    std::condition_variable wake_cv;
    std::promise<void> done;
    std::future<void> finished = done.get_future();

    std::thread watcher([&] {
        quit.wait();
        {
            std::lock_guard<std::mutex> lock(wake_mu);
            quit_received.store(true, std::memory_order_release);
        }
        wake_cv.notify_all();
    });

    std::thread poller([&] {
        while (!quit_received.load(std::memory_order_acquire)) {
            ConsumeResult res = consume_once(conn, handler);
            if (res.count > 0) stats.message_count += res.count;
            if (!res.ok() && res.error != ConsumeError::EndOfStream) {
                ++stats.failed_polls;
                stats.last_error = res.error;
                stats.last_detail = res.detail;
                std::cerr << "  [CONSUMER] ERROR: [" << tp_.topic << "] "
                          << error_name(res.error) << ": " << res.detail << "\n";
            }
            std::unique_lock<std::mutex> lock(wake_mu);
            wake_cv.wait_for(lock, poll_interval,
                             [&] { return quit_received.load(std::memory_order_relaxed); });
        }
        done.set_value();
    });

    finished.wait(); // the last iteration has finished before we return
    poller.join();
    watcher.join();

    std::cout << "  [CONSUMER] Stopped " << tp_.topic << "-" << tp_.partition
              << " at offset " << offset_ << " (" << stats.message_count << " messages)\n" << std::flush;
    return stats;
}

ConsumeResult BrokerConsumer::consume_on_channel(MessageChannel& channel,
                                                 std::chrono::milliseconds poll_interval,
                                                 QuitSignal& quit) {
    BrokerConnection conn;
    IoStatus st = open(conn);
    if (!st.ok()) {
        std::cerr << "  [CONSUMER] Fatal error: " << error_name(st.error) << ": " << st.detail << "\n";
        channel.close();
        return {-1, st.error, std::move(st.detail)};
    }

    ConsumeResult total;
    std::atomic<bool> stopping{false};
    std::mutex wake_mu;
    std::condition_variable wake_cv;
    std::promise<void> done;
    std::future<void> finished = done.get_future();

    std::thread poller([&] {
        // A closed channel declines the message, so the cursor stays on it.
        auto deliver = [&channel](const Message& msg) { return channel.push(msg.to_owned()); };
        while (!stopping.load(std::memory_order_acquire)) {
            ConsumeResult res = fetch_pass(conn, deliver);
            if (res.count > 0) total.count += res.count;
            // A failure caused by our own shutdown is not reported.
            if (stopping.load(std::memory_order_acquire)) break;
            if (!res.ok() && res.error != ConsumeError::EndOfStream) {
                std::cerr << "  [CONSUMER] Fatal error: [" << tp_.topic << "] "
                          << error_name(res.error) << ": " << res.detail << "\n";
                total.error = res.error;
                total.detail = std::move(res.detail);
                break;
            }
            std::unique_lock<std::mutex> lock(wake_mu);
            wake_cv.wait_for(lock, poll_interval,
                             [&] { return stopping.load(std::memory_order_relaxed); });
        }
        done.set_value();
    });

    // Wait to be told to stop, then tear down under the poller.
    quit.wait();
    {
        std::lock_guard<std::mutex> lock(wake_mu);
        stopping.store(true, std::memory_order_release);
    }
    wake_cv.notify_all();
    conn.shutdown();
    channel.close();
    finished.wait();
    poller.join();
    return total;
}

// ─── Offset query ───

OffsetsResult BrokerConsumer::get_offsets(int64_t time_marker, uint32_t max_num_offsets) {
    OffsetsResult res;
    BrokerConnection conn;
    IoStatus st = open(conn);
    if (st.ok()) st = conn.write_all(WireEncoder::offsets_request(tp_.topic, tp_.partition,
                                                                   time_marker, max_num_offsets));
    ResponseFrame frame;
    if (st.ok()) st = conn.read_response(frame);
    if (!st.ok()) {
        res.error = st.error;
        res.detail = std::move(st.detail);
        return res;
    }

    // Needs more than the error code to carry an offset count.
    if (frame.length > 4) {
        res.offsets = WireDecoder::decode_offsets(frame.payload.data(), frame.payload.size(),
                                                  max_num_offsets);
    }
    return res;
}

} // namespace client
} // namespace tap
