#include "core/types.h"
#include "client/broker_consumer.h"
#include "utils/timing.h"
#include <charconv>
#include <csignal>
#include <iostream>
#include <optional>
#include <stdexcept>
#include <pthread.h>
#include <string>
#include <string_view>
#include <thread>

namespace {

enum class Mode { Once, Follow, Channel, Offsets };

void usage(const char* prog) {
    std::cerr << "Usage: " << prog << " --topic=T [options]\n"
              << "  --host=H[:P]          broker address (default 127.0.0.1:9092)\n"
              << "  --partition=N         partition (default 0)\n"
              << "  --offset=N            start offset (default 0)\n"
              << "  --max-size=N          max fetch size in bytes (default 1048576)\n"
              << "  --poll-ms=N           delay between polls (default 1000)\n"
              << "  --mode=M              once | follow | channel | offsets (default once)\n"
              << "  --time=T              offsets mode: ms timestamp, latest or earliest\n"
              << "  --max-offsets=N       offsets mode: max offsets returned (default 10)\n";
}

template <typename T>
bool parse_number(std::string_view s, T& out) {
    if (s.empty()) return false;
    auto [ptr, ec] = std::from_chars(s.data(), s.data() + s.size(), out);
    return ec == std::errc() && ptr == s.data() + s.size();
}

bool parse_args(int argc, char* argv[], tap::ConsumerConfig& config, Mode& mode) {
    for (int i = 1; i < argc; ++i) {
        std::string_view arg(argv[i]);
        if (arg.substr(0, 2) != "--") {
            std::cerr << "Unexpected argument: " << arg << "\n";
            return false;
        }
        auto eq = arg.find('=');
        if (eq == std::string_view::npos) {
            std::cerr << "Expected --key=value, got: " << arg << "\n";
            return false;
        }
        std::string_view key = arg.substr(2, eq - 2);
        std::string_view val = arg.substr(eq + 1);
        bool ok = true;
        if (key == "host") {
            config.host = std::string(val);
        } else if (key == "topic") {
            config.topic = std::string(val);
        } else if (key == "partition") {
            ok = parse_number(val, config.partition);
        } else if (key == "offset") {
            ok = parse_number(val, config.start_offset);
        } else if (key == "max-size") {
            ok = parse_number(val, config.max_fetch_size);
        } else if (key == "poll-ms") {
            int64_t ms = 0;
            ok = parse_number(val, ms) && ms >= 0;
            config.poll_interval = std::chrono::milliseconds(ms);
        } else if (key == "max-offsets") {
            ok = parse_number(val, config.max_num_offsets);
        } else if (key == "time") {
            if (val == "latest") config.offsets_time = tap::kLatestTime;
            else if (val == "earliest") config.offsets_time = tap::kEarliestTime;
            else ok = parse_number(val, config.offsets_time);
        } else if (key == "mode") {
            if (val == "once") mode = Mode::Once;
            else if (val == "follow") mode = Mode::Follow;
            else if (val == "channel") mode = Mode::Channel;
            else if (val == "offsets") mode = Mode::Offsets;
            else ok = false;
        } else {
            std::cerr << "Unknown option: --" << key << "\n";
            return false;
        }
        if (!ok) {
            std::cerr << "Invalid value for --" << key << ": " << val << "\n";
            return false;
        }
    }
    if (config.topic.empty()) {
        std::cerr << "--topic is required\n";
        return false;
    }
    return true;
}

void print_message(const tap::Message& msg) {
    std::cout << msg.offset() << "\t" << msg.payload_size() << "\t" << msg.payload_view() << "\n";
}

// Blocks SIGINT/SIGTERM in every thread and trips `quit` from a dedicated
// sigwait thread, so no work happens inside an async signal handler.
std::thread start_signal_watcher(tap::QuitSignal& quit) {
    sigset_t set;
    sigemptyset(&set);
    sigaddset(&set, SIGINT);
    sigaddset(&set, SIGTERM);
    pthread_sigmask(SIG_BLOCK, &set, nullptr);
    return std::thread([set, &quit] {
        int sig = 0;
        if (sigwait(&set, &sig) == 0) {
            std::cout << "\n  [CONSUMER] Caught signal " << sig << ", stopping...\n" << std::flush;
        }
        quit.request();
    });
}

} // namespace

int main(int argc, char* argv[]) {
    tap::ConsumerConfig config;
    Mode mode = Mode::Once;
    if (!parse_args(argc, argv, config, mode)) {
        usage(argv[0]);
        return 1;
    }

    std::optional<tap::client::BrokerConsumer> maybe_consumer;
    try {
        maybe_consumer.emplace(config);
    } catch (const std::invalid_argument& e) {
        std::cerr << e.what() << "\n";
        return 1;
    }
    auto& consumer = *maybe_consumer;

    switch (mode) {
    case Mode::Once: {
        tap::Timing timing("consume " + config.topic);
        auto res = consumer.consume(print_message);
        timing.print(std::cerr);
        if (!res.ok() && res.error != tap::ConsumeError::EndOfStream) return 1;
        std::cerr << res.count << " messages, next offset " << consumer.offset() << "\n";
        return 0;
    }
    case Mode::Follow: {
        tap::QuitSignal quit;
        std::thread sig_thread = start_signal_watcher(quit);
        auto stats = consumer.consume_until_quit(config.poll_interval, quit, print_message);
        // Connection failure returns before any signal arrives.
        if (stats.message_count < 0) {
            sig_thread.detach();
            return 1;
        }
        sig_thread.join();
        std::cerr << stats.message_count << " messages, " << stats.failed_polls
                  << " failed polls, next offset " << consumer.offset() << "\n";
        return 0;
    }
    case Mode::Channel: {
        tap::QuitSignal quit;
        tap::client::MessageChannel channel;
        std::thread sig_thread = start_signal_watcher(quit);
        std::thread printer([&channel] {
            while (auto msg = channel.pop()) {
                std::cout << msg->offset << "\t" << msg->payload.size() << "\t"
                          << msg->payload_view() << "\n";
            }
        });
        auto res = consumer.consume_on_channel(channel, config.poll_interval, quit);
        printer.join();
        if (res.count < 0) {
            sig_thread.detach();
            return 1;
        }
        sig_thread.join();
        std::cerr << res.count << " messages, next offset " << consumer.offset() << "\n";
        return res.ok() ? 0 : 1;
    }
    case Mode::Offsets: {
        auto res = consumer.get_offsets(config.offsets_time, config.max_num_offsets);
        if (!res.ok()) {
            std::cerr << "Offset query failed: " << tap::error_name(res.error) << ": " << res.detail << "\n";
            return 1;
        }
        for (uint64_t off : res.offsets) std::cout << off << "\n";
        return 0;
    }
    }
    return 0;
}
