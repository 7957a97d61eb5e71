#pragma once
#include "core/types.h"
#include <cstdint>
#include <memory>
#include <span>
#include <string>
#include <vector>
#include <sys/types.h>

namespace tap {
namespace network {

bool set_nodelay(int fd);

/// Split "host[:port]" into its parts. Returns false on an empty host or a
/// port outside 1..65535.
bool parse_host_port(const std::string& hostname, std::string& host, uint16_t& port);

struct IoStatus {
    ConsumeError error = ConsumeError::None;
    std::string detail;

    [[nodiscard]] bool ok() const noexcept { return error == ConsumeError::None; }
    static IoStatus fail(ConsumeError e, std::string d) { return {e, std::move(d)}; }
};

/// One response frame: [int32 length][int16 error code][payload].
/// `payload` views the connection's read buffer until the next read.
struct ResponseFrame {
    uint32_t length = 0;
    int16_t error_code = 0;
    std::span<const uint8_t> payload;
};

/// Exclusive owner of one TCP connection to a broker partition.
class BrokerConnection {
public:
    BrokerConnection();
    /// Adopt an already connected socket (e.g. one end of a socketpair).
    BrokerConnection(int fd, TopicPartition tp);
    ~BrokerConnection();

    BrokerConnection(const BrokerConnection&) = delete;
    BrokerConnection& operator=(const BrokerConnection&) = delete;
    BrokerConnection(BrokerConnection&& o) noexcept;
    BrokerConnection& operator=(BrokerConnection&& o) noexcept;

    IoStatus connect(const std::string& hostname, TopicPartition tp);

    IoStatus write_all(const uint8_t* data, size_t len);
    IoStatus write_all(const std::vector<uint8_t>& bytes) { return write_all(bytes.data(), bytes.size()); }

    /// Read one complete response frame into the reusable buffer.
    IoStatus read_response(ResponseFrame& out);

    /// Unblock any thread waiting in read/write; the socket stays owned.
    void shutdown();
    void close();

    [[nodiscard]] bool is_open() const noexcept { return fd_ >= 0; }
    [[nodiscard]] int fd() const noexcept { return fd_; }
    [[nodiscard]] const TopicPartition& topic_partition() const noexcept { return tp_; }

    static constexpr uint32_t kMaxFrameSize = 104857600; // 100MB
    static constexpr uint16_t kDefaultPort = 9092;

private:
    IoStatus read_exact(uint8_t* dst, size_t len, bool frame_start);
    ssize_t send_some(const uint8_t* data, size_t len);
    ssize_t recv_some(uint8_t* dst, size_t len);
    bool init_io();

    int fd_ = -1;
    TopicPartition tp_;
    std::vector<uint8_t> read_buf_;

#ifdef TAP_IO_URING
    // struct io_uring lives in the .cpp to keep liburing out of this header
    struct UringState;
    std::unique_ptr<UringState> uring_;
#endif
};

} // namespace network
} // namespace tap
