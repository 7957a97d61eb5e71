#include "network/broker_connection.h"
#include "utils/endian.h"
#include <cerrno>
#include <cstring>
#include <iostream>
#include <netdb.h>
#include <netinet/in.h>
#include <netinet/tcp.h>
#include <sys/socket.h>
#include <unistd.h>

#ifdef TAP_IO_URING
#include <liburing.h>
#endif

namespace tap {
namespace network {

// ─── Free functions ───

bool set_nodelay(int fd) {
    int yes = 1;
    return ::setsockopt(fd, IPPROTO_TCP, TCP_NODELAY, &yes, sizeof(yes)) == 0;
}

bool parse_host_port(const std::string& hostname, std::string& host, uint16_t& port) {
    port = BrokerConnection::kDefaultPort;
    auto colon = hostname.rfind(':');
    if (colon == std::string::npos) {
        host = hostname;
        return !host.empty();
    }
    host = hostname.substr(0, colon);
    std::string port_str = hostname.substr(colon + 1);
    if (host.empty() || port_str.empty() || port_str.size() > 5) return false;
    unsigned long p = 0;
    for (char c : port_str) {
        if (c < '0' || c > '9') return false;
        p = p * 10 + static_cast<unsigned long>(c - '0');
    }
    if (p == 0 || p > 65535) return false;
    port = static_cast<uint16_t>(p);
    return true;
}

// ─── io_uring state (Linux only) ───

#ifdef TAP_IO_URING
struct BrokerConnection::UringState {
    // One request in flight at a time; user_data is a sequence number so a
    // stray completion is never taken for the current one.
    struct io_uring ring;
    uint64_t seq = 0;
    bool ready = false;

    ~UringState() {
        if (ready) io_uring_queue_exit(&ring);
    }

    // Tag `sqe`, submit it and block for its completion. Returns the CQE
    // result (bytes or -errno).
    int run(struct io_uring_sqe* sqe) {
        uint64_t tag = ++seq;
        io_uring_sqe_set_data64(sqe, tag);
        int ret = io_uring_submit_and_wait(&ring, 1);
        if (ret < 0) return ret;
        struct io_uring_cqe* cqe = nullptr;
        ret = io_uring_wait_cqe(&ring, &cqe);
        if (ret < 0) return ret;
        uint64_t got = io_uring_cqe_get_data64(cqe);
        int res = cqe->res;
        io_uring_cqe_seen(&ring, cqe);
        return got == tag ? res : -EIO;
    }
};
#endif

// ─── BrokerConnection ───

BrokerConnection::BrokerConnection() = default;

BrokerConnection::BrokerConnection(int fd, TopicPartition tp)
    : fd_(fd), tp_(std::move(tp)) {
    if (fd_ >= 0 && !init_io()) close();
}

BrokerConnection::~BrokerConnection() {
    close();
}

BrokerConnection::BrokerConnection(BrokerConnection&& o) noexcept
    : fd_(o.fd_), tp_(std::move(o.tp_)), read_buf_(std::move(o.read_buf_))
#ifdef TAP_IO_URING
    , uring_(std::move(o.uring_))
#endif
{
    o.fd_ = -1;
}

BrokerConnection& BrokerConnection::operator=(BrokerConnection&& o) noexcept {
    if (this != &o) {
        close();
        fd_ = o.fd_;
        tp_ = std::move(o.tp_);
        read_buf_ = std::move(o.read_buf_);
#ifdef TAP_IO_URING
        uring_ = std::move(o.uring_);
#endif
        o.fd_ = -1;
    }
    return *this;
}

bool BrokerConnection::init_io() {
#ifdef TAP_IO_URING
    uring_ = std::make_unique<UringState>();
    int ret = io_uring_queue_init(8, &uring_->ring, 0);
    if (ret < 0) {
        std::cerr << "  [CONN] io_uring_queue_init failed: " << std::strerror(-ret) << "\n";
        uring_.reset();
        return false;
    }
    uring_->ready = true;
#endif
    return true;
}

IoStatus BrokerConnection::connect(const std::string& hostname, TopicPartition tp) {
    close();
    tp_ = std::move(tp);

    std::string host;
    uint16_t port = 0;
    if (!parse_host_port(hostname, host, port)) {
        return IoStatus::fail(ConsumeError::Connection, "invalid broker address: " + hostname);
    }

    struct addrinfo hints{};
    hints.ai_family = AF_UNSPEC;
    hints.ai_socktype = SOCK_STREAM;
    struct addrinfo* res = nullptr;
    std::string port_str = std::to_string(port);
    int rc = ::getaddrinfo(host.c_str(), port_str.c_str(), &hints, &res);
    if (rc != 0) {
        return IoStatus::fail(ConsumeError::Connection,
                              "resolve " + host + ": " + ::gai_strerror(rc));
    }

    std::string last_error = "no addresses";
    for (auto* ai = res; ai; ai = ai->ai_next) {
        int fd = ::socket(ai->ai_family, ai->ai_socktype, ai->ai_protocol);
        if (fd < 0) {
            last_error = std::string("socket() failed: ") + std::strerror(errno);
            continue;
        }
        if (::connect(fd, ai->ai_addr, ai->ai_addrlen) < 0) {
            last_error = std::string("connect() failed: ") + std::strerror(errno);
            ::close(fd);
            continue;
        }
        set_nodelay(fd);
        fd_ = fd;
        break;
    }
    ::freeaddrinfo(res);

    if (fd_ < 0) {
        return IoStatus::fail(ConsumeError::Connection, hostname + ": " + last_error);
    }
    if (!init_io()) {
        close();
        return IoStatus::fail(ConsumeError::Connection, "io setup failed for " + hostname);
    }
    return {};
}

ssize_t BrokerConnection::send_some(const uint8_t* data, size_t len) {
#ifdef TAP_IO_URING
    struct io_uring_sqe* sqe = io_uring_get_sqe(&uring_->ring);
    if (!sqe) { errno = EBUSY; return -1; }
    io_uring_prep_send(sqe, fd_, data, len, MSG_NOSIGNAL);
    int res = uring_->run(sqe);
    if (res < 0) { errno = -res; return -1; }
    return res;
#else
    return ::send(fd_, data, len, MSG_NOSIGNAL);
#endif
}

ssize_t BrokerConnection::recv_some(uint8_t* dst, size_t len) {
#ifdef TAP_IO_URING
    struct io_uring_sqe* sqe = io_uring_get_sqe(&uring_->ring);
    if (!sqe) { errno = EBUSY; return -1; }
    io_uring_prep_recv(sqe, fd_, dst, len, 0);
    int res = uring_->run(sqe);
    if (res < 0) { errno = -res; return -1; }
    return res;
#else
    return ::recv(fd_, dst, len, 0);
#endif
}

IoStatus BrokerConnection::write_all(const uint8_t* data, size_t len) {
    if (fd_ < 0) return IoStatus::fail(ConsumeError::Io, "write on closed connection");
    size_t sent = 0;
    while (sent < len) {
        ssize_t n = send_some(data + sent, len - sent);
        if (n > 0) {
            sent += static_cast<size_t>(n);
        } else if (n < 0 && errno == EINTR) {
            continue;
        } else {
            return IoStatus::fail(ConsumeError::Io,
                std::string("send() failed: ") + (n < 0 ? std::strerror(errno) : "no progress"));
        }
    }
    return {};
}

IoStatus BrokerConnection::read_exact(uint8_t* dst, size_t len, bool frame_start) {
    size_t got = 0;
    while (got < len) {
        ssize_t n = recv_some(dst + got, len - got);
        if (n > 0) {
            got += static_cast<size_t>(n);
        } else if (n == 0) {
            // Clean close between frames is end-of-stream; mid-frame it is a short read.
            if (frame_start && got == 0) return IoStatus::fail(ConsumeError::EndOfStream, "end of stream");
            return IoStatus::fail(ConsumeError::Io, "unexpected end of stream after " +
                                  std::to_string(got) + " of " + std::to_string(len) + " bytes");
        } else if (errno == EINTR) {
            continue;
        } else {
            return IoStatus::fail(ConsumeError::Io, std::string("recv() failed: ") + std::strerror(errno));
        }
    }
    return {};
}

IoStatus BrokerConnection::read_response(ResponseFrame& out) {
    out = ResponseFrame{};
    if (fd_ < 0) return IoStatus::fail(ConsumeError::Io, "read on closed connection");

    uint8_t hdr[4];
    IoStatus st = read_exact(hdr, sizeof(hdr), true);
    if (!st.ok()) return st;

    uint32_t length = load_be32(hdr);
    if (length > kMaxFrameSize) {
        return IoStatus::fail(ConsumeError::Io, "response frame too large (" +
                              std::to_string(length) + " bytes)");
    }

    read_buf_.resize(length);
    if (length > 0) {
        st = read_exact(read_buf_.data(), length, false);
        if (!st.ok()) return st;
    }

    out.length = length;
    if (length < 2) return {};

    out.error_code = static_cast<int16_t>(load_be16(read_buf_.data()));
    out.payload = std::span<const uint8_t>(read_buf_.data() + 2, length - 2);
    if (out.error_code != 0) {
        return IoStatus::fail(ConsumeError::Broker,
                              "broker response error " + std::to_string(out.error_code));
    }
    return {};
}

void BrokerConnection::shutdown() {
    if (fd_ >= 0) ::shutdown(fd_, SHUT_RDWR);
}

void BrokerConnection::close() {
    if (fd_ < 0) return;
#ifdef TAP_IO_URING
    uring_.reset();
#endif
    ::close(fd_);
    fd_ = -1;
}

} // namespace network
} // namespace tap
