#ifndef SPOOF_BYTE_STREAM_HPP
#define SPOOF_BYTE_STREAM_HPP

#include <string>
#include <cstdint>
#include <cstddef>
#include <sys/types.h>

namespace spoof {

/**
 * @brief Read/write contract of one accepted connection
 *
 * read() and write() follow POSIX semantics: bytes transferred, 0 on
 * orderly close (read), -1 on error with errno set.
 */
class ByteStream {
public:
    virtual ~ByteStream() = default;

    virtual ssize_t read(uint8_t* buf, size_t len) = 0;
    virtual ssize_t write(const uint8_t* buf, size_t len) = 0;
    virtual void close() = 0;

    /// Correlation key of the peer, "ip:port" or "[ip6]:port".
    virtual std::string remote_address() const = 0;
};

/**
 * @brief ByteStream over a connected TCP socket; owns the descriptor
 */
class SocketStream : public ByteStream {
public:
    explicit SocketStream(int fd);
    ~SocketStream() override;

    SocketStream(const SocketStream&) = delete;
    SocketStream& operator=(const SocketStream&) = delete;

    ssize_t read(uint8_t* buf, size_t len) override;
    ssize_t write(const uint8_t* buf, size_t len) override;
    void close() override;
    std::string remote_address() const override { return remote_; }

    int fd() const { return fd_; }

    /// getpeername() of `fd` formatted as a correlation key, "" on error.
    static std::string peer_address(int fd);

private:
    int fd_;
    std::string remote_;
};

} // namespace spoof

#endif // SPOOF_BYTE_STREAM_HPP
