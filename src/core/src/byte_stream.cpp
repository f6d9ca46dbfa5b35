#include "../include/spoof_byte_stream.hpp"
#include "../include/spoof_fingerprint_store.hpp"

#include <arpa/inet.h>
#include <cerrno>
#include <netinet/in.h>
#include <sys/socket.h>
#include <unistd.h>

namespace spoof {

SocketStream::SocketStream(int fd)
    : fd_(fd)
    , remote_(peer_address(fd))
{}

SocketStream::~SocketStream() {
    close();
}

ssize_t SocketStream::read(uint8_t* buf, size_t len) {
    if (fd_ < 0) { errno = EBADF; return -1; }
    ssize_t n;
    do {
        n = ::recv(fd_, buf, len, 0);
    } while (n < 0 && errno == EINTR);
    return n;
}

ssize_t SocketStream::write(const uint8_t* buf, size_t len) {
    if (fd_ < 0) { errno = EBADF; return -1; }
    ssize_t n;
    do {
        n = ::send(fd_, buf, len, MSG_NOSIGNAL);
    } while (n < 0 && errno == EINTR);
    return n;
}

void SocketStream::close() {
    if (fd_ >= 0) {
        ::close(fd_);
        fd_ = -1;
    }
}

std::string SocketStream::peer_address(int fd) {
    sockaddr_storage ss{};
    socklen_t len = sizeof(ss);
    if (::getpeername(fd, reinterpret_cast<sockaddr*>(&ss), &len) != 0) {
        return "";
    }

    char ip[INET6_ADDRSTRLEN] = {0};
    if (ss.ss_family == AF_INET) {
        auto* sin = reinterpret_cast<sockaddr_in*>(&ss);
        if (!inet_ntop(AF_INET, &sin->sin_addr, ip, sizeof(ip))) return "";
        return format_remote_address(ip, ntohs(sin->sin_port));
    }
    if (ss.ss_family == AF_INET6) {
        auto* sin6 = reinterpret_cast<sockaddr_in6*>(&ss);
        if (!inet_ntop(AF_INET6, &sin6->sin6_addr, ip, sizeof(ip))) return "";
        return format_remote_address(ip, ntohs(sin6->sin6_port));
    }
    return "";
}

} // namespace spoof
