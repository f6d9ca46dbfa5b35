/**
 * @file capture_server.cpp
 * @brief Listener, accept loop and per-connection handler
 */

#include "../include/spoof_capture_server.hpp"
#include "../include/spoof_logger.hpp"

#include <arpa/inet.h>
#include <cerrno>
#include <cstring>
#include <netdb.h>
#include <netinet/in.h>
#include <poll.h>
#include <stdexcept>
#include <thread>
#include <sys/socket.h>
#include <sys/time.h>
#include <unistd.h>

namespace spoof {

namespace {

constexpr int ACCEPT_POLL_MS = 200;

const char NOT_FOUND_RESPONSE[] =
    "HTTP/1.1 404 Not Found\r\n"
    "Content-Length: 0\r\n"
    "Connection: close\r\n"
    "\r\n";

std::string errno_string() {
    return std::strerror(errno);
}

int clamp_int(int value, int lo, int hi) {
    if (value < lo) return lo;
    if (value > hi) return hi;
    return value;
}

} // namespace

// ============================================================================
// Options
// ============================================================================

CaptureServerOptions CaptureServerOptions::from_config(const Config& cfg) {
    CaptureServerOptions o;
    o.address = cfg.get("listen.address", o.address);
    o.port = static_cast<uint16_t>(clamp_int(cfg.getInt("listen.port", o.port), 0, 65535));
    o.workers = static_cast<size_t>(clamp_int(cfg.getInt("listen.workers", 4), 1, 1024));
    o.read_timeout = std::chrono::seconds(
        clamp_int(cfg.getInt("listen.read_timeout_sec", 10), 0, 3600));
    o.cert_file = cfg.get("tls.cert_file", o.cert_file);
    o.key_file = cfg.get("tls.key_file", o.key_file);
    o.fingerprint_enabled = cfg.getBool("fingerprint.enabled", true);
    o.store_ttl = std::chrono::seconds(
        clamp_int(cfg.getInt("fingerprint.store_ttl_sec", 300), 1, 86400));
    int max_bytes = cfg.getInt("fingerprint.max_client_hello_bytes",
                               static_cast<int>(ClientHelloAssembler::DEFAULT_MAX_BYTES));
    o.max_client_hello_bytes = static_cast<size_t>(
        clamp_int(max_bytes,
                  static_cast<int>(tls::RECORD_HEADER_LEN + tls::HANDSHAKE_HEADER_LEN),
                  1 << 20));
    return o;
}

// ============================================================================
// CaptureServer
// ============================================================================

CaptureServer::CaptureServer(const CaptureServerOptions& options,
                             std::shared_ptr<FingerprintStore> store)
    : options_(options)
    , store_(store ? std::move(store)
                   : std::make_shared<FingerprintStore>(options.store_ttl))
    , tls_(std::make_unique<TlsContext>(options.cert_file, options.key_file))
{}

CaptureServer::~CaptureServer() {
    stop();
}

void CaptureServer::start() {
    if (running_) return;

    addrinfo hints{};
    hints.ai_family = AF_UNSPEC;
    hints.ai_socktype = SOCK_STREAM;
    hints.ai_flags = AI_PASSIVE | AI_NUMERICHOST | AI_NUMERICSERV;

    addrinfo* res = nullptr;
    std::string port = std::to_string(options_.port);
    int rc = getaddrinfo(options_.address.c_str(), port.c_str(), &hints, &res);
    if (rc != 0 || !res) {
        throw std::runtime_error("invalid listen address " + options_.address +
                                 ": " + gai_strerror(rc));
    }

    int fd = ::socket(res->ai_family, res->ai_socktype, res->ai_protocol);
    if (fd < 0) {
        freeaddrinfo(res);
        throw std::runtime_error("socket failed: " + errno_string());
    }

    int opt = 1;
    setsockopt(fd, SOL_SOCKET, SO_REUSEADDR, &opt, sizeof(opt));

    if (::bind(fd, res->ai_addr, res->ai_addrlen) < 0) {
        std::string err = errno_string();
        freeaddrinfo(res);
        ::close(fd);
        throw std::runtime_error("bind " + options_.address + ":" + port +
                                 " failed: " + err);
    }
    freeaddrinfo(res);

    if (::listen(fd, SOMAXCONN) < 0) {
        std::string err = errno_string();
        ::close(fd);
        throw std::runtime_error("listen failed: " + err);
    }

    sockaddr_storage bound{};
    socklen_t bound_len = sizeof(bound);
    if (getsockname(fd, reinterpret_cast<sockaddr*>(&bound), &bound_len) == 0) {
        if (bound.ss_family == AF_INET6) {
            bound_port_ = ntohs(reinterpret_cast<sockaddr_in6*>(&bound)->sin6_port);
        } else {
            bound_port_ = ntohs(reinterpret_cast<sockaddr_in*>(&bound)->sin_port);
        }
    }

    listen_fd_ = fd;
    pool_ = std::make_unique<WorkerPool>(options_.workers);
    store_->start();
    running_ = true;
    accept_thread_ = std::thread(&CaptureServer::accept_loop, this);

    SPOOF_LOG_INFO("server", "listening on " +
                   format_remote_address(options_.address, bound_port_) +
                   " workers=" + std::to_string(options_.workers) +
                   (options_.fingerprint_enabled ? "" : " fingerprinting=off"));
}

void CaptureServer::stop() {
    bool was_running = running_.exchange(false);

    // Wake workers blocked in SSL_accept or a request read; queued
    // connections see running_ == false and close without serving.
    {
        std::lock_guard<std::mutex> lock(clients_mu_);
        for (int fd : clients_) {
            ::shutdown(fd, SHUT_RDWR);
        }
    }

    if (accept_thread_.joinable()) {
        accept_thread_.join();
    }
    if (listen_fd_ >= 0) {
        ::close(listen_fd_);
        listen_fd_ = -1;
    }
    if (pool_) {
        pool_->shutdown();
        pool_.reset();
    }
    store_->stop();

    if (was_running) {
        SPOOF_LOG_INFO("server", "stopped, accepted=" + std::to_string(accepted_.load()) +
                       " logged=" + std::to_string(requests_logged_.load()));
    }
}

void CaptureServer::wait(const std::atomic<bool>& keep_running) const {
    while (keep_running.load() && running_.load()) {
        std::this_thread::sleep_for(std::chrono::milliseconds(ACCEPT_POLL_MS));
    }
}

CaptureServerStats CaptureServer::stats() const {
    CaptureServerStats s;
    s.accepted = accepted_.load();
    s.rejected = rejected_.load();
    s.handshake_failures = handshake_failures_.load();
    s.requests_logged = requests_logged_.load();
    return s;
}

void CaptureServer::accept_loop() {
    while (running_) {
        pollfd pfd{};
        pfd.fd = listen_fd_;
        pfd.events = POLLIN;

        int ready = ::poll(&pfd, 1, ACCEPT_POLL_MS);
        if (ready < 0) {
            if (errno == EINTR) continue;
            SPOOF_LOG_ERROR("server", "poll failed: " + errno_string());
            break;
        }
        if (ready == 0) continue;

        int client = ::accept(listen_fd_, nullptr, nullptr);
        if (client < 0) {
            if (errno != EINTR && errno != EAGAIN && errno != ECONNABORTED) {
                SPOOF_LOG_WARN("server", "accept failed: " + errno_string());
            }
            continue;
        }
        ++accepted_;

        if (options_.read_timeout.count() > 0) {
            timeval tv{};
            tv.tv_sec = static_cast<time_t>(options_.read_timeout.count());
            setsockopt(client, SOL_SOCKET, SO_RCVTIMEO, &tv, sizeof(tv));
            setsockopt(client, SOL_SOCKET, SO_SNDTIMEO, &tv, sizeof(tv));
        }

        if (!pool_->post([this, client] { handle_connection(client); })) {
            ++rejected_;
            SPOOF_LOG_WARN("server", "worker queue full, dropping connection");
            ::close(client);
        }
    }
}

bool CaptureServer::track_client(int fd) {
    std::lock_guard<std::mutex> lock(clients_mu_);
    if (!running_) return false;
    clients_.insert(fd);
    return true;
}

void CaptureServer::untrack_client(int fd) {
    std::lock_guard<std::mutex> lock(clients_mu_);
    clients_.erase(fd);
}

void CaptureServer::handle_connection(int fd) {
    if (!track_client(fd)) {
        ::close(fd);
        return;
    }

    auto socket = std::make_unique<SocketStream>(fd);
    const std::string remote = socket->remote_address();

    ClientHelloCaptureStream capture(std::move(socket), store_,
                                     options_.max_client_hello_bytes);

    // Destroyed before `capture`, so the fd leaves the set before it is closed.
    struct Untrack {
        CaptureServer* server;
        int fd;
        ~Untrack() { server->untrack_client(fd); }
    } untrack{this, fd};

    if (!options_.fingerprint_enabled) {
        capture.disable();
    }
    serve_connection(capture, remote);
}

void CaptureServer::serve_connection(ClientHelloCaptureStream& capture,
                                     const std::string& remote) {
    TlsSession session(*tls_, capture);
    if (!session.handshake()) {
        ++handshake_failures_;
        SPOOF_LOG_DEBUG("server", remote + " handshake failed: " + session.last_error());
        return;
    }

    std::string line = read_request_line(session);
    std::optional<JA4Fingerprint> fp = store_->lookup(remote);

    SPOOF_LOG_INFO("server", remote + " " + (line.empty() ? "-" : line) +
                   " ja4=" + (fp ? fp->raw : "-") +
                   " tls=" + session.negotiated_version());
    ++requests_logged_;

    const size_t resp_len = sizeof(NOT_FOUND_RESPONSE) - 1;
    if (session.write(reinterpret_cast<const uint8_t*>(NOT_FOUND_RESPONSE), resp_len) < 0) {
        SPOOF_LOG_DEBUG("server", remote + " response not sent: " + session.last_error());
    }
    session.shutdown();
}

std::string read_request_line(TlsSession& session, size_t limit) {
    std::string line;
    uint8_t ch = 0;
    while (line.size() < limit) {
        ssize_t n = session.read(&ch, 1);
        if (n <= 0) break;
        if (ch == '\n') break;
        line.push_back(static_cast<char>(ch));
    }
    if (!line.empty() && line.back() == '\r') {
        line.pop_back();
    }
    return line;
}

} // namespace spoof
