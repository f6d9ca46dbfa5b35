#ifndef SPOOF_CAPTURE_SERVER_HPP
#define SPOOF_CAPTURE_SERVER_HPP

/**
 * @file spoof_capture_server.hpp
 * @brief TLS listener that fingerprints every ClientHello it accepts
 */

#include <atomic>
#include <chrono>
#include <cstdint>
#include <memory>
#include <mutex>
#include <string>
#include <thread>
#include <unordered_set>

#include "spoof_capture_stream.hpp"
#include "spoof_config.hpp"
#include "spoof_fingerprint_store.hpp"
#include "spoof_tls.hpp"
#include "spoof_worker_pool.hpp"

namespace spoof {

struct CaptureServerOptions {
    std::string address = "0.0.0.0";
    uint16_t port = 8443;
    size_t workers = 4;
    std::chrono::seconds read_timeout{10};
    std::string cert_file = "cert.pem";
    std::string key_file = "key.pem";
    bool fingerprint_enabled = true;
    std::chrono::seconds store_ttl{300};
    size_t max_client_hello_bytes = ClientHelloAssembler::DEFAULT_MAX_BYTES;

    /// Reads the listen.*, tls.* and fingerprint.* keys.
    static CaptureServerOptions from_config(const Config& cfg);
};

struct CaptureServerStats {
    uint64_t accepted = 0;
    uint64_t rejected = 0;
    uint64_t handshake_failures = 0;
    uint64_t requests_logged = 0;
};

/**
 * @brief Accept loop plus worker pool around the capture decorator
 *
 * Each connection is wrapped as SocketStream -> ClientHelloCaptureStream
 * -> TlsSession. After the handshake the first request line is read, the
 * fingerprint looked up by remote address and one access line logged.
 */
class CaptureServer {
public:
    /// Loads the certificate; throws std::runtime_error on failure.
    explicit CaptureServer(const CaptureServerOptions& options,
                           std::shared_ptr<FingerprintStore> store = nullptr);
    ~CaptureServer();

    CaptureServer(const CaptureServer&) = delete;
    CaptureServer& operator=(const CaptureServer&) = delete;

    /// Bind, listen and launch the accept thread. Throws std::runtime_error.
    void start();

    /// Stop accepting, cut off in-flight and queued connections, stop the
    /// store sweep. Idempotent.
    void stop();

    /// Blocks until `keep_running` is false or the server stops.
    void wait(const std::atomic<bool>& keep_running) const;

    bool is_running() const { return running_.load(); }
    uint16_t bound_port() const { return bound_port_; }

    std::shared_ptr<FingerprintStore> store() const { return store_; }
    CaptureServerStats stats() const;

private:
    void accept_loop();
    void handle_connection(int fd);
    void serve_connection(ClientHelloCaptureStream& capture, const std::string& remote);

    // False once stopping; the caller then owns closing `fd`.
    bool track_client(int fd);
    void untrack_client(int fd);

    CaptureServerOptions options_;
    std::shared_ptr<FingerprintStore> store_;
    std::unique_ptr<TlsContext> tls_;
    std::unique_ptr<WorkerPool> pool_;

    int listen_fd_ = -1;
    uint16_t bound_port_ = 0;
    std::atomic<bool> running_{false};
    std::thread accept_thread_;

    std::mutex clients_mu_;
    std::unordered_set<int> clients_;

    std::atomic<uint64_t> accepted_{0};
    std::atomic<uint64_t> rejected_{0};
    std::atomic<uint64_t> handshake_failures_{0};
    std::atomic<uint64_t> requests_logged_{0};
};

/**
 * @brief Read up to the first '\n' (CR stripped) or `limit` bytes
 * @return The line, empty if the peer sent nothing usable
 */
std::string read_request_line(TlsSession& session, size_t limit = 8192);

} // namespace spoof

#endif // SPOOF_CAPTURE_SERVER_HPP
