#include "spoof_capture_server.hpp"
#include "spoof_client_hello.hpp"
#include "spoof_client_hello_assembler.hpp"
#include "spoof_config.hpp"
#include "spoof_ja4.hpp"
#include "spoof_logger.hpp"

#include <openssl/crypto.h>
#include <sodium.h>

#include <algorithm>
#include <atomic>
#include <cctype>
#include <csignal>
#include <fstream>
#include <functional>
#include <iostream>
#include <iterator>
#include <map>
#include <memory>
#include <string>
#include <vector>

using namespace spoof;

#ifndef SPOOF_VERSION
#define SPOOF_VERSION "0.1.0"
#endif

// ============================================================================
// Signal handler
// ============================================================================

std::atomic<bool> g_running(true);

void signal_handler(int signal) {
    if (signal == SIGINT || signal == SIGTERM) {
        g_running = false;  // Only set flag, cleanup happens in the handler
    }
}

// ============================================================================
// ArgumentParser
// ============================================================================

class ArgumentParser {
public:
    using Handler = std::function<int(const std::vector<std::string>&)>;

    struct Command {
        std::string name;
        std::string description;
        Handler handler;
        std::vector<std::string> args_help;
    };

    ArgumentParser(const std::string& prog_name, const std::string& version)
        : prog_name_(prog_name), version_(version) {}

    void add_command(
        const std::string& name,
        const std::string& description,
        Handler handler,
        const std::vector<std::string>& args_help = {}
    ) {
        commands_[name] = {name, description, handler, args_help};
    }

    int parse_and_execute(int argc, char* argv[]) {
        if (argc < 2) {
            print_usage();
            return 1;
        }

        std::string cmd = argv[1];
        if (cmd == "help" || cmd == "--help" || cmd == "-h") {
            print_usage();
            return 0;
        }
        if (cmd == "version" || cmd == "--version" || cmd == "-v") {
            std::cout << prog_name_ << " " << version_
                      << " (" << OpenSSL_version(OPENSSL_VERSION)
                      << ", libsodium " << sodium_version_string() << ")\n";
            return 0;
        }

        auto it = commands_.find(cmd);
        if (it == commands_.end()) {
            std::cerr << "Unknown command: " << cmd << "\n";
            print_usage();
            return 1;
        }

        std::vector<std::string> args(argv + 2, argv + argc);
        return it->second.handler(args);
    }

private:
    void print_usage() const {
        std::cout << prog_name_ << " " << version_ << " - TLS ClientHello capture and JA4 fingerprinting\n";
        std::cout << "\nUsage: " << prog_name_ << " <command> [options]\n\n";
        std::cout << "Commands:\n";
        for (const auto& [name, cmd] : commands_) {
            std::cout << "  " << cmd.name;
            for (const auto& arg : cmd.args_help)
                std::cout << " " << arg;
            std::cout << "\n    " << cmd.description << "\n\n";
        }
        std::cout << "  help\n    Show this help message\n\n";
        std::cout << "  version\n    Show version information\n";
    }

    std::string prog_name_;
    std::string version_;
    std::map<std::string, Command> commands_;
};

// ============================================================================
// Utility functions
// ============================================================================

static std::string get_arg(const std::vector<std::string>& args, size_t index, const std::string& default_val = "") {
    return index < args.size() ? args[index] : default_val;
}

static bool has_flag(const std::vector<std::string>& args, const std::string& flag) {
    return std::find(args.begin(), args.end(), flag) != args.end();
}

static std::string get_option(const std::vector<std::string>& args, const std::string& option, const std::string& default_val = "") {
    auto it = std::find(args.begin(), args.end(), option);
    if (it != args.end() && ++it != args.end()) return *it;
    return default_val;
}

/// Accepts hex text (whitespace and an optional 0x prefix ignored) or raw bytes.
static std::vector<uint8_t> decode_capture(const std::string& content) {
    std::string hex;
    hex.reserve(content.size());
    bool is_hex = !content.empty();
    for (size_t i = 0; i < content.size() && is_hex; ++i) {
        unsigned char c = static_cast<unsigned char>(content[i]);
        if (std::isspace(c)) continue;
        if (c == '0' && i + 1 < content.size() && (content[i + 1] == 'x' || content[i + 1] == 'X')) {
            ++i;
            continue;
        }
        if (!std::isxdigit(c)) {
            is_hex = false;
            break;
        }
        hex.push_back(static_cast<char>(c));
    }

    if (is_hex && !hex.empty() && hex.size() % 2 == 0) {
        std::vector<uint8_t> out(hex.size() / 2);
        size_t bin_len = 0;
        if (sodium_hex2bin(out.data(), out.size(), hex.data(), hex.size(),
                           nullptr, &bin_len, nullptr) == 0) {
            out.resize(bin_len);
            return out;
        }
    }
    return std::vector<uint8_t>(content.begin(), content.end());
}

// ============================================================================
// Forward declarations
// ============================================================================

int handle_serve(const std::vector<std::string>& args);
int handle_ja4(const std::vector<std::string>& args);

// ============================================================================
// main()
// ============================================================================

int main(int argc, char* argv[]) {
    std::signal(SIGINT, signal_handler);
    std::signal(SIGTERM, signal_handler);

    if (sodium_init() < 0) {
        std::cerr << "[!] libsodium initialization failed\n";
        return 1;
    }

    ArgumentParser parser("spoof", SPOOF_VERSION);
    parser.add_command("serve", "Accept TLS connections and log their JA4 fingerprints",
                       handle_serve, {"[--config <file>]", "[--port <n>]", "[--no-fingerprint]"});
    parser.add_command("ja4", "Fingerprint a captured ClientHello record (hex or binary)",
                       handle_ja4, {"<file>"});

    return parser.parse_and_execute(argc, argv);
}

// ============================================================================
// Command handlers
// ============================================================================

int handle_serve(const std::vector<std::string>& args) {
    auto& cfg = Config::instance();

    std::string config_path = get_option(args, "--config");
    if (!config_path.empty() && !cfg.loadFromFile(config_path)) {
        std::cerr << "[!] Cannot read config file: " << config_path << "\n";
        return 1;
    }
    std::string port = get_option(args, "--port");
    if (!port.empty()) cfg.set("listen.port", port);
    if (has_flag(args, "--no-fingerprint")) cfg.setBool("fingerprint.enabled", false);

    cfg.applyLogging();

    std::unique_ptr<CaptureServer> server;
    try {
        server = std::make_unique<CaptureServer>(CaptureServerOptions::from_config(cfg));
        server->start();
    } catch (const std::exception& e) {
        SPOOF_LOG_FATAL("main", e.what());
        return 1;
    }

    std::cout << "[+] Listening on port " << server->bound_port() << ", press Ctrl+C to stop\n";

    server->wait(g_running);

    std::cout << "\n[!] Shutdown signal received...\n";
    server->stop();

    CaptureServerStats s = server->stats();
    FingerprintStoreStats st = server->store()->stats();
    std::cout << "[+] accepted=" << s.accepted
              << " rejected=" << s.rejected
              << " handshake_failures=" << s.handshake_failures
              << " logged=" << s.requests_logged
              << " fingerprints=" << st.records << "\n";
    return 0;
}

int handle_ja4(const std::vector<std::string>& args) {
    std::string path = get_arg(args, 0);
    if (path.empty()) {
        std::cerr << "Usage: spoof ja4 <file>\n";
        return 1;
    }

    std::ifstream in(path, std::ios::binary);
    if (!in.is_open()) {
        std::cerr << "[!] Cannot open " << path << "\n";
        return 1;
    }
    std::string content((std::istreambuf_iterator<char>(in)), std::istreambuf_iterator<char>());
    std::vector<uint8_t> data = decode_capture(content);

    ClientHelloAssembler assembler;
    ClientHelloAssembler::State state = assembler.feed(data.data(), data.size());
    if (state == ClientHelloAssembler::State::ABORTED) {
        std::cerr << "[!] Not a fingerprintable ClientHello: "
                  << capture_error_to_string(assembler.error()) << ", "
                  << assembler.error_detail() << "\n";
        return 1;
    }
    if (state == ClientHelloAssembler::State::NEED_MORE) {
        std::cerr << "[!] Truncated ClientHello: have " << data.size()
                  << " of " << assembler.expected_length() << " bytes\n";
        return 1;
    }

    ClientHelloParser hello_parser;
    ClientHelloParseResult parsed = hello_parser.parse(assembler.buffer());
    if (!parsed.success) {
        std::cerr << "[!] Malformed ClientHello: " << parsed.error << "\n";
        return 1;
    }

    JA4Generator generator;
    JA4Fingerprint fp = generator.generate(parsed.fields);

    std::cout << fp.raw << "\n";
    std::cout << "  part_a:  " << fp.part_a << "\n";
    std::cout << "  part_b:  " << fp.part_b << "\n";
    std::cout << "  part_c:  " << fp.part_c << "\n";
    std::cout << "  ja4_r:   " << fp.to_debug_string() << "\n";
    if (!fp.sni_hostname.empty()) {
        std::cout << "  sni:     " << fp.sni_hostname << "\n";
    }
    std::cout << "  ciphers: " << fp.cipher_count << "\n";
    return 0;
}
