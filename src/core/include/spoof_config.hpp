#pragma once

#include <string>
#include <cstdint>
#include <map>
#include <fstream>
#include <sstream>
#include <algorithm>
#include <mutex>

#include "spoof_logger.hpp"

namespace spoof {

/**
 * @brief Runtime configuration for the capture engine
 *
 * Flat `key = value` store shared by the listener, the fingerprint
 * store and the logger. Lines starting with '#' or ';' are comments.
 * Thread-safe singleton.
 */
class Config {
public:
    static Config& instance() {
        static Config cfg;
        return cfg;
    }

    Config(const Config&) = delete;
    Config& operator=(const Config&) = delete;

    // ==================== Getters ====================
    std::string get(const std::string& key, const std::string& default_val = "") const {
        std::lock_guard<std::mutex> lock(mtx_);
        auto it = values_.find(key);
        return (it != values_.end()) ? it->second : default_val;
    }

    int getInt(const std::string& key, int default_val = 0) const {
        std::string v = get(key);
        if (v.empty()) return default_val;
        try { return std::stoi(v); }
        catch (const std::exception&) { return default_val; }
    }

    bool getBool(const std::string& key, bool default_val = false) const {
        std::string v = get(key);
        if (v.empty()) return default_val;
        std::transform(v.begin(), v.end(), v.begin(), ::tolower);
        return (v == "true" || v == "1" || v == "yes" || v == "on");
    }

    bool has(const std::string& key) const {
        std::lock_guard<std::mutex> lock(mtx_);
        return values_.count(key) != 0;
    }

    // ==================== Setters ====================
    void set(const std::string& key, const std::string& value) {
        std::lock_guard<std::mutex> lock(mtx_);
        values_[key] = value;
    }

    void setInt(const std::string& key, int value) {
        set(key, std::to_string(value));
    }

    void setBool(const std::string& key, bool value) {
        set(key, value ? "true" : "false");
    }

    // ==================== File I/O ====================
    /// Merges `path` over the current values. Returns false if unreadable.
    bool loadFromFile(const std::string& path) {
        std::ifstream file(path);
        if (!file.is_open()) return false;

        std::lock_guard<std::mutex> lock(mtx_);
        std::string line;
        while (std::getline(file, line)) {
            auto first = line.find_first_not_of(" \t\r");
            if (first == std::string::npos) continue;
            if (line[first] == '#' || line[first] == ';') continue;
            auto pos = line.find('=');
            if (pos == std::string::npos) continue;

            std::string key = trim(line.substr(0, pos));
            std::string val = trim(line.substr(pos + 1));
            if (key.empty()) continue;
            values_[key] = val;
        }
        return true;
    }

    // ==================== Defaults ====================
    void loadDefaults() {
        std::lock_guard<std::mutex> lock(mtx_);
        values_["log.level"] = "info";
        values_["log.file"] = "";
        values_["log.console"] = "true";
        values_["listen.address"] = "0.0.0.0";
        values_["listen.port"] = "8443";
        values_["listen.workers"] = "4";
        values_["listen.read_timeout_sec"] = "10";
        values_["tls.cert_file"] = "cert.pem";
        values_["tls.key_file"] = "key.pem";
        values_["fingerprint.enabled"] = "true";
        values_["fingerprint.store_ttl_sec"] = "300";
        values_["fingerprint.max_client_hello_bytes"] = "16389";
    }

    /// Pushes the `log.*` keys into the process logger.
    void applyLogging() const {
        auto& logger = Logger::instance();
        logger.setLevel(Logger::levelFromString(get("log.level", "info")));
        logger.setConsoleOutput(getBool("log.console", true));
        std::string file = get("log.file");
        if (!logger.setFileOutput(file)) {
            SPOOF_LOG_WARN("config", "cannot open log file " + file);
        }
    }

    void clear() {
        std::lock_guard<std::mutex> lock(mtx_);
        values_.clear();
    }

private:
    Config() { loadDefaults(); }

    static std::string trim(const std::string& s) {
        auto b = s.find_first_not_of(" \t\r");
        if (b == std::string::npos) return "";
        auto e = s.find_last_not_of(" \t\r");
        return s.substr(b, e - b + 1);
    }

    mutable std::mutex mtx_;
    std::map<std::string, std::string> values_;
};

} // namespace spoof
