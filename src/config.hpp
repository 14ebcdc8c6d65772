#pragma once

#include <string>
#include <cstdint>
#include <cstddef>

namespace sfs {

struct FailureInjectionConfig {
    bool enabled = false;
    double rate = 0.0;     // probability in [0, 1]
    uint32_t seed = 0;     // 0 = seed from std::random_device
};

struct ServerConfig {
    std::string host = "0.0.0.0";
    int port = 8000;       // 0 = pick an ephemeral port
    int max_threads = 10;
    std::string public_dir = "./public";
    int timeout_sec = 30;
    size_t chunk_size = 8192;
    size_t max_body_bytes = 10 * 1024 * 1024;
    FailureInjectionConfig failure_injection;
};

struct LoggingConfig {
    std::string level = "info";
    std::string file;
    int max_file_size_mb = 10;
    int max_files = 5;
    size_t buffer_capacity = 500;
};

struct AppConfig {
    ServerConfig server;
    LoggingConfig logging;
};

// Load configuration from YAML file, with environment variable overrides
AppConfig load_config(const std::string& path);

// Throws std::runtime_error if values are out of range
void validate_config(const AppConfig& cfg);

} // namespace sfs
