#include "config.hpp"
#include <yaml-cpp/yaml.h>
#include <cstdlib>
#include <stdexcept>
#include <string>

namespace sfs {

static std::string env_or(const char* name, const std::string& fallback) {
    const char* val = std::getenv(name);
    return val ? std::string(val) : fallback;
}

static int env_int_or(const char* name, int fallback) {
    const char* val = std::getenv(name);
    if (!val) return fallback;
    try {
        return std::stoi(val);
    } catch (const std::exception&) {
        throw std::runtime_error(std::string("Invalid integer in ") + name + ": " + val);
    }
}

AppConfig load_config(const std::string& path) {
    AppConfig cfg;
    YAML::Node root;

    try {
        root = YAML::LoadFile(path);
    } catch (const YAML::Exception& e) {
        throw std::runtime_error("Failed to load config: " + std::string(e.what()));
    }

    try {
        // Server
        if (auto s = root["server"]) {
            cfg.server.host = s["host"].as<std::string>(cfg.server.host);
            cfg.server.port = s["port"].as<int>(cfg.server.port);
            cfg.server.max_threads = s["max_threads"].as<int>(cfg.server.max_threads);
            cfg.server.public_dir = s["public_dir"].as<std::string>(cfg.server.public_dir);
            cfg.server.timeout_sec = s["timeout"].as<int>(cfg.server.timeout_sec);
            cfg.server.chunk_size = s["chunk_size"].as<size_t>(cfg.server.chunk_size);
            cfg.server.max_body_bytes = s["max_body_bytes"].as<size_t>(cfg.server.max_body_bytes);

            if (auto f = s["failure_injection"]) {
                auto& fi = cfg.server.failure_injection;
                fi.enabled = f["enabled"].as<bool>(fi.enabled);
                fi.rate = f["rate"].as<double>(fi.rate);
                fi.seed = f["seed"].as<uint32_t>(fi.seed);
            }
        }

        // Logging
        if (auto l = root["logging"]) {
            cfg.logging.level = l["level"].as<std::string>(cfg.logging.level);
            cfg.logging.file = l["file"].as<std::string>("");
            cfg.logging.max_file_size_mb = l["max_file_size_mb"].as<int>(cfg.logging.max_file_size_mb);
            cfg.logging.max_files = l["max_files"].as<int>(cfg.logging.max_files);
            cfg.logging.buffer_capacity = l["buffer_capacity"].as<size_t>(cfg.logging.buffer_capacity);
        }
    } catch (const YAML::Exception& e) {
        throw std::runtime_error("Invalid config value in " + path + ": " + std::string(e.what()));
    }

    // Environment variable overrides (Docker / systemd)
    cfg.server.host = env_or("SFS_HOST", cfg.server.host);
    cfg.server.port = env_int_or("SFS_PORT", cfg.server.port);
    cfg.server.public_dir = env_or("SFS_PUBLIC_DIR", cfg.server.public_dir);
    cfg.server.max_threads = env_int_or("SFS_MAX_THREADS", cfg.server.max_threads);
    cfg.logging.level = env_or("LOG_LEVEL", cfg.logging.level);

    validate_config(cfg);
    return cfg;
}

void validate_config(const AppConfig& cfg) {
    if (cfg.server.port < 0 || cfg.server.port > 65535) {
        throw std::runtime_error("server.port must be within [0, 65535], got " +
                                 std::to_string(cfg.server.port));
    }
    if (cfg.server.max_threads < 1) {
        throw std::runtime_error("server.max_threads must be at least 1");
    }
    if (cfg.server.timeout_sec < 1) {
        throw std::runtime_error("server.timeout must be at least 1 second");
    }
    if (cfg.server.chunk_size == 0) {
        throw std::runtime_error("server.chunk_size must be positive");
    }
    if (cfg.server.public_dir.empty()) {
        throw std::runtime_error("server.public_dir must not be empty");
    }
    const double rate = cfg.server.failure_injection.rate;
    if (rate < 0.0 || rate > 1.0) {
        throw std::runtime_error("server.failure_injection.rate must be within [0, 1]");
    }
    if (cfg.logging.buffer_capacity == 0) {
        throw std::runtime_error("logging.buffer_capacity must be positive");
    }
}

} // namespace sfs
