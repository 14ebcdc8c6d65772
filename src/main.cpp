#include "config.hpp"
#include "logger.hpp"
#include "log_buffer.hpp"
#include "results_store.hpp"
#include "http_server.hpp"

#include <spdlog/spdlog.h>
#include <csignal>
#include <atomic>
#include <thread>
#include <chrono>
#include <iostream>

#ifndef SFS_VERSION
#define SFS_VERSION "dev"
#endif

// ─── Global shutdown flag ─────────────────────────────────────────────────────
static std::atomic<bool> g_shutdown{false};

static void signal_handler(int) {
    g_shutdown.store(true);
}

static void print_banner(const sfs::AppConfig& cfg) {
    std::cout << "sfs-server " SFS_VERSION " - static files + test telemetry API" << std::endl;

    spdlog::info("Configuration:");
    spdlog::info("  Listen          : {}:{}", cfg.server.host, cfg.server.port);
    spdlog::info("  Public dir      : {}", cfg.server.public_dir);
    spdlog::info("  Max threads     : {}", cfg.server.max_threads);
    spdlog::info("  Read timeout    : {} s", cfg.server.timeout_sec);
    spdlog::info("  Chunk size      : {} bytes", cfg.server.chunk_size);
    spdlog::info("  Failure inject  : {}", cfg.server.failure_injection.enabled
                 ? "enabled (rate " + std::to_string(cfg.server.failure_injection.rate) + ")"
                 : std::string("disabled"));
    spdlog::info("  Log file        : {}", cfg.logging.file.empty() ? "(console only)" : cfg.logging.file);
}

int main(int argc, char* argv[]) {
    // ─── Parse arguments ──────────────────────────────────────────────────────
    std::string config_path = "config.yaml";
    for (int i = 1; i < argc; i++) {
        std::string arg = argv[i];
        if ((arg == "--config" || arg == "-c") && i + 1 < argc) {
            config_path = argv[++i];
        } else if (arg == "--help" || arg == "-h") {
            std::cout << "Usage: sfs-server [options]\n"
                      << "Options:\n"
                      << "  -c, --config <path>    Config file (default: config.yaml)\n"
                      << "  -h, --help             Show this help\n"
                      << "\nEnvironment variables:\n"
                      << "  SFS_HOST               Listen address\n"
                      << "  SFS_PORT               Listen port\n"
                      << "  SFS_PUBLIC_DIR         Directory served as static content\n"
                      << "  SFS_MAX_THREADS        Worker pool size\n"
                      << "  LOG_LEVEL              Log level (trace/debug/info/warn/error)\n";
            return 0;
        } else {
            std::cerr << "Unknown argument: " << arg << " (see --help)" << std::endl;
            return 1;
        }
    }

    // ─── Load configuration ───────────────────────────────────────────────────
    sfs::AppConfig config;
    try {
        config = sfs::load_config(config_path);
    } catch (const std::exception& e) {
        std::cerr << "ERROR: " << e.what() << std::endl;
        return 1;
    }

    // ─── Initialize logger ────────────────────────────────────────────────────
    auto log_buffer = std::make_shared<sfs::LogBuffer>(config.logging.buffer_capacity);
    std::shared_ptr<spdlog::logger> logger;
    try {
        logger = sfs::init_logger(config.logging, log_buffer);
    } catch (const spdlog::spdlog_ex& e) {
        std::cerr << "ERROR: Failed to initialize logging: " << e.what() << std::endl;
        return 1;
    }
    print_banner(config);

    // ─── Signal handling ──────────────────────────────────────────────────────
    std::signal(SIGINT, signal_handler);
    std::signal(SIGTERM, signal_handler);

    // ─── Create and start the server ──────────────────────────────────────────
    sfs::TestResultsStore results;
    sfs::HttpServer http_server(config.server, *log_buffer, results, logger);

    if (!http_server.start()) {
        spdlog::critical("Failed to start HTTP server on {}:{}", config.server.host, config.server.port);
        return 1;
    }
    spdlog::info("Press Ctrl+C to stop the server");

    // ─── Main watchdog loop ───────────────────────────────────────────────────
    auto last_stats_time = std::chrono::steady_clock::now();
    constexpr auto stats_interval = std::chrono::seconds(60);

    while (!g_shutdown.load() && http_server.is_running()) {
        std::this_thread::sleep_for(std::chrono::milliseconds(500));

        auto now = std::chrono::steady_clock::now();
        if (now - last_stats_time >= stats_interval) {
            last_stats_time = now;
            auto stats = http_server.get_stats();
            spdlog::info("Health: accepted {} | active {} | completed {}",
                         stats.connections_accepted,
                         stats.connections_active,
                         stats.connections_completed);
        }
    }

    // ─── Graceful shutdown ────────────────────────────────────────────────────
    if (g_shutdown.load()) {
        spdlog::info("Received shutdown signal, stopping server...");
    }
    http_server.shutdown();
    spdlog::info("Shutdown complete");
    spdlog::shutdown();

    return 0;
}
