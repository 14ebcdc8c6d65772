#pragma once

#include <spdlog/spdlog.h>
#include <spdlog/sinks/stdout_color_sinks.h>
#include <spdlog/sinks/rotating_file_sink.h>
#include <memory>
#include <string>
#include <vector>
#include "config.hpp"
#include "log_buffer.hpp"

namespace sfs {

inline spdlog::level::level_enum parse_level(const std::string& level) {
    if (level == "trace") return spdlog::level::trace;
    if (level == "debug") return spdlog::level::debug;
    if (level == "info") return spdlog::level::info;
    if (level == "warn") return spdlog::level::warn;
    if (level == "error") return spdlog::level::err;
    if (level == "critical") return spdlog::level::critical;
    return spdlog::level::info;
}

// Builds the server logger (console, optional rotating file, in-memory buffer)
// and installs it as the spdlog default.
inline std::shared_ptr<spdlog::logger> init_logger(const LoggingConfig& cfg,
                                                   const std::shared_ptr<LogBuffer>& buffer) {
    std::vector<spdlog::sink_ptr> sinks;

    // Console sink (always)
    auto console_sink = std::make_shared<spdlog::sinks::stdout_color_sink_mt>();
    console_sink->set_pattern("%Y-%m-%d %H:%M:%S - [%t] - %^%l%$ - %v");
    sinks.push_back(console_sink);

    // File sink (optional)
    if (!cfg.file.empty()) {
        auto file_sink = std::make_shared<spdlog::sinks::rotating_file_sink_mt>(
            cfg.file,
            static_cast<size_t>(cfg.max_file_size_mb) * 1024 * 1024,
            static_cast<size_t>(cfg.max_files)
        );
        file_sink->set_pattern(kLogPattern);
        sinks.push_back(file_sink);
    }

    // In-memory tail served by /api/logs
    sinks.push_back(buffer->sink());

    auto logger = std::make_shared<spdlog::logger>("sfs-server", sinks.begin(), sinks.end());
    logger->set_level(parse_level(cfg.level));
    logger->flush_on(spdlog::level::warn);
    spdlog::set_default_logger(logger);

    logger->info("Logger initialized");
    return logger;
}

// Logger that only feeds a LogBuffer; used where console output is unwanted
inline std::shared_ptr<spdlog::logger> make_buffer_logger(const std::string& name,
                                                          const std::shared_ptr<LogBuffer>& buffer) {
    auto logger = std::make_shared<spdlog::logger>(name, buffer->sink());
    logger->set_level(spdlog::level::debug);
    return logger;
}

} // namespace sfs
