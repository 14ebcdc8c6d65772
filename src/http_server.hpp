#pragma once

#include "api_handler.hpp"
#include "config.hpp"
#include "connection_handler.hpp"
#include "failure_injector.hpp"
#include "log_buffer.hpp"
#include "results_store.hpp"
#include "socket.hpp"
#include "worker_pool.hpp"
#include <spdlog/spdlog.h>
#include <atomic>
#include <cstdint>
#include <filesystem>
#include <memory>
#include <mutex>
#include <string>
#include <thread>

namespace sfs {

enum class ServerState { Starting, Running, ShuttingDown, Stopped };

const char* to_string(ServerState state);

// Static file + telemetry API server. One thread accepts connections and
// hands each of them to a fixed-size worker pool.
class HttpServer {
public:
    static constexpr int kAcceptTimeoutMs = 1000;
    static constexpr int kListenBacklog = 128;

    HttpServer(const ServerConfig& config,
               const LogBuffer& log_buffer,
               TestResultsStore& results,
               std::shared_ptr<spdlog::logger> logger);
    ~HttpServer();

    // Non-copyable
    HttpServer(const HttpServer&) = delete;
    HttpServer& operator=(const HttpServer&) = delete;

    // Resolve the sandbox root, bind and listen, start accepting.
    // Returns false (and logs why) if the server cannot start.
    bool start();

    // Stop accepting, close the listening socket, then wait for every
    // dispatched connection to finish. Safe to call more than once.
    void shutdown();

    ServerState state() const { return state_.load(); }
    bool is_running() const { return state_.load() == ServerState::Running; }

    // Port actually bound (useful when configured with port 0)
    uint16_t port() const { return bound_port_.load(); }

    const std::filesystem::path& sandbox_root() const { return sandbox_root_; }

    struct ServerStats {
        uint64_t connections_accepted = 0;
        uint64_t connections_active = 0;
        uint64_t connections_completed = 0;
    };
    ServerStats get_stats() const;

private:
    bool open_listener();
    void accept_loop();
    void dispatch(Socket client, std::string peer);

    ServerConfig config_;
    std::shared_ptr<spdlog::logger> logger_;
    std::filesystem::path sandbox_root_;

    FailureInjector injector_;
    ApiHandler api_;
    std::unique_ptr<ConnectionHandler> handler_;
    std::unique_ptr<WorkerPool> pool_;

    Socket listen_socket_;
    std::atomic<uint16_t> bound_port_{0};
    std::atomic<ServerState> state_{ServerState::Stopped};
    std::mutex lifecycle_mutex_;
    std::thread accept_thread_;

    std::atomic<uint64_t> accepted_{0};
    std::atomic<uint64_t> active_{0};
    std::atomic<uint64_t> completed_{0};
};

} // namespace sfs
