#include "http_server.hpp"
#include <arpa/inet.h>
#include <netdb.h>
#include <netinet/in.h>
#include <poll.h>
#include <sys/socket.h>
#include <cerrno>
#include <cstring>

namespace fs = std::filesystem;

namespace sfs {

namespace {

std::string peer_name(const sockaddr_in& addr) {
    char ip[INET_ADDRSTRLEN] = {0};
    if (!inet_ntop(AF_INET, &addr.sin_addr, ip, sizeof(ip))) {
        return "unknown";
    }
    return std::string(ip) + ":" + std::to_string(ntohs(addr.sin_port));
}

} // namespace

const char* to_string(ServerState state) {
    switch (state) {
        case ServerState::Starting:     return "starting";
        case ServerState::Running:      return "running";
        case ServerState::ShuttingDown: return "shutting down";
        case ServerState::Stopped:      return "stopped";
    }
    return "unknown";
}

HttpServer::HttpServer(const ServerConfig& config,
                       const LogBuffer& log_buffer,
                       TestResultsStore& results,
                       std::shared_ptr<spdlog::logger> logger)
    : config_(config)
    , logger_(std::move(logger))
    , injector_(config_.failure_injection)
    , api_(results, log_buffer, logger_)
{
}

HttpServer::~HttpServer() {
    shutdown();
}

bool HttpServer::start() {
    std::lock_guard<std::mutex> lock(lifecycle_mutex_);
    if (state_.load() != ServerState::Stopped) {
        logger_->warn("HTTP: start() called while {}", to_string(state_.load()));
        return false;
    }
    state_.store(ServerState::Starting);

    std::error_code ec;
    sandbox_root_ = fs::canonical(config_.public_dir, ec);
    if (ec || !fs::is_directory(sandbox_root_)) {
        logger_->error("HTTP: Public directory {} is not usable: {}", config_.public_dir,
                       ec ? ec.message() : "not a directory");
        state_.store(ServerState::Stopped);
        return false;
    }

    if (!open_listener()) {
        state_.store(ServerState::Stopped);
        return false;
    }

    pool_ = std::make_unique<WorkerPool>(static_cast<size_t>(config_.max_threads), logger_);
    handler_ = std::make_unique<ConnectionHandler>(config_, sandbox_root_, api_, injector_, logger_);

    state_.store(ServerState::Running);
    accept_thread_ = std::thread(&HttpServer::accept_loop, this);

    logger_->info("HTTP server listening on http://{}:{} (root: {})",
                  config_.host, port(), sandbox_root_.string());
    logger_->info("Worker threads: {}", config_.max_threads);
    if (injector_.enabled()) {
        logger_->warn("Failure injection enabled (rate: {:.2f})", injector_.rate());
    }
    return true;
}

bool HttpServer::open_listener() {
    addrinfo hints{};
    hints.ai_family = AF_INET;
    hints.ai_socktype = SOCK_STREAM;
    hints.ai_flags = AI_PASSIVE;

    addrinfo* res = nullptr;
    int rc = getaddrinfo(config_.host.c_str(), nullptr, &hints, &res);
    if (rc != 0 || !res) {
        logger_->error("HTTP: Cannot resolve host {}: {}", config_.host, gai_strerror(rc));
        return false;
    }
    sockaddr_in addr = *reinterpret_cast<sockaddr_in*>(res->ai_addr);
    freeaddrinfo(res);
    addr.sin_port = htons(static_cast<uint16_t>(config_.port));

    Socket sock(socket(AF_INET, SOCK_STREAM | SOCK_CLOEXEC, 0));
    if (!sock.valid()) {
        logger_->error("HTTP: Failed to create socket: {}", std::strerror(errno));
        return false;
    }

    int opt = 1;
    if (setsockopt(sock.get(), SOL_SOCKET, SO_REUSEADDR, &opt, sizeof(opt)) < 0) {
        logger_->warn("HTTP: Failed to set SO_REUSEADDR: {}", std::strerror(errno));
    }

    if (bind(sock.get(), reinterpret_cast<sockaddr*>(&addr), sizeof(addr)) < 0) {
        logger_->error("HTTP: Failed to bind to {}:{}: {}", config_.host, config_.port, std::strerror(errno));
        return false;
    }

    if (listen(sock.get(), kListenBacklog) < 0) {
        logger_->error("HTTP: Failed to listen: {}", std::strerror(errno));
        return false;
    }

    sockaddr_in bound{};
    socklen_t bound_len = sizeof(bound);
    if (getsockname(sock.get(), reinterpret_cast<sockaddr*>(&bound), &bound_len) == 0) {
        bound_port_.store(ntohs(bound.sin_port));
    } else {
        bound_port_.store(static_cast<uint16_t>(config_.port));
    }

    listen_socket_ = std::move(sock);
    return true;
}

void HttpServer::shutdown() {
    std::lock_guard<std::mutex> lock(lifecycle_mutex_);
    if (state_.load() == ServerState::Stopped) {
        return;
    }

    logger_->info("HTTP: Shutting down, waiting for in-flight connections...");
    state_.store(ServerState::ShuttingDown);

    // The accept loop notices within one poll timeout and closes the listener
    if (accept_thread_.joinable()) {
        accept_thread_.join();
    }
    listen_socket_.reset();

    if (pool_) {
        pool_->shutdown();
        pool_.reset();
    }
    handler_.reset();

    state_.store(ServerState::Stopped);
    logger_->info("HTTP server stopped ({} connections served)", completed_.load());
}

HttpServer::ServerStats HttpServer::get_stats() const {
    ServerStats stats;
    stats.connections_accepted = accepted_.load();
    stats.connections_active = active_.load();
    stats.connections_completed = completed_.load();
    return stats;
}

void HttpServer::accept_loop() {
    const int listen_fd = listen_socket_.get();

    while (state_.load() == ServerState::Running) {
        pollfd pfd{};
        pfd.fd = listen_fd;
        pfd.events = POLLIN;

        int rc = poll(&pfd, 1, kAcceptTimeoutMs);
        if (rc < 0) {
            if (errno == EINTR) continue;
            logger_->error("HTTP: poll() on listening socket failed: {}", std::strerror(errno));
            break;
        }
        if (rc == 0) {
            continue;  // timeout, re-check the lifecycle state
        }

        sockaddr_in client_addr{};
        socklen_t client_len = sizeof(client_addr);
        int client_fd = accept4(listen_fd, reinterpret_cast<sockaddr*>(&client_addr), &client_len,
                                SOCK_CLOEXEC);
        if (client_fd < 0) {
            if (state_.load() == ServerState::Running) {
                logger_->debug("HTTP: Accept failed: {}", std::strerror(errno));
            }
            continue;
        }

        accepted_.fetch_add(1);
        dispatch(Socket(client_fd), peer_name(client_addr));
    }

    // An accept loop that dies on its own still leaves the server draining
    ServerState expected = ServerState::Running;
    if (state_.compare_exchange_strong(expected, ServerState::ShuttingDown)) {
        logger_->error("HTTP: Accept loop exited unexpectedly");
    }
    listen_socket_.reset();
}

void HttpServer::dispatch(Socket client, std::string peer) {
    // std::function needs a copyable callable, so the socket travels in a shared_ptr
    auto shared_client = std::make_shared<Socket>(std::move(client));
    bool queued = pool_->submit([this, shared_client, peer]() {
        active_.fetch_add(1);
        try {
            handler_->handle(std::move(*shared_client), peer);
        } catch (const std::exception& e) {
            logger_->error("{} - Connection aborted: {}", peer, e.what());
        }
        active_.fetch_sub(1);
        completed_.fetch_add(1);
    });
    if (!queued) {
        logger_->warn("{} - Dropped connection, server is shutting down", peer);
    }
}

} // namespace sfs
