#include "connection_handler.hpp"
#include "http_response.hpp"
#include "mime_types.hpp"
#include "router.hpp"
#include <sys/socket.h>
#include <sys/time.h>
#include <cerrno>
#include <chrono>
#include <cstring>
#include <fstream>
#include <iterator>
#include <vector>

namespace fs = std::filesystem;

namespace sfs {

ConnectionHandler::ConnectionHandler(const ServerConfig& config,
                                     fs::path sandbox_root,
                                     ApiHandler& api,
                                     FailureInjector& injector,
                                     std::shared_ptr<spdlog::logger> logger)
    : config_(config)
    , sandbox_root_(std::move(sandbox_root))
    , api_(api)
    , injector_(injector)
    , logger_(std::move(logger))
{
}

void ConnectionHandler::handle(Socket client, const std::string& peer) {
    const int fd = client.get();
    apply_timeouts(fd, peer);

    RawRequest raw = read_request(fd, peer);
    if (raw.data.empty()) {
        logger_->warn("{} - No request received", peer);
        return;
    }
    if (raw.body_too_large) {
        logger_->warn("{} - Request body exceeds {} bytes", peer, config_.max_body_bytes);
        send(fd, 400, status_reason(400), kTextPlain, "Request body too large\n",
             is_head_request(raw.data), peer);
        return;
    }

    ParseResult parsed = parse_request(raw.data);
    if (auto* error = std::get_if<ParseError>(&parsed)) {
        logger_->warn("{} - {} {}", peer, error->status, error->reason);
        send(fd, error->status, error->reason, kTextPlain, error->message,
             is_head_request(raw.data), peer);
        return;
    }

    const Request& request = std::get<Request>(parsed);
    const bool head = request.method == Method::Head;
    logger_->info("{} - {} {} {}", peer, to_string(request.method), request.target, request.version);

    try {
        Outcome outcome = respond(fd, request, peer);
        logger_->info("{} - {} -> {} ({} bytes)", peer, request.path, outcome.status, outcome.bytes);
    } catch (const std::exception& e) {
        logger_->error("{} - Error handling {} {}: {}", peer, to_string(request.method), request.path, e.what());
        if (!write_response(fd, 500, status_reason(500), kTextPlain, "Internal server error\n", head)) {
            logger_->error("{} - Failed to send 500 response: {}", peer, std::strerror(errno));
        }
    }
}

void ConnectionHandler::apply_timeouts(int fd, const std::string& peer) const {
    // Bounds every recv and every send, so a client that stops reading
    // cannot pin a worker
    timeval tv{};
    tv.tv_sec = config_.timeout_sec;
    if (setsockopt(fd, SOL_SOCKET, SO_RCVTIMEO, &tv, sizeof(tv)) < 0) {
        logger_->warn("{} - Failed to set read timeout: {}", peer, std::strerror(errno));
    }
    if (setsockopt(fd, SOL_SOCKET, SO_SNDTIMEO, &tv, sizeof(tv)) < 0) {
        logger_->warn("{} - Failed to set write timeout: {}", peer, std::strerror(errno));
    }
}

ConnectionHandler::RawRequest ConnectionHandler::read_request(int fd, const std::string& peer) const {
    const auto deadline = std::chrono::steady_clock::now() + std::chrono::seconds(config_.timeout_sec);
    RawRequest raw;
    std::vector<char> chunk(config_.chunk_size);
    std::optional<size_t> header_end;
    size_t wanted = 0;   // header bytes + declared body bytes

    while (std::chrono::steady_clock::now() < deadline) {
        ssize_t n = recv(fd, chunk.data(), chunk.size(), 0);
        if (n == 0) {
            break;  // peer closed its side
        }
        if (n < 0) {
            if (errno == EINTR) continue;
            if (errno == EAGAIN || errno == EWOULDBLOCK) {
                logger_->debug("{} - Read timed out after {} bytes", peer, raw.data.size());
            } else {
                logger_->warn("{} - Read failed: {}", peer, std::strerror(errno));
            }
            break;
        }
        raw.data.append(chunk.data(), static_cast<size_t>(n));

        if (!header_end) {
            header_end = find_header_end(raw.data);
            if (!header_end) continue;

            size_t declared = content_length_of(
                std::string_view(raw.data).substr(0, *header_end));
            if (declared > config_.max_body_bytes) {
                raw.body_too_large = true;
                break;
            }
            wanted = *header_end + declared;
        }
        if (raw.data.size() >= wanted) {
            break;
        }
    }
    return raw;
}

ConnectionHandler::Outcome ConnectionHandler::respond(int fd, const Request& request,
                                                      const std::string& peer) {
    const bool head = request.method == Method::Head;

    if (auto failure = injector_.draw()) {
        logger_->warn("{} - Injecting simulated {} for {}", peer, failure->status, request.path);
        send(fd, failure->status, failure->reason, kTextPlain, failure->body, head, peer);
        return Outcome{failure->status, failure->body.size()};
    }

    ResolvedTarget target = route(request, sandbox_root_);

    if (auto* file = std::get_if<StaticFile>(&target)) {
        return serve_file(fd, file->path, file->status, head, peer);
    }

    if (auto* api = std::get_if<ApiEndpoint>(&target)) {
        ApiResponse response = api_.handle(api->route, request);
        send(fd, response.status, status_reason(response.status), kApplicationJson,
             response.body, head, peer);
        return Outcome{response.status, response.body.size()};
    }

    const auto& rejected = std::get<Rejected>(target);
    if (rejected.status == 403) {
        logger_->warn("{} - Access denied: {}", peer, request.path);
    }
    send(fd, rejected.status, status_reason(rejected.status), kTextPlain, rejected.body, head, peer);
    return Outcome{rejected.status, rejected.body.size()};
}

ConnectionHandler::Outcome ConnectionHandler::serve_file(int fd, const fs::path& path, int status,
                                                         bool head, const std::string& peer) {
    std::ifstream file(path, std::ios::binary);
    if (!file.is_open()) {
        logger_->error("{} - Cannot read file {}", peer, path.string());
        const std::string body = "Cannot read file\n";
        send(fd, 500, status_reason(500), kTextPlain, body, head, peer);
        return Outcome{500, body.size()};
    }

    // Read file
    std::string body((std::istreambuf_iterator<char>(file)),
                      std::istreambuf_iterator<char>());

    send(fd, status, status_reason(status), mime_type_for(path.string()), body, head, peer);
    return Outcome{status, body.size()};
}

void ConnectionHandler::send(int fd, int status, std::string_view reason, std::string_view content_type,
                             std::string_view body, bool head, const std::string& peer) const {
    if (!write_response(fd, status, reason, content_type, body, head)) {
        if (errno == EAGAIN || errno == EWOULDBLOCK) {
            logger_->warn("{} - Send of {} response timed out after {}s", peer, status, config_.timeout_sec);
        } else {
            logger_->warn("{} - Failed to send {} response: {}", peer, status, std::strerror(errno));
        }
    }
}

} // namespace sfs
