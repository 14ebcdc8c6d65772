#pragma once

#include "api_handler.hpp"
#include "config.hpp"
#include "failure_injector.hpp"
#include "http_request.hpp"
#include "socket.hpp"
#include <spdlog/spdlog.h>
#include <filesystem>
#include <memory>
#include <string>
#include <string_view>

namespace sfs {

// Serves exactly one request on an accepted connection:
// read -> parse -> (inject failure | route) -> respond -> close.
class ConnectionHandler {
public:
    ConnectionHandler(const ServerConfig& config,
                      std::filesystem::path sandbox_root,
                      ApiHandler& api,
                      FailureInjector& injector,
                      std::shared_ptr<spdlog::logger> logger);

    // The socket is closed when this returns, whatever happened
    void handle(Socket client, const std::string& peer);

private:
    struct RawRequest {
        std::string data;
        bool body_too_large = false;
    };

    struct Outcome {
        int status;
        size_t bytes;   // body length announced in Content-Length
    };

    void apply_timeouts(int fd, const std::string& peer) const;
    RawRequest read_request(int fd, const std::string& peer) const;
    Outcome respond(int fd, const Request& request, const std::string& peer);
    Outcome serve_file(int fd, const std::filesystem::path& path, int status, bool head,
                       const std::string& peer);

    // Write a response, logging (not throwing) on failure
    void send(int fd, int status, std::string_view reason, std::string_view content_type,
              std::string_view body, bool head, const std::string& peer) const;

    const ServerConfig& config_;
    const std::filesystem::path sandbox_root_;
    ApiHandler& api_;
    FailureInjector& injector_;
    std::shared_ptr<spdlog::logger> logger_;
};

} // namespace sfs
