#pragma once

#include "http_request.hpp"
#include <filesystem>
#include <optional>
#include <string>
#include <variant>

namespace sfs {

// Every API endpoint the server knows; matched on exact (method, path)
enum class ApiRoute {
    PostTestResults,   // POST /api/test-results
    GetTestResults,    // GET  /api/test-results
    GetLogs,           // GET  /api/logs
};

const char* to_string(ApiRoute route);

struct StaticFile {
    std::filesystem::path path;
    int status = 200;   // 404 when serving the fallback page
};

struct ApiEndpoint {
    ApiRoute route;
};

struct Rejected {
    int status;
    std::string body;
};

using ResolvedTarget = std::variant<StaticFile, ApiEndpoint, Rejected>;

constexpr const char* kApiPrefix = "/api/";
constexpr const char* kIndexFile = "index.html";
constexpr const char* kNotFoundPage = "404.html";

std::optional<ApiRoute> match_api_route(Method method, const std::string& path);

// Decide what to serve for a parsed request. sandbox_root must be canonical.
ResolvedTarget route(const Request& request, const std::filesystem::path& sandbox_root);

} // namespace sfs
