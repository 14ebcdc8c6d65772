#include "router.hpp"
#include "path_guard.hpp"
#include <system_error>

namespace fs = std::filesystem;

namespace sfs {

namespace {

bool is_regular(const fs::path& p) {
    std::error_code ec;
    return fs::is_regular_file(p, ec);
}

ResolvedTarget not_found(const fs::path& sandbox_root) {
    fs::path fallback = sandbox_root / kNotFoundPage;
    if (is_regular(fallback)) {
        return StaticFile{fallback, 404};
    }
    return Rejected{404, "File not found\n"};
}

} // namespace

const char* to_string(ApiRoute route) {
    switch (route) {
        case ApiRoute::PostTestResults: return "POST /api/test-results";
        case ApiRoute::GetTestResults:  return "GET /api/test-results";
        case ApiRoute::GetLogs:         return "GET /api/logs";
    }
    return "unknown";
}

std::optional<ApiRoute> match_api_route(Method method, const std::string& path) {
    struct Entry {
        Method method;
        const char* path;
        ApiRoute route;
    };
    static const Entry kRoutes[] = {
        {Method::Post, "/api/test-results", ApiRoute::PostTestResults},
        {Method::Get,  "/api/test-results", ApiRoute::GetTestResults},
        {Method::Get,  "/api/logs",         ApiRoute::GetLogs},
    };
    for (const auto& entry : kRoutes) {
        if (entry.method == method && path == entry.path) {
            return entry.route;
        }
    }
    return std::nullopt;
}

ResolvedTarget route(const Request& request, const fs::path& sandbox_root) {
    const std::string& path = request.path;

    if (path.rfind(kApiPrefix, 0) == 0) {
        if (auto api = match_api_route(request.method, path)) {
            return ApiEndpoint{*api};
        }
        return Rejected{404, "API endpoint not found\n"};
    }

    std::string file_path = path == "/" ? std::string("/") + kIndexFile : path;

    // "/page.html/" is served as "/page.html" when that file exists
    if (file_path.size() > 1 && file_path.back() == '/') {
        std::string stripped = file_path;
        while (stripped.size() > 1 && stripped.back() == '/') stripped.pop_back();
        auto candidate = resolve_safe_path(stripped, sandbox_root);
        if (candidate && is_regular(*candidate)) {
            return StaticFile{*candidate, 200};
        }
    }

    auto resolved = resolve_safe_path(file_path, sandbox_root);
    if (!resolved) {
        return Rejected{403, "Access denied\n"};
    }

    std::error_code ec;
    auto status = fs::status(*resolved, ec);
    if (!fs::exists(status)) {
        return not_found(sandbox_root);
    }
    if (!fs::is_regular_file(status)) {
        return Rejected{403, "Not a regular file\n"};
    }
    return StaticFile{*resolved, 200};
}

} // namespace sfs
