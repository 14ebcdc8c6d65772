#pragma once

#include "http_request.hpp"
#include "log_buffer.hpp"
#include "results_store.hpp"
#include "router.hpp"
#include <spdlog/spdlog.h>
#include <memory>
#include <string>

namespace sfs {

struct ApiResponse {
    int status = 200;
    std::string body;   // JSON
};

// JSON API mounted under /api/
class ApiHandler {
public:
    ApiHandler(TestResultsStore& results, const LogBuffer& log_buffer,
               std::shared_ptr<spdlog::logger> logger);

    ApiResponse handle(ApiRoute route, const Request& request);

private:
    ApiResponse post_test_results(const Request& request);
    ApiResponse get_test_results() const;
    ApiResponse get_logs() const;

    TestResultsStore& results_;
    const LogBuffer& log_buffer_;
    std::shared_ptr<spdlog::logger> logger_;
};

// Local time as ISO-8601 with microseconds, e.g. 2024-05-01T12:00:00.123456
std::string iso_timestamp_now();

} // namespace sfs
