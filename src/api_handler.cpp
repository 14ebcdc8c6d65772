#include "api_handler.hpp"
#include <nlohmann/json.hpp>
#include <chrono>
#include <ctime>
#include <iomanip>
#include <sstream>

using json = nlohmann::json;

namespace sfs {

std::string iso_timestamp_now() {
    auto now = std::chrono::system_clock::now();
    std::time_t t = std::chrono::system_clock::to_time_t(now);
    auto micros = std::chrono::duration_cast<std::chrono::microseconds>(
        now.time_since_epoch()).count() % 1000000;

    std::tm tm_local{};
    localtime_r(&t, &tm_local);

    std::ostringstream oss;
    oss << std::put_time(&tm_local, "%Y-%m-%dT%H:%M:%S")
        << '.' << std::setfill('0') << std::setw(6) << micros;
    return oss.str();
}

ApiHandler::ApiHandler(TestResultsStore& results, const LogBuffer& log_buffer,
                       std::shared_ptr<spdlog::logger> logger)
    : results_(results)
    , log_buffer_(log_buffer)
    , logger_(std::move(logger))
{
}

ApiResponse ApiHandler::handle(ApiRoute route, const Request& request) {
    logger_->debug("API {} ({} body bytes)", to_string(route), request.body.size());
    switch (route) {
        case ApiRoute::PostTestResults: return post_test_results(request);
        case ApiRoute::GetTestResults:  return get_test_results();
        case ApiRoute::GetLogs:         return get_logs();
    }
    return ApiResponse{404, json{{"success", false}, {"message", "Unknown endpoint"}}.dump()};
}

ApiResponse ApiHandler::post_test_results(const Request& request) {
    json payload;
    try {
        payload = json::parse(request.body);
    } catch (const json::parse_error& e) {
        logger_->warn("POST /api/test-results - invalid JSON: {}", e.what());
        return ApiResponse{400, json{{"success", false}, {"message", "Invalid JSON"}}.dump()};
    }

    if (!payload.is_object()) {
        logger_->warn("POST /api/test-results - payload is not a JSON object");
        return ApiResponse{400, json{{"success", false},
                                     {"message", "Expected a JSON object"}}.dump()};
    }

    size_t count = 0;
    auto it = payload.find("results");
    if (it != payload.end() && it->is_array()) {
        count = it->size();
    }

    // Stored as received so GET returns the exact bytes that were posted
    results_.store(request.body);
    logger_->info("POST /api/test-results - stored {} test results", count);

    json response;
    response["success"] = true;
    response["message"] = "Test results saved";
    response["count"] = count;
    return ApiResponse{200, response.dump()};
}

ApiResponse ApiHandler::get_test_results() const {
    return ApiResponse{200, results_.snapshot()};
}

ApiResponse ApiHandler::get_logs() const {
    json response;
    response["timestamp"] = iso_timestamp_now();
    response["logs"] = log_buffer_.snapshot();
    // Log lines may carry raw request bytes that are not valid UTF-8
    return ApiResponse{200, response.dump(-1, ' ', false, json::error_handler_t::replace)};
}

} // namespace sfs
