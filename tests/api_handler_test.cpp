#include <gtest/gtest.h>

#include <nlohmann/json.hpp>

#include "api_handler.hpp"
#include "test_util.hpp"

using namespace sfs;
using json = nlohmann::json;

class ApiHandlerTest : public ::testing::Test {
protected:
    ApiHandlerTest()
        : server_logs(std::make_shared<LogBuffer>(100))
        , api(results, *server_logs, test::test_logger(std::make_shared<LogBuffer>(100))) {}

    static Request post(std::string body) {
        Request req;
        req.method = Method::Post;
        req.method_name = "POST";
        req.path = "/api/test-results";
        req.content_length = body.size();
        req.body = std::move(body);
        return req;
    }

    static Request get(std::string path) {
        Request req;
        req.method = Method::Get;
        req.method_name = "GET";
        req.path = std::move(path);
        return req;
    }

    TestResultsStore results;
    std::shared_ptr<LogBuffer> server_logs;
    ApiHandler api;
};

TEST_F(ApiHandlerTest, GetBeforeAnyPostReturnsEmptyObject) {
    auto response = api.handle(ApiRoute::GetTestResults, get("/api/test-results"));
    EXPECT_EQ(response.status, 200);
    EXPECT_EQ(response.body, "{}");
}

TEST_F(ApiHandlerTest, PostThenGetReturnsSamePayload) {
    json payload = {
        {"timestamp", "2024-05-01T10:00:00"},
        {"total_requests", 2},
        {"results", json::array({
            {{"request_id", 0}, {"path", "/"}, {"status_code", 200}, {"success", true}},
            {{"request_id", 1}, {"path", "/nope"}, {"status_code", 404}, {"success", false}},
        })},
    };

    auto posted = api.handle(ApiRoute::PostTestResults, post(payload.dump()));
    ASSERT_EQ(posted.status, 200);
    auto ack = json::parse(posted.body);
    EXPECT_TRUE(ack["success"].get<bool>());
    EXPECT_EQ(ack["count"].get<int>(), 2);
    EXPECT_TRUE(ack["message"].is_string());

    auto fetched = api.handle(ApiRoute::GetTestResults, get("/api/test-results"));
    EXPECT_EQ(fetched.status, 200);
    EXPECT_EQ(json::parse(fetched.body).dump(), payload.dump());
}

TEST_F(ApiHandlerTest, GetReturnsPostedBytesVerbatim) {
    const std::string body =
        R"({"timestamp":"2024-05-01T10:00:00","total_requests":2,)"
        R"("results":[{"status":200,"response_time":0.10}]})";
    ASSERT_EQ(api.handle(ApiRoute::PostTestResults, post(body)).status, 200);

    auto fetched = api.handle(ApiRoute::GetTestResults, get("/api/test-results"));
    EXPECT_EQ(fetched.body, body);
}

TEST_F(ApiHandlerTest, WhitespaceInPayloadIsPreserved) {
    const std::string body = "{\n  \"zeta\": 1,\n  \"alpha\": [ 1.50, 2 ]\n}";
    ASSERT_EQ(api.handle(ApiRoute::PostTestResults, post(body)).status, 200);
    EXPECT_EQ(api.handle(ApiRoute::GetTestResults, get("/api/test-results")).body, body);
}

TEST_F(ApiHandlerTest, LaterPostReplacesEarlierOne) {
    api.handle(ApiRoute::PostTestResults, post(R"({"results":[1,2,3]})"));
    api.handle(ApiRoute::PostTestResults, post(R"({"results":[4]})"));

    auto fetched = api.handle(ApiRoute::GetTestResults, get("/api/test-results"));
    EXPECT_EQ(fetched.body, R"({"results":[4]})");
}

TEST_F(ApiHandlerTest, PayloadWithoutResultsCountsZero) {
    auto posted = api.handle(ApiRoute::PostTestResults, post(R"({"timestamp":"now"})"));
    ASSERT_EQ(posted.status, 200);
    EXPECT_EQ(json::parse(posted.body)["count"].get<int>(), 0);
}

TEST_F(ApiHandlerTest, InvalidJsonIsBadRequestAndKeepsPreviousPayload) {
    api.handle(ApiRoute::PostTestResults, post(R"({"results":[]})"));

    auto response = api.handle(ApiRoute::PostTestResults, post("{not json"));
    EXPECT_EQ(response.status, 400);
    EXPECT_FALSE(json::parse(response.body)["success"].get<bool>());

    auto fetched = api.handle(ApiRoute::GetTestResults, get("/api/test-results"));
    EXPECT_EQ(fetched.body, R"({"results":[]})");
}

TEST_F(ApiHandlerTest, EmptyBodyIsBadRequest) {
    auto response = api.handle(ApiRoute::PostTestResults, post(""));
    EXPECT_EQ(response.status, 400);
    EXPECT_EQ(results.snapshot(), "{}");
}

TEST_F(ApiHandlerTest, NonObjectPayloadIsBadRequest) {
    auto response = api.handle(ApiRoute::PostTestResults, post("[1,2,3]"));
    EXPECT_EQ(response.status, 400);
    EXPECT_EQ(results.snapshot(), "{}");
}

TEST_F(ApiHandlerTest, LogsEndpointReturnsBufferedLines) {
    auto writer = test::plain_writer(server_logs);
    writer->info("first line");
    writer->info("second line");

    auto response = api.handle(ApiRoute::GetLogs, get("/api/logs"));
    EXPECT_EQ(response.status, 200);
    auto body = json::parse(response.body);
    ASSERT_TRUE(body["timestamp"].is_string());
    EXPECT_FALSE(body["timestamp"].get<std::string>().empty());
    EXPECT_EQ(body["logs"].get<std::vector<std::string>>(), (std::vector<std::string>{"first line", "second line"}));
}

TEST_F(ApiHandlerTest, LogsWithInvalidUtf8StillEncode) {
    test::plain_writer(server_logs)->info("{}", std::string("bad \xff\xfe bytes"));
    auto response = api.handle(ApiRoute::GetLogs, get("/api/logs"));
    EXPECT_EQ(response.status, 200);
    EXPECT_EQ(json::parse(response.body)["logs"].size(), 1U);
}

TEST(IsoTimestamp, HasDateTimeAndMicroseconds) {
    std::string ts = iso_timestamp_now();
    ASSERT_EQ(ts.size(), 26U) << ts;
    EXPECT_EQ(ts[4], '-');
    EXPECT_EQ(ts[10], 'T');
    EXPECT_EQ(ts[19], '.');
}
