#include <gtest/gtest.h>
#include <nlohmann/json.hpp>

#include "lb/common/logger.h"
#include "lb/dns/webserver/management_api.h"

namespace lb::dns::test {

using nlohmann::json;

static constexpr auto API_KEY = "apisecret";

class ManagementApiTest : public ::testing::Test {
protected:
    CounterRegistry m_counters;
    std::unique_ptr<ManagementApi> m_api;

    void SetUp() override {
        Logger::set_log_level(LogLevel::LOG_LEVEL_TRACE);
        auto [key, err] = ApiKey::parse(API_KEY);
        ASSERT_TRUE(key.has_value()) << err.value_or("");
        m_api = std::make_unique<ManagementApi>(m_counters, std::move(*key), "1.2.3");

        m_counters.increment("responses", 4);
        m_counters.increment("rule-nxdomain", 2);
        m_counters.increment("frontend-udp-nxdomain");
        m_counters.counter("cache-hits");
    }

    static HttpRequest make_request(std::string path, std::string query = {}, std::string key = API_KEY) {
        HttpRequest request{.method = "GET", .path = std::move(path), .query = std::move(query)};
        if (!key.empty()) {
            request.headers["x-api-key"] = std::move(key);
        }
        return request;
    }
};

TEST_F(ManagementApiTest, ServerInfo) {
    HttpResponse response = m_api->handle(make_request("/api/v1/servers/localhost"));
    ASSERT_EQ(response.status, 200);
    ASSERT_EQ(response.content_type, "application/json");

    json body = json::parse(response.body);
    ASSERT_EQ(body["type"], "Server");
    ASSERT_EQ(body["id"], "localhost");
    ASSERT_EQ(body["daemon_type"], "dnslb");
    ASSERT_EQ(body["version"], "1.2.3");

    const json &stats = body["statistics"];
    ASSERT_EQ(stats["responses"].get<uint64_t>(), 4u);
    ASSERT_EQ(stats["rule-nxdomain"].get<uint64_t>(), 2u);
    ASSERT_EQ(stats["frontend-udp-nxdomain"].get<uint64_t>(), 1u);
    ASSERT_EQ(stats["cache-hits"].get<uint64_t>(), 0u);
}

TEST_F(ManagementApiTest, StatisticsFollowCounters) {
    m_counters.increment("rule-nxdomain");
    HttpResponse response = m_api->handle(make_request("/api/v1/servers/localhost"));
    ASSERT_EQ(json::parse(response.body)["statistics"]["rule-nxdomain"].get<uint64_t>(), 3u);
}

TEST_F(ManagementApiTest, JsonStat) {
    HttpResponse response = m_api->handle(make_request("/jsonstat", "command=stats"));
    ASSERT_EQ(response.status, 200);
    json body = json::parse(response.body);
    ASSERT_TRUE(body.is_object());
    ASSERT_EQ(body.size(), m_counters.size());
    ASSERT_EQ(body["responses"].get<uint64_t>(), 4u);

    ASSERT_EQ(m_api->handle(make_request("/jsonstat", "command=dynblocklist")).status, 404);
    ASSERT_EQ(m_api->handle(make_request("/jsonstat")).status, 404);
}

TEST_F(ManagementApiTest, Unauthorized) {
    ASSERT_EQ(m_api->handle(make_request("/api/v1/servers/localhost", {}, "")).status, 401);
    ASSERT_EQ(m_api->handle(make_request("/api/v1/servers/localhost", {}, "wrong")).status, 401);
    ASSERT_EQ(m_api->handle(make_request("/nonexistent", {}, "")).status, 401);
}

TEST_F(ManagementApiTest, UnknownPathAndMethod) {
    ASSERT_EQ(m_api->handle(make_request("/api/v1/servers")).status, 404);

    HttpRequest post = make_request("/api/v1/servers/localhost");
    post.method = "POST";
    ASSERT_EQ(m_api->handle(post).status, 405);
}

} // namespace lb::dns::test
