#include <sys/socket.h>
#include <unistd.h>

#include <arpa/inet.h>
#include <netinet/in.h>

#include <gtest/gtest.h>
#include <nlohmann/json.hpp>

#include "lb/common/logger.h"
#include "lb/common/utils.h"
#include "lb/dns/webserver/web_server.h"

namespace lb::dns::test {

static constexpr auto API_KEY = "apisecret";

struct HttpReply {
    int status = 0;
    std::string body;
};

struct Socket {
    int fd = socket(AF_INET, SOCK_STREAM, 0);
    ~Socket() {
        if (fd >= 0) {
            close(fd);
        }
    }
};

// Minimal blocking HTTP/1.0 client
static std::optional<HttpReply> http_get(uint16_t port, const std::string &target, const std::string &key) {
    Socket sock;
    int fd = sock.fd;
    if (fd < 0) {
        return std::nullopt;
    }

    sockaddr_in addr{};
    addr.sin_family = AF_INET;
    addr.sin_port = htons(port);
    addr.sin_addr.s_addr = htonl(INADDR_LOOPBACK);
    if (0 != connect(fd, (sockaddr *) &addr, sizeof(addr))) {
        return std::nullopt;
    }

    std::string request = LB_FMT("GET {} HTTP/1.0\r\nHost: 127.0.0.1\r\n", target);
    if (!key.empty()) {
        request += LB_FMT("X-API-Key: {}\r\n", key);
    }
    request += "\r\n";
    if (send(fd, request.data(), request.size(), 0) != (ssize_t) request.size()) {
        return std::nullopt;
    }

    std::string raw;
    char buf[4096];
    ssize_t r;
    while ((r = recv(fd, buf, sizeof(buf), 0)) > 0) {
        raw.append(buf, r);
    }

    // HTTP/1.1 200 OK
    size_t status_pos = raw.find(' ');
    size_t body_pos = raw.find("\r\n\r\n");
    if (status_pos == std::string::npos || body_pos == std::string::npos) {
        return std::nullopt;
    }
    std::optional<int> status = utils::to_integer<int>(std::string_view{raw}.substr(status_pos + 1, 3));
    if (!status.has_value()) {
        return std::nullopt;
    }
    return HttpReply{.status = *status, .body = raw.substr(body_pos + 4)};
}

class WebServerTest : public ::testing::Test {
protected:
    CounterRegistry m_counters;
    std::unique_ptr<WebServer> m_server;

    void SetUp() override {
        Logger::set_log_level(LogLevel::LOG_LEVEL_TRACE);
        m_counters.increment("responses", 7);
        m_server = std::make_unique<WebServer>(m_counters, "test");
    }

    void TearDown() override {
        m_server->stop();
    }
};

TEST_F(WebServerTest, ServesCounters) {
    auto [ok, err] = m_server->start({.address = "127.0.0.1", .port = 0, .api_key = API_KEY});
    ASSERT_TRUE(ok) << err.value_or("");
    ASSERT_NE(m_server->port(), 0);

    std::optional<HttpReply> reply = http_get(m_server->port(), "/api/v1/servers/localhost", API_KEY);
    ASSERT_TRUE(reply.has_value());
    ASSERT_EQ(reply->status, 200);
    nlohmann::json body = nlohmann::json::parse(reply->body);
    ASSERT_EQ(body["statistics"]["responses"].get<uint64_t>(), 7u);

    reply = http_get(m_server->port(), "/jsonstat?command=stats", API_KEY);
    ASSERT_TRUE(reply.has_value());
    ASSERT_EQ(reply->status, 200);
    ASSERT_EQ(nlohmann::json::parse(reply->body)["responses"].get<uint64_t>(), 7u);
}

TEST_F(WebServerTest, RejectsWrongKey) {
    auto [ok, err] = m_server->start({.address = "127.0.0.1", .port = 0, .api_key = API_KEY});
    ASSERT_TRUE(ok) << err.value_or("");

    std::optional<HttpReply> reply = http_get(m_server->port(), "/api/v1/servers/localhost", "nope");
    ASSERT_TRUE(reply.has_value());
    ASSERT_EQ(reply->status, 401);

    reply = http_get(m_server->port(), "/api/v1/servers/localhost", "");
    ASSERT_TRUE(reply.has_value());
    ASSERT_EQ(reply->status, 401);
}

TEST_F(WebServerTest, RestartAfterStop) {
    auto [ok, err] = m_server->start({.address = "127.0.0.1", .port = 0, .api_key = API_KEY});
    ASSERT_TRUE(ok) << err.value_or("");
    m_server->stop();
    ASSERT_EQ(m_server->port(), 0);

    std::tie(ok, err) = m_server->start({.address = "127.0.0.1", .port = 0, .api_key = API_KEY});
    ASSERT_TRUE(ok) << err.value_or("");
    std::optional<HttpReply> reply = http_get(m_server->port(), "/jsonstat?command=stats", API_KEY);
    ASSERT_TRUE(reply.has_value());
    ASSERT_EQ(reply->status, 200);
}

TEST_F(WebServerTest, StopReleasesPort) {
    auto [ok, err] = m_server->start({.address = "127.0.0.1", .port = 0, .api_key = API_KEY});
    ASSERT_TRUE(ok) << err.value_or("");
    uint16_t port = m_server->port();
    ASSERT_TRUE(http_get(port, "/jsonstat?command=stats", API_KEY).has_value());
    m_server->stop();

    std::tie(ok, err) = m_server->start({.address = "127.0.0.1", .port = port, .api_key = API_KEY});
    ASSERT_TRUE(ok) << err.value_or("");
    ASSERT_EQ(m_server->port(), port);
    std::optional<HttpReply> reply = http_get(port, "/jsonstat?command=stats", API_KEY);
    ASSERT_TRUE(reply.has_value());
    ASSERT_EQ(reply->status, 200);
}

TEST_F(WebServerTest, InvalidApiKey) {
    auto [ok, err] = m_server->start({.address = "127.0.0.1", .port = 0, .api_key = "$scrypt$ln=10$broken"});
    ASSERT_FALSE(ok);
    ASSERT_TRUE(err.has_value());
}

} // namespace lb::dns::test
