#pragma once

#include <cstdint>
#include <memory>
#include <string>
#include <utility>

#include <event2/http.h>

#include "lb/common/defs.h"
#include "lb/common/event_loop.h"
#include "lb/common/logger.h"
#include "lb/dns/metrics/counter_registry.h"
#include "lb/dns/webserver/management_api.h"

namespace lb::dns {

struct WebServerSettings {
    /** Address to listen on */
    std::string address = "127.0.0.1";
    /** Port to listen on. 0 picks a free port, see `WebServer::port()`. */
    uint16_t port = 8083;
    /** API key, in plain text or hashed (see `ApiKey`). Empty key rejects every request. */
    std::string api_key;
};

/**
 * HTTP server of the management API. Runs on its own event loop thread.
 */
class WebServer {
public:
    using StartResult = std::pair<bool, ErrString>;

    /**
     * @param registry counters to expose, must outlive the server
     * @param version version reported by the API
     */
    WebServer(const CounterRegistry &registry, std::string version);
    ~WebServer();

    WebServer(const WebServer &) = delete;
    WebServer &operator=(const WebServer &) = delete;
    WebServer(WebServer &&) = delete;
    WebServer &operator=(WebServer &&) = delete;

    /**
     * Start listening
     * @return {true, std::nullopt} or {false, error_description}
     */
    [[nodiscard]] StartResult start(const WebServerSettings &settings);

    /**
     * Stop listening and join the event loop thread
     */
    void stop();

    /**
     * @return the port the server is bound to, 0 if not started
     */
    [[nodiscard]] uint16_t port() const {
        return m_port;
    }

private:
    Logger m_log{"web_server"};
    const CounterRegistry &m_registry;
    std::string m_version;
    std::unique_ptr<ManagementApi> m_api;
    EventLoopPtr m_loop;
    UniquePtr<evhttp, &evhttp_free> m_http;
    uint16_t m_port = 0;

    static void on_request(evhttp_request *request, void *arg);
};

} // namespace lb::dns
