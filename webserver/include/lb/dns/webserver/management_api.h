#pragma once

#include <string>
#include <string_view>

#include "lb/common/defs.h"
#include "lb/common/logger.h"
#include "lb/dns/metrics/counter_registry.h"
#include "lb/dns/webserver/api_key.h"

namespace lb::dns {

struct HttpRequest {
    std::string method;
    std::string path;
    std::string query;                        // Query string without `?`
    HashMap<std::string, std::string> headers; // Header names are lower case
};

struct HttpResponse {
    int status = 200;
    std::string content_type = "application/json";
    std::string body;
};

/**
 * Read-only management API exposing the counters.
 *
 * - `GET /api/v1/servers/localhost`: server description with all the counters in `statistics`
 * - `GET /jsonstat?command=stats`: all the counters as a flat object
 *
 * Every request must carry the `X-API-Key` header.
 */
class ManagementApi {
public:
    static constexpr std::string_view API_KEY_HEADER = "x-api-key";

    ManagementApi(const CounterRegistry &registry, ApiKey api_key, std::string version);

    HttpResponse handle(const HttpRequest &request) const;

private:
    Logger m_log{"management_api"};
    const CounterRegistry &m_registry;
    ApiKey m_api_key;
    std::string m_version;

    HttpResponse server_info() const;
    HttpResponse json_stat(std::string_view query) const;
};

} // namespace lb::dns
