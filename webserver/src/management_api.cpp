#include <nlohmann/json.hpp>

#include "lb/common/utils.h"
#include "lb/dns/webserver/management_api.h"

namespace lb::dns {

using nlohmann::json;

static constexpr std::string_view SERVER_INFO_PATH = "/api/v1/servers/localhost";
static constexpr std::string_view JSON_STAT_PATH = "/jsonstat";
static constexpr std::string_view DAEMON_TYPE = "dnslb";

static HttpResponse make_error(int status, std::string_view message) {
    return {.status = status, .content_type = "application/json", .body = json{{"error", std::string{message}}}.dump()};
}

static json counters_to_json(const CounterRegistry &registry) {
    json result = json::object();
    for (auto &[name, value] : registry.snapshot()) {
        result[name] = value;
    }
    return result;
}

ManagementApi::ManagementApi(const CounterRegistry &registry, ApiKey api_key, std::string version)
        : m_registry(registry)
        , m_api_key(std::move(api_key))
        , m_version(std::move(version)) {
}

HttpResponse ManagementApi::handle(const HttpRequest &request) const {
    dbglog(m_log, "{} {}{}{}", request.method, request.path, request.query.empty() ? "" : "?", request.query);

    auto key = request.headers.find(std::string{API_KEY_HEADER});
    if (key == request.headers.end() || !m_api_key.matches(key->second)) {
        dbglog(m_log, "Unauthorized request to {}", request.path);
        return make_error(401, "Unauthorized");
    }

    if (request.path != SERVER_INFO_PATH && request.path != JSON_STAT_PATH) {
        return make_error(404, "Not found");
    }
    if (request.method != "GET") {
        return make_error(405, "Method not allowed");
    }

    if (request.path == SERVER_INFO_PATH) {
        return server_info();
    }
    return json_stat(request.query);
}

HttpResponse ManagementApi::server_info() const {
    json body = {
            {"type", "Server"},
            {"id", "localhost"},
            {"url", std::string{SERVER_INFO_PATH}},
            {"daemon_type", std::string{DAEMON_TYPE}},
            {"version", m_version},
            {"statistics", counters_to_json(m_registry)},
    };
    return {.body = body.dump()};
}

HttpResponse ManagementApi::json_stat(std::string_view query) const {
    std::string_view command;
    for (std::string_view param : utils::split_by(query, '&')) {
        if (utils::starts_with(param, "command=")) {
            command = param.substr(std::string_view{"command="}.size());
        }
    }
    if (command != "stats") {
        return make_error(404, LB_FMT("Unknown command: {}", command));
    }
    return {.body = counters_to_json(m_registry).dump()};
}

} // namespace lb::dns
