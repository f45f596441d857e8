#include <sys/socket.h>

#include <netinet/in.h>

#include <event2/buffer.h>
#include <event2/keyvalq_struct.h>

#include "lb/common/utils.h"
#include "lb/dns/webserver/web_server.h"

namespace lb::dns {

static const char *method_str(evhttp_cmd_type cmd) {
    // clang-format off
    switch (cmd) {
    case EVHTTP_REQ_GET: return "GET";
    case EVHTTP_REQ_POST: return "POST";
    case EVHTTP_REQ_HEAD: return "HEAD";
    case EVHTTP_REQ_PUT: return "PUT";
    case EVHTTP_REQ_DELETE: return "DELETE";
    case EVHTTP_REQ_OPTIONS: return "OPTIONS";
    case EVHTTP_REQ_TRACE: return "TRACE";
    case EVHTTP_REQ_CONNECT: return "CONNECT";
    case EVHTTP_REQ_PATCH: return "PATCH";
    }
    // clang-format on
    return "UNKNOWN";
}

static const char *reason_str(int status) {
    // clang-format off
    switch (status) {
    case HTTP_OK: return "OK";
    case 401: return "Unauthorized";
    case HTTP_NOTFOUND: return "Not Found";
    case HTTP_BADMETHOD: return "Method Not Allowed";
    default: return "Error";
    }
    // clang-format on
}

static HttpRequest parse_request(evhttp_request *request) {
    HttpRequest result;
    result.method = method_str(evhttp_request_get_command(request));

    if (const evhttp_uri *uri = evhttp_request_get_evhttp_uri(request)) {
        const char *path = evhttp_uri_get_path(uri);
        const char *query = evhttp_uri_get_query(uri);
        result.path = (path != nullptr && *path != '\0') ? path : "/";
        result.query = (query != nullptr) ? query : "";
    }

    evkeyvalq *headers = evhttp_request_get_input_headers(request);
    for (evkeyval *header = headers->tqh_first; header != nullptr; header = header->next.tqe_next) {
        result.headers[utils::to_lower(header->key)] = header->value;
    }
    return result;
}

WebServer::WebServer(const CounterRegistry &registry, std::string version)
        : m_registry(registry)
        , m_version(std::move(version)) {
}

WebServer::~WebServer() {
    stop();
}

WebServer::StartResult WebServer::start(const WebServerSettings &settings) {
    infolog(m_log, "Starting web server on {}:{}...", settings.address, settings.port);

    auto [api_key, err] = ApiKey::parse(settings.api_key);
    if (!api_key.has_value()) {
        errlog(m_log, "Invalid API key: {}", err.value());
        return {false, LB_FMT("Invalid API key: {}", err.value())};
    }
    if (settings.api_key.empty()) {
        warnlog(m_log, "API key is not set, all the requests will be rejected");
    }
    m_api = std::make_unique<ManagementApi>(m_registry, std::move(*api_key), m_version);

    m_loop = EventLoop::create(false);
    m_http.reset(evhttp_new(m_loop->c_base()));
    evhttp_set_allowed_methods(m_http.get(),
            EVHTTP_REQ_GET | EVHTTP_REQ_POST | EVHTTP_REQ_HEAD | EVHTTP_REQ_PUT | EVHTTP_REQ_DELETE
                    | EVHTTP_REQ_PATCH);
    evhttp_set_gencb(m_http.get(), on_request, this);

    evhttp_bound_socket *handle = evhttp_bind_socket_with_handle(m_http.get(), settings.address.c_str(), settings.port);
    if (handle == nullptr) {
        std::string error = LB_FMT("Failed to bind {}:{}", settings.address, settings.port);
        errlog(m_log, "{}", error);
        m_http.reset();
        m_loop.reset();
        m_api.reset();
        return {false, std::move(error)};
    }

    sockaddr_storage addr{};
    socklen_t addr_len = sizeof(addr);
    if (0 == getsockname(evhttp_bound_socket_get_fd(handle), (sockaddr *) &addr, &addr_len)) {
        m_port = (addr.ss_family == AF_INET6) ? ntohs(((sockaddr_in6 *) &addr)->sin6_port)
                                               : ntohs(((sockaddr_in *) &addr)->sin_port);
    } else {
        m_port = settings.port;
    }

    m_loop->start();
    infolog(m_log, "Web server is listening on {}:{}", settings.address, m_port);
    return {true, std::nullopt};
}

void WebServer::stop() {
    if (m_loop == nullptr) {
        return;
    }
    infolog(m_log, "Stopping web server...");
    // The listener and its pending connections belong to the loop thread
    m_loop->submit([this] {
        m_http.reset();
    });
    m_loop->stop();
    m_loop->join();
    m_loop.reset();
    m_api.reset();
    m_port = 0;
    infolog(m_log, "Web server stopped");
}

void WebServer::on_request(evhttp_request *request, void *arg) {
    auto *self = (WebServer *) arg;

    HttpResponse response = self->m_api->handle(parse_request(request));

    evkeyvalq *headers = evhttp_request_get_output_headers(request);
    evhttp_add_header(headers, "Content-Type", response.content_type.c_str());
    evhttp_add_header(headers, "Cache-Control", "no-cache");

    UniquePtr<evbuffer, &evbuffer_free> body{evbuffer_new()};
    evbuffer_add(body.get(), response.body.data(), response.body.size());
    evhttp_send_reply(request, response.status, reason_str(response.status), body.get());
}

} // namespace lb::dns
