#include <atomic>
#include <cassert>
#include <chrono>
#include <csignal>
#include <thread>

#include "lb/common/logger.h"
#include "lb/dns/proxy/dns_balancer.h"
#include "lb/dns/webserver/web_server.h"

using namespace lb::dns;
using lb::Logger;
using lb::LogLevel;

static_assert(std::atomic_bool::is_always_lock_free, "Atomic bools are not always lock-free");
static std::atomic_bool keep_running{true};

static void sigint_handler(int signal) {
    assert(signal == SIGINT);
    keep_running = false;
}

// Answers everything with an empty NOERROR response
class LoopbackBackend : public Backend {
public:
    lb::dns::ldns_pkt_ptr exchange(std::string_view, const ldns_pkt *request) override {
        return create_rcode_response(request, LDNS_RCODE_NOERROR);
    }
};

int main() {
    Logger::set_log_level(LogLevel::LOG_LEVEL_TRACE);
    Logger log{"balancer_standalone"};

    DnsBalancerSettings settings = DnsBalancerSettings::get_default();
    settings.rules = {
            {.name = "nxdomain", .domains = {"evil.com"}, .action = SynthesizeRcode{LDNS_RCODE_NXDOMAIN}},
            {.name = "refused", .domains = {"evil.org"}, .action = SynthesizeRcode{LDNS_RCODE_REFUSED}},
    };

    LoopbackBackend backend;
    CounterRegistry counters;
    DnsBalancer balancer{counters};
    auto [ret, err] = balancer.init(settings, &backend);
    if (!ret) {
        return 1;
    }

    WebServer web_server(counters, DnsBalancer::version());
    std::tie(ret, err) = web_server.start({.address = "127.0.0.1", .port = 8083, .api_key = "apisecret"});
    if (!ret) {
        balancer.deinit();
        return 1;
    }

    std::signal(SIGINT, sigint_handler);
#ifdef SIGPIPE
    std::signal(SIGPIPE, SIG_IGN);
#endif

    // Feed a query every second so that the counters move
    const char *names[] = {"example.com.", "www.evil.com.", "evil.org."};
    size_t i = 0;
    while (keep_running) {
        ldns_pkt_ptr request{ldns_pkt_query_new(
                ldns_dname_new_frm_str(names[i++ % std::size(names)]), LDNS_RR_TYPE_A, LDNS_RR_CLASS_IN, LDNS_RD)};
        ldns_pkt_set_random_id(request.get());
        lb::Uint8Vector wire = encode_packet(request.get());
        balancer.handle_message({wire.data(), wire.size()}, {.frontend = "udp", .proto = TransportProtocol::UDP});
        infolog(log, "Served {} responses", counters.get("responses"));
        std::this_thread::sleep_for(std::chrono::seconds(1));
    }

    web_server.stop();
    balancer.deinit();
    return 0;
}
