#include <gtest/gtest.h>

#include "lb/common/logger.h"
#include "lb/dns/proxy/frontend_accounting.h"

#include "../../common/test/test_utils.h"

namespace lb::dns::test {

class FrontendAccountingTest : public ::testing::Test {
protected:
    CounterRegistry m_counters;
    FrontendAccounting m_accounting{m_counters};

    void SetUp() override {
        Logger::set_log_level(LogLevel::LOG_LEVEL_TRACE);
    }

    void record(std::string_view frontend, ldns_pkt_rcode rcode, Provenance provenance) {
        Query query = make_query("accounting.example.");
        Response response{create_rcode_response(query.packet(), rcode), provenance};
        m_accounting.record_completion(frontend, response);
    }
};

TEST_F(FrontendAccountingTest, CountsEveryCompletion) {
    record("udp", LDNS_RCODE_NOERROR, Provenance::BACKEND);
    record("tcp", LDNS_RCODE_NOERROR, Provenance::CACHE_HIT);
    record("dot", LDNS_RCODE_NXDOMAIN, Provenance::RULE_SYNTHESIZED);
    record("doh", LDNS_RCODE_FORMERR, Provenance::SELF_GENERATED);

    ASSERT_EQ(m_counters.get("responses"), 4u);
    ASSERT_EQ(m_counters.get("frontend-udp-noerror"), 1u);
    ASSERT_EQ(m_counters.get("frontend-tcp-noerror"), 1u);
    ASSERT_EQ(m_counters.get("frontend-noerror"), 2u);
    ASSERT_EQ(m_counters.get("frontend-doh-formerr"), 1u);
    // Synthesized responses are counted by the rule engine
    ASSERT_EQ(m_counters.get("frontend-dot-nxdomain"), 0u);
}

TEST_F(FrontendAccountingTest, ServfailFromBackendOnly) {
    record("udp", LDNS_RCODE_SERVFAIL, Provenance::BACKEND);
    ASSERT_EQ(m_counters.get("servfail-responses"), 1u);
    ASSERT_EQ(m_counters.get("frontend-udp-servfail"), 1u);

    record("udp", LDNS_RCODE_SERVFAIL, Provenance::CACHE_HIT);
    record("udp", LDNS_RCODE_SERVFAIL, Provenance::RULE_SYNTHESIZED);
    record("udp", LDNS_RCODE_SERVFAIL, Provenance::SELF_GENERATED);
    ASSERT_EQ(m_counters.get("servfail-responses"), 1u);
    ASSERT_EQ(m_counters.get("frontend-udp-servfail"), 3u);
    ASSERT_EQ(m_counters.get("responses"), 4u);
}

TEST_F(FrontendAccountingTest, AggregateCountersStartAtZero) {
    CounterRegistry::Snapshot snapshot = m_counters.snapshot();
    for (const char *name : {"responses", "servfail-responses", "frontend-noerror", "frontend-formerr",
                 "frontend-servfail", "frontend-nxdomain", "frontend-notimpl"}) {
        ASSERT_EQ(snapshot.count(name), 1u) << name;
        ASSERT_EQ(snapshot[name], 0u) << name;
    }
    ASSERT_EQ(snapshot.count("frontend-refused"), 0u);
}

TEST_F(FrontendAccountingTest, RefusedIsNotCountedPerFrontend) {
    record("udp", LDNS_RCODE_REFUSED, Provenance::BACKEND);
    record("tcp", LDNS_RCODE_REFUSED, Provenance::CACHE_HIT);

    ASSERT_EQ(m_counters.get("responses"), 2u);
    ASSERT_EQ(m_counters.snapshot().count("frontend-udp-refused"), 0u);
    ASSERT_EQ(m_counters.snapshot().count("frontend-refused"), 0u);
}

} // namespace lb::dns::test
