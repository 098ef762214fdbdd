#include <atomic>
#include <gtest/gtest.h>
#include <thread>
#include <vector>
#include "../../src/proxy/pool/proxy_pool.hpp"

using namespace Egress::Proxy::Pool;

TEST(ProxyPoolTest, SeedsUntestedRecords) {
    ProxyPool pool({"1.1.1.1:80", "socks5://2.2.2.2:1080", "http://3.3.3.3:3128"});

    EXPECT_EQ(pool.size(), 3u);
    auto stats = pool.snapshot_stats();
    EXPECT_EQ(stats.total_candidates, 3u);
    EXPECT_EQ(stats.untested_count, 3u);
    EXPECT_EQ(stats.working_count, 0u);
    EXPECT_EQ(stats.total_attempts, 0u);
}

TEST(ProxyPoolTest, AddCandidatesIsIdempotent) {
    ProxyPool pool;
    auto      a = ProxyEndpoint::parse("1.1.1.1:80");
    auto      b = ProxyEndpoint::parse("2.2.2.2:80");

    EXPECT_EQ(pool.add_candidates({a, b}), 2u);
    EXPECT_EQ(pool.add_candidates({a, b, a}), 0u);
    EXPECT_EQ(pool.add_candidates({ProxyEndpoint::parse("http://1.1.1.1:80")}), 0u);
    EXPECT_EQ(pool.size(), 2u);
}

TEST(ProxyPoolTest, DuplicateKeepsCounters) {
    ProxyPool pool;
    auto      a = ProxyEndpoint::parse("1.1.1.1:80");
    pool.add_candidates({a});
    pool.record_outcome(a, true);
    pool.add_candidates({a});

    auto record = pool.get(a);
    ASSERT_TRUE(record.has_value());
    EXPECT_EQ(record->attempt_count, 1u);
    EXPECT_EQ(record->classification, Classification::Working);
}

TEST(ProxyPoolTest, UnknownEndpointIsIgnored) {
    ProxyPool pool({"1.1.1.1:80"});
    auto      t = pool.record_outcome(ProxyEndpoint::parse("9.9.9.9:80"), true);
    EXPECT_FALSE(t.applied);
    EXPECT_EQ(pool.snapshot_stats().total_attempts, 0u);
}

TEST(ProxyPoolTest, SelectableExcludesFailedInInsertionOrder) {
    ProxyPool pool({"1.1.1.1:80", "2.2.2.2:80", "3.3.3.3:80"});
    auto      first  = ProxyEndpoint::parse("1.1.1.1:80");
    auto      second = ProxyEndpoint::parse("2.2.2.2:80");

    pool.record_outcome(second, true, OutcomeSource::Probe);
    pool.record_outcome(first, false, OutcomeSource::Probe);

    auto selectable = pool.selectable();
    ASSERT_EQ(selectable.size(), 2u);
    EXPECT_EQ(selectable[0].endpoint.host, "2.2.2.2");
    EXPECT_EQ(selectable[1].endpoint.host, "3.3.3.3");

    auto needs_probe = pool.needs_probe();
    ASSERT_EQ(needs_probe.size(), 2u);
    EXPECT_EQ(needs_probe[0].endpoint.host, "1.1.1.1");
    EXPECT_EQ(needs_probe[1].endpoint.host, "3.3.3.3");
}

TEST(ProxyPoolTest, SelectFollowsEvictionAndRecovery) {
    ProxyPool pool({"1.1.1.1:80", "2.2.2.2:80", "3.3.3.3:80"});
    EXPECT_EQ(pool.select(4)->endpoint.host, "2.2.2.2");

    pool.record_outcome(ProxyEndpoint::parse("2.2.2.2:80"), false, OutcomeSource::Probe);
    EXPECT_EQ(pool.select(0)->endpoint.host, "1.1.1.1");
    EXPECT_EQ(pool.select(1)->endpoint.host, "3.3.3.3");
    EXPECT_EQ(pool.select(2)->endpoint.host, "1.1.1.1");

    // Recovery restores insertion order.
    pool.record_outcome(ProxyEndpoint::parse("2.2.2.2:80"), true, OutcomeSource::Probe);
    EXPECT_EQ(pool.select(1)->endpoint.host, "2.2.2.2");
    EXPECT_EQ(pool.selectable().size(), 3u);

    for (const auto& host : {"1.1.1.1:80", "2.2.2.2:80", "3.3.3.3:80"})
        pool.record_outcome(ProxyEndpoint::parse(host), false, OutcomeSource::Probe);
    EXPECT_FALSE(pool.select(7).has_value());
    EXPECT_TRUE(pool.selectable().empty());
}

TEST(ProxyPoolTest, StatsSumRecordCounters) {
    ProxyPool pool({"1.1.1.1:80", "2.2.2.2:80"});
    auto      a = ProxyEndpoint::parse("1.1.1.1:80");
    auto      b = ProxyEndpoint::parse("2.2.2.2:80");

    pool.record_outcome(a, true, OutcomeSource::Probe);
    pool.record_outcome(a, true);
    pool.record_outcome(b, false, OutcomeSource::Probe);

    auto stats = pool.snapshot_stats();
    EXPECT_EQ(stats.working_count, 1u);
    EXPECT_EQ(stats.failed_count, 1u);
    EXPECT_EQ(stats.untested_count, 0u);
    EXPECT_EQ(stats.total_attempts, 3u);
    EXPECT_EQ(stats.successful_attempts, 2u);
    EXPECT_EQ(stats.failed_attempts, 1u);
    EXPECT_EQ(stats.working_count + stats.failed_count + stats.untested_count,
              stats.total_candidates);
}

TEST(ProxyPoolTest, ConcurrentOutcomesAreAllCounted) {
    ProxyPool pool({"1.1.1.1:80", "2.2.2.2:80"});
    auto      a = ProxyEndpoint::parse("1.1.1.1:80");
    auto      b = ProxyEndpoint::parse("2.2.2.2:80");

    std::vector<std::thread> threads;
    for (int i = 0; i < 8; ++i) {
        threads.emplace_back([&, i]() {
            for (int j = 0; j < 250; ++j)
                pool.record_outcome(i % 2 ? a : b, j % 2 == 0);
        });
    }
    for (auto& t : threads)
        t.join();

    auto stats = pool.snapshot_stats();
    EXPECT_EQ(stats.total_attempts, 2000u);
    EXPECT_EQ(stats.successful_attempts, 1000u);
    EXPECT_EQ(stats.working_count + stats.failed_count + stats.untested_count, 2u);

    auto ra = pool.get(a);
    ASSERT_TRUE(ra.has_value());
    EXPECT_EQ(ra->attempt_count, 1000u);
}

TEST(ProxyPoolTest, InvalidAddressThrows) {
    EXPECT_THROW(ProxyPool({"ftp://1.1.1.1:21"}), std::invalid_argument);
}
