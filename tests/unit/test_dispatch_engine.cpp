#include <gtest/gtest.h>
#include "../../src/core/logger/logger.hpp"
#include "../../src/dispatch/dispatch_engine.hpp"
#include "scripted_client.hpp"

using namespace Egress;
using namespace Egress::Dispatch;
using namespace Egress::Testing;

namespace {

const std::string PROXY_A = "http://10.0.0.1:8080";
const std::string PROXY_B = "http://10.0.0.2:8080";
const std::string PROXY_C = "http://10.0.0.3:8080";
const std::string TARGET  = "https://example.com/page";

class DispatchEngineTest : public ::testing::Test {
protected:
    void SetUp() override {
        Core::Logger::set_level(Core::LOG_NONE);
        script = std::make_shared<Script>();
    }

    void TearDown() override {
        Core::Logger::set_level(Core::LOG_ALL);
    }

    std::unique_ptr<DispatchEngine> make_engine(int max_attempts = 3) {
        DispatchSettings settings;
        settings.max_attempts    = max_attempts;
        settings.attempt_timeout = std::chrono::milliseconds(5000);
        settings.backoff_min     = std::chrono::milliseconds(0);
        settings.backoff_max     = std::chrono::milliseconds(0);
        settings.seed            = 1;
        return std::make_unique<DispatchEngine>(
            pool, selector, headers, scripted_factory(script), settings);
    }

    DispatchResult fetch(DispatchEngine& engine, FetchOptions options = {}) {
        return run_sync(engine.fetch(TARGET, options));
    }

    // Runs one fetch and cancels its token from the same io_context after `delay`.
    DispatchResult fetch_cancelled_after(DispatchEngine& engine, std::chrono::milliseconds delay) {
        boost::asio::io_context ioc;
        FetchOptions            options;
        options.cancel = std::make_shared<CancellationToken>();

        auto future =
            boost::asio::co_spawn(ioc, engine.fetch(TARGET, options), boost::asio::use_future);
        boost::asio::steady_timer timer(ioc, delay);
        timer.async_wait(
            [token = options.cancel](const boost::system::error_code&) { token->cancel(); });
        ioc.run();
        return future.get();
    }

    std::shared_ptr<Script> script;
    ProxyPool               pool;
    Selector                selector{pool};
    HeaderGenerator         headers{{}, 99};
};

}  // namespace

TEST_F(DispatchEngineTest, EmptyPoolGoesDirect) {
    script->set("", Behavior::Ok);
    auto engine = make_engine();

    auto result = fetch(*engine);
    EXPECT_TRUE(result.success);
    EXPECT_TRUE(result.direct);
    EXPECT_TRUE(result.degraded);
    EXPECT_EQ(result.attempts, 1);
    EXPECT_EQ(result.status_code, 200);
    EXPECT_EQ(result.body, "ok via direct");

    auto calls = script->recorded();
    ASSERT_EQ(calls.size(), 1u);
    EXPECT_EQ(calls[0].proxy, "");
    EXPECT_EQ(calls[0].url, TARGET);
    EXPECT_FALSE(calls[0].user_agent.empty());
}

TEST_F(DispatchEngineTest, WorkingProxyServesEveryRequest) {
    pool.add_candidates({ProxyEndpoint::parse(PROXY_A),
                         ProxyEndpoint::parse(PROXY_B),
                         ProxyEndpoint::parse(PROXY_C)});
    pool.record_outcome(ProxyEndpoint::parse(PROXY_A), false, OutcomeSource::Probe);
    pool.record_outcome(ProxyEndpoint::parse(PROXY_B), true, OutcomeSource::Probe);
    pool.record_outcome(ProxyEndpoint::parse(PROXY_C), false, OutcomeSource::Probe);
    script->set(PROXY_B, Behavior::Ok);
    auto engine = make_engine();

    auto stats = pool.snapshot_stats();
    EXPECT_EQ(stats.working_count, 1u);
    EXPECT_EQ(stats.failed_count, 2u);

    for (int i = 0; i < 10; ++i) {
        auto result = fetch(*engine);
        EXPECT_TRUE(result.success);
        EXPECT_EQ(result.proxy, PROXY_B);
        EXPECT_EQ(result.attempts, 1);
        EXPECT_FALSE(result.degraded);
    }

    EXPECT_EQ(script->count(PROXY_B), 10u);
    EXPECT_EQ(script->count(PROXY_A), 0u);
    EXPECT_EQ(script->count(PROXY_C), 0u);
    EXPECT_EQ(pool.get(ProxyEndpoint::parse(PROXY_B))->attempt_count, 11u);
}

TEST_F(DispatchEngineTest, RotatesToNextProxyAfterFailure) {
    pool.add_candidates({ProxyEndpoint::parse(PROXY_A), ProxyEndpoint::parse(PROXY_B)});
    script->set(PROXY_A, Behavior::Refused);
    script->set(PROXY_B, Behavior::Ok);
    auto engine = make_engine();

    auto result = fetch(*engine);
    EXPECT_TRUE(result.success);
    EXPECT_EQ(result.attempts, 2);
    EXPECT_EQ(result.proxy, PROXY_B);

    auto a = pool.get(ProxyEndpoint::parse(PROXY_A));
    auto b = pool.get(ProxyEndpoint::parse(PROXY_B));
    EXPECT_EQ(a->attempt_count, 1u);
    EXPECT_EQ(a->success_count, 0u);
    EXPECT_EQ(b->classification, Classification::Working);
}

TEST_F(DispatchEngineTest, ExhaustionReportsLastCause) {
    pool.add_candidates({ProxyEndpoint::parse(PROXY_A), ProxyEndpoint::parse(PROXY_B)});
    script->set(PROXY_A, Behavior::ServiceUnavailable);
    script->set(PROXY_B, Behavior::ServiceUnavailable);
    script->set("", Behavior::Refused);
    auto engine = make_engine();

    auto result = fetch(*engine);
    EXPECT_FALSE(result.success);
    EXPECT_EQ(result.error_kind, ErrorKind::AllAttemptsExhausted);
    EXPECT_EQ(result.last_cause, ErrorKind::AttemptConnectionError);
    EXPECT_EQ(result.attempts, 4);
    EXPECT_TRUE(result.direct);
    EXPECT_FALSE(result.degraded);
    EXPECT_EQ(result.error, "Connection refused");

    auto calls = script->recorded();
    ASSERT_EQ(calls.size(), 4u);
    EXPECT_EQ(calls[0].proxy, PROXY_A);
    EXPECT_EQ(calls[1].proxy, PROXY_B);
    EXPECT_EQ(calls[2].proxy, PROXY_A);
    EXPECT_EQ(calls[3].proxy, "");

    // The direct attempt is not a pool outcome.
    EXPECT_EQ(pool.snapshot_stats().total_attempts, 3u);
}

TEST_F(DispatchEngineTest, NonSuccessStatusIsAFailure) {
    script->set("", Behavior::ServiceUnavailable);
    auto engine = make_engine();

    auto result = fetch(*engine);
    EXPECT_FALSE(result.success);
    EXPECT_EQ(result.error_kind, ErrorKind::AllAttemptsExhausted);
    EXPECT_EQ(result.last_cause, ErrorKind::AttemptNonSuccessStatus);
    EXPECT_EQ(result.status_code, 503);
    EXPECT_EQ(result.body, "busy");
    EXPECT_TRUE(result.degraded);
}

TEST_F(DispatchEngineTest, RepeatedFailuresEvictProxy) {
    pool.add_candidates({ProxyEndpoint::parse(PROXY_A)});
    script->set(PROXY_A, Behavior::Refused);
    script->set("", Behavior::Ok);
    auto engine = make_engine();

    auto first = fetch(*engine);
    EXPECT_TRUE(first.success);
    EXPECT_TRUE(first.direct);
    EXPECT_FALSE(first.degraded);
    EXPECT_EQ(pool.get(ProxyEndpoint::parse(PROXY_A))->classification, Classification::Untested);

    auto second = fetch(*engine);
    EXPECT_TRUE(second.success);
    EXPECT_TRUE(second.degraded);
    EXPECT_EQ(second.attempts, 3);

    auto record = pool.get(ProxyEndpoint::parse(PROXY_A));
    EXPECT_EQ(record->classification, Classification::Failed);
    EXPECT_EQ(record->attempt_count, 5u);
    EXPECT_EQ(script->count(PROXY_A), 5u);
}

TEST_F(DispatchEngineTest, ZeroAttemptsGoesStraightToDirect) {
    pool.add_candidates({ProxyEndpoint::parse(PROXY_A)});
    script->set("", Behavior::Ok);
    auto engine = make_engine();

    FetchOptions options;
    options.max_attempts = 0;
    auto result          = fetch(*engine, options);
    EXPECT_TRUE(result.success);
    EXPECT_TRUE(result.direct);
    EXPECT_FALSE(result.degraded);
    EXPECT_EQ(script->count(PROXY_A), 0u);
}

TEST_F(DispatchEngineTest, BudgetCancelsWithoutPenalizingProxy) {
    pool.add_candidates({ProxyEndpoint::parse(PROXY_A)});
    script->set(PROXY_A, Behavior::Hang);
    script->set("", Behavior::Ok);
    auto engine = make_engine();

    FetchOptions options;
    options.budget = std::chrono::milliseconds(100);

    auto started = std::chrono::steady_clock::now();
    auto result  = fetch(*engine, options);
    auto elapsed = std::chrono::steady_clock::now() - started;

    EXPECT_FALSE(result.success);
    EXPECT_EQ(result.error_kind, ErrorKind::Cancelled);
    EXPECT_EQ(result.last_cause, ErrorKind::AttemptTimeout);
    EXPECT_LT(elapsed, std::chrono::seconds(3));
    EXPECT_EQ(script->count(""), 0u);
    EXPECT_EQ(pool.get(ProxyEndpoint::parse(PROXY_A))->attempt_count, 0u);
}

TEST_F(DispatchEngineTest, CancelledTokenStopsBeforeFirstAttempt) {
    pool.add_candidates({ProxyEndpoint::parse(PROXY_A)});
    script->set(PROXY_A, Behavior::Ok);
    auto engine = make_engine();

    FetchOptions options;
    options.cancel = std::make_shared<CancellationToken>();
    options.cancel->cancel();

    auto result = fetch(*engine, options);
    EXPECT_FALSE(result.success);
    EXPECT_EQ(result.error_kind, ErrorKind::Cancelled);
    EXPECT_EQ(result.attempts, 0);
    EXPECT_TRUE(script->recorded().empty());
}

TEST_F(DispatchEngineTest, CancelAbortsAttemptInFlight) {
    pool.add_candidates({ProxyEndpoint::parse(PROXY_A)});
    script->set(PROXY_A, Behavior::Hang);
    script->set("", Behavior::Ok);
    auto engine = make_engine();

    auto started = std::chrono::steady_clock::now();
    auto result  = fetch_cancelled_after(*engine, std::chrono::milliseconds(50));
    auto elapsed = std::chrono::steady_clock::now() - started;

    EXPECT_FALSE(result.success);
    EXPECT_EQ(result.error_kind, ErrorKind::Cancelled);
    EXPECT_EQ(result.last_cause, ErrorKind::Cancelled);
    EXPECT_EQ(result.attempts, 1);
    EXPECT_LT(elapsed, std::chrono::milliseconds(1000));
    EXPECT_EQ(script->count(PROXY_A), 1u);
    EXPECT_EQ(script->count(""), 0u);
    EXPECT_EQ(pool.get(ProxyEndpoint::parse(PROXY_A))->attempt_count, 0u);
}

TEST_F(DispatchEngineTest, CancelWakesBackoff) {
    pool.add_candidates({ProxyEndpoint::parse(PROXY_A)});
    script->set(PROXY_A, Behavior::Refused);
    script->set("", Behavior::Ok);

    DispatchSettings settings;
    settings.max_attempts    = 3;
    settings.attempt_timeout = std::chrono::milliseconds(5000);
    settings.backoff_min     = std::chrono::milliseconds(5000);
    settings.backoff_max     = std::chrono::milliseconds(5000);
    settings.seed            = 1;
    DispatchEngine engine(pool, selector, headers, scripted_factory(script), settings);

    auto started = std::chrono::steady_clock::now();
    auto result  = fetch_cancelled_after(engine, std::chrono::milliseconds(50));
    auto elapsed = std::chrono::steady_clock::now() - started;

    EXPECT_EQ(result.error_kind, ErrorKind::Cancelled);
    EXPECT_EQ(result.last_cause, ErrorKind::AttemptConnectionError);
    EXPECT_EQ(result.attempts, 1);
    EXPECT_LT(elapsed, std::chrono::milliseconds(1000));
    EXPECT_EQ(script->count(""), 0u);
    EXPECT_EQ(pool.get(ProxyEndpoint::parse(PROXY_A))->attempt_count, 1u);
}

TEST_F(DispatchEngineTest, CancelDuringDirectAttempt) {
    script->set("", Behavior::Hang);
    auto engine = make_engine();

    auto result = fetch_cancelled_after(*engine, std::chrono::milliseconds(50));
    EXPECT_EQ(result.error_kind, ErrorKind::Cancelled);
    EXPECT_TRUE(result.direct);
    EXPECT_EQ(result.attempts, 1);
}

TEST(CancellationTokenTest, HooksRunOnceAndUnregister) {
    CancellationToken token;
    int               kept    = 0;
    int               dropped = 0;

    auto registration = token.on_cancel([&kept]() { ++kept; });
    {
        auto scoped = token.on_cancel([&dropped]() { ++dropped; });
    }

    token.cancel();
    token.cancel();
    EXPECT_TRUE(token.cancelled());
    EXPECT_EQ(kept, 1);
    EXPECT_EQ(dropped, 0);

    int late = 0;
    auto after = token.on_cancel([&late]() { ++late; });
    EXPECT_EQ(late, 1);
}

TEST_F(DispatchEngineTest, Counters) {
    pool.add_candidates({ProxyEndpoint::parse(PROXY_A)});
    script->set(PROXY_A, Behavior::Refused);
    script->set("", Behavior::Ok);
    auto engine = make_engine(2);

    fetch(*engine);
    fetch(*engine);

    auto counters = engine->counters();
    EXPECT_EQ(counters.requests, 2u);
    EXPECT_EQ(counters.attempts, 6u);
    EXPECT_EQ(counters.successful, 2u);
    EXPECT_EQ(counters.failed, 4u);
    EXPECT_EQ(counters.direct_attempts, 2u);
}

TEST(ErrorKindTest, Names) {
    EXPECT_STREQ(to_string(ErrorKind::AllAttemptsExhausted), "all_attempts_exhausted");
    EXPECT_STREQ(to_string(ErrorKind::Cancelled), "cancelled");
    EXPECT_STREQ(to_string(ErrorKind::AttemptTimeout), "attempt_timeout");
}
