#include "gtest/gtest.h"
#include "metron/engine.hh"
#include "metron/error.hh"
#include "metron/thread_guard.hh"
#include <thread>
#include <vector>

using namespace metron;
using namespace std::chrono;

namespace {

const clock_source::time_point start{seconds{1760860800}};

engine_config test_config() {
    engine_config c;
    c.meter = "%{name}";
    c.host = "test-host";
    return c;
}

struct EngineTest : ::testing::Test {
    std::shared_ptr<manual_clock> clock = std::make_shared<manual_clock>(start);

    std::vector<snapshot> tick(engine &e) {
        clock->advance(seconds{5});
        return e.flush();
    }
};

} // anon namespace

TEST_F(EngineTest, RejectsBadRates) {
    auto c = test_config();
    c.rates = {1, 10};
    EXPECT_THROW({ engine e(c, clock); }, config_error);
    c.rates = {};
    EXPECT_THROW({ engine e(c, clock); }, config_error);
    c.rates = {0};
    EXPECT_THROW({ engine e(c, clock); }, config_error);
}

TEST_F(EngineTest, RejectsBadIntervals) {
    auto c = test_config();
    c.flush_interval = seconds{7};
    EXPECT_THROW({ engine e(c, clock); }, config_error);
    c.flush_interval = seconds{0};
    EXPECT_THROW({ engine e(c, clock); }, config_error);
    c.flush_interval = seconds{-5};
    EXPECT_THROW({ engine e(c, clock); }, config_error);

    c = test_config();
    c.clear_interval = seconds{12};
    EXPECT_THROW({ engine e(c, clock); }, config_error);

    c = test_config();
    c.tick = seconds{0};
    EXPECT_THROW({ engine e(c, clock); }, config_error);

    c = test_config();
    c.ignore_older_than = seconds{-1};
    EXPECT_THROW({ engine e(c, clock); }, config_error);
}

TEST_F(EngineTest, AcceptsDefaults) {
    engine e(test_config(), clock);
    EXPECT_EQ(seconds{5}, e.config().tick);
    EXPECT_EQ(seconds{5}, e.config().flush_interval);
    EXPECT_EQ(seconds{-1}, e.config().clear_interval);
    EXPECT_EQ(seconds{0}, e.config().ignore_older_than);
    EXPECT_EQ((std::vector<unsigned>{1, 5, 15}), e.config().rates);
    EXPECT_TRUE(e.flush().empty());
}

TEST_F(EngineTest, RatesNormalized) {
    auto c = test_config();
    c.rates = {15, 1, 15};
    engine e(c, clock);
    EXPECT_EQ((std::vector<unsigned>{1, 15}), e.config().rates);
}

TEST_F(EngineTest, DefaultHostIsHostname) {
    auto c = test_config();
    c.host.clear();
    engine e(c, clock);
    EXPECT_EQ(hostname(), e.config().host);
    EXPECT_FALSE(e.config().host.empty());
}

TEST_F(EngineTest, FlushPeriodicity) {
    auto c = test_config();
    c.flush_interval = seconds{10};
    engine e(c, clock);
    e.mark("once", clock->now());
    EXPECT_TRUE(tick(e).empty());
    auto batch = tick(e);
    ASSERT_EQ(1u, batch.size());
    EXPECT_EQ("once", batch[0].name);
    EXPECT_EQ(1u, batch[0].count);
    EXPECT_TRUE(tick(e).empty());
    EXPECT_EQ(1u, tick(e).size());
}

TEST_F(EngineTest, ClearIndependentOfFlush) {
    auto c = test_config();
    c.clear_interval = seconds{15};
    engine e(c, clock);

    uint64_t last = 0;
    for (int i = 1; i <= 3; ++i) {
        e.mark("busy", clock->now());
        e.mark("busy", clock->now());
        auto batch = tick(e);
        ASSERT_EQ(1u, batch.size());
        EXPECT_GT(batch[0].count, last);
        last = batch[0].count;
    }
    EXPECT_EQ(6u, last);

    auto batch = tick(e);
    ASSERT_EQ(1u, batch.size());
    EXPECT_EQ(0u, batch[0].count);
    ASSERT_TRUE(batch[0].rate_1m);
    EXPECT_DOUBLE_EQ(0.0, *batch[0].rate_1m);
}

TEST_F(EngineTest, ClearWithoutFlush) {
    auto c = test_config();
    c.flush_interval = seconds{20};
    c.clear_interval = seconds{10};
    engine e(c, clock);
    e.mark("k", clock->now());
    EXPECT_TRUE(tick(e).empty());
    EXPECT_TRUE(tick(e).empty());
    EXPECT_EQ(0u, e.registry().find("k")->count());
    e.mark("k", clock->now());
    EXPECT_TRUE(tick(e).empty());
    auto batch = tick(e);
    ASSERT_EQ(1u, batch.size());
    // cleared at 10s, remarked once, snapshot at 20s precedes the next clear
    EXPECT_EQ(1u, batch[0].count);
    EXPECT_EQ(0u, e.registry().find("k")->count());
}

TEST_F(EngineTest, ClearDoesNotTouchOtherKeys) {
    auto c = test_config();
    c.clear_interval = seconds{15};
    engine e(c, clock);
    e.mark("early", clock->now());
    tick(e);
    e.mark("late", clock->now());
    tick(e);
    tick(e);
    // early has 15s since its last clear, late only 10s
    EXPECT_EQ(0u, e.registry().find("early")->count());
    EXPECT_EQ(1u, e.registry().find("late")->count());
    tick(e);
    EXPECT_EQ(0u, e.registry().find("late")->count());
}

TEST_F(EngineTest, IgnoreOlderThan) {
    auto c = test_config();
    c.ignore_older_than = seconds{10};
    engine e(c, clock);
    const auto now = clock->now();
    e.mark("stale", now - seconds{11});
    EXPECT_FALSE(e.registry().find("stale"));
    EXPECT_EQ(0u, e.registry().size());
    e.mark("fresh", now - seconds{9});
    ASSERT_TRUE(e.registry().find("fresh"));
    EXPECT_EQ(1u, e.registry().find("fresh")->count());
    e.mark("edge", now - seconds{10});
    ASSERT_TRUE(e.registry().find("edge"));

    // explicit now overrides the clock
    e.mark("fresh", now - seconds{20}, now - seconds{15});
    EXPECT_EQ(2u, e.registry().find("fresh")->count());
}

TEST_F(EngineTest, IgnoresVeryOldRecords) {
    auto c = test_config();
    c.ignore_older_than = seconds{10};
    engine e(c, clock);
    // 1700-01-01, near the bottom of a nanosecond time_point
    e.mark("old", clock_source::time_point(seconds{-8520336000}));
    e.mark("oldest", clock_source::time_point::min());
    EXPECT_EQ(0u, e.registry().size());
    // far future records are not old
    e.mark("future", clock_source::time_point::max());
    ASSERT_TRUE(e.registry().find("future"));
}

TEST_F(EngineTest, RejectsHugeIgnoreOlderThan) {
    auto c = test_config();
    c.ignore_older_than = hours{24 * 365 * 1000};
    EXPECT_THROW({ engine e(c, clock); }, config_error);
    c.ignore_older_than = hours{24 * 365 * 100};
    engine e(c, clock);
    e.mark("recent", clock->now() - hours{1});
    EXPECT_TRUE(e.registry().find("recent"));
}

TEST_F(EngineTest, NoGateByDefault) {
    engine e(test_config(), clock);
    e.mark("ancient", clock->now() - hours{24 * 365});
    ASSERT_TRUE(e.registry().find("ancient"));
    EXPECT_EQ(1u, e.registry().find("ancient")->count());
}

TEST_F(EngineTest, SnapshotFields) {
    auto c = test_config();
    c.rates = {1, 15};
    c.add_tag = {"metric", "web"};
    engine e(c, clock);
    for (int i = 0; i < 10; ++i)
        e.mark("http_200", clock->now());
    auto batch = tick(e);
    ASSERT_EQ(1u, batch.size());
    const auto &s = batch[0];
    EXPECT_EQ("http_200", s.name);
    EXPECT_EQ(10u, s.count);
    EXPECT_EQ("test-host", s.host);
    EXPECT_EQ(clock->now(), s.timestamp);
    EXPECT_EQ((std::vector<std::string>{"metric", "web"}), s.tags);
    ASSERT_TRUE(s.rate_1m);
    EXPECT_DOUBLE_EQ(120.0, *s.rate_1m);
    EXPECT_FALSE(s.rate_5m);
    ASSERT_TRUE(s.rate_15m);
    EXPECT_DOUBLE_EQ(120.0, *s.rate_15m);
}

TEST_F(EngineTest, RateDecaysBetweenFlushes) {
    engine e(test_config(), clock);
    for (int i = 0; i < 30; ++i)
        e.mark("burst", clock->now());
    double last = *tick(e).at(0).rate_1m;
    EXPECT_DOUBLE_EQ(360.0, last);
    for (int i = 0; i < 5; ++i) {
        const double r = *tick(e).at(0).rate_1m;
        EXPECT_LT(r, last);
        EXPECT_GT(r, 0.0);
        last = r;
    }
}

TEST_F(EngineTest, ConcurrentMarks) {
    engine e(test_config(), clock);
    const auto now = clock->now();
    {
        std::vector<thread_guard> threads;
        for (int t = 0; t < 10; ++t) {
            threads.emplace_back(std::thread([&] {
                for (int i = 0; i < 100; ++i)
                    e.mark("shared", now);
            }));
        }
    }
    auto batch = tick(e);
    ASSERT_EQ(1u, batch.size());
    EXPECT_EQ(1000u, batch[0].count);
    EXPECT_DOUBLE_EQ(1000.0 / 5 * 60, *batch[0].rate_1m);
    EXPECT_DOUBLE_EQ(1000.0 / 5 * 60, *batch[0].rate_5m);
    EXPECT_DOUBLE_EQ(1000.0 / 5 * 60, *batch[0].rate_15m);
}

TEST_F(EngineTest, ManyKeysPerCycle) {
    engine e(test_config(), clock);
    for (int i = 0; i < 200; ++i)
        e.mark("key" + std::to_string(i % 40), clock->now());
    auto batch = tick(e);
    EXPECT_EQ(40u, batch.size());
    for (const auto &s : batch)
        EXPECT_EQ(5u, s.count);
}
