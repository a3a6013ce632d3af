#include "gtest/gtest.h"
#include "metron/registry.hh"
#include "metron/error.hh"
#include "metron/thread_guard.hh"
#include <atomic>
#include <set>
#include <string>
#include <thread>
#include <vector>

using namespace metron;
using namespace std::chrono;

TEST(Registry, SameMeterForKey) {
    meter_registry reg({1, 5, 15}, seconds{5});
    auto a = reg.get_or_create("a");
    for (int i = 0; i < 9; ++i) {
        auto again = reg.get_or_create("a");
        EXPECT_EQ(a.get(), again.get());
        again->mark();
    }
    a->mark();
    EXPECT_EQ(10u, a->count());
    EXPECT_EQ(1u, reg.size());
    EXPECT_EQ("a", a->key());
}

TEST(Registry, FindDoesNotCreate) {
    meter_registry reg({1}, seconds{5});
    EXPECT_FALSE(reg.find("missing"));
    EXPECT_EQ(0u, reg.size());
    auto m = reg.get_or_create("present");
    EXPECT_EQ(m.get(), reg.find("present").get());
}

TEST(Registry, ConcurrentFirstAccess) {
    meter_registry reg({1, 5, 15}, seconds{5}, 4);
    static const int nthreads = 32;
    std::vector<meter_registry::meter_ptr> seen(nthreads);
    std::atomic<bool> go{false};
    {
        std::vector<thread_guard> threads;
        for (int i = 0; i < nthreads; ++i) {
            threads.emplace_back(std::thread([&, i] {
                while (!go.load())
                    std::this_thread::yield();
                seen[i] = reg.get_or_create("contended");
                for (int j = 0; j < 100; ++j)
                    reg.get_or_create("contended")->mark();
            }));
        }
        go = true;
    }
    EXPECT_EQ(1u, reg.size());
    for (const auto &m : seen)
        EXPECT_EQ(seen[0].get(), m.get());
    EXPECT_EQ(uint64_t(nthreads) * 100, seen[0]->count());
}

TEST(Registry, FailedCreateLeavesNoEntry) {
    meter_registry reg({1, 10}, seconds{5});
    EXPECT_THROW(reg.get_or_create("bad"), config_error);
    EXPECT_THROW(reg.get_or_create("bad"), config_error);
    EXPECT_EQ(0u, reg.size());
    EXPECT_FALSE(reg.find("bad"));
    int visited = 0;
    reg.for_each([&](meter &) { ++visited; });
    EXPECT_EQ(0, visited);
}

TEST(Registry, ForEachVisitsEveryKey) {
    meter_registry reg({1}, seconds{5}, 3);
    std::set<std::string> keys;
    for (int i = 0; i < 50; ++i) {
        const auto k = "key" + std::to_string(i);
        keys.insert(k);
        reg.get_or_create(k)->mark(i);
    }
    std::set<std::string> visited;
    uint64_t total = 0;
    reg.for_each([&](meter &m) {
        EXPECT_TRUE(visited.insert(m.key()).second);
        total += m.count();
    });
    EXPECT_EQ(keys, visited);
    EXPECT_EQ(uint64_t(49 * 50 / 2), total);
}

TEST(Registry, MarkDuringForEach) {
    meter_registry reg({1}, seconds{5}, 1);
    reg.get_or_create("existing");
    // no shard lock is held while the callback runs
    reg.for_each([&](meter &m) {
        m.mark();
        reg.get_or_create("created-during-scan")->mark();
    });
    EXPECT_EQ(2u, reg.size());
    EXPECT_EQ(1u, reg.find("existing")->count());
    EXPECT_EQ(1u, reg.find("created-during-scan")->count());
}

TEST(Registry, ConcurrentScanAndMark) {
    meter_registry reg({1, 5}, seconds{5});
    std::atomic<bool> done{false};
    std::atomic<uint64_t> marked{0};
    {
        std::vector<thread_guard> producers;
        for (int t = 0; t < 4; ++t) {
            producers.emplace_back(std::thread([&, t] {
                for (int i = 0; i < 2000; ++i) {
                    reg.get_or_create("k" + std::to_string((i + t) % 64))->mark();
                    ++marked;
                }
            }));
        }
        thread_guard scanner(std::thread([&] {
            cycle_policy p;
            while (!done.load()) {
                reg.for_each([&](meter &m) { m.cycle(p); });
            }
        }));
        for (auto &p : producers)
            p.join();
        done = true;
    }
    uint64_t total = 0;
    reg.for_each([&](meter &m) { total += m.count(); });
    EXPECT_EQ(marked.load(), total);
    EXPECT_EQ(64u, reg.size());
}
