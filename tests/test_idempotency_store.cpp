#include <gtest/gtest.h>

#include <atomic>
#include <chrono>
#include <mutex>
#include <string>
#include <thread>
#include <vector>

#include "core/idempotency/IdempotencyStore.hpp"
#include "core/util/Hash.hpp"

using namespace tgw;
using nlohmann::json;

namespace {

// Steady clock the test advances by hand.
struct ManualClock {
    std::chrono::steady_clock::time_point now{};

    IdempotencyStore::Clock fn()
    {
        return [this] { return now; };
    }
    void advance(std::chrono::seconds s) { now += s; }
};

} // namespace

TEST(IdempotencyStore, StoresAndReturnsCopies)
{
    ManualClock clock;
    IdempotencyStore store(std::chrono::seconds(60), clock.fn());

    json value = {{"id", 700}};
    store.store("k", value);
    value["id"] = 1;

    auto got = store.get("k");
    ASSERT_TRUE(got.has_value());
    EXPECT_EQ((*got)["id"], 700);
    EXPECT_FALSE(store.get("other").has_value());
}

TEST(IdempotencyStore, EntriesExpireAtTtl)
{
    ManualClock clock;
    IdempotencyStore store(std::chrono::seconds(60), clock.fn());
    store.store("k", {{"id", 1}});

    clock.advance(std::chrono::seconds(59));
    EXPECT_TRUE(store.get("k").has_value());

    clock.advance(std::chrono::seconds(1));
    EXPECT_FALSE(store.get("k").has_value());
    EXPECT_EQ(store.size(), 0u);
}

TEST(IdempotencyStore, StorePurgesOtherExpiredEntries)
{
    ManualClock clock;
    IdempotencyStore store(std::chrono::seconds(10), clock.fn());
    store.store("old", 1);
    clock.advance(std::chrono::seconds(11));
    store.store("new", 2);

    EXPECT_EQ(store.size(), 1u);
    auto got = store.get("new");
    ASSERT_TRUE(got.has_value());
    EXPECT_EQ(*got, 2);
}

TEST(IdempotencyStore, RestoreRefreshesExpiry)
{
    ManualClock clock;
    IdempotencyStore store(std::chrono::seconds(10), clock.fn());
    store.store("k", 1);
    clock.advance(std::chrono::seconds(8));
    store.store("k", 2);
    clock.advance(std::chrono::seconds(8));

    auto got = store.get("k");
    ASSERT_TRUE(got.has_value());
    EXPECT_EQ(*got, 2);
}

TEST(IdempotencyStore, ConcurrentAccessWhileOlderEntriesExpire)
{
    // Shared with the writer threads, so guarded.
    std::mutex clockMu;
    std::chrono::steady_clock::time_point now{};
    IdempotencyStore store(std::chrono::seconds(10), [&] {
        std::lock_guard<std::mutex> lock(clockMu);
        return now;
    });

    constexpr int kStale = 50;
    for (int i = 0; i < kStale; ++i) store.store("stale-" + std::to_string(i), i);
    {
        std::lock_guard<std::mutex> lock(clockMu);
        now += std::chrono::seconds(5);
    }

    constexpr int kThreads = 8;
    constexpr int kPerThread = 200;
    std::atomic<int> misses{0};
    std::vector<std::thread> workers;
    for (int t = 0; t < kThreads; ++t) {
        workers.emplace_back([&, t] {
            for (int i = 0; i < kPerThread; ++i) {
                const std::string key = "t" + std::to_string(t) + "-" + std::to_string(i);
                store.store(key, json{{"thread", t}, {"i", i}});
                auto got = store.get(key);
                if (!got || (*got)["i"] != i) ++misses;
                if (t == 0 && i == kPerThread / 2) {
                    // Stale entries (stored at 0) expire; fresh ones (stored at 5) survive.
                    std::lock_guard<std::mutex> lock(clockMu);
                    now += std::chrono::seconds(6);
                }
            }
        });
    }
    for (auto& w : workers) w.join();

    EXPECT_EQ(misses.load(), 0);
    for (int i = 0; i < kStale; ++i) {
        EXPECT_FALSE(store.get("stale-" + std::to_string(i)).has_value());
    }
    for (int t = 0; t < kThreads; ++t) {
        for (int i = 0; i < kPerThread; ++i) {
            auto got = store.get("t" + std::to_string(t) + "-" + std::to_string(i));
            ASSERT_TRUE(got.has_value()) << t << "/" << i;
            EXPECT_EQ((*got)["thread"], t);
        }
    }
    EXPECT_EQ(store.size(), static_cast<size_t>(kThreads * kPerThread));
}

TEST(IdempotencyStore, DefaultTtlIsOneDay)
{
    IdempotencyStore store;
    EXPECT_EQ(store.ttl(), std::chrono::seconds(86400));
}

TEST(IdempotencyKey, BindsTokenToEntityAndSubject)
{
    const std::string a = make_idempotency_key("tok", "5", "Stand up mirror");
    const std::string b = make_idempotency_key("tok", "5", "Stand up mirror");
    const std::string c = make_idempotency_key("tok", "5", "Tear down mirror");
    const std::string d = make_idempotency_key("tok", "6", "Stand up mirror");

    EXPECT_EQ(a, b);
    EXPECT_NE(a, c);
    EXPECT_NE(a, d);
    EXPECT_EQ(a, "tok:" + sha256_hex("5:Stand up mirror"));
    EXPECT_EQ(a.size(), 4u + 64u);
}

TEST(Hash, Sha256KnownVector)
{
    EXPECT_EQ(sha256_hex("abc"),
              "ba7816bf8f01cfea414140de5dae2223b00361a396177a9cb410ff61f20015ad");
    EXPECT_EQ(sha256_hex(""),
              "e3b0c44298fc1c149afbf4c8996fb92427ae41e4649b934ca495991b7852b855");
}

TEST(Hash, ConstantTimeEquals)
{
    EXPECT_TRUE(constant_time_equals("secret", "secret"));
    EXPECT_FALSE(constant_time_equals("secret", "secreT"));
    EXPECT_FALSE(constant_time_equals("secret", "secret2"));
}
