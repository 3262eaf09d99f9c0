#include <chrono>
#include <mutex>
#include <set>
#include <string>
#include <thread>
#include <vector>

#include <gtest/gtest.h>

#include "zid/codec/integer.hpp"
#include "zid/core/errors.hpp"
#include "zid/core/layout.hpp"
#include "zid/gen/generator.hpp"
#include "zid/id/zid.hpp"
#include "zid/time/instant.hpp"

namespace {
// Replays a fixed list of readings, then keeps returning the last one plus a step per call.
struct ScriptedClock {
    std::vector<zid::time::Instant> readings;
    std::size_t next{0};
    std::size_t calls{0};
};

static zid::time::Instant scripted_now(void* ctx) noexcept {
    auto* c = static_cast<ScriptedClock*>(ctx);
    ++c->calls;
    if (c->next < c->readings.size()) {
        return c->readings[c->next++];
    }
    const auto extra = static_cast<long>(c->next++ - c->readings.size() + 1);
    return c->readings.back() + std::chrono::microseconds{extra};
}

static zid::time::Instant utc(int y, unsigned mo, unsigned d, int h, int mi, int s, long us) {
    const std::chrono::sys_days days{std::chrono::year{y} / std::chrono::month{mo} / std::chrono::day{d}};
    return zid::time::Instant{days} + std::chrono::hours{h} + std::chrono::minutes{mi} + std::chrono::seconds{s} +
           std::chrono::microseconds{us};
}
} // namespace

TEST(GenGenerator, EmbedsTheClockReading) {
    const zid::time::Instant t = utc(2024, 2, 29, 12, 34, 56, 789012);
    ScriptedClock clock{{t}};
    zid::gen::Generator gen(zid::gen::ClockSource{&scripted_now, &clock});

    zid::id::Zid z{};
    ASSERT_EQ(gen.generate(&z).code, zid::core::StatusCode::Ok);
    EXPECT_EQ(z.instant(), t);
    ASSERT_TRUE(gen.previous_instant().has_value());
    EXPECT_EQ(*gen.previous_instant(), t);
    EXPECT_LT(z.random_tail(), zid::core::kValuesPerMicro);
}

TEST(GenGenerator, RepeatedClockReadingIsSkipped) {
    const zid::time::Instant t = utc(2000, 1, 1, 0, 0, 0, 0);
    ScriptedClock clock{{t, t, t, t + std::chrono::microseconds{1}, t + std::chrono::microseconds{1},
                         t + std::chrono::microseconds{5}}};
    zid::gen::Generator gen(zid::gen::ClockSource{&scripted_now, &clock});

    zid::id::Zid a{};
    zid::id::Zid b{};
    zid::id::Zid c{};
    ASSERT_EQ(gen.generate(&a).code, zid::core::StatusCode::Ok);
    ASSERT_EQ(gen.generate(&b).code, zid::core::StatusCode::Ok);
    ASSERT_EQ(gen.generate(&c).code, zid::core::StatusCode::Ok);

    EXPECT_EQ(a.instant(), t);
    EXPECT_EQ(b.instant(), t + std::chrono::microseconds{1});
    EXPECT_EQ(c.instant(), t + std::chrono::microseconds{5});
    EXPECT_LT(a, b);
    EXPECT_LT(b, c);
    EXPECT_EQ(clock.calls, 6u);
}

TEST(GenGenerator, GenerateAtLeavesLastInstantAlone) {
    const zid::time::Instant t = utc(2000, 1, 1, 0, 0, 0, 0);
    ScriptedClock clock{{t}};
    zid::gen::Generator gen(zid::gen::ClockSource{&scripted_now, &clock});
    EXPECT_FALSE(gen.previous_instant().has_value());

    zid::id::Zid a{};
    zid::id::Zid b{};
    ASSERT_EQ(gen.generate_at(t, &a).code, zid::core::StatusCode::Ok);
    ASSERT_EQ(gen.generate_at(t, &b).code, zid::core::StatusCode::Ok);
    EXPECT_EQ(a.instant(), t);
    EXPECT_EQ(b.instant(), t);
    EXPECT_FALSE(gen.previous_instant().has_value());
    EXPECT_EQ(clock.calls, 0u);
}

TEST(GenGenerator, GenerateAtRangeEnds) {
    zid::gen::Generator gen;
    zid::id::Zid z{};

    ASSERT_EQ(gen.generate_at(zid::time::kMinInstant, &z).code, zid::core::StatusCode::Ok);
    EXPECT_EQ(z.instant(), zid::time::kMinInstant);

    ASSERT_EQ(gen.generate_at(zid::time::kMaxInstant, &z).code, zid::core::StatusCode::Ok);
    EXPECT_EQ(z.instant(), zid::time::kMaxInstant);
    EXPECT_LE(z, zid::id::zid_from_bytes(zid::codec::max_bytes()));

    const zid::core::Status s = gen.generate_at(zid::time::kMaxInstant + std::chrono::microseconds{1}, &z);
    EXPECT_EQ(s.domain, zid::core::StatusDomain::Time);
    EXPECT_EQ(s.code, zid::core::StatusCode::OutOfRange);

    EXPECT_EQ(gen.generate_at(zid::time::kMinInstant, nullptr).code, zid::core::StatusCode::Invalid);
    EXPECT_EQ(gen.generate(nullptr).code, zid::core::StatusCode::Invalid);
}

TEST(GenGenerator, NullClockFallsBackToSystemClock) {
    zid::gen::Generator gen(zid::gen::ClockSource{});
    const zid::time::Instant before = zid::time::now_utc();
    zid::id::Zid z{};
    ASSERT_EQ(gen.generate(&z).code, zid::core::StatusCode::Ok);
    EXPECT_GE(z.instant(), before);
}

TEST(GenGenerator, TightLoopYieldsStrictlyIncreasingInstants) {
    zid::gen::Generator gen;
    constexpr int kCount = 2000;

    zid::id::Zid prev{};
    ASSERT_EQ(gen.generate(&prev).code, zid::core::StatusCode::Ok);
    for (int i = 1; i < kCount; ++i) {
        zid::id::Zid z{};
        ASSERT_EQ(gen.generate(&z).code, zid::core::StatusCode::Ok);
        ASSERT_NE(z.instant(), prev.instant());
        prev = z;
    }
}

TEST(GenGenerator, LaterCallsSortAfterEarlierOnes) {
    zid::gen::Generator gen;
    zid::id::Zid prev{};
    ASSERT_EQ(gen.generate(&prev).code, zid::core::StatusCode::Ok);
    for (int i = 0; i < 500; ++i) {
        zid::id::Zid z{};
        ASSERT_EQ(gen.generate(&z).code, zid::core::StatusCode::Ok);
        ASSERT_LT(prev, z) << prev << " vs " << z;
        prev = z;
    }
}

TEST(GenGenerator, ConcurrentCallersNeverCollide) {
    zid::gen::Generator gen;
    constexpr int kThreads = 4;
    constexpr int kPerThread = 500;

    std::mutex mu;
    std::set<std::string> texts;
    std::vector<std::thread> workers;
    for (int t = 0; t < kThreads; ++t) {
        workers.emplace_back([&] {
            for (int i = 0; i < kPerThread; ++i) {
                zid::id::Zid z{};
                if (!zid::core::is_ok(gen.generate(&z))) {
                    continue;
                }
                std::lock_guard<std::mutex> lock(mu);
                texts.emplace(z.text());
            }
        });
    }
    for (auto& w : workers) {
        w.join();
    }

    EXPECT_EQ(texts.size(), static_cast<size_t>(kThreads * kPerThread));
}

// The generator reads the clock under its own lock, so the scripted clock needs none.
TEST(GenGenerator, ConcurrentCallersOnRepeatingClockGetDistinctInstants) {
    const zid::time::Instant t = utc(2024, 2, 29, 12, 0, 0, 0);
    ScriptedClock clock{{t, t, t, t}};
    zid::gen::Generator gen(zid::gen::ClockSource{&scripted_now, &clock});

    constexpr int kThreads = 4;
    constexpr int kPerThread = 100;
    std::mutex mu;
    std::set<zid::time::Instant> instants;
    std::vector<std::thread> workers;
    for (int w = 0; w < kThreads; ++w) {
        workers.emplace_back([&] {
            for (int i = 0; i < kPerThread; ++i) {
                zid::id::Zid z{};
                if (!zid::core::is_ok(gen.generate(&z))) {
                    continue;
                }
                std::lock_guard<std::mutex> lock(mu);
                instants.insert(z.instant());
            }
        });
    }
    for (auto& w : workers) {
        w.join();
    }

    EXPECT_EQ(instants.size(), static_cast<size_t>(kThreads * kPerThread));
}

TEST(GenGenerator, ProcessWideHelpers) {
    zid::id::Zid a{};
    zid::id::Zid b{};
    ASSERT_EQ(zid::gen::new_zid(&a).code, zid::core::StatusCode::Ok);
    ASSERT_EQ(zid::gen::new_zid(&b).code, zid::core::StatusCode::Ok);
    EXPECT_NE(a, b);
    EXPECT_NE(a.instant(), b.instant());

    const zid::time::Instant t = utc(1970, 1, 1, 0, 0, 0, 0);
    zid::id::Zid at{};
    ASSERT_EQ(zid::gen::new_zid_at(t, &at).code, zid::core::StatusCode::Ok);
    EXPECT_EQ(at.instant(), t);
    EXPECT_EQ(at.text().substr(0, 8), "ZN2MO54_");
}
