#include <array>
#include <set>

#include <gtest/gtest.h>

#include "zid/core/errors.hpp"
#include "zid/security/random.hpp"

TEST(SecurityRandom, FillProducesDistinctBuffers) {
    std::array<zid::core::u8, 32> a{};
    std::array<zid::core::u8, 32> b{};
    ASSERT_EQ(zid::security::random_fill({a.data(), static_cast<zid::core::u32>(a.size())}).code,
              zid::core::StatusCode::Ok);
    ASSERT_EQ(zid::security::random_fill({b.data(), static_cast<zid::core::u32>(b.size())}).code,
              zid::core::StatusCode::Ok);
    EXPECT_NE(a, b);
}

TEST(SecurityRandom, FillAcceptsEmptyAndRejectsNull) {
    EXPECT_EQ(zid::security::random_fill({nullptr, 0}).code, zid::core::StatusCode::Ok);

    const zid::core::Status s = zid::security::random_fill({nullptr, 8});
    EXPECT_EQ(s.domain, zid::core::StatusDomain::Random);
    EXPECT_EQ(s.code, zid::core::StatusCode::Invalid);
}

TEST(SecurityRandom, BelowStaysInBounds) {
    for (zid::core::u64 bound : {2ull, 3ull, 7ull, 1000ull, 4212577968906755729ull, ~0ull}) {
        for (int i = 0; i < 200; ++i) {
            zid::core::u64 v = 0;
            ASSERT_EQ(zid::security::random_below(bound, &v).code, zid::core::StatusCode::Ok);
            EXPECT_LT(v, bound);
        }
    }
}

TEST(SecurityRandom, BelowOneIsZero) {
    zid::core::u64 v = 99;
    ASSERT_EQ(zid::security::random_below(1, &v).code, zid::core::StatusCode::Ok);
    EXPECT_EQ(v, 0u);
}

TEST(SecurityRandom, BelowHitsEveryValueOfASmallRange) {
    std::set<zid::core::u64> seen;
    for (int i = 0; i < 500 && seen.size() < 5; ++i) {
        zid::core::u64 v = 0;
        ASSERT_EQ(zid::security::random_below(5, &v).code, zid::core::StatusCode::Ok);
        seen.insert(v);
    }
    EXPECT_EQ(seen.size(), 5u);
}

TEST(SecurityRandom, BelowRejectsZeroBoundAndNullOut) {
    zid::core::u64 v = 0;
    EXPECT_EQ(zid::security::random_below(0, &v).code, zid::core::StatusCode::Invalid);
    EXPECT_EQ(zid::security::random_below(10, nullptr).code, zid::core::StatusCode::Invalid);
}
