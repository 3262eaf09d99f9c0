#pragma once

#include <cstddef>

#include "zid/core/layout.hpp"
#include "zid/core/types.hpp"

namespace zid::codec {
    using u8 = zid::core::u8;
    using u64 = zid::core::u64;
    using u128 = zid::core::u128;

    [[nodiscard]] constexpr u128 bytes_to_value(const zid::core::ZidBytes& bytes) noexcept {
        u128 v = 0;
        for (u8 b : bytes.b) {
            v = (v << 8) | b;
        }
        return v;
    }

    // Caller guarantees v <= kMaxValue; higher bits are dropped.
    [[nodiscard]] constexpr zid::core::ZidBytes value_to_bytes(u128 v) noexcept {
        zid::core::ZidBytes out{};
        for (std::size_t i = zid::core::kZidByteWidth; i > 0; --i) {
            out.b[i - 1] = static_cast<u8>(v & 0xffu);
            v >>= 8;
        }
        return out;
    }

    [[nodiscard]] constexpr bool value_in_range(u128 v) noexcept {
        return v <= zid::core::kMaxValue;
    }

    [[nodiscard]] constexpr zid::core::ZidBytes max_bytes() noexcept {
        zid::core::ZidBytes out{};
        for (u8& b : out.b) {
            b = 0xffu;
        }
        return out;
    }

    static_assert(bytes_to_value(max_bytes()) == zid::core::kMaxValue);
    static_assert(bytes_to_value(value_to_bytes(0x0102030405u)) == 0x0102030405u);

} // namespace zid::codec
