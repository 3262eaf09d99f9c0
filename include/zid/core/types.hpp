#pragma once

#include <array>
#include <compare>
#include <cstddef>
#include <cstdint>
#include <type_traits>

namespace zid::core {

    using u8 = std::uint8_t;
    using u16 = std::uint16_t;
    using u32 = std::uint32_t;
    using u64 = std::uint64_t;

    using i64 = std::int64_t;

    // 120-bit payloads plus the UUID offset bit fit comfortably
    __extension__ typedef unsigned __int128 u128;

    inline constexpr std::size_t kZidByteWidth = 15;

    struct ZidBytes {
        std::array<u8, kZidByteWidth> b{};
        friend constexpr bool operator==(const ZidBytes&, const ZidBytes&) noexcept = default;
        friend constexpr auto operator<=>(const ZidBytes&, const ZidBytes&) noexcept = default;
    };
    static_assert(sizeof(ZidBytes) == kZidByteWidth);

    struct ByteView {
        const u8* data{nullptr};
        u32 len{0};
    };

    static_assert(std::is_trivially_copyable_v<ZidBytes>);
    static_assert(std::is_standard_layout_v<ZidBytes>);
    static_assert(std::is_trivially_copyable_v<ByteView>);
    static_assert(std::is_standard_layout_v<ByteView>);

} // namespace zid::core
