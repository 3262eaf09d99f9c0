#pragma once

#include <array>
#include <compare>
#include <cstddef>
#include <string_view>
#include <type_traits>

#include "zid/core/errors.hpp"
#include "zid/core/types.hpp"

namespace zid::uuid {
    using u8 = zid::core::u8;
    using u32 = zid::core::u32;

    struct Uuid {
        std::array<u8, 16> b{};
        friend constexpr bool operator==(const Uuid&, const Uuid&) noexcept = default;
        friend constexpr auto operator<=>(const Uuid&, const Uuid&) noexcept = default;
    };

    // Nibble indices (0 = most significant hex digit) fixed to 8 in a Zid UUID.
    inline constexpr std::size_t kVersionNibble = 12;
    inline constexpr std::size_t kVariantNibble = 16;
    inline constexpr u8 kZidNibble = 0x8;

    inline constexpr std::size_t kUuidTextLength = 36;
    using UuidText = std::array<char, kUuidTextLength>;

    [[nodiscard]] constexpr u8 uuid_nibble(const Uuid& u, std::size_t index) noexcept {
        const u8 byte = u.b[index / 2];
        return (index % 2 == 0) ? static_cast<u8>(byte >> 4) : static_cast<u8>(byte & 0x0fu);
    }

    [[nodiscard]] constexpr u8 uuid_version(const Uuid& u) noexcept {
        return uuid_nibble(u, kVersionNibble);
    }

    // Canonical lowercase 8-4-4-4-12.
    [[nodiscard]] UuidText format_uuid(const Uuid& u) noexcept;

    // Accepts the hyphenated form or 32 bare hex digits, any case.
    zid::core::Status parse_uuid(std::string_view text, Uuid* out) noexcept;

    // Splices the version and variant nibbles into the 30 payload nibbles.
    [[nodiscard]] Uuid uuid_from_zid_bytes(const zid::core::ZidBytes& bytes) noexcept;

    // NotZid when either fixed nibble differs from 8; aux holds the nibble index.
    zid::core::Status zid_bytes_from_uuid(const Uuid& u, zid::core::ZidBytes* out) noexcept;

    static_assert(std::is_trivially_copyable_v<Uuid>);
    static_assert(std::is_standard_layout_v<Uuid>);
    static_assert(sizeof(Uuid) == 16);

} // namespace zid::uuid
