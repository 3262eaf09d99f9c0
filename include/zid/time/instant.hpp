#pragma once

#include <array>
#include <chrono>
#include <string_view>

#include "zid/core/errors.hpp"
#include "zid/core/layout.hpp"
#include "zid/core/types.hpp"

namespace zid::time {
    using u64 = zid::core::u64;

    using Micros = std::chrono::microseconds;

    // UTC by construction; there is no naive form of this type.
    using Instant = std::chrono::sys_time<Micros>;

    inline constexpr Instant kMinInstant{
        std::chrono::sys_days{std::chrono::year{1} / std::chrono::January / 1}};
    inline constexpr Instant kMaxInstant{
        std::chrono::sys_days{std::chrono::year{9999} / std::chrono::December / 31} + std::chrono::days{1} - Micros{1}};

    static_assert(static_cast<u64>((kMaxInstant - kMinInstant).count()) + 1 == zid::core::kRangeMicros);

    // "YYYY-MM-DDTHH:MM:SS.ffffffZ"
    inline constexpr std::size_t kInstantTextLength = 27;
    using InstantText = std::array<char, kInstantTextLength>;

    [[nodiscard]] constexpr bool instant_in_range(Instant t) noexcept {
        return t >= kMinInstant && t <= kMaxInstant;
    }

    // Whole microseconds elapsed since kMinInstant.
    zid::core::Status micros_since_min(Instant t, u64* out) noexcept;

    // Caller guarantees micros < kRangeMicros.
    [[nodiscard]] Instant instant_from_micros(u64 micros) noexcept;

    // System clock reading truncated to microseconds.
    [[nodiscard]] Instant now_utc() noexcept;

    // ISO-8601 with a mandatory zone designator (Z or +-HH:MM); fractions beyond
    // microseconds are truncated. A missing designator yields TimezoneMissing.
    zid::core::Status parse_instant(std::string_view text, Instant* out) noexcept;

    [[nodiscard]] InstantText format_instant(Instant t) noexcept;

} // namespace zid::time
