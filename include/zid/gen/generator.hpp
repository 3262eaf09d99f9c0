#pragma once

#include <mutex>
#include <optional>

#include "zid/core/errors.hpp"
#include "zid/id/zid.hpp"
#include "zid/time/instant.hpp"

namespace zid::gen {
    using u64 = zid::core::u64;

    // Clock readings must already be truncated to microseconds.
    struct ClockSource {
        zid::time::Instant (*now)(void* ctx) noexcept {nullptr};
        void* ctx{nullptr};
    };

    [[nodiscard]] ClockSource system_clock_source() noexcept;

    // Produces fresh Zids. Remembers the last instant it sampled so that no two
    // Zids generated through the same Generator share an embedded microsecond,
    // even when the clock repeats a reading.
    class Generator {
    public:
        Generator() noexcept;
        explicit Generator(ClockSource clock) noexcept;

        Generator(const Generator&) = delete;
        Generator& operator=(const Generator&) = delete;

        // Current instant plus a secure random tail.
        zid::core::Status generate(zid::id::Zid* out) noexcept;

        // Explicit instant plus a secure random tail. Does not touch the
        // last-instant state.
        zid::core::Status generate_at(zid::time::Instant t, zid::id::Zid* out) noexcept;

        [[nodiscard]] std::optional<zid::time::Instant> previous_instant() const noexcept;

    private:
        zid::time::Instant next_instant() noexcept;

        ClockSource clock_;
        mutable std::mutex mutex_;
        std::optional<zid::time::Instant> previous_;
    };

    // Process-wide generator.
    Generator& default_generator() noexcept;

    zid::core::Status new_zid(zid::id::Zid* out) noexcept;

    zid::core::Status new_zid_at(zid::time::Instant t, zid::id::Zid* out) noexcept;

} // namespace zid::gen
