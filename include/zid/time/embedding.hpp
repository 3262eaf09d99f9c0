#pragma once

#include "zid/core/errors.hpp"
#include "zid/core/layout.hpp"
#include "zid/core/types.hpp"
#include "zid/time/instant.hpp"

namespace zid::time {

    // Random-offset slots available at t: kValuesPerMicro, except near the top of
    // the range where the payload limit truncates them.
    zid::core::Status slot_count_at(Instant t, u64* out) noexcept;

    // value = micros_since_min(t) * kValuesPerMicro + offset, offset < slot_count_at(t)
    zid::core::Status embed_instant(Instant t, u64 offset, zid::core::ZidBytes* out) noexcept;

    [[nodiscard]] Instant recover_instant(const zid::core::ZidBytes& bytes) noexcept;

    [[nodiscard]] u64 random_tail(const zid::core::ZidBytes& bytes) noexcept;

} // namespace zid::time
