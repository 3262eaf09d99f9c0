#include "zid/time/embedding.hpp"

#include "zid/codec/integer.hpp"

namespace zid::time {
    namespace {
        using u128 = zid::core::u128;

        [[nodiscard]] u128 base_value(u64 micros) noexcept {
            return static_cast<u128>(micros) * zid::core::kValuesPerMicro;
        }

        [[nodiscard]] u64 slots_for_micros(u64 micros) noexcept {
            const u128 room = zid::core::kValueLimit - base_value(micros);
            return room < zid::core::kValuesPerMicro ? static_cast<u64>(room) : zid::core::kValuesPerMicro;
        }
    } // namespace

    zid::core::Status slot_count_at(Instant t, u64* out) noexcept {
        if (out == nullptr) {
            return zid::core::make_status(zid::core::StatusDomain::Time, zid::core::StatusCode::Invalid);
        }
        u64 micros = 0;
        const zid::core::Status s = micros_since_min(t, &micros);
        if (!zid::core::is_ok(s)) {
            return s;
        }

        *out = slots_for_micros(micros);
        return zid::core::ok_status();
    }

    zid::core::Status embed_instant(Instant t, u64 offset, zid::core::ZidBytes* out) noexcept {
        if (out == nullptr) {
            return zid::core::make_status(zid::core::StatusDomain::Time, zid::core::StatusCode::Invalid);
        }
        u64 micros = 0;
        const zid::core::Status s = micros_since_min(t, &micros);
        if (!zid::core::is_ok(s)) {
            return s;
        }
        if (offset >= slots_for_micros(micros)) {
            return zid::core::make_status(zid::core::StatusDomain::Time, zid::core::StatusCode::OutOfRange);
        }

        *out = zid::codec::value_to_bytes(base_value(micros) + offset);
        return zid::core::ok_status();
    }

    Instant recover_instant(const zid::core::ZidBytes& bytes) noexcept {
        const u128 v = zid::codec::bytes_to_value(bytes);
        return instant_from_micros(static_cast<u64>(v / zid::core::kValuesPerMicro));
    }

    u64 random_tail(const zid::core::ZidBytes& bytes) noexcept {
        const u128 v = zid::codec::bytes_to_value(bytes);
        return static_cast<u64>(v % zid::core::kValuesPerMicro);
    }
} // namespace zid::time
