#include "zid/gen/generator.hpp"

#include <chrono>
#include <thread>

#include "zid/security/random.hpp"
#include "zid/time/embedding.hpp"

namespace zid::gen {
    namespace {
        zid::time::Instant read_system_clock(void* ctx) noexcept {
            (void)ctx;
            return zid::time::now_utc();
        }
    } // namespace

    ClockSource system_clock_source() noexcept {
        return ClockSource{&read_system_clock, nullptr};
    }

    Generator::Generator() noexcept : Generator(system_clock_source()) {}

    Generator::Generator(ClockSource clock) noexcept : clock_(clock) {
        if (clock_.now == nullptr) {
            clock_ = system_clock_source();
        }
    }

    zid::time::Instant Generator::next_instant() noexcept {
        std::lock_guard<std::mutex> lock(mutex_);

        zid::time::Instant now = clock_.now(clock_.ctx);
        while (previous_.has_value() && *previous_ == now) {
            std::this_thread::sleep_for(std::chrono::microseconds{1});
            now = clock_.now(clock_.ctx);
        }
        previous_ = now;
        return now;
    }

    zid::core::Status Generator::generate(zid::id::Zid* out) noexcept {
        if (out == nullptr) {
            return zid::core::make_status(zid::core::StatusDomain::Gen, zid::core::StatusCode::Invalid);
        }
        return generate_at(next_instant(), out);
    }

    zid::core::Status Generator::generate_at(zid::time::Instant t, zid::id::Zid* out) noexcept {
        if (out == nullptr) {
            return zid::core::make_status(zid::core::StatusDomain::Gen, zid::core::StatusCode::Invalid);
        }

        u64 slots = 0;
        zid::core::Status s = zid::time::slot_count_at(t, &slots);
        if (!zid::core::is_ok(s)) {
            return s;
        }

        u64 offset = 0;
        s = zid::security::random_below(slots, &offset);
        if (!zid::core::is_ok(s)) {
            return s;
        }

        zid::core::ZidBytes bytes{};
        s = zid::time::embed_instant(t, offset, &bytes);
        if (!zid::core::is_ok(s)) {
            return s;
        }

        *out = zid::id::zid_from_bytes(bytes);
        return zid::core::ok_status();
    }

    std::optional<zid::time::Instant> Generator::previous_instant() const noexcept {
        std::lock_guard<std::mutex> lock(mutex_);
        return previous_;
    }

    Generator& default_generator() noexcept {
        static Generator instance;
        return instance;
    }

    zid::core::Status new_zid(zid::id::Zid* out) noexcept {
        return default_generator().generate(out);
    }

    zid::core::Status new_zid_at(zid::time::Instant t, zid::id::Zid* out) noexcept {
        return default_generator().generate_at(t, out);
    }
} // namespace zid::gen
