#include "zid/security/random.hpp"

#include <cstddef>
#include <cstring>

#if defined(ZID_HAVE_LIBSODIUM)
#include <sodium.h>
#endif

#if defined(ZID_HAVE_OPENSSL)
#include <openssl/rand.h>
#endif

namespace zid::security {
    namespace {
        [[nodiscard]] bool buffer_ok_mut(RandomMut b) noexcept {
            return (b.len == 0) || (b.data != nullptr);
        }

#if defined(ZID_HAVE_LIBSODIUM)
        zid::core::Status ensure_sodium() noexcept {
            if (sodium_init() < 0) {
                return zid::core::make_status(zid::core::StatusDomain::External, zid::core::StatusCode::Unavailable);
            }
            return zid::core::ok_status();
        }
#endif

        // Smallest all-ones mask covering v.
        [[nodiscard]] constexpr u64 cover_mask(u64 v) noexcept {
            v |= v >> 1;
            v |= v >> 2;
            v |= v >> 4;
            v |= v >> 8;
            v |= v >> 16;
            v |= v >> 32;
            return v;
        }

        static_assert(cover_mask(1) == 1);
        static_assert(cover_mask(5) == 7);
        static_assert(cover_mask(0x8000000000000000ull) == ~0ull);
    } // namespace

    zid::core::Status random_fill(RandomMut out) noexcept {
        if (!buffer_ok_mut(out)) {
            return zid::core::make_status(zid::core::StatusDomain::Random, zid::core::StatusCode::Invalid);
        }
        if (out.len == 0) {
            return zid::core::ok_status();
        }

#if defined(ZID_HAVE_LIBSODIUM)
        const zid::core::Status init = ensure_sodium();
        if (!zid::core::is_ok(init)) {
            return init;
        }
        randombytes_buf(out.data, static_cast<std::size_t>(out.len));
        return zid::core::ok_status();
#elif defined(ZID_HAVE_OPENSSL)
        if (RAND_bytes(out.data, static_cast<int>(out.len)) != 1) {
            return zid::core::make_status(zid::core::StatusDomain::Random, zid::core::StatusCode::Crypto);
        }
        return zid::core::ok_status();
#else
        std::memset(out.data, 0, out.len);
        return zid::core::make_status(zid::core::StatusDomain::Random, zid::core::StatusCode::Unavailable);
#endif
    }

    zid::core::Status random_below(u64 bound, u64* out) noexcept {
        if (out == nullptr || bound == 0) {
            return zid::core::make_status(zid::core::StatusDomain::Random, zid::core::StatusCode::Invalid);
        }
        if (bound == 1) {
            *out = 0;
            return zid::core::ok_status();
        }

        // Rejection sampling: each draw succeeds with probability > 1/2.
        const u64 mask = cover_mask(bound - 1);
        for (;;) {
            u8 raw[8]{};
            const zid::core::Status s = random_fill(RandomMut{raw, sizeof(raw)});
            if (!zid::core::is_ok(s)) {
                return s;
            }
            u64 v = 0;
            for (u8 b : raw) {
                v = (v << 8) | b;
            }
            v &= mask;
            if (v < bound) {
                *out = v;
                return zid::core::ok_status();
            }
        }
    }
} // namespace zid::security
