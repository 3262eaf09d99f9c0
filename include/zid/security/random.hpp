#pragma once

#include <cstdint>

#include "zid/core/errors.hpp"
#include "zid/core/types.hpp"

namespace zid::security {
    using u8 = zid::core::u8;
    using u32 = zid::core::u32;
    using u64 = zid::core::u64;

    struct RandomMut {
        u8* data{nullptr};
        u32 len{0};
    };

    // Fills the buffer from the operating system CSPRNG (libsodium or OpenSSL).
    zid::core::Status random_fill(RandomMut out) noexcept;

    // Uniform value in [0, bound). bound must be non-zero.
    zid::core::Status random_below(u64 bound, u64* out) noexcept;

} // namespace zid::security
