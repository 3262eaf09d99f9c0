#pragma once

#include <cstddef>
#include <string_view>

#include "zid/core/types.hpp"

namespace zid::core {

    // Width and resolution policy. Everything below derives from these.
    inline constexpr std::size_t kPayloadBits = kZidByteWidth * 8;
    inline constexpr u128 kValueLimit = u128{1} << kPayloadBits; // exclusive
    inline constexpr u128 kMaxValue = kValueLimit - 1;

    // Microseconds from 0001-01-01T00:00:00Z to 10000-01-01T00:00:00Z
    inline constexpr u64 kRangeDays = 3652059;
    inline constexpr u64 kMicrosPerDay = 86400ull * 1000000ull;
    inline constexpr u64 kRangeMicros = kRangeDays * kMicrosPerDay;

    inline constexpr u64 kValuesPerMicro = static_cast<u64>(kValueLimit / kRangeMicros) + 1;

    static_assert(kRangeMicros == 315537897600000000ull);
    static_assert(kValuesPerMicro == 4212577968906755729ull);
    static_assert(static_cast<u128>(kValuesPerMicro) * kRangeMicros >= kValueLimit);
    static_assert(static_cast<u128>(kValuesPerMicro - 1) * kRangeMicros < kValueLimit);
    // the last microsecond still has a base slot inside the payload range
    static_assert(static_cast<u128>(kValuesPerMicro) * (kRangeMicros - 1) < kValueLimit);

    // Text form: C dddddd_ddddddd_ddddddd
    inline constexpr std::string_view kAlphabet =
        "0123456789ABCDEFGHIJKLMNOPQRSTUVWXYZabcdefghijklmnopqrstuvwxyz";
    inline constexpr std::string_view kCarryAlphabet = "Zz";
    inline constexpr char kSeparator = '_';
    inline constexpr u32 kBase = 62;
    inline constexpr std::size_t kDigitCount = 20;
    inline constexpr std::size_t kGroupSize = 7;
    inline constexpr std::size_t kSeparatorCount = (kDigitCount - 1) / kGroupSize;
    inline constexpr std::size_t kTextLength = 1 + kDigitCount + kSeparatorCount;
    inline constexpr std::size_t kShortTextLength = 1 + kDigitCount;

    inline constexpr std::string_view kMinText = "Z000000_0000000_0000000";
    // encoding of fifteen 0xff bytes; verified in zid/codec/text.hpp
    inline constexpr std::string_view kMaxText = "zszWVIy_ZES2MJo_AMUmjwV";

    static_assert(kAlphabet.size() == kBase);
    static_assert(kCarryAlphabet.size() == 2);
    static_assert(kTextLength == 23);
    static_assert(kShortTextLength == 21);
    static_assert(kMinText.size() == kTextLength);
    static_assert(kMaxText.size() == kTextLength);

    // True when text position pos (0 = carry) holds a separator.
    [[nodiscard]] constexpr bool is_separator_position(std::size_t pos) noexcept {
        // digits counted from the least significant end; a separator follows every kGroupSize digits
        if (pos == 0 || pos >= kTextLength) {
            return false;
        }
        const std::size_t from_end = kTextLength - 1 - pos;
        return (from_end + 1) % (kGroupSize + 1) == 0;
    }

    static_assert(!is_separator_position(0));
    static_assert(is_separator_position(7));
    static_assert(is_separator_position(15));
    static_assert(!is_separator_position(22));

} // namespace zid::core
