#pragma once

#include <array>
#include <cstddef>
#include <string_view>

#include "zid/codec/integer.hpp"
#include "zid/core/errors.hpp"
#include "zid/core/layout.hpp"
#include "zid/core/types.hpp"

namespace zid::codec {
    using u32 = zid::core::u32;

    using TextBuf = std::array<char, zid::core::kTextLength>;
    using ShortTextBuf = std::array<char, zid::core::kShortTextLength>;

    [[nodiscard]] constexpr TextBuf encode_text(const zid::core::ZidBytes& bytes) noexcept {
        TextBuf out{};
        u128 v = bytes_to_value(bytes);
        std::size_t pos = zid::core::kTextLength;
        for (std::size_t index = 0; index < zid::core::kDigitCount; ++index) {
            out[--pos] = zid::core::kAlphabet[static_cast<std::size_t>(v % zid::core::kBase)];
            v /= zid::core::kBase;
            if (index % zid::core::kGroupSize == zid::core::kGroupSize - 1 && index + 1 < zid::core::kDigitCount) {
                out[--pos] = zid::core::kSeparator;
            }
        }
        // 62^20 < 2^120 < 2 * 62^20, so the carry is 0 or 1
        out[--pos] = zid::core::kCarryAlphabet[static_cast<std::size_t>(v)];
        return out;
    }

    [[nodiscard]] constexpr bool text_equals(const TextBuf& text, std::string_view literal) noexcept {
        if (literal.size() != text.size()) {
            return false;
        }
        for (std::size_t i = 0; i < text.size(); ++i) {
            if (text[i] != literal[i]) {
                return false;
            }
        }
        return true;
    }

    static_assert(text_equals(encode_text(max_bytes()), zid::core::kMaxText),
                  "kMaxText does not match the encoding of the all-ones payload");
    static_assert(text_equals(encode_text(zid::core::ZidBytes{}), zid::core::kMinText));

    // Value of one alphabet symbol, or -1.
    [[nodiscard]] constexpr int digit_value(char c) noexcept {
        if (c >= '0' && c <= '9') {
            return c - '0';
        }
        if (c >= 'A' && c <= 'Z') {
            return c - 'A' + 10;
        }
        if (c >= 'a' && c <= 'z') {
            return c - 'a' + 36;
        }
        return -1;
    }

    [[nodiscard]] constexpr int carry_value(char c) noexcept {
        if (c == zid::core::kCarryAlphabet[0]) {
            return 0;
        }
        if (c == zid::core::kCarryAlphabet[1]) {
            return 1;
        }
        return -1;
    }

    // Long form: 23 chars with separators. Status aux holds the offending position.
    zid::core::Status decode_text(std::string_view text, zid::core::ZidBytes* out) noexcept;

    // Short form: 21 chars, no separators.
    zid::core::Status decode_short_text(std::string_view text, zid::core::ZidBytes* out) noexcept;

    [[nodiscard]] ShortTextBuf to_short_text(const TextBuf& text) noexcept;

    [[nodiscard]] TextBuf expand_short_text(const ShortTextBuf& text) noexcept;

    [[nodiscard]] bool is_valid_text(std::string_view text) noexcept;

    [[nodiscard]] bool is_valid_short_text(std::string_view text) noexcept;

} // namespace zid::codec
