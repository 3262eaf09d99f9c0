#include "zid/codec/text.hpp"

#include <cstddef>

namespace zid::codec {
    namespace {
        constexpr bool alphabet_matches_digit_values() noexcept {
            for (std::size_t i = 0; i < zid::core::kAlphabet.size(); ++i) {
                if (digit_value(zid::core::kAlphabet[i]) != static_cast<int>(i)) {
                    return false;
                }
            }
            return true;
        }
        static_assert(alphabet_matches_digit_values());

        [[nodiscard]] zid::core::Status invalid_at(std::size_t pos) noexcept {
            return zid::core::make_status(zid::core::StatusDomain::Codec, zid::core::StatusCode::Invalid, static_cast<u32>(pos));
        }

        [[nodiscard]] std::size_t first_length_error(std::size_t got, std::size_t want) noexcept {
            return got < want ? got : want;
        }
    } // namespace

    zid::core::Status decode_text(std::string_view text, zid::core::ZidBytes* out) noexcept {
        if (out == nullptr) {
            return zid::core::make_status(zid::core::StatusDomain::Codec, zid::core::StatusCode::Invalid);
        }
        if (text.size() != zid::core::kTextLength) {
            return invalid_at(first_length_error(text.size(), zid::core::kTextLength));
        }

        const int carry = carry_value(text[0]);
        if (carry < 0) {
            return invalid_at(0);
        }

        u128 v = static_cast<u128>(carry);
        for (std::size_t pos = 1; pos < text.size(); ++pos) {
            const char c = text[pos];
            if (zid::core::is_separator_position(pos)) {
                if (c != zid::core::kSeparator) {
                    return invalid_at(pos);
                }
                continue;
            }
            const int d = digit_value(c);
            if (d < 0) {
                return invalid_at(pos);
            }
            v = v * zid::core::kBase + static_cast<u128>(d);
        }

        if (!value_in_range(v)) {
            return zid::core::make_status(zid::core::StatusDomain::Codec, zid::core::StatusCode::OutOfRange);
        }

        *out = value_to_bytes(v);
        return zid::core::ok_status();
    }

    zid::core::Status decode_short_text(std::string_view text, zid::core::ZidBytes* out) noexcept {
        if (out == nullptr) {
            return zid::core::make_status(zid::core::StatusDomain::Codec, zid::core::StatusCode::Invalid);
        }
        if (text.size() != zid::core::kShortTextLength) {
            return invalid_at(first_length_error(text.size(), zid::core::kShortTextLength));
        }

        ShortTextBuf short_text{};
        for (std::size_t i = 0; i < short_text.size(); ++i) {
            // a separator here would land on a digit slot once expanded
            if (text[i] == zid::core::kSeparator) {
                return invalid_at(i);
            }
            short_text[i] = text[i];
        }

        const TextBuf expanded = expand_short_text(short_text);
        const zid::core::Status s = decode_text(std::string_view(expanded.data(), expanded.size()), out);
        if (s.code == zid::core::StatusCode::Invalid) {
            // report the position in the caller's short string
            std::size_t separators_before = 0;
            for (std::size_t pos = 0; pos < s.aux; ++pos) {
                if (zid::core::is_separator_position(pos)) {
                    ++separators_before;
                }
            }
            return invalid_at(s.aux - separators_before);
        }
        return s;
    }

    ShortTextBuf to_short_text(const TextBuf& text) noexcept {
        ShortTextBuf out{};
        std::size_t j = 0;
        for (std::size_t pos = 0; pos < text.size(); ++pos) {
            if (zid::core::is_separator_position(pos)) {
                continue;
            }
            out[j++] = text[pos];
        }
        return out;
    }

    TextBuf expand_short_text(const ShortTextBuf& text) noexcept {
        TextBuf out{};
        std::size_t j = 0;
        for (std::size_t pos = 0; pos < out.size(); ++pos) {
            if (zid::core::is_separator_position(pos)) {
                out[pos] = zid::core::kSeparator;
                continue;
            }
            out[pos] = text[j++];
        }
        return out;
    }

    bool is_valid_text(std::string_view text) noexcept {
        zid::core::ZidBytes scratch{};
        return zid::core::is_ok(decode_text(text, &scratch));
    }

    bool is_valid_short_text(std::string_view text) noexcept {
        zid::core::ZidBytes scratch{};
        return zid::core::is_ok(decode_short_text(text, &scratch));
    }
} // namespace zid::codec
