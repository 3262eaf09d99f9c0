#include "zid/time/instant.hpp"

#include <cstdio>
#include <cstring>

namespace zid::time {
    namespace {
        [[nodiscard]] zid::core::Status invalid_at(std::size_t pos) noexcept {
            return zid::core::make_status(zid::core::StatusDomain::Time, zid::core::StatusCode::Invalid,
                                          static_cast<zid::core::u32>(pos));
        }

        [[nodiscard]] zid::core::Status out_of_range() noexcept {
            return zid::core::make_status(zid::core::StatusDomain::Time, zid::core::StatusCode::OutOfRange);
        }

        [[nodiscard]] bool is_digit(char c) noexcept {
            return c >= '0' && c <= '9';
        }

        // Reads exactly n digits at pos; on failure *bad holds the offending position.
        [[nodiscard]] bool read_fixed(std::string_view s, std::size_t pos, std::size_t n, int* out, std::size_t* bad) noexcept {
            int v = 0;
            for (std::size_t i = 0; i < n; ++i) {
                if (pos + i >= s.size() || !is_digit(s[pos + i])) {
                    *bad = pos + i;
                    return false;
                }
                v = v * 10 + (s[pos + i] - '0');
            }
            *out = v;
            return true;
        }

        [[nodiscard]] bool expect_char(std::string_view s, std::size_t pos, char c) noexcept {
            return pos < s.size() && s[pos] == c;
        }
    } // namespace

    zid::core::Status micros_since_min(Instant t, u64* out) noexcept {
        if (out == nullptr) {
            return zid::core::make_status(zid::core::StatusDomain::Time, zid::core::StatusCode::Invalid);
        }
        if (!instant_in_range(t)) {
            return out_of_range();
        }
        *out = static_cast<u64>((t - kMinInstant).count());
        return zid::core::ok_status();
    }

    Instant instant_from_micros(u64 micros) noexcept {
        return kMinInstant + Micros{static_cast<Micros::rep>(micros)};
    }

    Instant now_utc() noexcept {
        return std::chrono::floor<Micros>(std::chrono::system_clock::now());
    }

    zid::core::Status parse_instant(std::string_view text, Instant* out) noexcept {
        if (out == nullptr) {
            return zid::core::make_status(zid::core::StatusDomain::Time, zid::core::StatusCode::Invalid);
        }

        std::size_t bad = 0;
        int year = 0;
        int month = 0;
        int day = 0;
        int hour = 0;
        int minute = 0;
        int second = 0;

        if (!read_fixed(text, 0, 4, &year, &bad)) {
            return invalid_at(bad);
        }
        if (!expect_char(text, 4, '-')) {
            return invalid_at(4);
        }
        if (!read_fixed(text, 5, 2, &month, &bad)) {
            return invalid_at(bad);
        }
        if (!expect_char(text, 7, '-')) {
            return invalid_at(7);
        }
        if (!read_fixed(text, 8, 2, &day, &bad)) {
            return invalid_at(bad);
        }
        if (!(expect_char(text, 10, 'T') || expect_char(text, 10, 't') || expect_char(text, 10, ' '))) {
            return invalid_at(10);
        }
        if (!read_fixed(text, 11, 2, &hour, &bad)) {
            return invalid_at(bad);
        }
        if (!expect_char(text, 13, ':')) {
            return invalid_at(13);
        }
        if (!read_fixed(text, 14, 2, &minute, &bad)) {
            return invalid_at(bad);
        }
        if (!expect_char(text, 16, ':')) {
            return invalid_at(16);
        }
        if (!read_fixed(text, 17, 2, &second, &bad)) {
            return invalid_at(bad);
        }

        std::size_t pos = 19;
        int micros = 0;
        if (expect_char(text, pos, '.') || expect_char(text, pos, ',')) {
            ++pos;
            std::size_t digits = 0;
            while (pos < text.size() && is_digit(text[pos])) {
                if (digits < 6) {
                    micros = micros * 10 + (text[pos] - '0');
                }
                ++digits;
                ++pos;
            }
            if (digits == 0 || digits > 9) {
                return invalid_at(pos);
            }
            for (; digits < 6; ++digits) {
                micros *= 10;
            }
        }

        if (pos == text.size()) {
            return zid::core::make_status(zid::core::StatusDomain::Time, zid::core::StatusCode::TimezoneMissing,
                                          static_cast<zid::core::u32>(pos));
        }

        int offset_minutes = 0;
        const char zone = text[pos];
        if (zone == 'Z' || zone == 'z') {
            ++pos;
        } else if (zone == '+' || zone == '-') {
            int off_h = 0;
            int off_m = 0;
            if (!read_fixed(text, pos + 1, 2, &off_h, &bad)) {
                return invalid_at(bad);
            }
            pos += 3;
            if (expect_char(text, pos, ':')) {
                ++pos;
            }
            if (!read_fixed(text, pos, 2, &off_m, &bad)) {
                return invalid_at(bad);
            }
            pos += 2;
            if (off_h > 23 || off_m > 59) {
                return invalid_at(pos - 1);
            }
            offset_minutes = (off_h * 60 + off_m) * (zone == '-' ? -1 : 1);
        } else {
            return invalid_at(pos);
        }

        if (pos != text.size()) {
            return invalid_at(pos);
        }
        if (hour > 23) {
            return invalid_at(11);
        }
        if (minute > 59) {
            return invalid_at(14);
        }
        if (second > 59) {
            return invalid_at(17);
        }

        const std::chrono::year_month_day ymd{std::chrono::year{year},
                                              std::chrono::month{static_cast<unsigned>(month)},
                                              std::chrono::day{static_cast<unsigned>(day)}};
        if (!ymd.month().ok()) {
            return invalid_at(5);
        }
        if (!ymd.ok()) {
            return invalid_at(8);
        }

        const Instant local = Instant{std::chrono::sys_days{ymd}} + std::chrono::hours{hour} +
                              std::chrono::minutes{minute} + std::chrono::seconds{second} + Micros{micros};
        const Instant t = local - std::chrono::minutes{offset_minutes};
        if (!instant_in_range(t)) {
            return out_of_range();
        }

        *out = t;
        return zid::core::ok_status();
    }

    InstantText format_instant(Instant t) noexcept {
        const std::chrono::sys_days days = std::chrono::floor<std::chrono::days>(t);
        const std::chrono::year_month_day ymd{days};
        const std::chrono::hh_mm_ss<Micros> hms{t - Instant{days}};

        char buf[kInstantTextLength + 1]{};
        std::snprintf(buf, sizeof(buf), "%04d-%02u-%02uT%02d:%02d:%02d.%06dZ",
                      static_cast<int>(ymd.year()),
                      static_cast<unsigned>(ymd.month()),
                      static_cast<unsigned>(ymd.day()),
                      static_cast<int>(hms.hours().count()),
                      static_cast<int>(hms.minutes().count()),
                      static_cast<int>(hms.seconds().count()),
                      static_cast<int>(hms.subseconds().count()));

        InstantText out{};
        std::memcpy(out.data(), buf, out.size());
        return out;
    }
} // namespace zid::time
