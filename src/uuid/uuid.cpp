#include "zid/uuid/uuid.hpp"

namespace zid::uuid {
    namespace {
        constexpr char kHex[] = "0123456789abcdef";
        constexpr std::size_t kPayloadNibbles = zid::core::kZidByteWidth * 2;
        constexpr std::size_t kUuidNibbles = kPayloadNibbles + 2;

        [[nodiscard]] int hex_value(char c) noexcept {
            if (c >= '0' && c <= '9') {
                return c - '0';
            }
            if (c >= 'a' && c <= 'f') {
                return c - 'a' + 10;
            }
            if (c >= 'A' && c <= 'F') {
                return c - 'A' + 10;
            }
            return -1;
        }

        [[nodiscard]] bool is_hyphen_position(std::size_t pos) noexcept {
            return pos == 8 || pos == 13 || pos == 18 || pos == 23;
        }

        [[nodiscard]] zid::core::Status invalid_at(std::size_t pos) noexcept {
            return zid::core::make_status(zid::core::StatusDomain::Uuid, zid::core::StatusCode::Invalid, static_cast<u32>(pos));
        }

        void set_nibble(u8* bytes, std::size_t index, u8 v) noexcept {
            u8& byte = bytes[index / 2];
            if (index % 2 == 0) {
                byte = static_cast<u8>((byte & 0x0fu) | (v << 4));
            } else {
                byte = static_cast<u8>((byte & 0xf0u) | (v & 0x0fu));
            }
        }

        [[nodiscard]] u8 get_nibble(const u8* bytes, std::size_t index) noexcept {
            const u8 byte = bytes[index / 2];
            return (index % 2 == 0) ? static_cast<u8>(byte >> 4) : static_cast<u8>(byte & 0x0fu);
        }
    } // namespace

    UuidText format_uuid(const Uuid& u) noexcept {
        UuidText out{};
        std::size_t nibble = 0;
        for (std::size_t pos = 0; pos < out.size(); ++pos) {
            if (is_hyphen_position(pos)) {
                out[pos] = '-';
                continue;
            }
            out[pos] = kHex[uuid_nibble(u, nibble++)];
        }
        return out;
    }

    zid::core::Status parse_uuid(std::string_view text, Uuid* out) noexcept {
        if (out == nullptr) {
            return zid::core::make_status(zid::core::StatusDomain::Uuid, zid::core::StatusCode::Invalid);
        }

        const bool hyphenated = text.size() == kUuidTextLength;
        if (!hyphenated && text.size() != 32) {
            return invalid_at(text.size() < 32 ? text.size() : 32);
        }

        Uuid u{};
        std::size_t nibble = 0;
        for (std::size_t pos = 0; pos < text.size(); ++pos) {
            const char c = text[pos];
            if (hyphenated && is_hyphen_position(pos)) {
                if (c != '-') {
                    return invalid_at(pos);
                }
                continue;
            }
            const int v = hex_value(c);
            if (v < 0) {
                return invalid_at(pos);
            }
            set_nibble(u.b.data(), nibble++, static_cast<u8>(v));
        }

        *out = u;
        return zid::core::ok_status();
    }

    Uuid uuid_from_zid_bytes(const zid::core::ZidBytes& bytes) noexcept {
        Uuid u{};
        std::size_t src = 0;
        for (std::size_t dst = 0; dst < kUuidNibbles; ++dst) {
            if (dst == kVersionNibble || dst == kVariantNibble) {
                set_nibble(u.b.data(), dst, kZidNibble);
                continue;
            }
            set_nibble(u.b.data(), dst, get_nibble(bytes.b.data(), src++));
        }
        return u;
    }

    zid::core::Status zid_bytes_from_uuid(const Uuid& u, zid::core::ZidBytes* out) noexcept {
        if (out == nullptr) {
            return zid::core::make_status(zid::core::StatusDomain::Uuid, zid::core::StatusCode::Invalid);
        }
        if (uuid_nibble(u, kVersionNibble) != kZidNibble) {
            return zid::core::make_status(zid::core::StatusDomain::Uuid, zid::core::StatusCode::NotZid, static_cast<u32>(kVersionNibble));
        }
        if (uuid_nibble(u, kVariantNibble) != kZidNibble) {
            return zid::core::make_status(zid::core::StatusDomain::Uuid, zid::core::StatusCode::NotZid, static_cast<u32>(kVariantNibble));
        }

        zid::core::ZidBytes bytes{};
        std::size_t dst = 0;
        for (std::size_t src = 0; src < kUuidNibbles; ++src) {
            if (src == kVersionNibble || src == kVariantNibble) {
                continue;
            }
            set_nibble(bytes.b.data(), dst++, uuid_nibble(u, src));
        }

        *out = bytes;
        return zid::core::ok_status();
    }
} // namespace zid::uuid
