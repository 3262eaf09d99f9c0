#include "zid/id/zid.hpp"

#include <ostream>

#include "zid/time/embedding.hpp"

namespace zid::id {

    zid::time::Instant Zid::instant() const noexcept {
        return zid::time::recover_instant(bytes_);
    }

    zid::core::u64 Zid::random_tail() const noexcept {
        return zid::time::random_tail(bytes_);
    }

    zid::uuid::Uuid Zid::uuid() const noexcept {
        return zid::uuid::uuid_from_zid_bytes(bytes_);
    }

    zid::core::Status zid_from_text(std::string_view text, Zid* out) noexcept {
        if (out == nullptr) {
            return zid::core::make_status(zid::core::StatusDomain::Codec, zid::core::StatusCode::Invalid);
        }
        zid::core::ZidBytes bytes{};
        const zid::core::Status s = zid::codec::decode_text(text, &bytes);
        if (!zid::core::is_ok(s)) {
            return s;
        }

        zid::codec::TextBuf buf{};
        for (std::size_t i = 0; i < buf.size(); ++i) {
            buf[i] = text[i];
        }
        *out = Zid(buf, bytes);
        return zid::core::ok_status();
    }

    zid::core::Status zid_from_short_text(std::string_view text, Zid* out) noexcept {
        if (out == nullptr) {
            return zid::core::make_status(zid::core::StatusDomain::Codec, zid::core::StatusCode::Invalid);
        }
        zid::core::ZidBytes bytes{};
        const zid::core::Status s = zid::codec::decode_short_text(text, &bytes);
        if (!zid::core::is_ok(s)) {
            return s;
        }
        *out = zid_from_bytes(bytes);
        return zid::core::ok_status();
    }

    zid::core::Status zid_from_bytes(zid::core::ByteView bytes, Zid* out) noexcept {
        if (out == nullptr) {
            return zid::core::make_status(zid::core::StatusDomain::Codec, zid::core::StatusCode::Invalid);
        }
        if (bytes.len != zid::core::kZidByteWidth) {
            return zid::core::make_status(zid::core::StatusDomain::Codec, zid::core::StatusCode::Invalid, bytes.len);
        }
        if (bytes.data == nullptr) {
            return zid::core::make_status(zid::core::StatusDomain::Codec, zid::core::StatusCode::Invalid);
        }

        zid::core::ZidBytes b{};
        for (std::size_t i = 0; i < b.b.size(); ++i) {
            b.b[i] = bytes.data[i];
        }
        *out = zid_from_bytes(b);
        return zid::core::ok_status();
    }

    Zid zid_from_bytes(const zid::core::ZidBytes& bytes) noexcept {
        return Zid(zid::codec::encode_text(bytes), bytes);
    }

    zid::core::Status zid_from_uuid(const zid::uuid::Uuid& u, Zid* out) noexcept {
        if (out == nullptr) {
            return zid::core::make_status(zid::core::StatusDomain::Uuid, zid::core::StatusCode::Invalid);
        }
        zid::core::ZidBytes bytes{};
        const zid::core::Status s = zid::uuid::zid_bytes_from_uuid(u, &bytes);
        if (!zid::core::is_ok(s)) {
            return s;
        }
        *out = zid_from_bytes(bytes);
        return zid::core::ok_status();
    }

    zid::core::Status zid_from_value(std::string_view value, Zid* out) noexcept {
        if (value.size() == zid::core::kShortTextLength) {
            return zid_from_short_text(value, out);
        }
        return zid_from_text(value, out);
    }

    zid::core::Status zid_from_uuid_text(std::string_view text, Zid* out) noexcept {
        if (out == nullptr) {
            return zid::core::make_status(zid::core::StatusDomain::Uuid, zid::core::StatusCode::Invalid);
        }
        zid::uuid::Uuid u{};
        const zid::core::Status s = zid::uuid::parse_uuid(text, &u);
        if (!zid::core::is_ok(s)) {
            return s;
        }
        return zid_from_uuid(u, out);
    }

    std::ostream& operator<<(std::ostream& os, const Zid& z) {
        return os << z.text();
    }

} // namespace zid::id
