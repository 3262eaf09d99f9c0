#pragma once

#include <compare>
#include <cstddef>
#include <functional>
#include <iosfwd>
#include <string_view>
#include <type_traits>

#include "zid/codec/text.hpp"
#include "zid/core/errors.hpp"
#include "zid/core/types.hpp"
#include "zid/time/instant.hpp"
#include "zid/uuid/uuid.hpp"

namespace zid::id {

    class Zid;

    zid::core::Status zid_from_text(std::string_view text, Zid* out) noexcept;
    zid::core::Status zid_from_short_text(std::string_view text, Zid* out) noexcept;
    zid::core::Status zid_from_bytes(zid::core::ByteView bytes, Zid* out) noexcept;
    [[nodiscard]] Zid zid_from_bytes(const zid::core::ZidBytes& bytes) noexcept;
    zid::core::Status zid_from_uuid(const zid::uuid::Uuid& u, Zid* out) noexcept;

    // Immutable identifier. Holds the canonical text and the 15 payload bytes;
    // the instant and UUID views are derived from the bytes on demand.
    // A default-constructed Zid is the minimum value Z000000_0000000_0000000.
    class Zid {
    public:
        constexpr Zid() noexcept = default;

        [[nodiscard]] std::string_view text() const noexcept {
            return std::string_view(text_.data(), text_.size());
        }

        [[nodiscard]] zid::codec::ShortTextBuf short_text() const noexcept {
            return zid::codec::to_short_text(text_);
        }

        [[nodiscard]] const zid::core::ZidBytes& bytes() const noexcept {
            return bytes_;
        }

        [[nodiscard]] zid::time::Instant instant() const noexcept;

        [[nodiscard]] zid::core::u64 random_tail() const noexcept;

        [[nodiscard]] zid::uuid::Uuid uuid() const noexcept;

        friend bool operator==(const Zid& a, const Zid& b) noexcept {
            return a.text_ == b.text_;
        }

        friend std::strong_ordering operator<=>(const Zid& a, const Zid& b) noexcept {
            return a.text() <=> b.text();
        }

    private:
        constexpr Zid(const zid::codec::TextBuf& text, const zid::core::ZidBytes& bytes) noexcept
            : text_(text), bytes_(bytes) {}

        friend zid::core::Status zid_from_text(std::string_view text, Zid* out) noexcept;
        friend Zid zid_from_bytes(const zid::core::ZidBytes& bytes) noexcept;

        zid::codec::TextBuf text_{zid::codec::encode_text(zid::core::ZidBytes{})};
        zid::core::ZidBytes bytes_{};
    };

    // Long form (23 chars) or short form (21 chars), chosen by length.
    zid::core::Status zid_from_value(std::string_view value, Zid* out) noexcept;

    // Canonical or bare-hex UUID text that must carry the Zid version/variant nibbles.
    zid::core::Status zid_from_uuid_text(std::string_view text, Zid* out) noexcept;

    std::ostream& operator<<(std::ostream& os, const Zid& z);

    static_assert(std::is_trivially_copyable_v<Zid>);
    static_assert(std::is_standard_layout_v<Zid>);

} // namespace zid::id

template <>
struct std::hash<zid::id::Zid> {
    std::size_t operator()(const zid::id::Zid& z) const noexcept {
        return std::hash<std::string_view>{}(z.text());
    }
};
