#pragma once

#include <slot-core/fwd.hh>
#include <slot-core/optional.hh>

#include <compare>
#include <string>
#include <string_view>

/// 256-bit value used both as a slot key and as the content of one slot.
/// Plain aggregate of 32 bytes, trivially copyable, zero-initialized by default.
/// Keys are ordered and added to as 256-bit big-endian unsigned integers:
/// the n slots covered by a multi-slot value are key, key + 1, ..., key + (n - 1).
struct sc::b256
{
    byte bytes[slot_size] = {};

    /// The all-zero value.
    [[nodiscard]] static constexpr b256 zero() { return {}; }

    /// Big-endian encoding of v in the last 8 bytes, zero above.
    [[nodiscard]] static b256 from_u64(u64 v);

    /// Parses exactly 64 hex digits, optionally prefixed with "0x".
    /// Returns nullopt on wrong length or a non-hex character.
    [[nodiscard]] static optional<b256> from_hex(std::string_view hex);

    [[nodiscard]] constexpr byte* data() { return bytes; }
    [[nodiscard]] constexpr byte const* data() const { return bytes; }
    [[nodiscard]] static constexpr isize size() { return slot_size; }

    [[nodiscard]] friend constexpr bool operator==(b256 const&, b256 const&) = default;
    [[nodiscard]] friend constexpr std::strong_ordering operator<=>(b256 const&, b256 const&) = default;
};

namespace sc
{
/// key + n as 256-bit big-endian unsigned integers, wrapping modulo 2^256.
[[nodiscard]] b256 add_to_b256(b256 const& key, u64 n);

/// "0x" followed by 64 lowercase hex digits.
[[nodiscard]] std::string to_string(b256 const& v);
} // namespace sc
