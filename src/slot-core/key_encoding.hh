#pragma once

#include <slot-core/b256.hh>
#include <slot-core/fwd.hh>
#include <slot-core/hash.hh>
#include <slot-core/span.hh>
#include <slot-core/utility.hh>

#include <string_view>
#include <type_traits>

// =========================================================================================================
// Key encoding
// =========================================================================================================
//
// Collections address their entries by hashing a key component together with the collection's base key:
//
//   derive_key(component, base) = sha256(serialize(component) ++ base)
//
// serialize(component) must be deterministic and injective per type, it never depends on host byte order:
//   bool                    -> 1 byte, 0x00 or 0x01
//   integers, enums         -> sizeof(T) bytes, big-endian (two's complement for signed)
//   b256                    -> its 32 bytes
//   strings                 -> u64 big-endian byte length, then the bytes
//   user types              -> an ADL-visible encode_storage_key(sc::sha256_hasher&, T const&)
//
// Any other type is rejected at compile time, structs included: their object representation is host order.
//
// Usage:
//   struct account_id { u32 shard; u64 serial; };
//   void encode_storage_key(sc::sha256_hasher& h, account_id const& id)
//   {
//       sc::encode_key_component(h, id.shard);
//       sc::encode_key_component(h, id.serial);
//   }

namespace sc
{
template <class T>
concept has_custom_storage_key_encoding = requires(sha256_hasher& h, T const& v) { encode_storage_key(h, v); };

/// Types encode_key_component accepts.
template <class T>
concept storage_key_component = has_custom_storage_key_encoding<T> || big_endian_scalar<T> || std::is_same_v<T, b256>
                                || std::is_convertible_v<T const&, std::string_view>;

namespace impl
{
template <big_endian_scalar U>
void encode_big_endian(sha256_hasher& h, U v)
{
    byte buf[sizeof(U)];
    store_big_endian(buf, v);
    h.input(span<byte const>(buf, isize(sizeof(U))));
}
} // namespace impl

/// Appends serialize(v) to the hasher.
template <class T>
void encode_key_component(sha256_hasher& h, T const& v)
{
    if constexpr (has_custom_storage_key_encoding<T>)
    {
        encode_storage_key(h, v);
    }
    else if constexpr (std::is_same_v<T, bool>)
    {
        h.input(u8(v ? 1 : 0));
    }
    else if constexpr (big_endian_scalar<T>)
    {
        impl::encode_big_endian(h, v);
    }
    else if constexpr (std::is_same_v<T, b256>)
    {
        h.input(v);
    }
    else if constexpr (std::is_convertible_v<T const&, std::string_view>)
    {
        auto const s = std::string_view(v);
        impl::encode_big_endian(h, u64(s.size()));
        h.input(s);
    }
    else
    {
        static_assert(always_false_t<T>, "type cannot be used as a storage key component, provide encode_storage_key");
    }
}

/// sha256(serialize(component) ++ base)
/// This is how a map entry or a vector element finds its slot.
template <class T>
[[nodiscard]] b256 derive_key(T const& component, b256 const& base)
{
    sha256_hasher h;
    encode_key_component(h, component);
    h.input(base);
    return h.finalize();
}
} // namespace sc
