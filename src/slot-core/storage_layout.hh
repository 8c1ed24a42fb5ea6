#pragma once

#include <slot-core/b256.hh>
#include <slot-core/fwd.hh>
#include <slot-core/slot_store.hh>
#include <slot-core/span.hh>
#include <slot-core/storage_codec.hh>

#include <string>
#include <string_view>
#include <vector>

// =========================================================================================================
// Storage layout
// =========================================================================================================
//
// Base keys for declared storage fields, and the initial slots of their default values.
//
// A storage field is named by a path: zero or more namespaces followed by the field name.
// Its key string is
//
//   "storage.<field>"                          no namespaces
//   "storage::<ns1>::<ns2>.<field>"            nested namespaces
//
// and its base key is sha256(storage_domain ++ key string). The one-byte domain prefix keeps field
// pre-images disjoint from the pre-images collections hash for their entries.
//
// Usage:
//   auto balances = sc::storage_map<sc::b256, u64>(store, sc::storage_field_key({"token", "balances"}));
//   auto owner = sc::storage_handle<sc::b256>(store, sc::storage_field_key({"owner"}));

namespace sc
{
/// Domain prefix of storage field key pre-images.
inline constexpr u8 storage_domain = 0;

inline constexpr std::string_view storage_top_level_namespace = "storage";
inline constexpr std::string_view storage_namespace_separator = "::";
inline constexpr std::string_view storage_field_separator = ".";
inline constexpr std::string_view struct_field_separator = ".";

/// Key string of a field path [ns1, ..., nsk, field].
/// Aborts if path is empty, in every build configuration.
[[nodiscard]] std::string storage_key_string(span<std::string_view const> path);

/// sha256(storage_domain ++ storage_key_string(path))
[[nodiscard]] b256 storage_field_key(span<std::string_view const> path);

/// Key of a (nested) struct field inside a storage field:
/// sha256(storage_domain ++ storage_key_string(path) ++ "." ++ join(struct_fields, ".")).
/// Equals storage_field_key(path) when struct_fields is empty.
[[nodiscard]] b256 storage_field_id(span<std::string_view const> path, span<std::string_view const> struct_fields);

/// Initial slots holding value at (key, offset), laid out exactly as write_packed would leave them in an
/// empty store: ceil((offset * 8 + size) / 32) slots keyed key, key + 1, ..., zero outside the value.
/// Zero-sized values produce no slots.
/// Usage:
///   backend.apply(sc::span<sc::storage_slot const>(sc::serialize_to_storage_slots(key, config{...})));
template <class T>
[[nodiscard]] std::vector<storage_slot> serialize_to_storage_slots(b256 const& key, T const& value, u64 offset = 0)
{
    static_assert(storable<T>, "storage values must be trivially copyable and default constructible");

    auto const n = isize(slots_needed(offset, u64(storage_size_of<T>)));
    std::vector<storage_slot> slots;
    if (n == 0)
        return slots;

    impl::slot_scratch scratch(n);
    impl::pack_into(scratch.slots(), offset, value);

    slots.reserve(size_t(n));
    for (isize i = 0; i < n; ++i)
        slots.push_back(storage_slot{.key = add_to_b256(key, u64(i)), .value = scratch.slots()[i]});
    return slots;
}
} // namespace sc
