#pragma once

#include <slot-core/assert.hh>
#include <slot-core/b256.hh>
#include <slot-core/fwd.hh>
#include <slot-core/optional.hh>
#include <slot-core/slot_store.hh>
#include <slot-core/span.hh>
#include <slot-core/utility.hh>

#include <concepts>
#include <cstring>
#include <memory>
#include <type_traits>

// =========================================================================================================
// Packing codec
// =========================================================================================================
//
// Moves typed values in and out of whole 32-byte slots.
//
// A value of storage_size_of<T> bytes placed `offset` words into the slot at `key` covers
//
//   slots_needed(offset, size) = ceil((offset * 8 + size) / 32)
//
// consecutive slots. Values smaller than a slot, or not slot-aligned, share their first/last slot with
// whatever else was packed there, so every write is a read-modify-write over the covered slots.
//
//   write_packed<T>(store, key, offset, value)  - load n, overlay value at byte offset*8, store n
//   read_packed<T>(store, key, offset)          - load n, nullopt unless all n slots were set
//   clear_packed<T>(store, key, offset)         - one clear call over the covered slots
//
// Zero-sized values (empty class types) are never stored: writes issue no host call, reads return
// nullopt, clears report true.
//
// Integers, enums and bools are packed big-endian (bool as one byte 0x00 / 0x01), so a u64 of 1 at
// offset 0 sets byte 7 of its slot on every host. Other types are packed as their object representation,
// so storable types are trivially copyable.

namespace sc
{
/// A type whose object representation can be packed into slots.
template <class T>
concept storable = std::is_trivially_copyable_v<T> && std::is_default_constructible_v<T>;

/// Bytes a value of type T occupies in storage; empty class types are zero-sized.
template <class T>
inline constexpr isize storage_size_of = std::is_empty_v<T> ? 0 : isize(sizeof(T));

/// Number of consecutive slots covered by size_bytes starting offset_words into the first slot.
/// Usage:
///   // slots_needed(0, 8) == 1
///   // slots_needed(3, 16) == 2   (bytes 24 .. 40 straddle the first boundary)
///   // slots_needed(0, 0) == 0
[[nodiscard]] constexpr u64 slots_needed(u64 offset_words, u64 size_bytes)
{
    return int_div_round_up(offset_words * u64(word_size) + size_bytes, u64(slot_size));
}

namespace impl
{
// word offsets beyond this overflow the byte arithmetic
inline constexpr u64 max_word_offset = u64(1) << 56;

/// Zero-initialized scratch slots for one read-modify-write.
/// Values up to four slots (128 bytes) stay on the stack.
struct slot_scratch
{
    explicit slot_scratch(isize n) : _size(n)
    {
        SC_ASSERT(n >= 0, "slot count must be non-negative");
        if (n > inline_slots)
            _heap = std::make_unique<b256[]>(size_t(n)); // value-initialized: all zero
    }

    [[nodiscard]] span<b256> slots() { return span<b256>(_heap ? _heap.get() : _inline, _size); }
    [[nodiscard]] byte* bytes() { return reinterpret_cast<byte*>(_heap ? _heap.get() : _inline); }

private:
    static constexpr isize inline_slots = 4;

    b256 _inline[inline_slots];
    std::unique_ptr<b256[]> _heap;
    isize _size = 0;
};

/// Copies value's bytes to byte offset*8 of the given slots, leaving every other byte untouched.
template <class T>
void pack_into(span<b256> slots, u64 offset, T const& value)
{
    constexpr auto size = storage_size_of<T>;
    SC_ASSERT(isize(offset) * word_size + size <= slots.size() * slot_size, "value does not fit into the given slots");

    auto const dst = reinterpret_cast<byte*>(slots.data()) + offset * word_size;
    if constexpr (big_endian_scalar<T>)
        store_big_endian(dst, value);
    else
        std::memcpy(dst, &value, size_t(size));
}

/// Inverse of pack_into.
template <class T>
[[nodiscard]] T unpack_from(byte const* slot_bytes, u64 offset)
{
    auto const src = slot_bytes + offset * word_size;
    if constexpr (big_endian_scalar<T>)
    {
        return load_big_endian<T>(src);
    }
    else
    {
        T value;
        std::memcpy(&value, src, size_t(storage_size_of<T>));
        return value;
    }
}
} // namespace impl

/// Writes value at (key, offset), preserving neighboring bytes in the first and last covered slot.
/// Unset slots in the covered range are treated as zero.
template <class T>
void write_packed(slot_store const& store, b256 const& key, u64 offset, T const& value)
{
    static_assert(storable<T>, "storage values must be trivially copyable and default constructible");

    constexpr auto size = storage_size_of<T>;
    if constexpr (size == 0)
    {
        SC_UNUSED(store);
        SC_UNUSED(key);
        SC_UNUSED(offset);
        SC_UNUSED(value);
    }
    else
    {
        SC_ASSERT(offset < impl::max_word_offset, "word offset out of range");

        auto const n = isize(slots_needed(offset, u64(size)));
        impl::slot_scratch scratch(n);

        // whether all covered slots were set does not matter here: unset ones read as zero
        static_cast<void>(load_slots(store, key, scratch.slots()));

        impl::pack_into(scratch.slots(), offset, value);
        store_slots(store, key, span<b256 const>(scratch.slots().data(), n));
    }
}

/// Reads the value at (key, offset).
/// Returns nullopt if any covered slot is unset, or if T is zero-sized.
template <class T>
[[nodiscard]] optional<T> read_packed(slot_store const& store, b256 const& key, u64 offset)
{
    static_assert(storable<T>, "storage values must be trivially copyable and default constructible");

    constexpr auto size = storage_size_of<T>;
    if constexpr (size == 0)
    {
        SC_UNUSED(store);
        SC_UNUSED(key);
        SC_UNUSED(offset);
        return nullopt;
    }
    else
    {
        SC_ASSERT(offset < impl::max_word_offset, "word offset out of range");

        auto const n = isize(slots_needed(offset, u64(size)));
        impl::slot_scratch scratch(n);

        if (!load_slots(store, key, scratch.slots()))
            return nullopt;

        return impl::unpack_from<T>(scratch.bytes(), offset);
    }
}

/// Unsets every slot covered by a T at (key, offset) with a single clear call.
/// Returns true iff all of them had been set.
template <class T>
[[nodiscard]] bool clear_packed(slot_store const& store, b256 const& key, u64 offset = 0)
{
    static_assert(storable<T>, "storage values must be trivially copyable and default constructible");

    constexpr auto size = storage_size_of<T>;
    if constexpr (size == 0)
    {
        SC_UNUSED(store);
        SC_UNUSED(key);
        SC_UNUSED(offset);
        return true;
    }
    else
    {
        SC_ASSERT(offset < impl::max_word_offset, "word offset out of range");
        return clear_slots(store, key, isize(slots_needed(offset, u64(size))));
    }
}
} // namespace sc
