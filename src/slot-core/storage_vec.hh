#pragma once

#include <slot-core/assert.hh>
#include <slot-core/b256.hh>
#include <slot-core/fwd.hh>
#include <slot-core/key_encoding.hh>
#include <slot-core/optional.hh>
#include <slot-core/slot_store.hh>
#include <slot-core/span.hh>
#include <slot-core/storage_codec.hh>
#include <slot-core/storage_handle.hh>

#include <vector>

/// Persistent growable array of V.
///
/// Layout:
///   length     u64 at offset 0 of slot `base` (unset reads as 0: a never-pushed vector is empty)
///   element i  offset 0 of slot sha256(serialize(u64 i) ++ base)
///
/// Every element has its own independent address, so growth never moves anything and push is O(1)
/// without any capacity strategy. The stored length is the single source of truth for which indices are
/// valid: shrinking operations only lower it and leave the element slots physically populated
/// (a later push silently overwrites them). Nothing is ever reclaimed.
///
/// Out-of-bounds mutation aborts the invocation; out-of-bounds lookup (get, first, last) yields nullopt.
///
/// Cost in slot round trips:
///   push, pop, get, set, swap_remove, swap, first, last, len   - O(1)
///   remove(i), insert(i)                                       - O(len - i), expensive for large vectors
///   reverse, fill, resize, load_vec, store_vec                 - O(len)
///   append(other)                                              - O(other.len())
///
/// Usage:
///   auto owners = sc::storage_vec<sc::b256>(store, sc::storage_field_key({"registry", "owners"}));
///   owners.push(owner);
///   if (auto h = owners.get(0); h.has_value())
///       use(h.value().read());
template <class V>
struct sc::storage_vec
{
    static_assert(storable<V>, "storage values must be trivially copyable and default constructible");
    static_assert(storage_size_of<V> > 0, "storage_vec elements must not be zero-sized");

    // construction
public:
    /// The store must outlive the vector. Callers choose distinct bases for distinct vectors.
    storage_vec(slot_store const& store, b256 const& base) : _store(&store), _base(base) {}

    // queries
public:
    /// Number of elements, 0 if the length was never written.
    [[nodiscard]] u64 len() const { return length_handle().try_read().value_or(0); }

    [[nodiscard]] bool is_empty() const { return len() == 0; }

    [[nodiscard]] b256 const& base() const { return _base; }

    /// Slot holding element index (regardless of whether index is currently valid).
    [[nodiscard]] b256 key_for(u64 index) const { return derive_key(index, _base); }

    // element access
public:
    /// Handle to element index, nullopt if index >= len().
    [[nodiscard]] optional<storage_handle<V>> get(u64 index) const
    {
        if (index >= len())
            return nullopt;
        return element(index);
    }

    /// Handle to the first element, nullopt if empty.
    [[nodiscard]] optional<storage_handle<V>> first() const
    {
        if (len() == 0)
            return nullopt;
        return element(0);
    }

    /// Handle to the last element, nullopt if empty.
    [[nodiscard]] optional<storage_handle<V>> last() const
    {
        auto const n = len();
        if (n == 0)
            return nullopt;
        return element(n - 1);
    }

    /// Reads every element into memory, in index order.
    [[nodiscard]] std::vector<V> load_vec() const
    {
        auto const n = len();
        std::vector<V> values;
        values.reserve(size_t(n));
        for (u64 i = 0; i < n; ++i)
            values.push_back(element(i).read());
        return values;
    }

    // modifiers - growth
public:
    /// Appends value.
    void push(V const& value)
    {
        auto const n = len();
        element(n).write(value);
        set_len(n + 1);
    }

    /// Inserts value at index, shifting index .. len-1 up by one.
    /// Aborts if index > len(). index == len() is a push.
    void insert(u64 index, V const& value)
    {
        auto const n = len();
        SC_ASSERT_ALWAYS(index <= n, "storage_vec::insert index out of bounds");

        if (index == n)
        {
            push(value);
            return;
        }

        // descending, so no source is overwritten before it has been moved
        for (auto i = n; i > index; --i)
            element(i).write(element(i - 1).read());

        element(index).write(value);
        set_len(n + 1);
    }

    /// Lowers or raises the length to new_len.
    /// Growing writes value at every new index; shrinking only lowers the length.
    void resize(u64 new_len, V const& value)
    {
        auto const n = len();
        for (auto i = n; i < new_len; ++i)
            element(i).write(value);
        set_len(new_len);
    }

    /// Moves every element of other onto the end of this vector, leaving other empty.
    /// Aborts if other is this vector (same store and base).
    void append(storage_vec& other)
    {
        SC_ASSERT_ALWAYS(other._store != _store || other._base != _base, "storage_vec::append of a vector onto itself");

        auto const n = len();
        auto const m = other.len();
        for (u64 i = 0; i < m; ++i)
            element(n + i).write(other.element(i).read());

        set_len(n + m);
        other.set_len(0);
    }

    /// Replaces the whole content with values: writes indices 0 .. size-1, then sets the length.
    /// Elements beyond the new length are left as garbage.
    void store_vec(span<V const> values)
    {
        for (isize i = 0; i < values.size(); ++i)
            element(u64(i)).write(values[i]);
        set_len(u64(values.size()));
    }

    // modifiers - in place
public:
    /// Overwrites element index. Aborts if index >= len().
    void set(u64 index, V const& value)
    {
        SC_ASSERT_ALWAYS(index < len(), "storage_vec::set index out of bounds");
        element(index).write(value);
    }

    /// Exchanges elements i and j. Aborts if either is out of bounds.
    void swap(u64 i, u64 j)
    {
        auto const n = len();
        SC_ASSERT_ALWAYS(i < n, "storage_vec::swap first index out of bounds");
        SC_ASSERT_ALWAYS(j < n, "storage_vec::swap second index out of bounds");

        if (i == j)
            return;

        auto const a = element(i);
        auto const b = element(j);
        auto const va = a.read();
        a.write(b.read());
        b.write(va);
    }

    /// Reverses the order of all elements.
    void reverse()
    {
        auto const n = len();
        if (n < 2)
            return;

        for (u64 i = 0, j = n - 1; i < j; ++i, --j)
        {
            auto const a = element(i);
            auto const b = element(j);
            auto const va = a.read();
            a.write(b.read());
            b.write(va);
        }
    }

    /// Overwrites every element with value.
    void fill(V const& value)
    {
        auto const n = len();
        for (u64 i = 0; i < n; ++i)
            element(i).write(value);
    }

    // modifiers - shrinking
public:
    /// Removes and returns the last element.
    /// nullopt if empty, or if the element's slots were cleared through a handle; the length drops either way.
    /// The slot of the removed element stays populated.
    [[nodiscard]] optional<V> pop()
    {
        auto const n = len();
        if (n == 0)
            return nullopt;

        set_len(n - 1);
        return element(n - 1).try_read();
    }

    /// Removes and returns element index, shifting index+1 .. len-1 down by one (order preserved).
    /// Aborts if index >= len().
    V remove(u64 index)
    {
        auto const n = len();
        SC_ASSERT_ALWAYS(index < n, "storage_vec::remove index out of bounds");

        auto const removed = element(index).read();
        for (auto i = index + 1; i < n; ++i)
            element(i - 1).write(element(i).read());

        set_len(n - 1);
        return removed;
    }

    /// Removes and returns element index, moving the last element into its place (order not preserved).
    /// Aborts if index >= len().
    V swap_remove(u64 index)
    {
        auto const n = len();
        SC_ASSERT_ALWAYS(index < n, "storage_vec::swap_remove index out of bounds");

        auto const target = element(index);
        auto const removed = target.read();
        if (index != n - 1)
            target.write(element(n - 1).read());

        set_len(n - 1);
        return removed;
    }

    /// Resets the length to 0. Element slots are not cleared and become unreachable.
    void clear() { set_len(0); }

    // helper
private:
    [[nodiscard]] storage_handle<u64> length_handle() const { return storage_handle<u64>(*_store, _base, 0); }
    [[nodiscard]] storage_handle<V> element(u64 index) const { return storage_handle<V>(*_store, key_for(index)); }

    void set_len(u64 n) { length_handle().write(n); }

    // members
private:
    slot_store const* _store;
    b256 _base;
};
