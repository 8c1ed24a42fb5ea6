#pragma once

#include <slot-core/assert.hh>
#include <slot-core/b256.hh>
#include <slot-core/fwd.hh>
#include <slot-core/optional.hh>
#include <slot-core/slot_store.hh>
#include <slot-core/storage_codec.hh>

/// Typed reference to one value in the slot store: the T that starts `offset` words into the slot at `slot`.
/// Pure value type, trivially copyable, created ad hoc by collections and never persisted itself.
/// Every call is an independent round trip to the store: nothing is cached or batched.
///
/// Two read flavors:
///   read()      - the value must be there; absence aborts the invocation
///   try_read()  - absence is an expected case and yields nullopt
///
/// Usage:
///   auto total = sc::storage_handle<u64>(store, sc::storage_field_key({"total_supply"}));
///   total.write(total.try_read().value_or(0) + minted);
template <class T>
struct sc::storage_handle
{
    static_assert(storable<T>, "storage values must be trivially copyable and default constructible");

    // construction
public:
    /// The store must outlive the handle.
    storage_handle(slot_store const& store, b256 const& slot, u64 offset = 0)
      : _store(&store), _slot(slot), _offset(offset)
    {
    }

    // access
public:
    /// Reads the value; aborts the invocation if it was never written (or was cleared).
    /// Use when absence is a programming error.
    [[nodiscard]] T read() const
    {
        auto const v = read_packed<T>(*_store, _slot, _offset);
        SC_ASSERT_ALWAYS(v.has_value(), "storage_handle::read of a value that was never set");
        return v.value();
    }

    /// Reads the value, nullopt if it was never written (or was cleared).
    [[nodiscard]] optional<T> try_read() const { return read_packed<T>(*_store, _slot, _offset); }

    /// Writes the value, preserving whatever else shares its first and last slot.
    void write(T const& value) const { write_packed<T>(*_store, _slot, _offset, value); }

    /// Unsets every slot this value covers.
    /// Returns true iff all of them had been set.
    /// NOTE: slots are the unit of clearing, so neighbors sharing those slots are cleared as well.
    bool clear() const { return clear_packed<T>(*_store, _slot, _offset); }

    // location
public:
    [[nodiscard]] b256 const& slot() const { return _slot; }
    [[nodiscard]] u64 offset() const { return _offset; }
    [[nodiscard]] slot_store const& store() const { return *_store; }

    // members
private:
    slot_store const* _store;
    b256 _slot;
    u64 _offset;
};
