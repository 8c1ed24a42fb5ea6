#pragma once

#include <slot-core/b256.hh>
#include <slot-core/fwd.hh>
#include <slot-core/key_encoding.hh>
#include <slot-core/optional.hh>
#include <slot-core/slot_store.hh>
#include <slot-core/storage_codec.hh>
#include <slot-core/storage_handle.hh>

/// Persistent associative container from K to V, addressed purely by hashing.
///
/// The entry for `key` lives at offset 0 of slot
///
///   key_for(key) = sha256(serialize(key) ++ base)
///
/// Mixing the base into every entry address gives each map instance its own address space: two maps with
/// distinct bases never share an entry, even for identical keys. Access cost is one hash plus one store
/// round trip, independent of the number of entries.
///
/// There is no key set: entries cannot be enumerated or counted, and there is no ordering.
/// Entries are created by insert, overwritten by insert, and destroyed only by remove.
///
/// Usage:
///   auto balances = sc::storage_map<sc::b256, u64>(store, sc::storage_field_key({"token", "balances"}));
///   balances.insert(owner, 1000);
///   auto b = balances.get(owner).try_read().value_or(0);
template <class K, class V>
struct sc::storage_map
{
    static_assert(storable<V>, "storage values must be trivially copyable and default constructible");

    // construction
public:
    /// The store must outlive the map. Callers choose distinct bases for distinct maps.
    storage_map(slot_store const& store, b256 const& base) : _store(&store), _base(base) {}

    // access
public:
    /// Slot holding the entry for key.
    [[nodiscard]] b256 key_for(K const& key) const { return derive_key(key, _base); }

    /// Handle to the entry for key, whether or not a value is present.
    /// The caller decides via read() or try_read() whether absence is fatal.
    [[nodiscard]] storage_handle<V> get(K const& key) const { return storage_handle<V>(*_store, key_for(key)); }

    // modifiers
public:
    /// Stores value for key, fully replacing any previous value.
    void insert(K const& key, V const& value) { write_packed<V>(*_store, key_for(key), 0, value); }

    /// Stores value only if key has no value yet.
    /// Returns nullopt if the value was inserted, otherwise the value already present (which is kept).
    [[nodiscard]] optional<V> try_insert(K const& key, V const& value)
    {
        auto const handle = get(key);
        auto const existing = handle.try_read();
        if (existing.has_value())
            return existing;

        handle.write(value);
        return nullopt;
    }

    /// Unsets the entry for key.
    /// Returns true iff a value had been stored there.
    bool remove(K const& key) { return clear_packed<V>(*_store, key_for(key)); }

    // queries
public:
    [[nodiscard]] b256 const& base() const { return _base; }

    // members
private:
    slot_store const* _store;
    b256 _base;
};
