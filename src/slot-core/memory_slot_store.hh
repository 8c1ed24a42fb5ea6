#pragma once

#include <slot-core/b256.hh>
#include <slot-core/fwd.hh>
#include <slot-core/optional.hh>
#include <slot-core/slot_store.hh>
#include <slot-core/span.hh>

#include <unordered_map>

/// In-memory slot store backend.
/// Holds set slots in a hash map; an absent entry is an unset slot.
/// Exposes the standard sc::slot_store table via store(), whose userdata points back at this object,
/// so the object is neither copyable nor movable.
/// Counts host calls so tests can observe exactly how much traffic an operation causes.
/// Not thread-safe.
///
/// Usage:
///   sc::memory_slot_store backend;
///   auto balances = sc::storage_map<u64, u64>(backend.store(), sc::storage_field_key({"balances"}));
///   balances.insert(7, 100);
struct sc::memory_slot_store
{
    memory_slot_store();

    memory_slot_store(memory_slot_store const&) = delete;
    memory_slot_store& operator=(memory_slot_store const&) = delete;
    memory_slot_store(memory_slot_store&&) = delete;
    memory_slot_store& operator=(memory_slot_store&&) = delete;

    /// The slot_store table bound to this backend.
    [[nodiscard]] slot_store const& store() const { return _store; }

    // direct inspection and seeding (bypasses the call counters)
public:
    /// Writes every (key, value) pair, e.g. the initial slots of a storage declaration.
    void apply(span<storage_slot const> slots);

    /// True if the slot at key is set.
    [[nodiscard]] bool is_set(b256 const& key) const;

    /// Content of the slot at key, nullopt if unset.
    [[nodiscard]] optional<b256> peek(b256 const& key) const;

    /// Number of set slots.
    [[nodiscard]] isize slot_count() const { return isize(_slots.size()); }

    // host traffic
public:
    [[nodiscard]] isize load_calls() const { return _load_calls; }
    [[nodiscard]] isize store_calls() const { return _store_calls; }
    [[nodiscard]] isize clear_calls() const { return _clear_calls; }

    void reset_call_counters();

private:
    struct key_hash
    {
        size_t operator()(b256 const& key) const noexcept;
    };

    static bool load_fn(b256 const& key, b256* dst, isize n, void* userdata);
    static void store_fn(b256 const& key, b256 const* src, isize n, void* userdata);
    static bool clear_fn(b256 const& key, isize n, void* userdata);

    std::unordered_map<b256, b256, key_hash> _slots;
    slot_store _store;

    isize _load_calls = 0;
    isize _store_calls = 0;
    isize _clear_calls = 0;
};
