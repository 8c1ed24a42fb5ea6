#pragma once

#include <slot-core/b256.hh>
#include <slot-core/fwd.hh>
#include <slot-core/span.hh>
#include <slot-core/utility.hh>

// sc::slot_store is the boundary to the host's persistent key-value substrate.
//
// The host owns a single global namespace of 32-byte slots addressed by 32-byte keys and offers exactly
// three primitives, each acting on n consecutive slots key, key + 1, ..., key + (n - 1):
//   load   - copy n slots out, report whether all of them had been set
//   store  - copy n slots in, marking them set
//   clear  - mark n slots unset, report whether all of them had been set
//
// Failures are reported as booleans, never thrown. Writes to a valid key always succeed.
// Any backend fits behind this table: a contract VM's state intrinsics, a database, or
// sc::memory_slot_store for tests.
//
// Like a memory resource, this is a POD table of function pointers plus userdata rather than a virtual
// interface: it is trivially copyable, can live in the data segment, and handles can point at it freely.

struct sc::slot_store
{
    /// Copy the n slots starting at `key` into dst[0 .. n).
    /// Returns true iff every one of the n slots had previously been stored (and not cleared since).
    /// Unset slots may be left untouched; callers hand in zeroed buffers.
    sc::function_ptr<bool(b256 const& key, b256* dst, isize n, void* userdata)> load = nullptr;

    /// Write src[0 .. n) into the n slots starting at `key`.
    sc::function_ptr<void(b256 const& key, b256 const* src, isize n, void* userdata)> store = nullptr;

    /// Mark the n slots starting at `key` as unset.
    /// Returns true iff every one of the n slots had been set before the call.
    sc::function_ptr<bool(b256 const& key, isize n, void* userdata)> clear = nullptr;

    /// Backend state, passed back to every call. Can be nullptr for stateless backends.
    void* userdata = nullptr;
};

/// One slot with its key, as found in initial storage listings.
struct sc::storage_slot
{
    b256 key;
    b256 value;

    [[nodiscard]] friend constexpr bool operator==(storage_slot const&, storage_slot const&) = default;
};

namespace sc
{
/// slot_load: fills dst with dst.size() consecutive slots starting at key.
[[nodiscard]] bool load_slots(slot_store const& store, b256 const& key, span<b256> dst);

/// slot_store: writes src.size() consecutive slots starting at key.
void store_slots(slot_store const& store, b256 const& key, span<b256 const> src);

/// slot_clear: unsets n consecutive slots starting at key.
[[nodiscard]] bool clear_slots(slot_store const& store, b256 const& key, isize n);
} // namespace sc
