#include "slot_store.hh"

#include <slot-core/assert.hh>

bool sc::load_slots(slot_store const& store, b256 const& key, span<b256> dst)
{
    SC_ASSERT(store.load != nullptr, "slot_store has no load function");
    SC_ASSERT(dst.size() > 0, "must load at least one slot");
    return store.load(key, dst.data(), dst.size(), store.userdata);
}

void sc::store_slots(slot_store const& store, b256 const& key, span<b256 const> src)
{
    SC_ASSERT(store.store != nullptr, "slot_store has no store function");
    SC_ASSERT(src.size() > 0, "must store at least one slot");
    store.store(key, src.data(), src.size(), store.userdata);
}

bool sc::clear_slots(slot_store const& store, b256 const& key, isize n)
{
    SC_ASSERT(store.clear != nullptr, "slot_store has no clear function");
    SC_ASSERT(n > 0, "must clear at least one slot");
    return store.clear(key, n, store.userdata);
}
