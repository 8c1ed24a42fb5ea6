#include "memory_slot_store.hh"

#include <slot-core/assert.hh>

#include <functional>
#include <string_view>

sc::memory_slot_store::memory_slot_store()
{
    _store = slot_store{
        .load = load_fn,
        .store = store_fn,
        .clear = clear_fn,
        .userdata = this,
    };
}

size_t sc::memory_slot_store::key_hash::operator()(b256 const& key) const noexcept
{
    return std::hash<std::string_view>{}(std::string_view(reinterpret_cast<char const*>(key.data()), size_t(key.size())));
}

void sc::memory_slot_store::apply(span<storage_slot const> slots)
{
    for (auto const& s : slots)
        _slots[s.key] = s.value;
}

bool sc::memory_slot_store::is_set(b256 const& key) const
{
    return _slots.contains(key);
}

sc::optional<sc::b256> sc::memory_slot_store::peek(b256 const& key) const
{
    auto const it = _slots.find(key);
    if (it == _slots.end())
        return nullopt;
    return it->second;
}

void sc::memory_slot_store::reset_call_counters()
{
    _load_calls = 0;
    _store_calls = 0;
    _clear_calls = 0;
}

bool sc::memory_slot_store::load_fn(b256 const& key, b256* dst, isize n, void* userdata)
{
    SC_ASSERT(userdata != nullptr, "memory_slot_store table used without its backend");
    SC_ASSERT(dst != nullptr && n >= 0, "invalid load buffer");

    auto& self = *static_cast<memory_slot_store*>(userdata);
    ++self._load_calls;

    auto all_set = true;
    for (isize i = 0; i < n; ++i)
    {
        auto const it = self._slots.find(add_to_b256(key, u64(i)));
        if (it == self._slots.end())
        {
            dst[i] = b256::zero();
            all_set = false;
        }
        else
        {
            dst[i] = it->second;
        }
    }
    return all_set;
}

void sc::memory_slot_store::store_fn(b256 const& key, b256 const* src, isize n, void* userdata)
{
    SC_ASSERT(userdata != nullptr, "memory_slot_store table used without its backend");
    SC_ASSERT(src != nullptr && n >= 0, "invalid store buffer");

    auto& self = *static_cast<memory_slot_store*>(userdata);
    ++self._store_calls;

    for (isize i = 0; i < n; ++i)
        self._slots[add_to_b256(key, u64(i))] = src[i];
}

bool sc::memory_slot_store::clear_fn(b256 const& key, isize n, void* userdata)
{
    SC_ASSERT(userdata != nullptr, "memory_slot_store table used without its backend");
    SC_ASSERT(n >= 0, "invalid clear count");

    auto& self = *static_cast<memory_slot_store*>(userdata);
    ++self._clear_calls;

    auto all_set = true;
    for (isize i = 0; i < n; ++i)
        if (self._slots.erase(add_to_b256(key, u64(i))) == 0)
            all_set = false;
    return all_set;
}
