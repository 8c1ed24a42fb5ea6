#include <slot-core/memory_slot_store.hh>
#include <slot-core/storage_layout.hh>
#include <slot-core/storage_map.hh>

#include <nexus/test.hh>

#include <abort-check.hh>

#include <string>

using namespace sc::primitive_defines;

namespace
{
struct allowance
{
    u64 amount = 0;
    u64 expiry = 0;

    friend bool operator==(allowance const&, allowance const&) = default;
};

struct unit
{
};
} // namespace

TEST("storage_map - insert and get")
{
    sc::memory_slot_store backend;
    auto map = sc::storage_map<u64, u64>(backend.store(), sc::storage_field_key({"balances"}));

    CHECK(map.get(1).try_read() == sc::nullopt);

    map.insert(1, 100);
    map.insert(2, 200);

    CHECK(map.get(1).read() == 100);
    CHECK(map.get(2).read() == 200);
    CHECK(map.get(3).try_read() == sc::nullopt);

    SECTION("insert overwrites")
    {
        map.insert(1, 101);
        CHECK(map.get(1).read() == 101);
        CHECK(map.get(2).read() == 200);
    }

    SECTION("get on an absent key aborts on read")
    {
        CHECK_ABORTS(map.get(3).read());
    }
}

TEST("storage_map - entries live at sha256(key ++ base)")
{
    sc::memory_slot_store backend;
    auto const base = sc::b256::from_u64(77);
    auto map = sc::storage_map<u64, u64>(backend.store(), base);

    map.insert(5, 9);

    auto const slot = sc::derive_key(u64(5), base);
    CHECK(map.key_for(5) == slot);
    CHECK(map.get(5).slot() == slot);
    CHECK(map.get(5).offset() == 0);
    CHECK(backend.is_set(slot));
    CHECK(map.base() == base);
}

TEST("storage_map - distinct bases do not share entries")
{
    sc::memory_slot_store backend;
    auto a = sc::storage_map<u64, u64>(backend.store(), sc::storage_field_key({"token", "balances"}));
    auto b = sc::storage_map<u64, u64>(backend.store(), sc::storage_field_key({"token", "allowances"}));

    a.insert(1, 10);
    b.insert(1, 20);

    CHECK(a.get(1).read() == 10);
    CHECK(b.get(1).read() == 20);

    CHECK(a.remove(1));
    CHECK(a.get(1).try_read() == sc::nullopt);
    CHECK(b.get(1).read() == 20);
}

TEST("storage_map - multi-slot values and string keys")
{
    sc::memory_slot_store backend;
    auto map = sc::storage_map<std::string, allowance>(backend.store(), sc::storage_field_key({"allowances"}));

    auto const v = allowance{.amount = 5, .expiry = 1000};
    map.insert("alice", v);

    CHECK(map.get("alice").read() == v);
    CHECK(map.get("bob").try_read() == sc::nullopt);
}

TEST("storage_map - try_insert")
{
    sc::memory_slot_store backend;
    auto map = sc::storage_map<sc::b256, u64>(backend.store(), sc::storage_field_key({"owners"}));
    auto const k = sc::b256::from_u64(1);

    CHECK(map.try_insert(k, 1) == sc::nullopt);
    CHECK(map.get(k).read() == 1);

    // existing value is kept and returned
    CHECK(map.try_insert(k, 2) == 1);
    CHECK(map.get(k).read() == 1);
}

TEST("storage_map - remove")
{
    sc::memory_slot_store backend;
    auto map = sc::storage_map<u64, allowance>(backend.store(), sc::storage_field_key({"allowances"}));

    CHECK(!map.remove(1));

    map.insert(1, allowance{.amount = 1, .expiry = 2});
    CHECK(map.remove(1));
    CHECK(map.get(1).try_read() == sc::nullopt);
    CHECK(backend.slot_count() == 0);
    CHECK(!map.remove(1));

    // a removed key can be inserted again
    map.insert(1, allowance{});
    CHECK(map.get(1).try_read().has_value());
}

TEST("storage_map - zero-sized values")
{
    sc::memory_slot_store backend;
    auto map = sc::storage_map<u64, unit>(backend.store(), sc::b256::from_u64(1));

    map.insert(1, unit{});
    CHECK(map.get(1).try_read() == sc::nullopt);
    CHECK(map.remove(1));
    CHECK(backend.store_calls() == 0);
}
