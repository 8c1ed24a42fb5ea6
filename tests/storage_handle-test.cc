#include <slot-core/memory_slot_store.hh>
#include <slot-core/storage_handle.hh>

#include <nexus/test.hh>

#include <abort-check.hh>

#include <string>

using namespace sc::primitive_defines;

static_assert(std::is_trivially_copyable_v<sc::storage_handle<u64>>);

namespace
{
struct position
{
    i64 x = 0;
    i64 y = 0;
    i64 z = 0;

    friend bool operator==(position const&, position const&) = default;
};
} // namespace

TEST("storage_handle - write then read")
{
    sc::memory_slot_store backend;
    auto const h = sc::storage_handle<u64>(backend.store(), sc::b256::from_u64(1));

    CHECK(h.try_read() == sc::nullopt);

    h.write(17);
    CHECK(h.read() == 17);
    CHECK(h.try_read() == 17);

    h.write(18);
    CHECK(h.read() == 18);
}

TEST("storage_handle - copies address the same value")
{
    sc::memory_slot_store backend;
    auto const a = sc::storage_handle<position>(backend.store(), sc::b256::from_u64(1), 2);
    auto const b = a;

    auto const p = position{.x = 1, .y = -2, .z = 3};
    a.write(p);
    CHECK(b.read() == p);

    CHECK(b.slot() == sc::b256::from_u64(1));
    CHECK(b.offset() == 2);
    CHECK(&b.store() == &backend.store());
}

TEST("storage_handle - handles at different offsets share a slot")
{
    sc::memory_slot_store backend;
    auto const key = sc::b256::from_u64(9);
    auto const lo = sc::storage_handle<u32>(backend.store(), key, 0);
    auto const hi = sc::storage_handle<u32>(backend.store(), key, 1);

    lo.write(1);
    hi.write(2);

    CHECK(lo.read() == 1);
    CHECK(hi.read() == 2);
    CHECK(backend.slot_count() == 1);
}

TEST("storage_handle - read of an unset value aborts")
{
    sc::memory_slot_store backend;
    auto const h = sc::storage_handle<u64>(backend.store(), sc::b256::from_u64(1));

    std::string message;
    CHECK(sc_test::aborts([&] { static_cast<void>(h.read()); }, &message));
    CHECK(message == "storage_handle::read of a value that was never set");

    h.write(0);
    CHECK_NOT_ABORTS(h.read());
}

TEST("storage_handle - clear")
{
    sc::memory_slot_store backend;
    auto const h = sc::storage_handle<position>(backend.store(), sc::b256::from_u64(1), 3);

    CHECK(!h.clear());

    h.write(position{});
    CHECK(h.try_read().has_value());

    CHECK(h.clear());
    CHECK(h.try_read() == sc::nullopt);
    CHECK(backend.slot_count() == 0);
    CHECK_ABORTS(h.read());
}
