#include <slot-core/b256.hh>

#include <nexus/test.hh>

#include <string>

using namespace sc::primitive_defines;

static_assert(std::is_trivially_copyable_v<sc::b256>);
static_assert(sizeof(sc::b256) == 32);

TEST("b256 - zero and from_u64")
{
    CHECK(sc::b256() == sc::b256::zero());

    auto const v = sc::b256::from_u64(0x0102030405060708);
    for (auto i = 0; i < 24; ++i)
        CHECK(v.bytes[i] == sc::byte(0));
    CHECK(v.bytes[24] == sc::byte(0x01));
    CHECK(v.bytes[31] == sc::byte(0x08));
}

TEST("b256 - hex round trip")
{
    auto const text = std::string("0x00000000000000000000000000000000000000000000000000000000000000ff");

    auto const v = sc::b256::from_hex(text);
    REQUIRE(v.has_value());
    CHECK(v.value() == sc::b256::from_u64(255));
    CHECK(sc::to_string(v.value()) == text);

    SECTION("prefix is optional and case does not matter")
    {
        auto const w = sc::b256::from_hex("00000000000000000000000000000000000000000000000000000000000000FF");
        CHECK(w == v);
    }

    SECTION("malformed input")
    {
        CHECK(!sc::b256::from_hex("").has_value());
        CHECK(!sc::b256::from_hex("0x00").has_value());
        CHECK(!sc::b256::from_hex("0x000000000000000000000000000000000000000000000000000000000000000g").has_value());
        CHECK(!sc::b256::from_hex("0x0000000000000000000000000000000000000000000000000000000000000000ff").has_value());
    }
}

TEST("b256 - ordering is big-endian")
{
    CHECK(sc::b256::from_u64(1) < sc::b256::from_u64(2));
    CHECK(sc::b256::from_u64(0xFF) < sc::b256::from_u64(0x100));

    auto high = sc::b256();
    high.bytes[0] = sc::byte(1);
    CHECK(sc::b256::from_u64(~u64(0)) < high);
}

TEST("b256 - add_to_b256")
{
    CHECK(sc::add_to_b256(sc::b256::from_u64(5), 0) == sc::b256::from_u64(5));
    CHECK(sc::add_to_b256(sc::b256::from_u64(5), 3) == sc::b256::from_u64(8));

    SECTION("carry across bytes")
    {
        CHECK(sc::add_to_b256(sc::b256::from_u64(0xFF), 1) == sc::b256::from_u64(0x100));
        CHECK(sc::add_to_b256(sc::b256::from_u64(0xFFFF), 0xFFFF) == sc::b256::from_u64(0x1FFFE));
    }

    SECTION("carry beyond the low 64 bits")
    {
        auto const r = sc::add_to_b256(sc::b256::from_u64(~u64(0)), 1);
        CHECK(r.bytes[23] == sc::byte(1));
        for (auto i = 24; i < 32; ++i)
            CHECK(r.bytes[i] == sc::byte(0));
    }

    SECTION("wraps around at 2^256")
    {
        sc::b256 max;
        for (auto& b : max.bytes)
            b = sc::byte(0xFF);

        CHECK(sc::add_to_b256(max, 1) == sc::b256::zero());
        CHECK(sc::add_to_b256(max, 3) == sc::b256::from_u64(2));
    }
}
