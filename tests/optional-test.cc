#include <slot-core/b256.hh>
#include <slot-core/optional.hh>

#include <nexus/test.hh>

#include <abort-check.hh>

using namespace sc::primitive_defines;

// optional stays trivial, so it can be returned from every read without cost
static_assert(std::is_constructible_v<sc::optional<int>>);
static_assert(std::is_constructible_v<sc::optional<int>, int>);
static_assert(std::is_constructible_v<sc::optional<int>, sc::nullopt_t>);
static_assert(std::is_trivially_copyable_v<sc::optional<int>>);
static_assert(std::is_trivially_destructible_v<sc::optional<int>>);
static_assert(std::is_trivially_copyable_v<sc::optional<sc::b256>>);

namespace
{
template <class A, class B>
concept equality_comparable_with_value = requires(A const& a, B const& b) { a == b; };

struct point
{
    int x = 0;
    int y = 0;

    friend bool operator==(point const&, point const&) = default;
};
} // namespace

// no accidental comparison of a stored flag with a bool literal
static_assert(!equality_comparable_with_value<sc::optional<int>, bool>);
static_assert(equality_comparable_with_value<sc::optional<bool>, bool>);
static_assert(equality_comparable_with_value<sc::optional<u64>, int>);

TEST("optional - default and nullopt are empty")
{
    sc::optional<int> a;
    sc::optional<int> b = sc::nullopt;

    CHECK(!a.has_value());
    CHECK(!b.has_value());
    CHECK(a == sc::nullopt);
    CHECK(a == b);
}

TEST("optional - holds a value")
{
    sc::optional<int> o = 42;

    REQUIRE(o.has_value());
    CHECK(o.value() == 42);
    CHECK(o == 42);
    CHECK(o != 41);
    CHECK(o != sc::nullopt);

    o.value() = 7;
    CHECK(o == 7);
}

TEST("optional - value_or")
{
    sc::optional<u64> empty;
    sc::optional<u64> full = u64(3);

    CHECK(empty.value_or(0) == 0);
    CHECK(full.value_or(0) == 3);
}

TEST("optional - aggregates")
{
    auto const a = point{1, 2};
    auto const b = point{2, 1};
    sc::optional<point> p = a;

    REQUIRE(p.has_value());
    CHECK(p.value().x == 1);
    CHECK(p == a);
    CHECK(p != b);
    CHECK(p != sc::optional<point>());
}

TEST("optional - copies are independent")
{
    sc::optional<int> a = 1;
    auto b = a;
    b.value() = 2;

    CHECK(a == 1);
    CHECK(b == 2);

    a = sc::nullopt;
    CHECK(!a.has_value());
    CHECK(b.has_value());
}

TEST("optional - value of empty optional asserts")
{
    if (!SC_ASSERT_ENABLED)
        return;

    sc::optional<int> o;
    CHECK_ABORTS(o.value());
}
