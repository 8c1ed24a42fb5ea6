#include <slot-core/hash.hh>

#include <nexus/test.hh>

#include <string>
#include <utility>

using namespace sc::primitive_defines;

namespace
{
sc::b256 hex(char const* s)
{
    return sc::b256::from_hex(s).value();
}
} // namespace

TEST("sha256 - known digests")
{
    sc::sha256_hasher h;
    CHECK(h.finalize() == hex("e3b0c44298fc1c149afbf4c8996fb92427ae41e4649b934ca495991b7852b855"));

    h.input(std::string_view("abc"));
    CHECK(h.finalize() == hex("ba7816bf8f01cfea414140de5dae2223b00361a396177a9cb410ff61f20015ad"));

    CHECK(sc::sha256(sc::span<sc::byte const>()) == hex("e3b0c44298fc1c149afbf4c8996fb92427ae41e4649b934ca495991b7852b855"));
}

TEST("sha256 - incremental input equals one-shot")
{
    auto const text = std::string("abcdbcdecdefdefgefghfghighijhijkijkljklmklmnlmnomnopnopq");

    sc::sha256_hasher h;
    h.input(std::string_view(text).substr(0, 10));
    h.input(std::string_view(text).substr(10));
    auto const incremental = h.finalize();

    auto const one_shot = sc::sha256(sc::span<sc::byte const>(reinterpret_cast<sc::byte const*>(text.data()), isize(text.size())));

    CHECK(incremental == one_shot);
    CHECK(incremental == hex("248d6a61d20638b8e5c026930c3e6039a33ce45964ff2167f6ecedd419db06c1"));
}

TEST("sha256 - typed inputs")
{
    auto const key = sc::b256::from_u64(7);

    sc::sha256_hasher a;
    a.input(u8(1));
    a.input(key);

    sc::byte raw[33] = {};
    raw[0] = sc::byte(1);
    raw[32] = sc::byte(7);

    CHECK(a.finalize() == sc::sha256(sc::span<sc::byte const>(raw)));
}

TEST("sha256 - hasher is reusable after finalize and movable")
{
    sc::sha256_hasher a;
    a.input(std::string_view("abc"));
    auto const first = a.finalize();

    a.input(std::string_view("abc"));
    CHECK(a.finalize() == first);

    a.input(std::string_view("abc"));
    auto b = std::move(a);
    CHECK(b.finalize() == first);
}
