#include "b256.hh"

namespace
{
constexpr char hex_digits[] = "0123456789abcdef";

int hex_value(char c)
{
    if (c >= '0' && c <= '9')
        return c - '0';
    if (c >= 'a' && c <= 'f')
        return c - 'a' + 10;
    if (c >= 'A' && c <= 'F')
        return c - 'A' + 10;
    return -1;
}
} // namespace

sc::b256 sc::b256::from_u64(u64 v)
{
    b256 r;
    for (isize i = slot_size - 1; i >= slot_size - 8; --i)
    {
        r.bytes[i] = byte(v & 0xFF);
        v >>= 8;
    }
    return r;
}

sc::optional<sc::b256> sc::b256::from_hex(std::string_view hex)
{
    if (hex.starts_with("0x") || hex.starts_with("0X"))
        hex.remove_prefix(2);

    if (isize(hex.size()) != 2 * slot_size)
        return nullopt;

    b256 r;
    for (isize i = 0; i < slot_size; ++i)
    {
        auto const hi = hex_value(hex[2 * i]);
        auto const lo = hex_value(hex[2 * i + 1]);
        if (hi < 0 || lo < 0)
            return nullopt;
        r.bytes[i] = byte((hi << 4) | lo);
    }
    return r;
}

sc::b256 sc::add_to_b256(b256 const& key, u64 n)
{
    auto r = key;

    // schoolbook addition from the least significant byte, carry runs off the top
    u64 carry = n;
    for (isize i = slot_size - 1; i >= 0 && carry != 0; --i)
    {
        auto const sum = u64(r.bytes[i]) + (carry & 0xFF);
        r.bytes[i] = byte(sum & 0xFF);
        carry = (carry >> 8) + (sum >> 8);
    }
    return r;
}

std::string sc::to_string(b256 const& v)
{
    std::string s;
    s.reserve(2 + 2 * slot_size);
    s += "0x";
    for (auto const b : v.bytes)
    {
        s += hex_digits[u8(b) >> 4];
        s += hex_digits[u8(b) & 0xF];
    }
    return s;
}
