#include "storage_layout.hh"

#include <slot-core/assert.hh>
#include <slot-core/hash.hh>

std::string sc::storage_key_string(span<std::string_view const> path)
{
    SC_ASSERT_ALWAYS(!path.empty(), "storage field path must contain at least the field name");

    std::string s(storage_top_level_namespace);
    if (path.size() == 1)
    {
        s += storage_field_separator;
        s += path[0];
        return s;
    }

    for (isize i = 0; i + 1 < path.size(); ++i)
    {
        s += storage_namespace_separator;
        s += path[i];
    }
    s += storage_field_separator;
    s += path[path.size() - 1];
    return s;
}

sc::b256 sc::storage_field_key(span<std::string_view const> path)
{
    sha256_hasher h;
    h.input(storage_domain);
    h.input(storage_key_string(path));
    return h.finalize();
}

sc::b256 sc::storage_field_id(span<std::string_view const> path, span<std::string_view const> struct_fields)
{
    auto s = storage_key_string(path);
    for (auto const& f : struct_fields)
    {
        s += struct_field_separator;
        s += f;
    }

    sha256_hasher h;
    h.input(storage_domain);
    h.input(s);
    return h.finalize();
}
