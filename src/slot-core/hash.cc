#include "hash.hh"

#include <slot-core/assert.hh>

#include <openssl/evp.h>

// libcrypto failures here mean a broken crypto installation, never bad input,
// so they abort like any other violated invariant.

sc::sha256_hasher::sha256_hasher() : _ctx(EVP_MD_CTX_new())
{
    SC_ASSERT_ALWAYS(_ctx != nullptr, "EVP_MD_CTX_new failed");
    SC_ASSERT_ALWAYS(EVP_DigestInit_ex(_ctx, EVP_sha256(), nullptr) == 1, "EVP_DigestInit_ex failed for sha256");
}

sc::sha256_hasher::~sha256_hasher()
{
    if (_ctx)
        EVP_MD_CTX_free(_ctx);
}

sc::sha256_hasher::sha256_hasher(sha256_hasher&& rhs) noexcept : _ctx(rhs._ctx)
{
    rhs._ctx = nullptr;
}

sc::sha256_hasher& sc::sha256_hasher::operator=(sha256_hasher&& rhs) noexcept
{
    if (this != &rhs)
    {
        if (_ctx)
            EVP_MD_CTX_free(_ctx);
        _ctx = rhs._ctx;
        rhs._ctx = nullptr;
    }
    return *this;
}

void sc::sha256_hasher::input(span<byte const> bytes)
{
    SC_ASSERT(_ctx != nullptr, "input on a moved-from sha256_hasher");
    if (bytes.empty())
        return;
    SC_ASSERT_ALWAYS(EVP_DigestUpdate(_ctx, bytes.data(), size_t(bytes.size())) == 1, "EVP_DigestUpdate failed");
}

void sc::sha256_hasher::input(b256 const& v)
{
    input(span<byte const>(v.data(), v.size()));
}

void sc::sha256_hasher::input(std::string_view s)
{
    input(span<byte const>(reinterpret_cast<byte const*>(s.data()), isize(s.size())));
}

void sc::sha256_hasher::input(u8 b)
{
    auto const v = byte(b);
    input(span<byte const>(&v, 1));
}

sc::b256 sc::sha256_hasher::finalize()
{
    SC_ASSERT(_ctx != nullptr, "finalize on a moved-from sha256_hasher");

    b256 digest;
    unsigned int len = 0;
    SC_ASSERT_ALWAYS(EVP_DigestFinal_ex(_ctx, reinterpret_cast<unsigned char*>(digest.data()), &len) == 1,
                     "EVP_DigestFinal_ex failed");
    SC_ASSERT_ALWAYS(len == unsigned(slot_size), "sha256 digest must be 32 bytes");

    // ready for the next pre-image
    SC_ASSERT_ALWAYS(EVP_DigestInit_ex(_ctx, EVP_sha256(), nullptr) == 1, "EVP_DigestInit_ex failed for sha256");
    return digest;
}

sc::b256 sc::sha256(span<byte const> bytes)
{
    sha256_hasher h;
    h.input(bytes);
    return h.finalize();
}
