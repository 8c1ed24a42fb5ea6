#pragma once

#include <slot-core/b256.hh>
#include <slot-core/fwd.hh>
#include <slot-core/span.hh>

#include <string_view>

// OpenSSL's digest context, kept out of this header
struct evp_md_ctx_st;

/// Incremental SHA-256, the digest behind every derived storage key.
/// Owns an OpenSSL EVP_MD_CTX; move-only.
/// Usage:
///   sc::sha256_hasher h;
///   h.input(sc::span<sc::byte const>(key_bytes, 8));
///   h.input(base);
///   sc::b256 slot = h.finalize();
struct sc::sha256_hasher
{
    sha256_hasher();
    ~sha256_hasher();

    sha256_hasher(sha256_hasher&& rhs) noexcept;
    sha256_hasher& operator=(sha256_hasher&& rhs) noexcept;
    sha256_hasher(sha256_hasher const&) = delete;
    sha256_hasher& operator=(sha256_hasher const&) = delete;

    /// Appends bytes to the pre-image.
    void input(span<byte const> bytes);
    void input(b256 const& v);
    void input(std::string_view s);
    void input(u8 b);

    /// Returns the digest of everything appended so far and resets the hasher for reuse.
    [[nodiscard]] b256 finalize();

private:
    evp_md_ctx_st* _ctx = nullptr;
};

namespace sc
{
/// One-shot SHA-256 of a byte range.
[[nodiscard]] b256 sha256(span<byte const> bytes);
} // namespace sc
