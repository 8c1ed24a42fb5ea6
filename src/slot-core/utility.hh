#pragma once

#include <slot-core/assert.hh>
#include <slot-core/fwd.hh>

#include <type_traits>

// =========================================================================================================
// Utility functions used across the storage layer
// =========================================================================================================
//
// Forwarding:
//   forward<T>(value)           - perfect forwarding for template arguments
//
// Integer division:
//   int_div_round_up(nom, denom) - divide integers and round up (nom >= 0, denom > 0)
//
// Byte order:
//   store_big_endian(dst, v)    - write an integer, enum or bool most significant byte first
//   load_big_endian<T>(src)     - inverse of store_big_endian
//
// Template metaprogramming:
//   always_false_t<T...>        - always false for static_assert with type parameters
//   function_ptr<Signature>     - convert function signature to function pointer type
//

namespace sc
{
// =========================================================================================================
// Forwarding
// =========================================================================================================

/// Perfect forwarding for template arguments
template <class T>
[[nodiscard]] SC_FORCE_INLINE constexpr T&& forward(T& value) noexcept
{
    return static_cast<T&&>(value);
}

template <class T>
[[nodiscard]] SC_FORCE_INLINE constexpr T&& forward(T&& value) noexcept // NOLINT
{
    return static_cast<T&&>(value);
}

// =========================================================================================================
// Integer division
// =========================================================================================================

/// Divide integers and round up: ceil(nom / denom)
/// Unlike the usual "(nom + denom - 1) / denom" this cannot overflow for large nom
/// nom == 0 yields 0, which is what slot counting needs for zero-sized values
/// Usage:
///   // int_div_round_up(33, 32) == 2
///   // int_div_round_up(0, 32) == 0
template <class T>
[[nodiscard]] constexpr T int_div_round_up(T nom, T denom)
{
    if constexpr (std::is_signed_v<T>)
        SC_ASSERT(nom >= 0, "int_div_round_up: nom must be non-negative");
    SC_ASSERT(denom > 0, "int_div_round_up: denom must be positive");
    return nom == 0 ? T(0) : T(1 + ((nom - 1) / denom));
}

// =========================================================================================================
// Byte order
// =========================================================================================================

/// Types whose persisted form is their value written big-endian, independent of the host.
/// bool is a single byte 0x00 / 0x01, signed integers are two's complement.
template <class T>
concept big_endian_scalar = std::is_integral_v<T> || std::is_enum_v<T>;

/// Writes v to dst[0 .. sizeof(T)), most significant byte first.
template <big_endian_scalar T>
constexpr void store_big_endian(byte* dst, T v)
{
    if constexpr (std::is_same_v<T, bool>)
    {
        dst[0] = byte(v ? 1 : 0);
    }
    else
    {
        using U = std::make_unsigned_t<T>;
        auto u = static_cast<U>(v);
        for (isize i = isize(sizeof(T)) - 1; i >= 0; --i)
        {
            dst[i] = byte(u & U(0xFF));
            if constexpr (sizeof(T) > 1)
                u >>= 8;
        }
    }
}

/// Reads a T written by store_big_endian from src[0 .. sizeof(T)).
/// Any non-zero byte reads as true for bool.
template <big_endian_scalar T>
[[nodiscard]] constexpr T load_big_endian(byte const* src)
{
    if constexpr (std::is_same_v<T, bool>)
    {
        return src[0] != byte(0);
    }
    else
    {
        using U = std::make_unsigned_t<T>;
        U u = 0;
        for (isize i = 0; i < isize(sizeof(T)); ++i)
            u = U((u << 8) | U(src[i]));
        return static_cast<T>(u);
    }
}

// =========================================================================================================
// Template metaprogramming utilities
// =========================================================================================================

/// Helper for indicating errors in static_asserts with dependent types
/// Usage:
///   static_assert(sc::always_false_t<T>, "T cannot be used as a storage key");
template <class... E>
constexpr bool always_false_t = false;

namespace impl
{
template <class T>
struct function_ptr_t
{
    static_assert(always_false_t<T>, "function_ptr should only be used with function signatures");
};
template <class R, class... Args>
struct function_ptr_t<R(Args...)>
{
    using type = R (*)(Args...);
};
template <class R, class... Args>
struct function_ptr_t<R(Args...) noexcept>
{
    using type = R (*)(Args...) noexcept;
};
} // namespace impl

/// Type alias for readable function pointer types
/// Usage:
///   sc::function_ptr<bool(b256 const&, isize)>  -> bool (*)(b256 const&, isize)
template <class T>
using function_ptr = typename impl::function_ptr_t<T>::type;

} // namespace sc
