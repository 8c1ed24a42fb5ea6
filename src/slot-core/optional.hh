#pragma once

#include <slot-core/assert.hh>
#include <slot-core/fwd.hh>
#include <slot-core/utility.hh>

#include <type_traits>

/// Sentinel type used to represent the "no value" state in optional.
/// Construct as sc::nullopt to explicitly assign or compare against empty optionals.
/// Deliberately lacks a default constructor to avoid ambiguity in optional<T> = {}.
struct sc::nullopt_t
{
    enum class _ctor_tag // NOLINT(readability-identifier-naming)
    {
        tag
    };
    explicit constexpr nullopt_t(_ctor_tag) {}
};

namespace sc
{
/// The canonical instance of nullopt_t.
constexpr nullopt_t nullopt = nullopt_t{nullopt_t::_ctor_tag::tag};
} // namespace sc

/// Result of a storage lookup: either a value of type T or nothing (the slots were never set).
/// Everything that travels through slots is trivially copyable, so this optional is only defined for
/// trivially copyable T and is itself trivially copyable.
/// Same safe subset as a general optional: no operator* or operator->, equality only.
template <class T>
struct sc::optional
{
    static_assert(std::is_trivially_copyable_v<T>, "sc::optional only holds trivially copyable values");

    // construction
public:
    /// Default optional is empty: has_value() == false.
    constexpr optional() : _empty() {}

    /// Constructs an optional holding the given value.
    template <class U = std::remove_cv_t<T>>
        requires(!std::is_same_v<std::remove_cvref_t<U>, optional> && !std::is_same_v<std::remove_cvref_t<U>, nullopt_t>)
    explicit(!std::is_convertible_v<U, T>) constexpr optional(U&& value) // NOLINT
      : _value(sc::forward<U>(value)), _has_value(true)
    {
    }

    /// Constructs an empty optional from sc::nullopt.
    constexpr optional(nullopt_t) : _empty() {}

    // queries and access
public:
    /// Returns true if this optional holds a value, false if empty.
    [[nodiscard]] constexpr bool has_value() const { return _has_value; }

    /// Returns the held value.
    /// Precondition: has_value() == true.
    [[nodiscard]] constexpr T& value()
    {
        SC_ASSERT(_has_value, "attempted to access value of empty optional");
        return _value;
    }
    [[nodiscard]] constexpr T const& value() const
    {
        SC_ASSERT(_has_value, "attempted to access value of empty optional");
        return _value;
    }

    /// Returns the held value or the given fallback when empty.
    /// Usage: auto len = length_handle.try_read().value_or(0);
    [[nodiscard]] constexpr T value_or(T const& fallback) const { return _has_value ? _value : fallback; }

    // comparison
public:
    /// Two optionals are equal if both are empty or both hold equal values.
    [[nodiscard]] friend constexpr bool operator==(optional const& lhs, optional const& rhs)
        requires requires(T v) { bool(v == v); }
    {
        if (lhs._has_value != rhs._has_value)
            return false;
        if (lhs._has_value)
            return lhs._value == rhs._value;
        return true;
    }

    /// An optional equals a value if it holds an equal value.
    [[nodiscard]] friend constexpr bool operator==(optional const& lhs, T const& rhs)
        requires requires(T v) { bool(v == v); }
    {
        return lhs._has_value && lhs._value == rhs;
    }

    /// An optional equals nullopt if it is empty.
    [[nodiscard]] friend constexpr bool operator==(optional const& lhs, nullopt_t) { return !lhs._has_value; }

    /// Prevents optional<int> from silently comparing with true/false.
    /// Only an actual bool argument is caught, so optional<u64> == 1 still compares values.
    template <class B>
        requires(std::is_same_v<B, bool> && !std::is_same_v<T, bool>)
    [[nodiscard]] bool operator==(B) const = delete;

    // members
private:
    union
    {
        char _empty;
        T _value;
    };

    bool _has_value = false;
};
