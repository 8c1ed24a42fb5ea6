#pragma once

#include <cstddef>
#include <cstdint>


namespace sc
{

//
// Primitives
//

// Explicitly-sized primitive types
// Everything that ends up in a slot is described with these.
// In-memory sizes and counts use isize, on-store quantities (lengths, indices, word offsets) use u64
// because that is how they are persisted.

// signed integers
using i8 = int8_t;
using i16 = int16_t;
using i32 = int32_t;
using i64 = int64_t;

// unsigned integers
using u8 = uint8_t;
using u16 = uint16_t;
using u32 = uint32_t;
using u64 = uint64_t;

// generic bytes
using byte = std::byte;

// signed size type for in-memory buffers
using isize = i64;

// pointer
using nullptr_t = std::nullptr_t;

// `using namespace sc::primitive_defines;` brings the primitives above into scope without the rest of sc
namespace primitive_defines
{
using sc::i16;
using sc::i32;
using sc::i64;
using sc::i8;
using sc::isize;
using sc::u16;
using sc::u32;
using sc::u64;
using sc::u8;
} // namespace primitive_defines

//
// Slot store geometry
//

// bytes in one slot (four 64-bit words)
inline constexpr isize slot_size = 32;
// bytes in one word, the granularity of handle offsets
inline constexpr isize word_size = 8;

//
// Foundation
//

struct nullopt_t;
template <class T>
struct optional;

template <class T>
struct span;

//
// Keys and the host store
//

struct b256;
struct slot_store;
struct memory_slot_store;
struct sha256_hasher;
struct storage_slot;

//
// Typed storage
//

template <class T>
struct storage_handle;
template <class K, class V>
struct storage_map;
template <class V>
struct storage_vec;

} // namespace sc
