#pragma once

#include <cstddef>
#include <cstdint>


namespace lw
{

//
// Primitives
//

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

// floating point
using f32 = float;
using f64 = double;

// generic bytes
using byte = std::byte;

// signed size type
// Sizes and indices are signed i64 instead of size_t:
// * "size - 1" on an empty container must not wrap to a huge positive number
// * mixed signed/unsigned arithmetic is a major source of implicit conversion bugs
// * negative values double as sentinels (e.g. "no limit" or "allocation failed")
// * we only target 64-bit platforms, so the range is plenty
// Lengths read from the wire are u64 and must be range-checked before they become an isize.
using isize = i64;

// pointer
using nullptr_t = std::nullptr_t;

//
// Memory
//

struct memory_resource;
template <class T>
struct allocation;
template <class T>
struct partial_init_guard;
template <class T>
struct resource_allocator;

//
// Views
//

template <class T>
struct span;

//
// Results and errors
//

template <class T, class E>
struct result;
template <class E>
struct as_error_t;

struct out_of_memory;
struct decode_error;
struct encode_error;

//
// Container
//

template <class T, class U>
struct pair;

template <class T, class ContainerT>
struct allocating_container;

template <class T>
struct array;
template <class T>
struct vector;
template <class T>
struct devector;
struct string;

template <class T>
struct set;
template <class K, class V>
struct map;
struct less;
template <class T, class LessT = less>
struct priority_queue;

//
// Pointer wrappers
//

template <class T>
struct box;
template <class T>
struct rc;
template <class T>
struct arc;
template <class T>
struct cow;

//
// Wire layer
//

struct config;
template <class T>
struct decoded;
struct decode_budget;

struct slice_reader;
struct vector_writer;
struct slice_writer;
struct size_writer;

template <class WriterT>
struct encoder;
template <class ReaderT>
struct decoder;

template <class T>
struct codec;

} // namespace lw
