#ifndef FASTVLQ_CORE_BITS_HPP
#define FASTVLQ_CORE_BITS_HPP

// uint_t<N> / int_t<N>: the native storage type for an N-bit value.
//
// The codec is written once against these aliases and instantiated for
// N = 32, 64 and 128. 128-bit storage is the compiler's __int128, which
// both GCC and Clang provide on 64-bit targets.

#include <bit>
#include <cstdint>

namespace fastvlq {

#if defined(__SIZEOF_INT128__)

using uint128_t = unsigned __int128;
using int128_t = __int128;

#else
#error "Requires a compiler with __int128 support"
#endif

namespace detail {

template <int N>
struct BitsStorage {
  static_assert(N == 32 || N == 64 || N == 128,
                "supported widths are 32, 64 and 128 bits");
};

template <>
struct BitsStorage<32> {
  using unsigned_type = uint32_t;
  using signed_type = int32_t;
};

template <>
struct BitsStorage<64> {
  using unsigned_type = uint64_t;
  using signed_type = int64_t;
};

template <>
struct BitsStorage<128> {
  using unsigned_type = uint128_t;
  using signed_type = int128_t;
};

} // namespace detail

template <int N>
using uint_t = typename detail::BitsStorage<N>::unsigned_type;

template <int N>
using int_t = typename detail::BitsStorage<N>::signed_type;

// All-ones value of an N-bit unsigned type.
template <int N>
inline constexpr uint_t<N> max_unsigned = ~uint_t<N>{0};

template <int N>
inline constexpr int_t<N> max_signed =
    static_cast<int_t<N>>(max_unsigned<N> >> 1);

template <int N>
inline constexpr int_t<N> min_signed = -max_signed<N> - 1;

// Leading zero bits of a single byte (8 for zero).
constexpr int countLeadingZeros(uint8_t Byte) { return std::countl_zero(Byte); }

} // namespace fastvlq

#endif // FASTVLQ_CORE_BITS_HPP
