#ifndef FASTVLQ_CORE_ZIGZAG_HPP
#define FASTVLQ_CORE_ZIGZAG_HPP

// Zigzag: signed <-> unsigned bijection ordered by magnitude.
//
//   0 -> 0, -1 -> 1, 1 -> 2, -2 -> 3, 2 -> 4, ...
//
// All arithmetic is done on the unsigned type; the right shift of the
// signed input is arithmetic (guaranteed since C++20).

#include "fastvlq/core/bits.hpp"

namespace fastvlq {

template <int N>
constexpr uint_t<N> zigzag(int_t<N> V) {
  using U = uint_t<N>;
  return static_cast<U>(static_cast<U>(V) << 1) ^ static_cast<U>(V >> (N - 1));
}

template <int N>
constexpr int_t<N> unzigzag(uint_t<N> V) {
  using U = uint_t<N>;
  U SignMask = static_cast<U>(~(V & U{1}) + U{1}); // 0 or all ones
  return static_cast<int_t<N>>(static_cast<U>(V >> 1) ^ SignMask);
}

} // namespace fastvlq

#endif // FASTVLQ_CORE_ZIGZAG_HPP
