#ifndef FASTVLQ_CORE_CAPACITY_HPP
#define FASTVLQ_CORE_CAPACITY_HPP

// Capacity classes: which values encode to which byte count.
//
// Class K (1-based) of a width is either a marker class (K <= 8, encoded
// in K bytes with a marker bit) or the overflow class (K = 9, encoded in
// max_bytes bytes behind a zero byte). Class K starts at
//
//   base(K) = sum_{i=1}^{K-1} 2^(7i)
//
// so every marker class holds exactly 2^(7K) values, and the last class
// of each width runs to the top of the type. For 64 bits:
//
//   K  bytes  range
//   1  1      [0, 127]
//   2  2      [128, 16511]
//   3  3      [16512, 2113663]
//   ...
//   8  8      [567382630219904, 72624976668147839]
//   9  9      [72624976668147840, 2^64 - 1]

#include <cstddef>
#include <cstdint>

#include "fastvlq/core/bits.hpp"
#include "fastvlq/core/width.hpp"

namespace fastvlq {

// First value of class K. Only defined up to K = 9, which is as far as
// any width goes; 2^(7*8) still fits a uint64_t.
inline constexpr uint64_t classBase(int K) {
  uint64_t Base = 0;
  for (int I = 1; I < K; ++I)
    Base += uint64_t{1} << (7 * I);
  return Base;
}

template <typename W>
  requires ValidWidth<W>
struct Capacity {
  using value_type = uint_t<W::bits>;

  static constexpr int classes =
      W::marker_classes + (W::has_overflow_class ? 1 : 0);

  static constexpr bool isMarkerClass(int K) { return K <= W::marker_classes; }

  // Encoded byte count of class K.
  static constexpr int lengthOfClass(int K) {
    return isMarkerClass(K) ? K : W::max_bytes;
  }

  // Inverse of lengthOfClass for lengths the width actually uses.
  static constexpr int classOfLength(int Len) {
    return Len <= W::marker_classes ? Len : classes;
  }

  static constexpr value_type minValue(int K) {
    return static_cast<value_type>(classBase(K));
  }

  static constexpr value_type maxValue(int K) {
    if (K == classes)
      return max_unsigned<W::bits>;
    return static_cast<value_type>(classBase(K + 1) - 1);
  }

  // Smallest class holding V.
  static constexpr int classOf(value_type V) {
    for (int K = 1; K < classes; ++K)
      if (V <= maxValue(K))
        return K;
    return classes;
  }

  static constexpr size_t lengthOf(value_type V) {
    return static_cast<size_t>(lengthOfClass(classOf(V)));
  }

  // Bits of byte 0 below the marker that carry payload. Zero for the
  // overflow class, whose byte 0 is all prefix.
  static constexpr uint8_t payloadMask(int K) {
    return isMarkerClass(K) ? static_cast<uint8_t>(0x7F >> (K - 1)) : 0;
  }

  static constexpr uint8_t markerBit(int K) {
    return isMarkerClass(K) ? static_cast<uint8_t>(0x80 >> (K - 1)) : 0;
  }

  static_assert(classBase(classes) <= max_unsigned<W::bits>,
                "every class must start inside the width");
};

} // namespace fastvlq

#endif // FASTVLQ_CORE_CAPACITY_HPP
