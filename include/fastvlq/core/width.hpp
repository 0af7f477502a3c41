#ifndef FASTVLQ_CORE_WIDTH_HPP
#define FASTVLQ_CORE_WIDTH_HPP

#include <concepts>

namespace fastvlq {

// Width: bit width of the integer type and the longest encoding it may
// take. Says nothing about signedness; that is the codec's job.
//
// Byte 0 of an encoding carries a unary length prefix: L-1 zero bits
// followed by a marker bit. Eight bits leave room for eight marker
// classes; a width that needs more bytes than that gets one extra
// markerless "overflow" class, selected by byte 0 == 0x00 and always
// exactly MaxBytes long.
template <int Bits, int MaxBytes>
struct Width {
  static constexpr int bits = Bits;
  static constexpr int max_bytes = MaxBytes;

  static constexpr bool has_overflow_class = MaxBytes > 8;
  static constexpr int marker_classes = has_overflow_class ? 8 : MaxBytes;

  // Payload bits carried by the longest encoding.
  static constexpr int capacity_bits =
      has_overflow_class ? 8 * (MaxBytes - 1) : 7 * MaxBytes;

  static_assert(Bits == 32 || Bits == 64 || Bits == 128,
                "supported widths are 32, 64 and 128 bits");
  static_assert(MaxBytes >= 1, "an encoding is at least one byte");
  static_assert(capacity_bits >= Bits,
                "the longest encoding must cover the full width");
  static_assert(!has_overflow_class || 7 * 8 < Bits,
                "overflow class is only needed beyond eight marker classes");
};

template <typename W>
concept ValidWidth = requires {
  { W::bits } -> std::convertible_to<int>;
  { W::max_bytes } -> std::convertible_to<int>;
  { W::marker_classes } -> std::convertible_to<int>;
  { W::has_overflow_class } -> std::convertible_to<bool>;
} && (W::marker_classes >= 1) && (W::marker_classes <= 8) &&
    (W::max_bytes >= W::marker_classes);

// Named widths. max_bytes is the number of bytes needed to cover the
// width: 7-bit groups for 32 bits, a full-width tail after the eight
// marker classes for 64 and 128 bits.
using width32 = Width<32, 5>;
using width64 = Width<64, 9>;
using width128 = Width<128, 18>;

static_assert(ValidWidth<width32>);
static_assert(ValidWidth<width64>);
static_assert(ValidWidth<width128>);

} // namespace fastvlq

#endif // FASTVLQ_CORE_WIDTH_HPP
