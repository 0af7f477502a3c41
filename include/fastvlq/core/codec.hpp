#ifndef FASTVLQ_CORE_CODEC_HPP
#define FASTVLQ_CORE_CODEC_HPP

// The length-prefix codec, written once and instantiated per width.
//
// Byte layout of class K (see capacity.hpp):
//
//   marker class:   [0 x (K-1)][1][payload ...]   K bytes
//   overflow class: [0000_0000][payload ...]      max_bytes bytes
//
// payload = value - base(K), stored big-endian so that its most
// significant bits sit directly below the marker bit. The byte count is
// known from byte 0 alone, before any payload is read.

#include <array>
#include <concepts>
#include <cstddef>
#include <cstdint>
#include <span>

#include "fastvlq/core/bits.hpp"
#include "fastvlq/core/capacity.hpp"
#include "fastvlq/core/errors.hpp"
#include "fastvlq/core/width.hpp"
#include "fastvlq/core/zigzag.hpp"

namespace fastvlq {

// Fixed-size, stack-resident encoding buffer. Bytes past Length are zero.
template <int MaxBytes>
struct EncodedBytes {
  std::array<uint8_t, MaxBytes> Bytes{};
  uint8_t Length = 0;

  constexpr size_t size() const { return Length; }
  constexpr const uint8_t *data() const { return Bytes.data(); }
  constexpr const uint8_t *begin() const { return Bytes.data(); }
  constexpr const uint8_t *end() const { return Bytes.data() + Length; }
  constexpr uint8_t operator[](size_t I) const { return Bytes[I]; }

  constexpr std::span<const uint8_t> asSlice() const {
    return {Bytes.data(), Length};
  }

  friend constexpr bool operator==(const EncodedBytes &A,
                                   const EncodedBytes &B) {
    if (A.Length != B.Length)
      return false;
    for (size_t I = 0; I < A.Length; ++I)
      if (A.Bytes[I] != B.Bytes[I])
        return false;
    return true;
  }
};

template <typename T>
struct Decoded {
  T Value{};
  size_t Consumed = 0;
};

// ===================================================================
// UnsignedCodec
// ===================================================================

template <typename W>
  requires ValidWidth<W>
struct UnsignedCodec {
  using width = W;
  using capacity = Capacity<W>;
  using value_type = uint_t<W::bits>;
  using wide_type = uint128_t;
  using encoded_type = EncodedBytes<W::max_bytes>;

  static constexpr int bits = W::bits;
  static constexpr int max_bytes = W::max_bytes;
  static constexpr bool is_signed = false;

  static constexpr size_t encodedLength(value_type V) {
    return capacity::lengthOf(V);
  }

  static constexpr encoded_type encode(value_type V) {
    encoded_type Out;
    int K = capacity::classOf(V);
    int Len = capacity::lengthOfClass(K);
    value_type Payload = V - capacity::minValue(K);
    for (int I = Len - 1; I >= 0; --I) {
      Out.Bytes[I] = static_cast<uint8_t>(Payload & value_type{0xFF});
      Payload >>= 8;
    }
    Out.Bytes[0] |= capacity::markerBit(K);
    Out.Length = static_cast<uint8_t>(Len);
    return Out;
  }

  // Rejects values that do not fit the width instead of truncating.
  static constexpr Result<encoded_type> encodeWide(wide_type V) {
    if (V > static_cast<wide_type>(max_unsigned<bits>))
      return failure<encoded_type>(Errc::OutOfRange);
    return success(encode(static_cast<value_type>(V)));
  }

  // Byte count of the value starting with First.
  static constexpr Result<size_t> peekLength(uint8_t First) {
    int Zeros = countLeadingZeros(First);
    if (Zeros < 8) {
      if (Zeros + 1 > W::marker_classes)
        return failure<size_t>(Errc::InvalidPrefix);
      return success(static_cast<size_t>(Zeros + 1));
    }
    if constexpr (W::has_overflow_class)
      return success(static_cast<size_t>(max_bytes));
    else
      return failure<size_t>(Errc::InvalidPrefix);
  }

  // Decodes one value from the front of [Data, Data + Size). Trailing
  // bytes are left alone; Consumed says where the next value starts.
  static constexpr Result<Decoded<value_type>> decode(const uint8_t *Data,
                                                      size_t Size) {
    using R = Decoded<value_type>;
    if (Size == 0)
      return failure<R>(Errc::TruncatedInput);

    Result<size_t> Len = peekLength(Data[0]);
    if (!Len.ok())
      return failure<R>(Len.Status);
    if (Size < Len.Value)
      return failure<R>(Errc::TruncatedInput);

    int K = capacity::classOfLength(static_cast<int>(Len.Value));
    value_type Payload = Data[0] & capacity::payloadMask(K);
    for (size_t I = 1; I < Len.Value; ++I) {
      // A wider type's encoding can carry more payload than fits here.
      if ((Payload >> (bits - 8)) != 0)
        return failure<R>(Errc::OutOfRange);
      Payload = static_cast<value_type>(Payload << 8) | Data[I];
    }

    value_type Base = capacity::minValue(K);
    if (Payload > max_unsigned<bits> - Base)
      return failure<R>(Errc::OutOfRange);
    return success(R{static_cast<value_type>(Base + Payload), Len.Value});
  }

  static constexpr Result<Decoded<value_type>>
  decode(std::span<const uint8_t> Bytes) {
    return decode(Bytes.data(), Bytes.size());
  }

  static constexpr Result<Decoded<wide_type>> decodeWide(const uint8_t *Data,
                                                         size_t Size) {
    auto D = decode(Data, Size);
    if (!D.ok())
      return failure<Decoded<wide_type>>(D.Status);
    return success(
        Decoded<wide_type>{static_cast<wide_type>(D.Value.Value),
                           D.Value.Consumed});
  }
};

// ===================================================================
// SignedCodec: zigzag in front of the unsigned codec
// ===================================================================

template <typename W>
  requires ValidWidth<W>
struct SignedCodec {
  using width = W;
  using unsigned_codec = UnsignedCodec<W>;
  using value_type = int_t<W::bits>;
  using wide_type = int128_t;
  using encoded_type = typename unsigned_codec::encoded_type;

  static constexpr int bits = W::bits;
  static constexpr int max_bytes = W::max_bytes;
  static constexpr bool is_signed = true;

  static constexpr size_t encodedLength(value_type V) {
    return unsigned_codec::encodedLength(zigzag<bits>(V));
  }

  static constexpr encoded_type encode(value_type V) {
    return unsigned_codec::encode(zigzag<bits>(V));
  }

  static constexpr Result<encoded_type> encodeWide(wide_type V) {
    if (V < static_cast<wide_type>(min_signed<bits>) ||
        V > static_cast<wide_type>(max_signed<bits>))
      return failure<encoded_type>(Errc::OutOfRange);
    return success(encode(static_cast<value_type>(V)));
  }

  static constexpr Result<size_t> peekLength(uint8_t First) {
    return unsigned_codec::peekLength(First);
  }

  static constexpr Result<Decoded<value_type>> decode(const uint8_t *Data,
                                                      size_t Size) {
    using R = Decoded<value_type>;
    auto D = unsigned_codec::decode(Data, Size);
    if (!D.ok())
      return failure<R>(D.Status);
    return success(R{unzigzag<bits>(D.Value.Value), D.Value.Consumed});
  }

  static constexpr Result<Decoded<value_type>>
  decode(std::span<const uint8_t> Bytes) {
    return decode(Bytes.data(), Bytes.size());
  }

  static constexpr Result<Decoded<wide_type>> decodeWide(const uint8_t *Data,
                                                         size_t Size) {
    auto D = decode(Data, Size);
    if (!D.ok())
      return failure<Decoded<wide_type>>(D.Status);
    return success(
        Decoded<wide_type>{static_cast<wide_type>(D.Value.Value),
                           D.Value.Consumed});
  }
};

template <typename C>
concept VlqCodec = requires {
  typename C::value_type;
  typename C::wide_type;
  typename C::encoded_type;
  { C::bits } -> std::convertible_to<int>;
  { C::max_bytes } -> std::convertible_to<int>;
  { C::is_signed } -> std::convertible_to<bool>;
};

// --- The six instantiations ---

using u32_codec = UnsignedCodec<width32>;
using u64_codec = UnsignedCodec<width64>;
using u128_codec = UnsignedCodec<width128>;
using i32_codec = SignedCodec<width32>;
using i64_codec = SignedCodec<width64>;
using i128_codec = SignedCodec<width128>;

static_assert(VlqCodec<u32_codec>);
static_assert(VlqCodec<u64_codec>);
static_assert(VlqCodec<u128_codec>);
static_assert(VlqCodec<i32_codec>);
static_assert(VlqCodec<i64_codec>);
static_assert(VlqCodec<i128_codec>);

} // namespace fastvlq

#endif // FASTVLQ_CORE_CODEC_HPP
