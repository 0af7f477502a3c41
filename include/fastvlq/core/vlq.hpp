#ifndef FASTVLQ_CORE_VLQ_HPP
#define FASTVLQ_CORE_VLQ_HPP

#include <array>
#include <cstddef>
#include <cstdint>
#include <span>

#include "fastvlq/core/codec.hpp"
#include "fastvlq/core/errors.hpp"

namespace fastvlq {

// Vlq<Codec>: an integer held in its encoded form.
//
// Always holds a well-formed encoding, so len() and get() cannot fail.
// The fallible ways in, fromWide() and parse(), return a Result.
template <typename Codec>
  requires VlqCodec<Codec>
class Vlq {
public:
  using codec = Codec;
  using value_type = typename Codec::value_type;
  using wide_type = typename Codec::wide_type;
  using encoded_type = typename Codec::encoded_type;

  static constexpr int max_bytes = Codec::max_bytes;

  constexpr Vlq() : Enc(Codec::encode(value_type{0})) {}
  constexpr explicit Vlq(value_type V) : Enc(Codec::encode(V)) {}

  static constexpr Result<Vlq> fromWide(wide_type V) {
    auto E = Codec::encodeWide(V);
    if (!E.ok())
      return failure<Vlq>(E.Status);
    return success(Vlq(E.Value));
  }

  // Validates and copies the value at the front of Data. Bytes after
  // the value are ignored.
  static constexpr Result<Vlq> parse(const uint8_t *Data, size_t Size) {
    auto D = Codec::decode(Data, Size);
    if (!D.ok())
      return failure<Vlq>(D.Status);
    return success(Vlq(D.Value.Value));
  }

  static constexpr Result<Vlq> parse(std::span<const uint8_t> Bytes) {
    return parse(Bytes.data(), Bytes.size());
  }

  // Length of the encoding in bytes.
  constexpr size_t len() const { return Enc.size(); }

  constexpr value_type get() const {
    return Codec::decode(Enc.data(), Enc.size()).Value.Value;
  }

  // The whole fixed-size buffer, zero past len().
  constexpr const std::array<uint8_t, max_bytes> &bytes() const {
    return Enc.Bytes;
  }

  constexpr std::span<const uint8_t> asSlice() const { return Enc.asSlice(); }

  constexpr const encoded_type &encoded() const { return Enc; }

  constexpr explicit operator value_type() const { return get(); }

  friend constexpr bool operator==(const Vlq &A, const Vlq &B) {
    return A.Enc == B.Enc;
  }

private:
  constexpr explicit Vlq(const encoded_type &E) : Enc(E) {}

  encoded_type Enc;
};

// --- Convenience aliases ---

using Vu32 = Vlq<u32_codec>;
using Vu64 = Vlq<u64_codec>;
using Vu128 = Vlq<u128_codec>;
using Vi32 = Vlq<i32_codec>;
using Vi64 = Vlq<i64_codec>;
using Vi128 = Vlq<i128_codec>;

} // namespace fastvlq

#endif // FASTVLQ_CORE_VLQ_HPP
