#ifndef FASTVLQ_IO_STREAM_HPP
#define FASTVLQ_IO_STREAM_HPP

// Blocking adapters over std::istream / std::ostream.
//
// readVlq pulls byte 0, sizes the rest of the read with peekLength, and
// pulls exactly the remaining bytes. Nothing is written or read beyond
// the encoding itself: no length field, no checksum.
//
// The error policy picks between a returned status (errors::ReturnStatus)
// and a thrown VlqError (errors::Trap).

#include <array>
#include <cstddef>
#include <cstdint>
#include <istream>
#include <ostream>

#include "fastvlq/core/codec.hpp"
#include "fastvlq/core/errors.hpp"
#include "fastvlq/core/vlq.hpp"

namespace fastvlq {

template <typename Codec, typename Err = errors::Default>
  requires VlqCodec<Codec> && ErrorPolicy<Err>
Result<typename Codec::value_type> readVlq(std::istream &In) {
  using T = typename Codec::value_type;
  std::array<uint8_t, Codec::max_bytes> Buf{};

  char First;
  if (!In.get(First))
    return report<Err>(failure<T>(Errc::StreamError));
  Buf[0] = static_cast<uint8_t>(First);

  Result<size_t> Len = Codec::peekLength(Buf[0]);
  if (!Len.ok())
    return report<Err>(failure<T>(Len.Status));

  if (Len.Value > 1) {
    auto Rest = static_cast<std::streamsize>(Len.Value - 1);
    In.read(reinterpret_cast<char *>(Buf.data() + 1), Rest);
    if (In.gcount() != Rest)
      return report<Err>(failure<T>(Errc::TruncatedInput));
  }

  auto D = Codec::decode(Buf.data(), Len.Value);
  if (!D.ok())
    return report<Err>(failure<T>(D.Status));
  return report<Err>(success(D.Value.Value));
}

// Returns the number of bytes written.
template <typename Codec, typename Err = errors::Default>
  requires VlqCodec<Codec> && ErrorPolicy<Err>
Result<size_t> writeVlq(std::ostream &Out, typename Codec::value_type V) {
  auto E = Codec::encode(V);
  Out.write(reinterpret_cast<const char *>(E.data()),
            static_cast<std::streamsize>(E.size()));
  if (!Out)
    return report<Err>(failure<size_t>(Errc::StreamError));
  return report<Err>(success(E.size()));
}

template <typename Err = errors::Default, typename Codec>
  requires ErrorPolicy<Err>
Result<size_t> writeVlq(std::ostream &Out, const Vlq<Codec> &V) {
  Out.write(reinterpret_cast<const char *>(V.asSlice().data()),
            static_cast<std::streamsize>(V.len()));
  if (!Out)
    return report<Err>(failure<size_t>(Errc::StreamError));
  return report<Err>(success(V.len()));
}

// --- Per-type shorthands ---

template <typename Err = errors::Default>
Result<uint32_t> readVu32(std::istream &In) {
  return readVlq<u32_codec, Err>(In);
}
template <typename Err = errors::Default>
Result<uint64_t> readVu64(std::istream &In) {
  return readVlq<u64_codec, Err>(In);
}
template <typename Err = errors::Default>
Result<uint128_t> readVu128(std::istream &In) {
  return readVlq<u128_codec, Err>(In);
}
template <typename Err = errors::Default>
Result<int32_t> readVi32(std::istream &In) {
  return readVlq<i32_codec, Err>(In);
}
template <typename Err = errors::Default>
Result<int64_t> readVi64(std::istream &In) {
  return readVlq<i64_codec, Err>(In);
}
template <typename Err = errors::Default>
Result<int128_t> readVi128(std::istream &In) {
  return readVlq<i128_codec, Err>(In);
}

template <typename Err = errors::Default>
Result<size_t> writeVu32(std::ostream &Out, uint32_t V) {
  return writeVlq<u32_codec, Err>(Out, V);
}
template <typename Err = errors::Default>
Result<size_t> writeVu64(std::ostream &Out, uint64_t V) {
  return writeVlq<u64_codec, Err>(Out, V);
}
template <typename Err = errors::Default>
Result<size_t> writeVu128(std::ostream &Out, uint128_t V) {
  return writeVlq<u128_codec, Err>(Out, V);
}
template <typename Err = errors::Default>
Result<size_t> writeVi32(std::ostream &Out, int32_t V) {
  return writeVlq<i32_codec, Err>(Out, V);
}
template <typename Err = errors::Default>
Result<size_t> writeVi64(std::ostream &Out, int64_t V) {
  return writeVlq<i64_codec, Err>(Out, V);
}
template <typename Err = errors::Default>
Result<size_t> writeVi128(std::ostream &Out, int128_t V) {
  return writeVlq<i128_codec, Err>(Out, V);
}

} // namespace fastvlq

#endif // FASTVLQ_IO_STREAM_HPP
