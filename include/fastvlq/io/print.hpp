#ifndef FASTVLQ_IO_PRINT_HPP
#define FASTVLQ_IO_PRINT_HPP

// Text forms of encoded values:
//
//   operator<<     : the decoded number, in decimal
//   toDebugString  : type name plus the encoded bytes in binary,
//                    e.g. Vu64(0b01000000_10000000)
//
// The standard streams have no overload for __int128, so 128-bit values
// go through toDecimalString.

#include <algorithm>
#include <cstdint>
#include <ostream>
#include <string>

#include "fastvlq/core/bits.hpp"
#include "fastvlq/core/vlq.hpp"

namespace fastvlq {

inline std::string toDecimalString(uint128_t V) {
  if (V == 0)
    return "0";
  std::string Digits;
  while (V != 0) {
    Digits.push_back(static_cast<char>('0' + static_cast<int>(V % 10)));
    V /= 10;
  }
  std::reverse(Digits.begin(), Digits.end());
  return Digits;
}

inline std::string toDecimalString(int128_t V) {
  if (V >= 0)
    return toDecimalString(static_cast<uint128_t>(V));
  // Negate in the unsigned domain so that INT128_MIN works.
  return "-" + toDecimalString(~static_cast<uint128_t>(V) + 1);
}

template <typename Codec>
std::string typeName() {
  return std::string("V") + (Codec::is_signed ? "i" : "u") +
         std::to_string(Codec::bits);
}

template <typename Codec>
std::string toDebugString(const Vlq<Codec> &V) {
  std::string Out = typeName<Codec>() + "(0b";
  bool First = true;
  for (uint8_t Byte : V.asSlice()) {
    if (!First)
      Out.push_back('_');
    First = false;
    for (int Bit = 7; Bit >= 0; --Bit)
      Out.push_back(((Byte >> Bit) & 1) ? '1' : '0');
  }
  Out.push_back(')');
  return Out;
}

template <typename Codec>
std::ostream &operator<<(std::ostream &OS, const Vlq<Codec> &V) {
  if constexpr (Codec::bits == 128)
    return OS << toDecimalString(V.get());
  else
    return OS << V.get();
}

} // namespace fastvlq

#endif // FASTVLQ_IO_PRINT_HPP
