// Codec unit tests: fixed vectors, class boundaries and error paths.
// The exhaustive comparison against GMP lives in tests/oracle.

#define DOCTEST_CONFIG_IMPLEMENT_WITH_MAIN
#include <doctest/doctest.h>

#include "fastvlq/fastvlq.hpp"

#include <cstdint>
#include <vector>

using namespace fastvlq;

template <typename Codec>
static std::vector<uint8_t> bytesOf(typename Codec::value_type V) {
  auto E = Codec::encode(V);
  return std::vector<uint8_t>(E.begin(), E.end());
}

TEST_CASE("known encodings") {
  CHECK(bytesOf<u64_codec>(0) == std::vector<uint8_t>{0x80});
  CHECK(bytesOf<u64_codec>(1) == std::vector<uint8_t>{0x81});
  CHECK(bytesOf<u64_codec>(127) == std::vector<uint8_t>{0xFF});
  CHECK(bytesOf<u64_codec>(128) == std::vector<uint8_t>{0x40, 0x00});
  CHECK(bytesOf<u64_codec>(300) == std::vector<uint8_t>{0x40, 0xAC});
  CHECK(bytesOf<u64_codec>(16511) == std::vector<uint8_t>{0x7F, 0xFF});
  CHECK(bytesOf<u64_codec>(16512) ==
        std::vector<uint8_t>{0x20, 0x00, 0x00});

  // Same value, same bytes, whatever the width.
  CHECK(bytesOf<u32_codec>(16512) == bytesOf<u64_codec>(16512));
  CHECK(bytesOf<u128_codec>(16512) == bytesOf<u64_codec>(16512));
}

TEST_CASE("signed values go through zigzag") {
  CHECK(bytesOf<i64_codec>(0) == std::vector<uint8_t>{0x80});
  CHECK(bytesOf<i64_codec>(-1) == std::vector<uint8_t>{0x81});
  CHECK(bytesOf<i64_codec>(1) == std::vector<uint8_t>{0x82});
  CHECK(bytesOf<i64_codec>(-64) == std::vector<uint8_t>{0xFF});
  CHECK(bytesOf<i64_codec>(64) == std::vector<uint8_t>{0x40, 0x00});
  CHECK(bytesOf<i32_codec>(-64) == bytesOf<i64_codec>(-64));
}

TEST_CASE("encoded length is minimal at every class edge") {
  using Cap = u64_codec::capacity;
  for (int K = 1; K < Cap::classes; ++K) {
    CAPTURE(K);
    CHECK(u64_codec::encodedLength(Cap::maxValue(K)) ==
          static_cast<size_t>(Cap::lengthOfClass(K)));
    CHECK(u64_codec::encodedLength(Cap::maxValue(K) + 1) ==
          static_cast<size_t>(Cap::lengthOfClass(K + 1)));
  }
  CHECK(u64_codec::encodedLength(~uint64_t{0}) == 9);
  CHECK(u32_codec::encodedLength(0xFFFFFFFFu) == 5);
  CHECK(u128_codec::encodedLength(max_unsigned<128>) == 18);
  CHECK(i64_codec::encodedLength(min_signed<64>) == 9);
}

TEST_CASE("top of each width") {
  auto Top64 = u64_codec::encode(~uint64_t{0});
  REQUIRE(Top64.size() == 9);
  CHECK(Top64[0] == 0x00);
  auto D64 = u64_codec::decode(Top64.asSlice());
  REQUIRE(D64.ok());
  CHECK(D64.Value.Value == ~uint64_t{0});
  CHECK(D64.Value.Consumed == 9);

  auto Top32 = u32_codec::encode(0xFFFFFFFFu);
  REQUIRE(Top32.size() == 5);
  CHECK(Top32[0] == 0x08);
  auto D32 = u32_codec::decode(Top32.asSlice());
  REQUIRE(D32.ok());
  CHECK(D32.Value.Value == 0xFFFFFFFFu);

  auto Top128 = u128_codec::encode(max_unsigned<128>);
  REQUIRE(Top128.size() == 18);
  CHECK(Top128[0] == 0x00);
  auto D128 = u128_codec::decode(Top128.asSlice());
  REQUIRE(D128.ok());
  CHECK((D128.Value.Value == max_unsigned<128>));

  auto Min128 = i128_codec::decode(i128_codec::encode(min_signed<128>).asSlice());
  REQUIRE(Min128.ok());
  CHECK((Min128.Value.Value == min_signed<128>));
}

TEST_CASE("peekLength agrees with encode") {
  const uint64_t Values[] = {0, 127, 128, 16511, 16512, 2113663, 2113664,
                             72624976668147839ull, 72624976668147840ull,
                             ~uint64_t{0}};
  for (uint64_t V : Values) {
    CAPTURE(V);
    auto E = u64_codec::encode(V);
    auto L = u64_codec::peekLength(E[0]);
    REQUIRE(L.ok());
    CHECK(L.Value == E.size());
  }
}

TEST_CASE("truncated input") {
  auto E = u64_codec::encode(16512);
  for (size_t Size = 0; Size < E.size(); ++Size) {
    CAPTURE(Size);
    CHECK(u64_codec::decode(E.data(), Size).Status == Errc::TruncatedInput);
  }

  auto Top = u128_codec::encode(max_unsigned<128>);
  CHECK(u128_codec::decode(Top.data(), 17).Status == Errc::TruncatedInput);
}

TEST_CASE("trailing bytes are left alone") {
  const uint8_t Stream[] = {0x40, 0xAC, 0x81, 0xFF};
  auto First = u64_codec::decode(Stream, sizeof(Stream));
  REQUIRE(First.ok());
  CHECK(First.Value.Value == 300);
  CHECK(First.Value.Consumed == 2);

  auto Second = u64_codec::decode(Stream + 2, sizeof(Stream) - 2);
  REQUIRE(Second.ok());
  CHECK(Second.Value.Value == 1);
  CHECK(Second.Value.Consumed == 1);
}

TEST_CASE("narrow decoders reject wide encodings") {
  // A 64-bit overflow-class encoding has no meaning at 32 bits.
  auto Wide = u64_codec::encode(~uint64_t{0});
  CHECK(u32_codec::decode(Wide.asSlice()).Status == Errc::InvalidPrefix);

  // Six and more bytes are beyond the 32-bit prefix range.
  const uint8_t Six[] = {0x04, 0, 0, 0, 0, 0};
  CHECK(u32_codec::decode(Six, sizeof(Six)).Status == Errc::InvalidPrefix);

  // Five bytes, but the payload exceeds 2^32 - 1.
  auto Big = u64_codec::encode(uint64_t{1} << 33);
  REQUIRE(Big.size() == 5);
  CHECK(u32_codec::decode(Big.asSlice()).Status == Errc::OutOfRange);
  CHECK(i32_codec::decode(Big.asSlice()).Status == Errc::OutOfRange);

  // 64-bit overflow class whose payload passes 2^64 - 1.
  const uint8_t Over[] = {0x00, 0xFF, 0xFF, 0xFF, 0xFF,
                          0xFF, 0xFF, 0xFF, 0xFF};
  CHECK(u64_codec::decode(Over, sizeof(Over)).Status == Errc::OutOfRange);

  // The 128-bit overflow class is longer than the 64-bit one.
  CHECK(u128_codec::decode(Wide.asSlice()).Status == Errc::TruncatedInput);
}

TEST_CASE("wide entry points") {
  CHECK(u32_codec::encodeWide(0xFFFFFFFFu).ok());
  CHECK(u32_codec::encodeWide(uint128_t{1} << 32).Status == Errc::OutOfRange);
  CHECK(u64_codec::encodeWide(uint128_t{1} << 64).Status == Errc::OutOfRange);
  CHECK(u128_codec::encodeWide(max_unsigned<128>).ok());

  CHECK(i32_codec::encodeWide(min_signed<32>).ok());
  CHECK(i32_codec::encodeWide(int128_t{min_signed<32>} - 1).Status ==
        Errc::OutOfRange);
  CHECK(i64_codec::encodeWide(int128_t{max_signed<64>} + 1).Status ==
        Errc::OutOfRange);

  auto E = u32_codec::encodeWide(300);
  REQUIRE(E.ok());
  auto D = u32_codec::decodeWide(E.Value.data(), E.Value.size());
  REQUIRE(D.ok());
  CHECK((D.Value.Value == 300));
  CHECK(D.Value.Consumed == 2);

  auto Neg = i64_codec::decodeWide(i64_codec::encode(-5).data(), 1);
  REQUIRE(Neg.ok());
  CHECK((Neg.Value.Value == -5));
}
