#ifndef FASTVLQ_IO_INCREMENTAL_HPP
#define FASTVLQ_IO_INCREMENTAL_HPP

// Non-blocking decoder for input that arrives in pieces (socket reads,
// async completions). feed() takes whatever bytes are on hand, consumes
// only those that belong to the current value, and never waits.
//
// Framing is identical to Codec::decode: the final step runs decode on
// the collected bytes.

#include <algorithm>
#include <array>
#include <cstddef>
#include <cstdint>
#include <span>

#include "fastvlq/core/codec.hpp"
#include "fastvlq/core/errors.hpp"

namespace fastvlq {

enum class FeedState {
  NeedMore, // Value not complete yet; feed more bytes
  Ready,    // Value complete; take() it
  Failed,   // Malformed prefix or payload; take() reports why
};

template <typename Codec>
  requires VlqCodec<Codec>
class IncrementalDecoder {
public:
  using value_type = typename Codec::value_type;

  // Returns the number of bytes consumed from Data. Consumes nothing
  // once the decoder is Ready or Failed.
  size_t feed(const uint8_t *Data, size_t Size) {
    size_t Consumed = 0;
    while (State == FeedState::NeedMore && Consumed < Size) {
      if (Filled == 0) {
        Buf[0] = Data[Consumed++];
        Filled = 1;
        Result<size_t> Len = Codec::peekLength(Buf[0]);
        if (!Len.ok()) {
          fail(Len.Status);
          break;
        }
        Needed = Len.Value;
      } else {
        size_t Take = std::min(Needed - Filled, Size - Consumed);
        std::copy_n(Data + Consumed, Take, Buf.data() + Filled);
        Filled += Take;
        Consumed += Take;
      }
      if (Filled == Needed)
        finish();
    }
    return Consumed;
  }

  size_t feed(std::span<const uint8_t> Bytes) {
    return feed(Bytes.data(), Bytes.size());
  }

  FeedState state() const { return State; }

  // Bytes collected for the current value so far.
  size_t buffered() const { return Filled; }

  // Total bytes of the current value; 0 until byte 0 has been seen.
  size_t expected() const { return Needed; }

  // Hands out the finished value (or the failure) and rearms the
  // decoder. While NeedMore, reports TruncatedInput and keeps the
  // partial value.
  Result<value_type> take() {
    if (State == FeedState::NeedMore)
      return failure<value_type>(Errc::TruncatedInput);
    Result<value_type> Out = State == FeedState::Ready
                                 ? success(Value)
                                 : failure<value_type>(Error);
    reset();
    return Out;
  }

  void reset() {
    Buf = {};
    Filled = 0;
    Needed = 0;
    State = FeedState::NeedMore;
    Error = Errc::Ok;
    Value = value_type{};
  }

private:
  void finish() {
    auto D = Codec::decode(Buf.data(), Filled);
    if (!D.ok()) {
      fail(D.Status);
      return;
    }
    Value = D.Value.Value;
    State = FeedState::Ready;
  }

  void fail(Errc E) {
    Error = E;
    State = FeedState::Failed;
  }

  std::array<uint8_t, Codec::max_bytes> Buf{};
  size_t Filled = 0;
  size_t Needed = 0;
  FeedState State = FeedState::NeedMore;
  Errc Error = Errc::Ok;
  value_type Value{};
};

} // namespace fastvlq

#endif // FASTVLQ_IO_INCREMENTAL_HPP
