#ifndef FASTVLQ_CORE_ERRORS_HPP
#define FASTVLQ_CORE_ERRORS_HPP

#include <concepts>
#include <stdexcept>
#include <string>

namespace fastvlq {

enum class Errc {
  Ok,
  OutOfRange,     // Value does not fit the declared width
  TruncatedInput, // Fewer bytes available than the prefix requires
  InvalidPrefix,  // Prefix names a length the width does not have
  StreamError,    // Underlying stream failed outside of a value
};

inline const char *errcName(Errc E) {
  switch (E) {
  case Errc::Ok:             return "ok";
  case Errc::OutOfRange:     return "out of range";
  case Errc::TruncatedInput: return "truncated input";
  case Errc::InvalidPrefix:  return "invalid prefix";
  case Errc::StreamError:    return "stream error";
  }
  return "???";
}

class VlqError : public std::runtime_error {
public:
  explicit VlqError(Errc E)
      : std::runtime_error(std::string("fastvlq: ") + errcName(E)), Code(E) {}

  Errc code() const noexcept { return Code; }

private:
  Errc Code;
};

// Result<T>: {value, status} pair returned by every fallible operation.
// Value is default-constructed when Status is not Ok.
template <typename T>
struct Result {
  T Value{};
  Errc Status = Errc::Ok;

  constexpr bool ok() const { return Status == Errc::Ok; }
  constexpr explicit operator bool() const { return ok(); }

  // Throws VlqError when the operation failed.
  const T &value() const {
    if (!ok())
      throw VlqError(Status);
    return Value;
  }
};

template <typename T>
constexpr Result<T> success(T Value) {
  return Result<T>{Value, Errc::Ok};
}

template <typename T>
constexpr Result<T> failure(Errc E) {
  return Result<T>{T{}, E};
}

template <typename E>
concept ErrorPolicy = requires {
  { E::throws } -> std::convertible_to<bool>;
};

namespace errors {

// Hand the status back in the Result. No side effects.
struct ReturnStatus {
  static constexpr bool throws = false;
};

// Throw VlqError on failure; returned Results are always Ok.
struct Trap {
  static constexpr bool throws = true;
};

using Default = ReturnStatus;

static_assert(ErrorPolicy<ReturnStatus>);
static_assert(ErrorPolicy<Trap>);

} // namespace errors

// Apply an error policy to a finished operation.
template <ErrorPolicy Err, typename T>
Result<T> report(Result<T> R) {
  if constexpr (Err::throws) {
    if (!R.ok())
      throw VlqError(R.Status);
  }
  return R;
}

} // namespace fastvlq

#endif // FASTVLQ_CORE_ERRORS_HPP
