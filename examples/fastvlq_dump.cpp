// fastvlq-dump: prints the 64-bit encoding of each argument.
//
//   $ fastvlq-dump 0 128 -5
//   0: Vu64(0b10000000)
//   128: Vu64(0b01000000_00000000)
//   -5: Vi64(0b10001001)
//
// Arguments with a leading '-' are encoded as signed.

#include "fastvlq/fastvlq.hpp"

#include <cerrno>
#include <cstdint>
#include <cstdio>
#include <cstdlib>
#include <string>

using namespace fastvlq;

static bool parseUnsigned(const char *Text, uint64_t &Out) {
  char *End = nullptr;
  errno = 0;
  unsigned long long V = std::strtoull(Text, &End, 10);
  if (errno != 0 || End == Text || *End != '\0')
    return false;
  Out = V;
  return true;
}

static bool parseSigned(const char *Text, int64_t &Out) {
  char *End = nullptr;
  errno = 0;
  long long V = std::strtoll(Text, &End, 10);
  if (errno != 0 || End == Text || *End != '\0')
    return false;
  Out = V;
  return true;
}

int main(int argc, char **argv) {
  if (argc < 2) {
    std::fprintf(stderr, "usage: %s <number>...\n", argv[0]);
    return 1;
  }

  int Status = 0;
  for (int I = 1; I < argc; ++I) {
    const char *Arg = argv[I];
    std::string Text;
    if (Arg[0] == '-') {
      int64_t V;
      if (!parseSigned(Arg, V)) {
        std::fprintf(stderr, "%s: not a 64-bit integer\n", Arg);
        Status = 1;
        continue;
      }
      Text = toDebugString(Vi64(V));
    } else {
      uint64_t V;
      if (Arg[0] == '+' || !parseUnsigned(Arg, V)) {
        std::fprintf(stderr, "%s: not a 64-bit integer\n", Arg);
        Status = 1;
        continue;
      }
      Text = toDebugString(Vu64(V));
    }
    std::printf("%s: %s\n", Arg, Text.c_str());
  }
  return Status;
}
