#pragma once

#include <cstring>
#include <vector>

#include "random.hh"

namespace genpw {

// Returns the scripted draws in order, as they are. Fails with
// RandomSourceError once the script runs out.
struct ScriptedRandomSource : RandomSource {
  std::vector<U32> draws;
  Size next = 0;
  int calls = 0;

  ScriptedRandomSource() = default;
  explicit ScriptedRandomSource(std::vector<U32> draws_arg) : draws(std::move(draws_arg)) {}

  U32 DrawUniform(U32, Status &status) override {
    ++calls;
    if (next >= draws.size()) {
      AppendErrorMessage(status, ErrorKind::RandomSource) += "Scripted draws exhausted";
      return 0;
    }
    return draws[next++];
  }
};

// Byte source that hands out the bytes of the scripted 32-bit words.
struct ScriptedByteSource : ByteRandomSource {
  std::vector<U8> bytes;
  Size next = 0;

  explicit ScriptedByteSource(const std::vector<U32> &words) {
    bytes.resize(words.size() * sizeof(U32));
    memcpy(bytes.data(), words.data(), bytes.size());
  }

  void FillBytes(U8 *out, Size n, Status &status) override {
    if (next + n > bytes.size()) {
      AppendErrorMessage(status, ErrorKind::RandomSource) += "Scripted bytes exhausted";
      return;
    }
    memcpy(out, bytes.data() + next, n);
    next += n;
  }
};

} // namespace genpw
