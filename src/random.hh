#pragma once

#include <memory>
#include <random>

#include "int.hh"
#include "status.hh"
#include "str.hh"

namespace genpw {

// Abstract source of uniformly distributed draws.
//
// Implementations may block (for example getrandom(2) before the kernel pool
// is initialized). There is no timeout - callers that need one must wrap the
// call themselves.
struct RandomSource {
  virtual ~RandomSource() = default;

  // Returns an integer in [0, alphabet_size). Each call is independent.
  //
  // On failure reports RandomSourceError through `status` and returns 0.
  virtual U32 DrawUniform(U32 alphabet_size, Status &status) = 0;
};

// Base class for sources that produce raw random bytes.
//
// Bytes are turned into draws with rejection sampling over 32-bit words so
// that no index is more likely than another.
struct ByteRandomSource : RandomSource {
  U32 DrawUniform(U32 alphabet_size, Status &status) override;

  // Fill `n` bytes at `out` with random data.
  virtual void FillBytes(U8 *out, Size n, Status &status) = 0;
};

// This function may block if there is not enough entropy available.
//
// See `man 2 getrandom` for more information.
void RandomBytesSecure(U8 *out, Size n, Status &status);

// Kernel CSPRNG through getrandom(2).
struct SystemRandomSource : ByteRandomSource {
  void FillBytes(U8 *out, Size n, Status &status) override;
};

// OpenSSL's RAND_bytes.
struct OpenSSLRandomSource : ByteRandomSource {
  void FillBytes(U8 *out, Size n, Status &status) override;
};

// Deterministic Mersenne Twister source. Only for reproducible tests - never
// use it for real passwords.
struct SeededRandomSource : RandomSource {
  std::mt19937 generator;

  explicit SeededRandomSource(U32 seed) : generator(seed) {}

  U32 DrawUniform(U32 alphabet_size, Status &status) override;
};

enum class RandomSourceKind { GetRandom, OpenSSL };

// Accepts "getrandom" & "openssl".
bool ParseRandomSourceKind(StrView name, RandomSourceKind &out);

StrView RandomSourceKindName(RandomSourceKind);

std::unique_ptr<RandomSource> MakeRandomSource(RandomSourceKind);

} // namespace genpw
