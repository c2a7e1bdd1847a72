#include "random.hh"

#include <openssl/err.h>
#include <openssl/rand.h>
#include <sys/random.h>

#include <cerrno>
#include <climits>
#include <cstring>

#include "format.hh"

namespace genpw {

U32 ByteRandomSource::DrawUniform(U32 alphabet_size, Status &status) {
  if (alphabet_size == 0) {
    AppendErrorMessage(status, ErrorKind::Configuration) +=
        "Can't draw from an empty alphabet";
    return 0;
  }
  // 2^32 mod alphabet_size. Words below this threshold would make the low
  // indices more likely, so they're rejected.
  U32 threshold = (0u - alphabet_size) % alphabet_size;
  while (true) {
    U32 word;
    FillBytes(reinterpret_cast<U8 *>(&word), sizeof(word), status);
    RETURN_VAL_ON_ERROR(status, 0);
    if (word >= threshold) {
      return word % alphabet_size;
    }
  }
}

void RandomBytesSecure(U8 *out, Size n, Status &status) {
  while (n > 0) {
    SSize ret = getrandom(out, n, 0);
    if (ret < 0) {
      if (errno == EINTR) {
        continue;
      }
      AppendErrorMessage(status, ErrorKind::RandomSource) +=
          f("getrandom() failed: %s", strerror(errno));
      return;
    }
    out += ret;
    n -= ret;
  }
}

void SystemRandomSource::FillBytes(U8 *out, Size n, Status &status) {
  RandomBytesSecure(out, n, status);
}

void OpenSSLRandomSource::FillBytes(U8 *out, Size n, Status &status) {
  while (n > 0) {
    int chunk = n > INT_MAX ? INT_MAX : (int)n;
    if (RAND_bytes(out, chunk) != 1) {
      char err[256];
      ERR_error_string_n(ERR_get_error(), err, sizeof(err));
      AppendErrorMessage(status, ErrorKind::RandomSource) +=
          f("RAND_bytes() failed: %s", err);
      return;
    }
    out += chunk;
    n -= chunk;
  }
}

U32 SeededRandomSource::DrawUniform(U32 alphabet_size, Status &status) {
  if (alphabet_size == 0) {
    AppendErrorMessage(status, ErrorKind::Configuration) +=
        "Can't draw from an empty alphabet";
    return 0;
  }
  std::uniform_int_distribution<U32> distr(0, alphabet_size - 1);
  return distr(generator);
}

bool ParseRandomSourceKind(StrView name, RandomSourceKind &out) {
  if (name == "getrandom") {
    out = RandomSourceKind::GetRandom;
    return true;
  }
  if (name == "openssl") {
    out = RandomSourceKind::OpenSSL;
    return true;
  }
  return false;
}

StrView RandomSourceKindName(RandomSourceKind kind) {
  switch (kind) {
  case RandomSourceKind::GetRandom:
    return "getrandom";
  case RandomSourceKind::OpenSSL:
    return "openssl";
  }
  return "getrandom";
}

std::unique_ptr<RandomSource> MakeRandomSource(RandomSourceKind kind) {
  switch (kind) {
  case RandomSourceKind::GetRandom:
    return std::make_unique<SystemRandomSource>();
  case RandomSourceKind::OpenSSL:
    return std::make_unique<OpenSSLRandomSource>();
  }
  return std::make_unique<SystemRandomSource>();
}

} // namespace genpw
