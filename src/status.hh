#pragma once

#include <memory>
#include <source_location>

#include "str.hh"

namespace genpw {

// Category of a failure. The first tagged error recorded in a Status decides
// its kind.
enum class ErrorKind {
  None,
  // Invalid or conflicting layout, charset or config parameters.
  Configuration,
  // A profile name that isn't in the catalog.
  UnknownProfile,
  // The random source failed. Only possible during synthesis.
  RandomSource,
};

StrView ErrorKindName(ErrorKind);

struct Status {
  struct Entry {
    std::unique_ptr<Entry> next;
    std::source_location location;
    Str message;
    Str advice;
  };

  std::unique_ptr<Entry> entry;

  int errsv; // Saved errno value

  ErrorKind kind;

  Status();

  // Records a new message and saves the current errno (if any).
  Str &operator()(const std::source_location location_arg =
                      std::source_location::current());

  // Records a new message tagged with `kind`. Doesn't look at errno.
  Str &operator()(ErrorKind kind_arg, const std::source_location location_arg =
                                          std::source_location::current());

  bool Ok() const;
  bool Is(ErrorKind k) const { return kind == k; }
  Str ToStr() const;
  void Reset();
};

inline bool OK(const Status &status) { return status.Ok(); }
inline Str &AppendErrorMessage(
    Status &status,
    const std::source_location location_arg = std::source_location::current()) {
  return status(location_arg);
}
inline Str &AppendErrorMessage(
    Status &status, ErrorKind kind,
    const std::source_location location_arg = std::source_location::current()) {
  return status(kind, location_arg);
}
void AppendErrorAdvice(Status &, StrView advice);

#define RETURN_ON_ERROR(status)                                                \
  if (!OK(status)) {                                                           \
    AppendErrorMessage(status, status.kind) += __FUNCTION__;                   \
    return;                                                                    \
  }

#define RETURN_VAL_ON_ERROR(status, value)                                     \
  if (!OK(status)) {                                                           \
    AppendErrorMessage(status, status.kind) += __FUNCTION__;                   \
    return value;                                                              \
  }

} // namespace genpw
