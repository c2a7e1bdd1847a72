#pragma once

#include <concepts>
#include <string>
#include <string_view>
#include <vector>

namespace genpw {

using Str = std::string;
using StrView = std::string_view;

using namespace std::literals;

void StripLeadingWhitespace(Str &);
void StripTrailingWhitespace(Str &);
void StripWhitespace(Str &);

Str Join(const std::vector<Str> &parts, StrView separator);

// Parses a base-10 integer that spans the whole of `s`. Leading sign is
// accepted. Returns false on garbage or overflow.
bool ParseInt(StrView s, int &out);

// Accepts "true"/"false", "yes"/"no", "1"/"0", "on"/"off".
bool ParseBool(StrView s, bool &out);

// ToStr function should be the default way of converting values to strings.
//
// It relies on ADL for lookup, so types in other namespaces can provide their
// own overloads next to their definitions.

inline Str ToStr(int val) { return std::to_string(val); }
inline Str ToStr(long val) { return std::to_string(val); }
inline Str ToStr(long long val) { return std::to_string(val); }
inline Str ToStr(unsigned val) { return std::to_string(val); }
inline Str ToStr(unsigned long val) { return std::to_string(val); }
inline Str ToStr(unsigned long long val) { return std::to_string(val); }
inline Str ToStr(double val) { return std::to_string(val); }

template <typename T>
  requires requires(T t) {
    { t.ToStr() } -> std::same_as<Str>;
  }
Str ToStr(const T &t) {
  return t.ToStr();
}

template <typename T>
concept Stringer = requires(T t) {
  { ToStr(t) } -> std::same_as<Str>;
};

} // namespace genpw
