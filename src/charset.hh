#pragma once

#include "int.hh"
#include "status.hh"
#include "str.hh"

namespace genpw {

// Characters with a special meaning in shells, URLs, SQL or config files. None
// of them may ever appear in a charset.
constexpr StrView kDangerousChars = "#'\"`$\\!&%;<>(){}[]*?| \t\r\n"sv;

// Characters at which double-click selection stops in common text widgets.
constexpr StrView kWordBoundaryChars = "-.,:;!@#$%^&*() "sv;

bool IsDangerousChar(char c);
bool IsWordBoundaryChar(char c);

// Ordered set of characters for one role (uppercase, digits, separators...).
//
// Construct through `Charset::Make` which rejects unsafe characters. Once made,
// a charset is never modified, so every draw from it is safe.
struct Charset {
  Str name;
  // Unique characters, in the order in which they were first listed.
  Str chars;

  // Drops duplicates from `chars` (keeping the first occurrence) and validates
  // the result.
  //
  // Fails with ConfigurationError if the result is empty or if any character is
  // dangerous, non-printable or outside of ASCII.
  static Charset Make(StrView name, StrView chars, Status &status);

  Size size() const { return chars.size(); }
  char operator[](Size i) const { return chars[i]; }
  bool Contains(char c) const { return chars.find(c) != Str::npos; }

  // True if none of the characters would stop double-click selection.
  bool WordSafe() const;

  // Union of two charsets. Order of `this` is kept, new characters from `other`
  // are appended.
  Charset Plus(StrView union_name, const Charset &other) const;
};

// Base alphabets.
namespace charsets {

constexpr StrView kUpper = "ABCDEFGHIJKLMNOPQRSTUVWXYZ"sv;
constexpr StrView kLower = "abcdefghijklmnopqrstuvwxyz"sv;
constexpr StrView kDigit = "0123456789"sv;

// Without glyphs that are easy to confuse: 0/O/o and 1/I/l/i.
constexpr StrView kUpperUnambiguous = "ABCDEFGHJKLMNPQRSTUVWXYZ"sv;
constexpr StrView kLowerUnambiguous = "abcdefghjkmnpqrstuvwxyz"sv;
constexpr StrView kDigitUnambiguous = "23456789"sv;

// Symbols that are safe to paste into shells, URLs, SQL & config files.
constexpr StrView kSafeSeparators = "_-.^:,=+"sv;

// Subset of `kSafeSeparators` with the most visually distinct symbols. All of
// them break double-click selection.
constexpr StrView kParanoidSymbols = ".-^:"sv;

} // namespace charsets

} // namespace genpw
