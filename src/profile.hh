#pragma once

#include <optional>
#include <vector>

#include "charset.hh"
#include "int.hh"
#include "status.hh"
#include "str.hh"

namespace genpw {

// Named password configuration.
//
// Profiles are validated once (see `Validate`) and then only handed out by
// const reference from a `ProfileCatalog`.
struct Profile {
  Str id;
  Str description;

  // Alphabets for the positions of every segment. Position `i` of a segment
  // draws from `position_charsets[i % position_charsets.size()]`.
  std::vector<Charset> position_charsets;

  // Separators placed between consecutive segments. The n-th separator is
  // `separators[n % separators.size()]` so a single character means a fixed
  // separator. Empty means that segments are concatenated.
  Str separators;

  int default_segments = 4;
  int default_segment_length = 4;

  // Whether double-click selection picks the whole password.
  bool word_safe = true;

  const Charset &CharsetAt(Size position_in_segment) const {
    return position_charsets[position_in_segment % position_charsets.size()];
  }

  // Separator placed after segment `n` (0-based). Only valid when `separators`
  // isn't empty.
  char SeparatorAt(Size n) const { return separators[n % separators.size()]; }

  // First separator, if the profile uses any.
  std::optional<char> Separator() const;

  int SeparatorWidth() const { return separators.empty() ? 0 : 1; }

  // Checks the structural rules & the safety rules:
  //
  // - every charset is non-empty & free from dangerous characters,
  // - every separator is one of `charsets::kSafeSeparators`,
  // - defaults are positive,
  // - a word-safe profile contains no double-click boundary characters.
  //
  // Fails with ConfigurationError.
  void Validate(Status &) const;
};

} // namespace genpw
