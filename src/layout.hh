#pragma once

#include <optional>

#include "profile.hh"
#include "status.hh"
#include "str.hh"

namespace genpw {

// Upper limit on the total length of a password. Keeps the arithmetic far away
// from integer overflow.
constexpr int kMaxPasswordLength = 4096;

// Layout parameters given explicitly by the caller. Missing values are derived
// from the others & the profile defaults.
struct LayoutRequest {
  std::optional<int> length;
  std::optional<int> segments;
  std::optional<int> segment_length;
};

// Concrete shape of a password.
//
// segment_count * segment_length + (segment_count - 1) * SeparatorWidth() ==
// TotalLength()
struct SegmentPlan {
  int segment_count;
  int segment_length;
  std::optional<char> separator;

  int SeparatorWidth() const { return separator ? 1 : 0; }

  // Number of randomly drawn characters.
  int RandomPositions() const { return segment_count * segment_length; }

  int TotalLength() const {
    return RandomPositions() + (segment_count - 1) * SeparatorWidth();
  }

  bool operator==(const SegmentPlan &) const = default;

  // For example "4x4 '_'".
  Str ToStr() const;
};

// Turns a request into a segment plan for `profile`.
//
// With only a length, segments keep the profile's default width and the
// segment count is rounded up, so the realized length may exceed the request
// by less than one segment plus separator. A short trailing segment is never
// produced.
//
// When two or three values are explicit they must describe the same plan,
// otherwise this fails with "ConfigurationError: conflicting layout
// parameters". Non-positive values (or a plan longer than kMaxPasswordLength)
// fail with "ConfigurationError: invalid layout parameters".
//
// Pure function of its arguments.
SegmentPlan ResolveLayout(const Profile &profile, const LayoutRequest &request,
                          Status &status);

// Renders `plan` with 'x' in place of random characters and the profile's
// separators in between, e.g. "xxxx_xxxx_xxxx_xxxx".
Str ExampleLayout(const Profile &profile, const SegmentPlan &plan);

} // namespace genpw
