#pragma once

#include "catalog.hh"
#include "layout.hh"
#include "profile.hh"
#include "random.hh"
#include "status.hh"
#include "str.hh"

namespace genpw {

struct GeneratedPassword {
  Str text;
  double entropy_bits = 0;
  Str profile_id;
};

struct GenerationRequest {
  Str profile_name = "default";
  LayoutRequest layout;
};

// Draw a password shaped by `plan` from `profile`'s alphabets.
//
// One uniform draw per character. Deterministic for a given sequence of draws.
//
// If `random` fails, fails with RandomSourceError and returns an empty password
// - partial output is wiped, never returned.
GeneratedPassword Synthesize(const Profile &profile, const SegmentPlan &plan,
                             RandomSource &random, Status &status);

// Look up the profile, resolve the layout & synthesize.
//
// Configuration & profile errors are reported before anything is drawn from
// `random`.
GeneratedPassword Generate(const ProfileCatalog &catalog, const GenerationRequest &request,
                           RandomSource &random, Status &status);

} // namespace genpw
