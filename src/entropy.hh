#pragma once

#include "layout.hh"
#include "profile.hh"
#include "str.hh"

namespace genpw {

// Bits of entropy of a password made by `profile` according to `plan`.
//
// Sum of log2(alphabet size) over every random position. Separators are fixed
// by the plan and add nothing.
double EntropyBits(const Profile &profile, const SegmentPlan &plan);

// Entropy rounded to the nearest whole bit, for display.
int RoundedBits(double bits);

// Multi-line, human-readable breakdown of the entropy of `plan`: alphabets,
// bits per character & the time needed to exhaust the search space.
Str ExplainEntropy(const Profile &profile, const SegmentPlan &plan);

} // namespace genpw
