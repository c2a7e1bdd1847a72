#include "entropy.hh"

#include <cmath>
#include <map>

#include "format.hh"

namespace genpw {

// Guessing speed assumed by ExplainEntropy.
constexpr double kGuessesPerSecond = 1e9;
constexpr double kSecondsPerYear = 365.25 * 24 * 3600;

double EntropyBits(const Profile &profile, const SegmentPlan &plan) {
  double segment_bits = 0;
  for (int i = 0; i < plan.segment_length; ++i) {
    segment_bits += std::log2((double)profile.CharsetAt(i).size());
  }
  return segment_bits * plan.segment_count;
}

int RoundedBits(double bits) { return (int)std::lround(bits); }

static Str DescribeYears(double bits) {
  // log10 keeps this finite for plans well beyond 1024 bits.
  double log10_years =
      bits * std::log10(2.0) - std::log10(kGuessesPerSecond) - std::log10(kSecondsPerYear);
  if (log10_years < 0) {
    double seconds = std::pow(2.0, bits) / kGuessesPerSecond;
    return f("%.3g seconds", seconds);
  }
  if (log10_years < 6) {
    return f("%.0f years", std::pow(10.0, log10_years));
  }
  double exponent = std::floor(log10_years);
  double mantissa = std::pow(10.0, log10_years - exponent);
  return f("%.1f x 10^%.0f years", mantissa, exponent);
}

Str ExplainEntropy(const Profile &profile, const SegmentPlan &plan) {
  // Count how many positions draw from each charset.
  std::map<Str, std::pair<Size, int>> usage;
  std::vector<Str> order;
  for (int i = 0; i < plan.segment_length; ++i) {
    const Charset &charset = profile.CharsetAt(i);
    auto [it, inserted] = usage.try_emplace(charset.name, charset.size(), 0);
    if (inserted) {
      order.push_back(charset.name);
    }
    it->second.second += plan.segment_count;
  }

  double bits = EntropyBits(profile, plan);
  Str ret;
  ret += f("Profile:       %s\n", profile.id.c_str());
  ret += f("Layout:        %d segments x %d chars = %d characters\n", plan.segment_count,
           plan.segment_length, plan.TotalLength());
  if (plan.separator) {
    ret += f("Separators:    %d, fixed by the layout (0 bits)\n", plan.segment_count - 1);
  }
  ret += f("Random chars:  %d\n", plan.RandomPositions());
  for (const Str &name : order) {
    auto [size, positions] = usage[name];
    ret += f("  %-12s %3zu chars x %d positions, %.2f bits each\n", name.c_str(), size,
             positions, std::log2((double)size));
  }
  ret += f("Entropy:       %.2f bits (~%d)\n", bits, RoundedBits(bits));
  ret += f("Bits/char:     %.2f\n", bits / plan.TotalLength());
  ret += f("Brute force:   %s at %.0e guesses/s\n", DescribeYears(bits).c_str(),
           kGuessesPerSecond);
  return ret;
}

} // namespace genpw
