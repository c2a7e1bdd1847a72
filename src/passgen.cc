#include "passgen.hh"

#include <cstring>

#include "entropy.hh"
#include "format.hh"

namespace genpw {

static void Wipe(Str &s) {
  explicit_bzero(s.data(), s.size());
  s.clear();
}

GeneratedPassword Synthesize(const Profile &profile, const SegmentPlan &plan,
                             RandomSource &random, Status &status) {
  Str password;
  password.reserve(plan.TotalLength());
  for (int s = 0; s < plan.segment_count; ++s) {
    if (s > 0 && plan.separator) {
      password += profile.SeparatorAt(s - 1);
    }
    for (int i = 0; i < plan.segment_length; ++i) {
      const Charset &charset = profile.CharsetAt(i);
      U32 index = random.DrawUniform((U32)charset.size(), status);
      if (OK(status) && index >= charset.size()) {
        AppendErrorMessage(status, ErrorKind::RandomSource) +=
            f("Random source returned %u for an alphabet of %zu characters", index,
              charset.size());
      }
      if (!OK(status)) {
        Wipe(password);
        AppendErrorMessage(status, ErrorKind::RandomSource) +=
            f("Couldn't draw character %d of %d", s * plan.segment_length + i + 1,
              plan.RandomPositions());
        return {};
      }
      password += charset[index];
    }
  }
  return GeneratedPassword{.text = std::move(password),
                           .entropy_bits = EntropyBits(profile, plan),
                           .profile_id = profile.id};
}

GeneratedPassword Generate(const ProfileCatalog &catalog, const GenerationRequest &request,
                           RandomSource &random, Status &status) {
  const Profile *profile = catalog.Find(request.profile_name, status);
  RETURN_VAL_ON_ERROR(status, {});
  SegmentPlan plan = ResolveLayout(*profile, request.layout, status);
  RETURN_VAL_ON_ERROR(status, {});
  return Synthesize(*profile, plan, random, status);
}

} // namespace genpw
