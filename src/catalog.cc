#include "catalog.hh"

#include "format.hh"
#include "layout.hh"

namespace genpw {

ProfileCatalog ProfileCatalog::Make(std::vector<Profile> profiles, Status &status) {
  for (Size i = 0; i < profiles.size(); ++i) {
    profiles[i].Validate(status);
    RETURN_VAL_ON_ERROR(status, {});
    for (Size j = 0; j < i; ++j) {
      if (profiles[j].id == profiles[i].id) {
        AppendErrorMessage(status, ErrorKind::Configuration) +=
            f("Profile %s is defined twice", profiles[i].id.c_str());
        return {};
      }
    }
  }
  return ProfileCatalog{.profiles = std::move(profiles)};
}

ProfileCatalog ProfileCatalog::BuiltIn(Status &status) {
  Charset upper = Charset::Make("UPPER", charsets::kUpper, status);
  Charset lower = Charset::Make("LOWER", charsets::kLower, status);
  Charset digit = Charset::Make("DIGIT", charsets::kDigit, status);
  Charset lower_unambiguous =
      Charset::Make("LOWER_UNAMBIGUOUS", charsets::kLowerUnambiguous, status);
  Charset digit_unambiguous =
      Charset::Make("DIGIT_UNAMBIGUOUS", charsets::kDigitUnambiguous, status);
  RETURN_VAL_ON_ERROR(status, {});

  Charset alnum = upper.Plus("UPPER+LOWER+DIGIT", lower).Plus("UPPER+LOWER+DIGIT", digit);
  Charset dictation = lower_unambiguous.Plus("LOWER_UNAMBIGUOUS+DIGIT_UNAMBIGUOUS",
                                             digit_unambiguous);

  std::vector<Profile> profiles;
  profiles.push_back(Profile{
      .id = "default",
      .description = "Mixed case + digits, underscore separators. Double-click "
                     "friendly. Digits & both cases are likely but not guaranteed",
      .position_charsets = {alnum},
      .separators = "_",
      .default_segments = 4,
      .default_segment_length = 4,
      .word_safe = true,
  });
  profiles.push_back(Profile{
      .id = "simple",
      .description = "Lowercase + digits without ambiguous characters (0 O o 1 I l i). "
                     "Easy to dictate, no shift key",
      .position_charsets = {dictation},
      .separators = "_",
      .default_segments = 4,
      .default_segment_length = 4,
      .word_safe = true,
  });
  profiles.push_back(Profile{
      .id = "paranoid",
      .description = "Mixed case + digits with rotating symbol separators. For sites "
                     "that reject underscore as a symbol. Breaks double-click selection",
      .position_charsets = {alnum},
      .separators = Str(charsets::kParanoidSymbols),
      .default_segments = 4,
      .default_segment_length = 4,
      .word_safe = false,
  });
  // Fixed classes on the first three positions of every segment, so each
  // segment of 3 or more characters has an uppercase letter, a lowercase letter
  // & a digit.
  profiles.push_back(Profile{
      .id = "compliant",
      .description = "Every segment starts with an uppercase letter, a lowercase letter "
                     "& a digit. For sites that demand all three. Double-click friendly",
      .position_charsets = {upper, lower, digit, alnum},
      .separators = "_",
      .default_segments = 4,
      .default_segment_length = 4,
      .word_safe = true,
  });
  return Make(std::move(profiles), status);
}

const Profile *ProfileCatalog::Find(StrView id, Status &status) const {
  for (const Profile &profile : profiles) {
    if (profile.id == id) {
      return &profile;
    }
  }
  AppendErrorMessage(status, ErrorKind::UnknownProfile) +=
      f("unknown profile \"%.*s\". Valid profiles: %s", (int)id.size(), id.data(),
        Join(Names(), ", ").c_str());
  return nullptr;
}

std::vector<Str> ProfileCatalog::Names() const {
  std::vector<Str> names;
  for (const Profile &profile : profiles) {
    names.push_back(profile.id);
  }
  return names;
}

std::vector<ProfileListing> ProfileCatalog::ListProfiles() const {
  std::vector<ProfileListing> listings;
  for (const Profile &profile : profiles) {
    SegmentPlan plan{.segment_count = profile.default_segments,
                     .segment_length = profile.default_segment_length,
                     .separator = profile.Separator()};
    listings.push_back(ProfileListing{.id = profile.id,
                                      .description = profile.description,
                                      .example_layout = ExampleLayout(profile, plan)});
  }
  return listings;
}

} // namespace genpw
