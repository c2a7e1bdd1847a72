#pragma once

#include <vector>

#include "profile.hh"
#include "status.hh"
#include "str.hh"

namespace genpw {

// Entry of `ProfileCatalog::ListProfiles`.
struct ProfileListing {
  Str id;
  Str description;
  // Default layout with 'x' for random characters, e.g. "xxxx_xxxx_xxxx_xxxx".
  Str example_layout;
};

// Read-only collection of validated profiles.
//
// Built once at startup & passed by reference to whoever needs to look up
// profiles. Nothing mutates it after construction.
struct ProfileCatalog {
  // Don't modify directly. Use `Make` or `BuiltIn`.
  std::vector<Profile> profiles;

  // Validates every profile & checks that ids are unique.
  static ProfileCatalog Make(std::vector<Profile> profiles, Status &status);

  // The default, simple, paranoid & compliant profiles.
  static ProfileCatalog BuiltIn(Status &status);

  // Fails with UnknownProfileError (listing the valid names) when `id` is not
  // in the catalog.
  const Profile *Find(StrView id, Status &status) const;

  std::vector<Str> Names() const;

  // Profiles in catalog order.
  std::vector<ProfileListing> ListProfiles() const;
};

} // namespace genpw
