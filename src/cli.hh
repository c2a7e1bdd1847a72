#pragma once

#include <optional>

#include "catalog.hh"
#include "config.hh"
#include "layout.hh"
#include "random.hh"
#include "status.hh"
#include "str.hh"

namespace genpw {

// Parsed command line. Unset values fall back to the config file.
struct Options {
  std::optional<Str> profile;
  std::optional<int> count;
  std::optional<bool> copy;
  std::optional<bool> verbose;
  std::optional<RandomSourceKind> random_source;
  LayoutRequest layout;
  bool list = false;
  bool explain = false;
  bool help = false;
};

extern const char kUsage[];

// Accepts `--flag value`, `--flag=value` & `-f value`.
//
// Fails with ConfigurationError on unknown flags, missing or malformed values
// and conflicting profile flags (e.g. --simple --paranoid).
Options ParseArgs(int argc, const char *const argv[], Status &status);

// Overwrite `config` with everything that was given on the command line.
void ApplyOptions(const Options &options, Config &config);

// Text printed by --list. One row per profile with its id, default layout, a
// freshly generated sample & its rounded entropy, followed by the indented
// description.
//
// Fails with RandomSourceError when a sample can't be generated.
Str RenderProfileList(const ProfileCatalog &catalog, RandomSource &random, Status &status);

} // namespace genpw
