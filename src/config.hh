#pragma once

#include "random.hh"
#include "status.hh"
#include "str.hh"

namespace genpw {

// Settings read from the config file. Command line flags take precedence.
//
// Example:
//
//   # ~/.config/genpassword/config
//   profile = simple
//   count = 3
//   copy = false
//   random_source = openssl
//   verbose = true
struct Config {
  Str profile = "default";
  int count = 1;
  bool copy = true;
  bool verbose = false;
  RandomSourceKind random_source = RandomSourceKind::GetRandom;
};

// $GENPASSWORD_CONFIG, $XDG_CONFIG_HOME/genpassword/config or
// ~/.config/genpassword/config, whichever is set first. Empty if none of the
// variables is set.
Str ConfigPath();

// Parse `key = value` lines into `config`. `origin` is used in error messages.
//
// Unknown keys & malformed values fail with ConfigurationError.
void ParseConfig(StrView text, StrView origin, Config &config, Status &status);

// Read & parse the file at `path`. A missing file leaves `config` untouched.
void ReadConfig(const Str &path, Config &config, Status &status);

} // namespace genpw
