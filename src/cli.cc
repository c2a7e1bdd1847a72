#include "cli.hh"

#include "entropy.hh"
#include "format.hh"
#include "passgen.hh"

namespace genpw {

const char kUsage[] = R"(Usage: genpassword [options]

Generate passwords that are safe to paste into shells, URLs, SQL & config
files, and that double-click selection picks up in one piece.

Profiles:
  (default)              Kp4x_Tm9n_Bc2w_Qf7v  mixed case + digits (~95 bits)
  -s, --simple           hn4k_xp2m_b7qf_9dtc  easy to dictate (~79 bits)
  -p, --paranoid         Kp4x.Tm9n-Bc2w^Qf7v  rotating symbols (~95 bits)
  -c, --compliant        Kp4x_Tm9n_Bc2w_Qf7v  every class in every segment (~75 bits)
      --profile NAME     select a profile by name

Layout:
  -l, --length N         total length, rounded up to whole segments
      --segments N       number of segments (default: 4)
      --segment-length N characters per segment (default: 4)

Output:
  -n, --count N          number of passwords to generate (default: 1)
      --no-copy          don't copy the password to the clipboard
      --list             show the available profiles with examples
      --explain          show the entropy breakdown of the layout
  -v, --verbose          log the entropy of every password
      --random-source S  getrandom (default) or openssl
  -h, --help             show this message

Examples:
  genpassword --segments 5         # 24 chars, ~119 bits
  genpassword --segment-length 5   # 23 chars, ~119 bits
  genpassword -l 30                # 34 chars (7 segments)

Defaults can be stored in ~/.config/genpassword/config (or the file named by
$GENPASSWORD_CONFIG) as `key = value` lines. Keys: profile, count, copy,
verbose, random_source. Command line flags take precedence.
)";

static void SetProfile(Options &options, StrView name, Status &status) {
  if (options.profile && *options.profile != name) {
    AppendErrorMessage(status, ErrorKind::Configuration) +=
        f("conflicting profile flags: %s and %.*s", options.profile->c_str(), (int)name.size(),
          name.data());
    return;
  }
  options.profile = Str(name);
}

static void ParseIntFlag(StrView flag, StrView value, std::optional<int> &out,
                         Status &status) {
  int parsed;
  if (!ParseInt(value, parsed)) {
    AppendErrorMessage(status, ErrorKind::Configuration) +=
        f("%.*s expects an integer, got \"%.*s\"", (int)flag.size(), flag.data(),
          (int)value.size(), value.data());
    return;
  }
  // Range checks for layout values happen in ResolveLayout.
  out = parsed;
}

Options ParseArgs(int argc, const char *const argv[], Status &status) {
  Options options;
  for (int i = 1; i < argc; ++i) {
    StrView arg = argv[i];
    StrView flag = arg;
    std::optional<StrView> inline_value;
    if (arg.starts_with("--")) {
      if (auto eq = arg.find('='); eq != StrView::npos) {
        flag = arg.substr(0, eq);
        inline_value = arg.substr(eq + 1);
      }
    }
    // Returns the value of the current flag, consuming the next argument if
    // needed.
    auto value = [&]() -> std::optional<StrView> {
      if (inline_value) {
        return inline_value;
      }
      if (i + 1 < argc) {
        return StrView(argv[++i]);
      }
      AppendErrorMessage(status, ErrorKind::Configuration) +=
          f("%.*s expects a value", (int)flag.size(), flag.data());
      return std::nullopt;
    };
    auto no_value = [&]() {
      if (inline_value) {
        AppendErrorMessage(status, ErrorKind::Configuration) +=
            f("%.*s doesn't take a value", (int)flag.size(), flag.data());
      }
    };

    if (flag == "-h" || flag == "--help") {
      no_value();
      options.help = true;
    } else if (flag == "-s" || flag == "--simple") {
      no_value();
      SetProfile(options, "simple", status);
    } else if (flag == "-p" || flag == "--paranoid") {
      no_value();
      SetProfile(options, "paranoid", status);
    } else if (flag == "-c" || flag == "--compliant") {
      no_value();
      SetProfile(options, "compliant", status);
    } else if (flag == "--profile") {
      if (auto v = value()) {
        SetProfile(options, *v, status);
      }
    } else if (flag == "-n" || flag == "--count") {
      if (auto v = value()) {
        std::optional<int> count;
        ParseIntFlag(flag, *v, count, status);
        if (count && *count < 1) {
          AppendErrorMessage(status, ErrorKind::Configuration) +=
              f("%.*s must be positive", (int)flag.size(), flag.data());
        } else {
          options.count = count;
        }
      }
    } else if (flag == "-l" || flag == "--length") {
      if (auto v = value()) {
        ParseIntFlag(flag, *v, options.layout.length, status);
      }
    } else if (flag == "--segments") {
      if (auto v = value()) {
        ParseIntFlag(flag, *v, options.layout.segments, status);
      }
    } else if (flag == "--segment-length") {
      if (auto v = value()) {
        ParseIntFlag(flag, *v, options.layout.segment_length, status);
      }
    } else if (flag == "--no-copy") {
      no_value();
      options.copy = false;
    } else if (flag == "--list") {
      no_value();
      options.list = true;
    } else if (flag == "--explain") {
      no_value();
      options.explain = true;
    } else if (flag == "-v" || flag == "--verbose") {
      no_value();
      options.verbose = true;
    } else if (flag == "--random-source") {
      if (auto v = value()) {
        RandomSourceKind kind;
        if (ParseRandomSourceKind(*v, kind)) {
          options.random_source = kind;
        } else {
          AppendErrorMessage(status, ErrorKind::Configuration) +=
              f("--random-source must be getrandom or openssl, got \"%.*s\"", (int)v->size(),
                v->data());
        }
      }
    } else {
      AppendErrorMessage(status, ErrorKind::Configuration) +=
          f("unknown argument \"%.*s\"", (int)arg.size(), arg.data());
    }
    RETURN_VAL_ON_ERROR(status, options);
  }
  return options;
}

void ApplyOptions(const Options &options, Config &config) {
  if (options.profile) {
    config.profile = *options.profile;
  }
  if (options.count) {
    config.count = *options.count;
  }
  if (options.copy) {
    config.copy = *options.copy;
  }
  if (options.verbose) {
    config.verbose = *options.verbose;
  }
  if (options.random_source) {
    config.random_source = *options.random_source;
  }
}

Str RenderProfileList(const ProfileCatalog &catalog, RandomSource &random, Status &status) {
  Str out = "Available profiles:\n";
  for (const ProfileListing &listing : catalog.ListProfiles()) {
    GeneratedPassword sample =
        Generate(catalog, GenerationRequest{.profile_name = listing.id}, random, status);
    RETURN_VAL_ON_ERROR(status, {});
    out += f("  %s %s  %s  ~%d bits\n", PadRight(listing.id, 10).c_str(),
             listing.example_layout.c_str(), sample.text.c_str(),
             RoundedBits(sample.entropy_bits));
    out += IndentString(listing.description, 13);
    out += "\n";
  }
  return out;
}

} // namespace genpw
