#include <cstdio>
#include <vector>

#include "catalog.hh"
#include "cli.hh"
#include "clipboard.hh"
#include "config.hh"
#include "entropy.hh"
#include "format.hh"
#include "log.hh"
#include "passgen.hh"
#include "random.hh"
#include "status.hh"

using namespace genpw;

// Exit codes.
constexpr int kExitRandomSource = 1;
constexpr int kExitUsage = 2;

static int ExitCode(const Status &status) {
  return status.Is(ErrorKind::RandomSource) ? kExitRandomSource : kExitUsage;
}

static int PrintList(const ProfileCatalog &catalog, RandomSource &random) {
  Status status;
  Str list = RenderProfileList(catalog, random, status);
  if (!OK(status)) {
    ERROR << status;
    return ExitCode(status);
  }
  printf("%s", list.c_str());
  return 0;
}

static int Explain(const ProfileCatalog &catalog, const GenerationRequest &request) {
  Status status;
  const Profile *profile = catalog.Find(request.profile_name, status);
  if (!OK(status)) {
    ERROR << status;
    return ExitCode(status);
  }
  SegmentPlan plan = ResolveLayout(*profile, request.layout, status);
  if (!OK(status)) {
    ERROR << status;
    return ExitCode(status);
  }
  printf("Example:       %s\n", ExampleLayout(*profile, plan).c_str());
  printf("%s", ExplainEntropy(*profile, plan).c_str());
  return 0;
}

int main(int argc, char *argv[]) {
  Status status;

  Options options = ParseArgs(argc, argv, status);
  if (!OK(status)) {
    ERROR << status;
    ERROR << "Try `genpassword --help`.";
    return kExitUsage;
  }
  if (options.help) {
    printf("%s", kUsage);
    return 0;
  }

  Config config;
  ReadConfig(ConfigPath(), config, status);
  if (!OK(status)) {
    ERROR << status;
    return kExitUsage;
  }
  ApplyOptions(options, config);

  ProfileCatalog catalog = ProfileCatalog::BuiltIn(status);
  if (!OK(status)) {
    FATAL << "Built-in profiles are broken: " << status;
  }

  auto random = MakeRandomSource(config.random_source);
  if (config.verbose) {
    LOG << "Random source: " << RandomSourceKindName(config.random_source);
  }

  if (options.list) {
    return PrintList(catalog, *random);
  }

  GenerationRequest request{.profile_name = config.profile, .layout = options.layout};

  if (options.explain) {
    return Explain(catalog, request);
  }

  std::vector<GeneratedPassword> passwords;
  for (int i = 0; i < config.count; ++i) {
    passwords.push_back(Generate(catalog, request, *random, status));
    if (!OK(status)) {
      ERROR << status;
      return ExitCode(status);
    }
  }

  for (const GeneratedPassword &password : passwords) {
    printf("%s\n", password.text.c_str());
    if (config.verbose) {
      LOG << password.profile_id << ": ~" << RoundedBits(password.entropy_bits)
          << " bits of entropy (" << f("%.2f", password.entropy_bits) << ")";
    }
  }
  fflush(stdout);

  // Copy only when there's a single, unambiguous password.
  if (config.copy && passwords.size() == 1) {
    clipboard::Copy(passwords.back().text, status);
    if (OK(status)) {
      LOG << "Copied to clipboard";
    } else {
      ERROR << "Couldn't copy to clipboard: " << status;
    }
  }
  return 0;
}
