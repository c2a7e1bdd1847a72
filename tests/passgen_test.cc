#ifdef NDEBUG
#undef NDEBUG
#endif

#include <cassert>
#include <cctype>
#include <cmath>

#include "catalog.hh"
#include "entropy.hh"
#include "passgen.hh"
#include "scripted_random.hh"

using namespace genpw;

static ProfileCatalog catalog = []() {
  Status status;
  ProfileCatalog ret = ProfileCatalog::BuiltIn(status);
  assert(OK(status));
  return ret;
}();

static const Profile &Get(StrView id) {
  Status status;
  const Profile *profile = catalog.Find(id, status);
  assert(OK(status));
  return *profile;
}

static std::vector<U32> Sequence(U32 from, U32 count) {
  std::vector<U32> ret;
  for (U32 i = 0; i < count; ++i) {
    ret.push_back(from + i);
  }
  return ret;
}

// Splits `text` the way double-click selection does & returns the number of
// selectable pieces.
static int SelectableUnits(StrView text) {
  int units = 0;
  bool in_unit = false;
  for (char c : text) {
    if (IsWordBoundaryChar(c)) {
      in_unit = false;
    } else if (!in_unit) {
      in_unit = true;
      ++units;
    }
  }
  return units;
}

static void TestScriptedDefault() {
  ScriptedRandomSource random(Sequence(0, 16));
  Status status;
  GeneratedPassword password = Synthesize(Get("default"), SegmentPlan{4, 4, '_'}, random, status);
  assert(OK(status));
  assert(password.text == "ABCD_EFGH_IJKL_MNOP");
  assert(password.profile_id == "default");
  assert(random.calls == 16);
}

static void TestScriptedAlphabetEnds() {
  ScriptedRandomSource random({25, 26, 51, 52, 61, 0});
  Status status;
  GeneratedPassword password = Synthesize(Get("default"), SegmentPlan{2, 3, '_'}, random, status);
  assert(OK(status));
  assert(password.text == "Zaz_09A");
}

static void TestScriptedParanoidRotation() {
  ScriptedRandomSource random(std::vector<U32>(24, 0));
  Status status;
  GeneratedPassword password =
      Synthesize(Get("paranoid"), SegmentPlan{6, 4, '.'}, random, status);
  assert(OK(status));
  assert(password.text == "AAAA.AAAA-AAAA^AAAA:AAAA.AAAA");
}

static void TestScriptedSimple() {
  ScriptedRandomSource random({0, 22, 23, 30});
  Status status;
  GeneratedPassword password = Synthesize(Get("simple"), SegmentPlan{1, 4, '_'}, random, status);
  assert(OK(status));
  assert(password.text == "az29");
}

static void TestDeterministic() {
  Status status;
  SeededRandomSource a(1234), b(1234);
  for (int i = 0; i < 50; ++i) {
    GenerationRequest request{.profile_name = "paranoid", .layout = {.length = 40}};
    auto pa = Generate(catalog, request, a, status);
    auto pb = Generate(catalog, request, b, status);
    assert(OK(status));
    assert(pa.text == pb.text);
  }
}

static void TestExhaustedSourceLeavesNoPartialPassword() {
  ScriptedRandomSource random(Sequence(0, 10));
  Status status;
  GeneratedPassword password = Synthesize(Get("default"), SegmentPlan{4, 4, '_'}, random, status);
  assert(!OK(status));
  assert(status.Is(ErrorKind::RandomSource));
  assert(status.ToStr().starts_with("RandomSourceError:"));
  assert(password.text.empty());
  // No retries after the failure.
  assert(random.calls == 11);
}

static void TestOutOfRangeDraw() {
  ScriptedRandomSource random({1, 2, 62});
  Status status;
  GeneratedPassword password = Synthesize(Get("default"), SegmentPlan{1, 4, '_'}, random, status);
  assert(status.Is(ErrorKind::RandomSource));
  assert(password.text.empty());
}

static void TestScenarioDefaultLength19() {
  SeededRandomSource random(7);
  Status status;
  GeneratedPassword password = Generate(
      catalog, GenerationRequest{.profile_name = "default", .layout = {.length = 19}}, random,
      status);
  assert(OK(status));
  assert(password.text.size() == 19);
  assert(password.profile_id == "default");
  for (int i : {4, 9, 14}) {
    assert(password.text[i] == '_');
  }
  assert(std::fabs(password.entropy_bits - 16 * std::log2(62.0)) < 1e-9);
  assert(RoundedBits(password.entropy_bits) == 95);
}

static void TestScenarioSimpleFiveSegments() {
  SeededRandomSource random(8);
  Status status;
  GeneratedPassword password = Generate(
      catalog, GenerationRequest{.profile_name = "simple", .layout = {.segments = 5}}, random,
      status);
  assert(OK(status));
  assert(password.text.size() == 24);
  assert(std::fabs(password.entropy_bits - 20 * std::log2(31.0)) < 1e-9);
  assert(RoundedBits(password.entropy_bits) == 99);
}

static void TestScenarioParanoidLength30() {
  SeededRandomSource random(9);
  Status status;
  GeneratedPassword password = Generate(
      catalog, GenerationRequest{.profile_name = "paranoid", .layout = {.length = 30}}, random,
      status);
  assert(OK(status));
  assert(password.text.size() == 34);
  assert(password.text[4] == '.');
  assert(SelectableUnits(password.text) == 7);
}

static void TestScenarioUnknownProfile() {
  ScriptedRandomSource random;
  Status status;
  GeneratedPassword password =
      Generate(catalog, GenerationRequest{.profile_name = "nonexistent"}, random, status);
  assert(status.Is(ErrorKind::UnknownProfile));
  assert(password.text.empty());
  assert(random.calls == 0);
}

static void TestScenarioConflictingLayout() {
  ScriptedRandomSource random;
  Status status;
  GeneratedPassword password = Generate(
      catalog,
      GenerationRequest{.profile_name = "default",
                        .layout = {.length = 50, .segments = 3, .segment_length = 4}},
      random, status);
  assert(status.Is(ErrorKind::Configuration));
  assert(password.text.empty());
  assert(random.calls == 0);
}

static void TestSafetyProperties() {
  SeededRandomSource random(2024);
  for (StrView id : {"default"sv, "simple"sv, "paranoid"sv, "compliant"sv}) {
    const Profile &profile = Get(id);
    for (int i = 0; i < 1000; ++i) {
      Status status;
      GeneratedPassword password = Generate(
          catalog, GenerationRequest{.profile_name = Str(id), .layout = {.length = 8 + i % 60}},
          random, status);
      assert(OK(status));
      for (char c : password.text) {
        assert(!IsDangerousChar(c));
      }
      if (profile.word_safe) {
        // Only word characters, so the whole password is one selectable unit.
        for (char c : password.text) {
          assert(std::isalnum((unsigned char)c) || c == '_');
          assert(!IsWordBoundaryChar(c));
        }
        assert(SelectableUnits(password.text) == 1);
      } else {
        assert(SelectableUnits(password.text) > 1);
      }
    }
  }
}

static void TestCompliantSegmentsHaveEveryClass() {
  SeededRandomSource random(31337);
  for (int i = 0; i < 2000; ++i) {
    Status status;
    GeneratedPassword password = Generate(
        catalog,
        GenerationRequest{.profile_name = "compliant",
                          .layout = {.segments = 1 + i % 6, .segment_length = 3 + i % 5}},
        random, status);
    assert(OK(status));
    Size start = 0;
    while (start <= password.text.size()) {
      Size end = password.text.find('_', start);
      if (end == Str::npos) {
        end = password.text.size();
      }
      StrView segment = StrView(password.text).substr(start, end - start);
      assert(std::isupper((unsigned char)segment[0]));
      assert(std::islower((unsigned char)segment[1]));
      assert(std::isdigit((unsigned char)segment[2]));
      start = end + 1;
    }
  }
}

static void TestScriptedCompliant() {
  // Index 0 of every charset: 'A', 'a', '0' & 'A' again for the alnum position.
  ScriptedRandomSource random(std::vector<U32>(8, 0));
  Status status;
  GeneratedPassword password =
      Synthesize(Get("compliant"), SegmentPlan{2, 4, '_'}, random, status);
  assert(OK(status));
  assert(password.text == "Aa0A_Aa0A");
}

static void TestSimpleHasNoAmbiguousOrShiftedChars() {
  SeededRandomSource random(99);
  for (int i = 0; i < 500; ++i) {
    Status status;
    GeneratedPassword password =
        Generate(catalog, GenerationRequest{.profile_name = "simple"}, random, status);
    assert(OK(status));
    for (char c : password.text) {
      assert(Str("0Oo1Ili").find(c) == Str::npos);
      assert(!std::isupper((unsigned char)c));
    }
  }
}

int main() {
  TestScriptedCompliant();
  TestCompliantSegmentsHaveEveryClass();
  TestScriptedDefault();
  TestScriptedAlphabetEnds();
  TestScriptedParanoidRotation();
  TestScriptedSimple();
  TestDeterministic();
  TestExhaustedSourceLeavesNoPartialPassword();
  TestOutOfRangeDraw();
  TestScenarioDefaultLength19();
  TestScenarioSimpleFiveSegments();
  TestScenarioParanoidLength30();
  TestScenarioUnknownProfile();
  TestScenarioConflictingLayout();
  TestSafetyProperties();
  TestSimpleHasNoAmbiguousOrShiftedChars();
  return 0;
}
