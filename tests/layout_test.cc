#ifdef NDEBUG
#undef NDEBUG
#endif

#include <cassert>

#include "catalog.hh"
#include "layout.hh"

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

static SegmentPlan Resolve(StrView id, LayoutRequest request) {
  Status status;
  SegmentPlan plan = ResolveLayout(Get(id), request, status);
  assert(OK(status));
  assert(plan.TotalLength() ==
         plan.segment_count * plan.segment_length +
             (plan.segment_count - 1) * plan.SeparatorWidth());
  return plan;
}

static Status ResolveError(StrView id, LayoutRequest request) {
  Status status;
  ResolveLayout(Get(id), request, status);
  assert(!OK(status));
  return status;
}

static void TestDefaults() {
  SegmentPlan plan = Resolve("default", {});
  assert((plan == SegmentPlan{4, 4, '_'}));
  assert(plan.TotalLength() == 19);
  assert(plan.RandomPositions() == 16);
}

static void TestLengthExactFit() {
  SegmentPlan plan = Resolve("default", {.length = 19});
  assert((plan == SegmentPlan{4, 4, '_'}));
  assert(plan.TotalLength() == 19);
}

static void TestLengthRoundsUp() {
  SegmentPlan plan = Resolve("paranoid", {.length = 30});
  assert(plan.segment_count == 7);
  assert(plan.segment_length == 4);
  assert(plan.separator == '.');
  assert(plan.TotalLength() == 34);

  // Shorter than a single segment still yields a whole segment.
  plan = Resolve("simple", {.length = 2});
  assert(plan.segment_count == 1);
  assert(plan.TotalLength() == 4);
}

static void TestLengthBounds() {
  for (StrView id : {"default"sv, "simple"sv, "paranoid"sv}) {
    const Profile &profile = Get(id);
    int slack = profile.default_segment_length + profile.SeparatorWidth();
    for (int length = 8; length <= 256; ++length) {
      SegmentPlan plan = Resolve(id, {.length = length});
      assert(plan.segment_length == profile.default_segment_length);
      assert(plan.TotalLength() >= length);
      assert(plan.TotalLength() < length + slack);
    }
  }
}

static void TestExplicitSegments() {
  SegmentPlan plan = Resolve("simple", {.segments = 5});
  assert((plan == SegmentPlan{5, 4, '_'}));
  assert(plan.TotalLength() == 24);

  plan = Resolve("default", {.segment_length = 5});
  assert((plan == SegmentPlan{4, 5, '_'}));
  assert(plan.TotalLength() == 23);

  plan = Resolve("default", {.segments = 6});
  assert(plan.TotalLength() == 29);
}

static void TestConsistentExplicitValues() {
  assert((Resolve("default", {.length = 14, .segments = 3, .segment_length = 4}) ==
          SegmentPlan{3, 4, '_'}));
  assert((Resolve("default", {.length = 24, .segments = 5}) == SegmentPlan{5, 4, '_'}));
  assert((Resolve("default", {.length = 29, .segments = 5}) == SegmentPlan{5, 5, '_'}));
  assert((Resolve("default", {.length = 23, .segment_length = 5}) == SegmentPlan{4, 5, '_'}));
  assert((Resolve("default", {.segments = 2, .segment_length = 8}) == SegmentPlan{2, 8, '_'}));
}

static void TestConflictingValues() {
  LayoutRequest requests[] = {
      {.length = 50, .segments = 3, .segment_length = 4},
      {.length = 25, .segments = 5},
      {.length = 20, .segment_length = 4},
      // Would need segments of zero characters.
      {.length = 5, .segments = 4},
  };
  for (auto &request : requests) {
    Status status = ResolveError("default", request);
    assert(status.Is(ErrorKind::Configuration));
    assert(status.ToStr().find("conflicting layout parameters") != Str::npos);
  }
}

static void TestInvalidValues() {
  LayoutRequest requests[] = {
      {.segments = 0},
      {.segment_length = -1},
      {.length = 0},
      {.length = -19},
      {.length = kMaxPasswordLength + 1},
      {.segments = kMaxPasswordLength, .segment_length = kMaxPasswordLength},
      {.segments = 1000, .segment_length = 10},
  };
  for (auto &request : requests) {
    Status status = ResolveError("default", request);
    assert(status.Is(ErrorKind::Configuration));
    assert(status.ToStr().find("invalid layout parameters") != Str::npos);
  }
}

static void TestIdempotent() {
  LayoutRequest request{.length = 37};
  for (StrView id : {"default"sv, "simple"sv, "paranoid"sv}) {
    assert(Resolve(id, request) == Resolve(id, request));
  }
}

static void TestWithoutSeparator() {
  Status status;
  Profile profile{
      .id = "solid",
      .position_charsets = {Charset::Make("LOWER", charsets::kLower, status)},
      .separators = "",
      .default_segments = 1,
      .default_segment_length = 4,
      .word_safe = true,
  };
  profile.Validate(status);
  assert(OK(status));

  SegmentPlan plan = ResolveLayout(profile, {.length = 10}, status);
  assert(OK(status));
  assert(!plan.separator);
  assert(plan.segment_count == 3);
  assert(plan.TotalLength() == 12);

  plan = ResolveLayout(profile, {.length = 12, .segments = 3}, status);
  assert(OK(status));
  assert(plan.segment_length == 4);
}

static void TestExampleLayout() {
  assert(ExampleLayout(Get("default"), Resolve("default", {})) == "xxxx_xxxx_xxxx_xxxx");
  assert(ExampleLayout(Get("paranoid"), Resolve("paranoid", {.length = 30})) ==
         "xxxx.xxxx-xxxx^xxxx:xxxx.xxxx-xxxx");
  assert(ExampleLayout(Get("simple"), Resolve("simple", {.segments = 1, .segment_length = 3})) ==
         "xxx");
}

static void TestPlanToStr() {
  assert((SegmentPlan{4, 4, '_'}.ToStr() == "4x4 '_'"));
  assert((SegmentPlan{2, 6, std::nullopt}.ToStr() == "2x6"));
}

int main() {
  TestDefaults();
  TestLengthExactFit();
  TestLengthRoundsUp();
  TestLengthBounds();
  TestExplicitSegments();
  TestConsistentExplicitValues();
  TestConflictingValues();
  TestInvalidValues();
  TestIdempotent();
  TestWithoutSeparator();
  TestExampleLayout();
  TestPlanToStr();
  return 0;
}
