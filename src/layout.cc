#include "layout.hh"

#include "format.hh"

namespace genpw {

Str SegmentPlan::ToStr() const {
  if (separator) {
    return f("%dx%d '%c'", segment_count, segment_length, *separator);
  }
  return f("%dx%d", segment_count, segment_length);
}

static bool InvalidValue(const std::optional<int> &value) {
  return value.has_value() && (*value < 1 || *value > kMaxPasswordLength);
}

SegmentPlan ResolveLayout(const Profile &profile, const LayoutRequest &request,
                          Status &status) {
  if (InvalidValue(request.length) || InvalidValue(request.segments) ||
      InvalidValue(request.segment_length)) {
    AppendErrorMessage(status, ErrorKind::Configuration) +=
        f("invalid layout parameters: length, segments & segment length must be "
          "between 1 and %d",
          kMaxPasswordLength);
    return {};
  }

  const int w = profile.SeparatorWidth();
  SegmentPlan plan{.segment_count = profile.default_segments,
                   .segment_length = profile.default_segment_length,
                   .separator = profile.Separator()};

  auto conflict = [&]() {
    AppendErrorMessage(status, ErrorKind::Configuration) +=
        f("conflicting layout parameters: length=%s segments=%s segment_length=%s",
          request.length ? ToStr(*request.length).c_str() : "auto",
          request.segments ? ToStr(*request.segments).c_str() : "auto",
          request.segment_length ? ToStr(*request.segment_length).c_str() : "auto");
  };

  if (request.length && !request.segments && !request.segment_length) {
    // Round up to a whole number of segments.
    int length = *request.length;
    int step = plan.segment_length + w;
    plan.segment_count = (length + w + step - 1) / step;
  } else if (request.length && request.segments && !request.segment_length) {
    int count = *request.segments;
    int body = *request.length - (count - 1) * w;
    if (body < count || body % count != 0) {
      conflict();
      return {};
    }
    plan.segment_count = count;
    plan.segment_length = body / count;
  } else if (request.length && !request.segments && request.segment_length) {
    int step = *request.segment_length + w;
    if ((*request.length + w) % step != 0) {
      conflict();
      return {};
    }
    plan.segment_count = (*request.length + w) / step;
    plan.segment_length = *request.segment_length;
  } else {
    plan.segment_count = request.segments.value_or(plan.segment_count);
    plan.segment_length = request.segment_length.value_or(plan.segment_length);
    if (request.length && plan.TotalLength() != *request.length) {
      conflict();
      return {};
    }
  }

  if (plan.segment_count < 1 || plan.segment_length < 1 ||
      plan.TotalLength() > kMaxPasswordLength) {
    AppendErrorMessage(status, ErrorKind::Configuration) +=
        f("invalid layout parameters: %s gives %d characters (maximum is %d)",
          plan.ToStr().c_str(), plan.TotalLength(), kMaxPasswordLength);
    return {};
  }
  return plan;
}

Str ExampleLayout(const Profile &profile, const SegmentPlan &plan) {
  Str ret;
  ret.reserve(plan.TotalLength());
  for (int s = 0; s < plan.segment_count; ++s) {
    if (s > 0 && plan.separator) {
      ret += profile.SeparatorAt(s - 1);
    }
    ret.append(plan.segment_length, 'x');
  }
  return ret;
}

} // namespace genpw
