#include "profile.hh"

#include "format.hh"

namespace genpw {

std::optional<char> Profile::Separator() const {
  if (separators.empty()) {
    return std::nullopt;
  }
  return separators.front();
}

void Profile::Validate(Status &status) const {
  if (id.empty()) {
    AppendErrorMessage(status, ErrorKind::Configuration) += "Profile has no id";
    return;
  }
  if (position_charsets.empty()) {
    AppendErrorMessage(status, ErrorKind::Configuration) +=
        f("Profile %s has no charsets", id.c_str());
    return;
  }
  for (const Charset &charset : position_charsets) {
    // Charsets are normally built with Charset::Make, but aggregate
    // initialization skips its checks.
    Charset::Make(charset.name, charset.chars, status);
    if (!OK(status)) {
      AppendErrorMessage(status, ErrorKind::Configuration) += f("Profile %s", id.c_str());
      return;
    }
    if (word_safe && !charset.WordSafe()) {
      AppendErrorMessage(status, ErrorKind::Configuration) +=
          f("Profile %s claims to be word-safe but charset %s breaks "
            "double-click selection",
            id.c_str(), charset.name.c_str());
      return;
    }
  }
  for (char c : separators) {
    if (charsets::kSafeSeparators.find(c) == StrView::npos) {
      AppendErrorMessage(status, ErrorKind::Configuration) +=
          f("Profile %s uses '%c' as a separator. Allowed separators: %.*s", id.c_str(), c,
            (int)charsets::kSafeSeparators.size(), charsets::kSafeSeparators.data());
      return;
    }
    if (word_safe && IsWordBoundaryChar(c)) {
      AppendErrorMessage(status, ErrorKind::Configuration) +=
          f("Profile %s claims to be word-safe but separator '%c' breaks "
            "double-click selection",
            id.c_str(), c);
      return;
    }
  }
  if (default_segments < 1 || default_segment_length < 1) {
    AppendErrorMessage(status, ErrorKind::Configuration) +=
        f("Profile %s has invalid default layout %dx%d", id.c_str(), default_segments,
          default_segment_length);
    return;
  }
}

} // namespace genpw
