#include "charset.hh"

#include "format.hh"

namespace genpw {

bool IsDangerousChar(char c) { return kDangerousChars.find(c) != StrView::npos; }

bool IsWordBoundaryChar(char c) { return kWordBoundaryChars.find(c) != StrView::npos; }

static Str Printable(char c) {
  if (c == ' ') {
    return "space";
  }
  if (c < 0x21 || c > 0x7e) {
    return f("0x%02x", (unsigned char)c);
  }
  return f("'%c'", c);
}

Charset Charset::Make(StrView name, StrView chars, Status &status) {
  Charset ret;
  ret.name = name;
  for (char c : chars) {
    if (IsDangerousChar(c)) {
      AppendErrorMessage(status, ErrorKind::Configuration) +=
          f("Charset %s contains dangerous character %s", ret.name.c_str(),
            Printable(c).c_str());
      return {};
    }
    if (c < 0x21 || c > 0x7e) {
      AppendErrorMessage(status, ErrorKind::Configuration) +=
          f("Charset %s contains non-printable character %s", ret.name.c_str(),
            Printable(c).c_str());
      return {};
    }
    if (!ret.Contains(c)) {
      ret.chars += c;
    }
  }
  if (ret.chars.empty()) {
    AppendErrorMessage(status, ErrorKind::Configuration) +=
        f("Charset %s is empty", ret.name.c_str());
    return {};
  }
  return ret;
}

bool Charset::WordSafe() const {
  for (char c : chars) {
    if (IsWordBoundaryChar(c)) {
      return false;
    }
  }
  return true;
}

Charset Charset::Plus(StrView union_name, const Charset &other) const {
  Charset ret{.name = Str(union_name), .chars = chars};
  for (char c : other.chars) {
    if (!ret.Contains(c)) {
      ret.chars += c;
    }
  }
  return ret;
}

} // namespace genpw
