#include "str.hh"

#include <algorithm>
#include <cctype>
#include <charconv>

namespace genpw {

void StripLeadingWhitespace(Str &s) {
  s.erase(s.begin(), std::find_if(s.begin(), s.end(),
                                  [](unsigned char ch) { return !std::isspace(ch); }));
}

void StripTrailingWhitespace(Str &s) {
  while (!s.empty() and std::isspace((unsigned char)s.back())) {
    s.pop_back();
  }
}

void StripWhitespace(Str &s) {
  StripLeadingWhitespace(s);
  StripTrailingWhitespace(s);
}

Str Join(const std::vector<Str> &parts, StrView separator) {
  Str ret;
  for (const Str &part : parts) {
    if (!ret.empty()) {
      ret += separator;
    }
    ret += part;
  }
  return ret;
}

bool ParseInt(StrView s, int &out) {
  if (s.starts_with('+')) {
    s.remove_prefix(1);
  }
  if (s.empty()) {
    return false;
  }
  int value = 0;
  auto [ptr, ec] = std::from_chars(s.data(), s.data() + s.size(), value);
  if (ec != std::errc() || ptr != s.data() + s.size()) {
    return false;
  }
  out = value;
  return true;
}

bool ParseBool(StrView s, bool &out) {
  if (s == "true" || s == "yes" || s == "1" || s == "on") {
    out = true;
    return true;
  }
  if (s == "false" || s == "no" || s == "0" || s == "off") {
    out = false;
    return true;
  }
  return false;
}

} // namespace genpw
