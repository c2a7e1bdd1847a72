#include "format.hh"

#include <cstdarg>
#include <cstdio>

namespace genpw {

Str f(const char *fmt, ...) {
  va_list args;
  va_start(args, fmt);
  va_list args2;
  va_copy(args2, args);
  int n = vsnprintf(NULL, 0, fmt, args) + 1;
  va_end(args);
  char buf[n];
  vsnprintf(buf, sizeof(buf), fmt, args2);
  va_end(args2);
  return Str(buf);
}

Str IndentString(Str in, int spaces) {
  Str out(spaces, ' ');
  for (Size i = 0; i < in.size(); ++i) {
    out += in[i];
    if (in[i] == '\n' && i + 1 < in.size()) {
      out.append(spaces, ' ');
    }
  }
  return out;
}

Str PadRight(StrView s, Size width) {
  Str ret(s);
  if (ret.size() < width) {
    ret.append(width - ret.size(), ' ');
  }
  return ret;
}

} // namespace genpw
