#pragma once

#include "int.hh"
#include "str.hh"

namespace genpw {

// printf-style formatting into a Str. The format attribute lets the compiler
// check arguments against the format string.
Str f(const char *fmt, ...) __attribute__((format(printf, 1, 2)));

// Prefix each line with `spaces` spaces.
Str IndentString(Str in, int spaces = 2);

// Pads `s` with spaces on the right so that it occupies at least `width`
// columns. Assumes ASCII.
Str PadRight(StrView s, Size width);

} // namespace genpw
