#pragma once

#include <sys/types.h>

#include <cstddef>

namespace genpw {

using U8 = unsigned char;
using U32 = unsigned int;

static_assert(sizeof(U32) == 4);

using Size = size_t;
using SSize = ssize_t;

} // namespace genpw
