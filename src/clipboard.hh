#pragma once

#include "status.hh"
#include "str.hh"

// Copying text to the desktop clipboard through the usual command line tools.
namespace genpw::clipboard {

// Copy `text` with the first available of wl-copy (Wayland), xclip, xsel (X11)
// or pbcopy (macOS).
void Copy(StrView text, Status &status);

// Run `command` through the shell and write `text` to its stdin. `name` is used
// in error messages. SIGPIPE is ignored during the write so a command that exits
// early produces an error instead of killing the process.
void PipeTo(const char *name, const char *command, StrView text, Status &status);

} // namespace genpw::clipboard
