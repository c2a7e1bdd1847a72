#include "clipboard.hh"

#include <sys/wait.h>

#include <csignal>

#include <cstdio>
#include <cstdlib>

#include "format.hh"

namespace genpw::clipboard {

struct Tool {
  const char *name;
  // Environment variable that must be set for the tool to work (or nullptr).
  const char *requires_env;
  const char *command;
};

static const Tool kTools[] = {
    {"wl-copy", "WAYLAND_DISPLAY", "wl-copy"},
    {"xclip", "DISPLAY", "xclip -selection clipboard"},
    {"xsel", "DISPLAY", "xsel --clipboard --input"},
    {"pbcopy", nullptr, "pbcopy"},
};

static bool IsInstalled(const char *name) {
  Str probe = f("command -v %s >/dev/null 2>&1", name);
  return system(probe.c_str()) == 0;
}

static const Tool *FindTool() {
  static const Tool *tool = []() -> const Tool * {
    for (const Tool &candidate : kTools) {
      if (candidate.requires_env && getenv(candidate.requires_env) == nullptr) {
        continue;
      }
      if (IsInstalled(candidate.name)) {
        return &candidate;
      }
    }
    return nullptr;
  }();
  return tool;
}

void Copy(StrView text, Status &status) {
  const Tool *tool = FindTool();
  if (tool == nullptr) {
    AppendErrorMessage(status) += "No clipboard tool found";
    AppendErrorAdvice(status, "Install wl-clipboard, xclip or xsel, or pass --no-copy.");
    return;
  }
  PipeTo(tool->name, tool->command, text, status);
}

void PipeTo(const char *name, const char *command, StrView text, Status &status) {
  FILE *pipe = popen(command, "w");
  if (pipe == nullptr) {
    AppendErrorMessage(status) += f("Couldn't start %s", name);
    return;
  }
  struct sigaction ignore = {}, previous;
  ignore.sa_handler = SIG_IGN;
  sigemptyset(&ignore.sa_mask);
  sigaction(SIGPIPE, &ignore, &previous);
  Size written = fwrite(text.data(), 1, text.size(), pipe);
  int ret = pclose(pipe);
  sigaction(SIGPIPE, &previous, nullptr);
  if (written != text.size()) {
    AppendErrorMessage(status) += f("Couldn't write to %s", name);
    return;
  }
  if (ret == -1 || !WIFEXITED(ret) || WEXITSTATUS(ret) != 0) {
    AppendErrorMessage(status) += f("%s failed", name);
    return;
  }
}

} // namespace genpw::clipboard
