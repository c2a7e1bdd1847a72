#include "config.hh"

#include <unistd.h>

#include <cerrno>
#include <cstdlib>
#include <fstream>
#include <sstream>

#include "format.hh"

namespace genpw {

Str ConfigPath() {
  if (auto env = getenv("GENPASSWORD_CONFIG"); env && *env) {
    return env;
  }
  if (auto xdg = getenv("XDG_CONFIG_HOME"); xdg && *xdg) {
    return Str(xdg) + "/genpassword/config";
  }
  if (auto home = getenv("HOME"); home && *home) {
    return Str(home) + "/.config/genpassword/config";
  }
  return "";
}

void ParseConfig(StrView text, StrView origin, Config &config, Status &status) {
  std::istringstream stream{Str(text)};
  Str line;
  int line_number = 0;
  while (getline(stream, line)) {
    ++line_number;
    if (auto pos = line.find('#'); pos != Str::npos) {
      line.resize(pos);
    }
    StripWhitespace(line);
    if (line.empty()) {
      continue;
    }
    auto fail = [&](const Str &message) {
      AppendErrorMessage(status, ErrorKind::Configuration) +=
          f("%.*s:%d: %s", (int)origin.size(), origin.data(), line_number, message.c_str());
    };
    auto eq = line.find('=');
    if (eq == Str::npos) {
      fail("expected `key = value`, got \"" + line + "\"");
      return;
    }
    Str key = line.substr(0, eq);
    Str value = line.substr(eq + 1);
    StripWhitespace(key);
    StripWhitespace(value);
    if (key == "profile") {
      if (value.empty()) {
        fail("profile can't be empty");
        return;
      }
      config.profile = value;
    } else if (key == "count") {
      int count;
      if (!ParseInt(value, count) || count < 1) {
        fail("count must be a positive integer, got \"" + value + "\"");
        return;
      }
      config.count = count;
    } else if (key == "copy") {
      if (!ParseBool(value, config.copy)) {
        fail("copy must be true or false, got \"" + value + "\"");
        return;
      }
    } else if (key == "verbose") {
      if (!ParseBool(value, config.verbose)) {
        fail("verbose must be true or false, got \"" + value + "\"");
        return;
      }
    } else if (key == "random_source") {
      if (!ParseRandomSourceKind(value, config.random_source)) {
        fail("random_source must be getrandom or openssl, got \"" + value + "\"");
        return;
      }
    } else {
      fail("unknown key \"" + key + "\"");
      return;
    }
  }
}

void ReadConfig(const Str &path, Config &config, Status &status) {
  if (path.empty()) {
    return;
  }
  if (access(path.c_str(), F_OK) != 0) {
    // No config file.
    errno = 0;
    return;
  }
  std::ifstream file(path);
  if (!file) {
    AppendErrorMessage(status) += "Couldn't open config file " + path;
    status.kind = ErrorKind::Configuration;
    return;
  }
  std::stringstream contents;
  contents << file.rdbuf();
  ParseConfig(contents.str(), path, config, status);
}

} // namespace genpw
