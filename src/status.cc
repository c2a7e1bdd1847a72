#include "status.hh"

#include <cerrno>
#include <cstring>

#include "format.hh"

namespace genpw {

StrView ErrorKindName(ErrorKind kind) {
  switch (kind) {
  case ErrorKind::None:
    return "Error";
  case ErrorKind::Configuration:
    return "ConfigurationError";
  case ErrorKind::UnknownProfile:
    return "UnknownProfileError";
  case ErrorKind::RandomSource:
    return "RandomSourceError";
  }
  return "Error";
}

Status::Status() : errsv(0), kind(ErrorKind::None) {}

Str &Status::operator()(const std::source_location location_arg) {
  if (errsv == 0) {
    errsv = errno;
    errno = 0;
  }
  entry.reset(new Entry{
      .next = std::move(entry), .location = location_arg, .message = {}});
  return entry->message;
}

Str &Status::operator()(ErrorKind kind_arg,
                        const std::source_location location_arg) {
  if (kind == ErrorKind::None) {
    kind = kind_arg;
  }
  entry.reset(new Entry{
      .next = std::move(entry), .location = location_arg, .message = {}});
  return entry->message;
}

void AppendErrorAdvice(Status &status, StrView advice) {
  if (status.entry) {
    status.entry->advice += advice;
  }
}

bool Status::Ok() const { return errsv == 0 && entry == nullptr; }

Str Status::ToStr() const {
  Str ret;
  if (kind != ErrorKind::None) {
    ret += ErrorKindName(kind);
    ret += ":";
  }
  for (Entry *i = entry.get(); i != nullptr; i = i->next.get()) {
    if (!ret.empty()) {
      ret += " ";
    }
    ret += i->message;
    if (!ret.empty()) {
      ret += " ";
    }
    auto &location = i->location;
    ret += f("(%s:%d).", location.file_name(), (int)location.line());
    if (!i->advice.empty()) {
      ret += " ";
      ret += i->advice;
    }
  }
  if (errsv) {
    if (!ret.empty()) {
      ret += " ";
    }
    ret += strerror(errsv);
    ret += '.';
  }
  return ret;
}

void Status::Reset() {
  errsv = 0;
  kind = ErrorKind::None;
  entry.reset();
}

} // namespace genpw
