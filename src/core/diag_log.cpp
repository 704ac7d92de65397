// Tagged stderr diagnostics.

#include "core/diag_log.h"

#include <cstdarg>
#include <cstdio>

namespace affect {

namespace {

void writeLine(const char* tag, const char* fmt, va_list args) {
  std::fprintf(stderr, "[%s] ", tag);
  std::vfprintf(stderr, fmt, args);
  std::fprintf(stderr, "\n");
}

}  // namespace

void logWarn(const char* tag, const char* fmt, ...) {
  va_list args;
  va_start(args, fmt);
  writeLine(tag, fmt, args);
  va_end(args);
}

void logDebug(bool verbose, const char* tag, const char* fmt, ...) {
  if (!verbose) return;
  va_list args;
  va_start(args, fmt);
  writeLine(tag, fmt, args);
  va_end(args);
}

}  // namespace affect
