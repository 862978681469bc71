#include "core/fault.h"

#include <cstdarg>
#include <cstdio>

bool raise_fault(Fault* fault, FaultKind kind, const char* reason, const char* fmt, ...) {
  if (!fault) return false;

  char buf[256];
  va_list args;
  va_start(args, fmt);
  vsnprintf(buf, sizeof(buf), fmt, args);
  va_end(args);

  fault->kind = kind;
  fault->reason = reason;
  fault->detail = buf;
  return false;
}
