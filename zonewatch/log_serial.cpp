#include "zw_log.h"

#include <Arduino.h>
#include <stdarg.h>
#include <stdio.h>

namespace zonewatch {

void logWrite(char level, const char* tag, const char* fmt, ...) {
  char buf[192];
  va_list args;
  va_start(args, fmt);
  vsnprintf(buf, sizeof(buf), fmt, args);
  va_end(args);

  Serial.printf("%8lu [%c][%s] %s\n", static_cast<unsigned long>(millis()), level, tag, buf);
}

}  // namespace zonewatch
