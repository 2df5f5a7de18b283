#include "beacon_types.h"

#include <stdio.h>

namespace zonewatch {

namespace {

int hexValue(char c) {
  if (c >= '0' && c <= '9') return c - '0';
  if (c >= 'a' && c <= 'f') return c - 'a' + 10;
  if (c >= 'A' && c <= 'F') return c - 'A' + 10;
  return -1;
}

inline bool isDashPosition(size_t i) {
  return i == 8 || i == 13 || i == 18 || i == 23;
}

}  // namespace

bool parseUuid(const char* text, BeaconUuid* out) {
  if (!text || !out) return false;
  if (strlen(text) != kUuidTextLen - 1) return false;

  BeaconUuid parsed;
  size_t byteIdx = 0;
  for (size_t i = 0; i < kUuidTextLen - 1;) {
    if (isDashPosition(i)) {
      if (text[i] != '-') return false;
      i++;
      continue;
    }
    const int hi = hexValue(text[i]);
    const int lo = hexValue(text[i + 1]);
    if (hi < 0 || lo < 0) return false;
    parsed.bytes[byteIdx++] = static_cast<uint8_t>((hi << 4) | lo);
    i += 2;
  }

  *out = parsed;
  return true;
}

void formatUuid(const BeaconUuid& uuid, char* out, size_t outLen) {
  if (!out || outLen == 0) return;
  const uint8_t* d = uuid.bytes;
  snprintf(out, outLen,
           "%02X%02X%02X%02X-%02X%02X-%02X%02X-%02X%02X-%02X%02X%02X%02X%02X%02X",
           d[0], d[1], d[2], d[3], d[4], d[5], d[6], d[7], d[8], d[9],
           d[10], d[11], d[12], d[13], d[14], d[15]);
}

}  // namespace zonewatch
