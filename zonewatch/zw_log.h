#pragma once

// Compile-time gated logging.
// Keep the level low in production, serial printing from the scan path adds jitter.
//   0 off, 1 error, 2 warn, 3 info, 4 debug
#ifndef ZW_LOG_LEVEL
#define ZW_LOG_LEVEL 3
#endif

namespace zonewatch {

// Sink for all ZW_LOG* macros. The firmware prints through Serial,
// host tests print to stderr.
void logWrite(char level, const char* tag, const char* fmt, ...)
    __attribute__((format(printf, 3, 4)));

}  // namespace zonewatch

#if ZW_LOG_LEVEL >= 1
  #define ZW_LOGE(tag, ...) ::zonewatch::logWrite('E', tag, __VA_ARGS__)
#else
  #define ZW_LOGE(tag, ...)
#endif

#if ZW_LOG_LEVEL >= 2
  #define ZW_LOGW(tag, ...) ::zonewatch::logWrite('W', tag, __VA_ARGS__)
#else
  #define ZW_LOGW(tag, ...)
#endif

#if ZW_LOG_LEVEL >= 3
  #define ZW_LOGI(tag, ...) ::zonewatch::logWrite('I', tag, __VA_ARGS__)
#else
  #define ZW_LOGI(tag, ...)
#endif

#if ZW_LOG_LEVEL >= 4
  #define ZW_LOGD(tag, ...) ::zonewatch::logWrite('D', tag, __VA_ARGS__)
#else
  #define ZW_LOGD(tag, ...)
#endif
