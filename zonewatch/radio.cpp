#include "radio.h"

namespace zonewatch {

const char* scanStatusName(ScanStatus s) {
  switch (s) {
    case ScanStatus::kOk:               return "OK";
    case ScanStatus::kRadioUnavailable: return "RADIO_UNAVAILABLE";
    case ScanStatus::kPermissionDenied: return "PERMISSION_DENIED";
    case ScanStatus::kInitFailed:       return "INIT_FAILED";
    case ScanStatus::kTaskFailed:       return "TASK_FAILED";
    default:                            return "?";
  }
}

}  // namespace zonewatch
