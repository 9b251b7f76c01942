/*
 * =================================================================================
 * Project:   BeaconGate - BLE Gate Automation Controller
 * File:      lib/GateEngine/Types.cpp
 * =================================================================================
 */
#include <string.h>

#include "Types.h"

const char *gateStateToString(GateState s) {
  switch (s) {
  case GATE_CLOSED:
    return "closed";
  case GATE_OPENING:
    return "opening";
  case GATE_OPEN:
    return "open";
  case GATE_CLOSING:
    return "closing";
  default:
    return "unknown";
  }
}

const char *activityTypeToString(ActivityType t) {
  switch (t) {
  case ACT_GATE_OPENED:
    return "gate_opened";
  case ACT_GATE_CLOSED:
    return "gate_closed";
  case ACT_TOKEN_DETECTED:
    return "token_detected";
  case ACT_TOKEN_REGISTERED:
    return "token_registered";
  case ACT_TOKEN_UNREGISTERED:
    return "token_unregistered";
  case ACT_TOKEN_UPDATED:
    return "token_updated";
  case ACT_ERROR:
    return "error";
  case ACT_CONFIG_UPDATED:
    return "config_updated";
  default:
    return "info";
  }
}

bool activityTypeFromString(const char *str, ActivityType &out) {
  if (str == nullptr) return false;

  static const ActivityType all[] = {ACT_GATE_OPENED,        ACT_GATE_CLOSED,   ACT_TOKEN_DETECTED,
                                     ACT_TOKEN_REGISTERED,   ACT_TOKEN_UNREGISTERED, ACT_TOKEN_UPDATED,
                                     ACT_ERROR,              ACT_INFO,          ACT_CONFIG_UPDATED};
  for (size_t i = 0; i < sizeof(all) / sizeof(all[0]); i++) {
    if (strcmp(str, activityTypeToString(all[i])) == 0) {
      out = all[i];
      return true;
    }
  }
  return false;
}

const char *activityModeToString(ActivityMode m) {
  return (m == ACTIVITY_EXTENDED) ? "extended" : "suppress";
}

const char *deviceKindToString(DeviceKind k) {
  return (k == DEVICE_BEACON) ? "beacon" : "device";
}
