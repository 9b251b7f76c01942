/*
 * =================================================================================
 * File:      src/SettingsManager.cpp
 * Description: Implementation of configuration validation and saving.
 * =================================================================================
 */
#include "SettingsManager.h"
#include "ConfigCodec.h"
#include "Esp32GateHAL.h" // For logging
#include <Arduino.h>
#include <Preferences.h>

// --- Preferences Namespaces ---
static Preferences wifiPrefs;
static Preferences c4Prefs;
static Preferences gatePrefs;
static Preferences tokenPrefs;
static Preferences activityPrefs;

// --- Safety Limits ---
static const uint32_t ABS_MIN_TIMEOUT = 1;
static const uint32_t ABS_MAX_TIMEOUT = 24 * 3600;
static const uint32_t ABS_MIN_INTERVAL = 1;
static const uint32_t ABS_MAX_INTERVAL = 3600;
static const uint32_t ABS_MIN_NEARBY_SCAN = 1;
static const uint32_t ABS_MAX_NEARBY_SCAN = 60;

// Helper for logging via HAL
void SettingsManager::log(const char *key, const char *val) { Esp32GateHAL::getInstance().logKeyValue(key, val); }

// =================================================================================
// SECTION: FACTORY RESET
// =================================================================================

void SettingsManager::wipeAll() {
  log("Settings", "Performing Full Factory Wipe...");

  wifiPrefs.begin("wifi-creds", false);
  wifiPrefs.clear();
  wifiPrefs.end();
  c4Prefs.begin("c4", false);
  c4Prefs.clear();
  c4Prefs.end();
  gatePrefs.begin("gate", false);
  gatePrefs.clear();
  gatePrefs.end();
  tokenPrefs.begin("tokens", false);
  tokenPrefs.clear();
  tokenPrefs.end();
  activityPrefs.begin("activity", false);
  activityPrefs.clear();
  activityPrefs.end();

  log("Settings", "Factory Wipe Complete.");
}

// =================================================================================
// SECTION: WIFI
// =================================================================================

void SettingsManager::setWifiSSID(const char *ssid) {
  wifiPrefs.begin("wifi-creds", false);
  wifiPrefs.putString("ssid", ssid);
  wifiPrefs.end();
  log("Settings", "SSID Updated");
}

void SettingsManager::setWifiPassword(const char *pass) {
  wifiPrefs.begin("wifi-creds", false);
  wifiPrefs.putString("pass", pass);
  wifiPrefs.end();
  log("Settings", "WiFi Password Updated");
}

void SettingsManager::getWifiSSID(char *buf, size_t maxLen) {
  wifiPrefs.begin("wifi-creds", true);
  String s = wifiPrefs.getString("ssid", "");
  wifiPrefs.end();
  if (maxLen > 0) {
    strncpy(buf, s.c_str(), maxLen);
    buf[maxLen - 1] = '\0';
  }
}

void SettingsManager::getWifiPassword(char *buf, size_t maxLen) {
  wifiPrefs.begin("wifi-creds", true);
  String p = wifiPrefs.getString("pass", "");
  wifiPrefs.end();
  if (maxLen > 0) {
    strncpy(buf, p.c_str(), maxLen);
    buf[maxLen - 1] = '\0';
  }
}

// =================================================================================
// SECTION: CONTROLLER
// =================================================================================

void SettingsManager::setControllerHost(const char *host) {
  c4Prefs.begin("c4", false);
  c4Prefs.putString("host", host);
  c4Prefs.end();
  log("Settings", "Controller Host Updated");
}

void SettingsManager::setControllerUser(const char *user) {
  c4Prefs.begin("c4", false);
  c4Prefs.putString("user", user);
  c4Prefs.end();
  log("Settings", "Controller User Updated");
}

void SettingsManager::setControllerPassword(const char *pass) {
  c4Prefs.begin("c4", false);
  c4Prefs.putString("pass", pass);
  c4Prefs.end();
  log("Settings", "Controller Password Updated");
}

void SettingsManager::setControllerItems(uint32_t gateDeviceId, uint32_t openScenario, uint32_t closeScenario, uint32_t agentId) {
  c4Prefs.begin("c4", false);
  c4Prefs.putUInt("gateId", gateDeviceId);
  c4Prefs.putUInt("openScn", openScenario);
  c4Prefs.putUInt("closeScn", closeScenario);
  c4Prefs.putUInt("agentId", agentId);
  c4Prefs.end();

  char logBuf[96];
  snprintf(logBuf, sizeof(logBuf), "C4 Items: gate %u, open %u, close %u, agent %u", gateDeviceId, openScenario, closeScenario,
           agentId);
  log("Settings", logBuf);
}

void SettingsManager::loadActuatorConfig(ActuatorConfig &config) {
  c4Prefs.begin("c4", true);
  config.host = c4Prefs.getString("host", "").c_str();
  config.username = c4Prefs.getString("user", "").c_str();
  config.password = c4Prefs.getString("pass", "").c_str();
  config.gateDeviceId = c4Prefs.getUInt("gateId", config.gateDeviceId);
  config.openScenario = c4Prefs.getUInt("openScn", config.openScenario);
  config.closeScenario = c4Prefs.getUInt("closeScn", config.closeScenario);
  config.notificationAgentId = c4Prefs.getUInt("agentId", config.notificationAgentId);
  c4Prefs.end();
}

bool SettingsManager::hasControllerCredentials() {
  ActuatorConfig config;
  loadActuatorConfig(config);
  return !config.host.empty() && !config.username.empty() && !config.password.empty();
}

// =================================================================================
// SECTION: GATE TUNABLES
// =================================================================================

void SettingsManager::loadGateConfig(GateConfig &config) {
  gatePrefs.begin("gate", true);
  config.autoCloseTimeout = gatePrefs.getUInt("autoClose", config.autoCloseTimeout);
  config.sessionTimeout = gatePrefs.getUInt("session", config.sessionTimeout);
  config.statusCheckInterval = gatePrefs.getUInt("statusInt", config.statusCheckInterval);
  config.bleScanInterval = gatePrefs.getUInt("scanInt", config.bleScanInterval);
  config.tokenIdleTimeout = gatePrefs.getUInt("tokenIdle", config.tokenIdleTimeout);
  config.autoCloseCheckInterval = gatePrefs.getUInt("acCheckInt", config.autoCloseCheckInterval);
  config.nearbyScanDuration = gatePrefs.getUInt("nearbyDur", config.nearbyScanDuration);
  gatePrefs.end();
}

GateConfig SettingsManager::saveGateConfig(const GateConfig &config) {
  GateConfig stored;
  stored.autoCloseTimeout =
      validateAndSave("autoClose", config.autoCloseTimeout, ABS_MIN_TIMEOUT, ABS_MAX_TIMEOUT, "Auto-Close Timeout");
  stored.sessionTimeout = validateAndSave("session", config.sessionTimeout, ABS_MIN_TIMEOUT, ABS_MAX_TIMEOUT, "Session Timeout");
  stored.statusCheckInterval =
      validateAndSave("statusInt", config.statusCheckInterval, ABS_MIN_INTERVAL, ABS_MAX_INTERVAL, "Status Interval");
  stored.bleScanInterval = validateAndSave("scanInt", config.bleScanInterval, ABS_MIN_INTERVAL, ABS_MAX_INTERVAL, "Scan Interval");
  stored.tokenIdleTimeout =
      validateAndSave("tokenIdle", config.tokenIdleTimeout, ABS_MIN_TIMEOUT, ABS_MAX_TIMEOUT, "Token Idle Timeout");
  stored.autoCloseCheckInterval =
      validateAndSave("acCheckInt", config.autoCloseCheckInterval, ABS_MIN_INTERVAL, ABS_MAX_INTERVAL, "Auto-Close Check");
  stored.nearbyScanDuration =
      validateAndSave("nearbyDur", config.nearbyScanDuration, ABS_MIN_NEARBY_SCAN, ABS_MAX_NEARBY_SCAN, "Nearby Scan");
  return stored;
}

uint32_t SettingsManager::validateAndSave(const char *key, uint32_t value, uint32_t min, uint32_t max, const char *label) {
  uint32_t finalValue = value;
  const char *note = "";

  if (finalValue < min) {
    finalValue = min;
    note = " (Clamped Min)";
  } else if (finalValue > max) {
    finalValue = max;
    note = " (Clamped Max)";
  }

  gatePrefs.begin("gate", false);
  gatePrefs.putUInt(key, finalValue);
  gatePrefs.end();

  char logBuf[128];
  if (value != finalValue) {
    snprintf(logBuf, sizeof(logBuf), "%s: %u s%s (Req: %u)", label, finalValue, note, value);
  } else {
    snprintf(logBuf, sizeof(logBuf), "%s: %u s", label, finalValue);
  }
  log("Settings", logBuf);

  return finalValue;
}

// =================================================================================
// SECTION: TOKEN LIST
// =================================================================================

bool SettingsManager::loadTokens(std::vector<Token> &tokens) {
  tokenPrefs.begin("tokens", true);
  String stored = tokenPrefs.getString("list", "");
  tokenPrefs.end();

  std::string errorMsg;
  if (!ConfigCodec::deserializeTokens(std::string(stored.c_str()), tokens, errorMsg)) {
    log("Settings", errorMsg.c_str());
    return false;
  }

  char logBuf[64];
  snprintf(logBuf, sizeof(logBuf), "Loaded %u token(s).", (unsigned)tokens.size());
  log("Settings", logBuf);
  return true;
}

bool SettingsManager::saveTokens(const std::vector<Token> &tokens) {
  std::string json;
  ConfigCodec::serializeTokens(tokens, json);

  tokenPrefs.begin("tokens", false);
  size_t written = tokenPrefs.putString("list", json.c_str());
  tokenPrefs.end();

  // putString returns 0 on failure (an empty list still writes "[]")
  if (written == 0) {
    log("Settings", "Token list write FAILED.");
    return false;
  }
  return true;
}

// =================================================================================
// SECTION: ACTIVITY
// =================================================================================

ActivityMode SettingsManager::getActivityMode() {
  activityPrefs.begin("activity", true);
  uint8_t mode = activityPrefs.getUChar("mode", (uint8_t)ACTIVITY_SUPPRESS);
  activityPrefs.end();
  return mode == (uint8_t)ACTIVITY_EXTENDED ? ACTIVITY_EXTENDED : ACTIVITY_SUPPRESS;
}

void SettingsManager::setActivityMode(ActivityMode mode) {
  activityPrefs.begin("activity", false);
  activityPrefs.putUChar("mode", (uint8_t)mode);
  activityPrefs.end();

  char logBuf[48];
  snprintf(logBuf, sizeof(logBuf), "Activity Mode: %s", activityModeToString(mode));
  log("Settings", logBuf);
}
