/*
 * =================================================================================
 * File:      include/SettingsManager.h
 * Description:
 * Central controller for Device Configuration and Storage.
 * - Manages all NVS (Preferences) interactions.
 * - Validates tunables against safety limits.
 * =================================================================================
 */
#pragma once
#include "Types.h"
#include <stdint.h>
#include <vector>

class SettingsManager {
public:
  // --- WiFi Management ---
  static void setWifiSSID(const char *ssid);
  static void setWifiPassword(const char *pass);
  static void getWifiSSID(char *buf, size_t maxLen);
  static void getWifiPassword(char *buf, size_t maxLen);

  // --- Controller (Control4) ---
  static void setControllerHost(const char *host);
  static void setControllerUser(const char *user);
  static void setControllerPassword(const char *pass);
  static void setControllerItems(uint32_t gateDeviceId, uint32_t openScenario, uint32_t closeScenario, uint32_t agentId);
  static void loadActuatorConfig(ActuatorConfig &config);
  static bool hasControllerCredentials();

  // --- Gate Tunables (Validated) ---
  // Missing keys keep the compile-time defaults
  static void loadGateConfig(GateConfig &config);
  // Clamps each value into its safety range and returns what was stored
  static GateConfig saveGateConfig(const GateConfig &config);

  // --- Token List ---
  // Returns false if the stored document cannot be read or parsed.
  static bool loadTokens(std::vector<Token> &tokens);
  static bool saveTokens(const std::vector<Token> &tokens);

  // --- Activity ---
  static ActivityMode getActivityMode();
  static void setActivityMode(ActivityMode mode);

  // --- Factory Reset ---
  static void wipeAll();

private:
  // Internal helper to perform clamping and logging
  static uint32_t validateAndSave(const char *key, uint32_t value, uint32_t min, uint32_t max, const char *label);
  static void log(const char *key, const char *value);
};
