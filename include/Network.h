/*
 * =================================================================================
 * File:      include/Network.h
 * Description: Public interface for Network Management.
 * WiFi station, mDNS, NTP time sync and BLE provisioning.
 * =================================================================================
 */
#pragma once
#include <Arduino.h>
#include <WiFi.h>
#include <freertos/timers.h>

class NetworkManager {
public:
  // Singleton Accessor
  static NetworkManager &getInstance();

  // --- Public API ---

  /**
   * Connects the station with stored credentials.
   * Missing WiFi or controller credentials, or WIFI_MAX_RETRIES failed
   * attempts, raise the provisioning flag instead. Never blocks.
   */
  void connectOrRequestProvisioning();

  bool isProvisioningNeeded() const { return _triggerProvisioning; }
  bool isConnected() const { return WiFi.status() == WL_CONNECTED; }

  /**
   * Advertises the provisioning GATT service (WiFi, controller account,
   * gate item and scenario numbers). Returns only through a reboot.
   */
  void startBLEProvisioningBlocking();

  // Starts SNTP. Epoch timestamps read 0 until the first sync lands.
  void startTimeSync();

  const char *getHostname() const { return _hostname; }

  void printStartupDiagnostics();

private:
  NetworkManager(); // Private Constructor

  void log(const char *key, const char *value);

  // --- Internal State ---
  char _wifiSSID[33];
  char _wifiPass[65];
  char _hostname[32];
  bool _wifiCredentialsExist;

  volatile bool _triggerProvisioning;
  volatile int _wifiRetries;
  TimerHandle_t _wifiReconnectTimer;

  // --- Helpers ---
  void connectToWiFi();
  void startMDNS();

  // --- Static Callbacks (Trampolines) ---
  static void onWiFiEvent(WiFiEvent_t event);
  static void onWifiTimer(TimerHandle_t t);

  // --- Member Event Handlers ---
  void handleWiFiEvent(WiFiEvent_t event);
  void handleWifiTimer();
};
