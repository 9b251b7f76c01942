/*
 * =================================================================================
 * Project:   BeaconGate - BLE Gate Automation Controller
 * File:      src/Network.cpp
 *
 * Description:
 * Network management module. Handles Wi-Fi connection logic, time sync and
 * BLE Provisioning of WiFi and controller credentials.
 * =================================================================================
 */
#include <BLEDevice.h>
#include <BLEServer.h>
#include <BLEUtils.h>
#include <ESPmDNS.h>
#include <WiFi.h>
#include <esp_task_wdt.h>
#include <time.h>

#include "Config.h"
#include "Esp32GateHAL.h"
#include "Network.h"
#include "SettingsManager.h"
#include "Types.h"

// =================================================================================
// SECTION: CONSTANTS & UUIDS
// =================================================================================

#define PROV_SERVICE_UUID "7b1a0000-3c52-4e0b-9d35-6a1f2e8c4b10"

// --- WiFi Credentials ---
#define PROV_SSID_CHAR_UUID "7b1a0001-3c52-4e0b-9d35-6a1f2e8c4b10"
#define PROV_PASS_CHAR_UUID "7b1a0002-3c52-4e0b-9d35-6a1f2e8c4b10"

// --- Controller ---
#define PROV_C4_HOST_UUID "7b1a0010-3c52-4e0b-9d35-6a1f2e8c4b10"
#define PROV_C4_USER_UUID "7b1a0011-3c52-4e0b-9d35-6a1f2e8c4b10"
#define PROV_C4_PASS_UUID "7b1a0012-3c52-4e0b-9d35-6a1f2e8c4b10"
#define PROV_C4_GATE_ID_UUID "7b1a0013-3c52-4e0b-9d35-6a1f2e8c4b10"
#define PROV_C4_OPEN_SCN_UUID "7b1a0014-3c52-4e0b-9d35-6a1f2e8c4b10"
#define PROV_C4_CLOSE_SCN_UUID "7b1a0015-3c52-4e0b-9d35-6a1f2e8c4b10"

// =================================================================================
// SECTION: CLASS IMPLEMENTATION
// =================================================================================

NetworkManager &NetworkManager::getInstance() {
  static NetworkManager instance;
  return instance;
}

NetworkManager::NetworkManager() : _wifiCredentialsExist(false), _triggerProvisioning(false), _wifiRetries(0), _wifiReconnectTimer(NULL) {
  memset(_wifiSSID, 0, sizeof(_wifiSSID));
  memset(_wifiPass, 0, sizeof(_wifiPass));
  memset(_hostname, 0, sizeof(_hostname));
}

void NetworkManager::log(const char *key, const char *val) { Esp32GateHAL::getInstance().logKeyValue(key, val); }

// =================================================================================
// SECTION: WIFI LOGIC
// =================================================================================

void NetworkManager::connectToWiFi() {
  if (!_wifiCredentialsExist)
    return;
  if (WiFi.status() == WL_CONNECTED)
    return;

  log("Network", "Connecting...");
  WiFi.mode(WIFI_STA);
  WiFi.begin(_wifiSSID, _wifiPass);
}

// --- Static Callbacks ---

void NetworkManager::onWiFiEvent(WiFiEvent_t event) { getInstance().handleWiFiEvent(event); }

void NetworkManager::onWifiTimer(TimerHandle_t t) { getInstance().handleWifiTimer(); }

// --- Member Handlers ---

void NetworkManager::handleWifiTimer() { connectToWiFi(); }

void NetworkManager::handleWiFiEvent(WiFiEvent_t event) {
  switch (event) {
  case ARDUINO_EVENT_WIFI_STA_GOT_IP:
    log("Network", "Connected.");
    _wifiRetries = 0;
    if (_wifiReconnectTimer != NULL)
      xTimerStop(_wifiReconnectTimer, 0);
    break;
  case ARDUINO_EVENT_WIFI_STA_DISCONNECTED:
    if (_wifiRetries >= WIFI_MAX_RETRIES) {
      log("Network", "Max retries exceeded. Requesting Provisioning...");
      if (_wifiReconnectTimer != NULL)
        xTimerStop(_wifiReconnectTimer, 0);
      _triggerProvisioning = true;
    } else {
      _wifiRetries++;
      if (_wifiReconnectTimer != NULL)
        xTimerStart(_wifiReconnectTimer, 0);
    }
    break;
  default:
    break;
  }
}

void NetworkManager::startMDNS() {
  log("Network", "Starting mDNS advertiser...");
  uint8_t mac[6];
  esp_efuse_mac_get_default(mac);
  snprintf(_hostname, sizeof(_hostname), "beacongate-%02x%02x%02x", mac[3], mac[4], mac[5]);

  if (!MDNS.begin(_hostname)) {
    log("Network", "Failed to set up mDNS responder!");
    return;
  }
  MDNS.addService("http", "tcp", WEB_SERVER_PORT);

  char logBuf[64];
  snprintf(logBuf, sizeof(logBuf), "mDNS active: %s.local", _hostname);
  log("Network", logBuf);
}

void NetworkManager::startTimeSync() {
  configTime(0, 0, NTP_SERVER_1, NTP_SERVER_2);
  log("Network", "SNTP started (UTC).");
}

// =================================================================================
// SECTION: BLE PROVISIONING (Transport Only)
// =================================================================================

static uint32_t bytesToUint32(const uint8_t *data, size_t len) {
  uint32_t v = 0;
  for (size_t i = 0; i < len && i < 4; i++)
    v |= ((uint32_t)data[i]) << (8 * i);
  return v;
}

class ProvisioningCallbacks : public BLECharacteristicCallbacks {
  // Flag to signal completion to the manager
  bool *_credentialsReceivedPtr;

private:
  void log(const char *key, const char *val) { Esp32GateHAL::getInstance().logKeyValue(key, val); }

public:
  ProvisioningCallbacks(bool *flagPtr) : _credentialsReceivedPtr(flagPtr) {}

  void onWrite(BLECharacteristic *pCharacteristic) {
    std::string uuid = pCharacteristic->getUUID().toString();
    uint8_t *data = pCharacteristic->getData();
    size_t len = pCharacteristic->getLength();

    if (len == 0)
      return;

    std::string val(data, data + len);

    // --- WiFi ---
    if (uuid == PROV_SSID_CHAR_UUID) {
      SettingsManager::setWifiSSID(val.c_str());
      log("BLE", "SSID Received");
    } else if (uuid == PROV_PASS_CHAR_UUID) {
      SettingsManager::setWifiPassword(val.c_str());
      log("BLE", "Password Received");
      // Written last by the provisioning client. Triggers Reboot.
      if (_credentialsReceivedPtr) *_credentialsReceivedPtr = true;
    }

    // --- Controller ---
    else if (uuid == PROV_C4_HOST_UUID) SettingsManager::setControllerHost(val.c_str());
    else if (uuid == PROV_C4_USER_UUID) SettingsManager::setControllerUser(val.c_str());
    else if (uuid == PROV_C4_PASS_UUID) SettingsManager::setControllerPassword(val.c_str());

    // --- Controller Items (Read-Modify-Write) ---
    else {
      ActuatorConfig config;
      SettingsManager::loadActuatorConfig(config);
      uint32_t num = bytesToUint32(data, len);

      if (uuid == PROV_C4_GATE_ID_UUID) config.gateDeviceId = num;
      else if (uuid == PROV_C4_OPEN_SCN_UUID) config.openScenario = num;
      else if (uuid == PROV_C4_CLOSE_SCN_UUID) config.closeScenario = num;
      else return;

      SettingsManager::setControllerItems(config.gateDeviceId, config.openScenario, config.closeScenario,
                                          config.notificationAgentId);
    }
  }
};

void NetworkManager::startBLEProvisioningBlocking() {
  log("BLE", "Entering Provisioning Mode (Blocking)...");

  // 1. Shutdown WiFi
  WiFi.disconnect(true);
  WiFi.mode(WIFI_OFF);

  // 2. Feedback
  Esp32GateHAL::getInstance().getStatusLed().FadeOn(500).FadeOff(500).Forever();

  // 3. Init BLE
  bool localCredentialsReceived = false;

  BLEDevice::init(DEVICE_NAME);
  BLEServer *pServer = BLEDevice::createServer();
  BLEService *pService = pServer->createService(BLEUUID(PROV_SERVICE_UUID), 30);

  ProvisioningCallbacks *callbacks = new ProvisioningCallbacks(&localCredentialsReceived);

  auto createChar = [&](const char *uuid) {
    BLECharacteristic *p = pService->createCharacteristic(uuid, BLECharacteristic::PROPERTY_WRITE);
    p->setCallbacks(callbacks);
    return p;
  };

  // Credentials
  createChar(PROV_SSID_CHAR_UUID);
  createChar(PROV_PASS_CHAR_UUID);

  // Controller
  createChar(PROV_C4_HOST_UUID);
  createChar(PROV_C4_USER_UUID);
  createChar(PROV_C4_PASS_UUID);
  createChar(PROV_C4_GATE_ID_UUID);
  createChar(PROV_C4_OPEN_SCN_UUID);
  createChar(PROV_C4_CLOSE_SCN_UUID);

  pService->start();

  BLEAdvertising *pAdvertising = BLEDevice::getAdvertising();
  pAdvertising->addServiceUUID(PROV_SERVICE_UUID);
  pAdvertising->start();

  // 4. Blocking Loop
  while (1) {
    Esp32GateHAL::getInstance().tick();

    if (localCredentialsReceived) {
      log("BLE", "Credentials received. Restarting...");
      Esp32GateHAL::getInstance().tick();
      delay(3000);
      ESP.restart();
    }

    esp_task_wdt_reset();
    delay(100);
  }
}

// =================================================================================
// SECTION: PUBLIC API IMPLEMENTATION
// =================================================================================

void NetworkManager::connectOrRequestProvisioning() {
  // Create Timer
  _wifiReconnectTimer = xTimerCreate("wifiTimer", pdMS_TO_TICKS(2000), pdFALSE, (void *)0, NetworkManager::onWifiTimer);

  SettingsManager::getWifiSSID(_wifiSSID, sizeof(_wifiSSID));
  SettingsManager::getWifiPassword(_wifiPass, sizeof(_wifiPass));

  // Determine if we can connect
  if (strlen(_wifiSSID) > 0) {
    log("Network", "Found Wi-Fi credentials.");
    _wifiCredentialsExist = true;
    WiFi.onEvent(NetworkManager::onWiFiEvent);
    connectToWiFi();
  }

  if (!SettingsManager::hasControllerCredentials()) {
    log("Network", "Controller credentials missing. Requesting Provisioning...");
    _triggerProvisioning = true;
    return;
  }

  // Blocking wait for initial connection
  if (_wifiCredentialsExist) {
    unsigned long wifiWaitStart = millis();
    WiFi.setSleep(false);

    while (WiFi.status() != WL_CONNECTED && (millis() - wifiWaitStart < 30000)) {
      Esp32GateHAL::getInstance().tick();
      esp_task_wdt_reset();
      delay(100);
    }

    if (WiFi.status() == WL_CONNECTED) {
      startMDNS();
      startTimeSync();
      return;
    }

    // Failure: Just flag it.
    log("Network", "Startup WiFi Failed. Requesting Provisioning...");
    _triggerProvisioning = true;
  } else {
    // No creds? Flag immediately.
    _triggerProvisioning = true;
  }
}

void NetworkManager::printStartupDiagnostics() {
  char logBuf[128];
  const char *boolStr[] = {"NO", "YES"};

  Esp32GateHAL &hal = Esp32GateHAL::getInstance();

  hal.log("==========================================================================");
  hal.log("                            NETWORK DIAGNOSTICS                           ");
  hal.log("==========================================================================");

  // -------------------------------------------------------------------------
  // SECTION: WI-FI STATE
  // -------------------------------------------------------------------------
  hal.log("[ WI-FI STATUS ]");

  wl_status_t status = WiFi.status();
  const char *statusStr;
  switch (status) {
  case WL_CONNECTED:      statusStr = "CONNECTED"; break;
  case WL_NO_SSID_AVAIL:  statusStr = "SSID NOT FOUND"; break;
  case WL_CONNECT_FAILED: statusStr = "FAILED"; break;
  case WL_IDLE_STATUS:    statusStr = "IDLE"; break;
  case WL_DISCONNECTED:   statusStr = "DISCONNECTED"; break;
  default:                statusStr = "UNKNOWN"; break;
  }

  snprintf(logBuf, sizeof(logBuf), " %-25s : %s", "Connection State", statusStr);
  hal.log(logBuf);

  snprintf(logBuf, sizeof(logBuf), " %-25s : %s", "Target SSID", strlen(_wifiSSID) > 0 ? _wifiSSID : "-- NOT SET --");
  hal.log(logBuf);

  if (status == WL_CONNECTED) {
    snprintf(logBuf, sizeof(logBuf), " %-25s : %ld dBm", "Signal Strength", (long)WiFi.RSSI());
    hal.log(logBuf);
  }

  snprintf(logBuf, sizeof(logBuf), " %-25s : %s", "Device MAC", WiFi.macAddress().c_str());
  hal.log(logBuf);

  // -------------------------------------------------------------------------
  // SECTION: IP CONFIGURATION
  // -------------------------------------------------------------------------
  if (status == WL_CONNECTED) {
    hal.log("");
    hal.log("[ IP CONFIGURATION ]");

    snprintf(logBuf, sizeof(logBuf), " %-25s : %s", "Local IP", WiFi.localIP().toString().c_str());
    hal.log(logBuf);

    snprintf(logBuf, sizeof(logBuf), " %-25s : %s", "Gateway", WiFi.gatewayIP().toString().c_str());
    hal.log(logBuf);

    snprintf(logBuf, sizeof(logBuf), " %-25s : %s.local", "mDNS Hostname", _hostname);
    hal.log(logBuf);
  }

  // -------------------------------------------------------------------------
  // SECTION: INTERNAL FLAGS
  // -------------------------------------------------------------------------
  hal.log("");
  hal.log("[ LOGIC FLAGS ]");

  snprintf(logBuf, sizeof(logBuf), " %-25s : %s", "Credentials Loaded", boolStr[_wifiCredentialsExist]);
  hal.log(logBuf);

  snprintf(logBuf, sizeof(logBuf), " %-25s : %s", "Controller Configured", boolStr[SettingsManager::hasControllerCredentials()]);
  hal.log(logBuf);

  snprintf(logBuf, sizeof(logBuf), " %-25s : %d / %d", "Retry Counter", _wifiRetries, WIFI_MAX_RETRIES);
  hal.log(logBuf);

  snprintf(logBuf, sizeof(logBuf), " %-25s : %s", "Provisioning Request", boolStr[_triggerProvisioning]);
  hal.log(logBuf);
}
