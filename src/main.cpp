/*
 * =================================================================================
 * Project:   BeaconGate - BLE Gate Automation Controller
 * File:      main.cpp
 * Description: Application entry point.
 * Wires the HAL, settings, controller gateway, BLE radio and the gate engine,
 * then hands control to the FreeRTOS loop tasks and the web server.
 * =================================================================================
 */

#include <Arduino.h>
#include <BLEDevice.h>
#include <Ticker.h>
#include <WiFi.h>
#include <esp_task_wdt.h>

// --- Module Includes ---
#include "Config.h"
#include "Control4Gateway.h"
#include "Esp32BleRadio.h"
#include "Esp32GateHAL.h"
#include "GateTasks.h"
#include "Network.h"
#include "SettingsManager.h"
#include "WebManager.h"

// --- Gate Engine Includes ---
#include "ActivityLog.h"
#include "ControlLoops.h"
#include "ScanService.h"
#include "SessionGate.h"
#include "TokenRegistry.h"

// --- LED sync ticker ---
Ticker oneSecondLedTicker;
volatile bool ledSyncPending = false;

// --- Dependencies ---
Esp32GateHAL &hal = Esp32GateHAL::getInstance();
NetworkManager &network = NetworkManager::getInstance();
WebManager &web = WebManager::getInstance();
Esp32BleRadio radio;

// --- Gate Engine
TokenRegistry *registry = nullptr;
ActivityLog *activity = nullptr;
Control4Gateway *gateway = nullptr;
SessionGate *gate = nullptr;
ScanService *scanner = nullptr;
ControlLoops *loops = nullptr;
GateTasks *tasks = nullptr;

// Set when startup aborted. loop() then only services logs and the watchdog.
bool fatalStartup = false;

/**
 * Prints high-level firmware identity and build information.
 */
void printFirmwareDiagnostics() {
    char logBuf[128];

    hal.log("==========================================================================");
    hal.log("                       FIRMWARE IDENTITY                                  ");
    hal.log("==========================================================================");

    // -------------------------------------------------------------------------
    // SECTION: IDENTITY
    // -------------------------------------------------------------------------
    hal.log("[ VERSION INFO ]");

    snprintf(logBuf, sizeof(logBuf), " %-25s : %s", "Device Name", DEVICE_NAME);
    hal.log(logBuf);

    snprintf(logBuf, sizeof(logBuf), " %-25s : %s", "Firmware Version", DEVICE_VERSION);
    hal.log(logBuf);

    // -------------------------------------------------------------------------
    // SECTION: BUILD METADATA
    // -------------------------------------------------------------------------
    hal.log("");
    hal.log("[ BUILD DETAILS ]");

    snprintf(logBuf, sizeof(logBuf), " %-25s : %s", "Build Date", __DATE__);
    hal.log(logBuf);

    snprintf(logBuf, sizeof(logBuf), " %-25s : %s", "Build Time", __TIME__);
    hal.log(logBuf);

    snprintf(logBuf, sizeof(logBuf), " %-25s : %ld", "C++ Standard", __cplusplus);
    hal.log(logBuf);

    hal.log("==========================================================================");
}

static void failStartup(const char *reason) {
    char logBuf[MAX_LOG_LENGTH];
    snprintf(logBuf, sizeof(logBuf), "CRITICAL: %s Startup halted.", reason);
    hal.logKeyValue("System", logBuf);
    fatalStartup = true;
}

// =================================================================
// --- Core Application Setup & Loop ---
// =================================================================

void setup() {
  Serial.begin(SERIAL_BAUD_RATE);
  delay(3000);

  // 1. Initialize Hardware
  hal.initialize();
  printFirmwareDiagnostics();

  hal.tick();

  // 2. Load Configuration
  GateConfig gateConfig;
  SettingsManager::loadGateConfig(gateConfig);

  std::string configError;
  if (!SessionGate::validateConfig(gateConfig, configError)) {
    hal.logKeyValue("System", configError.c_str());
    hal.logKeyValue("System", "Stored tunables invalid. Using defaults.");
    gateConfig = GateConfig();
  }

  ActuatorConfig actuatorConfig;
  SettingsManager::loadActuatorConfig(actuatorConfig);

  ActivityConfig activityConfig;
  activityConfig.mode = SettingsManager::getActivityMode();
  activityConfig.maxEntries = DEVICE_ACTIVITY_MAX_ENTRIES;

  // 3. Network (Provisioning does not return)
  network.connectOrRequestProvisioning();
  if (network.isProvisioningNeeded()) {
    network.startBLEProvisioningBlocking();
  }

  // 4. Token Registry
  registry = new TokenRegistry(hal);
  std::vector<Token> storedTokens;
  if (!SettingsManager::loadTokens(storedTokens)) {
    failStartup("Token list unreadable.");
    return;
  }
  registry->loadTokens(storedTokens);

  // 5. Controller
  gateway = new Control4Gateway(actuatorConfig);
  if (!gateway->connect()) {
    failStartup("Controller connection failed.");
    return;
  }

  // 6. Gate Engine
  activity = new ActivityLog(hal, activityConfig);
  gate = new SessionGate(hal, *gateway, *registry, gateConfig);
  gate->subscribe(activity);

  GateStatus initialStatus;
  if (gate->queryStatus(initialStatus) != 200) {
    hal.logKeyValue("System", "Controller status unavailable at startup.");
  }

  // 7. BLE Scanner
  BLEDevice::init(DEVICE_NAME);
  radio.begin();
  scanner = new ScanService(hal, radio, *registry);
  loops = new ControlLoops(hal, *gate, *scanner);
  tasks = new GateTasks(*gate, *scanner, *loops, *gateway);

  // 8. Diagnostics
  hal.printStartupDiagnostics();
  hal.tick();

  gateway->printStartupDiagnostics();
  hal.tick();

  gate->printStartupDiagnostics();
  hal.tick();

  network.printStartupDiagnostics();
  hal.tick();

  hal.log("==========================================================================");

  // 9. Start Loops
  if (!tasks->start()) {
    failStartup("Loop tasks could not start.");
    return;
  }
  gate->postInfo("Gate controller started");

  // 10. LED follows GateState once per second
  oneSecondLedTicker.attach(1, []() { ledSyncPending = true; });

  // 11. Start Web API
  web.begin(gate, activity, tasks);
}

void loop() {
  // 1. System Housekeeping
  esp_task_wdt_reset();

  // 2. Hardware Tick (Inputs, LEDs, Health, Logging)
  hal.tick();

  if (fatalStartup) {
    delay(10);
    return;
  }

  // 3. Physical Controls
  if (hal.checkClickAction()) {
    tasks->enqueue(CMD_TOGGLE, "Button");
  }
  if (hal.checkLongPressAction()) {
    tasks->enqueue(CMD_NEARBY_SCAN, "Button");
  }

  // 4. LED
  if (ledSyncPending) {
    ledSyncPending = false;
    hal.showGateState(gate->getState());
  }

  // 5. Lost network: stop cleanly and hand over to provisioning
  if (network.isProvisioningNeeded()) {
    hal.logKeyValue("System", "Network lost. Stopping loops for provisioning.");
    tasks->stopAndJoin();
    network.startBLEProvisioningBlocking();
  }
}
