/*
 * =================================================================================
 * Project:   BeaconGate - BLE Gate Automation Controller
 * File:      src/Esp32GateHAL.cpp
 *
 * SPDX-License-Identifier: Apache-2.0
 *
 * Description:
 * Low-level hardware abstraction layer. Owns the log ring buffer and serial
 * queue, the PCB button, the status LED pattern, the task watchdog and
 * system health monitoring.
 * =================================================================================
 */
#include "Esp32GateHAL.h"
#include <esp_task_wdt.h>
#include <time.h>

#include "Config.h"
#include "SettingsManager.h"
#include "TimeUtils.h"

// Anything before this is an unsynchronized RTC (2020-09-13)
static const time_t MIN_VALID_EPOCH = 1600000000;

// =================================================================================
// SECTION: CLASS IMPLEMENTATION
// =================================================================================

Esp32GateHAL::Esp32GateHAL()
    : _stateMutex(NULL), _clickPending(false), _longPressPending(false), _cachedState(GATE_UNKNOWN), _hasCachedState(false),
      _logBufferIndex(0), _queueHead(0), _queueTail(0), _statusLed(JLed(STATUS_LED_PIN)), _lastHealthCheck(0) {
  // OneButton Setup (Pin, ActiveLow, Pullup)
  _pcbButton = OneButton(PCB_BUTTON_PIN, true, true);

  // Clear log buffer
  for (int i = 0; i < LOG_BUFFER_SIZE; i++)
    _logBuffer[i][0] = '\0';
}

Esp32GateHAL &Esp32GateHAL::getInstance() {
  static Esp32GateHAL instance;
  return instance;
}

// --- Initialization ---

void Esp32GateHAL::initialize() {

  // 1. Acquire the Mutex
  _stateMutex = xSemaphoreCreateRecursiveMutex();
  if (_stateMutex == NULL) {
    Serial.println("Critical Error: Could not create Mutex.");
    ESP.restart();
  }

  // 2. Logging Init
  logKeyValue("System", "Initializing Hardware...");

  // 3. Button Attachments
  _pcbButton.attachClick(handlePcbClick);
  _pcbButton.setPressMs(LONG_PRESS_MS);
  _pcbButton.attachLongPressStart(handlePcbLongStart);

  // 4. Watchdog
  logKeyValue("System", "Initializing Hardware Watchdog...");
  esp_task_wdt_init(DEFAULT_WDT_TIMEOUT, true);
  esp_task_wdt_add(NULL);

  // 5. Force Initial LED State
  // Slow blink until the first status report arrives
  _statusLed.Blink(1000, 1000).Forever();
}

// --- Main Tick ---

void Esp32GateHAL::tick() {

  if (!lockState()) {
    return;
  }

  // 1. Process Serial Logs (Internal Queue)
  processLogQueue();

  // 2. Tick Peripherals
  _pcbButton.tick();
  _statusLed.Update();

  // 3. Periodic Health Checks (Every 60s)
  if (millis() - _lastHealthCheck > 60000) {
    checkSystemHealth();
    _lastHealthCheck = millis();
  }

  unlockState();
}

// =================================================================================
// SECTION: SYNCHRONIZATION
// =================================================================================

bool Esp32GateHAL::lockState(uint32_t timeoutMs) {
  if (_stateMutex == NULL)
    return false;
  return (xSemaphoreTakeRecursive(_stateMutex, (TickType_t)pdMS_TO_TICKS(timeoutMs)) == pdTRUE);
}

void Esp32GateHAL::unlockState() {
  if (_stateMutex != NULL) {
    xSemaphoreGiveRecursive(_stateMutex);
  }
}

// =================================================================================
// SECTION: LOGGING SYSTEM
// =================================================================================

void Esp32GateHAL::log(const char *message) {
  // Before initialize() only the setup task is running
  bool guarded = (_stateMutex != NULL);
  if (guarded && !lockState(200)) {
    return; // Busy: drop rather than stall a control loop
  }

  // 1. Write to RAM (/log Buffer)
  strncpy(_logBuffer[_logBufferIndex], message, MAX_LOG_LENGTH);
  _logBuffer[_logBufferIndex][MAX_LOG_LENGTH - 1] = '\0';

  _logBufferIndex++;
  if (_logBufferIndex >= LOG_BUFFER_SIZE) {
    _logBufferIndex = 0;
  }

  // 2. Write to Serial Queue
  int nextHead = (_queueHead + 1) % SERIAL_QUEUE_SIZE;
  if (nextHead != _queueTail) {
    strncpy(_serialQueue[_queueHead], message, MAX_LOG_LENGTH);
    _serialQueue[_queueHead][MAX_LOG_LENGTH - 1] = '\0';
    _queueHead = nextHead;
  }
  // Else: Queue full, drop message to prevent blocking

  if (guarded)
    unlockState();
}

void Esp32GateHAL::logKeyValue(const char *key, const char *value) {
  char tempBuf[MAX_LOG_LENGTH];
  snprintf(tempBuf, MAX_LOG_LENGTH, " %-8s : %s", key, value);
  log(tempBuf);
}

void Esp32GateHAL::processLogQueue() {
  // Process a batch of logs to keep Serial active without blocking too long
  int maxLines = 10;
  while (_queueHead != _queueTail && maxLines > 0) {
    Serial.println(_serialQueue[_queueTail]);
    _queueTail = (_queueTail + 1) % SERIAL_QUEUE_SIZE;
    maxLines--;
  }
}

void Esp32GateHAL::printStartupDiagnostics() {
  char logBuf[128];

  log("==========================================================================");
  log("                            DEVICE DIAGNOSTICS                           ");
  log("==========================================================================");

  // -------------------------------------------------------------------------
  // SECTION: SYSTEM HEALTH
  // -------------------------------------------------------------------------
  log("[ SYSTEM HEALTH ]");

  uint32_t freeHeap = ESP.getFreeHeap();
  snprintf(logBuf, sizeof(logBuf), " %-25s : %u bytes", "Free Heap", freeHeap);
  log(logBuf);

  snprintf(logBuf, sizeof(logBuf), " %-25s : %u bytes", "Min Free Heap", ESP.getMinFreeHeap());
  log(logBuf);

  float temp = temperatureRead();
  snprintf(logBuf, sizeof(logBuf), " %-25s : %.1f C", "CPU Temp", temp);
  log(logBuf);

  char timeBuf[32];
  TimeUtils::formatEpoch(getEpochSeconds(), timeBuf, sizeof(timeBuf));
  snprintf(logBuf, sizeof(logBuf), " %-25s : %s", "Wall Clock", timeBuf);
  log(logBuf);

  // -------------------------------------------------------------------------
  // SECTION: GPIO CONFIGURATION
  // -------------------------------------------------------------------------
  log(""); // Spacer
  log("[ GPIO & PERIPHERALS ]");

  snprintf(logBuf, sizeof(logBuf), " %-25s : GPIO %d", "PCB Button", PCB_BUTTON_PIN);
  log(logBuf);

  snprintf(logBuf, sizeof(logBuf), " %-25s : GPIO %d", "Status LED", STATUS_LED_PIN);
  log(logBuf);

  snprintf(logBuf, sizeof(logBuf), " %-25s : %d ms", "Long Press", LONG_PRESS_MS);
  log(logBuf);
}

// =================================================================================
// SECTION: IGateHAL IMPLEMENTATION
// =================================================================================

bool Esp32GateHAL::saveTokens(const std::vector<Token> &tokens) { return SettingsManager::saveTokens(tokens); }

unsigned long Esp32GateHAL::getMillis() { return millis(); }

uint32_t Esp32GateHAL::getEpochSeconds() {
  time_t now = time(NULL);
  if (now < MIN_VALID_EPOCH)
    return 0;
  return (uint32_t)now;
}

// --- Input Events ---

bool Esp32GateHAL::checkClickAction() {
  if (_clickPending) {
    _clickPending = false;
    return true;
  }
  return false;
}

bool Esp32GateHAL::checkLongPressAction() {
  if (_longPressPending) {
    _longPressPending = false;
    return true;
  }
  return false;
}

void Esp32GateHAL::showGateState(GateState state) {
  if (!lockState())
    return;
  updateLedPattern(state);
  unlockState();
}

// =================================================================================
// SECTION: INTERNAL LOGIC & HELPERS
// =================================================================================

void Esp32GateHAL::updateLedPattern(GateState state) {
  if (_hasCachedState && state == _cachedState)
    return;
  _cachedState = state;
  _hasCachedState = true;

  char logBuf[50];
  snprintf(logBuf, sizeof(logBuf), "LED Pattern: State %s", gateStateToString(state));
  logKeyValue("System", logBuf);

  switch (state) {
  case GATE_CLOSED:
    _statusLed.Breathe(4000).Forever();
    break;
  case GATE_OPENING:
  case GATE_CLOSING:
    _statusLed.Blink(150, 150).Forever();
    break;
  case GATE_OPEN:
    _statusLed.On().Forever();
    break;
  case GATE_UNKNOWN:
    _statusLed.Blink(1000, 1000).Forever();
    break;
  default:
    _statusLed.Off().Forever();
    break;
  }
}

void Esp32GateHAL::checkSystemHealth() {
  size_t freeMem = ESP.getFreeHeap();
  if (freeMem < MIN_FREE_HEAP) {
    logKeyValue("System", "CRITICAL: Low Heap! Restarting.");
    processLogQueue();
    ESP.restart();
  }
}

// =================================================================================
// SECTION: STATIC HANDLERS (OneButton Callbacks)
// =================================================================================

void Esp32GateHAL::handlePcbClick() { getInstance()._clickPending = true; }

void Esp32GateHAL::handlePcbLongStart() { getInstance()._longPressPending = true; }
