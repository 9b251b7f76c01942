/*
 * =================================================================================
 * Project:   BeaconGate - BLE Gate Automation Controller
 * File:      src/GateTasks.cpp
 *
 * SPDX-License-Identifier: Apache-2.0
 * =================================================================================
 */
#include "GateTasks.h"

#include "Config.h"
#include "Esp32GateHAL.h"

// Exit bits (one per task)
#define EXIT_SCAN (1 << 0)
#define EXIT_STATUS (1 << 1)
#define EXIT_AUTOCLOSE (1 << 2)
#define EXIT_COMMAND (1 << 3)
#define EXIT_ALL (EXIT_SCAN | EXIT_STATUS | EXIT_AUTOCLOSE | EXIT_COMMAND)

GateTasks::GateTasks(SessionGate &gate, ScanService &scanner, ControlLoops &loops, IActuatorGateway &gateway)
    : _gate(gate), _scanner(scanner), _loops(loops), _gateway(gateway), _commandQueue(NULL), _exitGroup(NULL), _resultMutex(NULL),
      _nearbyMillis(0), _hasNearbyResult(false), _nearbyPending(false) {}

void GateTasks::log(const char *value) { Esp32GateHAL::getInstance().logKeyValue("Tasks", value); }

// =================================================================================
// SECTION: LIFECYCLE
// =================================================================================

bool GateTasks::start() {
  _commandQueue = xQueueCreate(COMMAND_QUEUE_LENGTH, sizeof(GateCommand));
  _exitGroup = xEventGroupCreate();
  _resultMutex = xSemaphoreCreateMutex();
  if (_commandQueue == NULL || _exitGroup == NULL || _resultMutex == NULL) {
    log("CRITICAL: Could not allocate task primitives.");
    return false;
  }

  _loops.start();

  bool ok = true;
  ok &= xTaskCreate(scanTask, "gate-scan", SCAN_TASK_STACK, this, TASK_PRIORITY, NULL) == pdPASS;
  ok &= xTaskCreate(statusTask, "gate-status", STATUS_TASK_STACK, this, TASK_PRIORITY, NULL) == pdPASS;
  ok &= xTaskCreate(autoCloseTask, "gate-autoclose", AUTOCLOSE_TASK_STACK, this, TASK_PRIORITY, NULL) == pdPASS;
  ok &= xTaskCreate(commandTask, "gate-command", COMMAND_TASK_STACK, this, TASK_PRIORITY, NULL) == pdPASS;

  if (!ok) {
    log("CRITICAL: Task creation failed.");
    stopAndJoin();
    return false;
  }

  log("Scan, status, auto-close and command tasks started.");
  return true;
}

void GateTasks::stopAndJoin() {
  _loops.stop();

  if (_exitGroup != NULL) {
    EventBits_t bits = xEventGroupWaitBits(_exitGroup, EXIT_ALL, pdFALSE, pdTRUE, pdMS_TO_TICKS(TASK_JOIN_TIMEOUT_MS));
    if ((bits & EXIT_ALL) != EXIT_ALL) {
      char logBuf[64];
      snprintf(logBuf, sizeof(logBuf), "Join timeout (exit mask 0x%02X).", (unsigned)(bits & EXIT_ALL));
      log(logBuf);
    } else {
      log("All tasks stopped.");
    }
  }

  _gateway.disconnect();
}

void GateTasks::sleepSliced(uint32_t seconds) {
  uint32_t remainingMs = seconds * 1000;
  while (remainingMs > 0 && _loops.isRunning()) {
    uint32_t slice = remainingMs < TASK_SLEEP_SLICE_MS ? remainingMs : TASK_SLEEP_SLICE_MS;
    vTaskDelay(pdMS_TO_TICKS(slice));
    remainingMs -= slice;
  }
}

// =================================================================================
// SECTION: LOOP TASKS
// =================================================================================

void GateTasks::scanTask(void *arg) {
  GateTasks *self = static_cast<GateTasks *>(arg);
  while (self->_loops.isRunning()) {
    self->sleepSliced(self->_loops.runScanCycle());
  }
  xEventGroupSetBits(self->_exitGroup, EXIT_SCAN);
  vTaskDelete(NULL);
}

void GateTasks::statusTask(void *arg) {
  GateTasks *self = static_cast<GateTasks *>(arg);
  while (self->_loops.isRunning()) {
    self->sleepSliced(self->_loops.runStatusCycle());
  }
  xEventGroupSetBits(self->_exitGroup, EXIT_STATUS);
  vTaskDelete(NULL);
}

void GateTasks::autoCloseTask(void *arg) {
  GateTasks *self = static_cast<GateTasks *>(arg);
  while (self->_loops.isRunning()) {
    self->sleepSliced(self->_loops.runAutoCloseCycle());
  }
  xEventGroupSetBits(self->_exitGroup, EXIT_AUTOCLOSE);
  vTaskDelete(NULL);
}

// =================================================================================
// SECTION: COMMAND TASK
// =================================================================================

bool GateTasks::enqueue(GateCommandType type, const char *reason) {
  if (_commandQueue == NULL || !_loops.isRunning())
    return false;

  GateCommand cmd;
  cmd.type = type;
  strncpy(cmd.reason, reason ? reason : "", sizeof(cmd.reason));
  cmd.reason[sizeof(cmd.reason) - 1] = '\0';

  if (type == CMD_NEARBY_SCAN)
    _nearbyPending = true;

  if (xQueueSend(_commandQueue, &cmd, 0) != pdTRUE) {
    if (type == CMD_NEARBY_SCAN)
      _nearbyPending = false;
    log("Command queue full. Dropped.");
    return false;
  }
  return true;
}

void GateTasks::commandTask(void *arg) {
  GateTasks *self = static_cast<GateTasks *>(arg);
  GateCommand cmd;

  while (self->_loops.isRunning()) {
    if (xQueueReceive(self->_commandQueue, &cmd, pdMS_TO_TICKS(TASK_SLEEP_SLICE_MS)) == pdTRUE) {
      self->execute(cmd);
    }
  }
  xEventGroupSetBits(self->_exitGroup, EXIT_COMMAND);
  vTaskDelete(NULL);
}

void GateTasks::execute(const GateCommand &cmd) {
  switch (cmd.type) {
  case CMD_OPEN:
    _gate.requestOpen(cmd.reason);
    break;
  case CMD_CLOSE:
    _gate.requestClose(cmd.reason);
    break;
  case CMD_TOGGLE:
    if (_gate.getState() == GATE_OPEN)
      _gate.requestClose(cmd.reason);
    else
      _gate.requestOpen(cmd.reason);
    break;
  case CMD_NEARBY_SCAN:
    runNearbyScan();
    break;
  default:
    break;
  }
}

void GateTasks::runNearbyScan() {
  std::vector<NearbyDevice> found;
  bool ok = _scanner.listNearby(_gate.getConfig().nearbyScanDuration, found);

  if (ok && xSemaphoreTake(_resultMutex, portMAX_DELAY) == pdTRUE) {
    size_t count = found.size();
    _nearby.swap(found);
    _nearbyMillis = millis();
    _hasNearbyResult = true;
    xSemaphoreGive(_resultMutex);

    char logBuf[64];
    snprintf(logBuf, sizeof(logBuf), "Nearby scan complete: %u device(s).", (unsigned)count);
    _gate.postInfo(logBuf);
  } else if (!ok) {
    log("Nearby scan failed.");
  }
  _nearbyPending = false;
}

bool GateTasks::getNearbyResult(std::vector<NearbyDevice> &out, uint32_t &ageSeconds) {
  if (_resultMutex == NULL || xSemaphoreTake(_resultMutex, pdMS_TO_TICKS(100)) != pdTRUE)
    return false;
  out = _nearby;
  ageSeconds = (millis() - _nearbyMillis) / 1000;
  xSemaphoreGive(_resultMutex);
  return true;
}
