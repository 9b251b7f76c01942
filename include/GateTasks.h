/*
 * =================================================================================
 * Project:   BeaconGate - BLE Gate Automation Controller
 * File:      include/GateTasks.h
 * Description: FreeRTOS hosting of the control loops plus the command task.
 *
 * Tasks:
 *   scan      -> ControlLoops::runScanCycle
 *   status    -> ControlLoops::runStatusCycle
 *   autoclose -> ControlLoops::runAutoCloseCycle
 *   command   -> queued manual work (web / button): open, close, toggle, nearby scan
 *
 * Every task sleeps in TASK_SLEEP_SLICE_MS slices and re-checks the running
 * flag, so stopAndJoin() returns within about one slice plus any in-flight call.
 * =================================================================================
 */
#pragma once
#include <Arduino.h>
#include <freertos/event_groups.h>
#include <freertos/queue.h>
#include <vector>

#include "ActuatorGateway.h"
#include "ControlLoops.h"
#include "ScanService.h"
#include "SessionGate.h"

enum GateCommandType : uint8_t { CMD_OPEN, CMD_CLOSE, CMD_TOGGLE, CMD_NEARBY_SCAN };

struct GateCommand {
  GateCommandType type;
  char reason[48];
};

class GateTasks {
public:
  GateTasks(SessionGate &gate, ScanService &scanner, ControlLoops &loops, IActuatorGateway &gateway);

  // Creates the four tasks. Returns false if any task could not be created.
  bool start();

  // Clears the running flag, waits for every task to exit, then disconnects the gateway.
  void stopAndJoin();

  // --- Command Queue (non-blocking) ---
  // Returns false if the queue is full.
  bool enqueue(GateCommandType type, const char *reason);

  // --- Nearby Scan Result ---
  bool hasNearbyResult() const { return _hasNearbyResult; }
  bool isNearbyScanPending() const { return _nearbyPending; }
  // Copies the last result. Returns false if the lock is busy.
  bool getNearbyResult(std::vector<NearbyDevice> &out, uint32_t &ageSeconds);

private:
  SessionGate &_gate;
  ScanService &_scanner;
  ControlLoops &_loops;
  IActuatorGateway &_gateway;

  QueueHandle_t _commandQueue;
  EventGroupHandle_t _exitGroup;
  SemaphoreHandle_t _resultMutex;

  std::vector<NearbyDevice> _nearby;
  unsigned long _nearbyMillis;
  volatile bool _hasNearbyResult;
  volatile bool _nearbyPending;

  // --- Task Bodies ---
  static void scanTask(void *arg);
  static void statusTask(void *arg);
  static void autoCloseTask(void *arg);
  static void commandTask(void *arg);

  void sleepSliced(uint32_t seconds);
  void execute(const GateCommand &cmd);
  void runNearbyScan();

  void log(const char *value);
};
