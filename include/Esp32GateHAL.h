/*
 * =================================================================================
 * Project:   BeaconGate - BLE Gate Automation Controller
 * File:      include/Esp32GateHAL.h
 * Description: Header for the ESP32 implementation of IGateHAL.
 * Encapsulates Logging, Time, Token Storage, Button, LED and Watchdog.
 * =================================================================================
 */
#pragma once

#include "GateContext.h"
#include "Types.h"
#include <Arduino.h>
#include <OneButton.h>
#include <jled.h>

class Esp32GateHAL : public IGateHAL {
private:
  Esp32GateHAL();

  // --- Synchronization
  SemaphoreHandle_t _stateMutex;

  // --- State Members ---
  volatile bool _clickPending;
  volatile bool _longPressPending;

  GateState _cachedState;
  bool _hasCachedState;

  // --- Log State (RAM + Serial) ---
  char _logBuffer[LOG_BUFFER_SIZE][MAX_LOG_LENGTH]; // For /log
  int _logBufferIndex;
  char _serialQueue[SERIAL_QUEUE_SIZE][MAX_LOG_LENGTH]; // For Serial
  int _queueHead;
  int _queueTail;

  // --- Peripherals ---
  OneButton _pcbButton;
  JLed _statusLed;

  // --- Health Tracking ---
  unsigned long _lastHealthCheck;

  // --- Helpers ---
  void updateLedPattern(GateState state);
  void checkSystemHealth();
  void processLogQueue();

  // --- Static Callback Handlers ---
  static void handlePcbClick();
  static void handlePcbLongStart();

public:
  static Esp32GateHAL &getInstance();

  void initialize();
  void tick();

  // --- Thread Safety (Mutex Wrapper) ---
  // Returns true if lock acquired, false if timeout/busy
  bool lockState(uint32_t timeoutMs = 100);
  void unlockState();

  // --- Logging API ---
  void log(const char *message) override;
  void logKeyValue(const char *key, const char *value);
  void printStartupDiagnostics();

  // -- Accessor for WebServer
  const char *getLogLine(int index) const {
    if (index >= 0 && index < LOG_BUFFER_SIZE)
      return _logBuffer[index];
    return "";
  }
  int getLogBufferIndex() const { return _logBufferIndex; }

  // --- Used by BLE provisioning
  JLed &getStatusLed() { return _statusLed; }

  // --- Physical Controls ---
  bool checkClickAction();
  bool checkLongPressAction();
  void showGateState(GateState state);

  // --- IGateHAL Implementation ---
  bool saveTokens(const std::vector<Token> &tokens) override;
  unsigned long getMillis() override;
  uint32_t getEpochSeconds() override;
};
