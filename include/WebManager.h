/*
 * =================================================================================
 * File:      include/WebManager.h
 * Description:
 * Async HTTP Server Controller.
 * - Singleton Architecture.
 * - REST endpoints for tokens, configuration, gate commands, activity.
 * - Server-Sent Events stream of gate events (/events).
 * - Slow work (actuator calls, nearby scans) is handed to GateTasks.
 * =================================================================================
 */
#pragma once
#include "ActivityLog.h"
#include "GateTasks.h"
#include "SessionGate.h"
#include <ArduinoJson.h>
#include <ESPAsyncWebServer.h>

class WebManager : public IGateEventListener {
public:
  static WebManager &getInstance();

  // Initialization (Call in setup)
  void begin(SessionGate *gate, ActivityLog *activity, GateTasks *tasks);

  // --- IGateEventListener (SSE push) ---
  void onGateEvent(const GateEvent &event) override;

private:
  WebManager();

  // --- Dependencies ---
  AsyncWebServer _server;
  AsyncEventSource _events;
  SessionGate *_gate;
  ActivityLog *_activity;
  GateTasks *_tasks;

  // --- Helper Functions ---
  void sendJsonError(AsyncWebServerRequest *request, int code, const std::string &message);
  void sendJsonOk(AsyncWebServerRequest *request, int code, const char *message);
  bool parseBody(AsyncWebServerRequest *request, uint8_t *data, size_t len, size_t index, size_t total, JsonDocument &doc);
  void registerEndpoints();
  void log(const char *key, const char *value);

  // --- Route Handlers ---

  // System & Health
  void handleRoot(AsyncWebServerRequest *request);
  void handleHealth(AsyncWebServerRequest *request);
  void handleLog(AsyncWebServerRequest *request);
  void handleStatus(AsyncWebServerRequest *request);

  // Tokens
  void handleListTokens(AsyncWebServerRequest *request);
  void handleRegisterToken(AsyncWebServerRequest *request, uint8_t *data, size_t len, size_t index, size_t total);
  void handleUpdateToken(AsyncWebServerRequest *request, uint8_t *data, size_t len, size_t index, size_t total);
  void handleDeleteToken(AsyncWebServerRequest *request);

  // Configuration
  void handleGetConfig(AsyncWebServerRequest *request);
  void handleSetConfig(AsyncWebServerRequest *request, uint8_t *data, size_t len, size_t index, size_t total);
  void handleUpdateWifi(AsyncWebServerRequest *request, uint8_t *data, size_t len, size_t index, size_t total);

  // Gate & Scan
  void handleGateCommand(AsyncWebServerRequest *request, GateCommandType type);
  void handleStartScan(AsyncWebServerRequest *request);
  void handleGetScan(AsyncWebServerRequest *request);

  // Activity
  void handleGetActivity(AsyncWebServerRequest *request);
  void handleClearActivity(AsyncWebServerRequest *request);
  void handleGetActivityMode(AsyncWebServerRequest *request);
  void handleSetActivityMode(AsyncWebServerRequest *request, uint8_t *data, size_t len, size_t index, size_t total);
};
