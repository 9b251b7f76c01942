/*
 * =================================================================================
 * Project:   BeaconGate - BLE Gate Automation Controller
 * File:      src/WebManager.cpp
 *
 * Description:
 * Async HTTP Server implementation. Handlers never perform actuator I/O or
 * radio scans themselves; those are queued to the command task (202).
 * =================================================================================
 */
#include <ArduinoJson.h>
#include <WiFi.h>
#include <esp_timer.h> // For uptime
#include <string.h>

#include "Config.h"
#include "ConfigCodec.h"
#include "Esp32GateHAL.h"
#include "Network.h"
#include "SettingsManager.h"
#include "WebManager.h"
#include "WebValidators.h"

// =================================================================================
// SECTION: SINGLETON & INIT
// =================================================================================

WebManager &WebManager::getInstance() {
  static WebManager instance;
  return instance;
}

WebManager::WebManager() : _server(WEB_SERVER_PORT), _events("/events"), _gate(nullptr), _activity(nullptr), _tasks(nullptr) {}

void WebManager::begin(SessionGate *gate, ActivityLog *activity, GateTasks *tasks) {
  _gate = gate;
  _activity = activity;
  _tasks = tasks;
  registerEndpoints();
  _server.addHandler(&_events);
  _gate->subscribe(this);
  _server.begin();
  log("WebAPI", "HTTP server started.");
}

void WebManager::log(const char *key, const char *value) { Esp32GateHAL::getInstance().logKeyValue(key, value); }

// =================================================================================
// SECTION: HELPER FUNCTIONS
// =================================================================================

void WebManager::sendJsonError(AsyncWebServerRequest *request, int code, const std::string &message) {
  JsonDocument doc;
  doc["status"] = "error";
  doc["message"] = message;
  String response;
  serializeJson(doc, response);
  request->send(code, "application/json", response);
}

void WebManager::sendJsonOk(AsyncWebServerRequest *request, int code, const char *message) {
  JsonDocument doc;
  doc["status"] = "ok";
  doc["message"] = message;
  String response;
  serializeJson(doc, response);
  request->send(code, "application/json", response);
}

// Single-chunk bodies only. Returns false (and answers) on a parse error.
bool WebManager::parseBody(AsyncWebServerRequest *request, uint8_t *data, size_t len, size_t index, size_t total,
                           JsonDocument &doc) {
  if (index + len != total) return false;

  DeserializationError error = deserializeJson(doc, (const char *)data, len);
  if (error) {
    sendJsonError(request, 400, "Invalid JSON.");
    return false;
  }
  return true;
}

// =================================================================================
// SECTION: ROUTE REGISTRATION
// =================================================================================

void WebManager::registerEndpoints() {
  // 1. System & Health
  _server.on("/", HTTP_GET, [this](AsyncWebServerRequest *r) { handleRoot(r); });
  _server.on("/health", HTTP_GET, [this](AsyncWebServerRequest *r) { handleHealth(r); });
  _server.on("/log", HTTP_GET, [this](AsyncWebServerRequest *r) { handleLog(r); });
  _server.on("/api/status", HTTP_GET, [this](AsyncWebServerRequest *r) { handleStatus(r); });

  // 2. Tokens
  _server.on("/api/tokens", HTTP_GET, [this](AsyncWebServerRequest *r) { handleListTokens(r); });
  _server.on("/api/tokens", HTTP_DELETE, [this](AsyncWebServerRequest *r) { handleDeleteToken(r); });
  _server.on(
      "/api/tokens", HTTP_POST, [](AsyncWebServerRequest *r) {}, NULL,
      [this](AsyncWebServerRequest *r, uint8_t *data, size_t len, size_t index, size_t total) {
        handleRegisterToken(r, data, len, index, total);
      });
  _server.on(
      "/api/tokens", HTTP_PUT, [](AsyncWebServerRequest *r) {}, NULL,
      [this](AsyncWebServerRequest *r, uint8_t *data, size_t len, size_t index, size_t total) {
        handleUpdateToken(r, data, len, index, total);
      });

  // 3. Configuration
  _server.on("/api/config", HTTP_GET, [this](AsyncWebServerRequest *r) { handleGetConfig(r); });
  _server.on(
      "/api/config", HTTP_POST, [](AsyncWebServerRequest *r) {}, NULL,
      [this](AsyncWebServerRequest *r, uint8_t *data, size_t len, size_t index, size_t total) {
        handleSetConfig(r, data, len, index, total);
      });
  _server.on(
      "/update-wifi", HTTP_POST, [](AsyncWebServerRequest *r) {}, NULL,
      [this](AsyncWebServerRequest *r, uint8_t *data, size_t len, size_t index, size_t total) {
        handleUpdateWifi(r, data, len, index, total);
      });

  // 4. Gate Commands & Scan
  _server.on("/api/gate/open", HTTP_POST, [this](AsyncWebServerRequest *r) { handleGateCommand(r, CMD_OPEN); });
  _server.on("/api/gate/close", HTTP_POST, [this](AsyncWebServerRequest *r) { handleGateCommand(r, CMD_CLOSE); });
  _server.on("/api/scan", HTTP_POST, [this](AsyncWebServerRequest *r) { handleStartScan(r); });
  _server.on("/api/scan", HTTP_GET, [this](AsyncWebServerRequest *r) { handleGetScan(r); });

  // 5. Activity (the /mode routes must be registered before the /api/activity prefix)
  _server.on("/api/activity/mode", HTTP_GET, [this](AsyncWebServerRequest *r) { handleGetActivityMode(r); });
  _server.on(
      "/api/activity/mode", HTTP_POST, [](AsyncWebServerRequest *r) {}, NULL,
      [this](AsyncWebServerRequest *r, uint8_t *data, size_t len, size_t index, size_t total) {
        handleSetActivityMode(r, data, len, index, total);
      });
  _server.on("/api/activity", HTTP_GET, [this](AsyncWebServerRequest *r) { handleGetActivity(r); });
  _server.on("/api/activity", HTTP_DELETE, [this](AsyncWebServerRequest *r) { handleClearActivity(r); });
}

// =================================================================================
// SECTION: SYSTEM HANDLERS
// =================================================================================

void WebManager::handleRoot(AsyncWebServerRequest *request) {
  String html = "<html><head><title>" + String(DEVICE_NAME) + "</title></head><body>";
  html += "<h1>" + String(DEVICE_NAME) + " API</h1>";
  html += "<h2>" + String(DEVICE_VERSION) + "</h2>";
  request->send(200, "text/html", html);
}

void WebManager::handleHealth(AsyncWebServerRequest *request) {
  JsonDocument doc;
  doc["status"] = "ok";
  doc["message"] = "Device is reachable.";
  String response;
  serializeJson(doc, response);
  request->send(200, "application/json", response);
}

void WebManager::handleLog(AsyncWebServerRequest *request) {
  AsyncResponseStream *response = request->beginResponseStream("text/plain");
  Esp32GateHAL &hal = Esp32GateHAL::getInstance();

  // Oldest line first: the ring's write index points at the oldest slot
  int start = hal.getLogBufferIndex();
  for (int n = 0; n < LOG_BUFFER_SIZE; n++) {
    int i = (start + n) % LOG_BUFFER_SIZE;
    if (hal.lockState()) {
      char lineBuf[MAX_LOG_LENGTH];
      strncpy(lineBuf, hal.getLogLine(i), sizeof(lineBuf));
      lineBuf[sizeof(lineBuf) - 1] = '\0';
      hal.unlockState();

      if (strlen(lineBuf) > 0) {
        response->print(lineBuf);
        response->print("\n");
      }
    } else {
      response->print("[Busy]\n");
    }
  }
  request->send(response);
}

void WebManager::handleStatus(AsyncWebServerRequest *request) {
  GateStatus status;
  _gate->getCachedStatus(status);

  AsyncResponseStream *response = request->beginResponseStream("application/json");
  JsonDocument doc;

  // 1. Gate
  ConfigCodec::writeGateStatus(status, doc["gate"].to<JsonObject>());

  // 2. Counters
  JsonObject counts = doc["counts"].to<JsonObject>();
  counts["tokens"] = _gate->getTokens().size();
  counts["activity"] = _activity->size();

  // 3. Telemetry
  JsonObject tel = doc["telemetry"].to<JsonObject>();
  tel["rssi"] = WiFi.RSSI();
  tel["freeHeap"] = ESP.getFreeHeap();
  tel["uptime"] = esp_timer_get_time() / 1000; // micro to milli
  tel["hostname"] = NetworkManager::getInstance().getHostname();

  serializeJson(doc, *response);
  request->send(response);
}

// =================================================================================
// SECTION: TOKENS
// =================================================================================

void WebManager::handleListTokens(AsyncWebServerRequest *request) {
  bool live = request->hasParam("live") && request->getParam("live")->value() == "1";
  std::vector<Token> tokens = _gate->getTokens();

  AsyncResponseStream *response = request->beginResponseStream("application/json");
  JsonDocument doc;
  JsonArray arr = doc["tokens"].to<JsonArray>();
  for (size_t i = 0; i < tokens.size(); i++) {
    JsonObject o = arr.add<JsonObject>();
    ConfigCodec::writeToken(tokens[i], o);
    if (live) o["inRange"] = _gate->isTokenInRange(tokens[i].id);
  }
  serializeJson(doc, *response);
  request->send(response);
}

void WebManager::handleRegisterToken(AsyncWebServerRequest *request, uint8_t *data, size_t len, size_t index, size_t total) {
  JsonDocument doc;
  if (!parseBody(request, data, len, index, total, doc)) return;

  Token token;
  std::string err;
  if (!WebValidators::parseTokenRequest(doc.as<JsonVariant>(), token, err)) {
    sendJsonError(request, 400, err);
    return;
  }

  if (!Esp32GateHAL::getInstance().lockState()) {
    sendJsonError(request, 503, "System Busy");
    return;
  }
  int result = _gate->registerToken(token.id, token.displayName, token.enabled);
  Esp32GateHAL::getInstance().unlockState();

  if (result == 200) sendJsonOk(request, 200, "Token registered successfully");
  else if (result == 409) sendJsonError(request, 409, "Token already registered");
  else sendJsonError(request, result, "Token rejected.");
}

void WebManager::handleUpdateToken(AsyncWebServerRequest *request, uint8_t *data, size_t len, size_t index, size_t total) {
  if (!request->hasParam("id")) {
    sendJsonError(request, 400, "Missing id parameter.");
    return;
  }
  std::string id = request->getParam("id")->value().c_str();

  JsonDocument doc;
  if (!parseBody(request, data, len, index, total, doc)) return;

  TokenUpdate update;
  std::string err;
  if (!WebValidators::parseTokenUpdate(doc.as<JsonVariant>(), update, err)) {
    sendJsonError(request, 400, err);
    return;
  }

  if (!Esp32GateHAL::getInstance().lockState()) {
    sendJsonError(request, 503, "System Busy");
    return;
  }
  int result = _gate->updateToken(id, update.hasName ? &update.name : nullptr, update.hasEnabled ? &update.enabled : nullptr);
  Esp32GateHAL::getInstance().unlockState();

  if (result == 200) sendJsonOk(request, 200, "Token updated successfully");
  else if (result == 404) sendJsonError(request, 404, "Token not found");
  else sendJsonError(request, result, "Token update rejected.");
}

void WebManager::handleDeleteToken(AsyncWebServerRequest *request) {
  if (!request->hasParam("id")) {
    sendJsonError(request, 400, "Missing id parameter.");
    return;
  }
  std::string id = request->getParam("id")->value().c_str();

  if (!Esp32GateHAL::getInstance().lockState()) {
    sendJsonError(request, 503, "System Busy");
    return;
  }
  int result = _gate->unregisterToken(id);
  Esp32GateHAL::getInstance().unlockState();

  if (result == 200) sendJsonOk(request, 200, "Token unregistered successfully");
  else sendJsonError(request, 404, "Token not found");
}

// =================================================================================
// SECTION: CONFIGURATION
// =================================================================================

void WebManager::handleGetConfig(AsyncWebServerRequest *request) {
  ActuatorConfig actuator;
  SettingsManager::loadActuatorConfig(actuator);

  JsonDocument doc;
  ConfigCodec::writeGateConfig(_gate->getConfig(), doc["gate"].to<JsonObject>());

  // Credentials are never echoed
  JsonObject c4 = doc["c4"].to<JsonObject>();
  c4["host"] = actuator.host;
  c4["username"] = actuator.username;
  c4["gateDeviceId"] = actuator.gateDeviceId;
  c4["openScenario"] = actuator.openScenario;
  c4["closeScenario"] = actuator.closeScenario;
  c4["notificationAgentId"] = actuator.notificationAgentId;

  doc["activityMode"] = activityModeToString(_activity->getMode());

  String response;
  serializeJson(doc, response);
  request->send(200, "application/json", response);
}

void WebManager::handleSetConfig(AsyncWebServerRequest *request, uint8_t *data, size_t len, size_t index, size_t total) {
  JsonDocument doc;
  if (!parseBody(request, data, len, index, total, doc)) return;

  GateConfig next;
  std::string err;
  if (!WebValidators::parseGateConfig(doc.as<JsonVariant>(), _gate->getConfig(), next, err)) {
    sendJsonError(request, 400, err);
    return;
  }

  if (!Esp32GateHAL::getInstance().lockState()) {
    sendJsonError(request, 503, "System Busy");
    return;
  }
  GateConfig stored = SettingsManager::saveGateConfig(next);
  int result = _gate->applyConfig(stored);
  Esp32GateHAL::getInstance().unlockState();

  if (result != 200) {
    sendJsonError(request, result, "Configuration rejected.");
    return;
  }

  JsonDocument out;
  out["status"] = "ok";
  out["message"] = "Configuration saved and applied.";
  ConfigCodec::writeGateConfig(stored, out["gate"].to<JsonObject>());
  String response;
  serializeJson(out, response);
  request->send(200, "application/json", response);
}

void WebManager::handleUpdateWifi(AsyncWebServerRequest *request, uint8_t *data, size_t len, size_t index, size_t total) {
  JsonDocument doc;
  if (!parseBody(request, data, len, index, total, doc)) return;

  const char *ssid = doc["ssid"];
  const char *pass = doc["pass"];
  std::string err;

  if (!WebValidators::validateWifiCredentials(ssid, pass, err)) {
    sendJsonError(request, 400, err);
    return;
  }

  SettingsManager::setWifiSSID(ssid);
  SettingsManager::setWifiPassword(pass ? pass : "");

  request->send(200, "application/json", "{\"status\":\"saved\", \"message\":\"Reboot to apply.\"}");
}

// =================================================================================
// SECTION: GATE & SCAN
// =================================================================================

void WebManager::handleGateCommand(AsyncWebServerRequest *request, GateCommandType type) {
  if (!_tasks->enqueue(type, "Manual")) {
    sendJsonError(request, 503, "System Busy");
    return;
  }
  sendJsonOk(request, 202, type == CMD_OPEN ? "Gate open queued" : "Gate close queued");
}

void WebManager::handleStartScan(AsyncWebServerRequest *request) {
  if (_tasks->isNearbyScanPending()) {
    sendJsonError(request, 409, "Scan already in progress.");
    return;
  }
  if (!_tasks->enqueue(CMD_NEARBY_SCAN, "web")) {
    sendJsonError(request, 503, "System Busy");
    return;
  }
  sendJsonOk(request, 202, "Scan started");
}

void WebManager::handleGetScan(AsyncWebServerRequest *request) {
  std::vector<NearbyDevice> devices;
  uint32_t ageSeconds = 0;

  if (_tasks->hasNearbyResult() && !_tasks->getNearbyResult(devices, ageSeconds)) {
    sendJsonError(request, 503, "System Busy");
    return;
  }

  AsyncResponseStream *response = request->beginResponseStream("application/json");
  JsonDocument doc;
  doc["scanning"] = _tasks->isNearbyScanPending();
  if (_tasks->hasNearbyResult()) doc["age"] = ageSeconds;
  else doc["age"] = nullptr;

  JsonArray arr = doc["devices"].to<JsonArray>();
  for (size_t i = 0; i < devices.size(); i++) {
    ConfigCodec::writeNearbyDevice(devices[i], arr.add<JsonObject>());
  }
  serializeJson(doc, *response);
  request->send(response);
}

// =================================================================================
// SECTION: ACTIVITY
// =================================================================================

void WebManager::handleGetActivity(AsyncWebServerRequest *request) {
  const char *limitParam = request->hasParam("limit") ? request->getParam("limit")->value().c_str() : nullptr;
  const char *typeParam = request->hasParam("type") ? request->getParam("type")->value().c_str() : nullptr;

  size_t limit = 0;
  bool hasType = false;
  ActivityType type = ACT_INFO;
  std::string err;
  if (!WebValidators::parseActivityQuery(limitParam, typeParam, limit, hasType, type, err)) {
    sendJsonError(request, 400, err);
    return;
  }

  std::vector<ActivityEntry> entries;
  _activity->getEntries(limit, hasType ? &type : nullptr, entries);

  AsyncResponseStream *response = request->beginResponseStream("application/json");
  JsonDocument doc;
  JsonArray arr = doc["entries"].to<JsonArray>();
  for (size_t i = 0; i < entries.size(); i++) {
    ConfigCodec::writeActivityEntry(entries[i], arr.add<JsonObject>());
  }
  serializeJson(doc, *response);
  request->send(response);
}

void WebManager::handleClearActivity(AsyncWebServerRequest *request) {
  _activity->clear();
  sendJsonOk(request, 200, "Activity log cleared");
}

void WebManager::handleGetActivityMode(AsyncWebServerRequest *request) {
  JsonDocument doc;
  doc["mode"] = activityModeToString(_activity->getMode());
  String response;
  serializeJson(doc, response);
  request->send(200, "application/json", response);
}

void WebManager::handleSetActivityMode(AsyncWebServerRequest *request, uint8_t *data, size_t len, size_t index, size_t total) {
  JsonDocument doc;
  if (!parseBody(request, data, len, index, total, doc)) return;

  ActivityMode mode;
  std::string err;
  if (!WebValidators::parseActivityMode(doc.as<JsonVariant>(), mode, err)) {
    sendJsonError(request, 400, err);
    return;
  }

  _activity->setMode(mode);
  SettingsManager::setActivityMode(mode);

  JsonDocument out;
  out["status"] = "ok";
  out["mode"] = activityModeToString(mode);
  String response;
  serializeJson(out, response);
  request->send(200, "application/json", response);
}

// =================================================================================
// SECTION: EVENT STREAM
// =================================================================================

void WebManager::onGateEvent(const GateEvent &event) {
  if (_events.count() == 0) return;

  JsonDocument doc;
  ConfigCodec::writeGateEvent(event, doc.to<JsonObject>());
  String payload;
  serializeJson(doc, payload);
  _events.send(payload.c_str(), ConfigCodec::eventName(event.type), millis());
}
