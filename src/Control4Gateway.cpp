/*
 * =================================================================================
 * Project:   BeaconGate - BLE Gate Automation Controller
 * File:      src/Control4Gateway.cpp
 *
 * SPDX-License-Identifier: Apache-2.0
 *
 * Description:
 * HTTPS client for the Control4 controller. Owns the token cache and the retry
 * policy; SessionGate only ever sees bool / 200 / 503.
 * =================================================================================
 */
#include "Control4Gateway.h"
#include <HTTPClient.h>
#include <WiFi.h>
#include <WiFiClientSecure.h>

#include "Config.h"
#include "Esp32GateHAL.h"

// =================================================================================
// SECTION: LIFECYCLE
// =================================================================================

Control4Gateway::Control4Gateway(const ActuatorConfig& config) : _config(config) {
    _authMutex = xSemaphoreCreateMutex();
}

void Control4Gateway::log(const char* value) { Esp32GateHAL::getInstance().logKeyValue("C4", value); }

bool Control4Gateway::connect() {
    if (_authMutex == NULL || xSemaphoreTake(_authMutex, portMAX_DELAY) != pdTRUE) return false;
    bool ok = connectLocked();
    xSemaphoreGive(_authMutex);
    return ok;
}

void Control4Gateway::disconnect() {
    if (_authMutex == NULL || xSemaphoreTake(_authMutex, portMAX_DELAY) != pdTRUE) return;
    _accountToken.clear();
    _directorToken.clear();
    xSemaphoreGive(_authMutex);
    log("Disconnected from Control4.");
}

bool Control4Gateway::connectLocked() {
    char logBuf[96];
    snprintf(logBuf, sizeof(logBuf), "Connecting to controller at %s", _config.host.c_str());
    log(logBuf);

    _directorToken.clear();

    if (WiFi.status() != WL_CONNECTED) {
        log("WiFi not connected.");
        return false;
    }
    if (!requestAccountToken()) return false;
    if (!requestControllerName()) return false;
    if (!requestDirectorToken()) return false;

    snprintf(logBuf, sizeof(logBuf), "Connected to controller: %s", _controllerName.c_str());
    log(logBuf);
    return true;
}

// =================================================================================
// SECTION: AUTHENTICATION
// =================================================================================

bool Control4Gateway::requestAccountToken() {
    JsonDocument req;
    JsonObject device = req["clientInfo"]["device"].to<JsonObject>();
    device["deviceName"] = DEVICE_NAME;
    device["deviceUUID"] = "0000000000000000";
    device["make"] = DEVICE_NAME;
    device["model"] = DEVICE_NAME;
    device["os"] = "Android";
    device["osVersion"] = "10";
    JsonObject user = req["clientInfo"]["userInfo"].to<JsonObject>();
    user["applicationKey"] = C4_APPLICATION_KEY;
    user["userName"] = _config.username;
    user["password"] = _config.password;

    std::string body;
    serializeJson(req, body);

    std::string response;
    int code = httpRequest("POST", C4_AUTH_URL, "", &body, &response);
    if (code != 200) {
        char logBuf[64];
        snprintf(logBuf, sizeof(logBuf), "Account login failed (HTTP %d)", code);
        log(logBuf);
        return false;
    }

    JsonDocument doc;
    if (deserializeJson(doc, response)) {
        log("Account login: bad JSON.");
        return false;
    }
    const char* token = doc["authToken"]["token"] | "";
    if (token[0] == '\0') {
        log("Account login: no token.");
        return false;
    }
    _accountToken = token;
    return true;
}

bool Control4Gateway::requestControllerName() {
    std::string response;
    int code = httpRequest("GET", C4_ACCOUNTS_URL, _accountToken, nullptr, &response);
    if (code != 200) {
        char logBuf[64];
        snprintf(logBuf, sizeof(logBuf), "Controller lookup failed (HTTP %d)", code);
        log(logBuf);
        return false;
    }

    JsonDocument doc;
    if (deserializeJson(doc, response)) {
        log("Controller lookup: bad JSON.");
        return false;
    }
    JsonVariantConst account = doc["account"];
    const char* name = account["controllerCommonName"] | (account["name"] | "");
    if (name[0] == '\0') {
        log("Controller lookup: no controller on account.");
        return false;
    }
    _controllerName = name;
    return true;
}

bool Control4Gateway::requestDirectorToken() {
    JsonDocument req;
    req["serviceInfo"]["commonName"] = _controllerName;
    req["serviceInfo"]["services"] = "director";

    std::string body;
    serializeJson(req, body);

    std::string response;
    int code = httpRequest("POST", C4_CONTROLLER_AUTH_URL, _accountToken, &body, &response);
    if (code != 200) {
        char logBuf[64];
        snprintf(logBuf, sizeof(logBuf), "Director token failed (HTTP %d)", code);
        log(logBuf);
        return false;
    }

    JsonDocument doc;
    if (deserializeJson(doc, response)) {
        log("Director token: bad JSON.");
        return false;
    }
    const char* token = doc["authToken"]["token"] | "";
    if (token[0] == '\0') {
        log("Director token: missing.");
        return false;
    }
    _directorToken = token;
    return true;
}

// =================================================================================
// SECTION: TRANSPORT
// =================================================================================

std::string Control4Gateway::directorUrl(const std::string& path) const { return "https://" + _config.host + path; }

int Control4Gateway::httpRequest(const char* method, const std::string& url, const std::string& bearer,
                                 const std::string* body, std::string* response) {
    WiFiClientSecure client;
    // The director presents a self-signed certificate
    client.setInsecure();

    HTTPClient http;
    http.setTimeout(C4_HTTP_TIMEOUT_MS);
    if (!http.begin(client, url.c_str())) {
        return HTTPC_ERROR_CONNECTION_REFUSED;
    }

    http.addHeader("Content-Type", "application/json");
    if (!bearer.empty()) {
        http.addHeader("Authorization", ("Bearer " + bearer).c_str());
    }

    int code;
    if (body != nullptr) {
        code = http.sendRequest(method, (uint8_t*)body->data(), body->size());
    } else {
        code = http.sendRequest(method);
    }

    if (code > 0 && response != nullptr) {
        *response = http.getString().c_str();
    }
    http.end();
    return code;
}

bool Control4Gateway::acquireDirectorToken(std::string& out) {
    if (_authMutex == NULL || xSemaphoreTake(_authMutex, portMAX_DELAY) != pdTRUE) return false;
    bool ok = !_directorToken.empty() || connectLocked();
    if (ok) out = _directorToken;
    xSemaphoreGive(_authMutex);
    return ok;
}

void Control4Gateway::invalidateDirectorToken(const std::string& rejected) {
    if (_authMutex == NULL || xSemaphoreTake(_authMutex, portMAX_DELAY) != pdTRUE) return;
    // Another task may already have fetched a fresh token
    if (_directorToken == rejected) _directorToken.clear();
    xSemaphoreGive(_authMutex);
}

// The auth lock covers token reads and refreshes only. Requests run unlocked.
int Control4Gateway::directorRequest(const char* method, const std::string& path, const std::string* body,
                                     std::string* response) {
    int code = -1;
    bool reauthorized = false;
    uint32_t backoffMs = C4_BACKOFF_BASE_MS;

    for (int attempt = 1; attempt <= C4_MAX_ATTEMPTS; attempt++) {
        std::string token;
        if (!acquireDirectorToken(token)) {
            code = -1;
        } else {
            code = httpRequest(method, directorUrl(path), token, body, response);
            if (code >= 200 && code < 300) break;

            if (code == 401 && !reauthorized) {
                log("Director token rejected. Re-authenticating...");
                reauthorized = true;
                invalidateDirectorToken(token);
                attempt--; // Re-auth does not consume a retry
                continue;
            }
            if (code >= 400 && code < 500) break; // Not retryable
        }

        if (attempt < C4_MAX_ATTEMPTS) {
            char logBuf[64];
            snprintf(logBuf, sizeof(logBuf), "Request failed (%d). Retry %d in %u ms", code, attempt, backoffMs);
            log(logBuf);
            vTaskDelay(pdMS_TO_TICKS(backoffMs));
            backoffMs *= 2;
        }
    }
    return code;
}

// =================================================================================
// SECTION: COMMANDS
// =================================================================================

bool Control4Gateway::runScenario(uint32_t scenario, const char* label) {
    char logBuf[64];
    snprintf(logBuf, sizeof(logBuf), "%s gate (scenario %u)...", label, scenario);
    log(logBuf);

    JsonDocument req;
    req["async"] = true;
    req["command"] = "Run Scenario";
    req["tParams"]["Scenario"] = scenario;

    std::string body;
    serializeJson(req, body);

    char path[64];
    snprintf(path, sizeof(path), "/api/v1/items/%u/commands", _config.gateDeviceId);

    int code = directorRequest("POST", path, &body, nullptr);
    if (code < 200 || code >= 300) {
        snprintf(logBuf, sizeof(logBuf), "Scenario %u failed (%d)", scenario, code);
        log(logBuf);
        return false;
    }
    return true;
}

bool Control4Gateway::open() { return runScenario(_config.openScenario, "Opening"); }

bool Control4Gateway::close() { return runScenario(_config.closeScenario, "Closing"); }

int Control4Gateway::queryState(ActuatorStatus& out) {
    char path[48];
    snprintf(path, sizeof(path), "/api/v1/items/%u", _config.gateDeviceId);

    std::string response;
    int code = directorRequest("GET", path, nullptr, &response);
    if (code != 200) {
        out.online = false;
        out.name.clear();
        out.detail = "unavailable";
        return 503;
    }

    JsonDocument doc;
    DeserializationError err = deserializeJson(doc, response);
    if (err) {
        out.online = false;
        out.detail = "bad response";
        return 503;
    }

    // The director answers with a one-element array for a single item
    JsonVariantConst item = doc.as<JsonVariantConst>();
    if (doc.is<JsonArray>()) item = doc.as<JsonArrayConst>()[0];
    out.online = true;
    out.name = item["name"] | "";
    out.detail = item["type"].is<const char*>() ? item["type"].as<const char*>() : "online";
    return 200;
}

bool Control4Gateway::sendNotification(const char* title, const char* message, const char* priority) {
    JsonDocument req;
    req["async"] = true;
    req["command"] = "SendPushNotification";
    req["tParams"]["title"] = title;
    req["tParams"]["message"] = message;
    req["tParams"]["priority"] = priority;

    std::string body;
    serializeJson(req, body);

    char path[64];
    snprintf(path, sizeof(path), "/api/v1/items/%u/commands", _config.notificationAgentId);

    int code = directorRequest("POST", path, &body, nullptr);
    return code >= 200 && code < 300;
}

// =================================================================================
// SECTION: DIAGNOSTICS
// =================================================================================

void Control4Gateway::printStartupDiagnostics() {
    Esp32GateHAL& hal = Esp32GateHAL::getInstance();
    char logBuf[128];

    hal.log("==========================================================================");
    hal.log("                            CONTROLLER DIAGNOSTICS                        ");
    hal.log("==========================================================================");
    hal.log("[ CONTROL4 ]");

    snprintf(logBuf, sizeof(logBuf), " %-25s : %s", "Director Host", _config.host.c_str());
    hal.log(logBuf);
    snprintf(logBuf, sizeof(logBuf), " %-25s : %s", "Controller", _controllerName.empty() ? "-- UNKNOWN --" : _controllerName.c_str());
    hal.log(logBuf);
    snprintf(logBuf, sizeof(logBuf), " %-25s : %s", "Session", isConnected() ? "AUTHORIZED" : "NONE");
    hal.log(logBuf);
    snprintf(logBuf, sizeof(logBuf), " %-25s : %u", "Gate Item", _config.gateDeviceId);
    hal.log(logBuf);
    snprintf(logBuf, sizeof(logBuf), " %-25s : open %u / close %u", "Scenarios", _config.openScenario, _config.closeScenario);
    hal.log(logBuf);
    snprintf(logBuf, sizeof(logBuf), " %-25s : %u", "Notification Agent", _config.notificationAgentId);
    hal.log(logBuf);
}
