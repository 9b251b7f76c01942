/*
 * =================================================================================
 * File:      lib/WebValidators/WebValidators.h
 * Description: Request body and query validation for the HTTP API.
 * =================================================================================
 */
#pragma once
#include <ArduinoJson.h>
#include <string.h>
#include <string>

#include "Types.h"

// Partial token update. Only fields marked present are applied.
struct TokenUpdate {
    bool hasName = false;
    std::string name;
    bool hasEnabled = false;
    bool enabled = true;
};

class WebValidators {
public:
    // Validates WiFi credentials (length checks, empty checks)
    // Returns true if valid, false otherwise. Writes explanation to errorMsg.
    static bool validateWifiCredentials(const char* ssid, const char* pass, std::string& errorMsg);

    // Controller host and account credentials (provisioning / config).
    static bool validateControllerSettings(const char* host, const char* user, const char* pass, std::string& errorMsg);

    // POST /api/tokens body: { "id": str, "name": str, "enabled"?: bool }
    static bool parseTokenRequest(const JsonVariant& json, Token& outToken, std::string& errorMsg);

    // PUT /api/tokens body: { "name"?: str, "enabled"?: bool }, at least one field.
    static bool parseTokenUpdate(const JsonVariant& json, TokenUpdate& outUpdate, std::string& errorMsg);

    // POST /api/config body. Missing fields keep the value from 'base'.
    // The merged result must pass SessionGate::validateConfig.
    static bool parseGateConfig(const JsonVariant& json, const GateConfig& base, GateConfig& outConfig, std::string& errorMsg);

    // POST /api/activity/mode body: { "mode": "suppress" | "extended" }
    static bool parseActivityMode(const JsonVariant& json, ActivityMode& outMode, std::string& errorMsg);

    // GET /api/activity query. Either pointer may be null (parameter absent).
    static bool parseActivityQuery(const char* limitParam, const char* typeParam, size_t& outLimit,
                                   bool& outHasType, ActivityType& outType, std::string& errorMsg);
};
