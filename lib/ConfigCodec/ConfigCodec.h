/*
 * =================================================================================
 * Project:   BeaconGate - BLE Gate Automation Controller
 * File:      lib/ConfigCodec/ConfigCodec.h
 *
 * SPDX-License-Identifier: Apache-2.0
 *
 * Description:
 * JSON encoding of persisted state (token list) and of the value types the
 * HTTP API and the event stream expose. Pure functions over ArduinoJson so
 * they run in the native test build.
 * =================================================================================
 */
#pragma once
#include <ArduinoJson.h>
#include <string>
#include <vector>

#include "ActivityLog.h"
#include "Types.h"

class ConfigCodec {
public:
    // --- Persisted Token List ---
    // Format: [{"id":"...","name":"...","enabled":true}, ...]
    static void serializeTokens(const std::vector<Token>& tokens, std::string& out);

    // Returns false (and writes errorMsg) if the document is not a token array.
    // Entries without an id are skipped. An empty string decodes to an empty list.
    static bool deserializeTokens(const std::string& json, std::vector<Token>& out, std::string& errorMsg);

    // --- API Objects ---
    static void writeToken(const Token& token, JsonObject obj);
    static void writeGateConfig(const GateConfig& config, JsonObject obj);
    static void writeGateStatus(const GateStatus& status, JsonObject obj);
    static void writeActivityEntry(const ActivityEntry& entry, JsonObject obj);
    static void writeNearbyDevice(const NearbyDevice& device, JsonObject obj);
    static void writeGateEvent(const GateEvent& event, JsonObject obj);

    // SSE event name for a GateEvent ("token_detected", "gate_opened", ...)
    static const char* eventName(GateEventType type);

private:
    static void writeDistance(float distance, JsonObject obj);
};
