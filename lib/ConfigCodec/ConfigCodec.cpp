#include <math.h>

#include "ConfigCodec.h"
#include "TimeUtils.h"

// =================================================================================
// SECTION: PERSISTED TOKEN LIST
// =================================================================================

void ConfigCodec::serializeTokens(const std::vector<Token>& tokens, std::string& out) {
    JsonDocument doc;
    JsonArray arr = doc.to<JsonArray>();
    for (const Token& t : tokens) {
        writeToken(t, arr.add<JsonObject>());
    }
    out.clear();
    serializeJson(doc, out);
}

bool ConfigCodec::deserializeTokens(const std::string& json, std::vector<Token>& out, std::string& errorMsg) {
    out.clear();
    if (json.empty()) return true; // Nothing stored yet

    JsonDocument doc;
    DeserializationError err = deserializeJson(doc, json);
    if (err) {
        errorMsg = std::string("Token list JSON error: ") + err.c_str();
        return false;
    }
    if (!doc.is<JsonArray>()) {
        errorMsg = "Token list is not an array.";
        return false;
    }

    for (JsonObject o : doc.as<JsonArray>()) {
        const char* id = o["id"] | "";
        if (id[0] == '\0') continue;

        Token t;
        t.id = id;
        t.displayName = o["name"] | id;
        t.enabled = o["enabled"] | true;
        out.push_back(t);
    }
    return true;
}

// =================================================================================
// SECTION: API OBJECTS
// =================================================================================

void ConfigCodec::writeDistance(float distance, JsonObject obj) {
    if (distance < 0) {
        obj["distance"] = nullptr;
    } else {
        obj["distance"] = roundf(distance * 100.0f) / 100.0f;
    }
}

void ConfigCodec::writeToken(const Token& token, JsonObject obj) {
    obj["id"] = token.id;
    obj["name"] = token.displayName;
    obj["enabled"] = token.enabled;
}

void ConfigCodec::writeGateConfig(const GateConfig& config, JsonObject obj) {
    obj["autoCloseTimeout"] = config.autoCloseTimeout;
    obj["sessionTimeout"] = config.sessionTimeout;
    obj["statusCheckInterval"] = config.statusCheckInterval;
    obj["bleScanInterval"] = config.bleScanInterval;
    obj["tokenIdleTimeout"] = config.tokenIdleTimeout;
    obj["autoCloseCheckInterval"] = config.autoCloseCheckInterval;
    obj["nearbyScanDuration"] = config.nearbyScanDuration;
}

void ConfigCodec::writeGateStatus(const GateStatus& status, JsonObject obj) {
    obj["state"] = gateStateToString(status.state);

    if (status.hasLastOpenTime) {
        char buf[32];
        TimeUtils::formatEpoch(status.lastOpenEpoch, buf, sizeof(buf));
        obj["lastOpenTime"] = buf;
        obj["secondsSinceOpen"] = status.secondsSinceOpen;
    } else {
        obj["lastOpenTime"] = nullptr;
        obj["secondsSinceOpen"] = nullptr;
    }

    obj["sessionActive"] = status.sessionActive;
    if (status.sessionActive) {
        obj["secondsSinceSession"] = status.secondsSinceSession;
    }

    JsonObject act = obj["actuator"].to<JsonObject>();
    act["code"] = status.actuatorCode;
    act["online"] = status.actuator.online;
    act["name"] = status.actuator.name;
    act["detail"] = status.actuator.detail;
}

void ConfigCodec::writeActivityEntry(const ActivityEntry& entry, JsonObject obj) {
    char buf[32];
    TimeUtils::formatEpoch(entry.timestamp, buf, sizeof(buf));

    obj["seq"] = entry.seq;
    obj["timestamp"] = buf;
    obj["type"] = activityTypeToString(entry.type);
    obj["message"] = entry.message;
    obj["updateCount"] = entry.updateCount;

    if (!entry.tokenId.empty()) {
        JsonObject details = obj["details"].to<JsonObject>();
        details["tokenId"] = entry.tokenId;
        details["tokenName"] = entry.tokenName;
        if (entry.hasRssi) {
            details["rssi"] = entry.rssi;
            writeDistance(entry.distance, details);
        }
    }
}

void ConfigCodec::writeNearbyDevice(const NearbyDevice& device, JsonObject obj) {
    obj["type"] = deviceKindToString(device.kind);
    obj["address"] = device.address;
    obj["name"] = device.name;
    obj["rssi"] = device.rssi;
    writeDistance(device.distance, obj);

    if (device.kind == DEVICE_BEACON) {
        obj["uuid"] = device.beacon.uuid;
        obj["major"] = device.beacon.major;
        obj["minor"] = device.beacon.minor;
        obj["txPower"] = device.beacon.txPower;
    }
}

const char* ConfigCodec::eventName(GateEventType type) {
    switch (type) {
        case EVT_TOKEN_DETECTED:     return "token_detected";
        case EVT_GATE_OPENED:        return "gate_opened";
        case EVT_GATE_CLOSED:        return "gate_closed";
        case EVT_ACTUATOR_ERROR:     return "error";
        case EVT_TOKEN_REGISTERED:   return "token_registered";
        case EVT_TOKEN_UPDATED:      return "token_updated";
        case EVT_TOKEN_UNREGISTERED: return "token_unregistered";
        case EVT_CONFIG_UPDATED:     return "config_updated";
        case EVT_INFO:               return "info";
        default:                     return "unknown";
    }
}

void ConfigCodec::writeGateEvent(const GateEvent& event, JsonObject obj) {
    obj["event"] = eventName(event.type);
    if (!event.token.id.empty()) {
        obj["tokenId"] = event.token.id;
        obj["tokenName"] = event.token.displayName;
    }
    if (event.hasRssi) {
        obj["rssi"] = event.rssi;
        writeDistance(event.distance, obj);
    }
    if (!event.reason.empty()) {
        obj["reason"] = event.reason;
    }
}
