#include <stdlib.h>

#include "SessionGate.h"
#include "WebValidators.h"

// Upper bound for a single activity page
static const size_t MAX_ACTIVITY_LIMIT = 1000;

bool WebValidators::validateWifiCredentials(const char* ssid, const char* pass, std::string& errorMsg) {
    if (!ssid || strlen(ssid) == 0) {
        errorMsg = "SSID cannot be empty.";
        return false;
    }
    if (strlen(ssid) > 32) {
        errorMsg = "SSID too long (max 32 chars).";
        return false;
    }
    // Password can be empty for Open networks, but max length applies
    if (pass && strlen(pass) > 64) {
        errorMsg = "Password too long (max 64 chars).";
        return false;
    }
    return true;
}

bool WebValidators::validateControllerSettings(const char* host, const char* user, const char* pass, std::string& errorMsg) {
    if (!host || strlen(host) == 0) {
        errorMsg = "Controller host cannot be empty.";
        return false;
    }
    if (strlen(host) > 64) {
        errorMsg = "Controller host too long (max 64 chars).";
        return false;
    }
    if (!user || strlen(user) == 0) {
        errorMsg = "Controller username cannot be empty.";
        return false;
    }
    if (strlen(user) > 64) {
        errorMsg = "Controller username too long (max 64 chars).";
        return false;
    }
    if (!pass || strlen(pass) == 0) {
        errorMsg = "Controller password cannot be empty.";
        return false;
    }
    if (strlen(pass) > 64) {
        errorMsg = "Controller password too long (max 64 chars).";
        return false;
    }
    return true;
}

bool WebValidators::parseTokenRequest(const JsonVariant& json, Token& outToken, std::string& errorMsg) {
    if (!json["id"].is<const char*>() || !json["name"].is<const char*>()) {
        errorMsg = "Missing required fields: id, name.";
        return false;
    }

    std::string id = json["id"].as<const char*>();
    std::string name = json["name"].as<const char*>();

    if (TokenRegistry::normalizeId(id).empty()) {
        errorMsg = "Token id cannot be empty.";
        return false;
    }
    if (id.size() > MAX_TOKEN_ID_LENGTH) {
        errorMsg = "Token id too long (max " + std::to_string(MAX_TOKEN_ID_LENGTH) + " chars).";
        return false;
    }
    if (name.empty()) {
        errorMsg = "Token name cannot be empty.";
        return false;
    }
    if (name.size() > MAX_TOKEN_NAME_LENGTH) {
        errorMsg = "Token name too long (max " + std::to_string(MAX_TOKEN_NAME_LENGTH) + " chars).";
        return false;
    }

    if (!json["enabled"].isNull() && !json["enabled"].is<bool>()) {
        errorMsg = "enabled must be a boolean.";
        return false;
    }

    outToken.id = id;
    outToken.displayName = name;
    outToken.enabled = json["enabled"] | true;
    return true;
}

bool WebValidators::parseTokenUpdate(const JsonVariant& json, TokenUpdate& outUpdate, std::string& errorMsg) {
    outUpdate = TokenUpdate();

    if (!json["name"].isNull()) {
        if (!json["name"].is<const char*>()) {
            errorMsg = "name must be a string.";
            return false;
        }
        outUpdate.name = json["name"].as<const char*>();
        if (outUpdate.name.empty() || outUpdate.name.size() > MAX_TOKEN_NAME_LENGTH) {
            errorMsg = "Token name must be 1-" + std::to_string(MAX_TOKEN_NAME_LENGTH) + " chars.";
            return false;
        }
        outUpdate.hasName = true;
    }

    if (!json["enabled"].isNull()) {
        if (!json["enabled"].is<bool>()) {
            errorMsg = "enabled must be a boolean.";
            return false;
        }
        outUpdate.enabled = json["enabled"].as<bool>();
        outUpdate.hasEnabled = true;
    }

    if (!outUpdate.hasName && !outUpdate.hasEnabled) {
        errorMsg = "Nothing to update (expected name and/or enabled).";
        return false;
    }
    return true;
}

bool WebValidators::parseGateConfig(const JsonVariant& json, const GateConfig& base, GateConfig& outConfig, std::string& errorMsg) {
    GateConfig merged = base;

    struct Field {
        const char* key;
        uint32_t* target;
    };
    Field fields[] = {
        {"autoCloseTimeout", &merged.autoCloseTimeout},
        {"sessionTimeout", &merged.sessionTimeout},
        {"statusCheckInterval", &merged.statusCheckInterval},
        {"bleScanInterval", &merged.bleScanInterval},
        {"tokenIdleTimeout", &merged.tokenIdleTimeout},
        {"autoCloseCheckInterval", &merged.autoCloseCheckInterval},
        {"nearbyScanDuration", &merged.nearbyScanDuration},
    };

    int applied = 0;
    for (size_t i = 0; i < sizeof(fields) / sizeof(fields[0]); i++) {
        JsonVariantConst v = json[fields[i].key];
        if (v.isNull()) continue;
        if (!v.is<uint32_t>()) {
            errorMsg = std::string(fields[i].key) + " must be a non-negative integer.";
            return false;
        }
        *fields[i].target = v.as<uint32_t>();
        applied++;
    }

    if (applied == 0) {
        errorMsg = "No recognized configuration fields.";
        return false;
    }

    if (!SessionGate::validateConfig(merged, errorMsg)) {
        return false;
    }

    outConfig = merged;
    return true;
}

bool WebValidators::parseActivityMode(const JsonVariant& json, ActivityMode& outMode, std::string& errorMsg) {
    std::string modeStr = json["mode"] | "";
    if (modeStr == "suppress") outMode = ACTIVITY_SUPPRESS;
    else if (modeStr == "extended") outMode = ACTIVITY_EXTENDED;
    else {
        errorMsg = "Invalid mode: '" + modeStr + "' (expected suppress or extended).";
        return false;
    }
    return true;
}

bool WebValidators::parseActivityQuery(const char* limitParam, const char* typeParam, size_t& outLimit,
                                       bool& outHasType, ActivityType& outType, std::string& errorMsg) {
    outLimit = 0;
    outHasType = false;

    if (limitParam != nullptr && strlen(limitParam) > 0) {
        char* end = nullptr;
        long value = strtol(limitParam, &end, 10);
        if (end == limitParam || *end != '\0' || value < 0) {
            errorMsg = "limit must be a non-negative integer.";
            return false;
        }
        outLimit = (size_t)value > MAX_ACTIVITY_LIMIT ? MAX_ACTIVITY_LIMIT : (size_t)value;
    }

    if (typeParam != nullptr && strlen(typeParam) > 0) {
        if (!activityTypeFromString(typeParam, outType)) {
            errorMsg = std::string("Unknown activity type: ") + typeParam;
            return false;
        }
        outHasType = true;
    }
    return true;
}
