/*
 * =================================================================================
 * Project:   BeaconGate - BLE Gate Automation Controller
 * File:      lib/GateEngine/TokenRegistry.cpp
 *
 * Description:
 * Token CRUD with normalized identifiers. Mutation and persistence are not
 * transactional: a failed write is logged and the in-memory change is kept.
 * =================================================================================
 */
#include <ctype.h>
#include <stdio.h>

#include "TokenRegistry.h"

TokenRegistry::TokenRegistry(IGateHAL& hal) : _hal(hal) {}

void TokenRegistry::logKeyValue(const char* key, const char* value) {
    char tempBuf[MAX_LOG_LENGTH];
    snprintf(tempBuf, sizeof(tempBuf), " %-8s : %s", key, value);
    _hal.log(tempBuf);
}

std::string TokenRegistry::normalizeId(const std::string& id) {
    std::string out;
    out.reserve(id.size());
    for (size_t i = 0; i < id.size(); i++) {
        char c = id[i];
        if (c == ':' || c == '-' || c == '_' || c == ' ') continue;
        out += (char)tolower((unsigned char)c);
    }
    return out;
}

int TokenRegistry::findIndex(const std::string& normalizedId) const {
    for (size_t i = 0; i < _tokens.size(); i++) {
        if (_tokens[i].id == normalizedId) return (int)i;
    }
    return -1;
}

// Caller holds _mutex.
void TokenRegistry::persist() {
    if (!_hal.saveTokens(_tokens)) {
        logKeyValue("Registry", "WARNING: Token list could not be persisted.");
    }
}

// =================================================================================
// SECTION: MUTATIONS
// =================================================================================

int TokenRegistry::registerToken(const std::string& id, const std::string& name, bool enabled) {
    std::string key = normalizeId(id);
    if (key.empty() || name.empty()) return 400;
    if (key.size() > MAX_TOKEN_ID_LENGTH || name.size() > MAX_TOKEN_NAME_LENGTH) return 400;

    char logBuf[MAX_LOG_LENGTH];
    std::lock_guard<std::mutex> lock(_mutex);

    if (findIndex(key) >= 0) {
        snprintf(logBuf, sizeof(logBuf), "Token %s is already registered", key.c_str());
        logKeyValue("Registry", logBuf);
        return 409;
    }

    Token t;
    t.id = key;
    t.displayName = name;
    t.enabled = enabled;
    _tokens.push_back(t);
    persist();

    snprintf(logBuf, sizeof(logBuf), "Registered token: %s (%s)", name.c_str(), key.c_str());
    logKeyValue("Registry", logBuf);
    return 200;
}

int TokenRegistry::updateToken(const std::string& id, const std::string* name, const bool* enabled) {
    std::string key = normalizeId(id);
    if (name != nullptr && (name->empty() || name->size() > MAX_TOKEN_NAME_LENGTH)) return 400;

    std::lock_guard<std::mutex> lock(_mutex);
    int idx = findIndex(key);
    if (idx < 0) return 404;

    Token& t = _tokens[idx];
    if (name != nullptr) t.displayName = *name;
    if (enabled != nullptr) t.enabled = *enabled;
    persist();

    char logBuf[MAX_LOG_LENGTH];
    snprintf(logBuf, sizeof(logBuf), "Updated token: %s (%s)", t.displayName.c_str(), t.enabled ? "enabled" : "paused");
    logKeyValue("Registry", logBuf);
    return 200;
}

int TokenRegistry::unregisterToken(const std::string& id) {
    std::string key = normalizeId(id);

    std::lock_guard<std::mutex> lock(_mutex);
    int idx = findIndex(key);
    char logBuf[MAX_LOG_LENGTH];

    if (idx < 0) {
        snprintf(logBuf, sizeof(logBuf), "Token %s not found", key.c_str());
        logKeyValue("Registry", logBuf);
        return 404;
    }

    _tokens.erase(_tokens.begin() + idx);
    persist();

    snprintf(logBuf, sizeof(logBuf), "Unregistered token: %s", key.c_str());
    logKeyValue("Registry", logBuf);
    return 200;
}

// =================================================================================
// SECTION: QUERIES
// =================================================================================

bool TokenRegistry::getToken(const std::string& id, Token& out) const {
    std::string key = normalizeId(id);
    std::lock_guard<std::mutex> lock(_mutex);
    int idx = findIndex(key);
    if (idx < 0) return false;
    out = _tokens[idx];
    return true;
}

std::vector<Token> TokenRegistry::list() const {
    std::lock_guard<std::mutex> lock(_mutex);
    return _tokens;
}

size_t TokenRegistry::count() const {
    std::lock_guard<std::mutex> lock(_mutex);
    return _tokens.size();
}

void TokenRegistry::loadTokens(const std::vector<Token>& tokens) {
    std::lock_guard<std::mutex> lock(_mutex);
    _tokens.clear();
    for (size_t i = 0; i < tokens.size(); i++) {
        Token t = tokens[i];
        t.id = normalizeId(t.id);
        // First entry wins on normalized duplicates
        if (t.id.empty() || findIndex(t.id) >= 0) continue;
        _tokens.push_back(t);
    }

    char logBuf[64];
    snprintf(logBuf, sizeof(logBuf), "Loaded %u token(s) from storage", (unsigned)_tokens.size());
    logKeyValue("Registry", logBuf);
}
