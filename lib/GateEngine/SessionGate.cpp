/*
 * =================================================================================
 * Project:   BeaconGate - BLE Gate Automation Controller
 * File:      lib/GateEngine/SessionGate.cpp
 *
 * Description:
 * Core decision logic.
 * - Turns repeated token observations into single open decisions.
 * - Debounces re-triggering with a session window.
 * - Auto-closes on elapsed open time.
 * - Decoupled from hardware and network via IGateHAL / IActuatorGateway.
 * =================================================================================
 */
#include <stdio.h>
#include <string.h>

#include "SessionGate.h"
#include "TimeUtils.h"

// Ceiling for session and auto-close windows (24 h)
static const uint32_t MAX_WINDOW_SEC = 86400;
// Ceiling for loop periods (1 h)
static const uint32_t MAX_PERIOD_SEC = 3600;
static const uint32_t MAX_NEARBY_SCAN_SEC = 60;

// =================================================================================
// SECTION: CONSTRUCTOR & INIT
// =================================================================================

SessionGate::SessionGate(IGateHAL& hal,
                         IActuatorGateway& gateway,
                         TokenRegistry& registry,
                         const GateConfig& config)
    : _hal(hal),
      _gateway(gateway),
      _registry(registry),
      _config(config)
{
    // True position is unknown until the controller confirms an action
    _state = GATE_UNKNOWN;

    _hasLastOpenTime = false;
    _lastOpenMillis = 0;
    _lastOpenEpoch = 0;

    _hasSession = false;
    _sessionStartMillis = 0;

    _lastActuatorCode = 0;
}

void SessionGate::subscribe(IGateEventListener* listener) {
    if (listener == nullptr) return;
    std::lock_guard<std::mutex> lock(_listenerMutex);
    _listeners.push_back(listener);
}

// =================================================================================
// SECTION: INTERNAL HELPERS (Logging & Events)
// =================================================================================

void SessionGate::logKeyValue(const char* key, const char* value) {
    char tempBuf[MAX_LOG_LENGTH];
    // Format: " Key : Value"
    snprintf(tempBuf, sizeof(tempBuf), " %-8s : %s", key, value);
    _hal.log(tempBuf);
}

void SessionGate::emit(const GateEvent& event) {
    std::vector<IGateEventListener*> listeners;
    {
        std::lock_guard<std::mutex> lock(_listenerMutex);
        listeners = _listeners;
    }
    for (size_t i = 0; i < listeners.size(); i++) {
        listeners[i]->onGateEvent(event);
    }
}

void SessionGate::postInfo(const std::string& message) {
    GateEvent evt;
    evt.type = EVT_INFO;
    evt.reason = message;
    emit(evt);
}

// =================================================================================
// SECTION: STATE TRANSITION SYSTEM
// =================================================================================

// Caller holds _stateMutex.
bool SessionGate::changeStateLocked(GateState newState) {
    if (_state == newState) return false;
    _state = newState;
    return true;
}

void SessionGate::logStateChange(GateState newState) {
    char logBuf[64];
    snprintf(logBuf, sizeof(logBuf), ">>> STATE CHANGE: %s", gateStateToString(newState));
    logKeyValue("Gate", logBuf);
}

// Caller holds _stateMutex.
void SessionGate::expireStaleLocked(unsigned long now) {
    if (_hasSession && elapsedMs(now, _sessionStartMillis) >= (unsigned long)_config.sessionTimeout * 1000UL) {
        _hasSession = false;
        _sessionStartMillis = 0;
    }

    unsigned long idleMs = (unsigned long)_config.tokenIdleTimeout * 1000UL;
    std::map<std::string, unsigned long>::iterator it = _lastSeenMillis.begin();
    while (it != _lastSeenMillis.end()) {
        if (elapsedMs(now, it->second) >= idleMs) {
            _lastSeenMillis.erase(it++);
        } else {
            ++it;
        }
    }
}

// Caller holds _stateMutex.
bool SessionGate::sessionOpenLocked(unsigned long now) const {
    if (!_hasSession) return false;
    return elapsedMs(now, _sessionStartMillis) < (unsigned long)_config.sessionTimeout * 1000UL;
}

// =================================================================================
// SECTION: OBSERVATION HANDLING
// =================================================================================

void SessionGate::handleObservation(const Observation& obs) {
    Token token;
    bool known = _registry.getToken(obs.tokenId, token);
    if (!known) {
        token.id = TokenRegistry::normalizeId(obs.tokenId);
        token.displayName = obs.tokenId;
        token.enabled = false;
    }

    // 1. Presence bookkeeping and detection event (unconditional)
    {
        std::lock_guard<std::mutex> lock(_stateMutex);
        unsigned long now = _hal.getMillis();
        expireStaleLocked(now);
        _lastSeenMillis[token.id] = now;
    }

    GateEvent detected;
    detected.type = EVT_TOKEN_DETECTED;
    detected.token = token;
    detected.hasRssi = obs.hasRssi;
    detected.rssi = obs.rssi;
    detected.distance = obs.distance;
    emit(detected);

    char logBuf[MAX_LOG_LENGTH];

    // 2. Authorization
    if (!known) {
        snprintf(logBuf, sizeof(logBuf), "Ignoring unregistered id %s", obs.tokenId.c_str());
        logKeyValue("Gate", logBuf);
        return;
    }
    if (!token.enabled) {
        snprintf(logBuf, sizeof(logBuf), "Token %s is paused, not opening gate", token.displayName.c_str());
        logKeyValue("Gate", logBuf);
        return;
    }

    {
        std::lock_guard<std::mutex> lock(_stateMutex);
        unsigned long now = _hal.getMillis();

        // 3. Never issue a redundant open, never race an in-flight command
        if (_state == GATE_OPEN || isCommandInFlightLocked()) {
            return;
        }

        // 4. Debounce inside the session window
        if (sessionOpenLocked(now)) {
            return;
        }

        // 5. Claim the session and the open before the actuator call.
        // The session is kept even if the open fails: a failing controller is not retried for the whole window.
        _hasSession = true;
        _sessionStartMillis = now;
        changeStateLocked(GATE_OPENING);
    }

    snprintf(logBuf, sizeof(logBuf), "token detected: %s", token.displayName.c_str());
    performOpen(logBuf, &token);
}

// =================================================================================
// SECTION: COMMANDS
// =================================================================================

bool SessionGate::requestOpen(const char* reason) {
    GateState current;
    {
        std::lock_guard<std::mutex> lock(_stateMutex);
        current = _state;
        if (!isCommandInFlightLocked()) changeStateLocked(GATE_OPENING);
    }
    if (current == GATE_OPENING || current == GATE_CLOSING) {
        char logBuf[MAX_LOG_LENGTH];
        snprintf(logBuf, sizeof(logBuf), "Gate busy (%s), open refused: %s", gateStateToString(current), reason);
        logKeyValue("Gate", logBuf);
        return false;
    }
    return performOpen(reason, nullptr);
}

bool SessionGate::requestClose(const char* reason) {
    GateState current;
    {
        std::lock_guard<std::mutex> lock(_stateMutex);
        current = _state;
        if (!isCommandInFlightLocked()) changeStateLocked(GATE_CLOSING);
    }
    if (current == GATE_OPENING || current == GATE_CLOSING) {
        char logBuf[MAX_LOG_LENGTH];
        snprintf(logBuf, sizeof(logBuf), "Gate busy (%s), close refused: %s", gateStateToString(current), reason);
        logKeyValue("Gate", logBuf);
        return false;
    }
    return performClose(reason);
}

bool SessionGate::performOpen(const char* reason, const Token* token) {
    char logBuf[MAX_LOG_LENGTH];
    snprintf(logBuf, sizeof(logBuf), "Opening gate - Reason: %s", reason);
    logKeyValue("Gate", logBuf);
    logStateChange(GATE_OPENING);

    bool success = _gateway.open();

    bool changed;
    {
        std::lock_guard<std::mutex> lock(_stateMutex);
        if (success) {
            changed = changeStateLocked(GATE_OPEN);
            _hasLastOpenTime = true;
            _lastOpenMillis = _hal.getMillis();
            _lastOpenEpoch = _hal.getEpochSeconds();
        } else {
            changed = changeStateLocked(GATE_UNKNOWN);
        }
    }
    if (changed) logStateChange(success ? GATE_OPEN : GATE_UNKNOWN);

    GateEvent evt;
    if (token != nullptr) evt.token = *token;

    if (success) {
        evt.type = EVT_GATE_OPENED;
        evt.reason = reason;
        emit(evt);

        snprintf(logBuf, sizeof(logBuf), "Gate opened: %s", reason);
        if (!_gateway.sendNotification("Gate Opened", logBuf, "normal")) {
            logKeyValue("Gate", "Notification failed (ignored).");
        }
    } else {
        snprintf(logBuf, sizeof(logBuf), "Failed to open gate: %s", reason);
        logKeyValue("Gate", logBuf);
        evt.type = EVT_ACTUATOR_ERROR;
        evt.reason = logBuf;
        emit(evt);
    }
    return success;
}

bool SessionGate::performClose(const char* reason) {
    char logBuf[MAX_LOG_LENGTH];
    snprintf(logBuf, sizeof(logBuf), "Closing gate - Reason: %s", reason);
    logKeyValue("Gate", logBuf);
    logStateChange(GATE_CLOSING);

    bool success = _gateway.close();

    bool changed;
    {
        std::lock_guard<std::mutex> lock(_stateMutex);
        if (success) {
            changed = changeStateLocked(GATE_CLOSED);
            _hasLastOpenTime = false;
            _lastOpenMillis = 0;
            _lastOpenEpoch = 0;
            // Session keeps running: a token still in range must not
            // re-open the gate until the window expires.
        } else {
            changed = changeStateLocked(GATE_UNKNOWN);
        }
    }
    if (changed) logStateChange(success ? GATE_CLOSED : GATE_UNKNOWN);

    GateEvent evt;
    if (success) {
        evt.type = EVT_GATE_CLOSED;
        evt.reason = reason;
        emit(evt);

        snprintf(logBuf, sizeof(logBuf), "Gate closed: %s", reason);
        if (!_gateway.sendNotification("Gate Closed", logBuf, "normal")) {
            logKeyValue("Gate", "Notification failed (ignored).");
        }
    } else {
        snprintf(logBuf, sizeof(logBuf), "Failed to close gate: %s", reason);
        logKeyValue("Gate", logBuf);
        evt.type = EVT_ACTUATOR_ERROR;
        evt.reason = logBuf;
        emit(evt);
    }
    return success;
}

// =================================================================================
// SECTION: AUTO-CLOSE WATCHDOG
// =================================================================================

bool SessionGate::checkAutoClose() {
    unsigned long openForSec = 0;
    {
        std::lock_guard<std::mutex> lock(_stateMutex);
        unsigned long now = _hal.getMillis();
        // Drops expired sessions and presence entries
        expireStaleLocked(now);

        if (_state != GATE_OPEN || !_hasLastOpenTime) return false;
        unsigned long openFor = elapsedMs(now, _lastOpenMillis);
        if (openFor < (unsigned long)_config.autoCloseTimeout * 1000UL) return false;
        openForSec = openFor / 1000UL;

        // Closes regardless of token presence
        changeStateLocked(GATE_CLOSING);
    }

    char durBuf[48];
    TimeUtils::formatSeconds(openForSec, durBuf, sizeof(durBuf));
    char logBuf[MAX_LOG_LENGTH];
    snprintf(logBuf, sizeof(logBuf), "Auto-closing gate (open for %s)", durBuf);
    logKeyValue("Gate", logBuf);

    performClose("auto-close timeout");
    return true;
}

// =================================================================================
// SECTION: STATUS
// =================================================================================

// Caller holds _stateMutex.
void SessionGate::fillStatusLocked(GateStatus& out) const {
    unsigned long now = _hal.getMillis();
    bool sessionOpen = sessionOpenLocked(now);

    out.state = _state;
    out.hasLastOpenTime = _hasLastOpenTime;
    out.secondsSinceOpen = _hasLastOpenTime ? (uint32_t)(elapsedMs(now, _lastOpenMillis) / 1000UL) : 0;
    out.lastOpenEpoch = _hasLastOpenTime ? _lastOpenEpoch : 0;
    out.sessionActive = sessionOpen;
    out.secondsSinceSession = sessionOpen ? (uint32_t)(elapsedMs(now, _sessionStartMillis) / 1000UL) : 0;
    out.actuatorCode = _lastActuatorCode;
    out.actuator = _lastActuatorStatus;
}

int SessionGate::queryStatus(GateStatus& out) {
    ActuatorStatus report;
    int code = _gateway.queryState(report);

    std::lock_guard<std::mutex> lock(_stateMutex);
    _lastActuatorCode = code;
    if (code == 200) {
        _lastActuatorStatus = report;
    } else {
        _lastActuatorStatus = ActuatorStatus();
    }
    fillStatusLocked(out);
    return code;
}

void SessionGate::getCachedStatus(GateStatus& out) const {
    std::lock_guard<std::mutex> lock(_stateMutex);
    fillStatusLocked(out);
}

// =================================================================================
// SECTION: STATE ACCESSORS
// =================================================================================

GateState SessionGate::getState() const {
    std::lock_guard<std::mutex> lock(_stateMutex);
    return _state;
}

bool SessionGate::hasLastOpenTime() const {
    std::lock_guard<std::mutex> lock(_stateMutex);
    return _hasLastOpenTime;
}

bool SessionGate::isSessionActive() const {
    std::lock_guard<std::mutex> lock(_stateMutex);
    return sessionOpenLocked(_hal.getMillis());
}

bool SessionGate::isTokenInRange(const std::string& id) const {
    std::string key = TokenRegistry::normalizeId(id);
    std::lock_guard<std::mutex> lock(_stateMutex);
    std::map<std::string, unsigned long>::const_iterator it = _lastSeenMillis.find(key);
    if (it == _lastSeenMillis.end()) return false;
    return elapsedMs(_hal.getMillis(), it->second) < (unsigned long)_config.tokenIdleTimeout * 1000UL;
}

// =================================================================================
// SECTION: TOKEN ADMINISTRATION
// =================================================================================

int SessionGate::registerToken(const std::string& id, const std::string& name, bool enabled) {
    int result = _registry.registerToken(id, name, enabled);
    if (result == 200) {
        GateEvent evt;
        evt.type = EVT_TOKEN_REGISTERED;
        _registry.getToken(id, evt.token);
        emit(evt);
    }
    return result;
}

int SessionGate::updateToken(const std::string& id, const std::string* name, const bool* enabled) {
    int result = _registry.updateToken(id, name, enabled);
    if (result == 200) {
        GateEvent evt;
        evt.type = EVT_TOKEN_UPDATED;
        _registry.getToken(id, evt.token);
        emit(evt);
    }
    return result;
}

int SessionGate::unregisterToken(const std::string& id) {
    Token existing;
    bool found = _registry.getToken(id, existing);

    int result = _registry.unregisterToken(id);
    if (result != 200) return result;

    {
        std::lock_guard<std::mutex> lock(_stateMutex);
        _lastSeenMillis.erase(TokenRegistry::normalizeId(id));
    }

    GateEvent evt;
    evt.type = EVT_TOKEN_UNREGISTERED;
    if (found) {
        evt.token = existing;
    } else {
        evt.token.id = TokenRegistry::normalizeId(id);
        evt.token.displayName = id;
    }
    emit(evt);
    return result;
}

std::vector<Token> SessionGate::getTokens() const { return _registry.list(); }

// =================================================================================
// SECTION: CONFIGURATION
// =================================================================================

/**
 * Unified Configuration Validator.
 * Every period must be non-zero and below its ceiling.
 */
bool SessionGate::validateConfig(const GateConfig& config, std::string& errorMsg) {
    if (config.sessionTimeout == 0 || config.sessionTimeout > MAX_WINDOW_SEC) {
        errorMsg = "sessionTimeout must be between 1 and 86400 seconds.";
        return false;
    }
    if (config.autoCloseTimeout == 0 || config.autoCloseTimeout > MAX_WINDOW_SEC) {
        errorMsg = "autoCloseTimeout must be between 1 and 86400 seconds.";
        return false;
    }
    if (config.tokenIdleTimeout == 0 || config.tokenIdleTimeout > MAX_WINDOW_SEC) {
        errorMsg = "tokenIdleTimeout must be between 1 and 86400 seconds.";
        return false;
    }
    if (config.bleScanInterval == 0 || config.bleScanInterval > MAX_PERIOD_SEC) {
        errorMsg = "bleScanInterval must be between 1 and 3600 seconds.";
        return false;
    }
    if (config.statusCheckInterval == 0 || config.statusCheckInterval > MAX_PERIOD_SEC) {
        errorMsg = "statusCheckInterval must be between 1 and 3600 seconds.";
        return false;
    }
    if (config.autoCloseCheckInterval == 0 || config.autoCloseCheckInterval > MAX_PERIOD_SEC) {
        errorMsg = "autoCloseCheckInterval must be between 1 and 3600 seconds.";
        return false;
    }
    if (config.nearbyScanDuration == 0 || config.nearbyScanDuration > MAX_NEARBY_SCAN_SEC) {
        errorMsg = "nearbyScanDuration must be between 1 and 60 seconds.";
        return false;
    }
    return true;
}

int SessionGate::applyConfig(const GateConfig& config) {
    std::string err;
    if (!validateConfig(config, err)) {
        logKeyValue("Gate", err.c_str());
        return 400;
    }

    {
        std::lock_guard<std::mutex> lock(_stateMutex);
        _config = config;
    }
    logKeyValue("Gate", "Configuration applied.");

    GateEvent evt;
    evt.type = EVT_CONFIG_UPDATED;
    evt.reason = "Configuration updated";
    emit(evt);
    return 200;
}

GateConfig SessionGate::getConfig() const {
    std::lock_guard<std::mutex> lock(_stateMutex);
    return _config;
}

// =================================================================================
// SECTION: DIAGNOSTICS
// =================================================================================

void SessionGate::printStartupDiagnostics() {
    char logBuf[128];
    char durBuf[48];
    GateConfig cfg = getConfig();
    GateStatus st;
    bool haveReport;
    {
        std::lock_guard<std::mutex> lock(_stateMutex);
        haveReport = _lastActuatorCode != 0;
    }
    // No status poll has run yet
    if (haveReport) {
        getCachedStatus(st);
    } else {
        queryStatus(st);
    }

    _hal.log("==========================================================================");
    _hal.log("                         GATE ENGINE DIAGNOSTICS                          ");
    _hal.log("==========================================================================");

    // -------------------------------------------------------------------------
    // SECTION: CURRENT STATE
    // -------------------------------------------------------------------------
    _hal.log("[ ENGINE STATE ]");

    snprintf(logBuf, sizeof(logBuf), " %-25s : %s", "Gate State", gateStateToString(st.state));
    _hal.log(logBuf);

    snprintf(logBuf, sizeof(logBuf), " %-25s : %s", "Session Active", st.sessionActive ? "YES" : "NO");
    _hal.log(logBuf);

    snprintf(logBuf, sizeof(logBuf), " %-25s : %s", "Controller",
             st.actuatorCode == 200 ? (st.actuator.online ? "ONLINE" : "OFFLINE") : "UNREACHABLE");
    _hal.log(logBuf);

    snprintf(logBuf, sizeof(logBuf), " %-25s : %u", "Registered Tokens", (unsigned)_registry.count());
    _hal.log(logBuf);

    // -------------------------------------------------------------------------
    // SECTION: TIMING
    // -------------------------------------------------------------------------
    _hal.log("");
    _hal.log("[ TIMING CONFIGURATION ]");

    TimeUtils::formatSeconds(cfg.autoCloseTimeout, durBuf, sizeof(durBuf));
    snprintf(logBuf, sizeof(logBuf), " %-25s : %s", "Auto-Close Timeout", durBuf);
    _hal.log(logBuf);

    TimeUtils::formatSeconds(cfg.sessionTimeout, durBuf, sizeof(durBuf));
    snprintf(logBuf, sizeof(logBuf), " %-25s : %s", "Session Timeout", durBuf);
    _hal.log(logBuf);

    TimeUtils::formatSeconds(cfg.tokenIdleTimeout, durBuf, sizeof(durBuf));
    snprintf(logBuf, sizeof(logBuf), " %-25s : %s", "Token Idle Timeout", durBuf);
    _hal.log(logBuf);

    snprintf(logBuf, sizeof(logBuf), " %-25s : %u s", "BLE Scan Interval", cfg.bleScanInterval);
    _hal.log(logBuf);

    snprintf(logBuf, sizeof(logBuf), " %-25s : %u s", "Status Check Interval", cfg.statusCheckInterval);
    _hal.log(logBuf);

    snprintf(logBuf, sizeof(logBuf), " %-25s : %u s", "Auto-Close Check", cfg.autoCloseCheckInterval);
    _hal.log(logBuf);
}
