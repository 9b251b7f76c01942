/*
 * =================================================================================
 * Project:   BeaconGate - BLE Gate Automation Controller
 * File:      lib/GateEngine/SessionGate.h
 *
 * SPDX-License-Identifier: Apache-2.0
 *
 * Description:
 * Header for the SessionGate decision engine.
 *
 * DESIGN NOTES:
 * 1. Decoupled from the ESP32 via IGateHAL (time, storage, logging).
 * 2. Decoupled from the controller via IActuatorGateway.
 * 3. All state transitions go through changeStateLocked().
 * 4. _stateMutex guards state, timestamps and config. It is never held
 *    across actuator I/O, HAL logging or event delivery.
 * 5. Commands claim GATE_OPENING / GATE_CLOSING under the lock, call the
 *    gateway unlocked, then re-lock to commit. While a command is in flight
 *    observations return at once and further commands are refused.
 * 6. Sessions and presence entries are dropped once their window has been
 *    seen to expire, so a 32-bit millis wrap cannot revive them.
 * =================================================================================
 */
#pragma once
#include <map>
#include <mutex>
#include <string>
#include <vector>

#include "ActuatorGateway.h"
#include "GateContext.h"
#include "TokenRegistry.h"
#include "Types.h"

class SessionGate {
public:
    SessionGate(IGateHAL& hal,
                IActuatorGateway& gateway,
                TokenRegistry& registry,
                const GateConfig& config);

    // --- Event Subscribers ---
    void subscribe(IGateEventListener* listener);

    // --- Decision Engine ---
    void handleObservation(const Observation& obs);
    bool requestOpen(const char* reason);
    bool requestClose(const char* reason);

    // Auto-close watchdog body. Returns true if a close was issued.
    bool checkAutoClose();

    // Live query through the gateway. Returns the gateway code (200 / 503).
    // Never changes the locally tracked GateState.
    int queryStatus(GateStatus& out);

    // Local state plus the last actuator report. No I/O.
    void getCachedStatus(GateStatus& out) const;

    // --- Token Administration (delegates to TokenRegistry, emits events) ---
    int registerToken(const std::string& id, const std::string& name, bool enabled = true);
    int updateToken(const std::string& id, const std::string* name, const bool* enabled);
    int unregisterToken(const std::string& id);
    std::vector<Token> getTokens() const;

    // --- Configuration ---
    int applyConfig(const GateConfig& config);
    GateConfig getConfig() const;
    static bool validateConfig(const GateConfig& config, std::string& errorMsg);

    // --- State Accessors (Read-Only) ---
    GateState getState() const;
    bool hasLastOpenTime() const;
    bool isSessionActive() const;
    bool isTokenInRange(const std::string& id) const;

    void postInfo(const std::string& message);
    void printStartupDiagnostics();

private:
    // --- Dependencies ---
    IGateHAL& _hal;
    IActuatorGateway& _gateway;
    TokenRegistry& _registry;

    // --- Synchronization ---
    mutable std::mutex _stateMutex;
    mutable std::mutex _listenerMutex;

    // --- Configuration ---
    GateConfig _config;

    // --- Dynamic State ---
    GateState _state;

    bool _hasLastOpenTime;
    unsigned long _lastOpenMillis;
    uint32_t _lastOpenEpoch;

    bool _hasSession;
    unsigned long _sessionStartMillis;

    std::map<std::string, unsigned long> _lastSeenMillis;

    int _lastActuatorCode;
    ActuatorStatus _lastActuatorStatus;

    std::vector<IGateEventListener*> _listeners;

    // =========================================================================
    // SECTION: STATE TRANSITION SYSTEM
    // =========================================================================

    // Returns true if the state actually changed. Caller logs it unlocked.
    bool changeStateLocked(GateState newState);
    void logStateChange(GateState newState);

    // Caller must already have claimed GATE_OPENING / GATE_CLOSING
    bool performOpen(const char* reason, const Token* token);
    bool performClose(const char* reason);

    bool isCommandInFlightLocked() const { return _state == GATE_OPENING || _state == GATE_CLOSING; }
    void expireStaleLocked(unsigned long now);

    // =========================================================================
    // SECTION: HELPERS
    // =========================================================================

    void emit(const GateEvent& event);
    void fillStatusLocked(GateStatus& out) const;
    bool sessionOpenLocked(unsigned long now) const;
    // Device millis are 32-bit; elapsed time is computed with the same width.
    static unsigned long elapsedMs(unsigned long now, unsigned long since) { return (uint32_t)((uint32_t)now - (uint32_t)since); }

    void logKeyValue(const char* key, const char* value);
};
