/*
 * =================================================================================
 * File:      lib/GateEngine/GateContext.h
 * Description: Abstraction layer (HAL) for Time, Storage, and Logging.
 * =================================================================================
 */
#pragma once
#include <vector>

#include "Types.h"

class IGateHAL {
public:
    virtual ~IGateHAL() {}

    // --- Storage ---
    // Persists the complete token list. Returns false if the write failed.
    virtual bool saveTokens(const std::vector<Token>& tokens) = 0;

    // --- Logging ---
    virtual void log(const char* message) = 0;

    // --- Time ---
    // Monotonic milliseconds since boot. Used for all timeouts.
    virtual unsigned long getMillis() = 0;

    // Wall-clock seconds since the Unix epoch, or 0 if not yet synchronized.
    // Only used for activity timestamps.
    virtual uint32_t getEpochSeconds() = 0;
};

// Subscriber for state changes emitted by SessionGate.
class IGateEventListener {
public:
    virtual ~IGateEventListener() {}
    virtual void onGateEvent(const GateEvent& event) = 0;
};
