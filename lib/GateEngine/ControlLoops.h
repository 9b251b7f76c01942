/*
 * =================================================================================
 * Project:   BeaconGate - BLE Gate Automation Controller
 * File:      lib/GateEngine/ControlLoops.h
 *
 * SPDX-License-Identifier: Apache-2.0
 *
 * Description:
 * Bodies of the three periodic control loops (scan, status poll, auto-close)
 * and the shared running flag. The platform layer owns the threads: it calls
 * a cycle, sleeps for the returned number of seconds in short slices, and
 * exits as soon as isRunning() turns false.
 * =================================================================================
 */
#pragma once
#include <atomic>

#include "GateContext.h"
#include "ScanService.h"
#include "SessionGate.h"

class ControlLoops {
public:
    ControlLoops(IGateHAL& hal, SessionGate& gate, ScanService& scanner);

    // --- Lifecycle ---
    void start();
    void stop();
    bool isRunning() const { return _running; }

    // --- Cycles (each returns the sleep before the next run, in seconds) ---
    uint32_t runScanCycle();
    uint32_t runStatusCycle();
    uint32_t runAutoCloseCycle();

    // --- Counters (diagnostics) ---
    uint32_t getScanFailures() const { return _scanFailures; }
    uint32_t getStatusFailures() const { return _statusFailures; }

private:
    IGateHAL& _hal;
    SessionGate& _gate;
    ScanService& _scanner;

    std::atomic<bool> _running;
    std::atomic<uint32_t> _scanFailures;
    std::atomic<uint32_t> _statusFailures;

    void logKeyValue(const char* key, const char* value);
};
