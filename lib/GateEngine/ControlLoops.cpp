/*
 * =================================================================================
 * Project:   BeaconGate - BLE Gate Automation Controller
 * File:      lib/GateEngine/ControlLoops.cpp
 *
 * Description:
 * Loop bodies. A failing scan or status query is logged and the loop keeps
 * going; nothing here is fatal.
 * =================================================================================
 */
#include <stdio.h>
#include <vector>

#include "ControlLoops.h"

ControlLoops::ControlLoops(IGateHAL& hal, SessionGate& gate, ScanService& scanner)
    : _hal(hal), _gate(gate), _scanner(scanner), _running(false), _scanFailures(0), _statusFailures(0) {}

void ControlLoops::logKeyValue(const char* key, const char* value) {
    char tempBuf[MAX_LOG_LENGTH];
    snprintf(tempBuf, sizeof(tempBuf), " %-8s : %s", key, value);
    _hal.log(tempBuf);
}

void ControlLoops::start() {
    _running = true;
    logKeyValue("Loops", "Control loops RUNNING");
}

void ControlLoops::stop() {
    _running = false;
    logKeyValue("Loops", "Stop requested. Loops exit at next wake-up.");
}

// =================================================================================
// SECTION: CYCLES
// =================================================================================

uint32_t ControlLoops::runScanCycle() {
    GateConfig cfg = _gate.getConfig();

    std::vector<Observation> detected;
    if (!_scanner.scanOnce(cfg.bleScanInterval, detected)) {
        _scanFailures++;
        logKeyValue("Loops", "Error in BLE scan loop. Retrying after interval.");
        return cfg.bleScanInterval;
    }

    for (size_t i = 0; i < detected.size(); i++) {
        if (!_running) break;
        _gate.handleObservation(detected[i]);
    }
    return cfg.bleScanInterval;
}

uint32_t ControlLoops::runStatusCycle() {
    GateStatus status;
    int code = _gate.queryStatus(status);

    if (code != 200) {
        _statusFailures++;
        char logBuf[64];
        snprintf(logBuf, sizeof(logBuf), "Status check failed (code %d)", code);
        logKeyValue("Loops", logBuf);
    }
    return _gate.getConfig().statusCheckInterval;
}

uint32_t ControlLoops::runAutoCloseCycle() {
    _gate.checkAutoClose();
    return _gate.getConfig().autoCloseCheckInterval;
}
