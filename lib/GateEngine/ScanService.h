/*
 * =================================================================================
 * Project:   BeaconGate - BLE Gate Automation Controller
 * File:      lib/GateEngine/ScanService.h
 *
 * SPDX-License-Identifier: Apache-2.0
 *
 * Description:
 * Turns raw BLE advertisements into token observations.
 * - Owns the scan lock: only one physical radio scan is in flight, whether
 *   it comes from the periodic loop or from a manual request.
 * - Matches sightings against the registry (beacon UUID, MAC, device name).
 * - Collapses duplicates within a batch, keeping the strongest reading.
 * =================================================================================
 */
#pragma once
#include <atomic>
#include <mutex>
#include <string>
#include <vector>

#include "GateContext.h"
#include "TokenRegistry.h"
#include "Types.h"

class IBleRadio {
public:
    virtual ~IBleRadio() {}

    // Performs one blocking scan of 'durationSeconds'.
    // Returns false if the radio failed; 'out' is then unspecified.
    virtual bool collect(uint32_t durationSeconds, std::vector<RawSighting>& out) = 0;
};

class ScanService {
public:
    ScanService(IGateHAL& hal, IBleRadio& radio, const TokenRegistry& registry);

    // Registered tokens seen during the scan, one entry per token.
    // Returns false on radio failure.
    bool scanOnce(uint32_t durationSeconds, std::vector<Observation>& out);

    // Every visible device, strongest first, tagged beacon/device.
    bool listNearby(uint32_t durationSeconds, std::vector<NearbyDevice>& out);

    bool isScanning() const { return _scanning; }

    // Candidate identifiers in matching priority order.
    static void candidateIds(const RawSighting& sighting, const BeaconFrame* beacon, std::vector<std::string>& out);

private:
    IGateHAL& _hal;
    IBleRadio& _radio;
    const TokenRegistry& _registry;

    std::mutex _scanMutex;
    std::atomic<bool> _scanning;

    bool collectLocked(uint32_t durationSeconds, std::vector<RawSighting>& out);
    void logKeyValue(const char* key, const char* value);
};
