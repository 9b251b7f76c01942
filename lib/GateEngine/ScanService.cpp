/*
 * =================================================================================
 * Project:   BeaconGate - BLE Gate Automation Controller
 * File:      lib/GateEngine/ScanService.cpp
 *
 * Description:
 * Scan serialization, token matching and per-batch deduplication.
 * =================================================================================
 */
#include <stdio.h>
#include <algorithm>

#include "BeaconParser.h"
#include "ScanService.h"

ScanService::ScanService(IGateHAL& hal, IBleRadio& radio, const TokenRegistry& registry)
    : _hal(hal), _radio(radio), _registry(registry), _scanning(false) {}

void ScanService::logKeyValue(const char* key, const char* value) {
    char tempBuf[MAX_LOG_LENGTH];
    snprintf(tempBuf, sizeof(tempBuf), " %-8s : %s", key, value);
    _hal.log(tempBuf);
}

void ScanService::candidateIds(const RawSighting& sighting, const BeaconFrame* beacon, std::vector<std::string>& out) {
    out.clear();
    if (beacon != nullptr && !beacon->uuid.empty()) out.push_back(beacon->uuid);
    if (!sighting.address.empty()) out.push_back(sighting.address);
    if (!sighting.name.empty()) out.push_back(sighting.name);
}

// Caller holds _scanMutex.
bool ScanService::collectLocked(uint32_t durationSeconds, std::vector<RawSighting>& out) {
    out.clear();
    _scanning = true;
    bool ok = _radio.collect(durationSeconds, out);
    _scanning = false;

    if (!ok) {
        logKeyValue("Scan", "BLE scan error (radio).");
    }
    return ok;
}

// =================================================================================
// SECTION: TOKEN SCAN
// =================================================================================

bool ScanService::scanOnce(uint32_t durationSeconds, std::vector<Observation>& out) {
    out.clear();

    std::vector<RawSighting> sightings;
    {
        std::lock_guard<std::mutex> lock(_scanMutex);
        if (!collectLocked(durationSeconds, sightings)) return false;
    }

    std::vector<std::string> ids;
    for (size_t i = 0; i < sightings.size(); i++) {
        const RawSighting& s = sightings[i];

        BeaconFrame frame;
        bool isBeacon = (s.companyId == APPLE_COMPANY_ID) &&
                        BeaconParser::parseIBeacon((const uint8_t*)s.manufacturerData.data(), s.manufacturerData.size(), frame);

        candidateIds(s, isBeacon ? &frame : nullptr, ids);

        Token token;
        bool matched = false;
        for (size_t k = 0; k < ids.size() && !matched; k++) {
            matched = _registry.getToken(ids[k], token);
        }
        if (!matched) continue;

        int txPower = BEACON_DEFAULT_TX_POWER;
        if (isBeacon) txPower = frame.txPower;
        else if (s.hasTxPower) txPower = s.txPower;

        Observation obs;
        obs.tokenId = token.id;
        obs.hasRssi = (s.rssi != 0);
        obs.rssi = s.rssi;
        obs.distance = BeaconParser::estimateDistance(s.rssi, txPower);

        // Keep the strongest reading per token
        bool merged = false;
        for (size_t k = 0; k < out.size(); k++) {
            if (out[k].tokenId != obs.tokenId) continue;
            merged = true;
            if (obs.hasRssi && (!out[k].hasRssi || obs.rssi > out[k].rssi)) {
                out[k] = obs;
            }
            break;
        }
        if (!merged) out.push_back(obs);
    }

    if (!out.empty()) {
        char logBuf[64];
        snprintf(logBuf, sizeof(logBuf), "Detected %u registered token(s)", (unsigned)out.size());
        logKeyValue("Scan", logBuf);
    }
    return true;
}

// =================================================================================
// SECTION: NEARBY SCAN (Registration Tooling)
// =================================================================================

bool ScanService::listNearby(uint32_t durationSeconds, std::vector<NearbyDevice>& out) {
    out.clear();

    std::vector<RawSighting> sightings;
    {
        std::lock_guard<std::mutex> lock(_scanMutex);
        if (!collectLocked(durationSeconds, sightings)) return false;
    }

    size_t beacons = 0;
    for (size_t i = 0; i < sightings.size(); i++) {
        const RawSighting& s = sightings[i];

        NearbyDevice dev;
        dev.address = s.address;
        dev.rssi = s.rssi;

        int txPower = s.hasTxPower ? s.txPower : BEACON_DEFAULT_TX_POWER;
        if (s.companyId == APPLE_COMPANY_ID &&
            BeaconParser::parseIBeacon((const uint8_t*)s.manufacturerData.data(), s.manufacturerData.size(), dev.beacon)) {
            dev.kind = DEVICE_BEACON;
            dev.name = s.name.empty() ? "iBeacon" : s.name;
            txPower = dev.beacon.txPower;
        } else {
            dev.kind = DEVICE_GENERIC;
            dev.name = s.name.empty() ? "Unknown" : s.name;
        }
        dev.distance = BeaconParser::estimateDistance(s.rssi, txPower);

        // One entry per address
        bool merged = false;
        for (size_t k = 0; k < out.size(); k++) {
            if (out[k].address != dev.address) continue;
            merged = true;
            if (dev.rssi > out[k].rssi) out[k] = dev;
            break;
        }
        if (!merged) out.push_back(dev);
    }

    std::stable_sort(out.begin(), out.end(), [](const NearbyDevice& a, const NearbyDevice& b) { return a.rssi > b.rssi; });

    for (size_t i = 0; i < out.size(); i++) {
        if (out[i].kind == DEVICE_BEACON) beacons++;
    }

    char logBuf[80];
    snprintf(logBuf, sizeof(logBuf), "Found %u BLE devices (%u iBeacons)", (unsigned)out.size(), (unsigned)beacons);
    logKeyValue("Scan", logBuf);
    return true;
}
