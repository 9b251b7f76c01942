/*
 * =================================================================================
 * Project:   BeaconGate - BLE Gate Automation Controller
 * File:      lib/GateEngine/BeaconParser.cpp
 * =================================================================================
 */
#include <math.h>
#include <stdio.h>

#include "BeaconParser.h"

bool BeaconParser::parseIBeacon(const uint8_t* data, size_t len, BeaconFrame& out) {
    if (data == nullptr || len < IBEACON_MIN_PAYLOAD) return false;
    if (data[0] != IBEACON_TYPE || data[1] != IBEACON_LENGTH) return false;

    // UUID: bytes 2..17 as 8-4-4-4-12 uppercase hex
    char uuidBuf[37];
    int offset = 0;
    for (int i = 0; i < 16; i++) {
        if (i == 4 || i == 6 || i == 8 || i == 10) {
            uuidBuf[offset++] = '-';
        }
        offset += snprintf(uuidBuf + offset, sizeof(uuidBuf) - offset, "%02X", data[2 + i]);
    }
    uuidBuf[36] = '\0';

    out.uuid = uuidBuf;
    out.major = (uint16_t)((data[18] << 8) | data[19]);
    out.minor = (uint16_t)((data[20] << 8) | data[21]);
    out.txPower = (int8_t)data[22];
    return true;
}

float BeaconParser::estimateDistance(int rssi, int txPower, float pathLossExponent) {
    if (rssi == 0) return DISTANCE_UNKNOWN;
    if (pathLossExponent <= 0.0f) pathLossExponent = BEACON_PATH_LOSS_EXPONENT;
    return powf(10.0f, (float)(txPower - rssi) / (10.0f * pathLossExponent));
}

const char* BeaconParser::signalQuality(int rssi) {
    if (rssi >= -60) return "Excellent";
    if (rssi >= -70) return "Good";
    if (rssi >= -80) return "Fair";
    if (rssi >= -90) return "Weak";
    return "Very Weak";
}
