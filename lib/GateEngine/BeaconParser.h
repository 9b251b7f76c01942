/*
 * =================================================================================
 * Project:   BeaconGate - BLE Gate Automation Controller
 * File:      lib/GateEngine/BeaconParser.h
 *
 * SPDX-License-Identifier: Apache-2.0
 *
 * Description:
 * iBeacon advertisement decoding and RSSI based proximity helpers.
 *
 * iBeacon manufacturer payload (after the 0x004C company id):
 *   [0] 0x02 type  [1] 0x15 length  [2..17] UUID  [18..19] major (BE)
 *   [20..21] minor (BE)  [22] measured tx power at 1 m (signed dBm)
 * =================================================================================
 */
#pragma once
#include <stddef.h>
#include <stdint.h>

#include "Types.h"

#define APPLE_COMPANY_ID 0x004C
#define IBEACON_TYPE 0x02
#define IBEACON_LENGTH 0x15
#define IBEACON_MIN_PAYLOAD 23

class BeaconParser {
public:
    /**
     * Decodes an iBeacon frame from the manufacturer payload (company id
     * already stripped). Returns false if the payload is not an iBeacon.
     */
    static bool parseIBeacon(const uint8_t* data, size_t len, BeaconFrame& out);

    /**
     * Log-distance path loss model:
     *   distance = 10 ^ ((txPower - rssi) / (10 * n))
     * Returns DISTANCE_UNKNOWN when rssi is 0 (not available).
     */
    static float estimateDistance(int rssi, int txPower = BEACON_DEFAULT_TX_POWER,
                                  float pathLossExponent = BEACON_PATH_LOSS_EXPONENT);

    // Excellent / Good / Fair / Weak / Very Weak
    static const char* signalQuality(int rssi);
};
