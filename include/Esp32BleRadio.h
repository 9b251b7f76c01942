/*
 * =================================================================================
 * File:      include/Esp32BleRadio.h
 * Description: IBleRadio over the ESP32 Bluedroid BLEScan (active scan).
 * =================================================================================
 */
#pragma once
#include <BLEDevice.h>
#include <BLEScan.h>

#include "ScanService.h"

class Esp32BleRadio : public IBleRadio {
public:
    Esp32BleRadio();

    // Must run once after BLEDevice::init()
    void begin();

    bool collect(uint32_t durationSeconds, std::vector<RawSighting>& out) override;

private:
    BLEScan* _scan;
};
