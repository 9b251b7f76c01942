/*
 * =================================================================================
 * Project:   BeaconGate - BLE Gate Automation Controller
 * File:      src/Esp32BleRadio.cpp
 *
 * SPDX-License-Identifier: Apache-2.0
 *
 * Description:
 * Blocking active scan. Converts every advertised device into a RawSighting;
 * matching and iBeacon decoding happen in ScanService.
 * =================================================================================
 */
#include "Esp32BleRadio.h"
#include <BLEAdvertisedDevice.h>

#include "Esp32GateHAL.h"

Esp32BleRadio::Esp32BleRadio() : _scan(NULL) {}

void Esp32BleRadio::begin() {
  _scan = BLEDevice::getScan();
  if (_scan == NULL) {
    Esp32GateHAL::getInstance().logKeyValue("Scan", "CRITICAL: BLEScan unavailable.");
    return;
  }
  _scan->setActiveScan(true); // Scan responses carry the device name
  _scan->setInterval(100);
  _scan->setWindow(99); // Must be less than or equal to interval
}

bool Esp32BleRadio::collect(uint32_t durationSeconds, std::vector<RawSighting> &out) {
  out.clear();
  if (_scan == NULL)
    return false;

  BLEScanResults results = _scan->start(durationSeconds, false);
  int count = results.getCount();

  for (int i = 0; i < count; i++) {
    BLEAdvertisedDevice dev = results.getDevice(i);

    RawSighting s;
    s.address = dev.getAddress().toString();
    if (dev.haveName())
      s.name = dev.getName();
    s.rssi = dev.haveRSSI() ? dev.getRSSI() : 0;
    if (dev.haveTXPower()) {
      s.hasTxPower = true;
      s.txPower = dev.getTXPower();
    }

    if (dev.haveManufacturerData()) {
      std::string mfg = dev.getManufacturerData();
      if (mfg.size() >= 2) {
        // Company id is little-endian on air
        s.companyId = (uint16_t)((uint8_t)mfg[0] | ((uint8_t)mfg[1] << 8));
        s.manufacturerData = mfg.substr(2);
      }
    }
    out.push_back(s);
  }

  _scan->clearResults(); // Free the result cache
  return true;
}
