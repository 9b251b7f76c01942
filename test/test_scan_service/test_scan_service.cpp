/*
 * File: test/test_scan_service/test_scan_service.cpp
 * Description: Matching of raw advertisements against the token registry,
 * and the full-area listing used to find new tokens.
 */
#include <unity.h>
#include <thread>
#include "ScanService.h"
#include "MockGateHAL.h"
#include "MockBleRadio.h"

static const uint8_t BEACON_UUID[16] = {
    0xE2, 0xC5, 0x6D, 0xB5, 0xDF, 0xFB, 0x48, 0xD2, 0xB0, 0x60, 0xD0, 0xF5, 0xA7, 0x10, 0x96, 0xE0
};

void setUp(void) {}
void tearDown(void) {}

// ============================================================================
// TOKEN MATCHING TESTS
// ============================================================================

void test_matches_by_address(void) {
    MockGateHAL hal;
    MockBleRadio radio;
    TokenRegistry registry(hal);
    registry.registerToken("AA:BB:CC:DD:EE:FF", "Phone");
    ScanService scanner(hal, radio, registry);

    radio.addDevice("aa:bb:cc:dd:ee:ff", "", -59);
    radio.addDevice("11:22:33:44:55:66", "Speaker", -70);

    std::vector<Observation> found;
    TEST_ASSERT_TRUE(scanner.scanOnce(5, found));
    TEST_ASSERT_EQUAL_UINT32(1, found.size());
    TEST_ASSERT_EQUAL_STRING("aabbccddeeff", found[0].tokenId.c_str());
    TEST_ASSERT_TRUE(found[0].hasRssi);
    TEST_ASSERT_FLOAT_WITHIN(0.01f, 1.0f, found[0].distance);
    TEST_ASSERT_EQUAL_UINT32(5, radio.lastDuration);
}

void test_matches_beacon_uuid_first(void) {
    MockGateHAL hal;
    MockBleRadio radio;
    TokenRegistry registry(hal);
    registry.registerToken("E2C56DB5-DFFB-48D2-B060-D0F5A71096E0", "Key Fob");
    ScanService scanner(hal, radio, registry);

    radio.addBeacon("01:02:03:04:05:06", BEACON_UUID, 1, 2, -65, -85);

    std::vector<Observation> found;
    TEST_ASSERT_TRUE(scanner.scanOnce(5, found));
    TEST_ASSERT_EQUAL_UINT32(1, found.size());
    TEST_ASSERT_EQUAL_STRING("e2c56db5dffb48d2b060d0f5a71096e0", found[0].tokenId.c_str());
    // Beacon calibrated power is used: 20 dB below -65
    TEST_ASSERT_FLOAT_WITHIN(0.05f, 10.0f, found[0].distance);
}

void test_matches_by_name(void) {
    MockGateHAL hal;
    MockBleRadio radio;
    TokenRegistry registry(hal);
    registry.registerToken("MyTag", "Tag");
    ScanService scanner(hal, radio, registry);

    radio.addDevice("10:20:30:40:50:60", "mytag", -60);

    std::vector<Observation> found;
    scanner.scanOnce(5, found);
    TEST_ASSERT_EQUAL_UINT32(1, found.size());
    TEST_ASSERT_EQUAL_STRING("mytag", found[0].tokenId.c_str());
}

void test_one_observation_per_token_strongest_wins(void) {
    MockGateHAL hal;
    MockBleRadio radio;
    TokenRegistry registry(hal);
    registry.registerToken("E2C56DB5-DFFB-48D2-B060-D0F5A71096E0", "Key Fob");
    ScanService scanner(hal, radio, registry);

    radio.addBeacon("01:02:03:04:05:06", BEACON_UUID, 1, 2, -59, -80);
    radio.addBeacon("01:02:03:04:05:06", BEACON_UUID, 1, 2, -59, -55);
    radio.addBeacon("01:02:03:04:05:06", BEACON_UUID, 1, 2, -59, -70);

    std::vector<Observation> found;
    scanner.scanOnce(5, found);
    TEST_ASSERT_EQUAL_UINT32(1, found.size());
    TEST_ASSERT_EQUAL(-55, found[0].rssi);
}

void test_no_match_returns_empty(void) {
    MockGateHAL hal;
    MockBleRadio radio;
    TokenRegistry registry(hal);
    ScanService scanner(hal, radio, registry);

    radio.addDevice("aa:bb:cc:dd:ee:ff", "Phone", -50);

    std::vector<Observation> found;
    TEST_ASSERT_TRUE(scanner.scanOnce(5, found));
    TEST_ASSERT_EQUAL_UINT32(0, found.size());
}

void test_radio_failure_is_reported(void) {
    MockGateHAL hal;
    MockBleRadio radio;
    radio.fail = true;
    TokenRegistry registry(hal);
    ScanService scanner(hal, radio, registry);

    std::vector<Observation> found;
    TEST_ASSERT_FALSE(scanner.scanOnce(5, found));
    TEST_ASSERT_FALSE(scanner.isScanning());
    TEST_ASSERT_TRUE(hal.hasLogContaining("BLE scan error"));
}

void test_candidate_priority(void) {
    RawSighting s;
    s.address = "aa:bb";
    s.name = "Tag";
    BeaconFrame frame;
    frame.uuid = "E2C56DB5-DFFB-48D2-B060-D0F5A71096E0";

    std::vector<std::string> ids;
    ScanService::candidateIds(s, &frame, ids);
    TEST_ASSERT_EQUAL_UINT32(3, ids.size());
    TEST_ASSERT_EQUAL_STRING("E2C56DB5-DFFB-48D2-B060-D0F5A71096E0", ids[0].c_str());
    TEST_ASSERT_EQUAL_STRING("aa:bb", ids[1].c_str());
    TEST_ASSERT_EQUAL_STRING("Tag", ids[2].c_str());

    s.name = "";
    ScanService::candidateIds(s, nullptr, ids);
    TEST_ASSERT_EQUAL_UINT32(1, ids.size());
}

// ============================================================================
// NEARBY LISTING TESTS
// ============================================================================

void test_nearby_sorted_by_signal(void) {
    MockGateHAL hal;
    MockBleRadio radio;
    TokenRegistry registry(hal);
    ScanService scanner(hal, radio, registry);

    radio.addDevice("aa:aa:aa:aa:aa:aa", "", -90);
    radio.addBeacon("bb:bb:bb:bb:bb:bb", BEACON_UUID, 7, 8, -59, -50);
    radio.addDevice("cc:cc:cc:cc:cc:cc", "Watch", -70);

    std::vector<NearbyDevice> devices;
    TEST_ASSERT_TRUE(scanner.listNearby(10, devices));
    TEST_ASSERT_EQUAL_UINT32(3, devices.size());

    TEST_ASSERT_EQUAL(DEVICE_BEACON, devices[0].kind);
    TEST_ASSERT_EQUAL_STRING("iBeacon", devices[0].name.c_str());
    TEST_ASSERT_EQUAL_UINT16(7, devices[0].beacon.major);

    TEST_ASSERT_EQUAL_STRING("Watch", devices[1].name.c_str());
    TEST_ASSERT_EQUAL(DEVICE_GENERIC, devices[2].kind);
    TEST_ASSERT_EQUAL_STRING("Unknown", devices[2].name.c_str());
    TEST_ASSERT_TRUE(hal.hasLogContaining("Found 3 BLE devices (1 iBeacons)"));
}

void test_nearby_one_entry_per_address(void) {
    MockGateHAL hal;
    MockBleRadio radio;
    TokenRegistry registry(hal);
    ScanService scanner(hal, radio, registry);

    radio.addDevice("aa:aa:aa:aa:aa:aa", "Watch", -80);
    radio.addDevice("aa:aa:aa:aa:aa:aa", "Watch", -60);

    std::vector<NearbyDevice> devices;
    scanner.listNearby(10, devices);
    TEST_ASSERT_EQUAL_UINT32(1, devices.size());
    TEST_ASSERT_EQUAL(-60, devices[0].rssi);
}

void test_non_apple_payload_is_not_beacon(void) {
    MockGateHAL hal;
    MockBleRadio radio;
    TokenRegistry registry(hal);
    ScanService scanner(hal, radio, registry);

    radio.addBeacon("bb:bb:bb:bb:bb:bb", BEACON_UUID, 7, 8, -59, -50);
    radio.sightings[0].companyId = 0x0059;

    std::vector<NearbyDevice> devices;
    scanner.listNearby(10, devices);
    TEST_ASSERT_EQUAL(DEVICE_GENERIC, devices[0].kind);
}

// ============================================================================
// SCAN LOCK TESTS
// ============================================================================

void test_loop_scan_and_nearby_scan_never_overlap(void) {
    MockGateHAL hal;
    MockBleRadio radio;
    radio.collectDelayMs = 20;
    TokenRegistry registry(hal);
    registry.registerToken("aa:bb:cc:dd:ee:ff", "Phone");
    ScanService scanner(hal, radio, registry);
    radio.addDevice("aa:bb:cc:dd:ee:ff", "", -59);

    bool loopOk = true;
    bool nearbyOk = true;
    std::thread scanLoop([&] {
        for (int i = 0; i < 5; i++) {
            std::vector<Observation> found;
            if (!scanner.scanOnce(1, found) || found.size() != 1) loopOk = false;
        }
    });
    std::thread nearby([&] {
        for (int i = 0; i < 5; i++) {
            std::vector<NearbyDevice> devices;
            if (!scanner.listNearby(1, devices) || devices.size() != 1) nearbyOk = false;
        }
    });
    scanLoop.join();
    nearby.join();

    TEST_ASSERT_TRUE(loopOk);
    TEST_ASSERT_TRUE(nearbyOk);
    TEST_ASSERT_EQUAL(10, radio.collectCalls);
    TEST_ASSERT_EQUAL(1, radio.maxActiveCollects.load());
    TEST_ASSERT_FALSE(scanner.isScanning());
}

int main(void) {
    UNITY_BEGIN();

    RUN_TEST(test_matches_by_address);
    RUN_TEST(test_matches_beacon_uuid_first);
    RUN_TEST(test_matches_by_name);
    RUN_TEST(test_one_observation_per_token_strongest_wins);
    RUN_TEST(test_no_match_returns_empty);
    RUN_TEST(test_radio_failure_is_reported);
    RUN_TEST(test_candidate_priority);

    RUN_TEST(test_nearby_sorted_by_signal);
    RUN_TEST(test_nearby_one_entry_per_address);
    RUN_TEST(test_non_apple_payload_is_not_beacon);

    RUN_TEST(test_loop_scan_and_nearby_scan_never_overlap);

    return UNITY_END();
}
