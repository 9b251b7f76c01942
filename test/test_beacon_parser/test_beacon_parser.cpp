/*
 * File: test/test_beacon_parser/test_beacon_parser.cpp
 * Description: iBeacon frame decoding and RSSI based distance estimation.
 */
#include <unity.h>
#include "BeaconParser.h"
#include <string.h>

static const uint8_t FRAME[] = {
    0x02, 0x15,
    0xE2, 0xC5, 0x6D, 0xB5, 0xDF, 0xFB, 0x48, 0xD2, 0xB0, 0x60, 0xD0, 0xF5, 0xA7, 0x10, 0x96, 0xE0,
    0x01, 0x02, // major 258
    0x00, 0x2A, // minor 42
    0xC5        // tx power -59
};

void setUp(void) {}
void tearDown(void) {}

// ============================================================================
// FRAME TESTS
// ============================================================================

void test_parse_valid_frame(void) {
    BeaconFrame frame;
    TEST_ASSERT_TRUE(BeaconParser::parseIBeacon(FRAME, sizeof(FRAME), frame));
    TEST_ASSERT_EQUAL_STRING("E2C56DB5-DFFB-48D2-B060-D0F5A71096E0", frame.uuid.c_str());
    TEST_ASSERT_EQUAL_UINT16(258, frame.major);
    TEST_ASSERT_EQUAL_UINT16(42, frame.minor);
    TEST_ASSERT_EQUAL_INT8(-59, frame.txPower);
}

void test_reject_short_payload(void) {
    BeaconFrame frame;
    TEST_ASSERT_FALSE(BeaconParser::parseIBeacon(FRAME, sizeof(FRAME) - 1, frame));
    TEST_ASSERT_FALSE(BeaconParser::parseIBeacon(FRAME, 0, frame));
    TEST_ASSERT_FALSE(BeaconParser::parseIBeacon(nullptr, 23, frame));
}

void test_reject_wrong_type(void) {
    uint8_t data[sizeof(FRAME)];
    memcpy(data, FRAME, sizeof(FRAME));
    data[0] = 0x03;

    BeaconFrame frame;
    TEST_ASSERT_FALSE(BeaconParser::parseIBeacon(data, sizeof(data), frame));

    data[0] = 0x02;
    data[1] = 0x10;
    TEST_ASSERT_FALSE(BeaconParser::parseIBeacon(data, sizeof(data), frame));
}

// ============================================================================
// DISTANCE TESTS
// ============================================================================

void test_distance_at_reference_power(void) {
    TEST_ASSERT_FLOAT_WITHIN(0.001f, 1.0f, BeaconParser::estimateDistance(-59, -59));
}

void test_distance_grows_with_path_loss(void) {
    // 20 dB below reference with n = 2 is ten times the distance
    TEST_ASSERT_FLOAT_WITHIN(0.01f, 10.0f, BeaconParser::estimateDistance(-79, -59));
    TEST_ASSERT_FLOAT_WITHIN(0.01f, 0.1f, BeaconParser::estimateDistance(-39, -59));
    TEST_ASSERT_FLOAT_WITHIN(0.01f, 10.0f, BeaconParser::estimateDistance(-69, -59, 1.0f));
}

void test_distance_unknown_without_rssi(void) {
    TEST_ASSERT_EQUAL_FLOAT(DISTANCE_UNKNOWN, BeaconParser::estimateDistance(0));
}

// ============================================================================
// SIGNAL QUALITY TESTS
// ============================================================================

void test_signal_quality_buckets(void) {
    TEST_ASSERT_EQUAL_STRING("Excellent", BeaconParser::signalQuality(-45));
    TEST_ASSERT_EQUAL_STRING("Excellent", BeaconParser::signalQuality(-60));
    TEST_ASSERT_EQUAL_STRING("Good", BeaconParser::signalQuality(-61));
    TEST_ASSERT_EQUAL_STRING("Fair", BeaconParser::signalQuality(-80));
    TEST_ASSERT_EQUAL_STRING("Weak", BeaconParser::signalQuality(-90));
    TEST_ASSERT_EQUAL_STRING("Very Weak", BeaconParser::signalQuality(-91));
}

int main(void) {
    UNITY_BEGIN();

    RUN_TEST(test_parse_valid_frame);
    RUN_TEST(test_reject_short_payload);
    RUN_TEST(test_reject_wrong_type);

    RUN_TEST(test_distance_at_reference_power);
    RUN_TEST(test_distance_grows_with_path_loss);
    RUN_TEST(test_distance_unknown_without_rssi);

    RUN_TEST(test_signal_quality_buckets);

    return UNITY_END();
}
