/*
 * File: test/test_config_codec/test_config_codec.cpp
 * Description: JSON encoding of the stored token list and of API objects.
 */
#include <unity.h>
#include <ArduinoJson.h>
#include "ConfigCodec.h"

void setUp(void) {}
void tearDown(void) {}

// ============================================================================
// TOKEN LIST TESTS
// ============================================================================

void test_token_list_restores_fields(void) {
    std::vector<Token> tokens(2);
    tokens[0].id = "aabbccddeeff";
    tokens[0].displayName = "Phone";
    tokens[1].id = "e2c56db5dffb48d2b060d0f5a71096e0";
    tokens[1].displayName = "Key Fob";
    tokens[1].enabled = false;

    std::string json;
    ConfigCodec::serializeTokens(tokens, json);

    std::vector<Token> loaded;
    std::string err;
    TEST_ASSERT_TRUE(ConfigCodec::deserializeTokens(json, loaded, err));
    TEST_ASSERT_EQUAL_UINT32(2, loaded.size());
    TEST_ASSERT_EQUAL_STRING("Key Fob", loaded[1].displayName.c_str());
    TEST_ASSERT_FALSE(loaded[1].enabled);
    TEST_ASSERT_TRUE(loaded[0].enabled);
}

void test_token_list_empty_storage(void) {
    std::vector<Token> loaded;
    std::string err;
    TEST_ASSERT_TRUE(ConfigCodec::deserializeTokens("", loaded, err));
    TEST_ASSERT_EQUAL_UINT32(0, loaded.size());
}

void test_token_list_defaults(void) {
    std::vector<Token> loaded;
    std::string err;
    TEST_ASSERT_TRUE(ConfigCodec::deserializeTokens("[{\"id\":\"aabb\"},{\"name\":\"orphan\"}]", loaded, err));
    TEST_ASSERT_EQUAL_UINT32(1, loaded.size());
    TEST_ASSERT_EQUAL_STRING("aabb", loaded[0].displayName.c_str());
    TEST_ASSERT_TRUE(loaded[0].enabled);
}

void test_token_list_rejects_corrupt_data(void) {
    std::vector<Token> loaded;
    std::string err;
    TEST_ASSERT_FALSE(ConfigCodec::deserializeTokens("{\"id\":\"aabb\"}", loaded, err));
    TEST_ASSERT_EQUAL_STRING("Token list is not an array.", err.c_str());

    TEST_ASSERT_FALSE(ConfigCodec::deserializeTokens("[{\"id\":", loaded, err));
    TEST_ASSERT_TRUE(err.find("Token list JSON error: ") == 0);
}

// ============================================================================
// API OBJECT TESTS
// ============================================================================

void test_status_without_open_time(void) {
    GateStatus status;
    status.state = GATE_CLOSED;
    status.actuatorCode = 503;

    JsonDocument doc;
    ConfigCodec::writeGateStatus(status, doc.to<JsonObject>());

    TEST_ASSERT_EQUAL_STRING("closed", doc["state"].as<const char*>());
    TEST_ASSERT_TRUE(doc["lastOpenTime"].isNull());
    TEST_ASSERT_FALSE(doc["sessionActive"].as<bool>());
    TEST_ASSERT_FALSE(doc["secondsSinceSession"].is<uint32_t>());
    TEST_ASSERT_EQUAL(503, doc["actuator"]["code"].as<int>());
}

void test_status_with_open_time(void) {
    GateStatus status;
    status.state = GATE_OPEN;
    status.hasLastOpenTime = true;
    status.lastOpenEpoch = 1700000000;
    status.secondsSinceOpen = 12;
    status.sessionActive = true;
    status.secondsSinceSession = 12;

    JsonDocument doc;
    ConfigCodec::writeGateStatus(status, doc.to<JsonObject>());

    TEST_ASSERT_EQUAL_STRING("2023-11-14T22:13:20Z", doc["lastOpenTime"].as<const char*>());
    TEST_ASSERT_EQUAL_UINT32(12, doc["secondsSinceOpen"].as<uint32_t>());
    TEST_ASSERT_EQUAL_UINT32(12, doc["secondsSinceSession"].as<uint32_t>());
}

void test_activity_entry_details(void) {
    ActivityEntry entry;
    entry.seq = 7;
    entry.type = ACT_TOKEN_DETECTED;
    entry.message = "Token detected: Phone";
    entry.tokenId = "aabb";
    entry.tokenName = "Phone";
    entry.hasRssi = true;
    entry.rssi = -62;
    entry.distance = 1.2345f;
    entry.updateCount = 3;

    JsonDocument doc;
    ConfigCodec::writeActivityEntry(entry, doc.to<JsonObject>());

    TEST_ASSERT_EQUAL_STRING("unsynced", doc["timestamp"].as<const char*>());
    TEST_ASSERT_EQUAL_STRING("token_detected", doc["type"].as<const char*>());
    TEST_ASSERT_EQUAL_UINT32(3, doc["updateCount"].as<uint32_t>());
    TEST_ASSERT_EQUAL(-62, doc["details"]["rssi"].as<int>());
    TEST_ASSERT_FLOAT_WITHIN(0.001f, 1.23f, doc["details"]["distance"].as<float>());
}

void test_activity_entry_without_token(void) {
    ActivityEntry entry;
    entry.type = ACT_INFO;
    entry.message = "Gate controller started";

    JsonDocument doc;
    ConfigCodec::writeActivityEntry(entry, doc.to<JsonObject>());
    TEST_ASSERT_TRUE(doc["details"].isNull());
}

void test_nearby_beacon_fields(void) {
    NearbyDevice dev;
    dev.kind = DEVICE_BEACON;
    dev.address = "aa:bb:cc:dd:ee:ff";
    dev.name = "iBeacon";
    dev.rssi = -70;
    dev.distance = DISTANCE_UNKNOWN;
    dev.beacon.uuid = "E2C56DB5-DFFB-48D2-B060-D0F5A71096E0";
    dev.beacon.major = 1;
    dev.beacon.minor = 2;

    JsonDocument doc;
    ConfigCodec::writeNearbyDevice(dev, doc.to<JsonObject>());
    TEST_ASSERT_EQUAL_STRING("beacon", doc["type"].as<const char*>());
    TEST_ASSERT_TRUE(doc["distance"].isNull());
    TEST_ASSERT_EQUAL_STRING("E2C56DB5-DFFB-48D2-B060-D0F5A71096E0", doc["uuid"].as<const char*>());
    TEST_ASSERT_EQUAL(-59, doc["txPower"].as<int>());
}

void test_event_names(void) {
    TEST_ASSERT_EQUAL_STRING("gate_opened", ConfigCodec::eventName(EVT_GATE_OPENED));
    TEST_ASSERT_EQUAL_STRING("error", ConfigCodec::eventName(EVT_ACTUATOR_ERROR));
    TEST_ASSERT_EQUAL_STRING("token_unregistered", ConfigCodec::eventName(EVT_TOKEN_UNREGISTERED));

    GateEvent evt;
    evt.type = EVT_GATE_CLOSED;
    evt.reason = "auto-close timeout";

    JsonDocument doc;
    ConfigCodec::writeGateEvent(evt, doc.to<JsonObject>());
    TEST_ASSERT_EQUAL_STRING("gate_closed", doc["event"].as<const char*>());
    TEST_ASSERT_EQUAL_STRING("auto-close timeout", doc["reason"].as<const char*>());
    TEST_ASSERT_TRUE(doc["tokenId"].isNull());
}

int main(void) {
    UNITY_BEGIN();

    RUN_TEST(test_token_list_restores_fields);
    RUN_TEST(test_token_list_empty_storage);
    RUN_TEST(test_token_list_defaults);
    RUN_TEST(test_token_list_rejects_corrupt_data);

    RUN_TEST(test_status_without_open_time);
    RUN_TEST(test_status_with_open_time);
    RUN_TEST(test_activity_entry_details);
    RUN_TEST(test_activity_entry_without_token);
    RUN_TEST(test_nearby_beacon_fields);
    RUN_TEST(test_event_names);

    return UNITY_END();
}
