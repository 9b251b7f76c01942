/*
 * File: test/test_web_validation/test_web_validation.cpp
 * Description: Unit tests for WebValidators input validation.
 * Verifies credential lengths, token request bodies, gate config merging
 * and activity query parameters.
 */
#include <unity.h>
#include <string.h>
#include <ArduinoJson.h>
#include "WebValidators.h"
#include "Types.h"

void setUp(void) {}
void tearDown(void) {}

// ============================================================================
// WIFI VALIDATION TESTS
// ============================================================================

void test_wifi_valid_credentials(void) {
    std::string err;
    bool res = WebValidators::validateWifiCredentials("MyNetwork", "MyPassword123", err);
    TEST_ASSERT_TRUE_MESSAGE(res, "Should accept valid credentials");
    TEST_ASSERT_EQUAL_STRING("", err.c_str());
}

void test_wifi_ssid_empty(void) {
    std::string err;
    bool res = WebValidators::validateWifiCredentials("", "pass", err);
    TEST_ASSERT_FALSE_MESSAGE(res, "Should reject empty SSID");
    TEST_ASSERT_EQUAL_STRING("SSID cannot be empty.", err.c_str());
}

void test_wifi_ssid_too_long(void) {
    std::string err;
    // 33 chars
    const char* longSsid = "123456789012345678901234567890123";
    bool res = WebValidators::validateWifiCredentials(longSsid, "pass", err);

    TEST_ASSERT_FALSE_MESSAGE(res, "Should reject SSID > 32 chars");
    TEST_ASSERT_EQUAL_STRING("SSID too long (max 32 chars).", err.c_str());
}

void test_wifi_pass_empty_allowed(void) {
    std::string err;
    // Empty password is valid for Open networks
    bool res = WebValidators::validateWifiCredentials("OpenNetwork", "", err);
    TEST_ASSERT_TRUE(res);
}

void test_controller_settings_required(void) {
    std::string err;
    TEST_ASSERT_TRUE(WebValidators::validateControllerSettings("192.168.1.20", "owner@example.com", "secret", err));

    TEST_ASSERT_FALSE(WebValidators::validateControllerSettings("", "owner@example.com", "secret", err));
    TEST_ASSERT_EQUAL_STRING("Controller host cannot be empty.", err.c_str());

    TEST_ASSERT_FALSE(WebValidators::validateControllerSettings("192.168.1.20", "owner@example.com", "", err));
    TEST_ASSERT_EQUAL_STRING("Controller password cannot be empty.", err.c_str());
}

// ============================================================================
// TOKEN REQUEST TESTS
// ============================================================================

void test_token_request_defaults_enabled(void) {
    JsonDocument doc;
    doc["id"] = "AA:BB:CC:DD:EE:FF";
    doc["name"] = "Phone";

    Token t;
    std::string err;
    TEST_ASSERT_TRUE(WebValidators::parseTokenRequest(doc, t, err));
    TEST_ASSERT_EQUAL_STRING("AA:BB:CC:DD:EE:FF", t.id.c_str());
    TEST_ASSERT_EQUAL_STRING("Phone", t.displayName.c_str());
    TEST_ASSERT_TRUE(t.enabled);
}

void test_token_request_missing_fields(void) {
    JsonDocument doc;
    doc["id"] = "aa:bb";

    Token t;
    std::string err;
    TEST_ASSERT_FALSE(WebValidators::parseTokenRequest(doc, t, err));
    TEST_ASSERT_EQUAL_STRING("Missing required fields: id, name.", err.c_str());
}

void test_token_request_rejects_separator_only_id(void) {
    JsonDocument doc;
    doc["id"] = "::";
    doc["name"] = "Phone";

    Token t;
    std::string err;
    TEST_ASSERT_FALSE(WebValidators::parseTokenRequest(doc, t, err));
    TEST_ASSERT_EQUAL_STRING("Token id cannot be empty.", err.c_str());
}

void test_token_request_enabled_must_be_bool(void) {
    JsonDocument doc;
    doc["id"] = "aa:bb";
    doc["name"] = "Phone";
    doc["enabled"] = "yes";

    Token t;
    std::string err;
    TEST_ASSERT_FALSE(WebValidators::parseTokenRequest(doc, t, err));
    TEST_ASSERT_EQUAL_STRING("enabled must be a boolean.", err.c_str());
}

void test_token_update_partial(void) {
    JsonDocument doc;
    doc["enabled"] = false;

    TokenUpdate upd;
    std::string err;
    TEST_ASSERT_TRUE(WebValidators::parseTokenUpdate(doc, upd, err));
    TEST_ASSERT_FALSE(upd.hasName);
    TEST_ASSERT_TRUE(upd.hasEnabled);
    TEST_ASSERT_FALSE(upd.enabled);
}

void test_token_update_empty_body(void) {
    JsonDocument doc;
    doc["other"] = 1;

    TokenUpdate upd;
    std::string err;
    TEST_ASSERT_FALSE(WebValidators::parseTokenUpdate(doc, upd, err));
    TEST_ASSERT_EQUAL_STRING("Nothing to update (expected name and/or enabled).", err.c_str());
}

// ============================================================================
// GATE CONFIG PARSING TESTS
// ============================================================================

void test_gate_config_merges_with_base(void) {
    JsonDocument doc;
    doc["autoCloseTimeout"] = 120;
    doc["sessionTimeout"] = 90;

    GateConfig base;
    GateConfig out;
    std::string err;
    TEST_ASSERT_TRUE(WebValidators::parseGateConfig(doc, base, out, err));
    TEST_ASSERT_EQUAL_UINT32(120, out.autoCloseTimeout);
    TEST_ASSERT_EQUAL_UINT32(90, out.sessionTimeout);
    TEST_ASSERT_EQUAL_UINT32(base.bleScanInterval, out.bleScanInterval);
    TEST_ASSERT_EQUAL_UINT32(base.statusCheckInterval, out.statusCheckInterval);
}

void test_gate_config_rejects_negative(void) {
    JsonDocument doc;
    doc["bleScanInterval"] = -5;

    GateConfig out;
    std::string err;
    TEST_ASSERT_FALSE(WebValidators::parseGateConfig(doc, GateConfig(), out, err));
    TEST_ASSERT_EQUAL_STRING("bleScanInterval must be a non-negative integer.", err.c_str());
}

void test_gate_config_rejects_zero(void) {
    JsonDocument doc;
    doc["autoCloseTimeout"] = 0;

    GateConfig out;
    std::string err;
    TEST_ASSERT_FALSE(WebValidators::parseGateConfig(doc, GateConfig(), out, err));
    TEST_ASSERT_EQUAL_STRING("autoCloseTimeout must be between 1 and 86400 seconds.", err.c_str());
}

void test_gate_config_requires_known_field(void) {
    JsonDocument doc;
    doc["unknown"] = 10;

    GateConfig out;
    std::string err;
    TEST_ASSERT_FALSE(WebValidators::parseGateConfig(doc, GateConfig(), out, err));
    TEST_ASSERT_EQUAL_STRING("No recognized configuration fields.", err.c_str());
}

// ============================================================================
// ACTIVITY TESTS
// ============================================================================

void test_activity_mode_values(void) {
    JsonDocument doc;
    ActivityMode mode = ACTIVITY_SUPPRESS;
    std::string err;

    doc["mode"] = "extended";
    TEST_ASSERT_TRUE(WebValidators::parseActivityMode(doc, mode, err));
    TEST_ASSERT_EQUAL(ACTIVITY_EXTENDED, mode);

    doc["mode"] = "verbose";
    TEST_ASSERT_FALSE(WebValidators::parseActivityMode(doc, mode, err));
    TEST_ASSERT_EQUAL_STRING("Invalid mode: 'verbose' (expected suppress or extended).", err.c_str());
}

void test_activity_query_parsing(void) {
    size_t limit = 0;
    bool hasType = false;
    ActivityType type = ACT_INFO;
    std::string err;

    TEST_ASSERT_TRUE(WebValidators::parseActivityQuery(nullptr, nullptr, limit, hasType, type, err));
    TEST_ASSERT_EQUAL_UINT32(0, limit);
    TEST_ASSERT_FALSE(hasType);

    TEST_ASSERT_TRUE(WebValidators::parseActivityQuery("25", "gate_opened", limit, hasType, type, err));
    TEST_ASSERT_EQUAL_UINT32(25, limit);
    TEST_ASSERT_TRUE(hasType);
    TEST_ASSERT_EQUAL(ACT_GATE_OPENED, type);

    // Capped page size
    TEST_ASSERT_TRUE(WebValidators::parseActivityQuery("50000", nullptr, limit, hasType, type, err));
    TEST_ASSERT_EQUAL_UINT32(1000, limit);
}

void test_activity_query_rejects_bad_input(void) {
    size_t limit = 0;
    bool hasType = false;
    ActivityType type = ACT_INFO;
    std::string err;

    TEST_ASSERT_FALSE(WebValidators::parseActivityQuery("ten", nullptr, limit, hasType, type, err));
    TEST_ASSERT_EQUAL_STRING("limit must be a non-negative integer.", err.c_str());

    TEST_ASSERT_FALSE(WebValidators::parseActivityQuery(nullptr, "door_opened", limit, hasType, type, err));
    TEST_ASSERT_EQUAL_STRING("Unknown activity type: door_opened", err.c_str());
}

int main(void) {
    UNITY_BEGIN();

    RUN_TEST(test_wifi_valid_credentials);
    RUN_TEST(test_wifi_ssid_empty);
    RUN_TEST(test_wifi_ssid_too_long);
    RUN_TEST(test_wifi_pass_empty_allowed);
    RUN_TEST(test_controller_settings_required);

    RUN_TEST(test_token_request_defaults_enabled);
    RUN_TEST(test_token_request_missing_fields);
    RUN_TEST(test_token_request_rejects_separator_only_id);
    RUN_TEST(test_token_request_enabled_must_be_bool);
    RUN_TEST(test_token_update_partial);
    RUN_TEST(test_token_update_empty_body);

    RUN_TEST(test_gate_config_merges_with_base);
    RUN_TEST(test_gate_config_rejects_negative);
    RUN_TEST(test_gate_config_rejects_zero);
    RUN_TEST(test_gate_config_requires_known_field);

    RUN_TEST(test_activity_mode_values);
    RUN_TEST(test_activity_query_parsing);
    RUN_TEST(test_activity_query_rejects_bad_input);

    return UNITY_END();
}
