/*
 * File: test/test_token_registry/test_token_registry.cpp
 * Description: Registration, update and removal of authorized tokens.
 * Covers identifier normalization, distinct failure codes and persistence.
 */
#include <unity.h>
#include "TokenRegistry.h"
#include "MockGateHAL.h"

void setUp(void) {}
void tearDown(void) {}

// ============================================================================
// NORMALIZATION TESTS
// ============================================================================

void test_normalize_strips_separators_and_lowercases(void) {
    TEST_ASSERT_EQUAL_STRING("aabbccddeeff", TokenRegistry::normalizeId("AA:BB:CC:DD:EE:FF").c_str());
    TEST_ASSERT_EQUAL_STRING("e2c56db5dffb48d2", TokenRegistry::normalizeId("E2C56DB5-DFFB-48D2").c_str());
    TEST_ASSERT_EQUAL_STRING("myphone", TokenRegistry::normalizeId("My_Phone").c_str());
}

void test_lookup_ignores_formatting(void) {
    MockGateHAL hal;
    TokenRegistry registry(hal);
    TEST_ASSERT_EQUAL(200, registry.registerToken("aa:bb:cc:dd:ee:ff", "Phone"));

    Token t;
    TEST_ASSERT_TRUE(registry.getToken("AA-BB-CC-DD-EE-FF", t));
    TEST_ASSERT_EQUAL_STRING("aabbccddeeff", t.id.c_str());
    TEST_ASSERT_EQUAL_STRING("Phone", t.displayName.c_str());
    TEST_ASSERT_TRUE(t.enabled);
}

// ============================================================================
// MUTATION TESTS
// ============================================================================

void test_register_duplicate_is_conflict(void) {
    MockGateHAL hal;
    TokenRegistry registry(hal);
    TEST_ASSERT_EQUAL(200, registry.registerToken("aa:bb:cc:dd:ee:ff", "Phone"));
    TEST_ASSERT_EQUAL(409, registry.registerToken("AABBCCDDEEFF", "Other"));
    TEST_ASSERT_EQUAL_UINT32(1, registry.count());

    Token t;
    registry.getToken("aabbccddeeff", t);
    TEST_ASSERT_EQUAL_STRING("Phone", t.displayName.c_str());
}

void test_register_rejects_empty_fields(void) {
    MockGateHAL hal;
    TokenRegistry registry(hal);
    TEST_ASSERT_EQUAL(400, registry.registerToken("", "Phone"));
    TEST_ASSERT_EQUAL(400, registry.registerToken("::--", "Phone"));
    TEST_ASSERT_EQUAL(400, registry.registerToken("aa:bb", ""));
    TEST_ASSERT_EQUAL_UINT32(0, registry.count());
    TEST_ASSERT_EQUAL(0, hal.saveCount);
}

void test_update_partial_fields(void) {
    MockGateHAL hal;
    TokenRegistry registry(hal);
    registry.registerToken("aa:bb", "Phone");

    bool paused = false;
    TEST_ASSERT_EQUAL(200, registry.updateToken("AA:BB", nullptr, &paused));

    Token t;
    registry.getToken("aabb", t);
    TEST_ASSERT_FALSE(t.enabled);
    TEST_ASSERT_EQUAL_STRING("Phone", t.displayName.c_str());

    std::string rename = "Car Key";
    TEST_ASSERT_EQUAL(200, registry.updateToken("aabb", &rename, nullptr));
    registry.getToken("aabb", t);
    TEST_ASSERT_EQUAL_STRING("Car Key", t.displayName.c_str());
    TEST_ASSERT_FALSE(t.enabled);
}

void test_update_unknown_is_not_found(void) {
    MockGateHAL hal;
    TokenRegistry registry(hal);
    bool enabled = true;
    TEST_ASSERT_EQUAL(404, registry.updateToken("missing", nullptr, &enabled));
}

void test_unregister_round_trip(void) {
    MockGateHAL hal;
    TokenRegistry registry(hal);
    registry.registerToken("aa:bb:cc:dd:ee:ff", "Phone");

    TEST_ASSERT_EQUAL(200, registry.unregisterToken("aa:bb:cc:dd:ee:ff"));
    Token t;
    TEST_ASSERT_FALSE(registry.getToken("aa:bb:cc:dd:ee:ff", t));
    TEST_ASSERT_EQUAL(404, registry.unregisterToken("aa:bb:cc:dd:ee:ff"));
}

// ============================================================================
// PERSISTENCE TESTS
// ============================================================================

void test_every_mutation_persists_full_list(void) {
    MockGateHAL hal;
    TokenRegistry registry(hal);
    registry.registerToken("aa", "A");
    registry.registerToken("bb", "B");
    TEST_ASSERT_EQUAL(2, hal.saveCount);
    TEST_ASSERT_EQUAL_UINT32(2, hal.savedTokens.size());

    registry.unregisterToken("aa");
    TEST_ASSERT_EQUAL(3, hal.saveCount);
    TEST_ASSERT_EQUAL_UINT32(1, hal.savedTokens.size());
    TEST_ASSERT_EQUAL_STRING("bb", hal.savedTokens[0].id.c_str());
}

void test_persist_failure_is_logged_but_kept_in_memory(void) {
    MockGateHAL hal;
    hal.failSave = true;
    TokenRegistry registry(hal);

    TEST_ASSERT_EQUAL(200, registry.registerToken("aa", "A"));
    TEST_ASSERT_EQUAL_UINT32(1, registry.count());
    TEST_ASSERT_TRUE(hal.hasLogContaining("could not be persisted"));
}

void test_load_skips_duplicates_and_does_not_persist(void) {
    MockGateHAL hal;
    TokenRegistry registry(hal);

    std::vector<Token> stored(3);
    stored[0].id = "AA:BB";
    stored[0].displayName = "First";
    stored[1].id = "aabb";
    stored[1].displayName = "Second";
    stored[2].id = "cc";
    stored[2].displayName = "Third";
    stored[2].enabled = false;

    registry.loadTokens(stored);
    TEST_ASSERT_EQUAL_UINT32(2, registry.count());
    TEST_ASSERT_EQUAL(0, hal.saveCount);

    std::vector<Token> list = registry.list();
    TEST_ASSERT_EQUAL_STRING("First", list[0].displayName.c_str());
    TEST_ASSERT_EQUAL_STRING("cc", list[1].id.c_str());
    TEST_ASSERT_FALSE(list[1].enabled);
}

int main(void) {
    UNITY_BEGIN();

    RUN_TEST(test_normalize_strips_separators_and_lowercases);
    RUN_TEST(test_lookup_ignores_formatting);

    RUN_TEST(test_register_duplicate_is_conflict);
    RUN_TEST(test_register_rejects_empty_fields);
    RUN_TEST(test_update_partial_fields);
    RUN_TEST(test_update_unknown_is_not_found);
    RUN_TEST(test_unregister_round_trip);

    RUN_TEST(test_every_mutation_persists_full_list);
    RUN_TEST(test_persist_failure_is_logged_but_kept_in_memory);
    RUN_TEST(test_load_skips_duplicates_and_does_not_persist);

    return UNITY_END();
}
