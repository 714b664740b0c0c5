/**
 * @file test_hub_identify.cpp
 * @brief Unit tests for hub_identify - Advertisement classification
 */

#include <unity.h>
#include "hub_identify.h"

// Include source files directly for native testing
#include "../../src/types.cpp"
#include "../../src/hub_identify.cpp"

// =============================================================================
// HELPERS
// =============================================================================

static BleAdvertisement lpf2Advertisement(uint8_t deviceType) {
    BleAdvertisement adv;
    adv.setName("Hub");
    adv.addService(lpf2HubServiceUuid());
    const uint8_t data[] = { 0x00, deviceType, 0x06, 0x00, 0x61, 0x00 };
    adv.addManufacturerData(LEGO_COMPANY_ID, data, sizeof(data));
    return adv;
}

// =============================================================================
// TEST FIXTURES
// =============================================================================

void setUp(void) {
}

void tearDown(void) {
}

// =============================================================================
// UUID CONSTANT TESTS
// =============================================================================

void test_uuid_constants_parse(void) {
    BleUuid expected;
    BleUuid::fromString("00001623-1212-efde-1623-785feabcd123", expected);
    TEST_ASSERT_TRUE(lpf2HubServiceUuid() == expected);

    BleUuid::fromString("00001524-1212-efde-1623-785feabcd123", expected);
    TEST_ASSERT_TRUE(lpf2CharacteristicUuid() != expected);
}

void test_uuid_constants_distinct(void) {
    TEST_ASSERT_TRUE(lpf2HubServiceUuid() != wedo2SmartHubServiceUuid());
    TEST_ASSERT_TRUE(lpf2HubServiceUuid() != lpf2CharacteristicUuid());
}

// =============================================================================
// DEVICE TYPE TABLE TESTS
// =============================================================================

void test_hubKindFromDeviceType_all_codes(void) {
    HubKind kind;
    TEST_ASSERT_TRUE(hubKindFromDeviceType(32, kind));
    TEST_ASSERT_EQUAL(HubKind::DUPLO_TRAIN_BASE, kind);
    TEST_ASSERT_TRUE(hubKindFromDeviceType(64, kind));
    TEST_ASSERT_EQUAL(HubKind::MOVE_HUB, kind);
    TEST_ASSERT_TRUE(hubKindFromDeviceType(65, kind));
    TEST_ASSERT_EQUAL(HubKind::HUB, kind);
    TEST_ASSERT_TRUE(hubKindFromDeviceType(66, kind));
    TEST_ASSERT_EQUAL(HubKind::REMOTE_CONTROL, kind);
    TEST_ASSERT_TRUE(hubKindFromDeviceType(67, kind));
    TEST_ASSERT_EQUAL(HubKind::MARIO, kind);
    TEST_ASSERT_TRUE(hubKindFromDeviceType(128, kind));
    TEST_ASSERT_EQUAL(HubKind::TECHNIC_MEDIUM_HUB, kind);
}

void test_hubKindFromDeviceType_unknown_code(void) {
    HubKind kind = HubKind::UNKNOWN;
    TEST_ASSERT_FALSE(hubKindFromDeviceType(0x99, kind));
    TEST_ASSERT_EQUAL(HubKind::UNKNOWN, kind);
}

// =============================================================================
// IDENTIFICATION TESTS
// =============================================================================

void test_identifyHub_technic(void) {
    HubKind kind = HubKind::UNKNOWN;
    TEST_ASSERT_TRUE(identifyHub(lpf2Advertisement(0x80), kind));
    TEST_ASSERT_EQUAL(HubKind::TECHNIC_MEDIUM_HUB, kind);
}

void test_identifyHub_city_hub(void) {
    HubKind kind = HubKind::UNKNOWN;
    TEST_ASSERT_TRUE(identifyHub(lpf2Advertisement(65), kind));
    TEST_ASSERT_EQUAL(HubKind::HUB, kind);
}

void test_identifyHub_wedo2_by_service_alone(void) {
    BleAdvertisement adv;
    adv.addService(wedo2SmartHubServiceUuid());

    HubKind kind = HubKind::UNKNOWN;
    TEST_ASSERT_TRUE(identifyHub(adv, kind));
    TEST_ASSERT_EQUAL(HubKind::WEDO2_SMART_HUB, kind);
}

void test_identifyHub_wedo2_takes_precedence(void) {
    BleAdvertisement adv = lpf2Advertisement(0x80);
    adv.addService(wedo2SmartHubServiceUuid());

    HubKind kind = HubKind::UNKNOWN;
    TEST_ASSERT_TRUE(identifyHub(adv, kind));
    TEST_ASSERT_EQUAL(HubKind::WEDO2_SMART_HUB, kind);
}

void test_identifyHub_lego_data_without_service(void) {
    BleAdvertisement adv;
    const uint8_t data[] = { 0x00, 0x80, 0x06, 0x00 };
    adv.addManufacturerData(LEGO_COMPANY_ID, data, sizeof(data));

    HubKind kind = HubKind::UNKNOWN;
    TEST_ASSERT_FALSE(identifyHub(adv, kind));
    TEST_ASSERT_EQUAL(HubKind::UNKNOWN, kind);
}

void test_identifyHub_service_without_manufacturer_data(void) {
    BleAdvertisement adv;
    adv.addService(lpf2HubServiceUuid());

    HubKind kind = HubKind::UNKNOWN;
    TEST_ASSERT_FALSE(identifyHub(adv, kind));
}

void test_identifyHub_other_company_id(void) {
    BleAdvertisement adv;
    adv.addService(lpf2HubServiceUuid());
    const uint8_t data[] = { 0x00, 0x80 };
    adv.addManufacturerData(0x004C, data, sizeof(data));

    HubKind kind = HubKind::UNKNOWN;
    TEST_ASSERT_FALSE(identifyHub(adv, kind));
}

void test_identifyHub_payload_too_short(void) {
    BleAdvertisement adv;
    adv.addService(lpf2HubServiceUuid());
    const uint8_t data[] = { 0x00 };
    adv.addManufacturerData(LEGO_COMPANY_ID, data, sizeof(data));

    HubKind kind = HubKind::UNKNOWN;
    TEST_ASSERT_FALSE(identifyHub(adv, kind));
}

void test_identifyHub_unknown_device_type(void) {
    HubKind kind = HubKind::UNKNOWN;
    TEST_ASSERT_FALSE(identifyHub(lpf2Advertisement(0x99), kind));
    TEST_ASSERT_EQUAL(HubKind::UNKNOWN, kind);
}

void test_identifyHub_empty_advertisement(void) {
    BleAdvertisement adv;
    HubKind kind = HubKind::UNKNOWN;
    TEST_ASSERT_FALSE(identifyHub(adv, kind));
}

// =============================================================================
// ADVERTISEMENT TESTS
// =============================================================================

void test_BleAdvertisement_addManufacturerData_replaces(void) {
    BleAdvertisement adv;
    const uint8_t first[] = { 0x00, 0x40 };
    const uint8_t second[] = { 0x00, 0x80 };
    adv.addManufacturerData(LEGO_COMPANY_ID, first, sizeof(first));
    adv.addManufacturerData(LEGO_COMPANY_ID, second, sizeof(second));

    TEST_ASSERT_EQUAL(1, adv.manufacturerCount);
    TEST_ASSERT_EQUAL_HEX8(0x80, adv.findManufacturer(LEGO_COMPANY_ID)->data[1]);
}

void test_BleAdvertisement_addService_deduplicates(void) {
    BleAdvertisement adv;
    adv.addService(lpf2HubServiceUuid());
    adv.addService(lpf2HubServiceUuid());
    TEST_ASSERT_EQUAL(1, adv.serviceCount);
}

// =============================================================================
// TEST RUNNER
// =============================================================================

int main(int argc, char **argv) {
    UNITY_BEGIN();

    // UUID Constant Tests
    RUN_TEST(test_uuid_constants_parse);
    RUN_TEST(test_uuid_constants_distinct);

    // Device Type Table Tests
    RUN_TEST(test_hubKindFromDeviceType_all_codes);
    RUN_TEST(test_hubKindFromDeviceType_unknown_code);

    // Identification Tests
    RUN_TEST(test_identifyHub_technic);
    RUN_TEST(test_identifyHub_city_hub);
    RUN_TEST(test_identifyHub_wedo2_by_service_alone);
    RUN_TEST(test_identifyHub_wedo2_takes_precedence);
    RUN_TEST(test_identifyHub_lego_data_without_service);
    RUN_TEST(test_identifyHub_service_without_manufacturer_data);
    RUN_TEST(test_identifyHub_other_company_id);
    RUN_TEST(test_identifyHub_payload_too_short);
    RUN_TEST(test_identifyHub_unknown_device_type);
    RUN_TEST(test_identifyHub_empty_advertisement);

    // Advertisement Tests
    RUN_TEST(test_BleAdvertisement_addManufacturerData_replaces);
    RUN_TEST(test_BleAdvertisement_addService_deduplicates);

    return UNITY_END();
}
