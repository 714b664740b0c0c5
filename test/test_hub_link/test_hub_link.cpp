/**
 * @file test_hub_link.cpp
 * @brief Unit tests for HubLink - Adapter selection, wait-for-hub, and connect-with-retry
 */

#include <unity.h>
#include <thread>
#include "hub_link.h"
#include "fake_ble_central.h"

// Include source files directly for native testing
#include "../../src/types.cpp"
#include "../../src/hub_identify.cpp"
#include "../../src/lpf2_protocol.cpp"
#include "../../src/adapter_service.cpp"
#include "../../src/connection_manager.cpp"
#include "../../src/discovery_listener.cpp"
#include "../../src/hub.cpp"
#include "../../src/device.cpp"
#include "../../src/hub_controller.cpp"
#include "../../src/hub_registry.cpp"
#include "../../src/hub_link.cpp"

// =============================================================================
// TEST FIXTURES
// =============================================================================

static FakeCentral* central = nullptr;
static FakeManager* bleManager = nullptr;
static HubLink* hubLink = nullptr;

static const char* TECHNIC_ADDRESS = "90:84:2B:01:A2:FF";
static const char* CITY_ADDRESS = "90:84:2B:60:3C:B8";

void setUp(void) {
    mockResetTime();
    mockClearResetCount();
    central = new FakeCentral("nrf0");
    bleManager = new FakeManager();
    bleManager->addAdapter(central);
    hubLink = new HubLink();
}

void tearDown(void) {
    delete hubLink;
    delete bleManager;
    delete central;
    hubLink = nullptr;
    bleManager = nullptr;
    central = nullptr;
}

/**
 * @brief Announce a hub from another thread once the caller is blocked waiting
 */
static std::thread announceLater(const char* address, const char* name, ManufacturerDeviceType type) {
    BleAddress parsed = makeAddress(address);
    BleAdvertisement advertisement = makeHubAdvertisement(name, type);
    return std::thread([parsed, advertisement]() {
        vTaskDelay(pdMS_TO_TICKS(50));
        central->injectDiscovered(parsed, advertisement);
    });
}

/**
 * @brief Peripheral the adapter knows about, not yet announced
 */
static FakePeripheral* addTechnicHub() {
    FakePeripheral* peripheral = central->addPeripheral(makeAddress(TECHNIC_ADDRESS));
    peripheral->setAdvertisement(makeHubAdvertisement("Technic Hub", ManufacturerDeviceType::TECHNIC_MEDIUM_HUB));
    return peripheral;
}

static DiscoveredHub technicHub() {
    return DiscoveredHub(HubKind::TECHNIC_MEDIUM_HUB, makeAddress(TECHNIC_ADDRESS), "Technic Hub");
}

// =============================================================================
// ADAPTER / LIFECYCLE TESTS
// =============================================================================

void test_HubLink_listAdapters(void) {
    FakeCentral second("nrf1");
    bleManager->addAdapter(&second);

    const char* names[4];
    TEST_ASSERT_EQUAL(2, HubLink::listAdapters(bleManager, names, 4));
    TEST_ASSERT_EQUAL_STRING("nrf0", names[0]);
    TEST_ASSERT_EQUAL_STRING("nrf1", names[1]);
    TEST_ASSERT_EQUAL(0, HubLink::listAdapters(nullptr, names, 4));
}

void test_HubLink_begin_starts_scanning(void) {
    TEST_ASSERT_EQUAL(Result::OK, hubLink->begin(bleManager, 0));
    TEST_ASSERT_TRUE(hubLink->isRunning());
    TEST_ASSERT_TRUE(central->isScanning());
    TEST_ASSERT_EQUAL_PTR(central, hubLink->getAdapter());
    TEST_ASSERT_EQUAL(Result::ERROR_BUSY, hubLink->begin(bleManager, 0));
}

void test_HubLink_begin_bad_index(void) {
    TEST_ASSERT_EQUAL(Result::ERROR_ADAPTER_UNAVAILABLE, hubLink->begin(bleManager, 1));
    TEST_ASSERT_EQUAL(Result::ERROR_ADAPTER_UNAVAILABLE, hubLink->begin(nullptr, 0));
    TEST_ASSERT_FALSE(hubLink->isRunning());
}

void test_HubLink_begin_adapter_failure(void) {
    central->setBeginOk(false);
    TEST_ASSERT_EQUAL(Result::ERROR_ADAPTER_UNAVAILABLE, hubLink->begin(bleManager, 0));
    TEST_ASSERT_FALSE(hubLink->isRunning());
}

void test_HubLink_begin_scan_failure(void) {
    central->setScanOk(false);
    TEST_ASSERT_EQUAL(Result::ERROR_ADAPTER_UNAVAILABLE, hubLink->begin(bleManager, 0));
    TEST_ASSERT_FALSE(hubLink->isRunning());
}

void test_HubLink_stop_disconnects_hubs(void) {
    FakePeripheral* peripheral = addTechnicHub();
    hubLink->begin(bleManager, 0);

    HubController controller;
    TEST_ASSERT_TRUE(hubLink->createHub(technicHub(), controller).isOk());

    hubLink->stop();
    TEST_ASSERT_FALSE(hubLink->isRunning());
    TEST_ASSERT_FALSE(central->isScanning());
    TEST_ASSERT_EQUAL(1, peripheral->disconnectCount());

    DiscoveredHub hub;
    TEST_ASSERT_EQUAL(Result::ERROR_CHANNEL_CLOSED, hubLink->waitForHubTimeout(100, hub).code);
    TEST_ASSERT_EQUAL(0, mockResetCount());
}

// =============================================================================
// WAIT FOR HUB TESTS
// =============================================================================

void test_HubLink_waitForHub_returns_announced_hub(void) {
    hubLink->begin(bleManager, 0);
    std::thread announcer = announceLater(TECHNIC_ADDRESS, "Technic Hub",
                                          ManufacturerDeviceType::TECHNIC_MEDIUM_HUB);

    DiscoveredHub hub;
    Status status = hubLink->waitForHub(hub);
    announcer.join();

    TEST_ASSERT_TRUE(status.isOk());
    TEST_ASSERT_EQUAL(HubKind::TECHNIC_MEDIUM_HUB, hub.kind);
    TEST_ASSERT_EQUAL_STRING("Technic Hub", hub.name);
    TEST_ASSERT_TRUE(hub.address == makeAddress(TECHNIC_ADDRESS));
}

void test_HubLink_waitForHubFilter_skips_other_hubs(void) {
    hubLink->begin(bleManager, 0);
    std::thread first = announceLater(TECHNIC_ADDRESS, "Technic Hub",
                                      ManufacturerDeviceType::TECHNIC_MEDIUM_HUB);
    std::thread second = std::thread([]() {
        vTaskDelay(pdMS_TO_TICKS(150));
        central->injectDiscovered(makeAddress(CITY_ADDRESS),
                                  makeHubAdvertisement("City Hub", ManufacturerDeviceType::HUB));
    });

    DiscoveredHub hub;
    Status status = hubLink->waitForHubFilterTimeout(HubFilter::byName("City Hub"), 2000, hub);
    first.join();
    second.join();

    TEST_ASSERT_TRUE(status.isOk());
    TEST_ASSERT_EQUAL(HubKind::HUB, hub.kind);
    TEST_ASSERT_EQUAL_STRING("City Hub", hub.name);
}

void test_HubLink_waitForHub_timeout_retracts_wait(void) {
    hubLink->begin(bleManager, 0);

    DiscoveredHub hub;
    Status status = hubLink->waitForHubTimeout(50, hub);
    TEST_ASSERT_EQUAL(Result::ERROR_TIMEOUT, status.code);
    TEST_ASSERT_EQUAL_STRING("Timeout reached after 50 ms", status.message);

    // Round trip so the cancellation has been processed
    DiscoveredHubList list;
    hubLink->discoveredHubs(list);
    TEST_ASSERT_EQUAL(0, hubLink->connectionManager().pendingWaitCount());
}

void test_HubLink_filter_timeout_ignores_non_matching(void) {
    hubLink->begin(bleManager, 0);
    std::thread announcer = announceLater(TECHNIC_ADDRESS, "Technic Hub",
                                          ManufacturerDeviceType::TECHNIC_MEDIUM_HUB);

    DiscoveredHub hub;
    Status status = hubLink->waitForHubFilterTimeout(HubFilter::byAddress(CITY_ADDRESS), 200, hub);
    announcer.join();

    TEST_ASSERT_EQUAL(Result::ERROR_TIMEOUT, status.code);

    DiscoveredHubList list;
    TEST_ASSERT_TRUE(hubLink->discoveredHubs(list).isOk());
    TEST_ASSERT_EQUAL(1, list.count);
}

void test_HubLink_unnamed_device_never_satisfies_wait(void) {
    hubLink->begin(bleManager, 0);
    std::thread announcer = announceLater(TECHNIC_ADDRESS, nullptr,
                                          ManufacturerDeviceType::TECHNIC_MEDIUM_HUB);

    DiscoveredHub hub;
    TEST_ASSERT_EQUAL(Result::ERROR_TIMEOUT, hubLink->waitForHubTimeout(200, hub).code);
    announcer.join();
}

// =============================================================================
// CONNECT WITH RETRY TESTS
// =============================================================================

void test_HubLink_createHub_first_attempt(void) {
    FakePeripheral* peripheral = addTechnicHub();
    hubLink->begin(bleManager, 0);

    HubController controller;
    TEST_ASSERT_TRUE(hubLink->createHub(technicHub(), controller).isOk());
    TEST_ASSERT_EQUAL(HubKind::TECHNIC_MEDIUM_HUB, controller.getKind());
    TEST_ASSERT_EQUAL(1, peripheral->connectAttempts());
    TEST_ASSERT_EQUAL(0, millis());
}

void test_HubLink_createHub_succeeds_after_failures(void) {
    FakePeripheral* peripheral = addTechnicHub();
    peripheral->setConnectFailures(2);
    hubLink->begin(bleManager, 0);

    HubController controller;
    TEST_ASSERT_TRUE(hubLink->createHub(technicHub(), controller).isOk());
    TEST_ASSERT_EQUAL(3, peripheral->connectAttempts());
    TEST_ASSERT_EQUAL(2 * CONNECT_RETRY_DELAY_MS, millis());
}

void test_HubLink_createHub_retries_exhausted(void) {
    FakePeripheral* peripheral = addTechnicHub();
    peripheral->setConnectAlwaysFails(true);
    hubLink->begin(bleManager, 0);

    HubController controller;
    Status status = hubLink->createHub(technicHub(), controller);
    TEST_ASSERT_EQUAL(Result::ERROR_RETRIES_EXHAUSTED, status.code);
    TEST_ASSERT_EQUAL_STRING("Unable to connect to 90:84:2B:01:A2:FF after 10 tries", status.message);
    TEST_ASSERT_EQUAL(CONNECT_RETRY_COUNT, peripheral->connectAttempts());

    // No pause after the final attempt
    TEST_ASSERT_EQUAL((CONNECT_RETRY_COUNT - 1) * CONNECT_RETRY_DELAY_MS, millis());
    TEST_ASSERT_FALSE(controller.isValid());
}

void test_HubLink_setRetryPolicy(void) {
    FakePeripheral* peripheral = addTechnicHub();
    peripheral->setConnectAlwaysFails(true);
    hubLink->begin(bleManager, 0);
    hubLink->setRetryPolicy(3, 500);

    HubController controller;
    Status status = hubLink->createHub(technicHub(), controller);
    TEST_ASSERT_EQUAL_STRING("Unable to connect to 90:84:2B:01:A2:FF after 3 tries", status.message);
    TEST_ASSERT_EQUAL(3, peripheral->connectAttempts());
    TEST_ASSERT_EQUAL(1000, millis());

    hubLink->setRetryPolicy(0, 0);
    TEST_ASSERT_EQUAL(1, hubLink->getRetryCount());
}

void test_HubLink_createHub_unsupported_kind_retries(void) {
    FakePeripheral* peripheral = central->addPeripheral(makeAddress(TECHNIC_ADDRESS));
    hubLink->begin(bleManager, 0);
    hubLink->setRetryPolicy(2, 0);

    HubController controller;
    DiscoveredHub wedo(HubKind::WEDO2_SMART_HUB, makeAddress(TECHNIC_ADDRESS), "WeDo");
    TEST_ASSERT_EQUAL(Result::ERROR_RETRIES_EXHAUSTED, hubLink->createHub(wedo, controller).code);
    TEST_ASSERT_EQUAL(2, peripheral->disconnectCount());
}

// =============================================================================
// CONNECT BY ADDRESS TESTS
// =============================================================================

void test_HubLink_connectToHub_uses_discovery_log(void) {
    hubLink->begin(bleManager, 0);
    std::thread announcer = announceLater(CITY_ADDRESS, "City Hub", ManufacturerDeviceType::HUB);
    DiscoveredHub hub;
    hubLink->waitForHub(hub);
    announcer.join();

    HubController controller;
    TEST_ASSERT_TRUE(hubLink->connectToHub("90:84:2b:60:3c:b8", controller).isOk());
    TEST_ASSERT_EQUAL(HubKind::HUB, controller.getKind());
    TEST_ASSERT_EQUAL_STRING("City Hub", controller.getName());
}

void test_HubLink_connectToHub_identifies_undiscovered(void) {
    addTechnicHub();
    hubLink->begin(bleManager, 0);

    HubController controller;
    TEST_ASSERT_TRUE(hubLink->connectToHub(TECHNIC_ADDRESS, controller).isOk());
    TEST_ASSERT_EQUAL(HubKind::TECHNIC_MEDIUM_HUB, controller.getKind());
}

void test_HubLink_connectToHub_invalid_address(void) {
    hubLink->begin(bleManager, 0);

    HubController controller;
    Status status = hubLink->connectToHub("not-an-address", controller);
    TEST_ASSERT_EQUAL(Result::ERROR_INVALID_PARAM, status.code);
    TEST_ASSERT_EQUAL_STRING("Invalid address 'not-an-address'", status.message);
}

// =============================================================================
// END TO END
// =============================================================================

void test_HubLink_discover_connect_drive(void) {
    hubLink->begin(bleManager, 0);
    std::thread city = announceLater(CITY_ADDRESS, "City Hub", ManufacturerDeviceType::HUB);
    std::thread technic = announceLater(TECHNIC_ADDRESS, "Technic Hub",
                                        ManufacturerDeviceType::TECHNIC_MEDIUM_HUB);

    DiscoveredHub hub;
    TEST_ASSERT_TRUE(hubLink->waitForHubFilter(HubFilter::byAddress(TECHNIC_ADDRESS), hub).isOk());
    city.join();
    technic.join();
    TEST_ASSERT_TRUE(hub.address == makeAddress(TECHNIC_ADDRESS));

    HubController controller;
    TEST_ASSERT_TRUE(hubLink->createHub(hub, controller).isOk());

    PortController motor;
    TEST_ASSERT_TRUE(controller.port(PortSpec::B, motor).isOk());
    TEST_ASSERT_TRUE(motor->startSpeed(-50).isOk());

    FakePeripheral* peripheral = central->find(makeAddress(TECHNIC_ADDRESS));
    TEST_ASSERT_EQUAL(1, peripheral->writeCount());
    TEST_ASSERT_EQUAL_HEX8(0x01, peripheral->writtenFrame(0)[3]);
    TEST_ASSERT_EQUAL_HEX8(0xCE, peripheral->writtenFrame(0)[6]);

    // Connected hubs are not rediscovered
    central->injectEvent(AdapterEventType::DEVICE_DISCOVERED, makeAddress(TECHNIC_ADDRESS));
    TEST_ASSERT_EQUAL(Result::ERROR_TIMEOUT,
                      hubLink->waitForHubFilterTimeout(HubFilter::byAddress(TECHNIC_ADDRESS), 100, hub).code);

    TEST_ASSERT_TRUE(controller.disconnect().isOk());
    TEST_ASSERT_FALSE(peripheral->isConnected());
    TEST_ASSERT_EQUAL(Result::ERROR_UNKNOWN_HUB, controller.port(PortSpec::A, motor).code);
}

// =============================================================================
// TEST RUNNER
// =============================================================================

int main(int argc, char **argv) {
    UNITY_BEGIN();

    // Adapter / Lifecycle Tests
    RUN_TEST(test_HubLink_listAdapters);
    RUN_TEST(test_HubLink_begin_starts_scanning);
    RUN_TEST(test_HubLink_begin_bad_index);
    RUN_TEST(test_HubLink_begin_adapter_failure);
    RUN_TEST(test_HubLink_begin_scan_failure);
    RUN_TEST(test_HubLink_stop_disconnects_hubs);

    // Wait For Hub Tests
    RUN_TEST(test_HubLink_waitForHub_returns_announced_hub);
    RUN_TEST(test_HubLink_waitForHubFilter_skips_other_hubs);
    RUN_TEST(test_HubLink_waitForHub_timeout_retracts_wait);
    RUN_TEST(test_HubLink_filter_timeout_ignores_non_matching);
    RUN_TEST(test_HubLink_unnamed_device_never_satisfies_wait);

    // Connect With Retry Tests
    RUN_TEST(test_HubLink_createHub_first_attempt);
    RUN_TEST(test_HubLink_createHub_succeeds_after_failures);
    RUN_TEST(test_HubLink_createHub_retries_exhausted);
    RUN_TEST(test_HubLink_setRetryPolicy);
    RUN_TEST(test_HubLink_createHub_unsupported_kind_retries);

    // Connect By Address Tests
    RUN_TEST(test_HubLink_connectToHub_uses_discovery_log);
    RUN_TEST(test_HubLink_connectToHub_identifies_undiscovered);
    RUN_TEST(test_HubLink_connectToHub_invalid_address);

    // End To End
    RUN_TEST(test_HubLink_discover_connect_drive);

    return UNITY_END();
}
