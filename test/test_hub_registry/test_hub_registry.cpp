/**
 * @file test_hub_registry.cpp
 * @brief Unit tests for HubRegistry - Connect, ports, writes, and notifications
 */

#include <unity.h>
#include "hub_registry.h"
#include "fake_ble_central.h"

// Include source files directly for native testing
#include "../../src/types.cpp"
#include "../../src/hub_identify.cpp"
#include "../../src/lpf2_protocol.cpp"
#include "../../src/adapter_service.cpp"
#include "../../src/hub.cpp"
#include "../../src/device.cpp"
#include "../../src/hub_controller.cpp"
#include "../../src/hub_registry.cpp"

// =============================================================================
// TEST FIXTURES
// =============================================================================

static FakeCentral* central = nullptr;
static AdapterService* adapter = nullptr;
static HubRegistry* registry = nullptr;

static const char* TECHNIC_ADDRESS = "90:84:2B:01:A2:FF";
static const char* CITY_ADDRESS = "90:84:2B:60:3C:B8";

void setUp(void) {
    central = new FakeCentral();
    adapter = new AdapterService();
    registry = new HubRegistry();
    adapter->begin(central);
    registry->begin(adapter);
}

void tearDown(void) {
    delete registry;
    adapter->stop();
    delete adapter;
    delete central;
    registry = nullptr;
    adapter = nullptr;
    central = nullptr;
}

static FakePeripheral* addTechnicHub() {
    FakePeripheral* peripheral = central->addPeripheral(makeAddress(TECHNIC_ADDRESS));
    peripheral->setAdvertisement(makeHubAdvertisement("Technic Hub", ManufacturerDeviceType::TECHNIC_MEDIUM_HUB));
    return peripheral;
}

static FakePeripheral* addCityHub() {
    FakePeripheral* peripheral = central->addPeripheral(makeAddress(CITY_ADDRESS));
    peripheral->setAdvertisement(makeHubAdvertisement("City Hub", ManufacturerDeviceType::HUB));
    return peripheral;
}

static DiscoveredHub technicHub() {
    return DiscoveredHub(HubKind::TECHNIC_MEDIUM_HUB, makeAddress(TECHNIC_ADDRESS), "Technic Hub");
}

static DiscoveredHub cityHub() {
    return DiscoveredHub(HubKind::HUB, makeAddress(CITY_ADDRESS), "City Hub");
}

/**
 * @brief Poll an atomic counter updated by the registry task
 */
static bool waitForCount(uint32_t (HubRegistry::*counter)() const, uint32_t expected) {
    for (uint8_t i = 0; i < 100; i++) {
        if ((registry->*counter)() == expected) {
            return true;
        }
        vTaskDelay(pdMS_TO_TICKS(10));
    }
    return false;
}

// =============================================================================
// CONNECT TESTS
// =============================================================================

void test_HubRegistry_connect_technic_hub(void) {
    FakePeripheral* peripheral = addTechnicHub();

    HubController controller;
    Status status = registry->connectToHub(technicHub(), controller);
    TEST_ASSERT_TRUE(status.isOk());
    TEST_ASSERT_TRUE(controller.isValid());
    TEST_ASSERT_EQUAL(HubKind::TECHNIC_MEDIUM_HUB, controller.getKind());
    TEST_ASSERT_EQUAL_STRING("Technic Hub", controller.getName());

    TEST_ASSERT_TRUE(peripheral->isConnected());
    TEST_ASSERT_EQUAL(1, peripheral->subscribeCount());
    TEST_ASSERT_TRUE(peripheral->hasNotificationCallback());
    TEST_ASSERT_EQUAL(1, registry->hubCount());
    TEST_ASSERT_TRUE(registry->hasHub(makeAddress(TECHNIC_ADDRESS)));
}

void test_HubRegistry_connect_live_hub_returns_existing(void) {
    FakePeripheral* peripheral = addTechnicHub();

    HubController first;
    HubController second;
    registry->connectToHub(technicHub(), first);
    TEST_ASSERT_TRUE(registry->connectToHub(technicHub(), second).isOk());

    TEST_ASSERT_TRUE(second.getAddress() == first.getAddress());
    TEST_ASSERT_EQUAL(1, peripheral->connectAttempts());
    TEST_ASSERT_EQUAL(1, registry->hubCount());
}

void test_HubRegistry_connect_unknown_peripheral(void) {
    HubController controller;
    Status status = registry->connectToHub(technicHub(), controller);
    TEST_ASSERT_EQUAL(Result::ERROR_PERIPHERAL_NOT_FOUND, status.code);
    TEST_ASSERT_FALSE(controller.isValid());
}

void test_HubRegistry_connect_failure(void) {
    FakePeripheral* peripheral = addTechnicHub();
    peripheral->setConnectAlwaysFails(true);

    HubController controller;
    TEST_ASSERT_EQUAL(Result::ERROR_CONNECT_FAILED, registry->connectToHub(technicHub(), controller).code);
    TEST_ASSERT_EQUAL(0, registry->hubCount());
}

void test_HubRegistry_discovery_failure(void) {
    FakePeripheral* peripheral = addTechnicHub();
    peripheral->setDiscoverFails(true);

    HubController controller;
    TEST_ASSERT_EQUAL(Result::ERROR_CONNECT_FAILED, registry->connectToHub(technicHub(), controller).code);
    TEST_ASSERT_EQUAL(0, registry->hubCount());
    TEST_ASSERT_FALSE(peripheral->isConnected());
    TEST_ASSERT_EQUAL(1, peripheral->disconnectCount());
}

void test_HubRegistry_missing_characteristic(void) {
    FakePeripheral* peripheral = addTechnicHub();
    peripheral->clearCharacteristics();

    HubController controller;
    TEST_ASSERT_EQUAL(Result::ERROR_CHARACTERISTIC_MISSING,
                      registry->connectToHub(technicHub(), controller).code);
    TEST_ASSERT_FALSE(peripheral->hasNotificationCallback());
    TEST_ASSERT_EQUAL(0, registry->hubCount());
    TEST_ASSERT_FALSE(peripheral->isConnected());
}

void test_HubRegistry_subscribe_failure(void) {
    FakePeripheral* peripheral = addTechnicHub();
    peripheral->setSubscribeFails(true);

    HubController controller;
    TEST_ASSERT_EQUAL(Result::ERROR_CONNECT_FAILED, registry->connectToHub(technicHub(), controller).code);
    TEST_ASSERT_FALSE(peripheral->hasNotificationCallback());
    TEST_ASSERT_FALSE(peripheral->isConnected());
}

void test_HubRegistry_failed_connect_can_retry(void) {
    FakePeripheral* peripheral = addTechnicHub();
    peripheral->setSubscribeFails(true);

    HubController controller;
    registry->connectToHub(technicHub(), controller);
    peripheral->setSubscribeFails(false);

    TEST_ASSERT_TRUE(registry->connectToHub(technicHub(), controller).isOk());
    TEST_ASSERT_EQUAL(2, peripheral->connectAttempts());
    TEST_ASSERT_TRUE(peripheral->isConnected());
}

void test_HubRegistry_connect_requires_adapter(void) {
    addTechnicHub();
    HubRegistry unstarted;

    HubController controller;
    TEST_ASSERT_EQUAL(Result::ERROR_ADAPTER_UNAVAILABLE,
                      unstarted.connectToHub(technicHub(), controller).code);
    TEST_ASSERT_FALSE(controller.isValid());
}

void test_HubRegistry_unsupported_kind_disconnects(void) {
    FakePeripheral* peripheral = central->addPeripheral(makeAddress(TECHNIC_ADDRESS));

    HubController controller;
    DiscoveredHub mario(HubKind::MARIO, makeAddress(TECHNIC_ADDRESS), "Mario");
    Status status = registry->connectToHub(mario, controller);
    TEST_ASSERT_EQUAL(Result::ERROR_UNSUPPORTED_HUB_KIND, status.code);
    TEST_ASSERT_EQUAL_STRING("Hub kind Mario is not supported", status.message);
    TEST_ASSERT_EQUAL(1, peripheral->disconnectCount());
    TEST_ASSERT_EQUAL(0, registry->hubCount());
}

void test_HubRegistry_identifies_unknown_kind_on_connect(void) {
    addCityHub();

    HubController controller;
    DiscoveredHub unknown(HubKind::UNKNOWN, makeAddress(CITY_ADDRESS), "");
    TEST_ASSERT_TRUE(registry->connectToHub(unknown, controller).isOk());
    TEST_ASSERT_EQUAL(HubKind::HUB, controller.getKind());
    TEST_ASSERT_EQUAL_STRING("City Hub", controller.getName());
}

void test_HubRegistry_slots_exhausted(void) {
    char address[BLE_ADDRESS_STRING_LEN];
    HubController controller;
    for (uint8_t i = 0; i < MAX_HUBS; i++) {
        snprintf(address, sizeof(address), "00:00:00:00:00:%02X", i);
        central->addPeripheral(makeAddress(address));
        DiscoveredHub hub(HubKind::HUB, makeAddress(address), "Hub");
        TEST_ASSERT_TRUE(registry->connectToHub(hub, controller).isOk());
    }

    central->addPeripheral(makeAddress("00:00:00:00:00:FF"));
    DiscoveredHub extra(HubKind::HUB, makeAddress("00:00:00:00:00:FF"), "Hub");
    TEST_ASSERT_EQUAL(Result::ERROR_CONNECT_FAILED, registry->connectToHub(extra, controller).code);
    TEST_ASSERT_EQUAL(MAX_HUBS, registry->hubCount());
}

// =============================================================================
// PORT TESTS
// =============================================================================

void test_HubRegistry_getPort_maps_port_id(void) {
    addTechnicHub();
    HubController controller;
    registry->connectToHub(technicHub(), controller);

    PortController port;
    TEST_ASSERT_TRUE(registry->getPort(makeAddress(TECHNIC_ADDRESS), PortSpec::D, port).isOk());
    TEST_ASSERT_EQUAL(3, port.getPortId());
    TEST_ASSERT_EQUAL(DeviceKind::MOTOR, port->getKind());

    TEST_ASSERT_TRUE(registry->getPort(makeAddress(TECHNIC_ADDRESS), PortSpec::HUB_LED, port).isOk());
    TEST_ASSERT_EQUAL(50, port.getPortId());
    TEST_ASSERT_EQUAL(DeviceKind::HUB_LED, port->getKind());
}

void test_HubRegistry_getPort_unknown_port(void) {
    addCityHub();
    HubController controller;
    registry->connectToHub(cityHub(), controller);

    PortController port;
    Status status = registry->getPort(makeAddress(CITY_ADDRESS), PortSpec::D, port);
    TEST_ASSERT_EQUAL(Result::ERROR_UNKNOWN_PORT, status.code);
    TEST_ASSERT_EQUAL_STRING("Port D does not exist on hub 90:84:2B:60:3C:B8", status.message);
}

void test_HubRegistry_port_tables_sized_per_kind(void) {
    TEST_ASSERT_EQUAL(12, hubPropertiesFor(HubKind::TECHNIC_MEDIUM_HUB)->portCount);
    TEST_ASSERT_EQUAL(9, hubPropertiesFor(HubKind::MOVE_HUB)->portCount);
    TEST_ASSERT_EQUAL(5, hubPropertiesFor(HubKind::HUB)->portCount);
    TEST_ASSERT_EQUAL(4, hubPropertiesFor(HubKind::REMOTE_CONTROL)->portCount);
    TEST_ASSERT_NULL(hubPropertiesFor(HubKind::MARIO));
}

void test_HubRegistry_getPort_unknown_hub(void) {
    PortController port;
    TEST_ASSERT_EQUAL(Result::ERROR_UNKNOWN_HUB,
                      registry->getPort(makeAddress(TECHNIC_ADDRESS), PortSpec::A, port).code);
}

// =============================================================================
// SEND / DISCONNECT TESTS
// =============================================================================

void test_HubRegistry_sendToHub_writes_frame(void) {
    FakePeripheral* peripheral = addTechnicHub();
    HubController controller;
    registry->connectToHub(technicHub(), controller);

    TEST_ASSERT_TRUE(registry->sendToHub(makeAddress(TECHNIC_ADDRESS),
                                         Lpf2Message::createStartSpeed(0, 50)).isOk());

    const uint8_t expected[] = { 0x09, 0x00, 0x81, 0x00, 0x11, 0x07, 0x32, 0x64, 0x00 };
    TEST_ASSERT_EQUAL(1, peripheral->writeCount());
    std::vector<uint8_t> frame = peripheral->writtenFrame(0);
    TEST_ASSERT_EQUAL(sizeof(expected), frame.size());
    TEST_ASSERT_EQUAL_HEX8_ARRAY(expected, frame.data(), sizeof(expected));
}

void test_HubRegistry_sendToHub_write_failure(void) {
    FakePeripheral* peripheral = addTechnicHub();
    HubController controller;
    registry->connectToHub(technicHub(), controller);
    peripheral->setWriteFails(true);

    TEST_ASSERT_EQUAL(Result::ERROR_CONNECT_FAILED,
                      registry->sendToHub(makeAddress(TECHNIC_ADDRESS),
                                          Lpf2Message::createHubAction(LPF2_HUB_ACTION_SWITCH_OFF)).code);
}

void test_HubRegistry_disconnect_forgets_hub(void) {
    FakePeripheral* peripheral = addTechnicHub();
    HubController controller;
    registry->connectToHub(technicHub(), controller);

    TEST_ASSERT_TRUE(registry->disconnect(makeAddress(TECHNIC_ADDRESS)).isOk());
    TEST_ASSERT_EQUAL(1, peripheral->disconnectCount());
    TEST_ASSERT_FALSE(peripheral->hasNotificationCallback());
    TEST_ASSERT_EQUAL(0, registry->hubCount());

    PortController port;
    TEST_ASSERT_EQUAL(Result::ERROR_UNKNOWN_HUB,
                      registry->getPort(makeAddress(TECHNIC_ADDRESS), PortSpec::A, port).code);
    TEST_ASSERT_EQUAL(Result::ERROR_UNKNOWN_HUB,
                      registry->sendToHub(makeAddress(TECHNIC_ADDRESS), Lpf2Message::createStartSpeed(0, 0)).code);
    TEST_ASSERT_EQUAL(Result::ERROR_UNKNOWN_HUB, registry->disconnect(makeAddress(TECHNIC_ADDRESS)).code);
}

// =============================================================================
// ACTOR TESTS
// =============================================================================

void test_HubRegistry_controller_drives_motor(void) {
    FakePeripheral* peripheral = addTechnicHub();
    TEST_ASSERT_TRUE(registry->isRunning());

    HubController controller;
    TEST_ASSERT_TRUE(registryConnectToHub(registry->inbox(), technicHub(), controller).isOk());

    PortController motor;
    TEST_ASSERT_TRUE(controller.port(PortSpec::A, motor).isOk());
    TEST_ASSERT_TRUE(motor->startSpeed(50).isOk());
    TEST_ASSERT_TRUE(motor->stop().isOk());

    TEST_ASSERT_EQUAL(2, peripheral->writeCount());
    TEST_ASSERT_EQUAL_HEX8(0x07, peripheral->writtenFrame(0)[5]);
    TEST_ASSERT_EQUAL_HEX8(LPF2_POWER_BRAKE, peripheral->writtenFrame(1)[7]);

    Status status = motor->setColor((uint8_t)Lpf2Color::RED);
    TEST_ASSERT_EQUAL(Result::ERROR_UNSUPPORTED_OPERATION, status.code);
    TEST_ASSERT_EQUAL(Result::ERROR_INVALID_PARAM, motor->startSpeed(101).code);
    TEST_ASSERT_EQUAL(2, peripheral->writeCount());
}

void test_HubRegistry_controller_sets_led_rgb(void) {
    FakePeripheral* peripheral = addTechnicHub();

    HubController controller;
    registryConnectToHub(registry->inbox(), technicHub(), controller);

    PortController led;
    TEST_ASSERT_TRUE(controller.port(PortSpec::HUB_LED, led).isOk());
    TEST_ASSERT_TRUE(led->setRgb(0xFF, 0x00, 0x00).isOk());

    // Mode select, then the colour
    TEST_ASSERT_EQUAL(2, peripheral->writeCount());
    TEST_ASSERT_EQUAL_HEX8(0x41, peripheral->writtenFrame(0)[2]);
    TEST_ASSERT_EQUAL_HEX8(0xFF, peripheral->writtenFrame(1)[7]);
}

void test_HubRegistry_port_after_disconnect_is_unknown_hub(void) {
    addTechnicHub();

    HubController controller;
    registryConnectToHub(registry->inbox(), technicHub(), controller);
    PortController motor;
    controller.port(PortSpec::A, motor);

    TEST_ASSERT_TRUE(controller.disconnect().isOk());
    TEST_ASSERT_EQUAL(Result::ERROR_UNKNOWN_HUB, controller.port(PortSpec::A, motor).code);
    TEST_ASSERT_EQUAL(Result::ERROR_UNKNOWN_HUB, motor->startSpeed(10).code);
}

void test_HubRegistry_notifications_counted(void) {
    FakePeripheral* peripheral = addTechnicHub();

    HubController controller;
    registryConnectToHub(registry->inbox(), technicHub(), controller);

    const uint8_t value[] = { 0x05, 0x00, 0x45, 0x3B, 0x7F };
    TEST_ASSERT_TRUE(peripheral->deliverNotification(value, sizeof(value)));
    TEST_ASSERT_TRUE(waitForCount(&HubRegistry::getNotificationCount, 1));
}

void test_HubRegistry_malformed_notification_dropped(void) {
    FakePeripheral* peripheral = addTechnicHub();

    HubController controller;
    registryConnectToHub(registry->inbox(), technicHub(), controller);

    const uint8_t truncated[] = { 0x09, 0x00, 0x45 };
    peripheral->deliverNotification(truncated, sizeof(truncated));
    TEST_ASSERT_EQUAL(1, registry->getParseFailureCount());

    // Registry keeps serving the hub
    PortController motor;
    TEST_ASSERT_TRUE(controller.port(PortSpec::A, motor).isOk());
    TEST_ASSERT_EQUAL(0, registry->getNotificationCount());
}

void test_HubRegistry_stop_disconnects_all_hubs(void) {
    FakePeripheral* technic = addTechnicHub();
    FakePeripheral* city = addCityHub();

    HubController controller;
    registryConnectToHub(registry->inbox(), technicHub(), controller);
    registryConnectToHub(registry->inbox(), cityHub(), controller);

    registry->stop();
    TEST_ASSERT_FALSE(registry->isRunning());
    TEST_ASSERT_EQUAL(1, technic->disconnectCount());
    TEST_ASSERT_EQUAL(1, city->disconnectCount());
    TEST_ASSERT_EQUAL(0, registry->hubCount());

    PortController port;
    TEST_ASSERT_EQUAL(Result::ERROR_CHANNEL_CLOSED, controller.port(PortSpec::A, port).code);
}

// =============================================================================
// TEST RUNNER
// =============================================================================

int main(int argc, char **argv) {
    UNITY_BEGIN();

    // Connect Tests
    RUN_TEST(test_HubRegistry_connect_technic_hub);
    RUN_TEST(test_HubRegistry_connect_live_hub_returns_existing);
    RUN_TEST(test_HubRegistry_connect_unknown_peripheral);
    RUN_TEST(test_HubRegistry_connect_failure);
    RUN_TEST(test_HubRegistry_discovery_failure);
    RUN_TEST(test_HubRegistry_missing_characteristic);
    RUN_TEST(test_HubRegistry_subscribe_failure);
    RUN_TEST(test_HubRegistry_failed_connect_can_retry);
    RUN_TEST(test_HubRegistry_connect_requires_adapter);
    RUN_TEST(test_HubRegistry_unsupported_kind_disconnects);
    RUN_TEST(test_HubRegistry_identifies_unknown_kind_on_connect);
    RUN_TEST(test_HubRegistry_slots_exhausted);

    // Port Tests
    RUN_TEST(test_HubRegistry_getPort_maps_port_id);
    RUN_TEST(test_HubRegistry_getPort_unknown_port);
    RUN_TEST(test_HubRegistry_port_tables_sized_per_kind);
    RUN_TEST(test_HubRegistry_getPort_unknown_hub);

    // Send / Disconnect Tests
    RUN_TEST(test_HubRegistry_sendToHub_writes_frame);
    RUN_TEST(test_HubRegistry_sendToHub_write_failure);
    RUN_TEST(test_HubRegistry_disconnect_forgets_hub);

    // Actor Tests
    RUN_TEST(test_HubRegistry_controller_drives_motor);
    RUN_TEST(test_HubRegistry_controller_sets_led_rgb);
    RUN_TEST(test_HubRegistry_port_after_disconnect_is_unknown_hub);
    RUN_TEST(test_HubRegistry_notifications_counted);
    RUN_TEST(test_HubRegistry_malformed_notification_dropped);
    RUN_TEST(test_HubRegistry_stop_disconnects_all_hubs);

    return UNITY_END();
}
