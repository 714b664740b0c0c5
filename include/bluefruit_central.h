/**
 * @file bluefruit_central.h
 * @brief HubLink Bluefruit backend - nRF52840 radio as a BLE central
 * @version 1.0.0
 * @platform Adafruit Feather nRF52840 Express
 *
 * Implements the BleManager/BleCentral/BlePeripheral interfaces on the
 * Bluefruit library:
 * - Active scanning with RSSI floor; advertising data and scan responses
 *   are merged per address
 * - DEVICE_DISCOVERED once a peripheral has advertised its name,
 *   DEVICE_UPDATED afterwards, re-armed on disconnect
 * - Up to MAX_HUBS concurrent central connections, each with its own
 *   LPF2 client service/characteristic pair
 *
 * Bluefruit callbacks run on the BLE stack's task and hand events to the
 * adapter event channel with a bounded wait (EVENT_ENQUEUE_TIMEOUT_MS).
 */

#ifndef BLUEFRUIT_CENTRAL_H
#define BLUEFRUIT_CENTRAL_H

#include <Arduino.h>
#include <bluefruit.h>

#include "config.h"
#include "types.h"
#include "rtos_channel.h"
#include "ble_central.h"

#define BLUEFRUIT_ADAPTER_NAME "nRF52840"

// Bluefruit connection handle sentinel
#define CONN_HANDLE_INVALID 0xFFFF

class BluefruitCentral;

// =============================================================================
// PERIPHERAL
// =============================================================================

class BluefruitPeripheral : public BlePeripheral {
public:
    BluefruitPeripheral();

    void reset();

    // BlePeripheral
    BleAddress address() const override { return _address; }
    bool properties(BleAdvertisement& out) override;
    bool isConnected() override;
    bool connect() override;
    bool discoverCharacteristics(BleCharacteristic* out, uint8_t maxCount, uint8_t& count) override;
    bool subscribe(const BleCharacteristic& characteristic) override;
    void onNotification(BleNotifyCallback callback, void* context) override;
    bool write(const BleCharacteristic& characteristic, const uint8_t* data, uint16_t length) override;
    bool disconnect() override;

private:
    friend class BluefruitCentral;

    BluefruitCentral* _central;
    bool _inUse;
    bool _announced;            // DEVICE_DISCOVERED already sent
    uint32_t _lastSeenMs;
    BleAddress _address;
    ble_gap_addr_t _gapAddress;
    BleAdvertisement _advertisement;

    uint16_t _connHandle;
    int8_t _clientSlot;         // Index into BluefruitCentral::_clients, -1 if none

    BleNotifyCallback _notifyCallback;
    void* _notifyContext;
};

// =============================================================================
// CENTRAL
// =============================================================================

class BluefruitCentral : public BleCentral {
public:
    BluefruitCentral();

    // BleCentral
    const char* name() const override { return BLUEFRUIT_ADAPTER_NAME; }
    bool begin() override;
    bool startScan() override;
    void stopScan() override;
    BlePeripheral* peripheral(const BleAddress& address) override;
    Channel<AdapterEvent>* events() override { return &_events; }

    uint32_t getEventDropCount() const { return _events.dropped(); }

    // =========================================================================
    // STATIC CALLBACKS (for Bluefruit library)
    // =========================================================================

    static void _onScanCallback(ble_gap_evt_adv_report_t* report);
    static void _onConnect(uint16_t connHandle);
    static void _onDisconnect(uint16_t connHandle, uint8_t reason);
    static void _onNotify(BLEClientCharacteristic* characteristic, uint8_t* data, uint16_t length);

private:
    friend class BluefruitPeripheral;

    struct ClientSlot {
        bool inUse;
        uint16_t connHandle;
        BluefruitPeripheral* peripheral;
        BLEClientService service;
        BLEClientCharacteristic characteristic;
    };

    bool _initialized;
    bool _scanning;
    SemaphoreHandle_t _lock;
    SemaphoreHandle_t _connectDone;
    BluefruitPeripheral* _connecting;

    uint8_t _serviceUuidLe[16];
    uint8_t _characteristicUuidLe[16];

    BluefruitPeripheral _peripherals[MAX_PERIPHERALS];
    ClientSlot _clients[MAX_HUBS];
    Channel<AdapterEvent> _events;

    void handleReport(ble_gap_evt_adv_report_t* report);
    void handleConnect(uint16_t connHandle);
    void handleDisconnect(uint16_t connHandle, uint8_t reason);
    void handleNotify(BLEClientCharacteristic* characteristic, uint8_t* data, uint16_t length);

    bool connectPeripheral(BluefruitPeripheral& peripheral);
    bool discoverLpf2(BluefruitPeripheral& peripheral, BleCharacteristic* out, uint8_t maxCount, uint8_t& count);
    ClientSlot* clientFor(const BluefruitPeripheral& peripheral);

    BluefruitPeripheral* findPeripheral(const BleAddress& address);
    BluefruitPeripheral* allocatePeripheral(const BleAddress& address);

    void postEvent(AdapterEventType type, const BleAddress& address);

    void lock();
    void unlock();
};

// =============================================================================
// MANAGER
// =============================================================================

/**
 * @brief The Feather has a single radio: one adapter at index 0
 */
class BluefruitManager : public BleManager {
public:
    uint8_t adapterCount() const override { return 1; }
    BleCentral* adapter(uint8_t index) override { return index == 0 ? &_central : nullptr; }

private:
    BluefruitCentral _central;
};

// Global instance (needed for static callbacks)
extern BluefruitCentral* g_bluefruitCentral;

#endif // BLUEFRUIT_CENTRAL_H
