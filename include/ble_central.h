/**
 * @file ble_central.h
 * @brief HubLink BLE adapter interface - Adapters, peripherals, and advertisement data
 * @version 1.0.0
 * @platform Adafruit Feather nRF52840 Express
 *
 * The connection layer talks to the radio only through these interfaces.
 * BluefruitManager (bluefruit_central.h) implements them on the nRF52840
 * SoftDevice; native tests use the fakes in test/mocks/src/fake_ble_central.h.
 *
 * Threading:
 * - BleCentral methods are called from the AdapterService task only
 * - BlePeripheral methods are called from the AdapterService or HubRegistry task
 * - Notification callbacks run on the BLE stack's own task
 */

#ifndef BLE_CENTRAL_H
#define BLE_CENTRAL_H

#include <Arduino.h>
#include "config.h"
#include "types.h"
#include "rtos_channel.h"

// =============================================================================
// ADVERTISEMENT DATA
// =============================================================================

/**
 * @brief Manufacturer specific payload keyed by 16-bit company id
 *
 * data[] excludes the company id itself.
 */
struct ManufacturerEntry {
    uint16_t companyId;
    uint8_t length;
    uint8_t data[MANUFACTURER_DATA_MAX];
};

/**
 * @brief Snapshot of a peripheral's advertised properties
 */
struct BleAdvertisement {
    bool hasName;
    char name[HUB_NAME_MAX];
    uint8_t serviceCount;
    BleUuid services[MAX_SERVICE_UUIDS];
    uint8_t manufacturerCount;
    ManufacturerEntry manufacturer[MAX_MANUFACTURER_ENTRIES];

    BleAdvertisement() { clear(); }

    void clear() {
        hasName = false;
        name[0] = '\0';
        serviceCount = 0;
        manufacturerCount = 0;
    }

    void setName(const char* advertisedName) {
        if (!advertisedName) {
            return;
        }
        strncpy(name, advertisedName, HUB_NAME_MAX - 1);
        name[HUB_NAME_MAX - 1] = '\0';
        hasName = true;
    }

    bool addService(const BleUuid& uuid) {
        if (hasService(uuid)) {
            return true;
        }
        if (serviceCount >= MAX_SERVICE_UUIDS) {
            return false;
        }
        services[serviceCount++] = uuid;
        return true;
    }

    bool hasService(const BleUuid& uuid) const {
        for (uint8_t i = 0; i < serviceCount; i++) {
            if (services[i] == uuid) {
                return true;
            }
        }
        return false;
    }

    /**
     * @brief Store (or replace) the payload for a company id
     */
    bool addManufacturerData(uint16_t companyId, const uint8_t* data, uint8_t length) {
        ManufacturerEntry* entry = nullptr;
        for (uint8_t i = 0; i < manufacturerCount; i++) {
            if (manufacturer[i].companyId == companyId) {
                entry = &manufacturer[i];
            }
        }
        if (!entry) {
            if (manufacturerCount >= MAX_MANUFACTURER_ENTRIES) {
                return false;
            }
            entry = &manufacturer[manufacturerCount++];
        }

        if (length > MANUFACTURER_DATA_MAX) {
            length = MANUFACTURER_DATA_MAX;
        }
        entry->companyId = companyId;
        entry->length = length;
        if (length > 0 && data) {
            memcpy(entry->data, data, length);
        }
        return true;
    }

    const ManufacturerEntry* findManufacturer(uint16_t companyId) const {
        for (uint8_t i = 0; i < manufacturerCount; i++) {
            if (manufacturer[i].companyId == companyId) {
                return &manufacturer[i];
            }
        }
        return nullptr;
    }
};

// =============================================================================
// ADAPTER EVENTS
// =============================================================================

/**
 * @brief Low-level events reported by an adapter
 */
enum class AdapterEventType : uint8_t {
    DEVICE_DISCOVERED = 0,  // First advertisement from an address
    DEVICE_UPDATED,         // Later advertisement from a known address
    DEVICE_CONNECTED,
    DEVICE_DISCONNECTED,
    SHUTDOWN                // Orderly end of the event stream
};

inline const char* adapterEventTypeToString(AdapterEventType type) {
    switch (type) {
        case AdapterEventType::DEVICE_DISCOVERED: return "DISCOVERED";
        case AdapterEventType::DEVICE_UPDATED: return "UPDATED";
        case AdapterEventType::DEVICE_CONNECTED: return "CONNECTED";
        case AdapterEventType::DEVICE_DISCONNECTED: return "DISCONNECTED";
        case AdapterEventType::SHUTDOWN: return "SHUTDOWN";
        default: return "UNKNOWN";
    }
}

struct AdapterEvent {
    AdapterEventType type;
    BleAddress address;

    AdapterEvent() : type(AdapterEventType::DEVICE_DISCOVERED), address() {}
    AdapterEvent(AdapterEventType t, const BleAddress& addr) : type(t), address(addr) {}
};

// =============================================================================
// CHARACTERISTICS
// =============================================================================

struct BleCharacteristic {
    BleUuid uuid;
    uint16_t handle;

    BleCharacteristic() : uuid(), handle(0) {}
};

/**
 * @brief Raw notification callback; runs on the BLE stack's task
 */
typedef void (*BleNotifyCallback)(void* context, const uint8_t* data, uint16_t length);

// =============================================================================
// PERIPHERAL
// =============================================================================

/**
 * @brief Handle to a remote device known to an adapter
 *
 * Owned by its BleCentral; pointers stay valid for the adapter's lifetime.
 */
class BlePeripheral {
public:
    virtual ~BlePeripheral() {}

    virtual BleAddress address() const = 0;

    /**
     * @brief Copy the latest advertised properties
     * @return false if nothing has been received from this device
     */
    virtual bool properties(BleAdvertisement& out) = 0;

    virtual bool isConnected() = 0;

    /**
     * @brief Establish the link (blocking)
     */
    virtual bool connect() = 0;

    /**
     * @brief Enumerate characteristics of the connected device
     * @param out Output array
     * @param maxCount Capacity of out
     * @param count Number written
     */
    virtual bool discoverCharacteristics(BleCharacteristic* out, uint8_t maxCount, uint8_t& count) = 0;

    /**
     * @brief Enable notifications on a characteristic
     */
    virtual bool subscribe(const BleCharacteristic& characteristic) = 0;

    /**
     * @brief Install the raw notification callback (replaces any previous one)
     */
    virtual void onNotification(BleNotifyCallback callback, void* context) = 0;

    virtual bool write(const BleCharacteristic& characteristic, const uint8_t* data, uint16_t length) = 0;

    virtual bool disconnect() = 0;
};

// =============================================================================
// ADAPTER
// =============================================================================

/**
 * @brief One local BLE radio in the central role
 */
class BleCentral {
public:
    virtual ~BleCentral() {}

    virtual const char* name() const = 0;

    virtual bool begin() = 0;

    virtual bool startScan() = 0;

    virtual void stopScan() = 0;

    /**
     * @brief Resolve a peripheral handle
     * @return nullptr if the adapter has not seen the address
     */
    virtual BlePeripheral* peripheral(const BleAddress& address) = 0;

    /**
     * @brief Blocking event stream; closed when the radio stack dies
     */
    virtual Channel<AdapterEvent>* events() = 0;
};

/**
 * @brief Enumerates the local adapters
 */
class BleManager {
public:
    virtual ~BleManager() {}

    virtual uint8_t adapterCount() const = 0;

    /**
     * @return nullptr if index is out of range
     */
    virtual BleCentral* adapter(uint8_t index) = 0;
};

#endif // BLE_CENTRAL_H
