/**
 * @file adapter_service.h
 * @brief HubLink adapter service - Single owner of the BLE central
 * @version 1.0.0
 * @platform Adafruit Feather nRF52840 Express
 *
 * Every adapter-level operation (peripheral lookup, property snapshot,
 * connect, scan start) is a request on this task's queue, so the discovery
 * path and the hub registry never touch the BleCentral concurrently.
 * Contention shows up as queue depth (pendingRequests()).
 *
 * Usage:
 *   AdapterService adapter;
 *   adapter.begin(central);
 *   BlePeripheral* peripheral = nullptr;
 *   Status status = adapter.connectPeripheral(address, peripheral);
 */

#ifndef ADAPTER_SERVICE_H
#define ADAPTER_SERVICE_H

#include <Arduino.h>
#include <atomic>
#include "config.h"
#include "types.h"
#include "rtos_channel.h"
#include "ble_central.h"

// =============================================================================
// REQUESTS
// =============================================================================

enum class AdapterRequestType : uint8_t {
    RESOLVE_PERIPHERAL = 0,     // Lookup only
    INSPECT_PERIPHERAL,         // Lookup + properties + connection state
    CONNECT_PERIPHERAL,         // Lookup + connect
    START_SCAN,
    STOP
};

/**
 * @brief Reply payload for adapter requests
 */
struct PeripheralInfo {
    BlePeripheral* peripheral;
    BleAdvertisement advertisement;
    bool hasProperties;
    bool connected;

    PeripheralInfo() : peripheral(nullptr), advertisement(), hasProperties(false), connected(false) {}
};

struct AdapterRequest {
    AdapterRequestType type;
    BleAddress address;
    ReplySender<Outcome<PeripheralInfo>> reply;

    AdapterRequest() : type(AdapterRequestType::STOP), address(), reply() {}
};

// =============================================================================
// ADAPTER SERVICE CLASS
// =============================================================================

class AdapterService {
public:
    AdapterService();
    ~AdapterService();

    AdapterService(const AdapterService&) = delete;
    AdapterService& operator=(const AdapterService&) = delete;

    /**
     * @brief Take ownership of the central and start the service task
     * @return OK, ERROR_ADAPTER_UNAVAILABLE (null central), or ERROR_BUSY (already started)
     */
    Result begin(BleCentral* central);

    /**
     * @brief Stop the task; pending requests see ERROR_CHANNEL_CLOSED
     */
    void stop();

    bool isRunning() const { return _running.load(); }

    // =========================================================================
    // CLIENT API (any task)
    // =========================================================================

    Status startScan();

    /**
     * @brief Resolve a peripheral handle by address
     * @return OK or ERROR_PERIPHERAL_NOT_FOUND
     */
    Status resolvePeripheral(const BleAddress& address, BlePeripheral*& out);

    /**
     * @brief Resolve and snapshot advertised properties and connection state
     */
    Status inspectPeripheral(const BleAddress& address, PeripheralInfo& out);

    /**
     * @brief Resolve and connect (no-op if already connected)
     * @return OK, ERROR_PERIPHERAL_NOT_FOUND, or ERROR_CONNECT_FAILED
     */
    Status connectPeripheral(const BleAddress& address, BlePeripheral*& out);

    uint32_t pendingRequests() const { return _inbox.pending(); }

    // =========================================================================
    // TASK SIDE
    // =========================================================================

    /**
     * @brief Execute one request against the central (service task context)
     */
    Outcome<PeripheralInfo> handleRequest(const AdapterRequest& request);

private:
    static void taskEntry(void* param);
    void run();

    Status roundTrip(AdapterRequestType type, const BleAddress& address, PeripheralInfo& out);

    BleCentral* _central;
    Channel<AdapterRequest> _inbox;
    SemaphoreHandle_t _exited;
    std::atomic<bool> _running;
};

#endif // ADAPTER_SERVICE_H
