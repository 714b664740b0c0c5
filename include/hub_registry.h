/**
 * @file hub_registry.h
 * @brief HubLink hub registry - Actor owning every live hub connection
 * @version 1.0.0
 * @platform Adafruit Feather nRF52840 Express
 *
 * All hub I/O is serialized through this task's inbox:
 *
 *   CONNECT_TO_HUB  -> Outcome<HubController>
 *   GET_PORT        -> Outcome<PortController>
 *   SEND_TO_HUB     -> Status
 *   DISCONNECT      -> Status
 *   NOTIFICATION    (inbound from the BLE stack, no reply)
 *
 * Live hubs are kept in MAX_HUBS fixed slots keyed by address. A slot is
 * freed before its hub is disconnected, so any request processed after a
 * DISCONNECT sees ERROR_UNKNOWN_HUB.
 *
 * Notification callbacks run on the BLE stack's task. They parse the frame,
 * drop (and count) parse failures, and post the message to the inbox with
 * bounded blocking (NOTIFICATION_ENQUEUE_TIMEOUT_MS) before dropping it.
 */

#ifndef HUB_REGISTRY_H
#define HUB_REGISTRY_H

#include <Arduino.h>
#include <atomic>
#include "config.h"
#include "types.h"
#include "rtos_channel.h"
#include "ble_central.h"
#include "lpf2_protocol.h"
#include "hub.h"
#include "hub_controller.h"
#include "adapter_service.h"

// =============================================================================
// REQUESTS
// =============================================================================

enum class RegistryRequestType : uint8_t {
    CONNECT_TO_HUB = 0,
    GET_PORT,
    SEND_TO_HUB,
    DISCONNECT,
    NOTIFICATION,
    STOP
};

struct RegistryRequest {
    RegistryRequestType type;
    DiscoveredHub hub;              // CONNECT_TO_HUB
    BleAddress address;             // all others
    PortSpec port;                  // GET_PORT
    Lpf2Message message;            // SEND_TO_HUB, NOTIFICATION
    ReplySender<Outcome<HubController>> hubReply;
    ReplySender<Outcome<PortController>> portReply;
    ReplySender<Status> statusReply;

    RegistryRequest() :
        type(RegistryRequestType::STOP),
        hub(),
        address(),
        port(PortSpec::A),
        message(),
        hubReply(),
        portReply(),
        statusReply()
    {}
};

// =============================================================================
// CLIENT ROUND TRIPS
// =============================================================================

Status registryConnectToHub(Channel<RegistryRequest>* registry, const DiscoveredHub& hub,
                            HubController& out);

Status registryGetPort(Channel<RegistryRequest>* registry, const BleAddress& address,
                       PortSpec port, PortController& out);

Status registrySendToHub(Channel<RegistryRequest>* registry, const BleAddress& address,
                         const Lpf2Message& message);

Status registryDisconnect(Channel<RegistryRequest>* registry, const BleAddress& address);

// =============================================================================
// HUB REGISTRY CLASS
// =============================================================================

class HubRegistry {
public:
    HubRegistry();
    ~HubRegistry();

    HubRegistry(const HubRegistry&) = delete;
    HubRegistry& operator=(const HubRegistry&) = delete;

    /**
     * @brief Start the registry task
     * @param adapter Service used for peripheral lookup and connect
     */
    Result begin(AdapterService* adapter);

    /**
     * @brief Disconnect every live hub and stop the task
     */
    void stop();

    bool isRunning() const { return _running.load(); }

    Channel<RegistryRequest>* inbox() { return &_inbox; }

    // =========================================================================
    // REQUEST HANDLERS (registry task context)
    // =========================================================================

    void handleRequest(RegistryRequest& request);

    /**
     * @brief Connect, identify, subscribe, and register a hub
     * @return OK (existing controller if already live), ERROR_PERIPHERAL_NOT_FOUND,
     *         ERROR_CONNECT_FAILED, ERROR_CHARACTERISTIC_MISSING, or ERROR_UNSUPPORTED_HUB_KIND
     */
    Status connectToHub(const DiscoveredHub& discovered, HubController& out);

    Status getPort(const BleAddress& address, PortSpec port, PortController& out);

    Status sendToHub(const BleAddress& address, const Lpf2Message& message);

    Status disconnect(const BleAddress& address);

    /**
     * @brief Inbound notification; logged only
     */
    void onNotification(const BleAddress& address, const Lpf2Message& message);

    // =========================================================================
    // STATUS
    // =========================================================================

    uint8_t hubCount() const;

    bool hasHub(const BleAddress& address) const;

    uint32_t getNotificationCount() const { return _notifications.load(); }
    uint32_t getNotificationDropCount() const { return _notificationDrops.load(); }
    uint32_t getParseFailureCount() const { return _parseFailures.load(); }

private:
    /**
     * @brief Callback context; lives in the slot so its address is stable
     */
    struct NotificationRoute {
        HubRegistry* registry;
        BleAddress address;
    };

    struct HubSlot {
        bool active;
        Hub hub;
        BlePeripheral* peripheral;
        NotificationRoute route;
    };

    static void taskEntry(void* param);
    void run();

    static void notificationCallback(void* context, const uint8_t* data, uint16_t length);

    HubSlot* findSlot(const BleAddress& address);
    const HubSlot* findSlot(const BleAddress& address) const;
    HubSlot* freeSlot();
    void releaseSlot(HubSlot& slot);
    void disconnectAll();

    AdapterService* _adapter;
    Channel<RegistryRequest> _inbox;
    SemaphoreHandle_t _exited;
    std::atomic<bool> _running;

    HubSlot _hubs[MAX_HUBS];

    std::atomic<uint32_t> _notifications;
    std::atomic<uint32_t> _notificationDrops;
    std::atomic<uint32_t> _parseFailures;
};

#endif // HUB_REGISTRY_H
