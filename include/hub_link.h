/**
 * @file hub_link.h
 * @brief HubLink facade - Adapter selection, wait-for-hub, and connect-with-retry
 * @version 1.0.0
 * @platform Adafruit Feather nRF52840 Express
 *
 * Owns and wires the four background tasks:
 *
 *   adapter events -> DiscoveryListener -> ConnectionManager -> waitForHub*()
 *   createHub() -> HubRegistry -> Hub -> HubController
 *   HubController::port() -> HubRegistry -> Device -> PortController
 *
 * AdapterService is the only task that touches the BleCentral.
 *
 * Usage:
 *   HubLink link;
 *   link.begin(&bluefruitManager, 0);
 *   DiscoveredHub hub;
 *   HubFilter filter = HubFilter::byName("Technic Hub");
 *   if (link.waitForHubFilterTimeout(filter, 30000, hub).isOk()) {
 *       HubController controller;
 *       link.createHub(hub, controller);
 *   }
 *
 * The facade is single-use: after stop() a new HubLink is required.
 */

#ifndef HUB_LINK_H
#define HUB_LINK_H

#include <Arduino.h>
#include <atomic>
#include "config.h"
#include "types.h"
#include "ble_central.h"
#include "adapter_service.h"
#include "connection_manager.h"
#include "discovery_listener.h"
#include "hub_registry.h"
#include "hub_controller.h"

class HubLink {
public:
    HubLink();
    ~HubLink();

    HubLink(const HubLink&) = delete;
    HubLink& operator=(const HubLink&) = delete;

    // =========================================================================
    // ADAPTERS / LIFECYCLE
    // =========================================================================

    /**
     * @brief Names of the local adapters
     * @param names Output array of name pointers (owned by the adapters)
     * @param maxNames Capacity of names
     * @return Number of adapters (may exceed maxNames)
     */
    static uint8_t listAdapters(BleManager* manager, const char** names, uint8_t maxNames);

    /**
     * @brief Start on adapter N: tasks up, scanning
     * @return OK or ERROR_ADAPTER_UNAVAILABLE
     */
    Result begin(BleManager* manager, uint8_t adapterIndex);

    /**
     * @brief Stop listener, manager, registry (disconnecting hubs) and adapter service
     */
    void stop();

    bool isRunning() const { return _running; }

    BleCentral* getAdapter() const { return _central; }

    /**
     * @brief Attempts and delay used by createHub()
     */
    void setRetryPolicy(uint8_t attempts, uint32_t delayMs);

    uint8_t getRetryCount() const { return _retryCount; }
    uint32_t getRetryDelayMs() const { return _retryDelayMs; }

    // =========================================================================
    // WAIT FOR HUB
    // =========================================================================

    /**
     * @brief Block until any hub is discovered
     */
    Status waitForHub(DiscoveredHub& out);

    /**
     * @brief Block until any hub is discovered or timeoutMs passes
     * @return OK, ERROR_TIMEOUT, ERROR_BUSY, or ERROR_CHANNEL_CLOSED
     */
    Status waitForHubTimeout(uint32_t timeoutMs, DiscoveredHub& out);

    Status waitForHubFilter(const HubFilter& filter, DiscoveredHub& out);

    Status waitForHubFilterTimeout(const HubFilter& filter, uint32_t timeoutMs, DiscoveredHub& out);

    // =========================================================================
    // CONNECT
    // =========================================================================

    /**
     * @brief Connect to a discovered hub, retrying on failure
     * @return OK, or ERROR_RETRIES_EXHAUSTED naming the address and attempt count
     */
    Status createHub(const DiscoveredHub& hub, HubController& out);

    /**
     * @brief Connect by address string ("AA:BB:CC:DD:EE:FF")
     *
     * Uses the discovery log entry when one exists; otherwise the registry
     * identifies the hub from its live properties.
     */
    Status connectToHub(const char* address, HubController& out);

    /**
     * @brief Port controller on a connected hub
     */
    Status getPort(const BleAddress& address, PortSpec port, PortController& out);

    Status disconnectHub(const BleAddress& address);

    /**
     * @brief Snapshot of the discovery log
     */
    Status discoveredHubs(DiscoveredHubList& out);

    // =========================================================================
    // COMPONENTS (diagnostics)
    // =========================================================================

    AdapterService& adapterService() { return _adapterService; }
    ConnectionManager& connectionManager() { return _manager; }
    DiscoveryListener& discoveryListener() { return _listener; }
    HubRegistry& hubRegistry() { return _registry; }

private:
    Status waitFor(const HubFilter* filter, uint32_t timeoutMs, DiscoveredHub& out);

    BleCentral* _central;
    bool _running;
    uint8_t _retryCount;
    uint32_t _retryDelayMs;
    std::atomic<uint32_t> _nextWaitId;

    AdapterService _adapterService;
    ConnectionManager _manager;
    HubRegistry _registry;
    DiscoveryListener _listener;
};

#endif // HUB_LINK_H
