/**
 * @file connection_manager.h
 * @brief HubLink connection manager - Discovery log and wait-for-hub registrations
 * @version 1.0.0
 * @platform Adafruit Feather nRF52840 Express
 *
 * Actor task owning:
 * - the discovery log, one entry per hub address (a rediscovery refreshes
 *   kind and name in place; oldest entry is evicted when full)
 * - up to MAX_PENDING_WAITS wait registrations, each with its own id,
 *   optional HubFilter, and reply slot
 *
 * Every HubDiscovered message is offered to every registration; each one it
 * matches receives the hub and is removed. Non-matching registrations stay.
 */

#ifndef CONNECTION_MANAGER_H
#define CONNECTION_MANAGER_H

#include <Arduino.h>
#include <atomic>
#include "config.h"
#include "types.h"
#include "rtos_channel.h"

// =============================================================================
// MESSAGES
// =============================================================================

enum class ManagerMessageType : uint8_t {
    HUB_DISCOVERED = 0,     // From DiscoveryListener
    WAIT_FOR_HUB,           // Register a wait (reply via hubReply)
    CANCEL_WAIT,            // Retract a wait by id (no reply)
    LOOKUP_HUB,             // Discovery log lookup by address (reply via hubReply)
    LIST_HUBS,              // Discovery log snapshot (reply via listReply)
    STOP
};

/**
 * @brief Snapshot of the discovery log, oldest first
 */
struct DiscoveredHubList {
    uint8_t count;
    DiscoveredHub hubs[MAX_DISCOVERED_HUBS];

    DiscoveredHubList() : count(0) {}
};

struct ManagerMessage {
    ManagerMessageType type;
    DiscoveredHub hub;
    BleAddress address;
    uint32_t waitId;
    bool hasFilter;
    HubFilter filter;
    ReplySender<Outcome<DiscoveredHub>> hubReply;
    ReplySender<Outcome<DiscoveredHubList>> listReply;

    ManagerMessage() :
        type(ManagerMessageType::STOP),
        hub(),
        address(),
        waitId(0),
        hasFilter(false),
        filter(),
        hubReply(),
        listReply()
    {}
};

// =============================================================================
// CONNECTION MANAGER CLASS
// =============================================================================

class ConnectionManager {
public:
    ConnectionManager();
    ~ConnectionManager();

    ConnectionManager(const ConnectionManager&) = delete;
    ConnectionManager& operator=(const ConnectionManager&) = delete;

    /**
     * @brief Start the actor task
     */
    Result begin();

    /**
     * @brief Stop the actor; outstanding waits see ERROR_CHANNEL_CLOSED
     */
    void stop();

    bool isRunning() const { return _running.load(); }

    /**
     * @brief Inbox the DiscoveryListener posts HUB_DISCOVERED messages to
     */
    Channel<ManagerMessage>* inbox() { return &_inbox; }

    // =========================================================================
    // CLIENT API (any task)
    // =========================================================================

    /**
     * @brief Register a wait and hand back its reply slot
     * @param waitId Caller-unique id, used by cancelWait()
     * @param filter Optional filter (nullptr matches any hub)
     * @param reply Receives the matching hub, or ERROR_BUSY if the table is full
     */
    Status registerWait(uint32_t waitId, const HubFilter* filter,
                        ReplyReceiver<Outcome<DiscoveredHub>>& reply);

    /**
     * @brief Retract a registration (no-op if it was already fulfilled)
     */
    Status cancelWait(uint32_t waitId);

    /**
     * @brief Look up the discovery log entry for an address
     * @return OK or ERROR_UNKNOWN_HUB
     */
    Status lookupHub(const BleAddress& address, DiscoveredHub& out);

    Status listHubs(DiscoveredHubList& out);

    // =========================================================================
    // ACTOR STATE (task context)
    // =========================================================================

    /**
     * @brief Dispatch one inbox message
     */
    void handleMessage(ManagerMessage& message);

    /**
     * @brief Store a registration
     * @return OK, or ERROR_BUSY (reply is closed with the error)
     */
    Result addWait(uint32_t waitId, const HubFilter* filter,
                   ReplySender<Outcome<DiscoveredHub>>&& reply);

    bool removeWait(uint32_t waitId);

    /**
     * @brief Fulfil matching registrations and record the hub
     * @return Number of registrations fulfilled
     */
    uint8_t onHubDiscovered(const DiscoveredHub& hub);

    uint8_t pendingWaitCount() const;

    uint8_t discoveredCount() const { return _discoveredCount; }

    const DiscoveredHub* findDiscovered(const BleAddress& address) const;

    void snapshot(DiscoveredHubList& out) const;

private:
    struct PendingWait {
        bool active;
        uint32_t id;
        bool hasFilter;
        HubFilter filter;
        ReplySender<Outcome<DiscoveredHub>> reply;

        PendingWait() : active(false), id(0), hasFilter(false), filter(), reply() {}
    };

    static void taskEntry(void* param);
    void run();

    void recordDiscovery(const DiscoveredHub& hub);
    void releaseWaits();

    Channel<ManagerMessage> _inbox;
    SemaphoreHandle_t _exited;
    std::atomic<bool> _running;

    PendingWait _waits[MAX_PENDING_WAITS];
    DiscoveredHub _discovered[MAX_DISCOVERED_HUBS];
    uint8_t _discoveredCount;
};

#endif // CONNECTION_MANAGER_H
