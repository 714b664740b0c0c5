/**
 * @file discovery_listener.h
 * @brief HubLink discovery listener - Adapter events to HubDiscovered messages
 * @version 1.0.0
 * @platform Adafruit Feather nRF52840 Express
 *
 * Dedicated task blocking on the adapter's event stream. For every
 * DEVICE_DISCOVERED event it snapshots the peripheral through the
 * AdapterService, skips unnamed or already connected devices, identifies
 * the rest, and forwards positive results to the ConnectionManager.
 *
 * A SHUTDOWN event ends the task cleanly. A closed event stream means the
 * radio stack is gone and nothing can recover it: the MCU is reset.
 */

#ifndef DISCOVERY_LISTENER_H
#define DISCOVERY_LISTENER_H

#include <Arduino.h>
#include <atomic>
#include "config.h"
#include "types.h"
#include "rtos_channel.h"
#include "ble_central.h"
#include "adapter_service.h"
#include "connection_manager.h"

/**
 * @brief What the listener did with one adapter event
 */
enum class ListenerOutcome : uint8_t {
    FORWARDED = 0,      // HubDiscovered sent to the manager
    IGNORED,            // Event type not handled
    NOT_FOUND,          // Adapter could not resolve the address
    UNNAMED,            // No advertised name
    CONNECTED,          // Already connected
    NOT_A_HUB,          // Identification failed
    DROPPED,            // Manager queue full or closed
    SHUTDOWN
};

inline const char* listenerOutcomeToString(ListenerOutcome outcome) {
    switch (outcome) {
        case ListenerOutcome::FORWARDED: return "FORWARDED";
        case ListenerOutcome::IGNORED: return "IGNORED";
        case ListenerOutcome::NOT_FOUND: return "NOT_FOUND";
        case ListenerOutcome::UNNAMED: return "UNNAMED";
        case ListenerOutcome::CONNECTED: return "CONNECTED";
        case ListenerOutcome::NOT_A_HUB: return "NOT_A_HUB";
        case ListenerOutcome::DROPPED: return "DROPPED";
        case ListenerOutcome::SHUTDOWN: return "SHUTDOWN";
        default: return "UNKNOWN";
    }
}

// =============================================================================
// DISCOVERY LISTENER CLASS
// =============================================================================

class DiscoveryListener {
public:
    DiscoveryListener();
    ~DiscoveryListener();

    DiscoveryListener(const DiscoveryListener&) = delete;
    DiscoveryListener& operator=(const DiscoveryListener&) = delete;

    /**
     * @brief Start the listener task
     * @param events Adapter event stream
     * @param adapter Service used to snapshot peripherals
     * @param manager ConnectionManager inbox
     */
    Result begin(Channel<AdapterEvent>* events, AdapterService* adapter,
                 Channel<ManagerMessage>* manager);

    /**
     * @brief Post SHUTDOWN on the event stream and wait for the task to exit
     */
    void stop();

    bool isRunning() const { return _running.load(); }

    /**
     * @brief Process one adapter event (listener task context)
     */
    ListenerOutcome handleEvent(const AdapterEvent& event);

    uint32_t getForwardedCount() const { return _forwarded.load(); }
    uint32_t getDroppedCount() const { return _dropped.load(); }

private:
    static void taskEntry(void* param);
    void run();

    Channel<AdapterEvent>* _events;
    AdapterService* _adapter;
    Channel<ManagerMessage>* _manager;
    SemaphoreHandle_t _exited;
    std::atomic<bool> _running;
    std::atomic<uint32_t> _forwarded;
    std::atomic<uint32_t> _dropped;
};

#endif // DISCOVERY_LISTENER_H
