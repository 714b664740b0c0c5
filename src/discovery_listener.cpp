/**
 * @file discovery_listener.cpp
 * @brief HubLink discovery listener - Implementation
 * @version 1.0.0
 * @platform Adafruit Feather nRF52840 Express
 */

#include "discovery_listener.h"
#include "hub_identify.h"

// =============================================================================
// CONSTRUCTOR / DESTRUCTOR
// =============================================================================

DiscoveryListener::DiscoveryListener() :
    _events(nullptr),
    _adapter(nullptr),
    _manager(nullptr),
    _exited(xSemaphoreCreateBinary()),
    _running(false),
    _forwarded(0),
    _dropped(0)
{
}

DiscoveryListener::~DiscoveryListener() {
    stop();
    if (_exited) {
        vSemaphoreDelete(_exited);
    }
}

// =============================================================================
// LIFECYCLE
// =============================================================================

Result DiscoveryListener::begin(Channel<AdapterEvent>* events, AdapterService* adapter,
                               Channel<ManagerMessage>* manager) {
    if (!events || !adapter || !manager) {
        return Result::ERROR_INVALID_PARAM;
    }
    if (_running.load()) {
        return Result::ERROR_BUSY;
    }

    _events = events;
    _adapter = adapter;
    _manager = manager;
    _running = true;
    if (xTaskCreate(taskEntry, "listener", LISTENER_TASK_STACK, this,
                    LISTENER_TASK_PRIORITY, nullptr) != pdPASS) {
        _running = false;
        Serial.println(F("[LISTENER] ERROR: Failed to create task"));
        return Result::ERROR_CHANNEL_CLOSED;
    }
    return Result::OK;
}

void DiscoveryListener::stop() {
    if (!_running.load()) {
        return;
    }

    AdapterEvent shutdown(AdapterEventType::SHUTDOWN, BleAddress());
    if (_events->send(std::move(shutdown)) != Result::OK) {
        return;
    }

    if (xSemaphoreTake(_exited, pdMS_TO_TICKS(TASK_EXIT_TIMEOUT_MS)) != pdTRUE) {
        Serial.println(F("[LISTENER] WARNING: Task did not exit"));
    }
}

void DiscoveryListener::taskEntry(void* param) {
    static_cast<DiscoveryListener*>(param)->run();
    vTaskDelete(nullptr);
}

void DiscoveryListener::run() {
    Serial.println(F("[LISTENER] Started"));

    AdapterEvent event;
    while (true) {
        Result result = _events->receive(event);
        if (result != Result::OK) {
            // No recovery path for a dead radio event source
            Serial.printf("[FATAL] [LISTENER] Adapter event stream lost (%s), resetting\n",
                          resultToString(result));
            _running = false;
            NVIC_SystemReset();
            xSemaphoreGive(_exited);
            return;
        }

        if (handleEvent(event) == ListenerOutcome::SHUTDOWN) {
            break;
        }
    }

    _running = false;
    Serial.println(F("[LISTENER] Stopped"));
    xSemaphoreGive(_exited);
}

// =============================================================================
// EVENT HANDLING
// =============================================================================

ListenerOutcome DiscoveryListener::handleEvent(const AdapterEvent& event) {
    char addr[BLE_ADDRESS_STRING_LEN];
    event.address.toString(addr, sizeof(addr));

    if (event.type == AdapterEventType::SHUTDOWN) {
        return ListenerOutcome::SHUTDOWN;
    }
    if (event.type != AdapterEventType::DEVICE_DISCOVERED) {
        DEBUG_PRINTF("[LISTENER] %s %s\n", adapterEventTypeToString(event.type), addr);
        return ListenerOutcome::IGNORED;
    }

    PeripheralInfo info;
    Status status = _adapter->inspectPeripheral(event.address, info);
    if (!status.isOk()) {
        DEBUG_PRINTF("[LISTENER] %s\n", status.message);
        return ListenerOutcome::NOT_FOUND;
    }

    if (!info.hasProperties || !info.advertisement.hasName) {
        return ListenerOutcome::UNNAMED;
    }
    if (info.connected) {
        return ListenerOutcome::CONNECTED;
    }

    HubKind kind;
    if (!identifyHub(info.advertisement, kind)) {
        DEBUG_PRINTF("[LISTENER] %s \"%s\" is not a hub\n", addr, info.advertisement.name);
        return ListenerOutcome::NOT_A_HUB;
    }

    ManagerMessage message;
    message.type = ManagerMessageType::HUB_DISCOVERED;
    message.hub = DiscoveredHub(kind, event.address, info.advertisement.name);

    Result sent = _manager->send(std::move(message), EVENT_ENQUEUE_TIMEOUT_MS);
    if (sent != Result::OK) {
        _dropped++;
        Serial.printf("[LISTENER] WARNING: Dropped discovery of %s (%s, %lu dropped)\n",
                      addr, resultToString(sent), (unsigned long)_dropped.load());
        return ListenerOutcome::DROPPED;
    }

    _forwarded++;
    return ListenerOutcome::FORWARDED;
}
