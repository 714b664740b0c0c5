/**
 * @file connection_manager.cpp
 * @brief HubLink connection manager - Implementation
 * @version 1.0.0
 * @platform Adafruit Feather nRF52840 Express
 */

#include "connection_manager.h"

// =============================================================================
// CONSTRUCTOR / DESTRUCTOR
// =============================================================================

ConnectionManager::ConnectionManager() :
    _inbox(MANAGER_QUEUE_SIZE),
    _exited(xSemaphoreCreateBinary()),
    _running(false),
    _discoveredCount(0)
{
}

ConnectionManager::~ConnectionManager() {
    stop();
    releaseWaits();
    if (_exited) {
        vSemaphoreDelete(_exited);
    }
}

// =============================================================================
// LIFECYCLE
// =============================================================================

Result ConnectionManager::begin() {
    if (_running.load() || _inbox.isClosed()) {
        return Result::ERROR_BUSY;
    }

    _running = true;
    if (xTaskCreate(taskEntry, "manager", MANAGER_TASK_STACK, this,
                    MANAGER_TASK_PRIORITY, nullptr) != pdPASS) {
        _running = false;
        Serial.println(F("[MANAGER] ERROR: Failed to create task"));
        return Result::ERROR_CHANNEL_CLOSED;
    }
    return Result::OK;
}

void ConnectionManager::stop() {
    if (!_running.load()) {
        return;
    }

    ManagerMessage message;
    message.type = ManagerMessageType::STOP;
    if (_inbox.send(std::move(message)) != Result::OK) {
        return;
    }

    if (xSemaphoreTake(_exited, pdMS_TO_TICKS(TASK_EXIT_TIMEOUT_MS)) != pdTRUE) {
        Serial.println(F("[MANAGER] WARNING: Task did not exit"));
    }
}

void ConnectionManager::taskEntry(void* param) {
    static_cast<ConnectionManager*>(param)->run();
    vTaskDelete(nullptr);
}

void ConnectionManager::run() {
    Serial.println(F("[MANAGER] Started"));

    ManagerMessage message;
    while (_inbox.receive(message) == Result::OK) {
        if (message.type == ManagerMessageType::STOP) {
            break;
        }
        handleMessage(message);
    }

    _inbox.close();
    _inbox.drain();
    releaseWaits();
    _running = false;
    Serial.println(F("[MANAGER] Stopped"));
    xSemaphoreGive(_exited);
}

// =============================================================================
// MESSAGE DISPATCH
// =============================================================================

void ConnectionManager::handleMessage(ManagerMessage& message) {
    switch (message.type) {
        case ManagerMessageType::HUB_DISCOVERED:
            onHubDiscovered(message.hub);
            break;

        case ManagerMessageType::WAIT_FOR_HUB:
            addWait(message.waitId, message.hasFilter ? &message.filter : nullptr,
                    std::move(message.hubReply));
            break;

        case ManagerMessageType::CANCEL_WAIT:
            if (removeWait(message.waitId)) {
                Serial.printf("[MANAGER] Wait %lu retracted\n", (unsigned long)message.waitId);
            }
            break;

        case ManagerMessageType::LOOKUP_HUB: {
            const DiscoveredHub* hub = findDiscovered(message.address);
            if (hub) {
                message.hubReply.send(Outcome<DiscoveredHub>(*hub));
            } else {
                char addr[BLE_ADDRESS_STRING_LEN];
                message.address.toString(addr, sizeof(addr));
                message.hubReply.send(Outcome<DiscoveredHub>(
                    Status::error(Result::ERROR_UNKNOWN_HUB, "Hub %s has not been discovered", addr)));
            }
            break;
        }

        case ManagerMessageType::LIST_HUBS: {
            Outcome<DiscoveredHubList> outcome;
            snapshot(outcome.value);
            message.listReply.send(std::move(outcome));
            break;
        }

        default:
            break;
    }
}

// =============================================================================
// WAIT REGISTRATIONS
// =============================================================================

Result ConnectionManager::addWait(uint32_t waitId, const HubFilter* filter,
                                  ReplySender<Outcome<DiscoveredHub>>&& reply) {
    for (uint8_t i = 0; i < MAX_PENDING_WAITS; i++) {
        PendingWait& wait = _waits[i];
        if (wait.active) {
            continue;
        }

        wait.active = true;
        wait.id = waitId;
        wait.hasFilter = (filter != nullptr);
        if (filter) {
            wait.filter = *filter;
        }
        wait.reply = std::move(reply);

        if (filter) {
            Serial.printf("[MANAGER] Wait %lu registered (%s %s)\n", (unsigned long)waitId,
                          filter->type == HubFilterType::BY_NAME ? "name" : "address", filter->value);
        } else {
            Serial.printf("[MANAGER] Wait %lu registered (any hub)\n", (unsigned long)waitId);
        }
        return Result::OK;
    }

    Serial.printf("[MANAGER] Wait %lu rejected: %d registrations pending\n",
                  (unsigned long)waitId, MAX_PENDING_WAITS);
    reply.send(Outcome<DiscoveredHub>(Status::error(Result::ERROR_BUSY,
        "Too many pending waits (max %d)", MAX_PENDING_WAITS)));
    return Result::ERROR_BUSY;
}

bool ConnectionManager::removeWait(uint32_t waitId) {
    for (uint8_t i = 0; i < MAX_PENDING_WAITS; i++) {
        PendingWait& wait = _waits[i];
        if (wait.active && wait.id == waitId) {
            wait.reply.close();
            wait.active = false;
            return true;
        }
    }
    return false;
}

uint8_t ConnectionManager::pendingWaitCount() const {
    uint8_t count = 0;
    for (uint8_t i = 0; i < MAX_PENDING_WAITS; i++) {
        if (_waits[i].active) {
            count++;
        }
    }
    return count;
}

void ConnectionManager::releaseWaits() {
    for (uint8_t i = 0; i < MAX_PENDING_WAITS; i++) {
        if (_waits[i].active) {
            _waits[i].reply.close();
            _waits[i].active = false;
        }
    }
}

// =============================================================================
// DISCOVERY
// =============================================================================

uint8_t ConnectionManager::onHubDiscovered(const DiscoveredHub& hub) {
    char addr[BLE_ADDRESS_STRING_LEN];
    hub.address.toString(addr, sizeof(addr));
    Serial.printf("[MANAGER] Discovered %s \"%s\" at %s\n", hubKindToString(hub.kind), hub.name, addr);

    uint8_t fulfilled = 0;
    for (uint8_t i = 0; i < MAX_PENDING_WAITS; i++) {
        PendingWait& wait = _waits[i];
        if (!wait.active) {
            continue;
        }
        if (wait.hasFilter && !wait.filter.matches(hub)) {
            continue;
        }

        wait.reply.send(Outcome<DiscoveredHub>(hub));
        wait.active = false;
        fulfilled++;
        Serial.printf("[MANAGER] Wait %lu fulfilled by %s\n", (unsigned long)wait.id, addr);
    }

    recordDiscovery(hub);
    return fulfilled;
}

void ConnectionManager::recordDiscovery(const DiscoveredHub& hub) {
    for (uint8_t i = 0; i < _discoveredCount; i++) {
        if (_discovered[i].address == hub.address) {
            _discovered[i] = hub;
            return;
        }
    }

    if (_discoveredCount >= MAX_DISCOVERED_HUBS) {
        // Evict the oldest entry
        for (uint8_t i = 1; i < _discoveredCount; i++) {
            _discovered[i - 1] = _discovered[i];
        }
        _discoveredCount--;
    }
    _discovered[_discoveredCount++] = hub;
}

const DiscoveredHub* ConnectionManager::findDiscovered(const BleAddress& address) const {
    for (uint8_t i = 0; i < _discoveredCount; i++) {
        if (_discovered[i].address == address) {
            return &_discovered[i];
        }
    }
    return nullptr;
}

void ConnectionManager::snapshot(DiscoveredHubList& out) const {
    out.count = _discoveredCount;
    for (uint8_t i = 0; i < _discoveredCount; i++) {
        out.hubs[i] = _discovered[i];
    }
}

// =============================================================================
// CLIENT API
// =============================================================================

Status ConnectionManager::registerWait(uint32_t waitId, const HubFilter* filter,
                                       ReplyReceiver<Outcome<DiscoveredHub>>& reply) {
    ReplySender<Outcome<DiscoveredHub>> tx;
    makeReplyChannel(tx, reply);

    ManagerMessage message;
    message.type = ManagerMessageType::WAIT_FOR_HUB;
    message.waitId = waitId;
    message.hasFilter = (filter != nullptr);
    if (filter) {
        message.filter = *filter;
    }
    message.hubReply = std::move(tx);

    Result sent = _inbox.send(std::move(message));
    if (sent != Result::OK) {
        return Status::error(sent, "Connection manager unavailable");
    }
    return Status::ok();
}

Status ConnectionManager::cancelWait(uint32_t waitId) {
    ManagerMessage message;
    message.type = ManagerMessageType::CANCEL_WAIT;
    message.waitId = waitId;

    Result sent = _inbox.send(std::move(message));
    if (sent != Result::OK) {
        return Status::error(sent, "Connection manager unavailable");
    }
    return Status::ok();
}

Status ConnectionManager::lookupHub(const BleAddress& address, DiscoveredHub& out) {
    ReplySender<Outcome<DiscoveredHub>> tx;
    ReplyReceiver<Outcome<DiscoveredHub>> rx;
    makeReplyChannel(tx, rx);

    ManagerMessage message;
    message.type = ManagerMessageType::LOOKUP_HUB;
    message.address = address;
    message.hubReply = std::move(tx);

    Result sent = _inbox.send(std::move(message));
    if (sent != Result::OK) {
        return Status::error(sent, "Connection manager unavailable");
    }

    Outcome<DiscoveredHub> outcome;
    Result received = rx.receive(outcome);
    if (received != Result::OK) {
        return Status::error(received, "Connection manager dropped request");
    }
    if (outcome.status.isOk()) {
        out = outcome.value;
    }
    return outcome.status;
}

Status ConnectionManager::listHubs(DiscoveredHubList& out) {
    ReplySender<Outcome<DiscoveredHubList>> tx;
    ReplyReceiver<Outcome<DiscoveredHubList>> rx;
    makeReplyChannel(tx, rx);

    ManagerMessage message;
    message.type = ManagerMessageType::LIST_HUBS;
    message.listReply = std::move(tx);

    Result sent = _inbox.send(std::move(message));
    if (sent != Result::OK) {
        return Status::error(sent, "Connection manager unavailable");
    }

    Outcome<DiscoveredHubList> outcome;
    Result received = rx.receive(outcome);
    if (received != Result::OK) {
        return Status::error(received, "Connection manager dropped request");
    }
    out = outcome.value;
    return outcome.status;
}
