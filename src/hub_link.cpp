/**
 * @file hub_link.cpp
 * @brief HubLink facade - Implementation
 * @version 1.0.0
 * @platform Adafruit Feather nRF52840 Express
 */

#include "hub_link.h"

// =============================================================================
// CONSTRUCTOR / DESTRUCTOR
// =============================================================================

HubLink::HubLink() :
    _central(nullptr),
    _running(false),
    _retryCount(CONNECT_RETRY_COUNT),
    _retryDelayMs(CONNECT_RETRY_DELAY_MS),
    _nextWaitId(1)
{
}

HubLink::~HubLink() {
    stop();
}

// =============================================================================
// ADAPTERS / LIFECYCLE
// =============================================================================

uint8_t HubLink::listAdapters(BleManager* manager, const char** names, uint8_t maxNames) {
    if (!manager) {
        return 0;
    }

    uint8_t count = manager->adapterCount();
    for (uint8_t i = 0; i < count && i < maxNames; i++) {
        BleCentral* central = manager->adapter(i);
        names[i] = central ? central->name() : "";
    }
    return count;
}

Result HubLink::begin(BleManager* manager, uint8_t adapterIndex) {
    if (_running) {
        return Result::ERROR_BUSY;
    }
    if (!manager || adapterIndex >= manager->adapterCount()) {
        Serial.printf("[HUBLINK] ERROR: No adapter at index %u\n", adapterIndex);
        return Result::ERROR_ADAPTER_UNAVAILABLE;
    }

    BleCentral* central = manager->adapter(adapterIndex);
    if (!central || !central->begin()) {
        Serial.printf("[HUBLINK] ERROR: Adapter %u failed to start\n", adapterIndex);
        return Result::ERROR_ADAPTER_UNAVAILABLE;
    }
    _central = central;

    Result result = _adapterService.begin(central);
    if (result == Result::OK) {
        result = _manager.begin();
    }
    if (result == Result::OK) {
        result = _registry.begin(&_adapterService);
    }
    if (result == Result::OK) {
        result = _listener.begin(central->events(), &_adapterService, _manager.inbox());
    }
    if (result != Result::OK) {
        Serial.printf("[HUBLINK] ERROR: Task start failed (%s)\n", resultToString(result));
        _running = true;
        stop();
        return Result::ERROR_ADAPTER_UNAVAILABLE;
    }
    _running = true;

    Status scan = _adapterService.startScan();
    if (!scan.isOk()) {
        Serial.printf("[HUBLINK] ERROR: %s\n", scan.message);
        stop();
        return Result::ERROR_ADAPTER_UNAVAILABLE;
    }

    Serial.printf("[HUBLINK] Scanning on %s\n", central->name());
    return Result::OK;
}

void HubLink::stop() {
    if (!_running) {
        return;
    }
    _running = false;

    // Listener first so no discovery reaches a stopped manager
    _listener.stop();
    _manager.stop();
    _registry.stop();
    _adapterService.stop();
    if (_central) {
        _central->stopScan();
    }
    Serial.println(F("[HUBLINK] Stopped"));
}

void HubLink::setRetryPolicy(uint8_t attempts, uint32_t delayMs) {
    _retryCount = attempts > 0 ? attempts : 1;
    _retryDelayMs = delayMs;
}

// =============================================================================
// WAIT FOR HUB
// =============================================================================

Status HubLink::waitForHub(DiscoveredHub& out) {
    return waitFor(nullptr, WAIT_FOREVER_MS, out);
}

Status HubLink::waitForHubTimeout(uint32_t timeoutMs, DiscoveredHub& out) {
    return waitFor(nullptr, timeoutMs, out);
}

Status HubLink::waitForHubFilter(const HubFilter& filter, DiscoveredHub& out) {
    return waitFor(&filter, WAIT_FOREVER_MS, out);
}

Status HubLink::waitForHubFilterTimeout(const HubFilter& filter, uint32_t timeoutMs, DiscoveredHub& out) {
    return waitFor(&filter, timeoutMs, out);
}

Status HubLink::waitFor(const HubFilter* filter, uint32_t timeoutMs, DiscoveredHub& out) {
    uint32_t waitId = _nextWaitId++;

    ReplyReceiver<Outcome<DiscoveredHub>> reply;
    Status status = _manager.registerWait(waitId, filter, reply);
    if (!status.isOk()) {
        return status;
    }

    Outcome<DiscoveredHub> outcome;
    Result received = reply.receive(outcome, timeoutMs);
    if (received == Result::ERROR_TIMEOUT) {
        // The manager either fulfils the wait ahead of the cancel or closes it
        uint32_t settleMs = _manager.cancelWait(waitId).isOk() ? TASK_EXIT_TIMEOUT_MS : 0;
        Result settled = reply.receive(outcome, settleMs);
        if (settled != Result::OK) {
            Serial.printf("[HUBLINK] Wait %lu timed out after %lu ms\n",
                          (unsigned long)waitId, (unsigned long)timeoutMs);
            return Status::error(Result::ERROR_TIMEOUT, "Timeout reached after %lu ms",
                                 (unsigned long)timeoutMs);
        }
    } else if (received != Result::OK) {
        return Status::error(received, "Connection manager closed the wait");
    }

    if (outcome.status.isOk()) {
        out = outcome.value;
    }
    return outcome.status;
}

// =============================================================================
// CONNECT
// =============================================================================

Status HubLink::createHub(const DiscoveredHub& hub, HubController& out) {
    char addr[BLE_ADDRESS_STRING_LEN];
    hub.address.toString(addr, sizeof(addr));

    for (uint8_t attempt = 1; attempt <= _retryCount; attempt++) {
        Serial.printf("[HUBLINK] Connecting to hub %s attempt %u of %u...\n",
                      addr, attempt, _retryCount);

        Status status = registryConnectToHub(_registry.inbox(), hub, out);
        if (status.isOk()) {
            return status;
        }
        Serial.printf("[HUBLINK] WARNING: %s (%s)\n", status.message, resultToString(status.code));

        if (attempt < _retryCount) {
            delay(_retryDelayMs);
        }
    }

    return Status::error(Result::ERROR_RETRIES_EXHAUSTED, "Unable to connect to %s after %u tries",
                         addr, _retryCount);
}

Status HubLink::connectToHub(const char* address, HubController& out) {
    BleAddress parsed;
    if (!BleAddress::fromString(address, parsed)) {
        return Status::error(Result::ERROR_INVALID_PARAM, "Invalid address '%s'",
                             address ? address : "");
    }

    DiscoveredHub hub;
    Status status = _manager.lookupHub(parsed, hub);
    if (!status.isOk()) {
        if (status.code != Result::ERROR_UNKNOWN_HUB) {
            return status;
        }
        // Never advertised to us: let the registry identify it on connect
        hub = DiscoveredHub(HubKind::UNKNOWN, parsed, "");
    }
    return createHub(hub, out);
}

Status HubLink::getPort(const BleAddress& address, PortSpec port, PortController& out) {
    return registryGetPort(_registry.inbox(), address, port, out);
}

Status HubLink::disconnectHub(const BleAddress& address) {
    return registryDisconnect(_registry.inbox(), address);
}

Status HubLink::discoveredHubs(DiscoveredHubList& out) {
    return _manager.listHubs(out);
}
