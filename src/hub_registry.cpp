/**
 * @file hub_registry.cpp
 * @brief HubLink hub registry - Implementation
 * @version 1.0.0
 * @platform Adafruit Feather nRF52840 Express
 */

#include "hub_registry.h"
#include "hub_identify.h"

// =============================================================================
// CONSTRUCTOR / DESTRUCTOR
// =============================================================================

HubRegistry::HubRegistry() :
    _adapter(nullptr),
    _inbox(REGISTRY_QUEUE_SIZE),
    _exited(xSemaphoreCreateBinary()),
    _running(false),
    _notifications(0),
    _notificationDrops(0),
    _parseFailures(0)
{
    for (uint8_t i = 0; i < MAX_HUBS; i++) {
        _hubs[i].active = false;
        _hubs[i].peripheral = nullptr;
        _hubs[i].route.registry = this;
    }
}

HubRegistry::~HubRegistry() {
    stop();
    if (_exited) {
        vSemaphoreDelete(_exited);
    }
}

// =============================================================================
// LIFECYCLE
// =============================================================================

Result HubRegistry::begin(AdapterService* adapter) {
    if (!adapter) {
        return Result::ERROR_ADAPTER_UNAVAILABLE;
    }
    if (_running.load() || _inbox.isClosed()) {
        return Result::ERROR_BUSY;
    }

    _adapter = adapter;
    _running = true;
    if (xTaskCreate(taskEntry, "registry", REGISTRY_TASK_STACK, this,
                    REGISTRY_TASK_PRIORITY, nullptr) != pdPASS) {
        _running = false;
        Serial.println(F("[REGISTRY] ERROR: Failed to create task"));
        return Result::ERROR_CHANNEL_CLOSED;
    }
    return Result::OK;
}

void HubRegistry::stop() {
    if (!_running.load()) {
        return;
    }

    RegistryRequest request;
    request.type = RegistryRequestType::STOP;
    if (_inbox.send(std::move(request)) != Result::OK) {
        return;
    }

    if (xSemaphoreTake(_exited, pdMS_TO_TICKS(TASK_EXIT_TIMEOUT_MS)) != pdTRUE) {
        Serial.println(F("[REGISTRY] WARNING: Task did not exit"));
    }
}

void HubRegistry::taskEntry(void* param) {
    static_cast<HubRegistry*>(param)->run();
    vTaskDelete(nullptr);
}

void HubRegistry::run() {
    Serial.println(F("[REGISTRY] Started"));

    RegistryRequest request;
    while (_inbox.receive(request) == Result::OK) {
        if (request.type == RegistryRequestType::STOP) {
            break;
        }
        handleRequest(request);
    }

    disconnectAll();
    _inbox.close();
    _inbox.drain();
    _running = false;
    Serial.println(F("[REGISTRY] Stopped"));
    xSemaphoreGive(_exited);
}

// =============================================================================
// REQUEST DISPATCH
// =============================================================================

void HubRegistry::handleRequest(RegistryRequest& request) {
    switch (request.type) {
        case RegistryRequestType::CONNECT_TO_HUB: {
            Outcome<HubController> outcome;
            outcome.status = connectToHub(request.hub, outcome.value);
            request.hubReply.send(std::move(outcome));
            break;
        }

        case RegistryRequestType::GET_PORT: {
            Outcome<PortController> outcome;
            outcome.status = getPort(request.address, request.port, outcome.value);
            request.portReply.send(std::move(outcome));
            break;
        }

        case RegistryRequestType::SEND_TO_HUB:
            request.statusReply.send(sendToHub(request.address, request.message));
            break;

        case RegistryRequestType::DISCONNECT:
            request.statusReply.send(disconnect(request.address));
            break;

        case RegistryRequestType::NOTIFICATION:
            onNotification(request.address, request.message);
            break;

        default:
            break;
    }
}

// =============================================================================
// CONNECT
// =============================================================================

Status HubRegistry::connectToHub(const DiscoveredHub& discovered, HubController& out) {
    char addr[BLE_ADDRESS_STRING_LEN];
    discovered.address.toString(addr, sizeof(addr));

    HubSlot* existing = findSlot(discovered.address);
    if (existing) {
        out = HubController(discovered.address, existing->hub.getKind(),
                            existing->hub.getName(), &_inbox);
        Serial.printf("[REGISTRY] %s already connected\n", addr);
        return Status::ok();
    }

    HubSlot* slot = freeSlot();
    if (!slot) {
        return Status::error(Result::ERROR_CONNECT_FAILED,
                             "No free hub slot for %s (max %d)", addr, MAX_HUBS);
    }

    if (!_adapter) {
        return Status::error(Result::ERROR_ADAPTER_UNAVAILABLE, "Registry not started");
    }

    Serial.printf("[REGISTRY] Connecting to %s\n", addr);

    // Peripheral lookup + link establishment go through the adapter owner
    BlePeripheral* peripheral = nullptr;
    Status status = _adapter->connectPeripheral(discovered.address, peripheral);
    if (!status.isOk()) {
        return status;
    }

    BleCharacteristic characteristics[MAX_CHARACTERISTICS];
    uint8_t characteristicCount = 0;
    if (!peripheral->discoverCharacteristics(characteristics, MAX_CHARACTERISTICS, characteristicCount)) {
        peripheral->disconnect();
        return Status::error(Result::ERROR_CONNECT_FAILED,
                             "Characteristic discovery on %s failed", addr);
    }

    // Caller did not know the kind: identify from live properties
    HubKind kind = discovered.kind;
    char name[HUB_NAME_MAX];
    strncpy(name, discovered.name, HUB_NAME_MAX - 1);
    name[HUB_NAME_MAX - 1] = '\0';
    if (kind == HubKind::UNKNOWN) {
        name[0] = '\0';
        BleAdvertisement advertisement;
        if (peripheral->properties(advertisement)) {
            if (!identifyHub(advertisement, kind)) {
                kind = HubKind::UNKNOWN;
            }
            if (advertisement.hasName) {
                strncpy(name, advertisement.name, HUB_NAME_MAX - 1);
                name[HUB_NAME_MAX - 1] = '\0';
            }
        }
    }

    slot->route.registry = this;
    slot->route.address = discovered.address;
    peripheral->onNotification(notificationCallback, &slot->route);

    const BleCharacteristic* control = nullptr;
    for (uint8_t i = 0; i < characteristicCount; i++) {
        if (characteristics[i].uuid == lpf2CharacteristicUuid()) {
            control = &characteristics[i];
            break;
        }
    }
    if (!control) {
        peripheral->onNotification(nullptr, nullptr);
        peripheral->disconnect();
        return Status::error(Result::ERROR_CHARACTERISTIC_MISSING,
                             "LPF2 characteristic not found on %s", addr);
    }

    if (!peripheral->subscribe(*control)) {
        peripheral->onNotification(nullptr, nullptr);
        peripheral->disconnect();
        return Status::error(Result::ERROR_CONNECT_FAILED, "Subscribe on %s failed", addr);
    }

    status = slot->hub.init(kind, peripheral, characteristics, characteristicCount, name);
    if (!status.isOk()) {
        peripheral->onNotification(nullptr, nullptr);
        Serial.printf("[REGISTRY] %s at %s, disconnecting\n", status.message, addr);
        peripheral->disconnect();
        return status;
    }

    slot->peripheral = peripheral;
    slot->active = true;

    out = HubController(discovered.address, kind, slot->hub.getName(), &_inbox);
    Serial.printf("[REGISTRY] Connected %s \"%s\" at %s\n", hubKindToString(kind), name, addr);
    return Status::ok();
}

// =============================================================================
// PORTS / SEND / DISCONNECT
// =============================================================================

Status HubRegistry::getPort(const BleAddress& address, PortSpec port, PortController& out) {
    char addr[BLE_ADDRESS_STRING_LEN];
    address.toString(addr, sizeof(addr));

    HubSlot* slot = findSlot(address);
    if (!slot) {
        return Status::error(Result::ERROR_UNKNOWN_HUB, "Hub %s is not connected", addr);
    }

    uint8_t portId = 0;
    if (!slot->hub.findPortId(port, portId)) {
        return Status::error(Result::ERROR_UNKNOWN_PORT, "Port %s does not exist on hub %s",
                             portSpecToString(port), addr);
    }

    out = PortController(portId, port, createDevice(portId, port, address, &_inbox));
    return Status::ok();
}

Status HubRegistry::sendToHub(const BleAddress& address, const Lpf2Message& message) {
    HubSlot* slot = findSlot(address);
    if (!slot) {
        char addr[BLE_ADDRESS_STRING_LEN];
        address.toString(addr, sizeof(addr));
        return Status::error(Result::ERROR_UNKNOWN_HUB, "Hub %s is not connected", addr);
    }
    return slot->hub.send(message);
}

Status HubRegistry::disconnect(const BleAddress& address) {
    HubSlot* slot = findSlot(address);
    if (!slot) {
        char addr[BLE_ADDRESS_STRING_LEN];
        address.toString(addr, sizeof(addr));
        return Status::error(Result::ERROR_UNKNOWN_HUB, "Hub %s is not connected", addr);
    }

    // Forget the hub first; the disconnect outcome does not bring it back
    Hub hub = slot->hub;
    releaseSlot(*slot);
    return hub.disconnect();
}

// =============================================================================
// NOTIFICATIONS
// =============================================================================

void HubRegistry::onNotification(const BleAddress& address, const Lpf2Message& message) {
    _notifications++;

    char addr[BLE_ADDRESS_STRING_LEN];
    address.toString(addr, sizeof(addr));
    if (message.hasPort()) {
        Serial.printf("[REGISTRY] [%s] %s port=%u len=%u\n", addr, message.getTypeString(),
                      message.getPortId(), message.getPayloadLength());
    } else {
        Serial.printf("[REGISTRY] [%s] %s len=%u\n", addr, message.getTypeString(),
                      message.getPayloadLength());
    }
}

void HubRegistry::notificationCallback(void* context, const uint8_t* data, uint16_t length) {
    NotificationRoute* route = static_cast<NotificationRoute*>(context);
    if (!route || !route->registry) {
        return;
    }
    HubRegistry* registry = route->registry;

    RegistryRequest request;
    if (Lpf2Message::parse(data, length, request.message) != Result::OK) {
        registry->_parseFailures++;
        Serial.printf("[REGISTRY] WARNING: Unparseable notification (%u bytes) dropped\n", length);
        return;
    }

    request.type = RegistryRequestType::NOTIFICATION;
    request.address = route->address;

    Result sent = registry->_inbox.send(std::move(request), NOTIFICATION_ENQUEUE_TIMEOUT_MS);
    if (sent != Result::OK) {
        registry->_notificationDrops++;
        Serial.printf("[REGISTRY] WARNING: Notification dropped (%s)\n", resultToString(sent));
    }
}

// =============================================================================
// SLOTS
// =============================================================================

HubRegistry::HubSlot* HubRegistry::findSlot(const BleAddress& address) {
    for (uint8_t i = 0; i < MAX_HUBS; i++) {
        if (_hubs[i].active && _hubs[i].route.address == address) {
            return &_hubs[i];
        }
    }
    return nullptr;
}

const HubRegistry::HubSlot* HubRegistry::findSlot(const BleAddress& address) const {
    for (uint8_t i = 0; i < MAX_HUBS; i++) {
        if (_hubs[i].active && _hubs[i].route.address == address) {
            return &_hubs[i];
        }
    }
    return nullptr;
}

HubRegistry::HubSlot* HubRegistry::freeSlot() {
    for (uint8_t i = 0; i < MAX_HUBS; i++) {
        if (!_hubs[i].active) {
            return &_hubs[i];
        }
    }
    return nullptr;
}

void HubRegistry::releaseSlot(HubSlot& slot) {
    slot.active = false;
    if (slot.peripheral) {
        slot.peripheral->onNotification(nullptr, nullptr);
    }
    slot.peripheral = nullptr;
    slot.hub.reset();
}

void HubRegistry::disconnectAll() {
    for (uint8_t i = 0; i < MAX_HUBS; i++) {
        if (!_hubs[i].active) {
            continue;
        }
        Hub hub = _hubs[i].hub;
        releaseSlot(_hubs[i]);
        Status status = hub.disconnect();
        if (!status.isOk()) {
            Serial.printf("[REGISTRY] WARNING: %s\n", status.message);
        }
    }
}

uint8_t HubRegistry::hubCount() const {
    uint8_t count = 0;
    for (uint8_t i = 0; i < MAX_HUBS; i++) {
        if (_hubs[i].active) {
            count++;
        }
    }
    return count;
}

bool HubRegistry::hasHub(const BleAddress& address) const {
    return findSlot(address) != nullptr;
}

// =============================================================================
// CLIENT ROUND TRIPS
// =============================================================================

Status registryConnectToHub(Channel<RegistryRequest>* registry, const DiscoveredHub& hub,
                            HubController& out) {
    ReplySender<Outcome<HubController>> tx;
    ReplyReceiver<Outcome<HubController>> rx;
    makeReplyChannel(tx, rx);

    RegistryRequest request;
    request.type = RegistryRequestType::CONNECT_TO_HUB;
    request.hub = hub;
    request.hubReply = std::move(tx);

    Result sent = registry->send(std::move(request));
    if (sent != Result::OK) {
        return Status::error(sent, "Hub registry unavailable");
    }

    Outcome<HubController> outcome;
    Result received = rx.receive(outcome);
    if (received != Result::OK) {
        return Status::error(received, "Hub registry dropped request");
    }
    if (outcome.status.isOk()) {
        out = outcome.value;
    }
    return outcome.status;
}

Status registryGetPort(Channel<RegistryRequest>* registry, const BleAddress& address,
                       PortSpec port, PortController& out) {
    ReplySender<Outcome<PortController>> tx;
    ReplyReceiver<Outcome<PortController>> rx;
    makeReplyChannel(tx, rx);

    RegistryRequest request;
    request.type = RegistryRequestType::GET_PORT;
    request.address = address;
    request.port = port;
    request.portReply = std::move(tx);

    Result sent = registry->send(std::move(request));
    if (sent != Result::OK) {
        return Status::error(sent, "Hub registry unavailable");
    }

    Outcome<PortController> outcome;
    Result received = rx.receive(outcome);
    if (received != Result::OK) {
        return Status::error(received, "Hub registry dropped request");
    }
    if (outcome.status.isOk()) {
        out = std::move(outcome.value);
    }
    return outcome.status;
}

Status registrySendToHub(Channel<RegistryRequest>* registry, const BleAddress& address,
                         const Lpf2Message& message) {
    ReplySender<Status> tx;
    ReplyReceiver<Status> rx;
    makeReplyChannel(tx, rx);

    RegistryRequest request;
    request.type = RegistryRequestType::SEND_TO_HUB;
    request.address = address;
    request.message = message;
    request.statusReply = std::move(tx);

    Result sent = registry->send(std::move(request));
    if (sent != Result::OK) {
        return Status::error(sent, "Hub registry unavailable");
    }

    Status status;
    Result received = rx.receive(status);
    if (received != Result::OK) {
        return Status::error(received, "Hub registry dropped request");
    }
    return status;
}

Status registryDisconnect(Channel<RegistryRequest>* registry, const BleAddress& address) {
    ReplySender<Status> tx;
    ReplyReceiver<Status> rx;
    makeReplyChannel(tx, rx);

    RegistryRequest request;
    request.type = RegistryRequestType::DISCONNECT;
    request.address = address;
    request.statusReply = std::move(tx);

    Result sent = registry->send(std::move(request));
    if (sent != Result::OK) {
        return Status::error(sent, "Hub registry unavailable");
    }

    Status status;
    Result received = rx.receive(status);
    if (received != Result::OK) {
        return Status::error(received, "Hub registry dropped request");
    }
    return status;
}
