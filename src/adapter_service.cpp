/**
 * @file adapter_service.cpp
 * @brief HubLink adapter service - Implementation
 * @version 1.0.0
 * @platform Adafruit Feather nRF52840 Express
 */

#include "adapter_service.h"

// =============================================================================
// CONSTRUCTOR / DESTRUCTOR
// =============================================================================

AdapterService::AdapterService() :
    _central(nullptr),
    _inbox(ADAPTER_REQUEST_QUEUE_SIZE),
    _exited(xSemaphoreCreateBinary()),
    _running(false)
{
}

AdapterService::~AdapterService() {
    stop();
    if (_exited) {
        vSemaphoreDelete(_exited);
    }
}

// =============================================================================
// LIFECYCLE
// =============================================================================

Result AdapterService::begin(BleCentral* central) {
    if (!central) {
        return Result::ERROR_ADAPTER_UNAVAILABLE;
    }
    if (_running.load() || _inbox.isClosed()) {
        return Result::ERROR_BUSY;
    }

    _central = central;
    _running = true;
    if (xTaskCreate(taskEntry, "adapter", ADAPTER_TASK_STACK, this,
                    ADAPTER_TASK_PRIORITY, nullptr) != pdPASS) {
        _running = false;
        Serial.println(F("[ADAPTER] ERROR: Failed to create task"));
        return Result::ERROR_ADAPTER_UNAVAILABLE;
    }
    return Result::OK;
}

void AdapterService::stop() {
    if (!_running.load()) {
        return;
    }

    AdapterRequest request;
    request.type = AdapterRequestType::STOP;
    if (_inbox.send(std::move(request)) != Result::OK) {
        return;
    }

    if (xSemaphoreTake(_exited, pdMS_TO_TICKS(TASK_EXIT_TIMEOUT_MS)) != pdTRUE) {
        Serial.println(F("[ADAPTER] WARNING: Task did not exit"));
    }
}

void AdapterService::taskEntry(void* param) {
    static_cast<AdapterService*>(param)->run();
    vTaskDelete(nullptr);
}

void AdapterService::run() {
    Serial.printf("[ADAPTER] Service started on %s\n", _central->name());

    AdapterRequest request;
    while (_inbox.receive(request) == Result::OK) {
        if (request.type == AdapterRequestType::STOP) {
            break;
        }
        request.reply.send(handleRequest(request));
    }

    _inbox.close();
    _inbox.drain();
    _running = false;
    Serial.println(F("[ADAPTER] Service stopped"));
    xSemaphoreGive(_exited);
}

// =============================================================================
// REQUEST HANDLING
// =============================================================================

Outcome<PeripheralInfo> AdapterService::handleRequest(const AdapterRequest& request) {
    char addr[BLE_ADDRESS_STRING_LEN];
    request.address.toString(addr, sizeof(addr));

    if (request.type == AdapterRequestType::START_SCAN) {
        if (!_central->startScan()) {
            return Outcome<PeripheralInfo>(Status::error(Result::ERROR_ADAPTER_UNAVAILABLE,
                                                         "Scan start failed on %s", _central->name()));
        }
        return Outcome<PeripheralInfo>(PeripheralInfo());
    }

    PeripheralInfo info;
    info.peripheral = _central->peripheral(request.address);
    if (!info.peripheral) {
        return Outcome<PeripheralInfo>(Status::error(Result::ERROR_PERIPHERAL_NOT_FOUND,
                                                     "Peripheral %s not found", addr));
    }

    switch (request.type) {
        case AdapterRequestType::INSPECT_PERIPHERAL:
            info.hasProperties = info.peripheral->properties(info.advertisement);
            info.connected = info.peripheral->isConnected();
            break;

        case AdapterRequestType::CONNECT_PERIPHERAL:
            if (!info.peripheral->isConnected() && !info.peripheral->connect()) {
                Serial.printf("[ADAPTER] Connect to %s failed\n", addr);
                return Outcome<PeripheralInfo>(Status::error(Result::ERROR_CONNECT_FAILED,
                                                             "Failed to connect to %s", addr));
            }
            info.connected = true;
            break;

        default:
            break;
    }

    return Outcome<PeripheralInfo>(info);
}

// =============================================================================
// CLIENT API
// =============================================================================

Status AdapterService::roundTrip(AdapterRequestType type, const BleAddress& address, PeripheralInfo& out) {
    ReplySender<Outcome<PeripheralInfo>> tx;
    ReplyReceiver<Outcome<PeripheralInfo>> rx;
    makeReplyChannel(tx, rx);

    AdapterRequest request;
    request.type = type;
    request.address = address;
    request.reply = std::move(tx);

    Result sent = _inbox.send(std::move(request));
    if (sent != Result::OK) {
        return Status::error(sent, "Adapter service unavailable");
    }

    Outcome<PeripheralInfo> outcome;
    Result received = rx.receive(outcome);
    if (received != Result::OK) {
        return Status::error(received, "Adapter service dropped request");
    }

    out = outcome.value;
    return outcome.status;
}

Status AdapterService::startScan() {
    PeripheralInfo unused;
    return roundTrip(AdapterRequestType::START_SCAN, BleAddress(), unused);
}

Status AdapterService::resolvePeripheral(const BleAddress& address, BlePeripheral*& out) {
    PeripheralInfo info;
    Status status = roundTrip(AdapterRequestType::RESOLVE_PERIPHERAL, address, info);
    if (status.isOk()) {
        out = info.peripheral;
    }
    return status;
}

Status AdapterService::inspectPeripheral(const BleAddress& address, PeripheralInfo& out) {
    return roundTrip(AdapterRequestType::INSPECT_PERIPHERAL, address, out);
}

Status AdapterService::connectPeripheral(const BleAddress& address, BlePeripheral*& out) {
    PeripheralInfo info;
    Status status = roundTrip(AdapterRequestType::CONNECT_PERIPHERAL, address, info);
    if (status.isOk()) {
        out = info.peripheral;
    }
    return status;
}
