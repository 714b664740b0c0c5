/**
 * @file bluefruit_central.cpp
 * @brief HubLink Bluefruit backend - Implementation
 * @version 1.0.0
 * @platform Adafruit Feather nRF52840 Express
 */

#include "bluefruit_central.h"
#include "hub_identify.h"

// Global instance pointer for static callbacks
BluefruitCentral* g_bluefruitCentral = nullptr;

// Connection buffers: LPF2 frames fit a 23 byte MTU, notifications can burst
#define BLUEFRUIT_MTU 23
#define BLUEFRUIT_EVENT_LEN 6
#define BLUEFRUIT_HVN_QSIZE 8
#define BLUEFRUIT_WRCMD_QSIZE 8

// Peripheral entries not seen for this long may be recycled
#define PERIPHERAL_STALE_MS 60000

static BleAddress addressFromGap(const ble_gap_addr_t& gap) {
    // Soft Device stores the address LSB first
    BleAddress address;
    for (uint8_t i = 0; i < 6; i++) {
        address.bytes[i] = gap.addr[5 - i];
    }
    return address;
}

static void reverseUuid(const BleUuid& uuid, uint8_t* out) {
    for (uint8_t i = 0; i < 16; i++) {
        out[i] = uuid.bytes[15 - i];
    }
}

// =============================================================================
// PERIPHERAL
// =============================================================================

BluefruitPeripheral::BluefruitPeripheral() :
    _central(nullptr)
{
    reset();
}

void BluefruitPeripheral::reset() {
    _inUse = false;
    _announced = false;
    _lastSeenMs = 0;
    _address = BleAddress();
    memset(&_gapAddress, 0, sizeof(_gapAddress));
    _advertisement.clear();
    _connHandle = CONN_HANDLE_INVALID;
    _clientSlot = -1;
    _notifyCallback = nullptr;
    _notifyContext = nullptr;
}

bool BluefruitPeripheral::properties(BleAdvertisement& out) {
    _central->lock();
    bool known = _inUse && _lastSeenMs != 0;
    if (known) {
        out = _advertisement;
    }
    _central->unlock();
    return known;
}

bool BluefruitPeripheral::isConnected() {
    _central->lock();
    bool connected = _connHandle != CONN_HANDLE_INVALID;
    _central->unlock();
    return connected;
}

bool BluefruitPeripheral::connect() {
    if (isConnected()) {
        return true;
    }
    return _central->connectPeripheral(*this);
}

bool BluefruitPeripheral::discoverCharacteristics(BleCharacteristic* out, uint8_t maxCount, uint8_t& count) {
    count = 0;
    if (!isConnected()) {
        return false;
    }
    return _central->discoverLpf2(*this, out, maxCount, count);
}

bool BluefruitPeripheral::subscribe(const BleCharacteristic& characteristic) {
    BluefruitCentral::ClientSlot* client = _central->clientFor(*this);
    if (!client || client->characteristic.valueHandle() != characteristic.handle) {
        return false;
    }
    return client->characteristic.enableNotify();
}

void BluefruitPeripheral::onNotification(BleNotifyCallback callback, void* context) {
    _central->lock();
    _notifyCallback = callback;
    _notifyContext = context;
    _central->unlock();
}

bool BluefruitPeripheral::write(const BleCharacteristic& characteristic, const uint8_t* data, uint16_t length) {
    BluefruitCentral::ClientSlot* client = _central->clientFor(*this);
    if (!client || client->characteristic.valueHandle() != characteristic.handle) {
        return false;
    }
    return client->characteristic.write(data, length) == length;
}

bool BluefruitPeripheral::disconnect() {
    _central->lock();
    uint16_t connHandle = _connHandle;
    _central->unlock();

    if (connHandle == CONN_HANDLE_INVALID) {
        return true;
    }
    return Bluefruit.disconnect(connHandle);
}

// =============================================================================
// CENTRAL - INITIALIZATION
// =============================================================================

BluefruitCentral::BluefruitCentral() :
    _initialized(false),
    _scanning(false),
    _lock(nullptr),
    _connectDone(nullptr),
    _connecting(nullptr),
    _events(ADAPTER_EVENT_QUEUE_SIZE)
{
    for (uint8_t i = 0; i < MAX_PERIPHERALS; i++) {
        _peripherals[i]._central = this;
    }
    for (uint8_t i = 0; i < MAX_HUBS; i++) {
        _clients[i].inUse = false;
        _clients[i].connHandle = CONN_HANDLE_INVALID;
        _clients[i].peripheral = nullptr;
    }

    // Set global instance for static callbacks
    g_bluefruitCentral = this;
}

bool BluefruitCentral::begin() {
    if (_initialized) {
        return true;
    }

    Serial.println(F("[BLUEFRUIT] Initializing central..."));

    _lock = xSemaphoreCreateMutex();
    _connectDone = xSemaphoreCreateBinary();
    if (!_lock || !_connectDone) {
        Serial.println(F("[BLUEFRUIT] ERROR: Semaphore allocation failed"));
        return false;
    }

    // Must be configured before Bluefruit.begin()
    Bluefruit.configCentralConn(BLUEFRUIT_MTU, BLUEFRUIT_EVENT_LEN, BLUEFRUIT_HVN_QSIZE, BLUEFRUIT_WRCMD_QSIZE);

    // 0 peripheral, MAX_HUBS central connections
    if (!Bluefruit.begin(0, MAX_HUBS)) {
        Serial.println(F("[BLUEFRUIT] ERROR: Bluefruit.begin failed"));
        return false;
    }
    Bluefruit.setName(FIRMWARE_NAME);
    Bluefruit.setTxPower(0);

    Bluefruit.Central.setConnectCallback(_onConnect);
    Bluefruit.Central.setDisconnectCallback(_onDisconnect);

    // One LPF2 client service/characteristic pair per connection
    reverseUuid(lpf2HubServiceUuid(), _serviceUuidLe);
    reverseUuid(lpf2CharacteristicUuid(), _characteristicUuidLe);
    for (uint8_t i = 0; i < MAX_HUBS; i++) {
        _clients[i].service.uuid = BLEUuid(_serviceUuidLe);
        _clients[i].service.begin();
        _clients[i].characteristic.uuid = BLEUuid(_characteristicUuidLe);
        _clients[i].characteristic.setNotifyCallback(_onNotify);
        _clients[i].characteristic.begin(&_clients[i].service);
    }

    _initialized = true;
    Serial.printf("[BLUEFRUIT] Initialization complete (%d connections)\n", MAX_HUBS);
    return true;
}

// =============================================================================
// CENTRAL - SCANNING
// =============================================================================

bool BluefruitCentral::startScan() {
    if (!_initialized) {
        return false;
    }

    Bluefruit.Scanner.setRxCallback(_onScanCallback);
    Bluefruit.Scanner.restartOnDisconnect(true);

    // Hubs put the service UUID in the advertisement and the name in the
    // scan response, so filter on RSSI only and identify in the listener
    Bluefruit.Scanner.clearFilters();
    Bluefruit.Scanner.filterRssi(BLE_SCAN_RSSI_FLOOR);
    Bluefruit.Scanner.setInterval(BLE_SCAN_INTERVAL_UNITS, BLE_SCAN_WINDOW_UNITS);
    Bluefruit.Scanner.useActiveScan(true);

    bool started = Bluefruit.Scanner.start(0);  // 0 = Don't stop
    _scanning = started;
    Serial.printf("[BLUEFRUIT] Scanner.start() returned: %s\n", started ? "true" : "false");
    return started;
}

void BluefruitCentral::stopScan() {
    _scanning = false;
    Bluefruit.Scanner.stop();
    Serial.println(F("[BLUEFRUIT] Scanning stopped"));
}

void BluefruitCentral::handleReport(ble_gap_evt_adv_report_t* report) {
    BleAddress address = addressFromGap(report->peer_addr);

    char name[HUB_NAME_MAX] = {0};
    uint8_t nameLen = Bluefruit.Scanner.parseReportByType(report, BLE_GAP_AD_TYPE_COMPLETE_LOCAL_NAME,
                                                          (uint8_t*)name, sizeof(name) - 1);
    if (nameLen == 0) {
        nameLen = Bluefruit.Scanner.parseReportByType(report, BLE_GAP_AD_TYPE_SHORT_LOCAL_NAME,
                                                      (uint8_t*)name, sizeof(name) - 1);
    }

    uint8_t uuids[16 * MAX_SERVICE_UUIDS];
    uint8_t uuidLen = Bluefruit.Scanner.parseReportByType(report, BLE_GAP_AD_TYPE_128BIT_SERVICE_UUID_COMPLETE,
                                                          uuids, sizeof(uuids));
    if (uuidLen == 0) {
        uuidLen = Bluefruit.Scanner.parseReportByType(report, BLE_GAP_AD_TYPE_128BIT_SERVICE_UUID_MORE_AVAILABLE,
                                                      uuids, sizeof(uuids));
    }

    uint8_t manufacturer[2 + MANUFACTURER_DATA_MAX];
    uint8_t manufacturerLen = Bluefruit.Scanner.parseReportByType(report, BLE_GAP_AD_TYPE_MANUFACTURER_SPECIFIC_DATA,
                                                                  manufacturer, sizeof(manufacturer));

    bool announce = false;
    bool update = false;

    lock();
    BluefruitPeripheral* peripheral = findPeripheral(address);
    if (!peripheral) {
        peripheral = allocatePeripheral(address);
    }
    if (peripheral) {
        peripheral->_gapAddress = report->peer_addr;
        peripheral->_lastSeenMs = millis();

        BleAdvertisement& adv = peripheral->_advertisement;
        if (nameLen > 0) {
            adv.setName(name);
        }
        for (uint8_t offset = 0; offset + 16 <= uuidLen; offset += 16) {
            BleUuid uuid;
            for (uint8_t i = 0; i < 16; i++) {
                uuid.bytes[i] = uuids[offset + 15 - i];
            }
            adv.addService(uuid);
        }
        if (manufacturerLen >= 2) {
            uint16_t companyId = manufacturer[0] | (manufacturer[1] << 8);
            adv.addManufacturerData(companyId, manufacturer + 2, manufacturerLen - 2);
        }

        if (!peripheral->_announced && adv.hasName) {
            peripheral->_announced = true;
            announce = true;
        } else if (peripheral->_announced) {
            update = true;
        }
    }
    unlock();

    if (announce) {
        postEvent(AdapterEventType::DEVICE_DISCOVERED, address);
    } else if (update) {
        postEvent(AdapterEventType::DEVICE_UPDATED, address);
    }
}

// =============================================================================
// CENTRAL - CONNECTIONS
// =============================================================================

bool BluefruitCentral::connectPeripheral(BluefruitPeripheral& peripheral) {
    char addr[BLE_ADDRESS_STRING_LEN];
    peripheral._address.toString(addr, sizeof(addr));

    lock();
    ble_gap_addr_t gapAddress = peripheral._gapAddress;
    _connecting = &peripheral;
    unlock();

    // Clear a completion left over from an earlier timed-out attempt
    xSemaphoreTake(_connectDone, 0);

    // The Soft Device cannot scan and initiate at the same time
    bool resumeScan = _scanning;
    Bluefruit.Scanner.stop();

    Serial.printf("[BLUEFRUIT] Connecting to %s...\n", addr);
    bool connected = false;
    if (Bluefruit.Central.connect(&gapAddress)) {
        connected = xSemaphoreTake(_connectDone, pdMS_TO_TICKS(BLE_CONNECT_TIMEOUT_MS)) == pdTRUE;
        if (!connected) {
            sd_ble_gap_connect_cancel();
            Serial.printf("[BLUEFRUIT] WARNING: Connect to %s timed out\n", addr);
        }
    } else {
        Serial.printf("[BLUEFRUIT] WARNING: Connect to %s rejected\n", addr);
    }

    lock();
    _connecting = nullptr;
    unlock();

    if (resumeScan) {
        Bluefruit.Scanner.start(0);
    }

    return connected && peripheral.isConnected();
}

bool BluefruitCentral::discoverLpf2(BluefruitPeripheral& peripheral, BleCharacteristic* out,
                                    uint8_t maxCount, uint8_t& count) {
    count = 0;
    ClientSlot* client = clientFor(peripheral);
    if (!client) {
        return false;
    }

    // A hub without the LPF2 service still has a valid (empty) result
    if (!client->service.discover(client->connHandle)) {
        Serial.println(F("[BLUEFRUIT] LPF2 service not found"));
        return true;
    }
    if (!client->characteristic.discover()) {
        Serial.println(F("[BLUEFRUIT] LPF2 characteristic not found"));
        return true;
    }

    if (maxCount > 0) {
        out[0].uuid = lpf2CharacteristicUuid();
        out[0].handle = client->characteristic.valueHandle();
        count = 1;
    }
    return true;
}

BluefruitCentral::ClientSlot* BluefruitCentral::clientFor(const BluefruitPeripheral& peripheral) {
    lock();
    ClientSlot* client = nullptr;
    if (peripheral._clientSlot >= 0 && peripheral._connHandle != CONN_HANDLE_INVALID) {
        client = &_clients[peripheral._clientSlot];
    }
    unlock();
    return client;
}

void BluefruitCentral::handleConnect(uint16_t connHandle) {
    BLEConnection* connection = Bluefruit.Connection(connHandle);
    if (!connection) {
        return;
    }
    BleAddress address = addressFromGap(connection->getPeerAddr());

    char addr[BLE_ADDRESS_STRING_LEN];
    address.toString(addr, sizeof(addr));
    Serial.printf("[BLUEFRUIT] Connected: %s handle=%d\n", addr, connHandle);

    bool accepted = false;
    lock();
    BluefruitPeripheral* peripheral = findPeripheral(address);
    if (peripheral) {
        for (uint8_t i = 0; i < MAX_HUBS; i++) {
            if (!_clients[i].inUse) {
                _clients[i].inUse = true;
                _clients[i].connHandle = connHandle;
                _clients[i].peripheral = peripheral;
                peripheral->_clientSlot = (int8_t)i;
                peripheral->_connHandle = connHandle;
                accepted = true;
                break;
            }
        }
    }
    bool waiting = accepted && (_connecting == peripheral);
    unlock();

    if (!accepted) {
        Serial.println(F("[BLUEFRUIT] ERROR: No client slot for connection"));
        Bluefruit.disconnect(connHandle);
        return;
    }

    if (waiting) {
        xSemaphoreGive(_connectDone);
    }
    postEvent(AdapterEventType::DEVICE_CONNECTED, address);
}

void BluefruitCentral::handleDisconnect(uint16_t connHandle, uint8_t reason) {
    Serial.printf("[BLUEFRUIT] Disconnected: handle=%d reason=0x%02X\n", connHandle, reason);

    BleAddress address;
    bool found = false;

    lock();
    for (uint8_t i = 0; i < MAX_HUBS; i++) {
        ClientSlot& client = _clients[i];
        if (!client.inUse || client.connHandle != connHandle) {
            continue;
        }
        if (client.peripheral) {
            // Re-armed so the next advertisement is a fresh discovery
            client.peripheral->_connHandle = CONN_HANDLE_INVALID;
            client.peripheral->_clientSlot = -1;
            client.peripheral->_announced = false;
            client.peripheral->_notifyCallback = nullptr;
            client.peripheral->_notifyContext = nullptr;
            address = client.peripheral->_address;
            found = true;
        }
        client.inUse = false;
        client.connHandle = CONN_HANDLE_INVALID;
        client.peripheral = nullptr;
    }
    unlock();

    if (found) {
        postEvent(AdapterEventType::DEVICE_DISCONNECTED, address);
    }
}

void BluefruitCentral::handleNotify(BLEClientCharacteristic* characteristic, uint8_t* data, uint16_t length) {
    BleNotifyCallback callback = nullptr;
    void* context = nullptr;

    lock();
    for (uint8_t i = 0; i < MAX_HUBS; i++) {
        if (_clients[i].inUse && &_clients[i].characteristic == characteristic && _clients[i].peripheral) {
            callback = _clients[i].peripheral->_notifyCallback;
            context = _clients[i].peripheral->_notifyContext;
            break;
        }
    }
    unlock();

    if (callback) {
        callback(context, data, length);
    }
}

// =============================================================================
// CENTRAL - PERIPHERAL TABLE
// =============================================================================

BlePeripheral* BluefruitCentral::peripheral(const BleAddress& address) {
    lock();
    BluefruitPeripheral* found = findPeripheral(address);
    unlock();
    return found;
}

BluefruitPeripheral* BluefruitCentral::findPeripheral(const BleAddress& address) {
    for (uint8_t i = 0; i < MAX_PERIPHERALS; i++) {
        if (_peripherals[i]._inUse && _peripherals[i]._address == address) {
            return &_peripherals[i];
        }
    }
    return nullptr;
}

BluefruitPeripheral* BluefruitCentral::allocatePeripheral(const BleAddress& address) {
    BluefruitPeripheral* candidate = nullptr;
    uint32_t now = millis();

    for (uint8_t i = 0; i < MAX_PERIPHERALS; i++) {
        BluefruitPeripheral& entry = _peripherals[i];
        if (!entry._inUse) {
            candidate = &entry;
            break;
        }
        // Recycle the stalest unconnected entry
        if (entry._connHandle == CONN_HANDLE_INVALID && &entry != _connecting &&
            now - entry._lastSeenMs > PERIPHERAL_STALE_MS &&
            (!candidate || entry._lastSeenMs < candidate->_lastSeenMs)) {
            candidate = &entry;
        }
    }

    if (!candidate) {
        return nullptr;
    }
    candidate->reset();
    candidate->_inUse = true;
    candidate->_address = address;
    return candidate;
}

// =============================================================================
// CENTRAL - HELPERS
// =============================================================================

void BluefruitCentral::postEvent(AdapterEventType type, const BleAddress& address) {
    AdapterEvent event(type, address);
    Result result = _events.send(std::move(event), EVENT_ENQUEUE_TIMEOUT_MS);
    if (result == Result::ERROR_TIMEOUT) {
        DEBUG_PRINTF("[BLUEFRUIT] Event queue full, dropped %s\n", adapterEventTypeToString(type));
    }
}

void BluefruitCentral::lock() {
    xSemaphoreTake(_lock, portMAX_DELAY);
}

void BluefruitCentral::unlock() {
    xSemaphoreGive(_lock);
}

// =============================================================================
// STATIC CALLBACKS
// =============================================================================

void BluefruitCentral::_onScanCallback(ble_gap_evt_adv_report_t* report) {
    if (g_bluefruitCentral) {
        g_bluefruitCentral->handleReport(report);
    }

    // Must resume scanner to receive more results
    Bluefruit.Scanner.resume();
}

void BluefruitCentral::_onConnect(uint16_t connHandle) {
    if (!g_bluefruitCentral) return;
    g_bluefruitCentral->handleConnect(connHandle);
}

void BluefruitCentral::_onDisconnect(uint16_t connHandle, uint8_t reason) {
    if (!g_bluefruitCentral) return;
    g_bluefruitCentral->handleDisconnect(connHandle, reason);
}

void BluefruitCentral::_onNotify(BLEClientCharacteristic* characteristic, uint8_t* data, uint16_t length) {
    if (!g_bluefruitCentral) return;
    g_bluefruitCentral->handleNotify(characteristic, data, length);
}
