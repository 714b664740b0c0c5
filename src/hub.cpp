/**
 * @file hub.cpp
 * @brief HubLink hub instances - Implementation
 * @version 1.0.0
 * @platform Adafruit Feather nRF52840 Express
 */

#include "hub.h"
#include "hub_identify.h"

// =============================================================================
// PORT MAP TABLES
// =============================================================================

static const PortMapEntry TECHNIC_MEDIUM_HUB_PORTS[] = {
    { PortSpec::A,                  0 },
    { PortSpec::B,                  1 },
    { PortSpec::C,                  2 },
    { PortSpec::D,                  3 },
    { PortSpec::HUB_LED,            50 },
    { PortSpec::CURRENT_SENSOR,     59 },
    { PortSpec::VOLTAGE_SENSOR,     60 },
    { PortSpec::TEMPERATURE_SENSOR, 61 },
    { PortSpec::ACCELEROMETER,      97 },
    { PortSpec::GYRO_SENSOR,        98 },
    { PortSpec::TILT_SENSOR,        99 },
    { PortSpec::GESTURE_SENSOR,     100 }
};

static const PortMapEntry MOVE_HUB_PORTS[] = {
    { PortSpec::A,              0 },
    { PortSpec::B,              1 },
    { PortSpec::C,              2 },
    { PortSpec::D,              3 },
    { PortSpec::AB,             16 },
    { PortSpec::HUB_LED,        50 },
    { PortSpec::TILT_SENSOR,    58 },
    { PortSpec::CURRENT_SENSOR, 59 },
    { PortSpec::VOLTAGE_SENSOR, 60 }
};

static const PortMapEntry CITY_HUB_PORTS[] = {
    { PortSpec::A,              0 },
    { PortSpec::B,              1 },
    { PortSpec::HUB_LED,        50 },
    { PortSpec::CURRENT_SENSOR, 59 },
    { PortSpec::VOLTAGE_SENSOR, 60 }
};

static const PortMapEntry REMOTE_CONTROL_PORTS[] = {
    { PortSpec::A,              0 },
    { PortSpec::B,              1 },
    { PortSpec::HUB_LED,        52 },
    { PortSpec::VOLTAGE_SENSOR, 59 }
};

template <size_t N>
static constexpr uint8_t portCount(const PortMapEntry (&)[N]) {
    return (uint8_t)N;
}

static const HubProperties HUB_PROPERTIES_TABLE[] = {
    { HubKind::TECHNIC_MEDIUM_HUB, "TechnicMediumHub", TECHNIC_MEDIUM_HUB_PORTS, portCount(TECHNIC_MEDIUM_HUB_PORTS) },
    { HubKind::MOVE_HUB,           "MoveHub",          MOVE_HUB_PORTS,           portCount(MOVE_HUB_PORTS) },
    { HubKind::HUB,                "Hub",              CITY_HUB_PORTS,           portCount(CITY_HUB_PORTS) },
    { HubKind::REMOTE_CONTROL,     "RemoteControl",    REMOTE_CONTROL_PORTS,     portCount(REMOTE_CONTROL_PORTS) }
};

static const size_t HUB_PROPERTIES_COUNT = sizeof(HUB_PROPERTIES_TABLE) / sizeof(HUB_PROPERTIES_TABLE[0]);

const HubProperties* hubPropertiesFor(HubKind kind) {
    for (size_t i = 0; i < HUB_PROPERTIES_COUNT; i++) {
        if (HUB_PROPERTIES_TABLE[i].kind == kind) {
            return &HUB_PROPERTIES_TABLE[i];
        }
    }
    return nullptr;
}

// =============================================================================
// HUB - LIFECYCLE
// =============================================================================

Hub::Hub() :
    _kind(HubKind::UNKNOWN),
    _peripheral(nullptr),
    _control(),
    _properties(nullptr)
{
    _name[0] = '\0';
}

Status Hub::init(HubKind kind, BlePeripheral* peripheral,
                 const BleCharacteristic* characteristics, uint8_t count, const char* name) {
    reset();

    if (!peripheral) {
        return Status::error(Result::ERROR_INVALID_PARAM, "No peripheral");
    }

    const HubProperties* properties = hubPropertiesFor(kind);
    if (!properties) {
        return Status::error(Result::ERROR_UNSUPPORTED_HUB_KIND,
                             "Hub kind %s is not supported", hubKindToString(kind));
    }

    const BleCharacteristic* control = nullptr;
    for (uint8_t i = 0; i < count; i++) {
        if (characteristics[i].uuid == lpf2CharacteristicUuid()) {
            control = &characteristics[i];
            break;
        }
    }
    if (!control) {
        return Status::error(Result::ERROR_CHARACTERISTIC_MISSING,
                             "LPF2 characteristic not found");
    }

    _kind = kind;
    _peripheral = peripheral;
    _control = *control;
    _properties = properties;
    strncpy(_name, name ? name : "", HUB_NAME_MAX - 1);
    _name[HUB_NAME_MAX - 1] = '\0';
    return Status::ok();
}

void Hub::reset() {
    _kind = HubKind::UNKNOWN;
    _peripheral = nullptr;
    _control = BleCharacteristic();
    _properties = nullptr;
    _name[0] = '\0';
}

BleAddress Hub::getAddress() const {
    return _peripheral ? _peripheral->address() : BleAddress();
}

bool Hub::isConnected() const {
    return _peripheral && _peripheral->isConnected();
}

// =============================================================================
// HUB - PORTS
// =============================================================================

bool Hub::findPortId(PortSpec port, uint8_t& id) const {
    if (!_properties) {
        return false;
    }
    for (uint8_t i = 0; i < _properties->portCount; i++) {
        if (_properties->ports[i].port == port) {
            id = _properties->ports[i].id;
            return true;
        }
    }
    return false;
}

// =============================================================================
// HUB - I/O
// =============================================================================

Status Hub::send(const Lpf2Message& message) {
    uint8_t frame[LPF2_MAX_MESSAGE_SIZE + 4];
    uint16_t length = 0;
    if (!message.serialize(frame, sizeof(frame), length)) {
        return Status::error(Result::ERROR_INVALID_PARAM, "Message too large to encode");
    }
    return sendRaw(frame, length);
}

Status Hub::sendRaw(const uint8_t* data, uint16_t length) {
    if (!isValid()) {
        return Status::error(Result::ERROR_UNKNOWN_HUB, "Hub not initialised");
    }

    if (!_peripheral->write(_control, data, length)) {
        char addr[BLE_ADDRESS_STRING_LEN];
        getAddress().toString(addr, sizeof(addr));
        return Status::error(Result::ERROR_CONNECT_FAILED, "Write to %s failed", addr);
    }
    return Status::ok();
}

Status Hub::disconnect() {
    if (!_peripheral) {
        return Status::error(Result::ERROR_UNKNOWN_HUB, "Hub not initialised");
    }

    char addr[BLE_ADDRESS_STRING_LEN];
    getAddress().toString(addr, sizeof(addr));
    Serial.printf("[HUB] Disconnecting %s (%s)\n", _name, addr);

    if (!_peripheral->disconnect()) {
        return Status::error(Result::ERROR_CONNECT_FAILED, "Disconnect from %s failed", addr);
    }
    return Status::ok();
}
