/**
 * @file device.cpp
 * @brief HubLink port devices - Implementation
 * @version 1.0.0
 * @platform Adafruit Feather nRF52840 Express
 */

#include "device.h"
#include "hub_registry.h"

// =============================================================================
// FACTORY
// =============================================================================

Device createDevice(uint8_t portId, PortSpec port, const BleAddress& hubAddress,
                    Channel<RegistryRequest>* registry) {
    DeviceKind kind;
    switch (port) {
        case PortSpec::A:
        case PortSpec::B:
        case PortSpec::C:
        case PortSpec::D:
        case PortSpec::AB:
            kind = DeviceKind::MOTOR;
            break;
        case PortSpec::HUB_LED:
            kind = DeviceKind::HUB_LED;
            break;
        default:
            kind = DeviceKind::SENSOR;
            break;
    }
    return Device(kind, portId, port, hubAddress, registry);
}

// =============================================================================
// CONSTRUCTOR
// =============================================================================

Device::Device() :
    _kind(DeviceKind::SENSOR),
    _portId(0),
    _port(PortSpec::A),
    _hubAddress(),
    _registry(nullptr)
{
}

Device::Device(DeviceKind kind, uint8_t portId, PortSpec port, const BleAddress& hubAddress,
               Channel<RegistryRequest>* registry) :
    _kind(kind),
    _portId(portId),
    _port(port),
    _hubAddress(hubAddress),
    _registry(registry)
{
}

// =============================================================================
// MOTOR
// =============================================================================

Status Device::startSpeed(int8_t speed, uint8_t maxPower) {
    Status status = requireKind(DeviceKind::MOTOR, "startSpeed");
    if (!status.isOk()) {
        return status;
    }
    if (speed < -100 || speed > 100 || maxPower > 100) {
        return Status::error(Result::ERROR_INVALID_PARAM, "Speed %d out of range", speed);
    }
    return transmit(Lpf2Message::createStartSpeed(_portId, speed, maxPower));
}

Status Device::startPower(int8_t power) {
    Status status = requireKind(DeviceKind::MOTOR, "startPower");
    if (!status.isOk()) {
        return status;
    }
    if (power < -100 || power > 100) {
        return Status::error(Result::ERROR_INVALID_PARAM, "Power %d out of range", power);
    }
    return transmit(Lpf2Message::createStartPower(_portId, power));
}

Status Device::stop() {
    Status status = requireKind(DeviceKind::MOTOR, "stop");
    if (!status.isOk()) {
        return status;
    }
    return transmit(Lpf2Message::createStartPower(_portId, LPF2_POWER_BRAKE));
}

// =============================================================================
// HUB LED
// =============================================================================

Status Device::setColor(uint8_t color) {
    Status status = requireKind(DeviceKind::HUB_LED, "setColor");
    if (!status.isOk()) {
        return status;
    }
    if (color > LPF2_COLOR_MAX) {
        return Status::error(Result::ERROR_INVALID_PARAM, "Colour %u out of range", color);
    }
    return transmit(Lpf2Message::createSetLedColor(_portId, color));
}

Status Device::setRgb(uint8_t red, uint8_t green, uint8_t blue) {
    Status status = requireKind(DeviceKind::HUB_LED, "setRgb");
    if (!status.isOk()) {
        return status;
    }
    // RGB mode must be selected before RGB data is accepted
    status = transmit(Lpf2Message::createPortInputFormatSetup(_portId, LPF2_LED_MODE_RGB, 1, false));
    if (!status.isOk()) {
        return status;
    }
    return transmit(Lpf2Message::createSetLedRgb(_portId, red, green, blue));
}

// =============================================================================
// ALL DEVICES
// =============================================================================

Status Device::subscribe(uint8_t mode, uint32_t deltaInterval) {
    return transmit(Lpf2Message::createPortInputFormatSetup(_portId, mode, deltaInterval, true));
}

// =============================================================================
// HELPERS
// =============================================================================

Status Device::requireKind(DeviceKind kind, const char* operation) const {
    if (_kind != kind) {
        return Status::error(Result::ERROR_UNSUPPORTED_OPERATION, "%s not supported on %s port %s",
                             operation, deviceKindToString(_kind), portSpecToString(_port));
    }
    return Status::ok();
}

Status Device::transmit(const Lpf2Message& message) const {
    if (!_registry) {
        return Status::error(Result::ERROR_CHANNEL_CLOSED, "Device not bound to a registry");
    }
    return registrySendToHub(_registry, _hubAddress, message);
}
