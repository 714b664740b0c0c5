/**
 * @file hub_controller.cpp
 * @brief HubLink controller handles - Implementation
 * @version 1.0.0
 * @platform Adafruit Feather nRF52840 Express
 */

#include "hub_controller.h"
#include "hub_registry.h"

// =============================================================================
// PORT CONTROLLER
// =============================================================================

PortController::PortController() :
    _portId(0),
    _port(PortSpec::A),
    _device()
{
}

PortController::PortController(uint8_t portId, PortSpec port, Device&& device) :
    _portId(portId),
    _port(port),
    _device(std::move(device))
{
}

// =============================================================================
// HUB CONTROLLER
// =============================================================================

HubController::HubController() :
    _address(),
    _kind(HubKind::UNKNOWN),
    _registry(nullptr)
{
    _name[0] = '\0';
}

HubController::HubController(const BleAddress& address, HubKind kind, const char* name,
                             Channel<RegistryRequest>* registry) :
    _address(address),
    _kind(kind),
    _registry(registry)
{
    strncpy(_name, name ? name : "", HUB_NAME_MAX - 1);
    _name[HUB_NAME_MAX - 1] = '\0';
}

Status HubController::port(PortSpec port, PortController& out) const {
    if (!_registry) {
        return Status::error(Result::ERROR_CHANNEL_CLOSED, "Controller not connected to a registry");
    }
    return registryGetPort(_registry, _address, port, out);
}

Status HubController::send(const Lpf2Message& message) const {
    if (!_registry) {
        return Status::error(Result::ERROR_CHANNEL_CLOSED, "Controller not connected to a registry");
    }
    return registrySendToHub(_registry, _address, message);
}

Status HubController::disconnect() const {
    if (!_registry) {
        return Status::error(Result::ERROR_CHANNEL_CLOSED, "Controller not connected to a registry");
    }
    return registryDisconnect(_registry, _address);
}
