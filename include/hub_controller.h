/**
 * @file hub_controller.h
 * @brief HubLink controller handles - Client-side views of live hubs and ports
 * @version 1.0.0
 * @platform Adafruit Feather nRF52840 Express
 *
 * HubController is a copyable value: address, kind, name and the registry
 * inbox. Any number may refer to the same live hub; none owns it. Every
 * operation is a round trip to the HubRegistry, so after disconnect() all
 * copies fail with ERROR_UNKNOWN_HUB.
 *
 * PortController exclusively owns the Device created for one port.
 *
 * Usage:
 *   PortController motor;
 *   if (controller.port(PortSpec::A, motor).isOk()) {
 *       motor->startSpeed(50);
 *   }
 */

#ifndef HUB_CONTROLLER_H
#define HUB_CONTROLLER_H

#include <Arduino.h>
#include "config.h"
#include "types.h"
#include "rtos_channel.h"
#include "lpf2_protocol.h"
#include "device.h"

// =============================================================================
// PORT CONTROLLER
// =============================================================================

class PortController {
public:
    PortController();
    PortController(uint8_t portId, PortSpec port, Device&& device);

    PortController(PortController&&) = default;
    PortController& operator=(PortController&&) = default;

    PortController(const PortController&) = delete;
    PortController& operator=(const PortController&) = delete;

    uint8_t getPortId() const { return _portId; }
    PortSpec getPort() const { return _port; }

    Device& device() { return _device; }
    Device* operator->() { return &_device; }

private:
    uint8_t _portId;
    PortSpec _port;
    Device _device;
};

// =============================================================================
// HUB CONTROLLER
// =============================================================================

class HubController {
public:
    HubController();
    HubController(const BleAddress& address, HubKind kind, const char* name,
                  Channel<RegistryRequest>* registry);

    bool isValid() const { return _registry != nullptr; }

    const BleAddress& getAddress() const { return _address; }
    HubKind getKind() const { return _kind; }
    const char* getName() const { return _name; }

    /**
     * @brief Obtain a controller for one of this hub's ports
     * @return OK, ERROR_UNKNOWN_HUB, or ERROR_UNKNOWN_PORT
     */
    Status port(PortSpec port, PortController& out) const;

    /**
     * @brief Write a message to this hub
     */
    Status send(const Lpf2Message& message) const;

    /**
     * @brief Disconnect and forget this hub
     */
    Status disconnect() const;

private:
    BleAddress _address;
    HubKind _kind;
    char _name[HUB_NAME_MAX];
    Channel<RegistryRequest>* _registry;
};

#endif // HUB_CONTROLLER_H
