/**
 * @file device.h
 * @brief HubLink port devices - Motors, hub LED, and sensors behind a port
 * @version 1.0.0
 * @platform Adafruit Feather nRF52840 Express
 *
 * A Device is created by the HubRegistry for one GetPort request and is
 * owned by the PortController wrapping it. Commands are encoded as LPF2
 * messages and sent through the registry (SendToHub), so a device never
 * touches the radio directly and fails with UNKNOWN_HUB once its hub is
 * disconnected.
 */

#ifndef DEVICE_H
#define DEVICE_H

#include <Arduino.h>
#include "config.h"
#include "types.h"
#include "rtos_channel.h"
#include "lpf2_protocol.h"

struct RegistryRequest;

// =============================================================================
// DEVICE KIND
// =============================================================================

enum class DeviceKind : uint8_t {
    MOTOR = 0,      // Ports A-D, AB
    HUB_LED,
    SENSOR          // Built-in sensors
};

inline const char* deviceKindToString(DeviceKind kind) {
    switch (kind) {
        case DeviceKind::MOTOR: return "MOTOR";
        case DeviceKind::HUB_LED: return "HUB_LED";
        case DeviceKind::SENSOR: return "SENSOR";
        default: return "UNKNOWN";
    }
}

// =============================================================================
// DEVICE CLASS
// =============================================================================

class Device {
public:
    Device();
    Device(DeviceKind kind, uint8_t portId, PortSpec port, const BleAddress& hubAddress,
           Channel<RegistryRequest>* registry);

    DeviceKind getKind() const { return _kind; }
    uint8_t getPortId() const { return _portId; }
    PortSpec getPort() const { return _port; }
    const BleAddress& getHubAddress() const { return _hubAddress; }

    // =========================================================================
    // MOTOR
    // =========================================================================

    /**
     * @brief Run at a regulated speed
     * @param speed -100..100 (sign is direction)
     */
    Status startSpeed(int8_t speed, uint8_t maxPower = LPF2_DEFAULT_MAX_POWER);

    /**
     * @brief Run at an unregulated power
     * @param power -100..100
     */
    Status startPower(int8_t power);

    /**
     * @brief Brake the motor
     */
    Status stop();

    // =========================================================================
    // HUB LED
    // =========================================================================

    /**
     * @brief Set a colour index (0..LPF2_COLOR_MAX)
     */
    Status setColor(uint8_t color);

    Status setRgb(uint8_t red, uint8_t green, uint8_t blue);

    // =========================================================================
    // ALL DEVICES
    // =========================================================================

    /**
     * @brief Ask the hub to report value changes of a mode
     * @param mode Device mode
     * @param deltaInterval Minimum change before a notification is sent
     */
    Status subscribe(uint8_t mode, uint32_t deltaInterval = 1);

private:
    Status requireKind(DeviceKind kind, const char* operation) const;
    Status transmit(const Lpf2Message& message) const;

    DeviceKind _kind;
    uint8_t _portId;
    PortSpec _port;
    BleAddress _hubAddress;
    Channel<RegistryRequest>* _registry;
};

/**
 * @brief Construct the device for a port
 */
Device createDevice(uint8_t portId, PortSpec port, const BleAddress& hubAddress,
                    Channel<RegistryRequest>* registry);

#endif // DEVICE_H
