/**
 * @file hub.h
 * @brief HubLink hub instances - Per-kind port maps and the LPF2 control link
 * @version 1.0.0
 * @platform Adafruit Feather nRF52840 Express
 *
 * Hub kinds form a closed set. Each implemented kind is a row in a static
 * table (name + port map); Hub is the tagged instance the HubRegistry keeps
 * per connected address and dispatches through that row.
 *
 * Implemented kinds: TechnicMediumHub, MoveHub, Hub (City), RemoteControl.
 * WeDo2SmartHub, DuploTrainBase and Mario are identified but not implemented.
 */

#ifndef HUB_H
#define HUB_H

#include <Arduino.h>
#include "config.h"
#include "types.h"
#include "ble_central.h"
#include "lpf2_protocol.h"

// =============================================================================
// PORT MAPS
// =============================================================================

/**
 * @brief Logical port to physical port id
 */
struct PortMapEntry {
    PortSpec port;
    uint8_t id;
};

/**
 * @brief Static description of one implemented hub kind
 */
struct HubProperties {
    HubKind kind;
    const char* name;
    const PortMapEntry* ports;
    uint8_t portCount;
};

/**
 * @brief Static properties of a hub kind
 * @return nullptr if the kind is not implemented
 */
const HubProperties* hubPropertiesFor(HubKind kind);

// =============================================================================
// HUB CLASS
// =============================================================================

class Hub {
public:
    Hub();

    /**
     * @brief Bind to a connected, subscribed peripheral
     * @param kind Identified hub kind
     * @param peripheral Connected peripheral
     * @param characteristics Characteristics enumerated on connect
     * @param count Number of characteristics
     * @param name Advertised name
     * @return OK, ERROR_UNSUPPORTED_HUB_KIND, or ERROR_CHARACTERISTIC_MISSING
     */
    Status init(HubKind kind, BlePeripheral* peripheral,
                const BleCharacteristic* characteristics, uint8_t count, const char* name);

    /**
     * @brief Drop the binding (does not disconnect)
     */
    void reset();

    bool isValid() const { return _properties != nullptr && _peripheral != nullptr; }

    HubKind getKind() const { return _kind; }

    const char* getName() const { return _name; }

    BleAddress getAddress() const;

    const HubProperties* getProperties() const { return _properties; }

    /**
     * @brief Look up a port in this hub's port map
     * @return false if the hub has no such port
     */
    bool findPortId(PortSpec port, uint8_t& id) const;

    /**
     * @brief Encode and write a message to the control characteristic
     */
    Status send(const Lpf2Message& message);

    /**
     * @brief Write an already encoded frame
     */
    Status sendRaw(const uint8_t* data, uint16_t length);

    Status disconnect();

    bool isConnected() const;

private:
    HubKind _kind;
    BlePeripheral* _peripheral;
    BleCharacteristic _control;
    const HubProperties* _properties;
    char _name[HUB_NAME_MAX];
};

#endif // HUB_H
