/**
 * @file hub_identify.h
 * @brief HubLink hub identification - Classify advertisements into hub kinds
 * @version 1.0.0
 * @platform Adafruit Feather nRF52840 Express
 *
 * Identification order:
 * 1. WeDo 2.0 smart hub service advertised -> WEDO2_SMART_HUB
 * 2. LPF2 hub service advertised -> device type byte at offset 1 of the
 *    LEGO (company id 919) manufacturer payload, mapped through a fixed table
 * 3. Anything else -> not a hub
 *
 * Example LPF2 advertisement of a Technic hub:
 *   services:     00001623-1212-efde-1623-785feabcd123
 *   manufacturer: 919 -> [00 80 06 00 61 00]   (0x80 = TechnicMediumHub)
 */

#ifndef HUB_IDENTIFY_H
#define HUB_IDENTIFY_H

#include <Arduino.h>
#include "types.h"
#include "ble_central.h"

// =============================================================================
// PROTOCOL CONSTANTS
// =============================================================================

#define LPF2_HUB_SERVICE_UUID_STR        "00001623-1212-efde-1623-785feabcd123"
#define WEDO2_SMART_HUB_SERVICE_UUID_STR "00001523-1212-efde-1523-785feabcd123"
#define LPF2_CHARACTERISTIC_UUID_STR     "00001624-1212-efde-1623-785feabcd123"

#define LEGO_COMPANY_ID 919             // 0x0397
#define LEGO_DEVICE_TYPE_OFFSET 1       // Byte within the manufacturer payload

/**
 * @brief LPF2 hub service (all Powered Up hubs)
 */
const BleUuid& lpf2HubServiceUuid();

/**
 * @brief WeDo 2.0 smart hub service
 */
const BleUuid& wedo2SmartHubServiceUuid();

/**
 * @brief LPF2 control characteristic ("LPF2_ALL"), required on every connected hub
 */
const BleUuid& lpf2CharacteristicUuid();

// =============================================================================
// DEVICE TYPE CODES
// =============================================================================

/**
 * @brief Device type codes carried in the manufacturer payload
 */
enum class ManufacturerDeviceType : uint8_t {
    DUPLO_TRAIN_BASE = 32,
    MOVE_HUB = 64,
    HUB = 65,
    REMOTE_CONTROL = 66,
    MARIO = 67,
    TECHNIC_MEDIUM_HUB = 128
};

/**
 * @brief Map a device type code to a hub kind
 * @return false for codes outside the table
 */
bool hubKindFromDeviceType(uint8_t code, HubKind& out);

// =============================================================================
// IDENTIFICATION
// =============================================================================

/**
 * @brief Classify an advertisement
 * @param advertisement Advertised services and manufacturer data
 * @param out Identified kind (unchanged on false)
 * @return true if the advertisement is a known hub
 */
bool identifyHub(const BleAdvertisement& advertisement, HubKind& out);

#endif // HUB_IDENTIFY_H
