/**
 * @file hub_identify.cpp
 * @brief HubLink hub identification - Implementation
 * @version 1.0.0
 * @platform Adafruit Feather nRF52840 Express
 */

#include "hub_identify.h"

// =============================================================================
// UUID CONSTANTS
// =============================================================================

static BleUuid parseConstantUuid(const char* str) {
    BleUuid uuid;
    BleUuid::fromString(str, uuid);
    return uuid;
}

const BleUuid& lpf2HubServiceUuid() {
    static const BleUuid uuid = parseConstantUuid(LPF2_HUB_SERVICE_UUID_STR);
    return uuid;
}

const BleUuid& wedo2SmartHubServiceUuid() {
    static const BleUuid uuid = parseConstantUuid(WEDO2_SMART_HUB_SERVICE_UUID_STR);
    return uuid;
}

const BleUuid& lpf2CharacteristicUuid() {
    static const BleUuid uuid = parseConstantUuid(LPF2_CHARACTERISTIC_UUID_STR);
    return uuid;
}

// =============================================================================
// DEVICE TYPE TABLE
// =============================================================================

struct DeviceTypeMapping {
    ManufacturerDeviceType code;
    HubKind kind;
};

static const DeviceTypeMapping DEVICE_TYPE_MAPPINGS[] = {
    { ManufacturerDeviceType::DUPLO_TRAIN_BASE,   HubKind::DUPLO_TRAIN_BASE },
    { ManufacturerDeviceType::MOVE_HUB,           HubKind::MOVE_HUB },
    { ManufacturerDeviceType::HUB,                HubKind::HUB },
    { ManufacturerDeviceType::REMOTE_CONTROL,     HubKind::REMOTE_CONTROL },
    { ManufacturerDeviceType::MARIO,              HubKind::MARIO },
    { ManufacturerDeviceType::TECHNIC_MEDIUM_HUB, HubKind::TECHNIC_MEDIUM_HUB }
};

static const size_t DEVICE_TYPE_MAPPINGS_COUNT = sizeof(DEVICE_TYPE_MAPPINGS) / sizeof(DEVICE_TYPE_MAPPINGS[0]);

bool hubKindFromDeviceType(uint8_t code, HubKind& out) {
    for (size_t i = 0; i < DEVICE_TYPE_MAPPINGS_COUNT; i++) {
        if ((uint8_t)DEVICE_TYPE_MAPPINGS[i].code == code) {
            out = DEVICE_TYPE_MAPPINGS[i].kind;
            return true;
        }
    }
    return false;
}

// =============================================================================
// IDENTIFICATION
// =============================================================================

bool identifyHub(const BleAdvertisement& advertisement, HubKind& out) {
    if (advertisement.hasService(wedo2SmartHubServiceUuid())) {
        out = HubKind::WEDO2_SMART_HUB;
        return true;
    }

    if (!advertisement.hasService(lpf2HubServiceUuid())) {
        return false;
    }

    const ManufacturerEntry* entry = advertisement.findManufacturer(LEGO_COMPANY_ID);
    if (!entry || entry->length <= LEGO_DEVICE_TYPE_OFFSET) {
        DEBUG_PRINTLN(F("[IDENTIFY] LPF2 service without usable manufacturer data"));
        return false;
    }

    uint8_t code = entry->data[LEGO_DEVICE_TYPE_OFFSET];
    if (!hubKindFromDeviceType(code, out)) {
        DEBUG_PRINTF("[IDENTIFY] Unknown device type code %u\n", code);
        return false;
    }
    return true;
}
