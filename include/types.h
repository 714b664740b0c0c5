/**
 * @file types.h
 * @brief HubLink type definitions - Result codes, addresses, hub kinds, and filters
 * @version 1.0.0
 * @platform Adafruit Feather nRF52840 Express
 */

#ifndef TYPES_H
#define TYPES_H

#include <Arduino.h>
#include <utility>
#include "config.h"

// =============================================================================
// RESULT CODES
// =============================================================================

/**
 * @brief Result codes returned by every fallible HubLink operation
 */
enum class Result : uint8_t {
    OK = 0,
    ERROR_ADAPTER_UNAVAILABLE,      // No adapter at the requested index
    ERROR_PERIPHERAL_NOT_FOUND,     // Adapter has no peripheral for the address
    ERROR_CONNECT_FAILED,           // Connect, discovery, or subscribe failed
    ERROR_CHARACTERISTIC_MISSING,   // LPF2 control characteristic not present
    ERROR_UNKNOWN_HUB,              // No live hub for the address
    ERROR_UNKNOWN_PORT,             // Port not in the hub's port map
    ERROR_PARSE_FAILURE,            // Malformed LPF2 frame
    ERROR_TIMEOUT,
    ERROR_CHANNEL_CLOSED,           // Actor gone or reply dropped
    ERROR_UNSUPPORTED_HUB_KIND,     // Identified but not implemented
    ERROR_RETRIES_EXHAUSTED,        // createHub() gave up
    ERROR_BUSY,                     // Wait table full
    ERROR_INVALID_PARAM,
    ERROR_UNSUPPORTED_OPERATION     // Command not valid for the device kind
};

/**
 * @brief Get string representation of result code
 */
inline const char* resultToString(Result result) {
    switch (result) {
        case Result::OK: return "OK";
        case Result::ERROR_ADAPTER_UNAVAILABLE: return "ADAPTER_UNAVAILABLE";
        case Result::ERROR_PERIPHERAL_NOT_FOUND: return "PERIPHERAL_NOT_FOUND";
        case Result::ERROR_CONNECT_FAILED: return "CONNECT_FAILED";
        case Result::ERROR_CHARACTERISTIC_MISSING: return "CHARACTERISTIC_MISSING";
        case Result::ERROR_UNKNOWN_HUB: return "UNKNOWN_HUB";
        case Result::ERROR_UNKNOWN_PORT: return "UNKNOWN_PORT";
        case Result::ERROR_PARSE_FAILURE: return "PARSE_FAILURE";
        case Result::ERROR_TIMEOUT: return "TIMEOUT";
        case Result::ERROR_CHANNEL_CLOSED: return "CHANNEL_CLOSED";
        case Result::ERROR_UNSUPPORTED_HUB_KIND: return "UNSUPPORTED_HUB_KIND";
        case Result::ERROR_RETRIES_EXHAUSTED: return "RETRIES_EXHAUSTED";
        case Result::ERROR_BUSY: return "BUSY";
        case Result::ERROR_INVALID_PARAM: return "INVALID_PARAM";
        case Result::ERROR_UNSUPPORTED_OPERATION: return "UNSUPPORTED_OPERATION";
        default: return "UNKNOWN";
    }
}

// =============================================================================
// STATUS
// =============================================================================

/**
 * @brief Result code plus a human readable message
 *
 * Errors carry their context in the message, e.g.
 * "Port D does not exist on hub 90:84:2B:60:3C:B8".
 */
struct Status {
    Result code;
    char message[STATUS_MESSAGE_MAX];

    Status() : code(Result::OK) { message[0] = '\0'; }

    bool isOk() const { return code == Result::OK; }

    static Status ok() { return Status(); }

    /**
     * @brief Build an error status with a printf-style message
     */
    static Status error(Result code, const char* format, ...);
};

/**
 * @brief Status plus the value produced on success
 *
 * Used as the payload of reply channels.
 */
template <typename T>
struct Outcome {
    Status status;
    T value;

    Outcome() : status(), value() {}
    Outcome(const Status& s) : status(s), value() {}
    Outcome(T v) : status(), value(std::move(v)) {}
};

// =============================================================================
// BLE ADDRESS / UUID
// =============================================================================

#define BLE_ADDRESS_STRING_LEN 18       // "AA:BB:CC:DD:EE:FF" + terminator

/**
 * @brief 48-bit BLE device address, most significant byte first
 */
struct BleAddress {
    uint8_t bytes[6];

    BleAddress() { memset(bytes, 0, sizeof(bytes)); }

    /**
     * @brief Format as "AA:BB:CC:DD:EE:FF"
     * @param buffer Output buffer (at least BLE_ADDRESS_STRING_LEN bytes)
     */
    void toString(char* buffer, size_t bufferSize) const;

    /**
     * @brief Parse "AA:BB:CC:DD:EE:FF" (hex digits in either case)
     * @return true if the string is a well-formed address
     */
    static bool fromString(const char* str, BleAddress& out);

    bool isZero() const {
        for (uint8_t i = 0; i < 6; i++) {
            if (bytes[i] != 0) return false;
        }
        return true;
    }

    bool operator==(const BleAddress& other) const {
        return memcmp(bytes, other.bytes, sizeof(bytes)) == 0;
    }
    bool operator!=(const BleAddress& other) const { return !(*this == other); }
};

/**
 * @brief 128-bit UUID stored in canonical string order
 */
struct BleUuid {
    uint8_t bytes[16];

    BleUuid() { memset(bytes, 0, sizeof(bytes)); }

    /**
     * @brief Parse "00001623-1212-efde-1623-785feabcd123"
     */
    static bool fromString(const char* str, BleUuid& out);

    bool operator==(const BleUuid& other) const {
        return memcmp(bytes, other.bytes, sizeof(bytes)) == 0;
    }
    bool operator!=(const BleUuid& other) const { return !(*this == other); }
};

// =============================================================================
// HUB KIND
// =============================================================================

/**
 * @brief Closed set of hub kinds a peripheral can be identified as
 */
enum class HubKind : uint8_t {
    UNKNOWN = 0,            // Not identified yet; registry identifies on connect
    WEDO2_SMART_HUB,
    MOVE_HUB,
    HUB,                    // Two-port "City" hub
    REMOTE_CONTROL,
    DUPLO_TRAIN_BASE,
    TECHNIC_MEDIUM_HUB,
    MARIO
};

/**
 * @brief Get string representation of hub kind
 */
inline const char* hubKindToString(HubKind kind) {
    switch (kind) {
        case HubKind::UNKNOWN: return "Unknown";
        case HubKind::WEDO2_SMART_HUB: return "WeDo2SmartHub";
        case HubKind::MOVE_HUB: return "MoveHub";
        case HubKind::HUB: return "Hub";
        case HubKind::REMOTE_CONTROL: return "RemoteControl";
        case HubKind::DUPLO_TRAIN_BASE: return "DuploTrainBase";
        case HubKind::TECHNIC_MEDIUM_HUB: return "TechnicMediumHub";
        case HubKind::MARIO: return "Mario";
        default: return "Unknown";
    }
}

// =============================================================================
// PORT SPECIFICATION
// =============================================================================

/**
 * @brief Logical port names; each hub kind maps a subset to physical ids
 */
enum class PortSpec : uint8_t {
    A = 0,
    B,
    C,
    D,
    AB,                     // Move hub virtual port (A+B)
    HUB_LED,
    CURRENT_SENSOR,
    VOLTAGE_SENSOR,
    TEMPERATURE_SENSOR,
    ACCELEROMETER,
    GYRO_SENSOR,
    TILT_SENSOR,
    GESTURE_SENSOR
};

#define PORT_SPEC_COUNT 13

/**
 * @brief Get string representation of port specification
 */
inline const char* portSpecToString(PortSpec port) {
    switch (port) {
        case PortSpec::A: return "A";
        case PortSpec::B: return "B";
        case PortSpec::C: return "C";
        case PortSpec::D: return "D";
        case PortSpec::AB: return "AB";
        case PortSpec::HUB_LED: return "HUB_LED";
        case PortSpec::CURRENT_SENSOR: return "CURRENT";
        case PortSpec::VOLTAGE_SENSOR: return "VOLTAGE";
        case PortSpec::TEMPERATURE_SENSOR: return "TEMPERATURE";
        case PortSpec::ACCELEROMETER: return "ACCEL";
        case PortSpec::GYRO_SENSOR: return "GYRO";
        case PortSpec::TILT_SENSOR: return "TILT";
        case PortSpec::GESTURE_SENSOR: return "GESTURE";
        default: return "UNKNOWN";
    }
}

/**
 * @brief Parse a port name (case-insensitive)
 * @return true if the name is a known port specification
 */
bool portSpecFromString(const char* str, PortSpec& out);

// =============================================================================
// DISCOVERED HUB
// =============================================================================

/**
 * @brief A positively identified, not yet connected hub
 */
struct DiscoveredHub {
    HubKind kind;
    BleAddress address;
    char name[HUB_NAME_MAX];

    DiscoveredHub() : kind(HubKind::UNKNOWN), address() { name[0] = '\0'; }

    DiscoveredHub(HubKind k, const BleAddress& addr, const char* hubName) :
        kind(k),
        address(addr)
    {
        strncpy(name, hubName ? hubName : "", HUB_NAME_MAX - 1);
        name[HUB_NAME_MAX - 1] = '\0';
    }
};

// =============================================================================
// HUB FILTER
// =============================================================================

/**
 * @brief Filter type for wait-for-hub requests
 */
enum class HubFilterType : uint8_t {
    BY_NAME = 0,
    BY_ADDRESS
};

/**
 * @brief Exact-match filter on a discovered hub's name or address string
 *
 * An absent filter is passed as a null pointer.
 */
struct HubFilter {
    HubFilterType type;
    char value[HUB_NAME_MAX];

    HubFilter() : type(HubFilterType::BY_NAME) { value[0] = '\0'; }

    static HubFilter byName(const char* name);
    static HubFilter byAddress(const char* address);

    /**
     * @brief Check a discovered hub against this filter
     * @return true if the name (or "AA:BB:..." address) equals value exactly
     */
    bool matches(const DiscoveredHub& hub) const;
};

#endif // TYPES_H
