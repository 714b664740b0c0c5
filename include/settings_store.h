/**
 * @file settings_store.h
 * @brief HubLink settings - Validated runtime settings persisted to LittleFS
 * @version 1.0.0
 * @platform Adafruit Feather nRF52840 Express
 *
 * Settings are edited with setParameter() (serial console SET command) and
 * stored as one packed record in SETTINGS_FILE on the internal flash.
 * Flash access lives in settings_flash.cpp; encode/decode/validation here.
 *
 * Parameters (case-insensitive):
 *   ADAPTER       adapter index (0-7)
 *   RETRIES       connect attempts per createHub (1-50)
 *   RETRY_DELAY   ms between attempts (0-60000)
 *   WAIT_TIMEOUT  default wait-for-hub timeout in ms (0 = unbounded)
 *   AUTOCONNECT   0/1, connect to the first matching hub at boot
 *   FILTER_NAME   default filter by advertised name
 *   FILTER_ADDR   default filter by address (AA:BB:CC:DD:EE:FF)
 *   FILTER_NONE   clear the default filter (value ignored)
 */

#ifndef SETTINGS_STORE_H
#define SETTINGS_STORE_H

#include <Arduino.h>
#include "config.h"
#include "types.h"

#define SETTINGS_ADAPTER_MAX 7

// =============================================================================
// SETTINGS
// =============================================================================

struct LinkSettings {
    uint8_t adapterIndex;
    uint8_t connectRetries;
    uint32_t retryDelayMs;
    uint32_t waitTimeoutMs;         // 0 = unbounded
    bool autoConnect;
    bool hasFilter;
    HubFilter filter;
};

/**
 * @brief Packed binary settings structure for InternalFS storage
 */
struct __attribute__((packed)) SettingsData {
    uint8_t magic;
    uint8_t version;
    uint8_t adapterIndex;
    uint8_t connectRetries;
    uint32_t retryDelayMs;
    uint32_t waitTimeoutMs;
    uint8_t autoConnect;
    uint8_t filterType;             // 0 = none, 1 = name, 2 = address
    char filterValue[HUB_NAME_MAX];
    uint8_t reserved[8];
};

// =============================================================================
// SETTINGS STORE CLASS
// =============================================================================

class SettingsStore {
public:
    SettingsStore();

    /**
     * @brief Mount InternalFS and load stored settings (defaults if absent)
     */
    bool begin();

    /**
     * @brief Write current settings to flash
     */
    bool save();

    /**
     * @brief Read settings from flash
     * @return false if no valid record was found (defaults kept)
     */
    bool load();

    bool isStorageAvailable() const { return _storageAvailable; }

    const LinkSettings& get() const { return _settings; }

    void resetToDefaults();

    /**
     * @brief Validate and apply one parameter
     * @return false if the name is unknown or the value out of range
     */
    bool setParameter(const char* name, const char* value);

    /**
     * @brief Default filter, or nullptr if none is configured
     */
    const HubFilter* getFilter() const { return _settings.hasFilter ? &_settings.filter : nullptr; }

    /**
     * @brief Wait timeout for the facade (WAIT_FOREVER_MS when unbounded)
     */
    uint32_t getWaitTimeoutMs() const;

    // =========================================================================
    // SERIALIZATION
    // =========================================================================

    void encode(SettingsData& out) const;

    /**
     * @brief Apply a stored record field by field
     * @return false if magic/version do not match (nothing applied)
     */
    bool decode(const SettingsData& data);

private:
    LinkSettings _settings;
    bool _storageAvailable;
};

#endif // SETTINGS_STORE_H
