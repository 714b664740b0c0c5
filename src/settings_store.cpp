/**
 * @file settings_store.cpp
 * @brief HubLink settings - Validation and record encoding
 * @version 1.0.0
 * @platform Adafruit Feather nRF52840 Express
 */

#include "settings_store.h"
#include <stdlib.h>
#include <ctype.h>

// =============================================================================
// CONSTRUCTOR
// =============================================================================

SettingsStore::SettingsStore() :
    _storageAvailable(false)
{
    resetToDefaults();
}

void SettingsStore::resetToDefaults() {
    _settings.adapterIndex = 0;
    _settings.connectRetries = CONNECT_RETRY_COUNT;
    _settings.retryDelayMs = CONNECT_RETRY_DELAY_MS;
    _settings.waitTimeoutMs = 0;
    _settings.autoConnect = false;
    _settings.hasFilter = false;
    _settings.filter = HubFilter();
}

uint32_t SettingsStore::getWaitTimeoutMs() const {
    return _settings.waitTimeoutMs == 0 ? WAIT_FOREVER_MS : _settings.waitTimeoutMs;
}

// =============================================================================
// PARAMETERS
// =============================================================================

static bool parseUnsigned(const char* value, uint32_t maxValue, uint32_t& out) {
    if (!value || !*value) {
        return false;
    }
    char* end = nullptr;
    unsigned long parsed = strtoul(value, &end, 10);
    if (*end != '\0' || value[0] == '-' || parsed > maxValue) {
        return false;
    }
    out = (uint32_t)parsed;
    return true;
}

bool SettingsStore::setParameter(const char* name, const char* value) {
    if (!name || !value) {
        return false;
    }

    // Convert param name to uppercase for comparison
    char nameUpper[24];
    strncpy(nameUpper, name, sizeof(nameUpper) - 1);
    nameUpper[sizeof(nameUpper) - 1] = '\0';
    for (char* c = nameUpper; *c; c++) {
        *c = toupper(*c);
    }

    uint32_t number = 0;
    if (strcmp(nameUpper, "ADAPTER") == 0) {
        if (!parseUnsigned(value, SETTINGS_ADAPTER_MAX, number)) return false;
        _settings.adapterIndex = (uint8_t)number;
    }
    else if (strcmp(nameUpper, "RETRIES") == 0) {
        if (!parseUnsigned(value, CONNECT_RETRY_MAX, number) || number < 1) return false;
        _settings.connectRetries = (uint8_t)number;
    }
    else if (strcmp(nameUpper, "RETRY_DELAY") == 0) {
        if (!parseUnsigned(value, CONNECT_RETRY_DELAY_MAX_MS, number)) return false;
        _settings.retryDelayMs = number;
    }
    else if (strcmp(nameUpper, "WAIT_TIMEOUT") == 0) {
        if (!parseUnsigned(value, 0xFFFFFFFEUL, number)) return false;
        _settings.waitTimeoutMs = number;
    }
    else if (strcmp(nameUpper, "AUTOCONNECT") == 0) {
        if (strcmp(value, "1") == 0 || strcasecmp(value, "ON") == 0) {
            _settings.autoConnect = true;
        } else if (strcmp(value, "0") == 0 || strcasecmp(value, "OFF") == 0) {
            _settings.autoConnect = false;
        } else {
            return false;
        }
    }
    else if (strcmp(nameUpper, "FILTER_NAME") == 0) {
        if (!*value || strlen(value) >= HUB_NAME_MAX) return false;
        _settings.filter = HubFilter::byName(value);
        _settings.hasFilter = true;
    }
    else if (strcmp(nameUpper, "FILTER_ADDR") == 0) {
        BleAddress parsed;
        if (!BleAddress::fromString(value, parsed)) return false;
        // Store the canonical upper-case form so it matches discovered addresses
        char canonical[BLE_ADDRESS_STRING_LEN];
        parsed.toString(canonical, sizeof(canonical));
        _settings.filter = HubFilter::byAddress(canonical);
        _settings.hasFilter = true;
    }
    else if (strcmp(nameUpper, "FILTER_NONE") == 0) {
        _settings.filter = HubFilter();
        _settings.hasFilter = false;
    }
    else {
        return false;
    }

    Serial.printf("[SETTINGS] %s = %s\n", nameUpper, value);
    return true;
}

// =============================================================================
// SERIALIZATION
// =============================================================================

void SettingsStore::encode(SettingsData& out) const {
    memset(&out, 0, sizeof(out));

    out.magic = SETTINGS_MAGIC;
    out.version = SETTINGS_VERSION;
    out.adapterIndex = _settings.adapterIndex;
    out.connectRetries = _settings.connectRetries;
    out.retryDelayMs = _settings.retryDelayMs;
    out.waitTimeoutMs = _settings.waitTimeoutMs;
    out.autoConnect = _settings.autoConnect ? 1 : 0;

    if (_settings.hasFilter) {
        out.filterType = (_settings.filter.type == HubFilterType::BY_NAME) ? 1 : 2;
        strncpy(out.filterValue, _settings.filter.value, sizeof(out.filterValue) - 1);
    }
}

bool SettingsStore::decode(const SettingsData& data) {
    if (data.magic != SETTINGS_MAGIC || data.version != SETTINGS_VERSION) {
        Serial.println(F("[SETTINGS] Invalid file format"));
        return false;
    }

    if (data.adapterIndex <= SETTINGS_ADAPTER_MAX) {
        _settings.adapterIndex = data.adapterIndex;
    } else {
        Serial.printf("[SETTINGS] WARNING: Invalid adapter %u, keeping %u\n",
                      data.adapterIndex, _settings.adapterIndex);
    }

    if (data.connectRetries >= 1 && data.connectRetries <= CONNECT_RETRY_MAX) {
        _settings.connectRetries = data.connectRetries;
    } else {
        Serial.printf("[SETTINGS] WARNING: Invalid retries %u, keeping %u\n",
                      data.connectRetries, _settings.connectRetries);
    }

    uint32_t retryDelayMs = data.retryDelayMs;
    if (retryDelayMs <= CONNECT_RETRY_DELAY_MAX_MS) {
        _settings.retryDelayMs = retryDelayMs;
    } else {
        Serial.printf("[SETTINGS] WARNING: Invalid retry delay %lu, keeping %lu\n",
                      (unsigned long)retryDelayMs, (unsigned long)_settings.retryDelayMs);
    }

    _settings.waitTimeoutMs = data.waitTimeoutMs;
    _settings.autoConnect = (data.autoConnect == 1);

    // Filter value must be terminated within the field
    bool terminated = memchr(data.filterValue, '\0', sizeof(data.filterValue)) != nullptr;
    if (data.filterType == 1 && terminated && data.filterValue[0] != '\0') {
        _settings.filter = HubFilter::byName(data.filterValue);
        _settings.hasFilter = true;
    } else if (data.filterType == 2 && terminated && data.filterValue[0] != '\0') {
        _settings.filter = HubFilter::byAddress(data.filterValue);
        _settings.hasFilter = true;
    } else {
        _settings.filter = HubFilter();
        _settings.hasFilter = false;
    }

    return true;
}
