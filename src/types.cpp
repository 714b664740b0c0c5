/**
 * @file types.cpp
 * @brief HubLink type definitions - Implementation
 * @version 1.0.0
 * @platform Adafruit Feather nRF52840 Express
 */

#include "types.h"
#include <string.h>
#include <stdio.h>
#include <stdarg.h>
#include <ctype.h>

// =============================================================================
// STATUS
// =============================================================================

Status Status::error(Result code, const char* format, ...) {
    Status status;
    status.code = code;

    if (format) {
        va_list args;
        va_start(args, format);
        vsnprintf(status.message, sizeof(status.message), format, args);
        va_end(args);
    } else {
        strncpy(status.message, resultToString(code), sizeof(status.message) - 1);
        status.message[sizeof(status.message) - 1] = '\0';
    }

    return status;
}

// =============================================================================
// HEX HELPERS
// =============================================================================

static int hexNibble(char c) {
    if (c >= '0' && c <= '9') return c - '0';
    c = (char)tolower((unsigned char)c);
    if (c >= 'a' && c <= 'f') return c - 'a' + 10;
    return -1;
}

static bool hexByte(const char* str, uint8_t& out) {
    int hi = hexNibble(str[0]);
    int lo = hexNibble(str[1]);
    if (hi < 0 || lo < 0) {
        return false;
    }
    out = (uint8_t)((hi << 4) | lo);
    return true;
}

// =============================================================================
// BLE ADDRESS
// =============================================================================

void BleAddress::toString(char* buffer, size_t bufferSize) const {
    if (!buffer || bufferSize == 0) {
        return;
    }
    snprintf(buffer, bufferSize, "%02X:%02X:%02X:%02X:%02X:%02X",
             bytes[0], bytes[1], bytes[2], bytes[3], bytes[4], bytes[5]);
}

bool BleAddress::fromString(const char* str, BleAddress& out) {
    if (!str || strlen(str) != BLE_ADDRESS_STRING_LEN - 1) {
        return false;
    }

    BleAddress parsed;
    for (uint8_t i = 0; i < 6; i++) {
        const char* p = str + i * 3;
        if (!hexByte(p, parsed.bytes[i])) {
            return false;
        }
        if (i < 5 && p[2] != ':') {
            return false;
        }
    }

    out = parsed;
    return true;
}

// =============================================================================
// BLE UUID
// =============================================================================

bool BleUuid::fromString(const char* str, BleUuid& out) {
    // 8-4-4-4-12
    if (!str || strlen(str) != 36) {
        return false;
    }

    BleUuid parsed;
    uint8_t index = 0;
    size_t pos = 0;
    while (pos < 36) {
        if (pos == 8 || pos == 13 || pos == 18 || pos == 23) {
            if (str[pos] != '-') {
                return false;
            }
            pos++;
            continue;
        }
        if (!hexByte(str + pos, parsed.bytes[index++])) {
            return false;
        }
        pos += 2;
    }

    out = parsed;
    return true;
}

// =============================================================================
// PORT SPECIFICATION
// =============================================================================

bool portSpecFromString(const char* str, PortSpec& out) {
    if (!str) {
        return false;
    }

    for (uint8_t i = 0; i < PORT_SPEC_COUNT; i++) {
        PortSpec candidate = static_cast<PortSpec>(i);
        if (strcasecmp(str, portSpecToString(candidate)) == 0) {
            out = candidate;
            return true;
        }
    }
    return false;
}

// =============================================================================
// HUB FILTER
// =============================================================================

HubFilter HubFilter::byName(const char* name) {
    HubFilter filter;
    filter.type = HubFilterType::BY_NAME;
    strncpy(filter.value, name ? name : "", sizeof(filter.value) - 1);
    filter.value[sizeof(filter.value) - 1] = '\0';
    return filter;
}

HubFilter HubFilter::byAddress(const char* address) {
    HubFilter filter;
    filter.type = HubFilterType::BY_ADDRESS;
    strncpy(filter.value, address ? address : "", sizeof(filter.value) - 1);
    filter.value[sizeof(filter.value) - 1] = '\0';
    return filter;
}

bool HubFilter::matches(const DiscoveredHub& hub) const {
    if (type == HubFilterType::BY_NAME) {
        return strcmp(hub.name, value) == 0;
    }

    char addr[BLE_ADDRESS_STRING_LEN];
    hub.address.toString(addr, sizeof(addr));
    return strcmp(addr, value) == 0;
}
