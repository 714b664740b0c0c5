/**
 * @file config.h
 * @brief HubLink firmware configuration - Protocol constants, limits, and task parameters
 * @version 1.0.0
 * @platform Adafruit Feather nRF52840 Express
 */

#ifndef CONFIG_H
#define CONFIG_H

#include <Arduino.h>

// =============================================================================
// FIRMWARE VERSION
// =============================================================================

#define FIRMWARE_VERSION "1.0.0"
#define FIRMWARE_NAME "HubLink"

// =============================================================================
// CONNECTION POLICY
// =============================================================================

#define CONNECT_RETRY_COUNT 10          // Attempts per createHub() call
#define CONNECT_RETRY_DELAY_MS 3000     // Pause between failed attempts
#define CONNECT_RETRY_MAX 50            // Upper bound accepted from settings
#define CONNECT_RETRY_DELAY_MAX_MS 60000

#define WAIT_FOREVER_MS 0xFFFFFFFFUL    // Unbounded wait-for-hub / channel timeout

#define BLE_CONNECT_TIMEOUT_MS 5000     // Central.connect() -> connect callback
#define BLE_SCAN_INTERVAL_UNITS 160     // 100ms in 0.625ms units
#define BLE_SCAN_WINDOW_UNITS 80        // 50ms in 0.625ms units
#define BLE_SCAN_RSSI_FLOOR -90         // Ignore reports weaker than this (dBm)

// =============================================================================
// TABLE SIZES (static allocation)
// =============================================================================

#define MAX_HUBS 4                      // Simultaneously connected hubs
#define MAX_PERIPHERALS 16              // Peripherals tracked from scan reports
#define MAX_PENDING_WAITS 4             // Outstanding wait-for-hub registrations
#define MAX_DISCOVERED_HUBS 16          // Discovery log entries (keyed by address)
#define MAX_SERVICE_UUIDS 4             // 128-bit UUIDs kept per advertisement
#define MAX_MANUFACTURER_ENTRIES 2      // Company-id keyed payloads per advertisement
#define MANUFACTURER_DATA_MAX 24        // Bytes kept per manufacturer payload
#define MAX_CHARACTERISTICS 8           // Characteristics recorded per connection

#define HUB_NAME_MAX 32                 // Advertised name incl. terminator
#define STATUS_MESSAGE_MAX 96           // Status message incl. terminator

// =============================================================================
// CHANNEL CAPACITIES
// =============================================================================

#define ADAPTER_EVENT_QUEUE_SIZE 16     // Adapter -> DiscoveryListener
#define MANAGER_QUEUE_SIZE 16           // Listener + facade -> ConnectionManager
#define REGISTRY_QUEUE_SIZE 10          // Controllers/notifications -> HubRegistry
#define ADAPTER_REQUEST_QUEUE_SIZE 10   // Listener/registry -> AdapterService

// Bounded blocking for the hardware bridges; after this the item is dropped and counted
#define EVENT_ENQUEUE_TIMEOUT_MS 10
#define NOTIFICATION_ENQUEUE_TIMEOUT_MS 250

// How long stop() waits for a task to report that it exited
#define TASK_EXIT_TIMEOUT_MS 2000

// =============================================================================
// FREERTOS TASK PARAMETERS
// =============================================================================

#define ADAPTER_TASK_STACK 1024         // Words
#define LISTENER_TASK_STACK 1024
#define MANAGER_TASK_STACK 768
#define REGISTRY_TASK_STACK 1536

#define ADAPTER_TASK_PRIORITY 2
#define LISTENER_TASK_PRIORITY 2
#define MANAGER_TASK_PRIORITY 2
#define REGISTRY_TASK_PRIORITY 2

// =============================================================================
// LPF2 PROTOCOL LIMITS
// =============================================================================

#define LPF2_MAX_MESSAGE_SIZE 64        // Largest frame we parse or build
#define LPF2_HUB_ID 0x00                // Hub id byte (always 0 over BLE)

// =============================================================================
// SERIAL CONSOLE
// =============================================================================

#define SERIAL_BAUD 115200
#define CONSOLE_LINE_MAX 128
#define CONSOLE_RESPONSE_MAX 1024

// =============================================================================
// SETTINGS STORAGE
// =============================================================================

#define SETTINGS_FILE "/hublink.bin"
#define SETTINGS_MAGIC 0xB7
#define SETTINGS_VERSION 1

// =============================================================================
// DEVELOPMENT/DEBUG FLAGS
// =============================================================================

#ifndef DEBUG_ENABLED
#define DEBUG_ENABLED 0
#endif

// Debug macros
#if DEBUG_ENABLED
    #define DEBUG_PRINT(x) Serial.print(x)
    #define DEBUG_PRINTLN(x) Serial.println(x)
    #define DEBUG_PRINTF(...) Serial.printf(__VA_ARGS__)
#else
    #define DEBUG_PRINT(x)
    #define DEBUG_PRINTLN(x)
    #define DEBUG_PRINTF(...)
#endif

#endif // CONFIG_H
