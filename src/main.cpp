/**
 * @file main.cpp
 * @brief HubLink Firmware - Main Application
 * @version 1.0.0
 * @platform Adafruit Feather nRF52840 Express
 *
 * BLE central for LEGO Powered Up hubs:
 * - Scans continuously and logs every hub it identifies
 * - Optional auto-connect to the first hub matching the stored filter
 * - Serial console for waiting, connecting, and driving ports
 *
 * Configuration:
 * - Settings persist in InternalFS (SET/SAVE on the console)
 * - Send "HELP" over Serial for the command list
 */

#include <Arduino.h>
#include "config.h"
#include "types.h"
#include "settings_store.h"
#include "bluefruit_central.h"
#include "hub_link.h"
#include "console.h"

// =============================================================================
// GLOBAL INSTANCES
// =============================================================================

SettingsStore settings;
BluefruitManager bleManager;
HubLink hubLink;
Console console;

// =============================================================================
// STATE VARIABLES
// =============================================================================

bool linkReady = false;
uint32_t lastStatusPrint = 0;

#define STATUS_PRINT_INTERVAL_MS 60000

// =============================================================================
// FUNCTION DECLARATIONS
// =============================================================================

void printBanner();
void printAdapters();
void autoConnect();
void onConsoleResponse(const char* response);

// =============================================================================
// SETUP
// =============================================================================

void setup()
{
    Serial.begin(SERIAL_BAUD);

    // Wait for serial with timeout
    uint32_t serialWaitStart = millis();
    while (!Serial && (millis() - serialWaitStart < 3000))
    {
        delay(10);
    }

    Serial.printf("\n[BOOT] Serial ready at millis=%lu\n", (unsigned long)millis());
    Serial.flush();

    printBanner();

    // Settings first: they pick the adapter and retry policy
    Serial.println(F("\n--- Settings Initialization ---"));
    settings.begin();
    const LinkSettings& cfg = settings.get();
    Serial.printf("[BOOT] Adapter %u, %u attempts, %lu ms between\n",
                  cfg.adapterIndex, cfg.connectRetries, (unsigned long)cfg.retryDelayMs);

    Serial.println(F("\n--- BLE Initialization ---"));
    printAdapters();

    Result result = hubLink.begin(&bleManager, cfg.adapterIndex);
    if (result == Result::OK)
    {
        linkReady = true;
        hubLink.setRetryPolicy(cfg.connectRetries, cfg.retryDelayMs);
        Serial.println(F("[SUCCESS] HubLink scanning"));
    }
    else
    {
        Serial.printf("[ERROR] HubLink failed to start: %s\n", resultToString(result));
    }

    console.begin(&hubLink, &settings, &bleManager);
    console.setSendCallback(onConsoleResponse);

    if (linkReady && cfg.autoConnect)
    {
        autoConnect();
    }

    Serial.println(F("\n[BOOT] Ready - send HELP for commands"));
}

// =============================================================================
// LOOP
// =============================================================================

void loop()
{
    // Process Serial commands
    if (Serial.available())
    {
        String input = Serial.readStringUntil('\n');
        input.trim();
        if (input.length() > 0)
        {
            console.handleLine(input.c_str());
        }
    }

    uint32_t now = millis();
    if (linkReady && now - lastStatusPrint >= STATUS_PRINT_INTERVAL_MS)
    {
        lastStatusPrint = now;
        Serial.printf("[STATUS] forwarded=%lu dropped=%lu notifications=%lu\n",
                      (unsigned long)hubLink.discoveryListener().getForwardedCount(),
                      (unsigned long)hubLink.discoveryListener().getDroppedCount(),
                      (unsigned long)hubLink.hubRegistry().getNotificationCount());
    }

    delay(10);
}

// =============================================================================
// HELPERS
// =============================================================================

void printBanner()
{
    Serial.println(F("=========================================="));
    Serial.printf(" %s v%s\n", FIRMWARE_NAME, FIRMWARE_VERSION);
    Serial.println(F(" LEGO Powered Up hub link"));
    Serial.println(F("=========================================="));
}

void printAdapters()
{
    const char* names[4];
    uint8_t count = HubLink::listAdapters(&bleManager, names, 4);
    for (uint8_t i = 0; i < count && i < 4; i++)
    {
        Serial.printf("[BOOT] Adapter %u: %s\n", i, names[i]);
    }
}

void autoConnect()
{
    const HubFilter* filter = settings.getFilter();
    uint32_t timeoutMs = settings.getWaitTimeoutMs();

    Serial.println(F("[BOOT] Auto-connect: waiting for hub..."));

    DiscoveredHub hub;
    Status status = filter
        ? hubLink.waitForHubFilterTimeout(*filter, timeoutMs, hub)
        : hubLink.waitForHubTimeout(timeoutMs, hub);
    if (!status.isOk())
    {
        Serial.printf("[BOOT] Auto-connect skipped: %s\n", status.message);
        return;
    }

    HubController controller;
    status = hubLink.createHub(hub, controller);
    if (!status.isOk())
    {
        Serial.printf("[BOOT] Auto-connect failed: %s\n", status.message);
        return;
    }

    char addr[BLE_ADDRESS_STRING_LEN];
    controller.getAddress().toString(addr, sizeof(addr));
    Serial.printf("[BOOT] Connected to %s (%s) at %s\n",
                  controller.getName(), hubKindToString(controller.getKind()), addr);

    // Hub LED green marks a live link
    PortController led;
    if (controller.port(PortSpec::HUB_LED, led).isOk())
    {
        Status ledStatus = led->setColor((uint8_t)Lpf2Color::GREEN);
        if (!ledStatus.isOk())
        {
            Serial.printf("[BOOT] WARNING: %s\n", ledStatus.message);
        }
    }
}

void onConsoleResponse(const char* response)
{
    Serial.print(response);
}
