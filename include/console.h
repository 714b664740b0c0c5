/**
 * @file console.h
 * @brief HubLink serial console - Line command processing
 * @version 1.0.0
 * @platform Adafruit Feather nRF52840 Express
 *
 * Commands are space-separated; the command word is case-insensitive and
 * double quotes group a parameter containing spaces ("Technic Hub"):
 * - Device: HELP, INFO, ADAPTERS, RESTART
 * - Discovery: WAIT [NAME <n>|ADDR <a>] [timeoutMs], HUBS
 * - Hubs: CONNECT <addr>, DISCONNECT <addr>, PORTS <addr>
 * - Devices: SPEED <addr> <port> <-100..100>, LED <addr> <colour 0-10>
 * - Settings: SET <param> <value>, SAVE
 *
 * Responses are KEY:VALUE lines terminated by "OK", or a single
 * "ERROR:<text>" line.
 */

#ifndef CONSOLE_H
#define CONSOLE_H

#include <Arduino.h>
#include "config.h"
#include "types.h"

class HubLink;
class SettingsStore;
class BleManager;

// =============================================================================
// CONSTANTS
// =============================================================================

#define CONSOLE_MAX_PARAMS 6
#define CONSOLE_PARAM_MAX 40

// =============================================================================
// CALLBACK TYPES
// =============================================================================

/**
 * @brief Callback for sending a complete response
 */
typedef void (*ConsoleSendCallback)(const char* response);

/**
 * @brief Callback for device restart
 */
typedef void (*ConsoleRestartCallback)();

// =============================================================================
// CONSOLE CLASS
// =============================================================================

/**
 * @brief Serial command console for HubLink
 *
 * Usage:
 *   Console console;
 *   console.begin(&link, &settings, &bluefruitManager);
 *   console.setSendCallback(onConsoleResponse);
 *   console.handleLine("WAIT NAME \"Technic Hub\" 30000");
 *   // Callback receives: "HUB:90:84:2B:01:02:03\nKIND:TechnicMediumHub\nNAME:Technic Hub\nOK\n"
 */
class Console {
public:
    Console();

    void begin(HubLink* link, SettingsStore* settings, BleManager* manager);

    void setSendCallback(ConsoleSendCallback callback);

    void setRestartCallback(ConsoleRestartCallback callback);

    /**
     * @brief Handle one command line and send the response via callback
     * @return true if the command succeeded
     */
    bool handleLine(const char* line);

    /**
     * @brief Last response sent (diagnostics)
     */
    const char* getLastResponse() const { return _response; }

private:
    HubLink* _link;
    SettingsStore* _settings;
    BleManager* _manager;

    ConsoleSendCallback _sendCallback;
    ConsoleRestartCallback _restartCallback;

    char _response[CONSOLE_RESPONSE_MAX];

    // =========================================================================
    // PARSING
    // =========================================================================

    bool parseLine(const char* line, char* command, char params[][CONSOLE_PARAM_MAX], uint8_t& paramCount);

    bool parseAddress(const char* text, BleAddress& out);

    bool requireRunning();

    // =========================================================================
    // RESPONSE FORMATTING
    // =========================================================================

    void beginResponse();
    void addResponseLine(const char* key, const char* value);
    void addResponseLine(const char* key, int32_t value);
    void sendOk();
    void sendError(const char* message);
    void sendStatus(const Status& status);

    void addHubLines(const BleAddress& address, HubKind kind, const char* name);

    // =========================================================================
    // COMMAND HANDLERS
    // =========================================================================

    bool handleHelp();
    bool handleInfo();
    bool handleAdapters();
    bool handleWait(char params[][CONSOLE_PARAM_MAX], uint8_t paramCount);
    bool handleHubs();
    bool handleConnect(char params[][CONSOLE_PARAM_MAX], uint8_t paramCount);
    bool handleDisconnect(char params[][CONSOLE_PARAM_MAX], uint8_t paramCount);
    bool handlePorts(char params[][CONSOLE_PARAM_MAX], uint8_t paramCount);
    bool handleSpeed(char params[][CONSOLE_PARAM_MAX], uint8_t paramCount);
    bool handleLed(char params[][CONSOLE_PARAM_MAX], uint8_t paramCount);
    bool handleSet(char params[][CONSOLE_PARAM_MAX], uint8_t paramCount);
    bool handleSave();
    bool handleRestart();
};

#endif // CONSOLE_H
