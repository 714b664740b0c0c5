/**
 * @file console.cpp
 * @brief HubLink serial console - Implementation
 * @version 1.0.0
 * @platform Adafruit Feather nRF52840 Express
 */

#include "console.h"
#include "hub_link.h"
#include "settings_store.h"
#include "ble_central.h"
#include <stdlib.h>
#include <ctype.h>

#define CONSOLE_MAX_ADAPTERS 4

// =============================================================================
// CONSTRUCTOR
// =============================================================================

Console::Console() :
    _link(nullptr),
    _settings(nullptr),
    _manager(nullptr),
    _sendCallback(nullptr),
    _restartCallback(nullptr)
{
    memset(_response, 0, sizeof(_response));
}

// =============================================================================
// INITIALIZATION
// =============================================================================

void Console::begin(HubLink* link, SettingsStore* settings, BleManager* manager) {
    _link = link;
    _settings = settings;
    _manager = manager;

    Serial.println(F("[CONSOLE] Ready"));
}

void Console::setSendCallback(ConsoleSendCallback callback) {
    _sendCallback = callback;
}

void Console::setRestartCallback(ConsoleRestartCallback callback) {
    _restartCallback = callback;
}

// =============================================================================
// COMMAND PROCESSING
// =============================================================================

bool Console::handleLine(const char* line) {
    if (!line || strlen(line) == 0) {
        return false;
    }

    char command[16];
    char params[CONSOLE_MAX_PARAMS][CONSOLE_PARAM_MAX];
    uint8_t paramCount = 0;

    if (!parseLine(line, command, params, paramCount)) {
        sendError("Invalid command format");
        return false;
    }

    Serial.printf("[CONSOLE] Command: %s, Params: %d\n", command, paramCount);

    if (strcmp(command, "HELP") == 0) {
        return handleHelp();
    } else if (strcmp(command, "INFO") == 0) {
        return handleInfo();
    } else if (strcmp(command, "ADAPTERS") == 0) {
        return handleAdapters();
    } else if (strcmp(command, "WAIT") == 0) {
        return handleWait(params, paramCount);
    } else if (strcmp(command, "HUBS") == 0) {
        return handleHubs();
    } else if (strcmp(command, "CONNECT") == 0) {
        return handleConnect(params, paramCount);
    } else if (strcmp(command, "DISCONNECT") == 0) {
        return handleDisconnect(params, paramCount);
    } else if (strcmp(command, "PORTS") == 0) {
        return handlePorts(params, paramCount);
    } else if (strcmp(command, "SPEED") == 0) {
        return handleSpeed(params, paramCount);
    } else if (strcmp(command, "LED") == 0) {
        return handleLed(params, paramCount);
    } else if (strcmp(command, "SET") == 0) {
        return handleSet(params, paramCount);
    } else if (strcmp(command, "SAVE") == 0) {
        return handleSave();
    } else if (strcmp(command, "RESTART") == 0) {
        return handleRestart();
    }

    char errorMsg[48];
    snprintf(errorMsg, sizeof(errorMsg), "Unknown command: %s", command);
    sendError(errorMsg);
    return false;
}

// =============================================================================
// PARSING
// =============================================================================

bool Console::parseLine(const char* line, char* command, char params[][CONSOLE_PARAM_MAX], uint8_t& paramCount) {
    paramCount = 0;
    const char* p = line;

    // Command word
    while (*p == ' ' || *p == '\t') p++;
    uint8_t len = 0;
    while (*p && *p != ' ' && *p != '\t' && *p != '\r' && *p != '\n') {
        if (len >= 15) {
            return false;
        }
        command[len++] = toupper(*p++);
    }
    command[len] = '\0';
    if (len == 0) {
        return false;
    }

    // Parameters, double quotes group spaces
    while (*p && *p != '\r' && *p != '\n') {
        while (*p == ' ' || *p == '\t') p++;
        if (!*p || *p == '\r' || *p == '\n') {
            break;
        }
        if (paramCount >= CONSOLE_MAX_PARAMS) {
            return false;
        }

        char* out = params[paramCount];
        len = 0;
        if (*p == '"') {
            p++;
            while (*p && *p != '"') {
                if (len >= CONSOLE_PARAM_MAX - 1) return false;
                out[len++] = *p++;
            }
            if (*p != '"') {
                return false;
            }
            p++;
        } else {
            while (*p && *p != ' ' && *p != '\t' && *p != '\r' && *p != '\n') {
                if (len >= CONSOLE_PARAM_MAX - 1) return false;
                out[len++] = *p++;
            }
        }
        out[len] = '\0';
        paramCount++;
    }

    return true;
}

bool Console::parseAddress(const char* text, BleAddress& out) {
    if (!BleAddress::fromString(text, out)) {
        char errorMsg[64];
        snprintf(errorMsg, sizeof(errorMsg), "Invalid address '%s'", text);
        sendError(errorMsg);
        return false;
    }
    return true;
}

bool Console::requireRunning() {
    if (!_link || !_link->isRunning()) {
        sendError("HubLink not running");
        return false;
    }
    return true;
}

// =============================================================================
// RESPONSE FORMATTING
// =============================================================================

void Console::beginResponse() {
    _response[0] = '\0';
}

void Console::addResponseLine(const char* key, const char* value) {
    char line[96];
    snprintf(line, sizeof(line), "%s:%s\n", key, value ? value : "");

    size_t currentLen = strlen(_response);
    size_t lineLen = strlen(line);

    // Leave room for the terminating OK line
    if (currentLen + lineLen < CONSOLE_RESPONSE_MAX - 4) {
        strcat(_response, line);
    }
}

void Console::addResponseLine(const char* key, int32_t value) {
    char valueStr[16];
    snprintf(valueStr, sizeof(valueStr), "%ld", (long)value);
    addResponseLine(key, valueStr);
}

void Console::sendOk() {
    strcat(_response, "OK\n");

    if (_sendCallback) {
        _sendCallback(_response);
    }
    DEBUG_PRINTF("[CONSOLE-TX] %s", _response);
}

void Console::sendError(const char* message) {
    snprintf(_response, sizeof(_response), "ERROR:%s\n", message);

    if (_sendCallback) {
        _sendCallback(_response);
    }
    DEBUG_PRINTF("[CONSOLE-TX] %s", _response);
}

void Console::sendStatus(const Status& status) {
    if (status.isOk()) {
        sendOk();
    } else {
        sendError(status.message[0] ? status.message : resultToString(status.code));
    }
}

void Console::addHubLines(const BleAddress& address, HubKind kind, const char* name) {
    char addr[BLE_ADDRESS_STRING_LEN];
    address.toString(addr, sizeof(addr));
    addResponseLine("HUB", addr);
    addResponseLine("KIND", hubKindToString(kind));
    addResponseLine("NAME", name);
}

// =============================================================================
// DEVICE COMMANDS
// =============================================================================

bool Console::handleHelp() {
    beginResponse();
    addResponseLine("COMMAND", "HELP");
    addResponseLine("COMMAND", "INFO");
    addResponseLine("COMMAND", "ADAPTERS");
    addResponseLine("COMMAND", "WAIT");
    addResponseLine("COMMAND", "HUBS");
    addResponseLine("COMMAND", "CONNECT");
    addResponseLine("COMMAND", "DISCONNECT");
    addResponseLine("COMMAND", "PORTS");
    addResponseLine("COMMAND", "SPEED");
    addResponseLine("COMMAND", "LED");
    addResponseLine("COMMAND", "SET");
    addResponseLine("COMMAND", "SAVE");
    addResponseLine("COMMAND", "RESTART");
    sendOk();
    return true;
}

bool Console::handleInfo() {
    beginResponse();
    addResponseLine("NAME", FIRMWARE_NAME);
    addResponseLine("FW", FIRMWARE_VERSION);

    bool running = _link && _link->isRunning();
    addResponseLine("RUNNING", running ? "1" : "0");
    if (running) {
        BleCentral* central = _link->getAdapter();
        addResponseLine("ADAPTER", central ? central->name() : "");

        DiscoveredHubList list;
        if (_link->discoveredHubs(list).isOk()) {
            addResponseLine("DISCOVERED", (int32_t)list.count);
        }
        addResponseLine("FORWARDED", (int32_t)_link->discoveryListener().getForwardedCount());
        addResponseLine("NOTIFY", (int32_t)_link->hubRegistry().getNotificationCount());
    }
    if (_settings) {
        addResponseLine("RETRIES", (int32_t)_settings->get().connectRetries);
        addResponseLine("RETRY_DELAY", (int32_t)_settings->get().retryDelayMs);
    }
    sendOk();
    return true;
}

bool Console::handleAdapters() {
    const char* names[CONSOLE_MAX_ADAPTERS];
    uint8_t count = HubLink::listAdapters(_manager, names, CONSOLE_MAX_ADAPTERS);

    beginResponse();
    addResponseLine("COUNT", (int32_t)count);
    for (uint8_t i = 0; i < count && i < CONSOLE_MAX_ADAPTERS; i++) {
        addResponseLine("ADAPTER", names[i]);
    }
    sendOk();
    return true;
}

bool Console::handleRestart() {
    beginResponse();
    addResponseLine("STATUS", "REBOOTING");
    sendOk();

    // Give time for response to be sent
    delay(100);

    if (_restartCallback) {
        _restartCallback();
    } else {
        NVIC_SystemReset();
    }
    return true;
}

// =============================================================================
// DISCOVERY COMMANDS
// =============================================================================

bool Console::handleWait(char params[][CONSOLE_PARAM_MAX], uint8_t paramCount) {
    if (!requireRunning()) {
        return false;
    }

    HubFilter filter;
    const HubFilter* filterPtr = _settings ? _settings->getFilter() : nullptr;
    uint32_t timeoutMs = _settings ? _settings->getWaitTimeoutMs() : WAIT_FOREVER_MS;
    uint8_t index = 0;

    if (paramCount >= 2 && strcasecmp(params[0], "NAME") == 0) {
        if (strlen(params[1]) >= HUB_NAME_MAX) {
            sendError("Name too long");
            return false;
        }
        filter = HubFilter::byName(params[1]);
        filterPtr = &filter;
        index = 2;
    } else if (paramCount >= 2 && strcasecmp(params[0], "ADDR") == 0) {
        BleAddress address;
        if (!parseAddress(params[1], address)) {
            return false;
        }
        char canonical[BLE_ADDRESS_STRING_LEN];
        address.toString(canonical, sizeof(canonical));
        filter = HubFilter::byAddress(canonical);
        filterPtr = &filter;
        index = 2;
    }

    if (index < paramCount) {
        char* end = nullptr;
        unsigned long parsed = strtoul(params[index], &end, 10);
        if (*end != '\0' || params[index][0] == '-' || parsed == 0) {
            sendError("Invalid timeout");
            return false;
        }
        timeoutMs = (uint32_t)parsed;
        index++;
    }
    if (index != paramCount) {
        sendError("Usage: WAIT [NAME <n>|ADDR <a>] [timeoutMs]");
        return false;
    }

    DiscoveredHub hub;
    Status status = filterPtr
        ? _link->waitForHubFilterTimeout(*filterPtr, timeoutMs, hub)
        : _link->waitForHubTimeout(timeoutMs, hub);
    if (!status.isOk()) {
        sendStatus(status);
        return false;
    }

    beginResponse();
    addHubLines(hub.address, hub.kind, hub.name);
    sendOk();
    return true;
}

bool Console::handleHubs() {
    if (!requireRunning()) {
        return false;
    }

    DiscoveredHubList list;
    Status status = _link->discoveredHubs(list);
    if (!status.isOk()) {
        sendStatus(status);
        return false;
    }

    beginResponse();
    addResponseLine("COUNT", (int32_t)list.count);
    for (uint8_t i = 0; i < list.count; i++) {
        char addr[BLE_ADDRESS_STRING_LEN];
        char value[80];
        list.hubs[i].address.toString(addr, sizeof(addr));
        snprintf(value, sizeof(value), "%s,%s,%s", addr,
                 hubKindToString(list.hubs[i].kind), list.hubs[i].name);
        addResponseLine("HUB", value);
    }
    sendOk();
    return true;
}

// =============================================================================
// HUB COMMANDS
// =============================================================================

bool Console::handleConnect(char params[][CONSOLE_PARAM_MAX], uint8_t paramCount) {
    if (paramCount != 1) {
        sendError("Usage: CONNECT <addr>");
        return false;
    }
    BleAddress address;
    if (!parseAddress(params[0], address) || !requireRunning()) {
        return false;
    }

    HubController controller;
    Status status = _link->connectToHub(params[0], controller);
    if (!status.isOk()) {
        sendStatus(status);
        return false;
    }

    beginResponse();
    addHubLines(controller.getAddress(), controller.getKind(), controller.getName());
    sendOk();
    return true;
}

bool Console::handleDisconnect(char params[][CONSOLE_PARAM_MAX], uint8_t paramCount) {
    if (paramCount != 1) {
        sendError("Usage: DISCONNECT <addr>");
        return false;
    }
    BleAddress address;
    if (!parseAddress(params[0], address) || !requireRunning()) {
        return false;
    }

    Status status = _link->disconnectHub(address);
    beginResponse();
    sendStatus(status);
    return status.isOk();
}

bool Console::handlePorts(char params[][CONSOLE_PARAM_MAX], uint8_t paramCount) {
    if (paramCount != 1) {
        sendError("Usage: PORTS <addr>");
        return false;
    }
    BleAddress address;
    if (!parseAddress(params[0], address) || !requireRunning()) {
        return false;
    }

    beginResponse();
    uint8_t found = 0;
    for (uint8_t i = 0; i < PORT_SPEC_COUNT; i++) {
        PortSpec spec = static_cast<PortSpec>(i);
        PortController controller;
        Status status = _link->getPort(address, spec, controller);
        if (status.code == Result::ERROR_UNKNOWN_HUB || status.code == Result::ERROR_CHANNEL_CLOSED) {
            sendStatus(status);
            return false;
        }
        if (!status.isOk()) {
            continue;
        }

        char value[32];
        snprintf(value, sizeof(value), "%s=%u,%s", portSpecToString(spec),
                 controller.getPortId(), deviceKindToString(controller->getKind()));
        addResponseLine("PORT", value);
        found++;
    }
    addResponseLine("COUNT", (int32_t)found);
    sendOk();
    return true;
}

// =============================================================================
// DEVICE COMMANDS
// =============================================================================

bool Console::handleSpeed(char params[][CONSOLE_PARAM_MAX], uint8_t paramCount) {
    if (paramCount != 3) {
        sendError("Usage: SPEED <addr> <port> <-100..100>");
        return false;
    }
    BleAddress address;
    if (!parseAddress(params[0], address)) {
        return false;
    }
    PortSpec spec;
    if (!portSpecFromString(params[1], spec)) {
        sendError("Invalid port");
        return false;
    }
    char* end = nullptr;
    long speed = strtol(params[2], &end, 10);
    if (*end != '\0' || speed < -100 || speed > 100) {
        sendError("Speed must be -100 to 100");
        return false;
    }
    if (!requireRunning()) {
        return false;
    }

    PortController controller;
    Status status = _link->getPort(address, spec, controller);
    if (status.isOk()) {
        status = controller->startSpeed((int8_t)speed);
    }
    beginResponse();
    sendStatus(status);
    return status.isOk();
}

bool Console::handleLed(char params[][CONSOLE_PARAM_MAX], uint8_t paramCount) {
    if (paramCount != 2) {
        sendError("Usage: LED <addr> <colour 0-10>");
        return false;
    }
    BleAddress address;
    if (!parseAddress(params[0], address)) {
        return false;
    }
    char* end = nullptr;
    unsigned long color = strtoul(params[1], &end, 10);
    if (*end != '\0' || params[1][0] == '-' || color > LPF2_COLOR_MAX) {
        sendError("Colour must be 0 to 10");
        return false;
    }
    if (!requireRunning()) {
        return false;
    }

    PortController controller;
    Status status = _link->getPort(address, PortSpec::HUB_LED, controller);
    if (status.isOk()) {
        status = controller->setColor((uint8_t)color);
    }
    beginResponse();
    sendStatus(status);
    return status.isOk();
}

// =============================================================================
// SETTINGS COMMANDS
// =============================================================================

bool Console::handleSet(char params[][CONSOLE_PARAM_MAX], uint8_t paramCount) {
    if (!_settings) {
        sendError("Settings not available");
        return false;
    }

    // FILTER_NONE takes no value
    const char* value = (paramCount >= 2) ? params[1] : "";
    bool noValue = (paramCount == 1 && strcasecmp(params[0], "FILTER_NONE") == 0);
    if (paramCount != 2 && !noValue) {
        sendError("Usage: SET <param> <value>");
        return false;
    }

    if (!_settings->setParameter(params[0], value)) {
        char errorMsg[64];
        snprintf(errorMsg, sizeof(errorMsg), "Invalid parameter: %s", params[0]);
        sendError(errorMsg);
        return false;
    }

    // Retry policy applies to the running facade immediately
    if (_link) {
        _link->setRetryPolicy(_settings->get().connectRetries, _settings->get().retryDelayMs);
    }

    beginResponse();
    sendOk();
    return true;
}

bool Console::handleSave() {
    if (!_settings || !_settings->save()) {
        sendError("Save failed");
        return false;
    }
    beginResponse();
    sendOk();
    return true;
}
