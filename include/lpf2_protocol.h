/**
 * @file lpf2_protocol.h
 * @brief HubLink LPF2 protocol - Message framing, parsing, and command builders
 * @version 1.0.0
 * @platform Adafruit Feather nRF52840 Express
 *
 * Implements the LEGO Wireless Protocol 3 common frame used on the LPF2
 * control characteristic:
 *
 *   [length][hub id][message type][payload...]
 *
 * length counts the whole frame. Frames longer than 127 bytes use a two byte
 * length: [0x80 | (len & 0x7F)][len >> 7]. The hub id is always 0 over BLE.
 *
 * Example (start motor on port A at 50% speed):
 *   Lpf2Message msg = Lpf2Message::createStartSpeed(0x00, 50);
 *   -> 09 00 81 00 11 07 32 64 00
 */

#ifndef LPF2_PROTOCOL_H
#define LPF2_PROTOCOL_H

#include <Arduino.h>
#include "config.h"
#include "types.h"

// =============================================================================
// MESSAGE TYPES
// =============================================================================

enum class Lpf2MessageType : uint8_t {
    HUB_PROPERTIES = 0x01,
    HUB_ACTIONS = 0x02,
    HUB_ALERTS = 0x03,
    HUB_ATTACHED_IO = 0x04,
    GENERIC_ERROR = 0x05,
    PORT_INFORMATION_REQUEST = 0x21,
    PORT_MODE_INFORMATION_REQUEST = 0x22,
    PORT_INPUT_FORMAT_SETUP_SINGLE = 0x41,
    PORT_INFORMATION = 0x43,
    PORT_MODE_INFORMATION = 0x44,
    PORT_VALUE_SINGLE = 0x45,
    PORT_INPUT_FORMAT_SINGLE = 0x47,
    PORT_OUTPUT_COMMAND = 0x81,
    PORT_OUTPUT_COMMAND_FEEDBACK = 0x82
};

/**
 * @brief Get string representation of message type
 * @return nullptr for codes this firmware does not handle
 */
const char* lpf2MessageTypeToString(Lpf2MessageType type);

// =============================================================================
// COMMAND CONSTANTS
// =============================================================================

#define LPF2_STARTUP_IMMEDIATE_FEEDBACK 0x11    // Execute immediately, request feedback

#define LPF2_SUBCMD_START_SPEED 0x07
#define LPF2_SUBCMD_WRITE_DIRECT_MODE_DATA 0x51

#define LPF2_MOTOR_MODE_POWER 0x00
#define LPF2_LED_MODE_COLOR 0x00
#define LPF2_LED_MODE_RGB 0x01

#define LPF2_POWER_BRAKE 127
#define LPF2_DEFAULT_MAX_POWER 100

#define LPF2_HUB_ACTION_SWITCH_OFF 0x01
#define LPF2_HUB_ACTION_DISCONNECT 0x02

/**
 * @brief Hub LED colour index (mode 0)
 */
enum class Lpf2Color : uint8_t {
    BLACK = 0,
    PINK,
    PURPLE,
    BLUE,
    LIGHT_BLUE,
    CYAN,
    GREEN,
    YELLOW,
    ORANGE,
    RED,
    WHITE
};

#define LPF2_COLOR_MAX 10

// =============================================================================
// LPF2 MESSAGE
// =============================================================================

/**
 * @brief One LPF2 frame: type plus payload (header excluded)
 *
 * Usage:
 *   Lpf2Message msg;
 *   if (Lpf2Message::parse(data, len, msg) == Result::OK) {
 *       Serial.println(msg.getTypeString());
 *   }
 */
class Lpf2Message {
public:
    Lpf2Message();
    explicit Lpf2Message(Lpf2MessageType type);

    /**
     * @brief Parse a raw notification buffer
     * @return OK, or ERROR_PARSE_FAILURE for truncated, length-mismatched,
     *         oversized, or unknown-type frames
     */
    static Result parse(const uint8_t* data, uint16_t length, Lpf2Message& out);

    /**
     * @brief Encode the frame including header
     * @param buffer Output buffer
     * @param bufferSize Size of output buffer
     * @param written Bytes written
     * @return true if the frame fit
     */
    bool serialize(uint8_t* buffer, size_t bufferSize, uint16_t& written) const;

    /**
     * @brief Total encoded size including header
     */
    uint16_t getFrameLength() const;

    // =========================================================================
    // PROPERTIES
    // =========================================================================

    Lpf2MessageType getType() const { return _type; }

    const char* getTypeString() const;

    const uint8_t* getPayload() const { return _payload; }

    uint8_t getPayloadLength() const { return _payloadLength; }

    /**
     * @brief True for port-addressed messages (payload starts with a port id)
     */
    bool hasPort() const;

    /**
     * @brief Port id of a port-addressed message (0xFF otherwise)
     */
    uint8_t getPortId() const;

    // =========================================================================
    // PAYLOAD BUILDING
    // =========================================================================

    bool appendByte(uint8_t value);

    bool appendUint32(uint32_t value);

    void clearPayload() { _payloadLength = 0; }

    // =========================================================================
    // CONVENIENCE FACTORIES
    // =========================================================================

    /**
     * @brief Port output StartSpeed (-100..100, motor keeps running)
     */
    static Lpf2Message createStartSpeed(uint8_t portId, int8_t speed,
                                        uint8_t maxPower = LPF2_DEFAULT_MAX_POWER,
                                        uint8_t useProfile = 0);

    /**
     * @brief Port output StartPower via WriteDirectModeData (mode 0)
     */
    static Lpf2Message createStartPower(uint8_t portId, int8_t power);

    /**
     * @brief Hub LED colour index (mode 0)
     */
    static Lpf2Message createSetLedColor(uint8_t portId, uint8_t color);

    /**
     * @brief Hub LED RGB (mode 1)
     */
    static Lpf2Message createSetLedRgb(uint8_t portId, uint8_t red, uint8_t green, uint8_t blue);

    /**
     * @brief Port input format setup (single)
     * @param deltaInterval Change required before the hub notifies
     */
    static Lpf2Message createPortInputFormatSetup(uint8_t portId, uint8_t mode,
                                                  uint32_t deltaInterval, bool notify);

    static Lpf2Message createHubAction(uint8_t action);

private:
    Lpf2MessageType _type;
    uint8_t _payload[LPF2_MAX_MESSAGE_SIZE];
    uint8_t _payloadLength;
};

#endif // LPF2_PROTOCOL_H
