/**
 * @file lpf2_protocol.cpp
 * @brief HubLink LPF2 protocol - Implementation
 * @version 1.0.0
 * @platform Adafruit Feather nRF52840 Express
 */

#include "lpf2_protocol.h"
#include <string.h>

// =============================================================================
// MESSAGE TYPE STRING MAPPINGS
// =============================================================================

struct MessageTypeMapping {
    Lpf2MessageType type;
    const char* str;
    bool portAddressed;
};

static const MessageTypeMapping MESSAGE_TYPE_MAPPINGS[] = {
    { Lpf2MessageType::HUB_PROPERTIES,                "HUB_PROPERTIES",                false },
    { Lpf2MessageType::HUB_ACTIONS,                   "HUB_ACTIONS",                   false },
    { Lpf2MessageType::HUB_ALERTS,                    "HUB_ALERTS",                    false },
    { Lpf2MessageType::HUB_ATTACHED_IO,               "HUB_ATTACHED_IO",               true },
    { Lpf2MessageType::GENERIC_ERROR,                 "GENERIC_ERROR",                 false },
    { Lpf2MessageType::PORT_INFORMATION_REQUEST,      "PORT_INFORMATION_REQUEST",      true },
    { Lpf2MessageType::PORT_MODE_INFORMATION_REQUEST, "PORT_MODE_INFORMATION_REQUEST", true },
    { Lpf2MessageType::PORT_INPUT_FORMAT_SETUP_SINGLE,"PORT_INPUT_FORMAT_SETUP_SINGLE",true },
    { Lpf2MessageType::PORT_INFORMATION,              "PORT_INFORMATION",              true },
    { Lpf2MessageType::PORT_MODE_INFORMATION,         "PORT_MODE_INFORMATION",         true },
    { Lpf2MessageType::PORT_VALUE_SINGLE,             "PORT_VALUE_SINGLE",             true },
    { Lpf2MessageType::PORT_INPUT_FORMAT_SINGLE,      "PORT_INPUT_FORMAT_SINGLE",      true },
    { Lpf2MessageType::PORT_OUTPUT_COMMAND,           "PORT_OUTPUT_COMMAND",           true },
    { Lpf2MessageType::PORT_OUTPUT_COMMAND_FEEDBACK,  "PORT_OUTPUT_COMMAND_FEEDBACK",  true }
};

static const size_t MESSAGE_TYPE_MAPPINGS_COUNT = sizeof(MESSAGE_TYPE_MAPPINGS) / sizeof(MESSAGE_TYPE_MAPPINGS[0]);

static const MessageTypeMapping* findMessageType(uint8_t code) {
    for (size_t i = 0; i < MESSAGE_TYPE_MAPPINGS_COUNT; i++) {
        if ((uint8_t)MESSAGE_TYPE_MAPPINGS[i].type == code) {
            return &MESSAGE_TYPE_MAPPINGS[i];
        }
    }
    return nullptr;
}

const char* lpf2MessageTypeToString(Lpf2MessageType type) {
    const MessageTypeMapping* mapping = findMessageType((uint8_t)type);
    return mapping ? mapping->str : nullptr;
}

// =============================================================================
// LPF2 MESSAGE - CONSTRUCTOR
// =============================================================================

Lpf2Message::Lpf2Message() :
    _type(Lpf2MessageType::HUB_PROPERTIES),
    _payloadLength(0)
{
    memset(_payload, 0, sizeof(_payload));
}

Lpf2Message::Lpf2Message(Lpf2MessageType type) :
    _type(type),
    _payloadLength(0)
{
    memset(_payload, 0, sizeof(_payload));
}

// =============================================================================
// LPF2 MESSAGE - PARSING
// =============================================================================

Result Lpf2Message::parse(const uint8_t* data, uint16_t length, Lpf2Message& out) {
    if (!data || length < 3) {
        return Result::ERROR_PARSE_FAILURE;
    }

    uint16_t frameLength;
    uint8_t headerLength;
    if (data[0] & 0x80) {
        if (length < 4) {
            return Result::ERROR_PARSE_FAILURE;
        }
        frameLength = (uint16_t)((data[0] & 0x7F) | ((uint16_t)data[1] << 7));
        headerLength = 4;
    } else {
        frameLength = data[0];
        headerLength = 3;
    }

    if (frameLength != length || frameLength < headerLength) {
        return Result::ERROR_PARSE_FAILURE;
    }

    uint16_t payloadLength = frameLength - headerLength;
    if (payloadLength > LPF2_MAX_MESSAGE_SIZE) {
        return Result::ERROR_PARSE_FAILURE;
    }

    uint8_t typeCode = data[headerLength - 1];
    const MessageTypeMapping* mapping = findMessageType(typeCode);
    if (!mapping) {
        return Result::ERROR_PARSE_FAILURE;
    }

    // Port-addressed messages must at least carry the port id
    if (mapping->portAddressed && payloadLength == 0) {
        return Result::ERROR_PARSE_FAILURE;
    }

    out._type = mapping->type;
    out._payloadLength = (uint8_t)payloadLength;
    if (payloadLength > 0) {
        memcpy(out._payload, data + headerLength, payloadLength);
    }
    return Result::OK;
}

// =============================================================================
// LPF2 MESSAGE - SERIALIZATION
// =============================================================================

uint16_t Lpf2Message::getFrameLength() const {
    uint16_t length = (uint16_t)_payloadLength + 3;
    if (length > 127) {
        length++;
    }
    return length;
}

bool Lpf2Message::serialize(uint8_t* buffer, size_t bufferSize, uint16_t& written) const {
    uint16_t frameLength = getFrameLength();
    if (!buffer || bufferSize < frameLength) {
        return false;
    }

    size_t pos = 0;
    if (frameLength > 127) {
        buffer[pos++] = (uint8_t)(0x80 | (frameLength & 0x7F));
        buffer[pos++] = (uint8_t)(frameLength >> 7);
    } else {
        buffer[pos++] = (uint8_t)frameLength;
    }
    buffer[pos++] = LPF2_HUB_ID;
    buffer[pos++] = (uint8_t)_type;

    if (_payloadLength > 0) {
        memcpy(buffer + pos, _payload, _payloadLength);
        pos += _payloadLength;
    }

    written = (uint16_t)pos;
    return true;
}

// =============================================================================
// LPF2 MESSAGE - PROPERTIES
// =============================================================================

const char* Lpf2Message::getTypeString() const {
    const char* str = lpf2MessageTypeToString(_type);
    return str ? str : "UNKNOWN";
}

bool Lpf2Message::hasPort() const {
    const MessageTypeMapping* mapping = findMessageType((uint8_t)_type);
    return mapping && mapping->portAddressed && _payloadLength > 0;
}

uint8_t Lpf2Message::getPortId() const {
    return hasPort() ? _payload[0] : 0xFF;
}

// =============================================================================
// LPF2 MESSAGE - PAYLOAD BUILDING
// =============================================================================

bool Lpf2Message::appendByte(uint8_t value) {
    if (_payloadLength >= LPF2_MAX_MESSAGE_SIZE) {
        return false;
    }
    _payload[_payloadLength++] = value;
    return true;
}

bool Lpf2Message::appendUint32(uint32_t value) {
    if (_payloadLength + 4 > LPF2_MAX_MESSAGE_SIZE) {
        return false;
    }
    // Little endian on the wire
    _payload[_payloadLength++] = (uint8_t)(value & 0xFF);
    _payload[_payloadLength++] = (uint8_t)((value >> 8) & 0xFF);
    _payload[_payloadLength++] = (uint8_t)((value >> 16) & 0xFF);
    _payload[_payloadLength++] = (uint8_t)((value >> 24) & 0xFF);
    return true;
}

// =============================================================================
// CONVENIENCE FACTORIES
// =============================================================================

Lpf2Message Lpf2Message::createStartSpeed(uint8_t portId, int8_t speed, uint8_t maxPower, uint8_t useProfile) {
    Lpf2Message msg(Lpf2MessageType::PORT_OUTPUT_COMMAND);
    msg.appendByte(portId);
    msg.appendByte(LPF2_STARTUP_IMMEDIATE_FEEDBACK);
    msg.appendByte(LPF2_SUBCMD_START_SPEED);
    msg.appendByte((uint8_t)speed);
    msg.appendByte(maxPower);
    msg.appendByte(useProfile);
    return msg;
}

Lpf2Message Lpf2Message::createStartPower(uint8_t portId, int8_t power) {
    Lpf2Message msg(Lpf2MessageType::PORT_OUTPUT_COMMAND);
    msg.appendByte(portId);
    msg.appendByte(LPF2_STARTUP_IMMEDIATE_FEEDBACK);
    msg.appendByte(LPF2_SUBCMD_WRITE_DIRECT_MODE_DATA);
    msg.appendByte(LPF2_MOTOR_MODE_POWER);
    msg.appendByte((uint8_t)power);
    return msg;
}

Lpf2Message Lpf2Message::createSetLedColor(uint8_t portId, uint8_t color) {
    Lpf2Message msg(Lpf2MessageType::PORT_OUTPUT_COMMAND);
    msg.appendByte(portId);
    msg.appendByte(LPF2_STARTUP_IMMEDIATE_FEEDBACK);
    msg.appendByte(LPF2_SUBCMD_WRITE_DIRECT_MODE_DATA);
    msg.appendByte(LPF2_LED_MODE_COLOR);
    msg.appendByte(color);
    return msg;
}

Lpf2Message Lpf2Message::createSetLedRgb(uint8_t portId, uint8_t red, uint8_t green, uint8_t blue) {
    Lpf2Message msg(Lpf2MessageType::PORT_OUTPUT_COMMAND);
    msg.appendByte(portId);
    msg.appendByte(LPF2_STARTUP_IMMEDIATE_FEEDBACK);
    msg.appendByte(LPF2_SUBCMD_WRITE_DIRECT_MODE_DATA);
    msg.appendByte(LPF2_LED_MODE_RGB);
    msg.appendByte(red);
    msg.appendByte(green);
    msg.appendByte(blue);
    return msg;
}

Lpf2Message Lpf2Message::createPortInputFormatSetup(uint8_t portId, uint8_t mode,
                                                    uint32_t deltaInterval, bool notify) {
    Lpf2Message msg(Lpf2MessageType::PORT_INPUT_FORMAT_SETUP_SINGLE);
    msg.appendByte(portId);
    msg.appendByte(mode);
    msg.appendUint32(deltaInterval);
    msg.appendByte(notify ? 0x01 : 0x00);
    return msg;
}

Lpf2Message Lpf2Message::createHubAction(uint8_t action) {
    Lpf2Message msg(Lpf2MessageType::HUB_ACTIONS);
    msg.appendByte(action);
    return msg;
}
