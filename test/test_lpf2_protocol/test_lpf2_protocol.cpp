/**
 * @file test_lpf2_protocol.cpp
 * @brief Unit tests for lpf2_protocol - Frame parsing and command encoding
 */

#include <unity.h>
#include "lpf2_protocol.h"

// Include source files directly for native testing
#include "../../src/types.cpp"
#include "../../src/lpf2_protocol.cpp"

// =============================================================================
// HELPERS
// =============================================================================

static uint8_t g_buffer[LPF2_MAX_MESSAGE_SIZE + 8];
static uint16_t g_written = 0;

static void encode(const Lpf2Message& msg) {
    g_written = 0;
    TEST_ASSERT_TRUE(msg.serialize(g_buffer, sizeof(g_buffer), g_written));
}

// =============================================================================
// TEST FIXTURES
// =============================================================================

void setUp(void) {
    memset(g_buffer, 0, sizeof(g_buffer));
    g_written = 0;
}

void tearDown(void) {
}

// =============================================================================
// PARSING TESTS
// =============================================================================

void test_parse_hub_attached_io(void) {
    // Motor attached on port 0
    const uint8_t frame[] = { 0x0F, 0x00, 0x04, 0x00, 0x01, 0x2E, 0x00, 0x00, 0x10,
                              0x00, 0x00, 0x00, 0x10, 0x00, 0x00 };
    Lpf2Message msg;
    TEST_ASSERT_EQUAL(Result::OK, Lpf2Message::parse(frame, sizeof(frame), msg));
    TEST_ASSERT_EQUAL(Lpf2MessageType::HUB_ATTACHED_IO, msg.getType());
    TEST_ASSERT_EQUAL(12, msg.getPayloadLength());
    TEST_ASSERT_TRUE(msg.hasPort());
    TEST_ASSERT_EQUAL(0, msg.getPortId());
}

void test_parse_port_value_single(void) {
    const uint8_t frame[] = { 0x05, 0x00, 0x45, 0x3B, 0x7F };
    Lpf2Message msg;
    TEST_ASSERT_EQUAL(Result::OK, Lpf2Message::parse(frame, sizeof(frame), msg));
    TEST_ASSERT_EQUAL(Lpf2MessageType::PORT_VALUE_SINGLE, msg.getType());
    TEST_ASSERT_EQUAL(59, msg.getPortId());
    TEST_ASSERT_EQUAL_HEX8(0x7F, msg.getPayload()[1]);
}

void test_parse_hub_properties_has_no_port(void) {
    const uint8_t frame[] = { 0x06, 0x00, 0x01, 0x06, 0x06, 0x50 };
    Lpf2Message msg;
    TEST_ASSERT_EQUAL(Result::OK, Lpf2Message::parse(frame, sizeof(frame), msg));
    TEST_ASSERT_FALSE(msg.hasPort());
    TEST_ASSERT_EQUAL_HEX8(0xFF, msg.getPortId());
}

void test_parse_rejects_truncated(void) {
    const uint8_t frame[] = { 0x05, 0x00 };
    Lpf2Message msg;
    TEST_ASSERT_EQUAL(Result::ERROR_PARSE_FAILURE, Lpf2Message::parse(frame, sizeof(frame), msg));
    TEST_ASSERT_EQUAL(Result::ERROR_PARSE_FAILURE, Lpf2Message::parse(nullptr, 5, msg));
}

void test_parse_rejects_length_mismatch(void) {
    const uint8_t frame[] = { 0x09, 0x00, 0x45, 0x3B, 0x7F };
    Lpf2Message msg;
    TEST_ASSERT_EQUAL(Result::ERROR_PARSE_FAILURE, Lpf2Message::parse(frame, sizeof(frame), msg));
}

void test_parse_rejects_unknown_type(void) {
    const uint8_t frame[] = { 0x04, 0x00, 0x7E, 0x00 };
    Lpf2Message msg;
    TEST_ASSERT_EQUAL(Result::ERROR_PARSE_FAILURE, Lpf2Message::parse(frame, sizeof(frame), msg));
}

void test_parse_rejects_port_message_without_port(void) {
    const uint8_t frame[] = { 0x03, 0x00, 0x45 };
    Lpf2Message msg;
    TEST_ASSERT_EQUAL(Result::ERROR_PARSE_FAILURE, Lpf2Message::parse(frame, sizeof(frame), msg));
}

void test_parse_rejects_oversized_payload(void) {
    uint8_t frame[LPF2_MAX_MESSAGE_SIZE + 4];
    memset(frame, 0, sizeof(frame));
    frame[0] = (uint8_t)sizeof(frame);
    frame[2] = 0x45;

    Lpf2Message msg;
    TEST_ASSERT_EQUAL(Result::ERROR_PARSE_FAILURE, Lpf2Message::parse(frame, sizeof(frame), msg));
}

void test_parse_failure_leaves_output_untouched(void) {
    Lpf2Message msg = Lpf2Message::createHubAction(LPF2_HUB_ACTION_SWITCH_OFF);
    const uint8_t frame[] = { 0x04, 0x00, 0x7E, 0x00 };
    Lpf2Message::parse(frame, sizeof(frame), msg);
    TEST_ASSERT_EQUAL(Lpf2MessageType::HUB_ACTIONS, msg.getType());
}

// =============================================================================
// ENCODING TESTS
// =============================================================================

void test_createStartSpeed_encoding(void) {
    encode(Lpf2Message::createStartSpeed(0, 50));
    const uint8_t expected[] = { 0x09, 0x00, 0x81, 0x00, 0x11, 0x07, 0x32, 0x64, 0x00 };
    TEST_ASSERT_EQUAL(sizeof(expected), g_written);
    TEST_ASSERT_EQUAL_HEX8_ARRAY(expected, g_buffer, sizeof(expected));
}

void test_createStartSpeed_negative(void) {
    encode(Lpf2Message::createStartSpeed(1, -100));
    TEST_ASSERT_EQUAL_HEX8(0x01, g_buffer[3]);
    TEST_ASSERT_EQUAL_HEX8(0x9C, g_buffer[6]);
}

void test_createStartPower_brake(void) {
    encode(Lpf2Message::createStartPower(2, LPF2_POWER_BRAKE));
    const uint8_t expected[] = { 0x08, 0x00, 0x81, 0x02, 0x11, 0x51, 0x00, 0x7F };
    TEST_ASSERT_EQUAL(sizeof(expected), g_written);
    TEST_ASSERT_EQUAL_HEX8_ARRAY(expected, g_buffer, sizeof(expected));
}

void test_createSetLedColor_encoding(void) {
    encode(Lpf2Message::createSetLedColor(50, (uint8_t)Lpf2Color::GREEN));
    const uint8_t expected[] = { 0x08, 0x00, 0x81, 0x32, 0x11, 0x51, 0x00, 0x06 };
    TEST_ASSERT_EQUAL_HEX8_ARRAY(expected, g_buffer, sizeof(expected));
}

void test_createSetLedRgb_encoding(void) {
    encode(Lpf2Message::createSetLedRgb(50, 0xFF, 0x10, 0x00));
    const uint8_t expected[] = { 0x0A, 0x00, 0x81, 0x32, 0x11, 0x51, 0x01, 0xFF, 0x10, 0x00 };
    TEST_ASSERT_EQUAL(sizeof(expected), g_written);
    TEST_ASSERT_EQUAL_HEX8_ARRAY(expected, g_buffer, sizeof(expected));
}

void test_createPortInputFormatSetup_encoding(void) {
    encode(Lpf2Message::createPortInputFormatSetup(50, LPF2_LED_MODE_RGB, 1, false));
    const uint8_t expected[] = { 0x0A, 0x00, 0x41, 0x32, 0x01, 0x01, 0x00, 0x00, 0x00, 0x00 };
    TEST_ASSERT_EQUAL(sizeof(expected), g_written);
    TEST_ASSERT_EQUAL_HEX8_ARRAY(expected, g_buffer, sizeof(expected));
}

void test_createHubAction_encoding(void) {
    encode(Lpf2Message::createHubAction(LPF2_HUB_ACTION_DISCONNECT));
    const uint8_t expected[] = { 0x04, 0x00, 0x02, 0x02 };
    TEST_ASSERT_EQUAL_HEX8_ARRAY(expected, g_buffer, sizeof(expected));
}

void test_serialize_rejects_small_buffer(void) {
    Lpf2Message msg = Lpf2Message::createStartSpeed(0, 50);
    uint8_t small[4];
    uint16_t written = 0;
    TEST_ASSERT_FALSE(msg.serialize(small, sizeof(small), written));
}

void test_encoded_command_parses_back(void) {
    encode(Lpf2Message::createStartSpeed(3, 25));

    Lpf2Message parsed;
    TEST_ASSERT_EQUAL(Result::OK, Lpf2Message::parse(g_buffer, g_written, parsed));
    TEST_ASSERT_EQUAL(Lpf2MessageType::PORT_OUTPUT_COMMAND, parsed.getType());
    TEST_ASSERT_EQUAL(3, parsed.getPortId());
}

// =============================================================================
// PAYLOAD BUILDING TESTS
// =============================================================================

void test_appendByte_stops_at_capacity(void) {
    Lpf2Message msg(Lpf2MessageType::HUB_PROPERTIES);
    for (uint16_t i = 0; i < LPF2_MAX_MESSAGE_SIZE; i++) {
        TEST_ASSERT_TRUE(msg.appendByte((uint8_t)i));
    }
    TEST_ASSERT_FALSE(msg.appendByte(0xAA));
    TEST_ASSERT_EQUAL(LPF2_MAX_MESSAGE_SIZE, msg.getPayloadLength());
}

void test_appendUint32_little_endian(void) {
    Lpf2Message msg(Lpf2MessageType::HUB_PROPERTIES);
    msg.appendUint32(0x12345678);
    TEST_ASSERT_EQUAL_HEX8(0x78, msg.getPayload()[0]);
    TEST_ASSERT_EQUAL_HEX8(0x12, msg.getPayload()[3]);
}

void test_typeString_names(void) {
    TEST_ASSERT_EQUAL_STRING("PORT_VALUE_SINGLE", lpf2MessageTypeToString(Lpf2MessageType::PORT_VALUE_SINGLE));
    TEST_ASSERT_NULL(lpf2MessageTypeToString(static_cast<Lpf2MessageType>(0x7E)));
}

// =============================================================================
// TEST RUNNER
// =============================================================================

int main(int argc, char **argv) {
    UNITY_BEGIN();

    // Parsing Tests
    RUN_TEST(test_parse_hub_attached_io);
    RUN_TEST(test_parse_port_value_single);
    RUN_TEST(test_parse_hub_properties_has_no_port);
    RUN_TEST(test_parse_rejects_truncated);
    RUN_TEST(test_parse_rejects_length_mismatch);
    RUN_TEST(test_parse_rejects_unknown_type);
    RUN_TEST(test_parse_rejects_port_message_without_port);
    RUN_TEST(test_parse_rejects_oversized_payload);
    RUN_TEST(test_parse_failure_leaves_output_untouched);

    // Encoding Tests
    RUN_TEST(test_createStartSpeed_encoding);
    RUN_TEST(test_createStartSpeed_negative);
    RUN_TEST(test_createStartPower_brake);
    RUN_TEST(test_createSetLedColor_encoding);
    RUN_TEST(test_createSetLedRgb_encoding);
    RUN_TEST(test_createPortInputFormatSetup_encoding);
    RUN_TEST(test_createHubAction_encoding);
    RUN_TEST(test_serialize_rejects_small_buffer);
    RUN_TEST(test_encoded_command_parses_back);

    // Payload Building Tests
    RUN_TEST(test_appendByte_stops_at_capacity);
    RUN_TEST(test_appendUint32_little_endian);
    RUN_TEST(test_typeString_names);

    return UNITY_END();
}
