// ---------------------------------------------------------------------------
// test_response_parsing.cpp: decodeAtReply() and parseAtResponse() contracts
// ---------------------------------------------------------------------------
// Pure function tests; no FreeRTOS objects involved.
// ---------------------------------------------------------------------------

#include "unity.h"
#include "at_channel.hpp"

#include <string>

static void test_plain_ok_is_success_without_value(void)
{
    AtResponse r = parseAtResponse("OK");
    TEST_ASSERT_TRUE(r.ok);
    TEST_ASSERT_FALSE(r.hasValue);
    TEST_ASSERT_EQUAL(ESP_OK, r.status);
}

static void test_ok_is_trimmed_before_matching(void)
{
    AtResponse r = parseAtResponse("  OK\r\n");
    TEST_ASSERT_TRUE(r.ok);
    TEST_ASSERT_FALSE(r.hasValue);
}

static void test_command_echo_ok_is_success_without_value(void)
{
    AtResponse r = parseAtResponse("+CMD=OK");
    TEST_ASSERT_TRUE(r.ok);
    TEST_ASSERT_FALSE(r.hasValue);
}

static void test_key_value_reply_yields_value(void)
{
    AtResponse r = parseAtResponse("+DEVEUI=70B3D57ED0012345\r\n");
    TEST_ASSERT_TRUE(r.ok);
    TEST_ASSERT_TRUE(r.hasValue);
    TEST_ASSERT_EQUAL_STRING("70B3D57ED0012345", r.value.c_str());
}

static void test_value_is_split_on_first_equals_and_trimmed(void)
{
    AtResponse r = parseAtResponse("+KEY= a=b \r\n");
    TEST_ASSERT_TRUE(r.ok);
    TEST_ASSERT_EQUAL_STRING("a=b", r.value.c_str());
}

static void test_empty_value_is_success_with_empty_text(void)
{
    AtResponse r = parseAtResponse("+RSSI=");
    TEST_ASSERT_TRUE(r.ok);
    TEST_ASSERT_TRUE(r.hasValue);
    TEST_ASSERT_EQUAL_STRING("", r.value.c_str());
}

static void test_error_is_failure(void)
{
    AtResponse r = parseAtResponse("ERROR");
    TEST_ASSERT_FALSE(r.ok);
    TEST_ASSERT_FALSE(r.hasValue);
    TEST_ASSERT_EQUAL(ESP_ERR_INVALID_RESPONSE, r.status);
}

static void test_empty_text_is_failure(void)
{
    AtResponse r = parseAtResponse("");
    TEST_ASSERT_FALSE(r.ok);
    TEST_ASSERT_FALSE(r.hasValue);
}

static void test_whitespace_only_is_failure(void)
{
    TEST_ASSERT_FALSE(parseAtResponse(" \r\n ").ok);
}

static void test_lowercase_ok_is_not_success(void)
{
    TEST_ASSERT_FALSE(parseAtResponse("ok").ok);
}

static void test_decode_keeps_ascii_nul_and_wellformed_utf8(void)
{
    const std::string raw("+V=\x00" "a\xC3\xA9\xE2\x82\xAC", 10);
    TEST_ASSERT_TRUE(decodeAtReply(raw) == raw);
}

static void test_decode_drops_malformed_sequences(void)
{
    // Stray continuation, invalid lead, overlong lead and a cut-off
    // three-byte sequence whose breaking byte ('X') survives.
    TEST_ASSERT_EQUAL_STRING("OK", decodeAtReply("\x80O\xFFK").c_str());
    TEST_ASSERT_EQUAL_STRING("AB", decodeAtReply("A\xC0\xAF" "B").c_str());
    TEST_ASSERT_EQUAL_STRING("XY", decodeAtReply("\xE2\x82" "XY").c_str());
    TEST_ASSERT_EQUAL_STRING("Z", decodeAtReply("Z\xF0\x9F").c_str());
}

static void test_leading_nul_defeats_plain_ok(void)
{
    TEST_ASSERT_FALSE(parseAtResponse(std::string("\x00OK", 3)).ok);
}

void run_test_response_parsing(void)
{
    RUN_TEST(test_plain_ok_is_success_without_value);
    RUN_TEST(test_ok_is_trimmed_before_matching);
    RUN_TEST(test_command_echo_ok_is_success_without_value);
    RUN_TEST(test_key_value_reply_yields_value);
    RUN_TEST(test_value_is_split_on_first_equals_and_trimmed);
    RUN_TEST(test_empty_value_is_success_with_empty_text);
    RUN_TEST(test_error_is_failure);
    RUN_TEST(test_empty_text_is_failure);
    RUN_TEST(test_whitespace_only_is_failure);
    RUN_TEST(test_lowercase_ok_is_not_success);
    RUN_TEST(test_decode_keeps_ascii_nul_and_wellformed_utf8);
    RUN_TEST(test_decode_drops_malformed_sequences);
    RUN_TEST(test_leading_nul_defeats_plain_ok);
}
