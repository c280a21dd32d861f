// ---------------------------------------------------------------------------
// test_join_controller.cpp: OTAA join sequence tests
// ---------------------------------------------------------------------------
// Uses MockSerialPort as the module.  Asserts on the exact command sequence,
// the criticality rules of the configuration phase, and the outcome of the
// accept polling loop.
// ---------------------------------------------------------------------------

#include "unity.h"
#include "join_controller.hpp"
#include "lorawan_at_err.hpp"
#include "mock_serial_port.hpp"
#include "test_timing.hpp"

#include <string>
#include <vector>

static const char* EUI = "DFDFDFDF00000000";
static const char* KEY = "0102030405060708090A0B0C0D0E0F10";

// ---------------------------------------------------------------------------
// Per-test fixture
// ---------------------------------------------------------------------------
struct JoinFixture {
    MockSerialPort mock;
    AtChannel      channel{fastChannelConfig()};
    ModuleSession  session;
    JoinController controller{channel, session, fastJoinTiming()};

    JoinFixture() { TEST_ASSERT_EQUAL(ESP_OK, channel.init(&mock)); }

    static JoinParams params(uint32_t timeoutMs = 1000)
    {
        JoinParams p;
        p.joinEui   = EUI;
        p.appKey    = KEY;
        p.timeoutMs = timeoutMs;
        return p;
    }
};

static std::vector<std::string> lines(const MockSerialPort& mock)
{
    std::vector<std::string> out;
    for (const MockSerialPort::WriteRecord& w : mock.writes()) out.push_back(w.line);
    return out;
}

// ---------------------------------------------------------------------------
// Tests
// ---------------------------------------------------------------------------

static void test_join_succeeds_on_second_poll(void)
{
    JoinFixture f;
    f.mock.script("AT+JOIN?", {"+JOIN=0", "+JOIN=1"});

    TEST_ASSERT_EQUAL(ESP_OK, f.controller.join(JoinFixture::params()));
    TEST_ASSERT_TRUE(f.session.isJoined());
    TEST_ASSERT_EQUAL((int)JoinController::State::JOINED, (int)f.controller.getState());
    TEST_ASSERT_EQUAL(2, (int)f.controller.pollCount());
}

static void test_configuration_sequence_is_sent_in_order(void)
{
    JoinFixture f;
    f.mock.script("AT+JOIN?", {"+JOIN=1"});

    JoinParams p = JoinFixture::params();
    p.joinEui    = "dfdfdfdf00000000";
    p.appKey     = "0102030405060708090a0b0c0d0e0f10";
    p.dataRate   = 2;
    p.txPowerDbm = 16;
    p.region     = LoraRegion::US915;
    TEST_ASSERT_EQUAL(ESP_OK, f.controller.join(p));

    const char* expected[] = {
        "AT+LORAMODE=LORAWAN",
        "AT+JOINTYPE=OTAA",
        "AT+REGION=US915",
        "AT+CLASS=CLASS_A",
        "AT+DATARATE=2",
        "AT+EIRP=16",
        "AT+ADR=0",
        "AT+UPLINKTYPE=UNCONFIRMED",
        "AT+JOINEUI=DFDFDFDF00000000",
        "AT+APPKEY=0102030405060708090A0B0C0D0E0F10",
        "AT+JOIN=1",
        "AT+JOIN?",
    };
    std::vector<std::string> sent = lines(f.mock);
    TEST_ASSERT_EQUAL(12, (int)sent.size());
    for (size_t i = 0; i < sent.size(); ++i) {
        TEST_ASSERT_EQUAL_STRING(expected[i], sent[i].c_str());
    }
}

static void test_failed_advisory_command_does_not_abort(void)
{
    JoinFixture f;
    f.mock.script("AT+ADR=", {"ERROR"});
    f.mock.script("AT+CLASS=", {""});
    f.mock.script("AT+JOIN?", {"+JOIN=1"});

    TEST_ASSERT_EQUAL(ESP_OK, f.controller.join(JoinFixture::params()));
    TEST_ASSERT_EQUAL(1, f.mock.countOf("AT+JOIN=1"));
}

static void test_failed_appkey_aborts_with_config_error(void)
{
    JoinFixture f;
    f.mock.script("AT+APPKEY=", {"ERROR"});

    TEST_ASSERT_EQUAL(ESP_ERR_LORAWAN_CONFIG, f.controller.join(JoinFixture::params()));
    TEST_ASSERT_EQUAL_STRING("AT+APPKEY=0102030405060708090A0B0C0D0E0F10",
                             f.controller.failedCommand().c_str());
    TEST_ASSERT_EQUAL(0, f.mock.countOf("AT+JOIN=1"));
    TEST_ASSERT_EQUAL(0, f.mock.countOf("AT+JOIN?"));
    TEST_ASSERT_FALSE(f.session.isJoined());
    TEST_ASSERT_EQUAL((int)JoinController::State::FAILED, (int)f.controller.getState());
}

static void test_failed_joineui_stops_before_appkey(void)
{
    JoinFixture f;
    f.mock.script("AT+JOINEUI=", {""});

    TEST_ASSERT_EQUAL(ESP_ERR_LORAWAN_CONFIG, f.controller.join(JoinFixture::params()));
    TEST_ASSERT_EQUAL(0, f.mock.countOf("AT+APPKEY="));
}

static void test_refused_join_request_is_join_rejected(void)
{
    JoinFixture f;
    f.mock.script("AT+JOIN=1", {"ERROR"});

    TEST_ASSERT_EQUAL(ESP_ERR_LORAWAN_JOIN_REJECTED, f.controller.join(JoinFixture::params()));
    TEST_ASSERT_EQUAL(0, f.mock.countOf("AT+JOIN?"));
    TEST_ASSERT_FALSE(f.session.isJoined());
}

static void test_no_accept_before_deadline_times_out(void)
{
    JoinFixture f;
    f.mock.script("AT+JOIN?", {"+JOIN=0"});

    // Two poll intervals: a handful of polls, then a timeout.
    TEST_ASSERT_EQUAL(ESP_ERR_TIMEOUT, f.controller.join(JoinFixture::params(100)));
    TEST_ASSERT_FALSE(f.session.isJoined());
    TEST_ASSERT_EQUAL((int)JoinController::State::FAILED, (int)f.controller.getState());
    TEST_ASSERT_GREATER_OR_EQUAL(1, (int)f.controller.pollCount());
    TEST_ASSERT_LESS_OR_EQUAL(3, (int)f.controller.pollCount());
}

static void test_poll_value_other_than_one_is_not_joined(void)
{
    JoinFixture f;
    f.mock.script("AT+JOIN?", {"OK"});

    TEST_ASSERT_EQUAL(ESP_ERR_TIMEOUT, f.controller.join(JoinFixture::params(100)));
    TEST_ASSERT_FALSE(f.session.isJoined());
}

static void test_missing_credentials_are_rejected_before_any_command(void)
{
    JoinFixture f;
    JoinParams p = JoinFixture::params();
    p.appKey = "";

    TEST_ASSERT_EQUAL(ESP_ERR_INVALID_ARG, f.controller.join(p));
    TEST_ASSERT_EQUAL(0, (int)f.mock.writes().size());
}

static void test_data_rate_above_five_is_rejected(void)
{
    JoinFixture f;
    JoinParams p = JoinFixture::params();
    p.dataRate = 6;

    TEST_ASSERT_EQUAL(ESP_ERR_INVALID_ARG, f.controller.join(p));
    TEST_ASSERT_EQUAL(0, (int)f.mock.writes().size());
}

static void test_controller_is_single_use(void)
{
    JoinFixture f;
    f.mock.script("AT+JOIN=1", {"ERROR"});
    TEST_ASSERT_EQUAL(ESP_ERR_LORAWAN_JOIN_REJECTED, f.controller.join(JoinFixture::params()));

    const int written = (int)f.mock.writes().size();
    TEST_ASSERT_EQUAL(ESP_ERR_INVALID_STATE, f.controller.join(JoinFixture::params()));
    TEST_ASSERT_EQUAL(written, (int)f.mock.writes().size());
}

// ---------------------------------------------------------------------------
// Suite entry point
// ---------------------------------------------------------------------------

void run_test_join_controller(void)
{
    RUN_TEST(test_join_succeeds_on_second_poll);
    RUN_TEST(test_configuration_sequence_is_sent_in_order);
    RUN_TEST(test_failed_advisory_command_does_not_abort);
    RUN_TEST(test_failed_appkey_aborts_with_config_error);
    RUN_TEST(test_failed_joineui_stops_before_appkey);
    RUN_TEST(test_refused_join_request_is_join_rejected);
    RUN_TEST(test_no_accept_before_deadline_times_out);
    RUN_TEST(test_poll_value_other_than_one_is_not_joined);
    RUN_TEST(test_missing_credentials_are_rejected_before_any_command);
    RUN_TEST(test_data_rate_above_five_is_rejected);
    RUN_TEST(test_controller_is_single_use);
}
