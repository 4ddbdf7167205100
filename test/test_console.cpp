/**
 * test_console.cpp - Native unit tests for the USB serial command console
 *
 * Line assembly, command parsing and the OK / ERR replies, run against a
 * display on a recording mock transport.
 */
#include <unity.h>
#include <cstring>
#include <string>

#include "console.h"
#include "mock_transport.h"

using Console::Result;
using SmartNixie::Levels;
using SmartNixie::NixieDisplay;

void setUp(void) {}
void tearDown(void) {}

// A three-tube display on a mock transport, opened at {128, 0, 0, 255}.
struct ConsoleBench {
    MockTransport link;
    NixieDisplay display;
    char reply[Console::REPLY_MAX_LENGTH];

    ConsoleBench() {
        const Levels levels = {128, 0, 0, 255};
        TEST_ASSERT_EQUAL(SmartNixie::Error::Ok, display.begin(3, &link, levels));
        link.clearLog();
        reply[0] = '\0';
    }

    Result run(const char *line) {
        return Console::execute(line, display, reply, sizeof(reply));
    }

    std::string digits() const {
        std::string out;
        for (size_t i = 0; i < display.tubeCount(); i++) {
            out += display.tube(i)->digit();
        }
        return out;
    }
};

// =============================================================================
// LineBuffer
// =============================================================================

void test_line_buffer_splits_on_newline() {
    Console::LineBuffer buffer;
    const char *input = "NUM|42\r\n";
    int completed = 0;
    for (const char *p = input; *p; ++p) {
        if (buffer.feed(*p)) {
            completed++;
            TEST_ASSERT_EQUAL_STRING("NUM|42", buffer.line());
        }
    }
    TEST_ASSERT_EQUAL_INT(1, completed);
}

void test_line_buffer_drops_overlong_line() {
    Console::LineBuffer buffer;
    for (size_t i = 0; i < Console::LINE_MAX_LENGTH + 10; i++) {
        TEST_ASSERT_FALSE(buffer.feed('7'));
    }
    TEST_ASSERT_FALSE(buffer.feed('\n'));

    const char *next = "SEND\n";
    bool done = false;
    for (const char *p = next; *p; ++p) {
        done = buffer.feed(*p);
    }
    TEST_ASSERT_TRUE(done);
    TEST_ASSERT_EQUAL_STRING("SEND", buffer.line());
}

// =============================================================================
// Commands
// =============================================================================

void test_num_sets_digits() {
    ConsoleBench bench;
    TEST_ASSERT_EQUAL(Result::Ok, bench.run("NUM|42"));
    TEST_ASSERT_EQUAL_STRING("OK", bench.reply);
    TEST_ASSERT_EQUAL_STRING("042", bench.digits().c_str());
}

void test_num_is_case_insensitive_and_trimmed() {
    ConsoleBench bench;
    TEST_ASSERT_EQUAL(Result::Ok, bench.run("  num | 7 "));
    TEST_ASSERT_EQUAL_STRING("007", bench.digits().c_str());
}

void test_num_errors() {
    ConsoleBench bench;
    TEST_ASSERT_EQUAL(Result::Failed, bench.run("NUM|1000"));
    TEST_ASSERT_EQUAL_STRING_LEN("ERR|OUT_OF_RANGE|not enough tubes", bench.reply, 33);

    TEST_ASSERT_EQUAL(Result::Failed, bench.run("NUM|-1"));
    TEST_ASSERT_EQUAL_STRING_LEN("ERR|INVALID_ARGUMENT|", bench.reply, 21);

    TEST_ASSERT_EQUAL(Result::Failed, bench.run("NUM|abc"));
    TEST_ASSERT_EQUAL_STRING("ERR|INVALID_ARGUMENT|number", bench.reply);

    TEST_ASSERT_EQUAL(Result::Failed, bench.run("NUM"));
    TEST_ASSERT_EQUAL_STRING("ERR|INVALID_ARGUMENT|NUM|n", bench.reply);
}

void test_overlong_field_is_rejected() {
    ConsoleBench bench;
    TEST_ASSERT_EQUAL(Result::Ok, bench.run("NUM|42"));

    TEST_ASSERT_EQUAL(Result::Failed, bench.run("NUM|000000000000000000000000042"));
    TEST_ASSERT_EQUAL_STRING("ERR|INVALID_ARGUMENT|field too long", bench.reply);
    TEST_ASSERT_EQUAL_STRING("042", bench.digits().c_str());

    // 23 characters still fits.
    TEST_ASSERT_EQUAL(Result::Ok, bench.run("NUM|00000000000000000000007"));
    TEST_ASSERT_EQUAL_STRING("007", bench.digits().c_str());

    TEST_ASSERT_EQUAL(Result::Failed, bench.run("NUMBERNUMBERNUMBERNUMBER|1"));
    TEST_ASSERT_EQUAL_STRING("ERR|INVALID_ARGUMENT|field too long", bench.reply);
}

void test_digit_and_decimal_points() {
    ConsoleBench bench;
    TEST_ASSERT_EQUAL(Result::Ok, bench.run("DIGIT|1|8"));
    TEST_ASSERT_EQUAL(Result::Ok, bench.run("DIGIT|2|x"));
    TEST_ASSERT_EQUAL_STRING("-8-", bench.digits().c_str());

    TEST_ASSERT_EQUAL(Result::Ok, bench.run("DP|0|Y|n"));
    TEST_ASSERT_TRUE(bench.display.tube(0)->leftDecimalPoint());
    TEST_ASSERT_FALSE(bench.display.tube(0)->rightDecimalPoint());

    TEST_ASSERT_EQUAL(Result::Failed, bench.run("DP|0|maybe|N"));
    TEST_ASSERT_EQUAL_STRING("ERR|INVALID_ARGUMENT|left decimal point must be Y or N", bench.reply);
    TEST_ASSERT_TRUE(bench.display.tube(0)->leftDecimalPoint());

    TEST_ASSERT_EQUAL(Result::Failed, bench.run("DIGIT|0|12"));
    TEST_ASSERT_EQUAL_STRING("ERR|INVALID_ARGUMENT|digit must be one character", bench.reply);
}

void test_tube_index_out_of_range() {
    ConsoleBench bench;
    TEST_ASSERT_EQUAL(Result::Failed, bench.run("DIGIT|3|1"));
    TEST_ASSERT_EQUAL_STRING("ERR|OUT_OF_RANGE|tube 3 not in 0-2", bench.reply);
    TEST_ASSERT_EQUAL(Result::Failed, bench.run("OFF|-1"));
    TEST_ASSERT_EQUAL_STRING("ERR|OUT_OF_RANGE|tube -1 not in 0-2", bench.reply);
}

void test_bri_and_rgb() {
    ConsoleBench bench;
    TEST_ASSERT_EQUAL(Result::Ok, bench.run("BRI|10"));
    TEST_ASSERT_EQUAL(Result::Ok, bench.run("RGB|1|2|3"));
    TEST_ASSERT_EQUAL_INT(10, bench.display.brightness());
    TEST_ASSERT_EQUAL_UINT8(3, bench.display.tube(2)->blue());

    TEST_ASSERT_EQUAL(Result::Failed, bench.run("BRI|300"));
    TEST_ASSERT_EQUAL_STRING("ERR|OUT_OF_RANGE|brightness 300 out of range 0-255", bench.reply);
    TEST_ASSERT_EQUAL(Result::Failed, bench.run("RGB|1|2"));
    TEST_ASSERT_EQUAL(Result::Failed, bench.run("RGB|1|2|256"));
    TEST_ASSERT_EQUAL_INT(3, bench.display.blue());
}

void test_tube_levels() {
    ConsoleBench bench;
    TEST_ASSERT_EQUAL(Result::Ok, bench.run("TUBE|1|50|60|70|80"));
    TEST_ASSERT_EQUAL_UINT8(50, bench.display.tube(1)->brightness());
    TEST_ASSERT_EQUAL_UINT8(80, bench.display.tube(1)->blue());
    TEST_ASSERT_EQUAL_UINT8(128, bench.display.tube(0)->brightness());

    TEST_ASSERT_EQUAL(Result::Failed, bench.run("TUBE|1|1|2|999|4"));
    TEST_ASSERT_EQUAL_STRING("ERR|OUT_OF_RANGE|green 999 out of range 0-255", bench.reply);
    TEST_ASSERT_EQUAL_UINT8(50, bench.display.tube(1)->brightness());
}

void test_off_turns_single_tube_off() {
    ConsoleBench bench;
    bench.run("NUM|123");
    bench.run("DP|1|Y|Y");
    TEST_ASSERT_EQUAL(Result::Ok, bench.run("OFF|1"));
    TEST_ASSERT_EQUAL_STRING("1-3", bench.digits().c_str());
    TEST_ASSERT_FALSE(bench.display.tube(1)->leftDecimalPoint());
    TEST_ASSERT_EQUAL_UINT8(0, bench.display.tube(1)->brightness());
    TEST_ASSERT_EQUAL_UINT8(128, bench.display.tube(0)->brightness());
}

void test_frame_and_send() {
    ConsoleBench bench;
    bench.run("NUM|5");
    TEST_ASSERT_EQUAL(Result::Ok, bench.run("FRAME"));
    TEST_ASSERT_EQUAL_STRING(
        "OK|$5,N,N,128,000,000,255$0,N,N,128,000,000,255$0,N,N,128,000,000,255!", bench.reply);
    TEST_ASSERT_EQUAL_UINT(0, bench.link.frames.size());

    TEST_ASSERT_EQUAL(Result::Ok, bench.run("SEND"));
    TEST_ASSERT_EQUAL_UINT(1, bench.link.frames.size());
    TEST_ASSERT_EQUAL_STRING("OK", bench.reply);
    TEST_ASSERT_EQUAL_STRING("$5,N,N,128,000,000,255$0,N,N,128,000,000,255$0,N,N,128,000,000,255!",
                             bench.link.frames[0].c_str());
}

void test_send_failure_is_reported() {
    ConsoleBench bench;
    bench.link.writeLimit = 5;
    TEST_ASSERT_EQUAL(Result::Failed, bench.run("SEND"));
    TEST_ASSERT_EQUAL_STRING("ERR|TRANSPORT_ERROR|short write 5/67", bench.reply);
}

void test_reset_and_status() {
    ConsoleBench bench;
    TEST_ASSERT_EQUAL(Result::Ok, bench.run("STATUS"));
    TEST_ASSERT_EQUAL_STRING("OK|tubes=3|bri=128|rgb=0,0,255|state=OPEN|fault=OK", bench.reply);

    TEST_ASSERT_EQUAL(Result::Ok, bench.run("RESET"));
    bench.run("STATUS");
    TEST_ASSERT_EQUAL_STRING("OK|tubes=3|bri=128|rgb=0,0,255|state=OPEN|fault=OK", bench.reply);
    bench.run("FRAME");
    TEST_ASSERT_EQUAL_STRING(
        "OK|$-,N,N,000,000,000,000$-,N,N,000,000,000,000$-,N,N,000,000,000,000!", bench.reply);
}

void test_save_is_handed_to_caller() {
    ConsoleBench bench;
    TEST_ASSERT_EQUAL(Result::SaveRequested, bench.run("SAVE"));
    TEST_ASSERT_EQUAL_STRING("OK", bench.reply);
}

void test_unknown_and_empty_lines() {
    ConsoleBench bench;
    TEST_ASSERT_EQUAL(Result::Unknown, bench.run("BLINK|1"));
    TEST_ASSERT_EQUAL_STRING("ERR|UNKNOWN|BLINK", bench.reply);
    TEST_ASSERT_EQUAL(Result::Empty, bench.run("   "));
    TEST_ASSERT_EQUAL(Result::Failed, bench.run("TUBE|1|2|3|4|5|6|7"));
}

void test_closed_display_reports_unavailable() {
    ConsoleBench bench;
    bench.display.close();
    TEST_ASSERT_EQUAL(Result::Failed, bench.run("SEND"));
    TEST_ASSERT_EQUAL_STRING_LEN("ERR|TRANSPORT_UNAVAILABLE|", bench.reply, 26);
    TEST_ASSERT_EQUAL(Result::Failed, bench.run("DIGIT|0|1"));
    TEST_ASSERT_EQUAL_STRING("ERR|TRANSPORT_UNAVAILABLE|display not open", bench.reply);
    TEST_ASSERT_EQUAL(Result::Failed, bench.run("FRAME"));
    bench.run("STATUS");
    TEST_ASSERT_NOT_NULL(strstr(bench.reply, "state=CLOSED"));
}

int main(void) {
    UNITY_BEGIN();

    RUN_TEST(test_line_buffer_splits_on_newline);
    RUN_TEST(test_line_buffer_drops_overlong_line);

    RUN_TEST(test_num_sets_digits);
    RUN_TEST(test_num_is_case_insensitive_and_trimmed);
    RUN_TEST(test_num_errors);
    RUN_TEST(test_overlong_field_is_rejected);
    RUN_TEST(test_digit_and_decimal_points);
    RUN_TEST(test_tube_index_out_of_range);
    RUN_TEST(test_bri_and_rgb);
    RUN_TEST(test_tube_levels);
    RUN_TEST(test_off_turns_single_tube_off);
    RUN_TEST(test_frame_and_send);
    RUN_TEST(test_send_failure_is_reported);
    RUN_TEST(test_reset_and_status);
    RUN_TEST(test_save_is_handed_to_caller);
    RUN_TEST(test_unknown_and_empty_lines);
    RUN_TEST(test_closed_display_reports_unavailable);

    return UNITY_END();
}
