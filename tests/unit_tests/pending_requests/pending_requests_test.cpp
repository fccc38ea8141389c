/*
 *   Copyright (c) 2026 Edward Boggis-Rolfe
 *   All rights reserved.
 */

#include <cctype>

#include <gtest/gtest.h>

#include <bridge/bridge.h>

#include <fixtures/coro_test.h>

using namespace std::chrono_literals;

TEST(connection_status_test, starts_ok_and_only_leaves_once)
{
    bridge::connection_status_machine status;
    EXPECT_EQ(status.get(), bridge::connection_status::OK);

    EXPECT_TRUE(status.try_transition(bridge::connection_status::SERVER_COMPLETE));
    EXPECT_EQ(status.get(), bridge::connection_status::SERVER_COMPLETE);

    EXPECT_FALSE(status.try_transition(bridge::connection_status::CLIENT_ERROR));
    EXPECT_FALSE(status.try_transition(bridge::connection_status::SERVER_ERROR));
    EXPECT_EQ(status.get(), bridge::connection_status::SERVER_COMPLETE);
}

TEST(connection_status_test, transition_to_ok_is_rejected)
{
    bridge::connection_status_machine status;
    EXPECT_FALSE(status.try_transition(bridge::connection_status::OK));
    EXPECT_TRUE(status.try_transition(bridge::connection_status::CLIENT_COMPLETE));
}

TEST(connection_status_test, half_closed_stream_is_still_sendable)
{
    EXPECT_TRUE(bridge::is_sendable(bridge::connection_status::OK));
    EXPECT_TRUE(bridge::is_sendable(bridge::connection_status::SERVER_COMPLETE));
    EXPECT_FALSE(bridge::is_sendable(bridge::connection_status::SERVER_ERROR));
    EXPECT_FALSE(bridge::is_sendable(bridge::connection_status::CLIENT_ERROR));
    EXPECT_FALSE(bridge::is_sendable(bridge::connection_status::CLIENT_COMPLETE));
}

TEST(pending_request_table_test, rejects_duplicate_seq)
{
    bridge::pending_request_table table;
    auto first = table.add(1);
    ASSERT_NE(first, nullptr);
    EXPECT_EQ(table.add(1), nullptr);
    EXPECT_EQ(table.size(), 1u);
}

TEST(pending_request_table_test, take_removes_the_entry_once)
{
    bridge::pending_request_table table;
    auto entry = table.add(7);
    ASSERT_NE(entry, nullptr);

    EXPECT_EQ(table.take(7), entry);
    EXPECT_FALSE(table.contains(7));
    EXPECT_EQ(table.take(7), nullptr);
    EXPECT_EQ(table.take(8), nullptr);
}

TEST(pending_request_table_test, take_all_empties_the_table)
{
    bridge::pending_request_table table;
    table.add(1);
    table.add(2);
    table.add(3);

    auto entries = table.take_all();
    EXPECT_EQ(entries.size(), 3u);
    EXPECT_TRUE(table.empty());
    EXPECT_TRUE(table.take_all().empty());
}

TEST(pending_request_test, resolve_sets_payload_and_cancels_timer)
{
    bridge::pending_request entry;
    entry.resolve(bridge::action_response{"echo", {1, 2}}, 42);

    EXPECT_TRUE(entry.completed.is_set());
    EXPECT_TRUE(entry.timer.is_cancelled());
    EXPECT_EQ(entry.error_code, bridge::error::OK());
    EXPECT_EQ(entry.response.seq, 42u);
    auto* response = std::get_if<bridge::action_response>(&entry.response.payload);
    ASSERT_NE(response, nullptr);
    EXPECT_EQ(response->method, "echo");
}

TEST(pending_request_test, fail_records_the_failure)
{
    bridge::pending_request entry;
    entry.fail(bridge::request_failure{.code = bridge::error::PENDING_REQUEST_CANCELLED(),
        .reason = bridge::connection_status::SERVER_ERROR,
        .cause = "boom",
        .trace_id = "abcdEFGH"});

    EXPECT_TRUE(entry.completed.is_set());
    EXPECT_TRUE(entry.timer.is_cancelled());
    EXPECT_EQ(entry.error_code, bridge::error::PENDING_REQUEST_CANCELLED());
    EXPECT_EQ(entry.response.failure.describe(),
        "[tid:abcdEFGH] request has been cancelled for reason: SERVER_ERROR, boom");
}

TEST(request_failure_test, describe_without_cause)
{
    bridge::request_failure failure{.code = bridge::error::CHANNEL_CLOSED(),
        .reason = bridge::connection_status::CLIENT_COMPLETE,
        .trace_id = "T1234567"};
    EXPECT_EQ(failure.describe(), "[tid:T1234567] request has been cancelled for reason: CLIENT_COMPLETE");
}

TEST(request_failure_test, describe_timeout)
{
    bridge::request_failure failure{.code = bridge::error::REQUEST_TIMEOUT(), .trace_id = "T1234567"};
    EXPECT_EQ(failure.describe(), "[tid:T1234567] request timeout");
}

TEST(error_codes_test, names_every_code)
{
    EXPECT_STREQ(bridge::error::to_string(bridge::error::OK()), "OK");
    for (int code = bridge::error::MIN() + 1; code <= bridge::error::MAX(); ++code)
        EXPECT_STRNE(bridge::error::to_string(code), "UNKNOWN_ERROR") << code;
    EXPECT_STREQ(bridge::error::to_string(bridge::error::MAX() + 1), "UNKNOWN_ERROR");
}

TEST(trace_id_test, eight_alphanumeric_characters)
{
    auto trace_id = bridge::generate_trace_id();
    ASSERT_EQ(trace_id.size(), 8u);
    for (auto c : trace_id)
        EXPECT_TRUE(std::isalnum(static_cast<unsigned char>(c))) << trace_id;
    EXPECT_NE(trace_id, bridge::generate_trace_id());
}

class request_timer_test : public testing::Test
{
protected:
    bridge_test::scheduler_setup lib_;

    void SetUp() override { lib_.set_up(); }
    void TearDown() override { lib_.tear_down(); }
};

CORO_TASK(bool) coro_timer_expires(bridge_test::scheduler_setup& lib)
{
    bridge::request_timer timer;
    auto start = std::chrono::steady_clock::now();
    auto expired = CO_AWAIT timer.wait(*lib.get_scheduler(), 60ms);
    CORO_ASSERT_TRUE(expired);
    CORO_ASSERT_TRUE(std::chrono::steady_clock::now() - start >= 60ms);
    CO_RETURN true;
}

TEST_F(request_timer_test, expires_after_timeout)
{
    bridge_test::run_coro_test(lib_, [](auto& lib) { return coro_timer_expires(lib); });
}

CORO_TASK(bool) coro_timer_cancelled(bridge_test::scheduler_setup& lib)
{
    bridge::request_timer timer;
    // copies share the flag
    auto copy = timer;
    copy.cancel();
    auto start = std::chrono::steady_clock::now();
    auto expired = CO_AWAIT timer.wait(*lib.get_scheduler(), 10s);
    CORO_ASSERT_FALSE(expired);
    CORO_ASSERT_TRUE(std::chrono::steady_clock::now() - start < 1s);
    CO_RETURN true;
}

TEST_F(request_timer_test, cancelled_timer_does_not_expire)
{
    bridge_test::run_coro_test(lib_, [](auto& lib) { return coro_timer_cancelled(lib); });
}
