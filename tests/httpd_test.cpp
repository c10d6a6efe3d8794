//
//  httpd_test.cpp
//  uttt-httpd tests - Unit tests for the HTTP daemon
//
//  Tests command-line parsing and the long-poll connection hub
//

#include <gtest/gtest.h>

#include <chrono>
#include <filesystem>
#include <future>
#include <thread>

#include "connection_hub.hpp"
#include "httpd_cli.hpp"
#include "httpd_server.hpp"

using namespace uttt;
using namespace uttt::httpd;
using namespace std::chrono_literals;

class HttpdTest : public ::testing::Test {
protected:
    void SetUp() override {
        config_.host = "127.0.0.1";
        config_.port = 5604;  // Use a different port for testing
        config_.threads = 1;
        config_.ai_budget_ms = 50;
        config_.data_dir = (std::filesystem::temp_directory_path() / "uttt_httpd_test").string();
        config_.foreground_mode = true;
        config_.verbose = false;
    }

    HttpDaemonConfig config_;
};

TEST_F(HttpdTest, ConfigParsing) {
    const char* test_args[] = {
        "uttt-httpd",                  // 0
        "--host", "192.168.1.1",       // 1, 2
        "--port", "8080",              // 3, 4
        "--threads", "4",              // 5, 6
        "--ai-budget-ms", "800",       // 7, 8
        "--accounts", "users.json",    // 9, 10
        "--seed", "99",                // 11, 12
        "--foreground",                // 13
        "--verbose"                    // 14
    };

    auto result = parse_command_line(15, const_cast<char**>(test_args));

    ASSERT_TRUE(result.has_value());
    EXPECT_EQ(result->host, "192.168.1.1");
    EXPECT_EQ(result->port, 8080);
    EXPECT_EQ(result->threads, 4);
    EXPECT_EQ(result->ai_budget_ms, 800);
    EXPECT_EQ(result->accounts_file, "users.json");
    EXPECT_EQ(result->seed, 99u);
    EXPECT_TRUE(result->foreground_mode);
    EXPECT_TRUE(result->verbose);
    EXPECT_FALSE(result->daemon_mode);
}

TEST_F(HttpdTest, DefaultConfig) {
    const char* test_args[] = {"uttt-httpd"};

    auto result = parse_command_line(1, const_cast<char**>(test_args));

    ASSERT_TRUE(result.has_value());
    EXPECT_EQ(result->port, 5600);
    EXPECT_EQ(result->ai_budget_ms, 2500);
    EXPECT_EQ(result->data_dir, "uttt_data");
    EXPECT_EQ(result->sweep_ms, 1000);
    EXPECT_FALSE(result->accounts_file.has_value());
    EXPECT_FALSE(result->seed.has_value());
    EXPECT_GE(result->threads, 1);
}

TEST_F(HttpdTest, InvalidPortHandling) {
    const char* test_args[] = {"uttt-httpd", "--port", "99999"};

    auto result = parse_command_line(3, const_cast<char**>(test_args));

    EXPECT_FALSE(result.has_value());
    EXPECT_EQ(result.error(), CliError::InvalidPort);
}

TEST_F(HttpdTest, InvalidValuesRejected) {
    const char* budget[] = {"uttt-httpd", "--ai-budget-ms", "10"};
    EXPECT_EQ(parse_command_line(3, const_cast<char**>(budget)).error(), CliError::InvalidBudget);

    const char* threads[] = {"uttt-httpd", "-t", "many"};
    EXPECT_EQ(parse_command_line(3, const_cast<char**>(threads)).error(), CliError::InvalidThreads);

    const char* idle[] = {"uttt-httpd", "--idle-ms", "5"};
    EXPECT_EQ(parse_command_line(3, const_cast<char**>(idle)).error(), CliError::InvalidInterval);

    const char* seed[] = {"uttt-httpd", "--seed", "-1"};
    EXPECT_EQ(parse_command_line(3, const_cast<char**>(seed)).error(), CliError::InvalidSeed);

    const char* missing[] = {"uttt-httpd", "--port"};
    EXPECT_EQ(parse_command_line(2, const_cast<char**>(missing)).error(), CliError::MissingValue);

    const char* unknown[] = {"uttt-httpd", "--depth", "4"};
    EXPECT_EQ(parse_command_line(3, const_cast<char**>(unknown)).error(), CliError::InvalidArgument);
}

TEST_F(HttpdTest, SweepCanBeDisabled) {
    const char* test_args[] = {"uttt-httpd", "--sweep-ms", "0"};

    auto result = parse_command_line(3, const_cast<char**>(test_args));

    ASSERT_TRUE(result.has_value());
    EXPECT_EQ(result->sweep_ms, 0);
}

TEST_F(HttpdTest, HelpRequested) {
    const char* test_args[] = {"uttt-httpd", "--help"};

    auto result = parse_command_line(2, const_cast<char**>(test_args));

    EXPECT_FALSE(result.has_value());
    EXPECT_EQ(result.error(), CliError::HelpRequested);
}

TEST_F(HttpdTest, HTTPServerBasicFunctionality) {
    // The server is not started here to avoid port conflicts
    EXPECT_NO_THROW({
        HttpServer server(config_);
        EXPECT_FALSE(server.is_running());
    });
}

//===============================================================================
// CONNECTION HUB
//===============================================================================

class ConnectionHubTest : public ::testing::Test {
protected:
    ConnectionHub hub_{1};
    Identity alice_{"alice", "Alice", IdentityKind::Registered};
};

TEST_F(ConnectionHubTest, ConnectionIdsAreUniqueHex) {
    auto first = hub_.connect(alice_);
    auto second = hub_.connect(alice_);

    EXPECT_NE(first, second);
    EXPECT_EQ(first.size(), 16u);
    EXPECT_EQ(first.find_first_not_of("0123456789abcdef"), std::string::npos);
    EXPECT_EQ(hub_.identity_of(first), alice_);
    EXPECT_EQ(hub_.size(), 2u);
}

TEST_F(ConnectionHubTest, PollDrainsQueuedEventsInOrder) {
    auto conn = hub_.connect(alice_);
    hub_.send(conn, events::created("12345"));
    hub_.send(conn, events::assign(Player::Cross));

    auto events = hub_.poll(conn, 0ms);
    ASSERT_TRUE(events.has_value());
    ASSERT_EQ(events->size(), 2u);
    EXPECT_EQ((*events)[0]["event"], "created");
    EXPECT_EQ((*events)[0]["data"]["room"], "12345");
    EXPECT_EQ((*events)[1]["data"]["seat"], "X");

    auto empty = hub_.poll(conn, 10ms);
    ASSERT_TRUE(empty.has_value());
    EXPECT_TRUE(empty->empty());
}

TEST_F(ConnectionHubTest, PollWakesOnSend) {
    auto conn = hub_.connect(alice_);
    auto pending = std::async(std::launch::async, [&] { return hub_.poll(conn, 5000ms); });

    std::this_thread::sleep_for(50ms);
    hub_.send(conn, events::spectator());

    ASSERT_EQ(pending.wait_for(2000ms), std::future_status::ready);
    auto events = pending.get();
    ASSERT_TRUE(events.has_value());
    ASSERT_EQ(events->size(), 1u);
    EXPECT_EQ((*events)[0]["event"], "spectator");
}

TEST_F(ConnectionHubTest, UnknownConnectionsIgnored) {
    hub_.send("nope", events::invalid());
    EXPECT_FALSE(hub_.poll("nope", 0ms).has_value());
    EXPECT_FALSE(hub_.disconnect("nope"));
    EXPECT_FALSE(hub_.identity_of("nope").has_value());
}

TEST_F(ConnectionHubTest, QueueDropsOldestWhenFull) {
    auto conn = hub_.connect(alice_);
    for (size_t i = 0; i < MAX_QUEUED_EVENTS + 5; ++i) {
        hub_.send(conn, events::created(std::to_string(i)));
    }

    auto events = hub_.poll(conn, 0ms);
    ASSERT_EQ(events->size(), MAX_QUEUED_EVENTS);
    EXPECT_EQ(events->front()["data"]["room"], "5");
}

TEST_F(ConnectionHubTest, DisconnectWakesPendingPoll) {
    auto conn = hub_.connect(alice_);
    auto pending = std::async(std::launch::async, [&] { return hub_.poll(conn, 5000ms); });

    std::this_thread::sleep_for(50ms);
    EXPECT_TRUE(hub_.disconnect(conn));

    ASSERT_EQ(pending.wait_for(2000ms), std::future_status::ready);
    EXPECT_FALSE(pending.get().has_value());
    EXPECT_EQ(hub_.size(), 0u);
}

TEST_F(ConnectionHubTest, ReapsConnectionsNotPolled) {
    auto stale = hub_.connect(alice_);
    std::this_thread::sleep_for(200ms);
    auto fresh = hub_.connect(alice_);

    auto reaped = hub_.reap_idle(ConnectionHub::Clock::now(), 100ms);
    ASSERT_EQ(reaped.size(), 1u);
    EXPECT_EQ(reaped[0], stale);
    EXPECT_FALSE(hub_.identity_of(stale).has_value());
    EXPECT_TRUE(hub_.identity_of(fresh).has_value());

    // Polling counts as activity
    std::this_thread::sleep_for(200ms);
    ASSERT_TRUE(hub_.poll(fresh, 0ms).has_value());
    EXPECT_TRUE(hub_.reap_idle(ConnectionHub::Clock::now(), 100ms).empty());
}

TEST_F(ConnectionHubTest, WaitingPollIsNeverReaped) {
    auto conn = hub_.connect(alice_);
    auto pending = std::async(std::launch::async, [&] { return hub_.poll(conn, 5000ms); });

    std::this_thread::sleep_for(200ms);
    EXPECT_TRUE(hub_.reap_idle(ConnectionHub::Clock::now(), 100ms).empty());
    EXPECT_TRUE(hub_.identity_of(conn).has_value());

    hub_.send(conn, events::spectator());
    ASSERT_EQ(pending.wait_for(2000ms), std::future_status::ready);
    auto events = pending.get();
    ASSERT_TRUE(events.has_value());
    EXPECT_EQ(events->size(), 1u);
}

int main(int argc, char **argv) {
    ::testing::InitGoogleTest(&argc, argv);
    return RUN_ALL_TESTS();
}
