// Gangway Logging Unit Tests

#include <catch2/catch_test_macros.hpp>

#include <algorithm>
#include <set>
#include <string>
#include <thread>

#include "../../src/core/logging.hpp"

using namespace gangway::logging;

TEST_CASE("Correlation ID generation", "[logging][correlation_id]") {
    SECTION("has uuid and counter parts") {
        std::string id = generate_correlation_id();

        REQUIRE(std::count(id.begin(), id.end(), '#') == 1);
        REQUIRE(id.find('#') == 36);
        REQUIRE(is_valid_uuid(id));
    }

    SECTION("same thread keeps its base, counter advances") {
        std::string id1 = generate_correlation_id();
        std::string id2 = generate_correlation_id();

        REQUIRE(id1 != id2);
        REQUIRE(id1.substr(0, 36) == id2.substr(0, 36));
        REQUIRE(std::stoull(id2.substr(37)) > std::stoull(id1.substr(37)));
    }

    SECTION("counter is unique across connection threads") {
        std::string from_thread;
        std::thread worker([&from_thread]() { from_thread = generate_correlation_id(); });
        worker.join();
        std::string local = generate_correlation_id();

        REQUIRE(is_valid_uuid(from_thread));
        REQUIRE(from_thread.substr(37) != local.substr(37));
    }
}

TEST_CASE("Correlation ID validation", "[logging][validation]") {
    SECTION("accepts well-formed ids") {
        REQUIRE(is_valid_uuid("550e8400-e29b-41d4-a716-446655440000#0"));
        REQUIRE(is_valid_uuid("ABCDEF12-3456-4789-BBCD-EF0123456789#77"));
    }

    SECTION("rejects malformed ids") {
        REQUIRE_FALSE(is_valid_uuid(""));
        REQUIRE_FALSE(is_valid_uuid("550e8400-e29b-41d4-a716-446655440000"));
        REQUIRE_FALSE(is_valid_uuid("550e8400-e29b-41d4-a716-446655440000#"));
        REQUIRE_FALSE(is_valid_uuid("550e8400-e29b-41d4-a716-446655440000#x1"));
        REQUIRE_FALSE(is_valid_uuid("550e8400-e29b-31d4-a716-446655440000#0"));  // version 3
        REQUIRE_FALSE(is_valid_uuid("550e8400-e29b-41d4-c716-446655440000#0"));  // variant c
        REQUIRE_FALSE(is_valid_uuid("550e8400e29b41d4a716446655440000#0"));
        REQUIRE_FALSE(is_valid_uuid("550g8400-e29b-41d4-a716-446655440000#0"));
    }

    SECTION("every generated id validates") {
        std::set<std::string> seen;
        for (int i = 0; i < 100; ++i) {
            auto id = generate_correlation_id();
            REQUIRE(is_valid_uuid(id));
            seen.insert(id);
        }
        REQUIRE(seen.size() == 100);
    }
}

TEST_CASE("Log level parsing", "[logging][level]") {
    REQUIRE(parse_log_level("debug") == quill::LogLevel::Debug);
    REQUIRE(parse_log_level("INFO") == quill::LogLevel::Info);
    REQUIRE(parse_log_level("warning") == quill::LogLevel::Warning);
    REQUIRE(parse_log_level("Warn") == quill::LogLevel::Warning);
    REQUIRE(parse_log_level("error") == quill::LogLevel::Error);

    // Unknown levels fall back to info
    REQUIRE(parse_log_level("verbose") == quill::LogLevel::Info);
    REQUIRE(parse_log_level("") == quill::LogLevel::Info);
}

TEST_CASE("Process logger is available", "[logging][logger]") {
    auto* logger = get_current_logger();
    REQUIRE(logger != nullptr);
    REQUIRE(get_current_logger() == logger);

    LOG_INFO(logger, "logging test message: {}", 42);
    LOG_BACKEND(logger, "connected", "127.0.0.1", 8081, "test-correlation");
}
