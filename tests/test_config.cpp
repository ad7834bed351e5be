#include <catch2/catch.hpp>

#include "common/Config.h"
#include "common/Logging.h"

#include <cstdio>
#include <fstream>
#include <string>
#include <vector>

using namespace deskrelay::common;

namespace {

// argv-style wrapper over owned strings
struct Args {
    explicit Args(std::vector<std::string> a) : storage(std::move(a)) {
        storage.insert(storage.begin(), "deskrelay");
        for (auto& s : storage) ptrs.push_back(s.data());
    }
    int argc() const { return static_cast<int>(ptrs.size()); }
    char** argv() { return ptrs.data(); }

    std::vector<std::string> storage;
    std::vector<char*> ptrs;
};

} // namespace

TEST_CASE("defaults", "[config]") {
    Config c;
    CHECK(c.server.port == 8765);
    CHECK(c.server.max_connections == 100);
    CHECK(c.heartbeat.interval == std::chrono::milliseconds(5000));
    CHECK(c.heartbeat.missed == 3);
    CHECK(c.relay.control_request_timeout == std::chrono::milliseconds(15000));
    CHECK(c.security.require_auth);
    CHECK(c.security.session_timeout == std::chrono::seconds(3600));
    CHECK(c.security.pbkdf2_iterations == 100000);
    CHECK(c.security.max_failed_attempts == 5);
    CHECK(c.protocol.max_frame_bytes == 16u * 1024 * 1024);
}

TEST_CASE("JSON overrides only the keys it names", "[config]") {
    Config c;
    c.load_json(R"({
        "server": {"port": 9000, "max_send_queue": 8},
        "heartbeat": {"interval_ms": 2000, "missed": 4},
        "relay": {"control_request_timeout_ms": 5000},
        "security": {"require_auth": false, "lockout_s": 60},
        "users": [{"username": "ops", "password": "pw", "permissions": ["all"]}],
        "logging": {"level": "debug"}
    })");

    CHECK(c.server.port == 9000);
    CHECK(c.server.host == "0.0.0.0");
    CHECK(c.server.max_send_queue == 8);
    CHECK(c.heartbeat.interval == std::chrono::milliseconds(2000));
    CHECK(c.heartbeat.missed == 4);
    CHECK(c.relay.control_request_timeout == std::chrono::milliseconds(5000));
    CHECK_FALSE(c.security.require_auth);
    CHECK(c.security.lockout == std::chrono::seconds(60));
    REQUIRE(c.security.users.size() == 1);
    CHECK(c.security.users[0].username == "ops");
    CHECK(c.security.users[0].permissions == std::vector<std::string>{"all"});
    CHECK(c.logging.level == LogLevel::Debug);
}

TEST_CASE("invalid config values name the offending key", "[config]") {
    Config c;
    CHECK_THROWS_WITH(c.load_json(R"({"server": {"port": "http"}})"), Catch::Contains("server.port"));
    CHECK_THROWS_WITH(c.load_json(R"({"server": {"port": 70000}})"), Catch::Contains("server.port"));
    CHECK_THROWS_WITH(c.load_json(R"({"security": {"require_auth": 1}})"), Catch::Contains("security.require_auth"));
    CHECK_THROWS_WITH(c.load_json(R"({"logging": {"level": "loud"}})"), Catch::Contains("logging.level"));
    CHECK_THROWS_AS(c.load_json(R"({"users": [{"username": "x"}]})"), ConfigError);
    CHECK_THROWS_AS(c.load_json("[1, 2]"), ConfigError);
    CHECK_THROWS_AS(c.load_json("{not json"), ConfigError);
}

TEST_CASE("command-line flags win over the config file", "[config]") {
    const std::string path = "deskrelay_test_config.json";
    {
        std::ofstream out(path);
        out << R"({"server": {"port": 9100, "host": "127.0.0.1"}, "logging": {"level": "warn"}})";
    }

    Config c;
    Args args({"--port", "9200", "-c", path, "--no-auth", "--threads", "3"});
    REQUIRE(c.parse_args(args.argc(), args.argv()));

    CHECK(c.server.port == 9200);
    CHECK(c.server.host == "127.0.0.1");
    CHECK(c.server.threads == 3);
    CHECK(c.logging.level == LogLevel::Warning);
    CHECK_FALSE(c.security.require_auth);
    CHECK(c.config_path == path);

    std::remove(path.c_str());
}

TEST_CASE("bad command lines are rejected", "[config]") {
    Config c;
    Args unknown({"--frobnicate"});
    CHECK_THROWS_AS(c.parse_args(unknown.argc(), unknown.argv()), ConfigError);

    Args port({"--port", "0"});
    CHECK_THROWS_AS(c.parse_args(port.argc(), port.argv()), ConfigError);

    Args missing({"--config", "/nonexistent/deskrelay.json"});
    CHECK_THROWS_AS(c.parse_args(missing.argc(), missing.argv()), ConfigError);
}

TEST_CASE("threads default to at least one", "[config]") {
    Config c;
    Args none(std::vector<std::string>{});
    REQUIRE(c.parse_args(none.argc(), none.argv()));
    CHECK(c.server.threads >= 1);
}

TEST_CASE("log level names", "[config][logging]") {
    CHECK(Logging::parse_level("DEBUG") == LogLevel::Debug);
    CHECK(Logging::parse_level("warning") == LogLevel::Warning);
    CHECK(Logging::parse_level("warn") == LogLevel::Warning);
    CHECK_FALSE(Logging::parse_level("verbose"));
}
