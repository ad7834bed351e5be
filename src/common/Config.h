#pragma once

#include "common/Logging.h"

#include <chrono>
#include <cstddef>
#include <cstdint>
#include <stdexcept>
#include <string>
#include <vector>

#define DESKRELAY_VERSION "1.0.0"

namespace deskrelay::common {

class ConfigError : public std::runtime_error {
public:
    using std::runtime_error::runtime_error;
};

struct ServerConfig {
    std::string host = "0.0.0.0";
    unsigned short port = 8765;
    unsigned threads = 0;               // 0 = hardware concurrency
    std::size_t max_connections = 100;
    std::size_t max_send_queue = 64;    // per connection, droppable media only
};

struct HeartbeatConfig {
    std::chrono::milliseconds interval{5000};
    unsigned missed = 3;
};

struct RelayConfig {
    std::chrono::milliseconds control_request_timeout{15000};
};

struct ProtocolConfig {
    std::size_t max_frame_bytes = 16 * 1024 * 1024;
    std::size_t compress_threshold = 1024;  // 0 disables payload compression
    unsigned max_violations = 10;
    std::chrono::milliseconds violation_window{60000};
};

struct UserEntry {
    std::string username;
    std::string password;       // plain, hashed at startup
    std::string password_hash;  // base64(salt || pbkdf2 key)
    std::string role = "user";
    std::vector<std::string> permissions{"view", "control"};
};

struct SecurityConfig {
    bool require_auth = true;
    std::chrono::seconds session_timeout{3600};
    unsigned pbkdf2_iterations = 100000;
    unsigned max_failed_attempts = 5;
    std::chrono::seconds lockout{300};
    std::vector<UserEntry> users;
};

struct LoggingConfig {
    LogLevel level = LogLevel::Info;
    std::string file;
};

/**
 * Runtime configuration.
 *
 * Built-in defaults, overridden by an optional JSON file, overridden by
 * command-line flags.
 */
class Config {
public:
    ServerConfig server;
    HeartbeatConfig heartbeat;
    RelayConfig relay;
    ProtocolConfig protocol;
    SecurityConfig security;
    LoggingConfig logging;

    std::string config_path;

    /**
     * Parse command-line arguments (loads --config first, flags win).
     * @return false if the process should exit (--help / --version)
     * @throws ConfigError on invalid arguments or config file contents
     */
    bool parse_args(int argc, char* argv[]);

    void load_file(const std::string& path);
    void load_json(const std::string& text);

private:
    static void print_help();
    static void print_version();
};

} // namespace deskrelay::common
