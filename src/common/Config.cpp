#include "common/Config.h"

#include <boost/json.hpp>

#include <algorithm>
#include <cstdlib>
#include <fstream>
#include <iostream>
#include <limits>
#include <sstream>
#include <thread>

namespace deskrelay::common {

namespace json = boost::json;

namespace {

std::string where(const char* section, const char* key) {
    return std::string(section) + "." + key;
}

std::uint64_t read_uint(const json::value& v, const char* section, const char* key,
                        std::uint64_t max = std::numeric_limits<std::uint64_t>::max()) {
    std::uint64_t out = 0;
    if (v.is_uint64()) {
        out = v.as_uint64();
    } else if (v.is_int64() && v.as_int64() >= 0) {
        out = static_cast<std::uint64_t>(v.as_int64());
    } else {
        throw ConfigError(where(section, key) + ": expected a non-negative integer");
    }
    if (out > max) throw ConfigError(where(section, key) + ": value out of range");
    return out;
}

std::string read_string(const json::value& v, const char* section, const char* key) {
    if (!v.is_string()) throw ConfigError(where(section, key) + ": expected a string");
    const auto& s = v.as_string();
    return std::string(s.data(), s.size());
}

bool read_bool(const json::value& v, const char* section, const char* key) {
    if (!v.is_bool()) throw ConfigError(where(section, key) + ": expected true or false");
    return v.as_bool();
}

std::vector<std::string> read_strings(const json::value& v, const char* section, const char* key) {
    if (!v.is_array()) throw ConfigError(where(section, key) + ": expected an array of strings");
    std::vector<std::string> out;
    for (const auto& item : v.as_array()) out.push_back(read_string(item, section, key));
    return out;
}

const json::object* section_of(const json::object& root, const char* name) {
    const json::value* v = root.if_contains(name);
    if (!v) return nullptr;
    if (!v->is_object()) throw ConfigError(std::string(name) + ": expected an object");
    return &v->as_object();
}

LogLevel read_level(const std::string& name, const char* what) {
    auto level = Logging::parse_level(name);
    if (!level) throw ConfigError(std::string(what) + ": unknown log level '" + name + "'");
    return *level;
}

unsigned short read_port(const std::string& text) {
    char* end = nullptr;
    long port = std::strtol(text.c_str(), &end, 10);
    if (end == text.c_str() || *end != '\0' || port <= 0 || port > 65535) {
        throw ConfigError("invalid port number '" + text + "'");
    }
    return static_cast<unsigned short>(port);
}

} // namespace

void Config::load_file(const std::string& path) {
    std::ifstream in(path);
    if (!in) throw ConfigError("cannot open config file " + path);

    std::ostringstream ss;
    ss << in.rdbuf();
    load_json(ss.str());
    config_path = path;
}

void Config::load_json(const std::string& text) {
    boost::system::error_code ec;
    json::value root = json::parse(text, ec);
    if (ec) throw ConfigError("config is not valid JSON: " + ec.message());
    if (!root.is_object()) throw ConfigError("config root must be an object");
    const auto& obj = root.as_object();

    if (const auto* s = section_of(obj, "server")) {
        if (auto* v = s->if_contains("host")) server.host = read_string(*v, "server", "host");
        if (auto* v = s->if_contains("port")) {
            auto port = read_uint(*v, "server", "port", 65535);
            if (port == 0) throw ConfigError("server.port: must not be 0");
            server.port = static_cast<unsigned short>(port);
        }
        if (auto* v = s->if_contains("threads")) server.threads = static_cast<unsigned>(read_uint(*v, "server", "threads", 1024));
        if (auto* v = s->if_contains("max_connections")) server.max_connections = read_uint(*v, "server", "max_connections");
        if (auto* v = s->if_contains("max_send_queue")) server.max_send_queue = read_uint(*v, "server", "max_send_queue");
    }

    if (const auto* s = section_of(obj, "heartbeat")) {
        if (auto* v = s->if_contains("interval_ms")) {
            heartbeat.interval = std::chrono::milliseconds(read_uint(*v, "heartbeat", "interval_ms"));
            if (heartbeat.interval.count() == 0) throw ConfigError("heartbeat.interval_ms: must be positive");
        }
        if (auto* v = s->if_contains("missed")) {
            heartbeat.missed = static_cast<unsigned>(read_uint(*v, "heartbeat", "missed", 1000));
            if (heartbeat.missed == 0) throw ConfigError("heartbeat.missed: must be positive");
        }
    }

    if (const auto* s = section_of(obj, "relay")) {
        if (auto* v = s->if_contains("control_request_timeout_ms")) {
            relay.control_request_timeout =
                std::chrono::milliseconds(read_uint(*v, "relay", "control_request_timeout_ms"));
        }
    }

    if (const auto* s = section_of(obj, "protocol")) {
        if (auto* v = s->if_contains("max_frame_bytes")) protocol.max_frame_bytes = read_uint(*v, "protocol", "max_frame_bytes");
        if (auto* v = s->if_contains("compress_threshold")) protocol.compress_threshold = read_uint(*v, "protocol", "compress_threshold");
        if (auto* v = s->if_contains("max_violations")) protocol.max_violations = static_cast<unsigned>(read_uint(*v, "protocol", "max_violations", 1u << 20));
        if (auto* v = s->if_contains("violation_window_ms")) {
            protocol.violation_window = std::chrono::milliseconds(read_uint(*v, "protocol", "violation_window_ms"));
        }
    }

    if (const auto* s = section_of(obj, "security")) {
        if (auto* v = s->if_contains("require_auth")) security.require_auth = read_bool(*v, "security", "require_auth");
        if (auto* v = s->if_contains("session_timeout_s")) security.session_timeout = std::chrono::seconds(read_uint(*v, "security", "session_timeout_s"));
        if (auto* v = s->if_contains("pbkdf2_iterations")) {
            security.pbkdf2_iterations = static_cast<unsigned>(read_uint(*v, "security", "pbkdf2_iterations", 10000000));
            if (security.pbkdf2_iterations == 0) throw ConfigError("security.pbkdf2_iterations: must be positive");
        }
        if (auto* v = s->if_contains("max_failed_attempts")) security.max_failed_attempts = static_cast<unsigned>(read_uint(*v, "security", "max_failed_attempts", 1000));
        if (auto* v = s->if_contains("lockout_s")) security.lockout = std::chrono::seconds(read_uint(*v, "security", "lockout_s"));
    }

    if (const auto* v = obj.if_contains("users")) {
        if (!v->is_array()) throw ConfigError("users: expected an array");
        security.users.clear();
        for (const auto& item : v->as_array()) {
            if (!item.is_object()) throw ConfigError("users: every entry must be an object");
            const auto& u = item.as_object();

            UserEntry entry;
            if (auto* f = u.if_contains("username")) entry.username = read_string(*f, "users", "username");
            if (auto* f = u.if_contains("password")) entry.password = read_string(*f, "users", "password");
            if (auto* f = u.if_contains("password_hash")) entry.password_hash = read_string(*f, "users", "password_hash");
            if (auto* f = u.if_contains("role")) entry.role = read_string(*f, "users", "role");
            if (auto* f = u.if_contains("permissions")) entry.permissions = read_strings(*f, "users", "permissions");

            if (entry.username.empty()) throw ConfigError("users: entry without username");
            if (entry.password.empty() && entry.password_hash.empty()) {
                throw ConfigError("users: '" + entry.username + "' needs password or password_hash");
            }
            security.users.push_back(std::move(entry));
        }
    }

    if (const auto* s = section_of(obj, "logging")) {
        if (auto* v = s->if_contains("level")) logging.level = read_level(read_string(*v, "logging", "level"), "logging.level");
        if (auto* v = s->if_contains("file")) logging.file = read_string(*v, "logging", "file");
    }
}

bool Config::parse_args(int argc, char* argv[]) {
    // The config file is the base layer, so it is loaded before any other flag applies.
    for (int i = 1; i < argc; i++) {
        std::string arg = argv[i];
        if ((arg == "-c" || arg == "--config") && i + 1 < argc) {
            load_file(argv[i + 1]);
            break;
        }
    }

    for (int i = 1; i < argc; i++) {
        std::string arg = argv[i];

        if (arg == "-h" || arg == "--help") {
            print_help();
            return false;
        }

        if (arg == "-v" || arg == "--version") {
            print_version();
            return false;
        }

        if ((arg == "-c" || arg == "--config") && i + 1 < argc) {
            ++i;
            continue;
        }

        if (arg == "--host" && i + 1 < argc) {
            server.host = argv[++i];
            continue;
        }

        if ((arg == "-p" || arg == "--port") && i + 1 < argc) {
            server.port = read_port(argv[++i]);
            continue;
        }

        if ((arg == "-t" || arg == "--threads") && i + 1 < argc) {
            int threads = std::atoi(argv[++i]);
            if (threads < 0 || threads > 1024) throw ConfigError("invalid thread count");
            server.threads = static_cast<unsigned>(threads);
            continue;
        }

        if (arg == "--log-level" && i + 1 < argc) {
            logging.level = read_level(argv[++i], "--log-level");
            continue;
        }

        if (arg == "--log-file" && i + 1 < argc) {
            logging.file = argv[++i];
            continue;
        }

        if (arg == "--no-auth") {
            security.require_auth = false;
            continue;
        }

        throw ConfigError("unknown argument '" + arg + "' (see --help)");
    }

    if (server.threads == 0) {
        server.threads = std::max(1u, std::thread::hardware_concurrency());
    }
    return true;
}

void Config::print_help() {
    std::cout <<
        "Usage: deskrelay [options]\n"
        "\n"
        "Remote desktop broker: pairs controllers with controlled devices and\n"
        "relays screen frames and input events between them.\n"
        "\n"
        "Options:\n"
        "  -c, --config <file>    JSON configuration file\n"
        "      --host <addr>      listen address (default 0.0.0.0)\n"
        "  -p, --port <port>      listen port (default 8765)\n"
        "  -t, --threads <n>      I/O threads (default: hardware concurrency)\n"
        "      --log-level <lvl>  debug, info, warn, error (default info)\n"
        "      --log-file <file>  append log lines to this file\n"
        "      --no-auth          allow control requests without a session\n"
        "  -h, --help             show this help\n"
        "  -v, --version          show version\n";
}

void Config::print_version() {
    std::cout << "deskrelay " << DESKRELAY_VERSION << "\n";
}

} // namespace deskrelay::common
