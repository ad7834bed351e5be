#pragma once

#include "common/Config.h"

#include <chrono>
#include <cstddef>
#include <deque>
#include <mutex>
#include <optional>
#include <stdexcept>
#include <string>
#include <string_view>
#include <unordered_map>
#include <vector>

namespace deskrelay::auth {

class AuthFailed : public std::runtime_error {
public:
    enum class Reason { BadCredentials, Locked };

    AuthFailed(Reason reason, const std::string& what)
        : std::runtime_error(what), reason_(reason) {}

    Reason reason() const noexcept { return reason_; }
    // Wire error code: "auth_failed" or "locked".
    const char* code() const noexcept { return reason_ == Reason::Locked ? "locked" : "auth_failed"; }

private:
    Reason reason_;
};

struct Credentials {
    std::string username;
    std::string password;
};

struct Session {
    using Clock = std::chrono::steady_clock;

    std::string session_id;
    std::string connection_id;
    std::string username;
    std::vector<std::string> permissions;
    Clock::time_point issued_at{};
    Clock::time_point expires_at{};
};

/**
 * Credential checks and per-connection sessions.
 *
 * At most one session per connection; re-authenticating replaces it.
 * Sessions expire `session_timeout` after issue and never outlive their
 * connection (the registry's unregister cascade calls invalidate()).
 */
class AuthManager {
public:
    using Clock = std::chrono::steady_clock;

    // Hashes plain-text passwords from the config; throws ConfigError on duplicate users.
    explicit AuthManager(const common::SecurityConfig& config);

    AuthManager(const AuthManager&) = delete;
    AuthManager& operator=(const AuthManager&) = delete;

    // Throws AuthFailed. The transport is left alone so the client can retry.
    Session authenticate(const std::string& connection_id,
                         const Credentials& credentials,
                         Clock::time_point now = Clock::now());

    // Owning connection id of a live session; empty when unknown or expired.
    std::optional<std::string> validate(const std::string& session_id,
                                        Clock::time_point now = Clock::now());

    void invalidate(const std::string& connection_id);

    // Explicit logout; returns false when the connection had no session.
    bool logout(const std::string& connection_id);

    std::optional<Session> session_for(const std::string& connection_id,
                                       Clock::time_point now = Clock::now()) const;
    bool has_permission(const std::string& connection_id,
                        std::string_view permission,
                        Clock::time_point now = Clock::now()) const;

    // Drops expired sessions and failed-login records that no longer count.
    // Returns the number of sessions dropped.
    std::size_t purge_expired(Clock::time_point now = Clock::now());
    std::size_t session_count() const;
    // User names with recent failures or an active lockout.
    std::size_t tracked_users() const;

    bool require_auth() const noexcept { return require_auth_; }

    // Empty expected hash accepts any value. Constant-time comparison.
    static bool check_pair_password(std::string_view expected_hash, std::string_view supplied);
    static std::string hash_pair_password(std::string_view password);

private:
    struct UserRecord {
        std::string password_hash;
        std::string role;
        std::vector<std::string> permissions;
    };

    // Failures inside the last `lockout_` window; older ones no longer count.
    struct Attempts {
        std::deque<Clock::time_point> failures;
        Clock::time_point locked_until{};
    };

    void erase_locked(const std::string& connection_id);
    void record_failure_locked(const std::string& username, Clock::time_point now);
    void prune_locked(Attempts& a, Clock::time_point now) const;

    const bool require_auth_;
    const std::chrono::seconds session_timeout_;
    const unsigned iterations_;
    const unsigned max_failed_attempts_;
    const std::chrono::seconds lockout_;

    std::unordered_map<std::string, UserRecord> users_;
    std::string dummy_hash_;  // verified for unknown users so both paths cost the same

    mutable std::mutex mu_;
    std::unordered_map<std::string, Session> by_connection_;
    std::unordered_map<std::string, std::string> by_session_;  // session id -> connection id
    std::unordered_map<std::string, Attempts> attempts_;
};

} // namespace deskrelay::auth
