#include "auth/AuthManager.h"

#include "auth/Password.h"
#include "common/Logging.h"

#include <algorithm>

namespace deskrelay::auth {

namespace {
constexpr const char* kLog = "auth";
constexpr std::size_t kSessionIdBytes = 32;
}

AuthManager::AuthManager(const common::SecurityConfig& config)
    : require_auth_(config.require_auth),
      session_timeout_(config.session_timeout),
      iterations_(config.pbkdf2_iterations),
      max_failed_attempts_(config.max_failed_attempts),
      lockout_(config.lockout),
      dummy_hash_(hash_password("deskrelay-dummy", config.pbkdf2_iterations)) {
    for (const auto& u : config.users) {
        UserRecord rec;
        rec.password_hash = u.password_hash.empty() ? hash_password(u.password, iterations_) : u.password_hash;
        rec.role = u.role;
        rec.permissions = u.permissions;

        if (!users_.emplace(u.username, std::move(rec)).second) {
            throw common::ConfigError("users: duplicate username '" + u.username + "'");
        }
    }

    if (require_auth_ && users_.empty()) {
        DESKRELAY_LOG_WARN(kLog, "authentication is required but no users are configured");
    }
}

Session AuthManager::authenticate(const std::string& connection_id,
                                  const Credentials& credentials,
                                  Clock::time_point now) {
    {
        std::lock_guard<std::mutex> lk(mu_);
        auto it = attempts_.find(credentials.username);
        if (it != attempts_.end() && now < it->second.locked_until) {
            DESKRELAY_LOG_WARN(kLog, "login for locked user '" << credentials.username << "' from " << connection_id);
            throw AuthFailed(AuthFailed::Reason::Locked, "too many failed attempts, try again later");
        }
    }

    // PBKDF2 runs outside the lock.
    auto user = users_.find(credentials.username);
    const bool known = user != users_.end();
    const bool ok = verify_password(credentials.password,
                                    known ? user->second.password_hash : dummy_hash_,
                                    iterations_) && known;

    std::lock_guard<std::mutex> lk(mu_);

    if (!ok) {
        record_failure_locked(credentials.username, now);
        DESKRELAY_LOG_WARN(kLog, "authentication failed for '" << credentials.username << "' on " << connection_id);
        throw AuthFailed(AuthFailed::Reason::BadCredentials, "invalid username or password");
    }

    attempts_.erase(credentials.username);
    erase_locked(connection_id);

    Session s;
    s.session_id = random_token(kSessionIdBytes);
    s.connection_id = connection_id;
    s.username = credentials.username;
    s.permissions = user->second.permissions;
    s.issued_at = now;
    s.expires_at = now + session_timeout_;

    by_session_[s.session_id] = connection_id;
    by_connection_[connection_id] = s;

    DESKRELAY_LOG_INFO(kLog, "user '" << s.username << "' authenticated on " << connection_id);
    return s;
}

std::optional<std::string> AuthManager::validate(const std::string& session_id, Clock::time_point now) {
    std::lock_guard<std::mutex> lk(mu_);

    auto it = by_session_.find(session_id);
    if (it == by_session_.end()) return std::nullopt;

    auto conn = by_connection_.find(it->second);
    if (conn == by_connection_.end()) {
        by_session_.erase(it);
        return std::nullopt;
    }

    if (now >= conn->second.expires_at) {
        DESKRELAY_LOG_INFO(kLog, "session of '" << conn->second.username << "' expired");
        erase_locked(conn->first);
        return std::nullopt;
    }
    return conn->first;
}

void AuthManager::invalidate(const std::string& connection_id) {
    std::lock_guard<std::mutex> lk(mu_);
    erase_locked(connection_id);
}

bool AuthManager::logout(const std::string& connection_id) {
    std::lock_guard<std::mutex> lk(mu_);
    auto it = by_connection_.find(connection_id);
    if (it == by_connection_.end()) return false;

    DESKRELAY_LOG_INFO(kLog, "user '" << it->second.username << "' logged out of " << connection_id);
    erase_locked(connection_id);
    return true;
}

std::optional<Session> AuthManager::session_for(const std::string& connection_id, Clock::time_point now) const {
    std::lock_guard<std::mutex> lk(mu_);
    auto it = by_connection_.find(connection_id);
    if (it == by_connection_.end() || now >= it->second.expires_at) return std::nullopt;
    return it->second;
}

bool AuthManager::has_permission(const std::string& connection_id,
                                 std::string_view permission,
                                 Clock::time_point now) const {
    auto s = session_for(connection_id, now);
    if (!s) return false;
    return std::any_of(s->permissions.begin(), s->permissions.end(),
                       [&](const std::string& p) { return p == permission || p == "all"; });
}

std::size_t AuthManager::purge_expired(Clock::time_point now) {
    std::lock_guard<std::mutex> lk(mu_);

    std::vector<std::string> expired;
    for (const auto& [conn, s] : by_connection_) {
        if (now >= s.expires_at) expired.push_back(conn);
    }
    for (const auto& conn : expired) erase_locked(conn);

    for (auto it = attempts_.begin(); it != attempts_.end();) {
        prune_locked(it->second, now);
        if (it->second.failures.empty() && now >= it->second.locked_until) {
            it = attempts_.erase(it);
        } else {
            ++it;
        }
    }
    return expired.size();
}

std::size_t AuthManager::tracked_users() const {
    std::lock_guard<std::mutex> lk(mu_);
    return attempts_.size();
}

std::size_t AuthManager::session_count() const {
    std::lock_guard<std::mutex> lk(mu_);
    return by_connection_.size();
}

bool AuthManager::check_pair_password(std::string_view expected_hash, std::string_view supplied) {
    if (expected_hash.empty()) return true;
    return verify_access_password(supplied, expected_hash);
}

std::string AuthManager::hash_pair_password(std::string_view password) {
    return hash_access_password(password);
}

void AuthManager::erase_locked(const std::string& connection_id) {
    auto it = by_connection_.find(connection_id);
    if (it == by_connection_.end()) return;
    by_session_.erase(it->second.session_id);
    by_connection_.erase(it);
}

void AuthManager::record_failure_locked(const std::string& username, Clock::time_point now) {
    if (max_failed_attempts_ == 0) return;

    auto& a = attempts_[username];
    prune_locked(a, now);
    a.failures.push_back(now);
    if (a.failures.size() >= max_failed_attempts_) {
        a.failures.clear();
        a.locked_until = now + lockout_;
        DESKRELAY_LOG_WARN(kLog, "user '" << username << "' locked for " << lockout_.count() << "s");
    }
}

void AuthManager::prune_locked(Attempts& a, Clock::time_point now) const {
    while (!a.failures.empty() && now - a.failures.front() >= lockout_) a.failures.pop_front();
}

} // namespace deskrelay::auth
