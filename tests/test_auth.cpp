#include <catch2/catch.hpp>

#include "auth/AuthManager.h"
#include "auth/Password.h"

#include "TestSupport.h"

using namespace deskrelay;
using namespace deskrelay::test;
using auth::AuthFailed;
using auth::AuthManager;

TEST_CASE("PBKDF2 hashes verify only the original password", "[auth][password]") {
    const std::string h = auth::hash_password("correct horse", 1000);

    CHECK(auth::base64_decode(h).size() == 64);
    CHECK(auth::verify_password("correct horse", h, 1000));
    CHECK_FALSE(auth::verify_password("correct horse!", h, 1000));
    CHECK_FALSE(auth::verify_password("correct horse", h, 999));
    CHECK_FALSE(auth::verify_password("correct horse", "not-base64", 1000));

    // fresh salt every time
    CHECK(auth::hash_password("correct horse", 1000) != h);
}

TEST_CASE("base64 and tokens", "[auth][password]") {
    CHECK(auth::base64_encode("hello") == "aGVsbG8=");
    CHECK(auth::base64_decode("aGVsbG8=") == "hello");
    CHECK(auth::base64_decode("aGk=") == "hi");
    CHECK(auth::base64_decode("abc") == "");

    const std::string t = auth::random_token(32);
    CHECK(t.size() == 43);
    CHECK(t.find_first_of("+/=") == std::string::npos);
    CHECK(auth::random_token(32) != t);
}

TEST_CASE("three wrong passwords then the right one succeeds", "[auth]") {
    AuthManager am(test_config().security);
    const auto now = Clock::now();

    for (int i = 0; i < 3; ++i) {
        CHECK_THROWS_AS(am.authenticate("conn-1", {"alice", "wrong"}, now), AuthFailed);
    }

    const auto s = am.authenticate("conn-1", {"alice", "secret"}, now);
    CHECK(s.connection_id == "conn-1");
    CHECK(s.username == "alice");
    CHECK_FALSE(s.session_id.empty());

    auto owner = am.validate(s.session_id, now);
    REQUIRE(owner);
    CHECK(*owner == "conn-1");
}

TEST_CASE("unknown users fail like wrong passwords", "[auth]") {
    AuthManager am(test_config().security);
    try {
        am.authenticate("conn-1", {"mallory", "secret"});
        FAIL("expected AuthFailed");
    } catch (const AuthFailed& e) {
        CHECK(e.reason() == AuthFailed::Reason::BadCredentials);
        CHECK(std::string(e.code()) == "auth_failed");
    }
}

TEST_CASE("repeated failures lock the account for the lockout period", "[auth][lockout]") {
    auto cfg = test_config();
    cfg.security.max_failed_attempts = 5;
    cfg.security.lockout = std::chrono::seconds(300);
    AuthManager am(cfg.security);

    const auto t0 = Clock::now();
    for (int i = 0; i < 5; ++i) {
        CHECK_THROWS_AS(am.authenticate("conn-1", {"alice", "nope"}, t0), AuthFailed);
    }

    try {
        am.authenticate("conn-1", {"alice", "secret"}, t0 + 10s);
        FAIL("expected lockout");
    } catch (const AuthFailed& e) {
        CHECK(e.reason() == AuthFailed::Reason::Locked);
        CHECK(std::string(e.code()) == "locked");
    }

    // other users are unaffected
    CHECK_NOTHROW(am.authenticate("conn-2", {"bob", "hunter2"}, t0 + 10s));

    CHECK_NOTHROW(am.authenticate("conn-1", {"alice", "secret"}, t0 + 301s));
}

TEST_CASE("failures older than the lockout window no longer count", "[auth][lockout]") {
    auto cfg = test_config();
    cfg.security.max_failed_attempts = 5;
    cfg.security.lockout = std::chrono::seconds(300);
    AuthManager am(cfg.security);

    // never more than three failures inside any 300 s window
    const auto t0 = Clock::now();
    for (int i = 0; i < 10; ++i) {
        CHECK_THROWS_AS(am.authenticate("conn-1", {"alice", "nope"}, t0 + std::chrono::seconds(i * 100)), AuthFailed);
    }
    CHECK_NOTHROW(am.authenticate("conn-1", {"alice", "secret"}, t0 + 1000s));
}

TEST_CASE("purge_expired forgets stale failed-login records", "[auth][lockout]") {
    auto cfg = test_config();
    cfg.security.max_failed_attempts = 5;
    cfg.security.lockout = std::chrono::seconds(300);
    AuthManager am(cfg.security);
    const auto t0 = Clock::now();

    SECTION("unknown user names") {
        for (int i = 0; i < 50; ++i) {
            CHECK_THROWS_AS(am.authenticate("conn-1", {"ghost" + std::to_string(i), "x"}, t0), AuthFailed);
        }
        CHECK(am.tracked_users() == 50);

        am.purge_expired(t0 + 299s);
        CHECK(am.tracked_users() == 50);

        am.purge_expired(t0 + 300s);
        CHECK(am.tracked_users() == 0);
    }

    SECTION("a lockout outlives its failures until it runs out") {
        for (int i = 0; i < 5; ++i) {
            CHECK_THROWS_AS(am.authenticate("conn-1", {"alice", "nope"}, t0), AuthFailed);
        }
        am.purge_expired(t0 + 100s);
        CHECK(am.tracked_users() == 1);
        CHECK_THROWS_AS(am.authenticate("conn-1", {"alice", "secret"}, t0 + 100s), AuthFailed);

        am.purge_expired(t0 + 301s);
        CHECK(am.tracked_users() == 0);
        CHECK_NOTHROW(am.authenticate("conn-1", {"alice", "secret"}, t0 + 301s));
    }
}

TEST_CASE("sessions expire after the configured lifetime", "[auth][session]") {
    auto cfg = test_config();
    cfg.security.session_timeout = std::chrono::seconds(3600);
    AuthManager am(cfg.security);

    const auto t0 = Clock::now();
    const auto s = am.authenticate("conn-1", {"alice", "secret"}, t0);

    CHECK(am.validate(s.session_id, t0 + 3599s));
    CHECK_FALSE(am.validate(s.session_id, t0 + 3600s));
    // expired sessions are removed
    CHECK(am.session_count() == 0);
    CHECK_FALSE(am.validate(s.session_id, t0));
}

TEST_CASE("re-authentication replaces the connection's session", "[auth][session]") {
    AuthManager am(test_config().security);
    const auto first = am.authenticate("conn-1", {"alice", "secret"});
    const auto second = am.authenticate("conn-1", {"bob", "hunter2"});

    CHECK(first.session_id != second.session_id);
    CHECK_FALSE(am.validate(first.session_id));
    CHECK(am.validate(second.session_id));
    CHECK(am.session_count() == 1);
    CHECK(am.session_for("conn-1")->username == "bob");
}

TEST_CASE("invalidate and logout drop the session", "[auth][session]") {
    AuthManager am(test_config().security);
    const auto s = am.authenticate("conn-1", {"alice", "secret"});

    CHECK(am.logout("conn-1"));
    CHECK_FALSE(am.validate(s.session_id));
    CHECK_FALSE(am.logout("conn-1"));

    const auto s2 = am.authenticate("conn-2", {"alice", "secret"});
    am.invalidate("conn-2");
    CHECK_FALSE(am.validate(s2.session_id));
    CHECK_FALSE(am.validate("no-such-session"));
}

TEST_CASE("permissions come from the user table", "[auth]") {
    auto cfg = test_config();
    cfg.security.users.push_back({"root", "toor", "", "admin", {"all"}});
    AuthManager am(cfg.security);

    am.authenticate("c-alice", {"alice", "secret"});
    am.authenticate("c-bob", {"bob", "hunter2"});
    am.authenticate("c-root", {"root", "toor"});

    CHECK(am.has_permission("c-alice", "control"));
    CHECK_FALSE(am.has_permission("c-bob", "control"));
    CHECK(am.has_permission("c-bob", "view"));
    CHECK(am.has_permission("c-root", "control"));
    CHECK_FALSE(am.has_permission("c-nobody", "view"));
}

TEST_CASE("stored password hashes are accepted from the config", "[auth]") {
    auto cfg = test_config();
    cfg.security.users = {{"carol", "", auth::hash_password("pa55", 1000), "user", {"view"}}};
    AuthManager am(cfg.security);
    CHECK_NOTHROW(am.authenticate("c", {"carol", "pa55"}));
}

TEST_CASE("duplicate usernames are a configuration error", "[auth]") {
    auto cfg = test_config();
    cfg.security.users.push_back({"alice", "other", "", "user", {}});
    CHECK_THROWS_AS(AuthManager(cfg.security), common::ConfigError);
}

TEST_CASE("purge_expired drops only expired sessions", "[auth][session]") {
    auto cfg = test_config();
    cfg.security.session_timeout = std::chrono::seconds(60);
    AuthManager am(cfg.security);

    const auto t0 = Clock::now();
    am.authenticate("c1", {"alice", "secret"}, t0);
    am.authenticate("c2", {"bob", "hunter2"}, t0 + 30s);

    CHECK(am.purge_expired(t0 + 61s) == 1);
    CHECK(am.session_count() == 1);
    CHECK(am.session_for("c2", t0 + 61s));
}

TEST_CASE("pair password check", "[auth][pair]") {
    const std::string h = AuthManager::hash_pair_password("1234");

    CHECK(AuthManager::check_pair_password(h, "1234"));
    CHECK_FALSE(AuthManager::check_pair_password(h, "12345"));
    CHECK_FALSE(AuthManager::check_pair_password(h, ""));

    // no password configured: anything goes
    CHECK(AuthManager::check_pair_password("", ""));
    CHECK(AuthManager::check_pair_password("", "whatever"));

    CHECK(auth::constant_time_equals("abc", "abc"));
    CHECK_FALSE(auth::constant_time_equals("abc", "abd"));
    CHECK_FALSE(auth::constant_time_equals("abc", "abcd"));
}
