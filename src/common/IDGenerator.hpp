#pragma once

#include <openssl/rand.h>

#include <array>
#include <chrono>
#include <cstdint>
#include <mutex>
#include <stdexcept>
#include <string>

namespace deskrelay::common {

// ULID-style ids: 48-bit millisecond timestamp + 80 random bits, Crockford base32.
// Ids from one generator sort by creation order, also within a millisecond.
class IDGenerator {
public:
    enum class Kind { Connection, Request };

    std::string make(Kind kind) {
        return std::string(prefix_of(kind)) + "-" + ulid_();
    }

    std::string connectionID() { return make(Kind::Connection); }
    std::string requestID()    { return make(Kind::Request); }

private:
    using u128 = unsigned __int128;

    static const char* prefix_of(Kind kind) {
        switch (kind) {
            case Kind::Connection: return "conn";
            case Kind::Request:    return "req";
        }
        return "id";
    }

    std::string ulid_() {
        const std::uint64_t ts_ms = now_ms_();

        u128 value = 0;
        {
            std::lock_guard<std::mutex> lk(mu_);

            if (ts_ms > last_ts_ms_) {
                last_ts_ms_ = ts_ms;
                last_rand_ = random_80_();
            } else {
                // clock did not advance: bump the previous random part
                last_rand_ = (last_rand_ + 1) & kRandMask;
            }
            value = (static_cast<u128>(last_ts_ms_ & 0xFFFFFFFFFFFFull) << 80) | last_rand_;
        }

        return crockford_base32_(value);
    }

    static std::uint64_t now_ms_() {
        using namespace std::chrono;
        return static_cast<std::uint64_t>(
            duration_cast<milliseconds>(system_clock::now().time_since_epoch()).count());
    }

    static u128 random_80_() {
        std::array<unsigned char, 10> bytes{};
        if (RAND_bytes(bytes.data(), static_cast<int>(bytes.size())) != 1) {
            throw std::runtime_error("RAND_bytes failed");
        }
        u128 x = 0;
        for (unsigned char b : bytes) x = (x << 8) | b;
        return x;
    }

    // 128 bits -> 26 chars; the first char carries the top 3 bits.
    static std::string crockford_base32_(u128 value) {
        static constexpr char alphabet[] = "0123456789ABCDEFGHJKMNPQRSTVWXYZ";

        std::string out(26, '0');
        for (int i = 25; i >= 0; --i) {
            out[static_cast<std::size_t>(i)] = alphabet[static_cast<unsigned>(value & 0x1F)];
            value >>= 5;
        }
        return out;
    }

    static constexpr u128 kRandMask = (static_cast<u128>(1) << 80) - 1;

    std::mutex mu_;
    std::uint64_t last_ts_ms_ = 0;
    u128 last_rand_ = 0;
};

} // namespace deskrelay::common
