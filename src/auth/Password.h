#pragma once

#include <cstddef>
#include <string>
#include <string_view>

namespace deskrelay::auth {

// PBKDF2-HMAC-SHA256, 32-byte random salt; result is base64(salt || key).
std::string hash_password(std::string_view password, unsigned iterations);
bool verify_password(std::string_view password, std::string_view stored_hash, unsigned iterations);

// Salted single-round SHA-256 for per-device access passwords, base64(salt || digest).
std::string hash_access_password(std::string_view password);
bool verify_access_password(std::string_view password, std::string_view stored_hash);

bool constant_time_equals(std::string_view a, std::string_view b) noexcept;

// `nbytes` from the OpenSSL CSPRNG, base64url without padding.
std::string random_token(std::size_t nbytes);

std::string base64_encode(std::string_view bytes);
// Returns an empty string for invalid input.
std::string base64_decode(std::string_view text);

} // namespace deskrelay::auth
