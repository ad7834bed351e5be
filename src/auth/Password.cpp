#include "auth/Password.h"

#include <openssl/crypto.h>
#include <openssl/evp.h>
#include <openssl/rand.h>
#include <openssl/sha.h>

#include <stdexcept>
#include <vector>

namespace deskrelay::auth {

namespace {

constexpr std::size_t kSaltLen = 32;
constexpr std::size_t kKeyLen = 32;

std::string random_bytes(std::size_t n) {
    std::string out(n, '\0');
    if (RAND_bytes(reinterpret_cast<unsigned char*>(out.data()), static_cast<int>(n)) != 1) {
        throw std::runtime_error("RAND_bytes failed");
    }
    return out;
}

std::string pbkdf2(std::string_view password, std::string_view salt, unsigned iterations) {
    std::string key(kKeyLen, '\0');
    int ok = PKCS5_PBKDF2_HMAC(password.data(), static_cast<int>(password.size()),
                               reinterpret_cast<const unsigned char*>(salt.data()), static_cast<int>(salt.size()),
                               static_cast<int>(iterations), EVP_sha256(),
                               static_cast<int>(kKeyLen), reinterpret_cast<unsigned char*>(key.data()));
    if (ok != 1) throw std::runtime_error("PKCS5_PBKDF2_HMAC failed");
    return key;
}

std::string sha256(std::string_view salt, std::string_view password) {
    std::string input;
    input.reserve(salt.size() + password.size());
    input.append(salt.data(), salt.size());
    input.append(password.data(), password.size());

    std::string digest(SHA256_DIGEST_LENGTH, '\0');
    SHA256(reinterpret_cast<const unsigned char*>(input.data()), input.size(),
           reinterpret_cast<unsigned char*>(digest.data()));
    return digest;
}

} // namespace

std::string base64_encode(std::string_view bytes) {
    if (bytes.empty()) return {};
    std::string out(4 * ((bytes.size() + 2) / 3), '\0');
    int n = EVP_EncodeBlock(reinterpret_cast<unsigned char*>(out.data()),
                            reinterpret_cast<const unsigned char*>(bytes.data()),
                            static_cast<int>(bytes.size()));
    out.resize(static_cast<std::size_t>(n));
    return out;
}

std::string base64_decode(std::string_view text) {
    if (text.empty() || text.size() % 4 != 0) return {};
    std::string out(3 * text.size() / 4, '\0');
    int n = EVP_DecodeBlock(reinterpret_cast<unsigned char*>(out.data()),
                            reinterpret_cast<const unsigned char*>(text.data()),
                            static_cast<int>(text.size()));
    if (n < 0) return {};

    // EVP_DecodeBlock counts the padding as zero bytes
    std::size_t pad = 0;
    if (text.back() == '=') ++pad;
    if (text.size() > 1 && text[text.size() - 2] == '=') ++pad;
    out.resize(static_cast<std::size_t>(n) - pad);
    return out;
}

bool constant_time_equals(std::string_view a, std::string_view b) noexcept {
    if (a.size() != b.size()) return false;
    if (a.empty()) return true;
    return CRYPTO_memcmp(a.data(), b.data(), a.size()) == 0;
}

std::string random_token(std::size_t nbytes) {
    std::string token = base64_encode(random_bytes(nbytes));
    for (auto& c : token) {
        if (c == '+') c = '-';
        else if (c == '/') c = '_';
    }
    while (!token.empty() && token.back() == '=') token.pop_back();
    return token;
}

std::string hash_password(std::string_view password, unsigned iterations) {
    const std::string salt = random_bytes(kSaltLen);
    return base64_encode(salt + pbkdf2(password, salt, iterations));
}

bool verify_password(std::string_view password, std::string_view stored_hash, unsigned iterations) {
    const std::string decoded = base64_decode(stored_hash);
    if (decoded.size() != kSaltLen + kKeyLen) return false;

    const std::string_view salt(decoded.data(), kSaltLen);
    const std::string_view stored_key(decoded.data() + kSaltLen, kKeyLen);
    return constant_time_equals(pbkdf2(password, salt, iterations), stored_key);
}

std::string hash_access_password(std::string_view password) {
    const std::string salt = random_bytes(kSaltLen);
    return base64_encode(salt + sha256(salt, password));
}

bool verify_access_password(std::string_view password, std::string_view stored_hash) {
    const std::string decoded = base64_decode(stored_hash);
    if (decoded.size() != kSaltLen + SHA256_DIGEST_LENGTH) return false;

    const std::string_view salt(decoded.data(), kSaltLen);
    const std::string_view digest(decoded.data() + kSaltLen, SHA256_DIGEST_LENGTH);
    return constant_time_equals(sha256(salt, password), digest);
}

} // namespace deskrelay::auth
