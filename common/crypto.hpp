#pragma once

// ============================================================
// crypto.hpp -- OpenSSL primitives for PIN-keyed channels
// ============================================================

#include "platform.hpp"
#include <array>
#include <string>
#include <vector>

namespace crypto {

static constexpr size_t KEY_LEN   = 32;  // AES-256
static constexpr size_t SALT_LEN  = 16;
static constexpr size_t NONCE_LEN = 12;  // GCM standard nonce
static constexpr size_t TAG_LEN   = 16;

static constexpr int DEFAULT_KDF_ITERATIONS = 100000;

using Key  = std::array<u8, KEY_LEN>;
using Salt = std::array<u8, SALT_LEN>;

// CSPRNG bytes; throws std::runtime_error when the RNG fails
void random_fill(u8* out, size_t count);
u64 random_u64();

// Non-zero random id (0 is reserved for "none" on the wire)
u64 random_id();

Salt random_salt();

// Numeric PIN of `digits` digits, first digit non-zero
std::string random_pin(int digits);

// PBKDF2-HMAC-SHA256(pin, salt, iterations) -> 32-byte key
Key derive_key(const std::string& pin, const Salt& salt, int iterations);

// AES-256-GCM. Output layout: nonce(12) || ciphertext || tag(16)
std::vector<u8> seal(const Key& key, const std::vector<u8>& plaintext,
                     const std::vector<u8>& aad);

// Inverse of seal(). Returns false when the tag does not authenticate
// or the input is too short; never throws for bad input.
bool open(const Key& key, const std::vector<u8>& sealed,
          const std::vector<u8>& aad, std::vector<u8>& plaintext);

// Overwrite key material
void wipe(void* p, size_t len);

inline void wipe(Key& k) { wipe(k.data(), k.size()); }
inline void wipe(std::string& s) { if (!s.empty()) wipe(&s[0], s.size()); s.clear(); }

} // namespace crypto
