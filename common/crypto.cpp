// ============================================================
// crypto.cpp -- OpenSSL implementation
// ============================================================

#include "crypto.hpp"
#include "logger.hpp"
#include <stdexcept>
#include <cstring>

#include <openssl/crypto.h>
#include <openssl/evp.h>
#include <openssl/rand.h>

namespace crypto {

void random_fill(u8* out, size_t count) {
    if (count == 0) return;
    if (RAND_bytes(out, static_cast<int>(count)) != 1) {
        LOG_ERROR("crypto: RAND_bytes failed");
        throw std::runtime_error("Failed to generate random bytes");
    }
}

u64 random_u64() {
    u64 v = 0;
    random_fill(reinterpret_cast<u8*>(&v), sizeof(v));
    return v;
}

u64 random_id() {
    u64 v = 0;
    while (v == 0) v = random_u64();
    return v;
}

Salt random_salt() {
    Salt s;
    random_fill(s.data(), s.size());
    return s;
}

std::string random_pin(int digits) {
    if (digits < 4 || digits > 16) {
        throw std::invalid_argument("PIN length must be 4-16 digits");
    }
    std::string pin;
    pin.reserve((size_t)digits);
    while ((int)pin.size() < digits) {
        u8 b;
        random_fill(&b, 1);
        // Rejection sampling keeps digits uniform (250 = 25 * 10)
        if (b >= 250) continue;
        char c = (char)('0' + b % 10);
        if (pin.empty() && c == '0') continue;
        pin.push_back(c);
    }
    return pin;
}

Key derive_key(const std::string& pin, const Salt& salt, int iterations) {
    if (iterations < 1) {
        throw std::invalid_argument("KDF iterations must be positive");
    }
    Key key;
    if (PKCS5_PBKDF2_HMAC(pin.data(), static_cast<int>(pin.size()),
                          salt.data(), static_cast<int>(salt.size()),
                          iterations, EVP_sha256(),
                          static_cast<int>(key.size()), key.data()) != 1) {
        throw std::runtime_error("PBKDF2 derivation failed");
    }
    return key;
}

std::vector<u8> seal(const Key& key, const std::vector<u8>& plaintext,
                     const std::vector<u8>& aad) {
    std::vector<u8> out(NONCE_LEN + plaintext.size() + TAG_LEN);
    random_fill(out.data(), NONCE_LEN);

    EVP_CIPHER_CTX* ctx = EVP_CIPHER_CTX_new();
    if (!ctx) {
        throw std::runtime_error("EVP_CIPHER_CTX_new failed");
    }

    bool success = false;
    do {
        int len = 0;
        if (EVP_EncryptInit_ex(ctx, EVP_aes_256_gcm(), nullptr, nullptr, nullptr) != 1) break;
        if (EVP_CIPHER_CTX_ctrl(ctx, EVP_CTRL_GCM_SET_IVLEN, (int)NONCE_LEN, nullptr) != 1) break;
        if (EVP_EncryptInit_ex(ctx, nullptr, nullptr, key.data(), out.data()) != 1) break;
        if (!aad.empty() &&
            EVP_EncryptUpdate(ctx, nullptr, &len, aad.data(), (int)aad.size()) != 1) break;

        u8* ct = out.data() + NONCE_LEN;
        int ct_len = 0;
        if (!plaintext.empty()) {
            if (EVP_EncryptUpdate(ctx, ct, &len, plaintext.data(), (int)plaintext.size()) != 1) break;
            ct_len = len;
        }
        if (EVP_EncryptFinal_ex(ctx, ct + ct_len, &len) != 1) break;
        ct_len += len;
        if ((size_t)ct_len != plaintext.size()) break;

        if (EVP_CIPHER_CTX_ctrl(ctx, EVP_CTRL_GCM_GET_TAG, (int)TAG_LEN,
                                out.data() + NONCE_LEN + ct_len) != 1) break;
        success = true;
    } while (false);

    EVP_CIPHER_CTX_free(ctx);

    if (!success) {
        throw std::runtime_error("AES-256-GCM encryption failed");
    }
    return out;
}

bool open(const Key& key, const std::vector<u8>& sealed,
          const std::vector<u8>& aad, std::vector<u8>& plaintext) {
    if (sealed.size() < NONCE_LEN + TAG_LEN) return false;

    const u8* nonce = sealed.data();
    const u8* ct    = sealed.data() + NONCE_LEN;
    size_t ct_size  = sealed.size() - NONCE_LEN - TAG_LEN;
    u8 tag[TAG_LEN];
    std::memcpy(tag, sealed.data() + NONCE_LEN + ct_size, TAG_LEN);

    EVP_CIPHER_CTX* ctx = EVP_CIPHER_CTX_new();
    if (!ctx) {
        throw std::runtime_error("EVP_CIPHER_CTX_new failed");
    }

    std::vector<u8> out(ct_size);
    bool success = false;
    do {
        int len = 0;
        if (EVP_DecryptInit_ex(ctx, EVP_aes_256_gcm(), nullptr, nullptr, nullptr) != 1) break;
        if (EVP_CIPHER_CTX_ctrl(ctx, EVP_CTRL_GCM_SET_IVLEN, (int)NONCE_LEN, nullptr) != 1) break;
        if (EVP_DecryptInit_ex(ctx, nullptr, nullptr, key.data(), nonce) != 1) break;
        if (!aad.empty() &&
            EVP_DecryptUpdate(ctx, nullptr, &len, aad.data(), (int)aad.size()) != 1) break;

        int pt_len = 0;
        if (ct_size > 0) {
            if (EVP_DecryptUpdate(ctx, out.data(), &len, ct, (int)ct_size) != 1) break;
            pt_len = len;
        }
        if (EVP_CIPHER_CTX_ctrl(ctx, EVP_CTRL_GCM_SET_TAG, (int)TAG_LEN, tag) != 1) break;
        // Final fails when the tag does not verify
        if (EVP_DecryptFinal_ex(ctx, out.data() + pt_len, &len) != 1) break;
        pt_len += len;
        out.resize((size_t)pt_len);
        success = true;
    } while (false);

    EVP_CIPHER_CTX_free(ctx);

    if (!success) {
        wipe(out.data(), out.size());
        return false;
    }
    plaintext = std::move(out);
    return true;
}

void wipe(void* p, size_t len) {
    if (p && len > 0) OPENSSL_cleanse(p, len);
}

} // namespace crypto
