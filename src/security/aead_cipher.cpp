#include "security/aead_cipher.hpp"
#include "core/error.hpp"

#include <openssl/evp.h>
#include <openssl/rand.h>

#include <format>
#include <memory>
#include <stdexcept>

namespace llmshield {

namespace {

using CipherCtx = std::unique_ptr<EVP_CIPHER_CTX, decltype(&EVP_CIPHER_CTX_free)>;

CipherCtx new_ctx() {
    CipherCtx ctx(EVP_CIPHER_CTX_new(), &EVP_CIPHER_CTX_free);
    if (!ctx) {
        throw std::runtime_error("EVP_CIPHER_CTX_new failed");
    }
    return ctx;
}

const unsigned char* as_bytes(std::string_view s) {
    return reinterpret_cast<const unsigned char*>(s.data());
}

} // anonymous namespace

AeadCipher::Sealed AeadCipher::encrypt(const SecureBytes& key,
                                       std::string_view plaintext,
                                       std::string_view aad) {
    if (key.size() != kKeyLen) {
        throw std::invalid_argument(std::format("AES-256-GCM key must be {} bytes, got {}",
                                                kKeyLen, key.size()));
    }

    Sealed out;
    out.iv.resize(kIvLen);
    out.tag.resize(kTagLen);
    out.ciphertext.resize(plaintext.size() + EVP_MAX_BLOCK_LENGTH);

    if (RAND_bytes(out.iv.data(), static_cast<int>(kIvLen)) != 1) {
        throw std::runtime_error("RAND_bytes failed to produce a nonce");
    }

    auto ctx = new_ctx();
    int len = 0;
    int total = 0;

    if (EVP_EncryptInit_ex(ctx.get(), EVP_aes_256_gcm(), nullptr, nullptr, nullptr) != 1 ||
        EVP_CIPHER_CTX_ctrl(ctx.get(), EVP_CTRL_GCM_SET_IVLEN, static_cast<int>(kIvLen), nullptr) != 1 ||
        EVP_EncryptInit_ex(ctx.get(), nullptr, nullptr, key.data(), out.iv.data()) != 1) {
        throw std::runtime_error("AES-256-GCM encrypt init failed");
    }

    // AAD: null output buffer
    if (!aad.empty() &&
        EVP_EncryptUpdate(ctx.get(), nullptr, &len, as_bytes(aad), static_cast<int>(aad.size())) != 1) {
        throw std::runtime_error("AES-256-GCM AAD update failed");
    }

    if (EVP_EncryptUpdate(ctx.get(), out.ciphertext.data(), &len,
                          as_bytes(plaintext), static_cast<int>(plaintext.size())) != 1) {
        throw std::runtime_error("AES-256-GCM encrypt update failed");
    }
    total = len;

    if (EVP_EncryptFinal_ex(ctx.get(), out.ciphertext.data() + total, &len) != 1) {
        throw std::runtime_error("AES-256-GCM encrypt final failed");
    }
    total += len;
    out.ciphertext.resize(static_cast<size_t>(total));

    if (EVP_CIPHER_CTX_ctrl(ctx.get(), EVP_CTRL_GCM_GET_TAG,
                            static_cast<int>(kTagLen), out.tag.data()) != 1) {
        throw std::runtime_error("AES-256-GCM tag extraction failed");
    }
    return out;
}

SecureString AeadCipher::decrypt(const SecureBytes& key,
                                 const Sealed& sealed,
                                 std::string_view aad) {
    if (key.size() != kKeyLen) {
        throw std::invalid_argument(std::format("AES-256-GCM key must be {} bytes, got {}",
                                                kKeyLen, key.size()));
    }
    if (sealed.iv.size() != kIvLen || sealed.tag.size() != kTagLen) {
        throw DecryptionIntegrityError("Stored nonce or authentication tag has the wrong length");
    }

    SecureBytes plaintext(sealed.ciphertext.size() + EVP_MAX_BLOCK_LENGTH);
    auto ctx = new_ctx();
    int len = 0;
    int total = 0;

    if (EVP_DecryptInit_ex(ctx.get(), EVP_aes_256_gcm(), nullptr, nullptr, nullptr) != 1 ||
        EVP_CIPHER_CTX_ctrl(ctx.get(), EVP_CTRL_GCM_SET_IVLEN, static_cast<int>(kIvLen), nullptr) != 1 ||
        EVP_DecryptInit_ex(ctx.get(), nullptr, nullptr, key.data(), sealed.iv.data()) != 1) {
        throw std::runtime_error("AES-256-GCM decrypt init failed");
    }

    if (!aad.empty() &&
        EVP_DecryptUpdate(ctx.get(), nullptr, &len, as_bytes(aad), static_cast<int>(aad.size())) != 1) {
        throw std::runtime_error("AES-256-GCM AAD update failed");
    }

    if (EVP_DecryptUpdate(ctx.get(), plaintext.data(), &len,
                          sealed.ciphertext.data(), static_cast<int>(sealed.ciphertext.size())) != 1) {
        throw DecryptionIntegrityError("Ciphertext rejected during decryption");
    }
    total = len;

    // OpenSSL takes a non-const pointer for SET_TAG but only reads it
    if (EVP_CIPHER_CTX_ctrl(ctx.get(), EVP_CTRL_GCM_SET_TAG, static_cast<int>(kTagLen),
                            const_cast<uint8_t*>(sealed.tag.data())) != 1) {
        throw std::runtime_error("AES-256-GCM tag setup failed");
    }

    if (EVP_DecryptFinal_ex(ctx.get(), plaintext.data() + total, &len) <= 0) {
        throw DecryptionIntegrityError("Authentication tag mismatch");
    }
    total += len;

    return SecureString(reinterpret_cast<const char*>(plaintext.data()), static_cast<size_t>(total));
}

} // namespace llmshield
