#include "security/key_derivation.hpp"
#include "core/error.hpp"

#include <openssl/crypto.h>
#include <openssl/evp.h>
#include <openssl/sha.h>

#include <algorithm>
#include <format>
#include <stdexcept>

namespace llmshield {

KeyDerivation::KeyDerivation(std::string pepper, int iterations)
    : pepper_(std::move(pepper)), iterations_(iterations) {
    if (pepper_.empty()) {
        throw ConfigurationValidationError("vault.pepper must not be empty");
    }
    if (iterations_ < kMinIterations) {
        throw ConfigurationValidationError(std::format(
            "vault.kdf_iterations must be >= {}, got {}", kMinIterations, iterations_));
    }
}

KeyDerivation::~KeyDerivation() {
    OPENSSL_cleanse(pepper_.data(), pepper_.size());
}

SecureBytes KeyDerivation::derive(std::string_view root_secret, std::string_view context) const {
    SecureBytes salt_input(pepper_.size() + context.size());
    std::copy(pepper_.begin(), pepper_.end(), salt_input.data());
    std::copy(context.begin(), context.end(), salt_input.data() + pepper_.size());

    unsigned char salt[SHA256_DIGEST_LENGTH];
    SHA256(salt_input.data(), salt_input.size(), salt);

    SecureBytes key(kKeyLen);
    const int ok = PKCS5_PBKDF2_HMAC(
        root_secret.data(), static_cast<int>(root_secret.size()),
        salt, sizeof(salt),
        iterations_, EVP_sha256(),
        static_cast<int>(key.size()), key.data());
    OPENSSL_cleanse(salt, sizeof(salt));

    if (ok != 1) {
        throw std::runtime_error("PBKDF2 key derivation failed");
    }
    return key;
}

std::string KeyDerivation::build_context(std::string_view ns,
                                         std::string_view provider,
                                         std::string_view scope) {
    return std::format("{}:{}:{}", ns, provider, scope);
}

} // namespace llmshield
