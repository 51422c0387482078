#pragma once

#include "core/secure_buffer.hpp"

#include <cstddef>
#include <string>
#include <string_view>

namespace llmshield {

/**
 * @brief PBKDF2-HMAC-SHA256 key derivation bound to a (provider, scope) context
 *
 *   context = "{namespace}:{provider}:{scope}"
 *   salt    = SHA-256(pepper || context)
 *   key     = PBKDF2-HMAC-SHA256(root_secret, salt, iterations, 32)
 *
 * Deterministic: the same inputs always yield the same key, so nothing
 * about the key itself is ever stored.
 */
class KeyDerivation {
public:
    static constexpr size_t kKeyLen = 32;
    static constexpr int kMinIterations = 100000;

    /**
     * @throws ConfigurationValidationError if iterations < kMinIterations or pepper is empty
     */
    KeyDerivation(std::string pepper, int iterations);
    ~KeyDerivation();

    KeyDerivation(const KeyDerivation&) = delete;
    KeyDerivation& operator=(const KeyDerivation&) = delete;

    [[nodiscard]] SecureBytes derive(std::string_view root_secret, std::string_view context) const;

    [[nodiscard]] static std::string build_context(std::string_view ns,
                                                   std::string_view provider,
                                                   std::string_view scope);

    [[nodiscard]] int iterations() const { return iterations_; }

private:
    std::string pepper_;
    int iterations_;
};

} // namespace llmshield
