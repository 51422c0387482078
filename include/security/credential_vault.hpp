#pragma once

#include "audit/audit_trail.hpp"
#include "core/clock.hpp"
#include "core/json.hpp"
#include "core/secure_buffer.hpp"
#include "security/credential_validator.hpp"
#include "security/isecret_store.hpp"
#include "security/key_derivation.hpp"
#include "security/root_secret_source.hpp"

#include <memory>
#include <optional>
#include <string>
#include <string_view>
#include <vector>

namespace llmshield {

/**
 * @brief Encrypted-at-rest storage for LLM provider API keys
 *
 * Each (provider, scope) secret is sealed with AES-256-GCM under a key
 * derived on demand from the root secret, the pepper and the context
 * string "{namespace}:{provider}:{scope}". The same context is the AAD,
 * so a row copied under another (provider, scope) fails authentication.
 *
 * Derived keys and decrypted plaintext live in SecureBytes/SecureString
 * and are wiped when the call returns.
 *
 * Every access, creation, rotation and deletion is written to the
 * AuditTrail. Integrity failures are audited at error severity before
 * DecryptionIntegrityError propagates.
 */
class CredentialVault {
public:
    struct Config {
        std::string context_namespace = "llmshield";
        std::string pepper;
        int kdf_iterations = KeyDerivation::kMinIterations;
        size_t min_root_secret_length = 96;
    };

    /**
     * @throws ConfigurationValidationError on a short root secret, empty pepper,
     *         or too few KDF iterations
     */
    CredentialVault(Config config,
                    std::shared_ptr<IRootSecretSource> root_secret,
                    std::shared_ptr<ISecretStore> store,
                    std::shared_ptr<AuditTrail> audit,
                    std::shared_ptr<IClock> clock = nullptr);

    /**
     * @brief Encrypt and store a secret. Replaces (and audits as a rotation)
     *        an existing live secret for the same pair.
     * @throws InvalidCredentialFormat when the secret fails the provider check
     */
    void store(const std::string& provider, const std::string& scope,
               std::string_view secret, JsonValue metadata = JsonValue::object());

    /**
     * @return plaintext, or nullopt if no live secret exists
     * @throws DecryptionIntegrityError on tampering, wrong key or corruption
     */
    [[nodiscard]] std::optional<SecureString> retrieve(const std::string& provider,
                                                       const std::string& scope);

    /**
     * @brief Replace the ciphertext of an existing secret in one update
     * @throws NotFound if there is no live secret for the pair
     * @throws InvalidCredentialFormat when the new secret fails the provider check
     */
    void rotate(const std::string& provider, const std::string& scope,
                std::string_view new_secret);

    /// Soft delete. False if nothing was live.
    bool remove(const std::string& provider, const std::string& scope);

    [[nodiscard]] std::vector<SecretInfo> list(
        const std::optional<std::string>& scope = std::nullopt) const;

    [[nodiscard]] bool exists(const std::string& provider, const std::string& scope) const;

    [[nodiscard]] bool validate(std::string_view provider, std::string_view secret) const;

    /// Live secrets whose last rotation is older than max_age_days.
    [[nodiscard]] std::vector<SecretInfo> due_for_rotation(int max_age_days) const;

    [[nodiscard]] std::string context_for(std::string_view provider, std::string_view scope) const;

private:
    void seal_into(EncryptedSecret& row, std::string_view secret) const;
    void require_valid_format(const std::string& provider, const std::string& scope,
                              std::string_view secret) const;

    Config config_;
    SecureString root_secret_;
    KeyDerivation kdf_;
    CredentialValidator validator_;
    std::shared_ptr<ISecretStore> store_;
    std::shared_ptr<AuditTrail> audit_;
    std::shared_ptr<IClock> clock_;
};

} // namespace llmshield
