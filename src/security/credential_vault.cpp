#include "security/credential_vault.hpp"
#include "core/error.hpp"
#include "core/utils.hpp"
#include "security/aead_cipher.hpp"

#include <openssl/crypto.h>

#include <format>
#include <stdexcept>

namespace llmshield {

namespace {

AeadCipher::Sealed to_sealed(const EncryptedSecret& row) {
    return AeadCipher::Sealed{row.ciphertext, row.iv, row.tag};
}

} // anonymous namespace

CredentialVault::CredentialVault(Config config,
                                 std::shared_ptr<IRootSecretSource> root_secret,
                                 std::shared_ptr<ISecretStore> store,
                                 std::shared_ptr<AuditTrail> audit,
                                 std::shared_ptr<IClock> clock)
    : config_(std::move(config)),
      root_secret_(root_secret ? root_secret->load()
                               : throw std::invalid_argument("CredentialVault requires a root secret source")),
      kdf_(config_.pepper, config_.kdf_iterations),
      store_(std::move(store)),
      audit_(std::move(audit)),
      clock_(clock ? std::move(clock) : std::make_shared<SystemClock>()) {
    if (!store_ || !audit_) {
        throw std::invalid_argument("CredentialVault requires a secret store and an audit trail");
    }
    if (root_secret_.size() < config_.min_root_secret_length) {
        throw ConfigurationValidationError(std::format(
            "Root secret from {} is {} characters; at least {} required",
            root_secret->name(), root_secret_.size(), config_.min_root_secret_length));
    }
    if (config_.context_namespace.empty()) {
        throw ConfigurationValidationError("vault.context_namespace must not be empty");
    }
    // kdf_ holds its own copy
    OPENSSL_cleanse(config_.pepper.data(), config_.pepper.size());
    config_.pepper.clear();

    utils::log::info(std::format("CredentialVault: store={}, root secret from {}, {} KDF iterations",
        store_->name(), root_secret->name(), kdf_.iterations()));
}

// ============================================================================
// Public API
// ============================================================================

void CredentialVault::store(const std::string& provider, const std::string& scope,
                            std::string_view secret, JsonValue metadata) {
    require_valid_format(provider, scope, secret);

    const auto now = clock_->now();
    EncryptedSecret row;
    row.provider = provider;
    row.scope = scope;
    row.metadata = metadata.is_object() ? std::move(metadata) : JsonValue::object();
    row.last_rotated_at = now;
    row.created_at = now;
    row.updated_at = now;
    seal_into(row, secret);

    try {
        if (store_->insert(row)) {
            audit_->log_key_creation(provider, scope);
            return;
        }
        // A live row exists (or appeared concurrently): overwrite in place
        if (store_->replace(row)) {
            audit_->log_key_rotation(provider, scope);
            return;
        }
    } catch (const StorageUnavailable& e) {
        audit_->log_key_access_attempt(provider, scope, false,
            std::format("store failed: {}", e.what()), Severity::ERROR);
        throw;
    }
    throw StorageUnavailable(std::format(
        "Secret store '{}' accepted neither insert nor update for {}/{}",
        store_->name(), provider, scope));
}

std::optional<SecureString> CredentialVault::retrieve(const std::string& provider,
                                                      const std::string& scope) {
    std::optional<EncryptedSecret> row;
    try {
        row = store_->find(provider, scope);
    } catch (const StorageUnavailable& e) {
        audit_->log_key_access_attempt(provider, scope, false,
            std::format("storage unavailable: {}", e.what()), Severity::ERROR);
        throw;
    }

    if (!row) {
        audit_->log_key_access_attempt(provider, scope, false, "not_found");
        return std::nullopt;
    }

    const std::string context = context_for(provider, scope);
    try {
        const SecureBytes key = kdf_.derive(root_secret_.view(), context);
        SecureString plaintext = AeadCipher::decrypt(key, to_sealed(*row), context);
        audit_->log_key_access(provider, scope);
        return plaintext;
    } catch (const DecryptionIntegrityError& e) {
        audit_->log_key_access_attempt(provider, scope, false,
            std::format("integrity check failed: {}", e.what()), Severity::ERROR);
        throw DecryptionIntegrityError(std::format(
            "Stored secret for {}/{} failed authentication", provider, scope));
    }
}

void CredentialVault::rotate(const std::string& provider, const std::string& scope,
                             std::string_view new_secret) {
    require_valid_format(provider, scope, new_secret);

    std::optional<EncryptedSecret> existing;
    try {
        existing = store_->find(provider, scope);
    } catch (const StorageUnavailable& e) {
        audit_->log_key_access_attempt(provider, scope, false,
            std::format("rotate failed: {}", e.what()), Severity::ERROR);
        throw;
    }
    if (!existing) {
        throw NotFound(std::format("No API key stored for {}/{}", provider, scope));
    }

    const auto now = clock_->now();
    EncryptedSecret row = std::move(*existing);
    row.metadata.set("previous_rotation", utils::format_timestamp(row.last_rotated_at));
    row.last_rotated_at = now;
    row.updated_at = now;
    seal_into(row, new_secret);

    bool replaced = false;
    try {
        replaced = store_->replace(row);
    } catch (const StorageUnavailable& e) {
        audit_->log_key_access_attempt(provider, scope, false,
            std::format("rotate failed: {}", e.what()), Severity::ERROR);
        throw;
    }
    if (!replaced) {
        // Deleted between find and replace
        throw NotFound(std::format("No API key stored for {}/{}", provider, scope));
    }
    audit_->log_key_rotation(provider, scope);
}

bool CredentialVault::remove(const std::string& provider, const std::string& scope) {
    bool deleted = false;
    try {
        deleted = store_->soft_delete(provider, scope, clock_->now());
    } catch (const StorageUnavailable& e) {
        audit_->log_key_access_attempt(provider, scope, false,
            std::format("delete failed: {}", e.what()), Severity::ERROR);
        throw;
    }
    if (deleted) {
        audit_->log_key_deletion(provider, scope);
    }
    return deleted;
}

std::vector<SecretInfo> CredentialVault::list(const std::optional<std::string>& scope) const {
    std::vector<SecretInfo> result;
    for (const auto& row : store_->list(scope)) {
        result.emplace_back(row);
    }
    return result;
}

bool CredentialVault::exists(const std::string& provider, const std::string& scope) const {
    return store_->find(provider, scope).has_value();
}

bool CredentialVault::validate(std::string_view provider, std::string_view secret) const {
    return validator_.is_valid(provider, secret);
}

std::vector<SecretInfo> CredentialVault::due_for_rotation(int max_age_days) const {
    const auto threshold = clock_->now() - std::chrono::days(max_age_days);
    std::vector<SecretInfo> result;
    for (const auto& row : store_->list(std::nullopt)) {
        if (row.last_rotated_at < threshold) {
            result.emplace_back(row);
        }
    }
    return result;
}

std::string CredentialVault::context_for(std::string_view provider, std::string_view scope) const {
    return KeyDerivation::build_context(config_.context_namespace, provider, scope);
}

// ============================================================================
// Internals
// ============================================================================

void CredentialVault::seal_into(EncryptedSecret& row, std::string_view secret) const {
    const std::string context = context_for(row.provider, row.scope);
    const SecureBytes key = kdf_.derive(root_secret_.view(), context);
    auto sealed = AeadCipher::encrypt(key, secret, context);
    row.ciphertext = std::move(sealed.ciphertext);
    row.iv = std::move(sealed.iv);
    row.tag = std::move(sealed.tag);
}

void CredentialVault::require_valid_format(const std::string& provider, const std::string& scope,
                                           std::string_view secret) const {
    if (provider.empty() || scope.empty()) {
        throw InvalidCredentialFormat("Provider and scope must not be empty");
    }
    if (!validator_.is_valid(provider, secret)) {
        throw InvalidCredentialFormat(std::format(
            "API key for {}/{} does not match the expected format", provider, scope));
    }
}

} // namespace llmshield
