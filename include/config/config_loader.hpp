#pragma once

#include "audit/audit_trail.hpp"
#include "auth/iidentity_provider.hpp"
#include "content/prompt_guard.hpp"
#include "content/response_guard.hpp"
#include "security/access_governor.hpp"
#include "security/credential_vault.hpp"
#include "security/root_secret_source.hpp"

#include <string>
#include <vector>

namespace llmshield {

// ============================================================================
// Config sections (mirror the TOML hierarchy)
// ============================================================================

struct StorageConfig {
    std::string backend = "memory";     // memory | postgresql
    std::string connection_string;
};

struct LoggingConfig {
    std::string level = "info";         // info | warn | error
};

struct UserConfig {
    std::string id;
    std::string name;
    bool admin = false;
    std::vector<std::string> grants;
    std::vector<std::string> groups;
    std::vector<std::string> scopes;
};

struct GroupConfig {
    std::string id;
    std::vector<std::string> grants;
};

struct ShieldConfig {
    RootSecretConfig root_secret;
    CredentialVault::Config vault;
    int rotation_reminder_days = 90;

    PromptGuard::Config prompt;
    ResponseGuard::Config response;

    AuditTrail::Config audit;
    std::string fallback_journal;       // empty: fall back to the log only

    AccessGovernor::Config quotas;

    StorageConfig storage;
    LoggingConfig logging;

    std::vector<UserConfig> users;
    std::vector<GroupConfig> groups;
};

// ============================================================================
// Config Loader
// ============================================================================

/**
 * @brief Loads llmshield.toml into a validated ShieldConfig
 *
 * String values may reference the environment as ${VAR}. Validation
 * collects every problem before failing.
 */
class ConfigLoader {
public:
    struct LoadResult {
        bool success;
        std::string error_message;
        ShieldConfig config;

        static LoadResult ok(ShieldConfig cfg) {
            LoadResult result;
            result.success = true;
            result.config = std::move(cfg);
            return result;
        }

        static LoadResult error(std::string message) {
            LoadResult result;
            result.success = false;
            result.error_message = std::move(message);
            return result;
        }
    };

    [[nodiscard]] static LoadResult load_from_file(const std::string& config_path);
    [[nodiscard]] static LoadResult load_from_string(const std::string& toml_content);

    /// One message per problem; empty when the config is usable.
    [[nodiscard]] static std::vector<std::string> validate_config(const ShieldConfig& config);

    /// Resolves [[users]] against [[groups]] into identity-provider actors.
    [[nodiscard]] static std::vector<Actor> build_actors(const ShieldConfig& config);
};

} // namespace llmshield
