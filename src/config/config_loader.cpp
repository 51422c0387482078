#include "config/config_loader.hpp"
#include "core/utils.hpp"

#include <toml++/toml.hpp>

#include <cstdlib>
#include <format>
#include <stdexcept>
#include <unordered_map>
#include <unordered_set>

using namespace std::string_literals;

namespace llmshield {

namespace {

// ============================================================================
// TOML Parsing Helpers
// ============================================================================

/**
 * @brief Expand ${VAR_NAME} patterns in a string with environment variables.
 */
std::string expand_env_vars(const std::string& input) {
    if (input.find("${") == std::string::npos) return input;

    std::string result;
    result.reserve(input.size());
    size_t i = 0;
    while (i < input.size()) {
        if (i + 1 < input.size() && input[i] == '$' && input[i + 1] == '{') {
            const size_t close = input.find('}', i + 2);
            if (close == std::string::npos) {
                throw std::runtime_error(
                    std::format("Unclosed env var substitution at position {}", i));
            }
            const std::string var_name = input.substr(i + 2, close - i - 2);
            const char* env_val = std::getenv(var_name.c_str());
            if (env_val) result += env_val;
            i = close + 1;
        } else {
            result += input[i++];
        }
    }
    return result;
}

void expand_env_vars_in_array(toml::array& arr);

void expand_env_vars_recursive(toml::table& tbl) {
    for (auto& [key, val] : tbl) {
        if (val.is_string()) {
            auto& s = *val.as_string();
            s = expand_env_vars(s.get());
        } else if (val.is_table()) {
            expand_env_vars_recursive(*val.as_table());
        } else if (val.is_array()) {
            expand_env_vars_in_array(*val.as_array());
        }
    }
}

void expand_env_vars_in_array(toml::array& arr) {
    for (auto& elem : arr) {
        if (elem.is_string()) {
            auto& s = *elem.as_string();
            s = expand_env_vars(s.get());
        } else if (elem.is_table()) {
            expand_env_vars_recursive(*elem.as_table());
        } else if (elem.is_array()) {
            expand_env_vars_in_array(*elem.as_array());
        }
    }
}

std::vector<std::string> toml_string_array(const toml::table& tbl, const std::string_view key) {
    std::vector<std::string> result;
    if (const auto* arr = tbl[key].as_array()) {
        result.reserve(arr->size());
        for (const auto& elem : *arr) {
            if (const auto* s = elem.as_string()) {
                result.emplace_back(s->get());
            }
        }
    }
    return result;
}

// ---- Section extraction ----------------------------------------------------

void extract_vault(const toml::table& root, ShieldConfig& config) {
    const auto* sec = root["vault"].as_table();
    if (!sec) return;
    const auto& v = *sec;

    config.root_secret.source  = v["root_secret_source"].value_or(config.root_secret.source);
    config.root_secret.env_var = v["root_secret_env"].value_or(config.root_secret.env_var);
    config.root_secret.file    = v["root_secret_file"].value_or(config.root_secret.file);
    config.root_secret.value   = v["root_secret"].value_or(config.root_secret.value);

    config.vault.pepper            = v["pepper"].value_or(config.vault.pepper);
    config.vault.kdf_iterations    = static_cast<int>(v["kdf_iterations"].value_or(
                                         static_cast<int64_t>(config.vault.kdf_iterations)));
    config.vault.context_namespace = v["context_namespace"].value_or(config.vault.context_namespace);
    config.vault.min_root_secret_length = static_cast<size_t>(v["min_root_secret_length"].value_or(
                                         static_cast<int64_t>(config.vault.min_root_secret_length)));
    config.rotation_reminder_days  = static_cast<int>(v["rotation_reminder_days"].value_or(
                                         static_cast<int64_t>(config.rotation_reminder_days)));
}

void extract_prompt(const toml::table& root, PromptGuard::Config& cfg) {
    const auto* sec = root["prompt"].as_table();
    if (!sec) return;
    const auto& p = *sec;

    cfg.injection_detection    = p["injection_detection"].value_or(cfg.injection_detection);
    cfg.block_on_injection     = p["block_on_injection"].value_or(cfg.block_on_injection);
    cfg.log_suspicious_prompts = p["log_suspicious_prompts"].value_or(cfg.log_suspicious_prompts);
    cfg.max_prompt_length      = static_cast<size_t>(p["max_prompt_length"].value_or(
                                     static_cast<int64_t>(cfg.max_prompt_length)));
    cfg.pii_detection          = p["pii_detection"].value_or(cfg.pii_detection);

    const std::string mask = p["mask_char"].value_or(std::string(1, cfg.mask_char));
    if (!mask.empty()) cfg.mask_char = mask.front();
}

void extract_response(const toml::table& root, ResponseGuard::Config& cfg) {
    const auto* sec = root["response"].as_table();
    if (!sec) return;
    const auto& r = *sec;

    cfg.allow_html          = r["allow_html"].value_or(cfg.allow_html);
    cfg.allow_markdown      = r["allow_markdown"].value_or(cfg.allow_markdown);
    cfg.allow_links         = r["allow_links"].value_or(cfg.allow_links);
    cfg.validate_urls       = r["validate_urls"].value_or(cfg.validate_urls);
    cfg.strip_scripts       = r["strip_scripts"].value_or(cfg.strip_scripts);
    cfg.isolate_code_blocks = r["isolate_code_blocks"].value_or(cfg.isolate_code_blocks);
    cfg.max_response_length = static_cast<size_t>(r["max_response_length"].value_or(
                                  static_cast<int64_t>(cfg.max_response_length)));
    cfg.site_host           = r["site_host"].value_or(cfg.site_host);
}

void extract_audit(const toml::table& root, ShieldConfig& config) {
    const auto* sec = root["audit"].as_table();
    if (!sec) return;
    const auto& a = *sec;

    config.audit.retention_days = static_cast<int>(a["retention_days"].value_or(
                                      static_cast<int64_t>(config.audit.retention_days)));
    config.audit.anonymize_after_days = static_cast<int>(a["anonymize_after_days"].value_or(
                                      static_cast<int64_t>(config.audit.anonymize_after_days)));
    config.fallback_journal = a["fallback_journal"].value_or(config.fallback_journal);
}

void extract_quotas(const toml::table& root, QuotaLimits& limits) {
    const auto* sec = root["quotas"].as_table();
    if (!sec) return;
    const auto& q = *sec;

    limits.requests_per_hour  = q["requests_per_hour"].value_or(limits.requests_per_hour);
    limits.requests_per_day   = q["requests_per_day"].value_or(limits.requests_per_day);
    limits.tokens_per_hour    = q["tokens_per_hour"].value_or(limits.tokens_per_hour);
    limits.tokens_per_day     = q["tokens_per_day"].value_or(limits.tokens_per_day);
    limits.monthly_cost_limit = q["monthly_cost_limit"].value_or(limits.monthly_cost_limit);
}

void extract_storage(const toml::table& root, StorageConfig& cfg) {
    const auto* sec = root["storage"].as_table();
    if (!sec) return;
    cfg.backend           = (*sec)["backend"].value_or(cfg.backend);
    cfg.connection_string = (*sec)["connection_string"].value_or(cfg.connection_string);
}

void extract_logging(const toml::table& root, LoggingConfig& cfg) {
    const auto* sec = root["logging"].as_table();
    if (!sec) return;
    cfg.level = (*sec)["level"].value_or(cfg.level);
}

std::vector<UserConfig> extract_users(const toml::table& root) {
    std::vector<UserConfig> result;
    const auto* arr = root["users"].as_array();
    if (!arr) return result;

    for (const auto& elem : *arr) {
        const auto* u = elem.as_table();
        if (!u) continue;

        UserConfig user;
        user.id = (*u)["id"].value_or(""s);
        user.name = (*u)["name"].value_or(user.id);
        user.admin = (*u)["admin"].value_or(false);
        user.grants = toml_string_array(*u, "grants");
        user.groups = toml_string_array(*u, "groups");
        user.scopes = toml_string_array(*u, "scopes");
        result.push_back(std::move(user));
    }
    return result;
}

std::vector<GroupConfig> extract_groups(const toml::table& root) {
    std::vector<GroupConfig> result;
    const auto* arr = root["groups"].as_array();
    if (!arr) return result;

    for (const auto& elem : *arr) {
        const auto* g = elem.as_table();
        if (!g) continue;
        GroupConfig group;
        group.id = (*g)["id"].value_or(""s);
        group.grants = toml_string_array(*g, "grants");
        result.push_back(std::move(group));
    }
    return result;
}

ShieldConfig extract_all_sections(const toml::table& tbl) {
    ShieldConfig config;
    extract_vault(tbl, config);
    extract_prompt(tbl, config.prompt);
    extract_response(tbl, config.response);
    extract_audit(tbl, config);
    extract_quotas(tbl, config.quotas.defaults);
    extract_storage(tbl, config.storage);
    extract_logging(tbl, config.logging);
    config.users = extract_users(tbl);
    config.groups = extract_groups(tbl);
    return config;
}

ConfigLoader::LoadResult validate_and_return(ShieldConfig config) {
    const auto errors = ConfigLoader::validate_config(config);
    if (!errors.empty()) {
        std::string combined = "Config validation failed:";
        for (const auto& err : errors) { combined += "\n  - "; combined += err; }
        return ConfigLoader::LoadResult::error(std::move(combined));
    }
    return ConfigLoader::LoadResult::ok(std::move(config));
}

} // anonymous namespace

// ---- Public API ------------------------------------------------------------

ConfigLoader::LoadResult ConfigLoader::load_from_file(const std::string& config_path) {
    try {
        auto tbl = toml::parse_file(config_path);
        expand_env_vars_recursive(tbl);
        return validate_and_return(extract_all_sections(tbl));
    } catch (const std::exception& e) {
        return LoadResult::error(std::format("Failed to load config: {}", e.what()));
    }
}

ConfigLoader::LoadResult ConfigLoader::load_from_string(const std::string& toml_content) {
    try {
        auto tbl = toml::parse(toml_content);
        expand_env_vars_recursive(tbl);
        return validate_and_return(extract_all_sections(tbl));
    } catch (const std::exception& e) {
        return LoadResult::error(std::format("Failed to parse config: {}", e.what()));
    }
}

// ============================================================================
// Config Validation
// ============================================================================

std::vector<std::string> ConfigLoader::validate_config(const ShieldConfig& config) {
    std::vector<std::string> errors;

    // ---- Vault ----
    const auto& rs = config.root_secret;
    if (rs.source != "env" && rs.source != "file" && rs.source != "inline") {
        errors.push_back(std::format(
            "vault.root_secret_source '{}' must be one of env, file, inline", rs.source));
    }
    if (rs.source == "env" && rs.env_var.empty()) {
        errors.push_back("vault.root_secret_env must be set when root_secret_source = \"env\"");
    }
    if (rs.source == "file" && rs.file.empty()) {
        errors.push_back("vault.root_secret_file must be set when root_secret_source = \"file\"");
    }
    if (rs.source == "inline" && rs.value.empty()) {
        errors.push_back("vault.root_secret must be set when root_secret_source = \"inline\"");
    }
    if (config.vault.pepper.empty()) {
        errors.push_back("vault.pepper must not be empty");
    }
    if (config.vault.kdf_iterations < KeyDerivation::kMinIterations) {
        errors.push_back(std::format("vault.kdf_iterations must be at least {} (got {})",
                                     KeyDerivation::kMinIterations, config.vault.kdf_iterations));
    }
    if (config.vault.context_namespace.empty()) {
        errors.push_back("vault.context_namespace must not be empty");
    }
    if (config.rotation_reminder_days < 1) {
        errors.push_back("vault.rotation_reminder_days must be positive");
    }

    // ---- Guards ----
    if (config.prompt.max_prompt_length == 0) {
        errors.push_back("prompt.max_prompt_length must be positive");
    }
    if (config.response.max_response_length == 0) {
        errors.push_back("response.max_response_length must be positive");
    }

    // ---- Audit ----
    if (config.audit.anonymize_after_days < 1) {
        errors.push_back("audit.anonymize_after_days must be at least 1");
    }
    if (config.audit.retention_days < config.audit.anonymize_after_days) {
        errors.push_back(std::format(
            "audit.retention_days ({}) must be >= audit.anonymize_after_days ({})",
            config.audit.retention_days, config.audit.anonymize_after_days));
    }

    // ---- Quotas ----
    const auto& q = config.quotas.defaults;
    if (q.requests_per_hour < 0 || q.requests_per_day < 0 ||
        q.tokens_per_hour < 0 || q.tokens_per_day < 0 || q.monthly_cost_limit < 0) {
        errors.push_back("quotas must not be negative (0 = unlimited)");
    }

    // ---- Storage / logging ----
    if (config.storage.backend != "memory" && config.storage.backend != "postgresql") {
        errors.push_back(std::format(
            "storage.backend '{}' must be memory or postgresql", config.storage.backend));
    }
    if (config.storage.backend == "postgresql" && config.storage.connection_string.empty()) {
        errors.push_back("storage.connection_string is required for the postgresql backend");
    }
    if (!utils::log::parse_level(config.logging.level)) {
        errors.push_back(std::format(
            "logging.level '{}' must be info, warn or error", config.logging.level));
    }

    // ---- Identities ----
    std::unordered_set<std::string> group_ids;
    for (const auto& group : config.groups) {
        if (group.id.empty()) {
            errors.push_back("groups entry is missing an id");
            continue;
        }
        if (!group_ids.insert(group.id).second) {
            errors.push_back(std::format("duplicate group id '{}'", group.id));
        }
        for (const auto& grant : group.grants) {
            if (!parse_capability(grant)) {
                errors.push_back(std::format("group '{}': unknown capability '{}'", group.id, grant));
            }
        }
    }

    std::unordered_set<std::string> user_ids;
    for (const auto& user : config.users) {
        if (user.id.empty()) {
            errors.push_back("users entry is missing an id");
            continue;
        }
        if (!user_ids.insert(user.id).second) {
            errors.push_back(std::format("duplicate user id '{}'", user.id));
        }
        for (const auto& grant : user.grants) {
            if (!parse_capability(grant)) {
                errors.push_back(std::format("user '{}': unknown capability '{}'", user.id, grant));
            }
        }
        for (const auto& group : user.groups) {
            if (!group_ids.contains(group)) {
                errors.push_back(std::format("user '{}': unknown group '{}'", user.id, group));
            }
        }
    }

    return errors;
}

std::vector<Actor> ConfigLoader::build_actors(const ShieldConfig& config) {
    std::unordered_map<std::string, ActorGroup> groups;
    for (const auto& g : config.groups) {
        ActorGroup group;
        group.id = g.id;
        for (const auto& grant : g.grants) {
            if (const auto cap = parse_capability(grant)) group.grants.insert(*cap);
        }
        groups.insert_or_assign(g.id, std::move(group));
    }

    std::vector<Actor> actors;
    actors.reserve(config.users.size());
    for (const auto& u : config.users) {
        Actor actor(u.id, u.name);
        actor.is_admin = u.admin;
        for (const auto& grant : u.grants) {
            if (const auto cap = parse_capability(grant)) actor.grants.insert(*cap);
        }
        for (const auto& gid : u.groups) {
            if (const auto it = groups.find(gid); it != groups.end()) {
                actor.groups.push_back(it->second);
            }
        }
        actor.scopes.insert(u.scopes.begin(), u.scopes.end());
        actors.push_back(std::move(actor));
    }
    return actors;
}

} // namespace llmshield
