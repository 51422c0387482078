#include "config/config_loader.hpp"
#include "core/utils.hpp"
#include "audit/audit_trail.hpp"
#include "audit/file_sink.hpp"
#include "audit/memory_audit_store.hpp"
#include "auth/static_identity_provider.hpp"
#include "content/prompt_guard.hpp"
#include "content/response_guard.hpp"
#include "security/access_governor.hpp"
#include "security/credential_vault.hpp"
#include "security/memory_secret_store.hpp"
#include "security/quota_counter_store.hpp"
#include "security/quota_policy_store.hpp"
#include "usage/usage_ledger.hpp"

#ifdef ENABLE_POSTGRESQL
#include "db/postgresql/pg_audit_store.hpp"
#include "db/postgresql/pg_connection.hpp"
#include "db/postgresql/pg_quota_store.hpp"
#include "db/postgresql/pg_secret_store.hpp"
#include "db/postgresql/pg_usage_store.hpp"
#endif

#include <cstdlib>
#include <format>
#include <iostream>
#include <iterator>
#include <memory>
#include <optional>
#include <string>
#include <vector>

using namespace llmshield;

namespace {

constexpr int kExitOk = 0;
constexpr int kExitUsage = 1;
constexpr int kExitDenied = 2;

void print_usage() {
    std::cerr <<
        "Usage: llmshield [--config FILE] [--actor ID] <command> [args]\n"
        "\n"
        "Credentials:\n"
        "  store <provider> <scope>        read the secret from stdin\n"
        "  rotate <provider> <scope>       read the new secret from stdin\n"
        "  delete <provider> <scope>\n"
        "  exists <provider> <scope>\n"
        "  list [scope]\n"
        "  due-rotation [days]\n"
        "\n"
        "Audit:\n"
        "  audit [--type TYPE] [--actor-filter ID] [--min-severity LEVEL] [--limit N]\n"
        "  anonymize\n"
        "  cleanup\n"
        "  erase-actor <id>\n"
        "  usage [actor]\n"
        "\n"
        "Content:\n"
        "  check-prompt [--truncate] [--mask-pii]   prompt on stdin\n"
        "  check-system-prompt                      prompt on stdin\n"
        "  sanitize-response <html|markdown|plain>  response on stdin\n";
}

std::string read_stdin() {
    return std::string(std::istreambuf_iterator<char>(std::cin), std::istreambuf_iterator<char>());
}

// Reserved once so the secret is never copied by a reallocation. Secrets
// piped in usually end with a newline.
SecureString read_secret_stdin() {
    constexpr size_t kLimit = CredentialValidator::kMaxSecretLength;
    std::string raw;
    raw.reserve(kLimit + 2);

    char c;
    while (raw.size() < kLimit + 2 && std::cin.get(c)) raw.push_back(c);
    while (!raw.empty() && (raw.back() == '\n' || raw.back() == '\r')) raw.pop_back();

    if (raw.size() > kLimit || std::cin.peek() != std::char_traits<char>::eof()) {
        secure_wipe(raw);
        throw InvalidCredentialFormat(std::format(
            "Secret exceeds {} characters", kLimit));
    }
    return SecureString(std::move(raw));
}

std::optional<std::string> scope_arg(const std::string& scope) {
    if (scope == "global") return std::nullopt;
    return scope;
}

// ============================================================================
// Service wiring
// ============================================================================

struct Services {
    std::shared_ptr<StaticIdentityProvider> identity;
    std::shared_ptr<AuditTrail> audit;
    std::shared_ptr<CredentialVault> vault;
    std::shared_ptr<AccessGovernor> governor;
    std::shared_ptr<UsageLedger> usage;
    std::shared_ptr<PromptGuard> prompt_guard;
    std::shared_ptr<ResponseGuard> response_guard;
};

Services build_services(const ShieldConfig& cfg) {
    Services s;
    s.identity = std::make_shared<StaticIdentityProvider>(ConfigLoader::build_actors(cfg));

    std::shared_ptr<IAuditStore> audit_store;
    std::shared_ptr<ISecretStore> secret_store;
    std::shared_ptr<IUsageStore> usage_store;
    std::shared_ptr<IQuotaPolicyStore> policy_store;
    std::shared_ptr<IQuotaCounterStore> counter_store;

    if (cfg.storage.backend == "postgresql") {
#ifdef ENABLE_POSTGRESQL
        auto conn = PgConnection::connect(cfg.storage.connection_string);
        ensure_schema(*conn);
        audit_store = std::make_shared<PgAuditStore>(conn);
        secret_store = std::make_shared<PgSecretStore>(conn);
        usage_store = std::make_shared<PgUsageStore>(conn);
        policy_store = std::make_shared<PgQuotaPolicyStore>(conn);
        counter_store = std::make_shared<PgQuotaCounterStore>(conn);
        utils::log::info("Storage: postgresql");
#else
        throw ConfigurationValidationError(
            "storage.backend = \"postgresql\" but this build has no PostgreSQL support");
#endif
    } else {
        audit_store = std::make_shared<MemoryAuditStore>();
        secret_store = std::make_shared<MemorySecretStore>();
        usage_store = std::make_shared<MemoryUsageStore>();
        policy_store = std::make_shared<MemoryQuotaPolicyStore>();
        counter_store = std::make_shared<MemoryQuotaCounterStore>();
        utils::log::warn("Storage: memory (nothing persists past this process)");
    }

    std::shared_ptr<IAuditSink> fallback;
    if (!cfg.fallback_journal.empty()) {
        FileSink::Config sink_cfg;
        sink_cfg.output_file = cfg.fallback_journal;
        fallback = std::make_shared<FileSink>(sink_cfg);
    }

    auto clock = std::make_shared<SystemClock>();
    s.audit = std::make_shared<AuditTrail>(cfg.audit, audit_store, s.identity, clock, fallback);
    s.vault = std::make_shared<CredentialVault>(cfg.vault, make_root_secret_source(cfg.root_secret),
                                                secret_store, s.audit, clock);
    s.governor = std::make_shared<AccessGovernor>(cfg.quotas, s.identity, counter_store,
                                                  s.audit, policy_store, clock);
    s.usage = std::make_shared<UsageLedger>(usage_store, s.identity, clock);
    s.prompt_guard = std::make_shared<PromptGuard>(cfg.prompt, s.audit);
    s.response_guard = std::make_shared<ResponseGuard>(cfg.response, s.audit);
    return s;
}

JsonValue verdict_to_json(const SanitizationVerdict& verdict) {
    JsonValue out = JsonValue::object();
    out.set("blocked", JsonValue(verdict.blocked));
    out.set("modified", JsonValue(verdict.was_modified()));
    JsonValue warnings = JsonValue::array();
    for (const auto& w : verdict.warnings) {
        JsonValue item = JsonValue::object();
        item.set("code", JsonValue(w.code));
        item.set("message", JsonValue(w.message));
        item.set("details", w.details);
        warnings.push_back(std::move(item));
    }
    out.set("warnings", std::move(warnings));
    if (!verdict.blocked) out.set("sanitized", JsonValue(verdict.sanitized));
    return out;
}

JsonValue secret_info_to_json(const SecretInfo& info) {
    JsonValue out = JsonValue::object();
    out.set("provider", JsonValue(info.provider));
    out.set("scope", JsonValue(info.scope));
    out.set("metadata", info.metadata);
    out.set("last_rotated_at", JsonValue(utils::format_timestamp(info.last_rotated_at)));
    out.set("created_at", JsonValue(utils::format_timestamp(info.created_at)));
    return out;
}

// ============================================================================
// Commands
// ============================================================================

int cmd_store(Services& s, const std::vector<std::string>& args, bool rotate) {
    if (args.size() < 2) { print_usage(); return kExitUsage; }
    const auto& provider = args[0];
    const auto& scope = args[1];
    s.governor->require_permission(Capability::MANAGE_KEYS, scope_arg(scope));

    const SecureString secret = read_secret_stdin();
    if (rotate) {
        s.vault->rotate(provider, scope, secret.view());
        std::cout << std::format("Rotated {}/{}\n", provider, scope);
    } else {
        s.vault->store(provider, scope, secret.view());
        std::cout << std::format("Stored {}/{}\n", provider, scope);
    }
    return kExitOk;
}

int cmd_delete(Services& s, const std::vector<std::string>& args) {
    if (args.size() < 2) { print_usage(); return kExitUsage; }
    s.governor->require_permission(Capability::MANAGE_KEYS, scope_arg(args[1]));
    if (!s.vault->remove(args[0], args[1])) {
        std::cerr << std::format("No live secret for {}/{}\n", args[0], args[1]);
        return kExitDenied;
    }
    std::cout << std::format("Deleted {}/{}\n", args[0], args[1]);
    return kExitOk;
}

int cmd_exists(Services& s, const std::vector<std::string>& args) {
    if (args.size() < 2) { print_usage(); return kExitUsage; }
    s.governor->require_permission(Capability::MANAGE_KEYS, scope_arg(args[1]));
    const bool found = s.vault->exists(args[0], args[1]);
    std::cout << utils::booltostr(found) << "\n";
    return found ? kExitOk : kExitDenied;
}

int cmd_list(Services& s, const std::vector<std::string>& args) {
    std::optional<std::string> scope;
    if (!args.empty()) scope = args[0];
    s.governor->require_permission(Capability::MANAGE_KEYS, scope ? scope_arg(*scope) : std::nullopt);

    JsonValue out = JsonValue::array();
    for (const auto& info : s.vault->list(scope)) out.push_back(secret_info_to_json(info));
    std::cout << out.dump() << "\n";
    return kExitOk;
}

int cmd_due_rotation(Services& s, const std::vector<std::string>& args, int default_days) {
    s.governor->require_permission(Capability::MANAGE_KEYS);
    int days = default_days;
    if (!args.empty()) {
        const auto parsed = utils::try_parse_int<int>(args[0]);
        if (!parsed || *parsed < 1) {
            std::cerr << "due-rotation: days must be a positive integer\n";
            return kExitUsage;
        }
        days = *parsed;
    }

    JsonValue out = JsonValue::array();
    for (const auto& info : s.vault->due_for_rotation(days)) out.push_back(secret_info_to_json(info));
    std::cout << out.dump() << "\n";
    return kExitOk;
}

int cmd_audit(Services& s, const std::vector<std::string>& args) {
    s.governor->require_permission(Capability::VIEW_REPORTS);

    AuditFilter filter;
    size_t limit = 100;
    for (size_t i = 0; i < args.size(); ++i) {
        if (i + 1 >= args.size()) { print_usage(); return kExitUsage; }
        const auto& flag = args[i];
        const auto& value = args[++i];
        if (flag == "--type") {
            filter.event_type = parse_audit_event_type(value);
            if (!filter.event_type) {
                std::cerr << std::format("Unknown event type '{}'\n", value);
                return kExitUsage;
            }
        } else if (flag == "--actor-filter") {
            filter.actor_id = value;
        } else if (flag == "--min-severity") {
            filter.min_severity = parse_severity(value);
            if (!filter.min_severity) {
                std::cerr << std::format("Unknown severity '{}'\n", value);
                return kExitUsage;
            }
        } else if (flag == "--limit") {
            const auto parsed = utils::try_parse_int<size_t>(value);
            if (!parsed) {
                std::cerr << "--limit must be a non-negative integer\n";
                return kExitUsage;
            }
            limit = *parsed;
        } else {
            print_usage();
            return kExitUsage;
        }
    }

    for (const auto& event : s.audit->query(filter, limit)) {
        std::cout << audit_event_to_json(event) << "\n";
    }
    return kExitOk;
}

int cmd_retention(Services& s, const std::string& command, const std::vector<std::string>& args) {
    s.governor->require_permission(Capability::ADMIN_ALL);

    if (command == "anonymize") {
        std::cout << std::format("Anonymized {} events\n", s.audit->anonymize());
    } else if (command == "cleanup") {
        std::cout << std::format("Purged {} events\n", s.audit->cleanup());
    } else {
        if (args.empty()) { print_usage(); return kExitUsage; }
        std::cout << std::format("Anonymized {} events for {}\n",
                                 s.audit->erase_actor(args[0]), args[0]);
    }
    return kExitOk;
}

int cmd_usage(Services& s, const std::vector<std::string>& args) {
    s.governor->require_permission(Capability::VIEW_REPORTS);

    std::optional<std::string> actor;
    if (!args.empty()) actor = args[0];
    const auto summary = s.usage->summarize(actor, std::chrono::system_clock::time_point{});

    JsonValue out = JsonValue::object();
    out.set("requests", JsonValue(static_cast<unsigned long>(summary.requests)));
    out.set("prompt_tokens", JsonValue(static_cast<long long>(summary.prompt_tokens)));
    out.set("completion_tokens", JsonValue(static_cast<long long>(summary.completion_tokens)));
    out.set("total_tokens", JsonValue(static_cast<long long>(summary.total_tokens)));
    out.set("estimated_cost", JsonValue(summary.estimated_cost));
    out.set("errors", JsonValue(static_cast<unsigned long>(summary.errors)));
    std::cout << out.dump() << "\n";
    return kExitOk;
}

int cmd_check_prompt(Services& s, const std::vector<std::string>& args, bool system_prompt) {
    if (system_prompt) {
        s.governor->require_permission(Capability::CONFIGURE_PROMPTS);
    } else {
        s.governor->require_permission(Capability::USE_LLM);
        if (!s.governor->check_quota(QuotaDimension::REQUESTS_PER_HOUR) ||
            !s.governor->check_quota(QuotaDimension::REQUESTS_PER_DAY)) {
            std::cerr << "Request quota exceeded\n";
            return kExitDenied;
        }
    }

    PromptGuard::Options options;
    for (const auto& arg : args) {
        if (arg == "--truncate") options.truncate = true;
        else if (arg == "--mask-pii") options.mask_pii = true;
        else { print_usage(); return kExitUsage; }
    }

    const std::string prompt = read_stdin();
    const auto verdict = system_prompt ? s.prompt_guard->sanitize_system_prompt(prompt)
                                       : s.prompt_guard->sanitize_prompt(prompt, options);
    if (!system_prompt && !verdict.blocked) {
        s.governor->record_usage(QuotaDimension::REQUESTS_PER_HOUR);
        s.governor->record_usage(QuotaDimension::REQUESTS_PER_DAY);
    }

    std::cout << verdict_to_json(verdict).dump() << "\n";
    return verdict.blocked ? kExitDenied : kExitOk;
}

int cmd_sanitize_response(Services& s, const std::vector<std::string>& args) {
    s.governor->require_permission(Capability::USE_LLM);
    const ResponseFormat format = parse_response_format(args.empty() ? "plain" : args[0]);
    std::cout << s.response_guard->sanitize_response(read_stdin(), format);
    return kExitOk;
}

} // anonymous namespace

int main(int argc, char* argv[]) {
    std::string config_file = "config/llmshield.toml";
    std::string actor_id;
    std::vector<std::string> positional;

    for (int i = 1; i < argc; ++i) {
        const std::string arg = argv[i];
        if (arg == "--config" && i + 1 < argc) {
            config_file = argv[++i];
        } else if (arg == "--actor" && i + 1 < argc) {
            actor_id = argv[++i];
        } else if (arg == "-h" || arg == "--help") {
            print_usage();
            return kExitOk;
        } else {
            positional.push_back(arg);
        }
    }
    if (positional.empty()) {
        print_usage();
        return kExitUsage;
    }
    if (actor_id.empty()) {
        if (const char* env = std::getenv("LLMSHIELD_ACTOR")) actor_id = env;
    }

    const std::string command = positional.front();
    const std::vector<std::string> args(positional.begin() + 1, positional.end());

    auto config_result = ConfigLoader::load_from_file(config_file);
    if (!config_result.success) {
        utils::log::error(config_result.error_message);
        return kExitUsage;
    }
    const auto& cfg = config_result.config;
    if (const auto level = utils::log::parse_level(cfg.logging.level)) {
        utils::log::set_level(*level);
    }

    try {
        Services services = build_services(cfg);
        if (!actor_id.empty() && !services.identity->set_current(actor_id)) {
            utils::log::warn(std::format("Unknown actor '{}', continuing unauthenticated", actor_id));
        }

        if (command == "store")               return cmd_store(services, args, false);
        if (command == "rotate")              return cmd_store(services, args, true);
        if (command == "delete")              return cmd_delete(services, args);
        if (command == "exists")              return cmd_exists(services, args);
        if (command == "list")                return cmd_list(services, args);
        if (command == "due-rotation")        return cmd_due_rotation(services, args, cfg.rotation_reminder_days);
        if (command == "audit")               return cmd_audit(services, args);
        if (command == "anonymize" || command == "cleanup" || command == "erase-actor")
            return cmd_retention(services, command, args);
        if (command == "usage")               return cmd_usage(services, args);
        if (command == "check-prompt")        return cmd_check_prompt(services, args, false);
        if (command == "check-system-prompt") return cmd_check_prompt(services, args, true);
        if (command == "sanitize-response")   return cmd_sanitize_response(services, args);

        std::cerr << std::format("Unknown command '{}'\n", command);
        print_usage();
        return kExitUsage;

    } catch (const ConfigurationValidationError& e) {
        utils::log::error(e.what());
        return kExitUsage;
    } catch (const ShieldError& e) {
        utils::log::error(std::format("{}: {}", error_code_to_string(e.code()), e.what()));
        return kExitDenied;
    } catch (const std::exception& e) {
        utils::log::error(std::format("Fatal: {}", e.what()));
        return kExitDenied;
    }
}
