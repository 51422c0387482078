#include <catch2/catch_test_macros.hpp>
#include "config/config_loader.hpp"

#include <cstdlib>

using namespace llmshield;

namespace {

const std::string kMinimal = R"(
[vault]
pepper = "pepper-value"
)";

} // anonymous namespace

TEST_CASE("ConfigLoader: minimal config takes defaults", "[config]") {
    auto result = ConfigLoader::load_from_string(kMinimal);
    REQUIRE(result.success);

    const auto& cfg = result.config;
    CHECK(cfg.root_secret.source == "env");
    CHECK(cfg.root_secret.env_var == "LLMSHIELD_ROOT_SECRET");
    CHECK(cfg.vault.kdf_iterations == 100000);
    CHECK(cfg.vault.context_namespace == "llmshield");
    CHECK(cfg.rotation_reminder_days == 90);
    CHECK(cfg.prompt.max_prompt_length == 50000);
    CHECK(cfg.prompt.block_on_injection);
    CHECK(cfg.response.max_response_length == 100000);
    CHECK(cfg.audit.retention_days == 90);
    CHECK(cfg.audit.anonymize_after_days == 30);
    CHECK(cfg.storage.backend == "memory");
    CHECK(cfg.logging.level == "info");
    CHECK(cfg.users.empty());
}

TEST_CASE("ConfigLoader: full config is read section by section", "[config]") {
    const std::string toml = R"(
[vault]
root_secret_source = "file"
root_secret_file = "/run/secrets/llmshield"
pepper = "p"
kdf_iterations = 250000
context_namespace = "acme"
rotation_reminder_days = 30

[prompt]
block_on_injection = false
max_prompt_length = 1000
pii_detection = true
mask_char = "#"

[response]
allow_html = false
max_response_length = 2000
site_host = "example.org"

[audit]
retention_days = 365
anonymize_after_days = 60
fallback_journal = "audit.jsonl"

[quotas]
requests_per_hour = 10
tokens_per_day = 50000
monthly_cost_limit = 25.5

[logging]
level = "warn"
)";
    auto result = ConfigLoader::load_from_string(toml);
    REQUIRE(result.success);

    const auto& cfg = result.config;
    CHECK(cfg.root_secret.source == "file");
    CHECK(cfg.root_secret.file == "/run/secrets/llmshield");
    CHECK(cfg.vault.kdf_iterations == 250000);
    CHECK(cfg.vault.context_namespace == "acme");
    CHECK(cfg.rotation_reminder_days == 30);
    CHECK_FALSE(cfg.prompt.block_on_injection);
    CHECK(cfg.prompt.max_prompt_length == 1000);
    CHECK(cfg.prompt.pii_detection);
    CHECK(cfg.prompt.mask_char == '#');
    CHECK_FALSE(cfg.response.allow_html);
    CHECK(cfg.response.max_response_length == 2000);
    CHECK(cfg.response.site_host == "example.org");
    CHECK(cfg.audit.retention_days == 365);
    CHECK(cfg.audit.anonymize_after_days == 60);
    CHECK(cfg.fallback_journal == "audit.jsonl");
    CHECK(cfg.quotas.defaults.requests_per_hour == 10);
    CHECK(cfg.quotas.defaults.requests_per_day == 0);
    CHECK(cfg.quotas.defaults.tokens_per_day == 50000);
    CHECK(cfg.quotas.defaults.monthly_cost_limit == 25.5);
    CHECK(cfg.logging.level == "warn");
}

TEST_CASE("ConfigLoader: ${VAR} expands from the environment", "[config]") {
    ::setenv("LLMSHIELD_TEST_PEPPER", "from-env", 1);
    const std::string toml = R"(
[vault]
pepper = "${LLMSHIELD_TEST_PEPPER}"
)";
    auto result = ConfigLoader::load_from_string(toml);
    REQUIRE(result.success);
    CHECK(result.config.vault.pepper == "from-env");
    ::unsetenv("LLMSHIELD_TEST_PEPPER");
}

TEST_CASE("ConfigLoader: unclosed ${ fails to parse", "[config]") {
    const std::string toml = R"(
[vault]
pepper = "${BROKEN"
)";
    auto result = ConfigLoader::load_from_string(toml);
    CHECK_FALSE(result.success);
    CHECK(result.error_message.find("Unclosed") != std::string::npos);
}

TEST_CASE("ConfigLoader: malformed TOML is reported, not thrown", "[config]") {
    auto result = ConfigLoader::load_from_string("[vault\npepper = ");
    CHECK_FALSE(result.success);
    CHECK(result.error_message.find("Failed to parse config") != std::string::npos);
}

TEST_CASE("ConfigLoader: missing file is reported", "[config]") {
    auto result = ConfigLoader::load_from_file("/nonexistent/llmshield.toml");
    CHECK_FALSE(result.success);
    CHECK(result.error_message.find("Failed to load config") != std::string::npos);
}

// ============================================================================
// Validation
// ============================================================================

TEST_CASE("ConfigValidation: empty pepper fails", "[config][validation]") {
    auto result = ConfigLoader::load_from_string("[vault]\nkdf_iterations = 100000\n");
    CHECK_FALSE(result.success);
    CHECK(result.error_message.find("vault.pepper") != std::string::npos);
}

TEST_CASE("ConfigValidation: too few KDF iterations fails", "[config][validation]") {
    const std::string toml = R"(
[vault]
pepper = "p"
kdf_iterations = 1000
)";
    auto result = ConfigLoader::load_from_string(toml);
    CHECK_FALSE(result.success);
    CHECK(result.error_message.find("kdf_iterations") != std::string::npos);
}

TEST_CASE("ConfigValidation: unknown root secret source fails", "[config][validation]") {
    const std::string toml = R"(
[vault]
pepper = "p"
root_secret_source = "hsm"
)";
    auto result = ConfigLoader::load_from_string(toml);
    CHECK_FALSE(result.success);
    CHECK(result.error_message.find("root_secret_source") != std::string::npos);
}

TEST_CASE("ConfigValidation: file source without a path fails", "[config][validation]") {
    const std::string toml = R"(
[vault]
pepper = "p"
root_secret_source = "file"
)";
    auto result = ConfigLoader::load_from_string(toml);
    CHECK_FALSE(result.success);
    CHECK(result.error_message.find("root_secret_file") != std::string::npos);
}

TEST_CASE("ConfigValidation: retention shorter than anonymization fails", "[config][validation]") {
    const std::string toml = R"(
[vault]
pepper = "p"

[audit]
retention_days = 10
anonymize_after_days = 30
)";
    auto result = ConfigLoader::load_from_string(toml);
    CHECK_FALSE(result.success);
    CHECK(result.error_message.find("audit.retention_days") != std::string::npos);
}

TEST_CASE("ConfigValidation: zero prompt length fails", "[config][validation]") {
    const std::string toml = R"(
[vault]
pepper = "p"

[prompt]
max_prompt_length = 0
)";
    auto result = ConfigLoader::load_from_string(toml);
    CHECK_FALSE(result.success);
    CHECK(result.error_message.find("prompt.max_prompt_length") != std::string::npos);
}

TEST_CASE("ConfigValidation: negative quota fails", "[config][validation]") {
    const std::string toml = R"(
[vault]
pepper = "p"

[quotas]
requests_per_hour = -5
)";
    auto result = ConfigLoader::load_from_string(toml);
    CHECK_FALSE(result.success);
    CHECK(result.error_message.find("quotas") != std::string::npos);
}

TEST_CASE("ConfigValidation: postgresql without connection_string fails", "[config][validation]") {
    const std::string toml = R"(
[vault]
pepper = "p"

[storage]
backend = "postgresql"
)";
    auto result = ConfigLoader::load_from_string(toml);
    CHECK_FALSE(result.success);
    CHECK(result.error_message.find("connection_string") != std::string::npos);
}

TEST_CASE("ConfigValidation: unknown backend and log level fail", "[config][validation]") {
    const std::string toml = R"(
[vault]
pepper = "p"

[storage]
backend = "redis"

[logging]
level = "verbose"
)";
    auto result = ConfigLoader::load_from_string(toml);
    CHECK_FALSE(result.success);
    CHECK(result.error_message.find("storage.backend") != std::string::npos);
    CHECK(result.error_message.find("logging.level") != std::string::npos);
}

TEST_CASE("ConfigValidation: every problem is reported at once", "[config][validation]") {
    const std::string toml = R"(
[vault]
kdf_iterations = 10

[prompt]
max_prompt_length = 0
)";
    auto result = ConfigLoader::load_from_string(toml);
    CHECK_FALSE(result.success);
    CHECK(result.error_message.find("Config validation failed:") == 0);
    CHECK(result.error_message.find("vault.pepper") != std::string::npos);
    CHECK(result.error_message.find("kdf_iterations") != std::string::npos);
    CHECK(result.error_message.find("max_prompt_length") != std::string::npos);
}

TEST_CASE("ConfigValidation: unknown capability and group fail", "[config][validation]") {
    const std::string toml = R"(
[vault]
pepper = "p"

[[groups]]
id = "writers"
grants = ["use_llm", "launch_missiles"]

[[users]]
id = "alice"
groups = ["writers", "ghosts"]
)";
    auto result = ConfigLoader::load_from_string(toml);
    CHECK_FALSE(result.success);
    CHECK(result.error_message.find("launch_missiles") != std::string::npos);
    CHECK(result.error_message.find("unknown group 'ghosts'") != std::string::npos);
}

TEST_CASE("ConfigValidation: duplicate user id fails", "[config][validation]") {
    const std::string toml = R"(
[vault]
pepper = "p"

[[users]]
id = "alice"

[[users]]
id = "alice"
)";
    auto result = ConfigLoader::load_from_string(toml);
    CHECK_FALSE(result.success);
    CHECK(result.error_message.find("duplicate user id 'alice'") != std::string::npos);
}

// ============================================================================
// Actors
// ============================================================================

TEST_CASE("ConfigLoader: build_actors resolves groups and grants", "[config][identity]") {
    const std::string toml = R"(
[vault]
pepper = "p"

[[groups]]
id = "writers"
grants = ["use_llm"]

[[users]]
id = "admin"
name = "Administrator"
admin = true

[[users]]
id = "alice"
name = "Alice"
grants = ["view_reports"]
groups = ["writers"]
scopes = ["site-1", "site-2"]
)";
    auto result = ConfigLoader::load_from_string(toml);
    REQUIRE(result.success);

    const auto actors = ConfigLoader::build_actors(result.config);
    REQUIRE(actors.size() == 2);

    const auto& admin = actors[0];
    CHECK(admin.id == "admin");
    CHECK(admin.display_name == "Administrator");
    CHECK(admin.is_admin);

    const auto& alice = actors[1];
    CHECK(alice.display_name == "Alice");
    CHECK_FALSE(alice.is_admin);
    CHECK(alice.grants.contains(Capability::VIEW_REPORTS));
    CHECK_FALSE(alice.grants.contains(Capability::USE_LLM));
    REQUIRE(alice.groups.size() == 1);
    CHECK(alice.groups[0].id == "writers");
    CHECK(alice.groups[0].grants.contains(Capability::USE_LLM));
    CHECK(alice.scopes.contains("site-2"));
}

TEST_CASE("ConfigLoader: user name defaults to id", "[config][identity]") {
    const std::string toml = R"(
[vault]
pepper = "p"

[[users]]
id = "bob"
)";
    auto result = ConfigLoader::load_from_string(toml);
    REQUIRE(result.success);
    REQUIRE(result.config.users.size() == 1);
    CHECK(result.config.users[0].name == "bob");
}
