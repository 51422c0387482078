#include <catch2/catch_test_macros.hpp>
#include "audit/memory_audit_store.hpp"
#include "auth/static_identity_provider.hpp"
#include "core/error.hpp"
#include "security/aead_cipher.hpp"
#include "security/credential_vault.hpp"
#include "security/memory_secret_store.hpp"

#include <chrono>
#include <cstdlib>
#include <functional>
#include <memory>
#include <string>

using namespace llmshield;

namespace {

const std::string kRootSecret(96, 'R');
const std::string kPepper = "test-pepper";
const std::string kOpenAiKey = "sk-" + std::string(48, 'a');
const std::string kOpenAiKey2 = "sk-" + std::string(48, 'b');

struct VaultHarness {
    std::shared_ptr<ManualClock> clock = std::make_shared<ManualClock>(
        std::chrono::sys_days{std::chrono::year{2026} / 3 / 1});
    std::shared_ptr<StaticIdentityProvider> identity = std::make_shared<StaticIdentityProvider>();
    std::shared_ptr<MemoryAuditStore> audit_store = std::make_shared<MemoryAuditStore>();
    std::shared_ptr<AuditTrail> audit;
    std::shared_ptr<MemorySecretStore> secrets = std::make_shared<MemorySecretStore>();
    std::unique_ptr<CredentialVault> vault;

    VaultHarness() {
        identity->set_current(Actor("ops", "Ops Engineer"));
        audit = std::make_shared<AuditTrail>(AuditTrail::Config{}, audit_store, identity, clock);
        vault = std::make_unique<CredentialVault>(config(), root(), secrets, audit, clock);
    }

    static CredentialVault::Config config() {
        CredentialVault::Config cfg;
        cfg.pepper = kPepper;
        return cfg;
    }

    static std::shared_ptr<IRootSecretSource> root() {
        return std::make_shared<InlineRootSecretSource>(kRootSecret);
    }

    size_t count(AuditEventType type) const {
        AuditFilter filter;
        filter.event_type = type;
        return audit_store->query(filter, 1000, 0).size();
    }

    void tamper(const std::function<void(EncryptedSecret&)>& mutate) {
        auto row = secrets->find("openai", "global");
        REQUIRE(row.has_value());
        mutate(*row);
        REQUIRE(secrets->replace(*row));
    }
};

} // anonymous namespace

// ============================================================================
// Construction
// ============================================================================

TEST_CASE("CredentialVault: short root secret is rejected", "[vault]") {
    auto audit = std::make_shared<AuditTrail>(AuditTrail::Config{}, std::make_shared<MemoryAuditStore>());
    CHECK_THROWS_AS(CredentialVault(VaultHarness::config(),
                                    std::make_shared<InlineRootSecretSource>(std::string(95, 'R')),
                                    std::make_shared<MemorySecretStore>(), audit),
                    ConfigurationValidationError);
}

TEST_CASE("CredentialVault: empty pepper is rejected", "[vault]") {
    auto audit = std::make_shared<AuditTrail>(AuditTrail::Config{}, std::make_shared<MemoryAuditStore>());
    CHECK_THROWS_AS(CredentialVault(CredentialVault::Config{}, VaultHarness::root(),
                                    std::make_shared<MemorySecretStore>(), audit),
                    ConfigurationValidationError);
}

TEST_CASE("CredentialVault: missing env root secret is a configuration error", "[vault]") {
    ::unsetenv("LLMSHIELD_TEST_ROOT_UNSET");
    auto audit = std::make_shared<AuditTrail>(AuditTrail::Config{}, std::make_shared<MemoryAuditStore>());
    CHECK_THROWS_AS(CredentialVault(VaultHarness::config(),
                                    std::make_shared<EnvRootSecretSource>("LLMSHIELD_TEST_ROOT_UNSET"),
                                    std::make_shared<MemorySecretStore>(), audit),
                    ConfigurationValidationError);
}

// ============================================================================
// Store / retrieve
// ============================================================================

TEST_CASE("CredentialVault: store then retrieve returns the plaintext", "[vault]") {
    VaultHarness h;
    h.vault->store("openai", "global", kOpenAiKey);

    const auto row = h.secrets->find("openai", "global");
    REQUIRE(row.has_value());
    CHECK(std::string(row->ciphertext.begin(), row->ciphertext.end()) != kOpenAiKey);
    CHECK(row->iv.size() == AeadCipher::kIvLen);
    CHECK(row->tag.size() == AeadCipher::kTagLen);

    const auto plain = h.vault->retrieve("openai", "global");
    REQUIRE(plain.has_value());
    CHECK(plain->view() == kOpenAiKey);

    CHECK(h.count(AuditEventType::KEY_CREATION) == 1);
    CHECK(h.count(AuditEventType::KEY_ACCESS) == 1);

    AuditFilter filter;
    filter.event_type = AuditEventType::KEY_CREATION;
    const auto events = h.audit_store->query(filter, 10, 0);
    REQUIRE(events.size() == 1);
    CHECK(events[0].actor_id == "ops");
    CHECK(events[0].severity == Severity::NOTICE);
    CHECK(events[0].details["provider"].get<std::string>() == "openai");
    CHECK(events[0].details.dump().find(kOpenAiKey) == std::string::npos);
}

TEST_CASE("CredentialVault: retrieve of a missing pair is audited", "[vault]") {
    VaultHarness h;
    CHECK_FALSE(h.vault->retrieve("openai", "global").has_value());

    AuditFilter filter;
    filter.event_type = AuditEventType::KEY_ACCESS_ATTEMPT;
    const auto events = h.audit_store->query(filter, 10, 0);
    REQUIRE(events.size() == 1);
    CHECK(events[0].severity == Severity::WARNING);
    CHECK(events[0].details["reason"].get<std::string>() == "not_found");
    CHECK_FALSE(events[0].details["success"].get<bool>());
}

TEST_CASE("CredentialVault: malformed keys are refused before storage", "[vault]") {
    VaultHarness h;
    CHECK_THROWS_AS(h.vault->store("openai", "global", "not-a-key"), InvalidCredentialFormat);
    CHECK_THROWS_AS(h.vault->store("", "global", kOpenAiKey), InvalidCredentialFormat);
    CHECK(h.secrets->row_count() == 0);
    CHECK(h.count(AuditEventType::KEY_CREATION) == 0);
    CHECK_FALSE(h.vault->validate("openai", "not-a-key"));
    CHECK(h.vault->validate("openai", kOpenAiKey));
}

TEST_CASE("CredentialVault: storing over a live secret counts as rotation", "[vault]") {
    VaultHarness h;
    h.vault->store("openai", "global", kOpenAiKey);
    h.vault->store("openai", "global", kOpenAiKey2);

    CHECK(h.secrets->row_count() == 1);
    CHECK(h.count(AuditEventType::KEY_CREATION) == 1);
    CHECK(h.count(AuditEventType::KEY_ROTATION) == 1);
    CHECK(h.vault->retrieve("openai", "global")->view() == kOpenAiKey2);
}

// ============================================================================
// Integrity
// ============================================================================

TEST_CASE("CredentialVault: ciphertext is bound to its provider and scope", "[vault][integrity]") {
    VaultHarness h;
    h.vault->store("openai", "site-1", kOpenAiKey);
    h.vault->store("openai", "site-2", kOpenAiKey2);

    // Move site-1's sealed material under site-2
    auto source = h.secrets->find("openai", "site-1");
    auto target = h.secrets->find("openai", "site-2");
    REQUIRE(source.has_value());
    REQUIRE(target.has_value());
    target->ciphertext = source->ciphertext;
    target->iv = source->iv;
    target->tag = source->tag;
    REQUIRE(h.secrets->replace(*target));

    CHECK_THROWS_AS(h.vault->retrieve("openai", "site-2"), DecryptionIntegrityError);
    CHECK(h.vault->retrieve("openai", "site-1")->view() == kOpenAiKey);

    AuditFilter filter;
    filter.event_type = AuditEventType::KEY_ACCESS_ATTEMPT;
    filter.min_severity = Severity::ERROR;
    CHECK(h.audit_store->query(filter, 10, 0).size() == 1);
}

TEST_CASE("CredentialVault: tampering is detected", "[vault][integrity]") {
    VaultHarness h;
    h.vault->store("openai", "global", kOpenAiKey);

    SECTION("ciphertext bit flip") {
        h.tamper([](EncryptedSecret& row) { row.ciphertext[3] ^= 0x04; });
    }
    SECTION("iv bit flip") {
        h.tamper([](EncryptedSecret& row) { row.iv[0] ^= 0x01; });
    }
    SECTION("tag bit flip") {
        h.tamper([](EncryptedSecret& row) { row.tag[7] ^= 0x40; });
    }
    SECTION("truncated iv") {
        h.tamper([](EncryptedSecret& row) { row.iv.resize(8); });
    }

    CHECK_THROWS_AS(h.vault->retrieve("openai", "global"), DecryptionIntegrityError);
    CHECK(h.count(AuditEventType::KEY_ACCESS) == 0);
}

// ============================================================================
// Rotation / deletion / listing
// ============================================================================

TEST_CASE("CredentialVault: store and rotate end to end", "[vault][rotation]") {
    VaultHarness h;
    h.vault->store("openai", "global", kOpenAiKey);
    const auto before = h.secrets->find("openai", "global");
    REQUIRE(before.has_value());

    h.clock->advance(std::chrono::hours(24));
    h.vault->rotate("openai", "global", kOpenAiKey2);

    const auto after = h.secrets->find("openai", "global");
    REQUIRE(after.has_value());
    CHECK(after->id == before->id);
    CHECK(after->ciphertext != before->ciphertext);
    CHECK(after->iv != before->iv);
    CHECK(after->last_rotated_at > before->last_rotated_at);
    CHECK(after->created_at == before->created_at);
    CHECK(after->metadata.contains("previous_rotation"));

    CHECK(h.vault->retrieve("openai", "global")->view() == kOpenAiKey2);

    // The superseded ciphertext still authenticates, but only to the old value
    const KeyDerivation kdf(kPepper, KeyDerivation::kMinIterations);
    const std::string context = h.vault->context_for("openai", "global");
    const auto key = kdf.derive(kRootSecret, context);
    const auto old_plain = AeadCipher::decrypt(
        key, AeadCipher::Sealed{before->ciphertext, before->iv, before->tag}, context);
    CHECK(old_plain.view() == kOpenAiKey);
    CHECK(old_plain.view() != kOpenAiKey2);

    CHECK(h.count(AuditEventType::KEY_CREATION) == 1);
    CHECK(h.count(AuditEventType::KEY_ROTATION) == 1);
}

TEST_CASE("CredentialVault: rotating a missing secret throws NotFound", "[vault][rotation]") {
    VaultHarness h;
    CHECK_THROWS_AS(h.vault->rotate("openai", "global", kOpenAiKey), NotFound);
    CHECK(h.count(AuditEventType::KEY_ROTATION) == 0);
}

TEST_CASE("CredentialVault: remove soft-deletes once", "[vault]") {
    VaultHarness h;
    h.vault->store("openai", "global", kOpenAiKey);

    CHECK(h.vault->remove("openai", "global"));
    CHECK_FALSE(h.vault->exists("openai", "global"));
    CHECK_FALSE(h.vault->retrieve("openai", "global").has_value());
    CHECK_FALSE(h.vault->remove("openai", "global"));
    CHECK(h.secrets->row_count() == 1);
    CHECK(h.count(AuditEventType::KEY_DELETION) == 1);

    SECTION("the pair can be stored again") {
        h.vault->store("openai", "global", kOpenAiKey2);
        CHECK(h.vault->exists("openai", "global"));
        CHECK(h.count(AuditEventType::KEY_CREATION) == 2);
    }
}

TEST_CASE("CredentialVault: list is ordered and scope-filtered", "[vault]") {
    VaultHarness h;
    h.vault->store("openai", "site-1", kOpenAiKey);
    h.vault->store("mistral", "site-1", std::string(20, 'm'));
    h.vault->store("openai", "global", kOpenAiKey2);

    const auto all = h.vault->list();
    REQUIRE(all.size() == 3);
    CHECK(all[0].provider == "mistral");
    CHECK(all[1].scope == "global");
    CHECK(all[2].scope == "site-1");

    const auto site = h.vault->list(std::string("site-1"));
    CHECK(site.size() == 2);
}

TEST_CASE("CredentialVault: due_for_rotation uses last rotation time", "[vault][rotation]") {
    VaultHarness h;
    h.vault->store("openai", "global", kOpenAiKey);
    h.clock->advance(std::chrono::days(60));
    h.vault->store("mistral", "global", std::string(20, 'm'));

    h.clock->advance(std::chrono::days(31));
    const auto due = h.vault->due_for_rotation(90);
    REQUIRE(due.size() == 1);
    CHECK(due[0].provider == "openai");

    h.vault->rotate("openai", "global", kOpenAiKey2);
    CHECK(h.vault->due_for_rotation(90).empty());
}
