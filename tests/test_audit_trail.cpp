#include <catch2/catch_test_macros.hpp>
#include "audit/audit_trail.hpp"
#include "audit/file_sink.hpp"
#include "audit/memory_audit_store.hpp"
#include "auth/static_identity_provider.hpp"
#include "core/error.hpp"

#include <chrono>
#include <filesystem>
#include <fstream>
#include <memory>
#include <string>

using namespace llmshield;

namespace {

// Store that is down: every call throws
class UnavailableAuditStore : public IAuditStore {
public:
    int64_t append(const AuditEvent&) override {
        throw StorageUnavailable("audit database unreachable");
    }
    std::vector<AuditEvent> query(const AuditFilter&, size_t, size_t) const override {
        throw StorageUnavailable("audit database unreachable");
    }
    size_t anonymize_before(std::chrono::system_clock::time_point) override { return 0; }
    size_t anonymize_actor(const std::string&) override { return 0; }
    size_t purge_before(std::chrono::system_clock::time_point) override { return 0; }
    std::string name() const override { return "unavailable"; }
};

struct AuditHarness {
    std::shared_ptr<ManualClock> clock = std::make_shared<ManualClock>(
        std::chrono::sys_days{std::chrono::year{2026} / 1 / 1});
    std::shared_ptr<StaticIdentityProvider> identity = std::make_shared<StaticIdentityProvider>();
    std::shared_ptr<MemoryAuditStore> store = std::make_shared<MemoryAuditStore>();
    AuditTrail trail{AuditTrail::Config{}, store, identity, clock};

    AuditHarness() {
        Actor alice("alice", "Alice");
        alice.source_address = "10.0.0.7";
        alice.user_agent = "curl/8.0";
        identity->add_actor(alice);
        identity->add_actor(Actor("bob", "Bob"));
        identity->set_current("alice");
    }

    std::vector<AuditEvent> all() const { return store->query(AuditFilter{}, 1000, 0); }
};

std::string temp_path(const std::string& name) {
    return (std::filesystem::temp_directory_path() / name).string();
}

} // anonymous namespace

// ============================================================================
// Construction
// ============================================================================

TEST_CASE("AuditTrail: retention shorter than anonymization is rejected", "[audit]") {
    AuditTrail::Config cfg;
    cfg.retention_days = 10;
    cfg.anonymize_after_days = 30;
    CHECK_THROWS_AS(AuditTrail(cfg, std::make_shared<MemoryAuditStore>()),
                    ConfigurationValidationError);

    cfg.retention_days = 30;
    cfg.anonymize_after_days = 0;
    CHECK_THROWS_AS(AuditTrail(cfg, std::make_shared<MemoryAuditStore>()),
                    ConfigurationValidationError);
}

// ============================================================================
// Event categories
// ============================================================================

TEST_CASE("AuditTrail: actor fields come from the identity provider", "[audit]") {
    AuditHarness h;
    h.trail.log_key_access("openai", "global");

    const auto events = h.all();
    REQUIRE(events.size() == 1);
    CHECK(events[0].event_type == AuditEventType::KEY_ACCESS);
    CHECK(events[0].severity == Severity::INFO);
    CHECK(events[0].actor_id == "alice");
    CHECK(events[0].actor_name == "Alice");
    CHECK(events[0].source_address == "10.0.0.7");
    CHECK(events[0].user_agent == "curl/8.0");
    CHECK(events[0].created_at == h.clock->now());
    CHECK(events[0].id > 0);
}

TEST_CASE("AuditTrail: events without an actor are still recorded", "[audit]") {
    AuditHarness h;
    h.identity->clear();
    h.trail.log_access_denied("use_llm", "no authenticated actor");

    const auto events = h.all();
    REQUIRE(events.size() == 1);
    CHECK(events[0].actor_id.empty());
    CHECK(events[0].severity == Severity::WARNING);
    CHECK(events[0].details["permission"].get<std::string>() == "use_llm");
}

TEST_CASE("AuditTrail: each category has a fixed severity", "[audit]") {
    AuditHarness h;
    h.trail.log_key_creation("openai", "global");
    h.trail.log_key_rotation("openai", "global");
    h.trail.log_key_deletion("openai", "global");
    h.trail.log_key_access_attempt("openai", "global", false, "not_found");
    h.trail.log_llm_request({"openai", "gpt-4o", 120, 480});
    h.trail.log_llm_response({"openai", "gpt-4o", 80, 200, 1.5, 320});
    h.trail.log_llm_error("openai", "gpt-4o", "rate limited", 429);
    h.trail.log_quota_exceeded("alice", "requests_per_hour", 10, 10);
    h.trail.log_suspicious_activity("prompt_injection", "blocked");

    auto severity_of = [&](AuditEventType type) {
        AuditFilter filter;
        filter.event_type = type;
        const auto events = h.store->query(filter, 10, 0);
        REQUIRE(events.size() == 1);
        return events[0].severity;
    };

    CHECK(severity_of(AuditEventType::KEY_CREATION) == Severity::NOTICE);
    CHECK(severity_of(AuditEventType::KEY_ROTATION) == Severity::NOTICE);
    CHECK(severity_of(AuditEventType::KEY_DELETION) == Severity::NOTICE);
    CHECK(severity_of(AuditEventType::KEY_ACCESS_ATTEMPT) == Severity::WARNING);
    CHECK(severity_of(AuditEventType::LLM_REQUEST) == Severity::INFO);
    CHECK(severity_of(AuditEventType::LLM_RESPONSE) == Severity::INFO);
    CHECK(severity_of(AuditEventType::LLM_ERROR) == Severity::ERROR);
    CHECK(severity_of(AuditEventType::QUOTA_EXCEEDED) == Severity::WARNING);
    CHECK(severity_of(AuditEventType::SUSPICIOUS_ACTIVITY) == Severity::CRITICAL);
}

TEST_CASE("AuditTrail: request and response events carry metadata only", "[audit]") {
    AuditHarness h;
    h.trail.log_llm_request({"anthropic", "claude", 42, 168});

    const auto events = h.all();
    REQUIRE(events.size() == 1);
    const auto& d = events[0].details;
    CHECK(d["provider"].get<std::string>() == "anthropic");
    CHECK(d["prompt_tokens"].get<int64_t>() == 42);
    CHECK(d["prompt_length"].get<int64_t>() == 168);
    CHECK(d.size() == 4);
}

TEST_CASE("AuditTrail: quota events record usage and limit", "[audit]") {
    AuditHarness h;
    h.trail.log_quota_exceeded("alice", "tokens_per_day", 50123, 50000);

    const auto events = h.all();
    REQUIRE(events.size() == 1);
    CHECK(events[0].details["subject"].get<std::string>() == "alice");
    CHECK(events[0].details["quota_type"].get<std::string>() == "tokens_per_day");
    CHECK(events[0].details["usage"].get<int64_t>() == 50123);
    CHECK(events[0].details["limit"].get<int64_t>() == 50000);
}

// ============================================================================
// Config changes
// ============================================================================

TEST_CASE("AuditTrail: sensitive config keys are redacted", "[audit][redaction]") {
    AuditHarness h;
    h.trail.log_config_change("vault.pepper", JsonValue("old"), JsonValue("new"));
    h.trail.log_config_change("prompt.max_prompt_length", JsonValue(1000), JsonValue(2000));

    AuditFilter filter;
    filter.event_type = AuditEventType::CONFIG_CHANGE;
    const auto events = h.store->query(filter, 10, 0);
    REQUIRE(events.size() == 2);

    // newest first
    CHECK(events[1].details["old_value"].get<std::string>() == "[REDACTED]");
    CHECK(events[1].details["new_value"].get<std::string>() == "[REDACTED]");
    CHECK(events[0].details["new_value"].get<int>() == 2000);
}

TEST_CASE("AuditTrail: sanitize_value truncates and redacts nested values", "[audit][redaction]") {
    SECTION("long strings") {
        const auto out = AuditTrail::sanitize_value(JsonValue(std::string(600, 'x')));
        const auto s = out.get<std::string>();
        CHECK(s.size() == 500 + std::string("... [truncated]").size());
        CHECK(s.ends_with("... [truncated]"));
    }
    SECTION("nested objects") {
        JsonValue inner = JsonValue::object();
        inner.set("api_key", "sk-secret");
        inner.set("model", "gpt-4o");
        JsonValue outer = JsonValue::object();
        outer.set("provider", inner);
        outer.set("Token", "abc");

        const auto out = AuditTrail::sanitize_value(outer);
        CHECK(out["provider"]["api_key"].get<std::string>() == "[REDACTED]");
        CHECK(out["provider"]["model"].get<std::string>() == "gpt-4o");
        CHECK(out["Token"].get<std::string>() == "[REDACTED]");
        CHECK(out.dump().find("sk-secret") == std::string::npos);
    }
}

// ============================================================================
// Query
// ============================================================================

TEST_CASE("AuditTrail: query filters, orders newest first and paginates", "[audit][query]") {
    AuditHarness h;
    for (int i = 0; i < 5; ++i) {
        h.trail.log_key_access("openai", "global");
        h.clock->advance(std::chrono::minutes(1));
    }
    h.identity->set_current("bob");
    h.trail.log_access_denied("manage_keys", "scope=site-1");

    SECTION("by actor") {
        AuditFilter filter;
        filter.actor_id = "bob";
        const auto events = h.trail.query(filter);
        REQUIRE(events.size() == 1);
        CHECK(events[0].event_type == AuditEventType::ACCESS_DENIED);
    }
    SECTION("by minimum severity") {
        AuditFilter filter;
        filter.min_severity = Severity::WARNING;
        CHECK(h.trail.query(filter).size() == 1);
    }
    SECTION("by time range") {
        AuditFilter filter;
        filter.from = h.clock->now() - std::chrono::minutes(2);
        CHECK(h.trail.query(filter).size() == 3);
    }
    SECTION("ordering and paging") {
        const auto page1 = h.trail.query(AuditFilter{}, 2, 0);
        const auto page2 = h.trail.query(AuditFilter{}, 2, 2);
        REQUIRE(page1.size() == 2);
        REQUIRE(page2.size() == 2);
        CHECK(page1[0].actor_id == "bob");
        CHECK(page1[0].created_at >= page1[1].created_at);
        CHECK(page1[1].created_at >= page2[0].created_at);
        CHECK(page1[1].id != page2[0].id);
    }
}

// ============================================================================
// Retention
// ============================================================================

TEST_CASE("AuditTrail: anonymize clears actor data once", "[audit][retention]") {
    AuditHarness h;
    h.trail.log_key_access("openai", "global");
    h.trail.log_key_rotation("openai", "global");
    h.clock->advance(std::chrono::days(31));
    h.trail.log_key_access("openai", "global");

    CHECK(h.trail.anonymize() == 2);
    CHECK(h.trail.anonymize() == 0);

    const auto events = h.all();
    REQUIRE(events.size() == 3);
    CHECK(events[0].actor_id == "alice");
    CHECK_FALSE(events[0].anonymized);
    for (size_t i = 1; i < events.size(); ++i) {
        CHECK(events[i].anonymized);
        CHECK(events[i].actor_id.empty());
        CHECK(events[i].actor_name.empty());
        CHECK(events[i].source_address.empty());
        CHECK(events[i].user_agent.empty());
        CHECK(events[i].details["provider"].get<std::string>() == "openai");
    }
}

TEST_CASE("AuditTrail: cleanup deletes events past retention", "[audit][retention]") {
    AuditHarness h;
    h.trail.log_key_access("openai", "global");
    h.clock->advance(std::chrono::days(60));
    h.trail.log_key_access("openai", "global");
    h.clock->advance(std::chrono::days(31));

    CHECK(h.trail.cleanup() == 1);
    CHECK(h.trail.cleanup() == 0);
    CHECK(h.store->size() == 1);
}

TEST_CASE("AuditTrail: erase_actor anonymizes one actor regardless of age", "[audit][retention]") {
    AuditHarness h;
    h.trail.log_key_access("openai", "global");
    h.identity->set_current("bob");
    h.trail.log_key_access("openai", "global");

    CHECK(h.trail.erase_actor("alice") == 1);
    CHECK(h.trail.erase_actor("alice") == 0);
    CHECK(h.trail.erase_actor("") == 0);

    AuditFilter filter;
    filter.actor_id = "bob";
    CHECK(h.trail.query(filter).size() == 1);
}

// ============================================================================
// Store failure
// ============================================================================

TEST_CASE("AuditTrail: store failures go to the fallback journal", "[audit][fallback]") {
    const auto path = temp_path("llmshield_audit_fallback_test.jsonl");
    std::filesystem::remove(path);

    {
        FileSink::Config sink_cfg;
        sink_cfg.output_file = path;
        auto sink = std::make_shared<FileSink>(sink_cfg);
        auto identity = std::make_shared<StaticIdentityProvider>();
        identity->set_current(Actor("alice", "Alice"));

        AuditTrail trail(AuditTrail::Config{}, std::make_shared<UnavailableAuditStore>(), identity,
                         nullptr, sink);
        CHECK_NOTHROW(trail.log_key_creation("openai", "global"));
        CHECK_NOTHROW(trail.log_suspicious_activity("prompt_injection", "blocked"));

        const auto stats = trail.stats();
        CHECK(stats.events_written == 0);
        CHECK(stats.store_failures == 2);
        CHECK(stats.fallback_writes == 2);
        sink->flush();
    }

    std::ifstream in(path);
    std::string line;
    int lines = 0;
    bool saw_creation = false;
    while (std::getline(in, line)) {
        ++lines;
        if (line.find("\"event_type\":\"key_creation\"") != std::string::npos) saw_creation = true;
        CHECK(line.find("\"actor_id\":\"alice\"") != std::string::npos);
    }
    CHECK(lines == 2);
    CHECK(saw_creation);
    std::filesystem::remove(path);
}

TEST_CASE("AuditTrail: store failure without a fallback does not throw", "[audit][fallback]") {
    AuditTrail trail(AuditTrail::Config{}, std::make_shared<UnavailableAuditStore>());
    CHECK_NOTHROW(trail.log_key_access("openai", "global"));
    CHECK(trail.stats().store_failures == 1);
    CHECK(trail.stats().fallback_writes == 0);
}

TEST_CASE("FileSink: rotates when the size limit is reached", "[audit][fallback]") {
    const auto path = temp_path("llmshield_file_sink_rotation.jsonl");
    std::filesystem::remove(path);
    std::filesystem::remove(path + ".1");

    FileSink::Config cfg;
    cfg.output_file = path;
    cfg.max_file_size_bytes = 64;
    cfg.max_files = 2;
    FileSink sink(cfg);

    const std::string line(40, 'x');
    CHECK(sink.write(line));
    CHECK(sink.write(line));
    CHECK(sink.write(line));
    sink.flush();

    CHECK(sink.rotation_count() >= 1);
    CHECK(std::filesystem::exists(path + ".1"));

    std::filesystem::remove(path);
    std::filesystem::remove(path + ".1");
    std::filesystem::remove(path + ".2");
}
