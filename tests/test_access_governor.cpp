#include <catch2/catch_test_macros.hpp>
#include "audit/memory_audit_store.hpp"
#include "auth/static_identity_provider.hpp"
#include "core/error.hpp"
#include "security/access_governor.hpp"

#include <chrono>
#include <memory>
#include <string>
#include <thread>
#include <vector>

using namespace llmshield;

namespace {

struct GovernorHarness {
    std::shared_ptr<ManualClock> clock = std::make_shared<ManualClock>(
        std::chrono::sys_days{std::chrono::year{2026} / 3 / 1} + std::chrono::hours(12));
    std::shared_ptr<StaticIdentityProvider> identity = std::make_shared<StaticIdentityProvider>();
    std::shared_ptr<MemoryAuditStore> audit_store = std::make_shared<MemoryAuditStore>();
    std::shared_ptr<AuditTrail> audit =
        std::make_shared<AuditTrail>(AuditTrail::Config{}, audit_store, identity, clock);
    std::shared_ptr<MemoryQuotaCounterStore> counters = std::make_shared<MemoryQuotaCounterStore>(clock);
    std::shared_ptr<MemoryQuotaPolicyStore> policies = std::make_shared<MemoryQuotaPolicyStore>();
    std::unique_ptr<AccessGovernor> governor;

    explicit GovernorHarness(QuotaLimits defaults = {}) {
        ActorGroup writers;
        writers.id = "writers";
        writers.grants = {Capability::USE_LLM};

        Actor admin("admin", "Administrator");
        admin.is_admin = true;

        Actor alice("alice", "Alice");
        alice.groups.push_back(writers);
        alice.scopes = {"site-1"};

        Actor keeper("keeper", "Key Keeper");
        keeper.grants = {Capability::MANAGE_KEYS, Capability::VIEW_REPORTS};
        keeper.scopes = {"site-1", "site-2"};

        Actor root("root", "Root");
        root.grants = {Capability::ADMIN_ALL};

        for (auto& a : {admin, alice, keeper, root}) identity->add_actor(a);

        governor = std::make_unique<AccessGovernor>(AccessGovernor::Config{defaults}, identity,
                                                    counters, audit, policies, clock);
    }

    size_t count(AuditEventType type) const {
        AuditFilter filter;
        filter.event_type = type;
        return audit_store->query(filter, 1000, 0).size();
    }
};

} // anonymous namespace

// ============================================================================
// Permissions
// ============================================================================

TEST_CASE("AccessGovernor: requires its collaborators", "[governor]") {
    auto audit = std::make_shared<AuditTrail>(AuditTrail::Config{}, std::make_shared<MemoryAuditStore>());
    CHECK_THROWS_AS(AccessGovernor({}, nullptr, std::make_shared<MemoryQuotaCounterStore>(), audit),
                    std::invalid_argument);
}

TEST_CASE("AccessGovernor: no actor means no permission", "[governor][permission]") {
    GovernorHarness h;
    CHECK_FALSE(h.governor->can_use_llm());
    CHECK_FALSE(h.governor->can_view_reports());
    CHECK(h.count(AuditEventType::ACCESS_DENIED) == 2);
}

TEST_CASE("AccessGovernor: administrators hold every capability", "[governor][permission]") {
    GovernorHarness h;
    h.identity->set_current("admin");
    CHECK(h.governor->can_use_llm());
    CHECK(h.governor->can_configure_prompts());
    CHECK(h.governor->can_manage_keys(std::string("site-9")));
    CHECK(h.governor->can_view_reports());
    CHECK(h.count(AuditEventType::ACCESS_DENIED) == 0);
}

TEST_CASE("AccessGovernor: admin_all grant implies every capability", "[governor][permission]") {
    GovernorHarness h;
    h.identity->set_current("root");
    CHECK(h.governor->can_manage_keys());
    CHECK(h.governor->has_permission(Capability::ADMIN_ALL));
}

TEST_CASE("AccessGovernor: direct and group grants", "[governor][permission]") {
    GovernorHarness h;

    SECTION("group grant") {
        h.identity->set_current("alice");
        CHECK(h.governor->can_use_llm());
        CHECK_FALSE(h.governor->can_manage_keys());
        CHECK_FALSE(h.governor->has_permission(Capability::ADMIN_ALL));
    }
    SECTION("direct grant") {
        h.identity->set_current("keeper");
        CHECK(h.governor->can_manage_keys());
        CHECK(h.governor->can_view_reports());
        CHECK_FALSE(h.governor->can_use_llm());
    }
}

TEST_CASE("AccessGovernor: scope context requires membership", "[governor][permission]") {
    GovernorHarness h;
    h.identity->set_current("alice");

    CHECK(h.governor->can_use_llm(std::string("site-1")));
    CHECK_FALSE(h.governor->can_use_llm(std::string("site-2")));

    AuditFilter filter;
    filter.event_type = AuditEventType::ACCESS_DENIED;
    const auto events = h.audit_store->query(filter, 10, 0);
    REQUIRE(events.size() == 1);
    CHECK(events[0].actor_id == "alice");
    CHECK(events[0].details["permission"].get<std::string>() == "use_llm");
    CHECK(events[0].details["context"].get<std::string>().find("site-2") != std::string::npos);
}

TEST_CASE("AccessGovernor: require_permission raises AccessDenied", "[governor][permission]") {
    GovernorHarness h;
    h.identity->set_current("alice");

    CHECK_NOTHROW(h.governor->require_permission(Capability::USE_LLM));
    try {
        h.governor->require_permission(Capability::MANAGE_KEYS);
        FAIL("expected AccessDenied");
    } catch (const AccessDenied& e) {
        CHECK(std::string(e.what()) == "Access denied: Actor alice lacks permission 'manage_keys'");
        CHECK(e.capability() == "manage_keys");
        CHECK(e.code() == ErrorCode::ACCESS_DENIED);
    }
}

TEST_CASE("AccessGovernor: scope listing is not audited", "[governor][permission]") {
    GovernorHarness h;
    h.identity->set_current("keeper");

    CHECK(h.governor->can_access_scope("site-2"));
    CHECK_FALSE(h.governor->can_access_scope("site-3"));

    const std::vector<std::string> all = {"site-3", "site-2", "site-1"};
    CHECK(h.governor->accessible_scopes(all) == std::vector<std::string>{"site-2", "site-1"});
    CHECK(h.count(AuditEventType::ACCESS_DENIED) == 0);

    h.identity->set_current("admin");
    CHECK(h.governor->accessible_scopes(all) == all);
}

// ============================================================================
// Quotas
// ============================================================================

TEST_CASE("AccessGovernor: counter keys carry the window label", "[governor][quota]") {
    GovernorHarness h;
    CHECK(h.governor->counter_key("alice", QuotaDimension::REQUESTS_PER_HOUR) ==
          "quota:alice:requests_per_hour:2026030112");
    CHECK(h.governor->counter_key("alice", QuotaDimension::TOKENS_PER_DAY) ==
          "quota:alice:tokens_per_day:20260301");
}

TEST_CASE("AccessGovernor: hourly request quota of 10", "[governor][quota]") {
    GovernorHarness h;
    h.identity->set_current("alice");

    std::vector<bool> allowed;
    for (int i = 0; i < 15; ++i) {
        allowed.push_back(h.governor->check_quota(QuotaDimension::REQUESTS_PER_HOUR, 10));
        h.governor->record_usage(QuotaDimension::REQUESTS_PER_HOUR);
    }

    for (int i = 0; i < 10; ++i) CHECK(static_cast<bool>(allowed[i]));
    for (int i = 10; i < 15; ++i) CHECK_FALSE(static_cast<bool>(allowed[i]));

    AuditFilter filter;
    filter.event_type = AuditEventType::QUOTA_EXCEEDED;
    const auto events = h.audit_store->query(filter, 100, 0);
    REQUIRE(events.size() == 5);
    for (const auto& e : events) {
        CHECK(e.severity == Severity::WARNING);
        CHECK(e.details["limit"].get<int64_t>() == 10);
        CHECK(e.details["quota_type"].get<std::string>() == "requests_per_hour");
    }
}

TEST_CASE("AccessGovernor: a new window starts from zero", "[governor][quota]") {
    GovernorHarness h;
    h.identity->set_current("alice");
    for (int i = 0; i < 3; ++i) h.governor->record_usage(QuotaDimension::REQUESTS_PER_HOUR);
    CHECK(h.governor->current_usage(QuotaDimension::REQUESTS_PER_HOUR) == 3);
    CHECK_FALSE(h.governor->check_quota(QuotaDimension::REQUESTS_PER_HOUR, 3));

    h.clock->advance(std::chrono::hours(1));
    CHECK(h.governor->current_usage(QuotaDimension::REQUESTS_PER_HOUR) == 0);
    CHECK(h.governor->check_quota(QuotaDimension::REQUESTS_PER_HOUR, 3));
}

TEST_CASE("AccessGovernor: token usage accumulates by amount", "[governor][quota]") {
    GovernorHarness h;
    h.identity->set_current("alice");
    h.governor->record_usage(QuotaDimension::TOKENS_PER_DAY, 1200);
    h.governor->record_usage(QuotaDimension::TOKENS_PER_DAY, 800);
    h.governor->record_usage(QuotaDimension::TOKENS_PER_DAY, 0);
    h.governor->record_usage(QuotaDimension::TOKENS_PER_DAY, -50);
    CHECK(h.governor->current_usage(QuotaDimension::TOKENS_PER_DAY) == 2000);
    CHECK(h.governor->check_quota(QuotaDimension::TOKENS_PER_DAY, 2001));
    CHECK_FALSE(h.governor->check_quota(QuotaDimension::TOKENS_PER_DAY, 2000));
}

TEST_CASE("AccessGovernor: administrators are unrestricted", "[governor][quota]") {
    GovernorHarness h;
    h.identity->set_current("admin");
    for (int i = 0; i < 5; ++i) h.governor->record_usage(QuotaDimension::REQUESTS_PER_HOUR);
    CHECK(h.governor->check_quota(QuotaDimension::REQUESTS_PER_HOUR, 1));
    CHECK(h.governor->check_quota(QuotaDimension::REQUESTS_PER_HOUR, 0));
    CHECK(h.governor->current_usage(QuotaDimension::REQUESTS_PER_HOUR) == 5);
    CHECK(h.count(AuditEventType::QUOTA_EXCEEDED) == 0);
}

TEST_CASE("AccessGovernor: an explicit zero limit allows nothing", "[governor][quota]") {
    GovernorHarness h;
    h.identity->set_current("alice");

    SECTION("before any usage") {
        CHECK_FALSE(h.governor->check_quota(QuotaDimension::REQUESTS_PER_HOUR, 0));
        CHECK_THROWS_AS(h.governor->require_quota(QuotaDimension::TOKENS_PER_DAY, 0), QuotaExceeded);
        CHECK(h.count(AuditEventType::QUOTA_EXCEEDED) == 2);
    }
    SECTION("negative limits deny as well") {
        CHECK_FALSE(h.governor->check_quota(QuotaDimension::REQUESTS_PER_DAY, -1));
        CHECK(h.count(AuditEventType::QUOTA_EXCEEDED) == 1);
    }
}

TEST_CASE("AccessGovernor: a resolved limit of zero is unlimited", "[governor][quota]") {
    GovernorHarness h;    // every configured default is 0
    h.identity->set_current("alice");
    for (int i = 0; i < 500; ++i) h.governor->record_usage(QuotaDimension::REQUESTS_PER_HOUR);
    REQUIRE(h.governor->effective_limit(QuotaDimension::REQUESTS_PER_HOUR) == 0);
    CHECK(h.governor->check_quota(QuotaDimension::REQUESTS_PER_HOUR));
    CHECK(h.count(AuditEventType::QUOTA_EXCEEDED) == 0);
}

TEST_CASE("AccessGovernor: quota checks without an actor are denied", "[governor][quota]") {
    GovernorHarness h;
    CHECK_FALSE(h.governor->check_quota(QuotaDimension::REQUESTS_PER_HOUR, 100));
    h.governor->record_usage(QuotaDimension::REQUESTS_PER_HOUR);
    CHECK(h.counters->tracked_keys() == 0);
    CHECK(h.count(AuditEventType::ACCESS_DENIED) == 1);
}

TEST_CASE("AccessGovernor: require_quota raises QuotaExceeded", "[governor][quota]") {
    GovernorHarness h;
    h.identity->set_current("alice");
    h.governor->record_usage(QuotaDimension::REQUESTS_PER_DAY, 4);

    try {
        h.governor->require_quota(QuotaDimension::REQUESTS_PER_DAY, 4);
        FAIL("expected QuotaExceeded");
    } catch (const QuotaExceeded& e) {
        CHECK(e.dimension() == "requests_per_day");
        CHECK(e.usage() == 4);
        CHECK(e.limit() == 4);
    }
}

TEST_CASE("AccessGovernor: concurrent usage recording loses no increments", "[governor][quota][concurrency]") {
    GovernorHarness h;
    h.identity->set_current("alice");

    constexpr int kThreads = 8;
    constexpr int kPerThread = 500;
    std::vector<std::thread> threads;
    for (int t = 0; t < kThreads; ++t) {
        threads.emplace_back([&] {
            for (int i = 0; i < kPerThread; ++i) {
                h.governor->record_usage(QuotaDimension::REQUESTS_PER_DAY);
            }
        });
    }
    for (auto& t : threads) t.join();

    CHECK(h.governor->current_usage(QuotaDimension::REQUESTS_PER_DAY) == kThreads * kPerThread);
}

TEST_CASE("MemoryQuotaCounterStore: concurrent increments are monotonic", "[governor][quota][concurrency]") {
    MemoryQuotaCounterStore store;
    constexpr int kThreads = 8;
    constexpr int kPerThread = 1000;

    std::vector<std::thread> threads;
    std::vector<int64_t> last_seen(kThreads, 0);
    std::vector<char> monotonic(kThreads, 1);   // not vector<bool>: written concurrently
    for (int t = 0; t < kThreads; ++t) {
        threads.emplace_back([&, t] {
            for (int i = 0; i < kPerThread; ++i) {
                const int64_t v = store.increment("quota:k", 1, std::chrono::hours(1));
                if (v <= last_seen[t]) monotonic[t] = 0;
                last_seen[t] = v;
            }
        });
    }
    for (auto& t : threads) t.join();

    CHECK(store.get("quota:k") == kThreads * kPerThread);
    for (int t = 0; t < kThreads; ++t) CHECK(monotonic[t] == 1);
}

// ============================================================================
// Limit resolution
// ============================================================================

TEST_CASE("AccessGovernor: effective limit precedence", "[governor][quota]") {
    QuotaLimits defaults;
    defaults.requests_per_hour = 100;
    GovernorHarness h(defaults);
    h.identity->set_current("alice");

    CHECK(h.governor->effective_limit(QuotaDimension::REQUESTS_PER_HOUR) == 100);
    CHECK(h.governor->effective_limit(QuotaDimension::TOKENS_PER_DAY) == 0);

    QuotaPolicy global{"global", "*", {}};
    global.limits.requests_per_hour = 50;
    h.policies->upsert(global);
    CHECK(h.governor->effective_limit(QuotaDimension::REQUESTS_PER_HOUR) == 50);

    QuotaPolicy group{"group", "writers", {}};
    group.limits.requests_per_hour = 20;
    h.policies->upsert(group);
    CHECK(h.governor->effective_limit(QuotaDimension::REQUESTS_PER_HOUR) == 20);

    QuotaPolicy user{"user", "alice", {}};
    user.limits.requests_per_hour = 5;
    h.policies->upsert(user);
    CHECK(h.governor->effective_limit(QuotaDimension::REQUESTS_PER_HOUR) == 5);

    SECTION("rows that leave a dimension unset fall through") {
        CHECK(h.governor->effective_limit(QuotaDimension::REQUESTS_PER_DAY) == 0);
    }
    SECTION("check_quota uses the resolved limit") {
        for (int i = 0; i < 5; ++i) h.governor->record_usage(QuotaDimension::REQUESTS_PER_HOUR);
        CHECK_FALSE(h.governor->check_quota(QuotaDimension::REQUESTS_PER_HOUR));
    }
}

TEST_CASE("AccessGovernor: monthly cost budget", "[governor][quota]") {
    QuotaLimits defaults;
    defaults.monthly_cost_limit = 25.0;
    GovernorHarness h(defaults);
    h.identity->set_current("alice");

    CHECK(h.governor->check_cost_budget(24.99));
    CHECK_FALSE(h.governor->check_cost_budget(25.0));

    AuditFilter filter;
    filter.event_type = AuditEventType::QUOTA_EXCEEDED;
    const auto events = h.audit_store->query(filter, 10, 0);
    REQUIRE(events.size() == 1);
    CHECK(events[0].details["quota_type"].get<std::string>() == "monthly_cost_cents");
    CHECK(events[0].details["usage"].get<int64_t>() == 2500);

    h.identity->set_current("admin");
    CHECK(h.governor->check_cost_budget(1000.0));
}
