#include "db/postgresql/pg_quota_store.hpp"
#include "core/error.hpp"
#include "core/utils.hpp"

#include <format>

namespace llmshield {

namespace {

constexpr const char* kPolicyColumns =
    "SELECT scope_type, scope_id, requests_per_hour, requests_per_day, tokens_per_hour, "
    "tokens_per_day, monthly_cost_limit FROM quotas";

QuotaPolicy policy_from(const std::vector<std::string>& r) {
    QuotaPolicy policy;
    policy.scope_type = r[0];
    policy.scope_id = r[1];
    policy.limits.requests_per_hour = utils::parse_int<int64_t>(r[2]);
    policy.limits.requests_per_day = utils::parse_int<int64_t>(r[3]);
    policy.limits.tokens_per_hour = utils::parse_int<int64_t>(r[4]);
    policy.limits.tokens_per_day = utils::parse_int<int64_t>(r[5]);
    policy.limits.monthly_cost_limit = r[6].empty() ? 0.0 : std::stod(r[6]);
    return policy;
}

} // anonymous namespace

// ============================================================================
// PgQuotaPolicyStore
// ============================================================================

PgQuotaPolicyStore::PgQuotaPolicyStore(std::shared_ptr<PgConnection> conn)
    : conn_(std::move(conn)) {
    if (!conn_) {
        throw StorageUnavailable("PgQuotaPolicyStore requires a connection");
    }
}

std::optional<QuotaPolicy> PgQuotaPolicyStore::find(const std::string& scope_type,
                                                    const std::string& scope_id) const {
    const auto rs = conn_->execute(
        std::format("{} WHERE scope_type = $1 AND scope_id = $2", kPolicyColumns),
        {scope_type, scope_id});
    if (rs.empty()) return std::nullopt;
    return policy_from(rs.rows.front());
}

void PgQuotaPolicyStore::upsert(const QuotaPolicy& policy) {
    conn_->execute(
        "INSERT INTO quotas (scope_type, scope_id, requests_per_hour, requests_per_day, "
        "tokens_per_hour, tokens_per_day, monthly_cost_limit) "
        "VALUES ($1, $2, $3, $4, $5, $6, $7) "
        "ON CONFLICT (scope_type, scope_id) DO UPDATE SET "
        "requests_per_hour = EXCLUDED.requests_per_hour, "
        "requests_per_day = EXCLUDED.requests_per_day, "
        "tokens_per_hour = EXCLUDED.tokens_per_hour, "
        "tokens_per_day = EXCLUDED.tokens_per_day, "
        "monthly_cost_limit = EXCLUDED.monthly_cost_limit",
        {policy.scope_type, policy.scope_id,
         std::to_string(policy.limits.requests_per_hour),
         std::to_string(policy.limits.requests_per_day),
         std::to_string(policy.limits.tokens_per_hour),
         std::to_string(policy.limits.tokens_per_day),
         std::format("{}", policy.limits.monthly_cost_limit)});
}

std::vector<QuotaPolicy> PgQuotaPolicyStore::list() const {
    const auto rs = conn_->execute(std::format("{} ORDER BY scope_type, scope_id", kPolicyColumns));
    std::vector<QuotaPolicy> policies;
    policies.reserve(rs.rows.size());
    for (const auto& r : rs.rows) {
        policies.push_back(policy_from(r));
    }
    return policies;
}

// ============================================================================
// PgQuotaCounterStore
// ============================================================================

PgQuotaCounterStore::PgQuotaCounterStore(std::shared_ptr<PgConnection> conn)
    : conn_(std::move(conn)) {
    if (!conn_) {
        throw StorageUnavailable("PgQuotaCounterStore requires a connection");
    }
}

int64_t PgQuotaCounterStore::increment(const std::string& key, int64_t amount,
                                       std::chrono::seconds ttl) {
    const auto rs = conn_->execute(
        "INSERT INTO quota_counters (key, value, expires_at) "
        "VALUES ($1, $2, now() + make_interval(secs => $3)) "
        "ON CONFLICT (key) DO UPDATE SET "
        "value = CASE WHEN quota_counters.expires_at <= now() THEN EXCLUDED.value "
        "             ELSE quota_counters.value + EXCLUDED.value END, "
        "expires_at = CASE WHEN quota_counters.expires_at <= now() THEN EXCLUDED.expires_at "
        "                  ELSE quota_counters.expires_at END "
        "RETURNING value",
        {key, std::to_string(amount), std::to_string(ttl.count())});
    if (rs.empty()) {
        throw StorageUnavailable("quota counter upsert returned no value");
    }
    return utils::parse_int<int64_t>(rs.rows.front()[0]);
}

int64_t PgQuotaCounterStore::get(const std::string& key) const {
    const auto rs = conn_->execute(
        "SELECT value FROM quota_counters WHERE key = $1 AND expires_at > now()", {key});
    if (rs.empty()) return 0;
    return utils::parse_int<int64_t>(rs.rows.front()[0]);
}

size_t PgQuotaCounterStore::purge_expired() {
    return conn_->execute("DELETE FROM quota_counters WHERE expires_at <= now()").affected_rows;
}

} // namespace llmshield
