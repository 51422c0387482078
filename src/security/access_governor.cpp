#include "security/access_governor.hpp"
#include "core/error.hpp"
#include "core/utils.hpp"

#include <cmath>
#include <format>
#include <stdexcept>

namespace llmshield {

namespace {

const char* window_pattern(QuotaDimension dimension) {
    return quota_window(dimension) >= std::chrono::seconds(86400) ? "%Y%m%d" : "%Y%m%d%H";
}

std::string scope_context(const std::optional<std::string>& scope) {
    return scope ? std::format("scope={}", *scope) : std::string("scope=none");
}

} // anonymous namespace

AccessGovernor::AccessGovernor(Config config,
                               std::shared_ptr<IIdentityProvider> identity,
                               std::shared_ptr<IQuotaCounterStore> counters,
                               std::shared_ptr<AuditTrail> audit,
                               std::shared_ptr<IQuotaPolicyStore> policies,
                               std::shared_ptr<IClock> clock)
    : config_(std::move(config)),
      identity_(std::move(identity)),
      counters_(std::move(counters)),
      audit_(std::move(audit)),
      policies_(std::move(policies)),
      clock_(clock ? std::move(clock) : std::make_shared<SystemClock>()) {
    if (!identity_ || !counters_ || !audit_) {
        throw std::invalid_argument(
            "AccessGovernor requires an identity provider, a counter store and an audit trail");
    }
}

// ============================================================================
// Permissions
// ============================================================================

bool AccessGovernor::grants(const Actor& actor, Capability capability) {
    if (actor.is_admin) return true;
    if (actor.grants.contains(Capability::ADMIN_ALL) || actor.grants.contains(capability)) {
        return true;
    }
    for (const auto& group : actor.groups) {
        if (group.grants.contains(Capability::ADMIN_ALL) || group.grants.contains(capability)) {
            return true;
        }
    }
    return false;
}

bool AccessGovernor::has_permission(Capability capability,
                                    const std::optional<std::string>& scope) const {
    const auto actor = identity_->current_actor();
    if (!actor) {
        audit_->log_access_denied(capability_to_string(capability),
            std::format("no authenticated actor, {}", scope_context(scope)));
        return false;
    }

    if (!grants(*actor, capability)) {
        audit_->log_access_denied(capability_to_string(capability), scope_context(scope));
        return false;
    }

    if (scope && !actor->is_admin && !actor->scopes.contains(*scope)) {
        audit_->log_access_denied(capability_to_string(capability),
            std::format("{}, not a member", scope_context(scope)));
        return false;
    }
    return true;
}

void AccessGovernor::require_permission(Capability capability,
                                        const std::optional<std::string>& scope) const {
    if (has_permission(capability, scope)) return;

    const auto actor = identity_->current_actor();
    throw AccessDenied(std::format("Access denied: Actor {} lacks permission '{}'",
                                   actor ? actor->id : std::string("anonymous"),
                                   capability_to_string(capability)),
                       capability_to_string(capability));
}

bool AccessGovernor::can_use_llm(const std::optional<std::string>& scope) const {
    return has_permission(Capability::USE_LLM, scope);
}

bool AccessGovernor::can_configure_prompts(const std::optional<std::string>& scope) const {
    return has_permission(Capability::CONFIGURE_PROMPTS, scope);
}

bool AccessGovernor::can_manage_keys(const std::optional<std::string>& scope) const {
    return has_permission(Capability::MANAGE_KEYS, scope);
}

bool AccessGovernor::can_view_reports(const std::optional<std::string>& scope) const {
    return has_permission(Capability::VIEW_REPORTS, scope);
}

bool AccessGovernor::can_access_scope(const std::string& scope) const {
    const auto actor = identity_->current_actor();
    if (!actor) return false;
    return actor->is_admin || actor->scopes.contains(scope);
}

std::vector<std::string> AccessGovernor::accessible_scopes(
    const std::vector<std::string>& all_scopes) const {
    const auto actor = identity_->current_actor();
    std::vector<std::string> result;
    if (!actor) return result;
    for (const auto& scope : all_scopes) {
        if (actor->is_admin || actor->scopes.contains(scope)) {
            result.push_back(scope);
        }
    }
    return result;
}

// ============================================================================
// Quotas
// ============================================================================

std::string AccessGovernor::counter_key(const std::string& actor_id,
                                        QuotaDimension dimension) const {
    return std::format("quota:{}:{}:{}", actor_id, quota_dimension_to_string(dimension),
                       utils::format_utc(clock_->now(), window_pattern(dimension)));
}

bool AccessGovernor::check_quota(QuotaDimension dimension, int64_t limit) const {
    const auto actor = identity_->current_actor();
    if (!actor) {
        audit_->log_access_denied(quota_dimension_to_string(dimension), "no authenticated actor");
        return false;
    }
    if (actor->is_admin) return true;

    const int64_t usage = counters_->get(counter_key(actor->id, dimension));
    if (usage >= limit) {
        audit_->log_quota_exceeded(actor->id, quota_dimension_to_string(dimension), usage, limit);
        return false;
    }
    return true;
}

bool AccessGovernor::check_quota(QuotaDimension dimension) const {
    const int64_t limit = effective_limit(dimension);
    if (limit <= 0) return true;    // unlimited
    return check_quota(dimension, limit);
}

void AccessGovernor::require_quota(QuotaDimension dimension, int64_t limit) const {
    if (check_quota(dimension, limit)) return;
    throw QuotaExceeded(std::format("Quota exceeded: {} limit is {}",
                                    quota_dimension_to_string(dimension), limit),
                        quota_dimension_to_string(dimension),
                        current_usage(dimension), limit);
}

void AccessGovernor::record_usage(QuotaDimension dimension, int64_t amount) {
    const auto actor = identity_->current_actor();
    if (!actor || amount <= 0) return;
    counters_->increment(counter_key(actor->id, dimension), amount, quota_window(dimension));
}

int64_t AccessGovernor::current_usage(QuotaDimension dimension) const {
    const auto actor = identity_->current_actor();
    if (!actor) return 0;
    return counters_->get(counter_key(actor->id, dimension));
}

std::optional<QuotaPolicy> AccessGovernor::find_policy(const std::string& type,
                                                       const std::string& id) const {
    if (!policies_) return std::nullopt;
    return policies_->find(type, id);
}

int64_t AccessGovernor::effective_limit(QuotaDimension dimension) const {
    const auto actor = identity_->current_actor();
    if (actor) {
        if (const auto row = find_policy("user", actor->id)) {
            if (const int64_t limit = row->limits.limit_for(dimension); limit > 0) return limit;
        }
        for (const auto& group : actor->groups) {
            if (const auto row = find_policy("group", group.id)) {
                if (const int64_t limit = row->limits.limit_for(dimension); limit > 0) return limit;
            }
        }
    }
    if (const auto row = find_policy("global", "*")) {
        if (const int64_t limit = row->limits.limit_for(dimension); limit > 0) return limit;
    }
    return config_.defaults.limit_for(dimension);
}

bool AccessGovernor::check_cost_budget(double spent_this_month) const {
    const auto actor = identity_->current_actor();
    if (!actor) return false;
    if (actor->is_admin) return true;

    double limit = config_.defaults.monthly_cost_limit;
    if (const auto row = find_policy("user", actor->id); row && row->limits.monthly_cost_limit > 0) {
        limit = row->limits.monthly_cost_limit;
    } else if (const auto global = find_policy("global", "*");
               global && global->limits.monthly_cost_limit > 0) {
        limit = global->limits.monthly_cost_limit;
    }
    if (limit <= 0 || spent_this_month < limit) return true;

    // usage and limit audited in cents
    audit_->log_quota_exceeded(actor->id, "monthly_cost_cents",
                               static_cast<int64_t>(std::llround(spent_this_month * 100.0)),
                               static_cast<int64_t>(std::llround(limit * 100.0)));
    return false;
}

} // namespace llmshield
