#pragma once

#include "audit/audit_trail.hpp"
#include "auth/iidentity_provider.hpp"
#include "core/clock.hpp"
#include "core/types.hpp"
#include "security/quota_counter_store.hpp"
#include "security/quota_policy_store.hpp"

#include <cstdint>
#include <memory>
#include <optional>
#include <string>
#include <vector>

namespace llmshield {

/**
 * @brief Permission and quota gate in front of every LLM request
 *
 * Permission resolution order:
 *   1. administrator flag grants everything
 *   2. admin_all (direct or via a group) grants everything
 *   3. the capability itself, direct grants first, then groups in order
 *   4. with a scope context, the actor must also be a member of that scope
 *
 * Queries (has_permission, check_quota) return bool and audit every
 * denial. require_permission raises AccessDenied; require_quota raises
 * QuotaExceeded.
 *
 * Quota counters live in an IQuotaCounterStore keyed by
 * "quota:{actor}:{dimension}:{window label}" with a TTL equal to the
 * window, so a new window starts from zero.
 */
class AccessGovernor {
public:
    struct Config {
        QuotaLimits defaults;       // used when no quota policy row applies
    };

    AccessGovernor(Config config,
                   std::shared_ptr<IIdentityProvider> identity,
                   std::shared_ptr<IQuotaCounterStore> counters,
                   std::shared_ptr<AuditTrail> audit,
                   std::shared_ptr<IQuotaPolicyStore> policies = nullptr,
                   std::shared_ptr<IClock> clock = nullptr);

    // ---- Permissions -------------------------------------------------------

    [[nodiscard]] bool has_permission(Capability capability,
                                      const std::optional<std::string>& scope = std::nullopt) const;

    /// @throws AccessDenied
    void require_permission(Capability capability,
                            const std::optional<std::string>& scope = std::nullopt) const;

    [[nodiscard]] bool can_use_llm(const std::optional<std::string>& scope = std::nullopt) const;
    [[nodiscard]] bool can_configure_prompts(const std::optional<std::string>& scope = std::nullopt) const;
    [[nodiscard]] bool can_manage_keys(const std::optional<std::string>& scope = std::nullopt) const;
    [[nodiscard]] bool can_view_reports(const std::optional<std::string>& scope = std::nullopt) const;

    /// Scope membership only (no capability); not audited.
    [[nodiscard]] bool can_access_scope(const std::string& scope) const;

    /// Subset of all_scopes the current actor may access, order preserved.
    [[nodiscard]] std::vector<std::string> accessible_scopes(
        const std::vector<std::string>& all_scopes) const;

    // ---- Quotas ------------------------------------------------------------

    /// False (and audited at warning) when usage in the current window >= limit.
    /// An explicit limit of 0 allows nothing.
    [[nodiscard]] bool check_quota(QuotaDimension dimension, int64_t limit) const;

    /// As above with effective_limit(dimension); a resolved limit of 0 is unlimited.
    [[nodiscard]] bool check_quota(QuotaDimension dimension) const;

    /// @throws QuotaExceeded
    void require_quota(QuotaDimension dimension, int64_t limit) const;

    void record_usage(QuotaDimension dimension, int64_t amount = 1);

    [[nodiscard]] int64_t current_usage(QuotaDimension dimension) const;

    /// User row, then group rows, then the global row, then configured defaults.
    [[nodiscard]] int64_t effective_limit(QuotaDimension dimension) const;

    /// False (and audited) when spent_this_month reaches the monthly cost limit.
    [[nodiscard]] bool check_cost_budget(double spent_this_month) const;

    [[nodiscard]] std::string counter_key(const std::string& actor_id,
                                          QuotaDimension dimension) const;

private:
    [[nodiscard]] static bool grants(const Actor& actor, Capability capability);
    [[nodiscard]] std::optional<QuotaPolicy> find_policy(const std::string& type,
                                                         const std::string& id) const;

    Config config_;
    std::shared_ptr<IIdentityProvider> identity_;
    std::shared_ptr<IQuotaCounterStore> counters_;
    std::shared_ptr<AuditTrail> audit_;
    std::shared_ptr<IQuotaPolicyStore> policies_;
    std::shared_ptr<IClock> clock_;
};

} // namespace llmshield
