#include "usage/usage_ledger.hpp"

#include <mutex>
#include <stdexcept>

namespace llmshield {

// ============================================================================
// MemoryUsageStore
// ============================================================================

int64_t MemoryUsageStore::append(const UsageRecord& record) {
    std::unique_lock lock(mutex_);
    auto& row = records_.emplace_back(record);
    row.id = next_id_++;
    return row.id;
}

UsageSummary MemoryUsageStore::summarize(const std::optional<std::string>& actor_id,
                                         std::chrono::system_clock::time_point since) const {
    std::shared_lock lock(mutex_);
    UsageSummary summary;
    for (const auto& row : records_) {
        if (row.created_at < since) continue;
        if (actor_id && row.actor_id != *actor_id) continue;
        ++summary.requests;
        summary.prompt_tokens += row.prompt_tokens;
        summary.completion_tokens += row.completion_tokens;
        summary.total_tokens += row.total_tokens;
        summary.estimated_cost += row.estimated_cost;
        if (row.status == "error") ++summary.errors;
    }
    return summary;
}

size_t MemoryUsageStore::size() const {
    std::shared_lock lock(mutex_);
    return records_.size();
}

// ============================================================================
// UsageLedger
// ============================================================================

UsageLedger::UsageLedger(std::shared_ptr<IUsageStore> store,
                         std::shared_ptr<IIdentityProvider> identity,
                         std::shared_ptr<IClock> clock)
    : store_(std::move(store)),
      identity_(std::move(identity)),
      clock_(clock ? std::move(clock) : std::make_shared<SystemClock>()) {
    if (!store_) {
        throw std::invalid_argument("UsageLedger requires a usage store");
    }
}

int64_t UsageLedger::record(UsageRecord record) {
    if (record.actor_id.empty() && identity_) {
        if (const auto actor = identity_->current_actor()) {
            record.actor_id = actor->id;
        }
    }
    if (record.created_at == std::chrono::system_clock::time_point{}) {
        record.created_at = clock_->now();
    }
    if (record.total_tokens == 0) {
        record.total_tokens = record.prompt_tokens + record.completion_tokens;
    }
    return store_->append(record);
}

UsageSummary UsageLedger::summarize(const std::optional<std::string>& actor_id,
                                    std::chrono::system_clock::time_point since) const {
    return store_->summarize(actor_id, since);
}

double UsageLedger::month_to_date_cost(const std::string& actor_id) const {
    const auto today = std::chrono::floor<std::chrono::days>(clock_->now());
    const std::chrono::year_month_day ymd{today};
    const std::chrono::sys_days month_start{ymd.year() / ymd.month() / std::chrono::day{1}};
    return store_->summarize(actor_id, month_start).estimated_cost;
}

} // namespace llmshield
