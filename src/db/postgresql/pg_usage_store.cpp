#include "db/postgresql/pg_usage_store.hpp"
#include "core/error.hpp"
#include "core/utils.hpp"

#include <format>

namespace llmshield {

PgUsageStore::PgUsageStore(std::shared_ptr<PgConnection> conn) : conn_(std::move(conn)) {
    if (!conn_) {
        throw StorageUnavailable("PgUsageStore requires a connection");
    }
}

int64_t PgUsageStore::append(const UsageRecord& record) {
    const auto rs = conn_->execute(
        "INSERT INTO usage (actor_id, scope_id, provider, model, prompt_tokens, "
        "completion_tokens, total_tokens, estimated_cost, duration_seconds, status, "
        "error_message, created_at) "
        "VALUES ($1, $2, $3, $4, $5, $6, $7, $8, $9, $10, $11, to_timestamp($12)) RETURNING id",
        {record.actor_id, record.scope_id, record.provider, record.model,
         std::to_string(record.prompt_tokens), std::to_string(record.completion_tokens),
         std::to_string(record.total_tokens), std::format("{}", record.estimated_cost),
         std::format("{}", record.duration_seconds), record.status, record.error_message,
         pg::time_param(record.created_at)});
    if (rs.empty()) {
        throw StorageUnavailable("usage insert returned no id");
    }
    return utils::parse_int<int64_t>(rs.rows.front()[0]);
}

UsageSummary PgUsageStore::summarize(const std::optional<std::string>& actor_id,
                                     std::chrono::system_clock::time_point since) const {
    constexpr const char* kAggregate =
        "SELECT count(*), coalesce(sum(prompt_tokens), 0), coalesce(sum(completion_tokens), 0), "
        "coalesce(sum(total_tokens), 0), coalesce(sum(estimated_cost), 0), "
        "count(*) FILTER (WHERE status = 'error') FROM usage WHERE created_at >= to_timestamp($1)";

    const auto rs = actor_id
        ? conn_->execute(std::string(kAggregate) + " AND actor_id = $2",
                         {pg::time_param(since), *actor_id})
        : conn_->execute(kAggregate, {pg::time_param(since)});

    UsageSummary summary;
    if (rs.empty()) return summary;
    const auto& r = rs.rows.front();
    summary.requests = utils::parse_int<uint64_t>(r[0]);
    summary.prompt_tokens = utils::parse_int<int64_t>(r[1]);
    summary.completion_tokens = utils::parse_int<int64_t>(r[2]);
    summary.total_tokens = utils::parse_int<int64_t>(r[3]);
    summary.estimated_cost = r[4].empty() ? 0.0 : std::stod(r[4]);
    summary.errors = utils::parse_int<uint64_t>(r[5]);
    return summary;
}

} // namespace llmshield
