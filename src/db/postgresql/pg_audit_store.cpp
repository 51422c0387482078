#include "db/postgresql/pg_audit_store.hpp"
#include "core/error.hpp"
#include "core/utils.hpp"

#include <format>

namespace llmshield {

namespace {

constexpr const char* kAnonymizeSet =
    "UPDATE audit_events SET actor_id = '', actor_name = '', source_address = '', "
    "user_agent = '', anonymized = TRUE ";

AuditEvent event_from(const std::vector<std::string>& r) {
    AuditEvent event;
    event.id = utils::parse_int<int64_t>(r[0]);
    event.event_type = parse_audit_event_type(r[1]).value_or(AuditEventType::SUSPICIOUS_ACTIVITY);
    event.severity = static_cast<Severity>(utils::parse_int<int>(r[2]));
    event.message = r[3];
    event.actor_id = r[4];
    event.actor_name = r[5];
    event.source_address = r[6];
    event.user_agent = r[7];
    try {
        event.details = JsonValue::parse(r[8]);
    } catch (const JsonValue::parse_error& e) {
        utils::log::warn(std::format("PgAuditStore: unreadable details on event {}: {}",
                                     event.id, e.what()));
    }
    event.created_at = pg::parse_time(r[9]);
    event.anonymized = pg::parse_bool(r[10]);
    return event;
}

} // anonymous namespace

PgAuditStore::PgAuditStore(std::shared_ptr<PgConnection> conn) : conn_(std::move(conn)) {
    if (!conn_) {
        throw StorageUnavailable("PgAuditStore requires a connection");
    }
}

int64_t PgAuditStore::append(const AuditEvent& event) {
    const auto rs = conn_->execute(
        "INSERT INTO audit_events (event_type, severity, message, actor_id, actor_name, "
        "source_address, user_agent, detail_json, created_at, anonymized) "
        "VALUES ($1, $2, $3, $4, $5, $6, $7, $8, to_timestamp($9), $10) RETURNING id",
        {audit_event_type_to_string(event.event_type),
         std::to_string(static_cast<int>(event.severity)),
         event.message, event.actor_id, event.actor_name, event.source_address,
         event.user_agent, event.details.dump(), pg::time_param(event.created_at),
         pg::bool_param(event.anonymized)});
    if (rs.empty()) {
        throw StorageUnavailable("audit_events insert returned no id");
    }
    return utils::parse_int<int64_t>(rs.rows.front()[0]);
}

std::vector<AuditEvent> PgAuditStore::query(const AuditFilter& filter,
                                            size_t limit, size_t offset) const {
    std::string sql =
        "SELECT id, event_type, severity, message, actor_id, actor_name, source_address, "
        "user_agent, detail_json, extract(epoch from created_at), anonymized "
        "FROM audit_events WHERE TRUE";
    PgConnection::Params params;
    // appends "<column> $n<suffix>" and binds value as $n
    auto bind = [&](std::string_view column, std::string_view suffix, std::string value) {
        params.emplace_back(std::move(value));
        sql += std::format(" AND {}${}{}", column, params.size(), suffix);
    };

    if (filter.event_type) {
        bind("event_type = ", "", audit_event_type_to_string(*filter.event_type));
    }
    if (filter.actor_id) {
        bind("actor_id = ", "", *filter.actor_id);
    }
    if (filter.min_severity) {
        bind("severity >= ", "::smallint", std::to_string(static_cast<int>(*filter.min_severity)));
    }
    if (filter.from) {
        bind("created_at >= to_timestamp(", ")", pg::time_param(*filter.from));
    }
    if (filter.to) {
        bind("created_at <= to_timestamp(", ")", pg::time_param(*filter.to));
    }
    sql += std::format(" ORDER BY created_at DESC, id DESC LIMIT {} OFFSET {}", limit, offset);

    const auto rs = conn_->execute(sql, params);
    std::vector<AuditEvent> events;
    events.reserve(rs.rows.size());
    for (const auto& r : rs.rows) {
        events.push_back(event_from(r));
    }
    return events;
}

size_t PgAuditStore::anonymize_before(std::chrono::system_clock::time_point threshold) {
    return conn_->execute(
        std::string(kAnonymizeSet) + "WHERE NOT anonymized AND created_at < to_timestamp($1)",
        {pg::time_param(threshold)}).affected_rows;
}

size_t PgAuditStore::anonymize_actor(const std::string& actor_id) {
    return conn_->execute(
        std::string(kAnonymizeSet) + "WHERE NOT anonymized AND actor_id = $1",
        {actor_id}).affected_rows;
}

size_t PgAuditStore::purge_before(std::chrono::system_clock::time_point threshold) {
    return conn_->execute("DELETE FROM audit_events WHERE created_at < to_timestamp($1)",
                          {pg::time_param(threshold)}).affected_rows;
}

} // namespace llmshield
