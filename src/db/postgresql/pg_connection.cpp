#include "db/postgresql/pg_connection.hpp"
#include "core/error.hpp"
#include "core/utils.hpp"

#include <cstring>
#include <format>

namespace llmshield {

namespace {

struct PgResultDeleter {
    void operator()(PGresult* res) const { PQclear(res); }
};
using PgResultPtr = std::unique_ptr<PGresult, PgResultDeleter>;

constexpr const char* kSchemaDdl = R"SQL(
CREATE TABLE IF NOT EXISTS secrets (
    id              BIGSERIAL PRIMARY KEY,
    provider        VARCHAR(50)  NOT NULL,
    scope           VARCHAR(255) NOT NULL,
    ciphertext      BYTEA        NOT NULL,
    iv              BYTEA        NOT NULL,
    tag             BYTEA        NOT NULL,
    metadata_json   TEXT         NOT NULL DEFAULT '{}',
    last_rotated_at TIMESTAMPTZ  NOT NULL,
    created_at      TIMESTAMPTZ  NOT NULL,
    updated_at      TIMESTAMPTZ  NOT NULL,
    deleted         BOOLEAN      NOT NULL DEFAULT FALSE
);
CREATE UNIQUE INDEX IF NOT EXISTS secrets_live_identity
    ON secrets (provider, scope) WHERE NOT deleted;

CREATE TABLE IF NOT EXISTS audit_events (
    id              BIGSERIAL PRIMARY KEY,
    event_type      VARCHAR(50)  NOT NULL,
    severity        SMALLINT     NOT NULL,
    message         TEXT         NOT NULL,
    actor_id        VARCHAR(255) NOT NULL DEFAULT '',
    actor_name      VARCHAR(255) NOT NULL DEFAULT '',
    source_address  VARCHAR(64)  NOT NULL DEFAULT '',
    user_agent      TEXT         NOT NULL DEFAULT '',
    detail_json     TEXT         NOT NULL DEFAULT '{}',
    created_at      TIMESTAMPTZ  NOT NULL,
    anonymized      BOOLEAN      NOT NULL DEFAULT FALSE
);
CREATE INDEX IF NOT EXISTS audit_events_type ON audit_events (event_type);
CREATE INDEX IF NOT EXISTS audit_events_actor ON audit_events (actor_id);
CREATE INDEX IF NOT EXISTS audit_events_severity ON audit_events (severity);
CREATE INDEX IF NOT EXISTS audit_events_created ON audit_events (created_at);
CREATE INDEX IF NOT EXISTS audit_events_anonymized ON audit_events (anonymized);

CREATE TABLE IF NOT EXISTS usage (
    id                BIGSERIAL PRIMARY KEY,
    actor_id          VARCHAR(255) NOT NULL DEFAULT '',
    scope_id          VARCHAR(255) NOT NULL DEFAULT '',
    provider          VARCHAR(50)  NOT NULL DEFAULT '',
    model             VARCHAR(100) NOT NULL DEFAULT '',
    prompt_tokens     BIGINT       NOT NULL DEFAULT 0,
    completion_tokens BIGINT       NOT NULL DEFAULT 0,
    total_tokens      BIGINT       NOT NULL DEFAULT 0,
    estimated_cost    DOUBLE PRECISION NOT NULL DEFAULT 0,
    duration_seconds  DOUBLE PRECISION NOT NULL DEFAULT 0,
    status            VARCHAR(20)  NOT NULL DEFAULT 'success',
    error_message     TEXT         NOT NULL DEFAULT '',
    created_at        TIMESTAMPTZ  NOT NULL
);
CREATE INDEX IF NOT EXISTS usage_actor_created ON usage (actor_id, created_at);

CREATE TABLE IF NOT EXISTS quotas (
    scope_type         VARCHAR(20)  NOT NULL,
    scope_id           VARCHAR(255) NOT NULL,
    requests_per_hour  BIGINT NOT NULL DEFAULT 0,
    requests_per_day   BIGINT NOT NULL DEFAULT 0,
    tokens_per_hour    BIGINT NOT NULL DEFAULT 0,
    tokens_per_day     BIGINT NOT NULL DEFAULT 0,
    monthly_cost_limit DOUBLE PRECISION NOT NULL DEFAULT 0,
    PRIMARY KEY (scope_type, scope_id)
);

CREATE TABLE IF NOT EXISTS quota_counters (
    key        VARCHAR(512) PRIMARY KEY,
    value      BIGINT       NOT NULL,
    expires_at TIMESTAMPTZ  NOT NULL
);
)SQL";

} // anonymous namespace

// ============================================================================
// PgConnection
// ============================================================================

std::shared_ptr<PgConnection> PgConnection::connect(const std::string& connection_string) {
    PGconn* conn = PQconnectdb(connection_string.c_str());
    if (!conn) {
        throw StorageUnavailable("Failed to allocate PGconn");
    }
    if (PQstatus(conn) != CONNECTION_OK) {
        std::string error = PQerrorMessage(conn);
        PQfinish(conn);
        throw StorageUnavailable(std::format("Failed to connect to PostgreSQL: {}", error));
    }
    return std::make_shared<PgConnection>(conn);
}

PgConnection::PgConnection(PGconn* conn) : conn_(conn) {}

PgConnection::~PgConnection() {
    close();
}

void PgConnection::reconnect_if_needed() {
    if (!conn_) {
        throw StorageUnavailable("PostgreSQL connection is closed");
    }
    if (PQstatus(conn_) == CONNECTION_OK) return;

    utils::log::warn("PgConnection: connection lost, resetting");
    PQreset(conn_);
    if (PQstatus(conn_) != CONNECTION_OK) {
        throw StorageUnavailable(std::format("PostgreSQL unavailable: {}", PQerrorMessage(conn_)));
    }
}

DbResultSet PgConnection::execute(const std::string& sql, const Params& params) {
    std::lock_guard lock(mutex_);
    reconnect_if_needed();

    std::vector<const char*> values;
    values.reserve(params.size());
    for (const auto& p : params) {
        values.push_back(p ? p->c_str() : nullptr);
    }

    PgResultPtr res(PQexecParams(conn_, sql.c_str(), static_cast<int>(values.size()),
                                 nullptr, values.data(), nullptr, nullptr, 0));
    if (!res) {
        throw StorageUnavailable(std::format("PostgreSQL error: {}", PQerrorMessage(conn_)));
    }

    const ExecStatusType status = PQresultStatus(res.get());
    if (status != PGRES_TUPLES_OK && status != PGRES_COMMAND_OK) {
        throw StorageUnavailable(std::format("PostgreSQL error: {}",
                                             PQresultErrorMessage(res.get())));
    }

    DbResultSet result;
    const int ncols = PQnfields(res.get());
    for (int i = 0; i < ncols; ++i) {
        result.column_names.emplace_back(PQfname(res.get(), i));
    }
    const int nrows = PQntuples(res.get());
    result.rows.reserve(static_cast<size_t>(nrows));
    for (int i = 0; i < nrows; ++i) {
        std::vector<std::string> row;
        row.reserve(static_cast<size_t>(ncols));
        for (int j = 0; j < ncols; ++j) {
            row.emplace_back(PQgetisnull(res.get(), i, j) ? "" : PQgetvalue(res.get(), i, j));
        }
        result.rows.push_back(std::move(row));
    }

    const char* affected = PQcmdTuples(res.get());
    if (affected && std::strlen(affected) > 0) {
        result.affected_rows = std::stoull(affected);
    }
    return result;
}

void PgConnection::execute_script(const std::string& sql) {
    std::lock_guard lock(mutex_);
    reconnect_if_needed();

    PgResultPtr res(PQexec(conn_, sql.c_str()));
    if (!res || PQresultStatus(res.get()) != PGRES_COMMAND_OK) {
        throw StorageUnavailable(std::format("PostgreSQL script failed: {}", PQerrorMessage(conn_)));
    }
}

bool PgConnection::is_connected() const {
    std::lock_guard lock(mutex_);
    return conn_ != nullptr && PQstatus(conn_) == CONNECTION_OK;
}

void PgConnection::close() {
    std::lock_guard lock(mutex_);
    if (conn_) {
        PQfinish(conn_);
        conn_ = nullptr;
    }
}

void ensure_schema(PgConnection& conn) {
    conn.execute_script(kSchemaDdl);
    utils::log::info("PostgreSQL schema ready");
}

} // namespace llmshield
