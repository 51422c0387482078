#include "db/postgresql/pg_secret_store.hpp"
#include "core/error.hpp"
#include "core/utils.hpp"

#include <format>

namespace llmshield {

namespace {

constexpr const char* kSelectColumns =
    "SELECT id, provider, scope, encode(ciphertext, 'base64'), encode(iv, 'base64'), "
    "encode(tag, 'base64'), metadata_json, extract(epoch from last_rotated_at), "
    "extract(epoch from created_at), extract(epoch from updated_at) FROM secrets";

EncryptedSecret row_from(const std::vector<std::string>& r) {
    EncryptedSecret row;
    row.id = utils::parse_int<int64_t>(r[0]);
    row.provider = r[1];
    row.scope = r[2];
    row.ciphertext = pg::parse_bytes(r[3]);
    row.iv = pg::parse_bytes(r[4]);
    row.tag = pg::parse_bytes(r[5]);
    try {
        row.metadata = JsonValue::parse(r[6]);
    } catch (const JsonValue::parse_error& e) {
        utils::log::warn(std::format("PgSecretStore: unreadable metadata for {}/{}: {}",
                                     row.provider, row.scope, e.what()));
        row.metadata = JsonValue::object();
    }
    row.last_rotated_at = pg::parse_time(r[7]);
    row.created_at = pg::parse_time(r[8]);
    row.updated_at = pg::parse_time(r[9]);
    return row;
}

} // anonymous namespace

PgSecretStore::PgSecretStore(std::shared_ptr<PgConnection> conn) : conn_(std::move(conn)) {
    if (!conn_) {
        throw StorageUnavailable("PgSecretStore requires a connection");
    }
}

std::optional<EncryptedSecret> PgSecretStore::find(const std::string& provider,
                                                   const std::string& scope) const {
    const auto rs = conn_->execute(
        std::format("{} WHERE provider = $1 AND scope = $2 AND NOT deleted", kSelectColumns),
        {provider, scope});
    if (rs.empty()) return std::nullopt;
    return row_from(rs.rows.front());
}

bool PgSecretStore::insert(EncryptedSecret& row) {
    const auto rs = conn_->execute(
        "INSERT INTO secrets (provider, scope, ciphertext, iv, tag, metadata_json, "
        "last_rotated_at, created_at, updated_at, deleted) "
        "VALUES ($1, $2, decode($3, 'base64'), decode($4, 'base64'), decode($5, 'base64'), $6, "
        "to_timestamp($7), to_timestamp($8), to_timestamp($9), FALSE) "
        "ON CONFLICT (provider, scope) WHERE NOT deleted DO NOTHING RETURNING id",
        {row.provider, row.scope, pg::bytes_param(row.ciphertext), pg::bytes_param(row.iv),
         pg::bytes_param(row.tag), row.metadata.dump(), pg::time_param(row.last_rotated_at),
         pg::time_param(row.created_at), pg::time_param(row.updated_at)});
    if (rs.empty()) return false;
    row.id = utils::parse_int<int64_t>(rs.rows.front()[0]);
    return true;
}

bool PgSecretStore::replace(const EncryptedSecret& row) {
    const auto rs = conn_->execute(
        "UPDATE secrets SET ciphertext = decode($3, 'base64'), iv = decode($4, 'base64'), "
        "tag = decode($5, 'base64'), metadata_json = $6, last_rotated_at = to_timestamp($7), "
        "updated_at = to_timestamp($8) "
        "WHERE provider = $1 AND scope = $2 AND NOT deleted",
        {row.provider, row.scope, pg::bytes_param(row.ciphertext), pg::bytes_param(row.iv),
         pg::bytes_param(row.tag), row.metadata.dump(), pg::time_param(row.last_rotated_at),
         pg::time_param(row.updated_at)});
    return rs.affected_rows > 0;
}

bool PgSecretStore::soft_delete(const std::string& provider, const std::string& scope,
                                std::chrono::system_clock::time_point when) {
    const auto rs = conn_->execute(
        "UPDATE secrets SET deleted = TRUE, updated_at = to_timestamp($3) "
        "WHERE provider = $1 AND scope = $2 AND NOT deleted",
        {provider, scope, pg::time_param(when)});
    return rs.affected_rows > 0;
}

std::vector<EncryptedSecret> PgSecretStore::list(const std::optional<std::string>& scope) const {
    const auto rs = scope
        ? conn_->execute(std::format("{} WHERE NOT deleted AND scope = $1 ORDER BY provider, scope",
                                     kSelectColumns), {*scope})
        : conn_->execute(std::format("{} WHERE NOT deleted ORDER BY provider, scope", kSelectColumns));
    std::vector<EncryptedSecret> rows;
    rows.reserve(rs.rows.size());
    for (const auto& r : rs.rows) {
        rows.push_back(row_from(r));
    }
    return rows;
}

} // namespace llmshield
