#pragma once

#include "core/base64.hpp"

#include <libpq-fe.h>

#include <chrono>
#include <cstdint>
#include <format>
#include <memory>
#include <mutex>
#include <optional>
#include <string>
#include <vector>

namespace llmshield {

struct DbResultSet {
    std::vector<std::string> column_names;
    std::vector<std::vector<std::string>> rows;     // NULL reads as ""
    uint64_t affected_rows = 0;

    [[nodiscard]] bool empty() const { return rows.empty(); }
};

/**
 * @brief Single libpq connection shared by the PostgreSQL stores
 *
 * All statements go through PQexecParams with text parameters; callers
 * never splice values into SQL. Calls are serialized on an internal mutex
 * because a PGconn must not be used from two threads at once. Failures
 * raise StorageUnavailable.
 */
class PgConnection {
public:
    using Params = std::vector<std::optional<std::string>>;

    /// @throws StorageUnavailable when the server cannot be reached
    [[nodiscard]] static std::shared_ptr<PgConnection> connect(const std::string& connection_string);

    explicit PgConnection(PGconn* conn);
    ~PgConnection();

    PgConnection(const PgConnection&) = delete;
    PgConnection& operator=(const PgConnection&) = delete;

    DbResultSet execute(const std::string& sql, const Params& params = {});

    /// Runs a multi-statement script (DDL); no parameters.
    void execute_script(const std::string& sql);

    [[nodiscard]] bool is_connected() const;
    void close();

private:
    void reconnect_if_needed();

    mutable std::mutex mutex_;
    PGconn* conn_;
};

// ============================================================================
// Parameter codecs
// ============================================================================
//
// Timestamps cross the wire as epoch seconds (to_timestamp($n) on write,
// extract(epoch from col) on read); BYTEA as base64 (decode/encode).

namespace pg {

inline std::string time_param(std::chrono::system_clock::time_point tp) {
    const auto us = std::chrono::duration_cast<std::chrono::microseconds>(tp.time_since_epoch()).count();
    return std::format("{}.{:06}", us / 1000000, us % 1000000);
}

inline std::chrono::system_clock::time_point parse_time(const std::string& epoch) {
    const double seconds = epoch.empty() ? 0.0 : std::stod(epoch);
    return std::chrono::system_clock::time_point(
        std::chrono::duration_cast<std::chrono::system_clock::duration>(
            std::chrono::duration<double>(seconds)));
}

inline std::string bytes_param(const std::vector<uint8_t>& bytes) {
    return base64::encode(bytes.data(), bytes.size());
}

// encode(..., 'base64') wraps lines; the lenient decoder skips the newlines
inline std::vector<uint8_t> parse_bytes(const std::string& encoded) {
    return base64::decode(encoded);
}

inline const char* bool_param(bool b) { return b ? "true" : "false"; }

inline bool parse_bool(const std::string& v) { return v == "t" || v == "true"; }

} // namespace pg

/// Creates the secrets, audit_events, usage, quotas and quota_counters tables.
void ensure_schema(PgConnection& conn);

} // namespace llmshield
