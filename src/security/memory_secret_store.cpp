#include "security/memory_secret_store.hpp"

#include <algorithm>
#include <mutex>
#include <tuple>

namespace llmshield {

EncryptedSecret* MemorySecretStore::find_live(const std::string& provider, const std::string& scope) {
    for (auto& row : rows_) {
        if (!row.deleted && row.provider == provider && row.scope == scope) return &row;
    }
    return nullptr;
}

const EncryptedSecret* MemorySecretStore::find_live(const std::string& provider,
                                                    const std::string& scope) const {
    for (const auto& row : rows_) {
        if (!row.deleted && row.provider == provider && row.scope == scope) return &row;
    }
    return nullptr;
}

std::optional<EncryptedSecret> MemorySecretStore::find(
    const std::string& provider, const std::string& scope) const {
    std::shared_lock lock(mutex_);
    if (const auto* row = find_live(provider, scope)) return *row;
    return std::nullopt;
}

bool MemorySecretStore::insert(EncryptedSecret& row) {
    std::unique_lock lock(mutex_);
    if (find_live(row.provider, row.scope)) return false;
    row.id = next_id_++;
    row.deleted = false;
    rows_.push_back(row);
    return true;
}

bool MemorySecretStore::replace(const EncryptedSecret& row) {
    std::unique_lock lock(mutex_);
    auto* existing = find_live(row.provider, row.scope);
    if (!existing) return false;

    const int64_t id = existing->id;
    const auto created_at = existing->created_at;
    *existing = row;
    existing->id = id;
    existing->created_at = created_at;
    existing->deleted = false;
    return true;
}

bool MemorySecretStore::soft_delete(const std::string& provider, const std::string& scope,
                                    std::chrono::system_clock::time_point when) {
    std::unique_lock lock(mutex_);
    auto* existing = find_live(provider, scope);
    if (!existing) return false;
    existing->deleted = true;
    existing->updated_at = when;
    return true;
}

std::vector<EncryptedSecret> MemorySecretStore::list(const std::optional<std::string>& scope) const {
    std::vector<EncryptedSecret> result;
    {
        std::shared_lock lock(mutex_);
        for (const auto& row : rows_) {
            if (row.deleted) continue;
            if (scope && row.scope != *scope) continue;
            result.push_back(row);
        }
    }
    std::sort(result.begin(), result.end(), [](const EncryptedSecret& a, const EncryptedSecret& b) {
        return std::tie(a.provider, a.scope) < std::tie(b.provider, b.scope);
    });
    return result;
}

size_t MemorySecretStore::row_count() const {
    std::shared_lock lock(mutex_);
    return rows_.size();
}

} // namespace llmshield
