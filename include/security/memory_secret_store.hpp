#pragma once

#include "security/isecret_store.hpp"

#include <shared_mutex>
#include <vector>

namespace llmshield {

/**
 * @brief In-process secret store. Deleted rows are kept, flagged.
 */
class MemorySecretStore : public ISecretStore {
public:
    [[nodiscard]] std::optional<EncryptedSecret> find(
        const std::string& provider, const std::string& scope) const override;

    bool insert(EncryptedSecret& row) override;
    bool replace(const EncryptedSecret& row) override;
    bool soft_delete(const std::string& provider, const std::string& scope,
                     std::chrono::system_clock::time_point when) override;

    [[nodiscard]] std::vector<EncryptedSecret> list(
        const std::optional<std::string>& scope) const override;

    [[nodiscard]] std::string name() const override { return "memory"; }

    /// All rows including soft-deleted ones.
    [[nodiscard]] size_t row_count() const;

private:
    EncryptedSecret* find_live(const std::string& provider, const std::string& scope);
    const EncryptedSecret* find_live(const std::string& provider, const std::string& scope) const;

    mutable std::shared_mutex mutex_;
    std::vector<EncryptedSecret> rows_;
    int64_t next_id_ = 1;
};

} // namespace llmshield
