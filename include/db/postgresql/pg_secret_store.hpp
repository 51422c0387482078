#pragma once

#include "db/postgresql/pg_connection.hpp"
#include "security/isecret_store.hpp"

#include <memory>

namespace llmshield {

/**
 * @brief ISecretStore over the `secrets` table
 *
 * Live-row uniqueness is enforced by the partial unique index on
 * (provider, scope) WHERE NOT deleted; insert() relies on it rather than
 * a prior lookup.
 */
class PgSecretStore : public ISecretStore {
public:
    explicit PgSecretStore(std::shared_ptr<PgConnection> conn);

    [[nodiscard]] std::optional<EncryptedSecret> find(
        const std::string& provider, const std::string& scope) const override;
    bool insert(EncryptedSecret& row) override;
    bool replace(const EncryptedSecret& row) override;
    bool soft_delete(const std::string& provider, const std::string& scope,
                     std::chrono::system_clock::time_point when) override;
    [[nodiscard]] std::vector<EncryptedSecret> list(
        const std::optional<std::string>& scope) const override;
    [[nodiscard]] std::string name() const override { return "postgresql"; }

private:
    std::shared_ptr<PgConnection> conn_;
};

} // namespace llmshield
