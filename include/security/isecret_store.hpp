#pragma once

#include "core/json.hpp"

#include <chrono>
#include <cstdint>
#include <optional>
#include <string>
#include <vector>

namespace llmshield {

/**
 * @brief One row of the `secrets` table
 */
struct EncryptedSecret {
    int64_t id = 0;
    std::string provider;
    std::string scope;
    std::vector<uint8_t> ciphertext;
    std::vector<uint8_t> iv;
    std::vector<uint8_t> tag;
    JsonValue metadata = JsonValue::object();
    std::chrono::system_clock::time_point last_rotated_at;
    std::chrono::system_clock::time_point created_at;
    std::chrono::system_clock::time_point updated_at;
    bool deleted = false;
};

/**
 * @brief Listing view of a stored secret: never carries key material
 */
struct SecretInfo {
    std::string provider;
    std::string scope;
    JsonValue metadata = JsonValue::object();
    std::chrono::system_clock::time_point last_rotated_at;
    std::chrono::system_clock::time_point created_at;
    std::chrono::system_clock::time_point updated_at;

    SecretInfo() = default;
    explicit SecretInfo(const EncryptedSecret& row)
        : provider(row.provider), scope(row.scope), metadata(row.metadata),
          last_rotated_at(row.last_rotated_at), created_at(row.created_at),
          updated_at(row.updated_at) {}
};

/**
 * @brief Durable storage for encrypted secrets
 *
 * (provider, scope) is unique among rows with deleted == false. Every
 * method throws StorageUnavailable when the backend cannot be reached.
 */
class ISecretStore {
public:
    virtual ~ISecretStore() = default;

    /// Live row for (provider, scope), if any.
    [[nodiscard]] virtual std::optional<EncryptedSecret> find(
        const std::string& provider, const std::string& scope) const = 0;

    /// Inserts a new live row and assigns row.id. False if a live row already exists.
    virtual bool insert(EncryptedSecret& row) = 0;

    /// Replaces the live row's crypto material, metadata and timestamps in one update.
    /// False if there is no live row.
    virtual bool replace(const EncryptedSecret& row) = 0;

    /// Marks the live row deleted. False if there is no live row.
    virtual bool soft_delete(const std::string& provider, const std::string& scope,
                             std::chrono::system_clock::time_point when) = 0;

    /// Live rows, optionally restricted to one scope, ordered by (provider, scope).
    [[nodiscard]] virtual std::vector<EncryptedSecret> list(
        const std::optional<std::string>& scope) const = 0;

    [[nodiscard]] virtual std::string name() const = 0;
};

} // namespace llmshield
