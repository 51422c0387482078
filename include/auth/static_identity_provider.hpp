#pragma once

#include "auth/iidentity_provider.hpp"

#include <memory>
#include <mutex>
#include <optional>
#include <string>
#include <unordered_map>
#include <vector>

namespace llmshield {

/**
 * @brief Identity provider backed by the [[users]]/[[groups]] config tables
 *
 * The host (or the CLI --actor flag) selects the current actor with
 * set_current(); until then current_actor() is nullopt.
 */
class StaticIdentityProvider : public IIdentityProvider {
public:
    StaticIdentityProvider() = default;
    explicit StaticIdentityProvider(std::vector<Actor> actors);

    [[nodiscard]] std::optional<Actor> current_actor() const override;
    [[nodiscard]] std::string name() const override { return "static"; }

    /// Returns false (and clears the selection) for unknown ids.
    bool set_current(const std::string& actor_id);
    void set_current(Actor actor);
    void clear();

    void add_actor(Actor actor);
    [[nodiscard]] bool has_actor(const std::string& actor_id) const;
    [[nodiscard]] size_t actor_count() const;

private:
    mutable std::mutex mutex_;
    std::unordered_map<std::string, Actor> actors_;
    std::optional<Actor> current_;
};

} // namespace llmshield
